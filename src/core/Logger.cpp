/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only. Debug builds print from the header.
#ifndef DEBUG

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <vector>

#ifndef FORTRESS_APP_NAME
#define FORTRESS_APP_NAME "FortressEngine"
#endif

namespace FortressEngine {
namespace {

namespace fs = std::filesystem;

constexpr const char* LOG_PREFIX = "fortress_";
constexpr size_t ROTATED_LOGS_KEPT = 5;

// strftime into a small buffer; empty string if the clock cannot be read
std::string formatLocalTime(std::time_t when, const char* pattern) {
    std::tm local{};
    if (localtime_r(&when, &local) == nullptr) {
        return {};
    }
    char buffer[32];
    const size_t written = std::strftime(buffer, sizeof(buffer), pattern, &local);
    return std::string(buffer, written);
}

fs::path resolveLogDirectory() {
    if (const char* overrideDir = std::getenv("FORTRESS_LOG_DIR")) {
        return fs::path(overrideDir);
    }
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path() : cwd / "logs";
}

// Drops the oldest fortress_*.log files so that, with the one about to be
// created, at most ROTATED_LOGS_KEPT remain
void pruneRotatedLogs(const fs::path& directory) {
    std::error_code ec;
    std::vector<fs::path> existing;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.path().extension() == ".log" && name.rfind(LOG_PREFIX, 0) == 0) {
            existing.push_back(entry.path());
        }
    }
    if (existing.size() < ROTATED_LOGS_KEPT) {
        return;
    }

    // Names embed a sortable timestamp
    std::sort(existing.begin(), existing.end());
    const size_t excess = existing.size() - ROTATED_LOGS_KEPT + 1;
    for (size_t i = 0; i < excess; ++i) {
        fs::remove(existing[i], ec);
    }
}

class RotatingLogFile {
public:
    static RotatingLogFile& Instance() {
        static RotatingLogFile instance;
        return instance;
    }

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_stream) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                now.time_since_epoch()).count() % 1000;
        char msBuffer[8];
        std::snprintf(msBuffer, sizeof(msBuffer), ".%03d", static_cast<int>(millis));

        m_stream << formatLocalTime(std::chrono::system_clock::to_time_t(now), "%H:%M:%S")
                 << msBuffer << ' ' << level << " [" << system << "] " << message
                 << std::endl;
    }

    RotatingLogFile(const RotatingLogFile&) = delete;
    RotatingLogFile& operator=(const RotatingLogFile&) = delete;

private:
    RotatingLogFile() = default;

    void open() {
        m_opened = true;

        const fs::path directory = resolveLogDirectory();
        if (directory.empty()) {
            return;
        }
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            return;
        }
        pruneRotatedLogs(directory);

        const std::time_t started = std::time(nullptr);
        const std::string stamp = formatLocalTime(started, "%Y%m%d_%H%M%S");
        m_stream.open(directory / (std::string(LOG_PREFIX) + stamp + ".log"),
                      std::ios::out | std::ios::app);
        if (m_stream) {
            m_stream << "# " << FORTRESS_APP_NAME << " started "
                     << formatLocalTime(started, "%Y-%m-%d %H:%M:%S") << '\n';
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_opened{false};
};

} // namespace

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (!s_benchmarkMode.load(std::memory_order_relaxed)) {
        RotatingLogFile::Instance().append(level, system, message);
    }
}

} // namespace FortressEngine

#endif // DEBUG
