/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "host/VisualizerHost.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace FortressEngine {

VisualizerHost::VisualizerHost(const SchedulerConfig& config, float width, float height,
                               IRenderAdapter* renderer)
    : m_scheduler(config, width, height), mp_renderer(renderer)
{
    HOST_INFO("Visualizer host started");
}

void VisualizerHost::onFrame(double nowSeconds) {
    if (!m_running) {
        return;
    }

    m_scheduler.tick(nowSeconds);
    applyDueClassifications();

    if (mp_renderer) {
        mp_renderer->render(m_scheduler.snapshot());
    }
}

bool VisualizerHost::onResize(float width, float height) {
    return m_scheduler.recomputeLayout(width, height);
}

bool VisualizerHost::onPointerClick(float x, float y) {
    auto hit = m_scheduler.hitTest(x, y);
    if (!hit) {
        return false;
    }

    HOST_DEBUG("Pointer hit " + hit->id);
    const EntityClickEvent event{hit->id, hit->entity};

    // Copy so a listener may remove itself while being notified
    const auto listeners = m_clickListeners;
    for (const auto& [listenerId, listener] : listeners) {
        if (listener) {
            listener(event);
        }
    }
    return true;
}

VisualizerHost::ListenerId VisualizerHost::addClickListener(ClickListener listener) {
    const ListenerId id = m_nextListenerId++;
    m_clickListeners.emplace(id, std::move(listener));
    return id;
}

bool VisualizerHost::removeClickListener(ListenerId id) {
    return m_clickListeners.erase(id) > 0;
}

bool VisualizerHost::isThreatDecision(const std::string& decision) {
    return decision == "review" || decision == "block";
}

bool VisualizerHost::submitTransaction(const std::string& id, double amount,
                                       JsonObject metadata, const std::string& decision,
                                       double score) {
    if (!m_running) {
        HOST_DEBUG("Transaction " + id + " dropped, host stopped");
        return false;
    }
    if (id.empty()) {
        HOST_WARN("Rejected transaction with empty id");
        return false;
    }
    if (!std::isfinite(amount) || amount < 0.0) {
        HOST_WARN("Rejected transaction " + id + ": invalid amount");
        return false;
    }
    if (!std::isfinite(score)) {
        HOST_WARN("Rejected transaction " + id + ": non-finite risk score");
        return false;
    }

    metadata["decision"] = JsonValue(decision);
    if (!m_scheduler.addEntity(id, amount, std::move(metadata))) {
        return false;
    }

    // An id may come back after eviction; verdicts queued for the old entity
    // must not land on the new one
    const auto stale = std::remove_if(m_pending.begin(), m_pending.end(),
                                      [&id](const PendingClassification& p) { return p.id == id; });
    if (stale != m_pending.end()) {
        HOST_DEBUG("Discarded stale classification for resubmitted " + id);
        m_pending.erase(stale, m_pending.end());
    }

    const bool threat = isThreatDecision(decision);
    scheduleClassification(id, threat, score,
                           threat ? THREAT_CLASSIFICATION_DELAY : CLEAR_CLASSIFICATION_DELAY);
    return true;
}

void VisualizerHost::scheduleClassification(const std::string& id, bool isThreat,
                                            double score, double delaySeconds) {
    PendingClassification pending;
    pending.id = id;
    pending.isThreat = isThreat;
    pending.score = score;
    pending.dueTime = m_scheduler.getTime() + std::max(0.0, delaySeconds);
    m_pending.push_back(std::move(pending));
}

void VisualizerHost::applyDueClassifications() {
    if (m_pending.empty()) {
        return;
    }

    const double now = m_scheduler.getTime();

    // Stable: same-due entries keep submission order
    auto firstLater = std::stable_partition(
        m_pending.begin(), m_pending.end(),
        [now](const PendingClassification& p) { return p.dueTime <= now; });

    std::vector<PendingClassification> due(std::make_move_iterator(m_pending.begin()),
                                           std::make_move_iterator(firstLater));
    m_pending.erase(m_pending.begin(), firstLater);

    std::stable_sort(due.begin(), due.end(),
                     [](const PendingClassification& a, const PendingClassification& b) {
                         return a.dueTime < b.dueTime;
                     });

    for (const auto& pending : due) {
        if (!m_scheduler.classify(pending.id, pending.isThreat, pending.score)) {
            HOST_DEBUG("Deferred classification dropped for " + pending.id);
        }
    }
}

void VisualizerHost::triggerPulse() {
    if (m_running) {
        m_scheduler.triggerPulse();
    }
}

void VisualizerHost::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;
    m_clickListeners.clear();
    m_pending.clear();
    HOST_INFO("Visualizer host stopped");
}

} // namespace FortressEngine
