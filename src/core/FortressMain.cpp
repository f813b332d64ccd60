/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SchedulerConfig.hpp"
#include "host/TransactionFeed.hpp"
#include "host/VisualizerHost.hpp"
#include "render/SDLDrawSurface.hpp"
#include "render/SnapshotRenderer.hpp"
#include <SDL3/SDL.h>
#include <exception>
#include <memory>
#include <string>

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{720};
// Window title
const std::string APP_NAME{FORTRESS_APP_NAME};

namespace {

double secondsSinceInit() {
  return static_cast<double>(SDL_GetTicksNS()) / 1'000'000'000.0;
}

void logEntityClick(const FortressEngine::EntityClickEvent &event) {
  std::string score = "n/a";
  auto it = event.entity.metadata.find("risk_score");
  if (it != event.entity.metadata.end() && it->second.isNumber()) {
    score = std::to_string(it->second.asNumber());
  }
  HOST_INFO("Selected " + event.id + " [" + FortressEngine::toString(event.entity.state) +
            "] magnitude " + std::to_string(event.entity.magnitude) + ", risk " + score);
}

} // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
  using namespace FortressEngine;

  HOST_INFO("Initializing " + APP_NAME);

  SchedulerConfig config;
  if (!config.loadFromFile("res/fortress.json")) {
    CONFIG_WARN("Failed to load res/fortress.json - using defaults");
  } else {
    CONFIG_INFO("Scheduler configuration loaded from res/fortress.json");
  }

  if (!SDL_Init(SDL_INIT_VIDEO)) {
    HOST_CRITICAL(std::string("SDL_Init failed: ") + SDL_GetError());
    return -1;
  }

  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> window{nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> renderer{nullptr,
                                                                         SDL_DestroyRenderer};
  {
    SDL_Window *rawWindow = nullptr;
    SDL_Renderer *rawRenderer = nullptr;
    if (!SDL_CreateWindowAndRenderer(APP_NAME.c_str(), WINDOW_WIDTH, WINDOW_HEIGHT,
                                     SDL_WINDOW_RESIZABLE, &rawWindow, &rawRenderer)) {
      HOST_CRITICAL(std::string("Window creation failed: ") + SDL_GetError());
      SDL_Quit();
      return -1;
    }
    window.reset(rawWindow);
    renderer.reset(rawRenderer);
  }

  if (!SDL_SetRenderVSync(renderer.get(), 1)) {
    HOST_WARN(std::string("Failed to enable VSync: ") + SDL_GetError());
  }

  int code = 0;
  try {
    SDLDrawSurface surface(renderer.get());
    SnapshotRenderer snapshotRenderer(surface);
    VisualizerHost host(config, static_cast<float>(WINDOW_WIDTH),
                        static_cast<float>(WINDOW_HEIGHT), &snapshotRenderer);
    host.addClickListener(logEntityClick);

    TransactionFeed feed(host);

    HOST_INFO("Starting main loop");
    while (host.isRunning()) {
      SDL_Event event;
      while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_EVENT_QUIT:
          host.stop();
          break;
        case SDL_EVENT_KEY_DOWN:
          if (event.key.key == SDLK_ESCAPE) {
            host.stop();
          } else if (event.key.key == SDLK_P) {
            host.triggerPulse();
          }
          break;
        case SDL_EVENT_WINDOW_RESIZED:
          host.onResize(static_cast<float>(event.window.data1),
                        static_cast<float>(event.window.data2));
          break;
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
          host.onPointerClick(event.button.x, event.button.y);
          break;
        default:
          break;
        }
      }

      const double now = secondsSinceInit();
      feed.update(now);
      host.onFrame(now);
    }

    const PipelineStats stats = host.getScheduler().snapshotStats();
    HOST_INFO("Session stats: created " + std::to_string(stats.totalCreated) + ", threats " +
              std::to_string(stats.threatCount) + ", cleared " +
              std::to_string(stats.clearedCount) + ", growth " +
              std::to_string(stats.growthCount));
  } catch (const std::exception &e) {
    HOST_CRITICAL(std::string("Unhandled exception: ") + e.what());
    code = -1;
  }

  HOST_INFO(APP_NAME + " shutting down");
  renderer.reset();
  window.reset();
  SDL_Quit();
  return code;
}
