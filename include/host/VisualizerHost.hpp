/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VISUALIZER_HOST_HPP
#define VISUALIZER_HOST_HPP

/**
 * @file VisualizerHost.hpp
 * @brief Owns the scheduler and bridges it to the outside world
 *
 * Responsibilities:
 * - frame loop entry point: onFrame(now) ticks, applies due deferred
 *   classifications, then hands a snapshot to the render adapter
 * - resize and pointer notifications (click listeners get {id, entity copy})
 * - ingestion validation for upstream transactions
 * - stop(): halts ticking and detaches every listener; entities are abandoned
 *
 * Everything runs on the frame thread; deferred classifications are
 * timestamped in scheduler time, not wall time.
 */

#include "core/LifecycleScheduler.hpp"
#include "render/RenderAdapter.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace FortressEngine {

struct EntityClickEvent {
    std::string id;
    TransitEntity entity;
};

class VisualizerHost {
public:
    using ClickListener = std::function<void(const EntityClickEvent&)>;
    using ListenerId = uint64_t;

    // Upstream decisions are held back so the scanning orbit is visible
    static constexpr double THREAT_CLASSIFICATION_DELAY = 2.0;
    static constexpr double CLEAR_CLASSIFICATION_DELAY = 2.5;

    /**
     * @param config scheduler tunables
     * @param width initial canvas width
     * @param height initial canvas height
     * @param renderer optional adapter; not owned, must outlive the host
     */
    VisualizerHost(const SchedulerConfig& config, float width, float height,
                   IRenderAdapter* renderer = nullptr);

    VisualizerHost(const VisualizerHost&) = delete;
    VisualizerHost& operator=(const VisualizerHost&) = delete;

    void onFrame(double nowSeconds);
    bool onResize(float width, float height);

    /**
     * @brief Hit-tests the pointer position and notifies click listeners
     * @return true when an entity was hit
     */
    bool onPointerClick(float x, float y);

    ListenerId addClickListener(ClickListener listener);
    bool removeClickListener(ListenerId id);
    size_t getClickListenerCount() const { return m_clickListeners.size(); }

    /**
     * @brief Validated ingestion of one upstream transaction
     *
     * Rejects (with a warning) empty ids, non-finite or negative amounts and
     * non-finite scores. Decisions "review" and "block" are threats; anything
     * else clears. The classification is deferred by the threat/clear delay.
     *
     * Verdicts still queued under the same id for an earlier, evicted entity
     * are discarded.
     *
     * @return false when rejected or when the id is already live
     */
    bool submitTransaction(const std::string& id, double amount, JsonObject metadata,
                           const std::string& decision, double score);

    // Queue classify(id, isThreat, score) for delaySeconds of scheduler time
    void scheduleClassification(const std::string& id, bool isThreat, double score,
                                double delaySeconds);
    size_t getPendingClassificationCount() const { return m_pending.size(); }

    void triggerPulse();

    void setRenderAdapter(IRenderAdapter* renderer) { mp_renderer = renderer; }

    void stop();
    bool isRunning() const { return m_running; }

    LifecycleScheduler& getScheduler() { return m_scheduler; }
    const LifecycleScheduler& getScheduler() const { return m_scheduler; }

    static bool isThreatDecision(const std::string& decision);

private:
    struct PendingClassification {
        std::string id;
        bool isThreat{false};
        double score{0.0};
        double dueTime{0.0};
    };

    void applyDueClassifications();

    LifecycleScheduler m_scheduler;
    IRenderAdapter* mp_renderer{nullptr};
    boost::container::flat_map<ListenerId, ClickListener> m_clickListeners;
    ListenerId m_nextListenerId{1};
    std::vector<PendingClassification> m_pending;
    bool m_running{true};
};

} // namespace FortressEngine

#endif // VISUALIZER_HOST_HPP
