#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "types.hpp"
#include "queue.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace camrec {

/**
 * @file dispatcher.hpp
 * @brief Routes normalized events to the recorder of their camera.
 */

class EventRecorder;

/**
 * @brief Lookup of live event recorders by camera id.
 */
class IRecorderDirectory {
public:
    virtual ~IRecorderDirectory() = default;

    /**
     * @return Null when the camera has no live pipeline.
     * @threading Called with the dispatcher's lane lock held; must not block.
     */
    virtual std::shared_ptr<EventRecorder> findRecorder(const std::string& camera_id) const = 0;
};

/**
 * @brief Single entry point for push-monitor and manual events.
 * @threading submit() from any thread. Each camera has its own lane with a
 *            queue and worker thread, so one camera's slow trigger never
 *            delays another camera's events.
 *
 * Validation, the camera lookup and de-duplication happen synchronously in
 * submit(); the trigger itself runs on the camera's lane.
 */
class EventDispatcher {
public:
    EventDispatcher(const IRecorderDirectory& directory, const DispatchConfig& config,
                    WallClock clock = systemWallClock);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Validate, de-duplicate and route one event.
     * @return InvalidArgument for malformed events, NotFound for unknown
     *         cameras, Unavailable after stop(). A duplicate is reported as
     *         success with message "duplicate".
     */
    OpResult submit(const Event& event);

    /** @brief normalizeEvent() followed by submit(). */
    OpResult submitJson(const nlohmann::json& payload, EventOrigin origin);

    /** @brief Drop the lane of a removed camera. */
    void dropCamera(const std::string& camera_id);

    /** @brief Stop all lanes after draining queued events. */
    void stop();

    uint64_t accepted() const { return accepted_.load(); }
    uint64_t duplicates() const { return duplicates_.load(); }
    uint64_t rejected() const { return rejected_.load(); }
    size_t laneCount() const;

private:
    struct Lane {
        explicit Lane(size_t capacity) : queue(capacity) {}
        ThreadSafeQueue<Event> queue;
        std::thread worker;
    };

    bool rememberKey(const Event& event);
    void runLane(const std::string& camera_id, Lane* lane);
    void retireLane(std::unique_ptr<Lane> lane);

    const IRecorderDirectory& directory_;
    DispatchConfig config_;
    WallClock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Lane>> lanes_;
    bool stopped_ = false;

    std::mutex dedupe_mu_;
    std::unordered_set<std::string> seen_;
    std::deque<std::pair<double, std::string>> seen_order_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace camrec

#endif // DISPATCHER_HPP
