#include "dispatcher.hpp"
#include "event_recorder.hpp"
#include "events.hpp"
#include "logging.hpp"
#include <cstdio>
#include <iostream>

/**
 * @file dispatcher.cpp
 * @brief Event validation, de-duplication and per-camera lanes.
 */

namespace camrec {

EventDispatcher::EventDispatcher(const IRecorderDirectory& directory, const DispatchConfig& config,
                                 WallClock clock)
    : directory_(directory),
      config_(config),
      clock_(clock ? std::move(clock) : WallClock(systemWallClock)) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

OpResult EventDispatcher::submitJson(const nlohmann::json& payload, EventOrigin origin) {
    Event ev;
    OpResult parsed = normalizeEvent(payload, origin, ev, clock_());
    if (!parsed.ok()) {
        rejected_++;
        std::cerr << "[WARN] [dispatch] rejected " << toString(origin) << " event: " << parsed.message << std::endl;
        return parsed;
    }
    return submit(ev);
}

OpResult EventDispatcher::submit(const Event& event) {
    OpResult valid = validateEvent(event);
    if (!valid.ok()) {
        rejected_++;
        return valid;
    }
    if (!directory_.findRecorder(event.camera_id)) {
        rejected_++;
        return OpResult::error(ErrorCode::NotFound, "unknown camera '" + event.camera_id + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return OpResult::error(ErrorCode::Unavailable, "dispatcher stopped");
    // A removal may have retired this camera's lane since the lookup above;
    // dropCamera() runs after the registry change and waits for this lock.
    if (!directory_.findRecorder(event.camera_id)) {
        rejected_++;
        return OpResult::error(ErrorCode::NotFound, "camera '" + event.camera_id + "' was removed");
    }
    if (!rememberKey(event)) {
        duplicates_++;
        if (logEnabled(LogLevel::Debug)) {
            std::cout << "[DEBUG] [dispatch] duplicate " << event.type << " for " << event.camera_id << std::endl;
        }
        return OpResult{ErrorCode::Ok, "duplicate"};
    }

    auto& lane = lanes_[event.camera_id];
    if (!lane) {
        lane = std::make_unique<Lane>(config_.queue_capacity);
        lane->worker = std::thread(&EventDispatcher::runLane, this, event.camera_id, lane.get());
    }
    if (lane->queue.pushDropOldest(event)) {
        std::cerr << "[WARN] [dispatch] lane " << event.camera_id << " full, oldest event dropped" << std::endl;
    }
    accepted_++;
    return OpResult::success();
}

bool EventDispatcher::rememberKey(const Event& event) {
    char ts[32];
    std::snprintf(ts, sizeof(ts), "%.6f", event.timestamp);
    std::string key = event.camera_id + '\n' + event.type + '\n' + ts;
    const double now = clock_();

    std::lock_guard<std::mutex> lock(dedupe_mu_);
    while (!seen_order_.empty() && seen_order_.front().first < now - config_.dedupe_window) {
        seen_.erase(seen_order_.front().second);
        seen_order_.pop_front();
    }
    if (!seen_.insert(key).second) return false;
    seen_order_.emplace_back(now, std::move(key));
    return true;
}

void EventDispatcher::runLane(const std::string& camera_id, Lane* lane) {
    Event ev;
    while (lane->queue.pop(ev)) {
        try {
            auto recorder = directory_.findRecorder(camera_id);
            if (!recorder) {
                std::cerr << "[WARN] [dispatch] camera " << camera_id << " removed, event dropped" << std::endl;
                continue;
            }
            OpResult result = recorder->trigger(ev);
            if (!result.ok()) {
                std::cerr << "[WARN] [dispatch] trigger " << camera_id << " failed: "
                          << toString(result.code) << ": " << result.message << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] [dispatch] lane " << camera_id << " exception: " << e.what() << std::endl;
        }
    }
}

void EventDispatcher::retireLane(std::unique_ptr<Lane> lane) {
    if (!lane) return;
    lane->queue.stop();
    if (lane->worker.joinable()) lane->worker.join();
}

void EventDispatcher::dropCamera(const std::string& camera_id) {
    std::unique_ptr<Lane> lane;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lanes_.find(camera_id);
        if (it == lanes_.end()) return;
        lane = std::move(it->second);
        lanes_.erase(it);
    }
    retireLane(std::move(lane));
}

void EventDispatcher::stop() {
    std::map<std::string, std::unique_ptr<Lane>> lanes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        lanes.swap(lanes_);
    }
    for (auto& entry : lanes) retireLane(std::move(entry.second));
}

size_t EventDispatcher::laneCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lanes_.size();
}

} // namespace camrec
