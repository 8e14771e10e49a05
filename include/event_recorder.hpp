#ifndef EVENT_RECORDER_HPP
#define EVENT_RECORDER_HPP

#include "types.hpp"
#include "ingestor.hpp"
#include "ring_buffer.hpp"
#include "sink.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camrec {

/**
 * @file event_recorder.hpp
 * @brief Event recordings combining buffered history with a live continuation.
 */

class EventSession;

/**
 * @brief Turns triggers into event recordings for one camera.
 * @threading trigger() and the accessors are safe from any thread; each
 *            session writes its file from its own thread.
 * @ownership Owns its sessions; borrows the camera's buffer and fan-out,
 *            which must outlive the recorder.
 *
 * At most one session per camera accepts packets at a time. Deadlines are
 * taken from the recorder clock when a trigger arrives, not from the event's
 * own timestamp, which is only recorded. A trigger that arrives while a
 * session is open extends its deadline to now plus the post-event duration
 * and is listed in the session's sidecar.
 */
class EventRecorder {
public:
    EventRecorder(const std::string& camera_id, const RecordingConfig& config,
                  RollingBuffer& buffer, PacketFanout& fanout,
                  SinkFactory sinks, WallClock clock = systemWallClock);
    ~EventRecorder();

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    /**
     * @brief Open a session or coalesce into the open one.
     * @return InvalidArgument when the event names another camera,
     *         Unavailable after stop() or once the output path has failed.
     */
    OpResult trigger(const Event& event);

    /**
     * @brief End the open session early, finalize it and wait for its file.
     */
    void stop();

    /**
     * @brief Collect finished sessions into the history and update failure state.
     */
    void poll();

    bool sessionOpen() const;
    std::optional<EventRecordingInfo> activeSession() const;

    /** @brief Finished sessions, oldest first. */
    std::vector<EventRecordingInfo> history() const;

    uint64_t tapDrops() const;
    uint64_t recordingsFinalized() const { return finalized_.load(); }
    bool failed() const { return failed_.load(); }
    std::string lastError() const;

private:
    void reapLocked();

    std::string camera_id_;
    RecordingConfig config_;
    RollingBuffer& buffer_;
    PacketFanout& fanout_;
    SinkFactory sinks_;
    WallClock clock_;
    std::string tag_;

    mutable std::mutex mutex_;
    std::shared_ptr<EventSession> active_;
    std::vector<std::shared_ptr<EventSession>> closing_;
    std::deque<EventRecordingInfo> history_;
    bool stopped_ = false;
    int consecutive_failures_ = 0;
    uint64_t retired_tap_drops_ = 0;
    std::string last_error_;

    std::atomic<uint64_t> finalized_{0};
    std::atomic<bool> failed_{false};
};

} // namespace camrec

#endif // EVENT_RECORDER_HPP
