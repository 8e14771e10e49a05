#include "event_recorder.hpp"
#include "logging.hpp"
#include "queue.hpp"
#include "storage.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>

/**
 * @file event_recorder.cpp
 * @brief Event sessions: snapshot flush, live tap, coalescing and finalize.
 */

namespace camrec {

namespace {
constexpr size_t kHistorySize = 16;
constexpr auto kDeadlinePoll = std::chrono::milliseconds(100);

std::string fileSafe(const std::string& text) {
    std::string out;
    for (char c : text) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_';
        out += ok ? c : '_';
    }
    return out.empty() ? std::string("event") : out;
}
} // namespace

/**
 * @brief One event recording in progress.
 * @threading extend()/requestStop()/accessors from the recorder; offer() from
 *            the ingest thread; the session thread owns the sink.
 *
 * The session decides to close under its mutex, so an extension either lands
 * before the close decision or is refused and opens a new session.
 */
class EventSession : public IPacketConsumer {
public:
    EventSession(const std::string& camera_id, const RecordingConfig& config,
                 PacketFanout& fanout, SinkFactory sinks, WallClock clock, const Event& first)
        : camera_id_(camera_id),
          config_(config),
          fanout_(fanout),
          sinks_(std::move(sinks)),
          clock_(std::move(clock)),
          tag_("[event " + camera_id + "]"),
          queue_(config.queue_capacity) {
        info_.camera_id = camera_id;
        info_.event_type = first.type;
        info_.trigger_timestamp = first.timestamp;
        info_.received_at = clock_();
        info_.deadline = info_.received_at + config.post_event_duration;
        info_.open = true;
        info_.triggers.push_back(toRecord(first));
    }

    ~EventSession() override {
        requestStop();
        join();
    }

    void offer(const PacketPtr& packet) override {
        if (queue_.pushDropOldest(StreamItem{packet, false})) drops_++;
    }

    void discontinuity() override {}

    void setTap(PacketFanout::Handle handle) { tap_ = handle; }

    void begin(std::vector<PacketPtr> snapshot) {
        snapshot_ = std::move(snapshot);
        thread_ = std::thread(&EventSession::run, this);
    }

    /** @return False once the session has decided to close. */
    bool extend(const Event& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) return false;
        info_.deadline = std::max(info_.deadline, clock_() + config_.post_event_duration);
        info_.triggers.push_back(toRecord(event));
        return true;
    }

    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        queue_.stop();
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    bool open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closing_;
    }

    bool finished() const { return finished_.load(); }
    bool succeeded() const { return succeeded_.load(); }
    uint64_t drops() const { return drops_.load(); }

    EventRecordingInfo info() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return info_;
    }

    std::string error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

private:
    static TriggerRecord toRecord(const Event& event) {
        TriggerRecord rec;
        rec.event_type = event.type;
        rec.timestamp = event.timestamp;
        rec.origin = event.origin;
        rec.metadata = event.metadata;
        return rec;
    }

    void run() {
        try {
            std::string err;
            const double received = info_.received_at;
            const std::string dir = recordingDir(config_.base_dir, camera_id_, received);
            video_path_ = allocateRecordingPath(
                dir, "event_" + fileSafe(info_.event_type) + "_" + formatLocalTime(received, "%H-%M-%S"),
                containerExtension(config_.container), err);
            if (video_path_.empty()) {
                fail(err);
            } else if (flushSnapshot()) {
                followLive();
            }
        } catch (const std::exception& e) {
            fail(std::string("session exception: ") + e.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closing_ = true;
            info_.open = false;
        }
        fanout_.detach(tap_);
        queue_.stop();
        finalize();
        finished_ = true;
    }

    /** @brief Write the pre-event portion, trimmed to start on a keyframe. */
    bool flushSnapshot() {
        const double received = info_.received_at;
        size_t pre_end = 0;
        while (pre_end < snapshot_.size() && snapshot_[pre_end]->timestamp < received) ++pre_end;

        size_t begin = 0;
        for (size_t i = 0; i < pre_end; ++i) {
            if (snapshot_[i]->keyframe) {
                begin = i;
                break;
            }
        }
        for (size_t i = begin; i < snapshot_.size(); ++i) {
            const PacketPtr& pkt = snapshot_[i];
            if (pkt->timestamp >= currentDeadline()) break;
            if (!writePacket(pkt)) return false;
        }
        if (!snapshot_.empty()) last_seq_ = snapshot_.back()->seq;
        have_seq_ = !snapshot_.empty();
        snapshot_.clear();
        return true;
    }

    void followLive() {
        while (true) {
            bool expired = false;
            double expired_at = 0.0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stop_requested_) {
                    closing_ = true;
                    return;
                }
                if (clock_() >= info_.deadline) {
                    closing_ = true;
                    expired = true;
                    expired_at = info_.deadline;
                }
            }
            if (expired) {
                drainBefore(expired_at);
                return;
            }
            StreamItem item;
            auto result = queue_.popFor(item, kDeadlinePoll);
            if (result == ThreadSafeQueue<StreamItem>::PopResult::Stopped) return;
            if (result == ThreadSafeQueue<StreamItem>::PopResult::Timeout || !item.packet) continue;

            const PacketPtr& pkt = item.packet;
            if (have_seq_ && pkt->seq <= last_seq_) continue;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (pkt->timestamp >= info_.deadline) {
                    closing_ = true;
                    return;
                }
            }
            last_seq_ = pkt->seq;
            have_seq_ = true;
            if (!writePacket(pkt)) return;
        }
    }

    /** @brief Write packets already queued that still fall inside the window. */
    void drainBefore(double deadline) {
        StreamItem item;
        while (queue_.tryPop(item)) {
            if (!item.packet) continue;
            const PacketPtr& pkt = item.packet;
            if (have_seq_ && pkt->seq <= last_seq_) continue;
            if (pkt->timestamp >= deadline) return;
            last_seq_ = pkt->seq;
            have_seq_ = true;
            if (!writePacket(pkt)) return;
        }
    }

    double currentDeadline() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return info_.deadline;
    }

    bool writePacket(const PacketPtr& pkt) {
        if (!sink_) {
            // The first packet must be decodable on its own.
            if (!pkt->keyframe) return true;
            sink_ = sinks_ ? sinks_(config_.container) : nullptr;
            if (!sink_) {
                fail("no sink for container " + config_.container);
                return false;
            }
            stream_ = pkt->stream;
            if (!sink_->open(partPathFor(video_path_), stream_ ? *stream_ : StreamInfo{})) {
                fail("open " + partPathFor(video_path_) + ": " + sink_->lastError());
                sink_.reset();
                return false;
            }
        } else if (pkt->stream && stream_ && pkt->stream != stream_ && !stream_->compatibleWith(*pkt->stream)) {
            return true;
        }

        if (!sink_->write(*pkt)) {
            fail("write " + partPathFor(video_path_) + ": " + sink_->lastError());
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (pkt->timestamp < info_.received_at) {
            if (info_.pre_event_packets == 0) info_.pre_event_start = pkt->timestamp;
            info_.pre_event_packets++;
        } else {
            info_.post_event_packets++;
        }
        return true;
    }

    void finalize() {
        std::string part;
        if (sink_) {
            part = partPathFor(video_path_);
            bool closed = sink_->close();
            sink_.reset();
            if (!closed) {
                fail("close " + part + ": leaving in-progress file");
                return;
            }
        }
        if (video_path_.empty()) return;

        EventRecordingInfo snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            info_.video_path = part.empty() ? std::string() : video_path_;
            info_.sidecar_path = sidecarPathFor(video_path_);
            info_.bytes = part.empty() ? 0 : fileSize(part);
            snapshot = info_;
        }

        nlohmann::json triggers = nlohmann::json::array();
        for (const auto& t : snapshot.triggers) {
            triggers.push_back({
                {"event_type", t.event_type},
                {"timestamp", t.timestamp},
                {"origin", toString(t.origin)},
                {"metadata", t.metadata}
            });
        }
        const bool has_pre = snapshot.pre_event_packets > 0;
        nlohmann::json meta = {
            {"camera_id", camera_id_},
            {"type", "event"},
            {"event_type", snapshot.event_type},
            {"trigger_timestamp", snapshot.trigger_timestamp},
            {"received_at", snapshot.received_at},
            {"pre_event_start", has_pre ? snapshot.pre_event_start : snapshot.received_at},
            {"pre_event_duration", has_pre ? snapshot.received_at - snapshot.pre_event_start : 0.0},
            {"post_event_duration", snapshot.deadline - snapshot.received_at},
            {"post_event_end", snapshot.deadline},
            {"pre_event_frames", snapshot.pre_event_packets},
            {"post_event_frames", snapshot.post_event_packets},
            {"frame_count", snapshot.pre_event_packets + snapshot.post_event_packets},
            {"bytes", snapshot.bytes},
            {"container", config_.container},
            {"file", part.empty() ? std::string()
                                  : std::filesystem::path(video_path_).filename().string()},
            {"keep", true},
            {"triggering_events", triggers}
        };

        std::string err;
        if (!finalizeRecording(part, video_path_, snapshot.sidecar_path, meta, err)) {
            fail("finalize " + snapshot.sidecar_path + ": " + err);
            return;
        }
        succeeded_ = true;
        if (logEnabled(LogLevel::Info)) {
            std::cout << "[INFO] " << tag_ << " finalized " << snapshot.sidecar_path << " ("
                      << snapshot.pre_event_packets << " pre / " << snapshot.post_event_packets
                      << " post packets, " << snapshot.triggers.size() << " trigger(s))" << std::endl;
        }
    }

    void fail(const std::string& msg) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            error_ = msg;
        }
        std::cerr << "[WARN] " << tag_ << " " << msg << std::endl;
    }

    std::string camera_id_;
    RecordingConfig config_;
    PacketFanout& fanout_;
    SinkFactory sinks_;
    WallClock clock_;
    std::string tag_;

    ThreadSafeQueue<StreamItem> queue_;
    PacketFanout::Handle tap_ = 0;
    std::thread thread_;
    std::vector<PacketPtr> snapshot_;

    // session thread only
    std::unique_ptr<IRecordingSink> sink_;
    std::shared_ptr<const StreamInfo> stream_;
    std::string video_path_;
    uint64_t last_seq_ = 0;
    bool have_seq_ = false;

    mutable std::mutex mutex_;
    EventRecordingInfo info_;
    bool closing_ = false;
    bool stop_requested_ = false;
    std::string error_;

    std::atomic<bool> finished_{false};
    std::atomic<bool> succeeded_{false};
    std::atomic<uint64_t> drops_{0};
};

EventRecorder::EventRecorder(const std::string& camera_id, const RecordingConfig& config,
                             RollingBuffer& buffer, PacketFanout& fanout,
                             SinkFactory sinks, WallClock clock)
    : camera_id_(camera_id),
      config_(config),
      buffer_(buffer),
      fanout_(fanout),
      sinks_(std::move(sinks)),
      clock_(clock ? std::move(clock) : WallClock(systemWallClock)),
      tag_("[event " + camera_id + "]") {}

EventRecorder::~EventRecorder() {
    stop();
}

OpResult EventRecorder::trigger(const Event& event) {
    if (event.camera_id != camera_id_) {
        return OpResult::error(ErrorCode::InvalidArgument,
                               "event for camera '" + event.camera_id + "' sent to " + camera_id_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return OpResult::error(ErrorCode::Unavailable, "recorder for " + camera_id_ + " stopped");
    reapLocked();
    if (failed_) {
        return OpResult::error(ErrorCode::Unavailable, "event output for " + camera_id_ + " failed: " + last_error_);
    }

    if (active_ && active_->extend(event)) {
        if (logEnabled(LogLevel::Info)) {
            std::cout << "[INFO] " << tag_ << " coalesced " << event.type << " @" << std::fixed
                      << event.timestamp << ", recording until " << active_->info().deadline
                      << std::defaultfloat << std::endl;
        }
        return OpResult::success();
    }
    if (active_) {
        closing_.push_back(active_);
        active_.reset();
    }

    auto session = std::make_shared<EventSession>(camera_id_, config_, fanout_, sinks_, clock_, event);
    // Attach before the snapshot so nothing falls between the two; overlap is removed by seq.
    session->setTap(fanout_.attach(session));
    session->begin(buffer_.snapshot());
    active_ = session;
    if (logEnabled(LogLevel::Info)) {
        std::cout << "[INFO] " << tag_ << " recording " << event.type << " @" << std::fixed
                  << event.timestamp << " until " << session->info().deadline
                  << std::defaultfloat << " (" << toString(event.origin) << ")" << std::endl;
    }
    return OpResult::success();
}

void EventRecorder::stop() {
    std::vector<std::shared_ptr<EventSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        if (active_) closing_.push_back(active_);
        active_.reset();
        sessions = closing_;
    }
    for (auto& s : sessions) s->requestStop();
    for (auto& s : sessions) s->join();
    std::lock_guard<std::mutex> lock(mutex_);
    reapLocked();
}

void EventRecorder::reapLocked() {
    auto finish = [this](const std::shared_ptr<EventSession>& s) {
        s->join();
        retired_tap_drops_ += s->drops();
        history_.push_back(s->info());
        while (history_.size() > kHistorySize) history_.pop_front();
        if (s->succeeded()) {
            finalized_++;
            consecutive_failures_ = 0;
        } else {
            last_error_ = s->error();
            if (++consecutive_failures_ >= config_.max_sink_failures && !failed_) {
                failed_ = true;
                std::cerr << "[ERROR] " << tag_ << " output path unusable, event recording halted" << std::endl;
            }
        }
    };

    if (active_ && active_->finished()) {
        finish(active_);
        active_.reset();
    }
    for (auto it = closing_.begin(); it != closing_.end();) {
        if ((*it)->finished()) {
            finish(*it);
            it = closing_.erase(it);
        } else {
            ++it;
        }
    }
}

void EventRecorder::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    reapLocked();
}

bool EventRecorder::sessionOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ && active_->open();
}

std::optional<EventRecordingInfo> EventRecorder::activeSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || !active_->open()) return std::nullopt;
    return active_->info();
}

std::vector<EventRecordingInfo> EventRecorder::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<EventRecordingInfo>(history_.begin(), history_.end());
}

uint64_t EventRecorder::tapDrops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = retired_tap_drops_;
    if (active_) total += active_->drops();
    for (const auto& s : closing_) total += s->drops();
    return total;
}

std::string EventRecorder::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

} // namespace camrec
