#include "segment_writer.hpp"
#include "logging.hpp"
#include "storage.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>

/**
 * @file segment_writer.cpp
 * @brief Segment rotation, pause on outage and crash-safe finalize.
 */

namespace camrec {

namespace {
constexpr size_t kRecentSegments = 32;
constexpr auto kIdlePoll = std::chrono::milliseconds(250);
}

SegmentWriter::SegmentWriter(const std::string& camera_id, const RecordingConfig& config,
                             SinkFactory sinks, WallClock clock)
    : camera_id_(camera_id),
      config_(config),
      sinks_(std::move(sinks)),
      clock_(clock ? std::move(clock) : WallClock(systemWallClock)),
      tag_("[segment " + camera_id + "]"),
      queue_(config.queue_capacity) {}

SegmentWriter::~SegmentWriter() {
    stop();
}

double SegmentWriter::boundaryFloor(double ts, double interval) {
    return std::floor(ts / interval) * interval;
}

bool SegmentWriter::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&SegmentWriter::run, this);
    return true;
}

void SegmentWriter::stop() {
    running_ = false;
    queue_.stop();
    if (thread_.joinable()) thread_.join();
}

void SegmentWriter::offer(const PacketPtr& packet) {
    if (failed_) return;
    if (queue_.pushDropOldest(StreamItem{packet, false})) {
        dropped_++;
        if (!overflow_logged_) {
            overflow_logged_ = true;
            std::cerr << "[WARN] " << tag_ << " writer queue full, dropping oldest packets" << std::endl;
        }
    } else if (overflow_logged_ && queue_.size() < queue_.capacity() / 2) {
        overflow_logged_ = false;
        std::cout << "[INFO] " << tag_ << " writer caught up" << std::endl;
    }
}

void SegmentWriter::discontinuity() {
    if (failed_) return;
    if (queue_.pushDropOldest(StreamItem{nullptr, true})) dropped_++;
}

std::optional<double> SegmentWriter::activeSegmentStart() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return active_start_;
}

std::string SegmentWriter::lastError() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return last_error_;
}

std::vector<SegmentInfo> SegmentWriter::recentSegments() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return std::vector<SegmentInfo>(recent_.begin(), recent_.end());
}

void SegmentWriter::run() {
    try {
        while (true) {
            StreamItem item;
            auto result = queue_.popFor(item, kIdlePoll);
            if (result == ThreadSafeQueue<StreamItem>::PopResult::Stopped) break;
            if (result == ThreadSafeQueue<StreamItem>::PopResult::Timeout) {
                checkIdleTimer();
                continue;
            }
            if (item.discontinuity) {
                if (active_) finalizeActive(active_->last_ts + active_->last_duration, "source lost");
                continue;
            }
            if (item.packet) handlePacket(item.packet);
        }
        if (active_) finalizeActive(active_->last_ts + active_->last_duration, "stop");
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << tag_ << " writer thread exception: " << e.what() << std::endl;
        {
            std::lock_guard<std::mutex> lock(state_mu_);
            last_error_ = e.what();
            active_start_.reset();
        }
        failed_ = true;
    }
}

void SegmentWriter::handlePacket(const PacketPtr& packet) {
    if (failed_) return;
    const Packet& pkt = *packet;

    bool rotated = false;
    if (active_) {
        const double boundary = active_->next_boundary;
        bool at_boundary = pkt.timestamp >= boundary &&
                           (pkt.keyframe || pkt.timestamp >= boundary + config_.rotation_keyframe_grace);
        bool stream_changed = pkt.stream && active_->stream && pkt.stream != active_->stream &&
                              !active_->stream->compatibleWith(*pkt.stream);
        if (at_boundary || stream_changed) {
            finalizeActive(pkt.timestamp, at_boundary ? "rotation" : "stream parameters changed");
            rotated = at_boundary;
        }
    }

    if (!active_) {
        // A new recording has to start on a keyframe unless a rotation was forced.
        if (!pkt.keyframe && !rotated) return;
        if (!openSegment(pkt)) return;
    }

    if (!active_->sink->write(pkt)) {
        recordFailure("write " + active_->part_path + ": " + active_->sink->lastError());
        finalizeActive(active_->last_ts + active_->last_duration, "write failure");
        return;
    }
    active_->frame_count++;
    active_->last_ts = pkt.timestamp;
    active_->last_duration = pkt.duration;
    consecutive_failures_ = 0;
}

bool SegmentWriter::openSegment(const Packet& first) {
    const double ts = first.timestamp;
    std::string err;
    const std::string dir = recordingDir(config_.base_dir, camera_id_, ts);
    const std::string video = allocateRecordingPath(
        dir, "segment_" + formatLocalTime(ts, "%H-%M-%S"), containerExtension(config_.container), err);
    if (video.empty()) {
        recordFailure(err);
        return false;
    }

    auto sink = sinks_ ? sinks_(config_.container) : nullptr;
    if (!sink) {
        recordFailure("no sink for container " + config_.container);
        return false;
    }
    const std::string part = partPathFor(video);
    if (!sink->open(part, first.stream ? *first.stream : StreamInfo{})) {
        recordFailure("open " + part + ": " + sink->lastError());
        return false;
    }

    auto seg = std::make_unique<ActiveSegment>();
    seg->sink = std::move(sink);
    seg->stream = first.stream;
    seg->video_path = video;
    seg->part_path = part;
    seg->nominal_start = boundaryFloor(ts, config_.segment_duration);
    seg->next_boundary = seg->nominal_start + config_.segment_duration;
    seg->start = ts;
    seg->last_ts = ts;
    active_ = std::move(seg);
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        active_start_ = ts;
    }
    if (logEnabled(LogLevel::Debug)) {
        std::cout << "[DEBUG] " << tag_ << " opened " << part << std::endl;
    }
    return true;
}

void SegmentWriter::finalizeActive(double end, const char* reason) {
    if (!active_) return;
    std::unique_ptr<ActiveSegment> seg = std::move(active_);
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        active_start_.reset();
    }

    if (!seg->sink->close()) {
        // Left as .part; startup recovery renames it to .incomplete.
        recordFailure("close " + seg->part_path + ": " + seg->sink->lastError());
        return;
    }
    if (seg->frame_count == 0) {
        std::error_code ec;
        std::filesystem::remove(seg->part_path, ec);
        return;
    }

    SegmentInfo info;
    info.camera_id = camera_id_;
    info.video_path = seg->video_path;
    info.sidecar_path = sidecarPathFor(seg->video_path);
    info.start = seg->start;
    info.end = std::max(end, seg->start);
    info.frame_count = seg->frame_count;
    info.bytes = fileSize(seg->part_path);

    nlohmann::json meta = {
        {"camera_id", camera_id_},
        {"type", "continuous"},
        {"start", info.start},
        {"end", info.end},
        {"duration", info.end - info.start},
        {"nominal_start", seg->nominal_start},
        {"frame_count", info.frame_count},
        {"bytes", info.bytes},
        {"container", config_.container},
        {"file", std::filesystem::path(info.video_path).filename().string()},
        {"keep", false}
    };
    if (seg->stream) {
        meta["codec"] = seg->stream->codec_name;
        meta["width"] = seg->stream->width;
        meta["height"] = seg->stream->height;
    }

    std::string err;
    if (!finalizeRecording(seg->part_path, info.video_path, info.sidecar_path, meta, err)) {
        recordFailure("finalize " + info.video_path + ": " + err);
        return;
    }

    segments_finalized_++;
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        recent_.push_back(info);
        while (recent_.size() > kRecentSegments) recent_.pop_front();
    }
    if (logEnabled(LogLevel::Info)) {
        std::cout << "[INFO] " << tag_ << " finalized " << info.video_path << " ("
                  << info.frame_count << " packets, " << (info.end - info.start) << "s, "
                  << reason << ")" << std::endl;
    }
}

void SegmentWriter::checkIdleTimer() {
    if (!active_) return;
    if (clock_() >= active_->next_boundary + config_.rotation_keyframe_grace) {
        finalizeActive(active_->last_ts + active_->last_duration, "stream stalled");
    }
}

void SegmentWriter::recordFailure(const std::string& msg) {
    consecutive_failures_++;
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        last_error_ = msg;
    }
    std::cerr << "[WARN] " << tag_ << " " << msg << " (" << consecutive_failures_ << "/"
              << config_.max_sink_failures << ")" << std::endl;
    if (consecutive_failures_ >= config_.max_sink_failures && !failed_) {
        failed_ = true;
        queue_.clear();
        std::cerr << "[ERROR] " << tag_ << " output path unusable, continuous recording halted" << std::endl;
    }
}

} // namespace camrec
