#ifndef SEGMENT_WRITER_HPP
#define SEGMENT_WRITER_HPP

#include "types.hpp"
#include "ingestor.hpp"
#include "queue.hpp"
#include "sink.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace camrec {

/**
 * @file segment_writer.hpp
 * @brief Continuous recording into wall-clock aligned segments.
 */

/**
 * @brief Consumes the packet fan-out and rotates segment files.
 * @threading offer()/discontinuity() from the ingest thread; one writer
 *            thread owns the sink and all files; accessors from any thread.
 * @ownership Owns the active sink and its in-progress file.
 *
 * Segment boundaries are multiples of segment_duration in epoch time. The
 * writer rotates on the first keyframe at or after a boundary, or on the next
 * packet once the keyframe grace has passed. A discontinuity finalizes the
 * active segment and the writer stays idle until packets resume, so outages
 * show up as gaps between segments.
 */
class SegmentWriter : public IPacketConsumer {
public:
    SegmentWriter(const std::string& camera_id, const RecordingConfig& config,
                  SinkFactory sinks, WallClock clock = systemWallClock);
    ~SegmentWriter() override;

    SegmentWriter(const SegmentWriter&) = delete;
    SegmentWriter& operator=(const SegmentWriter&) = delete;

    bool start();

    /**
     * @brief Drain queued packets, finalize the active segment and join.
     */
    void stop();

    void offer(const PacketPtr& packet) override;
    void discontinuity() override;

    /** @brief Observed start of the segment being written, if any. */
    std::optional<double> activeSegmentStart() const;

    /** @brief Set after max_sink_failures consecutive sink failures. */
    bool failed() const { return failed_.load(); }
    std::string lastError() const;

    uint64_t dropped() const { return dropped_.load(); }
    uint64_t segmentsFinalized() const { return segments_finalized_.load(); }

    /** @brief Most recently finalized segments, oldest first. */
    std::vector<SegmentInfo> recentSegments() const;

    /** @brief Boundary at or before @p ts for @p interval seconds. */
    static double boundaryFloor(double ts, double interval);

private:
    struct ActiveSegment {
        std::unique_ptr<IRecordingSink> sink;
        std::shared_ptr<const StreamInfo> stream;
        std::string video_path;
        std::string part_path;
        double nominal_start = 0.0;
        double next_boundary = 0.0;
        double start = 0.0;
        double last_ts = 0.0;
        double last_duration = 0.0;
        uint64_t frame_count = 0;
    };

    void run();
    void handlePacket(const PacketPtr& packet);
    bool openSegment(const Packet& first);
    void finalizeActive(double end, const char* reason);
    void checkIdleTimer();
    void recordFailure(const std::string& msg);

    std::string camera_id_;
    RecordingConfig config_;
    SinkFactory sinks_;
    WallClock clock_;
    std::string tag_;

    ThreadSafeQueue<StreamItem> queue_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::unique_ptr<ActiveSegment> active_;  // writer thread only
    int consecutive_failures_ = 0;
    bool overflow_logged_ = false;

    mutable std::mutex state_mu_;
    std::optional<double> active_start_;
    std::string last_error_;
    std::deque<SegmentInfo> recent_;

    std::atomic<bool> failed_{false};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> segments_finalized_{0};
};

} // namespace camrec

#endif // SEGMENT_WRITER_HPP
