#ifndef CAMERA_PIPELINE_HPP
#define CAMERA_PIPELINE_HPP

#include "types.hpp"
#include "catalog.hpp"
#include "event_recorder.hpp"
#include "ingestor.hpp"
#include "ring_buffer.hpp"
#include "segment_writer.hpp"
#include "sink.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace camrec {

/**
 * @file camera_pipeline.hpp
 * @brief One camera's ingest, buffer, segment and event stages wired together.
 */

/**
 * @brief Factories and services a pipeline is built from.
 *
 * Empty members fall back to the FFmpeg source, the default sinks, the null
 * catalog and the system clock.
 */
struct PipelineDeps {
    SourceFactory sources;
    SinkFactory sinks;
    std::shared_ptr<ICatalogClient> catalog;
    WallClock clock;
};

/**
 * @brief Complete recording pipeline of a single camera.
 * @threading start()/stop() from the supervisor; status() and recorder()
 *            from any thread. A monitor thread registers the camera with
 *            the catalog, collects finished event sessions and watches for
 *            fatal sink failures.
 * @ownership Owns every stage; the event recorder is shared with the
 *            dispatcher's lanes, which only hold it while triggering.
 *
 * A fatal failure halts ingest for this camera only and is reported as
 * Health::Failed; other pipelines are unaffected.
 */
class CameraPipeline {
public:
    CameraPipeline(const CameraConfig& camera, const ServerConfig& config, PipelineDeps deps);
    ~CameraPipeline();

    CameraPipeline(const CameraPipeline&) = delete;
    CameraPipeline& operator=(const CameraPipeline&) = delete;

    /**
     * @brief Start writer, ingestor and monitor.
     * @return false when the packet source could not be created.
     */
    bool start();

    /**
     * @brief Stop ingest, then finalize the open event session and segment.
     */
    void stop();

    const std::string& id() const { return camera_.id; }
    const CameraConfig& camera() const { return camera_; }
    std::shared_ptr<EventRecorder> recorder() const { return recorder_; }
    bool registered() const { return registered_.load(); }

    Health health() const;
    CameraStatus status() const;

private:
    void monitor();
    void checkHealth();
    void tryRegister();
    std::string lastError() const;

    CameraConfig camera_;
    RecordingConfig recording_;
    PipelineDeps deps_;
    std::string tag_;

    PacketFanout fanout_;
    std::shared_ptr<RollingBuffer> buffer_;
    std::shared_ptr<SegmentWriter> writer_;
    std::shared_ptr<EventRecorder> recorder_;
    std::unique_ptr<FrameIngestor> ingestor_;

    std::thread monitor_;
    std::mutex monitor_mu_;
    std::condition_variable monitor_cv_;
    bool running_ = false;
    bool started_ = false;

    std::atomic<bool> failed_{false};
    std::atomic<bool> registered_{false};
    mutable std::mutex error_mu_;
    std::string catalog_error_;
    std::string fatal_error_;
};

} // namespace camrec

#endif // CAMERA_PIPELINE_HPP
