#include "camera_pipeline.hpp"
#include "capture.hpp"
#include "logging.hpp"
#include <chrono>
#include <iostream>

/**
 * @file camera_pipeline.cpp
 * @brief Per-camera stage wiring, catalog registration and health.
 */

namespace camrec {

namespace {

constexpr auto kMonitorPeriod = std::chrono::milliseconds(200);
constexpr double kRegisterRetrySeconds = 60.0;

} // namespace

CameraPipeline::CameraPipeline(const CameraConfig& camera, const ServerConfig& config, PipelineDeps deps)
    : camera_(camera),
      recording_(config.recording),
      deps_(std::move(deps)),
      tag_("[camera " + camera.id + "]") {
    if (!deps_.sources) deps_.sources = defaultSourceFactory(config.ingest);
    if (!deps_.sinks) deps_.sinks = defaultSinkFactory();
    if (!deps_.catalog) deps_.catalog = std::make_shared<NullCatalogClient>();
    if (!deps_.clock) deps_.clock = systemWallClock;

    buffer_ = std::make_shared<RollingBuffer>(recording_.pre_event_buffer, recording_.buffer_max_bytes,
                                              recording_.buffer_max_packets, camera_.id);
    writer_ = std::make_shared<SegmentWriter>(camera_.id, recording_, deps_.sinks, deps_.clock);
    recorder_ = std::make_shared<EventRecorder>(camera_.id, recording_, *buffer_, fanout_,
                                                deps_.sinks, deps_.clock);
    ingestor_ = std::make_unique<FrameIngestor>(camera_, config.ingest, fanout_, deps_.sources);
}

CameraPipeline::~CameraPipeline() {
    stop();
}

bool CameraPipeline::start() {
    std::lock_guard<std::mutex> lock(monitor_mu_);
    if (started_) return true;

    writer_->start();
    fanout_.attach(buffer_);
    fanout_.attach(writer_);
    if (!ingestor_->start()) {
        writer_->stop();
        return false;
    }
    started_ = true;
    running_ = true;
    monitor_ = std::thread(&CameraPipeline::monitor, this);
    std::cout << "[INFO] " << tag_ << " started: " << maskCredentials(camera_.rtsp_url) << std::endl;
    return true;
}

void CameraPipeline::stop() {
    {
        std::lock_guard<std::mutex> lock(monitor_mu_);
        if (!started_) return;
        started_ = false;
        running_ = false;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable()) monitor_.join();

    // Ingest first so the recorder and writer see the final packet set.
    ingestor_->stop();
    recorder_->stop();
    writer_->stop();
    std::cout << "[INFO] " << tag_ << " stopped, " << writer_->segmentsFinalized() << " segment(s) and "
              << recorder_->recordingsFinalized() << " event recording(s) finalized" << std::endl;
}

void CameraPipeline::monitor() {
    auto next_register = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(monitor_mu_);
    while (running_) {
        lock.unlock();
        try {
            if (!registered_ && deps_.catalog->enabled() && std::chrono::steady_clock::now() >= next_register) {
                tryRegister();
                next_register = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(kRegisterRetrySeconds));
            }
            recorder_->poll();
            checkHealth();
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] " << tag_ << " monitor exception: " << e.what() << std::endl;
        }
        lock.lock();
        monitor_cv_.wait_for(lock, kMonitorPeriod, [&]{ return !running_; });
    }
}

void CameraPipeline::tryRegister() {
    OpResult result = deps_.catalog->registerCamera(camera_, recording_);
    std::lock_guard<std::mutex> lock(error_mu_);
    if (result.ok()) {
        registered_ = true;
        catalog_error_.clear();
        std::cout << "[INFO] " << tag_ << " registered with catalog" << std::endl;
    } else {
        catalog_error_ = result.message;
        std::cerr << "[WARN] " << tag_ << " catalog registration failed, recording locally: "
                  << result.message << std::endl;
    }
}

void CameraPipeline::checkHealth() {
    if (failed_) return;
    std::string reason;
    if (writer_->failed()) {
        reason = "segment output failed: " + writer_->lastError();
    } else if (recorder_->failed()) {
        reason = "event output failed: " + recorder_->lastError();
    }
    if (reason.empty()) return;

    {
        std::lock_guard<std::mutex> lock(error_mu_);
        fatal_error_ = reason;
    }
    failed_ = true;
    std::cerr << "[ERROR] " << tag_ << " " << reason << "; halting ingest for this camera" << std::endl;
    ingestor_->stop();
}

std::string CameraPipeline::lastError() const {
    {
        std::lock_guard<std::mutex> lock(error_mu_);
        if (!fatal_error_.empty()) return fatal_error_;
        if (!catalog_error_.empty()) return "catalog: " + catalog_error_;
    }
    return ingestor_->lastError();
}

Health CameraPipeline::health() const {
    if (failed_ || writer_->failed() || recorder_->failed()) return Health::Failed;
    const IngestState state = ingestor_->state();
    if (buffer_->degraded() || state == IngestState::Backoff || state == IngestState::Connecting) {
        return Health::Degraded;
    }
    return Health::Ok;
}

CameraStatus CameraPipeline::status() const {
    CameraStatus s;
    s.camera_id = camera_.id;
    s.ingest_state = ingestor_->state();
    s.connected = ingestor_->connected();
    s.health = health();
    s.active_segment_start = writer_->activeSegmentStart();
    if (auto session = recorder_->activeSession()) {
        s.event_session_open = true;
        s.event_deadline = session->deadline;
    }
    s.registered = registered_.load();
    if (s.health != Health::Ok) s.last_error = lastError();

    CameraCounters& c = s.counters;
    c.packets_in = ingestor_->packetsIn();
    c.bytes_in = ingestor_->bytesIn();
    c.writer_drops = writer_->dropped();
    c.tap_drops = recorder_->tapDrops();
    c.buffer_evictions = buffer_->ceilingEvictions();
    c.buffered_packets = buffer_->size();
    c.buffered_bytes = buffer_->bytes();
    c.segments_finalized = writer_->segmentsFinalized();
    c.events_finalized = recorder_->recordingsFinalized();
    c.reconnects = ingestor_->reconnects();
    return s;
}

} // namespace camrec
