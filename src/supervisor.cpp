#include "supervisor.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "retention.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <vector>

/**
 * @file supervisor.cpp
 * @brief Camera registry, status surface, metrics and retention threads.
 */

namespace camrec {

Supervisor::Supervisor(const ServerConfig& config, PipelineDeps deps)
    : config_(config),
      deps_(std::move(deps)),
      registry_(std::make_shared<const Registry>()) {
    if (!deps_.catalog) deps_.catalog = createCatalogClient(config_.catalog);
    if (!deps_.clock) deps_.clock = systemWallClock;
}

Supervisor::~Supervisor() {
    stop();
}

std::shared_ptr<const Supervisor::Registry> Supervisor::registry() const {
    return std::atomic_load(&registry_);
}

void Supervisor::publish(std::shared_ptr<const Registry> next) {
    std::atomic_store(&registry_, std::move(next));
}

void Supervisor::setRemovalListener(RemovalListener listener) {
    std::lock_guard<std::mutex> lock(structure_mu_);
    removal_listener_ = std::move(listener);
}

bool Supervisor::start() {
    {
        std::lock_guard<std::mutex> lock(stop_mu_);
        if (running_ || stopped_) return running_;
        running_ = true;
    }
    if (!config_.perf_json_path.empty()) {
        metrics_writer_ = std::make_unique<JSONLMetricsWriter>(config_.perf_json_path);
    }
    metrics_thread_ = std::thread(&Supervisor::metricsLoop, this);
    if (config_.recording.retention_days > 0) {
        retention_thread_ = std::thread(&Supervisor::retentionLoop, this);
    }

    for (const auto& cam : config_.cameras) {
        OpResult r = addCamera(cam);
        if (!r.ok()) {
            std::cerr << "[ERROR] [supervisor] camera " << cam.id << " not started: "
                      << toString(r.code) << ": " << r.message << std::endl;
        }
    }
    std::cout << "[INFO] [supervisor] running with " << registry()->size() << " camera(s)" << std::endl;
    return true;
}

void Supervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mu_);
        if (stopped_) return;
        stopped_ = true;
        running_ = false;
    }
    stop_cv_.notify_all();
    if (metrics_thread_.joinable()) metrics_thread_.join();
    if (retention_thread_.joinable()) retention_thread_.join();

    std::shared_ptr<const Registry> cameras;
    {
        std::lock_guard<std::mutex> lock(structure_mu_);
        cameras = registry();
        publish(std::make_shared<const Registry>());
    }
    std::vector<std::thread> stoppers;
    for (const auto& entry : *cameras) {
        auto pipeline = entry.second;
        stoppers.emplace_back([pipeline]{ pipeline->stop(); });
    }
    for (auto& t : stoppers) t.join();
    if (!cameras->empty()) {
        std::cout << "[INFO] [supervisor] stopped " << cameras->size() << " camera(s)" << std::endl;
    }
}

OpResult Supervisor::addCamera(const CameraConfig& camera) {
    OpResult valid = validateCameraConfig(camera);
    if (!valid.ok()) return valid;
    {
        std::lock_guard<std::mutex> lock(structure_mu_);
        {
            std::lock_guard<std::mutex> stop_lock(stop_mu_);
            if (stopped_) return OpResult::error(ErrorCode::Unavailable, "supervisor stopped");
        }
        if (registry()->count(camera.id) || pending_.count(camera.id)) {
            return OpResult::error(ErrorCode::Conflict, "camera '" + camera.id + "' already exists");
        }
        pending_.insert(camera.id);
    }

    auto pipeline = std::make_shared<CameraPipeline>(camera, config_, deps_);
    const bool started = pipeline->start();

    std::unique_lock<std::mutex> lock(structure_mu_);
    pending_.erase(camera.id);
    if (!started) {
        return OpResult::error(ErrorCode::InvalidArgument,
                               "unsupported source for camera '" + camera.id + "'");
    }
    bool stopping;
    {
        std::lock_guard<std::mutex> stop_lock(stop_mu_);
        stopping = stopped_;
    }
    if (stopping) {
        lock.unlock();
        pipeline->stop();
        return OpResult::error(ErrorCode::Unavailable, "supervisor stopped");
    }
    auto next = std::make_shared<Registry>(*registry());
    (*next)[camera.id] = pipeline;
    publish(std::move(next));
    std::cout << "[INFO] [supervisor] added camera " << camera.id << std::endl;
    return OpResult::success();
}

OpResult Supervisor::removeCamera(const std::string& camera_id) {
    std::shared_ptr<CameraPipeline> pipeline;
    RemovalListener listener;
    {
        std::lock_guard<std::mutex> lock(structure_mu_);
        auto current = registry();
        auto it = current->find(camera_id);
        if (it == current->end()) {
            return OpResult::error(ErrorCode::NotFound, "unknown camera '" + camera_id + "'");
        }
        pipeline = it->second;
        auto next = std::make_shared<Registry>(*current);
        next->erase(camera_id);
        publish(std::move(next));
        pending_.insert(camera_id);
        listener = removal_listener_;
    }

    if (listener) listener(camera_id);
    pipeline->stop();
    if (pipeline->registered()) {
        OpResult r = deps_.catalog->unregisterCamera(camera_id);
        if (!r.ok()) {
            std::cerr << "[WARN] [supervisor] catalog unregister " << camera_id << " failed: " << r.message << std::endl;
        }
    }

    {
        std::lock_guard<std::mutex> lock(structure_mu_);
        pending_.erase(camera_id);
    }
    std::cout << "[INFO] [supervisor] removed camera " << camera_id << std::endl;
    return OpResult::success();
}

std::shared_ptr<EventRecorder> Supervisor::findRecorder(const std::string& camera_id) const {
    auto current = registry();
    auto it = current->find(camera_id);
    if (it == current->end()) return nullptr;
    return it->second->recorder();
}

ServerStatus Supervisor::status() const {
    ServerStatus s;
    s.running = running_.load();
    auto current = registry();
    for (const auto& entry : *current) {
        s.camera_ids.push_back(entry.first);
        s.cameras.push_back(entry.second->status());
    }
    return s;
}

std::optional<CameraStatus> Supervisor::cameraStatus(const std::string& camera_id) const {
    auto current = registry();
    auto it = current->find(camera_id);
    if (it == current->end()) return std::nullopt;
    return it->second->status();
}

bool Supervisor::waitStop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stop_mu_);
    stop_cv_.wait_for(lock, timeout, [&]{ return stopped_; });
    return !stopped_;
}

void Supervisor::metricsLoop() {
    const auto period = std::chrono::milliseconds(config_.perf_interval_ms);
    auto last = std::chrono::steady_clock::now();
    while (waitStop(period)) {
        auto now = std::chrono::steady_clock::now();
        double interval_s = std::chrono::duration<double>(now - last).count();
        last = now;
        try {
            sampleMetrics(interval_s);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] [metrics] sampling failed: " << e.what() << std::endl;
        }
    }
}

void Supervisor::sampleMetrics(double interval_s) {
    const int64_t ts_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    ServerStatus snapshot = status();
    std::map<std::string, std::pair<uint64_t, uint64_t>> counts;
    for (const auto& cam : snapshot.cameras) {
        const CameraCounters& c = cam.counters;
        auto prev = last_counts_.find(cam.camera_id);
        uint64_t prev_packets = prev == last_counts_.end() ? 0 : prev->second.first;
        uint64_t prev_bytes = prev == last_counts_.end() ? 0 : prev->second.second;
        double pps = interval_s > 0.0 ? (c.packets_in - prev_packets) / interval_s : 0.0;
        double bps = interval_s > 0.0 ? (c.bytes_in - prev_bytes) / interval_s : 0.0;
        counts[cam.camera_id] = {c.packets_in, c.bytes_in};

        if (metrics_writer_) metrics_writer_->write(ts_ms, cam, interval_s, pps, bps);
        if (logEnabled(LogLevel::Info)) {
            std::cout << std::fixed << std::setprecision(1)
                      << "[metrics] " << cam.camera_id
                      << " state=" << toString(cam.ingest_state)
                      << " health=" << toString(cam.health)
                      << " pps=" << pps
                      << " kbps=" << bps * 8.0 / 1000.0
                      << " buffered=" << c.buffered_packets
                      << " segments=" << c.segments_finalized
                      << " events=" << c.events_finalized
                      << " drops=" << (c.writer_drops + c.tap_drops)
                      << " evicted=" << c.buffer_evictions
                      << std::defaultfloat << std::endl;
        }
    }
    last_counts_.swap(counts);
}

void Supervisor::retentionLoop() {
    const auto period = std::chrono::seconds(config_.recording.retention_interval);
    do {
        try {
            sweepRecordings(config_.recording.base_dir, config_.recording.retention_days, false, deps_.clock());
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] [retention] sweep failed: " << e.what() << std::endl;
        }
    } while (waitStop(std::chrono::duration_cast<std::chrono::milliseconds>(period)));
}

} // namespace camrec
