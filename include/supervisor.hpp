#ifndef SUPERVISOR_HPP
#define SUPERVISOR_HPP

#include "types.hpp"
#include "camera_pipeline.hpp"
#include "dispatcher.hpp"
#include "metrics.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace camrec {

/**
 * @file supervisor.hpp
 * @brief Registry of camera pipelines and the server-wide housekeeping threads.
 */

/**
 * @brief Owns every camera pipeline and the status surface.
 * @threading addCamera/removeCamera/status/findRecorder from any thread.
 *            Structural changes are serialized by a mutex; readers load an
 *            immutable registry snapshot and never wait on them.
 * @lifecycle start() launches the metrics and retention threads and adds the
 *            configured cameras; stop() finalizes every pipeline.
 */
class Supervisor : public IRecorderDirectory {
public:
    using RemovalListener = std::function<void(const std::string& camera_id)>;

    explicit Supervisor(const ServerConfig& config, PipelineDeps deps = PipelineDeps());
    ~Supervisor() override;

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * @brief Start housekeeping threads and add the configured cameras.
     *
     * A camera that cannot be added is logged and skipped.
     */
    bool start();

    /** @brief Stop housekeeping and finalize all pipelines in parallel. */
    void stop();

    bool running() const { return running_.load(); }

    /**
     * @brief Create and start a pipeline for @p camera.
     * @return Conflict if the id is registered or still being removed,
     *         InvalidArgument for a bad config or unsupported source,
     *         Unavailable after stop().
     */
    OpResult addCamera(const CameraConfig& camera);

    /**
     * @brief Unregister and stop a pipeline, finalizing its open recordings.
     * @return NotFound for an unknown id.
     */
    OpResult removeCamera(const std::string& camera_id);

    ServerStatus status() const;
    std::optional<CameraStatus> cameraStatus(const std::string& camera_id) const;

    std::shared_ptr<EventRecorder> findRecorder(const std::string& camera_id) const override;

    /** @brief Called after a camera leaves the registry, before its pipeline stops. */
    void setRemovalListener(RemovalListener listener);

private:
    using Registry = std::map<std::string, std::shared_ptr<CameraPipeline>>;

    std::shared_ptr<const Registry> registry() const;
    void publish(std::shared_ptr<const Registry> next);
    void metricsLoop();
    void retentionLoop();
    void sampleMetrics(double interval_s);
    bool waitStop(std::chrono::milliseconds timeout);

    ServerConfig config_;
    PipelineDeps deps_;

    std::mutex structure_mu_;              //!< Serializes add/remove.
    std::shared_ptr<const Registry> registry_;
    std::set<std::string> pending_;        //!< Ids being added or retiring.
    RemovalListener removal_listener_;

    std::atomic<bool> running_{false};
    bool stopped_ = false;
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    std::thread metrics_thread_;
    std::thread retention_thread_;

    std::unique_ptr<JSONLMetricsWriter> metrics_writer_;
    std::map<std::string, std::pair<uint64_t, uint64_t>> last_counts_; //!< Metrics thread only.
};

} // namespace camrec

#endif // SUPERVISOR_HPP
