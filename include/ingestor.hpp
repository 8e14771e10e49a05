#ifndef INGESTOR_HPP
#define INGESTOR_HPP

#include "types.hpp"
#include "capture.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace camrec {

/**
 * @file ingestor.hpp
 * @brief Per-camera frame ingestor, reconnect policy and packet fan-out.
 */

/**
 * @brief Item of a consumer queue: a packet or a source discontinuity marker.
 */
struct StreamItem {
    PacketPtr packet;
    bool discontinuity = false;
};

/**
 * @brief Receiver of the ingested packet stream.
 * @threading Both calls come from the ingest thread and must not block.
 */
class IPacketConsumer {
public:
    virtual ~IPacketConsumer() = default;

    /** @brief Accept a packet; drop something rather than wait when saturated. */
    virtual void offer(const PacketPtr& packet) = 0;

    /** @brief The source was lost; the next packet starts a new connection. */
    virtual void discontinuity() = 0;
};

/**
 * @brief Delivers every packet to all attached consumers in order.
 * @threading attach/detach from any thread; publish from the ingest thread.
 *
 * The consumer list is copy-on-write, so publishing never waits on a
 * concurrent attach or detach.
 */
class PacketFanout {
public:
    using Handle = uint64_t;

    Handle attach(std::shared_ptr<IPacketConsumer> consumer);
    void detach(Handle handle);
    size_t consumerCount() const;

    void publish(const PacketPtr& packet);
    void signalDiscontinuity();

private:
    struct Entry {
        Handle handle;
        std::shared_ptr<IPacketConsumer> consumer;
    };
    using List = std::vector<Entry>;

    std::shared_ptr<const List> current() const;

    mutable std::mutex mutex_;
    std::shared_ptr<const List> consumers_ = std::make_shared<List>();
    Handle next_handle_ = 1;
};

/**
 * @brief Exponential reconnect delay with an upper bound.
 */
class Backoff {
public:
    Backoff(double initial, double max, double factor);

    /** @brief Delay to wait now; grows the delay for the next call. */
    double next();
    void reset();
    double peek() const { return current_; }

private:
    double initial_;
    double max_;
    double factor_;
    double current_;
};

using SourceFactory = std::function<std::unique_ptr<IPacketSource>(const CameraConfig&)>;

/**
 * @brief Default factory building FFmpeg sources from camera URLs.
 */
SourceFactory defaultSourceFactory(const IngestConfig& config);

/**
 * @brief Connects to one camera and publishes its packets until stopped.
 * @threading Owns a single ingest thread; accessors are safe from any thread.
 * @ownership Owns its packet source; shares packets with consumers.
 *
 * Connection loss never ends the stream: the ingestor backs off and
 * reconnects indefinitely, signalling a discontinuity on every loss.
 */
class FrameIngestor {
public:
    FrameIngestor(const CameraConfig& camera, const IngestConfig& config,
                  PacketFanout& fanout, SourceFactory factory);
    ~FrameIngestor();

    FrameIngestor(const FrameIngestor&) = delete;
    FrameIngestor& operator=(const FrameIngestor&) = delete;

    bool start();

    /**
     * @brief Cancel the reconnect loop and any blocking read, then join.
     */
    void stop();

    IngestState state() const { return state_.load(); }
    bool connected() const { return state_.load() == IngestState::Connected; }
    uint64_t packetsIn() const { return packets_in_.load(); }
    uint64_t bytesIn() const { return bytes_in_.load(); }
    uint64_t reconnects() const { return reconnects_.load(); }
    std::string lastError() const;

private:
    void run();
    void runConnection();
    bool waitFor(double seconds);
    void setState(IngestState s);
    void setError(const std::string& msg);

    CameraConfig camera_;
    IngestConfig config_;
    PacketFanout& fanout_;
    SourceFactory factory_;
    std::unique_ptr<IPacketSource> source_;
    std::string tag_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<IngestState> state_{IngestState::Idle};
    std::mutex wait_mu_;
    std::condition_variable wait_cv_;

    Backoff backoff_;
    uint64_t next_seq_ = 0;
    double last_timestamp_ = 0.0;
    uint64_t generation_ = 0;
    std::chrono::steady_clock::time_point anchor_steady_;
    double anchor_wall_ = 0.0;

    std::atomic<uint64_t> packets_in_{0};
    std::atomic<uint64_t> bytes_in_{0};
    std::atomic<uint64_t> reconnects_{0};
    mutable std::mutex error_mu_;
    std::string last_error_;
};

} // namespace camrec

#endif // INGESTOR_HPP
