#include "ingestor.hpp"
#include "logging.hpp"
#include <algorithm>
#include <iostream>

/**
 * @file ingestor.cpp
 * @brief Reconnect loop, capture timestamping and consumer fan-out.
 */

namespace camrec {

PacketFanout::Handle PacketFanout::attach(std::shared_ptr<IPacketConsumer> consumer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<List>(*consumers_);
    Handle handle = next_handle_++;
    next->push_back(Entry{handle, std::move(consumer)});
    consumers_ = std::move(next);
    return handle;
}

void PacketFanout::detach(Handle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<List>();
    for (const auto& entry : *consumers_) {
        if (entry.handle != handle) next->push_back(entry);
    }
    consumers_ = std::move(next);
}

size_t PacketFanout::consumerCount() const {
    return current()->size();
}

std::shared_ptr<const PacketFanout::List> PacketFanout::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumers_;
}

void PacketFanout::publish(const PacketPtr& packet) {
    auto list = current();
    for (const auto& entry : *list) {
        entry.consumer->offer(packet);
    }
}

void PacketFanout::signalDiscontinuity() {
    auto list = current();
    for (const auto& entry : *list) {
        entry.consumer->discontinuity();
    }
}

Backoff::Backoff(double initial, double max, double factor)
    : initial_(initial > 0 ? initial : 1.0),
      max_(std::max(max, initial_)),
      factor_(factor >= 1.0 ? factor : 1.0),
      current_(initial_) {}

double Backoff::next() {
    double delay = current_;
    current_ = std::min(current_ * factor_, max_);
    return delay;
}

void Backoff::reset() {
    current_ = initial_;
}

SourceFactory defaultSourceFactory(const IngestConfig& config) {
    return [config](const CameraConfig& camera) {
        return createPacketSource(camera.rtsp_url, config);
    };
}

FrameIngestor::FrameIngestor(const CameraConfig& camera, const IngestConfig& config,
                             PacketFanout& fanout, SourceFactory factory)
    : camera_(camera),
      config_(config),
      fanout_(fanout),
      factory_(std::move(factory)),
      tag_("[ingest " + camera.id + "]"),
      backoff_(config.backoff_initial, config.backoff_max, config.backoff_factor) {}

FrameIngestor::~FrameIngestor() {
    stop();
}

bool FrameIngestor::start() {
    if (running_) return true;
    source_ = factory_ ? factory_(camera_) : nullptr;
    if (!source_) {
        setError("no packet source for " + maskCredentials(camera_.rtsp_url));
        std::cerr << "[ERROR] " << tag_ << " " << lastError() << std::endl;
        setState(IngestState::Stopped);
        return false;
    }
    anchor_steady_ = std::chrono::steady_clock::now();
    anchor_wall_ = systemWallClock();
    running_ = true;
    thread_ = std::thread(&FrameIngestor::run, this);
    return true;
}

void FrameIngestor::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mu_);
        running_ = false;
    }
    if (source_) source_->interrupt();
    wait_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    setState(IngestState::Stopped);
}

std::string FrameIngestor::lastError() const {
    std::lock_guard<std::mutex> lock(error_mu_);
    return last_error_;
}

void FrameIngestor::setState(IngestState s) {
    state_.store(s);
}

void FrameIngestor::setError(const std::string& msg) {
    std::lock_guard<std::mutex> lock(error_mu_);
    last_error_ = msg;
}

bool FrameIngestor::waitFor(double seconds) {
    std::unique_lock<std::mutex> lock(wait_mu_);
    auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
    wait_cv_.wait_for(lock, timeout, [&]{ return !running_.load(); });
    return running_.load();
}

void FrameIngestor::run() {
    try {
        const std::string url = buildSourceUrl(camera_);
        const std::string masked = maskCredentials(url);
        bool first_attempt = true;

        while (running_) {
            if (!first_attempt) reconnects_++;
            first_attempt = false;

            setState(IngestState::Connecting);
            if (logEnabled(LogLevel::Debug)) {
                std::cout << "[DEBUG] " << tag_ << " connecting to " << masked << std::endl;
            }
            if (source_->open(url)) {
                runConnection();
                source_->close();
                fanout_.signalDiscontinuity();
            } else {
                setError(source_->lastError());
                std::cerr << "[WARN] " << tag_ << " connect failed: " << source_->lastError() << std::endl;
            }
            if (!running_) break;

            setState(IngestState::Backoff);
            double delay = backoff_.next();
            if (logEnabled(LogLevel::Info)) {
                std::cout << "[INFO] " << tag_ << " retrying in " << delay << "s" << std::endl;
            }
            if (!waitFor(delay)) break;
        }
    } catch (const std::exception& e) {
        setError(e.what());
        std::cerr << "[ERROR] " << tag_ << " ingest thread exception: " << e.what() << std::endl;
    }
    source_->close();
    setState(IngestState::Stopped);
}

void FrameIngestor::runConnection() {
    auto base = source_->streamInfo();
    auto info = std::make_shared<StreamInfo>(base ? *base : StreamInfo{});
    info->generation = ++generation_;
    std::shared_ptr<const StreamInfo> shared_info = info;

    setState(IngestState::Connected);
    if (logEnabled(LogLevel::Info)) {
        std::cout << "[INFO] " << tag_ << " connected: " << info->codec_name << " "
                  << info->width << "x" << info->height << std::endl;
    }

    uint64_t delivered = 0;
    while (running_) {
        Packet pkt;
        if (!source_->read(pkt)) {
            if (running_) {
                setError(source_->lastError());
                std::cerr << "[WARN] " << tag_ << " stream lost: " << source_->lastError() << std::endl;
            }
            break;
        }

        double ts = pkt.timestamp;
        if (ts <= 0.0) {
            ts = anchor_wall_ + std::chrono::duration<double>(
                std::chrono::steady_clock::now() - anchor_steady_).count();
        }
        pkt.timestamp = std::max(ts, last_timestamp_);
        last_timestamp_ = pkt.timestamp;
        pkt.seq = next_seq_++;
        pkt.stream = shared_info;

        packets_in_++;
        bytes_in_ += pkt.data.size();
        fanout_.publish(std::make_shared<const Packet>(std::move(pkt)));

        if (delivered++ == 0) backoff_.reset();
    }
}

} // namespace camrec
