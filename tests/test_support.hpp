#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "capture.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <stdlib.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @file test_support.hpp
 * @brief Shared fakes for the test executables: scripted sources, clocks, temp dirs.
 */

namespace camrec {
namespace testing {

inline std::shared_ptr<const StreamInfo> fakeStream(int width = 640, int height = 360) {
    auto info = std::make_shared<StreamInfo>();
    info->codec_id = 27; // H.264
    info->codec_name = "h264";
    info->width = width;
    info->height = height;
    info->extradata = {0x01, 0x64, 0x00, 0x1f};
    return info;
}

inline PacketPtr makePacket(uint64_t seq, double ts, bool keyframe = true, size_t bytes = 100,
                            std::shared_ptr<const StreamInfo> stream = nullptr) {
    auto pkt = std::make_shared<Packet>();
    pkt->seq = seq;
    pkt->timestamp = ts;
    pkt->duration = 0.0;
    pkt->keyframe = keyframe;
    pkt->data.assign(bytes, static_cast<uint8_t>(seq & 0xFF));
    pkt->stream = stream ? stream : fakeStream();
    return pkt;
}

/** @brief Wall clock the test moves by hand. */
class ManualClock {
public:
    explicit ManualClock(double start = 0.0) : now_(std::make_shared<std::atomic<double>>(start)) {}
    void set(double t) { now_->store(t); }
    void advance(double dt) { now_->store(now_->load() + dt); }
    double now() const { return now_->load(); }
    WallClock fn() const {
        auto now = now_;
        return [now] { return now->load(); };
    }

private:
    std::shared_ptr<std::atomic<double>> now_;
};

/** @brief Fresh directory removed on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        std::string tmpl = (std::filesystem::temp_directory_path() / (prefix + "_XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* made = ::mkdtemp(buf.data());
        path_ = made ? made : tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/** @brief Poll @p pred until it holds or @p timeout_ms passes. */
inline bool waitUntil(const std::function<bool()>& pred, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/** @brief Files under @p dir whose name ends with @p suffix, sorted. */
inline std::vector<std::string> findFiles(const std::string& dir, const std::string& suffix) {
    std::vector<std::string> out;
    std::error_code ec;
    for (std::filesystem::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        const std::string p = it->path().string();
        if (p.size() >= suffix.size() && p.compare(p.size() - suffix.size(), suffix.size(), suffix) == 0) {
            out.push_back(p);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

inline nlohmann::json readJson(const std::string& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
}

/**
 * @brief Behaviour shared by a test and the sources it hands to an ingestor.
 *
 * Each open() starts a connection delivering `packets_per_connection`
 * packets (unbounded when 0), `interval` seconds apart, a keyframe every
 * `gop` packets; the read then fails as if the camera dropped.
 */
struct FakeCamera {
    std::atomic<bool> reachable{true};
    std::atomic<int> packets_per_connection{0};
    std::atomic<int> opens{0};
    std::atomic<int> open_attempts{0};
    std::atomic<int> pace_ms{0};
    double start_ts = 1700000000.0;
    double interval = 0.1;
    int gop = 10;

    std::mutex mu;
    double next_ts = 0.0;
};

class FakeSource : public IPacketSource {
public:
    explicit FakeSource(std::shared_ptr<FakeCamera> cam) : cam_(std::move(cam)), info_(fakeStream()) {}

    bool open(const std::string&) override {
        cam_->open_attempts++;
        if (interrupted_ || !cam_->reachable) {
            error_ = "connection refused";
            return false;
        }
        cam_->opens++;
        delivered_ = 0;
        return true;
    }

    bool read(Packet& pkt) override {
        if (interrupted_) {
            error_ = "interrupted";
            return false;
        }
        const int limit = cam_->packets_per_connection.load();
        if ((limit > 0 && delivered_ >= limit) || !cam_->reachable) {
            error_ = "end of stream";
            return false;
        }
        if (cam_->pace_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(cam_->pace_ms.load()));
        {
            std::lock_guard<std::mutex> lock(cam_->mu);
            if (cam_->next_ts <= 0.0) cam_->next_ts = cam_->start_ts;
            pkt.timestamp = cam_->next_ts;
            cam_->next_ts += cam_->interval;
        }
        pkt.duration = cam_->interval;
        pkt.keyframe = (delivered_ % cam_->gop) == 0;
        pkt.pts = pkt.dts = delivered_ * 9000;
        pkt.data.assign(64, static_cast<uint8_t>(delivered_ & 0xFF));
        delivered_++;
        return true;
    }

    void close() override {}
    std::shared_ptr<const StreamInfo> streamInfo() const override { return info_; }
    void interrupt() override { interrupted_ = true; }
    std::string lastError() const override { return error_; }

private:
    std::shared_ptr<FakeCamera> cam_;
    std::shared_ptr<const StreamInfo> info_;
    std::atomic<bool> interrupted_{false};
    int delivered_ = 0;
    std::string error_;
};

inline std::function<std::unique_ptr<IPacketSource>(const CameraConfig&)>
fakeSourceFactory(std::shared_ptr<FakeCamera> cam) {
    return [cam](const CameraConfig&) { return std::make_unique<FakeSource>(cam); };
}

/** @brief Recording settings for fast tests: raw container under @p base. */
inline RecordingConfig testRecording(const std::string& base) {
    RecordingConfig r;
    r.base_dir = base;
    r.container = "raw";
    r.segment_duration = 60.0;
    r.pre_event_buffer = 60.0;
    r.post_event_duration = 60.0;
    return r;
}

} // namespace testing
} // namespace camrec

#endif // TEST_SUPPORT_HPP
