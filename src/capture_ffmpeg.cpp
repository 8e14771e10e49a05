#include "capture.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

/**
 * @file capture_ffmpeg.cpp
 * @brief FFmpeg demuxer producing encoded packets for the ingestor.
 */

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

namespace camrec {

std::string ffmpegError(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, buf, sizeof(buf));
    return std::string(buf);
}

/**
 * @brief Wraps FFmpeg demux state for one camera connection.
 *
 * Every blocking FFmpeg call is guarded by an I/O deadline checked from the
 * interrupt callback, so a silent camera cannot stall the ingest thread
 * longer than read_timeout.
 */
class FFmpegSource::Impl {
public:
    explicit Impl(const IngestConfig& config) : config_(config) {}

    ~Impl() { close(); }

    bool open(const std::string& url) {
        close();
        if (interrupted_) {
            setError("interrupted");
            return false;
        }

        std::string target = url;
        is_file_ = false;
        if (target.rfind("file:", 0) == 0) {
            target = target.substr(5);
            is_file_ = true;
        }

        format_ctx_ = avformat_alloc_context();
        if (!format_ctx_) {
            setError("failed to allocate format context");
            return false;
        }
        format_ctx_->interrupt_callback.callback = &Impl::interruptCallback;
        format_ctx_->interrupt_callback.opaque = this;

        AVDictionary* opts = nullptr;
        if (target.rfind("rtsp", 0) == 0) {
            av_dict_set(&opts, "rtsp_transport", config_.rtsp_transport.c_str(), 0);
        }
        armDeadline();
        int ret = avformat_open_input(&format_ctx_, target.c_str(), nullptr, &opts);
        av_dict_free(&opts);
        if (ret < 0) {
            // avformat_open_input frees the context on failure
            format_ctx_ = nullptr;
            setError("open failed: " + ffmpegError(ret));
            return false;
        }

        armDeadline();
        ret = avformat_find_stream_info(format_ctx_, nullptr);
        if (ret < 0) {
            setError("stream info failed: " + ffmpegError(ret));
            close();
            return false;
        }

        video_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (video_stream_index_ < 0) {
            setError("no video stream found");
            close();
            return false;
        }

        AVStream* stream = format_ctx_->streams[video_stream_index_];
        AVCodecParameters* par = stream->codecpar;
        auto info = std::make_shared<StreamInfo>();
        info->codec_id = static_cast<int>(par->codec_id);
        info->codec_name = avcodec_get_name(par->codec_id);
        info->width = par->width;
        info->height = par->height;
        info->format = par->format;
        info->profile = par->profile;
        info->level = par->level;
        info->bit_rate = par->bit_rate;
        info->time_base_num = stream->time_base.num;
        info->time_base_den = stream->time_base.den;
        AVRational fps = av_guess_frame_rate(format_ctx_, stream, nullptr);
        info->frame_rate_num = fps.num;
        info->frame_rate_den = fps.den > 0 ? fps.den : 1;
        if (par->extradata && par->extradata_size > 0) {
            info->extradata.assign(par->extradata, par->extradata + par->extradata_size);
        }
        info_ = info;

        packet_ = av_packet_alloc();
        if (!packet_) {
            setError("failed to allocate packet");
            close();
            return false;
        }

        ts_offset_ = 0;
        first_dts_ = AV_NOPTS_VALUE;
        last_dts_ = AV_NOPTS_VALUE;
        last_duration_ = 0;
        pace_started_ = false;
        return true;
    }

    bool read(Packet& pkt) {
        if (!format_ctx_ || !packet_) return false;

        while (!interrupted_) {
            armDeadline();
            int ret = av_read_frame(format_ctx_, packet_);
            if (ret == AVERROR_EOF && is_file_) {
                if (!rewind()) return false;
                continue;
            }
            if (ret < 0) {
                setError("read failed: " + ffmpegError(ret));
                return false;
            }
            if (packet_->stream_index != video_stream_index_) {
                av_packet_unref(packet_);
                continue;
            }

            int64_t dts = packet_->dts != AV_NOPTS_VALUE ? packet_->dts : packet_->pts;
            int64_t pts = packet_->pts != AV_NOPTS_VALUE ? packet_->pts : dts;
            if (dts == AV_NOPTS_VALUE) {
                // Some RTSP servers omit timestamps on the first packets
                dts = pts = last_dts_ == AV_NOPTS_VALUE ? 0 : last_dts_ + std::max<int64_t>(last_duration_, 1);
            } else {
                dts += ts_offset_;
                pts += ts_offset_;
            }
            if (first_dts_ == AV_NOPTS_VALUE) first_dts_ = dts;
            last_dts_ = dts;
            last_duration_ = packet_->duration;

            const AVRational tb = format_ctx_->streams[video_stream_index_]->time_base;
            pkt.pts = pts;
            pkt.dts = dts;
            pkt.duration = packet_->duration > 0 ? packet_->duration * av_q2d(tb) : 0.0;
            pkt.keyframe = (packet_->flags & AV_PKT_FLAG_KEY) != 0;
            pkt.timestamp = 0.0;
            pkt.data.assign(packet_->data, packet_->data + packet_->size);
            pkt.stream = info_;
            av_packet_unref(packet_);

            if (is_file_) pace(dts, tb);
            return !interrupted_;
        }
        setError("interrupted");
        return false;
    }

    void close() {
        if (packet_) {
            av_packet_free(&packet_);
            packet_ = nullptr;
        }
        if (format_ctx_) {
            avformat_close_input(&format_ctx_);
            format_ctx_ = nullptr;
        }
        video_stream_index_ = -1;
        info_.reset();
    }

    std::shared_ptr<const StreamInfo> streamInfo() const { return info_; }

    void interrupt() { interrupted_ = true; }

    std::string lastError() const {
        std::lock_guard<std::mutex> lock(error_mu_);
        return last_error_;
    }

private:
    static int interruptCallback(void* opaque) {
        auto* self = static_cast<Impl*>(opaque);
        if (self->interrupted_) return 1;
        return std::chrono::steady_clock::now() > self->io_deadline_.load() ? 1 : 0;
    }

    void armDeadline() {
        auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(config_.read_timeout));
        io_deadline_ = std::chrono::steady_clock::now() + timeout;
    }

    void setError(const std::string& msg) {
        std::lock_guard<std::mutex> lock(error_mu_);
        last_error_ = msg;
    }

    /** @brief Seek a looping file source back to its start, keeping DTS increasing. */
    bool rewind() {
        if (first_dts_ == AV_NOPTS_VALUE) {
            setError("file contains no video packets");
            return false;
        }
        int ret = av_seek_frame(format_ctx_, video_stream_index_, first_dts_, AVSEEK_FLAG_BACKWARD);
        if (ret < 0) {
            setError("seek failed: " + ffmpegError(ret));
            return false;
        }
        ts_offset_ = last_dts_ + std::max<int64_t>(last_duration_, 1) - first_dts_;
        return true;
    }

    /** @brief Sleep until the packet's presentation slot relative to the first packet. */
    void pace(int64_t dts, AVRational tb) {
        auto now = std::chrono::steady_clock::now();
        if (!pace_started_) {
            pace_start_ = now;
            pace_dts_ = dts;
            pace_started_ = true;
            return;
        }
        double offset = (dts - pace_dts_) * av_q2d(tb);
        auto due = pace_start_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(offset));
        while (!interrupted_ && std::chrono::steady_clock::now() < due) {
            auto left = due - std::chrono::steady_clock::now();
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                left, std::chrono::milliseconds(50)));
        }
    }

    IngestConfig config_;
    AVFormatContext* format_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    int video_stream_index_ = -1;
    std::shared_ptr<const StreamInfo> info_;

    bool is_file_ = false;
    int64_t ts_offset_ = 0;
    int64_t first_dts_ = AV_NOPTS_VALUE;
    int64_t last_dts_ = AV_NOPTS_VALUE;
    int64_t last_duration_ = 0;

    bool pace_started_ = false;
    std::chrono::steady_clock::time_point pace_start_;
    int64_t pace_dts_ = 0;

    std::atomic<bool> interrupted_{false};
    std::atomic<std::chrono::steady_clock::time_point> io_deadline_{std::chrono::steady_clock::time_point::max()};

    mutable std::mutex error_mu_;
    std::string last_error_;
};

FFmpegSource::FFmpegSource(const IngestConfig& config) : pImpl(std::make_unique<Impl>(config)) {}
FFmpegSource::~FFmpegSource() = default;

bool FFmpegSource::open(const std::string& url) {
    return pImpl->open(url);
}

bool FFmpegSource::read(Packet& pkt) {
    return pImpl->read(pkt);
}

void FFmpegSource::close() {
    pImpl->close();
}

std::shared_ptr<const StreamInfo> FFmpegSource::streamInfo() const {
    return pImpl->streamInfo();
}

void FFmpegSource::interrupt() {
    pImpl->interrupt();
}

std::string FFmpegSource::lastError() const {
    return pImpl->lastError();
}

std::unique_ptr<IPacketSource> createPacketSource(const std::string& url, const IngestConfig& config) {
    static const char* kSchemes[] = {"rtsp://", "rtsps://", "http://", "https://", "udp://", "file:"};
    for (const char* scheme : kSchemes) {
        if (url.rfind(scheme, 0) == 0) {
            return std::make_unique<FFmpegSource>(config);
        }
    }
    std::cerr << "[ERROR] Unsupported source scheme: " << maskCredentials(url) << std::endl;
    return nullptr;
}

std::string buildSourceUrl(const CameraConfig& camera) {
    const std::string& url = camera.rtsp_url;
    if (camera.username.empty()) return url;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return url;
    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string authority = url.substr(host_start, path_start == std::string::npos
                                                       ? std::string::npos
                                                       : path_start - host_start);
    if (authority.find('@') != std::string::npos) return url;

    std::string userinfo = camera.username;
    if (!camera.password.empty()) userinfo += ":" + camera.password;
    return url.substr(0, host_start) + userinfo + "@" + url.substr(host_start);
}

std::string maskCredentials(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return url;
    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    size_t at = url.find('@', host_start);
    if (at == std::string::npos || (path_start != std::string::npos && at > path_start)) return url;
    return url.substr(0, host_start) + "***@" + url.substr(at + 1);
}

} // namespace camrec
