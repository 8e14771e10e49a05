#include "sink.hpp"
#include "capture.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

/**
 * @file sink_ffmpeg.cpp
 * @brief Stream-copy muxer for segment and event files.
 */

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/mathematics.h>
}

namespace camrec {

/**
 * @brief FFmpeg output context for one file.
 *
 * Output timestamps come from the packets' capture timestamps relative to the
 * first packet written, so files assembled from buffered and live packets
 * start at zero and never run backwards.
 */
class FFmpegMuxer::Impl {
public:
    explicit Impl(const std::string& container) : container_(container) {}
    ~Impl() { close(); }

    bool open(const std::string& path, const StreamInfo& stream) {
        close();
        const char* format = muxerName();
        if (!format) {
            setError("unsupported container " + container_);
            return false;
        }
        // The extension of an in-progress file does not name its format
        int ret = avformat_alloc_output_context2(&oc_, nullptr, format, path.c_str());
        if (ret < 0 || !oc_) {
            setError("failed to alloc output context: " + ffmpegError(ret));
            oc_ = nullptr;
            return false;
        }

        st_ = avformat_new_stream(oc_, nullptr);
        if (!st_) {
            setError("avformat_new_stream failed");
            close();
            return false;
        }
        AVCodecParameters* par = st_->codecpar;
        par->codec_type = AVMEDIA_TYPE_VIDEO;
        par->codec_id = static_cast<AVCodecID>(stream.codec_id);
        par->width = stream.width;
        par->height = stream.height;
        par->format = stream.format;
        par->profile = stream.profile;
        par->level = stream.level;
        par->bit_rate = stream.bit_rate;
        par->codec_tag = 0;
        if (!stream.extradata.empty()) {
            par->extradata = static_cast<uint8_t*>(
                av_mallocz(stream.extradata.size() + AV_INPUT_BUFFER_PADDING_SIZE));
            if (!par->extradata) {
                setError("extradata allocation failed");
                close();
                return false;
            }
            std::copy(stream.extradata.begin(), stream.extradata.end(), par->extradata);
            par->extradata_size = static_cast<int>(stream.extradata.size());
        }
        st_->time_base = AVRational{1, 90000};
        if (stream.frame_rate_num > 0) {
            st_->avg_frame_rate = AVRational{stream.frame_rate_num, stream.frame_rate_den};
        }

        if (!(oc_->oformat->flags & AVFMT_NOFILE)) {
            ret = avio_open(&oc_->pb, path.c_str(), AVIO_FLAG_WRITE);
            if (ret < 0) {
                setError("avio_open failed: " + ffmpegError(ret));
                close();
                return false;
            }
        }

        AVDictionary* mux_opts = nullptr;
        if (container_ == "mp4") {
            av_dict_set(&mux_opts, "movflags", "+frag_keyframe+empty_moov+default_base_moof", 0);
        }
        ret = avformat_write_header(oc_, &mux_opts);
        av_dict_free(&mux_opts);
        if (ret < 0) {
            setError("write_header failed: " + ffmpegError(ret));
            close();
            return false;
        }

        pkt_ = av_packet_alloc();
        if (!pkt_) {
            setError("av_packet_alloc failed");
            close();
            return false;
        }
        header_written_ = true;
        first_ts_ = -1.0;
        last_dts_ = AV_NOPTS_VALUE;
        path_ = path;
        if (logEnabled(LogLevel::Debug)) {
            std::cout << "[DEBUG] muxer: opened " << path << " container=" << container_
                      << " codec=" << avcodec_get_name(par->codec_id) << std::endl;
        }
        return true;
    }

    bool write(const Packet& packet) {
        if (!header_written_) {
            setError("write on closed muxer");
            return false;
        }
        if (first_ts_ < 0) first_ts_ = packet.timestamp;

        const AVRational src_tb{packet.stream ? packet.stream->time_base_num : 1,
                                packet.stream ? packet.stream->time_base_den : 90000};
        const AVRational out_tb = st_->time_base;
        int64_t dts = std::llround((packet.timestamp - first_ts_) * out_tb.den / out_tb.num);
        if (last_dts_ != AV_NOPTS_VALUE && dts <= last_dts_) dts = last_dts_ + 1;
        int64_t reorder = av_rescale_q(packet.pts - packet.dts, src_tb, out_tb);
        int64_t pts = dts + std::max<int64_t>(reorder, 0);

        av_packet_unref(pkt_);
        int ret = av_new_packet(pkt_, static_cast<int>(packet.data.size()));
        if (ret < 0) {
            setError("av_new_packet failed: " + ffmpegError(ret));
            return false;
        }
        std::copy(packet.data.begin(), packet.data.end(), pkt_->data);
        pkt_->stream_index = st_->index;
        pkt_->dts = dts;
        pkt_->pts = pts;
        pkt_->duration = packet.duration > 0 ? std::llround(packet.duration * out_tb.den / out_tb.num) : 0;
        if (packet.keyframe) pkt_->flags |= AV_PKT_FLAG_KEY;

        ret = av_interleaved_write_frame(oc_, pkt_);
        if (ret < 0) {
            setError("interleaved_write_frame failed: " + ffmpegError(ret));
            return false;
        }
        last_dts_ = dts;
        return true;
    }

    bool close() {
        bool ok = true;
        if (header_written_ && oc_) {
            int ret = av_write_trailer(oc_);
            if (ret < 0) {
                setError("av_write_trailer failed: " + ffmpegError(ret));
                ok = false;
            }
        }
        if (pkt_) {
            av_packet_free(&pkt_);
            pkt_ = nullptr;
        }
        if (oc_) {
            if (!(oc_->oformat->flags & AVFMT_NOFILE) && oc_->pb) {
                if (avio_closep(&oc_->pb) < 0) {
                    setError("avio_close failed");
                    ok = false;
                }
            }
            avformat_free_context(oc_);
            oc_ = nullptr;
        }
        st_ = nullptr;
        header_written_ = false;
        path_.clear();
        return ok;
    }

    bool isOpen() const { return header_written_; }
    std::string lastError() const { return last_error_; }

private:
    const char* muxerName() const {
        if (container_ == "mp4") return "mp4";
        if (container_ == "mkv") return "matroska";
        if (container_ == "ts") return "mpegts";
        return nullptr;
    }

    void setError(const std::string& msg) {
        last_error_ = msg;
        std::cerr << "[WARN] muxer: " << msg << std::endl;
    }

    std::string container_;
    AVFormatContext* oc_ = nullptr;
    AVStream* st_ = nullptr;
    AVPacket* pkt_ = nullptr;
    bool header_written_ = false;
    double first_ts_ = -1.0;
    int64_t last_dts_ = AV_NOPTS_VALUE;
    std::string path_;
    std::string last_error_;
};

FFmpegMuxer::FFmpegMuxer(const std::string& container) : pImpl(std::make_unique<Impl>(container)) {}
FFmpegMuxer::~FFmpegMuxer() = default;

bool FFmpegMuxer::open(const std::string& path, const StreamInfo& stream) {
    return pImpl->open(path, stream);
}

bool FFmpegMuxer::write(const Packet& packet) {
    return pImpl->write(packet);
}

bool FFmpegMuxer::close() {
    return pImpl->close();
}

bool FFmpegMuxer::isOpen() const {
    return pImpl->isOpen();
}

std::string FFmpegMuxer::lastError() const {
    return pImpl->lastError();
}

} // namespace camrec
