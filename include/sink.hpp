#ifndef SINK_HPP
#define SINK_HPP

#include "types.hpp"
#include <cstdio>
#include <functional>
#include <memory>
#include <string>

namespace camrec {

/**
 * @file sink.hpp
 * @brief Recording sinks writing encoded packets into container files.
 */

/**
 * @brief Destination for the packets of one recording file.
 * @threading Owned by a single writer thread.
 * @lifecycle open() → repeated write() → close(). Packets are stream-copied;
 *            the codec is never touched.
 */
class IRecordingSink {
public:
    virtual ~IRecordingSink() = default;

    /**
     * @brief Create @p path and write the container header for @p stream.
     */
    virtual bool open(const std::string& path, const StreamInfo& stream) = 0;

    /**
     * @brief Append one packet. Timestamps are rebased to the first packet.
     */
    virtual bool write(const Packet& packet) = 0;

    /**
     * @brief Write the trailer and release the file.
     * @return False when the file could not be completed.
     */
    virtual bool close() = 0;

    virtual bool isOpen() const = 0;
    virtual std::string lastError() const = 0;
};

/**
 * @brief FFmpeg muxer stream-copying packets into mp4, matroska or mpegts.
 *
 * mp4 output is fragmented so that a file interrupted by a crash is still
 * playable up to its last fragment.
 */
class FFmpegMuxer : public IRecordingSink {
public:
    /** @param container "mp4", "mkv" or "ts". */
    explicit FFmpegMuxer(const std::string& container);
    ~FFmpegMuxer() override;

    bool open(const std::string& path, const StreamInfo& stream) override;
    bool write(const Packet& packet) override;
    bool close() override;
    bool isOpen() const override;
    std::string lastError() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Length-prefixed packet dump: a 4-byte big-endian size before every payload.
 *
 * Used when no container is wanted and by tests, since it accepts packets
 * with arbitrary payloads.
 */
class RawPacketSink : public IRecordingSink {
public:
    RawPacketSink() = default;
    ~RawPacketSink() override;

    bool open(const std::string& path, const StreamInfo& stream) override;
    bool write(const Packet& packet) override;
    bool close() override;
    bool isOpen() const override { return file_ != nullptr; }
    std::string lastError() const override { return last_error_; }

private:
    std::FILE* file_ = nullptr;
    std::string path_;
    std::string last_error_;
};

using SinkFactory = std::function<std::unique_ptr<IRecordingSink>(const std::string& container)>;

/** @brief True for mp4, mkv, ts and raw. */
bool isSupportedContainer(const std::string& container);

/** @brief File extension for a container name, without the dot. */
std::string containerExtension(const std::string& container);

/** @brief Sink for a container name, null when unsupported. */
std::unique_ptr<IRecordingSink> createSink(const std::string& container);

/** @brief Factory wrapping createSink(). */
SinkFactory defaultSinkFactory();

} // namespace camrec

#endif // SINK_HPP
