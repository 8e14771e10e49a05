#ifndef CAPTURE_HPP
#define CAPTURE_HPP

#include "types.hpp"
#include <memory>
#include <string>

namespace camrec {

/**
 * @file capture.hpp
 * @brief Declares packet sources feeding the frame ingestor.
 *
 * Sources demux an encoded video stream into Packet structures without
 * decoding. The ingestor owns one source per camera and drives it from its
 * own thread; only interrupt() may be called from another thread.
 */

/**
 * @brief Abstract interface for all packet source backends.
 * @threading open/read/close are called by the ingest thread only.
 *            interrupt() is safe from any thread and makes a blocked
 *            open() or read() return false promptly.
 * @lifecycle open() → repeated read() → close(), repeated per reconnect.
 */
class IPacketSource {
public:
    virtual ~IPacketSource() = default;

    /**
     * @brief Connect to the source and probe its video stream.
     * @param url Source URL with credentials already applied.
     * @return True when packets can be read.
     */
    virtual bool open(const std::string& url) = 0;

    /**
     * @brief Read the next encoded video packet.
     *
     * Fills everything except Packet::seq. Packet::timestamp may be left at 0,
     * in which case the ingestor stamps it with the capture time.
     * @return False on end of stream, timeout, interruption or error.
     */
    virtual bool read(Packet& pkt) = 0;

    /**
     * @brief Release the connection. Safe to call when not open.
     */
    virtual void close() = 0;

    /**
     * @brief Codec parameters of the current connection, null when closed.
     */
    virtual std::shared_ptr<const StreamInfo> streamInfo() const = 0;

    /**
     * @brief Abort blocking calls. Sticky until the source is destroyed.
     */
    virtual void interrupt() = 0;

    /**
     * @brief Description of the last failure for status reporting.
     */
    virtual std::string lastError() const = 0;
};

/**
 * @brief FFmpeg-backed demuxer for network and file sources.
 * @threading Owned by the ingest thread; FFmpeg contexts stay confined to it.
 * @ownership Holds the AVFormatContext and a reusable AVPacket.
 *
 * `file:` sources are paced in real time from packet DTS and loop at end of
 * file so a recorded clip can stand in for a live camera.
 */
class FFmpegSource : public IPacketSource {
public:
    explicit FFmpegSource(const IngestConfig& config);
    ~FFmpegSource() override;

    bool open(const std::string& url) override;
    bool read(Packet& pkt) override;
    void close() override;
    std::shared_ptr<const StreamInfo> streamInfo() const override;
    void interrupt() override;
    std::string lastError() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl; //!< Hidden FFmpeg state managed via PIMPL.
};

/**
 * @brief Factory selecting the source backend based on URL scheme.
 * @return Null for unsupported schemes.
 */
std::unique_ptr<IPacketSource> createPacketSource(const std::string& url,
                                                  const IngestConfig& config);

/**
 * @brief Apply camera credentials to its URL unless it already carries user-info.
 */
std::string buildSourceUrl(const CameraConfig& camera);

/**
 * @brief Replace the user-info of @p url with "***" for logging.
 */
std::string maskCredentials(const std::string& url);

/**
 * @brief Render an FFmpeg error code as text.
 */
std::string ffmpegError(int errnum);

} // namespace camrec

#endif // CAPTURE_HPP
