#include "sink.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>

/**
 * @file sink_raw.cpp
 * @brief Length-prefixed packet sink and sink factory.
 */

namespace camrec {

RawPacketSink::~RawPacketSink() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

bool RawPacketSink::open(const std::string& path, const StreamInfo& /*stream*/) {
    close();
    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) {
        last_error_ = "open " + path + ": " + std::strerror(errno);
        std::cerr << "[WARN] raw sink: " << last_error_ << std::endl;
        return false;
    }
    path_ = path;
    return true;
}

bool RawPacketSink::write(const Packet& packet) {
    if (!file_) {
        last_error_ = "write on closed sink";
        return false;
    }
    const uint32_t size = static_cast<uint32_t>(packet.data.size());
    const unsigned char header[4] = {
        static_cast<unsigned char>(size >> 24), static_cast<unsigned char>(size >> 16),
        static_cast<unsigned char>(size >> 8), static_cast<unsigned char>(size)
    };
    if (std::fwrite(header, 1, sizeof(header), file_) != sizeof(header) ||
        (size > 0 && std::fwrite(packet.data.data(), 1, size, file_) != size)) {
        last_error_ = "write " + path_ + ": " + std::strerror(errno);
        std::cerr << "[WARN] raw sink: " << last_error_ << std::endl;
        return false;
    }
    return true;
}

bool RawPacketSink::close() {
    if (!file_) return true;
    bool ok = std::fflush(file_) == 0;
    if (std::fclose(file_) != 0) ok = false;
    file_ = nullptr;
    if (!ok) {
        last_error_ = "close " + path_ + ": " + std::strerror(errno);
        std::cerr << "[WARN] raw sink: " << last_error_ << std::endl;
    }
    path_.clear();
    return ok;
}

bool isSupportedContainer(const std::string& container) {
    return container == "mp4" || container == "mkv" || container == "ts" || container == "raw";
}

std::string containerExtension(const std::string& container) {
    if (container == "raw") return "bin";
    return container;
}

std::unique_ptr<IRecordingSink> createSink(const std::string& container) {
    if (container == "raw") return std::make_unique<RawPacketSink>();
    if (isSupportedContainer(container)) return std::make_unique<FFmpegMuxer>(container);
    std::cerr << "[ERROR] Unsupported container: " << container << std::endl;
    return nullptr;
}

SinkFactory defaultSinkFactory() {
    return [](const std::string& container) { return createSink(container); };
}

} // namespace camrec
