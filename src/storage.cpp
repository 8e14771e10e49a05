#include "storage.hpp"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace camrec {

std::string formatLocalTime(double epoch_seconds, const char* fmt) {
    std::time_t t = static_cast<std::time_t>(std::floor(epoch_seconds));
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return std::string(buf, n);
}

std::string recordingDir(const std::string& base_dir, const std::string& camera_id, double epoch_seconds) {
    fs::path dir = fs::path(base_dir) / camera_id /
                   formatLocalTime(epoch_seconds, "%Y-%m-%d") /
                   formatLocalTime(epoch_seconds, "%H");
    return dir.string();
}

std::string allocateRecordingPath(const std::string& dir, const std::string& stem,
                                  const std::string& ext, std::string& err) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        err = "create_directories " + dir + ": " + ec.message();
        return std::string();
    }
    for (int n = 0; n < 1000; ++n) {
        std::string name = n == 0 ? stem : stem + "_" + std::to_string(n);
        fs::path video = fs::path(dir) / (name + "." + ext);
        std::string video_str = video.string();
        if (!fs::exists(video) && !fs::exists(partPathFor(video_str)) &&
            !fs::exists(sidecarPathFor(video_str))) {
            return video_str;
        }
    }
    err = "no free recording name for " + stem + " in " + dir;
    return std::string();
}

std::string sidecarPathFor(const std::string& video_path) {
    return fs::path(video_path).replace_extension(".json").string();
}

std::string partPathFor(const std::string& video_path) {
    return video_path + kPartSuffix;
}

bool writeFileSynced(const std::string& path, const std::string& content, std::string& err) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        err = "open " + path + ": " + std::strerror(errno);
        return false;
    }
    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = "write " + path + ": " + std::strerror(errno);
            ::close(fd);
            return false;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        err = "fsync " + path + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        err = "close " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

namespace {

bool syncPath(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

} // namespace

bool finalizeRecording(const std::string& part_path, const std::string& video_path,
                       const std::string& sidecar_path, const nlohmann::json& meta,
                       std::string& err) {
    if (!part_path.empty() && !syncPath(part_path, O_RDONLY)) {
        err = "fsync " + part_path + ": " + std::strerror(errno);
        return false;
    }

    const std::string tmp = sidecar_path + kTmpSuffix;
    if (!writeFileSynced(tmp, meta.dump(2) + "\n", err)) return false;

    std::error_code ec;
    if (!part_path.empty()) {
        fs::rename(part_path, video_path, ec);
        if (ec) {
            err = "rename " + part_path + ": " + ec.message();
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, sidecar_path, ec);
    if (ec) {
        err = "rename " + tmp + ": " + ec.message();
        return false;
    }
    // Persist the directory entries; failure here is not fatal for the recording.
    syncPath(fs::path(sidecar_path).parent_path().string(), O_RDONLY | O_DIRECTORY);
    return true;
}

uint64_t fileSize(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

} // namespace camrec
