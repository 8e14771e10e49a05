#include "trigger_fifo.hpp"
#include "dispatcher.hpp"
#include "events.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

/**
 * @file trigger_fifo.cpp
 * @brief Named pipe reader for manual triggers.
 */

namespace camrec {

namespace {

constexpr int kPollTimeoutMs = 200;
constexpr size_t kMaxLine = 64 * 1024;

std::string stringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : std::string();
}

} // namespace

TriggerFifo::TriggerFifo(const std::string& path, EventDispatcher& dispatcher)
    : path_(path), dispatcher_(dispatcher) {}

TriggerFifo::~TriggerFifo() {
    stop();
}

bool TriggerFifo::start() {
    if (running_) return true;
    struct stat st{};
    if (::stat(path_.c_str(), &st) == 0) {
        if (!S_ISFIFO(st.st_mode)) {
            std::cerr << "[ERROR] [trigger] " << path_ << " exists and is not a FIFO" << std::endl;
            return false;
        }
    } else if (::mkfifo(path_.c_str(), 0660) != 0) {
        std::cerr << "[ERROR] [trigger] mkfifo " << path_ << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    read_fd_ = ::open(path_.c_str(), O_RDONLY | O_NONBLOCK);
    if (read_fd_ < 0) {
        std::cerr << "[ERROR] [trigger] open " << path_ << ": " << std::strerror(errno) << std::endl;
        return false;
    }
    keep_fd_ = ::open(path_.c_str(), O_WRONLY | O_NONBLOCK);
    if (keep_fd_ < 0) {
        std::cerr << "[WARN] [trigger] cannot hold write end of " << path_ << ": " << std::strerror(errno) << std::endl;
    }
    running_ = true;
    thread_ = std::thread(&TriggerFifo::run, this);
    std::cout << "[INFO] [trigger] listening on " << path_ << std::endl;
    return true;
}

void TriggerFifo::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
    if (read_fd_ >= 0) ::close(read_fd_);
    if (keep_fd_ >= 0) ::close(keep_fd_);
    read_fd_ = keep_fd_ = -1;
}

bool TriggerFifo::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return true;
    nlohmann::json payload = nlohmann::json::parse(line, nullptr, false);
    if (payload.is_discarded()) {
        std::cerr << "[WARN] [trigger] ignoring malformed line: " << line << std::endl;
        return false;
    }
    OpResult r;
    if (payload.is_object() && payload.contains("topic") && payload["topic"].is_string()) {
        if (payload.contains("timestamp") && !payload["timestamp"].is_number()) {
            std::cerr << "[WARN] [trigger] rejected: timestamp must be a number" << std::endl;
            return false;
        }
        // Relayed push-monitor notification: {camera_id, topic, timestamp?, data?}
        Event ev = normalizeOnvifTopic(stringField(payload, "camera_id"),
                                       payload["topic"].get<std::string>(),
                                       payload.value("timestamp", systemWallClock()),
                                       payload.contains("data") ? payload["data"] : nlohmann::json());
        r = dispatcher_.submit(ev);
    } else {
        r = dispatcher_.submitJson(payload, EventOrigin::Manual);
    }
    if (!r.ok()) {
        std::cerr << "[WARN] [trigger] rejected: " << toString(r.code) << ": " << r.message << std::endl;
        return false;
    }
    const std::string type = stringField(payload, "event_type");
    std::cout << "[INFO] [trigger] accepted " << (type.empty() ? stringField(payload, "topic") : type)
              << " for " << stringField(payload, "camera_id")
              << (r.message.empty() ? "" : " (" + r.message + ")") << std::endl;
    return true;
}

void TriggerFifo::run() {
    std::string pending;
    char buf[4096];
    while (running_) {
        struct pollfd pfd{};
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, kPollTimeoutMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ERROR] [trigger] poll: " << std::strerror(errno) << std::endl;
            break;
        }
        if (rc == 0 || !(pfd.revents & (POLLIN | POLLHUP))) continue;

        ssize_t n = ::read(read_fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            std::cerr << "[ERROR] [trigger] read: " << std::strerror(errno) << std::endl;
            break;
        }
        if (n == 0) {
            // All writers gone and no write end held: avoid spinning on POLLHUP.
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollTimeoutMs));
            continue;
        }
        pending.append(buf, static_cast<size_t>(n));
        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            try {
                handleLine(line);
            } catch (const std::exception& e) {
                std::cerr << "[ERROR] [trigger] " << e.what() << std::endl;
            }
        }
        if (pending.size() > kMaxLine) {
            std::cerr << "[WARN] [trigger] discarding oversized line" << std::endl;
            pending.clear();
        }
    }
}

} // namespace camrec
