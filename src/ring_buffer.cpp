#include "ring_buffer.hpp"
#include <iostream>

namespace camrec {

RollingBuffer::RollingBuffer(double window_seconds, size_t max_bytes, size_t max_packets,
                             std::string camera_id)
    : window_(window_seconds),
      max_bytes_(max_bytes),
      max_packets_(max_packets == 0 ? 1 : max_packets),
      tag_(camera_id.empty() ? "[buffer]" : "[buffer " + camera_id + "]") {}

bool RollingBuffer::overCeiling() const {
    return packets_.size() > max_packets_ || (max_bytes_ > 0 && bytes_ > max_bytes_);
}

bool RollingBuffer::push(const PacketPtr& packet) {
    if (!packet) return false;

    bool entered = false;
    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!packets_.empty() && packet->timestamp < packets_.back()->timestamp) {
            rejected_++;
            return false;
        }
        packets_.push_back(packet);
        bytes_ += packet->data.size();

        const double newest = packet->timestamp;
        while (packets_.size() > 1 && newest - packets_.front()->timestamp >= window_) {
            bytes_ -= packets_.front()->data.size();
            packets_.pop_front();
        }

        bool hit_ceiling = false;
        while (packets_.size() > 1 && overCeiling()) {
            bytes_ -= packets_.front()->data.size();
            packets_.pop_front();
            ceiling_evictions_++;
            hit_ceiling = true;
        }

        if (hit_ceiling && !degraded_) {
            degraded_ = true;
            entered = true;
        } else if (!hit_ceiling && degraded_ && !packets_.empty() &&
                   newest - packets_.front()->timestamp >= window_ * 0.9) {
            // The window fits under the ceiling again.
            degraded_ = false;
            recovered = true;
        }
    }

    if (entered) {
        std::cerr << "[WARN] " << tag_ << " ceiling reached (" << max_packets_ << " packets / "
                  << max_bytes_ << " bytes), evicting before the window expires" << std::endl;
    } else if (recovered) {
        std::cout << "[INFO] " << tag_ << " capacity recovered, full window retained" << std::endl;
    }
    return true;
}

std::vector<PacketPtr> RollingBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<PacketPtr>(packets_.begin(), packets_.end());
}

void RollingBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    packets_.clear();
    bytes_ = 0;
}

size_t RollingBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return packets_.size();
}

size_t RollingBuffer::bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
}

} // namespace camrec
