#ifndef RING_BUFFER_HPP
#define RING_BUFFER_HPP

#include "types.hpp"
#include "ingestor.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace camrec {

/**
 * @file ring_buffer.hpp
 * @brief Rolling pre-event buffer holding the trailing window of packets.
 */

/**
 * @brief Time-windowed packet history of one camera.
 * @threading One pusher (ingest thread) and any number of snapshot readers.
 *            Both sides hold the mutex only for a deque update or a pointer copy.
 * @ownership Shares packets with other consumers; never copies payloads.
 *
 * After every push the newest and oldest retained timestamps differ by less
 * than the window. A byte/count ceiling evicts earlier than the window when
 * packets arrive abnormally fast; that degraded state is logged on entry and
 * on recovery.
 */
class RollingBuffer : public IPacketConsumer {
public:
    RollingBuffer(double window_seconds, size_t max_bytes, size_t max_packets,
                  std::string camera_id = std::string());

    /**
     * @brief Append a packet and evict from the oldest end.
     * @return False when the packet is older than the newest retained one.
     */
    bool push(const PacketPtr& packet);

    /**
     * @brief Consistent ordered copy of all retained packets.
     */
    std::vector<PacketPtr> snapshot() const;

    void offer(const PacketPtr& packet) override { push(packet); }
    void discontinuity() override {}

    void clear();

    size_t size() const;
    size_t bytes() const;
    double window() const { return window_; }
    bool degraded() const { return degraded_.load(); }
    uint64_t ceilingEvictions() const { return ceiling_evictions_.load(); }
    uint64_t rejected() const { return rejected_.load(); }

private:
    bool overCeiling() const;

    double window_;
    size_t max_bytes_;
    size_t max_packets_;
    std::string tag_;

    mutable std::mutex mutex_;
    std::deque<PacketPtr> packets_;
    size_t bytes_ = 0;

    std::atomic<bool> degraded_{false};
    std::atomic<uint64_t> ceiling_evictions_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace camrec

#endif // RING_BUFFER_HPP
