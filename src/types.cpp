#include "types.hpp"
#include <chrono>

/**
 * @file types.cpp
 * @brief Enum names, stream compatibility and status serialization.
 */

namespace camrec {

bool StreamInfo::compatibleWith(const StreamInfo& other) const {
    return codec_id == other.codec_id &&
           width == other.width &&
           height == other.height &&
           extradata == other.extradata;
}

const char* toString(IngestState s) {
    switch (s) {
        case IngestState::Idle: return "idle";
        case IngestState::Connecting: return "connecting";
        case IngestState::Connected: return "connected";
        case IngestState::Backoff: return "backoff";
        case IngestState::Stopped: return "stopped";
    }
    return "unknown";
}

const char* toString(Health h) {
    switch (h) {
        case Health::Ok: return "ok";
        case Health::Degraded: return "degraded";
        case Health::Failed: return "failed";
    }
    return "unknown";
}

const char* toString(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Conflict: return "conflict";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Unavailable: return "unavailable";
        case ErrorCode::IoError: return "io_error";
    }
    return "unknown";
}

const char* toString(EventOrigin o) {
    return o == EventOrigin::PushMonitor ? "push_monitor" : "manual";
}

nlohmann::json toJson(const CameraStatus& s) {
    nlohmann::json j;
    j["camera_id"] = s.camera_id;
    j["ingest_state"] = toString(s.ingest_state);
    j["connected"] = s.connected;
    j["health"] = toString(s.health);
    if (s.active_segment_start) {
        j["active_segment_start"] = *s.active_segment_start;
    } else {
        j["active_segment_start"] = nullptr;
    }
    j["event_session_open"] = s.event_session_open;
    if (s.event_session_open) j["event_deadline"] = s.event_deadline;
    j["registered"] = s.registered;
    if (!s.last_error.empty()) j["last_error"] = s.last_error;
    const auto& c = s.counters;
    j["counters"] = {
        {"packets_in", c.packets_in},
        {"bytes_in", c.bytes_in},
        {"writer_drops", c.writer_drops},
        {"tap_drops", c.tap_drops},
        {"buffer_evictions", c.buffer_evictions},
        {"buffered_packets", c.buffered_packets},
        {"buffered_bytes", c.buffered_bytes},
        {"segments_finalized", c.segments_finalized},
        {"events_finalized", c.events_finalized},
        {"reconnects", c.reconnects}
    };
    return j;
}

nlohmann::json toJson(const ServerStatus& s) {
    nlohmann::json j;
    j["running"] = s.running;
    j["cameras"] = static_cast<int>(s.camera_ids.size());
    j["camera_ids"] = s.camera_ids;
    nlohmann::json details = nlohmann::json::array();
    for (const auto& cam : s.cameras) details.push_back(toJson(cam));
    j["camera_status"] = std::move(details);
    return j;
}

double systemWallClock() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace camrec
