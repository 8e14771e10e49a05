#include "events.hpp"
#include <cmath>

namespace camrec {

bool isValidCameraId(const std::string& id) {
    if (id.empty() || id.size() > 64 || id == "." || id == "..") return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

OpResult validateEvent(const Event& event) {
    if (!isValidCameraId(event.camera_id)) {
        return OpResult::error(ErrorCode::InvalidArgument, "invalid camera_id '" + event.camera_id + "'");
    }
    if (event.type.empty()) {
        return OpResult::error(ErrorCode::InvalidArgument, "event_type must not be empty");
    }
    if (!std::isfinite(event.timestamp) || event.timestamp <= 0.0) {
        return OpResult::error(ErrorCode::InvalidArgument, "timestamp must be positive epoch seconds");
    }
    if (!event.metadata.is_object()) {
        return OpResult::error(ErrorCode::InvalidArgument, "metadata must be an object");
    }
    return OpResult::success();
}

OpResult normalizeEvent(const nlohmann::json& payload, EventOrigin origin, Event& out, double now) {
    if (!payload.is_object()) {
        return OpResult::error(ErrorCode::InvalidArgument, "event payload must be a JSON object");
    }
    auto camera = payload.find("camera_id");
    if (camera == payload.end() || !camera->is_string()) {
        return OpResult::error(ErrorCode::InvalidArgument, "camera_id missing or not a string");
    }
    auto type = payload.find("event_type");
    if (type == payload.end() || !type->is_string()) {
        return OpResult::error(ErrorCode::InvalidArgument, "event_type missing or not a string");
    }

    Event ev;
    ev.camera_id = camera->get<std::string>();
    ev.type = type->get<std::string>();
    ev.origin = origin;
    ev.timestamp = now;
    auto ts = payload.find("timestamp");
    if (ts != payload.end() && !ts->is_null()) {
        if (!ts->is_number()) {
            return OpResult::error(ErrorCode::InvalidArgument, "timestamp must be a number");
        }
        ev.timestamp = ts->get<double>();
    }
    auto meta = payload.find("metadata");
    if (meta != payload.end() && !meta->is_null()) {
        if (!meta->is_object()) {
            return OpResult::error(ErrorCode::InvalidArgument, "metadata must be an object");
        }
        ev.metadata = *meta;
    }
    auto alarm = payload.find("alarm_type");
    if (alarm != payload.end() && alarm->is_string()) {
        ev.metadata["alarm_type"] = *alarm;
    }

    OpResult valid = validateEvent(ev);
    if (!valid.ok()) return valid;
    out = std::move(ev);
    return OpResult::success();
}

Event normalizeOnvifTopic(const std::string& camera_id, const std::string& topic,
                          double timestamp, const nlohmann::json& data) {
    Event ev;
    ev.camera_id = camera_id;
    ev.timestamp = timestamp;
    ev.origin = EventOrigin::PushMonitor;
    if (topic.find("Motion") != std::string::npos || topic.find("motion") != std::string::npos) {
        ev.type = "motion";
    } else if (topic.find("Alarm") != std::string::npos || topic.find("alarm") != std::string::npos ||
               topic.find("DigitalInput") != std::string::npos) {
        ev.type = "alarm";
    } else {
        ev.type = "other";
    }
    ev.metadata = nlohmann::json::object();
    ev.metadata["topic"] = topic;
    if (!data.is_null()) ev.metadata["data"] = data;
    return ev;
}

} // namespace camrec
