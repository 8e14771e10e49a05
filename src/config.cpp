#include "config.hpp"
#include "events.hpp"
#include "sink.hpp"
#include <fstream>
#include <set>
#include <stdexcept>

/**
 * @file config.cpp
 * @brief JSON configuration loading and validation.
 */

namespace camrec {

namespace {

/** @brief Copy @p key of @p obj into @p out when present and not null. */
template <typename T>
void readField(const nlohmann::json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) out = it->get<T>();
}

const nlohmann::json* section(const nlohmann::json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        throw std::runtime_error(std::string("section '") + key + "' must be an object");
    }
    return &*it;
}

void applyRecording(const nlohmann::json& j, RecordingConfig& r) {
    readField(j, "base_dir", r.base_dir);
    readField(j, "segment_duration", r.segment_duration);
    readField(j, "pre_event_buffer", r.pre_event_buffer);
    readField(j, "post_event_duration", r.post_event_duration);
    readField(j, "container", r.container);
    readField(j, "buffer_max_bytes", r.buffer_max_bytes);
    readField(j, "buffer_max_packets", r.buffer_max_packets);
    readField(j, "queue_capacity", r.queue_capacity);
    readField(j, "rotation_keyframe_grace", r.rotation_keyframe_grace);
    readField(j, "max_sink_failures", r.max_sink_failures);
    readField(j, "retention_days", r.retention_days);
    readField(j, "retention_interval", r.retention_interval);
}

void applyIngest(const nlohmann::json& j, IngestConfig& in) {
    readField(j, "backoff_initial", in.backoff_initial);
    readField(j, "backoff_max", in.backoff_max);
    readField(j, "backoff_factor", in.backoff_factor);
    readField(j, "read_timeout", in.read_timeout);
    readField(j, "rtsp_transport", in.rtsp_transport);
}

CameraConfig parseCamera(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("camera entries must be objects");
    CameraConfig cam;
    readField(j, "id", cam.id);
    readField(j, "name", cam.name);
    readField(j, "rtsp_url", cam.rtsp_url);
    readField(j, "username", cam.username);
    readField(j, "password", cam.password);
    readField(j, "onvif_url", cam.onvif_url);
    if (cam.name.empty()) cam.name = cam.id;
    return cam;
}

} // namespace

bool applyConfigJson(const nlohmann::json& doc, ServerConfig& config, std::string& err) {
    if (!doc.is_object()) {
        err = "configuration must be a JSON object";
        return false;
    }
    try {
        if (auto r = section(doc, "recording")) applyRecording(*r, config.recording);
        if (auto in = section(doc, "ingest")) applyIngest(*in, config.ingest);
        if (auto d = section(doc, "dispatch")) {
            readField(*d, "dedupe_window", config.dispatch.dedupe_window);
            readField(*d, "queue_capacity", config.dispatch.queue_capacity);
        }
        if (auto s = section(doc, "shinobi")) {
            readField(*s, "base_url", config.catalog.base_url);
            readField(*s, "api_key", config.catalog.api_key);
            readField(*s, "group_key", config.catalog.group_key);
        }
        auto cams = doc.find("cameras");
        if (cams != doc.end() && !cams->is_null()) {
            if (!cams->is_array()) throw std::runtime_error("'cameras' must be an array");
            for (const auto& c : *cams) config.cameras.push_back(parseCamera(c));
        }
        readField(doc, "perf_interval_ms", config.perf_interval_ms);
        readField(doc, "perf_json_path", config.perf_json_path);
        readField(doc, "log_level", config.log_level);
        readField(doc, "trigger_fifo", config.trigger_fifo);
    } catch (const std::exception& e) {
        err = e.what();
        return false;
    }
    return true;
}

bool loadConfigFile(const std::string& path, ServerConfig& config, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "cannot open config file " + path;
        return false;
    }
    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        err = "config file " + path + " is not valid JSON";
        return false;
    }
    if (!applyConfigJson(doc, config, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

OpResult validateRecordingConfig(const RecordingConfig& r) {
    if (r.base_dir.empty()) {
        return OpResult::error(ErrorCode::InvalidArgument, "recording base_dir must not be empty");
    }
    if (!(r.segment_duration > 0.0) || !(r.pre_event_buffer > 0.0) || !(r.post_event_duration > 0.0)) {
        return OpResult::error(ErrorCode::InvalidArgument,
                               "segment_duration, pre_event_buffer and post_event_duration must be positive");
    }
    if (!isSupportedContainer(r.container)) {
        return OpResult::error(ErrorCode::InvalidArgument,
                               "unsupported container '" + r.container + "' (use mp4|mkv|ts|raw)");
    }
    if (r.buffer_max_bytes == 0 || r.buffer_max_packets == 0 || r.queue_capacity == 0) {
        return OpResult::error(ErrorCode::InvalidArgument, "buffer and queue limits must be positive");
    }
    if (r.rotation_keyframe_grace < 0.0 || r.max_sink_failures < 1) {
        return OpResult::error(ErrorCode::InvalidArgument,
                               "rotation_keyframe_grace must be >= 0 and max_sink_failures >= 1");
    }
    if (r.retention_days < 0 || r.retention_interval < 1) {
        return OpResult::error(ErrorCode::InvalidArgument,
                               "retention_days must be >= 0 and retention_interval >= 1");
    }
    return OpResult::success();
}

OpResult validateCameraConfig(const CameraConfig& camera) {
    if (!isValidCameraId(camera.id)) {
        return OpResult::error(ErrorCode::InvalidArgument,
                               "invalid camera id '" + camera.id + "' (use A-Z a-z 0-9 _ . -)");
    }
    if (camera.rtsp_url.empty()) {
        return OpResult::error(ErrorCode::InvalidArgument, "camera " + camera.id + " has no rtsp_url");
    }
    return OpResult::success();
}

bool validateConfig(const ServerConfig& config, std::string& err) {
    OpResult rec = validateRecordingConfig(config.recording);
    if (!rec.ok()) {
        err = rec.message;
        return false;
    }
    const IngestConfig& in = config.ingest;
    if (!(in.backoff_initial > 0.0) || in.backoff_max < in.backoff_initial || in.backoff_factor < 1.0 ||
        !(in.read_timeout > 0.0)) {
        err = "invalid ingest backoff or read_timeout settings";
        return false;
    }
    if (in.rtsp_transport != "tcp" && in.rtsp_transport != "udp") {
        err = "rtsp_transport must be tcp or udp";
        return false;
    }
    if (config.dispatch.dedupe_window < 0.0 || config.dispatch.queue_capacity == 0) {
        err = "invalid dispatch settings";
        return false;
    }
    if (config.perf_interval_ms < 1) {
        err = "perf_interval_ms must be positive";
        return false;
    }
    std::set<std::string> ids;
    for (const auto& cam : config.cameras) {
        OpResult c = validateCameraConfig(cam);
        if (!c.ok()) {
            err = c.message;
            return false;
        }
        if (!ids.insert(cam.id).second) {
            err = "duplicate camera id '" + cam.id + "'";
            return false;
        }
    }
    return true;
}

bool parseCameraSpec(const std::string& spec, CameraConfig& camera, std::string& err) {
    auto eq = spec.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
        err = "expected id=url, got '" + spec + "'";
        return false;
    }
    CameraConfig cam;
    cam.id = spec.substr(0, eq);
    cam.name = cam.id;
    cam.rtsp_url = spec.substr(eq + 1);
    OpResult valid = validateCameraConfig(cam);
    if (!valid.ok()) {
        err = valid.message;
        return false;
    }
    camera = std::move(cam);
    return true;
}

} // namespace camrec
