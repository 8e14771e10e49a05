#include "catalog.hpp"
#include <httplib.h>
#include <cctype>
#include <iostream>

/**
 * @file catalog.cpp
 * @brief Shinobi monitor registration over HTTP.
 */

namespace camrec {

namespace {

struct StreamLocation {
    std::string host;
    int port = 554;
    std::string path = "/";
};

StreamLocation parseStreamLocation(const std::string& url) {
    StreamLocation loc;
    auto scheme_end = url.find("://");
    size_t start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    size_t path_start = url.find('/', start);
    std::string authority = url.substr(start, path_start == std::string::npos ? std::string::npos
                                                                               : path_start - start);
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        loc.host = authority.substr(0, colon);
        try {
            loc.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            loc.port = 554;
        }
    } else {
        loc.host = authority;
    }
    if (path_start != std::string::npos) loc.path = url.substr(path_start);
    return loc;
}

std::string urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0xF];
        }
    }
    return out;
}

} // namespace

ShinobiCatalogClient::ShinobiCatalogClient(const CatalogConfig& config, double timeout_seconds)
    : config_(config), timeout_(timeout_seconds) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') config_.base_url.pop_back();
}

nlohmann::json ShinobiCatalogClient::monitorConfig(const CameraConfig& camera, const RecordingConfig& recording) {
    StreamLocation loc = parseStreamLocation(camera.rtsp_url);
    return {
        {"name", camera.name.empty() ? camera.id : camera.name},
        {"mode", "record"},
        {"type", "rtsp"},
        {"host", loc.host},
        {"port", loc.port},
        {"path", loc.path},
        {"details", {
            {"rtsp_transport", "tcp"},
            {"skip_ping", true},
            {"fatal_max", 10},
            {"detector", "1"},
            {"detector_record_method", "sip"},
            {"detector_trigger", "1"},
            {"detector_timeout", 10},
            {"record_method", "all"},
            {"recording_dir", recording.base_dir + "/" + camera.id}
        }}
    };
}

std::string ShinobiCatalogClient::endpoint(const std::string& action, const std::string& id) const {
    return "/api/" + urlEncode(config_.group_key) + "/" + action + "/" + urlEncode(id) +
           "?key=" + urlEncode(config_.api_key) + "&group=" + urlEncode(config_.group_key);
}

OpResult ShinobiCatalogClient::request(Method method, const std::string& path, const nlohmann::json* body) {
    httplib::Client client(config_.base_url);
    const time_t sec = static_cast<time_t>(timeout_);
    const time_t usec = static_cast<time_t>((timeout_ - sec) * 1e6);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);

    httplib::Result res = method == Method::Post
        ? client.Post(path.c_str(), body ? body->dump() : std::string("{}"), "application/json")
        : client.Delete(path.c_str());
    if (!res) {
        return OpResult::error(ErrorCode::Unavailable,
                               "catalog request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        return OpResult::error(ErrorCode::Unavailable, "catalog returned HTTP " + std::to_string(res->status));
    }
    nlohmann::json reply = nlohmann::json::parse(res->body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object() || !reply.value("ok", false)) {
        std::string msg = reply.is_object() ? reply.value("msg", std::string("ok is false")) : "invalid JSON reply";
        return OpResult::error(ErrorCode::Unavailable, "catalog rejected request: " + msg);
    }
    return OpResult::success();
}

OpResult ShinobiCatalogClient::registerCamera(const CameraConfig& camera, const RecordingConfig& recording) {
    nlohmann::json body = monitorConfig(camera, recording);
    return request(Method::Post, endpoint("configureMonitor", camera.id), &body);
}

OpResult ShinobiCatalogClient::unregisterCamera(const std::string& camera_id) {
    return request(Method::Delete, endpoint("configureMonitor", camera_id), nullptr);
}

std::shared_ptr<ICatalogClient> createCatalogClient(const CatalogConfig& config) {
    if (config.base_url.empty()) return std::make_shared<NullCatalogClient>();
    std::cout << "[INFO] Catalog registration enabled: " << config.base_url << std::endl;
    return std::make_shared<ShinobiCatalogClient>(config);
}

} // namespace camrec
