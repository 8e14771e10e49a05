#include "config.hpp"
#include "test_support.hpp"
#include <cassert>
#include <fstream>
#include <iostream>

using namespace camrec;
using namespace camrec::testing;

int main() {
    TempDir dir("camrec_cfg");

    // Defaults are valid apart from needing cameras.
    ServerConfig defaults;
    std::string err;
    assert(validateConfig(defaults, err));
    assert(defaults.recording.segment_duration == 60.0);
    assert(defaults.recording.container == "mp4");
    assert(defaults.ingest.backoff_max == 30.0);

    const std::string path = dir.path() + "/config.json";
    {
        std::ofstream out(path);
        out << R"({
  "cameras": [
    {"id": "front", "name": "Front door", "rtsp_url": "rtsp://10.0.0.5:554/stream1",
     "username": "admin", "password": "secret", "onvif_url": "http://10.0.0.5/onvif/device_service"},
    {"id": "yard", "rtsp_url": "file:/tmp/yard.mp4"}
  ],
  "recording": {"base_dir": "/var/lib/camrec", "segment_duration": 300, "pre_event_buffer": 30,
                "post_event_duration": 90, "container": "mkv"},
  "shinobi": {"base_url": "http://localhost:8080", "api_key": "k", "group_key": "g"},
  "ingest": {"backoff_max": 10, "rtsp_transport": "udp"},
  "perf_interval_ms": 5000
})";
    }
    ServerConfig cfg;
    assert(loadConfigFile(path, cfg, err));
    assert(cfg.cameras.size() == 2);
    assert(cfg.cameras[0].id == "front" && cfg.cameras[0].name == "Front door");
    assert(cfg.cameras[0].username == "admin" && cfg.cameras[0].password == "secret");
    assert(cfg.cameras[1].name == "yard");
    assert(cfg.recording.base_dir == "/var/lib/camrec");
    assert(cfg.recording.segment_duration == 300.0);
    assert(cfg.recording.pre_event_buffer == 30.0);
    assert(cfg.recording.post_event_duration == 90.0);
    assert(cfg.recording.container == "mkv");
    assert(cfg.recording.buffer_max_packets == 20000); // untouched default
    assert(cfg.catalog.base_url == "http://localhost:8080");
    assert(cfg.ingest.backoff_max == 10.0 && cfg.ingest.rtsp_transport == "udp");
    assert(cfg.perf_interval_ms == 5000);
    assert(validateConfig(cfg, err));

    // Duplicate ids are rejected.
    ServerConfig dup = cfg;
    dup.cameras.push_back(cfg.cameras[0]);
    assert(!validateConfig(dup, err));
    assert(err.find("duplicate") != std::string::npos);

    // Non-positive durations and unknown containers.
    ServerConfig bad = cfg;
    bad.recording.post_event_duration = 0;
    assert(!validateConfig(bad, err));
    bad = cfg;
    bad.recording.container = "avi";
    assert(validateRecordingConfig(bad.recording).code == ErrorCode::InvalidArgument);

    // Type errors and unreadable files.
    ServerConfig typed;
    assert(!applyConfigJson(nlohmann::json{{"recording", {{"segment_duration", "long"}}}}, typed, err));
    assert(!applyConfigJson(nlohmann::json{{"cameras", "front"}}, typed, err));
    assert(!loadConfigFile(dir.path() + "/missing.json", typed, err));
    {
        std::ofstream out(dir.path() + "/broken.json");
        out << "{ not json";
    }
    assert(!loadConfigFile(dir.path() + "/broken.json", typed, err));

    // --camera id=url
    CameraConfig cam;
    assert(parseCameraSpec("cam1=rtsp://host/live", cam, err));
    assert(cam.id == "cam1" && cam.rtsp_url == "rtsp://host/live");
    assert(!parseCameraSpec("rtsp://host/live", cam, err));
    assert(!parseCameraSpec("bad id=rtsp://host", cam, err));
    assert(!parseCameraSpec("cam1=", cam, err));

    std::cout << "test_config: OK" << std::endl;
    return 0;
}
