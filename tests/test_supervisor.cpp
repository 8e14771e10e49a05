#include "supervisor.hpp"
#include "sink.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>
#include <map>

using namespace camrec;
using namespace camrec::testing;

namespace {

/** Catalog that records calls. */
class RecordingCatalog : public ICatalogClient {
public:
    OpResult registerCamera(const CameraConfig& camera, const RecordingConfig&) override {
        std::lock_guard<std::mutex> lock(mu);
        registered.push_back(camera.id);
        return OpResult::success();
    }
    OpResult unregisterCamera(const std::string& camera_id) override {
        std::lock_guard<std::mutex> lock(mu);
        unregistered.push_back(camera_id);
        return OpResult::success();
    }
    bool enabled() const override { return true; }

    size_t registeredCount() {
        std::lock_guard<std::mutex> lock(mu);
        return registered.size();
    }

    std::mutex mu;
    std::vector<std::string> registered;
    std::vector<std::string> unregistered;
};

/** Raw sink that refuses files under one camera's directory. */
class PickySink : public IRecordingSink {
public:
    explicit PickySink(std::string refuse) : refuse_(std::move(refuse)) {}
    bool open(const std::string& path, const StreamInfo& stream) override {
        if (path.find("/" + refuse_ + "/") != std::string::npos) return false;
        return inner_.open(path, stream);
    }
    bool write(const Packet& packet) override { return inner_.write(packet); }
    bool close() override { return inner_.close(); }
    bool isOpen() const override { return inner_.isOpen(); }
    std::string lastError() const override { return inner_.isOpen() ? inner_.lastError() : "read-only volume"; }

private:
    std::string refuse_;
    RawPacketSink inner_;
};

/** One FakeCamera per camera id, created on first use. */
struct CameraFarm {
    std::shared_ptr<FakeCamera> get(const std::string& id) {
        std::lock_guard<std::mutex> lock(mu);
        auto& cam = cams[id];
        if (!cam) {
            cam = std::make_shared<FakeCamera>();
            cam->pace_ms = 2;
            cam->start_ts = systemWallClock();
        }
        return cam;
    }
    SourceFactory factory() {
        return [this](const CameraConfig& c) { return std::make_unique<FakeSource>(get(c.id)); };
    }

    std::mutex mu;
    std::map<std::string, std::shared_ptr<FakeCamera>> cams;
};

CameraConfig camera(const std::string& id) {
    CameraConfig c;
    c.id = id;
    c.name = id;
    c.rtsp_url = "rtsp://fake/" + id;
    return c;
}

ServerConfig serverConfig(const std::string& base) {
    ServerConfig cfg;
    cfg.recording = testRecording(base);
    cfg.recording.segment_duration = 3600.0;
    cfg.recording.post_event_duration = 600.0;
    cfg.perf_interval_ms = 100;
    return cfg;
}

Event motion(const std::string& camera_id, double ts) {
    Event ev;
    ev.camera_id = camera_id;
    ev.type = "motion";
    ev.timestamp = ts;
    return ev;
}

} // namespace

static void testAddRemoveAndStatus() {
    TempDir dir("camrec_sup_basic");
    CameraFarm farm;
    auto catalog = std::make_shared<RecordingCatalog>();
    PipelineDeps deps;
    deps.sources = farm.factory();
    deps.catalog = catalog;

    ServerConfig cfg = serverConfig(dir.path());
    cfg.cameras.push_back(camera("front"));
    Supervisor sup(cfg, deps);
    assert(sup.start());
    assert(sup.running());

    assert(sup.addCamera(camera("front")).code == ErrorCode::Conflict);
    assert(sup.addCamera(camera("bad/id")).code == ErrorCode::InvalidArgument);
    assert(sup.addCamera(camera("back")).ok());
    assert(sup.removeCamera("ghost").code == ErrorCode::NotFound);

    assert(waitUntil([&] { return catalog->registeredCount() == 2; }));
    assert(waitUntil([&] {
        auto s = sup.cameraStatus("back");
        return s && s->connected && s->counters.packets_in > 0 && s->registered;
    }));

    ServerStatus s = sup.status();
    assert(s.running);
    assert(s.camera_ids.size() == 2);
    nlohmann::json j = toJson(s);
    assert(j["running"] == true);
    assert(j["cameras"] == 2);
    assert(j["camera_ids"].size() == 2);
    assert(j["camera_status"][0].contains("health"));
    assert(!sup.cameraStatus("ghost"));

    assert(sup.removeCamera("back").ok());
    assert(!sup.findRecorder("back"));
    assert(sup.status().camera_ids.size() == 1);
    {
        std::lock_guard<std::mutex> lock(catalog->mu);
        assert(catalog->unregistered.size() == 1 && catalog->unregistered[0] == "back");
    }
    // The id is free again once removal has finished.
    assert(sup.addCamera(camera("back")).ok());

    sup.stop();
    assert(!sup.running());
    assert(sup.status().camera_ids.empty());
    assert(sup.addCamera(camera("late")).code == ErrorCode::Unavailable);
}

static void testRemovalFinalizesRecordings() {
    TempDir dir("camrec_sup_remove");
    CameraFarm farm;
    PipelineDeps deps;
    deps.sources = farm.factory();
    Supervisor sup(serverConfig(dir.path()), deps);
    assert(sup.start());
    assert(sup.addCamera(camera("cam1")).ok());

    std::vector<std::string> removed;
    sup.setRemovalListener([&](const std::string& id) { removed.push_back(id); });

    assert(waitUntil([&] { return sup.cameraStatus("cam1")->counters.buffered_packets >= 20; }));
    auto recorder = sup.findRecorder("cam1");
    assert(recorder);
    const double now = farm.get("cam1")->start_ts + 1.0;
    assert(recorder->trigger(motion("cam1", now)).ok());
    assert(waitUntil([&] {
        auto active = recorder->activeSession();
        return active && active->post_event_packets > 5;
    }));
    assert(sup.cameraStatus("cam1")->event_session_open);

    assert(sup.removeCamera("cam1").ok());
    assert(removed.size() == 1 && removed[0] == "cam1");
    assert(!recorder->sessionOpen());

    auto sidecars = findFiles(dir.path() + "/cam1", ".json");
    int continuous = 0, events = 0;
    for (const auto& path : sidecars) {
        auto meta = readJson(path);
        if (meta["type"] == "continuous") continuous++;
        if (meta["type"] == "event") events++;
    }
    assert(continuous == 1 && events == 1);
    assert(findFiles(dir.path(), ".part").empty());
    assert(findFiles(dir.path(), ".tmp").empty());
}

static void testUnreachableCameraDoesNotStallOthers() {
    TempDir dir("camrec_sup_unreach");
    CameraFarm farm;
    farm.get("dead")->reachable = false;
    PipelineDeps deps;
    deps.sources = farm.factory();
    Supervisor sup(serverConfig(dir.path()), deps);
    assert(sup.start());

    auto t0 = std::chrono::steady_clock::now();
    assert(sup.addCamera(camera("dead")).ok());
    assert(sup.addCamera(camera("live")).ok());
    ServerStatus s = sup.status();
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));
    assert(s.camera_ids.size() == 2);

    assert(waitUntil([&] { return sup.cameraStatus("dead")->health == Health::Degraded; }));
    assert(waitUntil([&] { return sup.cameraStatus("live")->connected; }));
    assert(waitUntil([&] { return sup.cameraStatus("live")->health == Health::Ok; }));

    // Triggers are accepted while the camera is disconnected.
    EventDispatcher dispatcher(sup, DispatchConfig());
    assert(dispatcher.submit(motion("dead", farm.get("dead")->start_ts)).ok());
    assert(dispatcher.submit(motion("live", farm.get("live")->start_ts + 0.5)).ok());
    assert(waitUntil([&] { return sup.findRecorder("live")->sessionOpen(); }));
    assert(waitUntil([&] { return sup.findRecorder("dead")->sessionOpen(); }));

    t0 = std::chrono::steady_clock::now();
    dispatcher.stop();
    sup.stop();
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(10));
}

static void testFailureIsIsolated() {
    TempDir dir("camrec_sup_fail");
    CameraFarm farm;
    PipelineDeps deps;
    deps.sources = farm.factory();
    deps.sinks = [](const std::string&) { return std::make_unique<PickySink>("broken"); };
    Supervisor sup(serverConfig(dir.path()), deps);
    assert(sup.start());
    assert(sup.addCamera(camera("broken")).ok());
    assert(sup.addCamera(camera("healthy")).ok());

    assert(waitUntil([&] { return sup.cameraStatus("broken")->health == Health::Failed; }));
    auto broken = *sup.cameraStatus("broken");
    assert(!broken.last_error.empty());
    assert(toJson(broken)["health"] == "failed");

    auto healthy = sup.cameraStatus("healthy");
    assert(healthy->health == Health::Ok);
    const uint64_t before = healthy->counters.packets_in;
    assert(waitUntil([&] { return sup.cameraStatus("healthy")->counters.packets_in > before + 10; }));

    sup.stop();
    assert(findFiles(dir.path() + "/healthy", ".json").size() == 1);
    assert(findFiles(dir.path() + "/broken", ".json").empty());
}

int main() {
    testAddRemoveAndStatus();
    testRemovalFinalizesRecordings();
    testUnreachableCameraDoesNotStallOthers();
    testFailureIsIsolated();
    std::cout << "test_supervisor: OK" << std::endl;
    return 0;
}
