#include "dispatcher.hpp"
#include "event_recorder.hpp"
#include "test_support.hpp"
#include <cassert>
#include <condition_variable>
#include <iostream>
#include <map>
#include <set>

using namespace camrec;
using namespace camrec::testing;

namespace {

Event makeEvent(const std::string& camera, const std::string& type, double ts) {
    Event ev;
    ev.camera_id = camera;
    ev.type = type;
    ev.timestamp = ts;
    return ev;
}

struct CameraRig {
    CameraRig(const std::string& id, const RecordingConfig& cfg, const ManualClock& clock)
        : buffer(std::make_shared<RollingBuffer>(cfg.pre_event_buffer, 0, 100000, id)) {
        fanout.attach(buffer);
        recorder = std::make_shared<EventRecorder>(id, cfg, *buffer, fanout, defaultSinkFactory(), clock.fn());
    }
    ~CameraRig() { recorder->stop(); }

    PacketFanout fanout;
    std::shared_ptr<RollingBuffer> buffer;
    std::shared_ptr<EventRecorder> recorder;
};

/**
 * Directory of recorders. Lookups of a "gated" camera from any thread other
 * than the one that closed the gate (so: from its lane) block until the gate
 * opens. A one-shot hook can run after a lookup, outside the directory lock.
 */
class FakeDirectory : public IRecorderDirectory {
public:
    FakeDirectory(const std::string& base, const ManualClock& clock) : cfg_(testRecording(base)), clock_(clock) {}

    void add(const std::string& id) { cams_[id] = std::make_unique<CameraRig>(id, cfg_, clock_); }
    void remove(const std::string& id) {
        std::lock_guard<std::mutex> lock(mu_);
        removed_.insert(id);
    }
    std::shared_ptr<EventRecorder> recorder(const std::string& id) const { return cams_.at(id)->recorder; }

    void gate(const std::string& id) {
        std::lock_guard<std::mutex> lock(mu_);
        gated_ = id;
        gate_owner_ = std::this_thread::get_id();
        open_ = false;
    }
    void afterNextLookup(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mu_);
        hook_ = std::move(hook);
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            open_ = true;
        }
        cv_.notify_all();
    }
    bool laneBlocked() const {
        std::lock_guard<std::mutex> lock(mu_);
        return blocked_;
    }

    std::shared_ptr<EventRecorder> findRecorder(const std::string& camera_id) const override {
        std::shared_ptr<EventRecorder> found;
        std::function<void()> hook;
        {
            std::unique_lock<std::mutex> lock(mu_);
            auto it = cams_.find(camera_id);
            if (removed_.count(camera_id) || it == cams_.end()) return nullptr;
            if (camera_id == gated_ && std::this_thread::get_id() != gate_owner_) {
                blocked_ = true;
                cv_.wait(lock, [&] { return open_; });
                blocked_ = false;
            }
            found = it->second->recorder;
            hook.swap(hook_);
        }
        if (hook) hook();
        return found;
    }

private:
    RecordingConfig cfg_;
    ManualClock clock_;
    std::map<std::string, std::unique_ptr<CameraRig>> cams_;
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    std::set<std::string> removed_;
    std::string gated_;
    std::thread::id gate_owner_;
    bool open_ = true;
    mutable bool blocked_ = false;
    mutable std::function<void()> hook_;
};

} // namespace

static void testRejectsMalformedAndUnknown() {
    TempDir dir("camrec_disp_bad");
    ManualClock clock(1000.0);
    FakeDirectory cams(dir.path(), clock);
    cams.add("cam1");
    EventDispatcher dispatcher(cams, DispatchConfig(), clock.fn());

    assert(dispatcher.submitJson(nlohmann::json::array(), EventOrigin::Manual).code == ErrorCode::InvalidArgument);
    assert(dispatcher.submitJson({{"camera_id", "cam1"}}, EventOrigin::Manual).code == ErrorCode::InvalidArgument);
    assert(dispatcher.submit(makeEvent("cam1", "", 1000.0)).code == ErrorCode::InvalidArgument);
    assert(dispatcher.submit(makeEvent("cam1", "motion", 0.0)).code == ErrorCode::InvalidArgument);
    assert(dispatcher.submit(makeEvent("nope", "motion", 1000.0)).code == ErrorCode::NotFound);
    assert(dispatcher.rejected() == 5);
    assert(dispatcher.accepted() == 0);
    assert(dispatcher.laneCount() == 0);
    assert(!cams.recorder("cam1")->sessionOpen());
}

static void testDuplicatesCollapse() {
    TempDir dir("camrec_disp_dup");
    ManualClock clock(1000.0);
    FakeDirectory cams(dir.path(), clock);
    cams.add("cam1");
    DispatchConfig cfg;
    cfg.dedupe_window = 300.0;
    EventDispatcher dispatcher(cams, cfg, clock.fn());

    nlohmann::json payload = {{"camera_id", "cam1"}, {"event_type", "motion"}, {"timestamp", 1000.0}};
    OpResult first = dispatcher.submitJson(payload, EventOrigin::PushMonitor);
    assert(first.ok() && first.message.empty());
    OpResult second = dispatcher.submitJson(payload, EventOrigin::PushMonitor);
    assert(second.ok() && second.message == "duplicate");
    assert(dispatcher.accepted() == 1 && dispatcher.duplicates() == 1);

    auto recorder = cams.recorder("cam1");
    assert(waitUntil([&] { return recorder->sessionOpen(); }));

    // A different type at the same instant is a separate event.
    assert(dispatcher.submit(makeEvent("cam1", "alarm", 1000.0)).message.empty());
    assert(waitUntil([&] {
        auto s = recorder->activeSession();
        return s && s->triggers.size() == 2;
    }));

    // Once the key ages out of the window it is accepted again.
    clock.advance(301.0);
    OpResult later = dispatcher.submitJson(payload, EventOrigin::PushMonitor);
    assert(later.ok() && later.message.empty());
    assert(dispatcher.accepted() == 3);
}

static void testManualAlarmMetadataReachesRecorder() {
    TempDir dir("camrec_disp_alarm");
    ManualClock clock(2000.0);
    FakeDirectory cams(dir.path(), clock);
    cams.add("cam1");
    EventDispatcher dispatcher(cams, DispatchConfig(), clock.fn());

    nlohmann::json payload = {{"camera_id", "cam1"}, {"event_type", "alarm"}, {"alarm_type", "door_open"}};
    assert(dispatcher.submitJson(payload, EventOrigin::Manual).ok());

    auto recorder = cams.recorder("cam1");
    assert(waitUntil([&] { return recorder->sessionOpen(); }));
    auto session = recorder->activeSession();
    assert(session->trigger_timestamp == 2000.0);
    assert(session->deadline == 2060.0);
    assert(session->triggers.size() == 1);
    assert(session->triggers[0].origin == EventOrigin::Manual);
    assert(session->triggers[0].metadata["alarm_type"] == "door_open");
}

static void testSlowCameraDoesNotBlockOthers() {
    TempDir dir("camrec_disp_lanes");
    ManualClock clock(3000.0);
    FakeDirectory cams(dir.path(), clock);
    cams.add("slow");
    cams.add("fast");
    cams.gate("slow");
    EventDispatcher dispatcher(cams, DispatchConfig(), clock.fn());

    assert(dispatcher.submit(makeEvent("slow", "motion", 3000.0)).ok());
    assert(waitUntil([&] { return cams.laneBlocked(); }));

    auto start = std::chrono::steady_clock::now();
    assert(dispatcher.submit(makeEvent("fast", "motion", 3000.0)).ok());
    auto fast = cams.recorder("fast");
    assert(waitUntil([&] { return fast->sessionOpen(); }, 2000));
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    assert(!cams.recorder("slow")->sessionOpen());
    assert(dispatcher.laneCount() == 2);

    cams.release();
    auto slow = cams.recorder("slow");
    assert(waitUntil([&] { return slow->sessionOpen(); }));
}

static void testDropCameraAndStop() {
    TempDir dir("camrec_disp_stop");
    ManualClock clock(4000.0);
    FakeDirectory cams(dir.path(), clock);
    cams.add("cam1");
    cams.add("cam2");
    EventDispatcher dispatcher(cams, DispatchConfig(), clock.fn());

    assert(dispatcher.submit(makeEvent("cam1", "motion", 4000.0)).ok());
    assert(dispatcher.submit(makeEvent("cam2", "motion", 4000.0)).ok());
    assert(waitUntil([&] { return dispatcher.laneCount() == 2; }));

    cams.remove("cam2");
    dispatcher.dropCamera("cam2");
    assert(dispatcher.laneCount() == 1);
    assert(dispatcher.submit(makeEvent("cam2", "motion", 4001.0)).code == ErrorCode::NotFound);

    dispatcher.stop();
    assert(dispatcher.laneCount() == 0);
    assert(dispatcher.submit(makeEvent("cam1", "motion", 4002.0)).code == ErrorCode::Unavailable);
}

static void testRemovalDuringSubmit() {
    TempDir dir("camrec_disp_race");
    ManualClock clock(5000.0);
    FakeDirectory cams(dir.path(), clock);
    cams.add("cam1");
    EventDispatcher dispatcher(cams, DispatchConfig(), clock.fn());

    assert(dispatcher.submit(makeEvent("cam1", "motion", 5000.0)).ok());
    assert(dispatcher.laneCount() == 1);

    // The camera disappears between submit's lookup and its lane handling.
    cams.afterNextLookup([&] {
        cams.remove("cam1");
        dispatcher.dropCamera("cam1");
    });
    OpResult r = dispatcher.submit(makeEvent("cam1", "alarm", 5001.0));
    assert(r.code == ErrorCode::NotFound);
    assert(dispatcher.laneCount() == 0);
    assert(dispatcher.accepted() == 1);
}

int main() {
    testRejectsMalformedAndUnknown();
    testDuplicatesCollapse();
    testManualAlarmMetadataReachesRecorder();
    testSlowCameraDoesNotBlockOthers();
    testDropCameraAndStop();
    testRemovalDuringSubmit();
    std::cout << "test_dispatcher: OK" << std::endl;
    return 0;
}
