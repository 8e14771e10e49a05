#include "event_recorder.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>

using namespace camrec;
using namespace camrec::testing;

namespace {

Event makeEvent(const std::string& camera, const std::string& type, double ts,
                EventOrigin origin = EventOrigin::Manual) {
    Event ev;
    ev.camera_id = camera;
    ev.type = type;
    ev.timestamp = ts;
    ev.origin = origin;
    return ev;
}

/** Camera side of a recorder: fan-out, buffer and a hand-driven clock. */
struct Rig {
    explicit Rig(const std::string& base, double post = 60.0, double now = 0.0)
        : cfg(testRecording(base)),
          buffer(std::make_shared<RollingBuffer>(60.0, 0, 100000, "cam1")),
          clock(now) {
        cfg.post_event_duration = post;
        fanout.attach(buffer);
        recorder = std::make_unique<EventRecorder>("cam1", cfg, *buffer, fanout, defaultSinkFactory(), clock.fn());
    }

    void publish(double ts, bool keyframe = true) {
        fanout.publish(makePacket(next_seq++, ts, keyframe));
    }

    bool waitClosed() {
        return waitUntil([&] {
            recorder->poll();
            return !recorder->sessionOpen() && !recorder->history().empty();
        });
    }

    RecordingConfig cfg;
    PacketFanout fanout;
    std::shared_ptr<RollingBuffer> buffer;
    ManualClock clock;
    std::unique_ptr<EventRecorder> recorder;
    uint64_t next_seq = 0;
};

} // namespace

static void testEmptyBufferTrigger() {
    TempDir dir("camrec_evt_empty");
    Rig rig(dir.path(), 60.0, 100.0);

    OpResult r = rig.recorder->trigger(makeEvent("cam1", "motion", 100.0));
    assert(r.ok());
    assert(rig.recorder->sessionOpen());
    auto active = rig.recorder->activeSession();
    assert(active && active->deadline == 160.0);

    for (int t = 100; t <= 170; ++t) rig.publish(t);
    assert(rig.waitClosed());

    auto hist = rig.recorder->history();
    assert(hist.size() == 1);
    const auto& rec = hist[0];
    assert(rec.pre_event_packets == 0);
    assert(rec.post_event_packets == 60);
    assert(rec.trigger_timestamp == 100.0);
    assert(rec.deadline == 160.0);
    assert(!rec.open);

    auto meta = readJson(rec.sidecar_path);
    assert(meta["type"] == "event");
    assert(meta["event_type"] == "motion");
    assert(meta["trigger_timestamp"].get<double>() == 100.0);
    assert(meta["pre_event_duration"].get<double>() == 0.0);
    assert(meta["post_event_duration"].get<double>() == 60.0);
    assert(meta["post_event_end"].get<double>() == 160.0);
    assert(meta["frame_count"].get<uint64_t>() == 60);
    assert(meta["keep"] == true);
    assert(meta["triggering_events"].size() == 1);
    assert(std::filesystem::exists(rec.video_path));
    assert(rig.recorder->recordingsFinalized() == 1);
}

static void testCoalescing() {
    TempDir dir("camrec_evt_coalesce");
    const double t = 1000.0;
    Rig rig(dir.path(), 60.0, t);

    assert(rig.recorder->trigger(makeEvent("cam1", "motion", t)).ok());
    rig.clock.set(t + 5);
    assert(rig.recorder->trigger(makeEvent("cam1", "alarm", t + 5, EventOrigin::PushMonitor)).ok());
    auto active = rig.recorder->activeSession();
    assert(active && active->deadline == t + 65);
    assert(active->triggers.size() == 2);

    for (int k = 0; k <= 70; ++k) rig.publish(t + k);
    assert(rig.waitClosed());

    auto hist = rig.recorder->history();
    assert(hist.size() == 1);
    assert(hist[0].deadline == t + 65);
    assert(hist[0].post_event_packets == 65);
    assert(hist[0].triggers.size() == 2);

    auto meta = readJson(hist[0].sidecar_path);
    assert(meta["post_event_end"].get<double>() == t + 65);
    assert(meta["triggering_events"].size() == 2);
    assert(meta["triggering_events"][0]["event_type"] == "motion");
    assert(meta["triggering_events"][1]["event_type"] == "alarm");
    assert(meta["triggering_events"][1]["origin"] == "push_monitor");
    assert(findFiles(dir.path(), ".json").size() == 1);
}

static void testPreEventStartsOnKeyframe() {
    TempDir dir("camrec_evt_pre");
    Rig rig(dir.path(), 10.0, 100.0);

    // Keyframes every 7 s; the buffer window leaves 40..99 with the first keyframe at 42.
    for (int t = 35; t < 100; ++t) rig.publish(t, t % 7 == 0);
    assert(rig.buffer->snapshot().front()->timestamp == 40.0);

    assert(rig.recorder->trigger(makeEvent("cam1", "motion", 100.0)).ok());
    for (int t = 100; t <= 115; ++t) rig.publish(t, t % 7 == 0);
    assert(rig.waitClosed());

    auto rec = rig.recorder->history().at(0);
    assert(rec.pre_event_start == 42.0);
    assert(rec.pre_event_packets == 58);
    assert(rec.post_event_packets == 10);
    auto meta = readJson(rec.sidecar_path);
    assert(meta["pre_event_duration"].get<double>() == 58.0);
    assert(meta["frame_count"].get<uint64_t>() == 68);
}

static void testWallClockDeadlineWithoutPackets() {
    TempDir dir("camrec_evt_idle");
    Rig rig(dir.path(), 60.0, 200.0);

    assert(rig.recorder->trigger(makeEvent("cam1", "alarm", 200.0)).ok());
    rig.clock.set(261.0);
    assert(rig.waitClosed());

    auto rec = rig.recorder->history().at(0);
    assert(rec.video_path.empty());
    auto meta = readJson(rec.sidecar_path);
    assert(meta["frame_count"].get<uint64_t>() == 0);
    assert(meta["file"] == "");
    assert(findFiles(dir.path(), ".part").empty());
}

static void testStopFinalizesOpenSession() {
    TempDir dir("camrec_evt_stop");
    Rig rig(dir.path(), 60.0, 300.0);

    assert(rig.recorder->trigger(makeEvent("cam1", "motion", 300.0)).ok());
    for (int t = 300; t < 310; ++t) rig.publish(t);
    assert(waitUntil([&] {
        auto s = rig.recorder->activeSession();
        return s && s->post_event_packets == 10;
    }));
    rig.recorder->stop();
    assert(!rig.recorder->sessionOpen());

    auto hist = rig.recorder->history();
    assert(hist.size() == 1);
    assert(hist[0].post_event_packets == 10);
    assert(std::filesystem::exists(hist[0].sidecar_path));
    assert(findFiles(dir.path(), ".part").empty());
    assert(rig.fanout.consumerCount() == 1); // tap detached, buffer remains

    OpResult late = rig.recorder->trigger(makeEvent("cam1", "motion", 320.0));
    assert(late.code == ErrorCode::Unavailable);
}

static void testWrongCameraAndSequentialSessions() {
    TempDir dir("camrec_evt_seq");
    Rig rig(dir.path(), 5.0, 500.0);

    assert(rig.recorder->trigger(makeEvent("cam2", "motion", 500.0)).code == ErrorCode::InvalidArgument);

    assert(rig.recorder->trigger(makeEvent("cam1", "motion", 500.0)).ok());
    for (int t = 500; t <= 506; ++t) rig.publish(t);
    assert(rig.waitClosed());

    rig.clock.set(510.0);
    assert(rig.recorder->trigger(makeEvent("cam1", "motion", 510.0)).ok());
    for (int t = 507; t <= 516; ++t) rig.publish(t);
    assert(waitUntil([&] {
        rig.recorder->poll();
        return rig.recorder->history().size() == 2;
    }));
    auto hist = rig.recorder->history();
    // The second session picks its pre-event portion from the buffer.
    assert(hist[1].pre_event_packets > 0);
    assert(hist[1].post_event_packets == 5);
    assert(findFiles(dir.path(), ".json").size() == 2);
}

static void testStaleTriggerTimestamp() {
    TempDir dir("camrec_evt_stale");
    Rig rig(dir.path(), 60.0, 1000.0);

    // A late redelivery carries a timestamp two minutes old.
    assert(rig.recorder->trigger(makeEvent("cam1", "motion", 880.0)).ok());
    auto active = rig.recorder->activeSession();
    assert(active && active->deadline == 1060.0);
    assert(active->received_at == 1000.0);

    for (int t = 1000; t <= 1065; ++t) rig.publish(t);
    assert(rig.waitClosed());

    auto rec = rig.recorder->history().at(0);
    assert(rec.trigger_timestamp == 880.0);
    assert(rec.post_event_packets == 60);
    assert(rec.pre_event_packets == 0);
    auto meta = readJson(rec.sidecar_path);
    assert(meta["trigger_timestamp"].get<double>() == 880.0);
    assert(meta["received_at"].get<double>() == 1000.0);
    assert(meta["post_event_end"].get<double>() == 1060.0);
    assert(meta["triggering_events"][0]["timestamp"].get<double>() == 880.0);
}

static void testFutureTriggerTimestamp() {
    TempDir dir("camrec_evt_future");
    Rig rig(dir.path(), 60.0, 1000.0);

    // A camera with a broken clock must not pin the session open.
    assert(rig.recorder->trigger(makeEvent("cam1", "motion", 1e12)).ok());
    assert(rig.recorder->activeSession()->deadline == 1060.0);
    rig.clock.set(1030.0);
    assert(rig.recorder->trigger(makeEvent("cam1", "alarm", 2e12)).ok());
    assert(rig.recorder->activeSession()->deadline == 1090.0);

    rig.clock.set(1091.0);
    assert(rig.waitClosed());
    auto rec = rig.recorder->history().at(0);
    assert(rec.trigger_timestamp == 1e12);
    assert(rec.deadline == 1090.0);
    assert(rec.triggers.size() == 2);
}

static void testExpiryKeepsQueuedPackets() {
    TempDir dir("camrec_evt_drain");
    Rig rig(dir.path(), 60.0, 100.0);

    assert(rig.recorder->trigger(makeEvent("cam1", "motion", 100.0)).ok());
    // Queue the whole window and expire it before the session can catch up.
    for (int t = 100; t < 160; ++t) rig.publish(t);
    rig.clock.set(200.0);
    assert(rig.waitClosed());

    auto rec = rig.recorder->history().at(0);
    assert(rec.post_event_packets == 60);
}

int main() {
    testEmptyBufferTrigger();
    testCoalescing();
    testPreEventStartsOnKeyframe();
    testWallClockDeadlineWithoutPackets();
    testStopFinalizesOpenSession();
    testWrongCameraAndSequentialSessions();
    testStaleTriggerTimestamp();
    testFutureTriggerTimestamp();
    testExpiryKeepsQueuedPackets();
    std::cout << "test_event_recorder: OK" << std::endl;
    return 0;
}
