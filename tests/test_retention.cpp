#include "retention.hpp"
#include "test_support.hpp"
#include <cassert>
#include <fstream>
#include <iostream>

using namespace camrec;
using namespace camrec::testing;
namespace fs = std::filesystem;

namespace {

const double kNow = 1700000000.0;
const double kDay = 86400.0;

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

/** Finalized recording: video plus sidecar. */
void writeRecording(const fs::path& dir, const std::string& stem, nlohmann::json meta) {
    meta["file"] = stem + ".mp4";
    writeFile(dir / (stem + ".mp4"), std::string(1000, 'v'));
    writeFile(dir / (stem + ".json"), meta.dump());
}

} // namespace

static void testSweep() {
    TempDir dir("camrec_ret");
    const fs::path base = dir.path();
    const fs::path old_day = base / "cam1" / "2023" / "11" / "01";
    const fs::path new_day = base / "cam1" / "2023" / "11" / "14";

    writeRecording(old_day, "segment_old", {{"type", "continuous"}, {"end", kNow - 10 * kDay}});
    writeRecording(old_day, "event_old", {{"type", "event"}, {"post_event_end", kNow - 10 * kDay}});
    writeRecording(old_day, "segment_kept", {{"type", "continuous"}, {"end", kNow - 10 * kDay}, {"keep", true}});
    writeRecording(new_day, "segment_new", {{"type", "continuous"}, {"end", kNow - 3600.0}});
    writeFile(new_day / "garbage.json", "{ nope");
    writeFile(new_day / "wrong_types.json", R"({"type": 7, "end": "soon"})");
    writeRecording(base / "cam2" / "2023" / "10" / "01", "segment_gone",
                   {{"type", "continuous"}, {"end", kNow - 40 * kDay}});

    // Dry run reports but removes nothing.
    SweepStats dry = sweepRecordings(base.string(), 7, true, kNow);
    assert(dry.scanned == 7);
    assert(dry.deleted == 2);
    assert(dry.skipped == 2);
    assert(dry.kept == 3);
    assert(dry.bytes_freed > 2000);
    assert(fs::exists(old_day / "segment_old.mp4"));

    SweepStats real = sweepRecordings(base.string(), 7, false, kNow);
    assert(real.deleted == 2);
    assert(!fs::exists(old_day / "segment_old.mp4"));
    assert(!fs::exists(old_day / "segment_old.json"));
    assert(fs::exists(old_day / "event_old.mp4"));
    assert(fs::exists(old_day / "segment_kept.mp4"));
    assert(fs::exists(new_day / "segment_new.mp4"));
    assert(fs::exists(new_day / "garbage.json"));
    // cam2 held one expired segment; its whole tree is pruned.
    assert(!fs::exists(base / "cam2"));
    assert(real.dirs_removed >= 4);
    assert(fs::exists(base));

    // Missing base directory is not an error.
    SweepStats none = sweepRecordings((base / "missing").string(), 7, false, kNow);
    assert(none.scanned == 0);
}

static void testRecoverIncomplete() {
    TempDir dir("camrec_recover");
    const fs::path day = fs::path(dir.path()) / "cam1" / "2023" / "11" / "14";
    writeFile(day / "segment_10-00-00.mp4.part", "partial");
    writeFile(day / "segment_10-00-00.json.tmp", "{}");
    writeFile(day / "event_motion_10-01-00.mkv.part", "partial");
    writeRecording(day, "segment_09-59-00", {{"type", "continuous"}, {"end", kNow}});
    // Crashed after the video rename but before the sidecar rename.
    writeFile(day / "segment_09-58-00.mp4", "finished video");
    writeFile(day / "segment_09-58-00.json.tmp", "{}");
    writeFile(day / "event_alarm_09-57-00.bin", "raw packets");

    RecoveryStats stats = recoverIncomplete(dir.path());
    assert(stats.tmp_removed == 2);
    assert(stats.parts_preserved == 2);
    assert(stats.orphans_preserved == 2);
    assert(fs::exists(day / "segment_09-58-00.incomplete.mp4"));
    assert(!fs::exists(day / "segment_09-58-00.mp4"));
    assert(fs::exists(day / "event_alarm_09-57-00.incomplete.bin"));
    assert(fs::exists(day / "segment_10-00-00.incomplete.mp4"));
    assert(fs::exists(day / "event_motion_10-01-00.incomplete.mkv"));
    assert(findFiles(dir.path(), ".part").empty());
    assert(findFiles(dir.path(), ".tmp").empty());
    assert(fs::exists(day / "segment_09-59-00.mp4"));

    // Second run finds nothing left to do.
    RecoveryStats again = recoverIncomplete(dir.path());
    assert(again.tmp_removed == 0 && again.parts_preserved == 0 && again.orphans_preserved == 0);
    assert(fs::exists(day / "segment_10-00-00.incomplete.mp4"));
}

int main() {
    testSweep();
    testRecoverIncomplete();
    std::cout << "test_retention: OK" << std::endl;
    return 0;
}
