#include "retention.hpp"
#include "sink.hpp"
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

/**
 * @file retention.cpp
 * @brief Recording sweep and in-progress file recovery.
 */

namespace fs = std::filesystem;

namespace camrec {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/** @brief segment_10-00-00.mp4 -> segment_10-00-00.incomplete.mp4 */
fs::path incompleteName(const fs::path& video) {
    return video.parent_path() / (video.stem().string() + ".incomplete" + video.extension().string());
}

bool isRecordingVideo(const fs::path& path) {
    static const char* const kContainers[] = {"mp4", "mkv", "ts", "raw"};
    const std::string ext = path.extension().string();
    for (const char* c : kContainers) {
        if (ext == "." + containerExtension(c)) {
            return path.stem().extension() != ".incomplete";
        }
    }
    return false;
}

void pruneEmptyDirs(const fs::path& base, bool dry_run, SweepStats& stats) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) dirs.push_back(it->path());
    }
    // Deepest first so parents emptied by this pass are removed too.
    std::sort(dirs.begin(), dirs.end(), [](const fs::path& a, const fs::path& b) {
        return a.string().size() > b.string().size();
    });
    for (const auto& dir : dirs) {
        if (fs::is_empty(dir, ec) && !ec) {
            if (!dry_run) fs::remove(dir, ec);
            if (!ec) stats.dirs_removed++;
        }
    }
}

} // namespace

SweepStats sweepRecordings(const std::string& base_dir, int max_age_days, bool dry_run, double now) {
    SweepStats stats;
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec)) {
        std::cerr << "[WARN] [retention] recordings directory not found: " << base_dir << std::endl;
        return stats;
    }
    const double cutoff = now - static_cast<double>(max_age_days) * 86400.0;

    std::vector<fs::path> sidecars;
    for (fs::recursive_directory_iterator it(base_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".json") sidecars.push_back(it->path());
    }

    for (const auto& sidecar : sidecars) {
        stats.scanned++;
        std::string type;
        std::string file;
        bool keep = false;
        double end_ts = 0.0;
        try {
            std::ifstream in(sidecar);
            nlohmann::json meta = nlohmann::json::parse(in);
            if (!meta.is_object()) throw std::runtime_error("not a JSON object");
            type = meta.value("type", std::string("continuous"));
            keep = meta.value("keep", false);
            end_ts = meta.value("end", meta.value("post_event_end", 0.0));
            file = meta.value("file", std::string());
        } catch (const std::exception& e) {
            std::cerr << "[WARN] [retention] skipping unreadable " << sidecar.string() << ": " << e.what() << std::endl;
            stats.skipped++;
            continue;
        }

        if (keep || type.rfind("event", 0) == 0 || end_ts <= 0.0 || end_ts >= cutoff) {
            stats.kept++;
            continue;
        }

        fs::path video;
        if (!file.empty()) video = sidecar.parent_path() / fs::path(file).filename();

        uint64_t bytes = fileSize(sidecar.string());
        if (!video.empty()) bytes += fileSize(video.string());
        if (!dry_run) {
            if (!video.empty()) fs::remove(video, ec);
            fs::remove(sidecar, ec);
            if (ec) {
                std::cerr << "[WARN] [retention] failed to delete " << sidecar.string() << ": " << ec.message() << std::endl;
                continue;
            }
        }
        stats.deleted++;
        stats.bytes_freed += bytes;
    }

    pruneEmptyDirs(base_dir, dry_run, stats);
    std::cout << "[INFO] [retention] " << (dry_run ? "would delete " : "deleted ") << stats.deleted
              << " of " << stats.scanned << " recordings older than " << max_age_days << " days ("
              << stats.bytes_freed / (1024 * 1024) << " MiB), kept " << stats.kept << std::endl;
    return stats;
}

RecoveryStats recoverIncomplete(const std::string& base_dir) {
    RecoveryStats stats;
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec)) return stats;

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(base_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) files.push_back(it->path());
    }
    const std::string tmp_suffix = std::string(".json") + kTmpSuffix;
    for (const auto& path : files) {
        const std::string name = path.string();
        if (endsWith(name, tmp_suffix)) {
            fs::remove(path, ec);
            if (!ec) stats.tmp_removed++;
        } else if (endsWith(name, kPartSuffix)) {
            fs::path video = name.substr(0, name.size() - std::string(kPartSuffix).size());
            fs::rename(path, incompleteName(video), ec);
            if (ec) {
                std::cerr << "[WARN] [retention] could not preserve " << name << ": " << ec.message() << std::endl;
                continue;
            }
            stats.parts_preserved++;
        } else if (isRecordingVideo(path)) {
            // Renamed from .part but the sidecar never followed.
            if (fs::exists(sidecarPathFor(name), ec)) continue;
            fs::rename(path, incompleteName(path), ec);
            if (ec) {
                std::cerr << "[WARN] [retention] could not preserve " << name << ": " << ec.message() << std::endl;
                continue;
            }
            stats.orphans_preserved++;
        }
    }
    if (stats.tmp_removed > 0 || stats.parts_preserved > 0 || stats.orphans_preserved > 0) {
        std::cout << "[INFO] [retention] recovered after unclean shutdown: "
                  << stats.parts_preserved + stats.orphans_preserved
                  << " incomplete recording(s) preserved, " << stats.tmp_removed << " temp file(s) removed"
                  << std::endl;
    }
    return stats;
}

} // namespace camrec
