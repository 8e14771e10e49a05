#ifndef STORAGE_HPP
#define STORAGE_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace camrec {

/**
 * @file storage.hpp
 * @brief Recording paths and the crash-safe finalize protocol.
 *
 * A recording is written as `<name>.<ext>.part`. Finalizing writes the sidecar
 * to `<name>.json.tmp`, syncs it, renames the video to `<name>.<ext>` and
 * finally renames the sidecar to `<name>.json`. A recording is finalized if
 * and only if its `.json` sidecar exists.
 */

constexpr const char* kPartSuffix = ".part";
constexpr const char* kTmpSuffix = ".tmp";

/** @brief strftime() of epoch seconds in local time. */
std::string formatLocalTime(double epoch_seconds, const char* fmt);

/** @brief `<base>/<camera>/<YYYY-MM-DD>/<HH>` for the hour containing @p epoch_seconds. */
std::string recordingDir(const std::string& base_dir, const std::string& camera_id, double epoch_seconds);

/**
 * @brief Create @p dir and pick `<dir>/<stem>.<ext>`, suffixing the stem with
 *        `_N` when a recording of that name already exists.
 * @return Final video path, or empty with @p err set.
 */
std::string allocateRecordingPath(const std::string& dir, const std::string& stem,
                                  const std::string& ext, std::string& err);

/** @brief Video path with its extension replaced by `.json`. */
std::string sidecarPathFor(const std::string& video_path);

/** @brief In-progress name of a video path. */
std::string partPathFor(const std::string& video_path);

/** @brief Write @p content to @p path and fsync it. */
bool writeFileSynced(const std::string& path, const std::string& content, std::string& err);

/**
 * @brief Publish a recording.
 * @param part_path In-progress video, or empty when no video was produced.
 * @param video_path Final video name.
 * @param sidecar_path Final sidecar name.
 */
bool finalizeRecording(const std::string& part_path, const std::string& video_path,
                       const std::string& sidecar_path, const nlohmann::json& meta,
                       std::string& err);

/** @brief Size of a file, 0 if it does not exist. */
uint64_t fileSize(const std::string& path);

} // namespace camrec

#endif // STORAGE_HPP
