#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace camrec {

/**
 * @file config.hpp
 * @brief Loading and validation of the server configuration file.
 *
 * The file is a JSON object with `cameras`, `recording` and `shinobi`
 * sections plus optional `ingest`, `dispatch` and top-level runtime keys.
 * Keys that are absent keep the defaults of ServerConfig.
 */

/**
 * @brief Merge a parsed configuration document into @p config.
 * @return false with @p err set on a type mismatch or unknown container.
 */
bool applyConfigJson(const nlohmann::json& doc, ServerConfig& config, std::string& err);

/**
 * @brief Read @p path and apply it with applyConfigJson().
 */
bool loadConfigFile(const std::string& path, ServerConfig& config, std::string& err);

/** @brief Range checks on the recording settings shared by all cameras. */
OpResult validateRecordingConfig(const RecordingConfig& recording);

/** @brief Id and source URL checks for a single camera. */
OpResult validateCameraConfig(const CameraConfig& camera);

/**
 * @brief Validate the whole configuration, including duplicate camera ids.
 */
bool validateConfig(const ServerConfig& config, std::string& err);

/**
 * @brief Parse a `--camera id=url` command line value.
 */
bool parseCameraSpec(const std::string& spec, CameraConfig& camera, std::string& err);

} // namespace camrec

#endif // CONFIG_HPP
