#ifndef CATALOG_HPP
#define CATALOG_HPP

#include "types.hpp"
#include <memory>
#include <string>

namespace camrec {

/**
 * @file catalog.hpp
 * @brief Registration of cameras with the external recording catalog.
 */

/**
 * @brief Black-box catalog service a camera is registered with when added.
 * @threading Called from camera pipeline threads; implementations must be
 *            safe for concurrent calls for different cameras.
 */
class ICatalogClient {
public:
    virtual ~ICatalogClient() = default;

    virtual OpResult registerCamera(const CameraConfig& camera, const RecordingConfig& recording) = 0;
    virtual OpResult unregisterCamera(const std::string& camera_id) = 0;

    /** @brief False when registration is disabled. */
    virtual bool enabled() const = 0;
};

/**
 * @brief Catalog stand-in used when no catalog is configured.
 */
class NullCatalogClient : public ICatalogClient {
public:
    OpResult registerCamera(const CameraConfig&, const RecordingConfig&) override { return OpResult::success(); }
    OpResult unregisterCamera(const std::string&) override { return OpResult::success(); }
    bool enabled() const override { return false; }
};

/**
 * @brief Shinobi-style HTTP catalog.
 *
 * Monitors are configured with `POST /api/<group>/configureMonitor/<id>`,
 * removed with `DELETE` on the same path. The API key and group travel as
 * query parameters; a response of `{"ok": true}` means success.
 */
class ShinobiCatalogClient : public ICatalogClient {
public:
    explicit ShinobiCatalogClient(const CatalogConfig& config, double timeout_seconds = 5.0);

    OpResult registerCamera(const CameraConfig& camera, const RecordingConfig& recording) override;
    OpResult unregisterCamera(const std::string& camera_id) override;
    bool enabled() const override { return true; }

    /** @brief Monitor document sent for @p camera. */
    static nlohmann::json monitorConfig(const CameraConfig& camera, const RecordingConfig& recording);

private:
    enum class Method { Post, Delete };

    OpResult request(Method method, const std::string& path, const nlohmann::json* body);
    std::string endpoint(const std::string& action, const std::string& id) const;

    CatalogConfig config_;
    double timeout_;
};

/** @brief Shinobi client when a base URL is configured, the null client otherwise. */
std::shared_ptr<ICatalogClient> createCatalogClient(const CatalogConfig& config);

} // namespace camrec

#endif // CATALOG_HPP
