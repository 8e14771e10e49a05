#ifndef EVENTS_HPP
#define EVENTS_HPP

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace camrec {

/**
 * @file events.hpp
 * @brief Normalization of external event payloads into Event.
 */

/**
 * @brief Parse a `{camera_id, event_type, timestamp, metadata?}` payload.
 *
 * A manual alarm's `alarm_type` is folded into the metadata. A missing
 * timestamp is filled from @p now.
 * @return InvalidArgument with a description of the first problem found.
 */
OpResult normalizeEvent(const nlohmann::json& payload, EventOrigin origin, Event& out,
                        double now);

/**
 * @brief Map a push-monitor notification onto an Event.
 *
 * Topics mentioning motion become "motion", alarms and digital inputs become
 * "alarm", everything else "other". The topic is kept in the metadata.
 */
Event normalizeOnvifTopic(const std::string& camera_id, const std::string& topic,
                          double timestamp, const nlohmann::json& data);

/** @brief Structural checks shared by every origin. */
OpResult validateEvent(const Event& event);

/** @brief True when @p id is usable as a camera id (and directory name). */
bool isValidCameraId(const std::string& id);

} // namespace camrec

#endif // EVENTS_HPP
