#ifndef TYPES_HPP
#define TYPES_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace camrec {

/**
 * @file types.hpp
 * @brief Common enums, structs, and constants shared across modules.
 */

/**
 * @brief Codec parameters of one ingested elementary stream.
 *
 * Produced by a packet source on every successful connect and shared
 * read-only by all packets of that connection. Sinks open their output
 * container from it without touching the codec.
 */
struct StreamInfo {
    int codec_id = 0;               //!< AVCodecID of the video stream.
    std::string codec_name;         //!< Human readable codec name (logging only).
    int width = 0;
    int height = 0;
    int format = -1;                //!< Pixel format reported by the demuxer, -1 if unknown.
    int profile = -99;
    int level = -99;
    int64_t bit_rate = 0;
    int time_base_num = 1;          //!< Time base of Packet::pts / Packet::dts.
    int time_base_den = 90000;
    int frame_rate_num = 0;
    int frame_rate_den = 1;
    std::vector<uint8_t> extradata; //!< SPS/PPS or equivalent codec config.
    uint64_t generation = 0;        //!< Incremented by the ingestor on every reconnect.

    /** @brief True when packets of @p other can be appended to a file opened with this info. */
    bool compatibleWith(const StreamInfo& other) const;
};

/**
 * @brief One encoded video unit flowing from the ingestor to consumers.
 *
 * Immutable once published; consumers share it through PacketPtr.
 */
struct Packet {
    uint64_t seq = 0;        //!< Per-camera monotonic sequence number.
    double timestamp = 0.0;  //!< Capture time, epoch seconds, non-decreasing per camera.
    double duration = 0.0;   //!< Seconds, 0 when the source does not report it.
    int64_t pts = 0;         //!< Source presentation timestamp (StreamInfo time base).
    int64_t dts = 0;         //!< Source decoding timestamp (StreamInfo time base).
    bool keyframe = false;
    std::vector<uint8_t> data;
    std::shared_ptr<const StreamInfo> stream;
};

using PacketPtr = std::shared_ptr<const Packet>;

/** @brief Where an event entered the system. */
enum class EventOrigin {
    PushMonitor, //!< ONVIF-style push notification.
    Manual       //!< Manual trigger API / trigger FIFO.
};

/**
 * @brief Normalized external event.
 */
struct Event {
    std::string camera_id;
    std::string type;        //!< "motion", "alarm" or any other string.
    double timestamp = 0.0;  //!< Epoch seconds.
    nlohmann::json metadata = nlohmann::json::object();
    EventOrigin origin = EventOrigin::Manual;
};

enum class IngestState { Idle, Connecting, Connected, Backoff, Stopped };

enum class Health { Ok, Degraded, Failed };

enum class ErrorCode { Ok, NotFound, Conflict, InvalidArgument, Unavailable, IoError };

/**
 * @brief Outcome of a caller-visible operation.
 */
struct OpResult {
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    bool ok() const { return code == ErrorCode::Ok; }
    static OpResult success() { return OpResult{}; }
    static OpResult error(ErrorCode c, std::string msg) { return OpResult{c, std::move(msg)}; }
};

const char* toString(IngestState s);
const char* toString(Health h);
const char* toString(ErrorCode c);
const char* toString(EventOrigin o);

/**
 * @brief One configured camera.
 */
struct CameraConfig {
    std::string id;
    std::string name;
    std::string rtsp_url;   // rtsp://, http(s)://, udp:// or file:path
    std::string username;
    std::string password;
    std::string onvif_url;  // consumed by the external event monitor only
};

/**
 * @brief Recording settings shared by all cameras.
 */
struct RecordingConfig {
    std::string base_dir;
    double segment_duration;        // seconds, rotation interval
    double pre_event_buffer;        // seconds, rolling buffer window W
    double post_event_duration;     // seconds, continuation D
    std::string container;          // mp4, mkv, ts, raw
    size_t buffer_max_bytes;        // hard ceiling on buffered payload
    size_t buffer_max_packets;      // hard ceiling on buffered packet count
    size_t queue_capacity;          // per-consumer fan-out queue
    double rotation_keyframe_grace; // seconds to wait for a keyframe past a boundary
    int max_sink_failures;          // consecutive sink failures before a camera is failed
    int retention_days;             // 0 disables the periodic sweep
    int retention_interval;         // seconds between sweeps

    RecordingConfig() :
        base_dir("./recordings"),
        segment_duration(60.0),
        pre_event_buffer(60.0),
        post_event_duration(60.0),
        container("mp4"),
        buffer_max_bytes(256u * 1024u * 1024u),
        buffer_max_packets(20000),
        queue_capacity(512),
        rotation_keyframe_grace(5.0),
        max_sink_failures(3),
        retention_days(0),
        retention_interval(3600) {}
};

/**
 * @brief Reconnect and transport policy of the frame ingestor.
 */
struct IngestConfig {
    double backoff_initial = 1.0;
    double backoff_max = 30.0;
    double backoff_factor = 2.0;
    double read_timeout = 10.0;
    std::string rtsp_transport = "tcp";
};

struct DispatchConfig {
    double dedupe_window = 300.0; //!< Seconds a (camera, type, timestamp) key is remembered.
    size_t queue_capacity = 64;   //!< Pending events per camera lane.
};

/**
 * @brief External recording catalog ("Shinobi") connection.
 */
struct CatalogConfig {
    std::string base_url;  // empty disables registration
    std::string api_key;
    std::string group_key;
};

/**
 * @brief Server configuration aggregated from config file and CLI options.
 */
struct ServerConfig {
    RecordingConfig recording;
    IngestConfig ingest;
    DispatchConfig dispatch;
    CatalogConfig catalog;
    std::vector<CameraConfig> cameras;

    int perf_interval_ms = 1000;
    std::string perf_json_path;
    std::string log_level = "info";
    std::string trigger_fifo;
};

/**
 * @brief A finalized continuous segment.
 */
struct SegmentInfo {
    std::string camera_id;
    std::string video_path;
    std::string sidecar_path;
    double start = 0.0;
    double end = 0.0;
    uint64_t frame_count = 0;
    uint64_t bytes = 0;
};

/**
 * @brief One trigger that contributed to an event recording.
 */
struct TriggerRecord {
    std::string event_type;
    double timestamp = 0.0;
    EventOrigin origin = EventOrigin::Manual;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief State of an event recording session, open or finished.
 */
struct EventRecordingInfo {
    std::string camera_id;
    std::string event_type;
    double trigger_timestamp = 0.0;   //!< Timestamp carried by the first event.
    double received_at = 0.0;         //!< Recorder clock when it arrived; splits pre from post.
    double deadline = 0.0;            //!< End of the continuation window.
    double pre_event_start = 0.0;     //!< Timestamp of the first pre-event packet (0 if none).
    uint64_t pre_event_packets = 0;
    uint64_t post_event_packets = 0;
    uint64_t bytes = 0;
    std::string video_path;           //!< Empty when no packet was ever written.
    std::string sidecar_path;
    std::vector<TriggerRecord> triggers;
    bool open = false;
};

/**
 * @brief Per-camera counters sampled by the metrics thread.
 */
struct CameraCounters {
    uint64_t packets_in = 0;
    uint64_t bytes_in = 0;
    uint64_t writer_drops = 0;
    uint64_t tap_drops = 0;
    uint64_t buffer_evictions = 0;
    uint64_t buffered_packets = 0;
    uint64_t buffered_bytes = 0;
    uint64_t segments_finalized = 0;
    uint64_t events_finalized = 0;
    uint64_t reconnects = 0;
};

struct CameraStatus {
    std::string camera_id;
    IngestState ingest_state = IngestState::Idle;
    bool connected = false;
    Health health = Health::Ok;
    std::optional<double> active_segment_start;
    bool event_session_open = false;
    double event_deadline = 0.0;
    bool registered = false;
    std::string last_error;
    CameraCounters counters;
};

struct ServerStatus {
    bool running = false;
    std::vector<std::string> camera_ids;
    std::vector<CameraStatus> cameras;
};

nlohmann::json toJson(const CameraStatus& s);
nlohmann::json toJson(const ServerStatus& s);

/** @brief Source of wall-clock time in epoch seconds; injectable for tests. */
using WallClock = std::function<double()>;

/** @brief Current system time in epoch seconds. */
double systemWallClock();

} // namespace camrec

#endif // TYPES_HPP
