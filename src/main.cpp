#include "types.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "logging.hpp"
#include "retention.hpp"
#include "sink.hpp"
#include "supervisor.hpp"
#include "trigger_fifo.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

/**
 * @file main.cpp
 * @brief CLI entry point configuring and launching the recording server.
 */

using namespace camrec;

static volatile std::sig_atomic_t g_stop = 0;

/** @brief Catch termination signals and request server shutdown. */
void signal_handler(int sig) {
    (void)sig;
    g_stop = 1;
}

/** @brief Print CLI usage with supported flags and defaults. */
void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nCameras:\n"
              << "  --config path                     JSON config (cameras, recording, shinobi)\n"
              << "  --camera id=url                   Add a camera (repeatable; rtsp://, http://, udp://, file:)\n"
              << "\nRecording:\n"
              << "  --base-dir path                   Recordings root (default: ./recordings)\n"
              << "  --segment-duration sec            Continuous segment length (default: 60)\n"
              << "  --pre-event sec                   Pre-event buffer window (default: 60)\n"
              << "  --post-event sec                  Post-event continuation (default: 60)\n"
              << "  --container mp4|mkv|ts|raw        Output container (default: mp4)\n"
              << "  --retention-days N                Delete continuous segments older than N days (0=off)\n"
              << "\nEvents:\n"
              << "  --trigger-fifo path               Read JSON trigger lines from a named pipe\n"
              << "  --shinobi-url url                 Catalog base URL (registration off when empty)\n"
              << "\nPerformance:\n"
              << "  --perf-interval ms                Metrics interval (default: 1000)\n"
              << "  --perf-json path                  JSONL metrics output\n"
              << "\nOther:\n"
              << "  --log-level info|debug|warn|error Log level (default: info)\n"
              << "  --help                            Show this help\n";
}

namespace {

constexpr int kCliUserError = 2;

/** @brief Print error, usage, and exit with CLI failure code. */
[[noreturn]] void cli_error(const char* program, const std::string& opt, const std::string& message) {
    (void)opt;
    if (!message.empty()) {
        std::cerr << message << std::endl;
    }
    print_usage(program);
    std::exit(kCliUserError);
}

/** @brief Parse integer argument with bounds checking. */
int parse_int_option(const char* program, const std::string& opt, const std::string& value,
                     int min_value, int max_value) {
    if (value.empty()) {
        cli_error(program, opt, "Missing value for " + opt);
    }
    try {
        size_t idx = 0;
        long long parsed = std::stoll(value, &idx, 10);
        if (idx != value.size()) {
            cli_error(program, opt, "Invalid integer for " + opt + ": " + value);
        }
        if (parsed < static_cast<long long>(min_value) || parsed > static_cast<long long>(max_value)) {
            std::ostringstream oss;
            oss << "Value for " << opt << " must be between " << min_value << " and " << max_value;
            cli_error(program, opt, oss.str());
        }
        return static_cast<int>(parsed);
    } catch (const std::exception&) {
        cli_error(program, opt, "Invalid integer for " + opt + ": " + value);
    }
    return min_value; // Unreachable, keeps compiler happy
}

/** @brief Parse seconds argument with bounds checking. */
double parse_seconds_option(const char* program, const std::string& opt, const std::string& value,
                            double min_value, double max_value) {
    if (value.empty()) {
        cli_error(program, opt, "Missing value for " + opt);
    }
    try {
        size_t idx = 0;
        double parsed = std::stod(value, &idx);
        if (idx != value.size()) {
            cli_error(program, opt, "Invalid number for " + opt + ": " + value);
        }
        if (!(parsed >= min_value && parsed <= max_value)) {
            std::ostringstream oss;
            oss << "Value for " << opt << " must be between " << min_value << " and " << max_value;
            cli_error(program, opt, oss.str());
        }
        return parsed;
    } catch (const std::exception&) {
        cli_error(program, opt, "Invalid number for " + opt + ": " + value);
    }
    return min_value; // Unreachable, keeps compiler happy
}

/** @brief Fetch next CLI token, erroring if absent. */
std::string require_value(int& index, int argc, char* argv[], const std::string& opt, const char* program) {
    if (index + 1 >= argc) {
        cli_error(program, opt, "Missing value for " + opt);
    }
    return argv[++index];
}

/** @brief Lowercase helper preserving original string immutability. */
std::string to_lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

/**
 * @brief Parse CLI arguments on top of the optional config file.
 * @throws Exits process via cli_error on invalid input.
 */
ServerConfig parse_args(int argc, char* argv[]) {
    ServerConfig config;
    const char* program = argv[0];

    // The config file is the base layer; every other flag overrides it.
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(program);
            std::exit(0);
        }
        if (arg == "--config") {
            std::string path = require_value(i, argc, argv, arg, program);
            std::string err;
            if (!loadConfigFile(path, config, err)) {
                cli_error(program, arg, err);
            }
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config") {
            ++i;
        } else if (arg == "--camera") {
            CameraConfig cam;
            std::string err;
            if (!parseCameraSpec(require_value(i, argc, argv, arg, program), cam, err)) {
                cli_error(program, arg, "Invalid --camera: " + err);
            }
            config.cameras.push_back(cam);
        } else if (arg == "--base-dir") {
            config.recording.base_dir = require_value(i, argc, argv, arg, program);
        } else if (arg == "--segment-duration") {
            config.recording.segment_duration =
                parse_seconds_option(program, arg, require_value(i, argc, argv, arg, program), 1.0, 86400.0);
        } else if (arg == "--pre-event") {
            config.recording.pre_event_buffer =
                parse_seconds_option(program, arg, require_value(i, argc, argv, arg, program), 1.0, 3600.0);
        } else if (arg == "--post-event") {
            config.recording.post_event_duration =
                parse_seconds_option(program, arg, require_value(i, argc, argv, arg, program), 1.0, 3600.0);
        } else if (arg == "--container") {
            std::string v = to_lower_copy(require_value(i, argc, argv, arg, program));
            if (!isSupportedContainer(v)) {
                cli_error(program, arg, "Invalid --container value: " + v + " (use mp4|mkv|ts|raw)");
            }
            config.recording.container = v;
        } else if (arg == "--retention-days") {
            config.recording.retention_days =
                parse_int_option(program, arg, require_value(i, argc, argv, arg, program), 0, 3650);
        } else if (arg == "--trigger-fifo") {
            config.trigger_fifo = require_value(i, argc, argv, arg, program);
        } else if (arg == "--shinobi-url") {
            config.catalog.base_url = require_value(i, argc, argv, arg, program);
        } else if (arg == "--perf-interval") {
            config.perf_interval_ms = parse_int_option(program, arg, require_value(i, argc, argv, arg, program),
                                                       100, std::numeric_limits<int>::max());
        } else if (arg == "--perf-json") {
            config.perf_json_path = require_value(i, argc, argv, arg, program);
        } else if (arg == "--log-level") {
            config.log_level = to_lower_copy(require_value(i, argc, argv, arg, program));
        } else {
            cli_error(program, arg, "Unknown option: " + arg);
        }
    }

    LogLevel level;
    if (!parseLogLevel(config.log_level, level)) {
        cli_error(program, "--log-level", "Invalid --log-level value: " + config.log_level);
    }
    std::string err;
    if (!validateConfig(config, err)) {
        cli_error(program, "--config", "Invalid configuration: " + err);
    }
    if (config.cameras.empty()) {
        cli_error(program, "--camera", "No cameras configured (use --config or --camera)");
    }
    return config;
}

/**
 * @brief Program entry: parse CLI, recover leftovers, run until signalled.
 */
int main(int argc, char* argv[]) {
    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler); // handle SSH session termination gracefully
    signal(SIGPIPE, SIG_IGN);

    ServerConfig config = parse_args(argc, argv);
    LogLevel level = LogLevel::Info;
    parseLogLevel(config.log_level, level);
    setLogLevel(level);

    std::cout << "camrec recording server\n"
              << "============================================\n"
              << "Cameras: " << config.cameras.size() << "\n"
              << "Recordings: " << config.recording.base_dir << "\n"
              << "Segment: " << config.recording.segment_duration << "s, pre-event "
              << config.recording.pre_event_buffer << "s, post-event "
              << config.recording.post_event_duration << "s, container " << config.recording.container << "\n"
              << "Catalog: " << (config.catalog.base_url.empty() ? "off" : config.catalog.base_url) << "\n"
              << "============================================\n" << std::endl;

    recoverIncomplete(config.recording.base_dir);

    Supervisor supervisor(config);
    EventDispatcher dispatcher(supervisor, config.dispatch);
    supervisor.setRemovalListener([&dispatcher](const std::string& id) { dispatcher.dropCamera(id); });
    if (!supervisor.start()) {
        std::cerr << "[ERROR] Failed to start supervisor" << std::endl;
        return 1;
    }

    std::unique_ptr<TriggerFifo> fifo;
    if (!config.trigger_fifo.empty()) {
        fifo = std::make_unique<TriggerFifo>(config.trigger_fifo, dispatcher);
        if (!fifo->start()) {
            std::cerr << "[WARN] Manual trigger channel disabled" << std::endl;
            fifo.reset();
        }
    }

    auto wall_t0 = std::chrono::steady_clock::now();
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << "\nStopping..." << std::endl;

    if (fifo) fifo->stop();
    ServerStatus final_status = supervisor.status();
    dispatcher.stop();
    supervisor.stop();

    auto wall_t1 = std::chrono::steady_clock::now();
    auto wall_s = std::chrono::duration_cast<std::chrono::seconds>(wall_t1 - wall_t0).count();
    std::cout << "\nDone after " << wall_s << "s. Events accepted: " << dispatcher.accepted()
              << ", duplicates: " << dispatcher.duplicates() << ", rejected: " << dispatcher.rejected() << std::endl;
    for (const auto& cam : final_status.cameras) {
        std::cout << "  " << cam.camera_id << ": packets " << cam.counters.packets_in
                  << ", reconnects " << cam.counters.reconnects
                  << ", health " << toString(cam.health) << std::endl;
    }
    return 0;
}
