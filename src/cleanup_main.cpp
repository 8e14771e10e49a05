#include "config.hpp"
#include "retention.hpp"
#include "types.hpp"
#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <string>

/**
 * @file cleanup_main.cpp
 * @brief One-shot retention sweep over a recordings tree.
 */

using namespace camrec;

namespace {

constexpr int kCliUserError = 2;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --base-dir path     Recordings root (default: from --config or ./recordings)\n"
              << "  --max-age days      Delete continuous segments older than this (default: 7)\n"
              << "  --dry-run           Report what would be deleted\n"
              << "  --config path       Read base_dir from a server config file\n"
              << "  --help              Show this help\n";
}

[[noreturn]] void cli_error(const char* program, const std::string& message) {
    std::cerr << message << std::endl;
    print_usage(program);
    std::exit(kCliUserError);
}

} // namespace

int main(int argc, char* argv[]) {
    const char* program = argv[0];
    ServerConfig config;
    std::string base_dir;
    int max_age = 7;
    bool dry_run = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) cli_error(program, "Missing value for " + arg);
            return argv[++i];
        };
        if (arg == "--help" || arg == "-h") {
            print_usage(program);
            return 0;
        } else if (arg == "--base-dir") {
            base_dir = value();
        } else if (arg == "--max-age") {
            std::string v = value();
            try {
                size_t idx = 0;
                max_age = std::stoi(v, &idx);
                if (idx != v.size() || max_age < 0) throw std::invalid_argument(v);
            } catch (const std::exception&) {
                cli_error(program, "Invalid --max-age: " + v);
            }
        } else if (arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "--config") {
            std::string err;
            if (!loadConfigFile(value(), config, err)) cli_error(program, err);
        } else {
            cli_error(program, "Unknown option: " + arg);
        }
    }
    if (base_dir.empty()) base_dir = config.recording.base_dir;

    std::cout << "[INFO] [retention] sweeping " << base_dir << " (max age " << max_age << " days"
              << (dry_run ? ", dry run" : "") << ")" << std::endl;
    SweepStats stats = sweepRecordings(base_dir, max_age, dry_run, systemWallClock());
    std::cout << "Scanned: " << stats.scanned << ", deleted: " << stats.deleted << ", kept: " << stats.kept
              << ", skipped: " << stats.skipped << ", freed: " << stats.bytes_freed << " bytes"
              << ", empty dirs: " << stats.dirs_removed << std::endl;
    return 0;
}
