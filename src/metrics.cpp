#include "metrics.hpp"
#include <iostream>

/**
 * @file metrics.cpp
 * @brief JSONL metrics writer implementation.
 */

namespace camrec {

/**
 * @brief Open JSONL file for append; parent directories should exist already.
 */
JSONLMetricsWriter::JSONLMetricsWriter(const std::string& path) {
    ofs_.open(path, std::ios::out | std::ios::app);
    if (!ofs_.is_open()) {
        std::cerr << "[WARN] [metrics] cannot open " << path << ", JSONL output disabled" << std::endl;
    }
}

JSONLMetricsWriter::~JSONLMetricsWriter() {
    if (ofs_.is_open()) ofs_.close();
}

/**
 * @brief Serialize one camera sample; the status fields keep their names.
 */
void JSONLMetricsWriter::write(int64_t ts_ms, const CameraStatus& status, double interval_s,
                               double packets_per_sec, double bytes_per_sec) {
    if (!ofs_.is_open()) return;
    nlohmann::json line = toJson(status);
    line["ts_ms"] = ts_ms;
    line["interval_s"] = interval_s;
    line["in_pps"] = packets_per_sec;
    line["in_kbps"] = bytes_per_sec * 8.0 / 1000.0;

    std::lock_guard<std::mutex> lock(mu_);
    ofs_ << line.dump() << '\n';
    ofs_.flush();
}

} // namespace camrec
