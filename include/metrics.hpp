#ifndef METRICS_HPP
#define METRICS_HPP

#include "types.hpp"
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace camrec {

/**
 * @file metrics.hpp
 * @brief Declares the JSONL metrics writer used by the supervisor.
 *
 * The supervisor's metrics thread samples every camera at a fixed cadence
 * and appends one record per camera. Each line is flushed so records can be
 * tailed while the server runs.
 */

/**
 * @brief Writes per-camera status samples into a JSON Lines file.
 * @threading Safe for concurrent calls; guards with an internal mutex.
 * @lifecycle Construct once per server when `--perf-json` is provided.
 */
class JSONLMetricsWriter {
public:
    /**
     * @brief Open output file for append.
     * @param path Destination JSONL file path (created if missing).
     */
    explicit JSONLMetricsWriter(const std::string& path);
    ~JSONLMetricsWriter();

    bool isOpen() const { return ofs_.is_open(); }

    /**
     * @brief Append one camera sample as a single JSON line.
     * @param ts_ms Sample time, epoch milliseconds.
     * @param status Camera status including its counters.
     * @param interval_s Seconds covered by the rates.
     * @param packets_per_sec Ingest packet rate over the interval.
     * @param bytes_per_sec Ingest byte rate over the interval.
     */
    void write(int64_t ts_ms, const CameraStatus& status, double interval_s,
               double packets_per_sec, double bytes_per_sec);

private:
    std::ofstream ofs_; //!< Owned JSONL stream.
    std::mutex mu_;     //!< Protects interleaved write() calls.
};

} // namespace camrec

#endif // METRICS_HPP
