#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <cstdint>
#include <string>

namespace camrec {

/**
 * @file retention.hpp
 * @brief Age-based cleanup of finalized recordings and startup recovery.
 */

struct SweepStats {
    uint64_t scanned = 0;
    uint64_t deleted = 0;
    uint64_t kept = 0;
    uint64_t skipped = 0;     //!< Unreadable sidecars.
    uint64_t bytes_freed = 0;
    uint64_t dirs_removed = 0;
};

/**
 * @brief Delete continuous recordings whose end is older than @p max_age_days.
 *
 * Only finalized recordings (those with a sidecar) are considered. Event
 * recordings and recordings marked `keep` are never deleted. Empty
 * directories are pruned afterwards. With @p dry_run nothing is removed.
 */
SweepStats sweepRecordings(const std::string& base_dir, int max_age_days, bool dry_run, double now);

struct RecoveryStats {
    uint64_t tmp_removed = 0;
    uint64_t parts_preserved = 0;
    uint64_t orphans_preserved = 0;  //!< Videos whose sidecar rename never happened.
};

/**
 * @brief Clean up after a crash: remove `*.json.tmp`, rename `*.part` videos
 *        and videos without a sidecar to `*.incomplete.<ext>` so they are
 *        kept but never look finalized.
 */
RecoveryStats recoverIncomplete(const std::string& base_dir);

} // namespace camrec

#endif // RETENTION_HPP
