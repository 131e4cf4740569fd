/**
 * @file retention_planner.hpp
 * @brief Grandfather-Father-Son retention of backup files.
 *
 * Backups are grouped by local calendar day, ISO week and month. The newest backup of each of
 * the most recent N days, weeks and months is kept, plus the newest backup overall. Everything
 * else is deleted. Buckets are recomputed on every pass.
 */

#ifndef RETENTION_PLANNER_HPP
#define RETENTION_PLANNER_HPP

#include <set>
#include <string>
#include <vector>
#include "backup_catalog.hpp"
#include "backup_config.hpp"

/**
 * @brief Outcome of applying a keep set.
 */
struct RetentionReport {
    std::vector<std::string> kept;
    std::vector<std::string> deleted;
    std::vector<std::string> failed; ///< Names whose deletion failed. Logged, not fatal.
};

/**
 * @brief Bucket keys of a timestamp in local time.
 */
std::string dayBucket(std::chrono::system_clock::time_point when);   ///< "YYYY-MM-DD"
std::string weekBucket(std::chrono::system_clock::time_point when);  ///< "YYYY-WW" (ISO year and week)
std::string monthBucket(std::chrono::system_clock::time_point when); ///< "YYYY-MM"

/**
 * @brief Computes the names to keep under @p policy.
 *
 * @param records Backups in any order.
 * @param policy Number of day, week and month buckets to retain.
 * @return Names to keep. Contains the newest record even when every threshold is zero.
 */
std::set<std::string> planRetention(const std::vector<BackupRecord>& records, const RetentionPolicy& policy);

/**
 * @brief Deletes every record absent from @p keep.
 *
 * A failed deletion is logged as a warning and the pass continues with the remaining files.
 */
RetentionReport applyRetention(const std::set<std::string>& keep,
                               const std::vector<BackupRecord>& records,
                               const BackupCatalog& catalog,
                               const BackupConfig& config);

#endif // RETENTION_PLANNER_HPP
