#include "retention_planner.hpp"
#include <algorithm>
#include <ctime>
#include <format>
#include <functional>
#include <map>

namespace {

std::string formatLocal(std::chrono::system_clock::time_point when, const char* pattern) {
    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm tmWhen{};
    localtime_r(&timeT, &tmWhen);
    char buf[32];
    std::strftime(buf, sizeof(buf), pattern, &tmWhen);
    return buf;
}

using Buckets = std::map<std::string, std::vector<std::string>, std::greater<>>;

void keepNewestOfRecentBuckets(const Buckets& buckets, int count, std::set<std::string>& keep) {
    int taken = 0;
    for (const auto& [key, filenames] : buckets) {
        if (taken++ >= count) {
            break;
        }
        keep.insert(filenames.front());
    }
}

} // namespace

std::string dayBucket(std::chrono::system_clock::time_point when) {
    return formatLocal(when, "%Y-%m-%d");
}

std::string weekBucket(std::chrono::system_clock::time_point when) {
    return formatLocal(when, "%G-%V");
}

std::string monthBucket(std::chrono::system_clock::time_point when) {
    return formatLocal(when, "%Y-%m");
}

std::set<std::string> planRetention(const std::vector<BackupRecord>& records, const RetentionPolicy& policy) {
    std::set<std::string> keep;
    if (records.empty()) {
        return keep;
    }

    std::vector<BackupRecord> sorted = records;
    std::stable_sort(sorted.begin(), sorted.end(), [](const BackupRecord& a, const BackupRecord& b) {
        return a.createdAt > b.createdAt;
    });

    Buckets daily;
    Buckets weekly;
    Buckets monthly;
    for (const auto& record : sorted) {
        daily[dayBucket(record.createdAt)].push_back(record.filename);
        weekly[weekBucket(record.createdAt)].push_back(record.filename);
        monthly[monthBucket(record.createdAt)].push_back(record.filename);
    }

    keepNewestOfRecentBuckets(daily, policy.days, keep);
    keepNewestOfRecentBuckets(weekly, policy.weeks, keep);
    keepNewestOfRecentBuckets(monthly, policy.months, keep);

    keep.insert(sorted.front().filename);
    return keep;
}

RetentionReport applyRetention(const std::set<std::string>& keep,
                               const std::vector<BackupRecord>& records,
                               const BackupCatalog& catalog,
                               const BackupConfig& config) {
    RetentionReport report;
    for (const auto& record : records) {
        if (keep.contains(record.filename)) {
            report.kept.push_back(record.filename);
            continue;
        }
        auto removed = catalog.remove(record.filename);
        if (removed) {
            report.deleted.push_back(record.filename);
            config.logMessage(std::format("[Cleanup] Deleted redundant backup: {}", record.filename));
        } else {
            report.failed.push_back(record.filename);
            config.logWarning(std::format("[Cleanup] {}: failed to delete {}: {}",
                                          errorKindName(BackupErrorKind::CleanupWarning), record.filename,
                                          removed.error().message));
        }
    }
    return report;
}
