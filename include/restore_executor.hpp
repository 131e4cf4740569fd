/**
 * @file restore_executor.hpp
 * @brief Restore protocol states and restore-tool output classification.
 */

#ifndef RESTORE_EXECUTOR_HPP
#define RESTORE_EXECUTOR_HPP

#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Phases of a restore. Phases run strictly in order and are never retried.
 */
enum class RestoreStage {
    Pending,
    Verifying,
    Draining,
    Sanitizing,
    Restoring,
    Complete,
    Failed
};

std::string_view restoreStageName(RestoreStage stage);

/**
 * @brief stderr of the restore tool split into fatal and tolerable lines.
 */
struct RestoreDiagnostics {
    std::vector<std::string> errorLines;   ///< Lines containing "ERROR:".
    std::vector<std::string> warningLines; ///< Lines containing "WARNING:" or "NOTICE:" and no "ERROR:".

    bool hasFatal() const { return !errorLines.empty(); }
};

/**
 * @brief Classifies restore tool output line by line.
 */
RestoreDiagnostics classifyRestoreOutput(std::string_view stderrText);

#endif // RESTORE_EXECUTOR_HPP
