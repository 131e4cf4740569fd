/**
 * @file backup_error.hpp
 * @brief Error kinds reported by the dbvault backup engine.
 *
 * Every fallible operation returns std::expected<T, BackupError>. The kind tells the caller
 * whether the whole operation was aborted or whether the condition was only worth a log line.
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <string>
#include <string_view>

/**
 * @brief Classification of backup engine failures.
 */
enum class BackupErrorKind {
    DumpFailed,             ///< Dump tool exited non-zero or the copy failed.
    BackupNotFound,         ///< Named backup does not exist in the backup root.
    SanitizeIOFailure,      ///< Disk error while filtering a dump.
    ConnectionDrainWarning, ///< Terminating other sessions failed. Logged only.
    RestoreTimeout,         ///< Restore tool was killed after its wall-clock budget.
    RestoreFailed,          ///< Restore tool reported a fatal error.
    CleanupWarning,         ///< A stale temp file or an old backup could not be removed. Logged only.
    InvalidConnection,      ///< Connection string could not be parsed.
    InvalidFilename,        ///< Backup name escapes the backup root or is empty.
    ImportFailed,           ///< External dump could not be staged for import.
    DeleteFailed            ///< An existing backup file could not be removed.
};

/**
 * @brief An error kind with a human-readable message.
 */
struct BackupError {
    BackupErrorKind kind;
    std::string message;
};

/**
 * @brief Returns the stable name of an error kind (e.g. "RestoreTimeout").
 */
std::string_view errorKindName(BackupErrorKind kind);

/**
 * @brief True for kinds that abort the operation they occur in.
 *
 * ConnectionDrainWarning and CleanupWarning are logged where they occur and never leave
 * the engine's public operations.
 */
bool isFatal(BackupErrorKind kind);

/**
 * @brief Formats an error as "<Kind>: <message>".
 */
std::string describe(const BackupError& error);

#endif // BACKUP_ERROR_HPP
