/**
 * @file backup_service.hpp
 * @brief Backup orchestration for one database and one backup root.
 *
 * BackupService ties the connection resolver, the engine strategies, the catalog and the
 * retention planner together. It is an explicit component built from injected configuration,
 * so several independent instances (e.g. one per test) can coexist in one process.
 */

#ifndef BACKUP_SERVICE_HPP
#define BACKUP_SERVICE_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <future>
#include <expected>
#include "backup_catalog.hpp"
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "database_backup.hpp"
#include "retention_planner.hpp"

/**
 * @brief Main backup orchestration class.
 *
 * Create, restore, import and retention passes on the same backup root are serialized by one
 * mutex, so a scheduled backup can never race a manual restore. Listing and deleting do not
 * take the lock; they only touch the backup directory.
 */
class BackupService {
public:
    /**
     * @brief Constructs a service from a loaded configuration.
     *
     * Creates the backup root if needed and probes it for writability. Problems are logged,
     * never thrown.
     */
    explicit BackupService(BackupConfig config);

    /**
     * @brief Constructs a service from a JSON configuration file.
     *
     * @throws std::runtime_error If the configuration is invalid.
     */
    explicit BackupService(const std::string& configFile);

    /**
     * @brief Dumps the database into a new backup file, then applies retention.
     *
     * @return The new backup's filename, or DumpFailed / InvalidConnection.
     */
    std::expected<std::string, BackupError> createBackup();

    /**
     * @brief Lists backups newest first.
     */
    std::vector<BackupRecord> listBackups() const;

    /**
     * @brief Restores the database from the named backup.
     *
     * @return Nothing on success, or InvalidFilename, BackupNotFound, SanitizeIOFailure,
     * RestoreTimeout, RestoreFailed, InvalidConnection.
     */
    std::expected<void, BackupError> restoreBackup(const std::string& filename);

    /**
     * @brief Deletes the named backup.
     *
     * @return InvalidFilename or BackupNotFound when there is nothing to delete.
     */
    std::expected<void, BackupError> deleteBackup(const std::string& filename);

    /**
     * @brief Restores from a dump outside the backup root.
     *
     * The file is staged as "upload_<name>" in the backup root for the duration of the restore
     * and removed afterwards, whatever the outcome.
     */
    std::expected<void, BackupError> importBackup(const std::string& sourcePath);

    /**
     * @brief Runs one GFS retention pass over the catalog.
     */
    RetentionReport runRetention();

    /**
     * @brief Runs createBackup() on a worker thread.
     */
    std::future<std::expected<std::string, BackupError>> createBackupAsync();

    /**
     * @brief Runs restoreBackup() on a worker thread.
     */
    std::future<std::expected<void, BackupError>> restoreBackupAsync(const std::string& filename);

    /**
     * @brief Creates a backup every configured interval until stop() or SIGINT/SIGTERM.
     */
    void runDaemon();

    /**
     * @brief Asks a running daemon loop to exit at its next wake-up.
     */
    void stop();

private:
    void initBackupRoot();
    std::expected<std::unique_ptr<DatabaseBackupStrategy>, BackupError> makeStrategy() const;
    RetentionReport runRetentionLocked();

    BackupConfig config;     ///< Engine configuration.
    BackupCatalog catalog;   ///< Backup root listing.
    std::mutex operationMutex;
    std::atomic<bool> stopRequested{false};
};

#endif // BACKUP_SERVICE_HPP
