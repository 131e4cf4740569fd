/**
 * @file database_backup.hpp
 * @brief Database backup strategies for dbvault.
 *
 * Provides the dump/restore capability interface and one implementation per supported engine.
 * The strategy is chosen once, from the resolved connection string.
 *
 * @note The PostgreSQL strategy requires pg_dump and psql (paths configurable).
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <string>
#include <string_view>
#include <map>
#include <memory>
#include <expected>
#include <filesystem>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "connection_resolver.hpp"
#include "restore_executor.hpp"

/**
 * @brief Interface for database backup strategies.
 *
 * Defines the contract for dumping a database to a single file and replaying such a file.
 */
class DatabaseBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseBackupStrategy() = default;

    /**
     * @brief Writes a complete dump of the database to @p destination.
     *
     * @param destination Path of the new backup file.
     * @return Nothing on success, DumpFailed otherwise. No partial file is left behind on failure.
     */
    virtual std::expected<void, BackupError> createDump(const std::filesystem::path& destination) = 0;

    /**
     * @brief Replays @p backupFile against the database.
     *
     * @param backupFile Existing backup file.
     * @return Nothing on success, or BackupNotFound, SanitizeIOFailure, RestoreTimeout, RestoreFailed.
     */
    virtual std::expected<void, BackupError> restore(const std::filesystem::path& backupFile) = 0;

    /**
     * @brief Short engine name used in log lines.
     */
    virtual std::string_view engineName() const = 0;
};

/**
 * @brief SQLite strategy: backups and restores are plain file copies.
 */
class SQLiteBackupStrategy : public DatabaseBackupStrategy {
public:
    /**
     * @brief Constructs a SQLite backup strategy.
     *
     * @param databasePath Absolute path of the database file.
     * @param config Engine configuration, used for logging.
     */
    SQLiteBackupStrategy(std::string databasePath, const BackupConfig& config);

    std::expected<void, BackupError> createDump(const std::filesystem::path& destination) override;
    std::expected<void, BackupError> restore(const std::filesystem::path& backupFile) override;
    std::string_view engineName() const override { return "SQLite"; }

private:
    std::string databasePath; ///< Live database file.
    const BackupConfig& config;
};

/**
 * @brief PostgreSQL strategy using pg_dump for backups and psql for restores.
 *
 * The password, if any, reaches the tools only through PGPASSWORD in their environment.
 */
class PostgreSQLBackupStrategy : public DatabaseBackupStrategy {
public:
    /**
     * @brief Constructs a PostgreSQL backup strategy.
     *
     * @param connection Resolved connection (clean URL plus isolated secret).
     * @param config Engine configuration: tool paths, timeouts, sanitization rules.
     */
    PostgreSQLBackupStrategy(ResolvedConnection connection, const BackupConfig& config);

    /**
     * @brief Runs pg_dump with portability flags.
     *
     * Uses --no-owner, --no-acl, --clean --if-exists and --no-comments so the dump restores on
     * another server version without ownership, privilege or version-comment noise.
     */
    std::expected<void, BackupError> createDump(const std::filesystem::path& destination) override;

    /**
     * @brief Verifies, drains sessions, sanitizes and replays the dump with psql.
     *
     * The sanitized temporary file is removed on every exit path.
     */
    std::expected<void, BackupError> restore(const std::filesystem::path& backupFile) override;

    std::string_view engineName() const override { return "PostgreSQL"; }

    /**
     * @brief Stage reached by the most recent restore.
     */
    RestoreStage lastRestoreStage() const { return stage; }

private:
    void enterStage(RestoreStage next);
    void drainConnections();
    std::expected<void, BackupError> executeRestore(const std::filesystem::path& sanitizedFile,
                                                    const std::string& displayName);
    std::map<std::string, std::string> childEnvironment() const;

    ResolvedConnection connection;
    const BackupConfig& config;
    RestoreStage stage = RestoreStage::Pending;
};

/**
 * @brief Creates the strategy matching the engine of @p connection.
 */
std::unique_ptr<DatabaseBackupStrategy> makeBackupStrategy(const ResolvedConnection& connection,
                                                           const BackupConfig& config);

#endif // DATABASE_BACKUP_HPP
