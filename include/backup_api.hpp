/**
 * @file backup_api.hpp
 * @brief High-level API for interacting with the dbvault backup engine.
 *
 * Provides a simplified interface for the HTTP layer and the command line: every call builds
 * the engine from a configuration file, runs one operation and reports the outcome as
 * std::expected with a human-readable message.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <string>
#include <expected>
#include <json/json.h>
#include "backup_catalog.hpp"
#include "backup_config.hpp"

/**
 * @brief API for managing backups.
 *
 * Serves as the primary entry point for external applications.
 */
class BackupAPI {
public:
    /**
     * @brief Creates a backup.
     *
     * @param configFile Path to the JSON configuration file.
     * @return The new backup's filename or an error message.
     */
    static std::expected<std::string, std::string> startBackup(const std::string& configFile);

    /**
     * @brief Lists backups as a JSON array of {filename, size, created_at} objects, newest first.
     */
    static std::expected<Json::Value, std::string> listBackups(const std::string& configFile);

    /**
     * @brief Restores the named backup.
     */
    static std::expected<void, std::string> restoreBackup(const std::string& configFile, const std::string& filename);

    /**
     * @brief Deletes the named backup.
     */
    static std::expected<void, std::string> deleteBackup(const std::string& configFile, const std::string& filename);

    /**
     * @brief Restores from a dump file outside the backup root.
     */
    static std::expected<void, std::string> importBackup(const std::string& configFile, const std::string& sourcePath);

    /**
     * @brief Runs one retention pass and returns the number of deleted backups.
     */
    static std::expected<int, std::string> cleanupBackups(const std::string& configFile);

    /**
     * @brief Updates the retention policy.
     *
     * Rewrites the "retention" object of the configuration file.
     *
     * @param configFile Path to the JSON configuration file.
     * @param policy New thresholds. Negative values are rejected.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> updateRetention(const std::string& configFile, const RetentionPolicy& policy);

    /**
     * @brief Converts a record to its JSON form ("created_at" in local ISO-8601).
     */
    static Json::Value toJson(const BackupRecord& record);
};

#endif // BACKUP_API_HPP
