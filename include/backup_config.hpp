/**
 * @file backup_config.hpp
 * @brief Configuration management for the dbvault backup engine.
 *
 * Defines the configuration class holding the backup root, the connection string, retention
 * thresholds, external tool paths and timeouts. Settings are loaded from a JSON file or an
 * already parsed JSON value, so tests can point the engine at temporary directories.
 *
 * @note The connection string may carry a password. It is stored here but never logged.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <string>
#include <vector>
#include <chrono>
#include <json/json.h>

/**
 * @brief Grandfather-Father-Son retention thresholds.
 */
struct RetentionPolicy {
    int days = 7;   ///< Number of most recent days keeping one backup each.
    int weeks = 4;  ///< Number of most recent ISO weeks keeping one backup each.
    int months = 6; ///< Number of most recent months keeping one backup each.
};

/**
 * @brief Paths of the external PostgreSQL client tools.
 */
struct ToolPaths {
    std::string pgDump = "pg_dump"; ///< Dump tool, looked up in PATH unless absolute.
    std::string psql = "psql";      ///< Restore and session-termination tool.
};

/**
 * @brief Line prefixes removed from dumps before they are replayed.
 */
struct SanitizationRules {
    std::vector<std::string> versionSpecific; ///< Server directives tied to one engine version.
    std::vector<std::string> metaCommands;    ///< Provider-proprietary client meta-commands.

    /**
     * @brief The built-in rule set for PostgreSQL 16/17 dumps and managed providers.
     */
    static SanitizationRules defaults();
};

/**
 * @brief Configuration class for the backup engine.
 *
 * Loads and manages settings, providing defaults and validation. Also owns the log sinks
 * used by every engine component.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is missing, unparsable or holds invalid values.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration instance from parsed JSON.
     *
     * @param configJson Configuration object. Missing keys take their defaults.
     * @throws std::runtime_error If a value is out of range.
     */
    explicit BackupConfig(const Json::Value& configJson);

    /**
     * @brief Logs a message to stdout and the configured log file.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a recoverable problem to stderr and the log file.
     *
     * @param message Warning message to log.
     */
    void logWarning(const std::string& message) const;

    /**
     * @brief Logs an error to stderr, the log file and the error log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Logs a diagnostic line when debug logging is enabled.
     */
    void logDebug(const std::string& message) const;

    std::string backupBase;                       ///< Directory holding backups (e.g., "/app/data/backups/").
    std::string databaseUrl;                      ///< Connection string. May embed a password.
    RetentionPolicy retention;                    ///< GFS retention thresholds.
    ToolPaths tools;                              ///< External tool paths.
    SanitizationRules sanitizeRules;              ///< Prefix rules applied before restores.
    std::chrono::seconds restoreTimeout{600};     ///< Wall-clock budget of the restore tool.
    std::chrono::seconds drainTimeout{30};        ///< Wall-clock budget of the session-termination command.
    std::chrono::hours backupInterval{24};        ///< Interval between scheduled backups in daemon mode.
    bool strictRestore = false;                   ///< Treat any non-zero restore exit as fatal.
    bool debug = false;                           ///< Enables logDebug output.
    std::string logFile;                          ///< Path to the log file.
    std::string errorLogFile;                     ///< Path to the error log file.

private:
    void load(const Json::Value& configJson);
    static std::string formatEntry(const std::string& level, const std::string& message);
    static void appendToFile(const std::string& file, const std::string& logEntry);
};

#endif // BACKUP_CONFIG_HPP
