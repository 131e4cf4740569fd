#include "database_backup.hpp"
#include "backup_catalog.hpp"
#include "sanitizer.hpp"
#include "scoped_file.hpp"
#include "subprocess.hpp"
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

void removePartial(const fs::path& path, const BackupConfig& config) {
    std::error_code ec;
    if (fs::exists(path, ec) && !fs::remove(path, ec)) {
        config.logWarning(std::format("[Backup] Could not remove partial backup {}: {}", path.string(), ec.message()));
    }
}

std::string firstLine(const std::string& text) {
    auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

std::string quoteLiteral(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += '\'';
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string joinFirst(const std::vector<std::string>& lines, std::size_t count) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size() && i < count; ++i) {
        if (!joined.empty()) {
            joined += " | ";
        }
        joined += lines[i];
    }
    return joined;
}

} // namespace

SQLiteBackupStrategy::SQLiteBackupStrategy(std::string databasePath, const BackupConfig& config)
    : databasePath(std::move(databasePath)), config(config) {}

std::expected<void, BackupError> SQLiteBackupStrategy::createDump(const fs::path& destination) {
    std::error_code ec;
    fs::copy_file(databasePath, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        removePartial(destination, config);
        auto message = std::format("SQLite backup failed: {}", ec.message());
        config.logError(std::format("[Backup] {}", message));
        return std::unexpected(BackupError{BackupErrorKind::DumpFailed, message});
    }
    config.logMessage("[Backup] SQLite backup completed via file copy");
    return {};
}

std::expected<void, BackupError> SQLiteBackupStrategy::restore(const fs::path& backupFile) {
    std::error_code ec;
    if (!fs::is_regular_file(backupFile, ec)) {
        return std::unexpected(BackupError{BackupErrorKind::BackupNotFound,
                                           std::format("Backup file not found: {}", backupFile.filename().string())});
    }
    fs::copy_file(backupFile, databasePath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        auto message = std::format("SQLite restore failed: {}", ec.message());
        config.logError(std::format("[Restore] {}", message));
        return std::unexpected(BackupError{BackupErrorKind::RestoreFailed, message});
    }
    config.logMessage("[Restore] SQLite restoration completed");
    return {};
}

PostgreSQLBackupStrategy::PostgreSQLBackupStrategy(ResolvedConnection connection, const BackupConfig& config)
    : connection(std::move(connection)), config(config) {}

std::map<std::string, std::string> PostgreSQLBackupStrategy::childEnvironment() const {
    std::map<std::string, std::string> env;
    if (connection.secret) {
        env["PGPASSWORD"] = *connection.secret;
    }
    return env;
}

std::expected<void, BackupError> PostgreSQLBackupStrategy::createDump(const fs::path& destination) {
    const auto& params = connection.params;
    config.logDebug(std::format("[DB] Prepared connection: host={}, port={}, db={}, user={}",
                                params.host, params.port, params.database, params.username));

    ProcessSpec spec;
    spec.argv = {
        config.tools.pgDump,
        "--dbname=" + connection.cleanUrl,
        "--file=" + destination.string(),
        "--no-owner",
        "--no-acl",
        "--clean",
        "--if-exists",
        "--no-comments",
    };
    spec.extraEnv = childEnvironment();

    auto result = runProcess(spec);
    if (!result) {
        removePartial(destination, config);
        config.logError(std::format("[Backup] Could not start pg_dump: {}", result.error()));
        return std::unexpected(BackupError{BackupErrorKind::DumpFailed,
                                           std::format("Backup failed: {}", result.error())});
    }

    config.logDebug(std::format("[Backup] pg_dump finished: exit={}, stdout={} bytes, stderr={} bytes",
                                result->exitCode, result->stdoutText.size(), result->stderrText.size()));
    if (result->exitCode != 0) {
        removePartial(destination, config);
        config.logError(std::format("[Backup] pg_dump failed (code {}): {}", result->exitCode, firstLine(result->stderrText)));
        return std::unexpected(BackupError{BackupErrorKind::DumpFailed,
                                           std::format("Backup failed: {}", result->stderrText)});
    }

    config.logMessage("[Backup] PostgreSQL backup completed successfully");
    return {};
}

// Restore runs verify, drain, sanitize and replay in order. The sanitized copy lives next to
// the backup as "<backup>.sanitized" and a ScopedFile removes it on every exit path.
void PostgreSQLBackupStrategy::enterStage(RestoreStage next) {
    config.logDebug(std::format("[Restore] {} -> {}", restoreStageName(stage), restoreStageName(next)));
    stage = next;
}

std::expected<void, BackupError> PostgreSQLBackupStrategy::restore(const fs::path& backupFile) {
    stage = RestoreStage::Pending;
    std::string displayName = backupFile.filename().string();

    auto fail = [this](BackupError error) -> std::expected<void, BackupError> {
        enterStage(RestoreStage::Failed);
        return std::unexpected(std::move(error));
    };

    enterStage(RestoreStage::Verifying);
    std::error_code ec;
    if (!fs::is_regular_file(backupFile, ec)) {
        config.logError(std::format("[Restore] File not found: {}", backupFile.string()));
        return fail(BackupError{BackupErrorKind::BackupNotFound, std::format("Backup file not found: {}", displayName)});
    }
    config.logMessage(std::format("[Restore] Starting restoration from {}...", displayName));

    fs::path sanitizedPath = backupFile;
    sanitizedPath += BackupCatalog::kSanitizedSuffix;
    ScopedFile sanitizedGuard(sanitizedPath, config);

    enterStage(RestoreStage::Draining);
    drainConnections();

    enterStage(RestoreStage::Sanitizing);
    config.logMessage("[Restore] Sanitizing SQL file for cross-version compatibility...");
    auto stats = sanitizeDump(backupFile, sanitizedPath, config.sanitizeRules);
    if (!stats) {
        config.logError(std::format("[Restore] Sanitization failed: {}", stats.error().message));
        return fail(stats.error());
    }
    config.logMessage(std::format("[Restore] Sanitization complete: {} lines filtered from {} total",
                                  stats->linesFiltered, stats->linesTotal));

    enterStage(RestoreStage::Restoring);
    auto restored = executeRestore(sanitizedPath, displayName);
    if (!restored) {
        return fail(restored.error());
    }

    enterStage(RestoreStage::Complete);
    config.logMessage(std::format("[Restore] PostgreSQL restore completed successfully for {}", displayName));
    return {};
}

void PostgreSQLBackupStrategy::drainConnections() {
    std::string_view drainWarning = errorKindName(BackupErrorKind::ConnectionDrainWarning);
    const std::string& dbName = connection.params.database;
    config.logMessage(std::format("[Restore] Terminating existing connections to {}...", dbName));

    ProcessSpec spec;
    spec.argv = {
        config.tools.psql,
        "--dbname=" + connection.cleanUrl,
        "-c",
        std::format("SELECT pg_terminate_backend(pid) FROM pg_stat_activity WHERE datname = {} AND pid <> pg_backend_pid();",
                    quoteLiteral(dbName)),
    };
    spec.extraEnv = childEnvironment();
    spec.timeout = config.drainTimeout;

    auto result = runProcess(spec);
    if (!result) {
        config.logWarning(std::format("[Restore] {}: could not start psql: {}", drainWarning, result.error()));
    } else if (result->timedOut) {
        config.logWarning(std::format("[Restore] {}: session termination timed out after {}s",
                                      drainWarning, config.drainTimeout.count()));
    } else if (result->exitCode != 0) {
        config.logWarning(std::format("[Restore] {}: {}", drainWarning, result->stderrText));
    } else {
        config.logMessage("[Restore] Connections terminated successfully");
    }
}

std::expected<void, BackupError> PostgreSQLBackupStrategy::executeRestore(const fs::path& sanitizedFile,
                                                                          const std::string& displayName) {
    config.logMessage(std::format("[Restore] Executing psql restore for {}...", displayName));

    // No ON_ERROR_STOP: cross-version restores emit expected non-fatal errors.
    ProcessSpec spec;
    spec.argv = {
        config.tools.psql,
        "--dbname=" + connection.cleanUrl,
        "--file=" + sanitizedFile.string(),
    };
    spec.extraEnv = childEnvironment();
    spec.timeout = config.restoreTimeout;

    auto result = runProcess(spec);
    if (!result) {
        config.logError(std::format("[Restore] Could not start psql: {}", result.error()));
        return std::unexpected(BackupError{BackupErrorKind::RestoreFailed,
                                           std::format("Database restore error: {}", result.error())});
    }
    if (result->timedOut) {
        config.logError(std::format("[Restore] psql restore timed out after {} seconds", config.restoreTimeout.count()));
        return std::unexpected(BackupError{BackupErrorKind::RestoreTimeout,
                                           "Restore timed out. The database might be too large."});
    }

    if (!result->stdoutText.empty()) {
        config.logDebug(std::format("[Restore] psql stdout: {}", result->stdoutText.substr(0, 500)));
    }

    RestoreDiagnostics diagnostics = classifyRestoreOutput(result->stderrText);
    if (!diagnostics.errorLines.empty()) {
        config.logError(std::format("[Restore] psql errors ({}): {}", diagnostics.errorLines.size(),
                                    joinFirst(diagnostics.errorLines, 3)));
    }
    if (!diagnostics.warningLines.empty()) {
        config.logWarning(std::format("[Restore] psql warnings ({}): {}", diagnostics.warningLines.size(),
                                      joinFirst(diagnostics.warningLines, 3)));
    }

    if (result->exitCode == 0) {
        return {};
    }
    if (diagnostics.hasFatal()) {
        const std::string& firstError = diagnostics.errorLines.front();
        config.logError(std::format("[Restore] Critical error during restore: {}", firstError));
        return std::unexpected(BackupError{BackupErrorKind::RestoreFailed, firstError});
    }
    if (config.strictRestore) {
        auto message = std::format("psql exited with code {}", result->exitCode);
        config.logError(std::format("[Restore] {} (strict mode)", message));
        return std::unexpected(BackupError{BackupErrorKind::RestoreFailed, message});
    }
    config.logWarning(std::format("[Restore] psql returned {} but no critical errors found", result->exitCode));
    return {};
}

std::unique_ptr<DatabaseBackupStrategy> makeBackupStrategy(const ResolvedConnection& connection,
                                                           const BackupConfig& config) {
    switch (connection.params.engine) {
        case DatabaseEngine::SQLite:
            return std::make_unique<SQLiteBackupStrategy>(connection.params.database, config);
        case DatabaseEngine::PostgreSQL:
            return std::make_unique<PostgreSQLBackupStrategy>(connection, config);
    }
    return nullptr;
}
