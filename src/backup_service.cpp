#include "backup_service.hpp"
#include "connection_resolver.hpp"
#include "scoped_file.hpp"
#include <chrono>
#include <csignal>
#include <ctime>
#include <format>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <system_error>

namespace fs = std::filesystem;

volatile std::sig_atomic_t gShutdownFlag = 0;

namespace {

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

std::string formatLocalTime(std::chrono::system_clock::time_point when) {
    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm tmWhen{};
    localtime_r(&timeT, &tmWhen);
    std::stringstream ss;
    ss << std::put_time(&tmWhen, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

BackupService::BackupService(BackupConfig config)
    : config(std::move(config)), catalog(this->config.backupBase) {
    initBackupRoot();
}

BackupService::BackupService(const std::string& configFile) : BackupService(BackupConfig(configFile)) {}

void BackupService::initBackupRoot() {
    const fs::path& root = catalog.root();
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        if (!fs::create_directories(root, ec) || ec) {
            config.logError(std::format("Failed to create backup directory {}: {}", root.string(), ec.message()));
            return;
        }
        config.logMessage(std::format("Created backup directory at {}", root.string()));
    }

    fs::path probe = root / ".write_probe";
    {
        std::ofstream probeFile(probe);
        probeFile << "probe";
        if (!probeFile) {
            config.logError(std::format("Backup directory {} is not writable", root.string()));
            return;
        }
    }
    if (!fs::remove(probe, ec) || ec) {
        config.logWarning(std::format("Could not remove write probe {}: {}", probe.string(), ec.message()));
    }
    config.logMessage(std::format("Backup directory {} is writable", root.string()));
    config.logMessage(std::format("Initialized backup service. Found {} existing backups.", catalog.list().size()));
}

std::expected<std::unique_ptr<DatabaseBackupStrategy>, BackupError> BackupService::makeStrategy() const {
    auto connection = resolveConnection(config.databaseUrl);
    if (!connection) {
        config.logError(std::format("Invalid database connection string: {}", connection.error().message));
        return std::unexpected(connection.error());
    }
    return makeBackupStrategy(*connection, config);
}

std::expected<std::string, BackupError> BackupService::createBackup() {
    std::lock_guard<std::mutex> lock(operationMutex);

    auto strategy = makeStrategy();
    if (!strategy) {
        return std::unexpected(strategy.error());
    }

    std::error_code ec;
    fs::create_directories(catalog.root(), ec);

    std::string filename = catalog.nextFilename(std::chrono::system_clock::now());
    fs::path destination = catalog.root() / filename;
    config.logMessage(std::format("[Backup] Starting {} backup to {}...", (*strategy)->engineName(), filename));

    auto dumped = (*strategy)->createDump(destination);
    if (!dumped) {
        return std::unexpected(dumped.error());
    }

    auto size = fs::file_size(destination, ec);
    config.logMessage(std::format("[Backup] Created {} ({} bytes)", filename, ec ? 0 : size));

    runRetentionLocked();
    return filename;
}

std::vector<BackupRecord> BackupService::listBackups() const {
    return catalog.list();
}

std::expected<void, BackupError> BackupService::restoreBackup(const std::string& filename) {
    auto path = catalog.locate(filename);
    if (!path) {
        config.logError(std::format("[Restore] {}", path.error().message));
        return std::unexpected(path.error());
    }

    std::lock_guard<std::mutex> lock(operationMutex);
    auto strategy = makeStrategy();
    if (!strategy) {
        return std::unexpected(strategy.error());
    }
    return (*strategy)->restore(*path);
}

std::expected<void, BackupError> BackupService::deleteBackup(const std::string& filename) {
    auto removed = catalog.remove(filename);
    if (!removed) {
        config.logWarning(std::format("[Backup] Could not delete {}: {}", filename, removed.error().message));
        return removed;
    }
    config.logMessage(std::format("[Backup] Deleted backup file: {}", filename));
    return {};
}

std::expected<void, BackupError> BackupService::importBackup(const std::string& sourcePath) {
    fs::path source(sourcePath);
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return std::unexpected(BackupError{BackupErrorKind::BackupNotFound,
                                           std::format("Import source not found: {}", sourcePath)});
    }

    std::lock_guard<std::mutex> lock(operationMutex);
    auto strategy = makeStrategy();
    if (!strategy) {
        return std::unexpected(strategy.error());
    }

    ScopedFile staged(catalog.root() / ("upload_" + source.filename().string()), config);
    fs::copy_file(source, staged.get(), fs::copy_options::overwrite_existing, ec);
    if (ec) {
        auto message = std::format("Could not stage {}: {}", sourcePath, ec.message());
        config.logError(std::format("[Import] {}", message));
        return std::unexpected(BackupError{BackupErrorKind::ImportFailed, message});
    }

    config.logMessage(std::format("[Import] Importing {}...", source.filename().string()));
    auto restored = (*strategy)->restore(staged.get());
    if (restored) {
        config.logMessage("[Import] Database imported successfully.");
    }
    return restored;
}

RetentionReport BackupService::runRetention() {
    std::lock_guard<std::mutex> lock(operationMutex);
    return runRetentionLocked();
}

RetentionReport BackupService::runRetentionLocked() {
    auto records = catalog.list();
    if (records.empty()) {
        return {};
    }
    config.logMessage(std::format("[Cleanup] Running retention cleanup (total backups: {})", records.size()));
    auto keep = planRetention(records, config.retention);
    auto report = applyRetention(keep, records, catalog, config);
    config.logMessage(std::format("[Cleanup] Kept {}, deleted {}, failed {}",
                                  report.kept.size(), report.deleted.size(), report.failed.size()));
    return report;
}

std::future<std::expected<std::string, BackupError>> BackupService::createBackupAsync() {
    return std::async(std::launch::async, [this] { return createBackup(); });
}

std::future<std::expected<void, BackupError>> BackupService::restoreBackupAsync(const std::string& filename) {
    return std::async(std::launch::async, [this, filename] { return restoreBackup(filename); });
}

void BackupService::stop() {
    stopRequested = true;
}

void BackupService::runDaemon() {
    struct sigaction sa{};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto shouldStop = [this] { return gShutdownFlag || stopRequested; };
    config.logMessage(std::format("Daemon mode started. Backups every {} hours. Check {} for logs.",
                                  config.backupInterval.count(), config.logFile));

    while (!shouldStop()) {
        auto nextBackup = std::chrono::system_clock::now() + config.backupInterval;
        config.logMessage(std::format("Next backup scheduled at {}", formatLocalTime(nextBackup)));

        while (!shouldStop() && std::chrono::system_clock::now() < nextBackup) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (shouldStop()) {
            break;
        }

        try {
            auto result = createBackup();
            if (!result) {
                config.logError(std::format("Scheduled backup failed: {}", describe(result.error())));
            } else {
                config.logMessage(std::format("Scheduled backup completed: {}", *result));
            }
        } catch (const std::exception& e) {
            config.logError(std::format("Daemon error: {}", e.what()));
        }
    }
    config.logMessage("Daemon shutting down gracefully");
}
