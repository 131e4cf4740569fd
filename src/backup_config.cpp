#include "backup_config.hpp"
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <mutex>
#include <print>
#include <stdexcept>

namespace {

std::mutex gLogMutex;

std::vector<std::string> readStringList(const Json::Value& list, std::vector<std::string> fallback) {
    if (!list.isArray()) {
        return fallback;
    }
    std::vector<std::string> values;
    for (const auto& item : list) {
        values.push_back(item.asString());
    }
    return values;
}

} // namespace

SanitizationRules SanitizationRules::defaults() {
    SanitizationRules rules;
    rules.versionSpecific = {
        "SET transaction_timeout",                   // PostgreSQL 17+
        "SET idle_in_transaction_session_timeout",
    };
    rules.metaCommands = {
        "\\restrict",
        "\\unrestrict",
    };
    return rules;
}

BackupConfig::BackupConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}", configFile));
    }
    load(configJson);
}

BackupConfig::BackupConfig(const Json::Value& configJson) {
    load(configJson);
}

void BackupConfig::load(const Json::Value& configJson) {
    backupBase = configJson.get("backup_base", "./backups/").asString();
    if (!backupBase.empty() && backupBase.back() != '/') {
        backupBase += '/';
    }

    std::string envUrl;
    if (const char* value = std::getenv("DATABASE_URL")) {
        envUrl = value;
    }
    databaseUrl = configJson.get("database_url", envUrl.empty() ? "sqlite:///./data/homepage.db" : envUrl).asString();

    const Json::Value& retentionJson = configJson["retention"];
    if (retentionJson.isObject()) {
        retention.days = retentionJson.get("days", retention.days).asInt();
        retention.weeks = retentionJson.get("weeks", retention.weeks).asInt();
        retention.months = retentionJson.get("months", retention.months).asInt();
    }
    if (retention.days < 0 || retention.weeks < 0 || retention.months < 0) {
        throw std::runtime_error(std::format("Invalid retention policy: days={}, weeks={}, months={}",
                                             retention.days, retention.weeks, retention.months));
    }

    const Json::Value& toolsJson = configJson["tools"];
    if (toolsJson.isObject()) {
        tools.pgDump = toolsJson.get("pg_dump", tools.pgDump).asString();
        tools.psql = toolsJson.get("psql", tools.psql).asString();
    }

    sanitizeRules = SanitizationRules::defaults();
    const Json::Value& sanitizeJson = configJson["sanitize"];
    if (sanitizeJson.isObject()) {
        sanitizeRules.versionSpecific = readStringList(sanitizeJson["version_specific"], sanitizeRules.versionSpecific);
        sanitizeRules.metaCommands = readStringList(sanitizeJson["meta_commands"], sanitizeRules.metaCommands);
    }

    int restoreSeconds = configJson.get("restore_timeout_seconds", 600).asInt();
    int drainSeconds = configJson.get("drain_timeout_seconds", 30).asInt();
    int intervalHours = configJson.get("backup_interval_hours", 24).asInt();
    if (restoreSeconds <= 0 || drainSeconds <= 0 || intervalHours <= 0) {
        throw std::runtime_error("Timeouts and backup interval must be positive");
    }
    restoreTimeout = std::chrono::seconds(restoreSeconds);
    drainTimeout = std::chrono::seconds(drainSeconds);
    backupInterval = std::chrono::hours(intervalHours);

    strictRestore = configJson.get("strict_restore", false).asBool();
    debug = configJson.get("debug", false).asBool();
    logFile = configJson.get("log_file", backupBase + "backup.log").asString();
    errorLogFile = configJson.get("error_log_file", backupBase + "errors.log").asString();
}

std::string BackupConfig::formatEntry(const std::string& level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    return level.empty()
        ? std::format("[{}] {}", timeBuf, message)
        : std::format("[{}] {}: {}", timeBuf, level, message);
}

void BackupConfig::appendToFile(const std::string& file, const std::string& logEntry) {
    if (file.empty()) {
        return;
    }
    std::ofstream log(file, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", file);
    }
}

void BackupConfig::logMessage(const std::string& message) const {
    std::string logEntry = formatEntry("", message);
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println("{}", logEntry);
    appendToFile(logFile, logEntry);
}

void BackupConfig::logWarning(const std::string& message) const {
    std::string logEntry = formatEntry("WARNING", message);
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println(stderr, "{}", logEntry);
    appendToFile(logFile, logEntry);
}

void BackupConfig::logError(const std::string& message) const {
    std::string logEntry = formatEntry("ERROR", message);
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println(stderr, "{}", logEntry);
    appendToFile(logFile, logEntry);
    appendToFile(errorLogFile, logEntry);
}

void BackupConfig::logDebug(const std::string& message) const {
    if (!debug) {
        return;
    }
    std::string logEntry = formatEntry("DEBUG", message);
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println("{}", logEntry);
    appendToFile(logFile, logEntry);
}
