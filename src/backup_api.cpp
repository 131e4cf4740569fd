#include "backup_api.hpp"
#include "backup_service.hpp"
#include <ctime>
#include <format>
#include <fstream>
#include <memory>

std::expected<std::string, std::string> BackupAPI::startBackup(const std::string& configFile) {
    try {
        BackupService service(configFile);
        auto result = service.createBackup();
        if (!result) {
            return std::unexpected(result.error().message);
        }
        return *result;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to start backup: {}", e.what()));
    }
}

std::expected<Json::Value, std::string> BackupAPI::listBackups(const std::string& configFile) {
    try {
        BackupService service(configFile);
        Json::Value list(Json::arrayValue);
        for (const auto& record : service.listBackups()) {
            list.append(toJson(record));
        }
        return list;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to list backups: {}", e.what()));
    }
}

std::expected<void, std::string> BackupAPI::restoreBackup(const std::string& configFile, const std::string& filename) {
    try {
        BackupService service(configFile);
        auto result = service.restoreBackup(filename);
        if (!result) {
            return std::unexpected(result.error().message);
        }
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to restore backup: {}", e.what()));
    }
}

std::expected<void, std::string> BackupAPI::deleteBackup(const std::string& configFile, const std::string& filename) {
    try {
        BackupService service(configFile);
        auto result = service.deleteBackup(filename);
        if (!result) {
            return std::unexpected(result.error().message);
        }
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to delete backup: {}", e.what()));
    }
}

std::expected<void, std::string> BackupAPI::importBackup(const std::string& configFile, const std::string& sourcePath) {
    try {
        BackupService service(configFile);
        auto result = service.importBackup(sourcePath);
        if (!result) {
            return std::unexpected(result.error().message);
        }
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to import backup: {}", e.what()));
    }
}

std::expected<int, std::string> BackupAPI::cleanupBackups(const std::string& configFile) {
    try {
        BackupService service(configFile);
        return static_cast<int>(service.runRetention().deleted.size());
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to clean up backups: {}", e.what()));
    }
}

std::expected<void, std::string> BackupAPI::updateRetention(const std::string& configFile, const RetentionPolicy& policy) {
    if (policy.days < 0 || policy.weeks < 0 || policy.months < 0) {
        return std::unexpected("Retention thresholds must not be negative");
    }
    try {
        std::ifstream file(configFile);
        if (!file.is_open()) {
            return std::unexpected("Failed to open config file for reading: " + configFile);
        }
        Json::Value configJson;
        Json::Reader reader;
        if (!reader.parse(file, configJson)) {
            return std::unexpected("Failed to parse config file: " + configFile);
        }
        file.close();

        Json::Value retention(Json::objectValue);
        retention["days"] = policy.days;
        retention["weeks"] = policy.weeks;
        retention["months"] = policy.months;
        configJson["retention"] = retention;

        std::ofstream outFile(configFile);
        if (!outFile.is_open()) {
            return std::unexpected("Failed to open config file for writing: " + configFile);
        }
        Json::StreamWriterBuilder builder;
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(configJson, &outFile);
        outFile.close();

        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to update retention: {}", e.what()));
    }
}

Json::Value BackupAPI::toJson(const BackupRecord& record) {
    auto timeT = std::chrono::system_clock::to_time_t(record.createdAt);
    std::tm tmCreated{};
    localtime_r(&timeT, &tmCreated);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%dT%H:%M:%S", &tmCreated);

    Json::Value value(Json::objectValue);
    value["filename"] = record.filename;
    value["size"] = static_cast<Json::UInt64>(record.sizeBytes);
    value["created_at"] = timeBuf;
    return value;
}
