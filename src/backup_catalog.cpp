#include "backup_catalog.hpp"
#include <algorithm>
#include <ctime>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

BackupCatalog::BackupCatalog(fs::path root) : root_(std::move(root)) {}

bool BackupCatalog::isValidFilename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    return filename.find('/') == std::string::npos
        && filename.find('\\') == std::string::npos
        && filename.find("..") == std::string::npos
        && filename.find('\0') == std::string::npos;
}

std::vector<BackupRecord> BackupCatalog::list() const {
    std::vector<BackupRecord> records;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return records;
    }

    for (auto it = fs::directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        if (!name.ends_with(kExtension)) {
            continue;
        }

        std::error_code statEc;
        if (!entry.is_regular_file(statEc) || statEc) {
            continue;
        }
        auto size = entry.file_size(statEc);
        if (statEc) {
            continue;
        }
        auto lastWrite = entry.last_write_time(statEc);
        if (statEc) {
            continue;
        }

        BackupRecord record;
        record.filename = std::move(name);
        record.sizeBytes = static_cast<std::uint64_t>(size);
        record.createdAt = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(lastWrite));
        records.push_back(std::move(record));
    }

    std::sort(records.begin(), records.end(), [](const BackupRecord& a, const BackupRecord& b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt > b.createdAt;
        }
        return a.filename > b.filename;
    });
    return records;
}

std::expected<fs::path, BackupError> BackupCatalog::locate(const std::string& filename) const {
    if (!isValidFilename(filename)) {
        return std::unexpected(BackupError{BackupErrorKind::InvalidFilename,
                                           std::format("Invalid backup name: {}", filename)});
    }
    fs::path path = root_ / filename;
    std::error_code ec;
    if (!filename.ends_with(kExtension) || !fs::is_regular_file(path, ec)) {
        return std::unexpected(BackupError{BackupErrorKind::BackupNotFound,
                                           std::format("Backup file not found: {}", filename)});
    }
    return path;
}

std::expected<void, BackupError> BackupCatalog::remove(const std::string& filename) const {
    auto path = locate(filename);
    if (!path) {
        return std::unexpected(path.error());
    }
    std::error_code ec;
    if (!fs::remove(*path, ec) || ec) {
        return std::unexpected(BackupError{BackupErrorKind::DeleteFailed,
                                           std::format("Failed to delete {}: {}", filename, ec.message())});
    }
    return {};
}

std::string BackupCatalog::nextFilename(std::chrono::system_clock::time_point when) const {
    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm tmWhen{};
    localtime_r(&timeT, &tmWhen);
    char stampBuf[32];
    std::strftime(stampBuf, sizeof(stampBuf), "%Y%m%d_%H%M%S", &tmWhen);

    std::string filename = std::format("backup_{}{}", stampBuf, kExtension);
    std::error_code ec;
    for (int suffix = 1; fs::exists(root_ / filename, ec); ++suffix) {
        filename = std::format("backup_{}_{}{}", stampBuf, suffix, kExtension);
    }
    return filename;
}
