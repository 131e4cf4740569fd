/**
 * @file scoped_file.hpp
 * @brief Ownership of transient files that must not outlive an operation.
 */

#ifndef SCOPED_FILE_HPP
#define SCOPED_FILE_HPP

#include <filesystem>
#include <format>
#include <system_error>
#include "backup_config.hpp"
#include "backup_error.hpp"

/**
 * @brief Removes a file when the owning scope ends, on every exit path.
 *
 * A failed removal is logged as a CleanupWarning and never propagated.
 */
class ScopedFile {
public:
    ScopedFile(std::filesystem::path path, const BackupConfig& config) : path(std::move(path)), config(config) {}
    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    ~ScopedFile() {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return;
        }
        if (!std::filesystem::remove(path, ec) || ec) {
            config.logWarning(std::format("{}: could not remove {}: {}", errorKindName(BackupErrorKind::CleanupWarning),
                                          path.string(), ec.message()));
        }
    }

    const std::filesystem::path& get() const { return path; }

private:
    std::filesystem::path path;
    const BackupConfig& config;
};

#endif // SCOPED_FILE_HPP
