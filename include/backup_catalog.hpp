/**
 * @file backup_catalog.hpp
 * @brief Enumeration and naming of backup files in the backup root.
 */

#ifndef BACKUP_CATALOG_HPP
#define BACKUP_CATALOG_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "backup_error.hpp"

/**
 * @brief One backup file. Identity is the filename.
 */
struct BackupRecord {
    std::string filename;
    std::uint64_t sizeBytes = 0;
    std::chrono::system_clock::time_point createdAt; ///< File modification time.
};

/**
 * @brief Flat directory of `backup_<YYYYMMDD_HHMMSS>.sql` files.
 *
 * Catalog reads never touch the database and need no coordination with running operations.
 */
class BackupCatalog {
public:
    static constexpr const char* kExtension = ".sql";
    static constexpr const char* kSanitizedSuffix = ".sanitized";

    explicit BackupCatalog(std::filesystem::path root);

    /**
     * @brief Lists backups newest first.
     *
     * Only regular files ending in ".sql" are reported. Entries whose metadata cannot be read are
     * skipped. A missing root yields an empty list.
     */
    std::vector<BackupRecord> list() const;

    /**
     * @brief Deletes the named backup.
     *
     * @return InvalidFilename for names leaving the root, BackupNotFound when absent or not a
     * ".sql" file, DeleteFailed when the file exists but cannot be removed.
     */
    std::expected<void, BackupError> remove(const std::string& filename) const;

    /**
     * @brief Resolves a backup name to its path, validating the name and the file's presence.
     *
     * Only names list() would report resolve. Other files in the root (logs, sanitized copies)
     * are BackupNotFound.
     */
    std::expected<std::filesystem::path, BackupError> locate(const std::string& filename) const;

    /**
     * @brief Generates the name of a backup taken at @p when (local time).
     *
     * If `backup_<stamp>.sql` already exists, `_1`, `_2`, ... are appended until the name is free.
     */
    std::string nextFilename(std::chrono::system_clock::time_point when) const;

    const std::filesystem::path& root() const { return root_; }

    /**
     * @brief Checks that @p filename is a plain, non-empty name without path components.
     */
    static bool isValidFilename(const std::string& filename);

private:
    std::filesystem::path root_;
};

#endif // BACKUP_CATALOG_HPP
