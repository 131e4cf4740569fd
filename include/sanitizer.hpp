/**
 * @file sanitizer.hpp
 * @brief Cross-version clean-up of SQL dumps before they are replayed.
 *
 * Dumps are handled as opaque bytes. Column data may hold arbitrary binary sequences, so no
 * text decoding is ever attempted.
 */

#ifndef SANITIZER_HPP
#define SANITIZER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <expected>
#include <filesystem>
#include "backup_config.hpp"
#include "backup_error.hpp"

/**
 * @brief Line counts of one sanitization pass.
 */
struct SanitizeStats {
    std::uint64_t linesTotal = 0;
    std::uint64_t linesFiltered = 0;
};

/**
 * @brief Returns true when @p line, stripped of surrounding ASCII whitespace, starts with a rule prefix.
 */
bool matchesSanitizationRule(std::string_view line, const SanitizationRules& rules);

/**
 * @brief Copies @p inputPath to @p outputPath, dropping every line that matches @p rules.
 *
 * Kept lines are written byte-for-byte, including carriage returns and a missing final newline.
 * The input is never modified. On failure the partially written output is removed.
 *
 * @return Line counts, or SanitizeIOFailure.
 */
std::expected<SanitizeStats, BackupError> sanitizeDump(const std::filesystem::path& inputPath,
                                                      const std::filesystem::path& outputPath,
                                                      const SanitizationRules& rules);

#endif // SANITIZER_HPP
