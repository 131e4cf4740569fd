#include "sanitizer.hpp"
#include <fstream>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view strip(std::string_view line) {
    while (!line.empty() && isSpace(line.front())) {
        line.remove_prefix(1);
    }
    while (!line.empty() && isSpace(line.back())) {
        line.remove_suffix(1);
    }
    return line;
}

bool startsWithAny(std::string_view text, const std::vector<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        if (!prefix.empty() && text.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

std::unexpected<BackupError> ioFailure(const fs::path& outputPath, const std::string& message) {
    std::error_code ec;
    if (fs::is_regular_file(outputPath, ec)) {
        fs::remove(outputPath, ec);
    }
    return std::unexpected(BackupError{BackupErrorKind::SanitizeIOFailure, message});
}

} // namespace

bool matchesSanitizationRule(std::string_view line, const SanitizationRules& rules) {
    std::string_view stripped = strip(line);
    return startsWithAny(stripped, rules.metaCommands) || startsWithAny(stripped, rules.versionSpecific);
}

std::expected<SanitizeStats, BackupError> sanitizeDump(const fs::path& inputPath,
                                                      const fs::path& outputPath,
                                                      const SanitizationRules& rules) {
    std::ifstream in(inputPath, std::ios::binary);
    if (!in.is_open()) {
        return ioFailure(outputPath, std::format("Cannot open dump for reading: {}", inputPath.string()));
    }
    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ioFailure(outputPath, std::format("Cannot create sanitized file: {}", outputPath.string()));
    }

    SanitizeStats stats;
    std::string line;
    while (std::getline(in, line)) {
        ++stats.linesTotal;
        bool hadNewline = !in.eof();
        if (matchesSanitizationRule(line, rules)) {
            ++stats.linesFiltered;
            continue;
        }
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        if (hadNewline) {
            out.put('\n');
        }
        if (!out) {
            return ioFailure(outputPath, std::format("Write failed on sanitized file: {}", outputPath.string()));
        }
    }
    if (in.bad()) {
        return ioFailure(outputPath, std::format("Read failed on dump: {}", inputPath.string()));
    }

    out.flush();
    out.close();
    if (out.fail()) {
        return ioFailure(outputPath, std::format("Failed to finalize sanitized file: {}", outputPath.string()));
    }
    return stats;
}
