#ifndef DBVAULT_TEST_HELPERS_HPP
#define DBVAULT_TEST_HELPERS_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <json/json.h>

namespace testing_support {

/**
 * @brief Unique directory under the system temp path, removed with its contents on destruction.
 */
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

void writeFile(const std::filesystem::path& path, const std::string& content);
std::string readFile(const std::filesystem::path& path);

/// Writes an executable /bin/sh script.
void writeScript(const std::filesystem::path& path, const std::string& body);

/// Sets the file's modification time.
void touchAt(const std::filesystem::path& path, std::chrono::system_clock::time_point when);

/// Local time point for the given calendar date and time.
std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour = 12, int minute = 0, int second = 0);

/// Minimal engine configuration rooted at @p root; logs go to the same directory.
Json::Value baseConfig(const std::filesystem::path& root, const std::string& databaseUrl);

bool processAlive(int pid);

} // namespace testing_support

#endif // DBVAULT_TEST_HELPERS_HPP
