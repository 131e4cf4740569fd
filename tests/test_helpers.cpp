#include "test_helpers.hpp"
#include <cerrno>
#include <csignal>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>
#include <stdlib.h>

namespace fs = std::filesystem;

namespace testing_support {

TempDir::TempDir() {
    std::string pattern = (fs::temp_directory_path() / "dbvault_test_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed");
    }
    path_ = buffer.data();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeScript(const fs::path& path, const std::string& body) {
    writeFile(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
}

void touchAt(const fs::path& path, std::chrono::system_clock::time_point when) {
    fs::last_write_time(path, std::chrono::file_clock::from_sys(when));
}

std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tmValue{};
    tmValue.tm_year = year - 1900;
    tmValue.tm_mon = month - 1;
    tmValue.tm_mday = day;
    tmValue.tm_hour = hour;
    tmValue.tm_min = minute;
    tmValue.tm_sec = second;
    tmValue.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tmValue));
}

Json::Value baseConfig(const fs::path& root, const std::string& databaseUrl) {
    Json::Value config(Json::objectValue);
    config["backup_base"] = (root / "backups").string() + "/";
    config["database_url"] = databaseUrl;
    config["log_file"] = (root / "engine.log").string();
    config["error_log_file"] = (root / "errors.log").string();
    return config;
}

bool processAlive(int pid) {
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace testing_support
