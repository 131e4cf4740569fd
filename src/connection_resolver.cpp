#include "connection_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultUser = "homepage";
constexpr const char* kDefaultHost = "db";
constexpr int kDefaultPort = 5432;
constexpr const char* kDefaultDatabase = "homepage";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::unexpected<BackupError> invalid(const std::string& message) {
    return std::unexpected(BackupError{BackupErrorKind::InvalidConnection, message});
}

std::expected<ResolvedConnection, BackupError> resolveSQLite(const std::string& rest) {
    // sqlite:///relative/path and sqlite:////absolute/path
    std::string path = rest;
    if (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    if (path.empty()) {
        return invalid("SQLite connection string has no database path");
    }

    ResolvedConnection resolved;
    resolved.params.engine = DatabaseEngine::SQLite;
    resolved.params.scheme = "sqlite";
    resolved.params.database = fs::absolute(fs::path(path)).lexically_normal().string();
    resolved.cleanUrl = "sqlite:///" + resolved.params.database;
    return resolved;
}

std::expected<ResolvedConnection, BackupError> resolvePostgreSQL(const std::string& rest) {
    ResolvedConnection resolved;
    ConnectionParams& params = resolved.params;
    params.engine = DatabaseEngine::PostgreSQL;
    params.scheme = "postgresql";

    std::string authority = rest;
    std::string path;
    if (auto slash = rest.find('/'); slash != std::string::npos) {
        authority = rest.substr(0, slash);
        path = rest.substr(slash + 1);
    }
    if (auto query = path.find_first_of("?#"); query != std::string::npos) {
        path.erase(query);
    }

    std::string hostPort = authority;
    if (auto at = authority.rfind('@'); at != std::string::npos) {
        std::string userInfo = authority.substr(0, at);
        hostPort = authority.substr(at + 1);
        if (auto colon = userInfo.find(':'); colon != std::string::npos) {
            params.username = userInfo.substr(0, colon);
            std::string password = percentDecode(userInfo.substr(colon + 1));
            if (!password.empty()) {
                params.password = password;
                resolved.secret = password;
            }
        } else {
            params.username = userInfo;
        }
    }

    std::string portText;
    if (!hostPort.empty() && hostPort.front() == '[') {
        auto close = hostPort.find(']');
        if (close == std::string::npos) {
            return invalid("Unterminated IPv6 host literal");
        }
        params.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size()) {
            if (hostPort[close + 1] != ':') {
                return invalid("Unexpected characters after IPv6 host literal");
            }
            portText = hostPort.substr(close + 2);
        }
    } else if (auto colon = hostPort.rfind(':'); colon != std::string::npos) {
        params.host = hostPort.substr(0, colon);
        portText = hostPort.substr(colon + 1);
    } else {
        params.host = hostPort;
    }

    params.port = kDefaultPort;
    if (!portText.empty()) {
        int port = 0;
        auto [end, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc() || end != portText.data() + portText.size() || port <= 0 || port > 65535) {
            return invalid(std::format("Invalid port: {}", portText));
        }
        params.port = port;
    }

    if (params.username.empty()) params.username = kDefaultUser;
    if (params.host.empty()) params.host = kDefaultHost;
    params.database = path.empty() ? kDefaultDatabase : path;

    std::string hostForUrl = params.host.find(':') != std::string::npos ? "[" + params.host + "]" : params.host;
    resolved.cleanUrl = std::format("postgresql://{}@{}:{}/{}", params.username, hostForUrl, params.port, params.database);
    return resolved;
}

} // namespace

std::string percentDecode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int high = hexValue(text[i + 1]);
            int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

std::expected<ResolvedConnection, BackupError> resolveConnection(const std::string& url) {
    auto separator = url.find("://");
    if (separator == std::string::npos || separator == 0) {
        return invalid("Connection string must look like scheme://[user[:password]@]host[:port]/database");
    }

    std::string scheme = url.substr(0, separator);
    if (auto plus = scheme.find('+'); plus != std::string::npos) {
        scheme.erase(plus);
    }
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string rest = url.substr(separator + 3);
    if (scheme == "sqlite") {
        return resolveSQLite(rest);
    }
    if (scheme == "postgresql" || scheme == "postgres") {
        return resolvePostgreSQL(rest);
    }
    return invalid(std::format("Unsupported database scheme: {}", scheme));
}
