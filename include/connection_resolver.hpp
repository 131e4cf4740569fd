/**
 * @file connection_resolver.hpp
 * @brief Parses database connection strings into credential-isolated parameters.
 *
 * The resolved password is kept apart from everything that ends up on a command line or in
 * a log line. Callers hand it to child processes through their environment only.
 */

#ifndef CONNECTION_RESOLVER_HPP
#define CONNECTION_RESOLVER_HPP

#include <string>
#include <optional>
#include <expected>
#include "backup_error.hpp"

/**
 * @brief Database engines the backup engine knows how to dump and restore.
 */
enum class DatabaseEngine {
    SQLite,     ///< Embedded single-file database. Backups are file copies.
    PostgreSQL  ///< Client/server database. Backups go through pg_dump and psql.
};

/**
 * @brief Structured connection parameters.
 *
 * For SQLite only @c database is meaningful and holds the absolute database file path.
 */
struct ConnectionParams {
    DatabaseEngine engine = DatabaseEngine::PostgreSQL;
    std::string scheme;   ///< Normalized scheme ("postgresql" or "sqlite").
    std::string username;
    std::string password; ///< Percent-decoded secret. Never logged, never placed in argv.
    std::string host;
    int port = 0;
    std::string database;
};

/**
 * @brief Result of resolving a connection string.
 */
struct ResolvedConnection {
    ConnectionParams params;
    std::string cleanUrl;              ///< "postgresql://user@host:port/db", free of credentials.
    std::optional<std::string> secret; ///< Password to export as PGPASSWORD, if one was given.
};

/**
 * @brief Parses @p url of the form scheme://[user[:password]@]host[:port]/database.
 *
 * Driver suffixes such as "+asyncpg" are dropped. Missing user, host, port and database fall
 * back to "homepage", "db", 5432 and "homepage".
 *
 * @return The resolved connection, or InvalidConnection for a malformed string.
 */
std::expected<ResolvedConnection, BackupError> resolveConnection(const std::string& url);

/**
 * @brief Decodes %XX escapes. Malformed escapes are kept verbatim.
 */
std::string percentDecode(const std::string& text);

#endif // CONNECTION_RESOLVER_HPP
