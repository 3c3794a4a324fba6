// src/sql/dialects.cpp
#include "mvcore/sql/dialect.h"
#include "common/types.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mvcore::sql {

const char* backend_name(DatabaseBackend backend) {
    switch (backend) {
        case DatabaseBackend::POSTGRES: return "PostgreSQL";
        case DatabaseBackend::MYSQL: return "MySQL";
        case DatabaseBackend::MARIADB: return "MariaDB";
        case DatabaseBackend::SQLITE: return "SQLite";
    }
    return "unknown";
}

DatabaseBackend parse_backend(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "postgres" || lower == "postgresql" || lower == "pg") return DatabaseBackend::POSTGRES;
    if (lower == "mysql") return DatabaseBackend::MYSQL;
    if (lower == "mariadb") return DatabaseBackend::MARIADB;
    if (lower == "sqlite" || lower == "sqlite3") return DatabaseBackend::SQLITE;
    throw ConfigError("Unknown database backend '" + name + "'");
}

// --- SqlDialect defaults ---

bool SqlDialect::is_passthrough_identifier(const std::string& identifier) {
    return identifier == "*" || identifier.find('.') != std::string::npos;
}

std::string SqlDialect::quote_with(const std::string& identifier, char quote) {
    std::string out(1, quote);
    for (char c : identifier) {
        if (c == quote) out += quote;
        out += c;
    }
    out += quote;
    return out;
}

std::string SqlDialect::join_quoted(const std::vector<std::string>& columns) const {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote_identifier(columns[i]);
    }
    return out;
}

std::string SqlDialect::limit_syntax(std::optional<uint64_t> limit, std::optional<uint64_t> offset) const {
    std::string out;
    if (limit) out += " LIMIT " + std::to_string(*limit);
    if (offset) out += " OFFSET " + std::to_string(*offset);
    return out;
}

std::optional<std::string> SqlDialect::returning_syntax(const std::vector<std::string>& columns) const {
    if (!supports_returning()) return std::nullopt;
    if (columns.empty()) return std::string(" RETURNING *");
    return " RETURNING " + join_quoted(columns);
}

// --- PostgreSQL ---

std::string PostgresDialect::quote_identifier(const std::string& identifier) const {
    if (is_passthrough_identifier(identifier)) return identifier;
    return quote_with(identifier, '"');
}

std::string PostgresDialect::placeholder(size_t index) const {
    return "$" + std::to_string(index);
}

std::string PostgresDialect::upsert_syntax(const std::vector<std::string>& columns,
                                           const std::vector<std::string>& conflict_columns,
                                           size_t first_param) const {
    std::string sets;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (std::find(conflict_columns.begin(), conflict_columns.end(), columns[i]) != conflict_columns.end()) continue;
        if (!sets.empty()) sets += ", ";
        sets += quote_identifier(columns[i]) + " = " + placeholder(first_param + i);
    }
    std::string out = " ON CONFLICT (" + join_quoted(conflict_columns) + ")";
    return sets.empty() ? out + " DO NOTHING" : out + " DO UPDATE SET " + sets;
}

// --- MySQL / MariaDB ---

std::string MySqlDialect::quote_identifier(const std::string& identifier) const {
    if (is_passthrough_identifier(identifier)) return identifier;
    return quote_with(identifier, '`');
}

std::string MySqlDialect::placeholder(size_t) const {
    return "?";
}

std::string MySqlDialect::limit_syntax(std::optional<uint64_t> limit, std::optional<uint64_t> offset) const {
    // MySQL has no OFFSET without LIMIT
    if (offset && !limit) {
        return " LIMIT 18446744073709551615 OFFSET " + std::to_string(*offset);
    }
    return SqlDialect::limit_syntax(limit, offset);
}

std::string MySqlDialect::upsert_syntax(const std::vector<std::string>& columns,
                                        const std::vector<std::string>& conflict_columns,
                                        size_t) const {
    std::string sets;
    for (const auto& col : columns) {
        if (std::find(conflict_columns.begin(), conflict_columns.end(), col) != conflict_columns.end()) continue;
        if (!sets.empty()) sets += ", ";
        std::string quoted = quote_identifier(col);
        sets += quoted + " = VALUES(" + quoted + ")";
    }
    if (sets.empty()) {
        // no-op update keeps the statement valid
        std::string quoted = quote_identifier(columns.front());
        sets = quoted + " = " + quoted;
    }
    return " ON DUPLICATE KEY UPDATE " + sets;
}

// --- SQLite ---

std::string SqliteDialect::quote_identifier(const std::string& identifier) const {
    if (is_passthrough_identifier(identifier)) return identifier;
    return quote_with(identifier, '"');
}

std::string SqliteDialect::placeholder(size_t) const {
    return "?";
}

std::string SqliteDialect::limit_syntax(std::optional<uint64_t> limit, std::optional<uint64_t> offset) const {
    if (offset && !limit) {
        return " LIMIT -1 OFFSET " + std::to_string(*offset);
    }
    return SqlDialect::limit_syntax(limit, offset);
}

std::string SqliteDialect::upsert_syntax(const std::vector<std::string>& columns,
                                         const std::vector<std::string>& conflict_columns,
                                         size_t) const {
    std::string sets;
    for (const auto& col : columns) {
        if (std::find(conflict_columns.begin(), conflict_columns.end(), col) != conflict_columns.end()) continue;
        if (!sets.empty()) sets += ", ";
        std::string quoted = quote_identifier(col);
        sets += quoted + " = excluded." + quoted;
    }
    std::string out = " ON CONFLICT(" + join_quoted(conflict_columns) + ")";
    return sets.empty() ? out + " DO NOTHING" : out + " DO UPDATE SET " + sets;
}

std::unique_ptr<SqlDialect> create_dialect(DatabaseBackend backend) {
    switch (backend) {
        case DatabaseBackend::POSTGRES:
            return std::make_unique<PostgresDialect>();
        case DatabaseBackend::MYSQL:
        case DatabaseBackend::MARIADB:
            return std::make_unique<MySqlDialect>(backend);
        case DatabaseBackend::SQLITE:
            return std::make_unique<SqliteDialect>();
    }
    throw std::runtime_error("Unsupported database backend");
}

} // namespace mvcore::sql
