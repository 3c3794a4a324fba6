// mvcore/sql/dialect.h
#ifndef MVCORE_SQL_DIALECT_H
#define MVCORE_SQL_DIALECT_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mvcore::sql {

enum class DatabaseBackend : uint8_t {
    POSTGRES,
    MYSQL,
    MARIADB,
    SQLITE
};

const char* backend_name(DatabaseBackend backend);

// "postgres" / "postgresql", "mysql", "mariadb", "sqlite" / "sqlite3"
DatabaseBackend parse_backend(const std::string& name);

// Backend specific SQL text. Stateless, one instance per builder.
class SqlDialect {
public:
    virtual ~SqlDialect() = default;

    virtual DatabaseBackend backend() const = 0;

    // Qualified names ("t.col") and "*" pass through unquoted
    virtual std::string quote_identifier(const std::string& identifier) const = 0;

    // 1-based
    virtual std::string placeholder(size_t index) const = 0;

    // Leading space included, empty when neither is set
    virtual std::string limit_syntax(std::optional<uint64_t> limit, std::optional<uint64_t> offset) const;

    virtual bool supports_returning() const = 0;
    virtual bool supports_full_join() const = 0;
    virtual bool supports_enum_cast() const { return false; }

    // nullopt when RETURNING is unsupported
    virtual std::optional<std::string> returning_syntax(const std::vector<std::string>& columns) const;

    // Conflict clause appended to an INSERT; first_param is the index of the
    // first placeholder used by the INSERT values
    virtual std::string upsert_syntax(const std::vector<std::string>& columns,
                                      const std::vector<std::string>& conflict_columns,
                                      size_t first_param) const = 0;

    virtual std::string current_timestamp() const { return "CURRENT_TIMESTAMP"; }
    virtual std::string auto_increment_syntax() const = 0;
    virtual std::string boolean_type() const = 0;

protected:
    static bool is_passthrough_identifier(const std::string& identifier);
    static std::string quote_with(const std::string& identifier, char quote);
    std::string join_quoted(const std::vector<std::string>& columns) const;
};

class PostgresDialect : public SqlDialect {
public:
    DatabaseBackend backend() const override { return DatabaseBackend::POSTGRES; }
    std::string quote_identifier(const std::string& identifier) const override;
    std::string placeholder(size_t index) const override;
    bool supports_returning() const override { return true; }
    bool supports_full_join() const override { return true; }
    bool supports_enum_cast() const override { return true; }
    std::string upsert_syntax(const std::vector<std::string>& columns,
                              const std::vector<std::string>& conflict_columns,
                              size_t first_param) const override;
    std::string auto_increment_syntax() const override { return "SERIAL PRIMARY KEY"; }
    std::string boolean_type() const override { return "BOOLEAN"; }
};

class MySqlDialect : public SqlDialect {
public:
    explicit MySqlDialect(DatabaseBackend backend = DatabaseBackend::MYSQL) : backend_(backend) {}

    DatabaseBackend backend() const override { return backend_; }
    std::string quote_identifier(const std::string& identifier) const override;
    std::string placeholder(size_t index) const override;
    std::string limit_syntax(std::optional<uint64_t> limit, std::optional<uint64_t> offset) const override;
    bool supports_returning() const override { return false; }
    bool supports_full_join() const override { return false; }
    std::string upsert_syntax(const std::vector<std::string>& columns,
                              const std::vector<std::string>& conflict_columns,
                              size_t first_param) const override;
    std::string current_timestamp() const override { return "CURRENT_TIMESTAMP()"; }
    std::string auto_increment_syntax() const override { return "AUTO_INCREMENT PRIMARY KEY"; }
    std::string boolean_type() const override { return "TINYINT(1)"; }

private:
    DatabaseBackend backend_;
};

class SqliteDialect : public SqlDialect {
public:
    DatabaseBackend backend() const override { return DatabaseBackend::SQLITE; }
    std::string quote_identifier(const std::string& identifier) const override;
    std::string placeholder(size_t index) const override;
    std::string limit_syntax(std::optional<uint64_t> limit, std::optional<uint64_t> offset) const override;
    bool supports_returning() const override { return true; }
    bool supports_full_join() const override { return true; }
    std::string upsert_syntax(const std::vector<std::string>& columns,
                              const std::vector<std::string>& conflict_columns,
                              size_t first_param) const override;
    std::string auto_increment_syntax() const override { return "INTEGER PRIMARY KEY AUTOINCREMENT"; }
    std::string boolean_type() const override { return "INTEGER"; }
};

std::unique_ptr<SqlDialect> create_dialect(DatabaseBackend backend);

} // namespace mvcore::sql

#endif // MVCORE_SQL_DIALECT_H
