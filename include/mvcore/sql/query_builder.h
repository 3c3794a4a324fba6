// mvcore/sql/query_builder.h
#ifndef MVCORE_SQL_QUERY_BUILDER_H
#define MVCORE_SQL_QUERY_BUILDER_H

#include "mvcore/sql/dialect.h"
#include "mvcore/sql/query_error.h"
#include "mvcore/sql/sql_value.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mvcore::sql {

enum class OrderDirection : uint8_t {
    ASC,
    DESC
};

enum class JoinType : uint8_t {
    INNER,
    LEFT,
    RIGHT,
    FULL
};

// Column -> value; ordered so generated column lists are deterministic
using Row = std::map<std::string, SqlValue>;

struct BuiltQuery {
    std::string sql;
    std::vector<SqlValue> params;
};

// Fluent SQL builder bound to one backend. Chaining methods mutate and
// return *this; build_* methods are const and may be called repeatedly.
class QueryBuilder {
public:
    explicit QueryBuilder(DatabaseBackend backend);

    QueryBuilder(const QueryBuilder& other);
    QueryBuilder& operator=(const QueryBuilder& other);
    QueryBuilder(QueryBuilder&&) noexcept = default;
    QueryBuilder& operator=(QueryBuilder&&) noexcept = default;

    QueryBuilder& from(std::string table);
    QueryBuilder& as_alias(std::string alias);
    QueryBuilder& select(std::vector<std::string> columns);
    QueryBuilder& count();                          // COUNT(*)
    QueryBuilder& count_column(const std::string& column);

    QueryBuilder& where_eq(std::string column, SqlValue value);
    QueryBuilder& where_ne(std::string column, SqlValue value);
    QueryBuilder& where_gt(std::string column, SqlValue value);
    QueryBuilder& where_lt(std::string column, SqlValue value);
    QueryBuilder& where_gte(std::string column, SqlValue value);
    QueryBuilder& where_lte(std::string column, SqlValue value);
    QueryBuilder& where_like(std::string column, SqlValue pattern);
    QueryBuilder& where_not_like(std::string column, SqlValue pattern);
    QueryBuilder& where_null(std::string column);
    QueryBuilder& where_not_null(std::string column);
    QueryBuilder& where_in(std::string column, std::vector<SqlValue> values);
    QueryBuilder& where_not_in(std::string column, std::vector<SqlValue> values);
    QueryBuilder& where_between(std::string column, SqlValue low, SqlValue high);
    // Emitted verbatim; binds nothing
    QueryBuilder& where_raw(std::string condition);

    QueryBuilder& or_where_eq(std::string column, SqlValue value);
    QueryBuilder& or_where_ne(std::string column, SqlValue value);
    QueryBuilder& or_where_gt(std::string column, SqlValue value);
    QueryBuilder& or_where_lt(std::string column, SqlValue value);
    QueryBuilder& or_where_gte(std::string column, SqlValue value);
    QueryBuilder& or_where_lte(std::string column, SqlValue value);
    QueryBuilder& or_where_like(std::string column, SqlValue pattern);
    QueryBuilder& or_where_null(std::string column);
    QueryBuilder& or_where_not_null(std::string column);
    QueryBuilder& or_where_in(std::string column, std::vector<SqlValue> values);
    QueryBuilder& or_where_not_in(std::string column, std::vector<SqlValue> values);
    QueryBuilder& or_where_between(std::string column, SqlValue low, SqlValue high);

    // table may carry an alias: "posts AS p" or "posts p"; on is raw SQL
    QueryBuilder& join(std::string table, std::string on);
    QueryBuilder& left_join(std::string table, std::string on);
    QueryBuilder& right_join(std::string table, std::string on);
    QueryBuilder& full_join(std::string table, std::string on);

    QueryBuilder& order_by(std::string column, OrderDirection direction = OrderDirection::ASC);
    QueryBuilder& order_by_asc(std::string column) { return order_by(std::move(column), OrderDirection::ASC); }
    QueryBuilder& order_by_desc(std::string column) { return order_by(std::move(column), OrderDirection::DESC); }
    QueryBuilder& group_by(std::string column);
    QueryBuilder& limit(uint64_t n);
    QueryBuilder& offset(uint64_t n);
    // 1-based page; page 0 is treated as page 1
    QueryBuilder& paginate(uint64_t page, uint64_t per_page);

    QueryBuilder& returning(std::vector<std::string> columns);
    QueryBuilder& returning_column(std::string column);

    // Bind IN / NOT IN / BETWEEN operands as placeholders instead of
    // embedding literals. Embedded literals only double single quotes; MySQL
    // and MariaDB also treat a backslash as an escape unless NO_BACKSLASH_ESCAPES is
    // set, so enable this there whenever list values come from user input.
    QueryBuilder& bind_list_parameters(bool enabled);

    [[nodiscard]] BuiltQuery build() const;
    [[nodiscard]] BuiltQuery build_insert(const Row& row) const;
    [[nodiscard]] BuiltQuery build_update(const Row& row) const;
    [[nodiscard]] BuiltQuery build_delete() const;
    [[nodiscard]] BuiltQuery build_upsert(const Row& row, const std::vector<std::string>& conflict_columns) const;

    // SQL with parameters appended, for logs
    std::string to_debug_string() const;

    DatabaseBackend backend() const { return backend_; }
    const SqlDialect& dialect() const { return *dialect_; }

private:
    enum class Connector : uint8_t { AND, OR };

    enum class ConditionType : uint8_t {
        COMPARE,     // column op ?
        IS_NULL,
        IS_NOT_NULL,
        IN,
        NOT_IN,
        BETWEEN,
        RAW
    };

    struct WhereCondition {
        std::string column;
        ConditionType type;
        std::string op;               // COMPARE operator or RAW text
        std::vector<SqlValue> values;
        Connector connector;
    };

    struct JoinClause {
        JoinType type;
        std::string table;
        std::string on;
    };

    struct OrderClause {
        std::string column;
        OrderDirection direction;
    };

    QueryBuilder& add_condition(Connector connector, std::string column, ConditionType type,
                                std::string op, std::vector<SqlValue> values);
    QueryBuilder& add_join(JoinType type, std::string table, std::string on);

    void require_table() const;
    std::string quoted_table() const;
    std::string join_table_sql(const std::string& table) const;
    // Value slot for INSERT/UPDATE: NULL and DEFAULT inline, the rest bound
    std::string value_expression(const SqlValue& value, std::vector<SqlValue>& params) const;
    std::string bind(const SqlValue& value, std::vector<SqlValue>& params) const;
    std::string build_where_clause(std::vector<SqlValue>& params) const;
    std::string build_returning_clause() const;

    DatabaseBackend backend_;
    std::unique_ptr<SqlDialect> dialect_;
    std::string table_;
    std::optional<std::string> alias_;
    std::vector<std::string> select_columns_{"*"};
    std::vector<WhereCondition> where_conditions_;
    std::vector<JoinClause> joins_;
    std::vector<OrderClause> order_by_;
    std::vector<std::string> group_by_;
    std::optional<uint64_t> limit_;
    std::optional<uint64_t> offset_;
    std::vector<std::string> returning_;
    bool bind_lists_ = false;
};

} // namespace mvcore::sql

#endif // MVCORE_SQL_QUERY_BUILDER_H
