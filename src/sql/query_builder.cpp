// src/sql/query_builder.cpp
#include "mvcore/sql/query_builder.h"
#include "common/log.h"
#include <sstream>

namespace mvcore::sql {

namespace {

// Literal text for IN / NOT IN / BETWEEN operands when list binding is off
std::string embedded_literal(const SqlValue& value, DatabaseBackend backend) {
    std::string literal = value.to_sql_string();
    if ((backend == DatabaseBackend::MYSQL || backend == DatabaseBackend::MARIADB) &&
        literal.find('\\') != std::string::npos) {
        log_warning(std::string("Backslash in an embedded ") + backend_name(backend) +
                    " literal is read as an escape; use bind_list_parameters(true) for such values");
    }
    return literal;
}

} // namespace

QueryBuilder::QueryBuilder(DatabaseBackend backend)
    : backend_(backend), dialect_(create_dialect(backend)) {}

QueryBuilder::QueryBuilder(const QueryBuilder& other)
    : backend_(other.backend_),
      dialect_(create_dialect(other.backend_)),
      table_(other.table_),
      alias_(other.alias_),
      select_columns_(other.select_columns_),
      where_conditions_(other.where_conditions_),
      joins_(other.joins_),
      order_by_(other.order_by_),
      group_by_(other.group_by_),
      limit_(other.limit_),
      offset_(other.offset_),
      returning_(other.returning_),
      bind_lists_(other.bind_lists_) {}

QueryBuilder& QueryBuilder::operator=(const QueryBuilder& other) {
    if (this != &other) {
        QueryBuilder copy(other);
        *this = std::move(copy);
    }
    return *this;
}

// --- clauses ---

QueryBuilder& QueryBuilder::from(std::string table) {
    table_ = std::move(table);
    return *this;
}

QueryBuilder& QueryBuilder::as_alias(std::string alias) {
    alias_ = std::move(alias);
    return *this;
}

QueryBuilder& QueryBuilder::select(std::vector<std::string> columns) {
    select_columns_ = std::move(columns);
    if (select_columns_.empty()) select_columns_ = {"*"};
    return *this;
}

QueryBuilder& QueryBuilder::count() {
    select_columns_ = {"COUNT(*)"};
    return *this;
}

QueryBuilder& QueryBuilder::count_column(const std::string& column) {
    select_columns_ = {"COUNT(" + column + ")"};
    return *this;
}

QueryBuilder& QueryBuilder::add_condition(Connector connector, std::string column, ConditionType type,
                                          std::string op, std::vector<SqlValue> values) {
    where_conditions_.push_back(WhereCondition{
        std::move(column), type, std::move(op), std::move(values), connector});
    return *this;
}

QueryBuilder& QueryBuilder::where_eq(std::string column, SqlValue value) {
    return add_condition(Connector::AND, std::move(column), ConditionType::COMPARE, "=", {std::move(value)});
}
QueryBuilder& QueryBuilder::where_ne(std::string column, SqlValue value) {
    return add_condition(Connector::AND, std::move(column), ConditionType::COMPARE, "!=", {std::move(value)});
}
QueryBuilder& QueryBuilder::where_gt(std::string column, SqlValue value) {
    return add_condition(Connector::AND, std::move(column), ConditionType::COMPARE, ">", {std::move(value)});
}
QueryBuilder& QueryBuilder::where_lt(std::string column, SqlValue value) {
    return add_condition(Connector::AND, std::move(column), ConditionType::COMPARE, "<", {std::move(value)});
}
QueryBuilder& QueryBuilder::where_gte(std::string column, SqlValue value) {
    return add_condition(Connector::AND, std::move(column), ConditionType::COMPARE, ">=", {std::move(value)});
}
QueryBuilder& QueryBuilder::where_lte(std::string column, SqlValue value) {
    return add_condition(Connector::AND, std::move(column), ConditionType::COMPARE, "<=", {std::move(value)});
}
QueryBuilder& QueryBuilder::where_like(std::string column, SqlValue pattern) {
    return add_condition(Connector::AND, std::move(column), ConditionType::COMPARE, "LIKE", {std::move(pattern)});
}
QueryBuilder& QueryBuilder::where_not_like(std::string column, SqlValue pattern) {
    return add_condition(Connector::AND, std::move(column), ConditionType::COMPARE, "NOT LIKE", {std::move(pattern)});
}
QueryBuilder& QueryBuilder::where_null(std::string column) {
    return add_condition(Connector::AND, std::move(column), ConditionType::IS_NULL, "IS", {});
}
QueryBuilder& QueryBuilder::where_not_null(std::string column) {
    return add_condition(Connector::AND, std::move(column), ConditionType::IS_NOT_NULL, "IS NOT", {});
}
QueryBuilder& QueryBuilder::where_in(std::string column, std::vector<SqlValue> values) {
    return add_condition(Connector::AND, std::move(column), ConditionType::IN, "IN", std::move(values));
}
QueryBuilder& QueryBuilder::where_not_in(std::string column, std::vector<SqlValue> values) {
    return add_condition(Connector::AND, std::move(column), ConditionType::NOT_IN, "NOT IN", std::move(values));
}
QueryBuilder& QueryBuilder::where_between(std::string column, SqlValue low, SqlValue high) {
    return add_condition(Connector::AND, std::move(column), ConditionType::BETWEEN, "BETWEEN",
                         {std::move(low), std::move(high)});
}
QueryBuilder& QueryBuilder::where_raw(std::string condition) {
    return add_condition(Connector::AND, "", ConditionType::RAW, std::move(condition), {});
}

QueryBuilder& QueryBuilder::or_where_eq(std::string column, SqlValue value) {
    return add_condition(Connector::OR, std::move(column), ConditionType::COMPARE, "=", {std::move(value)});
}
QueryBuilder& QueryBuilder::or_where_ne(std::string column, SqlValue value) {
    return add_condition(Connector::OR, std::move(column), ConditionType::COMPARE, "!=", {std::move(value)});
}
QueryBuilder& QueryBuilder::or_where_gt(std::string column, SqlValue value) {
    return add_condition(Connector::OR, std::move(column), ConditionType::COMPARE, ">", {std::move(value)});
}
QueryBuilder& QueryBuilder::or_where_lt(std::string column, SqlValue value) {
    return add_condition(Connector::OR, std::move(column), ConditionType::COMPARE, "<", {std::move(value)});
}
QueryBuilder& QueryBuilder::or_where_gte(std::string column, SqlValue value) {
    return add_condition(Connector::OR, std::move(column), ConditionType::COMPARE, ">=", {std::move(value)});
}
QueryBuilder& QueryBuilder::or_where_lte(std::string column, SqlValue value) {
    return add_condition(Connector::OR, std::move(column), ConditionType::COMPARE, "<=", {std::move(value)});
}
QueryBuilder& QueryBuilder::or_where_like(std::string column, SqlValue pattern) {
    return add_condition(Connector::OR, std::move(column), ConditionType::COMPARE, "LIKE", {std::move(pattern)});
}
QueryBuilder& QueryBuilder::or_where_null(std::string column) {
    return add_condition(Connector::OR, std::move(column), ConditionType::IS_NULL, "IS", {});
}
QueryBuilder& QueryBuilder::or_where_not_null(std::string column) {
    return add_condition(Connector::OR, std::move(column), ConditionType::IS_NOT_NULL, "IS NOT", {});
}
QueryBuilder& QueryBuilder::or_where_in(std::string column, std::vector<SqlValue> values) {
    return add_condition(Connector::OR, std::move(column), ConditionType::IN, "IN", std::move(values));
}
QueryBuilder& QueryBuilder::or_where_not_in(std::string column, std::vector<SqlValue> values) {
    return add_condition(Connector::OR, std::move(column), ConditionType::NOT_IN, "NOT IN", std::move(values));
}
QueryBuilder& QueryBuilder::or_where_between(std::string column, SqlValue low, SqlValue high) {
    return add_condition(Connector::OR, std::move(column), ConditionType::BETWEEN, "BETWEEN",
                         {std::move(low), std::move(high)});
}

QueryBuilder& QueryBuilder::add_join(JoinType type, std::string table, std::string on) {
    joins_.push_back(JoinClause{type, std::move(table), std::move(on)});
    return *this;
}

QueryBuilder& QueryBuilder::join(std::string table, std::string on) {
    return add_join(JoinType::INNER, std::move(table), std::move(on));
}
QueryBuilder& QueryBuilder::left_join(std::string table, std::string on) {
    return add_join(JoinType::LEFT, std::move(table), std::move(on));
}
QueryBuilder& QueryBuilder::right_join(std::string table, std::string on) {
    return add_join(JoinType::RIGHT, std::move(table), std::move(on));
}
QueryBuilder& QueryBuilder::full_join(std::string table, std::string on) {
    return add_join(JoinType::FULL, std::move(table), std::move(on));
}

QueryBuilder& QueryBuilder::order_by(std::string column, OrderDirection direction) {
    order_by_.push_back(OrderClause{std::move(column), direction});
    return *this;
}

QueryBuilder& QueryBuilder::group_by(std::string column) {
    group_by_.push_back(std::move(column));
    return *this;
}

QueryBuilder& QueryBuilder::limit(uint64_t n) {
    limit_ = n;
    return *this;
}

QueryBuilder& QueryBuilder::offset(uint64_t n) {
    offset_ = n;
    return *this;
}

QueryBuilder& QueryBuilder::paginate(uint64_t page, uint64_t per_page) {
    uint64_t zero_based = page > 0 ? page - 1 : 0;
    limit_ = per_page;
    offset_ = zero_based * per_page;
    return *this;
}

QueryBuilder& QueryBuilder::returning(std::vector<std::string> columns) {
    returning_ = std::move(columns);
    return *this;
}

QueryBuilder& QueryBuilder::returning_column(std::string column) {
    returning_.push_back(std::move(column));
    return *this;
}

QueryBuilder& QueryBuilder::bind_list_parameters(bool enabled) {
    bind_lists_ = enabled;
    return *this;
}

// --- SQL generation ---

void QueryBuilder::require_table() const {
    if (table_.empty()) {
        throw QueryError::missing_clause("from");
    }
}

std::string QueryBuilder::quoted_table() const {
    return dialect_->quote_identifier(table_);
}

std::string QueryBuilder::join_table_sql(const std::string& table) const {
    std::istringstream iss(table);
    std::vector<std::string> parts;
    std::string part;
    while (iss >> part) parts.push_back(part);

    // Only the table is quoted, aliases stay bare
    if (parts.size() == 3 && (parts[1] == "AS" || parts[1] == "as" || parts[1] == "As" || parts[1] == "aS")) {
        return dialect_->quote_identifier(parts[0]) + " AS " + parts[2];
    }
    if (parts.size() == 2) {
        return dialect_->quote_identifier(parts[0]) + " " + parts[1];
    }
    return dialect_->quote_identifier(table);
}

std::string QueryBuilder::bind(const SqlValue& value, std::vector<SqlValue>& params) const {
    params.push_back(value);
    std::string ph = dialect_->placeholder(params.size());
    if (value.is_typed_enum() && dialect_->supports_enum_cast()) {
        ph += "::" + value.enum_parts().second;
    }
    return ph;
}

std::string QueryBuilder::value_expression(const SqlValue& value, std::vector<SqlValue>& params) const {
    if (value.is_null()) return "NULL";
    if (value.is_default()) return "DEFAULT";
    return bind(value, params);
}

std::string QueryBuilder::build_where_clause(std::vector<SqlValue>& params) const {
    if (where_conditions_.empty()) return "";

    std::string sql = " WHERE ";
    for (size_t i = 0; i < where_conditions_.size(); ++i) {
        const auto& cond = where_conditions_[i];
        if (i > 0) {
            sql += cond.connector == Connector::AND ? " AND " : " OR ";
        }

        if (cond.type == ConditionType::RAW) {
            sql += cond.op;
            continue;
        }

        std::string column = dialect_->quote_identifier(cond.column);
        switch (cond.type) {
            case ConditionType::IS_NULL:
                sql += column + " IS NULL";
                break;
            case ConditionType::IS_NOT_NULL:
                sql += column + " IS NOT NULL";
                break;
            case ConditionType::IN:
            case ConditionType::NOT_IN: {
                bool negated = cond.type == ConditionType::NOT_IN;
                if (cond.values.empty()) {
                    // IN () is not valid SQL anywhere
                    sql += negated ? "1 = 1" : "1 = 0";
                    break;
                }
                std::string list;
                for (size_t j = 0; j < cond.values.size(); ++j) {
                    if (j > 0) list += ", ";
                    list += bind_lists_ ? bind(cond.values[j], params) : embedded_literal(cond.values[j], backend_);
                }
                sql += column + (negated ? " NOT IN (" : " IN (") + list + ")";
                break;
            }
            case ConditionType::BETWEEN: {
                const auto& low = cond.values.at(0);
                const auto& high = cond.values.at(1);
                if (bind_lists_) {
                    std::string low_ph = bind(low, params);
                    sql += column + " BETWEEN " + low_ph + " AND " + bind(high, params);
                } else {
                    sql += column + " BETWEEN " + embedded_literal(low, backend_) + " AND " + embedded_literal(high, backend_);
                }
                break;
            }
            case ConditionType::COMPARE:
                sql += column + " " + cond.op + " " + bind(cond.values.at(0), params);
                break;
            case ConditionType::RAW:
                break;
        }
    }
    return sql;
}

std::string QueryBuilder::build_returning_clause() const {
    if (returning_.empty()) return "";
    auto clause = dialect_->returning_syntax(returning_);
    if (!clause) {
        throw QueryError::unsupported_feature("RETURNING", backend_name(backend_));
    }
    return *clause;
}

BuiltQuery QueryBuilder::build() const {
    require_table();

    BuiltQuery q;
    std::string& sql = q.sql;
    sql.reserve(128);

    sql += "SELECT ";
    for (size_t i = 0; i < select_columns_.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += select_columns_[i];
    }

    sql += " FROM " + quoted_table();
    if (alias_) {
        sql += " AS " + dialect_->quote_identifier(*alias_);
    }

    for (const auto& j : joins_) {
        switch (j.type) {
            case JoinType::INNER: sql += " INNER JOIN "; break;
            case JoinType::LEFT: sql += " LEFT JOIN "; break;
            case JoinType::RIGHT: sql += " RIGHT JOIN "; break;
            case JoinType::FULL:
                if (!dialect_->supports_full_join()) {
                    throw QueryError::unsupported_feature("FULL JOIN", backend_name(backend_));
                }
                sql += " FULL JOIN ";
                break;
        }
        sql += join_table_sql(j.table) + " ON " + j.on;
    }

    sql += build_where_clause(q.params);

    if (!group_by_.empty()) {
        sql += " GROUP BY ";
        for (size_t i = 0; i < group_by_.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += dialect_->quote_identifier(group_by_[i]);
        }
    }

    if (!order_by_.empty()) {
        sql += " ORDER BY ";
        for (size_t i = 0; i < order_by_.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += dialect_->quote_identifier(order_by_[i].column);
            sql += order_by_[i].direction == OrderDirection::ASC ? " ASC" : " DESC";
        }
    }

    sql += dialect_->limit_syntax(limit_, offset_);

    log_debug("SQL " + sql);
    return q;
}

BuiltQuery QueryBuilder::build_insert(const Row& row) const {
    require_table();
    if (row.empty()) {
        throw QueryError::invalid_syntax("INSERT requires at least one column");
    }

    BuiltQuery q;
    std::string columns;
    std::string values;
    for (const auto& [column, value] : row) {
        if (!columns.empty()) {
            columns += ", ";
            values += ", ";
        }
        columns += dialect_->quote_identifier(column);
        values += value_expression(value, q.params);
    }

    q.sql = "INSERT INTO " + quoted_table() + " (" + columns + ") VALUES (" + values + ")";
    q.sql += build_returning_clause();
    log_debug("SQL " + q.sql);
    return q;
}

BuiltQuery QueryBuilder::build_update(const Row& row) const {
    require_table();
    if (row.empty()) {
        throw QueryError::invalid_syntax("UPDATE requires at least one column");
    }

    BuiltQuery q;
    std::string sets;
    for (const auto& [column, value] : row) {
        if (!sets.empty()) sets += ", ";
        sets += dialect_->quote_identifier(column) + " = " + value_expression(value, q.params);
    }

    // SET parameters come first, WHERE numbering continues after them
    q.sql = "UPDATE " + quoted_table() + " SET " + sets;
    q.sql += build_where_clause(q.params);
    q.sql += build_returning_clause();
    log_debug("SQL " + q.sql);
    return q;
}

BuiltQuery QueryBuilder::build_delete() const {
    require_table();

    BuiltQuery q;
    q.sql = "DELETE FROM " + quoted_table();
    q.sql += build_where_clause(q.params);
    q.sql += build_returning_clause();
    log_debug("SQL " + q.sql);
    return q;
}

BuiltQuery QueryBuilder::build_upsert(const Row& row, const std::vector<std::string>& conflict_columns) const {
    require_table();
    if (row.empty()) {
        throw QueryError::invalid_syntax("UPSERT requires at least one column");
    }
    if (conflict_columns.empty()) {
        throw QueryError::invalid_syntax("UPSERT requires at least one conflict column");
    }

    BuiltQuery q;
    std::vector<std::string> names;
    std::string columns;
    std::string values;
    for (const auto& [column, value] : row) {
        if (!columns.empty()) {
            columns += ", ";
            values += ", ";
        }
        if (value.is_default()) {
            throw QueryError::invalid_syntax("DEFAULT is not allowed in UPSERT column '" + column + "'");
        }
        names.push_back(column);
        columns += dialect_->quote_identifier(column);
        // Every column is bound so the conflict clause can refer back by index
        values += bind(value, q.params);
    }

    q.sql = "INSERT INTO " + quoted_table() + " (" + columns + ") VALUES (" + values + ")";
    q.sql += dialect_->upsert_syntax(names, conflict_columns, 1);
    q.sql += build_returning_clause();
    log_debug("SQL " + q.sql);
    return q;
}

std::string QueryBuilder::to_debug_string() const {
    BuiltQuery q = build();
    std::string out = q.sql + " -- [";
    for (size_t i = 0; i < q.params.size(); ++i) {
        if (i > 0) out += ", ";
        out += q.params[i].to_sql_string();
    }
    return out + "]";
}

} // namespace mvcore::sql
