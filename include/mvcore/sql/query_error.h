// mvcore/sql/query_error.h
#ifndef MVCORE_SQL_QUERY_ERROR_H
#define MVCORE_SQL_QUERY_ERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mvcore::sql {

class QueryError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        MISSING_CLAUSE,
        UNSUPPORTED_FEATURE,
        INVALID_SYNTAX
    };

    static QueryError missing_clause(const std::string& clause);
    static QueryError unsupported_feature(const std::string& feature, const std::string& backend);
    static QueryError invalid_syntax(const std::string& reason);

    Kind kind() const { return kind_; }
    // Clause name, feature name or reason, without the surrounding message
    const std::string& detail() const { return detail_; }
    // Empty unless kind() == UNSUPPORTED_FEATURE
    const std::string& backend() const { return backend_; }

private:
    QueryError(Kind kind, const std::string& message, std::string detail, std::string backend = "")
        : std::runtime_error(message), kind_(kind), detail_(std::move(detail)), backend_(std::move(backend)) {}

    Kind kind_;
    std::string detail_;
    std::string backend_;
};

} // namespace mvcore::sql

#endif // MVCORE_SQL_QUERY_ERROR_H
