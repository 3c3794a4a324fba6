// src/sql/query_error.cpp
#include "mvcore/sql/query_error.h"

namespace mvcore::sql {

QueryError QueryError::missing_clause(const std::string& clause) {
    return QueryError(Kind::MISSING_CLAUSE,
                      "Missing required clause: " + clause + ". Add ." + clause + "() to your query.",
                      clause);
}

QueryError QueryError::unsupported_feature(const std::string& feature, const std::string& backend) {
    return QueryError(Kind::UNSUPPORTED_FEATURE,
                      feature + " is not supported by " + backend,
                      feature, backend);
}

QueryError QueryError::invalid_syntax(const std::string& reason) {
    return QueryError(Kind::INVALID_SYNTAX, "Invalid query: " + reason, reason);
}

} // namespace mvcore::sql
