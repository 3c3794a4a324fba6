// mvcore/sql/sql_value.h
#ifndef MVCORE_SQL_SQL_VALUE_H
#define MVCORE_SQL_SQL_VALUE_H

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace mvcore::sql {

enum class SqlValueKind : uint8_t {
    NULL_VALUE,
    DEFAULT,     // DEFAULT keyword, never bound
    BOOL,
    INT,
    UINT,
    DOUBLE,
    DECIMAL,     // exact numeric kept as text
    STRING,
    TEXT,
    BYTES,
    ENUM,        // "value::pg_type"
    UUID,
    JSON,
    DATE,
    TIME,
    DATETIME,
    TIMESTAMP,   // unix seconds
    INET,
    CIDR,
    ARRAY
};

// A typed value bound to a query placeholder
class SqlValue {
public:
    using Bytes = std::vector<uint8_t>;

    SqlValue() = default;
    SqlValue(std::nullptr_t) {}
    SqlValue(bool b);
    SqlValue(int i);
    SqlValue(long i);
    SqlValue(long long i);
    SqlValue(unsigned int u);
    SqlValue(unsigned long u);
    SqlValue(unsigned long long u);
    SqlValue(float d);
    SqlValue(double d);
    // Strings shaped "value::type" become ENUM
    SqlValue(const char* s);
    SqlValue(std::string s);
    SqlValue(Bytes bytes);
    explicit SqlValue(nlohmann::json j);

    template<typename T>
    SqlValue(const std::optional<T>& opt) {
        if (opt.has_value()) *this = SqlValue(*opt);
    }

    static SqlValue null() { return SqlValue(); }
    static SqlValue default_value();
    static SqlValue decimal(std::string digits);
    static SqlValue text(std::string s);
    static SqlValue plain_string(std::string s); // STRING even when it contains "::"
    static SqlValue enum_value(std::string value, std::string pg_type = "");
    static SqlValue uuid(std::string s);
    static SqlValue json(nlohmann::json j);
    static SqlValue date(std::string iso_date);
    static SqlValue time(std::string iso_time);
    static SqlValue datetime(std::string iso_datetime);
    static SqlValue timestamp(int64_t unix_seconds);
    static SqlValue inet(std::string address);
    static SqlValue cidr(std::string address, uint8_t prefix);
    static SqlValue array(std::vector<SqlValue> items);

    SqlValueKind kind() const { return kind_; }
    bool is_null() const { return kind_ == SqlValueKind::NULL_VALUE; }
    bool is_default() const { return kind_ == SqlValueKind::DEFAULT; }

    std::optional<bool> as_bool() const;
    std::optional<int64_t> as_int64() const;
    std::optional<double> as_double() const;
    std::optional<std::string> as_string() const;
    const std::vector<SqlValue>& items() const { return items_; }

    // ENUM only: (value, pg_type); pg_type empty when untyped
    std::pair<std::string, std::string> enum_parts() const;
    bool is_typed_enum() const { return kind_ == SqlValueKind::ENUM && !aux_.empty(); }

    // Literal SQL text: quotes doubled, bytes as X'..', arrays as ARRAY[..]
    std::string to_sql_string() const;
    nlohmann::json to_json() const;
    const char* type_name() const;

    bool operator==(const SqlValue& other) const;
    bool operator!=(const SqlValue& other) const { return !(*this == other); }

private:
    SqlValueKind kind_ = SqlValueKind::NULL_VALUE;
    bool bool_ = false;
    int64_t int_ = 0;
    uint64_t uint_ = 0;
    double double_ = 0.0;
    std::string text_;
    std::string aux_;  // enum type name
    Bytes bytes_;
    nlohmann::json json_;
    std::vector<SqlValue> items_;
};

std::ostream& operator<<(std::ostream& os, const SqlValue& v);

} // namespace mvcore::sql

#endif // MVCORE_SQL_SQL_VALUE_H
