// src/sql/sql_value.cpp
#include "mvcore/sql/sql_value.h"
#include "common/utils.h"
#include <cstdio>
#include <ostream>
#include <sstream>

namespace mvcore::sql {

namespace {

std::string quote_literal(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string hex_encode(const SqlValue::Bytes& bytes) {
    static const char* digits = "0123456789ABCDEF";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

std::string format_double(double d) {
    std::ostringstream oss;
    oss.precision(17);
    oss << d;
    return oss.str();
}

} // namespace

SqlValue::SqlValue(bool b) : kind_(SqlValueKind::BOOL), bool_(b) {}
SqlValue::SqlValue(int i) : kind_(SqlValueKind::INT), int_(i) {}
SqlValue::SqlValue(long i) : kind_(SqlValueKind::INT), int_(i) {}
SqlValue::SqlValue(long long i) : kind_(SqlValueKind::INT), int_(i) {}
SqlValue::SqlValue(unsigned int u) : kind_(SqlValueKind::UINT), uint_(u) {}
SqlValue::SqlValue(unsigned long u) : kind_(SqlValueKind::UINT), uint_(u) {}
SqlValue::SqlValue(unsigned long long u) : kind_(SqlValueKind::UINT), uint_(u) {}
SqlValue::SqlValue(float d) : kind_(SqlValueKind::DOUBLE), double_(d) {}
SqlValue::SqlValue(double d) : kind_(SqlValueKind::DOUBLE), double_(d) {}

SqlValue::SqlValue(const char* s) : SqlValue(std::string(s ? s : "")) {}

SqlValue::SqlValue(std::string s) : kind_(SqlValueKind::STRING), text_(std::move(s)) {
    auto pos = text_.find("::");
    if (pos != std::string::npos && pos > 0 && pos + 2 < text_.size()) {
        kind_ = SqlValueKind::ENUM;
        aux_ = text_.substr(pos + 2);
        text_.resize(pos);
    }
}

SqlValue::SqlValue(Bytes bytes) : kind_(SqlValueKind::BYTES), bytes_(std::move(bytes)) {}

SqlValue::SqlValue(nlohmann::json j) : kind_(SqlValueKind::JSON), json_(std::move(j)) {}

SqlValue SqlValue::default_value() {
    SqlValue v;
    v.kind_ = SqlValueKind::DEFAULT;
    return v;
}

SqlValue SqlValue::decimal(std::string digits) {
    SqlValue v;
    v.kind_ = SqlValueKind::DECIMAL;
    v.text_ = std::move(digits);
    return v;
}

SqlValue SqlValue::text(std::string s) {
    SqlValue v;
    v.kind_ = SqlValueKind::TEXT;
    v.text_ = std::move(s);
    return v;
}

SqlValue SqlValue::plain_string(std::string s) {
    SqlValue v;
    v.kind_ = SqlValueKind::STRING;
    v.text_ = std::move(s);
    return v;
}

SqlValue SqlValue::enum_value(std::string value, std::string pg_type) {
    SqlValue v;
    v.kind_ = SqlValueKind::ENUM;
    v.text_ = std::move(value);
    v.aux_ = std::move(pg_type);
    return v;
}

SqlValue SqlValue::uuid(std::string s) {
    SqlValue v;
    v.kind_ = SqlValueKind::UUID;
    v.text_ = std::move(s);
    return v;
}

SqlValue SqlValue::json(nlohmann::json j) {
    return SqlValue(std::move(j));
}

SqlValue SqlValue::date(std::string iso_date) {
    SqlValue v;
    v.kind_ = SqlValueKind::DATE;
    v.text_ = std::move(iso_date);
    return v;
}

SqlValue SqlValue::time(std::string iso_time) {
    SqlValue v;
    v.kind_ = SqlValueKind::TIME;
    v.text_ = std::move(iso_time);
    return v;
}

SqlValue SqlValue::datetime(std::string iso_datetime) {
    SqlValue v;
    v.kind_ = SqlValueKind::DATETIME;
    v.text_ = std::move(iso_datetime);
    return v;
}

SqlValue SqlValue::timestamp(int64_t unix_seconds) {
    SqlValue v;
    v.kind_ = SqlValueKind::TIMESTAMP;
    v.int_ = unix_seconds;
    return v;
}

SqlValue SqlValue::inet(std::string address) {
    SqlValue v;
    v.kind_ = SqlValueKind::INET;
    v.text_ = std::move(address);
    return v;
}

SqlValue SqlValue::cidr(std::string address, uint8_t prefix) {
    SqlValue v;
    v.kind_ = SqlValueKind::CIDR;
    v.text_ = std::move(address);
    v.uint_ = prefix;
    return v;
}

SqlValue SqlValue::array(std::vector<SqlValue> items) {
    SqlValue v;
    v.kind_ = SqlValueKind::ARRAY;
    v.items_ = std::move(items);
    return v;
}

std::optional<bool> SqlValue::as_bool() const {
    switch (kind_) {
        case SqlValueKind::BOOL: return bool_;
        case SqlValueKind::INT: return int_ != 0;
        case SqlValueKind::UINT: return uint_ != 0;
        default: return std::nullopt;
    }
}

std::optional<int64_t> SqlValue::as_int64() const {
    switch (kind_) {
        case SqlValueKind::INT:
        case SqlValueKind::TIMESTAMP:
            return int_;
        case SqlValueKind::UINT:
            return static_cast<int64_t>(uint_);
        case SqlValueKind::BOOL:
            return bool_ ? 1 : 0;
        default:
            return std::nullopt;
    }
}

std::optional<double> SqlValue::as_double() const {
    switch (kind_) {
        case SqlValueKind::DOUBLE: return double_;
        case SqlValueKind::INT: return static_cast<double>(int_);
        case SqlValueKind::UINT: return static_cast<double>(uint_);
        case SqlValueKind::DECIMAL:
            try {
                return std::stod(text_);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        default: return std::nullopt;
    }
}

std::optional<std::string> SqlValue::as_string() const {
    switch (kind_) {
        case SqlValueKind::STRING:
        case SqlValueKind::TEXT:
        case SqlValueKind::DECIMAL:
        case SqlValueKind::ENUM:
        case SqlValueKind::UUID:
        case SqlValueKind::DATE:
        case SqlValueKind::TIME:
        case SqlValueKind::DATETIME:
        case SqlValueKind::INET:
            return text_;
        case SqlValueKind::CIDR:
            return text_ + "/" + std::to_string(uint_);
        default:
            return std::nullopt;
    }
}

std::pair<std::string, std::string> SqlValue::enum_parts() const {
    return {text_, aux_};
}

std::string SqlValue::to_sql_string() const {
    switch (kind_) {
        case SqlValueKind::NULL_VALUE: return "NULL";
        case SqlValueKind::DEFAULT: return "DEFAULT";
        case SqlValueKind::BOOL: return bool_ ? "true" : "false";
        case SqlValueKind::INT:
        case SqlValueKind::TIMESTAMP:
            return std::to_string(int_);
        case SqlValueKind::UINT: return std::to_string(uint_);
        case SqlValueKind::DOUBLE: return format_double(double_);
        case SqlValueKind::DECIMAL: return text_;
        case SqlValueKind::STRING:
        case SqlValueKind::TEXT:
        case SqlValueKind::ENUM:
        case SqlValueKind::UUID:
        case SqlValueKind::DATE:
        case SqlValueKind::TIME:
        case SqlValueKind::DATETIME:
            return quote_literal(text_);
        case SqlValueKind::BYTES: return "X'" + hex_encode(bytes_) + "'";
        case SqlValueKind::JSON: return quote_literal(dump_json(json_));
        case SqlValueKind::INET: return quote_literal(text_) + "::inet";
        case SqlValueKind::CIDR: return quote_literal(text_ + "/" + std::to_string(uint_)) + "::cidr";
        case SqlValueKind::ARRAY: {
            std::string out = "ARRAY[";
            for (size_t i = 0; i < items_.size(); ++i) {
                if (i > 0) out += ", ";
                out += items_[i].to_sql_string();
            }
            return out + "]";
        }
    }
    return "NULL";
}

nlohmann::json SqlValue::to_json() const {
    switch (kind_) {
        case SqlValueKind::NULL_VALUE:
        case SqlValueKind::DEFAULT:
            return nullptr;
        case SqlValueKind::BOOL: return bool_;
        case SqlValueKind::INT:
        case SqlValueKind::TIMESTAMP:
            return int_;
        case SqlValueKind::UINT: return uint_;
        case SqlValueKind::DOUBLE: return double_;
        case SqlValueKind::BYTES: return hex_encode(bytes_);
        case SqlValueKind::JSON: return json_;
        case SqlValueKind::ARRAY: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : items_) arr.push_back(item.to_json());
            return arr;
        }
        default:
            return as_string().value_or("");
    }
}

const char* SqlValue::type_name() const {
    switch (kind_) {
        case SqlValueKind::NULL_VALUE: return "null";
        case SqlValueKind::DEFAULT: return "default";
        case SqlValueKind::BOOL: return "bool";
        case SqlValueKind::INT: return "int";
        case SqlValueKind::UINT: return "uint";
        case SqlValueKind::DOUBLE: return "double";
        case SqlValueKind::DECIMAL: return "decimal";
        case SqlValueKind::STRING: return "string";
        case SqlValueKind::TEXT: return "text";
        case SqlValueKind::BYTES: return "bytes";
        case SqlValueKind::ENUM: return "enum";
        case SqlValueKind::UUID: return "uuid";
        case SqlValueKind::JSON: return "json";
        case SqlValueKind::DATE: return "date";
        case SqlValueKind::TIME: return "time";
        case SqlValueKind::DATETIME: return "datetime";
        case SqlValueKind::TIMESTAMP: return "timestamp";
        case SqlValueKind::INET: return "inet";
        case SqlValueKind::CIDR: return "cidr";
        case SqlValueKind::ARRAY: return "array";
    }
    return "unknown";
}

bool SqlValue::operator==(const SqlValue& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case SqlValueKind::NULL_VALUE:
        case SqlValueKind::DEFAULT:
            return true;
        case SqlValueKind::BOOL: return bool_ == other.bool_;
        case SqlValueKind::INT:
        case SqlValueKind::TIMESTAMP:
            return int_ == other.int_;
        case SqlValueKind::UINT: return uint_ == other.uint_;
        case SqlValueKind::DOUBLE: return double_ == other.double_;
        case SqlValueKind::BYTES: return bytes_ == other.bytes_;
        case SqlValueKind::JSON: return json_ == other.json_;
        case SqlValueKind::ARRAY: return items_ == other.items_;
        case SqlValueKind::CIDR: return text_ == other.text_ && uint_ == other.uint_;
        default:
            return text_ == other.text_ && aux_ == other.aux_;
    }
}

std::ostream& operator<<(std::ostream& os, const SqlValue& v) {
    return os << v.to_sql_string();
}

} // namespace mvcore::sql
