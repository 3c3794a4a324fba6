// src/common/utils.cpp
#include "common/utils.h"
#include <cctype>
#include <cmath>
#include <string>

namespace mvcore {

std::string trim(std::string_view s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(start, end - start));
}

std::vector<std::string> split(std::string_view s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> split_arguments(std::string_view s) {
    std::vector<std::string> args;
    std::string current;
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            current += c;
            if (c == '\\' && i + 1 < s.size()) {
                current += s[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --depth;
        } else if (c == ',' && depth == 0) {
            args.push_back(trim(current));
            current.clear();
            continue;
        }
        current += c;
    }
    std::string last = trim(current);
    if (!last.empty() || !args.empty()) {
        args.push_back(last);
    }
    return args;
}

std::string unquote(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '\'' || s.front() == '"') && s.back() == s.front()) {
        return std::string(s.substr(1, s.size() - 2));
    }
    return std::string(s);
}

bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_' || s[0] == '$')) return false;
    for (char c : s) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$')) return false;
    }
    return true;
}

bool is_dotted_path(std::string_view s) {
    if (s.empty()) return false;
    for (const auto& seg : split(s, '.')) {
        if (seg.empty()) return false;
        // numeric segments index arrays: items.0.name
        bool numeric = true;
        for (char c : seg) {
            if (!std::isdigit(static_cast<unsigned char>(c))) { numeric = false; break; }
        }
        if (!numeric && !is_identifier(seg)) return false;
    }
    return is_identifier(split(s, '.').front());
}

std::string html_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + s.size() / 8);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string html_escape_attribute(std::string_view s) {
    std::string out;
    out.reserve(s.size() + s.size() / 8);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            case '=': out += "&#x3D;"; break;
            case '`': out += "&#x60;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string value_to_string(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::null:
            return "";
        case nlohmann::json::value_t::string:
            return v.get<std::string>();
        case nlohmann::json::value_t::boolean:
            return v.get<bool>() ? "true" : "false";
        case nlohmann::json::value_t::number_float: {
            double d = v.get<double>();
            // 2.0 prints as "2"
            if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
                return std::to_string(static_cast<long long>(d));
            }
            return dump_json(v);
        }
        default:
            return dump_json(v);
    }
}

std::string dump_json(const nlohmann::json& v) {
    return v.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool is_truthy(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::null:
            return false;
        case nlohmann::json::value_t::boolean:
            return v.get<bool>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return v.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !v.get_ref<const std::string&>().empty();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            return !v.empty();
        default:
            return true;
    }
}

} // namespace mvcore
