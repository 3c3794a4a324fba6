#ifndef MVCORE_COMMON_UTILS_H
#define MVCORE_COMMON_UTILS_H

#include "types.h"
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace mvcore {

// Whitespace trimming, returns a copy
std::string trim(std::string_view s);

// Split on a single character; empty segments are kept
std::vector<std::string> split(std::string_view s, char delim);

// Split a comma separated argument list, ignoring commas inside quotes,
// parentheses, brackets and braces
std::vector<std::string> split_arguments(std::string_view s);

// Strip one level of matching single or double quotes
std::string unquote(std::string_view s);

bool is_identifier(std::string_view s);

// Identifier segments joined with '.', e.g. "user.profile.name"
bool is_dotted_path(std::string_view s);

// & < > " ' -> entities
std::string html_escape(std::string_view s);

// html_escape plus '=' and '`', for attribute values
std::string html_escape_attribute(std::string_view s);

// Template output form of a value: strings unquoted, null empty,
// containers as compact JSON
std::string value_to_string(const nlohmann::json& v);

// Compact JSON text; invalid UTF-8 in strings becomes U+FFFD instead of throwing
std::string dump_json(const nlohmann::json& v);

// null, false, 0, "", [] and {} are false
bool is_truthy(const nlohmann::json& v);

nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace mvcore

#endif // MVCORE_COMMON_UTILS_H
