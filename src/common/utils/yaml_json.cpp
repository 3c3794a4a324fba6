// src/common/utils/yaml_json.cpp
#include "common/utils.h"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mvcore {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Integers, floats and scientific notation
bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            // Quoted scalars carry the "!" tag and always stay strings: "8080", "true"
            if (node.Tag() == "!") return s;

            if (s == "true" || s == "True" || s == "TRUE") return true;
            if (s == "false" || s == "False" || s == "FALSE") return false;
            if (s == "~" || s == "null" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // Too large for a number, keep the text
                    return s;
                }
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

} // namespace mvcore
