// src/config/app_config.cpp
#include "mvcore/config/app_config.h"
#include "common/utils.h"
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace mvcore {

namespace {

const Value* section(const Value& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("'") + name + "' must be a mapping");
    }
    return &*it;
}

void read_string(const Value& sec, const char* sec_name, const char* key, std::string& out) {
    auto it = sec.find(key);
    if (it == sec.end() || it->is_null()) return;
    if (!it->is_string()) {
        throw ConfigError(std::string(sec_name) + "." + key + " must be a string");
    }
    out = it->get<std::string>();
}

void read_bool(const Value& sec, const char* sec_name, const char* key, bool& out) {
    auto it = sec.find(key);
    if (it == sec.end() || it->is_null()) return;
    if (!it->is_boolean()) {
        throw ConfigError(std::string(sec_name) + "." + key + " must be true or false");
    }
    out = it->get<bool>();
}

void read_size(const Value& sec, const char* sec_name, const char* key, size_t& out) {
    auto it = sec.find(key);
    if (it == sec.end() || it->is_null()) return;
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
        throw ConfigError(std::string(sec_name) + "." + key + " must be a non-negative integer");
    }
    out = it->get<size_t>();
}

} // namespace

AppConfig AppConfig::from_yaml_string(const std::string& yaml) {
    Value doc;
    try {
        YAML::Node root = YAML::Load(yaml);
        doc = yaml_to_json(root);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("YAML parse error: ") + e.what());
    }

    if (doc.is_null()) {
        doc = Value::object();
    }
    if (!doc.is_object()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    AppConfig config;
    config.raw = doc;

    if (const Value* views = section(doc, "views")) {
        read_string(*views, "views", "directory", config.views.directory);
        read_string(*views, "views", "default_layout", config.views.default_layout);
        read_bool(*views, "views", "cache_enabled", config.views.cache_enabled);
        read_string(*views, "views", "extension", config.views.extension);
        read_string(*views, "views", "default_root", config.views.default_root);
        read_bool(*views, "views", "strict_partials", config.views.strict_partials);
        read_size(*views, "views", "max_include_depth", config.views.max_include_depth);
    }

    if (const Value* database = section(doc, "database")) {
        std::string backend;
        read_string(*database, "database", "backend", backend);
        if (!backend.empty()) {
            config.backend = sql::parse_backend(backend);
        }
    }

    if (const Value* logging = section(doc, "logging")) {
        std::string level;
        read_string(*logging, "logging", "level", level);
        if (!level.empty()) {
            config.log_level = parse_log_level(level);
        }
    }

    return config;
}

AppConfig AppConfig::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return from_yaml_string(buffer.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

Value AppConfig::to_json() const {
    Value out = raw.is_object() ? raw : Value::object();

    Value& views_json = out["views"];
    if (!views_json.is_object()) views_json = Value::object();
    views_json["directory"] = views.directory;
    views_json["default_layout"] = views.default_layout;
    views_json["cache_enabled"] = views.cache_enabled;
    views_json["extension"] = views.extension;
    views_json["default_root"] = views.default_root;
    views_json["strict_partials"] = views.strict_partials;
    views_json["max_include_depth"] = views.max_include_depth;

    Value& database_json = out["database"];
    if (!database_json.is_object()) database_json = Value::object();
    database_json["backend"] = sql::backend_name(backend);

    // Flat aliases used by @{root} and CONF.default_root
    out["default_root"] = views.default_root;
    out["default_layout"] = views.default_layout;
    out["cache_enabled"] = views.cache_enabled;
    return out;
}

void AppConfig::apply_logging() const {
    set_log_level(log_level);
}

} // namespace mvcore
