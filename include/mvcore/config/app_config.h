// mvcore/config/app_config.h
#ifndef MVCORE_CONFIG_APP_CONFIG_H
#define MVCORE_CONFIG_APP_CONFIG_H

#include "common/log.h"
#include "common/types.h"
#include "mvcore/sql/dialect.h"
#include "mvcore/views/engine.h"
#include <string>

namespace mvcore {

// Application settings loaded from YAML:
//
//   views:    { directory, default_layout, cache_enabled, extension,
//               default_root, strict_partials, max_include_depth }
//   database: { backend: postgres | mysql | mariadb | sqlite }
//   logging:  { level: debug | info | warning | error | off }
//
// Missing keys keep their defaults. Keys of the wrong type raise ConfigError.
struct AppConfig {
    ViewConfig views;
    sql::DatabaseBackend backend = sql::DatabaseBackend::POSTGRES;
    LogLevel log_level = LogLevel::WARNING;
    // The whole document, exposed to templates as CONF
    Value raw = Value::object();

    static AppConfig from_yaml_string(const std::string& yaml);
    static AppConfig from_file(const std::string& path);

    // raw with the effective settings filled in
    Value to_json() const;

    // Sets the process log level from this config
    void apply_logging() const;
};

} // namespace mvcore

#endif // MVCORE_CONFIG_APP_CONFIG_H
