#ifndef MVCORE_COMMON_LOG_H
#define MVCORE_COMMON_LOG_H

#include <cstdint>
#include <string>

namespace mvcore {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

// Process wide threshold, default WARNING
void set_log_level(LogLevel level);
LogLevel log_level();

// "debug" | "info" | "warning" | "error" | "off"
LogLevel parse_log_level(const std::string& name);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warning(const std::string& message);
void log_error(const std::string& message);

} // namespace mvcore

#endif // MVCORE_COMMON_LOG_H
