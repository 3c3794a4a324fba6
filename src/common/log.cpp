// src/common/log.cpp
#include "common/log.h"
#include "common/types.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace mvcore {

namespace {
std::atomic<LogLevel> g_level{LogLevel::WARNING};
std::mutex g_log_mutex;

void write_line(LogLevel level, const char* tag, const std::string& message) {
    if (level < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << tag << " " << message << std::endl;
}
} // namespace

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off" || name == "none") return LogLevel::OFF;
    throw ConfigError("Unknown log level '" + name + "'");
}

void log_debug(const std::string& message) { write_line(LogLevel::DEBUG, "[DEBUG]", message); }
void log_info(const std::string& message) { write_line(LogLevel::INFO, "[INFO]", message); }
void log_warning(const std::string& message) { write_line(LogLevel::WARNING, "[WARNING]", message); }
void log_error(const std::string& message) { write_line(LogLevel::ERROR, "[ERROR]", message); }

} // namespace mvcore
