#ifndef MVCORE_COMMON_TYPES_H
#define MVCORE_COMMON_TYPES_H

#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mvcore {

// Template data is plain JSON: null, bool, number, string, array, object
using Value = nlohmann::json;

// String-valued application config, looked up with @{'%key'}
using ConfigMap = std::map<std::string, std::string>;

class TemplateParseError : public std::runtime_error {
public:
    TemplateParseError(const std::string& message, size_t line, size_t column)
        : std::runtime_error(message + " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")"),
          message_(message), line_(line), column_(column) {}

    // Message without the location suffix
    const std::string& message() const { return message_; }
    size_t line() const { return line_; }
    size_t column() const { return column_; }

private:
    std::string message_;
    size_t line_;
    size_t column_;
};

class TemplateRenderError : public std::runtime_error {
public:
    TemplateRenderError(const std::string& message, std::string template_name = "")
        : std::runtime_error(template_name.empty() ? message : "[" + template_name + "] " + message),
          template_name_(std::move(template_name)) {}

    const std::string& template_name() const { return template_name_; }

private:
    std::string template_name_;
};

// A view, layout or partial file does not exist
class TemplateNotFoundError : public std::runtime_error {
public:
    explicit TemplateNotFoundError(const std::string& path)
        : std::runtime_error("Template not found: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace mvcore

#endif // MVCORE_COMMON_TYPES_H
