// mvcore/views/template_cache.h
#ifndef MVCORE_VIEWS_TEMPLATE_CACHE_H
#define MVCORE_VIEWS_TEMPLATE_CACHE_H

#include "mvcore/views/ast.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mvcore {

// Compiled templates keyed by file path. Lookups share a reader lock;
// reading and parsing a file happen outside any lock, so two threads
// missing on the same path may both compile it and the later insert wins.
class TemplateCache {
public:
    explicit TemplateCache(bool hot_reload = false) : hot_reload_(hot_reload) {}

    // Throws TemplateNotFoundError, TemplateParseError
    [[nodiscard]] std::shared_ptr<const Template> get_or_compile(const std::string& path);

    void invalidate(const std::string& path);
    void clear();
    size_t size() const;

    // Hot reload: always recompile, never store
    void set_hot_reload(bool enabled) { hot_reload_.store(enabled); }
    bool hot_reload() const { return hot_reload_.load(); }

    // Number of file compilations since construction
    size_t compile_count() const { return compile_count_.load(); }

private:
    struct Entry {
        std::shared_ptr<const Template> tpl;
        std::filesystem::file_time_type mtime;
        std::chrono::system_clock::time_point compiled_at;
    };

    std::shared_ptr<const Template> compile(const std::string& path) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::atomic<bool> hot_reload_;
    mutable std::atomic<size_t> compile_count_{0};
};

} // namespace mvcore

#endif // MVCORE_VIEWS_TEMPLATE_CACHE_H
