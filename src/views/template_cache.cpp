// src/views/template_cache.cpp
#include "mvcore/views/template_cache.h"
#include "mvcore/views/parser.h"
#include "common/log.h"
#include "common/types.h"
#include <fstream>
#include <mutex>
#include <sstream>

namespace mvcore {

std::shared_ptr<const Template> TemplateCache::compile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw TemplateNotFoundError(path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    ++compile_count_;
    log_debug("Compiling template " + path);
    TemplateParser parser;
    return std::make_shared<const Template>(parser.parse_from_string(buffer.str(), path));
}

std::shared_ptr<const Template> TemplateCache::get_or_compile(const std::string& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        throw TemplateNotFoundError(path);
    }

    if (hot_reload()) {
        return compile(path);
    }

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(path);
        if (it != entries_.end() && it->second.mtime >= mtime) {
            return it->second.tpl;
        }
    }

    auto tpl = compile(path);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_[path] = Entry{tpl, mtime, std::chrono::system_clock::now()};
    }
    return tpl;
}

void TemplateCache::invalidate(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(path);
}

void TemplateCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

size_t TemplateCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace mvcore
