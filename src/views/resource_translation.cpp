// src/views/resource_translation.cpp
#include "mvcore/views/resource_translation.h"
#include "common/log.h"
#include "common/utils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mvcore {

namespace {

std::string unescape_value(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c != '\\' || i + 1 == s.size()) {
            out += c;
            continue;
        }
        char next = s[++i];
        switch (next) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case '\\': out += '\\'; break;
            case '"': out += '"'; break;
            default:
                out += c;
                out += next;
        }
    }
    return out;
}

} // namespace

ResourceTable parse_resource(std::string_view content) {
    ResourceTable table;
    TranslationTable* current = &table.global;

    std::istringstream in{std::string(content)};
    std::string raw;
    size_t line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
            std::string section = trim(line.substr(1, line.size() - 2));
            current = section == "global" ? &table.global : &table.sections[section];
            continue;
        }

        auto sep = line.find(" : ");
        if (sep == std::string::npos) {
            log_debug("Resource line " + std::to_string(line_no) + " has no 'key : value' pair, skipped");
            continue;
        }
        std::string key = trim(line.substr(0, sep));
        std::string value = trim(line.substr(sep + 3));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = unescape_value(std::string_view(value).substr(1, value.size() - 2));
        }
        (*current)[std::move(key)] = std::move(value);
    }
    return table;
}

std::string view_section_name(std::string_view view_path) {
    std::string path(view_path);
    while (path.starts_with("/")) path.erase(0, 1);
    if (path.ends_with(".html")) path.resize(path.size() - 5);
    if (path.starts_with("views/")) return path;
    return "views/" + path;
}

ResourceTranslations::ResourceTranslations(std::string language, std::string fallback_language)
    : language_(std::move(language)), fallback_language_(std::move(fallback_language)) {}

void ResourceTranslations::load_resource_string(const std::string& language, std::string_view content) {
    ResourceTable parsed = parse_resource(content);
    ResourceTable& table = tables_[language];
    for (auto& [key, value] : parsed.global) {
        table.global[key] = std::move(value);
    }
    for (auto& [section, entries] : parsed.sections) {
        auto& target = table.sections[section];
        for (auto& [key, value] : entries) {
            target[key] = std::move(value);
        }
    }
    clear_cache();
}

void ResourceTranslations::load_resource(const std::string& language, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open translation file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    load_resource_string(language, buffer.str());
}

std::vector<std::string> ResourceTranslations::load_directory(const std::string& directory) {
    namespace fs = std::filesystem;
    std::vector<std::string> loaded;
    if (!fs::is_directory(directory)) {
        log_warning("Translation directory not found: " + directory);
        return loaded;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (entry.is_regular_file() && entry.path().extension() == ".res") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    // default.res is the base the fallback language's own file refines
    fs::path defaults = fs::path(directory) / "default.res";
    if (fs::is_regular_file(defaults)) {
        load_resource(fallback_language_, defaults.string());
        loaded.push_back(fallback_language_);
    }
    for (const auto& path : files) {
        std::string language = path.stem().string();
        if (language == "default") continue;
        load_resource(language, path.string());
        if (std::find(loaded.begin(), loaded.end(), language) == loaded.end()) {
            loaded.push_back(language);
        }
    }
    return loaded;
}

void ResourceTranslations::set_language(std::string language) {
    if (language_ == language) return;
    language_ = std::move(language);
    clear_cache();
}

void ResourceTranslations::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    view_cache_.clear();
}

void ResourceTranslations::merge_view_entries(TranslationTable& merged, const std::string& language,
                                              const std::string& section, bool override_existing) const {
    auto lang_it = tables_.find(language);
    if (lang_it == tables_.end()) return;

    auto merge = [&](const TranslationTable& entries) {
        for (const auto& [key, value] : entries) {
            if (override_existing) merged[key] = value;
            else merged.emplace(key, value);
        }
    };
    merge(lang_it->second.global);
    auto section_it = lang_it->second.sections.find(section);
    if (section_it != lang_it->second.sections.end()) merge(section_it->second);
}

std::shared_ptr<const Translator> ResourceTranslations::view_translator(const std::string& view_path) const {
    const std::string section = view_section_name(view_path);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = view_cache_.find(section);
        if (it != view_cache_.end()) return it->second;
    }

    TranslationTable merged;
    merge_view_entries(merged, language_, section, true);
    if (fallback_language_ != language_) {
        merge_view_entries(merged, fallback_language_, section, false);
    }

    auto translator = std::make_shared<Translator>(language_, language_);
    for (auto& [key, value] : merged) {
        translator->add_translation(language_, key, std::move(value));
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    return view_cache_.emplace(section, std::move(translator)).first->second;
}

} // namespace mvcore
