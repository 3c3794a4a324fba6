// mvcore/views/resource_translation.h
#ifndef MVCORE_VIEWS_RESOURCE_TRANSLATION_H
#define MVCORE_VIEWS_RESOURCE_TRANSLATION_H

#include "mvcore/views/translation.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mvcore {

using TranslationTable = std::unordered_map<std::string, std::string>;

// One parsed .res file:
//
//   # comment
//   title : "Site"          <- before any header: global section
//   [global]
//   save : "Save"
//   [views/home/index]
//   welcome : "Welcome\n"   <- \n \r \t \\ \" are unescaped inside quotes
struct ResourceTable {
    TranslationTable global;
    std::unordered_map<std::string, TranslationTable> sections;
};

ResourceTable parse_resource(std::string_view content);

// "home/index.html" and "/home/index" -> "views/home/index"
std::string view_section_name(std::string_view view_path);

// Sectioned translations keyed by language. Each view sees the global
// entries overridden by its own [views/<path>] section, with keys missing in
// the current language taken from the fallback language.
class ResourceTranslations {
public:
    explicit ResourceTranslations(std::string language = "en", std::string fallback_language = "en");

    ResourceTranslations(const ResourceTranslations&) = delete;
    ResourceTranslations& operator=(const ResourceTranslations&) = delete;

    // Entries override those already loaded for the language
    void load_resource_string(const std::string& language, std::string_view content);
    void load_resource(const std::string& language, const std::string& path);

    // <lang>.res for every .res file in directory; default.res is loaded
    // first under the fallback language. Returns the languages loaded.
    std::vector<std::string> load_directory(const std::string& directory);

    void set_language(std::string language);
    const std::string& language() const { return language_; }
    const std::string& fallback_language() const { return fallback_language_; }
    bool has_language(const std::string& language) const { return tables_.count(language) > 0; }

    // Merged table for a view, built once per view and shared afterwards
    std::shared_ptr<const Translator> view_translator(const std::string& view_path) const;

private:
    void merge_view_entries(TranslationTable& merged, const std::string& language, const std::string& section,
                            bool override_existing) const;
    void clear_cache();

    std::string language_;
    std::string fallback_language_;
    std::unordered_map<std::string, ResourceTable> tables_;

    mutable std::mutex cache_mutex_;
    mutable std::map<std::string, std::shared_ptr<const Translator>> view_cache_;
};

} // namespace mvcore

#endif // MVCORE_VIEWS_RESOURCE_TRANSLATION_H
