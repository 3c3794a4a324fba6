// mvcore/views/translation.h
#ifndef MVCORE_VIEWS_TRANSLATION_H
#define MVCORE_VIEWS_TRANSLATION_H

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace mvcore {

// Key generated for free text in @(text): ASCII letters lowercased, digits
// kept, spaces and '-' become '_', everything else dropped; at most 30
// characters, outer '_' trimmed. "Save changes!" -> "save_changes"
std::string translation_key(std::string_view text);

// Per-language key -> text tables for @(text) and @(#key)
class Translator {
public:
    explicit Translator(std::string language = "en", std::string fallback_language = "en");

    void add_translation(const std::string& language, std::string key, std::string text);

    // Nested objects are flattened with '.': {"nav": {"home": "Home"}} -> nav.home
    void load_from_json(const std::string& language, const nlohmann::json& table);

    // <dir>/<lang>.json for every .json file in dir; returns loaded languages
    std::vector<std::string> load_directory(const std::string& directory);

    void set_language(std::string language) { language_ = std::move(language); }
    const std::string& language() const { return language_; }
    const std::string& fallback_language() const { return fallback_language_; }
    bool has_language(const std::string& language) const { return tables_.count(language) > 0; }

    // current -> fallback -> "[key]"
    std::string translate_key(const std::string& key) const;
    // Exact text then translation_key(text), current language before the
    // fallback; text unchanged when neither matches
    std::string translate_text(const std::string& text) const;

private:
    const std::string* lookup(const std::string& language, const std::string& key) const;
    void flatten_into(std::unordered_map<std::string, std::string>& table, const std::string& prefix,
                      const nlohmann::json& node);

    std::string language_;
    std::string fallback_language_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> tables_;
};

} // namespace mvcore

#endif // MVCORE_VIEWS_TRANSLATION_H
