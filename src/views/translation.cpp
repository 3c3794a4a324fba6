// src/views/translation.cpp
#include "mvcore/views/translation.h"
#include "common/log.h"
#include "common/utils.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace mvcore {

std::string translation_key(std::string_view text) {
    constexpr size_t kMaxKeyLength = 30;
    std::string key;
    for (char c : text) {
        if (key.size() == kMaxKeyLength) break;
        if (c >= 'a' && c <= 'z') key += c;
        else if (c >= '0' && c <= '9') key += c;
        else if (c >= 'A' && c <= 'Z') key += static_cast<char>(c - 'A' + 'a');
        else if (c == ' ' || c == '-') key += '_';
    }
    size_t first = key.find_first_not_of('_');
    if (first == std::string::npos) return "";
    size_t last = key.find_last_not_of('_');
    return key.substr(first, last - first + 1);
}

Translator::Translator(std::string language, std::string fallback_language)
    : language_(std::move(language)), fallback_language_(std::move(fallback_language)) {}

void Translator::add_translation(const std::string& language, std::string key, std::string text) {
    tables_[language][std::move(key)] = std::move(text);
}

void Translator::flatten_into(std::unordered_map<std::string, std::string>& table, const std::string& prefix,
                              const nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            flatten_into(table, prefix.empty() ? it.key() : prefix + "." + it.key(), it.value());
        }
    } else if (!prefix.empty()) {
        table[prefix] = value_to_string(node);
    }
}

void Translator::load_from_json(const std::string& language, const nlohmann::json& table) {
    if (!table.is_object()) {
        throw std::runtime_error("Translation table for '" + language + "' must be a JSON object");
    }
    flatten_into(tables_[language], "", table);
}

std::vector<std::string> Translator::load_directory(const std::string& directory) {
    namespace fs = std::filesystem;
    std::vector<std::string> loaded;
    if (!fs::is_directory(directory)) {
        log_warning("Translation directory not found: " + directory);
        return loaded;
    }
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        std::ifstream file(entry.path());
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open translation file: " + entry.path().string());
        }
        std::string language = entry.path().stem().string();
        try {
            load_from_json(language, nlohmann::json::parse(file));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Invalid translation file " + entry.path().string() + ": " + e.what());
        }
        loaded.push_back(language);
    }
    return loaded;
}

const std::string* Translator::lookup(const std::string& language, const std::string& key) const {
    auto lang_it = tables_.find(language);
    if (lang_it == tables_.end()) return nullptr;
    auto it = lang_it->second.find(key);
    return it == lang_it->second.end() ? nullptr : &it->second;
}

std::string Translator::translate_key(const std::string& key) const {
    if (const auto* text = lookup(language_, key)) return *text;
    if (const auto* text = lookup(fallback_language_, key)) return *text;
    return "[" + key + "]";
}

std::string Translator::translate_text(const std::string& text) const {
    const std::string key = translation_key(text);
    for (const std::string* language : {&language_, &fallback_language_}) {
        if (const auto* t = lookup(*language, text)) return *t;
        if (key.empty() || key == text) continue;
        if (const auto* t = lookup(*language, key)) return *t;
    }
    return text;
}

} // namespace mvcore
