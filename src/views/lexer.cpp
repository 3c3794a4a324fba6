// src/views/lexer.cpp
#include "mvcore/views/lexer.h"
#include "common/types.h"
#include "common/utils.h"

namespace mvcore {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::TEXT: return "text";
        case TokenType::VARIABLE: return "variable";
        case TokenType::RAW_VARIABLE: return "raw variable";
        case TokenType::IF: return "if";
        case TokenType::ELSE_IF: return "else if";
        case TokenType::ELSE: return "else";
        case TokenType::FI: return "fi";
        case TokenType::FOREACH: return "foreach";
        case TokenType::END: return "end";
        case TokenType::BREAK: return "break";
        case TokenType::CONTINUE: return "continue";
        case TokenType::INDEX: return "index";
        case TokenType::SECTION_DEF: return "section";
        case TokenType::SECTION_CALL: return "section()";
        case TokenType::HELPER_DEF: return "helper";
        case TokenType::VIEW: return "view";
        case TokenType::IMPORT: return "import";
        case TokenType::META: return "meta";
        case TokenType::BODY: return "body";
        case TokenType::HEAD: return "head";
        case TokenType::CONTENT: return "content";
        case TokenType::CSRF: return "csrf";
        case TokenType::CONFIG: return "config";
        case TokenType::NAMESPACE: return "namespace";
        case TokenType::TRANSLATE: return "translate";
        case TokenType::TRANSLATE_KEY: return "translate key";
    }
    return "unknown";
}

namespace {

Token make_token(TokenType type, size_t line, size_t column, std::string value = "", std::string extra = "") {
    Token t;
    t.type = type;
    t.value = std::move(value);
    t.extra = std::move(extra);
    t.line = line;
    t.column = column;
    return t;
}

// "name(a, b)" -> inner "a, b"; false when content is not a call of name
bool call_arguments(const std::string& content, const std::string& name, std::string& inner) {
    if (!content.starts_with(name + "(") || content.back() != ')') return false;
    inner = content.substr(name.size() + 1, content.size() - name.size() - 2);
    return true;
}

std::vector<std::string> unquoted_arguments(const std::string& inner) {
    std::vector<std::string> out;
    for (const auto& arg : split_arguments(inner)) {
        out.push_back(unquote(arg));
    }
    return out;
}

bool namespace_directive(const std::string& content, std::string& prefix, std::string& key) {
    static const char* prefixes[] = {"APP", "MAIN", "repository", "R", "model", "M", "session", "query", "user"};
    if (content == "user") {
        prefix = "user";
        key.clear();
        return true;
    }
    if (!is_dotted_path(content)) return false;
    for (const char* p : prefixes) {
        std::string dotted = std::string(p) + ".";
        if (content.starts_with(dotted)) {
            prefix = p;
            key = content.substr(dotted.size());
            return true;
        }
    }
    return false;
}

} // namespace

Token Lexer::classify_directive(const std::string& raw_content, size_t line, size_t column) {
    std::string content = trim(raw_content);
    if (content.empty()) {
        throw TemplateParseError("Empty directive '@{}'", line, column);
    }

    if (content[0] == '!') {
        std::string expr = trim(content.substr(1));
        if (expr.empty()) throw TemplateParseError("Empty raw directive '@{!}'", line, column);
        return make_token(TokenType::RAW_VARIABLE, line, column, expr);
    }

    // Block keywords
    if (content.starts_with("if ") || content.starts_with("if(")) {
        return make_token(TokenType::IF, line, column, trim(content.substr(2)));
    }
    if (content.starts_with("else if ") || content.starts_with("else if(")) {
        return make_token(TokenType::ELSE_IF, line, column, trim(content.substr(7)));
    }
    if (content.starts_with("elif ") || content.starts_with("elif(")) {
        return make_token(TokenType::ELSE_IF, line, column, trim(content.substr(4)));
    }
    if (content == "else") return make_token(TokenType::ELSE, line, column);
    if (content == "fi") return make_token(TokenType::FI, line, column);
    if (content == "end") return make_token(TokenType::END, line, column);
    if (content == "break") return make_token(TokenType::BREAK, line, column);
    if (content == "continue") return make_token(TokenType::CONTINUE, line, column);
    if (content == "index") return make_token(TokenType::INDEX, line, column);
    if (content == "body") return make_token(TokenType::BODY, line, column);
    if (content == "head") return make_token(TokenType::HEAD, line, column);
    if (content == "content") return make_token(TokenType::CONTENT, line, column);
    if (content == "csrf") return make_token(TokenType::CSRF, line, column);

    if (content.starts_with("foreach ")) {
        std::string rest = trim(content.substr(8));
        if (rest.starts_with("var ")) rest = trim(rest.substr(4));
        auto in_pos = rest.find(" in ");
        if (in_pos == std::string::npos) {
            throw TemplateParseError("Invalid foreach directive '" + content + "', expected 'foreach item in collection'", line, column);
        }
        std::string item = trim(rest.substr(0, in_pos));
        std::string collection = trim(rest.substr(in_pos + 4));
        if (!is_identifier(item) || collection.empty()) {
            throw TemplateParseError("Invalid foreach directive '" + content + "'", line, column);
        }
        return make_token(TokenType::FOREACH, line, column, item, collection);
    }

    std::string inner;
    if (call_arguments(content, "section", inner)) {
        std::string name = unquote(trim(inner));
        if (name.empty()) throw TemplateParseError("Section call without a name", line, column);
        return make_token(TokenType::SECTION_CALL, line, column, name);
    }
    if (content.starts_with("section ")) {
        std::string name = trim(content.substr(8));
        if (!is_identifier(name)) {
            throw TemplateParseError("Invalid section name '" + name + "'", line, column);
        }
        return make_token(TokenType::SECTION_DEF, line, column, name);
    }

    if (content.starts_with("helper ")) {
        std::string sig = trim(content.substr(7));
        auto open = sig.find('(');
        if (open == std::string::npos || sig.back() != ')') {
            throw TemplateParseError("Invalid helper definition '" + content + "', expected 'helper name(params)'", line, column);
        }
        std::string name = trim(sig.substr(0, open));
        if (!is_identifier(name)) {
            throw TemplateParseError("Invalid helper name '" + name + "'", line, column);
        }
        Token t = make_token(TokenType::HELPER_DEF, line, column, name);
        for (const auto& p : split_arguments(sig.substr(open + 1, sig.size() - open - 2))) {
            if (!is_identifier(p)) {
                throw TemplateParseError("Invalid helper parameter '" + p + "'", line, column);
            }
            t.args.push_back(p);
        }
        return t;
    }

    if (call_arguments(content, "view", inner)) {
        auto args = split_arguments(inner);
        if (args.empty() || args[0].empty()) {
            throw TemplateParseError("view() requires a view name", line, column);
        }
        std::string model = args.size() > 1 ? args[1] : "";
        return make_token(TokenType::VIEW, line, column, unquote(args[0]), model);
    }

    if (call_arguments(content, "import", inner)) {
        Token t = make_token(TokenType::IMPORT, line, column);
        t.args = unquoted_arguments(inner);
        return t;
    }

    if (content == "meta") return make_token(TokenType::META, line, column);
    if (call_arguments(content, "meta", inner)) {
        Token t = make_token(TokenType::META, line, column);
        t.args = unquoted_arguments(inner);
        return t;
    }

    // @{'%key'}
    if (content.size() >= 4 && content.starts_with("'%") && content.back() == '\'') {
        return make_token(TokenType::CONFIG, line, column, content.substr(2, content.size() - 3));
    }

    std::string prefix;
    std::string key;
    if (namespace_directive(content, prefix, key)) {
        return make_token(TokenType::NAMESPACE, line, column, prefix, key);
    }

    return make_token(TokenType::VARIABLE, line, column, content);
}

void Lexer::advance(size_t n) {
    for (size_t i = 0; i < n && pos_ < source_.size(); ++i) {
        if (source_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }
}

size_t Lexer::find_directive_end(char open, char close) const {
    int depth = 1;
    char quote = 0;
    // Localized text is free form, apostrophes are not quotes there
    bool track_quotes = open == '{';
    for (size_t i = pos_ + 2; i < source_.size(); ++i) {
        char c = source_[i];
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (track_quotes && (c == '\'' || c == '"')) {
            quote = c;
        } else if (c == open) {
            ++depth;
        } else if (c == close) {
            if (--depth == 0) return i;
        }
    }
    return std::string_view::npos;
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    std::string text;
    size_t text_line = line_;
    size_t text_column = column_;

    auto flush_text = [&]() {
        if (!text.empty()) {
            tokens.push_back(make_token(TokenType::TEXT, text_line, text_column, std::move(text)));
            text.clear();
        }
    };

    while (pos_ < source_.size()) {
        char c = source_[pos_];
        bool directive = c == '@' && pos_ + 1 < source_.size() &&
                         (source_[pos_ + 1] == '{' || source_[pos_ + 1] == '(');
        if (!directive) {
            if (text.empty()) {
                text_line = line_;
                text_column = column_;
            }
            text += c;
            advance(1);
            continue;
        }

        flush_text();
        char open = source_[pos_ + 1];
        char close = open == '{' ? '}' : ')';
        size_t end = find_directive_end(open, close);
        if (end == std::string_view::npos) {
            throw TemplateParseError(std::string("Unterminated directive '@") + open + "'", line_, column_);
        }

        std::string content(source_.substr(pos_ + 2, end - pos_ - 2));
        size_t line = line_;
        size_t column = column_;

        if (open == '{') {
            tokens.push_back(classify_directive(content, line, column));
        } else {
            std::string body = trim(content);
            if (body.starts_with("#")) {
                tokens.push_back(make_token(TokenType::TRANSLATE_KEY, line, column, trim(body.substr(1))));
            } else {
                tokens.push_back(make_token(TokenType::TRANSLATE, line, column, body));
            }
        }
        advance(end + 1 - pos_);
    }
    flush_text();
    return tokens;
}

} // namespace mvcore
