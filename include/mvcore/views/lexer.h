// mvcore/views/lexer.h
#ifndef MVCORE_VIEWS_LEXER_H
#define MVCORE_VIEWS_LEXER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mvcore {

enum class TokenType : uint8_t {
    TEXT,
    VARIABLE,       // value: expression source
    RAW_VARIABLE,   // @{!expr}
    IF,             // value: condition
    ELSE_IF,        // value: condition
    ELSE,
    FI,
    FOREACH,        // value: item name, extra: collection expression
    END,
    BREAK,
    CONTINUE,
    INDEX,
    SECTION_DEF,    // value: name
    SECTION_CALL,   // value: name
    HELPER_DEF,     // value: name, args: parameter names
    VIEW,           // value: name, extra: model expression (may be empty)
    IMPORT,         // args: files
    META,           // args: title, description, keywords (each optional)
    BODY,
    HEAD,
    CONTENT,
    CSRF,
    CONFIG,         // value: key
    NAMESPACE,      // value: prefix, extra: dotted key
    TRANSLATE,      // value: text
    TRANSLATE_KEY   // value: key
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type;
    std::string value;
    std::string extra;
    std::vector<std::string> args;
    size_t line = 1;
    size_t column = 1;
};

// Splits template source into text runs and @{...} / @(...) directives
class Lexer {
public:
    explicit Lexer(std::string_view source) : source_(source) {}

    // Throws TemplateParseError on unterminated or malformed directives
    [[nodiscard]] std::vector<Token> tokenize();

    // Classify the inside of a @{...} directive
    static Token classify_directive(const std::string& content, size_t line, size_t column);

private:
    void advance(size_t n);
    // Position of the closing delimiter for the directive opened at pos_
    size_t find_directive_end(char open, char close) const;

    std::string_view source_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
};

} // namespace mvcore

#endif // MVCORE_VIEWS_LEXER_H
