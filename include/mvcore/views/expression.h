// mvcore/views/expression.h
#ifndef MVCORE_VIEWS_EXPRESSION_H
#define MVCORE_VIEWS_EXPRESSION_H

#include "mvcore/views/ast.h"
#include <string>
#include <string_view>
#include <vector>

namespace mvcore {

// Recursive descent parser for directive expressions.
// Precedence, lowest first: ?:  ||  &&  == != === !==  < <= > >=  + -  * / %
// then unary ! -, then postfix .name [expr] (args).
class ExpressionParser {
public:
    // line/column locate the directive in the template for error messages
    ExpressionParser(std::string_view source, size_t line = 1, size_t column = 1);

    // Whole input must be consumed; throws TemplateParseError otherwise
    [[nodiscard]] ExprPtr parse();

private:
    enum class TokKind : uint8_t { IDENT, NUMBER, STRING, PUNCT, END };

    struct Tok {
        TokKind kind;
        std::string text;
        size_t offset;
    };

    void tokenize();
    const Tok& peek() const { return toks_[index_]; }
    Tok next() { return toks_[index_++]; }
    bool accept(const std::string& punct);
    void expect(const std::string& punct);
    [[noreturn]] void fail(const std::string& message) const;

    ExprPtr parse_ternary();
    ExprPtr parse_or();
    ExprPtr parse_and();
    ExprPtr parse_equality();
    ExprPtr parse_relational();
    ExprPtr parse_additive();
    ExprPtr parse_multiplicative();
    ExprPtr parse_unary();
    ExprPtr parse_postfix();
    ExprPtr parse_primary();
    std::vector<ExprPtr> parse_call_arguments();

    std::string source_;
    size_t line_;
    size_t column_;
    std::vector<Tok> toks_;
    size_t index_ = 0;
};

inline ExprPtr parse_expression(std::string_view source, size_t line = 1, size_t column = 1) {
    return ExpressionParser(source, line, column).parse();
}

} // namespace mvcore

#endif // MVCORE_VIEWS_EXPRESSION_H
