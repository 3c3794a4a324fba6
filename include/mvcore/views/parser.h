// mvcore/views/parser.h
#ifndef MVCORE_VIEWS_PARSER_H
#define MVCORE_VIEWS_PARSER_H

#include "mvcore/views/ast.h"
#include "mvcore/views/lexer.h"
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace mvcore {

class TemplateParser {
public:
    // name labels the template in errors; throws TemplateParseError
    Template parse_from_string(std::string_view source, const std::string& name = "");
    Template parse_from_file(const std::string& file_path);

private:
    NodeList parse_block(const Token* opener);
    NodePtr parse_conditional(const Token& opener);
    NodePtr parse_loop(const Token& opener);
    NodePtr parse_section(const Token& opener);
    NodePtr parse_helper(const Token& opener);
    NodePtr parse_simple(const Token& token);

    bool at_end() const { return index_ >= tokens_.size(); }
    [[noreturn]] void fail(const std::string& message, const Token& at) const;

    std::vector<Token> tokens_;
    size_t index_ = 0;
    std::unordered_set<std::string> helper_names_;
    std::string name_;
};

} // namespace mvcore

#endif // MVCORE_VIEWS_PARSER_H
