// src/views/parser.cpp
#include "mvcore/views/parser.h"
#include "mvcore/views/expression.h"
#include "common/types.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mvcore {

namespace {

bool is_block_terminator(TokenType t) {
    return t == TokenType::ELSE_IF || t == TokenType::ELSE || t == TokenType::FI || t == TokenType::END;
}

Namespace namespace_from_prefix(const std::string& prefix) {
    if (prefix == "repository") return Namespace::REPOSITORY;
    if (prefix == "R") return Namespace::R;
    if (prefix == "APP") return Namespace::APP;
    if (prefix == "MAIN") return Namespace::MAIN;
    if (prefix == "model") return Namespace::MODEL;
    if (prefix == "M") return Namespace::M;
    if (prefix == "session") return Namespace::SESSION;
    if (prefix == "query") return Namespace::QUERY;
    return Namespace::USER;
}

std::optional<std::string> optional_arg(const std::vector<std::string>& args, size_t i) {
    if (i < args.size() && !args[i].empty()) return args[i];
    return std::nullopt;
}

} // namespace

[[noreturn]] void TemplateParser::fail(const std::string& message, const Token& at) const {
    throw TemplateParseError(message, at.line, at.column);
}

Template TemplateParser::parse_from_string(std::string_view source, const std::string& name) {
    name_ = name;
    index_ = 0;
    helper_names_.clear();

    Template tpl;
    tpl.name = name;
    try {
        tokens_ = Lexer(source).tokenize();

        // Helpers may be called before their definition
        for (const auto& t : tokens_) {
            if (t.type == TokenType::HELPER_DEF) helper_names_.insert(t.value);
        }

        tpl.nodes = parse_block(nullptr);
    } catch (const TemplateParseError& e) {
        if (name.empty()) throw;
        throw TemplateParseError("Template '" + name + "': " + e.message(), e.line(), e.column());
    }

    tpl.extract_sections();
    tpl.extract_helpers();
    tokens_.clear();
    return tpl;
}

Template TemplateParser::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw TemplateNotFoundError(file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str(), file_path);
}

NodeList TemplateParser::parse_block(const Token* opener) {
    NodeList nodes;
    while (!at_end()) {
        const Token& tok = tokens_[index_];
        if (is_block_terminator(tok.type)) {
            if (!opener) {
                fail(std::string("Unexpected '") + token_type_name(tok.type) + "' without an open block", tok);
            }
            return nodes;
        }
        ++index_;
        switch (tok.type) {
            case TokenType::IF:
                nodes.push_back(parse_conditional(tok));
                break;
            case TokenType::FOREACH:
                nodes.push_back(parse_loop(tok));
                break;
            case TokenType::SECTION_DEF:
                nodes.push_back(parse_section(tok));
                break;
            case TokenType::HELPER_DEF:
                // helpers are template scoped and lifted from the top level only
                if (opener) {
                    fail("Helper '" + tok.value + "' must be defined at the top level, not inside '" +
                         token_type_name(opener->type) + "'", tok);
                }
                nodes.push_back(parse_helper(tok));
                break;
            default:
                nodes.push_back(parse_simple(tok));
        }
    }
    if (opener) {
        fail(std::string("Unterminated '") + token_type_name(opener->type) + "' block", *opener);
    }
    return nodes;
}

NodePtr TemplateParser::parse_conditional(const Token& opener) {
    auto node = std::make_unique<ConditionalNode>(parse_expression(opener.value, opener.line, opener.column), opener.line);
    node->then_body = parse_block(&opener);

    while (true) {
        const Token& tok = tokens_[index_++];
        switch (tok.type) {
            case TokenType::ELSE_IF: {
                if (node->else_body) fail("'else if' after 'else'", tok);
                ConditionalNode::Branch branch;
                branch.condition = parse_expression(tok.value, tok.line, tok.column);
                branch.body = parse_block(&opener);
                node->else_ifs.push_back(std::move(branch));
                break;
            }
            case TokenType::ELSE:
                if (node->else_body) fail("Duplicate 'else' in 'if' block", tok);
                node->else_body = parse_block(&opener);
                break;
            case TokenType::FI:
                return node;
            default:
                fail("Expected 'fi' to close 'if' opened at line " + std::to_string(opener.line) +
                     ", found '" + token_type_name(tok.type) + "'", tok);
        }
    }
}

NodePtr TemplateParser::parse_loop(const Token& opener) {
    auto node = std::make_unique<LoopNode>(opener.value, parse_expression(opener.extra, opener.line, opener.column), opener.line);
    node->body = parse_block(&opener);
    const Token& tok = tokens_[index_++];
    if (tok.type != TokenType::END) {
        fail("Expected 'end' to close 'foreach' opened at line " + std::to_string(opener.line) +
             ", found '" + token_type_name(tok.type) + "'", tok);
    }
    return node;
}

NodePtr TemplateParser::parse_section(const Token& opener) {
    auto body = std::make_shared<NodeList>(parse_block(&opener));
    const Token& tok = tokens_[index_++];
    if (tok.type != TokenType::END) {
        fail("Expected 'end' to close 'section " + opener.value + "', found '" + token_type_name(tok.type) + "'", tok);
    }
    return std::make_unique<SectionDefNode>(opener.value, std::move(body), opener.line);
}

NodePtr TemplateParser::parse_helper(const Token& opener) {
    auto helper = std::make_shared<HelperDefinition>();
    helper->name = opener.value;
    helper->params = opener.args;
    helper->body = parse_block(&opener);
    const Token& tok = tokens_[index_++];
    if (tok.type != TokenType::END) {
        fail("Expected 'end' to close 'helper " + opener.value + "', found '" + token_type_name(tok.type) + "'", tok);
    }
    return std::make_unique<HelperDefNode>(std::move(helper), opener.line);
}

NodePtr TemplateParser::parse_simple(const Token& tok) {
    switch (tok.type) {
        case TokenType::TEXT:
            return std::make_unique<TextNode>(tok.value, tok.line);
        case TokenType::VARIABLE:
        case TokenType::RAW_VARIABLE: {
            ExprPtr expr = parse_expression(tok.value, tok.line, tok.column);
            if (expr->kind == ExprKind::CALL) {
                auto& call = static_cast<CallExpr&>(*expr);
                if (helper_names_.count(call.name)) {
                    auto node = std::make_unique<HelperCallNode>(call.name, tok.line);
                    node->args = std::move(call.args);
                    return node;
                }
            }
            return std::make_unique<VariableNode>(tok.value, tok.type == TokenType::RAW_VARIABLE, std::move(expr), tok.line);
        }
        case TokenType::BREAK:
            return std::make_unique<TemplateNode>(NodeKind::BREAK, tok.line);
        case TokenType::CONTINUE:
            return std::make_unique<TemplateNode>(NodeKind::CONTINUE, tok.line);
        case TokenType::INDEX:
            return std::make_unique<TemplateNode>(NodeKind::INDEX, tok.line);
        case TokenType::SECTION_CALL:
            return std::make_unique<SectionCallNode>(tok.value, tok.line);
        case TokenType::VIEW: {
            ExprPtr model;
            if (!tok.extra.empty()) model = parse_expression(tok.extra, tok.line, tok.column);
            return std::make_unique<ViewNode>(tok.value, std::move(model), tok.line);
        }
        case TokenType::IMPORT:
            return std::make_unique<ImportNode>(tok.args, tok.line);
        case TokenType::META: {
            auto node = std::make_unique<MetaNode>(tok.line);
            node->title = optional_arg(tok.args, 0);
            node->description = optional_arg(tok.args, 1);
            node->keywords = optional_arg(tok.args, 2);
            return node;
        }
        case TokenType::BODY:
            return std::make_unique<TemplateNode>(NodeKind::BODY, tok.line);
        case TokenType::HEAD:
            return std::make_unique<TemplateNode>(NodeKind::HEAD, tok.line);
        case TokenType::CONTENT:
            return std::make_unique<TemplateNode>(NodeKind::CONTENT, tok.line);
        case TokenType::CSRF:
            return std::make_unique<TemplateNode>(NodeKind::CSRF, tok.line);
        case TokenType::CONFIG:
            return std::make_unique<ConfigNode>(tok.value, tok.line);
        case TokenType::NAMESPACE:
            return std::make_unique<NamespaceNode>(namespace_from_prefix(tok.value), tok.extra, tok.line);
        case TokenType::TRANSLATE:
            return std::make_unique<TranslateNode>(tok.value, false, tok.line);
        case TokenType::TRANSLATE_KEY:
            return std::make_unique<TranslateNode>(tok.value, true, tok.line);
        default:
            fail(std::string("Unexpected '") + token_type_name(tok.type) + "'", tok);
    }
}

} // namespace mvcore
