// src/views/expression.cpp
#include "mvcore/views/expression.h"
#include "common/types.h"
#include <cctype>
#include <stdexcept>

namespace mvcore {

namespace {

bool ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_variable(const ExprPtr& e) {
    return e && e->kind == ExprKind::VARIABLE;
}

} // namespace

ExpressionParser::ExpressionParser(std::string_view source, size_t line, size_t column)
    : source_(source), line_(line), column_(column) {}

[[noreturn]] void ExpressionParser::fail(const std::string& message) const {
    throw TemplateParseError(message + " in expression '" + source_ + "'", line_, column_);
}

void ExpressionParser::tokenize() {
    static const char* multi[] = {"===", "!==", "==", "!=", "<=", ">=", "&&", "||"};
    size_t i = 0;
    while (i < source_.size()) {
        char c = source_[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        size_t start = i;

        if (ident_start(c)) {
            while (i < source_.size() && ident_char(source_[i])) ++i;
            toks_.push_back({TokKind::IDENT, source_.substr(start, i - start), start});
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (i < source_.size() && std::isdigit(static_cast<unsigned char>(source_[i]))) ++i;
            // fraction only when a digit follows the dot: items.0.name stays a path
            if (i + 1 < source_.size() && source_[i] == '.' && std::isdigit(static_cast<unsigned char>(source_[i + 1]))) {
                ++i;
                while (i < source_.size() && std::isdigit(static_cast<unsigned char>(source_[i]))) ++i;
            }
            toks_.push_back({TokKind::NUMBER, source_.substr(start, i - start), start});
            continue;
        }

        if (c == '\'' || c == '"') {
            std::string value;
            ++i;
            bool closed = false;
            while (i < source_.size()) {
                char ch = source_[i++];
                if (ch == c) {
                    closed = true;
                    break;
                }
                if (ch == '\\' && i < source_.size()) {
                    char esc = source_[i++];
                    switch (esc) {
                        case 'n': value += '\n'; break;
                        case 't': value += '\t'; break;
                        case 'r': value += '\r'; break;
                        default: value += esc;
                    }
                    continue;
                }
                value += ch;
            }
            if (!closed) fail("Unterminated string literal");
            toks_.push_back({TokKind::STRING, value, start});
            continue;
        }

        bool matched = false;
        for (const char* op : multi) {
            std::string_view sv(op);
            if (source_.compare(i, sv.size(), sv) == 0) {
                toks_.push_back({TokKind::PUNCT, std::string(sv), start});
                i += sv.size();
                matched = true;
                break;
            }
        }
        if (matched) continue;

        if (std::string("()[]{},.?:!<>+-*/%").find(c) != std::string::npos) {
            toks_.push_back({TokKind::PUNCT, std::string(1, c), start});
            ++i;
            continue;
        }
        fail(std::string("Unexpected character '") + c + "'");
    }
    toks_.push_back({TokKind::END, "", source_.size()});
}

bool ExpressionParser::accept(const std::string& punct) {
    if (peek().kind == TokKind::PUNCT && peek().text == punct) {
        ++index_;
        return true;
    }
    return false;
}

void ExpressionParser::expect(const std::string& punct) {
    if (!accept(punct)) {
        const Tok& t = peek();
        fail("Expected '" + punct + "' but found " + (t.kind == TokKind::END ? std::string("end of input") : "'" + t.text + "'"));
    }
}

ExprPtr ExpressionParser::parse() {
    tokenize();
    if (peek().kind == TokKind::END) fail("Empty expression");
    ExprPtr expr = parse_ternary();
    if (peek().kind != TokKind::END) {
        fail("Unexpected '" + peek().text + "'");
    }
    return expr;
}

ExprPtr ExpressionParser::parse_ternary() {
    ExprPtr cond = parse_or();
    if (accept("?")) {
        ExprPtr then_expr = parse_ternary();
        expect(":");
        ExprPtr else_expr = parse_ternary();
        return std::make_unique<TernaryExpr>(std::move(cond), std::move(then_expr), std::move(else_expr));
    }
    return cond;
}

ExprPtr ExpressionParser::parse_or() {
    ExprPtr left = parse_and();
    while (accept("||")) {
        left = std::make_unique<BinaryExpr>(BinaryOp::OR, std::move(left), parse_and());
    }
    return left;
}

ExprPtr ExpressionParser::parse_and() {
    ExprPtr left = parse_equality();
    while (accept("&&")) {
        left = std::make_unique<BinaryExpr>(BinaryOp::AND, std::move(left), parse_equality());
    }
    return left;
}

ExprPtr ExpressionParser::parse_equality() {
    ExprPtr left = parse_relational();
    while (true) {
        BinaryOp op;
        if (accept("===")) op = BinaryOp::STRICT_EQ;
        else if (accept("!==")) op = BinaryOp::STRICT_NE;
        else if (accept("==")) op = BinaryOp::EQ;
        else if (accept("!=")) op = BinaryOp::NE;
        else break;
        left = std::make_unique<BinaryExpr>(op, std::move(left), parse_relational());
    }
    return left;
}

ExprPtr ExpressionParser::parse_relational() {
    ExprPtr left = parse_additive();
    while (true) {
        BinaryOp op;
        if (accept("<=")) op = BinaryOp::LE;
        else if (accept(">=")) op = BinaryOp::GE;
        else if (accept("<")) op = BinaryOp::LT;
        else if (accept(">")) op = BinaryOp::GT;
        else break;
        left = std::make_unique<BinaryExpr>(op, std::move(left), parse_additive());
    }
    return left;
}

ExprPtr ExpressionParser::parse_additive() {
    ExprPtr left = parse_multiplicative();
    while (true) {
        BinaryOp op;
        if (accept("+")) op = BinaryOp::ADD;
        else if (accept("-")) op = BinaryOp::SUB;
        else break;
        left = std::make_unique<BinaryExpr>(op, std::move(left), parse_multiplicative());
    }
    return left;
}

ExprPtr ExpressionParser::parse_multiplicative() {
    ExprPtr left = parse_unary();
    while (true) {
        BinaryOp op;
        if (accept("*")) op = BinaryOp::MUL;
        else if (accept("/")) op = BinaryOp::DIV;
        else if (accept("%")) op = BinaryOp::MOD;
        else break;
        left = std::make_unique<BinaryExpr>(op, std::move(left), parse_unary());
    }
    return left;
}

ExprPtr ExpressionParser::parse_unary() {
    if (accept("!")) {
        return std::make_unique<UnaryExpr>(UnaryOp::NOT, parse_unary());
    }
    if (accept("-")) {
        return std::make_unique<UnaryExpr>(UnaryOp::NEG, parse_unary());
    }
    return parse_postfix();
}

std::vector<ExprPtr> ExpressionParser::parse_call_arguments() {
    std::vector<ExprPtr> args;
    if (accept(")")) return args;
    do {
        args.push_back(parse_ternary());
    } while (accept(","));
    expect(")");
    return args;
}

ExprPtr ExpressionParser::parse_postfix() {
    ExprPtr expr = parse_primary();
    while (true) {
        if (accept(".")) {
            Tok member = next();
            if (member.kind != TokKind::IDENT && member.kind != TokKind::NUMBER) {
                fail("Expected property name after '.'");
            }
            // value.method(args) calls the registered function with value first
            if (member.kind == TokKind::IDENT && accept("(")) {
                auto call = std::make_unique<CallExpr>(member.text);
                call->args.push_back(std::move(expr));
                for (auto& a : parse_call_arguments()) call->args.push_back(std::move(a));
                expr = std::move(call);
                continue;
            }
            if (is_variable(expr)) {
                static_cast<VariableExpr&>(*expr).name += "." + member.text;
            } else {
                expr = std::make_unique<PropertyExpr>(std::move(expr), member.text);
            }
            continue;
        }
        if (accept("[")) {
            ExprPtr index = parse_ternary();
            expect("]");
            expr = std::make_unique<IndexExpr>(std::move(expr), std::move(index));
            continue;
        }
        break;
    }
    return expr;
}

ExprPtr ExpressionParser::parse_primary() {
    Tok tok = next();
    switch (tok.kind) {
        case TokKind::NUMBER: {
            if (tok.text.find('.') == std::string::npos) {
                try {
                    return std::make_unique<LiteralExpr>(Value(std::stoll(tok.text)));
                } catch (const std::out_of_range&) {
                    return std::make_unique<LiteralExpr>(Value(std::stod(tok.text)));
                }
            }
            return std::make_unique<LiteralExpr>(Value(std::stod(tok.text)));
        }
        case TokKind::STRING:
            return std::make_unique<LiteralExpr>(Value(tok.text));
        case TokKind::IDENT: {
            if (tok.text == "true") return std::make_unique<LiteralExpr>(Value(true));
            if (tok.text == "false") return std::make_unique<LiteralExpr>(Value(false));
            if (tok.text == "null" || tok.text == "NULL" || tok.text == "undefined") {
                return std::make_unique<LiteralExpr>(Value(nullptr));
            }
            if (accept("(")) {
                auto call = std::make_unique<CallExpr>(tok.text);
                call->args = parse_call_arguments();
                return call;
            }
            return std::make_unique<VariableExpr>(tok.text);
        }
        case TokKind::PUNCT: {
            if (tok.text == "(") {
                ExprPtr inner = parse_ternary();
                expect(")");
                return inner;
            }
            if (tok.text == "[") {
                auto arr = std::make_unique<ArrayExpr>();
                if (!accept("]")) {
                    do {
                        arr->items.push_back(parse_ternary());
                    } while (accept(","));
                    expect("]");
                }
                return arr;
            }
            if (tok.text == "{") {
                auto obj = std::make_unique<ObjectExpr>();
                if (!accept("}")) {
                    do {
                        Tok key = next();
                        if (key.kind != TokKind::IDENT && key.kind != TokKind::STRING) {
                            fail("Expected object key");
                        }
                        expect(":");
                        obj->entries.emplace_back(key.text, parse_ternary());
                    } while (accept(","));
                    expect("}");
                }
                return obj;
            }
            fail("Unexpected '" + tok.text + "'");
        }
        case TokKind::END:
            fail("Unexpected end of expression");
    }
    fail("Unexpected token");
}

} // namespace mvcore
