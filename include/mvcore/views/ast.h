// mvcore/views/ast.h
#ifndef MVCORE_VIEWS_AST_H
#define MVCORE_VIEWS_AST_H

#include "common/types.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mvcore {

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

enum class ExprKind : uint8_t {
    LITERAL,    // string, number, boolean, null
    VARIABLE,   // dotted path, resolved through RenderContext::resolve_variable
    PROPERTY,   // <expr>.name on a non-variable base
    INDEX,      // <expr>[<expr>]
    ARRAY,
    OBJECT,
    BINARY,
    UNARY,
    CALL,
    TERNARY
};

enum class BinaryOp : uint8_t {
    EQ, NE, STRICT_EQ, STRICT_NE,
    LT, LE, GT, GE,
    AND, OR,
    ADD, SUB, MUL, DIV, MOD
};

enum class UnaryOp : uint8_t {
    NOT,
    NEG
};

const char* binary_op_symbol(BinaryOp op);

struct Expression {
    ExprKind kind;

    explicit Expression(ExprKind k) : kind(k) {}
    virtual ~Expression() = default;
};

using ExprPtr = std::unique_ptr<Expression>;

struct LiteralExpr : public Expression {
    Value value;
    explicit LiteralExpr(Value v) : Expression(ExprKind::LITERAL), value(std::move(v)) {}
};

struct VariableExpr : public Expression {
    std::string name;
    explicit VariableExpr(std::string n) : Expression(ExprKind::VARIABLE), name(std::move(n)) {}
};

struct PropertyExpr : public Expression {
    ExprPtr object;
    std::string property;
    PropertyExpr(ExprPtr obj, std::string prop)
        : Expression(ExprKind::PROPERTY), object(std::move(obj)), property(std::move(prop)) {}
};

struct IndexExpr : public Expression {
    ExprPtr object;
    ExprPtr index;
    IndexExpr(ExprPtr obj, ExprPtr idx)
        : Expression(ExprKind::INDEX), object(std::move(obj)), index(std::move(idx)) {}
};

struct ArrayExpr : public Expression {
    std::vector<ExprPtr> items;
    ArrayExpr() : Expression(ExprKind::ARRAY) {}
};

struct ObjectExpr : public Expression {
    std::vector<std::pair<std::string, ExprPtr>> entries;
    ObjectExpr() : Expression(ExprKind::OBJECT) {}
};

struct BinaryExpr : public Expression {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
    BinaryExpr(BinaryOp o, ExprPtr l, ExprPtr r)
        : Expression(ExprKind::BINARY), op(o), left(std::move(l)), right(std::move(r)) {}
};

struct UnaryExpr : public Expression {
    UnaryOp op;
    ExprPtr operand;
    UnaryExpr(UnaryOp o, ExprPtr e) : Expression(ExprKind::UNARY), op(o), operand(std::move(e)) {}
};

struct CallExpr : public Expression {
    std::string name;
    std::vector<ExprPtr> args;
    explicit CallExpr(std::string n) : Expression(ExprKind::CALL), name(std::move(n)) {}
};

struct TernaryExpr : public Expression {
    ExprPtr condition;
    ExprPtr then_expr;
    ExprPtr else_expr;
    TernaryExpr(ExprPtr c, ExprPtr t, ExprPtr e)
        : Expression(ExprKind::TERNARY), condition(std::move(c)), then_expr(std::move(t)), else_expr(std::move(e)) {}
};

// ---------------------------------------------------------------------------
// Template nodes
// ---------------------------------------------------------------------------

enum class NodeKind : uint8_t {
    TEXT,
    VARIABLE,
    CONDITIONAL,
    LOOP,
    BREAK,
    CONTINUE,
    INDEX,
    SECTION_CALL,
    SECTION_DEF,
    HELPER_CALL,
    HELPER_DEF,
    VIEW,
    IMPORT,
    META,
    BODY,
    HEAD,
    CONTENT,
    CSRF,
    TRANSLATE,
    CONFIG,
    NAMESPACE
};

// Prefixes of @{R.key}, @{M.key}, ... accessors
enum class Namespace : uint8_t {
    REPOSITORY,
    R,
    APP,
    MAIN,
    MODEL,
    M,
    SESSION,
    QUERY,
    USER
};

struct TemplateNode {
    NodeKind kind;
    size_t line = 0;

    explicit TemplateNode(NodeKind k, size_t l = 0) : kind(k), line(l) {}
    virtual ~TemplateNode() = default;
};

using NodePtr = std::unique_ptr<TemplateNode>;
using NodeList = std::vector<NodePtr>;

struct TextNode : public TemplateNode {
    std::string text;
    explicit TextNode(std::string t, size_t l = 0) : TemplateNode(NodeKind::TEXT, l), text(std::move(t)) {}
};

struct VariableNode : public TemplateNode {
    std::string name;  // source text, used for the unescaped-name rule
    bool raw = false;
    ExprPtr expr;
    VariableNode(std::string n, bool r, ExprPtr e, size_t l = 0)
        : TemplateNode(NodeKind::VARIABLE, l), name(std::move(n)), raw(r), expr(std::move(e)) {}
};

struct ConditionalNode : public TemplateNode {
    struct Branch {
        ExprPtr condition;
        NodeList body;
    };

    ExprPtr condition;
    NodeList then_body;
    std::vector<Branch> else_ifs;
    std::optional<NodeList> else_body;

    explicit ConditionalNode(ExprPtr c, size_t l = 0)
        : TemplateNode(NodeKind::CONDITIONAL, l), condition(std::move(c)) {}
};

struct LoopNode : public TemplateNode {
    std::string item_name;
    ExprPtr collection;
    NodeList body;
    LoopNode(std::string item, ExprPtr coll, size_t l = 0)
        : TemplateNode(NodeKind::LOOP, l), item_name(std::move(item)), collection(std::move(coll)) {}
};

struct SectionCallNode : public TemplateNode {
    std::string name;
    explicit SectionCallNode(std::string n, size_t l = 0)
        : TemplateNode(NodeKind::SECTION_CALL, l), name(std::move(n)) {}
};

struct SectionDefNode : public TemplateNode {
    std::string name;
    std::shared_ptr<const NodeList> body;
    SectionDefNode(std::string n, std::shared_ptr<const NodeList> b, size_t l = 0)
        : TemplateNode(NodeKind::SECTION_DEF, l), name(std::move(n)), body(std::move(b)) {}
};

struct HelperDefinition {
    std::string name;
    std::vector<std::string> params;
    NodeList body;
};

struct HelperDefNode : public TemplateNode {
    std::shared_ptr<const HelperDefinition> helper;
    explicit HelperDefNode(std::shared_ptr<const HelperDefinition> h, size_t l = 0)
        : TemplateNode(NodeKind::HELPER_DEF, l), helper(std::move(h)) {}
};

struct HelperCallNode : public TemplateNode {
    std::string name;
    std::vector<ExprPtr> args;
    explicit HelperCallNode(std::string n, size_t l = 0)
        : TemplateNode(NodeKind::HELPER_CALL, l), name(std::move(n)) {}
};

struct ViewNode : public TemplateNode {
    std::string name;
    ExprPtr model;  // null: partial shares the caller's context
    ViewNode(std::string n, ExprPtr m, size_t l = 0)
        : TemplateNode(NodeKind::VIEW, l), name(std::move(n)), model(std::move(m)) {}
};

struct ImportNode : public TemplateNode {
    std::vector<std::string> files;
    explicit ImportNode(std::vector<std::string> f, size_t l = 0)
        : TemplateNode(NodeKind::IMPORT, l), files(std::move(f)) {}
};

struct MetaNode : public TemplateNode {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> keywords;
    explicit MetaNode(size_t l = 0) : TemplateNode(NodeKind::META, l) {}
};

struct TranslateNode : public TemplateNode {
    std::string text;
    bool is_key = false;
    TranslateNode(std::string t, bool key, size_t l = 0)
        : TemplateNode(NodeKind::TRANSLATE, l), text(std::move(t)), is_key(key) {}
};

struct ConfigNode : public TemplateNode {
    std::string key;
    explicit ConfigNode(std::string k, size_t l = 0) : TemplateNode(NodeKind::CONFIG, l), key(std::move(k)) {}
};

struct NamespaceNode : public TemplateNode {
    Namespace ns;
    std::string key;  // dotted path; may be empty for @{user}
    NamespaceNode(Namespace n, std::string k, size_t l = 0)
        : TemplateNode(NodeKind::NAMESPACE, l), ns(n), key(std::move(k)) {}
};

const char* namespace_prefix(Namespace ns);

// ---------------------------------------------------------------------------
// Compiled template
// ---------------------------------------------------------------------------

using SectionMap = std::unordered_map<std::string, std::shared_ptr<const NodeList>>;
using HelperMap = std::unordered_map<std::string, std::shared_ptr<const HelperDefinition>>;

struct Template {
    std::string name;
    NodeList nodes;
    SectionMap sections;
    HelperMap helpers;

    Template() = default;
    Template(Template&&) = default;
    Template& operator=(Template&&) = default;
    Template(const Template&) = delete;
    Template& operator=(const Template&) = delete;

    // Lift top-level @{section name} definitions into sections
    void extract_sections();
    // Lift top-level @{helper name(...)} definitions into helpers
    void extract_helpers();
};

} // namespace mvcore

#endif // MVCORE_VIEWS_AST_H
