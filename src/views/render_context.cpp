// src/views/render_context.cpp
#include "mvcore/views/render_context.h"
#include "common/utils.h"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace mvcore {

namespace {

bool parse_index(const std::string& s, size_t& out) {
    if (s.empty() || s.size() > 18) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    out = static_cast<size_t>(std::stoull(s));
    return true;
}

bool both_integers(const Value& a, const Value& b) {
    return (a.is_number_integer() || a.is_number_unsigned()) && (b.is_number_integer() || b.is_number_unsigned());
}

// "12" -> 12.0 for loose equality against numbers
bool numeric_string(const Value& v, double& out) {
    if (!v.is_string()) return false;
    const auto& s = v.get_ref<const std::string&>();
    if (s.empty()) return false;
    try {
        size_t consumed = 0;
        out = std::stod(s, &consumed);
        return consumed == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool loose_equals(const Value& a, const Value& b) {
    if (a == b) return true;
    double n = 0.0;
    if (a.is_number() && numeric_string(b, n)) return a.get<double>() == n;
    if (b.is_number() && numeric_string(a, n)) return b.get<double>() == n;
    return false;
}

// Integer results stay integers so "@{index + 1}" prints "2", not "2.0"
Value number_result(double d, bool integral) {
    if (integral && std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.0e15) {
        return Value(static_cast<int64_t>(d));
    }
    return Value(d);
}

} // namespace

RenderContext::RenderContext() : RenderContext(Value::object()) {}

RenderContext::RenderContext(Value data)
    : data_(std::move(data)),
      global_repository_(Value::object()),
      repository_(Value::object()),
      session_(Value::object()),
      query_(Value::object()),
      user_(nullptr),
      conf_(Value::object()),
      functions_(FunctionRegistry::shared_default()) {}

RenderContext& RenderContext::with_data(Value data) { data_ = std::move(data); return *this; }
RenderContext& RenderContext::with_global_repository(Value repo) { global_repository_ = std::move(repo); return *this; }
RenderContext& RenderContext::with_repository(Value repo) { repository_ = std::move(repo); return *this; }
RenderContext& RenderContext::with_session(Value session) { session_ = std::move(session); return *this; }
RenderContext& RenderContext::with_query(Value query) { query_ = std::move(query); return *this; }
RenderContext& RenderContext::with_user(Value user) { user_ = std::move(user); return *this; }
RenderContext& RenderContext::with_config(ConfigMap config) { config_ = std::move(config); return *this; }
RenderContext& RenderContext::with_conf(Value conf) { conf_ = std::move(conf); return *this; }
RenderContext& RenderContext::with_url(std::string url) { url_ = std::move(url); return *this; }
RenderContext& RenderContext::with_hostname(std::string hostname) { hostname_ = std::move(hostname); return *this; }

RenderContext& RenderContext::with_translator(std::shared_ptr<const Translator> translator) {
    translator_ = std::move(translator);
    return *this;
}

RenderContext& RenderContext::with_functions(std::shared_ptr<const FunctionRegistry> functions) {
    if (!functions) {
        throw std::invalid_argument("RenderContext requires a function registry");
    }
    functions_ = std::move(functions);
    return *this;
}

// --- variable resolution ---

Value RenderContext::get_nested_value(const Value& root, const std::vector<std::string>& path, size_t from) {
    const Value* current = &root;
    for (size_t i = from; i < path.size(); ++i) {
        const std::string& seg = path[i];
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it != current->end()) {
                current = &*it;
                continue;
            }
            if (seg == "length" || seg == "size") {
                if (i + 1 != path.size()) return nullptr;
                return current->size();
            }
            return nullptr;
        }
        if (current->is_array()) {
            size_t idx = 0;
            if (parse_index(seg, idx)) {
                if (idx >= current->size()) return nullptr;
                current = &(*current)[idx];
                continue;
            }
            if ((seg == "length" || seg == "size") && i + 1 == path.size()) {
                return current->size();
            }
            return nullptr;
        }
        if (current->is_string() && (seg == "length" || seg == "size") && i + 1 == path.size()) {
            return current->get_ref<const std::string&>().size();
        }
        return nullptr;
    }
    return *current;
}

Value RenderContext::resolve_reserved(const std::string& root, const std::vector<std::string>& segments, bool& found) const {
    found = true;
    if (root == "index") {
        if (auto idx = current_index()) return *idx;
        found = false;
        return nullptr;
    }
    if (root == "CONF") return get_nested_value(conf_, segments, 1);
    if (root == "repository" || root == "R") return get_nested_value(repository_, segments, 1);
    if (root == "session") return get_nested_value(session_, segments, 1);
    if (root == "flash") {
        Value flash = session_.is_object() && session_.contains("flash") ? session_["flash"] : Value(nullptr);
        return get_nested_value(flash, segments, 1);
    }
    if (root == "query") return get_nested_value(query_, segments, 1);
    if (root == "user") return get_nested_value(user_, segments, 1);
    if (root == "url" && segments.size() == 1) return url_;
    if (root == "hostname" && segments.size() == 1) return hostname_;
    if (root == "model" || root == "M") return get_nested_value(data_, segments, 1);
    if (root == "APP" || root == "MAIN") return get_nested_value(global_repository_, segments, 1);
    if (root == "csrf_token") {
        // csrf_token -> session._csrf_token.token, csrf_token.<id> -> session.<id>.token
        std::string token_id = segments.size() > 1 ? segments[1] : "_csrf_token";
        return get_nested_value(session_, {token_id, "token"});
    }
    if (root == "root" && segments.size() == 1) {
        if (conf_.is_object()) {
            auto it = conf_.find("default_root");
            if (it != conf_.end() && it->is_string()) return *it;
        }
        return "";
    }
    found = false;
    return nullptr;
}

Value RenderContext::resolve_variable(const std::string& name) const {
    std::vector<std::string> segments = split(name, '.');
    const std::string& root = segments.front();

    bool found = false;
    Value reserved = resolve_reserved(root, segments, found);
    if (found) return reserved;

    for (auto it = loop_stack_.rbegin(); it != loop_stack_.rend(); ++it) {
        if (it->item_name == root) {
            return it->item ? get_nested_value(*it->item, segments, 1) : Value(nullptr);
        }
    }

    auto local = locals_.find(root);
    if (local != locals_.end()) {
        return get_nested_value(local->second, segments, 1);
    }

    if (data_.is_object()) {
        auto it = data_.find(root);
        if (it != data_.end()) return get_nested_value(*it, segments, 1);
    }
    return nullptr;
}

// --- expression evaluation ---

Value RenderContext::evaluate(const Expression& expr) const {
    switch (expr.kind) {
        case ExprKind::LITERAL:
            return static_cast<const LiteralExpr&>(expr).value;
        case ExprKind::VARIABLE:
            return resolve_variable(static_cast<const VariableExpr&>(expr).name);
        case ExprKind::PROPERTY: {
            const auto& e = static_cast<const PropertyExpr&>(expr);
            return get_nested_value(evaluate(*e.object), {e.property});
        }
        case ExprKind::INDEX: {
            const auto& e = static_cast<const IndexExpr&>(expr);
            Value base = evaluate(*e.object);
            Value key = evaluate(*e.index);
            if (base.is_array() && key.is_number()) {
                double d = key.get<double>();
                if (d < 0 || d != std::floor(d) || d >= static_cast<double>(base.size())) return nullptr;
                return base[static_cast<size_t>(d)];
            }
            if (base.is_object() && key.is_string()) {
                auto it = base.find(key.get<std::string>());
                return it == base.end() ? Value(nullptr) : *it;
            }
            if (key.is_string()) {
                return get_nested_value(base, {key.get<std::string>()});
            }
            return nullptr;
        }
        case ExprKind::ARRAY: {
            Value arr = Value::array();
            for (const auto& item : static_cast<const ArrayExpr&>(expr).items) {
                arr.push_back(evaluate(*item));
            }
            return arr;
        }
        case ExprKind::OBJECT: {
            Value obj = Value::object();
            for (const auto& [key, value] : static_cast<const ObjectExpr&>(expr).entries) {
                obj[key] = evaluate(*value);
            }
            return obj;
        }
        case ExprKind::BINARY:
            return evaluate_binary(static_cast<const BinaryExpr&>(expr));
        case ExprKind::UNARY: {
            const auto& e = static_cast<const UnaryExpr&>(expr);
            Value operand = evaluate(*e.operand);
            if (e.op == UnaryOp::NOT) return !is_truthy(operand);
            if (operand.is_number_unsigned()) {
                uint64_t u = operand.get<uint64_t>();
                if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return -static_cast<int64_t>(u);
                return -static_cast<double>(u);
            }
            if (operand.is_number_integer()) {
                int64_t i = operand.get<int64_t>();
                // -INT64_MIN is not representable
                if (i == std::numeric_limits<int64_t>::min()) return -static_cast<double>(i);
                return -i;
            }
            if (operand.is_number()) return -operand.get<double>();
            return nullptr;
        }
        case ExprKind::CALL:
            return call(static_cast<const CallExpr&>(expr));
        case ExprKind::TERNARY: {
            const auto& e = static_cast<const TernaryExpr&>(expr);
            return is_truthy(evaluate(*e.condition)) ? evaluate(*e.then_expr) : evaluate(*e.else_expr);
        }
    }
    return nullptr;
}

Value RenderContext::evaluate_binary(const BinaryExpr& expr) const {
    // Logical operators short-circuit and always produce booleans
    if (expr.op == BinaryOp::AND) {
        return is_truthy(evaluate(*expr.left)) && is_truthy(evaluate(*expr.right));
    }
    if (expr.op == BinaryOp::OR) {
        return is_truthy(evaluate(*expr.left)) || is_truthy(evaluate(*expr.right));
    }

    Value l = evaluate(*expr.left);
    Value r = evaluate(*expr.right);

    switch (expr.op) {
        case BinaryOp::EQ: return loose_equals(l, r);
        case BinaryOp::NE: return !loose_equals(l, r);
        case BinaryOp::STRICT_EQ: return l == r;
        case BinaryOp::STRICT_NE: return l != r;
        case BinaryOp::LT:
        case BinaryOp::LE:
        case BinaryOp::GT:
        case BinaryOp::GE: {
            int cmp;
            if (l.is_number() && r.is_number()) {
                double a = l.get<double>();
                double b = r.get<double>();
                cmp = a < b ? -1 : (a > b ? 1 : 0);
            } else if (l.is_string() && r.is_string()) {
                cmp = l.get_ref<const std::string&>().compare(r.get_ref<const std::string&>());
            } else {
                return false;
            }
            switch (expr.op) {
                case BinaryOp::LT: return cmp < 0;
                case BinaryOp::LE: return cmp <= 0;
                case BinaryOp::GT: return cmp > 0;
                default: return cmp >= 0;
            }
        }
        case BinaryOp::ADD:
            if (l.is_number() && r.is_number()) {
                return number_result(l.get<double>() + r.get<double>(), both_integers(l, r));
            }
            if (l.is_string() || r.is_string()) {
                return value_to_string(l) + value_to_string(r);
            }
            return nullptr;
        case BinaryOp::SUB:
        case BinaryOp::MUL:
        case BinaryOp::DIV:
        case BinaryOp::MOD: {
            if (!l.is_number() || !r.is_number()) return nullptr;
            double a = l.get<double>();
            double b = r.get<double>();
            bool integral = both_integers(l, r);
            if (expr.op == BinaryOp::SUB) return number_result(a - b, integral);
            if (expr.op == BinaryOp::MUL) return number_result(a * b, integral);
            if (b == 0.0) return nullptr;
            if (expr.op == BinaryOp::DIV) return number_result(a / b, integral);
            return number_result(std::fmod(a, b), integral);
        }
        default:
            return nullptr;
    }
}

Value RenderContext::call(const CallExpr& expr) const {
    std::vector<Value> args;
    args.reserve(expr.args.size());
    for (const auto& a : expr.args) {
        args.push_back(evaluate(*a));
    }
    return functions_->call_function(expr.name, args, *this);
}

// --- loop stack / locals ---

void RenderContext::push_loop(std::string item_name, const Value* item, size_t index) {
    loop_stack_.push_back(LoopFrame{std::move(item_name), index, item});
}

void RenderContext::pop_loop() {
    if (!loop_stack_.empty()) loop_stack_.pop_back();
}

std::optional<size_t> RenderContext::current_index() const {
    if (loop_stack_.empty()) return std::nullopt;
    return loop_stack_.back().index;
}

void RenderContext::set_local(const std::string& name, Value value) {
    locals_[name] = std::move(value);
}

std::unordered_map<std::string, Value> RenderContext::swap_locals(std::unordered_map<std::string, Value> locals) {
    std::swap(locals_, locals);
    return locals;
}

// --- sections / helpers ---

std::shared_ptr<const NodeList> RenderContext::find_section(const std::string& name) const {
    auto it = sections_.find(name);
    return it == sections_.end() ? nullptr : it->second;
}

void RenderContext::add_sections(const SectionMap& sections) {
    for (const auto& [name, body] : sections) {
        sections_.emplace(name, body);
    }
}

void RenderContext::set_section(const std::string& name, std::shared_ptr<const NodeList> body) {
    sections_[name] = std::move(body);
}

std::shared_ptr<const HelperDefinition> RenderContext::find_helper(const std::string& name) const {
    auto it = helpers_.find(name);
    return it == helpers_.end() ? nullptr : it->second;
}

void RenderContext::add_helpers(const HelperMap& helpers) {
    for (const auto& [name, helper] : helpers) {
        helpers_[name] = helper;
    }
}

RenderContext RenderContext::derive_for_model(Value model) const {
    RenderContext child(std::move(model));
    child.global_repository_ = global_repository_;
    child.repository_ = repository_;
    child.session_ = session_;
    child.query_ = query_;
    child.user_ = user_;
    child.config_ = config_;
    child.conf_ = conf_;
    child.url_ = url_;
    child.hostname_ = hostname_;
    child.translator_ = translator_;
    child.functions_ = functions_;
    child.include_depth_ = include_depth_;
    return child;
}

} // namespace mvcore
