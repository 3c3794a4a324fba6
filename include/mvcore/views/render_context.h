// mvcore/views/render_context.h
#ifndef MVCORE_VIEWS_RENDER_CONTEXT_H
#define MVCORE_VIEWS_RENDER_CONTEXT_H

#include "common/types.h"
#include "mvcore/views/ast.h"
#include "mvcore/views/functions.h"
#include "mvcore/views/translation.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mvcore {

struct LoopFrame {
    std::string item_name;
    size_t index;
    const Value* item; // owned by the renderer for the duration of the iteration
};

// Everything a template can see while rendering: model, request scoped
// data, globals, loop variables, helper locals, sections and helpers.
class RenderContext {
public:
    RenderContext();
    explicit RenderContext(Value data);

    RenderContext& with_data(Value data);
    RenderContext& with_global_repository(Value repo);
    RenderContext& with_repository(Value repo);
    RenderContext& with_session(Value session);
    RenderContext& with_query(Value query);
    RenderContext& with_user(Value user);
    RenderContext& with_config(ConfigMap config);
    RenderContext& with_conf(Value conf);
    RenderContext& with_url(std::string url);
    RenderContext& with_hostname(std::string hostname);
    RenderContext& with_translator(std::shared_ptr<const Translator> translator);
    RenderContext& with_functions(std::shared_ptr<const FunctionRegistry> functions);

    const Value& data() const { return data_; }
    const Value& global_repository() const { return global_repository_; }
    const Value& repository() const { return repository_; }
    const Value& session() const { return session_; }
    const Value& query() const { return query_; }
    const Value& user() const { return user_; }
    const ConfigMap& config() const { return config_; }
    const Value& conf() const { return conf_; }
    const std::string& url() const { return url_; }
    const std::string& hostname() const { return hostname_; }
    const Translator* translator() const { return translator_.get(); }
    const FunctionRegistry& functions() const { return *functions_; }

    // Reserved names, then loop variables (innermost first), then helper
    // locals, then top-level model keys. Unresolvable paths yield null.
    Value resolve_variable(const std::string& name) const;

    // Walks object keys, numeric array indices, and length/size
    static Value get_nested_value(const Value& root, const std::vector<std::string>& path, size_t from = 0);

    // Data anomalies (missing keys, type mismatches, division by zero)
    // evaluate to null rather than throwing
    Value evaluate(const Expression& expr) const;

    // Loop stack
    void push_loop(std::string item_name, const Value* item, size_t index);
    void pop_loop();
    size_t loop_depth() const { return loop_stack_.size(); }
    std::optional<size_t> current_index() const;

    // Helper locals
    const std::unordered_map<std::string, Value>& locals() const { return locals_; }
    void set_local(const std::string& name, Value value);
    std::unordered_map<std::string, Value> swap_locals(std::unordered_map<std::string, Value> locals);

    // Sections and helpers
    const SectionMap& sections() const { return sections_; }
    std::shared_ptr<const NodeList> find_section(const std::string& name) const;
    // Existing definitions win, so child sections override layout defaults
    void add_sections(const SectionMap& sections);
    void set_section(const std::string& name, std::shared_ptr<const NodeList> body);

    const HelperMap& helpers() const { return helpers_; }
    std::shared_ptr<const HelperDefinition> find_helper(const std::string& name) const;
    void add_helpers(const HelperMap& helpers);

    // Fresh context over a partial model; request data, config and
    // registries carry over, loop state, locals and sections do not
    RenderContext derive_for_model(Value model) const;

    // Number of view() partials currently being rendered
    size_t include_depth() const { return include_depth_; }
    void set_include_depth(size_t depth) { include_depth_ = depth; }

private:
    Value resolve_reserved(const std::string& root, const std::vector<std::string>& segments, bool& found) const;
    Value evaluate_binary(const BinaryExpr& expr) const;
    Value call(const CallExpr& expr) const;

    Value data_;
    Value global_repository_;
    Value repository_;
    Value session_;
    Value query_;
    Value user_;
    ConfigMap config_;
    Value conf_;
    std::string url_ = "/";
    std::string hostname_ = "localhost";

    std::vector<LoopFrame> loop_stack_;
    std::unordered_map<std::string, Value> locals_;
    SectionMap sections_;
    HelperMap helpers_;

    std::shared_ptr<const Translator> translator_;
    std::shared_ptr<const FunctionRegistry> functions_;
    size_t include_depth_ = 0;
};

// Pushes a loop frame for one iteration and pops it on scope exit,
// including exceptions
class LoopScope {
public:
    LoopScope(RenderContext& ctx, std::string item_name, const Value* item, size_t index) : ctx_(ctx) {
        ctx_.push_loop(std::move(item_name), item, index);
    }
    ~LoopScope() { ctx_.pop_loop(); }

    LoopScope(const LoopScope&) = delete;
    LoopScope& operator=(const LoopScope&) = delete;

private:
    RenderContext& ctx_;
};

} // namespace mvcore

#endif // MVCORE_VIEWS_RENDER_CONTEXT_H
