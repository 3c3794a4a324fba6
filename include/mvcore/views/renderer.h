// mvcore/views/renderer.h
#ifndef MVCORE_VIEWS_RENDERER_H
#define MVCORE_VIEWS_RENDERER_H

#include "mvcore/views/ast.h"
#include "mvcore/views/render_context.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mvcore {

// Resolves a partial name from @{view('name')} to a compiled template
using TemplateLoader = std::function<std::shared_ptr<const Template>(const std::string& name)>;

enum class LoopControl : uint8_t {
    NONE,
    BREAK,
    CONTINUE
};

struct RenderOptions {
    // Missing partials: throw TemplateRenderError instead of an HTML comment
    bool strict_partials = false;
    // Nesting limit for view() partials, and separately for helper and
    // section calls within one template
    size_t max_include_depth = 32;
};

class Renderer {
public:
    Renderer(RenderContext& ctx, TemplateLoader loader = {}, RenderOptions options = {});

    // Template sections are merged into the context without replacing
    // existing ones, helpers are registered, then nodes are rendered
    [[nodiscard]] std::string render(const Template& tpl);

    // Appends to out; a break/continue signal stops the sequence and is
    // returned so the enclosing loop can act on it
    LoopControl render_nodes_with_control(const NodeList& nodes, std::string& out);

private:
    LoopControl render_node(const TemplateNode& node, std::string& out);
    LoopControl render_conditional(const ConditionalNode& node, std::string& out);
    void render_loop(const LoopNode& node, std::string& out);
    void render_helper_call(const HelperCallNode& node, std::string& out);
    void render_view(const ViewNode& node, std::string& out);
    void render_section(const std::string& name, std::string& out);
    void render_variable(const VariableNode& node, std::string& out);
    void render_namespace(const NamespaceNode& node, std::string& out);
    void render_translate(const TranslateNode& node, std::string& out);

    RenderContext& ctx_;
    TemplateLoader loader_;
    RenderOptions options_;
    std::string template_name_;
    size_t call_depth_ = 0;
};

} // namespace mvcore

#endif // MVCORE_VIEWS_RENDERER_H
