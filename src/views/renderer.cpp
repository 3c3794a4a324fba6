// src/views/renderer.cpp
#include "mvcore/views/renderer.h"
#include "common/log.h"
#include "common/utils.h"
#include <algorithm>

namespace mvcore {

namespace {

constexpr size_t kBytesPerNode = 512;
constexpr size_t kMaxInitialCapacity = 64 * 1024;

// Restores helper locals even when the body throws
class LocalsScope {
public:
    LocalsScope(RenderContext& ctx, std::unordered_map<std::string, Value> locals)
        : ctx_(ctx), saved_(ctx.swap_locals(std::move(locals))) {}
    ~LocalsScope() { ctx_.swap_locals(std::move(saved_)); }

    LocalsScope(const LocalsScope&) = delete;
    LocalsScope& operator=(const LocalsScope&) = delete;

private:
    RenderContext& ctx_;
    std::unordered_map<std::string, Value> saved_;
};

class DepthScope {
public:
    explicit DepthScope(size_t& depth) : depth_(depth) { ++depth_; }
    ~DepthScope() { --depth_; }

    DepthScope(const DepthScope&) = delete;
    DepthScope& operator=(const DepthScope&) = delete;

private:
    size_t& depth_;
};

bool unescaped_name(const std::string& name) {
    return name == "root" || name == "url" || name == "hostname";
}

std::string asset_path(const std::string& file, const std::string& dir) {
    if (file.starts_with("/") || file.find("://") != std::string::npos) return file;
    return "/" + dir + "/" + file;
}

} // namespace

Renderer::Renderer(RenderContext& ctx, TemplateLoader loader, RenderOptions options)
    : ctx_(ctx), loader_(std::move(loader)), options_(options) {}

std::string Renderer::render(const Template& tpl) {
    template_name_ = tpl.name;
    ctx_.add_sections(tpl.sections);
    ctx_.add_helpers(tpl.helpers);

    std::string out;
    out.reserve(std::min(tpl.nodes.size() * kBytesPerNode, kMaxInitialCapacity));
    // break/continue outside any loop have nothing to act on
    (void)render_nodes_with_control(tpl.nodes, out);
    return out;
}

LoopControl Renderer::render_nodes_with_control(const NodeList& nodes, std::string& out) {
    for (const auto& node : nodes) {
        LoopControl ctl = render_node(*node, out);
        if (ctl != LoopControl::NONE) return ctl;
    }
    return LoopControl::NONE;
}

LoopControl Renderer::render_node(const TemplateNode& node, std::string& out) {
    switch (node.kind) {
        case NodeKind::TEXT:
            out += static_cast<const TextNode&>(node).text;
            break;
        case NodeKind::VARIABLE:
            render_variable(static_cast<const VariableNode&>(node), out);
            break;
        case NodeKind::CONDITIONAL:
            return render_conditional(static_cast<const ConditionalNode&>(node), out);
        case NodeKind::LOOP:
            render_loop(static_cast<const LoopNode&>(node), out);
            break;
        case NodeKind::BREAK:
            if (ctx_.loop_depth() > 0) return LoopControl::BREAK;
            break;
        case NodeKind::CONTINUE:
            if (ctx_.loop_depth() > 0) return LoopControl::CONTINUE;
            break;
        case NodeKind::INDEX:
            if (auto idx = ctx_.current_index()) out += std::to_string(*idx);
            break;
        case NodeKind::SECTION_CALL:
            render_section(static_cast<const SectionCallNode&>(node).name, out);
            break;
        case NodeKind::SECTION_DEF:
        case NodeKind::HELPER_DEF:
            // lifted into the template maps at parse time
            break;
        case NodeKind::HELPER_CALL:
            render_helper_call(static_cast<const HelperCallNode&>(node), out);
            break;
        case NodeKind::VIEW:
            render_view(static_cast<const ViewNode&>(node), out);
            break;
        case NodeKind::IMPORT:
            for (const auto& file : static_cast<const ImportNode&>(node).files) {
                if (file.ends_with(".css")) {
                    out += "<link rel=\"stylesheet\" href=\"" + html_escape_attribute(asset_path(file, "css")) + "\">\n";
                } else if (file.ends_with(".js")) {
                    out += "<script src=\"" + html_escape_attribute(asset_path(file, "js")) + "\"></script>\n";
                } else {
                    log_debug("import(): skipping '" + file + "', only .css and .js are supported");
                }
            }
            break;
        case NodeKind::META: {
            const auto& meta = static_cast<const MetaNode&>(node);
            if (meta.title) out += "<title>" + html_escape(*meta.title) + "</title>\n";
            if (meta.description) {
                out += "<meta name=\"description\" content=\"" + html_escape_attribute(*meta.description) + "\">\n";
            }
            if (meta.keywords) {
                out += "<meta name=\"keywords\" content=\"" + html_escape_attribute(*meta.keywords) + "\">\n";
            }
            break;
        }
        case NodeKind::BODY:
        case NodeKind::CONTENT: {
            const Value& data = ctx_.data();
            if (data.is_object()) {
                auto it = data.find("content");
                if (it != data.end() && it->is_string()) out += it->get<std::string>();
            }
            break;
        }
        case NodeKind::HEAD:
            render_section("head", out);
            break;
        case NodeKind::CSRF:
            out += value_to_string(ctx_.functions().call_function("csrf", {}, ctx_));
            break;
        case NodeKind::TRANSLATE:
            render_translate(static_cast<const TranslateNode&>(node), out);
            break;
        case NodeKind::CONFIG: {
            const auto& config = ctx_.config();
            auto it = config.find(static_cast<const ConfigNode&>(node).key);
            if (it != config.end()) out += it->second;
            break;
        }
        case NodeKind::NAMESPACE:
            render_namespace(static_cast<const NamespaceNode&>(node), out);
            break;
    }
    return LoopControl::NONE;
}

void Renderer::render_variable(const VariableNode& node, std::string& out) {
    Value value = node.expr ? ctx_.evaluate(*node.expr) : ctx_.resolve_variable(node.name);

    bool escape = !node.raw && !unescaped_name(node.name);
    if (escape && node.expr && node.expr->kind == ExprKind::CALL) {
        escape = !ctx_.functions().is_html_safe(static_cast<const CallExpr&>(*node.expr).name);
    }

    std::string text = value_to_string(value);
    out += escape ? html_escape(text) : text;
}

void Renderer::render_namespace(const NamespaceNode& node, std::string& out) {
    std::string path = namespace_prefix(node.ns);
    if (!node.key.empty()) path += "." + node.key;
    out += html_escape(value_to_string(ctx_.resolve_variable(path)));
}

LoopControl Renderer::render_conditional(const ConditionalNode& node, std::string& out) {
    if (is_truthy(ctx_.evaluate(*node.condition))) {
        return render_nodes_with_control(node.then_body, out);
    }
    for (const auto& branch : node.else_ifs) {
        if (is_truthy(ctx_.evaluate(*branch.condition))) {
            return render_nodes_with_control(branch.body, out);
        }
    }
    if (node.else_body) {
        return render_nodes_with_control(*node.else_body, out);
    }
    return LoopControl::NONE;
}

void Renderer::render_loop(const LoopNode& node, std::string& out) {
    const Value collection = ctx_.evaluate(*node.collection);

    if (collection.is_array()) {
        for (size_t i = 0; i < collection.size(); ++i) {
            LoopScope scope(ctx_, node.item_name, &collection[i], i);
            if (render_nodes_with_control(node.body, out) == LoopControl::BREAK) break;
        }
        return;
    }

    if (collection.is_object()) {
        size_t i = 0;
        for (auto it = collection.begin(); it != collection.end(); ++it, ++i) {
            const Value pair = {{"key", it.key()}, {"value", it.value()}};
            LoopScope scope(ctx_, node.item_name, &pair, i);
            if (render_nodes_with_control(node.body, out) == LoopControl::BREAK) break;
        }
        return;
    }

    log_warning("foreach " + node.item_name + " (line " + std::to_string(node.line) + "): collection is " +
                std::string(collection.type_name()) + ", not an array or object");
}

void Renderer::render_helper_call(const HelperCallNode& node, std::string& out) {
    auto helper = ctx_.find_helper(node.name);
    if (!helper) {
        log_debug("Helper '" + node.name + "' is not defined");
        return;
    }
    if (call_depth_ >= options_.max_include_depth) {
        throw TemplateRenderError("Maximum helper nesting depth (" + std::to_string(options_.max_include_depth) +
                                  ") exceeded calling '" + node.name + "'", template_name_);
    }

    std::vector<Value> args;
    args.reserve(node.args.size());
    for (const auto& a : node.args) {
        args.push_back(ctx_.evaluate(*a));
    }

    auto locals = ctx_.locals();
    for (size_t i = 0; i < helper->params.size(); ++i) {
        locals[helper->params[i]] = i < args.size() ? args[i] : Value(nullptr);
    }

    DepthScope depth(call_depth_);
    LocalsScope scope(ctx_, std::move(locals));
    (void)render_nodes_with_control(helper->body, out);
}

void Renderer::render_section(const std::string& name, std::string& out) {
    auto body = ctx_.find_section(name);
    if (!body) return;
    if (call_depth_ >= options_.max_include_depth) {
        throw TemplateRenderError("Maximum section nesting depth (" + std::to_string(options_.max_include_depth) +
                                  ") exceeded rendering '" + name + "'", template_name_);
    }
    DepthScope depth(call_depth_);
    (void)render_nodes_with_control(*body, out);
}

void Renderer::render_view(const ViewNode& node, std::string& out) {
    if (ctx_.include_depth() >= options_.max_include_depth) {
        throw TemplateRenderError("Maximum view nesting depth (" + std::to_string(options_.max_include_depth) +
                                  ") exceeded including '" + node.name + "'", template_name_);
    }

    std::shared_ptr<const Template> partial;
    std::string failure;
    if (!loader_) {
        failure = "no template loader configured";
    } else {
        try {
            partial = loader_(node.name);
            if (!partial) failure = "not found";
        } catch (const TemplateParseError&) {
            throw;
        } catch (const TemplateRenderError&) {
            throw;
        } catch (const std::exception& e) {
            failure = e.what();
        }
    }

    if (!partial) {
        if (options_.strict_partials) {
            throw TemplateRenderError("Cannot load view '" + node.name + "': " + failure, template_name_);
        }
        log_warning("Cannot load view '" + node.name + "': " + failure);
        out += "<!-- Error loading view '" + html_escape(node.name) + "' -->";
        return;
    }

    RenderContext child = node.model ? ctx_.derive_for_model(ctx_.evaluate(*node.model)) : ctx_;
    child.set_include_depth(ctx_.include_depth() + 1);
    Renderer renderer(child, loader_, options_);
    out += renderer.render(*partial);
}

void Renderer::render_translate(const TranslateNode& node, std::string& out) {
    if (const Translator* t = ctx_.translator()) {
        out += node.is_key ? t->translate_key(node.text) : t->translate_text(node.text);
        return;
    }
    out += node.is_key ? "[#" + node.text + "]" : node.text;
}

} // namespace mvcore
