// mvcore/views/engine.h
#ifndef MVCORE_VIEWS_ENGINE_H
#define MVCORE_VIEWS_ENGINE_H

#include "common/types.h"
#include "mvcore/views/functions.h"
#include "mvcore/views/renderer.h"
#include "mvcore/views/resource_translation.h"
#include "mvcore/views/template_cache.h"
#include "mvcore/views/translation.h"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace mvcore {

struct ViewConfig {
    std::string directory = "views";
    std::string default_layout = "layout";
    bool cache_enabled = true;
    std::string extension = ".html";
    std::string default_root;
    bool strict_partials = false;
    size_t max_include_depth = 32;
};

// Per-request data exposed as repository/R, session, query, user, url, hostname
struct RenderRequest {
    Value repository = Value::object();
    Value session = Value::object();
    Value query = Value::object();
    Value user;
    std::string url = "/";
    std::string hostname = "localhost";
};

class ViewEngine {
public:
    explicit ViewEngine(ViewConfig config = {});

    // layout: nullopt or "" renders without a layout
    [[nodiscard]] std::string render(const std::string& name, const Value& data,
                                     const std::optional<std::string>& layout = std::nullopt);

    // Same as render() using config().default_layout
    [[nodiscard]] std::string render_with_default_layout(const std::string& name, const Value& data);

    [[nodiscard]] std::string render_with_context(const std::string& name, const Value& data,
                                                  const std::optional<std::string>& layout,
                                                  const RenderRequest& request);

    void set_global_repository(Value repository);
    void set_config(ConfigMap config);
    void set_conf(Value conf);
    // One translator for every view; ignored while resource translations are set
    void set_translator(std::shared_ptr<const Translator> translator);
    // Loads <dir>/<lang>.json files into a new translator for the given language
    void load_json_translations(const std::string& directory, const std::string& language = "en");

    // Sectioned translations: each view and layout renders with its own merged table
    void set_resource_translations(std::shared_ptr<const ResourceTranslations> translations);
    // Loads <dir>/*.res (plus default.res as the fallback) for the given language
    void load_translations(const std::string& directory, const std::string& language = "en");

    // Register template functions before rendering starts
    template<typename Func>
    void register_function(std::string name, Func&& func, bool html_safe = false) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto functions = std::make_shared<FunctionRegistry>(*functions_);
        functions->register_function(std::move(name), std::forward<Func>(func), html_safe);
        functions_ = std::move(functions);
    }

    void clear_cache() { cache_->clear(); }
    const TemplateCache& cache() const { return *cache_; }
    const ViewConfig& config() const { return config_; }

    std::string template_path(const std::string& name) const;
    std::string layout_path(const std::string& name) const;

private:
    struct Globals {
        Value global_repository;
        ConfigMap config;
        Value conf;
        std::shared_ptr<const Translator> translator;
        std::shared_ptr<const ResourceTranslations> resources;
        std::shared_ptr<const FunctionRegistry> functions;
    };

    Globals snapshot() const;
    // scope: view path relative to the views directory, without extension
    std::shared_ptr<const Translator> translator_for(const Globals& globals, const std::string& scope) const;
    std::string view_scope(const std::string& name) const;
    std::string layout_scope(const std::string& name) const;
    RenderContext make_context(Value data, const RenderRequest& request, const Globals& globals,
                               std::shared_ptr<const Translator> translator) const;
    TemplateLoader make_loader() const;
    std::string with_extension(std::string path) const;

    ViewConfig config_;
    std::shared_ptr<TemplateCache> cache_;
    RenderOptions options_;

    mutable std::shared_mutex mutex_;
    Value global_repository_ = Value::object();
    ConfigMap legacy_config_;
    Value conf_ = Value::object();
    std::shared_ptr<const Translator> translator_;
    std::shared_ptr<const ResourceTranslations> resources_;
    std::shared_ptr<const FunctionRegistry> functions_;
};

} // namespace mvcore

#endif // MVCORE_VIEWS_ENGINE_H
