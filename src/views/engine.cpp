// src/views/engine.cpp
#include "mvcore/views/engine.h"
#include "common/log.h"
#include <filesystem>
#include <mutex>

namespace mvcore {

ViewEngine::ViewEngine(ViewConfig config)
    : config_(std::move(config)),
      cache_(std::make_shared<TemplateCache>(!config_.cache_enabled)),
      functions_(FunctionRegistry::shared_default()) {
    options_.strict_partials = config_.strict_partials;
    options_.max_include_depth = config_.max_include_depth;

    legacy_config_["default_root"] = config_.default_root;
    legacy_config_["default_layout"] = config_.default_layout;
    legacy_config_["cache_enabled"] = config_.cache_enabled ? "true" : "false";
    set_conf(Value::object());
}

std::string ViewEngine::with_extension(std::string path) const {
    if (!config_.extension.empty() && !path.ends_with(config_.extension)) {
        path += config_.extension;
    }
    return path;
}

std::string ViewEngine::template_path(const std::string& name) const {
    std::string relative = name;
    while (relative.starts_with("/")) {
        relative.erase(0, 1);
    }
    return (std::filesystem::path(config_.directory) / with_extension(relative)).string();
}

std::string ViewEngine::layout_path(const std::string& name) const {
    std::filesystem::path dir(config_.directory);
    if (name.find('/') != std::string::npos) {
        std::string relative = name;
        while (relative.starts_with("/")) {
            relative.erase(0, 1);
        }
        return (dir / with_extension(relative)).string();
    }
    return (dir / "layouts" / with_extension(name)).string();
}

void ViewEngine::set_global_repository(Value repository) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    global_repository_ = std::move(repository);
}

void ViewEngine::set_config(ConfigMap config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    legacy_config_ = std::move(config);
}

void ViewEngine::set_conf(Value conf) {
    if (!conf.is_object()) {
        throw ConfigError("CONF must be an object");
    }
    // Engine settings are always visible to templates
    conf["default_root"] = config_.default_root;
    conf["default_layout"] = config_.default_layout;
    conf["cache_enabled"] = config_.cache_enabled;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    conf_ = std::move(conf);
}

void ViewEngine::set_translator(std::shared_ptr<const Translator> translator) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    translator_ = std::move(translator);
}

void ViewEngine::set_resource_translations(std::shared_ptr<const ResourceTranslations> translations) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    resources_ = std::move(translations);
}

void ViewEngine::load_translations(const std::string& directory, const std::string& language) {
    auto translations = std::make_shared<ResourceTranslations>(language);
    auto loaded = translations->load_directory(directory);
    if (!translations->has_language(language)) {
        log_warning("No resource translations for language '" + language + "' in " + directory);
    }
    log_debug("Loaded " + std::to_string(loaded.size()) + " resource file language(s) from " + directory);
    set_resource_translations(std::move(translations));
}

void ViewEngine::load_json_translations(const std::string& directory, const std::string& language) {
    auto translator = std::make_shared<Translator>(language);
    auto loaded = translator->load_directory(directory);
    if (!translator->has_language(language)) {
        log_warning("No translations for language '" + language + "' in " + directory);
    }
    log_debug("Loaded " + std::to_string(loaded.size()) + " translation table(s) from " + directory);
    set_translator(std::move(translator));
}

ViewEngine::Globals ViewEngine::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return Globals{global_repository_, legacy_config_, conf_, translator_, resources_, functions_};
}

std::shared_ptr<const Translator> ViewEngine::translator_for(const Globals& globals, const std::string& scope) const {
    if (globals.resources) return globals.resources->view_translator(scope);
    return globals.translator;
}

std::string ViewEngine::view_scope(const std::string& name) const {
    std::string scope = name;
    while (scope.starts_with("/")) {
        scope.erase(0, 1);
    }
    if (!config_.extension.empty() && scope.ends_with(config_.extension)) {
        scope.resize(scope.size() - config_.extension.size());
    }
    return scope;
}

std::string ViewEngine::layout_scope(const std::string& name) const {
    if (name.find('/') != std::string::npos) return view_scope(name);
    return "layouts/" + view_scope(name);
}

RenderContext ViewEngine::make_context(Value data, const RenderRequest& request, const Globals& globals,
                                       std::shared_ptr<const Translator> translator) const {
    RenderContext ctx(std::move(data));
    ctx.with_global_repository(globals.global_repository)
        .with_repository(request.repository)
        .with_session(request.session)
        .with_query(request.query)
        .with_user(request.user)
        .with_url(request.url)
        .with_hostname(request.hostname)
        .with_config(globals.config)
        .with_conf(globals.conf)
        .with_translator(std::move(translator))
        .with_functions(globals.functions);
    return ctx;
}

TemplateLoader ViewEngine::make_loader() const {
    auto cache = cache_;
    return [this, cache](const std::string& name) {
        return cache->get_or_compile(template_path(name));
    };
}

std::string ViewEngine::render(const std::string& name, const Value& data,
                               const std::optional<std::string>& layout) {
    return render_with_context(name, data, layout, RenderRequest{});
}

std::string ViewEngine::render_with_default_layout(const std::string& name, const Value& data) {
    return render_with_context(name, data, config_.default_layout, RenderRequest{});
}

std::string ViewEngine::render_with_context(const std::string& name, const Value& data,
                                            const std::optional<std::string>& layout,
                                            const RenderRequest& request) {
    Globals globals = snapshot();
    TemplateLoader loader = make_loader();

    auto view = cache_->get_or_compile(template_path(name));
    RenderContext ctx = make_context(data, request, globals, translator_for(globals, view_scope(name)));
    Renderer renderer(ctx, loader, options_);
    std::string content = renderer.render(*view);

    if (!layout.has_value() || layout->empty()) {
        return content;
    }

    auto layout_tpl = cache_->get_or_compile(layout_path(*layout));

    Value layout_data = data.is_object() ? data : Value::object();
    layout_data["content"] = std::move(content);

    RenderContext layout_ctx = make_context(std::move(layout_data), request, globals,
                                            translator_for(globals, layout_scope(*layout)));
    // Child sections first so they override the layout's defaults
    layout_ctx.add_sections(view->sections);
    Renderer layout_renderer(layout_ctx, loader, options_);
    return layout_renderer.render(*layout_tpl);
}

} // namespace mvcore
