// tests/test_engine.cpp
#include <catch2/catch.hpp>
#include "mvcore/views/engine.h"
#include "mvcore/views/template_cache.h"
#include "common/types.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace mvcore;
namespace fs = std::filesystem;

namespace {

// Temporary views directory removed at scope exit
class ViewsDir {
public:
    ViewsDir() {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("mvcore_views_" + std::to_string(rd()));
        fs::create_directories(root_ / "layouts");
    }
    ~ViewsDir() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& relative, const std::string& content) const {
        fs::path path = root_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string path() const { return root_.string(); }
    std::string file(const std::string& relative) const { return (root_ / relative).string(); }

private:
    fs::path root_;
};

ViewConfig config_for(const ViewsDir& dir) {
    ViewConfig config;
    config.directory = dir.path();
    return config;
}

} // namespace

TEST_CASE("Engine renders a view by name", "[engine]") {
    ViewsDir dir;
    dir.write("index.html", "Hello @{M.name}!");

    ViewEngine engine(config_for(dir));
    REQUIRE(engine.render("index", {{"name", "World"}}) == "Hello World!");
    REQUIRE(engine.render("/index", {{"name", "Slash"}}) == "Hello Slash!");
    REQUIRE(engine.render("index.html", {{"name", "Ext"}}) == "Hello Ext!");
}

TEST_CASE("Engine resolves view and layout paths", "[engine]") {
    ViewConfig config;
    config.directory = "views";
    ViewEngine engine(config);
    REQUIRE(engine.template_path("users/list") == (fs::path("views") / "users/list.html").string());
    REQUIRE(engine.layout_path("main") == (fs::path("views") / "layouts" / "main.html").string());
    REQUIRE(engine.layout_path("shared/frame") == (fs::path("views") / "shared/frame.html").string());
}

TEST_CASE("Layout wraps the view output", "[engine][layout]") {
    ViewsDir dir;
    dir.write("page.html", "<p>@{M.text}</p>");
    dir.write("layouts/layout.html", "<main>@{body}</main><footer>@{M.text}</footer>");

    ViewEngine engine(config_for(dir));
    Value data = {{"text", "hi"}};
    REQUIRE(engine.render("page", data, std::string("layout")) == "<main><p>hi</p></main><footer>hi</footer>");
    REQUIRE(engine.render_with_default_layout("page", data) == "<main><p>hi</p></main><footer>hi</footer>");
    REQUIRE(engine.render("page", data, std::string("")) == "<p>hi</p>");
    REQUIRE(engine.render("page", data) == "<p>hi</p>");
}

TEST_CASE("Child sections override layout sections", "[engine][layout][section]") {
    ViewsDir dir;
    dir.write("page.html", "@{section title}Child@{end}body");
    dir.write("plain.html", "plain");
    dir.write("layouts/layout.html", "@{section title}Default@{end}<title>@{section('title')}</title>@{content}");

    ViewEngine engine(config_for(dir));
    REQUIRE(engine.render("page", Value::object(), std::string("layout")) == "<title>Child</title>body");
    REQUIRE(engine.render("plain", Value::object(), std::string("layout")) == "<title>Default</title>plain");
}

TEST_CASE("Non-object model still receives content in the layout", "[engine][layout]") {
    ViewsDir dir;
    dir.write("list.html", "@{foreach x in M}@{x}@{end}");
    dir.write("layouts/layout.html", "[@{body}]");

    ViewEngine engine(config_for(dir));
    REQUIRE(engine.render("list", Value{1, 2, 3}, std::string("layout")) == "[123]");
}

TEST_CASE("Partials load from the views directory", "[engine][view]") {
    ViewsDir dir;
    dir.write("home.html", "@{view('partials/nav')}|@{view('partials/item', M.first)}|@{view('nope')}");
    dir.write("partials/nav.html", "nav:@{M.site}");
    dir.write("partials/item.html", "item:@{M.name}");

    ViewEngine engine(config_for(dir));
    Value data = {{"site", "S"}, {"first", {{"name", "One"}}}};
    REQUIRE(engine.render("home", data) == "nav:S|item:One|<!-- Error loading view 'nope' -->");
}

TEST_CASE("Strict partials turn a missing view into an error", "[engine][view]") {
    ViewsDir dir;
    dir.write("home.html", "@{view('nope')}");

    ViewConfig config = config_for(dir);
    config.strict_partials = true;
    ViewEngine engine(config);
    REQUIRE_THROWS_AS(engine.render("home", Value::object()), TemplateRenderError);
}

TEST_CASE("Missing top level view is reported", "[engine][error]") {
    ViewsDir dir;
    ViewEngine engine(config_for(dir));
    REQUIRE_THROWS_AS(engine.render("absent", Value::object()), TemplateNotFoundError);

    dir.write("ok.html", "ok");
    REQUIRE_THROWS_AS(engine.render("ok", Value::object(), std::string("absent_layout")), TemplateNotFoundError);
}

TEST_CASE("Request data is visible to templates", "[engine][context]") {
    ViewsDir dir;
    dir.write("req.html", "@{user.name}|@{session.id}|@{query.page}|@{R.title}|@{url}|@{hostname}|@{APP.name}");

    ViewEngine engine(config_for(dir));
    engine.set_global_repository({{"name", "Global"}});

    RenderRequest request;
    request.user = {{"name", "Ann"}};
    request.session = {{"id", "s1"}};
    request.query = {{"page", 2}};
    request.repository = {{"title", "T"}};
    request.url = "/req";
    request.hostname = "example.com";

    REQUIRE(engine.render_with_context("req", Value::object(), std::nullopt, request) ==
            "Ann|s1|2|T|/req|example.com|Global");
}

TEST_CASE("Config values reach templates", "[engine][context]") {
    ViewsDir dir;
    dir.write("conf.html", "@{'%site'}|@{CONF.mode}|@{CONF.default_layout}|@{root}");

    ViewConfig config = config_for(dir);
    config.default_root = "/base";
    ViewEngine engine(config);
    engine.set_config({{"site", "mvcore"}});
    engine.set_conf({{"mode", "test"}});
    REQUIRE(engine.render("conf", Value::object()) == "mvcore|test|layout|/base");

    REQUIRE_THROWS_AS(engine.set_conf(Value::array()), ConfigError);
}

TEST_CASE("Registered functions are available to views", "[engine][functions]") {
    ViewsDir dir;
    dir.write("fn.html", "@{shout(M.word)}|@{badge('x')}");

    ViewEngine engine(config_for(dir));
    engine.register_function("shout", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        return args.empty() ? Value("") : Value(args[0].get<std::string>() + "!");
    });
    engine.register_function("badge", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        return "<b>" + args.at(0).get<std::string>() + "</b>";
    }, true);
    REQUIRE(engine.render("fn", {{"word", "hey"}}) == "hey!|<b>x</b>");
}

TEST_CASE("JSON translations load from a directory", "[engine][translate]") {
    ViewsDir dir;
    dir.write("t.html", "@(#nav.home)|@(Save)");
    dir.write("i18n/en.json", R"({"nav": {"home": "Home"}, "Save": "Save"})");
    dir.write("i18n/fr.json", R"({"nav": {"home": "Accueil"}, "Save": "Enregistrer"})");

    ViewEngine engine(config_for(dir));
    engine.load_json_translations(dir.file("i18n"), "fr");
    REQUIRE(engine.render("t", Value::object()) == "Accueil|Enregistrer");
}

TEST_CASE("Resource translations give each view its own section", "[engine][translate]") {
    ViewsDir dir;
    dir.write("home/index.html", "@(#title)|@(#save)|@(#welcome)|@(Save changes)");
    dir.write("about.html", "@(#title)|@(#welcome)");
    dir.write("layouts/layout.html", "<@(#brand)>@{body}");
    dir.write("resources/default.res",
              "# shipped defaults\n"
              "[global]\n"
              "title : \"Site\"\n"
              "save : \"Save\"\n"
              "brand : \"Brand\"\n"
              "[views/home/index]\n"
              "welcome : \"Welcome home\"\n"
              "save_changes : \"Save your changes\"\n");
    dir.write("resources/fr.res",
              "title : \"Le site\"\n"
              "[views/home/index]\n"
              "welcome : \"Bienvenue\"\n"
              "[views/layouts/layout]\n"
              "brand : \"Marque\"\n");

    ViewEngine engine(config_for(dir));
    engine.load_translations(dir.file("resources"), "fr");

    REQUIRE(engine.render("home/index", Value::object()) == "Le site|Save|Bienvenue|Save your changes");
    REQUIRE(engine.render("/about", Value::object()) == "Le site|[welcome]");
    REQUIRE(engine.render("home/index", Value::object(), "layout") ==
            "<Marque>Le site|Save|Bienvenue|Save your changes");
}

TEST_CASE("Resource translations take precedence over a plain translator", "[engine][translate]") {
    ViewsDir dir;
    dir.write("p.html", "@(#greeting)");

    ViewEngine engine(config_for(dir));
    auto plain = std::make_shared<Translator>();
    plain->add_translation("en", "greeting", "Hello");
    engine.set_translator(plain);
    REQUIRE(engine.render("p", Value::object()) == "Hello");

    auto resources = std::make_shared<ResourceTranslations>();
    resources->load_resource_string("en", "[views/p]\ngreeting : \"Hi from p\"\n");
    engine.set_resource_translations(resources);
    REQUIRE(engine.render("p", Value::object()) == "Hi from p");
}

TEST_CASE("Cache reuses compiled templates and reloads changed files", "[engine][cache]") {
    ViewsDir dir;
    dir.write("c.html", "v1");
    std::string path = dir.file("c.html");

    TemplateCache cache;
    auto first = cache.get_or_compile(path);
    auto again = cache.get_or_compile(path);
    REQUIRE(first == again);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.compile_count() == 1);

    dir.write("c.html", "v2");
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));
    auto reloaded = cache.get_or_compile(path);
    REQUIRE(reloaded != first);
    REQUIRE(cache.compile_count() == 2);

    cache.invalidate(path);
    REQUIRE(cache.size() == 0);
    (void)cache.get_or_compile(path);
    cache.clear();
    REQUIRE(cache.size() == 0);

    REQUIRE_THROWS_AS(cache.get_or_compile(dir.file("missing.html")), TemplateNotFoundError);
}

TEST_CASE("Hot reload recompiles every time", "[engine][cache]") {
    ViewsDir dir;
    dir.write("h.html", "x");
    TemplateCache cache(true);
    (void)cache.get_or_compile(dir.file("h.html"));
    (void)cache.get_or_compile(dir.file("h.html"));
    REQUIRE(cache.compile_count() == 2);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("Disabled cache picks up edits immediately", "[engine][cache]") {
    ViewsDir dir;
    dir.write("e.html", "before");
    ViewConfig config = config_for(dir);
    config.cache_enabled = false;
    ViewEngine engine(config);
    REQUIRE(engine.render("e", Value::object()) == "before");
    dir.write("e.html", "after");
    REQUIRE(engine.render("e", Value::object()) == "after");
}

TEST_CASE("Concurrent renders share one engine", "[engine][threads]") {
    ViewsDir dir;
    dir.write("n.html", "@{foreach x in M.xs}@{x}@{end}");
    dir.write("layouts/layout.html", "<@{body}>");

    ViewEngine engine(config_for(dir));
    std::vector<std::string> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&engine, &results, i]() {
            results[i] = engine.render("n", {{"xs", {i, i + 1}}}, std::string("layout"));
        });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i] == "<" + std::to_string(i) + std::to_string(i + 1) + ">");
    }
    REQUIRE(engine.cache().size() == 2);
}
