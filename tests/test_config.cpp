// tests/test_config.cpp
#include <catch2/catch.hpp>
#include "mvcore/config/app_config.h"
#include "common/log.h"
#include "common/utils.h"
#include <filesystem>
#include <fstream>
#include <string>

using namespace mvcore;

TEST_CASE("Defaults apply to an empty document", "[config]") {
    AppConfig config = AppConfig::from_yaml_string("");
    REQUIRE(config.views.directory == "views");
    REQUIRE(config.views.default_layout == "layout");
    REQUIRE(config.views.cache_enabled);
    REQUIRE(config.views.extension == ".html");
    REQUIRE_FALSE(config.views.strict_partials);
    REQUIRE(config.views.max_include_depth == 32);
    REQUIRE(config.backend == sql::DatabaseBackend::POSTGRES);
    REQUIRE(config.log_level == LogLevel::WARNING);
}

TEST_CASE("All sections are read", "[config]") {
    const std::string yaml = R"(
views:
  directory: templates
  default_layout: main
  cache_enabled: false
  extension: .tpl
  default_root: /app
  strict_partials: true
  max_include_depth: 8
database:
  backend: mariadb
logging:
  level: debug
site:
  name: Demo
)";
    AppConfig config = AppConfig::from_yaml_string(yaml);
    REQUIRE(config.views.directory == "templates");
    REQUIRE(config.views.default_layout == "main");
    REQUIRE_FALSE(config.views.cache_enabled);
    REQUIRE(config.views.extension == ".tpl");
    REQUIRE(config.views.default_root == "/app");
    REQUIRE(config.views.strict_partials);
    REQUIRE(config.views.max_include_depth == 8);
    REQUIRE(config.backend == sql::DatabaseBackend::MARIADB);
    REQUIRE(config.log_level == LogLevel::DEBUG);

    Value conf = config.to_json();
    REQUIRE(conf["site"]["name"] == "Demo");
    REQUIRE(conf["default_root"] == "/app");
    REQUIRE(conf["default_layout"] == "main");
    REQUIRE(conf["cache_enabled"] == false);
    REQUIRE(conf["views"]["max_include_depth"] == 8);
}

TEST_CASE("Wrong types are rejected", "[config][error]") {
    REQUIRE_THROWS_AS(AppConfig::from_yaml_string("views: [1, 2]"), ConfigError);
    REQUIRE_THROWS_AS(AppConfig::from_yaml_string("views:\n  cache_enabled: maybe"), ConfigError);
    REQUIRE_THROWS_AS(AppConfig::from_yaml_string("views:\n  max_include_depth: -1"), ConfigError);
    REQUIRE_THROWS_AS(AppConfig::from_yaml_string("views:\n  directory: 5"), ConfigError);
    REQUIRE_THROWS_AS(AppConfig::from_yaml_string("database:\n  backend: oracle"), ConfigError);
    REQUIRE_THROWS_AS(AppConfig::from_yaml_string("logging:\n  level: loud"), ConfigError);
    REQUIRE_THROWS_AS(AppConfig::from_yaml_string("- just\n- a list"), ConfigError);
    REQUIRE_THROWS_AS(AppConfig::from_yaml_string("views: {directory: [unclosed"), ConfigError);
}

TEST_CASE("Quoted scalars stay strings", "[config][yaml]") {
    Value doc = yaml_to_json(YAML::Load("a: 'true'\nb: true\nc: \"42\"\nd: 42\ne: 1.5\nf: ~\n"));
    REQUIRE(doc["a"] == "true");
    REQUIRE(doc["b"] == true);
    REQUIRE(doc["c"] == "42");
    REQUIRE(doc["d"] == 42);
    REQUIRE(doc["e"] == 1.5);
    REQUIRE(doc["f"].is_null());
}

TEST_CASE("Config loads from a file", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "mvcore_test_config.yaml";
    {
        std::ofstream out(path);
        out << "database:\n  backend: sqlite\n";
    }
    AppConfig config = AppConfig::from_file(path.string());
    REQUIRE(config.backend == sql::DatabaseBackend::SQLITE);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(AppConfig::from_file("/nonexistent/mvcore.yaml"), ConfigError);
}

TEST_CASE("Log level follows the config", "[config][log]") {
    LogLevel previous = log_level();
    AppConfig::from_yaml_string("logging:\n  level: error").apply_logging();
    REQUIRE(log_level() == LogLevel::ERROR);
    set_log_level(previous);

    REQUIRE(parse_log_level("off") == LogLevel::OFF);
    REQUIRE_THROWS_AS(parse_log_level("verbose"), ConfigError);
}
