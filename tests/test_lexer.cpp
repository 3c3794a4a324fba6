// tests/test_lexer.cpp
#include <catch2/catch.hpp>
#include "mvcore/views/lexer.h"
#include "common/types.h"
#include <string>

using namespace mvcore;

TEST_CASE("Lexer splits text and variable directives", "[lexer]") {
    auto tokens = Lexer("Hello @{name}!").tokenize();
    REQUIRE(tokens.size() == 3);
    REQUIRE(tokens[0].type == TokenType::TEXT);
    REQUIRE(tokens[0].value == "Hello ");
    REQUIRE(tokens[1].type == TokenType::VARIABLE);
    REQUIRE(tokens[1].value == "name");
    REQUIRE(tokens[2].type == TokenType::TEXT);
    REQUIRE(tokens[2].value == "!");
}

TEST_CASE("Lexer classifies block keywords", "[lexer]") {
    auto tokens = Lexer("@{if a}x@{else if b}y@{else}z@{fi}").tokenize();
    REQUIRE(tokens.size() == 7);
    REQUIRE(tokens[0].type == TokenType::IF);
    REQUIRE(tokens[0].value == "a");
    REQUIRE(tokens[2].type == TokenType::ELSE_IF);
    REQUIRE(tokens[2].value == "b");
    REQUIRE(tokens[4].type == TokenType::ELSE);
    REQUIRE(tokens[6].type == TokenType::FI);
}

TEST_CASE("Lexer parses foreach with and without var", "[lexer][foreach]") {
    auto plain = Lexer::classify_directive("foreach item in M.items", 1, 1);
    REQUIRE(plain.type == TokenType::FOREACH);
    REQUIRE(plain.value == "item");
    REQUIRE(plain.extra == "M.items");

    auto with_var = Lexer::classify_directive("foreach var row in rows", 1, 1);
    REQUIRE(with_var.type == TokenType::FOREACH);
    REQUIRE(with_var.value == "row");
    REQUIRE(with_var.extra == "rows");

    REQUIRE_THROWS_AS(Lexer::classify_directive("foreach items", 1, 1), TemplateParseError);
}

TEST_CASE("Lexer recognizes raw, namespace and config directives", "[lexer]") {
    auto raw = Lexer::classify_directive("!M.html", 1, 1);
    REQUIRE(raw.type == TokenType::RAW_VARIABLE);
    REQUIRE(raw.value == "M.html");

    auto ns = Lexer::classify_directive("repository.title", 1, 1);
    REQUIRE(ns.type == TokenType::NAMESPACE);
    REQUIRE(ns.value == "repository");
    REQUIRE(ns.extra == "title");

    auto user = Lexer::classify_directive("user", 1, 1);
    REQUIRE(user.type == TokenType::NAMESPACE);
    REQUIRE(user.extra.empty());

    auto config = Lexer::classify_directive("'%name'", 1, 1);
    REQUIRE(config.type == TokenType::CONFIG);
    REQUIRE(config.value == "name");
}

TEST_CASE("Lexer parses section, helper and view directives", "[lexer]") {
    auto def = Lexer::classify_directive("section scripts", 1, 1);
    REQUIRE(def.type == TokenType::SECTION_DEF);
    REQUIRE(def.value == "scripts");

    auto call = Lexer::classify_directive("section('scripts')", 1, 1);
    REQUIRE(call.type == TokenType::SECTION_CALL);
    REQUIRE(call.value == "scripts");

    auto helper = Lexer::classify_directive("helper card(title, body)", 1, 1);
    REQUIRE(helper.type == TokenType::HELPER_DEF);
    REQUIRE(helper.value == "card");
    REQUIRE(helper.args == std::vector<std::string>{"title", "body"});

    auto view = Lexer::classify_directive("view('partials/nav', M.menu)", 1, 1);
    REQUIRE(view.type == TokenType::VIEW);
    REQUIRE(view.value == "partials/nav");
    REQUIRE(view.extra == "M.menu");

    REQUIRE_THROWS_AS(Lexer::classify_directive("helper broken", 1, 1), TemplateParseError);
}

TEST_CASE("Lexer handles braces inside quoted strings", "[lexer]") {
    auto tokens = Lexer("@{json({'a': '}'})}").tokenize();
    REQUIRE(tokens.size() == 1);
    REQUIRE(tokens[0].type == TokenType::VARIABLE);
    REQUIRE(tokens[0].value == "json({'a': '}'})");
}

TEST_CASE("Lexer produces translation tokens", "[lexer][translate]") {
    auto tokens = Lexer("@(Hello world) @(#nav.home)").tokenize();
    REQUIRE(tokens.size() == 3);
    REQUIRE(tokens[0].type == TokenType::TRANSLATE);
    REQUIRE(tokens[0].value == "Hello world");
    REQUIRE(tokens[2].type == TokenType::TRANSLATE_KEY);
    REQUIRE(tokens[2].value == "nav.home");
}

TEST_CASE("Lexer tracks line and column", "[lexer]") {
    auto tokens = Lexer("line one\n  @{value}").tokenize();
    REQUIRE(tokens.size() == 2);
    REQUIRE(tokens[1].line == 2);
    REQUIRE(tokens[1].column == 3);
}

TEST_CASE("Lexer rejects unterminated and empty directives", "[lexer][error]") {
    REQUIRE_THROWS_AS(Lexer("Hello @{name").tokenize(), TemplateParseError);
    REQUIRE_THROWS_AS(Lexer("@{  }").tokenize(), TemplateParseError);

    try {
        (void)Lexer("ok\n@{oops").tokenize();
        FAIL("expected TemplateParseError");
    } catch (const TemplateParseError& e) {
        REQUIRE(e.line() == 2);
        REQUIRE(e.column() == 1);
    }
}

TEST_CASE("A lone at sign is plain text", "[lexer]") {
    auto tokens = Lexer("mail me @ home").tokenize();
    REQUIRE(tokens.size() == 1);
    REQUIRE(tokens[0].type == TokenType::TEXT);
    REQUIRE(tokens[0].value == "mail me @ home");
}
