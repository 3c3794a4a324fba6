// tests/test_translation.cpp
#include <catch2/catch.hpp>
#include "mvcore/views/resource_translation.h"
#include "mvcore/views/translation.h"
#include <stdexcept>
#include <string>

using namespace mvcore;

TEST_CASE("Resource files split into global and view sections", "[translate][resource]") {
    ResourceTable table = parse_resource(
        "# comment\n"
        "title : \"Site\"\n"
        "\n"
        "[global]\n"
        "save : \"Save\"\n"
        "cancel : Cancel\n"
        "[views/home/index]\n"
        "welcome : \"Line one\\nLine \\\"two\\\"\"\n"
        "not a pair\n");

    REQUIRE(table.global.at("title") == "Site");
    REQUIRE(table.global.at("save") == "Save");
    REQUIRE(table.global.at("cancel") == "Cancel");
    REQUIRE(table.sections.count("views/home/index") == 1);
    REQUIRE(table.sections.at("views/home/index").at("welcome") == "Line one\nLine \"two\"");
    REQUIRE(table.global.size() == 3);
}

TEST_CASE("View paths map to section names", "[translate][resource]") {
    REQUIRE(view_section_name("home/index") == "views/home/index");
    REQUIRE(view_section_name("/home/index.html") == "views/home/index");
    REQUIRE(view_section_name("views/admin/list") == "views/admin/list");
}

TEST_CASE("Free text maps to a generated key", "[translate]") {
    REQUIRE(translation_key("Save changes!") == "save_changes");
    REQUIRE(translation_key("  Hello - World ") == "hello___world");
    REQUIRE(translation_key("Version 2") == "version_2");
    REQUIRE(translation_key("!!!").empty());
    REQUIRE(translation_key("abcdefghijklmnopqrstuvwxyz0123456789").size() == 30);
}

TEST_CASE("Plain text translation falls back to the generated key", "[translate]") {
    Translator translator("en");
    translator.add_translation("en", "save_changes", "Save all changes");
    translator.add_translation("en", "Exact", "Exact match");
    REQUIRE(translator.translate_text("Save changes") == "Save all changes");
    REQUIRE(translator.translate_text("Exact") == "Exact match");
    REQUIRE(translator.translate_text("Untranslated text") == "Untranslated text");
}

TEST_CASE("View tables merge sections over globals with fallback", "[translate][resource]") {
    ResourceTranslations translations("de", "en");
    translations.load_resource_string("en",
                                      "title : \"Site\"\n"
                                      "save : \"Save\"\n"
                                      "[views/home/index]\n"
                                      "welcome : \"Welcome\"\n"
                                      "hint : \"Hint\"\n");
    translations.load_resource_string("de",
                                      "title : \"Seite\"\n"
                                      "[views/home/index]\n"
                                      "welcome : \"Willkommen\"\n"
                                      "title : \"Startseite\"\n");

    auto home = translations.view_translator("home/index");
    REQUIRE(home->translate_key("title") == "Startseite");
    REQUIRE(home->translate_key("welcome") == "Willkommen");
    REQUIRE(home->translate_key("save") == "Save");
    REQUIRE(home->translate_key("hint") == "Hint");
    REQUIRE(home->translate_key("missing") == "[missing]");

    auto other = translations.view_translator("other");
    REQUIRE(other->translate_key("title") == "Seite");
    REQUIRE(other->translate_key("welcome") == "[welcome]");

    REQUIRE(translations.view_translator("/home/index.html") == home);
}

TEST_CASE("Later resources override and language switches rebuild tables", "[translate][resource]") {
    ResourceTranslations translations("en", "en");
    translations.load_resource_string("en", "title : \"Old\"\n");
    auto before = translations.view_translator("page");
    REQUIRE(before->translate_key("title") == "Old");

    translations.load_resource_string("en", "title : \"New\"\n");
    REQUIRE(translations.view_translator("page")->translate_key("title") == "New");

    translations.load_resource_string("fr", "title : \"Titre\"\n");
    translations.set_language("fr");
    REQUIRE(translations.language() == "fr");
    REQUIRE(translations.view_translator("page")->translate_key("title") == "Titre");
}

TEST_CASE("Missing resource files are reported", "[translate][resource][error]") {
    ResourceTranslations translations;
    REQUIRE_THROWS_AS(translations.load_resource("en", "/nonexistent/mvcore/en.res"), std::runtime_error);
    REQUIRE(translations.load_directory("/nonexistent/mvcore").empty());
}
