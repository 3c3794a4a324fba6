// tests/test_dialects.cpp
#include <catch2/catch.hpp>
#include "mvcore/sql/dialect.h"
#include "common/types.h"
#include <string>

using namespace mvcore::sql;

TEST_CASE("Backend names parse case-insensitively", "[sql][dialect]") {
    REQUIRE(parse_backend("postgres") == DatabaseBackend::POSTGRES);
    REQUIRE(parse_backend("PostgreSQL") == DatabaseBackend::POSTGRES);
    REQUIRE(parse_backend("MySQL") == DatabaseBackend::MYSQL);
    REQUIRE(parse_backend("mariadb") == DatabaseBackend::MARIADB);
    REQUIRE(parse_backend("sqlite3") == DatabaseBackend::SQLITE);
    REQUIRE_THROWS_AS(parse_backend("oracle"), mvcore::ConfigError);
    REQUIRE(std::string(backend_name(DatabaseBackend::MARIADB)) == "MariaDB");
}

TEST_CASE("Identifier quoting per backend", "[sql][dialect]") {
    auto pg = create_dialect(DatabaseBackend::POSTGRES);
    auto my = create_dialect(DatabaseBackend::MYSQL);
    auto lite = create_dialect(DatabaseBackend::SQLITE);

    REQUIRE(pg->quote_identifier("users") == "\"users\"");
    REQUIRE(pg->quote_identifier("we\"ird") == "\"we\"\"ird\"");
    REQUIRE(my->quote_identifier("users") == "`users`");
    REQUIRE(my->quote_identifier("a`b") == "`a``b`");
    REQUIRE(lite->quote_identifier("users") == "\"users\"");

    REQUIRE(pg->quote_identifier("u.id") == "u.id");
    REQUIRE(my->quote_identifier("*") == "*");
}

TEST_CASE("Placeholders per backend", "[sql][dialect]") {
    REQUIRE(create_dialect(DatabaseBackend::POSTGRES)->placeholder(3) == "$3");
    REQUIRE(create_dialect(DatabaseBackend::MYSQL)->placeholder(3) == "?");
    REQUIRE(create_dialect(DatabaseBackend::MARIADB)->placeholder(1) == "?");
    REQUIRE(create_dialect(DatabaseBackend::SQLITE)->placeholder(9) == "?");
}

TEST_CASE("Limit and offset syntax", "[sql][dialect]") {
    auto pg = create_dialect(DatabaseBackend::POSTGRES);
    auto my = create_dialect(DatabaseBackend::MYSQL);
    auto lite = create_dialect(DatabaseBackend::SQLITE);

    REQUIRE(pg->limit_syntax(std::nullopt, std::nullopt).empty());
    REQUIRE(pg->limit_syntax(10, std::nullopt) == " LIMIT 10");
    REQUIRE(pg->limit_syntax(10, 20) == " LIMIT 10 OFFSET 20");
    REQUIRE(pg->limit_syntax(std::nullopt, 5) == " OFFSET 5");
    REQUIRE(my->limit_syntax(std::nullopt, 5) == " LIMIT 18446744073709551615 OFFSET 5");
    REQUIRE(lite->limit_syntax(std::nullopt, 5) == " LIMIT -1 OFFSET 5");
}

TEST_CASE("Feature support per backend", "[sql][dialect]") {
    auto pg = create_dialect(DatabaseBackend::POSTGRES);
    auto maria = create_dialect(DatabaseBackend::MARIADB);
    auto lite = create_dialect(DatabaseBackend::SQLITE);

    REQUIRE(pg->supports_returning());
    REQUIRE(pg->supports_full_join());
    REQUIRE_FALSE(maria->supports_returning());
    REQUIRE_FALSE(maria->supports_full_join());
    REQUIRE(maria->backend() == DatabaseBackend::MARIADB);
    REQUIRE(lite->supports_returning());

    REQUIRE(pg->returning_syntax({}) == std::optional<std::string>(" RETURNING *"));
    REQUIRE(pg->returning_syntax({"id"}) == std::optional<std::string>(" RETURNING \"id\""));
    REQUIRE_FALSE(maria->returning_syntax({"id"}).has_value());
}

TEST_CASE("DDL fragments per backend", "[sql][dialect]") {
    auto pg = create_dialect(DatabaseBackend::POSTGRES);
    auto my = create_dialect(DatabaseBackend::MYSQL);
    auto lite = create_dialect(DatabaseBackend::SQLITE);

    REQUIRE(pg->current_timestamp() == "CURRENT_TIMESTAMP");
    REQUIRE(my->current_timestamp() == "CURRENT_TIMESTAMP()");
    REQUIRE(pg->auto_increment_syntax() == "SERIAL PRIMARY KEY");
    REQUIRE(my->auto_increment_syntax() == "AUTO_INCREMENT PRIMARY KEY");
    REQUIRE(lite->auto_increment_syntax() == "INTEGER PRIMARY KEY AUTOINCREMENT");
    REQUIRE(pg->boolean_type() == "BOOLEAN");
    REQUIRE(my->boolean_type() == "TINYINT(1)");
    REQUIRE(lite->boolean_type() == "INTEGER");
}

TEST_CASE("Upsert clauses per backend", "[sql][dialect][upsert]") {
    std::vector<std::string> columns{"email", "id", "name"};
    std::vector<std::string> conflict{"id"};

    REQUIRE(create_dialect(DatabaseBackend::POSTGRES)->upsert_syntax(columns, conflict, 1) ==
            " ON CONFLICT (\"id\") DO UPDATE SET \"email\" = $1, \"name\" = $3");
    REQUIRE(create_dialect(DatabaseBackend::MYSQL)->upsert_syntax(columns, conflict, 1) ==
            " ON DUPLICATE KEY UPDATE `email` = VALUES(`email`), `name` = VALUES(`name`)");
    REQUIRE(create_dialect(DatabaseBackend::SQLITE)->upsert_syntax(columns, conflict, 1) ==
            " ON CONFLICT(\"id\") DO UPDATE SET \"email\" = excluded.\"email\", \"name\" = excluded.\"name\"");

    std::vector<std::string> only_key{"id"};
    REQUIRE(create_dialect(DatabaseBackend::POSTGRES)->upsert_syntax(only_key, conflict, 1) ==
            " ON CONFLICT (\"id\") DO NOTHING");
    REQUIRE(create_dialect(DatabaseBackend::MYSQL)->upsert_syntax(only_key, conflict, 1) ==
            " ON DUPLICATE KEY UPDATE `id` = `id`");
}
