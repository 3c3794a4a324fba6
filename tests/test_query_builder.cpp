// tests/test_query_builder.cpp
#include <catch2/catch.hpp>
#include "mvcore/sql/query_builder.h"
#include <functional>
#include <string>
#include <vector>

using namespace mvcore::sql;

namespace {

QueryError::Kind error_kind(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const QueryError& e) {
        return e.kind();
    }
    FAIL("expected QueryError");
    return QueryError::Kind::INVALID_SYNTAX;
}

} // namespace

TEST_CASE("Select with one condition on PostgreSQL", "[sql][builder]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    auto q = qb.from("users").where_eq("id", 5).build();
    REQUIRE(q.sql == "SELECT * FROM \"users\" WHERE \"id\" = $1");
    REQUIRE(q.params.size() == 1);
    REQUIRE(q.params[0] == SqlValue(5));
}

TEST_CASE("Select on MySQL uses backticks and question marks", "[sql][builder]") {
    QueryBuilder qb(DatabaseBackend::MYSQL);
    auto q = qb.from("users").select({"id", "name"}).where_eq("status", "active").where_gt("age", 18).build();
    REQUIRE(q.sql == "SELECT id, name FROM `users` WHERE `status` = ? AND `age` > ?");
    REQUIRE(q.params.size() == 2);
}

TEST_CASE("Clauses appear in SQL order", "[sql][builder]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    qb.from("orders")
        .as_alias("o")
        .select({"o.id", "COUNT(i.id)"})
        .left_join("items AS i", "i.order_id = o.id")
        .where_gte("o.total", 100)
        .or_where_null("o.coupon")
        .group_by("o.id")
        .order_by_desc("o.id")
        .limit(10)
        .offset(20);
    auto q = qb.build();
    REQUIRE(q.sql ==
            "SELECT o.id, COUNT(i.id) FROM \"orders\" AS \"o\" LEFT JOIN \"items\" AS i ON i.order_id = o.id "
            "WHERE o.total >= $1 OR o.coupon IS NULL GROUP BY o.id ORDER BY o.id DESC LIMIT 10 OFFSET 20");
    REQUIRE(q.params.size() == 1);
}

TEST_CASE("Join variants and aliases", "[sql][builder][join]") {
    QueryBuilder pg(DatabaseBackend::POSTGRES);
    pg.from("a").join("b bb", "bb.a_id = a.id").right_join("c", "c.a_id = a.id").full_join("d", "d.a_id = a.id");
    REQUIRE(pg.build().sql ==
            "SELECT * FROM \"a\" INNER JOIN \"b\" bb ON bb.a_id = a.id RIGHT JOIN \"c\" ON c.a_id = a.id "
            "FULL JOIN \"d\" ON d.a_id = a.id");
}

TEST_CASE("MySQL supports RIGHT JOIN but not FULL JOIN", "[sql][builder][join]") {
    QueryBuilder right(DatabaseBackend::MYSQL);
    right.from("users").right_join("posts", "posts.user_id = users.id");
    REQUIRE(right.build().sql == "SELECT * FROM `users` RIGHT JOIN `posts` ON posts.user_id = users.id");

    QueryBuilder full(DatabaseBackend::MYSQL);
    full.from("users").full_join("posts", "posts.user_id = users.id");
    try {
        (void)full.build();
        FAIL("expected QueryError");
    } catch (const QueryError& e) {
        REQUIRE(e.kind() == QueryError::Kind::UNSUPPORTED_FEATURE);
        REQUIRE(e.detail() == "FULL JOIN");
        REQUIRE(e.backend() == "MySQL");
    }

    QueryBuilder maria(DatabaseBackend::MARIADB);
    maria.from("users").full_join("posts", "true");
    REQUIRE(error_kind([&] { (void)maria.build(); }) == QueryError::Kind::UNSUPPORTED_FEATURE);
}

TEST_CASE("Every terminal build requires a table", "[sql][builder][error]") {
    for (auto backend : {DatabaseBackend::POSTGRES, DatabaseBackend::MYSQL, DatabaseBackend::MARIADB,
                         DatabaseBackend::SQLITE}) {
        QueryBuilder qb(backend);
        Row row{{"name", "x"}};
        REQUIRE(error_kind([&] { (void)qb.build(); }) == QueryError::Kind::MISSING_CLAUSE);
        REQUIRE(error_kind([&] { (void)qb.build_insert(row); }) == QueryError::Kind::MISSING_CLAUSE);
        REQUIRE(error_kind([&] { (void)qb.build_update(row); }) == QueryError::Kind::MISSING_CLAUSE);
        REQUIRE(error_kind([&] { (void)qb.build_delete(); }) == QueryError::Kind::MISSING_CLAUSE);
        REQUIRE(error_kind([&] { (void)qb.build_upsert(row, {"name"}); }) == QueryError::Kind::MISSING_CLAUSE);
        REQUIRE(error_kind([&] { (void)qb.to_debug_string(); }) == QueryError::Kind::MISSING_CLAUSE);
    }

    QueryBuilder qb(DatabaseBackend::POSTGRES);
    try {
        (void)qb.build();
    } catch (const QueryError& e) {
        REQUIRE(e.detail() == "from");
        REQUIRE(std::string(e.what()) == "Missing required clause: from. Add .from() to your query.");
    }
}

TEST_CASE("Lists and ranges are embedded as literals by default", "[sql][builder][where]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    qb.from("t")
        .where_in("id", {1, 2, 3})
        .where_not_in("name", {"a", "O'Neil"})
        .where_between("age", 18, 65)
        .where_eq("active", true);
    auto q = qb.build();
    REQUIRE(q.sql ==
            "SELECT * FROM \"t\" WHERE \"id\" IN (1, 2, 3) AND \"name\" NOT IN ('a', 'O''Neil') "
            "AND \"age\" BETWEEN 18 AND 65 AND \"active\" = $1");
    REQUIRE(q.params.size() == 1);
}

TEST_CASE("List binding numbers every element", "[sql][builder][where]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    qb.from("t").bind_list_parameters(true).where_eq("a", 1).where_in("id", {2, 3}).where_between("n", 4, 5);
    auto q = qb.build();
    REQUIRE(q.sql == "SELECT * FROM \"t\" WHERE \"a\" = $1 AND \"id\" IN ($2, $3) AND \"n\" BETWEEN $4 AND $5");
    REQUIRE(q.params.size() == 5);
    REQUIRE(q.params[4] == SqlValue(5));
}

TEST_CASE("MySQL list values with backslashes are safe only when bound", "[sql][builder][where][mysql]") {
    const std::string hostile = "x\\' OR 1=1 -- ";

    QueryBuilder embedded(DatabaseBackend::MYSQL);
    embedded.from("t").where_in("n", {hostile});
    // quotes are doubled, the backslash is left for the server to interpret
    REQUIRE(embedded.build().sql == "SELECT * FROM `t` WHERE `n` IN ('x\\'' OR 1=1 -- ')");
    REQUIRE(embedded.build().params.empty());

    QueryBuilder bound(DatabaseBackend::MARIADB);
    bound.from("t").bind_list_parameters(true).where_in("n", {hostile}).where_between("m", hostile, "z");
    auto q = bound.build();
    REQUIRE(q.sql == "SELECT * FROM `t` WHERE `n` IN (?) AND `m` BETWEEN ? AND ?");
    REQUIRE(q.sql.find('\\') == std::string::npos);
    REQUIRE(q.params.size() == 3);
    REQUIRE(q.params[0] == SqlValue(hostile));
}

TEST_CASE("Empty IN lists render constant conditions", "[sql][builder][where]") {
    QueryBuilder qb(DatabaseBackend::SQLITE);
    qb.from("t").where_in("id", {}).or_where_not_in("id", {});
    REQUIRE(qb.build().sql == "SELECT * FROM \"t\" WHERE 1 = 0 OR 1 = 1");
}

TEST_CASE("Bound parameters match the value taking conditions", "[sql][builder][where]") {
    QueryBuilder qb(DatabaseBackend::MYSQL);
    qb.from("t")
        .where_eq("a", 1)
        .where_ne("b", 2)
        .where_lt("c", 3)
        .where_lte("d", 4)
        .where_like("e", "%x%")
        .where_not_like("f", "y%")
        .where_null("g")
        .where_not_null("h")
        .where_in("i", {1, 2})
        .where_raw("j > k")
        .or_where_gt("l", 5)
        .or_where_gte("m", 6)
        .or_where_lt("n", 7)
        .or_where_lte("o", 8)
        .or_where_ne("p", 9)
        .or_where_like("q", "z")
        .or_where_eq("r", 10)
        .or_where_not_null("s")
        .or_where_in("t", {3})
        .or_where_between("u", 1, 2);
    auto q = qb.build();
    REQUIRE(q.params.size() == 13);
    REQUIRE(q.sql.find("j > k") != std::string::npos);
    REQUIRE(q.sql.find("`e` LIKE ?") != std::string::npos);
    REQUIRE(q.sql.find("`f` NOT LIKE ?") != std::string::npos);
}

TEST_CASE("Typed enums are cast on PostgreSQL only", "[sql][builder][enum]") {
    QueryBuilder pg(DatabaseBackend::POSTGRES);
    pg.from("users").where_eq("status", "active::user_status");
    REQUIRE(pg.build().sql == "SELECT * FROM \"users\" WHERE \"status\" = $1::user_status");

    QueryBuilder my(DatabaseBackend::MYSQL);
    my.from("users").where_eq("status", "active::user_status");
    REQUIRE(my.build().sql == "SELECT * FROM `users` WHERE `status` = ?");
}

TEST_CASE("Insert binds values and inlines NULL and DEFAULT", "[sql][builder][insert]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    qb.from("users").returning_column("id");
    Row row{{"name", "Ann"}, {"bio", nullptr}, {"created", SqlValue::default_value()}, {"age", 30}};
    auto q = qb.build_insert(row);
    REQUIRE(q.sql == "INSERT INTO \"users\" (\"age\", \"bio\", \"created\", \"name\") VALUES ($1, NULL, DEFAULT, $2) "
                     "RETURNING \"id\"");
    REQUIRE(q.params.size() == 2);
    REQUIRE(q.params[0] == SqlValue(30));
    REQUIRE(q.params[1] == SqlValue("Ann"));
}

TEST_CASE("Returning is rejected on MySQL", "[sql][builder][insert]") {
    QueryBuilder qb(DatabaseBackend::MYSQL);
    qb.from("users").returning({"id"});
    REQUIRE(error_kind([&] { (void)qb.build_insert({{"name", "x"}}); }) == QueryError::Kind::UNSUPPORTED_FEATURE);

    QueryBuilder lite(DatabaseBackend::SQLITE);
    lite.from("users").returning({});
    REQUIRE(lite.build_delete().sql == "DELETE FROM \"users\"");
    lite.returning_column("id");
    REQUIRE(lite.build_delete().sql == "DELETE FROM \"users\" RETURNING \"id\"");
}

TEST_CASE("Update numbers SET parameters before WHERE", "[sql][builder][update]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    qb.from("users").where_eq("id", 7).where_ne("role", "admin");
    auto q = qb.build_update({{"name", "Bob"}, {"email", "b@x"}});
    REQUIRE(q.sql == "UPDATE \"users\" SET \"email\" = $1, \"name\" = $2 WHERE \"id\" = $3 AND \"role\" != $4");
    REQUIRE(q.params.size() == 4);
    REQUIRE(q.params[2] == SqlValue(7));
}

TEST_CASE("Delete with conditions", "[sql][builder][delete]") {
    QueryBuilder qb(DatabaseBackend::SQLITE);
    qb.from("sessions").where_lt("expires", 1000);
    auto q = qb.build_delete();
    REQUIRE(q.sql == "DELETE FROM \"sessions\" WHERE \"expires\" < ?");
    REQUIRE(q.params.size() == 1);
}

TEST_CASE("Empty rows are invalid", "[sql][builder][error]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    qb.from("t");
    REQUIRE(error_kind([&] { (void)qb.build_insert({}); }) == QueryError::Kind::INVALID_SYNTAX);
    REQUIRE(error_kind([&] { (void)qb.build_update({}); }) == QueryError::Kind::INVALID_SYNTAX);
    REQUIRE(error_kind([&] { (void)qb.build_upsert({}, {"id"}); }) == QueryError::Kind::INVALID_SYNTAX);
    REQUIRE(error_kind([&] { (void)qb.build_upsert({{"id", 1}}, {}); }) == QueryError::Kind::INVALID_SYNTAX);
    REQUIRE(error_kind([&] { (void)qb.build_upsert({{"id", SqlValue::default_value()}}, {"id"}); }) ==
            QueryError::Kind::INVALID_SYNTAX);
}

TEST_CASE("Upsert per backend", "[sql][builder][upsert]") {
    Row row{{"id", 1}, {"name", "Ann"}};

    QueryBuilder pg(DatabaseBackend::POSTGRES);
    pg.from("users");
    auto q = pg.build_upsert(row, {"id"});
    REQUIRE(q.sql == "INSERT INTO \"users\" (\"id\", \"name\") VALUES ($1, $2) ON CONFLICT (\"id\") DO UPDATE SET "
                     "\"name\" = $2");
    REQUIRE(q.params.size() == 2);

    QueryBuilder my(DatabaseBackend::MYSQL);
    my.from("users");
    REQUIRE(my.build_upsert(row, {"id"}).sql ==
            "INSERT INTO `users` (`id`, `name`) VALUES (?, ?) ON DUPLICATE KEY UPDATE `name` = VALUES(`name`)");
}

TEST_CASE("Pagination and offsets", "[sql][builder][limit]") {
    QueryBuilder pg(DatabaseBackend::POSTGRES);
    pg.from("t").paginate(3, 25);
    REQUIRE(pg.build().sql == "SELECT * FROM \"t\" LIMIT 25 OFFSET 50");

    QueryBuilder first(DatabaseBackend::POSTGRES);
    first.from("t").paginate(0, 10);
    REQUIRE(first.build().sql == "SELECT * FROM \"t\" LIMIT 10 OFFSET 0");

    QueryBuilder my(DatabaseBackend::MYSQL);
    my.from("t").offset(5);
    REQUIRE(my.build().sql == "SELECT * FROM `t` LIMIT 18446744073709551615 OFFSET 5");

    QueryBuilder lite(DatabaseBackend::SQLITE);
    lite.from("t").offset(5);
    REQUIRE(lite.build().sql == "SELECT * FROM \"t\" LIMIT -1 OFFSET 5");
}

TEST_CASE("Count helpers and ordering", "[sql][builder]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    qb.from("users").count();
    REQUIRE(qb.build().sql == "SELECT COUNT(*) FROM \"users\"");
    qb.count_column("id").order_by("name").order_by_asc("id");
    REQUIRE(qb.build().sql == "SELECT COUNT(id) FROM \"users\" ORDER BY \"name\" ASC, \"id\" ASC");
}

TEST_CASE("Building is repeatable and copies are independent", "[sql][builder]") {
    QueryBuilder base(DatabaseBackend::POSTGRES);
    base.from("users").where_eq("active", true);

    QueryBuilder copy = base;
    copy.where_eq("id", 1);

    REQUIRE(base.build().sql == base.build().sql);
    REQUIRE(base.build().params.size() == 1);
    REQUIRE(copy.build().params.size() == 2);
    REQUIRE(copy.dialect().backend() == DatabaseBackend::POSTGRES);
}

TEST_CASE("Debug string lists parameters", "[sql][builder]") {
    QueryBuilder qb(DatabaseBackend::POSTGRES);
    qb.from("users").where_eq("name", "O'Hara").where_eq("id", 3);
    REQUIRE(qb.to_debug_string() == "SELECT * FROM \"users\" WHERE \"name\" = $1 AND \"id\" = $2 -- ['O''Hara', 3]");
}
