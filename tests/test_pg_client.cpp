#include <catch2/catch_test_macros.hpp>
#include "db/connection.hpp"
#include "db/postgresql/pg_client.hpp"
#include "fixtures/records.hpp"

#include <cstdlib>
#include <format>
#include <string>
#include <vector>

using namespace pgmapper;
using namespace pgmapper::testing;

// Live-server tests; set PGMAPPER_TEST_DSN to a scratch database to run them.

namespace {

std::string test_dsn() {
    const char* dsn = std::getenv("PGMAPPER_TEST_DSN");
    return dsn ? dsn : "";
}

} // anonymous namespace

TEST_CASE("PgClientFactory: unreachable server is a connection error", "[connection][pg]") {
    PgClientFactory factory;
    const auto client = factory.connect("host=127.0.0.1 port=1 connect_timeout=1");
    REQUIRE(client.is_error());
    CHECK(client.error_category() == ErrorCategory::CONNECTION_ERROR);
    CHECK_FALSE(client.error_message().empty());
}

TEST_CASE("PgClient: CRUD round trip", "[connection][pg]") {
    const std::string dsn = test_dsn();
    if (dsn.empty()) {
        WARN("PGMAPPER_TEST_DSN not set, skipping");
        return;
    }

    auto opened = Connection::connect(DatabaseConfig{dsn, 4});
    REQUIRE(opened.is_ok());
    const Connection conn = opened.value();

    REQUIRE(conn.batch_execute(
        R"(DROP TABLE IF EXISTS "notes"; )"
        R"(CREATE TABLE "notes" ("note_id" BIGSERIAL PRIMARY KEY, "desc" VARCHAR NOT NULL, "author" VARCHAR))"
    ).is_ok());

    const auto created = conn.create_multiple(std::vector<Note>{
        {0, "first", std::nullopt}, {0, "second", "ann"}, {0, "third", "bo"}});
    REQUIRE(created.is_ok());
    REQUIRE(created.value().size() == 3);
    CHECK(created.value()[1].desc == "second");

    auto notes = created.value();
    notes[0].desc = "first, edited";
    notes[2].author = std::nullopt;
    const auto updated = conn.update_multiple(notes);
    REQUIRE(updated.is_ok());
    CHECK(updated.value().size() == 3);

    const auto fetched = conn.query<Note>(
        R"(SELECT * FROM "notes" WHERE "note_id" = $1)", make_params(notes[0].note_id));
    REQUIRE(fetched.is_ok());
    CHECK(fetched.value().desc == "first, edited");

    notes[1].desc = "second, edited";
    const auto single = conn.update(notes[1]);
    REQUIRE(single.is_ok());
    CHECK(single.value() == notes[1]);

    const auto removed = conn.remove_multiple(std::vector<Note>{notes[0], notes[2]});
    REQUIRE(removed.is_ok());
    CHECK(removed.value().size() == 2);

    const auto last = conn.remove(notes[1]);
    REQUIRE(last.is_ok());
    CHECK(conn.remove(notes[1]).error_category() == ErrorCategory::NOT_FOUND);

    const auto bad = conn.execute(R"(SELECT * FROM "no_such_table")");
    REQUIRE(bad.is_error());
    CHECK(bad.error_category() == ErrorCategory::STATEMENT_ERROR);

    // Statement cache keeps working after a reset
    for (int i = 0; i < 6; ++i) {
        CHECK(conn.execute(std::format("SELECT {}", i)).is_ok());
    }

    REQUIRE(conn.batch_execute(R"(DROP TABLE "notes")").is_ok());
    conn.close();
    CHECK(conn.execute("SELECT 1").error_category() == ErrorCategory::CONNECTION_ERROR);
}

TEST_CASE("PgClient: scripts that deallocate invalidate the statement cache", "[connection][pg]") {
    const std::string dsn = test_dsn();
    if (dsn.empty()) {
        WARN("PGMAPPER_TEST_DSN not set, skipping");
        return;
    }

    PgClientFactory factory(8);
    auto opened = factory.connect(dsn);
    REQUIRE(opened.is_ok());
    auto* client = dynamic_cast<PgClient*>(opened.value().get());
    REQUIRE(client != nullptr);

    auto first = client->prepare("SELECT 1");
    REQUIRE(first.is_ok());
    REQUIRE(client->query(first.value(), {}).is_ok());
    CHECK(client->cached_statements() == 1);

    REQUIRE(client->batch_execute("DEALLOCATE ALL").is_ok());
    CHECK(client->cached_statements() == 0);

    auto again = client->prepare("SELECT 1");
    REQUIRE(again.is_ok());
    CHECK(again.value().name != first.value().name);
    const auto rows = client->query(again.value(), {});
    REQUIRE(rows.is_ok());
    CHECK(rows.value().rows.size() == 1);

    // A failing script still runs its earlier statements
    REQUIRE(client->prepare("SELECT 2").is_ok());
    CHECK(client->batch_execute("DEALLOCATE ALL; SELECT * FROM no_such_table").is_error());
    CHECK(client->cached_statements() == 0);
    auto after_failure = client->prepare("SELECT 2");
    REQUIRE(after_failure.is_ok());
    CHECK(client->query(after_failure.value(), {}).is_ok());
}

TEST_CASE("PgClient: failed cached statement is prepared again", "[connection][pg]") {
    const std::string dsn = test_dsn();
    if (dsn.empty()) {
        WARN("PGMAPPER_TEST_DSN not set, skipping");
        return;
    }

    PgClientFactory factory(8);
    auto opened = factory.connect(dsn);
    auto other = factory.connect(dsn);
    REQUIRE(opened.is_ok());
    REQUIRE(other.is_ok());
    auto& client = *opened.value();
    auto& admin = *other.value();

    REQUIRE(admin.batch_execute(
        "DROP TABLE IF EXISTS pgmapper_cache_t; CREATE TABLE pgmapper_cache_t (a INT)").is_ok());

    const std::string sql = "SELECT * FROM pgmapper_cache_t";
    auto stmt = client.prepare(sql);
    REQUIRE(stmt.is_ok());
    REQUIRE(client.query(stmt.value(), {}).is_ok());

    // Changing the row type from another session invalidates the cached plan
    REQUIRE(admin.batch_execute("ALTER TABLE pgmapper_cache_t ADD COLUMN b INT").is_ok());

    auto cached = client.prepare(sql);
    REQUIRE(cached.is_ok());
    CHECK(cached.value().name == stmt.value().name);
    const auto stale = client.query(cached.value(), {});
    REQUIRE(stale.is_error());
    CHECK(stale.error_category() == ErrorCategory::STATEMENT_ERROR);

    auto fresh = client.prepare(sql);
    REQUIRE(fresh.is_ok());
    CHECK(fresh.value().name != stmt.value().name);
    const auto rows = client.query(fresh.value(), {});
    REQUIRE(rows.is_ok());
    CHECK(rows.value().column_names == std::vector<std::string>{"a", "b"});

    REQUIRE(admin.batch_execute("DROP TABLE pgmapper_cache_t").is_ok());
}
