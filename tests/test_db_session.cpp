#include <catch2/catch_test_macros.hpp>
#include "db/db_session.hpp"
#include "mocks/mock_database.hpp"

#include <stop_token>

using namespace tempo;
using namespace tempo::testing;

namespace {

constexpr std::chrono::milliseconds kAcquire{100};

struct Fixture {
    std::shared_ptr<ScriptedDatabase> db = std::make_shared<ScriptedDatabase>();
    std::unique_ptr<GenericConnectionPool> pool = make_mock_pool(db);

    DbSession open(const CallContext& ctx = {}) {
        return DbSession(*pool, ctx, kAcquire, "accounts", "update");
    }
};

} // anonymous namespace

// ============================================================================
// Statements
// ============================================================================

TEST_CASE("DbSession: run passes parameters and raises failures", "[db][session]") {
    Fixture f;
    f.db->on("broken", error_result("  syntax error at or near \"broken\"\n", "42601"));

    DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
    const auto rs = session.run("SELECT * FROM t WHERE a = $1", {std::string("x"), std::nullopt});
    REQUIRE(rs.success);

    const auto executed = f.db->statements().back();
    REQUIRE(executed.params.size() == 2);
    REQUIRE(executed.params[0] == "x");
    REQUIRE_FALSE(executed.params[1].has_value());

    try {
        session.run("broken");
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.category() == ErrorCategory::DATABASE_ERROR);
        REQUIRE(std::string(e.what()) == "syntax error at or near \"broken\"");
        REQUIRE(e.context().table == "accounts");
        REQUIRE(e.context().operation == "update");
        REQUIRE(e.sql_state() == "42601");
    }

    const auto failed = session.try_run("broken");
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.sql_state == "42601");
}

TEST_CASE("DbSession: server-side cancellation maps to CANCELLED", "[db][session]") {
    Fixture f;
    f.db->on("pg_sleep", error_result("canceling statement due to statement timeout", "57014"));

    DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
    try {
        (void)session.try_run("SELECT pg_sleep(10)");
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.category() == ErrorCategory::CANCELLED);
    }
}

// ============================================================================
// Deadlines / Cancellation
// ============================================================================

TEST_CASE("DbSession: cancelled context never reaches the database", "[db][session]") {
    Fixture f;
    std::stop_source stop;
    stop.request_stop();

    CallContext ctx;
    ctx.stop = stop.get_token();

    REQUIRE_THROWS_AS(f.open(ctx), EngineError);
    REQUIRE(f.db->statements().empty());
    REQUIRE(f.pool->get_stats().total_acquires == 0);
}

TEST_CASE("DbSession: cancellation between statements", "[db][session]") {
    Fixture f;
    std::stop_source stop;
    CallContext ctx;
    ctx.stop = stop.get_token();

    DbSession session(*f.pool, ctx, kAcquire, "accounts", "update");
    session.run("SELECT 1");
    stop.request_stop();

    REQUIRE_THROWS_AS(session.checkpoint(), EngineError);
    REQUIRE_THROWS_AS(session.run("SELECT 2"), EngineError);
    REQUIRE(f.db->count("SELECT 2") == 0);
}

TEST_CASE("DbSession: deadline is pushed as statement timeout and reset", "[db][session]") {
    Fixture f;
    {
        DbSession session(*f.pool, CallContext::with_timeout(std::chrono::seconds(30)),
                          kAcquire, "accounts", "update");
        session.run("SELECT 1");
        session.run("SELECT 2");
    }

    const auto timeouts = f.db->timeouts();
    REQUIRE(timeouts.size() == 3);
    REQUIRE(timeouts[0] > 0);
    REQUIRE(timeouts[0] <= 30000);
    REQUIRE(timeouts[1] <= timeouts[0]);
    REQUIRE(timeouts.back() == 0);
}

TEST_CASE("DbSession: no deadline leaves the timeout alone", "[db][session]") {
    Fixture f;
    {
        DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
        session.run("SELECT 1");
    }
    REQUIRE(f.db->timeouts().empty());
}

TEST_CASE("DbSession: exhausted pool is a database error", "[db][session]") {
    Fixture f;
    DbSession first(*f.pool, {}, kAcquire, "accounts", "update");
    DbSession second(*f.pool, {}, kAcquire, "accounts", "update");

    try {
        DbSession third(*f.pool, {}, std::chrono::milliseconds(10), "accounts", "update");
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.category() == ErrorCategory::DATABASE_ERROR);
        REQUIRE(std::string(e.what()).find("'mock'") != std::string::npos);
        REQUIRE(e.sql_state() == "08001");
    }
}

TEST_CASE("DbSession: connection exception retires the lease", "[db][session]") {
    Fixture f;
    f.db->on("SELECT 1", error_result("server closed the connection unexpectedly", "08006"));

    {
        DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
        const auto rs = session.try_run("SELECT 1");
        REQUIRE_FALSE(rs.success);
    }
    CHECK(f.pool->get_stats().connections_discarded == 1);

    {
        DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
        f.db->on("SELECT 1", error_result("division by zero", "22012"));
        (void)session.try_run("SELECT 1");
    }
    CHECK(f.pool->get_stats().connections_discarded == 1);
}

// ============================================================================
// Transaction
// ============================================================================

TEST_CASE("Transaction: commit and implicit rollback", "[db][transaction]") {
    Fixture f;

    SECTION("committed") {
        DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
        Transaction tx(session);
        REQUIRE(tx.active());
        session.run("UPDATE a");
        tx.commit();
        REQUIRE_FALSE(tx.active());
        REQUIRE(f.db->sql_log() == std::vector<std::string>{"BEGIN", "UPDATE a", "COMMIT"});
    }

    SECTION("abandoned by an exception") {
        f.db->on("UPDATE b", error_result("deadlock detected", "40P01"));
        {
            DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
            try {
                Transaction tx(session);
                session.run("UPDATE b");
                tx.commit();
            } catch (const EngineError&) {
            }
        }
        REQUIRE(f.db->sql_log() == std::vector<std::string>{"BEGIN", "UPDATE b", "ROLLBACK"});
        REQUIRE(f.pool->get_stats().connections_discarded == 0);
    }
}

TEST_CASE("Transaction: rollback runs even after the deadline", "[db][transaction]") {
    Fixture f;
    std::stop_source stop;
    CallContext ctx;
    ctx.stop = stop.get_token();
    {
        DbSession session(*f.pool, ctx, kAcquire, "accounts", "update");
        Transaction tx(session);
        stop.request_stop();
    }
    REQUIRE(f.db->sql_log() == std::vector<std::string>{"BEGIN", "ROLLBACK"});
}

TEST_CASE("Transaction: failed rollback drops the connection", "[db][transaction]") {
    Fixture f;
    f.db->on("ROLLBACK", error_result("server closed the connection unexpectedly"));
    {
        DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
        Transaction tx(session);
    }
    const auto stats = f.pool->get_stats();
    REQUIRE(stats.connections_discarded == 1);
    REQUIRE(stats.total_connections == 0);
}

TEST_CASE("Transaction: failed commit rolls back", "[db][transaction]") {
    Fixture f;
    f.db->on("COMMIT", error_result("could not serialize access", "40001"));
    {
        DbSession session(*f.pool, {}, kAcquire, "accounts", "update");
        Transaction tx(session);
        REQUIRE_THROWS_AS(tx.commit(), EngineError);
    }
    REQUIRE(f.db->count("ROLLBACK") == 1);
}
