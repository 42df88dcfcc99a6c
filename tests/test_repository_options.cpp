#include <catch2/catch_test_macros.hpp>
#include "temporal/temporal_repository.hpp"
#include "mocks/mock_database.hpp"

#include <format>
#include <stop_token>

using namespace tempo;
using namespace tempo::testing;

namespace {

constexpr const char* kTenant = "11111111-1111-1111-1111-111111111111";
constexpr const char* kFirstId = "33333333-3333-3333-3333-333333333333";
constexpr const char* kSecondId = "55555555-5555-5555-5555-555555555555";
constexpr const char* kUnknownId = "66666666-6666-6666-6666-666666666666";
constexpr const char* kActor = "44444444-4444-4444-4444-444444444444";

constexpr const char* kSelect = "SELECT * FROM \"public\".\"notes\"";
constexpr const char* kUpdate = "UPDATE \"public\".\"notes\"";

TableDefinition notes_table() {
    TableDefinition t;
    t.name = "notes";
    t.strategy = VersioningStrategy::NONE;
    t.multi_tenant = true;

    ColumnDefinition title("title", LogicalType::STRING, false);
    title.max_length = 120;
    t.columns.push_back(title);
    t.columns.push_back(ColumnDefinition("tags", LogicalType::STRING_ARRAY, true));
    return t;
}

TextRow stored_note(const std::string& id, const std::string& title) {
    return {
        {"id", id},
        {"tenant_id", kTenant},
        {"title", title},
        {"tags", "{\"a\"}"},
        {"created_at", "2024-03-01T10:00:00.000Z"},
        {"updated_at", "2024-03-01T10:00:00.000Z"},
        {"created_by", std::nullopt},
        {"updated_by", std::nullopt},
        {"deleted_at", std::nullopt},
        {"deleted_by", std::nullopt},
    };
}

struct Fixture {
    std::shared_ptr<ScriptedDatabase> db = std::make_shared<ScriptedDatabase>();
    std::unique_ptr<GenericConnectionPool> pool = make_mock_pool(db);
    std::unique_ptr<TemporalRepository> repo;

    explicit Fixture(RepositoryOptions options = {}) {
        options.tenant_id = kTenant;
        repo = make_repository(notes_table(), *pool, options);
        db->on("INSERT INTO", [](const ExecutedStatement& s) { return echo_insert(s); });
    }
};

RepositoryOptions cached_options() {
    RepositoryOptions options;
    options.cache_enabled = true;
    options.cache_ttl = std::chrono::seconds(300);
    return options;
}

RepositoryOptions retrying_options(uint32_t max_retries) {
    RepositoryOptions options;
    options.retry.max_retries = max_retries;
    options.retry.initial_backoff = std::chrono::milliseconds(1);
    options.retry.max_backoff = std::chrono::milliseconds(4);
    return options;
}

std::string title_of(const Record& record) {
    return std::get<std::string>(record.at("title"));
}

} // anonymous namespace

// ============================================================================
// Read cache
// ============================================================================

TEST_CASE("Repository cache: second get is served without a query", "[repository][cache]") {
    Fixture f(cached_options());
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));

    REQUIRE(f.repo->get(kFirstId).is_ok());
    const auto again = f.repo->get(kFirstId);
    REQUIRE(again.is_ok());
    REQUIRE(again.value().has_value());
    CHECK(title_of(*again.value()) == "Groceries");
    CHECK(f.db->count(kSelect) == 1);
}

TEST_CASE("Repository cache: callers get copies", "[repository][cache]") {
    Fixture f(cached_options());
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));

    auto first = f.repo->get(kFirstId);
    REQUIRE(first.is_ok());
    first.value()->at("title") = std::string("Modified");
    std::get<StringArray>(first.value()->at("tags")).push_back("x");

    const auto second = f.repo->get(kFirstId);
    REQUIRE(second.is_ok());
    CHECK(title_of(*second.value()) == "Groceries");
    CHECK(std::get<StringArray>(second.value()->at("tags")) == StringArray{"a"});
    CHECK(f.db->count(kSelect) == 1);
}

TEST_CASE("Repository cache: update drops the cached record", "[repository][cache]") {
    Fixture f(cached_options());
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));
    f.db->on(kUpdate, [](const ExecutedStatement& s) {
        return echo_update(stored_note(kFirstId, "Groceries"), s);
    });

    REQUIRE(f.repo->get(kFirstId).is_ok());
    REQUIRE(f.repo->update(kFirstId, {{"title", std::string("Updated")}}, kActor).is_ok());

    f.db->on(kSelect, row_result(stored_note(kFirstId, "Updated")));
    const auto after = f.repo->get(kFirstId);
    REQUIRE(after.is_ok());
    CHECK(title_of(*after.value()) == "Updated");
    CHECK(f.db->count(kSelect) == 2);
}

TEST_CASE("Repository cache: soft delete drops both visibility variants", "[repository][cache]") {
    Fixture f(cached_options());
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));
    f.db->on(kUpdate, [](const ExecutedStatement& s) {
        return echo_update(stored_note(kFirstId, "Groceries"), s);
    });

    GetOptions with_deleted;
    with_deleted.include_deleted = true;
    REQUIRE(f.repo->get(kFirstId).is_ok());
    REQUIRE(f.repo->get(kFirstId, with_deleted).is_ok());
    REQUIRE(f.db->count(kSelect) == 2);

    REQUIRE(f.repo->remove(kFirstId, kActor).is_ok());

    f.db->on(kSelect, row_result(std::vector<TextRow>{}));
    const auto live = f.repo->get(kFirstId);
    REQUIRE(live.is_ok());
    CHECK_FALSE(live.value().has_value());
    REQUIRE(f.repo->get(kFirstId, with_deleted).is_ok());
    CHECK(f.db->count(kSelect) == 4);
}

TEST_CASE("Repository cache: invalidate_cache forces a refetch", "[repository][cache]") {
    Fixture f(cached_options());
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));

    REQUIRE(f.repo->get(kFirstId).is_ok());
    f.repo->invalidate_cache();
    REQUIRE(f.repo->get(kFirstId).is_ok());
    CHECK(f.db->count(kSelect) == 2);
}

TEST_CASE("Repository cache: entries expire after cache_ttl", "[repository][cache]") {
    auto options = cached_options();
    options.cache_ttl = std::chrono::seconds(0);
    Fixture f(options);
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));

    REQUIRE(f.repo->get(kFirstId).is_ok());
    REQUIRE(f.repo->get(kFirstId).is_ok());
    CHECK(f.db->count(kSelect) == 2);
}

TEST_CASE("Repository cache: misses are not remembered", "[repository][cache]") {
    Fixture f(cached_options());
    f.db->on(kSelect, row_result(std::vector<TextRow>{}));

    REQUIRE_FALSE(f.repo->get(kFirstId).value().has_value());
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));
    REQUIRE(f.repo->get(kFirstId).value().has_value());
    CHECK(f.db->count(kSelect) == 2);
}

TEST_CASE("Repository cache: disabled by default", "[repository][cache]") {
    Fixture f;
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));

    REQUIRE(f.repo->get(kFirstId).is_ok());
    REQUIRE(f.repo->get(kFirstId).is_ok());
    CHECK(f.db->count(kSelect) == 2);
}

// ============================================================================
// Batch operations
// ============================================================================

TEST_CASE("Repository batch: create_many returns records in input order", "[repository][batch]") {
    Fixture f;

    std::vector<Record> records;
    for (int i = 1; i <= 4; ++i) {
        records.push_back({{"title", std::format("Batch {}", i)}});
    }

    const auto created = f.repo->create_many(records, kActor);
    REQUIRE(created.is_ok());
    REQUIRE(created.value().size() == 4);
    CHECK(title_of(created.value()[0]) == "Batch 1");
    CHECK(title_of(created.value()[3]) == "Batch 4");
    CHECK(f.db->count("INSERT INTO") == 4);
}

TEST_CASE("Repository batch: create_many stops at the first failure", "[repository][batch]") {
    Fixture f;

    const std::vector<Record> records = {
        {{"title", std::string("ok")}},
        {{"no_such_column", std::string("x")}},
        {{"title", std::string("never written")}},
    };

    const auto created = f.repo->create_many(records, kActor);
    REQUIRE(created.is_error());
    CHECK(created.error_category() == ErrorCategory::VALIDATION_BYPASS);
    CHECK(created.error_message().find("record 2 of 3") != std::string::npos);
    CHECK(created.error_message().find("(1 created)") != std::string::npos);
    CHECK(f.db->count("INSERT INTO") == 1);
}

TEST_CASE("Repository batch: get_many reads every id in one statement", "[repository][batch]") {
    Fixture f;
    f.db->on(kSelect, row_result(std::vector<TextRow>{
        stored_note(kFirstId, "First"),
        stored_note(kSecondId, "Second"),
    }));

    const auto found = f.repo->get_many({kFirstId, kSecondId, kUnknownId});
    REQUIRE(found.is_ok());
    REQUIRE(found.value().size() == 3);
    CHECK(title_of(*found.value().at(kFirstId)) == "First");
    CHECK(title_of(*found.value().at(kSecondId)) == "Second");
    CHECK_FALSE(found.value().at(kUnknownId).has_value());

    const auto selects = f.db->matching(kSelect);
    REQUIRE(selects.size() == 1);
    CHECK(selects[0].sql.find("\"id\" = ANY($2)") != std::string::npos);
    CHECK(selects[0].params[1] == std::format("{{\"{}\",\"{}\",\"{}\"}}", kFirstId, kSecondId, kUnknownId));
}

TEST_CASE("Repository batch: get_many keeps the caller's id spelling", "[repository][batch]") {
    Fixture f;
    const std::string upper = "3333333A-3333-3333-3333-333333333333";
    f.db->on(kSelect, row_result(stored_note("3333333a-3333-3333-3333-333333333333", "First")));

    const auto found = f.repo->get_many({upper});
    REQUIRE(found.is_ok());
    REQUIRE(found.value().size() == 1);
    CHECK(found.value().at(upper).has_value());
}

TEST_CASE("Repository batch: get_many only queries cache misses", "[repository][batch][cache]") {
    Fixture f(cached_options());
    f.db->on(kSelect, row_result(stored_note(kFirstId, "First")));
    REQUIRE(f.repo->get(kFirstId).is_ok());

    f.db->on(kSelect, row_result(stored_note(kSecondId, "Second")));
    const auto found = f.repo->get_many({kFirstId, kSecondId});
    REQUIRE(found.is_ok());
    CHECK(title_of(*found.value().at(kFirstId)) == "First");
    CHECK(title_of(*found.value().at(kSecondId)) == "Second");

    const auto selects = f.db->matching(kSelect);
    REQUIRE(selects.size() == 2);
    CHECK(selects[1].params[1] == std::format("{{\"{}\"}}", kSecondId));

    // Both are cached now
    REQUIRE(f.repo->get_many({kFirstId, kSecondId}).is_ok());
    CHECK(f.db->count(kSelect) == 2);
}

TEST_CASE("Repository batch: empty and as_of requests", "[repository][batch]") {
    Fixture f;

    const auto none = f.repo->get_many({});
    REQUIRE(none.is_ok());
    CHECK(none.value().empty());
    CHECK(f.db->count("SELECT") == 0);

    GetOptions as_of;
    as_of.as_of = std::chrono::system_clock::now();
    const auto historic = f.repo->get_many({kFirstId}, as_of);
    REQUIRE(historic.is_error());
    CHECK(historic.error_category() == ErrorCategory::UNSUPPORTED_OPERATION);
}

// ============================================================================
// Retry
// ============================================================================

TEST_CASE("Repository retry: transient failures are retried until success", "[repository][retry]") {
    Fixture f(retrying_options(3));
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));
    f.db->on(kSelect, error_result("could not serialize access", "40001"), 2);

    const auto result = f.repo->get(kFirstId);
    REQUIRE(result.is_ok());
    CHECK(result.value().has_value());
    CHECK(f.db->count(kSelect) == 3);
}

TEST_CASE("Repository retry: lost connections are discarded before the next attempt", "[repository][retry]") {
    Fixture f(retrying_options(1));
    f.db->on(kSelect, row_result(stored_note(kFirstId, "Groceries")));
    f.db->on(kSelect, error_result("server closed the connection unexpectedly", "08006"), 1);

    REQUIRE(f.repo->get(kFirstId).is_ok());
    CHECK(f.db->count(kSelect) == 2);
    CHECK(f.pool->get_stats().connections_discarded == 1);
}

TEST_CASE("Repository retry: gives up after max_retries", "[repository][retry]") {
    Fixture f(retrying_options(2));
    f.db->on(kSelect, error_result("deadlock detected", "40P01"));

    const auto result = f.repo->get(kFirstId);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::DATABASE_ERROR);
    CHECK(result.error_message() == "deadlock detected");
    CHECK(f.db->count(kSelect) == 3);
}

TEST_CASE("Repository retry: permanent errors are returned on the first attempt", "[repository][retry]") {
    Fixture f(retrying_options(3));

    SECTION("syntax error") {
        f.db->on(kSelect, error_result("syntax error at or near", "42601"));
    }
    SECTION("internal error") {
        f.db->on(kSelect, error_result("something broke"));
    }

    REQUIRE(f.repo->get(kFirstId).is_error());
    CHECK(f.db->count(kSelect) == 1);
}

TEST_CASE("Repository retry: a stopped call is not retried", "[repository][retry]") {
    auto options = retrying_options(3);
    options.retry.initial_backoff = std::chrono::milliseconds(10000);
    options.retry.max_backoff = std::chrono::milliseconds(10000);
    Fixture f(options);

    std::stop_source stop;
    CallContext ctx;
    ctx.stop = stop.get_token();
    f.db->on(kSelect, [&](const ExecutedStatement&) {
        stop.request_stop();
        return error_result("could not serialize access", "40001");
    });

    const auto started = std::chrono::steady_clock::now();
    const auto result = f.repo->get(kFirstId, {}, ctx);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CANCELLED);
    CHECK(f.db->count(kSelect) == 1);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

TEST_CASE("Repository retry: disabled by default", "[repository][retry]") {
    Fixture f;
    f.db->on(kSelect, error_result("could not serialize access", "40001"));

    REQUIRE(f.repo->get(kFirstId).is_error());
    CHECK(f.db->count(kSelect) == 1);
}
