#include <catch2/catch_test_macros.hpp>
#include "temporal/copy_on_change_repository.hpp"
#include "mocks/mock_database.hpp"

using namespace tempo;
using namespace tempo::testing;

namespace {

constexpr const char* kProductId = "6b1f0b3e-5d0a-4c55-9a3f-0e6f8d2c1a77";
constexpr const char* kActor = "0d9e8f7a-6b5c-4d3e-2f1a-0b9c8d7e6f5a";

constexpr const char* kInsertProduct = "INSERT INTO \"public\".\"products\"";
constexpr const char* kInsertAudit = "INSERT INTO \"public\".\"products_audit\"";

TableDefinition products_table() {
    TableDefinition t;
    t.name = "products";
    t.strategy = VersioningStrategy::COPY_ON_CHANGE;

    ColumnDefinition name("name", LogicalType::STRING, false);
    name.max_length = 200;
    t.columns.push_back(name);

    ColumnDefinition price("price", LogicalType::DECIMAL, false);
    price.precision = 10;
    price.scale = 2;
    t.columns.push_back(price);

    t.columns.push_back(ColumnDefinition("attributes", LogicalType::JSON, true));
    return t;
}

TextRow stored_product() {
    return {
        {"id", kProductId},
        {"name", "Widget"},
        {"price", "10.00"},
        {"attributes", "{\"colour\": \"red\", \"size\": \"m\"}"},
        {"created_at", "2024-05-01T08:00:00.000Z"},
        {"updated_at", "2024-05-01T08:00:00.000Z"},
        {"created_by", std::nullopt},
        {"updated_by", std::nullopt},
        {"deleted_at", std::nullopt},
        {"deleted_by", std::nullopt},
    };
}

struct Fixture {
    std::shared_ptr<ScriptedDatabase> db = std::make_shared<ScriptedDatabase>();
    std::unique_ptr<GenericConnectionPool> pool = make_mock_pool(db);
    CopyOnChangeRepository repo{products_table(), *pool, RepositoryOptions{}};

    Fixture() {
        db->on("INSERT INTO", [](const ExecutedStatement& s) { return echo_insert(s); });
    }

    void with_current(TextRow row) {
        db->on("FOR UPDATE", row_result(row));
        db->on("UPDATE \"public\".\"products\" SET", [row](const ExecutedStatement& s) {
            return echo_update(row, s);
        });
    }

    std::vector<TextRow> audit_rows() const {
        std::vector<TextRow> rows;
        for (const auto& s : db->matching(kInsertAudit)) rows.push_back(inserted_values(s));
        return rows;
    }
};

} // anonymous namespace

// ============================================================================
// Create
// ============================================================================

TEST_CASE("CopyOnChangeRepository: create writes one insert audit row per field", "[repository][copy_on_change]") {
    Fixture f;

    const auto result = f.repo.create({{"name", std::string("Widget")}, {"price", Decimal{"10.00"}}}, kActor);
    REQUIRE(result.is_ok());

    REQUIRE(f.db->count(kInsertProduct) == 1);
    const auto audits = f.audit_rows();
    REQUIRE(audits.size() == 2);

    const auto record_id = std::get<std::string>(result.value().at("id"));
    for (const auto& a : audits) {
        CHECK(a.at("operation") == "insert");
        CHECK(a.at("record_id") == record_id);
        CHECK_FALSE(a.at("old_value").has_value());
        CHECK(a.at("changed_by") == kActor);
    }
    REQUIRE(audits[0].at("field_name") == "name");
    REQUIRE(audits[0].at("new_value") == "\"Widget\"");
    REQUIRE(audits[1].at("field_name") == "price");
    REQUIRE(audits[1].at("new_value") == "\"10.00\"");

    // one transaction for the row and its audit entries
    REQUIRE(audits[0].at("transaction_id") == audits[1].at("transaction_id"));
    REQUIRE(f.db->count("BEGIN") == 1);
    REQUIRE(f.db->count("COMMIT") == 1);

    const auto log = f.db->sql_log();
    REQUIRE(log.front() == "BEGIN");
    REQUIRE(log.back() == "COMMIT");
}

TEST_CASE("CopyOnChangeRepository: failed audit write rolls the insert back", "[repository][copy_on_change]") {
    Fixture f;
    f.db->on(kInsertAudit, error_result("permission denied for table products_audit", "42501"));

    const auto result = f.repo.create({{"name", std::string("Widget")}, {"price", Decimal{"10.00"}}}, kActor);
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::DATABASE_ERROR);
    REQUIRE(result.error_context().operation == "create");

    REQUIRE(f.db->count("COMMIT") == 0);
    REQUIRE(f.db->count("ROLLBACK") == 1);
}

// ============================================================================
// Update
// ============================================================================

TEST_CASE("CopyOnChangeRepository: only changed fields are audited", "[repository][copy_on_change]") {
    Fixture f;
    f.with_current(stored_product());

    // name unchanged, price numerically different
    const auto result = f.repo.update(kProductId,
        {{"name", std::string("Widget")}, {"price", Decimal{"12.50"}}}, kActor);
    REQUIRE(result.is_ok());
    REQUIRE(std::get<Decimal>(result.value().at("price")).text == "12.50");

    const auto audits = f.audit_rows();
    REQUIRE(audits.size() == 1);
    REQUIRE(audits[0].at("field_name") == "price");
    REQUIRE(audits[0].at("operation") == "update");
    REQUIRE(audits[0].at("old_value") == "\"10.00\"");
    REQUIRE(audits[0].at("new_value") == "\"12.50\"");

    const auto update = f.db->matching("UPDATE \"public\".\"products\" SET")[0];
    const auto assigned = assigned_values(update);
    REQUIRE_FALSE(assigned.contains("name"));
    REQUIRE(assigned.at("price") == "12.50");
    REQUIRE(assigned.at("updated_by") == kActor);

    const auto lock = f.db->matching("FOR UPDATE")[0];
    REQUIRE(lock.sql.find("\"deleted_at\" IS NULL") != std::string::npos);
}

TEST_CASE("CopyOnChangeRepository: equal values produce no write", "[repository][copy_on_change]") {
    Fixture f;
    f.with_current(stored_product());

    const auto result = f.repo.update(kProductId, {
        {"price", Decimal{"10.0"}},
        {"attributes", Json{"{\"size\":\"m\",\"colour\":\"red\"}"}},
    }, kActor);
    REQUIRE(result.is_ok());
    REQUIRE(f.db->count("UPDATE \"public\".\"products\" SET") == 0);
    REQUIRE(f.audit_rows().empty());
    REQUIRE(f.db->count("COMMIT") == 1);
}

TEST_CASE("CopyOnChangeRepository: JSON and NULL transitions", "[repository][copy_on_change]") {
    Fixture f;
    f.with_current(stored_product());

    const auto result = f.repo.update(kProductId, {{"attributes", std::monostate{}}}, kActor);
    REQUIRE(result.is_ok());

    const auto audits = f.audit_rows();
    REQUIRE(audits.size() == 1);
    REQUIRE(audits[0].at("field_name") == "attributes");
    REQUIRE(audits[0].at("old_value") == "{\"colour\":\"red\",\"size\":\"m\"}");
    REQUIRE_FALSE(audits[0].at("new_value").has_value());
}

TEST_CASE("CopyOnChangeRepository: update of a missing record", "[repository][copy_on_change]") {
    Fixture f;

    const auto result = f.repo.update(kProductId, {{"price", Decimal{"1"}}}, kActor);
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::NOT_FOUND);
    REQUIRE(f.db->count("ROLLBACK") == 1);
    REQUIRE(f.audit_rows().empty());
}

// ============================================================================
// Delete / Restore
// ============================================================================

TEST_CASE("CopyOnChangeRepository: soft delete is audited", "[repository][copy_on_change]") {
    Fixture f;
    f.with_current(stored_product());

    const auto result = f.repo.remove(kProductId, kActor, false);
    REQUIRE(result.is_ok());
    REQUIRE(result.value());

    const auto audits = f.audit_rows();
    REQUIRE(audits.size() == 1);
    REQUIRE(audits[0].at("operation") == "delete");
    REQUIRE(audits[0].at("field_name") == "deleted_at");
    REQUIRE_FALSE(audits[0].at("old_value").has_value());
    REQUIRE(audits[0].at("new_value").has_value());
}

TEST_CASE("CopyOnChangeRepository: hard delete keeps a snapshot", "[repository][copy_on_change]") {
    Fixture f;
    f.with_current(stored_product());
    f.db->on("DELETE FROM", ok_result(1));

    const auto result = f.repo.remove(kProductId, kActor, true);
    REQUIRE(result.is_ok());
    REQUIRE(result.value());
    REQUIRE(f.db->count("DELETE FROM \"public\".\"products\"") == 1);

    const auto audits = f.audit_rows();
    REQUIRE(audits.size() == 1);
    REQUIRE(audits[0].at("field_name") == "*");
    REQUIRE(audits[0].at("old_value")->find("\"name\":\"Widget\"") != std::string::npos);
    REQUIRE_FALSE(audits[0].at("new_value").has_value());
}

TEST_CASE("CopyOnChangeRepository: restore is audited as an update", "[repository][copy_on_change]") {
    Fixture f;
    auto deleted = stored_product();
    deleted["deleted_at"] = "2024-05-02T08:00:00.000Z";
    f.with_current(deleted);

    const auto result = f.repo.restore(kProductId, kActor);
    REQUIRE(result.is_ok());

    const auto audits = f.audit_rows();
    REQUIRE(audits.size() == 1);
    REQUIRE(audits[0].at("operation") == "update");
    REQUIRE(audits[0].at("old_value") == "\"2024-05-02T08:00:00.000Z\"");
    REQUIRE_FALSE(audits[0].at("new_value").has_value());
}

// ============================================================================
// History
// ============================================================================

TEST_CASE("CopyOnChangeRepository: audit history reads the audit table", "[repository][copy_on_change]") {
    Fixture f;
    const TextRow first = {
        {"audit_id", "a1"}, {"record_id", kProductId}, {"field_name", "price"},
        {"old_value", std::nullopt}, {"new_value", "\"10.00\""}, {"operation", "insert"},
        {"changed_at", "2024-05-01T08:00:00.000Z"}, {"changed_by", kActor},
        {"transaction_id", "t1"}, {"metadata", std::nullopt},
    };
    TextRow second = first;
    second["audit_id"] = "a2";
    second["old_value"] = "\"10.00\"";
    second["new_value"] = "\"12.50\"";
    second["operation"] = "update";
    f.db->on("FROM \"public\".\"products_audit\"", row_result({first, second}));

    const auto history = f.repo.get_audit_history(kProductId);
    REQUIRE(history.is_ok());
    REQUIRE(history.value().size() == 2);
    REQUIRE(history.value()[1].operation == "update");
    REQUIRE(history.value()[1].old_value == "\"10.00\"");
    REQUIRE(history.value()[0].changed_by == kActor);
    REQUIRE_FALSE(history.value()[0].old_value.has_value());

    const auto select = f.db->matching("products_audit")[0];
    REQUIRE(select.sql.find("ORDER BY \"changed_at\" ASC, \"field_name\" ASC") != std::string::npos);

    REQUIRE(f.repo.get_field_history(kProductId, "price").is_ok());
    const auto field_select = f.db->matching("products_audit")[1];
    REQUIRE(field_select.sql.find("\"field_name\" = $2") != std::string::npos);
    REQUIRE(field_select.params[1] == "price");
}

TEST_CASE("CopyOnChangeRepository: audit table layout", "[repository][copy_on_change]") {
    Fixture f;
    const auto& audit = f.repo.audit_table();
    REQUIRE(audit.name == "products_audit");
    REQUIRE(audit.find_column("audit_id")->primary_key);
    REQUIRE(audit.find_column("old_value")->native_type == "JSONB");
    REQUIRE(audit.find_column("operation")->native_type == "VARCHAR(16)");
    REQUIRE(audit.find_index("idx_products_audit_record_field") != nullptr);
}
