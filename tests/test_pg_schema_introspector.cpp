#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_schema_introspector.hpp"
#include "db/postgresql/pg_array.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/db_session.hpp"
#include "mocks/mock_database.hpp"

using namespace tempo;
using namespace tempo::testing;

namespace {

using Cells = std::vector<std::optional<std::string>>;

Cells column_row(const char* table, const char* column, const char* data_type, const char* udt,
                 const char* nullable, std::optional<std::string> def = std::nullopt,
                 std::optional<std::string> length = std::nullopt,
                 std::optional<std::string> precision = std::nullopt,
                 std::optional<std::string> scale = std::nullopt) {
    return {std::string("public"), std::string(table), std::string(column), std::string(data_type),
            std::string(udt), std::string(nullable), def, length, precision, scale};
}

struct Fixture {
    std::shared_ptr<ScriptedDatabase> db = std::make_shared<ScriptedDatabase>();
    std::unique_ptr<GenericConnectionPool> pool = make_mock_pool(db);
    PgSchemaIntrospector introspector;

    Fixture() {
        db->on("FROM information_schema.columns", rows_result(
            {"table_schema", "table_name", "column_name", "data_type", "udt_name", "is_nullable",
             "column_default", "character_maximum_length", "numeric_precision", "numeric_scale"},
            {
                column_row("products", "id", "uuid", "uuid", "NO", std::string("gen_random_uuid()")),
                column_row("products", "name", "character varying", "varchar", "NO",
                           std::nullopt, std::string("200")),
                column_row("products", "price", "numeric", "numeric", "YES",
                           std::string("0.00"), std::nullopt, std::string("10"), std::string("2")),
                column_row("products", "tags", "ARRAY", "_text", "YES"),
                column_row("products", "created_at", "timestamp with time zone", "timestamptz", "NO",
                           std::string("now()")),
                column_row("legacy", "code", "character", "bpchar", "NO",
                           std::nullopt, std::string("3")),
            }));
        db->on("WHERE ix.indisprimary", rows_result({"nspname", "relname", "attname"}, {
            {std::string("public"), std::string("products"), std::string("id")},
        }));
        db->on("WHERE NOT ix.indisprimary", rows_result(
            {"nspname", "table", "index", "indisunique", "amname", "pred", "cols"}, {
                {std::string("public"), std::string("products"), std::string("idx_products_name"),
                 std::string("t"), std::string("btree"), std::string("(deleted_at IS NULL)"),
                 std::string("{name}")},
                {std::string("public"), std::string("products"), std::string("idx_products_lower"),
                 std::string("f"), std::string("btree"), std::nullopt,
                 std::string("{\"lower((name)::text)\",price}")},
            }));
    }

    std::vector<TableDefinition> introspect() {
        DbSession session(*pool, {}, std::chrono::milliseconds(100), "", "introspect");
        return introspector.introspect(session, {"public", "audit"});
    }
};

} // anonymous namespace

// ============================================================================
// Type spelling
// ============================================================================

TEST_CASE("PgSchemaIntrospector: catalog type spelling", "[introspector]") {
    CHECK(PgSchemaIntrospector::compose_native_type("character varying", "varchar", 255,
                                                    std::nullopt, std::nullopt)
          == "character varying(255)");
    CHECK(PgSchemaIntrospector::compose_native_type("character varying", "varchar", std::nullopt,
                                                    std::nullopt, std::nullopt)
          == "character varying");
    CHECK(PgSchemaIntrospector::compose_native_type("numeric", "numeric", std::nullopt, 10, 2)
          == "numeric(10,2)");
    CHECK(PgSchemaIntrospector::compose_native_type("numeric", "numeric", std::nullopt, 12,
                                                    std::nullopt)
          == "numeric(12,0)");
    CHECK(PgSchemaIntrospector::compose_native_type("ARRAY", "_text", std::nullopt, std::nullopt,
                                                    std::nullopt)
          == "_text");
    CHECK(PgSchemaIntrospector::compose_native_type("integer", "int4", std::nullopt, 32, 0)
          == "integer");
}

TEST_CASE("PgTypeMap: declared column spelling", "[introspector][types]") {
    ColumnDefinition price("price", LogicalType::DECIMAL);
    CHECK(PgTypeMap::native_type_for(price) == "NUMERIC(15,2)");
    price.precision = 8;
    price.scale = 3;
    CHECK(PgTypeMap::native_type_for(price) == "NUMERIC(8,3)");

    CHECK(PgTypeMap::native_type_for(ColumnDefinition("n", LogicalType::STRING)) == "VARCHAR(255)");
    CHECK(PgTypeMap::native_type_for(ColumnDefinition("j", LogicalType::JSON)) == "JSONB");
    CHECK(PgTypeMap::native_type_for(ColumnDefinition("t", LogicalType::TIMESTAMP))
          == "TIMESTAMP WITH TIME ZONE");
    REQUIRE_THROWS_AS(PgTypeMap::native_type_for(ColumnDefinition("x", LogicalType::UNKNOWN)),
                      EngineError);

    CHECK(PgTypeMap::canonical_type_name("int4") == "integer");
    CHECK(PgTypeMap::canonical_type_name("bpchar") == "char");
    CHECK(PgTypeMap::canonical_type_name("money") == "money");
    CHECK(PgTypeMap::canonical_to_logical("money") == LogicalType::UNKNOWN);
}

TEST_CASE("pg array literals", "[introspector][array]") {
    CHECK(pg::encode_text_array({}) == "{}");
    CHECK(pg::encode_text_array({"public", "a\\b"}) == "{\"public\",\"a\\\\b\"}");

    CHECK(pg::decode_text_array("{a,b}") == std::vector<std::string>{"a", "b"});
    CHECK(pg::decode_text_array("{\"x, y\",NULL,\"NULL\"}")
          == std::vector<std::string>{"x, y", "NULL"});
    CHECK(pg::decode_text_array("{}").empty());
    CHECK(pg::decode_text_array("not an array").empty());
}

// ============================================================================
// Introspection
// ============================================================================

TEST_CASE("PgSchemaIntrospector: builds tables from catalog rows", "[introspector]") {
    Fixture f;
    const auto tables = f.introspect();

    // ordered by qualified name
    REQUIRE(tables.size() == 2);
    CHECK(tables[0].qualified_name() == "public.legacy");
    const auto& products = tables[1];
    REQUIRE(products.qualified_name() == "public.products");
    REQUIRE(products.columns.size() == 5);

    const auto* id = products.find_column("id");
    REQUIRE(id != nullptr);
    CHECK(id->primary_key);
    CHECK_FALSE(id->nullable);
    CHECK(id->logical_type == LogicalType::UUID);
    CHECK(id->default_value == "gen_random_uuid()");

    const auto* name = products.find_column("name");
    CHECK(name->native_type == "character varying(200)");
    CHECK(name->max_length == 200);
    CHECK(name->logical_type == LogicalType::STRING);
    CHECK_FALSE(name->primary_key);

    const auto* price = products.find_column("price");
    CHECK(price->nullable);
    CHECK(price->native_type == "numeric(10,2)");
    CHECK(price->precision == 10);
    CHECK(price->scale == 2);
    CHECK(price->logical_type == LogicalType::DECIMAL);

    CHECK(products.find_column("tags")->native_type == "_text");
    CHECK(products.find_column("tags")->logical_type == LogicalType::STRING_ARRAY);
    CHECK(products.find_column("created_at")->logical_type == LogicalType::TIMESTAMP);
    CHECK(tables[0].find_column("code")->native_type == "character(3)");
    CHECK(tables[0].find_column("code")->logical_type == LogicalType::CHAR);
}

TEST_CASE("PgSchemaIntrospector: secondary indexes", "[introspector]") {
    Fixture f;
    const auto tables = f.introspect();
    const auto& products = tables[1];
    REQUIRE(products.indexes.size() == 2);

    const auto* by_name = products.find_index("idx_products_name");
    REQUIRE(by_name != nullptr);
    CHECK(by_name->unique);
    CHECK(by_name->table == "products");
    CHECK(by_name->method == "btree");
    CHECK(by_name->where == "(deleted_at IS NULL)");
    CHECK(by_name->columns == std::vector<std::string>{"name"});

    const auto* by_lower = products.find_index("idx_products_lower");
    REQUIRE(by_lower != nullptr);
    CHECK_FALSE(by_lower->unique);
    CHECK_FALSE(by_lower->where.has_value());
    CHECK(by_lower->columns == std::vector<std::string>{"lower((name)::text)", "price"});
}

TEST_CASE("PgSchemaIntrospector: schemas are bound as one array parameter", "[introspector]") {
    Fixture f;
    (void)f.introspect();

    const auto columns = f.db->matching("information_schema.columns");
    REQUIRE(columns.size() == 1);
    REQUIRE(columns[0].params.size() == 1);
    CHECK(columns[0].params[0] == "{\"public\",\"audit\"}");
    CHECK(f.db->count("ANY($1::text[])") == 3);
}

TEST_CASE("PgSchemaIntrospector: catalog query failure propagates", "[introspector]") {
    Fixture f;
    f.db->on("FROM information_schema.columns", error_result("permission denied for schema audit", "42501"));
    REQUIRE_THROWS_AS(f.introspect(), EngineError);
}
