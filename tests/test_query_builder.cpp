#include <catch2/catch_test_macros.hpp>
#include "query/query_builder.hpp"
#include "temporal/strategy_schema.hpp"
#include "core/error.hpp"

using namespace tempo;

namespace {

// Columns named after SQL keywords
TableDefinition events_table() {
    TableDefinition t;
    t.name = "events";
    t.soft_delete = false;

    t.columns.push_back(ColumnDefinition("limit", LogicalType::INTEGER, true));
    t.columns.push_back(ColumnDefinition("order", LogicalType::INTEGER, true));
    ColumnDefinition user("user", LogicalType::STRING, true);
    user.max_length = 50;
    t.columns.push_back(user);
    t.columns.push_back(ColumnDefinition("select", LogicalType::TEXT, true));
    t.columns.push_back(ColumnDefinition("score", LogicalType::FLOAT, true));
    return StrategySchema::augment(t);
}

} // anonymous namespace

// ============================================================================
// Identifiers
// ============================================================================

TEST_CASE("QueryBuilder: identifiers are always quoted", "[query_builder]") {
    REQUIRE(QueryBuilder::quote_identifier("limit") == "\"limit\"");
    REQUIRE(QueryBuilder::quote_identifier("a\"b") == "\"a\"\"b\"");

    TableDefinition t;
    t.schema = "tenant data";
    t.name = "order";
    REQUIRE(QueryBuilder::qualified_table(t) == "\"tenant data\".\"order\"");
}

// ============================================================================
// DML
// ============================================================================

TEST_CASE("QueryBuilder: insert quotes reserved-word columns", "[query_builder][dml]") {
    const auto table = events_table();
    const Record values = {
        {"order", int64_t{3}},
        {"user", std::string("bob")},
        {"select", std::string("x")},
    };

    const auto stmt = QueryBuilder::insert(table, values);
    REQUIRE(stmt.sql == "INSERT INTO \"public\".\"events\" (\"order\", \"select\", \"user\") "
                        "VALUES ($1, $2, $3) RETURNING *");
    REQUIRE(stmt.params.size() == 3);
    REQUIRE(stmt.params[0] == "3");
    REQUIRE(stmt.params[1] == "x");
    REQUIRE(stmt.params[2] == "bob");
}

TEST_CASE("QueryBuilder: update binds assignments before conditions", "[query_builder][dml]") {
    const auto table = events_table();
    const Record values = {{"limit", int64_t{10}}, {"user", std::monostate{}}};

    WhereClause where;
    where.eq("id", std::string("7f0c3a52-2f4e-4b8a-9f7e-3f1e2d4c5b6a")).eq("order", int64_t{1});

    const auto stmt = QueryBuilder::update(table, values, where);
    REQUIRE(stmt.sql == "UPDATE \"public\".\"events\" SET \"limit\" = $1, \"user\" = $2 "
                        "WHERE \"id\" = $3 AND \"order\" = $4 RETURNING *");
    REQUIRE(stmt.params.size() == 4);
    REQUIRE(stmt.params[0] == "10");
    REQUIRE_FALSE(stmt.params[1].has_value());
    REQUIRE(stmt.params[3] == "1");
}

TEST_CASE("QueryBuilder: select with ordering, paging and locking", "[query_builder][dml]") {
    const auto table = events_table();
    WhereClause where;
    where.eq("user", std::string("alice"));

    SelectOptions options;
    options.order_by = {{"order", true}, {"limit", false}};
    options.limit = 10;
    options.offset = 20;
    options.for_update = true;

    const auto stmt = QueryBuilder::select(table, where, options);
    REQUIRE(stmt.sql == "SELECT * FROM \"public\".\"events\" WHERE \"user\" = $1 "
                        "ORDER BY \"order\" DESC, \"limit\" ASC LIMIT $2 OFFSET $3 FOR UPDATE");
    REQUIRE(stmt.params.size() == 3);
    REQUIRE(stmt.params[1] == "10");
    REQUIRE(stmt.params[2] == "20");
}

TEST_CASE("QueryBuilder: zero offset is omitted", "[query_builder][dml]") {
    SelectOptions options;
    options.limit = 5;
    options.offset = 0;
    const auto stmt = QueryBuilder::select(events_table(), WhereClause{}, options);
    REQUIRE(stmt.sql == "SELECT * FROM \"public\".\"events\" LIMIT $1");
}

TEST_CASE("QueryBuilder: null conditions", "[query_builder][dml]") {
    const auto table = events_table();
    WhereClause where;
    where.eq("user", std::monostate{})
         .is_not_null("select")
         .null_or_gt("limit", int64_t{5});

    const auto stmt = QueryBuilder::count(table, where);
    REQUIRE(stmt.sql == "SELECT COUNT(*) FROM \"public\".\"events\" WHERE \"user\" IS NULL "
                        "AND \"select\" IS NOT NULL AND (\"limit\" IS NULL OR \"limit\" > $1)");
    REQUIRE(stmt.params.size() == 1);
}

TEST_CASE("QueryBuilder: any_of binds one array parameter", "[query_builder][dml]") {
    const auto table = events_table();
    WhereClause where;
    where.eq("order", int64_t{1})
         .any_of("limit", {"1", "20", "300"});

    const auto stmt = QueryBuilder::select(table, where);
    REQUIRE(stmt.sql == "SELECT * FROM \"public\".\"events\" WHERE \"order\" = $1 "
                        "AND \"limit\" = ANY($2)");
    REQUIRE(stmt.params.size() == 2);
    REQUIRE(stmt.params[1] == "{\"1\",\"20\",\"300\"}");
}

TEST_CASE("QueryBuilder: any_of checks every element against the column", "[query_builder][dml]") {
    const auto table = events_table();
    WhereClause where;
    where.any_of("limit", {"1", "not a number"});

    try {
        (void)QueryBuilder::select(table, where);
        FAIL("expected VALIDATION_BYPASS");
    } catch (const EngineError& e) {
        REQUIRE(e.category() == ErrorCategory::VALIDATION_BYPASS);
        REQUIRE(e.context().subject == "limit");
    }
}

TEST_CASE("QueryBuilder: delete requires conditions", "[query_builder][dml]") {
    const auto table = events_table();
    REQUIRE_THROWS_AS(QueryBuilder::remove(table, WhereClause{}), EngineError);

    WhereClause where;
    where.le("created_at", std::string("2024-01-01T00:00:00Z"));
    const auto stmt = QueryBuilder::remove(table, where);
    REQUIRE(stmt.sql == "DELETE FROM \"public\".\"events\" WHERE \"created_at\" <= $1");
}

TEST_CASE("QueryBuilder: unknown columns are rejected", "[query_builder][dml]") {
    const auto table = events_table();

    try {
        (void)QueryBuilder::insert(table, {{"nope", std::string("x")}});
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.category() == ErrorCategory::VALIDATION_BYPASS);
        REQUIRE(e.context().subject == "nope");
    }

    WhereClause where;
    where.eq("missing", int64_t{1});
    REQUIRE_THROWS_AS(QueryBuilder::select(table, where), EngineError);

    SelectOptions options;
    options.order_by = {{"missing", false}};
    REQUIRE_THROWS_AS(QueryBuilder::select(table, WhereClause{}, options), EngineError);
}

TEST_CASE("QueryBuilder: values are coerced to the column type", "[query_builder][dml]") {
    const auto table = events_table();

    const auto stmt = QueryBuilder::insert(table, {{"score", Decimal{"19.99"}}});
    REQUIRE(stmt.params[0] == "19.99");

    REQUIRE_THROWS_AS(QueryBuilder::insert(table, {{"limit", std::string("ten")}}), EngineError);
    REQUIRE_THROWS_AS(QueryBuilder::insert(table, {{"user", std::string(51, 'u')}}), EngineError);
}

TEST_CASE("QueryBuilder: update needs assignments", "[query_builder][dml]") {
    WhereClause where;
    where.eq("order", int64_t{1});
    REQUIRE_THROWS_AS(QueryBuilder::update(events_table(), Record{}, where), EngineError);
}

// ============================================================================
// DDL
// ============================================================================

TEST_CASE("QueryBuilder: create table", "[query_builder][ddl]") {
    TableDefinition t;
    t.name = "tags";

    ColumnDefinition id("id", LogicalType::UUID, false);
    id.primary_key = true;
    t.columns.push_back(id);
    ColumnDefinition user("user", LogicalType::STRING, false);
    user.max_length = 50;
    t.columns.push_back(user);
    ColumnDefinition order("order", LogicalType::INTEGER, true);
    order.default_value = "0";
    t.columns.push_back(order);

    REQUIRE(QueryBuilder::create_table(t) ==
        "CREATE TABLE \"public\".\"tags\" (\n"
        "    \"id\" UUID NOT NULL,\n"
        "    \"user\" VARCHAR(50) NOT NULL,\n"
        "    \"order\" INTEGER DEFAULT 0,\n"
        "    PRIMARY KEY (\"id\")\n"
        ")");
}

TEST_CASE("QueryBuilder: scd2 table has a composite primary key", "[query_builder][ddl]") {
    TableDefinition t;
    t.name = "prices";
    t.strategy = VersioningStrategy::SCD2;
    const auto sql = QueryBuilder::create_table(StrategySchema::augment(t));
    REQUIRE(sql.find("PRIMARY KEY (\"id\", \"version\")") != std::string::npos);
}

TEST_CASE("QueryBuilder: index statements", "[query_builder][ddl]") {
    TableDefinition t;
    t.name = "orders";

    IndexDefinition idx;
    idx.name = "idx_orders_current";
    idx.columns = {"id", "order"};
    idx.unique = true;
    idx.where = "valid_to IS NULL";

    REQUIRE(QueryBuilder::create_index(t, idx) ==
        "CREATE UNIQUE INDEX \"idx_orders_current\" ON \"public\".\"orders\" "
        "USING btree (\"id\", \"order\") WHERE valid_to IS NULL");
    REQUIRE(QueryBuilder::drop_index(t, idx) == "DROP INDEX \"public\".\"idx_orders_current\"");

    IndexDefinition expr;
    expr.name = "idx_orders_lower_user";
    expr.columns = {"lower(\"user\")"};
    expr.method = "hash";
    REQUIRE(QueryBuilder::create_index(t, expr) ==
        "CREATE INDEX \"idx_orders_lower_user\" ON \"public\".\"orders\" USING hash (lower(\"user\"))");
}

TEST_CASE("QueryBuilder: alter column emits one statement per difference", "[query_builder][ddl]") {
    TableDefinition t;
    t.name = "orders";

    ColumnDefinition live("qty", LogicalType::UNKNOWN, false);
    live.native_type = "integer";
    live.default_value = "1";

    ColumnDefinition declared("qty", LogicalType::BIGINT, true);

    const auto statements = QueryBuilder::alter_column(t, live, declared);
    REQUIRE(statements.size() == 3);
    REQUIRE(statements[0] == "ALTER TABLE \"public\".\"orders\" ALTER COLUMN \"qty\" TYPE BIGINT");
    REQUIRE(statements[1] == "ALTER TABLE \"public\".\"orders\" ALTER COLUMN \"qty\" DROP NOT NULL");
    REQUIRE(statements[2] == "ALTER TABLE \"public\".\"orders\" ALTER COLUMN \"qty\" DROP DEFAULT");

    declared.nullable = false;
    declared.native_type = "int8";
    declared.default_value = "'1'::integer";
    live.native_type = "bigint";
    REQUIRE(QueryBuilder::alter_column(t, live, declared).empty());
}

TEST_CASE("QueryBuilder: rendered changes", "[query_builder][ddl]") {
    TableDefinition t;
    t.name = "orders";

    SchemaChange replace;
    replace.kind = ChangeKind::ADD_INDEX;
    replace.table = t;
    replace.index.name = "idx_orders_user";
    replace.index.columns = {"user", "order"};
    replace.previous_index = IndexDefinition{};
    replace.previous_index->name = "idx_orders_user";
    replace.previous_index->columns = {"user"};

    const auto statements = QueryBuilder::render_change(replace);
    REQUIRE(statements.size() == 2);
    REQUIRE(statements[0] == "DROP INDEX \"public\".\"idx_orders_user\"");
    REQUIRE(statements[1].starts_with("CREATE INDEX \"idx_orders_user\""));

    SchemaChange drop;
    drop.kind = ChangeKind::DROP_COLUMN;
    drop.table = t;
    drop.column.name = "select";
    REQUIRE(QueryBuilder::render_change(drop) ==
            std::vector<std::string>{"ALTER TABLE \"public\".\"orders\" DROP COLUMN \"select\""});

    TableDefinition with_index = t;
    with_index.columns.push_back(ColumnDefinition("user", LogicalType::TEXT, true));
    with_index.indexes.push_back(replace.index);
    SchemaChange create;
    create.kind = ChangeKind::ADD_TABLE;
    create.table = with_index;
    const auto create_statements = QueryBuilder::render_change(create);
    REQUIRE(create_statements.size() == 2);
    REQUIRE(create_statements[0].starts_with("CREATE TABLE"));
    REQUIRE(create_statements[1].starts_with("CREATE INDEX"));
}

TEST_CASE("QueryBuilder: primary key replacement", "[query_builder][ddl]") {
    TableDefinition t;
    t.name = "prices";

    SchemaChange change;
    change.kind = ChangeKind::ALTER_PRIMARY_KEY;
    change.table = t;
    change.previous_primary_key = {"id"};
    change.primary_key = {"id", "version"};

    REQUIRE(QueryBuilder::render_change(change) == std::vector<std::string>{
        "ALTER TABLE \"public\".\"prices\" DROP CONSTRAINT \"prices_pkey\", ADD PRIMARY KEY (\"id\", \"version\")"});

    REQUIRE(QueryBuilder::replace_primary_key(t, {}, {"id"})
            == "ALTER TABLE \"public\".\"prices\" ADD PRIMARY KEY (\"id\")");
    REQUIRE(QueryBuilder::replace_primary_key(t, {"id"}, {})
            == "ALTER TABLE \"public\".\"prices\" DROP CONSTRAINT \"prices_pkey\"");
}
