#include "db/postgresql/pg_schema_introspector.hpp"
#include "db/postgresql/pg_array.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/db_session.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"

#include <format>
#include <map>

namespace tempo {

namespace {

constexpr const char* kColumnsQuery = R"SQL(
SELECT c.table_schema, c.table_name, c.column_name, c.data_type, c.udt_name,
       c.is_nullable, c.column_default, c.character_maximum_length,
       c.numeric_precision, c.numeric_scale
FROM information_schema.columns c
JOIN information_schema.tables t
  ON t.table_schema = c.table_schema AND t.table_name = c.table_name
WHERE t.table_type = 'BASE TABLE'
  AND c.table_schema = ANY($1::text[])
ORDER BY c.table_schema, c.table_name, c.ordinal_position
)SQL";

constexpr const char* kPrimaryKeyQuery = R"SQL(
SELECT n.nspname, c.relname, a.attname
FROM pg_index ix
JOIN pg_class c ON c.oid = ix.indrelid
JOIN pg_namespace n ON n.oid = c.relnamespace
JOIN pg_attribute a ON a.attrelid = c.oid AND a.attnum = ANY(ix.indkey)
WHERE ix.indisprimary
  AND n.nspname = ANY($1::text[])
)SQL";

constexpr const char* kIndexQuery = R"SQL(
SELECT n.nspname, t.relname, i.relname, ix.indisunique, am.amname,
       pg_get_expr(ix.indpred, ix.indrelid),
       ARRAY(SELECT pg_get_indexdef(ix.indexrelid, k + 1, true)
             FROM generate_subscripts(ix.indkey, 1) AS k
             ORDER BY k)
FROM pg_index ix
JOIN pg_class i ON i.oid = ix.indexrelid
JOIN pg_class t ON t.oid = ix.indrelid
JOIN pg_namespace n ON n.oid = t.relnamespace
JOIN pg_am am ON am.oid = i.relam
WHERE NOT ix.indisprimary
  AND t.relkind = 'r'
  AND n.nspname = ANY($1::text[])
ORDER BY n.nspname, t.relname, i.relname
)SQL";

using Row = std::vector<std::optional<std::string>>;

const std::string& text_at(const Row& row, size_t i) {
    static const std::string empty;
    return (i < row.size() && row[i]) ? *row[i] : empty;
}

std::optional<int> int_at(const Row& row, size_t i) {
    if (i >= row.size() || !row[i]) return std::nullopt;
    return utils::try_parse_int<int>(*row[i]);
}

std::string table_key(const std::string& schema, const std::string& table) {
    return schema + "." + table;
}

} // anonymous namespace

std::string PgSchemaIntrospector::compose_native_type(
    const std::string& data_type, const std::string& udt_name,
    const std::optional<int>& char_length,
    const std::optional<int>& numeric_precision,
    const std::optional<int>& numeric_scale) {

    if (data_type == "ARRAY" || data_type == "USER-DEFINED") {
        return udt_name;
    }
    if ((data_type == "character varying" || data_type == "character") && char_length) {
        return std::format("{}({})", data_type, *char_length);
    }
    if (data_type == "numeric" && numeric_precision) {
        return std::format("numeric({},{})", *numeric_precision, numeric_scale.value_or(0));
    }
    return data_type;
}

std::vector<TableDefinition> PgSchemaIntrospector::introspect(
    DbSession& session, const std::vector<std::string>& schemas) {

    const std::vector<DbParam> params = {pg::encode_text_array(schemas)};
    std::map<std::string, TableDefinition> tables;

    // ===== Columns =====
    const auto columns = session.run(kColumnsQuery, params);
    for (const auto& row : columns.rows) {
        const auto& schema = text_at(row, 0);
        const auto& table_name = text_at(row, 1);

        auto& table = tables[table_key(schema, table_name)];
        if (table.name.empty()) {
            table.schema = schema;
            table.name = table_name;
        }

        ColumnDefinition col;
        col.name = text_at(row, 2);
        col.max_length = int_at(row, 7);
        col.native_type = compose_native_type(text_at(row, 3), text_at(row, 4),
            col.max_length, int_at(row, 8), int_at(row, 9));
        col.nullable = text_at(row, 5) == db::kYes || text_at(row, 5) == db::kYesLow;
        if (row.size() > 6 && row[6]) {
            col.default_value = *row[6];
        }
        col.logical_type = PgTypeMap::canonical_to_logical(
            PgTypeMap::canonical_type_name(utils::to_lower(text_at(row, 4))));
        if (text_at(row, 3) == "numeric") {
            col.precision = int_at(row, 8);
            col.scale = int_at(row, 9);
        }
        table.columns.push_back(std::move(col));
    }

    // ===== Primary keys =====
    const auto pks = session.run(kPrimaryKeyQuery, params);
    for (const auto& row : pks.rows) {
        auto it = tables.find(table_key(text_at(row, 0), text_at(row, 1)));
        if (it == tables.end()) continue;
        for (auto& col : it->second.columns) {
            if (col.name == text_at(row, 2)) col.primary_key = true;
        }
    }

    // ===== Secondary indexes =====
    const auto indexes = session.run(kIndexQuery, params);
    for (const auto& row : indexes.rows) {
        auto it = tables.find(table_key(text_at(row, 0), text_at(row, 1)));
        if (it == tables.end()) continue;

        IndexDefinition idx;
        idx.table = text_at(row, 1);
        idx.name = text_at(row, 2);
        idx.unique = text_at(row, 3) == db::kPgTrue;
        idx.method = text_at(row, 4);
        if (row.size() > 5 && row[5]) {
            idx.where = *row[5];
        }
        idx.columns = pg::decode_text_array(text_at(row, 6));
        it->second.indexes.push_back(std::move(idx));
    }

    std::vector<TableDefinition> result;
    result.reserve(tables.size());
    for (auto& [key, table] : tables) {
        result.push_back(std::move(table));
    }

    utils::log::info(std::format("Introspected {} tables", result.size()));
    return result;
}

} // namespace tempo
