#include "query/query_builder.hpp"
#include "query/value_codec.hpp"
#include "schema/type_normalizer.hpp"
#include "db/postgresql/pg_array.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace tempo {

// ============================================================================
// WhereClause
// ============================================================================

WhereClause& WhereClause::eq(std::string column, FieldValue value) {
    conditions_.push_back({std::move(column), ConditionOp::EQ, std::move(value)});
    return *this;
}

WhereClause& WhereClause::le(std::string column, FieldValue value) {
    conditions_.push_back({std::move(column), ConditionOp::LE, std::move(value)});
    return *this;
}

WhereClause& WhereClause::gt(std::string column, FieldValue value) {
    conditions_.push_back({std::move(column), ConditionOp::GT, std::move(value)});
    return *this;
}

WhereClause& WhereClause::is_null(std::string column) {
    conditions_.push_back({std::move(column), ConditionOp::IS_NULL, std::monostate{}});
    return *this;
}

WhereClause& WhereClause::is_not_null(std::string column) {
    conditions_.push_back({std::move(column), ConditionOp::IS_NOT_NULL, std::monostate{}});
    return *this;
}

WhereClause& WhereClause::null_or_gt(std::string column, FieldValue value) {
    conditions_.push_back({std::move(column), ConditionOp::NULL_OR_GT, std::move(value)});
    return *this;
}

WhereClause& WhereClause::any_of(std::string column, std::vector<std::string> values) {
    conditions_.push_back({std::move(column), ConditionOp::ANY_OF, StringArray(std::move(values))});
    return *this;
}

WhereClause& WhereClause::match(const Record& filters) {
    for (const auto& [column, value] : filters) {
        eq(column, value);
    }
    return *this;
}

// ============================================================================
// Identifiers
// ============================================================================

std::string QueryBuilder::quote_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string QueryBuilder::qualified_table(const TableDefinition& table) {
    return quote_identifier(table.schema) + "." + quote_identifier(table.name);
}

const ColumnDefinition& QueryBuilder::require_column(const TableDefinition& table,
                                                     const std::string& column) {
    const auto* col = table.find_column(column);
    if (!col) {
        throw EngineError(ErrorCategory::VALIDATION_BYPASS,
            std::format("unknown column '{}' on table '{}'", column, table.name),
            {table.name, column, "build"});
    }
    return *col;
}

std::string QueryBuilder::render_where(const TableDefinition& table, const WhereClause& where,
                                       std::vector<DbParam>& params) {
    if (where.empty()) return "";

    std::string sql = " WHERE ";
    bool first = true;
    for (const auto& cond : where.conditions()) {
        const auto& col = require_column(table, cond.column);
        const auto name = quote_identifier(cond.column);

        if (!first) sql += " AND ";
        first = false;

        auto bind = [&]() {
            params.push_back(ValueCodec::encode(col, cond.value, table.name));
            return std::format("${}", params.size());
        };

        switch (cond.op) {
            case ConditionOp::EQ:
                if (is_null(cond.value)) {
                    sql += name + " IS NULL";
                } else {
                    sql += name + " = " + bind();
                }
                break;
            case ConditionOp::LE:
                sql += name + " <= " + bind();
                break;
            case ConditionOp::GT:
                sql += name + " > " + bind();
                break;
            case ConditionOp::IS_NULL:
                sql += name + " IS NULL";
                break;
            case ConditionOp::IS_NOT_NULL:
                sql += name + " IS NOT NULL";
                break;
            case ConditionOp::NULL_OR_GT:
                sql += std::format("({} IS NULL OR {} > {})", name, name, bind());
                break;
            case ConditionOp::ANY_OF: {
                // Each element is checked against the column type, then sent as one array
                std::vector<std::string> items;
                for (const auto& item : std::get<StringArray>(cond.value)) {
                    if (auto text = ValueCodec::encode(col, item, table.name)) {
                        items.push_back(std::move(*text));
                    }
                }
                params.push_back(pg::encode_text_array(items));
                sql += std::format("{} = ANY(${})", name, params.size());
                break;
            }
        }
    }
    return sql;
}

// ============================================================================
// DML
// ============================================================================

SqlStatement QueryBuilder::insert(const TableDefinition& table, const Record& values) {
    SqlStatement stmt;
    if (values.empty()) {
        stmt.sql = std::format("INSERT INTO {} DEFAULT VALUES RETURNING *", qualified_table(table));
        return stmt;
    }

    std::string columns;
    std::string placeholders;
    for (const auto& [name, value] : values) {
        const auto& col = require_column(table, name);
        stmt.params.push_back(ValueCodec::encode(col, value, table.name));
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += quote_identifier(name);
        placeholders += std::format("${}", stmt.params.size());
    }

    stmt.sql = std::format("INSERT INTO {} ({}) VALUES ({}) RETURNING *",
                           qualified_table(table), columns, placeholders);
    return stmt;
}

SqlStatement QueryBuilder::update(const TableDefinition& table, const Record& values,
                                  const WhereClause& where) {
    if (values.empty()) {
        throw EngineError(ErrorCategory::INTERNAL_ERROR, "UPDATE without assignments",
            {table.name, "", "update"});
    }

    SqlStatement stmt;
    std::string assignments;
    for (const auto& [name, value] : values) {
        const auto& col = require_column(table, name);
        stmt.params.push_back(ValueCodec::encode(col, value, table.name));
        if (!assignments.empty()) assignments += ", ";
        assignments += std::format("{} = ${}", quote_identifier(name), stmt.params.size());
    }

    stmt.sql = std::format("UPDATE {} SET {}{} RETURNING *", qualified_table(table),
                           assignments, render_where(table, where, stmt.params));
    return stmt;
}

SqlStatement QueryBuilder::select(const TableDefinition& table, const WhereClause& where,
                                  const SelectOptions& options) {
    SqlStatement stmt;
    stmt.sql = "SELECT * FROM " + qualified_table(table) + render_where(table, where, stmt.params);

    if (!options.order_by.empty()) {
        stmt.sql += " ORDER BY ";
        for (size_t i = 0; i < options.order_by.size(); ++i) {
            const auto& ob = options.order_by[i];
            (void)require_column(table, ob.column);
            if (i > 0) stmt.sql += ", ";
            stmt.sql += quote_identifier(ob.column) + (ob.descending ? " DESC" : " ASC");
        }
    }
    if (options.limit) {
        stmt.params.push_back(std::to_string(*options.limit));
        stmt.sql += std::format(" LIMIT ${}", stmt.params.size());
    }
    if (options.offset && *options.offset > 0) {
        stmt.params.push_back(std::to_string(*options.offset));
        stmt.sql += std::format(" OFFSET ${}", stmt.params.size());
    }
    if (options.for_update) {
        stmt.sql += " FOR UPDATE";
    }
    return stmt;
}

SqlStatement QueryBuilder::count(const TableDefinition& table, const WhereClause& where) {
    SqlStatement stmt;
    stmt.sql = "SELECT COUNT(*) FROM " + qualified_table(table)
             + render_where(table, where, stmt.params);
    return stmt;
}

SqlStatement QueryBuilder::remove(const TableDefinition& table, const WhereClause& where) {
    if (where.empty()) {
        throw EngineError(ErrorCategory::INTERNAL_ERROR, "DELETE without conditions",
            {table.name, "", "delete"});
    }
    SqlStatement stmt;
    stmt.sql = "DELETE FROM " + qualified_table(table) + render_where(table, where, stmt.params);
    return stmt;
}

// ============================================================================
// DDL
// ============================================================================

std::string QueryBuilder::column_ddl(const ColumnDefinition& column) {
    const auto type = column.native_type.empty() ? PgTypeMap::native_type_for(column)
                                                 : column.native_type;
    auto ddl = quote_identifier(column.name) + " " + type;
    if (!column.nullable) ddl += " NOT NULL";
    if (column.default_value) ddl += " DEFAULT " + *column.default_value;
    return ddl;
}

std::string QueryBuilder::create_table(const TableDefinition& table) {
    std::string body;
    std::string pk;
    for (const auto& col : table.columns) {
        if (!body.empty()) body += ",\n";
        body += "    " + column_ddl(col);
        if (col.primary_key) {
            if (!pk.empty()) pk += ", ";
            pk += quote_identifier(col.name);
        }
    }
    if (!pk.empty()) {
        body += ",\n    PRIMARY KEY (" + pk + ")";
    }
    return std::format("CREATE TABLE {} (\n{}\n)", qualified_table(table), body);
}

std::string QueryBuilder::drop_table(const TableDefinition& table) {
    return "DROP TABLE " + qualified_table(table);
}

std::string QueryBuilder::add_column(const TableDefinition& table, const ColumnDefinition& column) {
    return std::format("ALTER TABLE {} ADD COLUMN {}", qualified_table(table), column_ddl(column));
}

std::string QueryBuilder::drop_column(const TableDefinition& table, const ColumnDefinition& column) {
    return std::format("ALTER TABLE {} DROP COLUMN {}", qualified_table(table),
                       quote_identifier(column.name));
}

std::vector<std::string> QueryBuilder::alter_column(const TableDefinition& table,
                                                    const ColumnDefinition& live,
                                                    const ColumnDefinition& declared) {
    const auto from = TypeNormalizer::normalize_column(live);
    const auto to = TypeNormalizer::normalize_column(declared);
    const auto prefix = std::format("ALTER TABLE {} ALTER COLUMN {}", qualified_table(table),
                                    quote_identifier(declared.name));

    std::vector<std::string> statements;
    if (from.native_type != to.native_type) {
        const auto type = declared.native_type.empty() ? PgTypeMap::native_type_for(declared)
                                                       : declared.native_type;
        statements.push_back(prefix + " TYPE " + type);
    }
    if (from.nullable != to.nullable) {
        statements.push_back(prefix + (to.nullable ? " DROP NOT NULL" : " SET NOT NULL"));
    }
    if (from.default_value != to.default_value) {
        statements.push_back(declared.default_value
            ? prefix + " SET DEFAULT " + *declared.default_value
            : prefix + " DROP DEFAULT");
    }
    return statements;
}

std::string QueryBuilder::replace_primary_key(const TableDefinition& table,
                                              const std::vector<std::string>& previous,
                                              const std::vector<std::string>& key) {
    std::vector<std::string> actions;
    if (!previous.empty()) {
        actions.push_back("DROP CONSTRAINT " + quote_identifier(table.name + "_pkey"));
    }
    if (!key.empty()) {
        std::string columns;
        for (const auto& c : key) {
            if (!columns.empty()) columns += ", ";
            columns += quote_identifier(c);
        }
        actions.push_back("ADD PRIMARY KEY (" + columns + ")");
    }
    return std::format("ALTER TABLE {} {}", qualified_table(table), utils::join(actions, ", "));
}

std::string QueryBuilder::create_index(const TableDefinition& table, const IndexDefinition& index) {
    std::string columns;
    for (const auto& c : index.columns) {
        if (!columns.empty()) columns += ", ";
        // expression keys are passed through as written
        columns += c.find('(') == std::string::npos ? quote_identifier(c) : c;
    }

    auto sql = std::format("CREATE {}INDEX {} ON {} USING {} ({})",
        index.unique ? "UNIQUE " : "", quote_identifier(index.name), qualified_table(table),
        index.method.empty() ? "btree" : index.method, columns);
    if (index.where) {
        sql += " WHERE " + *index.where;
    }
    return sql;
}

std::string QueryBuilder::drop_index(const TableDefinition& table, const IndexDefinition& index) {
    return std::format("DROP INDEX {}.{}", quote_identifier(table.schema),
                       quote_identifier(index.name));
}

std::vector<std::string> QueryBuilder::render_change(const SchemaChange& change) {
    std::vector<std::string> statements;
    switch (change.kind) {
        case ChangeKind::ADD_TABLE:
            statements.push_back(create_table(change.table));
            for (const auto& idx : change.table.indexes) {
                statements.push_back(create_index(change.table, idx));
            }
            break;
        case ChangeKind::ADD_COLUMN:
            statements.push_back(add_column(change.table, change.column));
            break;
        case ChangeKind::ADD_INDEX:
            if (change.previous_index) {
                statements.push_back(drop_index(change.table, *change.previous_index));
            }
            statements.push_back(create_index(change.table, change.index));
            break;
        case ChangeKind::ALTER_COLUMN:
            if (change.previous_column) {
                statements = alter_column(change.table, *change.previous_column, change.column);
            }
            break;
        case ChangeKind::ALTER_PRIMARY_KEY:
            statements.push_back(replace_primary_key(change.table, change.previous_primary_key,
                                                     change.primary_key));
            break;
        case ChangeKind::DROP_INDEX:
            statements.push_back(drop_index(change.table, change.index));
            break;
        case ChangeKind::DROP_COLUMN:
            statements.push_back(drop_column(change.table, change.column));
            break;
        case ChangeKind::DROP_TABLE:
            statements.push_back(drop_table(change.table));
            break;
    }
    return statements;
}

} // namespace tempo
