#pragma once

#include "core/field_value.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tempo {

/**
 * @brief SQL text plus its positional parameters ($1..$n)
 */
struct SqlStatement {
    std::string sql;
    std::vector<DbParam> params;
};

/**
 * @brief Comparison operator of one WHERE condition
 */
enum class ConditionOp : uint8_t {
    EQ,
    LE,
    GT,
    IS_NULL,
    IS_NOT_NULL,
    NULL_OR_GT,     // (col IS NULL OR col > $n)
    ANY_OF          // col = ANY($n), value is a StringArray
};

struct Condition {
    std::string column;
    ConditionOp op = ConditionOp::EQ;
    FieldValue value;
};

/**
 * @brief Conjunction of column conditions, rendered against a table
 *
 * Values are encoded with the column's type; EQ with a NULL value renders
 * as IS NULL.
 */
class WhereClause {
public:
    WhereClause& eq(std::string column, FieldValue value);
    WhereClause& le(std::string column, FieldValue value);
    WhereClause& gt(std::string column, FieldValue value);
    WhereClause& is_null(std::string column);
    WhereClause& is_not_null(std::string column);
    WhereClause& null_or_gt(std::string column, FieldValue value);

    /**
     * @brief Column equals one of @p values (bound as a single array parameter)
     */
    WhereClause& any_of(std::string column, std::vector<std::string> values);

    /**
     * @brief Add one EQ condition per filter entry
     */
    WhereClause& match(const Record& filters);

    [[nodiscard]] bool empty() const { return conditions_.empty(); }
    [[nodiscard]] const std::vector<Condition>& conditions() const { return conditions_; }

private:
    std::vector<Condition> conditions_;
};

struct OrderBy {
    std::string column;
    bool descending = false;
};

struct SelectOptions {
    std::vector<OrderBy> order_by;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    bool for_update = false;
};

/**
 * @brief Renders parameterized DML and DDL from table metadata
 *
 * Every identifier is double-quoted, so reserved words (limit, order, user,
 * select) are safe in every clause. Every value is a placeholder, including
 * generated ids and timestamps. Unknown columns and values that do not fit
 * their column are rejected before any SQL exists.
 */
class QueryBuilder {
public:
    // ===== Identifiers =====

    [[nodiscard]] static std::string quote_identifier(std::string_view name);

    /**
     * @brief "schema"."table"
     */
    [[nodiscard]] static std::string qualified_table(const TableDefinition& table);

    // ===== DML =====

    /**
     * @brief INSERT ... RETURNING *
     */
    [[nodiscard]] static SqlStatement insert(const TableDefinition& table, const Record& values);

    /**
     * @brief UPDATE ... SET ... WHERE ... RETURNING *
     */
    [[nodiscard]] static SqlStatement update(const TableDefinition& table, const Record& values,
                                             const WhereClause& where);

    [[nodiscard]] static SqlStatement select(const TableDefinition& table, const WhereClause& where,
                                             const SelectOptions& options = {});

    [[nodiscard]] static SqlStatement count(const TableDefinition& table, const WhereClause& where);

    [[nodiscard]] static SqlStatement remove(const TableDefinition& table, const WhereClause& where);

    // ===== DDL =====

    [[nodiscard]] static std::string create_table(const TableDefinition& table);
    [[nodiscard]] static std::string drop_table(const TableDefinition& table);
    [[nodiscard]] static std::string add_column(const TableDefinition& table, const ColumnDefinition& column);
    [[nodiscard]] static std::string drop_column(const TableDefinition& table, const ColumnDefinition& column);

    /**
     * @brief ALTER COLUMN statements moving live to declared (type, nullability, default)
     */
    [[nodiscard]] static std::vector<std::string> alter_column(const TableDefinition& table,
                                                               const ColumnDefinition& live,
                                                               const ColumnDefinition& declared);

    /**
     * @brief Swap the "{table}_pkey" constraint for one over @p key (empty key: drop only)
     */
    [[nodiscard]] static std::string replace_primary_key(const TableDefinition& table,
                                                         const std::vector<std::string>& previous,
                                                         const std::vector<std::string>& key);

    [[nodiscard]] static std::string create_index(const TableDefinition& table, const IndexDefinition& index);
    [[nodiscard]] static std::string drop_index(const TableDefinition& table, const IndexDefinition& index);

    /**
     * @brief All statements needed to apply one change, in execution order
     */
    [[nodiscard]] static std::vector<std::string> render_change(const SchemaChange& change);

private:
    [[nodiscard]] static std::string column_ddl(const ColumnDefinition& column);

    static std::string render_where(const TableDefinition& table, const WhereClause& where,
                                    std::vector<DbParam>& params);

    [[nodiscard]] static const ColumnDefinition& require_column(const TableDefinition& table,
                                                                const std::string& column);
};

} // namespace tempo
