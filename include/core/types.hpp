#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tempo {

// ============================================================================
// Versioning Strategy
// ============================================================================

enum class VersioningStrategy : uint8_t {
    NONE,
    COPY_ON_CHANGE,
    SCD2
};

[[nodiscard]] inline const char* strategy_to_string(VersioningStrategy s) {
    switch (s) {
        case VersioningStrategy::NONE:           return "none";
        case VersioningStrategy::COPY_ON_CHANGE: return "copy_on_change";
        case VersioningStrategy::SCD2:           return "scd2";
        default:                                 return "none";
    }
}

[[nodiscard]] inline std::optional<VersioningStrategy> parse_strategy(std::string_view s) {
    if (s == "none") return VersioningStrategy::NONE;
    if (s == "copy_on_change") return VersioningStrategy::COPY_ON_CHANGE;
    if (s == "scd2") return VersioningStrategy::SCD2;
    return std::nullopt;
}

// ============================================================================
// Schema Description
// ============================================================================

/**
 * @brief One column, either declared by the application or read back from
 * the catalog
 *
 * native_type is the dialect spelling ("VARCHAR(255)", "int4", ...). Two
 * columns are equal when names match and normalized native types, normalized
 * defaults and nullability match (see TypeNormalizer::columns_equal).
 */
struct ColumnDefinition {
    std::string name;
    LogicalType logical_type = LogicalType::UNKNOWN;
    bool nullable = true;
    std::string native_type;
    std::optional<std::string> default_value;   // raw SQL expression
    std::optional<int> max_length;
    std::optional<int> precision;
    std::optional<int> scale;
    bool primary_key = false;

    ColumnDefinition() = default;
    ColumnDefinition(std::string n, LogicalType lt, bool is_nullable = true)
        : name(std::move(n)), logical_type(lt), nullable(is_nullable) {}
};

/**
 * @brief Secondary index; where is the raw partial-index predicate
 */
struct IndexDefinition {
    std::string name;
    std::string table;
    std::vector<std::string> columns;
    bool unique = false;
    std::string method = "btree";
    std::optional<std::string> where;
};

/**
 * @brief A declared (or introspected) table
 *
 * Declared tables are built once at startup and treated as immutable; the
 * strategy-managed columns are added by strategy_schema::augment().
 */
struct TableDefinition {
    std::string schema = "public";
    std::string name;
    std::vector<ColumnDefinition> columns;
    std::vector<IndexDefinition> indexes;
    VersioningStrategy strategy = VersioningStrategy::NONE;
    bool multi_tenant = false;
    bool soft_delete = true;
    std::string tenant_field = "tenant_id";

    [[nodiscard]] std::string qualified_name() const {
        return schema + "." + name;
    }

    [[nodiscard]] const ColumnDefinition* find_column(std::string_view column) const {
        for (const auto& c : columns) {
            if (c.name == column) return &c;
        }
        return nullptr;
    }

    [[nodiscard]] const IndexDefinition* find_index(std::string_view index) const {
        for (const auto& i : indexes) {
            if (i.name == index) return &i;
        }
        return nullptr;
    }

    [[nodiscard]] bool has_column(std::string_view column) const {
        return find_column(column) != nullptr;
    }
};

// ============================================================================
// Schema Changes
// ============================================================================

/**
 * @brief Kind tag of a SchemaChange
 *
 * Declaration order is application order inside one table: additions,
 * then alterations, then drops.
 */
enum class ChangeKind : uint8_t {
    ADD_TABLE,
    ADD_COLUMN,
    ADD_INDEX,
    ALTER_COLUMN,
    ALTER_PRIMARY_KEY,
    DROP_INDEX,
    DROP_COLUMN,
    DROP_TABLE
};

[[nodiscard]] inline const char* change_kind_to_string(ChangeKind k) {
    switch (k) {
        case ChangeKind::ADD_TABLE:    return "AddTable";
        case ChangeKind::ADD_COLUMN:   return "AddColumn";
        case ChangeKind::ADD_INDEX:    return "AddIndex";
        case ChangeKind::ALTER_COLUMN: return "AlterColumn";
        case ChangeKind::ALTER_PRIMARY_KEY: return "AlterPrimaryKey";
        case ChangeKind::DROP_INDEX:   return "DropIndex";
        case ChangeKind::DROP_COLUMN:  return "DropColumn";
        case ChangeKind::DROP_TABLE:   return "DropTable";
        default:                       return "Unknown";
    }
}

/**
 * @brief One structural difference between declared and live schema
 *
 * table carries the owning table (complete definition for ADD_TABLE,
 * identity only otherwise). column / previous_column are set for column
 * changes, index for index changes. An ADD_INDEX with previous_index set
 * drops the live index of the same name first, so it counts as destructive.
 * ALTER_PRIMARY_KEY carries both key column lists and is always blocked.
 */
struct SchemaChange {
    ChangeKind kind = ChangeKind::ADD_TABLE;
    TableDefinition table;
    ColumnDefinition column;
    std::optional<ColumnDefinition> previous_column;
    IndexDefinition index;
    std::optional<IndexDefinition> previous_index;   // ADD_INDEX replacing a redefined index
    std::vector<std::string> primary_key;
    std::vector<std::string> previous_primary_key;

    // Change that cannot be applied without a data migration
    bool blocked = false;
    std::string blocked_reason;

    [[nodiscard]] bool is_destructive() const {
        return kind == ChangeKind::DROP_TABLE || kind == ChangeKind::DROP_COLUMN
            || kind == ChangeKind::DROP_INDEX || kind == ChangeKind::ALTER_PRIMARY_KEY
            || (kind == ChangeKind::ADD_INDEX && previous_index.has_value());
    }

    /**
     * @brief Column or index name the change is about ("" for table changes)
     */
    [[nodiscard]] std::string subject() const {
        switch (kind) {
            case ChangeKind::ADD_COLUMN:
            case ChangeKind::ALTER_COLUMN:
            case ChangeKind::DROP_COLUMN:
                return column.name;
            case ChangeKind::ADD_INDEX:
            case ChangeKind::DROP_INDEX:
                return index.name;
            case ChangeKind::ALTER_PRIMARY_KEY:
                return "PRIMARY KEY";
            default:
                return "";
        }
    }

    [[nodiscard]] std::string describe() const {
        const auto s = subject();
        if (s.empty()) {
            return std::string(change_kind_to_string(kind)) + " " + table.qualified_name();
        }
        return std::string(change_kind_to_string(kind)) + " " + table.qualified_name() + "." + s;
    }
};

} // namespace tempo
