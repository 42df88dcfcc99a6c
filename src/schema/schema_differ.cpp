#include "schema/schema_differ.hpp"
#include "schema/type_normalizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <tuple>

namespace tempo {

namespace {

/**
 * @brief Table identity without columns/indexes, for non-ADD_TABLE changes
 */
TableDefinition identity_of(const TableDefinition& table) {
    TableDefinition id;
    id.schema = table.schema;
    id.name = table.name;
    id.strategy = table.strategy;
    id.multi_tenant = table.multi_tenant;
    id.soft_delete = table.soft_delete;
    id.tenant_field = table.tenant_field;
    return id;
}

struct TypeParts {
    std::string base;
    std::vector<int> mods;
};

TypeParts split_type(const std::string& normalized) {
    TypeParts parts;
    const auto open = normalized.find('(');
    const auto close = open == std::string::npos ? open : normalized.find(')', open);
    if (close == std::string::npos) {
        parts.base = normalized;
        return parts;
    }
    parts.base = normalized.substr(0, open) + normalized.substr(close + 1);
    for (const auto& m : utils::split(normalized.substr(open + 1, close - open - 1), ',')) {
        if (auto v = utils::try_parse_int<int>(utils::trim(m))) parts.mods.push_back(*v);
    }
    return parts;
}

std::vector<std::string> primary_key_of(const TableDefinition& table) {
    std::vector<std::string> key;
    for (const auto& c : table.columns) {
        if (c.primary_key) key.push_back(c.name);
    }
    return key;
}

std::string key_list(const std::vector<std::string>& key) {
    return key.empty() ? "none" : "(" + utils::join(key, ", ") + ")";
}

int integer_rank(const std::string& base) {
    if (base == "smallint") return 1;
    if (base == "integer") return 2;
    if (base == "bigint") return 3;
    return 0;
}

} // anonymous namespace

// ============================================================================
// Widening rules
// ============================================================================

bool SchemaDiffer::is_widening(const std::string& from, const std::string& to) {
    if (from == to) return true;

    const auto f = split_type(from);
    const auto t = split_type(to);

    const int fr = integer_rank(f.base);
    const int tr = integer_rank(t.base);
    if (fr > 0 && tr > 0) return tr >= fr;

    if (f.base == "real" && t.base == "double precision") return true;

    if ((f.base == "varchar" || f.base == "char") && t.base == "text") return true;
    if (f.base == "varchar" && t.base == "varchar") {
        if (t.mods.empty()) return true;
        if (f.mods.empty()) return false;
        return t.mods[0] >= f.mods[0];
    }
    if (f.base == "char" && t.base == "varchar") {
        if (t.mods.empty()) return true;
        return !f.mods.empty() && t.mods[0] >= f.mods[0];
    }

    if (f.base == "numeric" && t.base == "numeric") {
        if (t.mods.empty()) return true;
        if (f.mods.empty()) return false;
        const int f_scale = f.mods.size() > 1 ? f.mods[1] : 0;
        const int t_scale = t.mods.size() > 1 ? t.mods[1] : 0;
        return t_scale >= f_scale && (t.mods[0] - t_scale) >= (f.mods[0] - f_scale);
    }

    if (f.base == "json" && t.base == "jsonb") return true;

    return false;
}

std::optional<std::string> SchemaDiffer::alter_block_reason(
    const ColumnDefinition& live, const ColumnDefinition& declared) {

    const auto from = TypeNormalizer::normalize_column(live);
    const auto to = TypeNormalizer::normalize_column(declared);

    if (!is_widening(from.native_type, to.native_type)) {
        return std::format("type change {} -> {} requires a data migration",
                           from.native_type, to.native_type);
    }
    if (from.nullable && !to.nullable) {
        return "NULL -> NOT NULL requires a backfill of existing rows";
    }
    return std::nullopt;
}

// ============================================================================
// Diff
// ============================================================================

void SchemaDiffer::diff_table(const TableDefinition& declared, const TableDefinition& live,
                              std::vector<SchemaChange>& out) {
    const auto table_id = identity_of(declared);

    // ===== Columns =====
    for (const auto& col : declared.columns) {
        const auto* existing = live.find_column(col.name);
        if (!existing) {
            SchemaChange change;
            change.kind = ChangeKind::ADD_COLUMN;
            change.table = table_id;
            change.column = col;
            out.push_back(std::move(change));
            continue;
        }
        if (TypeNormalizer::columns_equal(col, *existing)) continue;

        SchemaChange change;
        change.kind = ChangeKind::ALTER_COLUMN;
        change.table = table_id;
        change.column = col;
        change.previous_column = *existing;
        if (auto reason = alter_block_reason(*existing, col)) {
            change.blocked = true;
            change.blocked_reason = std::move(*reason);
        }
        out.push_back(std::move(change));
    }

    for (const auto& col : live.columns) {
        if (declared.has_column(col.name)) continue;
        SchemaChange change;
        change.kind = ChangeKind::DROP_COLUMN;
        change.table = table_id;
        change.column = col;
        out.push_back(std::move(change));
    }

    // ===== Primary key =====
    auto declared_key = primary_key_of(declared);
    auto live_key = primary_key_of(live);
    auto declared_set = declared_key;
    auto live_set = live_key;
    std::sort(declared_set.begin(), declared_set.end());
    std::sort(live_set.begin(), live_set.end());
    if (declared_set != live_set) {
        SchemaChange change;
        change.kind = ChangeKind::ALTER_PRIMARY_KEY;
        change.table = table_id;
        change.primary_key = std::move(declared_key);
        change.previous_primary_key = std::move(live_key);
        change.blocked = true;
        change.blocked_reason = std::format("primary key change {} -> {} requires migration",
            key_list(change.previous_primary_key), key_list(change.primary_key));
        out.push_back(std::move(change));
    }

    // ===== Indexes =====
    std::map<std::string, const IndexDefinition*> live_indexes;
    for (const auto& idx : live.indexes) {
        live_indexes[TypeNormalizer::normalize_index(idx).name] = &idx;
    }

    std::map<std::string, bool> declared_names;
    for (const auto& idx : declared.indexes) {
        const auto name = TypeNormalizer::normalize_index(idx).name;
        declared_names[name] = true;

        auto it = live_indexes.find(name);
        if (it != live_indexes.end() && TypeNormalizer::indexes_equal(idx, *it->second)) {
            continue;
        }

        SchemaChange change;
        change.kind = ChangeKind::ADD_INDEX;
        change.table = table_id;
        change.index = idx;
        change.index.table = declared.name;
        if (it != live_indexes.end()) {
            change.previous_index = *it->second;
        }
        out.push_back(std::move(change));
    }

    for (const auto& [name, idx] : live_indexes) {
        if (declared_names.contains(name)) continue;
        SchemaChange change;
        change.kind = ChangeKind::DROP_INDEX;
        change.table = table_id;
        change.index = *idx;
        out.push_back(std::move(change));
    }
}

std::vector<SchemaChange> SchemaDiffer::diff(
    const std::vector<TableDefinition>& declared,
    const std::vector<TableDefinition>& introspected) {

    std::map<std::string, const TableDefinition*> live;
    for (const auto& t : introspected) {
        live[t.qualified_name()] = &t;
    }

    std::vector<SchemaChange> changes;
    std::map<std::string, bool> seen;

    for (const auto& table : declared) {
        const auto key = table.qualified_name();
        if (seen.contains(key)) continue;
        seen[key] = true;

        auto it = live.find(key);
        if (it == live.end()) {
            SchemaChange change;
            change.kind = ChangeKind::ADD_TABLE;
            change.table = table;
            changes.push_back(std::move(change));
            continue;
        }
        diff_table(table, *it->second, changes);
    }

    for (const auto& [key, table] : live) {
        if (seen.contains(key)) continue;
        SchemaChange change;
        change.kind = ChangeKind::DROP_TABLE;
        change.table = *table;
        changes.push_back(std::move(change));
    }

    std::stable_sort(changes.begin(), changes.end(),
        [](const SchemaChange& a, const SchemaChange& b) {
            return std::make_tuple(a.table.qualified_name(), a.kind, a.subject())
                 < std::make_tuple(b.table.qualified_name(), b.kind, b.subject());
        });

    return changes;
}

} // namespace tempo
