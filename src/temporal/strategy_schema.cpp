#include "temporal/strategy_schema.hpp"
#include "db/postgresql/pg_type_map.hpp"

#include <format>

namespace tempo {

namespace {

constexpr size_t kMaxIdentifierLength = 63;
constexpr const char* kNotDeleted = "deleted_at IS NULL";

ColumnDefinition make_column(std::string_view name, LogicalType type, bool nullable,
                             std::optional<std::string> default_value = std::nullopt) {
    ColumnDefinition col(std::string(name), type, nullable);
    col.default_value = std::move(default_value);
    col.native_type = PgTypeMap::native_type_for(col);
    return col;
}

void add_if_missing(TableDefinition& table, ColumnDefinition col) {
    if (!table.has_column(col.name)) {
        table.columns.push_back(std::move(col));
    }
}

void add_index_if_missing(TableDefinition& table, IndexDefinition idx) {
    if (!table.find_index(idx.name)) {
        table.indexes.push_back(std::move(idx));
    }
}

IndexDefinition make_index(const TableDefinition& table, const std::string& suffix,
                           std::vector<std::string> columns, bool unique = false,
                           std::optional<std::string> where = std::nullopt) {
    IndexDefinition idx;
    idx.name = StrategySchema::index_name(table.name, suffix);
    idx.table = table.name;
    idx.columns = std::move(columns);
    idx.unique = unique;
    idx.where = std::move(where);
    return idx;
}

} // anonymous namespace

std::string StrategySchema::index_name(const std::string& table, const std::string& suffix) {
    auto name = std::format("idx_{}_{}", table, suffix);
    if (name.size() > kMaxIdentifierLength) {
        name.resize(kMaxIdentifierLength);
    }
    return name;
}

std::string StrategySchema::audit_table_name(const TableDefinition& table) {
    return table.name + "_audit";
}

TableDefinition StrategySchema::augment(const TableDefinition& declared) {
    TableDefinition table;
    table.schema = declared.schema;
    table.name = declared.name;
    table.strategy = declared.strategy;
    table.multi_tenant = declared.multi_tenant;
    table.soft_delete = declared.soft_delete;
    table.tenant_field = declared.tenant_field;

    const bool scd2 = declared.strategy == VersioningStrategy::SCD2;

    // ===== Leading identity columns =====
    auto id = make_column(managed::kId, LogicalType::UUID, false);
    id.primary_key = true;
    table.columns.push_back(std::move(id));

    if (declared.multi_tenant) {
        table.columns.push_back(make_column(declared.tenant_field, LogicalType::UUID, false));
    }

    // ===== Application columns =====
    for (const auto& col : declared.columns) {
        if (table.has_column(col.name)) continue;
        auto resolved = col;
        if (resolved.native_type.empty()) {
            resolved.native_type = PgTypeMap::native_type_for(resolved);
        }
        resolved.primary_key = false;
        table.columns.push_back(std::move(resolved));
    }

    // ===== Bookkeeping columns =====
    add_if_missing(table, make_column(managed::kCreatedAt, LogicalType::TIMESTAMP, false, "NOW()"));
    add_if_missing(table, make_column(managed::kUpdatedAt, LogicalType::TIMESTAMP, false, "NOW()"));
    add_if_missing(table, make_column(managed::kCreatedBy, LogicalType::UUID, true));
    add_if_missing(table, make_column(managed::kUpdatedBy, LogicalType::UUID, true));

    if (declared.soft_delete) {
        add_if_missing(table, make_column(managed::kDeletedAt, LogicalType::TIMESTAMP, true));
        add_if_missing(table, make_column(managed::kDeletedBy, LogicalType::UUID, true));
    }

    if (scd2) {
        auto version = make_column(managed::kVersion, LogicalType::INTEGER, false, "1");
        version.primary_key = true;
        add_if_missing(table, std::move(version));
        add_if_missing(table, make_column(managed::kValidFrom, LogicalType::TIMESTAMP, false, "NOW()"));
        add_if_missing(table, make_column(managed::kValidTo, LogicalType::TIMESTAMP, true));
    }

    // ===== Indexes =====
    for (const auto& idx : declared.indexes) {
        auto copy = idx;
        copy.table = table.name;
        add_index_if_missing(table, std::move(copy));
    }

    if (declared.multi_tenant) {
        add_index_if_missing(table, make_index(table, declared.tenant_field,
            {declared.tenant_field}));
        add_index_if_missing(table, make_index(table, declared.tenant_field + "_created",
            {declared.tenant_field, std::string(managed::kCreatedAt)}, false,
            declared.soft_delete ? std::optional<std::string>(kNotDeleted) : std::nullopt));
    }

    if (declared.soft_delete) {
        add_index_if_missing(table, make_index(table, "not_deleted",
            {std::string(managed::kDeletedAt)}, false, kNotDeleted));
    }

    if (scd2) {
        add_index_if_missing(table, make_index(table, "valid_period",
            {std::string(managed::kValidFrom), std::string(managed::kValidTo)}));
        add_index_if_missing(table, make_index(table, "id_version",
            {std::string(managed::kId), std::string(managed::kVersion)}));
        // at most one open version per record
        add_index_if_missing(table, make_index(table, "current",
            {std::string(managed::kId)}, true, "valid_to IS NULL"));
    }

    return table;
}

TableDefinition StrategySchema::audit_table_for(const TableDefinition& source) {
    TableDefinition audit;
    audit.schema = source.schema;
    audit.name = audit_table_name(source);
    audit.strategy = VersioningStrategy::NONE;
    audit.multi_tenant = source.multi_tenant;
    audit.soft_delete = false;
    audit.tenant_field = source.tenant_field;

    auto audit_id = make_column(audit_column::kAuditId, LogicalType::UUID, false);
    audit_id.primary_key = true;
    audit.columns.push_back(std::move(audit_id));
    audit.columns.push_back(make_column(audit_column::kRecordId, LogicalType::UUID, false));
    if (source.multi_tenant) {
        audit.columns.push_back(make_column(source.tenant_field, LogicalType::UUID, false));
    }

    audit.columns.push_back(make_column(audit_column::kFieldName, LogicalType::STRING, false));

    audit.columns.push_back(make_column(audit_column::kOldValue, LogicalType::JSON, true));
    audit.columns.push_back(make_column(audit_column::kNewValue, LogicalType::JSON, true));

    ColumnDefinition operation(std::string(audit_column::kOperation), LogicalType::STRING, false);
    operation.max_length = 16;
    operation.native_type = PgTypeMap::native_type_for(operation);
    audit.columns.push_back(std::move(operation));

    audit.columns.push_back(make_column(audit_column::kChangedAt, LogicalType::TIMESTAMP, false, "NOW()"));
    audit.columns.push_back(make_column(audit_column::kChangedBy, LogicalType::UUID, true));
    audit.columns.push_back(make_column(audit_column::kTransactionId, LogicalType::UUID, true));
    audit.columns.push_back(make_column(audit_column::kMetadata, LogicalType::JSON, true));

    audit.indexes.push_back(make_index(audit, "changed_at",
        {std::string(audit_column::kChangedAt)}));
    audit.indexes.push_back(make_index(audit, "record_field",
        {std::string(audit_column::kRecordId), std::string(audit_column::kFieldName)}));
    if (source.multi_tenant) {
        audit.indexes.push_back(make_index(audit, source.tenant_field, {source.tenant_field}));
    }

    return audit;
}

bool StrategySchema::is_managed_column(const TableDefinition& table, std::string_view column) {
    if (column == managed::kId || column == managed::kCreatedAt || column == managed::kUpdatedAt
        || column == managed::kCreatedBy || column == managed::kUpdatedBy) {
        return true;
    }
    if (table.multi_tenant && column == table.tenant_field) return true;
    if (table.soft_delete && (column == managed::kDeletedAt || column == managed::kDeletedBy)) {
        return true;
    }
    if (table.strategy == VersioningStrategy::SCD2
        && (column == managed::kVersion || column == managed::kValidFrom
            || column == managed::kValidTo)) {
        return true;
    }
    return false;
}

} // namespace tempo
