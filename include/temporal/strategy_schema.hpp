#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace tempo {

namespace managed {
inline constexpr std::string_view kId         = "id";
inline constexpr std::string_view kCreatedAt  = "created_at";
inline constexpr std::string_view kUpdatedAt  = "updated_at";
inline constexpr std::string_view kCreatedBy  = "created_by";
inline constexpr std::string_view kUpdatedBy  = "updated_by";
inline constexpr std::string_view kDeletedAt  = "deleted_at";
inline constexpr std::string_view kDeletedBy  = "deleted_by";
inline constexpr std::string_view kVersion    = "version";
inline constexpr std::string_view kValidFrom  = "valid_from";
inline constexpr std::string_view kValidTo    = "valid_to";
} // namespace managed

namespace audit_column {
inline constexpr std::string_view kAuditId       = "audit_id";
inline constexpr std::string_view kRecordId      = "record_id";
inline constexpr std::string_view kFieldName     = "field_name";
inline constexpr std::string_view kOldValue      = "old_value";
inline constexpr std::string_view kNewValue      = "new_value";
inline constexpr std::string_view kOperation     = "operation";
inline constexpr std::string_view kChangedAt     = "changed_at";
inline constexpr std::string_view kChangedBy     = "changed_by";
inline constexpr std::string_view kTransactionId = "transaction_id";
inline constexpr std::string_view kMetadata      = "metadata";
} // namespace audit_column

namespace audit_op {
inline constexpr std::string_view kInsert = "insert";
inline constexpr std::string_view kUpdate = "update";
inline constexpr std::string_view kDelete = "delete";
} // namespace audit_op

/**
 * @brief Columns and indexes a versioning strategy adds to a declared table
 *
 * augment() is the single place that turns application metadata into the
 * physical table: bookkeeping columns (id, timestamps, actors), tenant and
 * soft-delete columns, scd2 version/validity columns, their indexes, and
 * the dialect spelling of every column. Repositories and SchemaManager both
 * work on the augmented definition.
 */
class StrategySchema {
public:
    /**
     * @brief Declared table plus strategy-managed columns and indexes
     * @throws EngineError UNSUPPORTED_TYPE if a column has no type mapping
     */
    [[nodiscard]] static TableDefinition augment(const TableDefinition& declared);

    /**
     * @brief "{table}_audit" for copy_on_change tables
     */
    [[nodiscard]] static std::string audit_table_name(const TableDefinition& table);

    /**
     * @brief Fixed-layout audit table for a copy_on_change table
     */
    [[nodiscard]] static TableDefinition audit_table_for(const TableDefinition& table);

    /**
     * @brief True for columns written by the repository, not the caller
     */
    [[nodiscard]] static bool is_managed_column(const TableDefinition& table, std::string_view column);

    /**
     * @brief Generated index name, cut to the identifier length limit
     */
    [[nodiscard]] static std::string index_name(const std::string& table, const std::string& suffix);
};

} // namespace tempo
