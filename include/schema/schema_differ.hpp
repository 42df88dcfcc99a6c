#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tempo {

/**
 * @brief Structural diff between declared and introspected tables
 *
 * Tables are matched by qualified name, columns and indexes by name, and
 * equality goes through TypeNormalizer. Live-only tables, columns and
 * indexes are reported as drop candidates; gating them is the caller's job.
 *
 * Output is sorted by table name, then ChangeKind, then column/index name,
 * so identical inputs always produce identical change lists.
 */
class SchemaDiffer {
public:
    [[nodiscard]] static std::vector<SchemaChange> diff(
        const std::vector<TableDefinition>& declared,
        const std::vector<TableDefinition>& introspected);

    /**
     * @brief Why an ALTER COLUMN from live to declared cannot be applied
     * @return Reason text, or std::nullopt if the change only widens
     *
     * Widening: smallint/integer -> bigint, real -> double precision,
     * varchar(n) -> varchar(m >= n) or text, numeric precision growth,
     * NOT NULL -> NULL, default changes.
     */
    [[nodiscard]] static std::optional<std::string> alter_block_reason(
        const ColumnDefinition& live, const ColumnDefinition& declared);

private:
    static void diff_table(const TableDefinition& declared, const TableDefinition& live,
                           std::vector<SchemaChange>& out);

    [[nodiscard]] static bool is_widening(const std::string& from, const std::string& to);
};

} // namespace tempo
