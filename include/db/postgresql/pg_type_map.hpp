#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace tempo {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps between PG type names, OIDs and LogicalType, and renders the
 * dialect spelling of a declared column.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to LogicalType
     * @param oid PostgreSQL type OID
     * @return Logical type, UNKNOWN if unmapped
     */
    [[nodiscard]] static LogicalType oid_to_logical_type(uint32_t oid);

    /**
     * @brief Canonical spelling of a base type name (no modifiers)
     * @param type_name Lowercase, whitespace-collapsed type name ("int4",
     *        "character varying", "double", "_text")
     * @return Canonical name ("integer", "varchar", "double precision",
     *         "text[]"), or the input unchanged if it is not an alias
     */
    [[nodiscard]] static std::string canonical_type_name(const std::string& type_name);

    /**
     * @brief Logical type of a canonical base type name
     */
    [[nodiscard]] static LogicalType canonical_to_logical(const std::string& canonical);

    /**
     * @brief Dialect spelling for a declared column ("VARCHAR(255)", "NUMERIC(15,2)")
     * @throws EngineError UNSUPPORTED_TYPE for UNKNOWN logical types
     */
    [[nodiscard]] static std::string native_type_for(const ColumnDefinition& column);
};

} // namespace tempo
