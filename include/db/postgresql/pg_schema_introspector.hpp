#pragma once

#include "db/ischema_introspector.hpp"
#include <optional>

namespace tempo {

/**
 * @brief PostgreSQL schema introspector
 *
 * Columns come from information_schema.columns (base tables only),
 * primary keys and secondary indexes from pg_index / pg_class, with the
 * partial-index predicate rendered by pg_get_expr().
 */
class PgSchemaIntrospector : public ISchemaIntrospector {
public:
    ~PgSchemaIntrospector() override = default;

    [[nodiscard]] std::vector<TableDefinition> introspect(
        DbSession& session, const std::vector<std::string>& schemas) override;

    /**
     * @brief Compose the catalog spelling of a column type
     *
     * ("character varying", 255) -> "character varying(255)",
     * ("numeric", p, s) -> "numeric(p,s)", ("ARRAY", udt "_text") -> "_text".
     */
    [[nodiscard]] static std::string compose_native_type(
        const std::string& data_type, const std::string& udt_name,
        const std::optional<int>& char_length,
        const std::optional<int>& numeric_precision,
        const std::optional<int>& numeric_scale);
};

} // namespace tempo
