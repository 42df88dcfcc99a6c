#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace tempo {

class DbSession;

/**
 * @brief Reads the live schema back as TableDefinitions
 *
 * Each backend queries its own catalog (information_schema + pg_catalog
 * for PostgreSQL). Introspected tables carry no strategy; columns carry
 * the catalog's type spelling in native_type.
 */
class ISchemaIntrospector {
public:
    virtual ~ISchemaIntrospector() = default;

    /**
     * @brief Load tables, columns and secondary indexes of the given schemas
     * @param session Leased connection for the call
     * @param schemas Schema names to read (e.g. {"public"})
     * @return Tables sorted by qualified name
     * @throws EngineError on catalog query failure
     */
    [[nodiscard]] virtual std::vector<TableDefinition> introspect(
        DbSession& session, const std::vector<std::string>& schemas) = 0;
};

} // namespace tempo
