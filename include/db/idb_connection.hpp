#pragma once

#include "core/column_type.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <optional>

namespace tempo {

/**
 * @brief A single statement parameter in text form; std::nullopt binds SQL NULL
 */
using DbParam = std::optional<std::string>;

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute() / execute_params().
 * Owns the result data (copied from native result handles).
 * SQL NULL is kept distinct from the empty string.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sql_state;
    std::string constraint_name;   // violated constraint or index, if any

    // For SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<std::optional<std::string>>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    /**
     * @brief Index of a result column by name, -1 if absent
     */
    [[nodiscard]] int column_index(const std::string& name) const {
        for (size_t i = 0; i < column_names.size(); ++i) {
            if (column_names[i] == name) return static_cast<int>(i);
        }
        return -1;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement without parameters
     * @param sql SQL text
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a statement with positional parameters ($1, $2, ...)
     * @param sql SQL text with placeholders
     * @param params One text value (or NULL) per placeholder
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql, const std::vector<DbParam>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set query timeout for subsequent queries
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET statement_timeout = N
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace tempo
