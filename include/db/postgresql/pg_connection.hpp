#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_pool.hpp"
#include <libpq-fe.h>
#include <string>

namespace tempo {

/**
 * @brief libpq-backed IDbConnection
 *
 * Parameters travel as text through PQexecParams; NULL cells and params stay
 * NULL. Failed results keep their SQLSTATE so DbSession can tell a
 * statement_timeout (57014) or unique violation (23505) from other errors.
 */
class PgConnection : public IDbConnection {
public:
    /// Takes ownership of an open PGconn
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql,
                               const std::vector<DbParam>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    // Copies out and PQclear()s the result
    DbResultSet consume_result(PGresult* res);

    DbResultSet process_tuples_result(PGresult* res);   // SELECT, RETURNING
    DbResultSet process_command_result(PGresult* res);  // DDL, DML without RETURNING

    PGconn* conn_;
};

/**
 * @brief Opens PgConnections with PQconnectdb; logs and returns nullptr on failure
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace tempo
