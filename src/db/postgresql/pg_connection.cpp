#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace tempo {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        DbResultSet rs;
        rs.error_message = "Connection is null";
        rs.sql_state = std::string(db::kConnectionDoesNotExist);
        return rs;
    }

    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<DbParam>& params) {
    if (!conn_) {
        DbResultSet rs;
        rs.error_message = "Connection is null";
        rs.sql_state = std::string(db::kConnectionDoesNotExist);
        return rs;
    }

    // Text-format parameters; a null pointer binds SQL NULL
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    const int nparams = static_cast<int>(params.size());
    PGresult* res = PQexecParams(
        conn_,
        sql.c_str(),
        nparams,
        nullptr,                                // let server infer types
        nparams ? values.data() : nullptr,
        nullptr,                                // text params need no lengths
        nullptr,                                // all text format
        0);                                     // text results

    return consume_result(res);
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        DbResultSet rs;
        rs.error_message = PQerrorMessage(conn_);
        rs.sql_state = std::string(db::kConnectionFailure);
        return rs;
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    DbResultSet rs;
    rs.error_message = PQresultErrorMessage(res);
    if (rs.error_message.empty()) {
        rs.error_message = PQerrorMessage(conn_);
    }
    const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    if (state) {
        rs.sql_state = state;
    }
    if (const char* constraint = PQresultErrorField(res, PG_DIAG_CONSTRAINT_NAME)) {
        rs.constraint_name = constraint;
    }
    // Errors raised by libpq itself (server gone) carry no SQLSTATE
    if (rs.sql_state.empty() && PQstatus(conn_) == CONNECTION_BAD) {
        rs.sql_state = std::string(db::kConnectionFailure);
    }
    PQclear(res);
    return rs;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));

        const Oid type_oid = PQftype(res, i);
        result.column_types.emplace_back(
            PgTypeMap::oid_to_logical_type(static_cast<uint32_t>(type_oid)),
            static_cast<uint32_t>(type_oid), "");
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::optional<std::string>> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                                             static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    // INSERT/UPDATE ... RETURNING also reports a command tag
    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace tempo
