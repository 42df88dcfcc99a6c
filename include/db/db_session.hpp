#pragma once

#include "core/call_context.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace tempo {

/**
 * @brief One leased connection bound to a CallContext
 *
 * Acquires from the injected pool (bounded by the call's deadline), pushes
 * the remaining time to the server as statement_timeout before every
 * statement, and checks for cancellation between statements. Failed
 * statements are raised as EngineError carrying the table/operation of the
 * call.
 */
class DbSession {
public:
    /**
     * @throws EngineError CANCELLED if the deadline passes while waiting,
     *         DATABASE_ERROR if no connection could be acquired
     */
    DbSession(IConnectionPool& pool, const CallContext& ctx,
              std::chrono::milliseconds acquire_timeout,
              std::string table, std::string operation);

    ~DbSession();

    DbSession(const DbSession&) = delete;
    DbSession& operator=(const DbSession&) = delete;

    /**
     * @brief Run a statement; throws EngineError on failure
     */
    DbResultSet run(const std::string& sql, const std::vector<DbParam>& params = {});

    /**
     * @brief Run a statement and hand back failures unthrown (sql_state set)
     *
     * Still throws CANCELLED when the call must stop before executing.
     */
    DbResultSet try_run(const std::string& sql, const std::vector<DbParam>& params = {});

    /**
     * @brief Cancellation check between steps of a unit of work
     */
    void checkpoint() const { ctx_.check(table_, operation_); }

    [[nodiscard]] const CallContext& context() const { return ctx_; }
    [[nodiscard]] const std::string& table() const { return table_; }
    [[nodiscard]] const std::string& operation() const { return operation_; }

    void mark_broken() { lease_->mark_broken(); }

private:
    friend class Transaction;

    void apply_timeout();

    /**
     * @brief Execute without cancellation check or timeout refresh (ROLLBACK)
     */
    DbResultSet try_run_unchecked(const std::string& sql);

    std::unique_ptr<PooledConnection> lease_;
    CallContext ctx_;
    std::string table_;
    std::string operation_;
    bool timeout_applied_ = false;
};

/**
 * @brief RAII transaction scope on a DbSession
 *
 * BEGIN in the constructor; ROLLBACK on destruction unless commit() ran.
 * A ROLLBACK that fails marks the lease broken so the pool drops it.
 */
class Transaction {
public:
    explicit Transaction(DbSession& session);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @throws EngineError if COMMIT fails (the transaction is then rolled back)
     */
    void commit();

    [[nodiscard]] bool active() const { return active_; }

private:
    DbSession& session_;
    bool active_ = false;
};

} // namespace tempo
