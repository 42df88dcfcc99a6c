#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace tempo {

/**
 * @brief RAII lease of a pooled database connection
 *
 * Returns the connection to the pool on destruction. A lease marked broken
 * (e.g. a ROLLBACK failed, so the session state is unknown) is handed back
 * with reusable=false and the pool closes it instead of recycling it.
 * Move-only.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }
    IDbConnection& operator*() const { return *conn_; }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Do not put this connection back into the idle set
     */
    void mark_broken() { broken_ = true; }
    [[nodiscard]] bool is_broken() const { return broken_; }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace tempo
