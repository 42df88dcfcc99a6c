#pragma once

#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace tempo {

/**
 * @brief Bounded connection pool over any IConnectionFactory
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Pre-warmed to min_connections, grown lazily up to max
 * - Health check only for connections idle longer than idle_timeout
 * - max_lifetime recycling
 * - Connections returned broken are closed, never reused
 * - Circuit breaker on connection establishment: while the server keeps
 *   refusing connects, acquire fails fast instead of dialing again
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param db_name Database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    /**
     * @brief Open a connection through the circuit breaker
     * @return nullptr if the factory failed or the breaker refused the attempt
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Close a connection and forget its bookkeeping
     */
    void retire(std::unique_ptr<IDbConnection>& conn);

    /**
     * @brief Called by PooledConnection on destruction
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;
    std::unique_ptr<CircuitBreaker> circuit_breaker_;   // null when disabled

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> connections_discarded_{0};
    std::atomic<size_t> circuit_rejections_{0};

    std::atomic<bool> shutdown_{false};

    // Guarded by mutex_
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
};

} // namespace tempo
