#pragma once

#include "db/circuit_breaker.hpp"
#include "db/idb_connection.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace tempo {

class PooledConnection;

/**
 * @brief Sizing and upkeep of the shared connection pool ([database] in tempo.toml)
 */
struct PoolConfig {
    std::string connection_string;                    // libpq conninfo, ${ENV} already expanded
    size_t min_connections = 2;                       // opened eagerly
    size_t max_connections = 10;                      // hard cap on concurrent leases
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};   // re-check idle connections past this
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};          // 0 keeps connections forever
    bool circuit_breaker_enabled = true;              // guards connection establishment
    CircuitBreaker::Config circuit_breaker;
};

/**
 * @brief Counters reported by get_stats()
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;    // closed after max_lifetime
    size_t connections_discarded = 0;   // lease came back broken
    size_t circuit_rejections = 0;      // connects refused while the breaker was open
    CircuitState circuit_state = CircuitState::CLOSED;
};

/**
 * @brief Opens native connections for a pool
 *
 * PgConnectionFactory in production; the test suite plugs in a scripted one.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @return Open connection, or nullptr when the server is unreachable
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

/**
 * @brief Connection pool shared by SchemaManager and every repository
 *
 * The application owns it and passes it in by reference. One DbSession
 * holds one lease for the length of an operation; a lease marked broken
 * (failed ROLLBACK, lost server) is closed on release instead of reused.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Block until a connection is free or @p timeout passes
     * @return Lease that returns itself on destruction, nullptr on timeout or connect failure
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close idle connections and refuse new leases
     */
    virtual void drain() = 0;

    /// Name used in log lines and pool-exhaustion errors
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace tempo
