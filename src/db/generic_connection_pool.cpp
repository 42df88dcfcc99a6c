#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace tempo {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      circuit_breaker_(config.circuit_breaker_enabled
          ? std::make_unique<CircuitBreaker>(db_name_, config.circuit_breaker)
          : nullptr),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            const auto now = std::chrono::steady_clock::now();
            created_at_[conn.get()] = now;
            last_used_[conn.get()] = now;
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for database '{}'", i + 1, db_name_));
        }
    }

    utils::log::info(std::format("ConnectionPool initialized for database '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Shutdown may have been set while waiting for the slot
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (conn) {
                const auto it = created_at_.find(conn.get());
                if (it != created_at_.end()) birth = it->second;
                const auto lu = last_used_.find(conn.get());
                if (lu != last_used_.end()) last_used = lu->second;
            }
        }
    }

    const auto replace = [this](std::unique_ptr<IDbConnection>& c) -> bool {
        c = create_connection();
        if (!c) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        created_at_[c.get()] = now;
        last_used_[c.get()] = now;
        return true;
    };

    if (!conn) {
        if (!replace(conn)) return nullptr;
        birth = std::chrono::steady_clock::now();
        last_used = birth;
    }

    // Recycle connections older than max_lifetime
    if (config_.max_lifetime.count() > 0) {
        const auto age = std::chrono::steady_clock::now() - birth;
        if (age > config_.max_lifetime) {
            retire(conn);
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            if (!replace(conn)) return nullptr;
            last_used = std::chrono::steady_clock::now();
        }
    }

    // Only health-check connections that sat idle longer than idle_timeout
    const auto idle_duration = std::chrono::steady_clock::now() - last_used;
    if (idle_duration > config_.idle_timeout) {
        if (!conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            retire(conn);
            if (!replace(conn)) return nullptr;
        }
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool reusable) {
        this->return_connection(std::move(c), reusable);
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_discarded = connections_discarded_.load(std::memory_order_relaxed);
    stats.circuit_rejections = circuit_rejections_.load(std::memory_order_relaxed);
    if (circuit_breaker_) stats.circuit_state = circuit_breaker_->get_state();
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();
    created_at_.clear();
    last_used_.clear();

    utils::log::info(std::format("ConnectionPool drained for database '{}'", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    if (circuit_breaker_ && !circuit_breaker_->allow_request()) {
        circuit_rejections_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    auto conn = factory_->create(config_.connection_string);
    if (circuit_breaker_) {
        if (conn) {
            circuit_breaker_->record_success();
        } else {
            circuit_breaker_->record_failure();
        }
    }
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    }
    return conn;
}

void GenericConnectionPool::retire(std::unique_ptr<IDbConnection>& conn) {
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    conn.reset();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire) || !reusable) {
        if (!reusable) {
            connections_discarded_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Discarding broken connection for database '{}'", db_name_));
        }
        retire(conn);
        semaphore_.release();
        return;
    }

    // No health check on return; stale connections are caught on acquire
    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace tempo
