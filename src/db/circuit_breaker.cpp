#include "db/circuit_breaker.hpp"
#include "core/utils.hpp"
#include <format>

namespace tempo {

namespace {

std::chrono::system_clock::time_point from_rep(std::chrono::system_clock::time_point::rep rep) {
    return std::chrono::system_clock::time_point(std::chrono::system_clock::time_point::duration(rep));
}

} // anonymous namespace

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config),
      state_(CircuitState::CLOSED),
      success_count_(0),
      failure_count_(0),
      half_open_calls_(0),
      last_failure_time_(0),
      opened_time_(0) {}

bool CircuitBreaker::allow_request() {
    switch (state_.load(std::memory_order_acquire)) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now() - from_rep(opened_time_.load(std::memory_order_acquire)));
            if (elapsed < config_.timeout) {
                rejected_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            attempt_reset();
        }
            // The caller becomes one of the HALF_OPEN test calls
            [[fallthrough]];

        case CircuitState::HALF_OPEN: {
            const uint64_t calls = half_open_calls_.fetch_add(1, std::memory_order_acq_rel);
            if (calls >= config_.half_open_max_calls) {
                half_open_calls_.fetch_sub(1, std::memory_order_acq_rel);
                rejected_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            return true;
        }
    }

    return false;
}

void CircuitBreaker::record_success() {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    if (current_state == CircuitState::HALF_OPEN) {
        half_open_calls_.fetch_sub(1, std::memory_order_acq_rel);
        const uint64_t successes = success_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (successes >= config_.success_threshold) {
            close_circuit();
        }
    } else if (current_state == CircuitState::CLOSED) {
        // Only consecutive failures count
        failure_count_.store(0, std::memory_order_relaxed);
    }
}

void CircuitBreaker::record_failure() {
    last_failure_time_.store(std::chrono::system_clock::now().time_since_epoch().count(),
                             std::memory_order_release);

    const CircuitState current_state = state_.load(std::memory_order_acquire);
    if (current_state == CircuitState::HALF_OPEN) {
        half_open_calls_.fetch_sub(1, std::memory_order_acq_rel);
        trip();
    } else if (current_state == CircuitState::CLOSED) {
        const uint64_t failures = failure_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (failures >= config_.failure_threshold) {
            trip();
        }
    }
}

CircuitState CircuitBreaker::get_state() const {
    return state_.load(std::memory_order_acquire);
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    CircuitBreakerStats stats;
    stats.state = state_.load(std::memory_order_acquire);
    stats.success_count = success_count_.load(std::memory_order_relaxed);
    stats.failure_count = failure_count_.load(std::memory_order_relaxed);
    stats.rejected_count = rejected_count_.load(std::memory_order_relaxed);

    const auto last_failure_rep = last_failure_time_.load(std::memory_order_acquire);
    if (last_failure_rep > 0) stats.last_failure = from_rep(last_failure_rep);

    const auto opened_rep = opened_time_.load(std::memory_order_acquire);
    if (opened_rep > 0) stats.opened_at = from_rep(opened_rep);

    return stats;
}

void CircuitBreaker::reset() {
    const auto previous = state_.exchange(CircuitState::CLOSED, std::memory_order_acq_rel);
    success_count_.store(0, std::memory_order_relaxed);
    failure_count_.store(0, std::memory_order_relaxed);
    half_open_calls_.store(0, std::memory_order_relaxed);
    last_failure_time_.store(0, std::memory_order_relaxed);
    opened_time_.store(0, std::memory_order_relaxed);
    if (previous != CircuitState::CLOSED) {
        emit_transition(previous, CircuitState::CLOSED);
    }
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(callback_mutex_);
    on_state_change_ = std::move(cb);
}

void CircuitBreaker::trip() {
    for (const auto from : {CircuitState::CLOSED, CircuitState::HALF_OPEN}) {
        CircuitState expected = from;
        if (state_.compare_exchange_strong(expected, CircuitState::OPEN,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
            opened_time_.store(std::chrono::system_clock::now().time_since_epoch().count(),
                               std::memory_order_release);
            emit_transition(from, CircuitState::OPEN);
            return;
        }
    }
}

void CircuitBreaker::attempt_reset() {
    CircuitState expected = CircuitState::OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::HALF_OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        success_count_.store(0, std::memory_order_relaxed);
        failure_count_.store(0, std::memory_order_relaxed);
        half_open_calls_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::OPEN, CircuitState::HALF_OPEN);
    }
}

void CircuitBreaker::close_circuit() {
    CircuitState expected = CircuitState::HALF_OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::CLOSED,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        success_count_.store(0, std::memory_order_relaxed);
        failure_count_.store(0, std::memory_order_relaxed);
        half_open_calls_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::HALF_OPEN, CircuitState::CLOSED);
    }
}

void CircuitBreaker::emit_transition(CircuitState from, CircuitState to) {
    const auto message = std::format("Circuit breaker '{}': {} -> {}", name_,
                                     circuit_state_to_string(from), circuit_state_to_string(to));
    if (to == CircuitState::OPEN) {
        utils::log::warn(message);
    } else {
        utils::log::info(message);
    }

    std::function<void(const StateChangeEvent&)> cb;
    {
        std::lock_guard lock(callback_mutex_);
        cb = on_state_change_;
    }
    if (cb) {
        cb(StateChangeEvent{from, to, std::chrono::system_clock::now(), name_});
    }
}

} // namespace tempo
