#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace tempo {

enum class CircuitState : uint8_t {
    CLOSED,
    OPEN,
    HALF_OPEN
};

[[nodiscard]] inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default:                      return "UNKNOWN";
    }
}

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
    uint64_t rejected_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure;
    std::optional<std::chrono::system_clock::time_point> opened_at;
};

/**
 * @brief Emitted on every state transition
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

/**
 * @brief Circuit breaker around connection establishment
 *
 * Three states:
 * - CLOSED:     Normal operation, connects go through
 * - OPEN:       Server considered down, connects are refused without a round trip
 * - HALF_OPEN:  Testing recovery, a limited number of connects allowed
 *
 * State transitions:
 * - CLOSED -> OPEN:      consecutive failures >= failure_threshold
 * - OPEN -> HALF_OPEN:   timeout elapsed (checked by the next allow_request)
 * - HALF_OPEN -> CLOSED: successes >= success_threshold
 * - HALF_OPEN -> OPEN:   any failure
 */
class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold;     // Failures to trip OPEN
        uint32_t success_threshold;     // Successes to close from HALF_OPEN
        std::chrono::milliseconds timeout;  // Time before trying HALF_OPEN
        uint32_t half_open_max_calls;   // Max concurrent calls in HALF_OPEN

        Config()
            : failure_threshold(5),
              success_threshold(2),
              timeout(5000),
              half_open_max_calls(1) {}
    };

    explicit CircuitBreaker(std::string name, const Config& config = Config());

    /**
     * @brief Check if a connect may proceed
     * @return true if allowed, false if the circuit is open
     */
    [[nodiscard]] bool allow_request();

    void record_success();
    void record_failure();

    [[nodiscard]] CircuitState get_state() const;
    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Force reset to CLOSED state
     */
    void reset();

    [[nodiscard]] const std::string& name() const { return name_; }

    /**
     * @brief Register callback for state transitions
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

private:
    void trip();
    void attempt_reset();
    void close_circuit();
    void emit_transition(CircuitState from, CircuitState to);

    std::string name_;
    Config config_;

    std::atomic<CircuitState> state_;
    std::atomic<uint64_t> success_count_;
    std::atomic<uint64_t> failure_count_;
    std::atomic<uint64_t> half_open_calls_;
    std::atomic<uint64_t> rejected_count_{0};

    std::atomic<std::chrono::system_clock::time_point::rep> last_failure_time_;
    std::atomic<std::chrono::system_clock::time_point::rep> opened_time_;

    std::function<void(const StateChangeEvent&)> on_state_change_;
    mutable std::mutex callback_mutex_;
};

} // namespace tempo
