#pragma once

#include "core/error.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>

namespace tempo {

/**
 * @brief Deadline and cancellation signal for one I/O-bound call
 *
 * Default-constructed: no deadline, never cancelled.
 */
struct CallContext {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::stop_token stop;

    [[nodiscard]] static CallContext with_timeout(std::chrono::milliseconds timeout) {
        CallContext ctx;
        ctx.deadline = std::chrono::steady_clock::now() + timeout;
        return ctx;
    }

    [[nodiscard]] bool cancelled() const {
        if (stop.stop_requested()) return true;
        return deadline && std::chrono::steady_clock::now() >= *deadline;
    }

    /**
     * @brief Milliseconds left before the deadline (nullopt = unbounded, min 1)
     */
    [[nodiscard]] std::optional<uint32_t> remaining_ms() const {
        if (!deadline) return std::nullopt;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - std::chrono::steady_clock::now()).count();
        return static_cast<uint32_t>(std::clamp<long long>(left, 1, UINT32_MAX));
    }

    /**
     * @brief Throw CANCELLED if the call must stop now
     */
    void check(const std::string& table, const std::string& operation) const {
        if (stop.stop_requested()) {
            throw EngineError(ErrorCategory::CANCELLED, "operation cancelled",
                {table, "", operation});
        }
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            throw EngineError(ErrorCategory::CANCELLED, "deadline exceeded",
                {table, "", operation});
        }
    }
};

} // namespace tempo
