#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <initializer_list>
#include <stop_token>
#include <thread>
#include <vector>

namespace tempo {

/**
 * @brief Turns process signals into a stop request
 *
 * The installed handler only stores the signal number in a sig_atomic_t.
 * A watcher thread polls it, logs, and requests the stop, so no lock or
 * allocation ever happens inside the handler. One instance per process;
 * the destructor restores the default dispositions.
 */
class SignalStop {
public:
    explicit SignalStop(std::initializer_list<int> signals = {SIGINT, SIGTERM},
                        std::chrono::milliseconds poll_interval = std::chrono::milliseconds{50});
    ~SignalStop();

    SignalStop(const SignalStop&) = delete;
    SignalStop& operator=(const SignalStop&) = delete;

    [[nodiscard]] std::stop_token token() const { return stop_.get_token(); }

    /// Signal that triggered the stop, 0 while none arrived
    [[nodiscard]] int received() const { return received_.load(); }

private:
    static void handle(int signal);

    static volatile std::sig_atomic_t pending_;

    std::vector<int> signals_;
    std::stop_source stop_;
    std::atomic<int> received_{0};
    std::jthread watcher_;   // last: joined before the members it reads go away
};

} // namespace tempo
