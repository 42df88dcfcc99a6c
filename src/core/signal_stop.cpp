#include "core/signal_stop.hpp"
#include "core/utils.hpp"
#include <format>

namespace tempo {

volatile std::sig_atomic_t SignalStop::pending_ = 0;

void SignalStop::handle(int signal) {
    pending_ = signal;
}

SignalStop::SignalStop(std::initializer_list<int> signals, std::chrono::milliseconds poll_interval)
    : signals_(signals) {
    pending_ = 0;
    for (const int signal : signals_) {
        std::signal(signal, &SignalStop::handle);
    }

    watcher_ = std::jthread([this, poll_interval](std::stop_token st) {
        while (!st.stop_requested()) {
            if (const int signal = pending_; signal != 0) {
                received_.store(signal);
                utils::log::warn(std::format("Received signal {}, cancelling...", signal));
                stop_.request_stop();
                return;
            }
            std::this_thread::sleep_for(poll_interval);
        }
    });
}

SignalStop::~SignalStop() {
    for (const int signal : signals_) {
        std::signal(signal, SIG_DFL);
    }
}

} // namespace tempo
