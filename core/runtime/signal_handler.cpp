#include "signal_handler.hpp"

#include <csignal>

#include "logging/logger.hpp"

namespace skysync {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

void SignalHandler::install() {
    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART: blocking waits return early

    for (int signo : {SIGINT, SIGTERM}) {
        if (sigaction(signo, &action, nullptr) != 0) {
            LOG_WARN("[Runtime] Could not install handler for signal " << signo);
        }
    }

    // A dropped SSE client must not kill the process
    std::signal(SIGPIPE, SIG_IGN);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::handle_signal(int) {
    // Async-signal-safe: only atomic operations allowed
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace skysync
