#pragma once

#include <atomic>

namespace skysync {
namespace runtime {

// SIGINT/SIGTERM set a flag polled by Runtime::run()
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace skysync
