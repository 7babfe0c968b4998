#pragma once

#include <atomic>

namespace tether {
namespace runtime {

// SIGINT/SIGTERM/SIGHUP request a host close. The handler only sets an atomic
// flag; HostRuntime::run() polls it.
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Clears a pending request (tests)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace tether
