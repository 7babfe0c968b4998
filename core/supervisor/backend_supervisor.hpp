#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "probe/i_liveness_prober.hpp"
#include "process/i_process_launcher.hpp"

namespace tether {
namespace supervisor {

// UNSTARTED -> RUNNING | RUNNING_UNMANAGED -> STOPPED (terminal).
// shutdown() on UNSTARTED is a no-op unless a start is in flight.
enum class SupervisorState {
    UNSTARTED,
    RUNNING,            // We spawned the backend and hold its handle
    RUNNING_UNMANAGED,  // Backend was already reachable; owned by someone else
    STOPPED
};

const char *state_to_string(SupervisorState state);

// BackendSupervisor keeps exactly one backend process alive for the
// session and kills it exactly once.
//
// The handle cell holds at most one child. It is guarded by mutex_, and
// shutdown() issues the kill while holding it, so no caller can observe
// a handle that has not yet been asked to terminate.
//
// Thread model:
// - ensure_started() runs once from the host startup hook
// - shutdown() may run any number of times, from any thread, concurrently
//
// Errors are returned as false + error message. The caller decides:
// startup failures abort the host, shutdown failures are logged.
class BackendSupervisor {
public:
    BackendSupervisor(std::shared_ptr<probe::ILivenessProber> prober,
                      std::shared_ptr<process::IProcessLauncher> launcher, process::LaunchCommand command);
    ~BackendSupervisor();

    BackendSupervisor(const BackendSupervisor &) = delete;
    BackendSupervisor &operator=(const BackendSupervisor &) = delete;

    // Probe the endpoint; spawn the backend only if nothing is serving.
    // Liveness is decided by the probe, not by the local cell.
    // Returns false on spawn failure or after STOPPED.
    bool ensure_started(std::string &error);

    // Kill the managed backend if there is one and clear the cell.
    // Idempotent. A failed kill still clears the cell and returns false.
    // Before any start this does nothing and startup stays possible.
    bool shutdown(std::string &error);

    SupervisorState state() const;
    bool has_handle() const;
    std::optional<int> managed_pid() const;

    const process::LaunchCommand &launch_command() const { return command_; }

private:
    std::shared_ptr<probe::ILivenessProber> prober_;
    std::shared_ptr<process::IProcessLauncher> launcher_;
    process::LaunchCommand command_;

    mutable std::mutex mutex_;
    std::unique_ptr<process::IProcessHandle> handle_;  // guarded by mutex_
    SupervisorState state_ = SupervisorState::UNSTARTED;  // guarded by mutex_
    std::atomic<int> starts_in_flight_{0};

    bool lock_state(std::unique_lock<std::mutex> &lock, std::string &error) const;
};

}  // namespace supervisor
}  // namespace tether
