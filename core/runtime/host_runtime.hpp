#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "lifecycle_hooks.hpp"
#include "probe/i_liveness_prober.hpp"
#include "process/i_process_launcher.hpp"
#include "supervisor/backend_supervisor.hpp"

namespace tether {
namespace runtime {

// HostRuntime is the headless stand-in for the desktop shell: it owns the
// supervisor, fires the startup hook, and dispatches the close and exit
// notifications a windowed host would send.
class HostRuntime {
public:
    explicit HostRuntime(const HostConfig &config);

    // Injection constructor (tests, alternate platforms)
    HostRuntime(const HostConfig &config, std::shared_ptr<probe::ILivenessProber> prober,
                std::shared_ptr<process::IProcessLauncher> launcher);

    ~HostRuntime();

    HostRuntime(const HostRuntime &) = delete;
    HostRuntime &operator=(const HostRuntime &) = delete;

    // Runs the startup hook; false means the host must not continue
    bool initialize(std::string &error);

    // Blocks until request_close() or a termination signal, then
    // dispatches WINDOW_CLOSE_REQUESTED
    void run();

    // Equivalent of the user closing the main window
    void request_close() { close_requested_ = true; }

    // Dispatches APP_EXIT once
    void shutdown();

    supervisor::BackendSupervisor &get_supervisor() { return *supervisor_; }
    LifecycleHooks &get_hooks() { return hooks_; }
    const HostConfig &config() const { return config_; }

private:
    HostConfig config_;
    std::shared_ptr<supervisor::BackendSupervisor> supervisor_;
    LifecycleHooks hooks_;

    std::atomic<bool> close_requested_{false};
    std::atomic<bool> exited_{false};
};

// Maps the backend section onto a launch command
process::LaunchCommand make_launch_command(const BackendConfig &backend);

}  // namespace runtime
}  // namespace tether
