#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "supervisor/backend_supervisor.hpp"

namespace tether {
namespace runtime {

// Host notifications the supervisor reacts to
enum class HostEvent {
    WINDOW_CLOSE_REQUESTED,  // User closed the main window
    APP_EXIT                 // Final application-termination notification
};

const char *host_event_to_string(HostEvent event);

/**
 * @brief Registry of host lifecycle handlers
 *
 * The host owns event dispatch; components register handlers per event.
 * dispatch() copies the handler list under the lock and invokes handlers
 * outside it, so the same event may be dispatched from several threads
 * at once and handlers may register further handlers.
 */
class LifecycleHooks {
public:
    using Handler = std::function<void(HostEvent)>;

    void on(HostEvent event, Handler handler);

    // Returns the number of handlers invoked
    size_t dispatch(HostEvent event);

    size_t handler_count(HostEvent event) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<HostEvent, std::vector<Handler>> handlers_;
};

// Startup hook: fatal to the caller when the backend cannot be started
bool run_startup_hook(supervisor::BackendSupervisor &supervisor, std::string &error);

// Registers supervisor shutdown for both close and exit events.
// Shutdown failures are logged; they never block the host from exiting.
void bind_supervisor(LifecycleHooks &hooks, std::shared_ptr<supervisor::BackendSupervisor> supervisor);

}  // namespace runtime
}  // namespace tether
