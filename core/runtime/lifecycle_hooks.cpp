#include "lifecycle_hooks.hpp"

#include <exception>
#include <utility>

#include "logging/logger.hpp"

namespace tether {
namespace runtime {

const char *host_event_to_string(HostEvent event) {
    switch (event) {
        case HostEvent::WINDOW_CLOSE_REQUESTED:
            return "WINDOW_CLOSE_REQUESTED";
        case HostEvent::APP_EXIT:
            return "APP_EXIT";
    }
    return "UNKNOWN";
}

void LifecycleHooks::on(HostEvent event, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[event].push_back(std::move(handler));
}

size_t LifecycleHooks::dispatch(HostEvent event) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        if (it != handlers_.end()) {
            handlers = it->second;
        }
    }

    LOG_DEBUG("[Lifecycle] " << host_event_to_string(event) << " -> " << handlers.size() << " handler(s)");

    for (const auto &handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception &e) {
            LOG_ERROR("[Lifecycle] Handler for " << host_event_to_string(event) << " threw: " << e.what());
        }
    }
    return handlers.size();
}

size_t LifecycleHooks::handler_count(HostEvent event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(event);
    return it == handlers_.end() ? 0 : it->second.size();
}

bool run_startup_hook(supervisor::BackendSupervisor &supervisor, std::string &error) {
    if (!supervisor.ensure_started(error)) {
        return false;
    }
    LOG_DEBUG("[Lifecycle] Startup hook complete (state=" << supervisor::state_to_string(supervisor.state()) << ")");
    return true;
}

void bind_supervisor(LifecycleHooks &hooks, std::shared_ptr<supervisor::BackendSupervisor> supervisor) {
    auto shutdown_handler = [supervisor](HostEvent event) {
        LOG_INFO("[Lifecycle] " << host_event_to_string(event) << ": shutting down backend");
        std::string error;
        if (!supervisor->shutdown(error)) {
            LOG_ERROR("[Lifecycle] Backend shutdown failed (continuing exit): " << error);
        }
    };

    hooks.on(HostEvent::WINDOW_CLOSE_REQUESTED, shutdown_handler);
    hooks.on(HostEvent::APP_EXIT, shutdown_handler);
}

}  // namespace runtime
}  // namespace tether
