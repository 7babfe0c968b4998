#include "host_runtime.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include "logging/logger.hpp"
#include "probe/tcp_liveness_prober.hpp"
#include "process/posix_process.hpp"
#include "signal_handler.hpp"

namespace tether {
namespace runtime {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(50);
}

process::LaunchCommand make_launch_command(const BackendConfig &backend) {
    process::LaunchCommand command;
    command.command = backend.command;
    command.args = backend.args;
    command.working_dir = backend.working_dir;
    command.env = backend.env;
    return command;
}

HostRuntime::HostRuntime(const HostConfig &config)
    : HostRuntime(config, std::make_shared<probe::TcpLivenessProber>(config.backend.host, config.backend.port),
                  std::make_shared<process::PosixProcessLauncher>()) {}

HostRuntime::HostRuntime(const HostConfig &config, std::shared_ptr<probe::ILivenessProber> prober,
                         std::shared_ptr<process::IProcessLauncher> launcher)
    : config_(config),
      supervisor_(std::make_shared<supervisor::BackendSupervisor>(std::move(prober), std::move(launcher),
                                                                  make_launch_command(config.backend))) {
    bind_supervisor(hooks_, supervisor_);
}

HostRuntime::~HostRuntime() { shutdown(); }

bool HostRuntime::initialize(std::string &error) {
    LOG_INFO("[Host] Initializing (backend " << config_.backend.host << ":" << config_.backend.port << ")");

    if (!run_startup_hook(*supervisor_, error)) {
        return false;
    }

    LOG_INFO("[Host] Initialization complete (backend "
             << supervisor::state_to_string(supervisor_->state()) << ")");
    return true;
}

void HostRuntime::run() {
    LOG_INFO("[Host] Running");
    while (!close_requested_.load() && !SignalHandler::is_shutdown_requested()) {
        std::this_thread::sleep_for(kPollInterval);
    }

    LOG_INFO("[Host] Close requested");
    hooks_.dispatch(HostEvent::WINDOW_CLOSE_REQUESTED);
}

void HostRuntime::shutdown() {
    if (exited_.exchange(true)) {
        return;
    }
    hooks_.dispatch(HostEvent::APP_EXIT);
}

}  // namespace runtime
}  // namespace tether
