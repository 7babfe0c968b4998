#include "backend_supervisor.hpp"

#include <atomic>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

namespace tether {
namespace supervisor {

namespace {

// Counts an ensure_started() call from its STOPPED check until it returns
class StartInFlight {
public:
    explicit StartInFlight(std::atomic<int> &count) : count_(count) {}
    ~StartInFlight() { count_.fetch_sub(1); }

    StartInFlight(const StartInFlight &) = delete;
    StartInFlight &operator=(const StartInFlight &) = delete;

private:
    std::atomic<int> &count_;
};

}  // namespace

const char *state_to_string(SupervisorState state) {
    switch (state) {
        case SupervisorState::UNSTARTED:
            return "UNSTARTED";
        case SupervisorState::RUNNING:
            return "RUNNING";
        case SupervisorState::RUNNING_UNMANAGED:
            return "RUNNING_UNMANAGED";
        case SupervisorState::STOPPED:
            return "STOPPED";
    }
    return "UNKNOWN";
}

BackendSupervisor::BackendSupervisor(std::shared_ptr<probe::ILivenessProber> prober,
                                     std::shared_ptr<process::IProcessLauncher> launcher,
                                     process::LaunchCommand command)
    : prober_(std::move(prober)), launcher_(std::move(launcher)), command_(std::move(command)) {}

BackendSupervisor::~BackendSupervisor() {
    std::string error;
    if (!shutdown(error)) {
        LOG_WARN("[Supervisor] Shutdown on destruction failed: " << error);
    }
}

bool BackendSupervisor::lock_state(std::unique_lock<std::mutex> &lock, std::string &error) const {
    try {
        lock = std::unique_lock<std::mutex>(mutex_);
        return true;
    } catch (const std::system_error &e) {
        error = "Supervisor lock unusable: " + std::string(e.what());
        LOG_ERROR("[Supervisor] " << error);
        return false;
    }
}

bool BackendSupervisor::ensure_started(std::string &error) {
    {
        std::unique_lock<std::mutex> lock;
        if (!lock_state(lock, error)) {
            return false;
        }
        if (state_ == SupervisorState::STOPPED) {
            error = "Supervisor already stopped; backend will not be restarted";
            LOG_WARN("[Supervisor] " << error);
            return false;
        }
        starts_in_flight_.fetch_add(1);
    }
    StartInFlight in_flight(starts_in_flight_);

    // Probe outside the lock: connect may block for the platform timeout
    if (prober_->is_running()) {
        LOG_INFO("[Supervisor] Backend is already running at " << prober_->endpoint());
        std::unique_lock<std::mutex> lock;
        if (!lock_state(lock, error)) {
            return false;
        }
        if (state_ == SupervisorState::UNSTARTED) {
            state_ = SupervisorState::RUNNING_UNMANAGED;
        }
        return true;
    }

    LOG_INFO("[Supervisor] Starting backend (" << prober_->endpoint() << " not reachable)...");

    std::string launch_error;
    auto child = launcher_->launch(command_, launch_error);
    if (!child) {
        error = "Failed to start backend '" + command_.command + "': " + launch_error;
        LOG_ERROR("[Supervisor] " << error);
        return false;
    }
    const int pid = child->pid();

    std::unique_lock<std::mutex> lock;
    if (!lock_state(lock, error)) {
        std::string kill_error;
        if (!child->terminate(kill_error)) {
            LOG_ERROR("[Supervisor] Could not kill untracked backend pid " << pid << ": " << kill_error);
        }
        return false;
    }

    if (state_ == SupervisorState::STOPPED) {
        // shutdown() ran while we were spawning
        std::string kill_error;
        if (!child->terminate(kill_error)) {
            LOG_ERROR("[Supervisor] Could not kill late backend pid " << pid << ": " << kill_error);
        }
        error = "Supervisor stopped while backend was starting";
        LOG_WARN("[Supervisor] " << error);
        return false;
    }

    if (handle_) {
        // Singleton ownership: keep the tracked child, drop the new one
        LOG_WARN("[Supervisor] Backend pid " << handle_->pid() << " already tracked; killing duplicate pid " << pid);
        std::string kill_error;
        if (!child->terminate(kill_error)) {
            LOG_ERROR("[Supervisor] Could not kill duplicate backend pid " << pid << ": " << kill_error);
        }
        return true;
    }

    handle_ = std::move(child);
    state_ = SupervisorState::RUNNING;
    LOG_INFO("[Supervisor] Backend process started (PID=" << pid << ")");
    return true;
}

bool BackendSupervisor::shutdown(std::string &error) {
    std::unique_lock<std::mutex> lock;
    if (!lock_state(lock, error)) {
        return false;
    }

    if (!handle_) {
        if (state_ == SupervisorState::RUNNING_UNMANAGED) {
            LOG_INFO("[Supervisor] Backend is externally owned; leaving it running");
            state_ = SupervisorState::STOPPED;
        } else if (state_ == SupervisorState::UNSTARTED) {
            if (starts_in_flight_.load() > 0) {
                // A spawn is under way; its child is killed when it lands
                LOG_INFO("[Supervisor] Shutdown requested while backend is starting");
                state_ = SupervisorState::STOPPED;
            } else {
                LOG_DEBUG("[Supervisor] No backend process to shut down");
            }
        }
        return true;
    }

    const int pid = handle_->pid();
    LOG_INFO("[Supervisor] Shutting down backend (PID=" << pid << ")...");

    std::string kill_error;
    const bool killed = handle_->terminate(kill_error);

    // The cell is cleared whether or not the kill succeeded
    handle_.reset();
    state_ = SupervisorState::STOPPED;

    if (!killed) {
        error = "Failed to kill backend (PID=" + std::to_string(pid) + "): " + kill_error;
        LOG_ERROR("[Supervisor] " << error);
        return false;
    }

    LOG_INFO("[Supervisor] Backend shut down successfully");
    return true;
}

SupervisorState BackendSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool BackendSupervisor::has_handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ != nullptr;
}

std::optional<int> BackendSupervisor::managed_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        return std::nullopt;
    }
    return handle_->pid();
}

}  // namespace supervisor
}  // namespace tether
