#pragma once

#include <sys/types.h>

#include <memory>
#include <string>

#include "i_process_handle.hpp"
#include "i_process_launcher.hpp"

namespace tether {
namespace process {

// PosixProcessHandle owns one forked child.
// Lifecycle:
// - terminate() sends SIGKILL and blocks until the child is reaped
// - is_alive() reaps an exited child without blocking
// - the destructor never kills; it only reaps an already exited child
class PosixProcessHandle : public IProcessHandle {
public:
    explicit PosixProcessHandle(pid_t pid);
    ~PosixProcessHandle() override;

    // Delete copy/move
    PosixProcessHandle(const PosixProcessHandle &) = delete;
    PosixProcessHandle &operator=(const PosixProcessHandle &) = delete;

    int pid() const override { return static_cast<int>(pid_); }
    bool is_alive() override;
    bool terminate(std::string &error) override;

    // Exit status from waitpid, valid once reaped
    int wait_status() const { return wait_status_; }

private:
    pid_t pid_;
    bool reaped_ = false;
    int wait_status_ = 0;

    // Blocking or WNOHANG waitpid; true once the child is reaped
    bool reap(bool block);
};

// PosixProcessLauncher spawns the backend with fork/exec.
// - Bare command names are resolved against PATH before forking
// - The child runs in its own process group so terminal signals reach only the host
// - stdin is /dev/null; stdout/stderr are inherited
// - Setup or exec failures in the child are reported through a close-on-exec pipe,
//   so launch() fails synchronously instead of returning a dead handle
class PosixProcessLauncher : public IProcessLauncher {
public:
    std::unique_ptr<IProcessHandle> launch(const LaunchCommand &command, std::string &error) override;

    // Absolute path of an executable, or empty if not found
    static std::string resolve_executable(const std::string &command);
};

}  // namespace process
}  // namespace tether
