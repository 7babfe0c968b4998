#include "posix_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <map>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

extern char **environ;

namespace tether {
namespace process {

namespace {

constexpr int kExecFailureExitCode = 127;

bool is_executable_file(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

// Inherited environment with overrides applied, as NAME=value strings
std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides) {
    std::map<std::string, std::string> merged;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto &[name, value] : overrides) {
        merged[name] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto &[name, value] : merged) {
        result.push_back(name + "=" + value);
    }
    return result;
}

// Only async-signal-safe calls below this point in the child
[[noreturn]] void child_fail(int error_fd) {
    int err = errno;
    ssize_t ignored = ::write(error_fd, &err, sizeof(err));
    (void)ignored;
    _exit(kExecFailureExitCode);
}

}  // namespace

/******************************************************************************
 * PosixProcessHandle
 ******************************************************************************/

PosixProcessHandle::PosixProcessHandle(pid_t pid) : pid_(pid) {}

PosixProcessHandle::~PosixProcessHandle() {
    if (!reaped_ && pid_ > 0) {
        reap(false);
    }
}

bool PosixProcessHandle::reap(bool block) {
    if (reaped_) {
        return true;
    }

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, block ? 0 : WNOHANG);
        if (result == pid_) {
            reaped_ = true;
            wait_status_ = status;
            return true;
        }
        if (result == 0) {
            return false;  // Still running
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECHILD) {
            // Reaped by someone else
            reaped_ = true;
            return true;
        }
        return false;
    }
}

bool PosixProcessHandle::is_alive() {
    if (pid_ <= 0) {
        return false;
    }
    return !reap(false);
}

bool PosixProcessHandle::terminate(std::string &error) {
    if (pid_ <= 0 || reaped_) {
        error = "Process " + std::to_string(pid_) + " already exited";
        return false;
    }

    if (::kill(pid_, SIGKILL) != 0) {
        error = "kill(" + std::to_string(pid_) + ", SIGKILL) failed: " + std::strerror(errno);
        return false;
    }

    if (!reap(true)) {
        error = "waitpid(" + std::to_string(pid_) + ") failed: " + std::strerror(errno);
        return false;
    }

    LOG_DEBUG("[Process] pid " << pid_ << " reaped (status=" << wait_status_ << ")");
    return true;
}

/******************************************************************************
 * PosixProcessLauncher
 ******************************************************************************/

std::string PosixProcessLauncher::resolve_executable(const std::string &command) {
    if (command.empty()) {
        return "";
    }

    if (command.find('/') != std::string::npos) {
        std::filesystem::path path(command);
        if (!is_executable_file(path)) {
            return "";
        }
        return std::filesystem::absolute(path).string();
    }

    const char *path_env = std::getenv("PATH");
    std::string search_path = (path_env != nullptr && *path_env != '\0') ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::stringstream ss(search_path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::filesystem::path candidate = std::filesystem::path(dir) / command;
        if (is_executable_file(candidate)) {
            return std::filesystem::absolute(candidate).string();
        }
    }
    return "";
}

std::unique_ptr<IProcessHandle> PosixProcessLauncher::launch(const LaunchCommand &command, std::string &error) {
    LOG_INFO("[Process] Launching: " << command.command);

    std::string exec_path = resolve_executable(command.command);
    if (exec_path.empty()) {
        error = "Executable not found: " + command.command;
        return nullptr;
    }

    // Everything the child needs is built before fork
    std::vector<std::string> argv_storage;
    argv_storage.push_back(command.command);
    argv_storage.insert(argv_storage.end(), command.args.begin(), command.args.end());
    std::vector<char *> argv;
    for (auto &arg : argv_storage) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(command.env);
    std::vector<char *> envp;
    for (auto &entry : env_storage) {
        envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        error = std::string("Failed to open /dev/null: ") + std::strerror(errno);
        return nullptr;
    }

    int error_pipe[2];
    if (pipe2(error_pipe, O_CLOEXEC) < 0) {
        error = std::string("Failed to create error pipe: ") + std::strerror(errno);
        ::close(devnull);
        return nullptr;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("Fork failed: ") + std::strerror(errno);
        ::close(devnull);
        ::close(error_pipe[0]);
        ::close(error_pipe[1]);
        return nullptr;
    }

    if (pid == 0) {
        // Child process
        ::close(error_pipe[0]);

        if (::setpgid(0, 0) != 0) {
            child_fail(error_pipe[1]);
        }
        if (::dup2(devnull, STDIN_FILENO) < 0) {
            child_fail(error_pipe[1]);
        }
        if (!command.working_dir.empty() && ::chdir(command.working_dir.c_str()) != 0) {
            child_fail(error_pipe[1]);
        }

        ::execve(exec_path.c_str(), argv.data(), envp.data());

        // If we get here, exec failed
        child_fail(error_pipe[1]);
    }

    // Parent process
    ::close(error_pipe[1]);
    ::close(devnull);

    // EOF means exec succeeded and the close-on-exec write end went away
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    int read_errno = errno;
    ::close(error_pipe[0]);

    if (n != 0) {
        if (n > 0) {
            error = "Failed to start " + exec_path + ": " + std::strerror(child_errno);
        } else {
            error = std::string("Failed to read spawn status: ") + std::strerror(read_errno);
            if (::kill(pid, SIGKILL) != 0) {
                LOG_WARN("[Process] Could not kill pid " << pid << ": " << std::strerror(errno));
            }
        }
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
        }
        return nullptr;
    }

    LOG_INFO("[Process] Spawned " << exec_path << " (PID=" << pid << ")");
    return std::make_unique<PosixProcessHandle>(pid);
}

}  // namespace process
}  // namespace tether
