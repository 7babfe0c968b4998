#pragma once

#include <string>

namespace tether {
namespace process {

// Interface for an owned child process to enable mocking
class IProcessHandle {
public:
    virtual ~IProcessHandle() = default;

    virtual int pid() const = 0;

    // Reaps the child if it has exited; false once it is gone
    virtual bool is_alive() = 0;

    // Forceful kill (no graceful stop negotiation), then reap.
    // Returns false and sets error if the OS refuses or the child is already gone.
    virtual bool terminate(std::string &error) = 0;
};

}  // namespace process
}  // namespace tether
