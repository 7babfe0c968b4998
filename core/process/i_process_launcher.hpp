#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "i_process_handle.hpp"

namespace tether {
namespace process {

struct LaunchCommand {
    std::string command;                     // Executable name (PATH lookup) or path
    std::vector<std::string> args;           // argv[1..]
    std::string working_dir;                 // Empty: inherit
    std::map<std::string, std::string> env;  // Added to (or overriding) the inherited environment
};

// Interface for process creation to enable mocking
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // Returns nullptr and sets error when the process could not be started
    virtual std::unique_ptr<IProcessHandle> launch(const LaunchCommand &command, std::string &error) = 0;
};

}  // namespace process
}  // namespace tether
