#pragma once

#include <string>

namespace tether {
namespace probe {

// Interface for the backend liveness check to enable mocking
class ILivenessProber {
public:
    virtual ~ILivenessProber() = default;

    // True iff the backend endpoint accepts a connection right now
    virtual bool is_running() const = 0;

    // host:port, for logs
    virtual std::string endpoint() const = 0;
};

}  // namespace probe
}  // namespace tether
