#pragma once

#include <string>

#include "i_liveness_prober.hpp"

namespace tether {
namespace probe {

// TcpLivenessProber answers "is the backend already serving?" with a
// single blocking TCP connect to host:port.
// - Every resolved address is tried in order; first success wins
// - Refused, unreachable, timeout and resolution errors all mean "not running"
// - Uses the platform default connect timeout; no retries
// - The test connection is closed before returning
class TcpLivenessProber : public ILivenessProber {
public:
    TcpLivenessProber(const std::string &host, int port);

    bool is_running() const override;

    std::string endpoint() const override;

    const std::string &host() const { return host_; }
    int port() const { return port_; }

private:
    std::string host_;
    int port_;
};

}  // namespace probe
}  // namespace tether
