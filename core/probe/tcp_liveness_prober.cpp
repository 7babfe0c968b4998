#include "tcp_liveness_prober.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"

namespace tether {
namespace probe {

TcpLivenessProber::TcpLivenessProber(const std::string &host, int port) : host_(host), port_(port) {}

std::string TcpLivenessProber::endpoint() const { return host_ + ":" + std::to_string(port_); }

bool TcpLivenessProber::is_running() const {
    addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    const std::string service = std::to_string(port_);
    addrinfo *res = nullptr;
    int rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        LOG_DEBUG("[Probe] Cannot resolve " << endpoint() << ": " << gai_strerror(rc));
        return false;
    }

    bool connected = false;
    for (addrinfo *it = res; it != nullptr && !connected; it = it->ai_next) {
        int fd = ::socket(it->ai_family, it->ai_socktype | SOCK_CLOEXEC, it->ai_protocol);
        if (fd < 0) {
            continue;
        }

        if (::connect(fd, it->ai_addr, it->ai_addrlen) == 0) {
            connected = true;
        } else {
            LOG_DEBUG("[Probe] connect " << endpoint() << " failed: " << std::strerror(errno));
        }
        ::close(fd);
    }
    freeaddrinfo(res);

    LOG_DEBUG("[Probe] " << endpoint() << (connected ? " reachable" : " not reachable"));
    return connected;
}

}  // namespace probe
}  // namespace tether
