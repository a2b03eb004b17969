/**
 * @file tcp_probe.cpp
 * @brief POSIX non-blocking TCP connect probe.
 */

#include "converge/health/probe.hpp"
#include "converge/config/constants.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace converge::health {
using namespace converge::config::constants;

namespace {

/// Closes the socket on scope exit.
struct SocketGuard {
  int fd{-1};
  ~SocketGuard() { if (fd >= 0) ::close(fd); }
};

/// Resolved address list, freed on scope exit.
struct AddrInfoGuard {
  addrinfo* head{nullptr};
  ~AddrInfoGuard() { if (head) ::freeaddrinfo(head); }
};

} // namespace

ProbeOutcome tcp_probe(const std::string& host, std::uint16_t port,
                       std::chrono::milliseconds budget, std::stop_token stop) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + budget;
  const auto slice = std::chrono::milliseconds(PROBE_SLICE_MS);

  ProbeOutcome out;
  if (port == 0) {
    out.error = "no port configured";
    return out;
  }

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags    = AI_NUMERICSERV;
  AddrInfoGuard ai;
  const std::string service = std::to_string(port);
  if (const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &ai.head); rc != 0) {
    out.error = "resolve " + host + ": " + ::gai_strerror(rc);
    return out;
  }

  for (addrinfo* a = ai.head; a != nullptr; a = a->ai_next) {
    SocketGuard sock{::socket(a->ai_family, a->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, a->ai_protocol)};
    if (sock.fd < 0) {
      out.error = std::string("socket: ") + std::strerror(errno);
      continue;
    }

    if (::connect(sock.fd, a->ai_addr, a->ai_addrlen) == 0) {
      out.connected = true;
      return out;
    }
    if (errno != EINPROGRESS) {
      out.error = "connect " + host + ":" + service + ": " + std::strerror(errno);
      continue;
    }

    // Wait for writability in slices so a stop request is noticed promptly.
    pollfd pfd{sock.fd, POLLOUT, 0};
    for (;;) {
      if (stop.stop_requested()) {
        out.cancelled = true;
        out.error = "cancelled";
        return out;
      }
      const auto now = Clock::now();
      if (now >= deadline) {
        out.error = "connect " + host + ":" + service + ": timed out";
        return out;
      }
      const auto wait = std::min<Clock::duration>(slice, deadline - now);
      const int rc = ::poll(&pfd, 1,
          static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()) + 1);
      if (rc < 0 && errno != EINTR) {
        out.error = std::string("poll: ") + std::strerror(errno);
        break;
      }
      if (rc > 0) {
        int soerr = 0;
        socklen_t len = sizeof(soerr);
        ::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &soerr, &len);
        if (soerr == 0) {
          out.connected = true;
          out.error.clear();
          return out;
        }
        out.error = "connect " + host + ":" + service + ": " + std::strerror(soerr);
        break;
      }
    }
  }
  return out;
}

} // namespace converge::health
