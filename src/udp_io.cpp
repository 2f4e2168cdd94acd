// ============================================================================
// udp_io.cpp - implementation for udp_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "udp_io.hpp"
#include "wbf/log.hpp"

#include <arpa/inet.h>     // inet_pton, inet_ntop, htons
#include <netinet/in.h>    // sockaddr_in
#include <poll.h>          // poll(2) for the receive timeout
#include <sys/socket.h>    // socket, bind, sendto, recvfrom
#include <unistd.h>        // ::close

#include <cerrno>
#include <cstring>         // strerror

namespace wbf {

static void log_errno(const std::string& what) {
  log(LogLevel::Error, what + ": " + std::strerror(errno));
}

static bool fill_addr(const std::string& address, uint16_t port, sockaddr_in& sa) {
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_family = AF_INET;
  sa.sin_port   = htons(port);
  return ::inet_pton(AF_INET, address.c_str(), &sa.sin_addr) == 1;
}

// ---------------------------------------------------------------------------
// open_udp()
// ----------
// socket -> SO_REUSEADDR -> bind. The descriptor is closed again on any
// failure after socket() so the caller never owns a half-set-up fd.
// ---------------------------------------------------------------------------
int open_udp(const std::string& address, uint16_t port) {
  sockaddr_in sa{};
  if (!fill_addr(address, port, sa)) {
    log(LogLevel::Error, "udp: invalid IPv4 address " + address);
    return -1;
  }

  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) { log_errno("udp: socket"); return -1; }

  int one = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0) {
    log_errno("udp: setsockopt(SO_REUSEADDR)");
    ::close(fd);
    return -1;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
    log_errno("udp: bind " + address + ":" + std::to_string(port));
    ::close(fd);
    return -1;
  }
  return fd;
}

// ---------------------------------------------------------------------------
// recv_datagram()
// ---------------
// poll() bounds the wait so the server loop can check its stop flag.
// ---------------------------------------------------------------------------
bool recv_datagram(int fd, Datagram& out, int timeout_ms) {
  pollfd pfd{fd, POLLIN, 0};
  int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr == 0) return false;                          // timeout
  if (pr < 0) {
    if (errno != EINTR) log_errno("udp: poll");
    return false;
  }
  if (!(pfd.revents & POLLIN)) return false;

  out.bytes.resize(MAX_DATAGRAM);
  sockaddr_in from{};
  socklen_t from_len = sizeof(from);
  ssize_t n = ::recvfrom(fd, out.bytes.data(), out.bytes.size(), 0,
                         reinterpret_cast<sockaddr*>(&from), &from_len);
  if (n < 0) {
    log_errno("udp: recvfrom");
    out.bytes.clear();
    return false;
  }
  out.bytes.resize(static_cast<std::size_t>(n));

  char text[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &from.sin_addr, text, sizeof(text));
  out.peer.address = text;
  out.peer.port    = ntohs(from.sin_port);
  return true;
}

bool send_datagram(int fd, const Datagram& d) {
  sockaddr_in to{};
  if (!fill_addr(d.peer.address, d.peer.port, to)) {
    log(LogLevel::Error, "udp: invalid peer address " + d.peer.to_string());
    return false;
  }
  ssize_t n = ::sendto(fd, d.bytes.data(), d.bytes.size(), 0,
                       reinterpret_cast<const sockaddr*>(&to), sizeof(to));
  if (n < 0) {
    log_errno("udp: sendto " + d.peer.to_string());
    return false;
  }
  return n == static_cast<ssize_t>(d.bytes.size());
}

uint16_t local_port(int fd) {
  sockaddr_in sa{};
  socklen_t len = sizeof(sa);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &len) != 0) return 0;
  return ntohs(sa.sin_port);
}

void close_udp(int fd) {
  if (fd >= 0) ::close(fd);
}

} // namespace wbf
