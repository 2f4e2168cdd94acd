// ============================================================================
// server.cpp - implementation for server.hpp
// ============================================================================
#include "server.hpp"
#include "udp_io.hpp"
#include "wbf/log.hpp"

#include <exception>
#include <sstream>
#include <utility>

namespace wbf {

Server::Server(Dispatcher& dispatcher, std::string address, uint16_t port)
  : dispatcher_(dispatcher), address_(std::move(address)), port_(port) {}

Server::~Server() {
  close_udp(fd_);
}

bool Server::open() {
  if (fd_ >= 0) return true;
  fd_ = open_udp(address_, port_);
  if (fd_ < 0) return false;
  std::ostringstream os;
  os << "listening on " << address_ << ":" << port() << " id=" << dispatcher_.config().id;
  log(LogLevel::Info, os.str());
  return true;
}

uint16_t Server::port() const {
  return fd_ >= 0 ? local_port(fd_) : port_;
}

void Server::send_all(const std::vector<Datagram>& replies) {
  for (const Datagram& reply : replies) {
    if (!send_datagram(fd_, reply)) {
      log(LogLevel::Warn, "reply not sent peer=" + reply.peer.to_string());
    }
  }
}

// ---------------------------------------------------------------------------
// run()
// -----
// The stop flag is checked between datagrams only; a dispatch in progress
// always completes and its replies are sent. A datagram whose dispatch
// throws is logged and skipped. On the way out every painted call is
// cleared at its peer.
// ---------------------------------------------------------------------------
uint64_t Server::run() {
  uint64_t received = 0;
  if (!open()) return received;

  Datagram in;
  while (!stop_.load()) {
    if (!recv_datagram(fd_, in, POLL_MS)) continue;
    ++received;
    try {
      send_all(dispatcher_.dispatch(in));
    } catch (const std::exception& e) {
      std::ostringstream os;
      os << "dispatch failed peer=" << in.peer.to_string()
         << " size=" << in.bytes.size() << " reason=\"" << e.what() << "\"";
      log(LogLevel::Error, os.str());
    }
  }

  send_all(dispatcher_.clear_all());
  close_udp(fd_);
  fd_ = -1;
  std::ostringstream os;
  os << "stopped after " << received << " datagram(s)";
  log(LogLevel::Info, os.str());
  return received;
}

} // namespace wbf
