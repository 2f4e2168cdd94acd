/**
 * @file server.hpp
 * @brief The receive loop: one socket, one dispatcher, run until stopped.
 *
 * @details
 * Cycle: poll up to POLL_MS -> read one datagram -> dispatch fully -> send
 * every reply -> repeat. Datagrams from all peers are handled in receive
 * order, one at a time.
 *
 * stop() only flips an atomic flag, so it is safe from a signal handler or
 * another thread. The loop notices it within POLL_MS, after finishing the
 * datagram in flight, sends Dispatcher::clear_all() and closes the socket
 * before run() returns.
 *
 * An exception out of dispatch() costs that one datagram only: it is logged
 * at error level and the loop goes on.
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "wbf/dispatcher.hpp"

namespace wbf {

class Server {
public:
  static constexpr int POLL_MS = 200;

  Server(Dispatcher& dispatcher, std::string address, uint16_t port);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /// Bind the socket. False (already logged) when the address cannot be bound.
  bool open();

  /// Loop until stop(). Returns the number of datagrams received.
  uint64_t run();

  void stop() { stop_.store(true); }
  bool stopping() const { return stop_.load(); }

  /// Bound port, useful when constructed with port 0.
  uint16_t port() const;

private:
  void send_all(const std::vector<Datagram>& replies);

  Dispatcher&       dispatcher_;
  std::string       address_;
  uint16_t          port_;
  int               fd_{-1};
  std::atomic<bool> stop_{false};
};

} // namespace wbf
