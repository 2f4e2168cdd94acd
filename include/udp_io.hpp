/**
 * @file udp_io.hpp
 * @brief Minimal POSIX UDP socket helpers for the wbf-srv receive loop and wbf-send.
 *
 * @details
 * PURPOSE
 * -------
 * Everything the server needs from the network is four calls: bind a socket,
 * wait for one datagram with a timeout, send one datagram, close. The rest of
 * wbf never sees a socket; it works on wbf::Datagram values.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   open_udp() -> recv_datagram() -> Dispatcher::dispatch() -> send_datagram() -> ... -> close_udp()
 *
 * CONVENTIONS
 * -----------
 * - Free functions on a plain int descriptor, -1 / false on failure.
 * - Failures are logged through wbf::log with the errno text; a timeout is
 *   not a failure and logs nothing.
 * - IPv4 only. WSJT-X defaults to 127.0.0.1 and its multicast groups are
 *   out of scope here.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = wbf::open_udp("127.0.0.1", 2237);
 *   wbf::Datagram d;
 *   if (fd >= 0 && wbf::recv_datagram(fd, d, 200)) {
 *     // d.peer is the sender, d.bytes the payload
 *   }
 *   wbf::close_udp(fd);
 * @endcode
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "wbf/dispatcher.hpp"   // wbf::Datagram, wbf::Endpoint

namespace wbf {

/// Largest datagram we accept. Bigger ones are truncated by the kernel and will fail decode.
constexpr std::size_t MAX_DATAGRAM = 65507;

/**
 * @brief Create a UDP socket bound to address:port.
 *
 * @param address  dotted IPv4 address, "0.0.0.0" for all interfaces
 * @param port     UDP port, 0 for an ephemeral one (wbf-send)
 * @return descriptor, or -1 on failure (bad address, bind error)
 *
 * SO_REUSEADDR is set so a restarted server can rebind at once.
 */
int open_udp(const std::string& address, uint16_t port);

/**
 * @brief Wait up to timeout_ms for one datagram.
 *
 * @return true with @p out filled (peer + bytes); false on timeout or error.
 *         An interrupted poll (EINTR) counts as a timeout.
 */
bool recv_datagram(int fd, Datagram& out, int timeout_ms);

/// Send @p d.bytes to @p d.peer in one sendto(2). False unless every byte went out.
bool send_datagram(int fd, const Datagram& d);

/// Local port a descriptor is bound to, or 0 when unknown.
uint16_t local_port(int fd);

/// Close a descriptor from open_udp(). Negative values are ignored.
void close_udp(int fd);

} // namespace wbf
