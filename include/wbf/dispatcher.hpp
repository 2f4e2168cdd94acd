/**
 * @file dispatcher.hpp
 * @brief One datagram in, zero or more reply datagrams out.
 *
 * @details
 * The dispatcher sits between the socket loop (server.hpp) and everything
 * that understands telegrams. It owns no socket; it takes a Datagram and
 * returns the Datagrams to send, so it is testable without the network.
 *
 * PER DATAGRAM
 * ------------
 * 1) decode; a TelegramError is logged (peer, stage, offset, type) and the
 *    datagram is dropped
 * 2) hand the telegram to every registered handler, in registration order
 * 3) route by type:
 *      Status            -> per-peer cache (last wins); a band change clears
 *                           every call painted for that peer
 *      Decode/WSPRDecode -> worked-before engine with the peer's cached Status;
 *                           a painted call that is now Worked gets cleared
 *      Heartbeat         -> our own Heartbeat back, when enabled
 * 4) encode replies with our id and min(inbound schema, MAX_SCHEMA_VERSION),
 *    addressed to the sender only
 *
 * PAINTED CALLS
 * -------------
 * Every call we sent colors for is remembered per peer, together with the
 * schema that peer last used. A clear is clear_highlight(): two invalid
 * colors. clear_all() produces the clears for every peer, for shutdown.
 *
 * THREADING
 * ---------
 * Register handlers before the first dispatch(). After that dispatch(),
 * clear_all() and get_current_status() may be called from any thread; the
 * Status map and the painted calls are the only mutable state and one mutex
 * guards both.
 */
#ifndef WBF_DISPATCHER_HPP
#define WBF_DISPATCHER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "wbf/telegram.hpp"
#include "wbf/worked_before.hpp"

namespace wbf {

/// IPv4 address in dotted form plus port. Ordered so it can key a map.
struct Endpoint {
  std::string address;
  uint16_t    port{0};

  bool operator<(const Endpoint& o) const {
    return address != o.address ? address < o.address : port < o.port;
  }
  bool operator==(const Endpoint& o) const { return address == o.address && port == o.port; }
  bool operator!=(const Endpoint& o) const { return !(*this == o); }

  std::string to_string() const { return address + ":" + std::to_string(port); }
};

struct Datagram {
  Endpoint             peer;
  std::vector<uint8_t> bytes;
};

using TelegramHandler = std::function<void(const Endpoint& peer, const Telegram& t)>;

struct DispatcherConfig {
  std::string id{"wbf-srv"};        ///< our instance id in reply headers
  bool        reply_heartbeat{true};
  std::string version{"1.0.0"};     ///< sent in our Heartbeat
};

class Dispatcher {
public:
  explicit Dispatcher(const WorkedBeforeEngine& engine, DispatcherConfig cfg = {});

  void add_handler(TelegramHandler handler);

  /// Process one datagram and return the replies to send.
  std::vector<Datagram> dispatch(const Datagram& in);

  /// Clears for every painted call of every peer; forgets them all.
  std::vector<Datagram> clear_all();

  /// Last Status received from `peer`, if any.
  std::optional<Status> get_current_status(const Endpoint& peer) const;

  /// Calls currently painted at `peer`.
  std::set<std::string> painted_calls(const Endpoint& peer) const;

  const DispatcherConfig& config() const { return cfg_; }

private:
  struct Painted {
    uint32_t              schema{MAX_SCHEMA_VERSION};
    std::set<std::string> calls;
  };

  std::optional<Telegram> decode_or_drop(const Datagram& in) const;
  void run_handlers(const Endpoint& peer, const Telegram& t) const;
  Datagram make_reply(const Endpoint& peer, uint32_t inbound_schema, Payload payload) const;
  void update_status(const Endpoint& peer, uint32_t schema, const Status& s,
                     std::vector<Datagram>& replies);
  void route_decode(const Endpoint& peer, const Telegram& t, std::vector<Datagram>& replies);

  const WorkedBeforeEngine&    engine_;
  DispatcherConfig             cfg_;
  std::vector<TelegramHandler> handlers_;

  mutable std::mutex           mutex_;      // guards status_, painted_
  std::map<Endpoint, Status>   status_;
  std::map<Endpoint, Painted>  painted_;
};

} // namespace wbf

#endif // WBF_DISPATCHER_HPP
