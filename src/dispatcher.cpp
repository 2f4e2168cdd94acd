// ============================================================================
// dispatcher.cpp - implementation for dispatcher.hpp
// Tests: tests/test_dispatcher.cpp
// ============================================================================
#include "wbf/dispatcher.hpp"
#include "wbf/band.hpp"
#include "wbf/codec.hpp"
#include "wbf/errors.hpp"
#include "wbf/log.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace wbf {

// Raw type code of a datagram whose header got that far, for drop logs.
static std::optional<uint32_t> peek_type_code(const std::vector<uint8_t>& b) {
  if (b.size() < 12) return std::nullopt;
  return (uint32_t(b[8]) << 24) | (uint32_t(b[9]) << 16) | (uint32_t(b[10]) << 8) | uint32_t(b[11]);
}

Dispatcher::Dispatcher(const WorkedBeforeEngine& engine, DispatcherConfig cfg)
  : engine_(engine), cfg_(std::move(cfg)) {}

void Dispatcher::add_handler(TelegramHandler handler) {
  handlers_.push_back(std::move(handler));
}

std::optional<Status> Dispatcher::get_current_status(const Endpoint& peer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = status_.find(peer);
  if (it == status_.end()) return std::nullopt;
  return it->second;
}

std::set<std::string> Dispatcher::painted_calls(const Endpoint& peer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = painted_.find(peer);
  if (it == painted_.end()) return {};
  return it->second.calls;
}

std::vector<Datagram> Dispatcher::clear_all() {
  std::vector<Datagram> replies;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [peer, painted] : painted_) {
    for (const std::string& call : painted.calls) {
      replies.push_back(make_reply(peer, painted.schema, clear_highlight(call)));
    }
  }
  painted_.clear();
  return replies;
}

// ---------------------------------------------------------------------------
// decode_or_drop()
// ----------------
// Any codec error ends processing of this datagram. One warn line carries
// everything needed to find the offending byte.
// ---------------------------------------------------------------------------
std::optional<Telegram> Dispatcher::decode_or_drop(const Datagram& in) const {
  try {
    return decode(in.bytes);
  } catch (const TelegramError& e) {
    std::ostringstream os;
    os << "drop datagram peer=" << in.peer.to_string()
       << " stage=" << to_string(e.stage())
       << " offset=" << e.offset();
    if (auto* u = dynamic_cast<const UnknownTypeError*>(&e)) {
      os << " type=" << u->type_code();
    } else if (auto code = peek_type_code(in.bytes)) {
      os << " type=" << *code;
    }
    os << " size=" << in.bytes.size() << " reason=\"" << e.what() << "\"";
    log(LogLevel::Warn, os.str());
    return std::nullopt;
  }
}

void Dispatcher::run_handlers(const Endpoint& peer, const Telegram& t) const {
  for (std::size_t i = 0; i < handlers_.size(); ++i) {
    try {
      handlers_[i](peer, t);
    } catch (const std::exception& e) {
      std::ostringstream os;
      os << "handler failed index=" << i << " peer=" << peer.to_string()
         << " type=" << to_string(t.type()) << " reason=\"" << e.what() << "\"";
      log(LogLevel::Error, os.str());
    }
  }
}

Datagram Dispatcher::make_reply(const Endpoint& peer, uint32_t inbound_schema, Payload payload) const {
  Telegram out;
  out.schema_version = std::min(inbound_schema, MAX_SCHEMA_VERSION);
  out.id             = cfg_.id;
  out.payload        = std::move(payload);

  Datagram d;
  d.peer  = peer;
  d.bytes = encode(out);
  return d;
}

// ---------------------------------------------------------------------------
// update_status()
// ---------------
// Colors belong to one band. When the dial moves to another band (or off
// every band) the calls painted for this peer are cleared before the new
// Status takes effect.
// ---------------------------------------------------------------------------
void Dispatcher::update_status(const Endpoint& peer, uint32_t schema, const Status& s,
                               std::vector<Datagram>& replies) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto prev = status_.find(peer);
  if (prev != status_.end() &&
      band_for_frequency(prev->second.dial_frequency_hz) != band_for_frequency(s.dial_frequency_hz)) {
    auto it = painted_.find(peer);
    if (it != painted_.end()) {
      for (const std::string& call : it->second.calls) {
        replies.push_back(make_reply(peer, schema, clear_highlight(call)));
      }
      std::ostringstream os;
      os << "band change peer=" << peer.to_string() << " cleared=" << it->second.calls.size();
      log(LogLevel::Debug, os.str());
      painted_.erase(it);
    }
  }
  status_[peer] = s;
}

// ---------------------------------------------------------------------------
// route_decode()
// --------------
// The engine runs on a copy of the Status without the lock, so a slow lookup
// never blocks other peers. Only the painted set is touched under the lock.
// ---------------------------------------------------------------------------
void Dispatcher::route_decode(const Endpoint& peer, const Telegram& t,
                              std::vector<Datagram>& replies) {
  const std::optional<Status> status = get_current_status(peer);
  std::optional<Assessment> assessment;
  try {
    if (const Decode* d = t.get_if<Decode>()) assessment = engine_.assess(*d, status ? &*status : nullptr);
    else assessment = engine_.assess(*t.get_if<WsprDecode>(), status ? &*status : nullptr);
  } catch (const LookupUnavailableError& e) {
    std::ostringstream os;
    os << "lookup unavailable peer=" << peer.to_string()
       << " type=" << to_string(t.type()) << " reason=\"" << e.what() << "\"";
    log(LogLevel::Warn, os.str());
    return;
  }
  if (!assessment) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto highlight = engine_.highlight_for(*assessment)) {
    std::ostringstream os;
    os << "highlight peer=" << peer.to_string() << " call=" << assessment->callsign
       << " class=" << to_string(assessment->classification);
    log(LogLevel::Debug, os.str());
    Painted& painted = painted_[peer];
    painted.schema = t.schema_version;
    painted.calls.insert(assessment->callsign);
    replies.push_back(make_reply(peer, t.schema_version, *highlight));
    return;
  }

  auto it = painted_.find(peer);
  if (it == painted_.end() || it->second.calls.erase(assessment->callsign) == 0) return;
  std::ostringstream os;
  os << "clear peer=" << peer.to_string() << " call=" << assessment->callsign;
  log(LogLevel::Debug, os.str());
  replies.push_back(make_reply(peer, t.schema_version, clear_highlight(assessment->callsign)));
}

// ---------------------------------------------------------------------------
// dispatch()
// ----------
// Order: decode -> handlers -> route -> encode replies.
// ---------------------------------------------------------------------------
std::vector<Datagram> Dispatcher::dispatch(const Datagram& in) {
  std::vector<Datagram> replies;

  auto decoded = decode_or_drop(in);
  if (!decoded) return replies;
  const Telegram& t = *decoded;

  {
    std::ostringstream os;
    os << "recv peer=" << in.peer.to_string() << " " << describe(t);
    log(LogLevel::Debug, os.str());
  }

  run_handlers(in.peer, t);

  if (const Status* s = t.get_if<Status>()) {
    update_status(in.peer, t.schema_version, *s, replies);
    return replies;
  }

  if (t.is<Heartbeat>()) {
    if (!cfg_.reply_heartbeat) return replies;
    Heartbeat hb;
    hb.max_schema_version = MAX_SCHEMA_VERSION;
    hb.version  = Text(cfg_.version);
    hb.revision = Text(std::string());
    replies.push_back(make_reply(in.peer, t.schema_version, hb));
    return replies;
  }

  if (t.is<Decode>() || t.is<WsprDecode>()) route_decode(in.peer, t, replies);
  return replies;
}

} // namespace wbf
