// ============================================================================
// telegram.cpp - type names and describe() for telegram.hpp
// ============================================================================
#include "wbf/telegram.hpp"
#include "wbf/telegram_fields.hpp"

#include <iomanip>   // std::setw, std::setfill, std::hex for colors
#include <sstream>   // std::ostringstream: assemble the summary line

namespace wbf {

const char* to_string(TelegramType type) {
  switch (type) {
    case TelegramType::Heartbeat:           return "Heartbeat";
    case TelegramType::Status:              return "Status";
    case TelegramType::Decode:              return "Decode";
    case TelegramType::Clear:               return "Clear";
    case TelegramType::Reply:               return "Reply";
    case TelegramType::QsoLogged:           return "QSOLogged";
    case TelegramType::Close:               return "Close";
    case TelegramType::Replay:              return "Replay";
    case TelegramType::HaltTx:              return "HaltTx";
    case TelegramType::FreeText:            return "FreeText";
    case TelegramType::WsprDecode:          return "WSPRDecode";
    case TelegramType::Location:            return "Location";
    case TelegramType::LoggedAdif:          return "LoggedADIF";
    case TelegramType::HighlightCallsign:   return "HighlightCallsign";
    case TelegramType::SwitchConfiguration: return "SwitchConfiguration";
    case TelegramType::Configure:           return "Configure";
  }
  return "Unknown";
}

namespace {

// ---------------------------------------------------------------------------
// Line
// ----
// Appends " key=value" pairs. Overloads pick the rendering per wire type:
//   - strings are quoted only when they contain a space, null is (null)
//   - absent optionals are skipped entirely
//   - colors render as #rrggbb (8-bit per channel) or "invalid"
// ---------------------------------------------------------------------------
class Line {
public:
  explicit Line(std::ostringstream& os) : os_(os) {}

  void put(const char* k, const Text& v) {
    os_ << ' ' << k << '=';
    if (!v) { os_ << "(null)"; return; }
    if (v->find(' ') != std::string::npos || v->empty()) os_ << '"' << *v << '"';
    else                                                  os_ << *v;
  }
  void put(const char* k, bool v)          { os_ << ' ' << k << '=' << (v ? 1 : 0); }
  void put(const char* k, uint8_t v)       { os_ << ' ' << k << '=' << static_cast<unsigned>(v); }
  void put(const char* k, uint32_t v)      { os_ << ' ' << k << '=' << v; }
  void put(const char* k, int32_t v)       { os_ << ' ' << k << '=' << v; }
  void put(const char* k, uint64_t v)      { os_ << ' ' << k << '=' << v; }
  void put(const char* k, double v)        { os_ << ' ' << k << '=' << v; }

  void put(const char* k, const Color& c) {
    os_ << ' ' << k << '=';
    if (!c.valid()) { os_ << "invalid"; return; }
    os_ << '#' << std::hex << std::setfill('0')
        << std::setw(2) << (c.red >> 8) << std::setw(2) << (c.green >> 8) << std::setw(2) << (c.blue >> 8)
        << std::dec << std::setfill(' ');
  }

  void put(const char* k, const DateTime& dt) {
    os_ << ' ' << k << '=' << dt.julian_day << '/' << dt.ms_since_midnight << "ms/spec" << static_cast<unsigned>(dt.timespec);
    if (dt.utc_offset_s) os_ << '/' << *dt.utc_offset_s << 's';
  }

  template <class T>
  void put(const char* k, const std::optional<T>& v) {
    if (v) put(k, *v);
  }

private:
  std::ostringstream& os_;
};

} // namespace

std::string describe(const Telegram& t) {
  std::ostringstream os;
  os << "type=" << to_string(t.type());
  Line line(os);
  fields::walk(line, t);
  return os.str();
}

} // namespace wbf
