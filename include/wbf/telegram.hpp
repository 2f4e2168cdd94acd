/**
 * @file telegram.hpp
 * @brief Telegram model: the sixteen WSJT-X UDP message variants as one closed sum type.
 *
 * @details
 * ## Field Brief
 * A telegram is one UDP datagram from (or to) a WSJT-X class program. It has
 * a shared header and exactly one payload variant, picked by a type code.
 *
 * ```
 *  Telegram
 *   ├─ schema_version   (u32, we speak up to 3)
 *   ├─ id               (sender instance name, never null)
 *   └─ payload          std::variant<Heartbeat, Status, ..., Configure>
 *                       index == wire type code
 * ```
 *
 * @par Field conventions
 * - `Text` fields may be null on the wire (`std::nullopt`), distinct from "".
 * - Fields added by the extended schema (version 2) sit at the end of their
 *   variant and are wrapped in `std::optional`. "Not in the datagram" is
 *   `std::nullopt`, never a zero or a -1.
 * - A trailing `Text` field is therefore `std::optional<Text>`: outer empty
 *   means absent from the datagram, inner empty means a null string.
 *
 * @par What this file does not do
 * No byte handling. The layouts live in codec.cpp; this is only the shape.
 */
#ifndef WBF_TELEGRAM_HPP
#define WBF_TELEGRAM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <variant>

#include "wbf/frame_buffer.hpp"

namespace wbf {

/// Highest schema version this codec writes and answers with.
constexpr uint32_t MAX_SCHEMA_VERSION = 3;

/// First schema version carrying the trailing (extended) fields.
constexpr uint32_t EXTENDED_SCHEMA_VERSION = 2;

/// Wire type codes. Order matches the `Payload` variant alternatives.
enum class TelegramType : uint32_t {
  Heartbeat           = 0,
  Status              = 1,
  Decode              = 2,
  Clear               = 3,
  Reply               = 4,
  QsoLogged           = 5,
  Close               = 6,
  Replay              = 7,
  HaltTx              = 8,
  FreeText            = 9,
  WsprDecode          = 10,
  Location            = 11,
  LoggedAdif          = 12,
  HighlightCallsign   = 13,
  SwitchConfiguration = 14,
  Configure           = 15
};

/// Protocol name of a type ("Heartbeat", "QSOLogged", "WSPRDecode", ...).
const char* to_string(TelegramType type);

// Each variant exposes fields() as a tuple of references; equality is built on it.
#define WBF_FIELD_EQUALITY(T)                                                   \
  bool operator==(const T& o) const { return fields() == o.fields(); }          \
  bool operator!=(const T& o) const { return !(*this == o); }

/// Liveness and capability announcement. Sent by both sides.
struct Heartbeat {
  uint32_t max_schema_version{MAX_SCHEMA_VERSION};
  std::optional<Text> version;
  std::optional<Text> revision;

  auto fields() const { return std::tie(max_schema_version, version, revision); }
  WBF_FIELD_EQUALITY(Heartbeat)
};

/**
 * @brief Radio and session state of the sender.
 *
 * The first eight fields exist in every schema. The rest are extended fields.
 * `dial_frequency_hz` and `mode` are what the worked-before engine uses to
 * scope its lookups.
 */
struct Status {
  uint64_t dial_frequency_hz{0};
  Text     mode;
  Text     dx_call;
  Text     report;
  Text     tx_mode;
  bool     tx_enabled{false};
  bool     transmitting{false};
  bool     decoding{false};
  // extended
  std::optional<uint32_t> rx_df;
  std::optional<uint32_t> tx_df;
  std::optional<Text>     de_call;
  std::optional<Text>     de_grid;
  std::optional<Text>     dx_grid;
  std::optional<bool>     tx_watchdog;
  std::optional<Text>     sub_mode;
  std::optional<bool>     fast_mode;
  std::optional<uint8_t>  special_op_mode;
  std::optional<uint32_t> frequency_tolerance;
  std::optional<uint32_t> tr_period;
  std::optional<Text>     configuration_name;
  std::optional<Text>     tx_message;

  auto fields() const {
    return std::tie(dial_frequency_hz, mode, dx_call, report, tx_mode, tx_enabled,
                    transmitting, decoding, rx_df, tx_df, de_call, de_grid, dx_grid,
                    tx_watchdog, sub_mode, fast_mode, special_op_mode,
                    frequency_tolerance, tr_period, configuration_name, tx_message);
  }
  WBF_FIELD_EQUALITY(Status)
};

/// One decoded over-the-air message. `message` is where the callsign hides.
struct Decode {
  bool     is_new{true};
  uint32_t time_ms{0};          ///< ms since midnight UTC
  int32_t  snr{0};
  double   delta_time_s{0.0};
  uint32_t delta_freq_hz{0};
  Text     mode;                ///< single mode character ("~" FT8, "+" FT4, ...)
  Text     message;
  // extended
  std::optional<bool> low_confidence;
  std::optional<bool> off_air;

  auto fields() const {
    return std::tie(is_new, time_ms, snr, delta_time_s, delta_freq_hz, mode, message,
                    low_confidence, off_air);
  }
  WBF_FIELD_EQUALITY(Decode)
};

/// Clear decode windows: 0 band activity, 1 rx frequency, 2 both.
struct Clear {
  std::optional<uint8_t> window;

  auto fields() const { return std::tie(window); }
  WBF_FIELD_EQUALITY(Clear)
};

/// Companion asks the sender to reply to a decode, as if double-clicked.
struct Reply {
  uint32_t time_ms{0};
  int32_t  snr{0};
  double   delta_time_s{0.0};
  uint32_t delta_freq_hz{0};
  Text     mode;
  Text     message;
  // extended
  std::optional<bool>    low_confidence;
  std::optional<uint8_t> modifiers;     ///< keyboard modifier mask

  auto fields() const {
    return std::tie(time_ms, snr, delta_time_s, delta_freq_hz, mode, message,
                    low_confidence, modifiers);
  }
  WBF_FIELD_EQUALITY(Reply)
};

/// A contact the operator just logged.
struct QsoLogged {
  DateTime date_time_off;
  Text     dx_call;
  Text     dx_grid;
  uint64_t tx_frequency_hz{0};
  Text     mode;
  Text     report_sent;
  Text     report_received;
  Text     tx_power;
  Text     comments;
  Text     name;
  // extended
  std::optional<DateTime> date_time_on;
  std::optional<Text>     operator_call;
  std::optional<Text>     my_call;
  std::optional<Text>     my_grid;
  std::optional<Text>     exchange_sent;
  std::optional<Text>     exchange_received;
  std::optional<Text>     adif_propagation_mode;

  auto fields() const {
    return std::tie(date_time_off, dx_call, dx_grid, tx_frequency_hz, mode, report_sent,
                    report_received, tx_power, comments, name, date_time_on, operator_call,
                    my_call, my_grid, exchange_sent, exchange_received, adif_propagation_mode);
  }
  WBF_FIELD_EQUALITY(QsoLogged)
};

/// Sender is shutting down.
struct Close {
  auto fields() const { return std::tie(); }
  WBF_FIELD_EQUALITY(Close)
};

/// Ask the sender to resend its current decode window.
struct Replay {
  auto fields() const { return std::tie(); }
  WBF_FIELD_EQUALITY(Replay)
};

struct HaltTx {
  bool auto_tx_only{false};

  auto fields() const { return std::tie(auto_tx_only); }
  WBF_FIELD_EQUALITY(HaltTx)
};

struct FreeText {
  Text text;
  // extended
  std::optional<bool> send;

  auto fields() const { return std::tie(text, send); }
  WBF_FIELD_EQUALITY(FreeText)
};

/// WSPR spot. The callsign comes pre-parsed, no message grammar involved.
struct WsprDecode {
  bool     is_new{true};
  uint32_t time_ms{0};
  int32_t  snr{0};
  double   delta_time_s{0.0};
  uint64_t frequency_hz{0};
  int32_t  drift{0};
  Text     callsign;
  Text     grid;
  int32_t  power_dbm{0};
  // extended
  std::optional<bool> off_air;

  auto fields() const {
    return std::tie(is_new, time_ms, snr, delta_time_s, frequency_hz, drift, callsign,
                    grid, power_dbm, off_air);
  }
  WBF_FIELD_EQUALITY(WsprDecode)
};

struct Location {
  Text location;    ///< Maidenhead grid

  auto fields() const { return std::tie(location); }
  WBF_FIELD_EQUALITY(Location)
};

/// The logged contact again, as one ADIF record.
struct LoggedAdif {
  Text adif_text;

  auto fields() const { return std::tie(adif_text); }
  WBF_FIELD_EQUALITY(LoggedAdif)
};

/**
 * @brief Recolor a callsign in the receiver's decode window.
 *
 * Invalid colors (both) clear an earlier highlight. `highlight_last_only`
 * limits the change to the most recent decode carrying the callsign.
 */
struct HighlightCallsign {
  Text  callsign;
  Color background_color{Color::invalid()};
  Color foreground_color{Color::invalid()};
  bool  highlight_last_only{true};

  auto fields() const {
    return std::tie(callsign, background_color, foreground_color, highlight_last_only);
  }
  WBF_FIELD_EQUALITY(HighlightCallsign)
};

struct SwitchConfiguration {
  Text configuration_name;

  auto fields() const { return std::tie(configuration_name); }
  WBF_FIELD_EQUALITY(SwitchConfiguration)
};

struct Configure {
  Text     mode;
  uint32_t frequency_tolerance{0};
  Text     submode;
  bool     fast_mode{false};
  uint32_t tr_period{0};
  uint32_t rx_df{0};
  Text     dx_call;
  Text     dx_grid;
  bool     generate_messages{false};

  auto fields() const {
    return std::tie(mode, frequency_tolerance, submode, fast_mode, tr_period, rx_df,
                    dx_call, dx_grid, generate_messages);
  }
  WBF_FIELD_EQUALITY(Configure)
};

#undef WBF_FIELD_EQUALITY

/// Variant alternatives in type code order: `payload.index()` is the wire code.
using Payload = std::variant<Heartbeat, Status, Decode, Clear, Reply, QsoLogged, Close, Replay,
                             HaltTx, FreeText, WsprDecode, Location, LoggedAdif,
                             HighlightCallsign, SwitchConfiguration, Configure>;

/// One telegram: header plus payload.
struct Telegram {
  uint32_t    schema_version{MAX_SCHEMA_VERSION};
  std::string id;
  Payload     payload;

  TelegramType type() const { return static_cast<TelegramType>(payload.index()); }

  template <class T> const T* get_if() const { return std::get_if<T>(&payload); }
  template <class T> bool is() const { return std::holds_alternative<T>(payload); }

  bool operator==(const Telegram& o) const {
    return schema_version == o.schema_version && id == o.id && payload == o.payload;
  }
  bool operator!=(const Telegram& o) const { return !(*this == o); }
};

/// `value` of a wire string, or `fallback` when null.
inline std::string text_or(const Text& t, const std::string& fallback = {}) {
  return t ? *t : fallback;
}

/// Same for a trailing string field: absent and null both give `fallback`.
inline std::string text_or(const std::optional<Text>& t, const std::string& fallback = {}) {
  return (t && *t) ? **t : fallback;
}

/**
 * @brief One-line `key=value` rendering for logs and the pretty printer.
 *
 * Example: `type=Decode id=WSJT-X schema=2 is_new=1 time_ms=3600000 snr=-12 ... message="CQ K1ABC FN42"`.
 * Absent trailing fields are left out; null strings print as `(null)`.
 */
std::string describe(const Telegram& t);

} // namespace wbf

#endif // WBF_TELEGRAM_HPP
