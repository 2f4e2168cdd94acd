/**
 * @file telegram_fields.hpp
 * @brief Field-by-field walk over each telegram variant, shared by the text and JSON renderers.
 *
 * @details
 * `fields_of(sink, variant)` calls `sink.put(key, value)` once per field in
 * wire order. A sink provides put() overloads for Text, bool, the integer
 * widths, double, Color, DateTime and std::optional of those. Keys are the
 * short names used in log lines and in `wbf-srv --format json`.
 */
#ifndef WBF_TELEGRAM_FIELDS_HPP
#define WBF_TELEGRAM_FIELDS_HPP

#include <variant>

#include "wbf/telegram.hpp"

namespace wbf {
namespace fields {

template <class Sink>
void fields_of(Sink& l, const Heartbeat& t) {
  l.put("max_schema", t.max_schema_version);
  l.put("version", t.version);
  l.put("revision", t.revision);
}

template <class Sink>
void fields_of(Sink& l, const Status& t) {
  l.put("dial_hz", t.dial_frequency_hz);
  l.put("mode", t.mode);
  l.put("dx_call", t.dx_call);
  l.put("report", t.report);
  l.put("tx_mode", t.tx_mode);
  l.put("tx_enabled", t.tx_enabled);
  l.put("transmitting", t.transmitting);
  l.put("decoding", t.decoding);
  l.put("rx_df", t.rx_df);
  l.put("tx_df", t.tx_df);
  l.put("de_call", t.de_call);
  l.put("de_grid", t.de_grid);
  l.put("dx_grid", t.dx_grid);
  l.put("tx_watchdog", t.tx_watchdog);
  l.put("sub_mode", t.sub_mode);
  l.put("fast_mode", t.fast_mode);
  l.put("special_op", t.special_op_mode);
  l.put("frq_tolerance", t.frequency_tolerance);
  l.put("tr_period", t.tr_period);
  l.put("config_name", t.configuration_name);
  l.put("tx_message", t.tx_message);
}

template <class Sink>
void fields_of(Sink& l, const Decode& t) {
  l.put("is_new", t.is_new);
  l.put("time_ms", t.time_ms);
  l.put("snr", t.snr);
  l.put("dt", t.delta_time_s);
  l.put("df", t.delta_freq_hz);
  l.put("mode", t.mode);
  l.put("message", t.message);
  l.put("low_confidence", t.low_confidence);
  l.put("off_air", t.off_air);
}

template <class Sink>
void fields_of(Sink& l, const Clear& t) { l.put("window", t.window); }

template <class Sink>
void fields_of(Sink& l, const Reply& t) {
  l.put("time_ms", t.time_ms);
  l.put("snr", t.snr);
  l.put("dt", t.delta_time_s);
  l.put("df", t.delta_freq_hz);
  l.put("mode", t.mode);
  l.put("message", t.message);
  l.put("low_confidence", t.low_confidence);
  l.put("modifiers", t.modifiers);
}

template <class Sink>
void fields_of(Sink& l, const QsoLogged& t) {
  l.put("time_off", t.date_time_off);
  l.put("dx_call", t.dx_call);
  l.put("dx_grid", t.dx_grid);
  l.put("tx_hz", t.tx_frequency_hz);
  l.put("mode", t.mode);
  l.put("report_sent", t.report_sent);
  l.put("report_recv", t.report_received);
  l.put("tx_power", t.tx_power);
  l.put("comments", t.comments);
  l.put("name", t.name);
  l.put("time_on", t.date_time_on);
  l.put("operator_call", t.operator_call);
  l.put("my_call", t.my_call);
  l.put("my_grid", t.my_grid);
  l.put("exchange_sent", t.exchange_sent);
  l.put("exchange_recv", t.exchange_received);
  l.put("propmode", t.adif_propagation_mode);
}

template <class Sink>
void fields_of(Sink&, const Close&) {}
template <class Sink>
void fields_of(Sink&, const Replay&) {}
template <class Sink>
void fields_of(Sink& l, const HaltTx& t) { l.put("auto_tx_only", t.auto_tx_only); }

template <class Sink>
void fields_of(Sink& l, const FreeText& t) {
  l.put("text", t.text);
  l.put("send", t.send);
}

template <class Sink>
void fields_of(Sink& l, const WsprDecode& t) {
  l.put("is_new", t.is_new);
  l.put("time_ms", t.time_ms);
  l.put("snr", t.snr);
  l.put("dt", t.delta_time_s);
  l.put("frequency_hz", t.frequency_hz);
  l.put("drift", t.drift);
  l.put("callsign", t.callsign);
  l.put("grid", t.grid);
  l.put("power_dbm", t.power_dbm);
  l.put("off_air", t.off_air);
}

template <class Sink>
void fields_of(Sink& l, const Location& t)   { l.put("location", t.location); }
template <class Sink>
void fields_of(Sink& l, const LoggedAdif& t) { l.put("adif", t.adif_text); }

template <class Sink>
void fields_of(Sink& l, const HighlightCallsign& t) {
  l.put("callsign", t.callsign);
  l.put("bg", t.background_color);
  l.put("fg", t.foreground_color);
  l.put("last_only", t.highlight_last_only);
}

template <class Sink>
void fields_of(Sink& l, const SwitchConfiguration& t) { l.put("config_name", t.configuration_name); }

template <class Sink>
void fields_of(Sink& l, const Configure& t) {
  l.put("mode", t.mode);
  l.put("frq_tolerance", t.frequency_tolerance);
  l.put("submode", t.submode);
  l.put("fast_mode", t.fast_mode);
  l.put("tr_period", t.tr_period);
  l.put("rx_df", t.rx_df);
  l.put("dx_call", t.dx_call);
  l.put("dx_grid", t.dx_grid);
  l.put("gen_messages", t.generate_messages);
}

/// Header fields then payload fields.
template <class Sink>
void walk(Sink& l, const Telegram& t) {
  l.put("id", Text(t.id));
  l.put("schema", t.schema_version);
  std::visit([&l](const auto& p) { fields_of(l, p); }, t.payload);
}

} // namespace fields
} // namespace wbf

#endif // WBF_TELEGRAM_FIELDS_HPP
