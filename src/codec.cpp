// ============================================================================
// codec.cpp - implementation for codec.hpp
// Header layout and the decode/encode contract are documented in the .hpp.
// Field tables live in telegram.hpp. Tests: tests/test_codec.cpp
// ============================================================================
#include "wbf/codec.hpp"

#include <utility>

namespace wbf {
// ============================================================================
// Trailing (extended-schema) field helpers
// ============================================================================

namespace {

// ---------------------------------------------------------------------------
// TrailingReader
// --------------
// Reads extended fields in wire order until the datagram runs out.
// - Schema below EXTENDED_SCHEMA_VERSION: nothing is read, any bytes left
//   are extras and ignored, same as the writer never producing them.
// - Buffer empty at a field boundary: this and every later field stay nullopt.
// - Buffer ends inside a field: cursor goes back to the field start, the
//   partial bytes are ignored, and the same rule applies.
// - A string prefix that is negative (and not the null marker) is malformed,
//   not short. That one still propagates.
// ---------------------------------------------------------------------------
class TrailingReader {
public:
  TrailingReader(FrameReader& r, uint32_t schema)
  : r_(r), done_(schema < EXTENDED_SCHEMA_VERSION) {}

  template <class T, class Fn>
  void read(std::optional<T>& field, Fn&& fn) {
    if (done_ || r_.exhausted()) { done_ = true; return; }
    const std::size_t start = r_.offset();
    try {
      field = fn(r_);
    } catch (const TruncatedBufferError&) {
      stop_at(start);
    } catch (const InvalidLengthError& e) {
      if (e.declared() < 0) throw;
      stop_at(start);
    }
  }

private:
  void stop_at(std::size_t start) {
    r_.rewind(start);
    done_ = true;
  }

  FrameReader& r_;
  bool done_;
};

// Writes extended fields while the schema allows them and nothing is missing.
class TrailingWriter {
public:
  TrailingWriter(FrameWriter& w, uint32_t schema)
  : w_(w), open_(schema >= EXTENDED_SCHEMA_VERSION) {}

  template <class T, class Fn>
  void write(const std::optional<T>& field, Fn&& fn) {
    if (!open_) return;
    if (!field) { open_ = false; return; }
    fn(w_, *field);
  }

private:
  FrameWriter& w_;
  bool open_;
};

// Small adapters so the field tables below read as one line per field.
auto rd_u8     = [](FrameReader& r) { return r.read_u8(); };
auto rd_u32    = [](FrameReader& r) { return r.read_u32(); };
auto rd_bool   = [](FrameReader& r) { return r.read_bool(); };
auto rd_text   = [](FrameReader& r) { return r.read_string(); };
auto rd_dt     = [](FrameReader& r) { return r.read_datetime(); };

auto wr_u8     = [](FrameWriter& w, uint8_t v) { w.write_u8(v); };
auto wr_u32    = [](FrameWriter& w, uint32_t v) { w.write_u32(v); };
auto wr_bool   = [](FrameWriter& w, bool v) { w.write_bool(v); };
auto wr_text   = [](FrameWriter& w, const Text& v) { w.write_string(v); };
auto wr_dt     = [](FrameWriter& w, const DateTime& v) { w.write_datetime(v); };


// ============================================================================
// Per-variant readers
// ============================================================================
// One function per type code, hand-written so the wire order is visible at a
// glance and greppable against telegram.hpp.

Heartbeat read_heartbeat(FrameReader& r, uint32_t schema) {
  Heartbeat t;
  t.max_schema_version = r.read_u32();
  TrailingReader ext(r, schema);
  ext.read(t.version, rd_text);
  ext.read(t.revision, rd_text);
  return t;
}

Status read_status(FrameReader& r, uint32_t schema) {
  Status t;
  t.dial_frequency_hz = r.read_u64();
  t.mode              = r.read_string();
  t.dx_call           = r.read_string();
  t.report            = r.read_string();
  t.tx_mode           = r.read_string();
  t.tx_enabled        = r.read_bool();
  t.transmitting      = r.read_bool();
  t.decoding          = r.read_bool();
  TrailingReader ext(r, schema);
  ext.read(t.rx_df, rd_u32);
  ext.read(t.tx_df, rd_u32);
  ext.read(t.de_call, rd_text);
  ext.read(t.de_grid, rd_text);
  ext.read(t.dx_grid, rd_text);
  ext.read(t.tx_watchdog, rd_bool);
  ext.read(t.sub_mode, rd_text);
  ext.read(t.fast_mode, rd_bool);
  ext.read(t.special_op_mode, rd_u8);
  ext.read(t.frequency_tolerance, rd_u32);
  ext.read(t.tr_period, rd_u32);
  ext.read(t.configuration_name, rd_text);
  ext.read(t.tx_message, rd_text);
  return t;
}

Decode read_decode(FrameReader& r, uint32_t schema) {
  Decode t;
  t.is_new        = r.read_bool();
  t.time_ms       = r.read_u32();
  t.snr           = r.read_i32();
  t.delta_time_s  = r.read_f64();
  t.delta_freq_hz = r.read_u32();
  t.mode          = r.read_string();
  t.message       = r.read_string();
  TrailingReader ext(r, schema);
  ext.read(t.low_confidence, rd_bool);
  ext.read(t.off_air, rd_bool);
  return t;
}

Clear read_clear(FrameReader& r, uint32_t schema) {
  Clear t;
  TrailingReader ext(r, schema);
  ext.read(t.window, rd_u8);
  return t;
}

Reply read_reply(FrameReader& r, uint32_t schema) {
  Reply t;
  t.time_ms       = r.read_u32();
  t.snr           = r.read_i32();
  t.delta_time_s  = r.read_f64();
  t.delta_freq_hz = r.read_u32();
  t.mode          = r.read_string();
  t.message       = r.read_string();
  TrailingReader ext(r, schema);
  ext.read(t.low_confidence, rd_bool);
  ext.read(t.modifiers, rd_u8);
  return t;
}

QsoLogged read_qso_logged(FrameReader& r, uint32_t schema) {
  QsoLogged t;
  t.date_time_off   = r.read_datetime();
  t.dx_call         = r.read_string();
  t.dx_grid         = r.read_string();
  t.tx_frequency_hz = r.read_u64();
  t.mode            = r.read_string();
  t.report_sent     = r.read_string();
  t.report_received = r.read_string();
  t.tx_power        = r.read_string();
  t.comments        = r.read_string();
  t.name            = r.read_string();
  TrailingReader ext(r, schema);
  ext.read(t.date_time_on, rd_dt);
  ext.read(t.operator_call, rd_text);
  ext.read(t.my_call, rd_text);
  ext.read(t.my_grid, rd_text);
  ext.read(t.exchange_sent, rd_text);
  ext.read(t.exchange_received, rd_text);
  ext.read(t.adif_propagation_mode, rd_text);
  return t;
}

HaltTx read_halt_tx(FrameReader& r) {
  HaltTx t;
  t.auto_tx_only = r.read_bool();
  return t;
}

FreeText read_free_text(FrameReader& r, uint32_t schema) {
  FreeText t;
  t.text = r.read_string();
  TrailingReader ext(r, schema);
  ext.read(t.send, rd_bool);
  return t;
}

WsprDecode read_wspr_decode(FrameReader& r, uint32_t schema) {
  WsprDecode t;
  t.is_new       = r.read_bool();
  t.time_ms      = r.read_u32();
  t.snr          = r.read_i32();
  t.delta_time_s = r.read_f64();
  t.frequency_hz = r.read_u64();
  t.drift        = r.read_i32();
  t.callsign     = r.read_string();
  t.grid         = r.read_string();
  t.power_dbm    = r.read_i32();
  TrailingReader ext(r, schema);
  ext.read(t.off_air, rd_bool);
  return t;
}

HighlightCallsign read_highlight(FrameReader& r) {
  HighlightCallsign t;
  t.callsign            = r.read_string();
  t.background_color    = r.read_color();
  t.foreground_color    = r.read_color();
  t.highlight_last_only = r.read_bool();
  return t;
}

Configure read_configure(FrameReader& r) {
  Configure t;
  t.mode                = r.read_string();
  t.frequency_tolerance = r.read_u32();
  t.submode             = r.read_string();
  t.fast_mode           = r.read_bool();
  t.tr_period           = r.read_u32();
  t.rx_df               = r.read_u32();
  t.dx_call             = r.read_string();
  t.dx_grid             = r.read_string();
  t.generate_messages   = r.read_bool();
  return t;
}

// ---------------------------------------------------------------------------
// read_payload()
// --------------
// Type code -> variant. The default branch is the only place an unknown code
// can go, and it throws before touching payload bytes.
// ---------------------------------------------------------------------------
Payload read_payload(uint32_t code, std::size_t code_offset, uint32_t schema, FrameReader& r) {
  switch (static_cast<TelegramType>(code)) {
    case TelegramType::Heartbeat:           return read_heartbeat(r, schema);
    case TelegramType::Status:              return read_status(r, schema);
    case TelegramType::Decode:              return read_decode(r, schema);
    case TelegramType::Clear:               return read_clear(r, schema);
    case TelegramType::Reply:               return read_reply(r, schema);
    case TelegramType::QsoLogged:           return read_qso_logged(r, schema);
    case TelegramType::Close:               return Close{};
    case TelegramType::Replay:              return Replay{};
    case TelegramType::HaltTx:              return read_halt_tx(r);
    case TelegramType::FreeText:            return read_free_text(r, schema);
    case TelegramType::WsprDecode:          return read_wspr_decode(r, schema);
    case TelegramType::Location:            return Location{r.read_string()};
    case TelegramType::LoggedAdif:          return LoggedAdif{r.read_string()};
    case TelegramType::HighlightCallsign:   return read_highlight(r);
    case TelegramType::SwitchConfiguration: return SwitchConfiguration{r.read_string()};
    case TelegramType::Configure:           return read_configure(r);
  }
  throw UnknownTypeError(code, code_offset);
}


// ============================================================================
// Per-variant writers
// ============================================================================

void write_payload(FrameWriter& w, const Heartbeat& t, uint32_t schema) {
  w.write_u32(t.max_schema_version);
  TrailingWriter ext(w, schema);
  ext.write(t.version, wr_text);
  ext.write(t.revision, wr_text);
}

void write_payload(FrameWriter& w, const Status& t, uint32_t schema) {
  w.write_u64(t.dial_frequency_hz);
  w.write_string(t.mode);
  w.write_string(t.dx_call);
  w.write_string(t.report);
  w.write_string(t.tx_mode);
  w.write_bool(t.tx_enabled);
  w.write_bool(t.transmitting);
  w.write_bool(t.decoding);
  TrailingWriter ext(w, schema);
  ext.write(t.rx_df, wr_u32);
  ext.write(t.tx_df, wr_u32);
  ext.write(t.de_call, wr_text);
  ext.write(t.de_grid, wr_text);
  ext.write(t.dx_grid, wr_text);
  ext.write(t.tx_watchdog, wr_bool);
  ext.write(t.sub_mode, wr_text);
  ext.write(t.fast_mode, wr_bool);
  ext.write(t.special_op_mode, wr_u8);
  ext.write(t.frequency_tolerance, wr_u32);
  ext.write(t.tr_period, wr_u32);
  ext.write(t.configuration_name, wr_text);
  ext.write(t.tx_message, wr_text);
}

void write_payload(FrameWriter& w, const Decode& t, uint32_t schema) {
  w.write_bool(t.is_new);
  w.write_u32(t.time_ms);
  w.write_i32(t.snr);
  w.write_f64(t.delta_time_s);
  w.write_u32(t.delta_freq_hz);
  w.write_string(t.mode);
  w.write_string(t.message);
  TrailingWriter ext(w, schema);
  ext.write(t.low_confidence, wr_bool);
  ext.write(t.off_air, wr_bool);
}

void write_payload(FrameWriter& w, const Clear& t, uint32_t schema) {
  TrailingWriter ext(w, schema);
  ext.write(t.window, wr_u8);
}

void write_payload(FrameWriter& w, const Reply& t, uint32_t schema) {
  w.write_u32(t.time_ms);
  w.write_i32(t.snr);
  w.write_f64(t.delta_time_s);
  w.write_u32(t.delta_freq_hz);
  w.write_string(t.mode);
  w.write_string(t.message);
  TrailingWriter ext(w, schema);
  ext.write(t.low_confidence, wr_bool);
  ext.write(t.modifiers, wr_u8);
}

void write_payload(FrameWriter& w, const QsoLogged& t, uint32_t schema) {
  w.write_datetime(t.date_time_off);
  w.write_string(t.dx_call);
  w.write_string(t.dx_grid);
  w.write_u64(t.tx_frequency_hz);
  w.write_string(t.mode);
  w.write_string(t.report_sent);
  w.write_string(t.report_received);
  w.write_string(t.tx_power);
  w.write_string(t.comments);
  w.write_string(t.name);
  TrailingWriter ext(w, schema);
  ext.write(t.date_time_on, wr_dt);
  ext.write(t.operator_call, wr_text);
  ext.write(t.my_call, wr_text);
  ext.write(t.my_grid, wr_text);
  ext.write(t.exchange_sent, wr_text);
  ext.write(t.exchange_received, wr_text);
  ext.write(t.adif_propagation_mode, wr_text);
}

void write_payload(FrameWriter&, const Close&, uint32_t) {}
void write_payload(FrameWriter&, const Replay&, uint32_t) {}

void write_payload(FrameWriter& w, const HaltTx& t, uint32_t) {
  w.write_bool(t.auto_tx_only);
}

void write_payload(FrameWriter& w, const FreeText& t, uint32_t schema) {
  w.write_string(t.text);
  TrailingWriter ext(w, schema);
  ext.write(t.send, wr_bool);
}

void write_payload(FrameWriter& w, const WsprDecode& t, uint32_t schema) {
  w.write_bool(t.is_new);
  w.write_u32(t.time_ms);
  w.write_i32(t.snr);
  w.write_f64(t.delta_time_s);
  w.write_u64(t.frequency_hz);
  w.write_i32(t.drift);
  w.write_string(t.callsign);
  w.write_string(t.grid);
  w.write_i32(t.power_dbm);
  TrailingWriter ext(w, schema);
  ext.write(t.off_air, wr_bool);
}

void write_payload(FrameWriter& w, const Location& t, uint32_t)   { w.write_string(t.location); }
void write_payload(FrameWriter& w, const LoggedAdif& t, uint32_t) { w.write_string(t.adif_text); }

void write_payload(FrameWriter& w, const HighlightCallsign& t, uint32_t) {
  w.write_string(t.callsign);
  w.write_color(t.background_color);
  w.write_color(t.foreground_color);
  w.write_bool(t.highlight_last_only);
}

void write_payload(FrameWriter& w, const SwitchConfiguration& t, uint32_t) {
  w.write_string(t.configuration_name);
}

void write_payload(FrameWriter& w, const Configure& t, uint32_t) {
  w.write_string(t.mode);
  w.write_u32(t.frequency_tolerance);
  w.write_string(t.submode);
  w.write_bool(t.fast_mode);
  w.write_u32(t.tr_period);
  w.write_u32(t.rx_df);
  w.write_string(t.dx_call);
  w.write_string(t.dx_grid);
  w.write_bool(t.generate_messages);
}

} // namespace


// ============================================================================
// Public API
// ============================================================================

// ---------------------------------------------------------------------------
// decode()
// --------
// Phases:
//   1) magic           (BadMagicError, never a partial match)
//   2) schema, type    (TruncatedBufferError at stage header)
//   3) type check      (UnknownTypeError, before the id or payload is used)
//   4) id              (null id is an InvalidLengthError at stage header)
//   5) payload         (stage field)
// ---------------------------------------------------------------------------
Telegram decode(const uint8_t* data, std::size_t len) {
  FrameReader r(data, len);
  r.set_stage(DecodeStage::Header);

  if (len < 4 || r.read_u32() != MAGIC) {
    throw BadMagicError(len);
  }

  Telegram t;
  t.schema_version = r.read_u32();

  const std::size_t code_offset = r.offset();
  const uint32_t code = r.read_u32();
  if (code > static_cast<uint32_t>(TelegramType::Configure)) {
    throw UnknownTypeError(code, code_offset);
  }

  const std::size_t id_offset = r.offset();
  Text id = r.read_string();
  if (!id) {
    throw InvalidLengthError(DecodeStage::Header, id_offset, -1, r.remaining());
  }
  t.id = std::move(*id);

  r.set_stage(DecodeStage::Field);
  t.payload = read_payload(code, code_offset, t.schema_version, r);
  return t;
}

Telegram decode(const std::vector<uint8_t>& bytes) {
  return decode(bytes.data(), bytes.size());
}

std::vector<uint8_t> encode(const Telegram& t) {
  FrameWriter w;
  w.write_u32(MAGIC);
  w.write_u32(t.schema_version);
  w.write_u32(static_cast<uint32_t>(t.type()));
  w.write_string(Text(t.id));
  const uint32_t schema = t.schema_version;
  std::visit([&w, schema](const auto& p) { write_payload(w, p, schema); }, t.payload);
  return w.take();
}

} // namespace wbf
