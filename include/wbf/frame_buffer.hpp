/**
 * @file frame_buffer.hpp
 * @brief Big-endian cursor reader and append-only writer for the telegram wire types.
 *
 * @details
 * PURPOSE
 * -------
 * Everything the codec puts on the wire is built from a handful of primitive
 * shapes. This file owns those shapes and nothing else: no telegram layouts,
 * no type codes, no sockets.
 *
 * WIRE TYPES
 * ----------
 * | Type      | Bytes | Notes                                                    |
 * |-----------|-------|----------------------------------------------------------|
 * | u8/bool   | 1     | bool: nonzero is true                                    |
 * | u16       | 2     | big-endian                                               |
 * | u32/i32   | 4     | big-endian                                               |
 * | u64/i64   | 8     | big-endian                                               |
 * | f64       | 8     | IEEE-754 double, big-endian                              |
 * | string    | 4+n   | signed length n, then n UTF-8 bytes; -1 means null       |
 * | optional  | 1+... | bool flag, then the inner value only when the flag is set|
 * | Color     | 11    | spec u8, alpha/red/green/blue u16, u16 pad               |
 * | DateTime  | 13/17 | julian day i64, ms of day u32, timespec u8, [offset i32] |
 *
 * NULL VS EMPTY
 * -------------
 * The sender distinguishes a null string (length -1) from an empty string
 * (length 0). Above this layer a null string is `std::nullopt` of `wbf::Text`;
 * the empty string is `std::string{}`. Nobody above this file sees -1.
 *
 * ERRORS
 * ------
 * - Short read: `TruncatedBufferError`.
 * - Bad string length: `InvalidLengthError`.
 * Both carry the offset where the failing item began, and the reader's
 * current `DecodeStage`, which the codec sets as it walks the datagram.
 */
#ifndef WBF_FRAME_BUFFER_HPP
#define WBF_FRAME_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "wbf/errors.hpp"

namespace wbf {

/// Wire string: `std::nullopt` is the null string, distinct from "".
using Text = std::optional<std::string>;

/**
 * @brief QColor as carried on the wire.
 *
 * Only the RGB spec and the invalid spec are produced here. An invalid color
 * tells the receiver to drop a previously set highlight.
 */
struct Color {
  static constexpr uint8_t  SPEC_INVALID = 0;
  static constexpr uint8_t  SPEC_RGB     = 1;
  static constexpr uint16_t CMAX         = 0xFFFF;

  uint8_t  spec{SPEC_RGB};
  uint16_t alpha{CMAX};
  uint16_t red{0};
  uint16_t green{0};
  uint16_t blue{0};
  uint16_t pad{0};      ///< unused by the sender, kept so a color re-encodes byte for byte

  static Color rgb(uint16_t r, uint16_t g, uint16_t b) { return Color{SPEC_RGB, CMAX, r, g, b, 0}; }
  static Color invalid() { return Color{SPEC_INVALID, CMAX, 0, 0, 0, 0}; }

  bool valid() const { return spec != SPEC_INVALID; }

  bool operator==(const Color& o) const {
    return std::tie(spec, alpha, red, green, blue, pad) ==
           std::tie(o.spec, o.alpha, o.red, o.green, o.blue, o.pad);
  }
  bool operator!=(const Color& o) const { return !(*this == o); }
};

/// QDateTime as carried on the wire.
struct DateTime {
  static constexpr uint8_t LOCAL_TIME = 0;
  static constexpr uint8_t UTC        = 1;
  static constexpr uint8_t OFFSET     = 2;   ///< followed by a UTC offset in seconds
  static constexpr uint8_t TIME_ZONE  = 3;

  int64_t  julian_day{0};
  uint32_t ms_since_midnight{0};
  uint8_t  timespec{UTC};
  std::optional<int32_t> utc_offset_s;       ///< present iff timespec == OFFSET

  bool operator==(const DateTime& o) const {
    return std::tie(julian_day, ms_since_midnight, timespec, utc_offset_s) ==
           std::tie(o.julian_day, o.ms_since_midnight, o.timespec, o.utc_offset_s);
  }
  bool operator!=(const DateTime& o) const { return !(*this == o); }
};


/**
 * @brief Cursor over a received datagram.
 *
 * The reader never copies the buffer. The caller keeps the bytes alive for
 * the lifetime of the reader.
 */
class FrameReader {
public:
  FrameReader(const uint8_t* data, std::size_t len) : data_(data), len_(len) {}
  explicit FrameReader(const std::vector<uint8_t>& bytes) : FrameReader(bytes.data(), bytes.size()) {}

  uint8_t  read_u8();
  uint16_t read_u16();
  uint32_t read_u32();
  uint64_t read_u64();
  int32_t  read_i32();
  int64_t  read_i64();
  double   read_f64();
  bool     read_bool();
  Text     read_string();
  Color    read_color();
  DateTime read_datetime();

  /// Flag byte, then `read()` only when the flag is set.
  template <class Fn>
  auto read_optional(Fn read) -> std::optional<decltype(read())> {
    if (!read_bool()) return std::nullopt;
    return read();
  }

  std::size_t offset() const { return pos_; }
  std::size_t remaining() const { return len_ - pos_; }
  bool exhausted() const { return pos_ >= len_; }

  /// Move the cursor back to an earlier offset (used to discard a partial trailing field).
  void rewind(std::size_t offset) { if (offset <= len_) pos_ = offset; }

  void set_stage(DecodeStage stage) { stage_ = stage; }
  DecodeStage stage() const { return stage_; }

private:
  void need(std::size_t n, std::size_t start) const;
  uint64_t read_be(std::size_t n);

  const uint8_t* data_;
  std::size_t    len_;
  std::size_t    pos_{0};
  DecodeStage    stage_{DecodeStage::Field};
};


/// Append-only builder for an outbound datagram.
class FrameWriter {
public:
  FrameWriter() { buf_.reserve(128); }

  void write_u8(uint8_t v);
  void write_u16(uint16_t v);
  void write_u32(uint32_t v);
  void write_u64(uint64_t v);
  void write_i32(int32_t v);
  void write_i64(int64_t v);
  void write_f64(double v);
  void write_bool(bool v);
  void write_string(const Text& s);          ///< nullopt is written as length -1
  void write_color(const Color& c);
  void write_datetime(const DateTime& dt);

  template <class T, class Fn>
  void write_optional(const std::optional<T>& v, Fn write) {
    write_bool(v.has_value());
    if (v) write(*v);
  }

  const std::vector<uint8_t>& bytes() const { return buf_; }
  std::vector<uint8_t> take() { return std::move(buf_); }

private:
  void write_be(uint64_t v, std::size_t n);

  std::vector<uint8_t> buf_;
};

} // namespace wbf

#endif // WBF_FRAME_BUFFER_HPP
