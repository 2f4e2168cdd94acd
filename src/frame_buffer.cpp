// ============================================================================
// frame_buffer.cpp - implementation for frame_buffer.hpp
// For the wire type table see the matching .hpp. Tests: tests/test_frame_buffer.cpp
// ============================================================================
#include "wbf/frame_buffer.hpp"

#include <cstring>   // std::memcpy for the double <-> u64 bit copy

namespace wbf {

static constexpr int32_t NULL_STRING_LENGTH = -1;

// ---------------------------------------------------------------------------
// need()
// ------
// Guard for every fixed-width read. `start` is the offset of the item being
// read, which is what the error reports (not the cursor mid-item).
// ---------------------------------------------------------------------------
void FrameReader::need(std::size_t n, std::size_t start) const {
  if (remaining() < n) {
    throw TruncatedBufferError(stage_, start, n, remaining());
  }
}

// Assemble n bytes, most significant first.
uint64_t FrameReader::read_be(std::size_t n) {
  need(n, pos_);
  uint64_t v = 0;
  for (std::size_t i = 0; i < n; ++i) {
    v = (v << 8) | data_[pos_ + i];
  }
  pos_ += n;
  return v;
}

uint8_t  FrameReader::read_u8()  { return static_cast<uint8_t>(read_be(1)); }
uint16_t FrameReader::read_u16() { return static_cast<uint16_t>(read_be(2)); }
uint32_t FrameReader::read_u32() { return static_cast<uint32_t>(read_be(4)); }
uint64_t FrameReader::read_u64() { return read_be(8); }
int32_t  FrameReader::read_i32() { return static_cast<int32_t>(read_u32()); }
int64_t  FrameReader::read_i64() { return static_cast<int64_t>(read_u64()); }
bool     FrameReader::read_bool() { return read_u8() != 0; }

double FrameReader::read_f64() {
  const uint64_t bits = read_u64();
  double v;
  std::memcpy(&v, &bits, sizeof v);
  return v;
}

// ---------------------------------------------------------------------------
// read_string()
// -------------
// Length prefix is read as signed 32-bit:
//   -1      -> null string (std::nullopt)
//   0..left -> that many bytes
//   other   -> InvalidLengthError at the prefix offset
// On failure the error carries the prefix offset; callers that recover
// use rewind().
// ---------------------------------------------------------------------------
Text FrameReader::read_string() {
  const std::size_t start = pos_;
  const int32_t len = read_i32();
  if (len == NULL_STRING_LENGTH) return std::nullopt;
  if (len < 0 || static_cast<std::size_t>(len) > remaining()) {
    throw InvalidLengthError(stage_, start, len, remaining());
  }
  std::string s(reinterpret_cast<const char*>(data_ + pos_), static_cast<std::size_t>(len));
  pos_ += static_cast<std::size_t>(len);
  return s;
}

Color FrameReader::read_color() {
  const std::size_t start = pos_;
  need(11, start);                 // whole color or nothing
  Color c;
  c.spec  = read_u8();
  c.alpha = read_u16();
  c.red   = read_u16();
  c.green = read_u16();
  c.blue  = read_u16();
  c.pad   = read_u16();
  return c;
}

DateTime FrameReader::read_datetime() {
  const std::size_t start = pos_;
  need(13, start);
  DateTime dt;
  dt.julian_day        = read_i64();
  dt.ms_since_midnight = read_u32();
  dt.timespec          = read_u8();
  if (dt.timespec == DateTime::OFFSET) {
    if (remaining() < 4) {
      throw TruncatedBufferError(stage_, start, 17, remaining() + 13);
    }
    dt.utc_offset_s = read_i32();
  }
  return dt;
}


// ============================================================================
// FrameWriter
// ============================================================================

void FrameWriter::write_be(uint64_t v, std::size_t n) {
  for (std::size_t i = n; i-- > 0;) {
    buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

void FrameWriter::write_u8(uint8_t v)   { buf_.push_back(v); }
void FrameWriter::write_u16(uint16_t v) { write_be(v, 2); }
void FrameWriter::write_u32(uint32_t v) { write_be(v, 4); }
void FrameWriter::write_u64(uint64_t v) { write_be(v, 8); }
void FrameWriter::write_i32(int32_t v)  { write_u32(static_cast<uint32_t>(v)); }
void FrameWriter::write_i64(int64_t v)  { write_u64(static_cast<uint64_t>(v)); }
void FrameWriter::write_bool(bool v)    { write_u8(v ? 1 : 0); }

void FrameWriter::write_f64(double v) {
  uint64_t bits;
  std::memcpy(&bits, &v, sizeof bits);
  write_u64(bits);
}

void FrameWriter::write_string(const Text& s) {
  if (!s) {
    write_i32(NULL_STRING_LENGTH);
    return;
  }
  write_u32(static_cast<uint32_t>(s->size()));
  buf_.insert(buf_.end(), s->begin(), s->end());
}

void FrameWriter::write_color(const Color& c) {
  write_u8(c.spec);
  write_u16(c.alpha);
  write_u16(c.red);
  write_u16(c.green);
  write_u16(c.blue);
  write_u16(c.pad);
}

void FrameWriter::write_datetime(const DateTime& dt) {
  write_i64(dt.julian_day);
  write_u32(dt.ms_since_midnight);
  write_u8(dt.timespec);
  if (dt.timespec == DateTime::OFFSET) {
    write_i32(dt.utc_offset_s.value_or(0));
  }
}

} // namespace wbf
