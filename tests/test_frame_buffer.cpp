#include <doctest/doctest.h>
#include "wbf/frame_buffer.hpp"

#include <vector>

using namespace wbf;

TEST_CASE("Integers are written big-endian") {
    FrameWriter w;
    w.write_u32(0xADBCCBDA);
    w.write_u16(0x0102);
    w.write_i32(-2);
    const std::vector<uint8_t> expect = {0xAD, 0xBC, 0xCB, 0xDA, 0x01, 0x02, 0xFF, 0xFF, 0xFF, 0xFE};
    CHECK(w.bytes() == expect);

    FrameReader r(w.bytes());
    CHECK(r.read_u32() == 0xADBCCBDAu);
    CHECK(r.read_u16() == 0x0102);
    CHECK(r.read_i32() == -2);
    CHECK(r.exhausted());
}

TEST_CASE("Null and empty strings are distinct on the wire") {
    FrameWriter w;
    w.write_string(std::nullopt);
    w.write_string(std::string());
    w.write_string(std::string("FT8"));
    const std::vector<uint8_t> expect = {
        0xFF, 0xFF, 0xFF, 0xFF,
        0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x03, 'F', 'T', '8'};
    CHECK(w.bytes() == expect);

    FrameReader r(w.bytes());
    CHECK_FALSE(r.read_string().has_value());
    Text empty = r.read_string();
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
    CHECK(r.read_string() == Text("FT8"));
}

TEST_CASE("String longer than the buffer is an InvalidLengthError at the prefix") {
    const std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x0A, 'a', 'b'};
    FrameReader r(bytes);
    try {
        r.read_string();
        FAIL("expected InvalidLengthError");
    } catch (const InvalidLengthError& e) {
        CHECK(e.offset() == 0);
        CHECK(e.declared() == 10);
        CHECK(e.available() == 2);
        CHECK(e.stage() == DecodeStage::Field);
    }
}

TEST_CASE("Negative length other than -1 is rejected") {
    const std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFE};
    FrameReader r(bytes);
    CHECK_THROWS_AS(r.read_string(), InvalidLengthError);
}

TEST_CASE("Short read reports offset, needed and available") {
    const std::vector<uint8_t> bytes = {0x01, 0x02, 0x03, 0x04, 0x05};
    FrameReader r(bytes);
    r.set_stage(DecodeStage::Header);
    CHECK(r.read_u32() == 0x01020304u);
    try {
        r.read_u32();
        FAIL("expected TruncatedBufferError");
    } catch (const TruncatedBufferError& e) {
        CHECK(e.stage() == DecodeStage::Header);
        CHECK(e.offset() == 4);
        CHECK(e.needed() == 4);
        CHECK(e.available() == 1);
    }
}

TEST_CASE("Color is eleven bytes: spec, alpha, rgb, pad") {
    FrameWriter w;
    w.write_color(Color::rgb(0xFFFF, 0xA0A0, 0x0000));
    const std::vector<uint8_t> expect = {
        0x01, 0xFF, 0xFF, 0xFF, 0xFF, 0xA0, 0xA0, 0x00, 0x00, 0x00, 0x00};
    CHECK(w.bytes() == expect);

    FrameReader r(w.bytes());
    CHECK(r.read_color() == Color::rgb(0xFFFF, 0xA0A0, 0x0000));
}

TEST_CASE("Invalid color keeps its spec byte") {
    FrameWriter w;
    w.write_color(Color::invalid());
    REQUIRE(w.bytes().size() == 11);
    CHECK(w.bytes()[0] == Color::SPEC_INVALID);
    FrameReader r(w.bytes());
    CHECK_FALSE(r.read_color().valid());
}

TEST_CASE("DateTime carries an offset only for timespec OFFSET") {
    DateTime utc;
    utc.julian_day = 2459000;
    utc.ms_since_midnight = 3600000;
    utc.timespec = DateTime::UTC;

    DateTime off = utc;
    off.timespec = DateTime::OFFSET;
    off.utc_offset_s = 7200;

    FrameWriter w;
    w.write_datetime(utc);
    CHECK(w.bytes().size() == 13);
    w.write_datetime(off);
    CHECK(w.bytes().size() == 13 + 17);

    FrameReader r(w.bytes());
    CHECK(r.read_datetime() == utc);
    CHECK(r.read_datetime() == off);
    CHECK(r.exhausted());
}

TEST_CASE("Rewind discards a partially read item") {
    const std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x01, 0x02};
    FrameReader r(bytes);
    r.read_u32();
    const std::size_t mark = r.offset();
    CHECK_THROWS_AS(r.read_u32(), TruncatedBufferError);
    r.rewind(mark);
    CHECK(r.offset() == mark);
    CHECK(r.remaining() == 1);
}

TEST_CASE("Optional is a flag byte followed by the value when set") {
    FrameWriter w;
    w.write_optional(std::optional<uint32_t>(7), [&w](uint32_t v) { w.write_u32(v); });
    w.write_optional(std::optional<uint32_t>(), [&w](uint32_t v) { w.write_u32(v); });
    const std::vector<uint8_t> expect = {0x01, 0x00, 0x00, 0x00, 0x07, 0x00};
    CHECK(w.bytes() == expect);

    FrameReader r(w.bytes());
    CHECK(r.read_optional([&r] { return r.read_u32(); }) == std::optional<uint32_t>(7));
    CHECK_FALSE(r.read_optional([&r] { return r.read_u32(); }).has_value());
    CHECK(r.exhausted());
}

TEST_CASE("A nonzero pad word survives read then write") {
    const std::vector<uint8_t> bytes = {
        0x01, 0xFF, 0xFF, 0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0x00, 0x07};
    FrameReader r(bytes);
    const Color c = r.read_color();
    CHECK(c.pad == 7);
    CHECK(c.red == 0x1234);

    FrameWriter w;
    w.write_color(c);
    CHECK(w.bytes() == bytes);
}
