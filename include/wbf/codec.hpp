/**
 * @file codec.hpp
 * @brief Bit-exact encode/decode of WSJT-X UDP telegrams.
 *
 * @details
 * HEADER LAYOUT
 * -------------
 * ```
 *  offset  size  field
 *  0       4     magic           0xADBCCBDA
 *  4       4     schema_version  u32
 *  8       4     type code       u32 (TelegramType)
 *  12      4+n   id              string, never null
 *  ...           payload         per variant, see telegram.hpp
 * ```
 *
 * DECODE
 * ------
 * - Wrong magic (or fewer than 4 bytes): `BadMagicError`.
 * - Truncated header: `TruncatedBufferError` with stage header.
 * - Unknown type code: `UnknownTypeError`, raised before any payload byte is read.
 * - Mandatory field short: `TruncatedBufferError` / `InvalidLengthError`, stage field.
 * - Extended fields are read only when `schema_version >= EXTENDED_SCHEMA_VERSION`;
 *   below that, bytes after the mandatory fields are extras and ignored.
 * - Extended fields are read while bytes remain. Once the datagram ends
 *   (at a field boundary or inside a field) that field and all later ones are
 *   `std::nullopt`. Bytes after the last known field are ignored.
 *
 * ENCODE
 * ------
 * - Writes the header and the mandatory fields.
 * - Writes extended fields only when `schema_version >= EXTENDED_SCHEMA_VERSION`,
 *   in order, stopping at the first absent one (the wire has no way to skip).
 * - Pure function of the telegram: equal telegrams give equal bytes.
 */
#ifndef WBF_CODEC_HPP
#define WBF_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "wbf/telegram.hpp"

namespace wbf {

/// Protocol family marker, first four bytes of every datagram.
constexpr uint32_t MAGIC = 0xADBCCBDA;

/// Decode one datagram. Throws a `TelegramError` subtype on failure.
Telegram decode(const uint8_t* data, std::size_t len);
Telegram decode(const std::vector<uint8_t>& bytes);

/// Encode one telegram at its own `schema_version`.
std::vector<uint8_t> encode(const Telegram& t);

} // namespace wbf

#endif // WBF_CODEC_HPP
