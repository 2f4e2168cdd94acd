/**
 * @file errors.hpp
 * @brief Typed decode errors for the telegram codec, plus the lookup failure of the engine layer.
 *
 * @details
 * Every failure the codec can produce is one of four types, all derived from
 * `wbf::TelegramError`. Each error knows:
 *   - the **stage** it happened in (header, type dispatch, field read), and
 *   - the **byte offset** where the failing item started.
 *
 * That is enough for a log line to point at the exact byte of a protocol
 * mismatch without hex-dumping the whole datagram.
 *
 * @par Taxonomy
 * | Error                    | Stage          | Extra context               |
 * |--------------------------|----------------|-----------------------------|
 * | BadMagicError            | header         | bytes available             |
 * | UnknownTypeError         | type dispatch  | raw type code               |
 * | TruncatedBufferError     | header / field | bytes needed / available    |
 * | InvalidLengthError       | header / field | declared length / available |
 *
 * `LookupUnavailableError` is **not** a codec error. It comes from a contact
 * lookup collaborator and travels up through the worked-before engine.
 *
 * @par Policy
 * - Codec errors are local to one datagram. The dispatcher logs and drops.
 * - Nothing here is fatal to the process.
 */
#ifndef WBF_ERRORS_HPP
#define WBF_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace wbf {

/// Where in the datagram a decode failed.
enum class DecodeStage : uint8_t {
  Header       = 0,   ///< magic, schema version, type code, id
  TypeDispatch = 1,   ///< type code not in the variant table
  Field        = 2    ///< a variant field
};

/// Short lowercase name for logs ("header", "type", "field").
const char* to_string(DecodeStage stage);

/**
 * @brief Base of all codec errors.
 *
 * `what()` carries a short human text. `stage()` and `offset()` carry the
 * machine-readable position.
 */
class TelegramError : public std::runtime_error {
public:
  TelegramError(const std::string& what, DecodeStage stage, std::size_t offset);

  DecodeStage stage() const noexcept { return stage_; }
  std::size_t offset() const noexcept { return offset_; }

private:
  DecodeStage stage_;
  std::size_t offset_;
};

/// First four bytes are not 0xADBCCBDA (or there are fewer than four).
class BadMagicError : public TelegramError {
public:
  explicit BadMagicError(std::size_t available);

  std::size_t available() const noexcept { return available_; }

private:
  std::size_t available_;
};

/// Header parsed, but the type code names no known variant.
class UnknownTypeError : public TelegramError {
public:
  UnknownTypeError(uint32_t type_code, std::size_t offset);

  uint32_t type_code() const noexcept { return type_code_; }

private:
  uint32_t type_code_;
};

/// A fixed-width read ran past the end of the buffer.
class TruncatedBufferError : public TelegramError {
public:
  TruncatedBufferError(DecodeStage stage, std::size_t offset,
                       std::size_t needed, std::size_t available);

  std::size_t needed() const noexcept { return needed_; }
  std::size_t available() const noexcept { return available_; }

private:
  std::size_t needed_;
  std::size_t available_;
};

/**
 * @brief A string length prefix is not usable.
 *
 * Either negative but not -1 (the null marker), larger than what is left in
 * the buffer, or -1 where a null is not allowed (the header id).
 */
class InvalidLengthError : public TelegramError {
public:
  InvalidLengthError(DecodeStage stage, std::size_t offset,
                     int64_t declared, std::size_t available);

  int64_t declared() const noexcept { return declared_; }
  std::size_t available() const noexcept { return available_; }

private:
  int64_t declared_;
  std::size_t available_;
};

/// The contact log behind a ContactLookup could not answer.
class LookupUnavailableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace wbf

#endif // WBF_ERRORS_HPP
