// ============================================================================
// errors.cpp - implementation for errors.hpp
// ============================================================================
#include "wbf/errors.hpp"

namespace wbf {

const char* to_string(DecodeStage stage) {
  switch (stage) {
    case DecodeStage::Header:       return "header";
    case DecodeStage::TypeDispatch: return "type";
    case DecodeStage::Field:        return "field";
  }
  return "unknown";
}

TelegramError::TelegramError(const std::string& what, DecodeStage stage, std::size_t offset)
: std::runtime_error(what), stage_(stage), offset_(offset) {}

BadMagicError::BadMagicError(std::size_t available)
: TelegramError("bad magic", DecodeStage::Header, 0), available_(available) {}

UnknownTypeError::UnknownTypeError(uint32_t type_code, std::size_t offset)
: TelegramError("unknown telegram type " + std::to_string(type_code),
                DecodeStage::TypeDispatch, offset),
  type_code_(type_code) {}

TruncatedBufferError::TruncatedBufferError(DecodeStage stage, std::size_t offset,
                                           std::size_t needed, std::size_t available)
: TelegramError("truncated buffer: need " + std::to_string(needed) +
                " byte(s), have " + std::to_string(available),
                stage, offset),
  needed_(needed), available_(available) {}

InvalidLengthError::InvalidLengthError(DecodeStage stage, std::size_t offset,
                                       int64_t declared, std::size_t available)
: TelegramError("invalid length " + std::to_string(declared) +
                " (" + std::to_string(available) + " byte(s) left)",
                stage, offset),
  declared_(declared), available_(available) {}

} // namespace wbf
