/**
 * @file telegram_json.hpp
 * @brief nlohmann::json rendering of telegrams for `wbf-srv --format json`.
 *
 * Same keys as describe(). Null strings become JSON null, absent trailing
 * fields are left out, colors are "#rrggbb" (null when invalid), date/times
 * are objects `{ "julian_day", "ms", "timespec" [, "utc_offset_s"] }`.
 */
#pragma once
#include "nlohmann/json.hpp"

#include <string>

#include "wbf/dispatcher.hpp"   // wbf::Endpoint
#include "wbf/telegram.hpp"

namespace wbf {

/// `{ "type": "...", "id": ..., "schema": ..., <fields> }`
nlohmann::json telegram_to_json(const Telegram& t);

/// telegram_to_json() plus `"peer": "address:port"`.
nlohmann::json telegram_to_json(const Endpoint& peer, const Telegram& t);

/// One compact JSON line. Strings are raw bytes off the wire; invalid UTF-8
/// is written as U+FFFD instead of throwing.
std::string telegram_json_line(const Endpoint& peer, const Telegram& t);

} // namespace wbf
