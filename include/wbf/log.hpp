/**
 * @file log.hpp
 * @brief Leveled, line-oriented logging to stderr with a swappable sink.
 *
 * @details
 * Lines look like the rest of our stderr output:
 * ```
 *   warn: drop datagram peer=127.0.0.1:50214 stage=header offset=0 reason="bad magic"
 * ```
 * `level: message` with grep-friendly `key=value` pairs. Call sites build
 * the message with an ostringstream; this file only filters and writes.
 *
 * - Threshold defaults to Info. Lines below it are dropped.
 * - The default sink writes to std::cerr under a mutex, so lines from
 *   different threads never interleave.
 * - Tests install their own sink to capture records.
 */
#ifndef WBF_LOG_HPP
#define WBF_LOG_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace wbf {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

using LogSink = std::function<void(LogLevel, const std::string&)>;

const char* to_string(LogLevel level);

/// Parse "debug" / "info" / "warn" / "error". Returns false on anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

void set_log_level(LogLevel level);
LogLevel log_level();

/// Replace the sink. An empty function restores the stderr sink.
void set_log_sink(LogSink sink);

/// Emit one line if `level` passes the threshold.
void log(LogLevel level, const std::string& message);

} // namespace wbf

#endif // WBF_LOG_HPP
