/**
 * @file config.hpp
 * @brief wbf-srv settings: built-in defaults, JSON config file, environment.
 *
 * @details
 * Precedence, lowest first:
 *   1) defaults in ServerConfig
 *   2) config file ($XDG_CONFIG_HOME/wbf/config.json unless --config says otherwise)
 *   3) environment: WBF_PATH, WBF_HIGHLIGHT, WBF_PORT
 *   4) command line (applied by cli/main.cpp on top of the result)
 *
 * CONFIG FILE
 * -----------
 * @code
 * {
 *   "bind": "0.0.0.0",
 *   "port": 2237,
 *   "id": "wbf-srv",
 *   "adif": "/home/op/.local/share/WSJT-X/wsjtx_log.adi",
 *   "dxcc_table": "/home/op/.config/wbf/prefixes.json",
 *   "highlight_dxcc": ["230", "291"],
 *   "dxcc_confirmed_only": false,
 *   "reply_heartbeat": true,
 *   "exit_on_close": false,
 *   "format": "pretty",
 *   "log_level": "info",
 *   "palette": {
 *     "new_dxcc":  { "fg": "#000000", "bg": "#ff00ff" },
 *     "highlight": { "fg": null,      "bg": "#ffa000" }
 *   }
 * }
 * @endcode
 * Every key is optional. Unknown keys are ignored. A color of `null` is the
 * invalid color (the sender's default).
 */
#pragma once
#include <cstdint>
#include <functional>
#include <set>
#include <string>

#include "wbf/worked_before.hpp"   // Palette, Color

namespace wbf {

struct ServerConfig {
  std::string bind{"127.0.0.1"};
  uint16_t    port{2237};
  std::string id{"wbf-srv"};
  std::string adif_path;                 ///< empty until defaults are resolved
  std::string dxcc_table;
  std::set<std::string> highlight_dxcc;
  bool        dxcc_confirmed_only{false};
  bool        reply_heartbeat{true};
  bool        exit_on_close{false};
  std::string format{"pretty"};          ///< pretty | json | none
  std::string log_level{"info"};
  Palette     palette;
};

/// getenv-shaped lookup, swappable in tests.
using EnvLookup = std::function<const char*(const char*)>;

/// Defaults with adif_path resolved against $HOME.
ServerConfig default_config(const EnvLookup& env);

/// $XDG_CONFIG_HOME/wbf/config.json, or ~/.config/wbf/config.json.
std::string default_config_path(const EnvLookup& env);

/// Apply a JSON document on top of @p cfg. False (logged) on a parse error or a bad value.
bool apply_config_text(const std::string& text, ServerConfig& cfg);

/**
 * @brief Apply a config file on top of @p cfg.
 * @param required  when false a missing file is not an error
 */
bool load_config_file(const std::string& path, ServerConfig& cfg, bool required);

/// Apply WBF_PATH, WBF_HIGHLIGHT, WBF_PORT. False (logged) on a bad WBF_PORT.
bool apply_env(ServerConfig& cfg, const EnvLookup& env);

/// "#rrggbb" -> 16-bit-per-channel RGB color. False on anything else.
bool parse_color(const std::string& text, Color& out);

/// Split a comma separated entity list, trimming blanks and padding numbers to three digits.
std::set<std::string> parse_entity_list(const std::string& text);

/// Three-digit form of an entity code ("6" -> "006"); other text is returned trimmed.
std::string normalize_entity(const std::string& code);

} // namespace wbf
