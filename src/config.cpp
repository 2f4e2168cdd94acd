// ============================================================================
// config.cpp - implementation for config.hpp
// Tests: tests/test_config.cpp
// ============================================================================
#include "config.hpp"
#include "wbf/log.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace wbf {

static std::string env_or(const EnvLookup& env, const char* name, const std::string& fallback) {
  const char* v = env ? env(name) : nullptr;
  return (v && *v) ? std::string(v) : fallback;
}

static std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

static bool parse_port(const std::string& text, uint16_t& out) {
  char* end = nullptr;
  long v = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || v < 1 || v > 65535) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

ServerConfig default_config(const EnvLookup& env) {
  ServerConfig cfg;
  fs::path home = env_or(env, "HOME", ".");
  cfg.adif_path = (home / ".local" / "share" / "WSJT-X" / "wsjtx_log.adi").string();
  return cfg;
}

std::string default_config_path(const EnvLookup& env) {
  std::string xdg = env_or(env, "XDG_CONFIG_HOME", "");
  fs::path base = !xdg.empty() ? fs::path(xdg) : fs::path(env_or(env, "HOME", ".")) / ".config";
  return (base / "wbf" / "config.json").string();
}

std::string normalize_entity(const std::string& code) {
  std::string s = trim(code);
  if (s.empty()) return s;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return s;
  s = std::to_string(std::strtol(s.c_str(), nullptr, 10));
  if (s.size() < 3) s.insert(0, 3 - s.size(), '0');
  return s;
}

std::set<std::string> parse_entity_list(const std::string& text) {
  std::set<std::string> out;
  std::istringstream in(text);
  std::string item;
  while (std::getline(in, item, ',')) {
    std::string e = normalize_entity(item);
    if (!e.empty()) out.insert(e);
  }
  return out;
}

bool parse_color(const std::string& text, Color& out) {
  if (text.size() != 7 || text[0] != '#') return false;
  uint16_t ch[3];
  for (int i = 0; i < 3; ++i) {
    std::string hex = text.substr(1 + 2 * i, 2);
    if (!std::isxdigit(static_cast<unsigned char>(hex[0])) ||
        !std::isxdigit(static_cast<unsigned char>(hex[1]))) return false;
    ch[i] = static_cast<uint16_t>(std::strtoul(hex.c_str(), nullptr, 16) * 0x101);   // 0xAB -> 0xABAB
  }
  out = Color::rgb(ch[0], ch[1], ch[2]);
  return true;
}

// "#rrggbb" or null; anything else is an error.
static bool color_from_json(const json& j, Color& out) {
  if (j.is_null()) { out = Color::invalid(); return true; }
  return j.is_string() && parse_color(j.get<std::string>(), out);
}

static bool apply_palette(const json& p, Palette& palette) {
  if (!p.is_object()) return false;
  struct Entry { const char* key; ColorPair* pair; };
  const Entry entries[] = {
    { "new_dxcc",         &palette.new_dxcc },
    { "new_dxcc_on_band", &palette.new_dxcc_on_band },
    { "new_call",         &palette.new_call },
    { "new_call_on_band", &palette.new_call_on_band },
    { "highlight",        &palette.highlight },
  };
  for (const Entry& e : entries) {
    if (!p.contains(e.key)) continue;
    const json& c = p[e.key];
    if (!c.is_object()) return false;
    if (c.contains("fg") && !color_from_json(c["fg"], e.pair->foreground)) return false;
    if (c.contains("bg") && !color_from_json(c["bg"], e.pair->background)) return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// apply_config_text()
// -------------------
// A bad value in a known key fails the call. Keys checked before it are
// already applied to cfg.
// ---------------------------------------------------------------------------
bool apply_config_text(const std::string& text, ServerConfig& cfg) {
  json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    log(LogLevel::Error, "config: not a JSON object");
    return false;
  }

  auto bad = [](const char* key) {
    log(LogLevel::Error, std::string("config: bad value for \"") + key + "\"");
    return false;
  };
  auto str = [&j](const char* key, std::string& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<std::string>();
    return true;
  };
  auto flag = [&j](const char* key, bool& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) return false;
    out = j[key].get<bool>();
    return true;
  };

  if (!str("bind", cfg.bind))             return bad("bind");
  if (!str("id", cfg.id))                 return bad("id");
  if (!str("adif", cfg.adif_path))        return bad("adif");
  if (!str("dxcc_table", cfg.dxcc_table)) return bad("dxcc_table");
  if (!str("format", cfg.format))         return bad("format");
  if (!str("log_level", cfg.log_level))   return bad("log_level");
  if (!flag("dxcc_confirmed_only", cfg.dxcc_confirmed_only)) return bad("dxcc_confirmed_only");
  if (!flag("reply_heartbeat", cfg.reply_heartbeat))         return bad("reply_heartbeat");
  if (!flag("exit_on_close", cfg.exit_on_close))             return bad("exit_on_close");

  if (j.contains("port")) {
    const json& p = j["port"];
    if (!p.is_number_unsigned() || p.get<uint64_t>() < 1 || p.get<uint64_t>() > 65535) return bad("port");
    cfg.port = static_cast<uint16_t>(p.get<uint64_t>());
  }
  if (j.contains("highlight_dxcc")) {
    const json& h = j["highlight_dxcc"];
    if (!h.is_array()) return bad("highlight_dxcc");
    std::set<std::string> list;
    for (const json& e : h) {
      if (e.is_string())                list.insert(normalize_entity(e.get<std::string>()));
      else if (e.is_number_unsigned())  list.insert(normalize_entity(std::to_string(e.get<uint64_t>())));
      else return bad("highlight_dxcc");
    }
    cfg.highlight_dxcc = std::move(list);
  }
  if (j.contains("palette") && !apply_palette(j["palette"], cfg.palette)) return bad("palette");

  if (cfg.format != "pretty" && cfg.format != "json" && cfg.format != "none") return bad("format");
  LogLevel lvl;
  if (!parse_log_level(cfg.log_level, lvl)) return bad("log_level");
  return true;
}

bool load_config_file(const std::string& path, ServerConfig& cfg, bool required) {
  std::ifstream in(path);
  if (!in) {
    if (!required) return true;
    log(LogLevel::Error, "config: cannot open " + path);
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (!apply_config_text(buf.str(), cfg)) {
    log(LogLevel::Error, "config: rejected " + path);
    return false;
  }
  log(LogLevel::Debug, "config: loaded " + path);
  return true;
}

bool apply_env(ServerConfig& cfg, const EnvLookup& env) {
  cfg.adif_path = env_or(env, "WBF_PATH", cfg.adif_path);

  std::string hl = env_or(env, "WBF_HIGHLIGHT", "");
  if (!hl.empty()) cfg.highlight_dxcc = parse_entity_list(hl);

  std::string port = env_or(env, "WBF_PORT", "");
  if (!port.empty() && !parse_port(port, cfg.port)) {
    log(LogLevel::Error, "config: WBF_PORT is not a port number: " + port);
    return false;
  }
  return true;
}

} // namespace wbf
