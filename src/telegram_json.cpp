// ============================================================================
// telegram_json.cpp - implementation for telegram_json.hpp
// ============================================================================
#include "telegram_json.hpp"
#include "wbf/telegram_fields.hpp"

#include <cstdio>   // std::snprintf for #rrggbb

using json = nlohmann::json;

namespace wbf {

namespace {

class JsonSink {
public:
  explicit JsonSink(json& obj) : obj_(obj) {}

  void put(const char* k, const Text& v) { obj_[k] = v ? json(*v) : json(nullptr); }
  void put(const char* k, bool v)        { obj_[k] = v; }
  void put(const char* k, uint8_t v)     { obj_[k] = static_cast<unsigned>(v); }
  void put(const char* k, uint32_t v)    { obj_[k] = v; }
  void put(const char* k, int32_t v)     { obj_[k] = v; }
  void put(const char* k, uint64_t v)    { obj_[k] = v; }
  void put(const char* k, double v)      { obj_[k] = v; }

  void put(const char* k, const Color& c) {
    if (!c.valid()) { obj_[k] = nullptr; return; }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.red >> 8, c.green >> 8, c.blue >> 8);
    obj_[k] = buf;
  }

  void put(const char* k, const DateTime& dt) {
    json j;
    j["julian_day"] = dt.julian_day;
    j["ms"]         = dt.ms_since_midnight;
    j["timespec"]   = static_cast<unsigned>(dt.timespec);
    if (dt.utc_offset_s) j["utc_offset_s"] = *dt.utc_offset_s;
    obj_[k] = j;
  }

  template <class T>
  void put(const char* k, const std::optional<T>& v) {
    if (v) put(k, *v);
  }

private:
  json& obj_;
};

} // namespace

json telegram_to_json(const Telegram& t) {
  json obj = json::object();
  obj["type"] = to_string(t.type());
  JsonSink sink(obj);
  fields::walk(sink, t);
  return obj;
}

json telegram_to_json(const Endpoint& peer, const Telegram& t) {
  json obj = telegram_to_json(t);
  obj["peer"] = peer.to_string();
  return obj;
}

std::string telegram_json_line(const Endpoint& peer, const Telegram& t) {
  return telegram_to_json(peer, t).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace wbf
