// ============================================================================
// contact_log.cpp - implementation for contact_log.hpp
// Tests: tests/test_contact_log.cpp
// ============================================================================
#include "wbf/contact_log.hpp"
#include "wbf/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <sstream>

#include "nlohmann/json.hpp"

namespace wbf {

using json = nlohmann::json;

static std::string to_upper(std::string s) {
  for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

// "OE3RSU/P" -> "OE3RSU", "DL/OE3RSU" -> "OE3RSU", "KH6/K1ABC" -> "K1ABC".
// The longer side wins; on a tie the first one does.
static std::string base_call(const std::string& call) {
  std::string best;
  std::size_t start = 0;
  while (start <= call.size()) {
    std::size_t slash = call.find('/', start);
    if (slash == std::string::npos) slash = call.size();
    std::string part = call.substr(start, slash - start);
    if (part.size() > best.size()) best = part;
    start = slash + 1;
  }
  return best;
}

// ---------------------------------------------------------------------------
// PrefixDxccTable
// ---------------------------------------------------------------------------
void PrefixDxccTable::add(const std::string& prefix, std::optional<std::string> entity) {
  std::string p = to_upper(prefix);
  if (p.empty()) return;
  longest_ = std::max(longest_, p.size());
  prefixes_[p] = std::move(entity);
}

std::optional<std::string> PrefixDxccTable::entity_for(const std::string& callsign) const {
  const std::string call = base_call(to_upper(callsign));
  for (std::size_t n = std::min(longest_, call.size()); n > 0; --n) {
    auto it = prefixes_.find(call.substr(0, n));
    if (it != prefixes_.end()) return it->second;   // null entry: known-unknown, stop here
  }
  return std::nullopt;
}

bool PrefixDxccTable::load_json(const std::string& text) {
  json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    log(LogLevel::Error, "dxcc table: expected a JSON object of prefix -> entity");
    return false;
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.value().is_null()) {
      add(it.key(), std::nullopt);
    } else if (it.value().is_string()) {
      add(it.key(), it.value().get<std::string>());
    } else if (it.value().is_number_unsigned()) {
      std::string code = std::to_string(it.value().get<unsigned>());
      if (code.size() < 3) code.insert(0, 3 - code.size(), '0');
      add(it.key(), code);
    } else {
      std::ostringstream os;
      os << "dxcc table: ignoring prefix=" << it.key() << " (entity must be string or null)";
      log(LogLevel::Warn, os.str());
    }
  }
  return true;
}

bool PrefixDxccTable::load_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    log(LogLevel::Error, "dxcc table: cannot open " + path);
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return load_json(buf.str());
}

// ---------------------------------------------------------------------------
// ContactLog
// ---------------------------------------------------------------------------
ContactLog::ContactLog(DxccCredit credit, std::shared_ptr<const DxccResolver> resolver)
  : credit_(credit), resolver_(std::move(resolver)) {}

bool ContactLog::add(const ContactRecord& rec) {
  if (rec.call.empty() || rec.band.empty()) return false;

  std::unique_lock<std::shared_mutex> lock(mutex_);

  calls_[{rec.band, rec.mode}].insert(rec.call);
  calls_[{ANY_BAND, rec.mode}].insert(rec.call);

  std::optional<std::string> entity = rec.dxcc;
  if (entity) entity_by_call_[rec.call] = *entity;
  else        entity = entity_of(rec.call);

  if (entity && (credit_ == DxccCredit::Worked || rec.confirmed)) {
    dxcc_[{rec.band, rec.mode}].insert(*entity);
    dxcc_[{ANY_BAND, rec.mode}].insert(*entity);
  }
  ++records_;
  return true;
}

std::optional<std::string> ContactLog::entity_of(const std::string& call) const {
  auto it = entity_by_call_.find(call);
  if (it != entity_by_call_.end()) return it->second;
  if (resolver_) return resolver_->entity_for(call);
  return std::nullopt;
}

LookupResult ContactLog::lookup(const std::string& callsign,
                                const std::string& band,
                                const std::string& mode) const {
  const std::string call = to_upper(callsign);
  const Key key{band, mode};

  std::shared_lock<std::shared_mutex> lock(mutex_);

  LookupResult r;
  auto c = calls_.find(key);
  r.worked = (c != calls_.end() && c->second.count(call) != 0);

  r.dxcc_entity = entity_of(call);
  if (r.dxcc_entity) {
    auto d = dxcc_.find(key);
    r.confirmed = (d != dxcc_.end() && d->second.count(*r.dxcc_entity) != 0);
  }
  return r;
}

std::size_t ContactLog::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_;
}

} // namespace wbf
