// ============================================================================
// adif.cpp - implementation for adif.hpp
// Tests: tests/test_adif.cpp
// ============================================================================
#include "adif.hpp"
#include "wbf/band.hpp"
#include "wbf/log.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace wbf {

static std::string upper(std::string s) {
  for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

static std::string trimmed(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

static const std::string* field(const AdifFields& f, const char* name) {
  auto it = f.find(name);
  return (it == f.end() || it->second.empty()) ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// parse_adif_fields()
// -------------------
// States, one pass over the text:
//   search  skip to '<'
//   tag     read NAME[:LEN[:TYPE]] up to '>'
//   value   take LEN bytes
// A tag without LEN is a marker: EOH drops what was collected (header),
// EOR closes the record.
// ---------------------------------------------------------------------------
std::vector<AdifFields> parse_adif_fields(const std::string& text) {
  std::vector<AdifFields> records;
  AdifFields current;
  std::size_t i = 0;

  while (true) {
    std::size_t lt = text.find('<', i);
    if (lt == std::string::npos) break;
    std::size_t gt = text.find('>', lt + 1);
    if (gt == std::string::npos) break;                 // unterminated tag

    std::string tag = text.substr(lt + 1, gt - lt - 1);
    std::size_t colon = tag.find(':');
    std::string name = upper(trimmed(tag.substr(0, colon)));
    i = gt + 1;

    if (colon == std::string::npos) {
      if (name == "EOH") current.clear();
      else if (name == "EOR") {
        if (!current.empty()) records.push_back(std::move(current));
        current.clear();
      }
      continue;
    }

    std::string len_text = tag.substr(colon + 1);
    std::size_t colon2 = len_text.find(':');
    if (colon2 != std::string::npos) len_text.erase(colon2);   // drop :TYPE
    char* end = nullptr;
    long len = std::strtol(len_text.c_str(), &end, 10);
    if (end == len_text.c_str() || len < 0) {
      log(LogLevel::Warn, "adif: bad field length in <" + tag + ">, stopping");
      break;
    }
    if (i + static_cast<std::size_t>(len) > text.size()) {
      log(LogLevel::Warn, "adif: field " + name + " runs past end of text, stopping");
      break;
    }
    current[name] = text.substr(i, static_cast<std::size_t>(len));
    i += static_cast<std::size_t>(len);
  }
  return records;
}

std::optional<ContactRecord> to_contact(const AdifFields& f) {
  ContactRecord r;

  if (const std::string* call = field(f, "CALL")) r.call = upper(trimmed(*call));
  if (r.call.empty()) return std::nullopt;

  if (const std::string* band = field(f, "BAND")) {
    r.band = normalize_band(*band);
  } else if (const std::string* freq = field(f, "FREQ")) {
    double mhz = std::strtod(freq->c_str(), nullptr);
    if (mhz > 0.0) {
      auto b = band_for_frequency(static_cast<uint64_t>(std::llround(mhz * 1e6)));
      if (b) r.band = *b;
    }
  }
  if (r.band.empty()) return std::nullopt;

  const std::string* mode    = field(f, "MODE");
  const std::string* submode = field(f, "SUBMODE");
  r.mode = normalize_mode(mode ? *mode : std::string(), submode ? *submode : std::string());

  if (const std::string* dxcc = field(f, "DXCC")) {
    std::string code = trimmed(*dxcc);
    long n = std::strtol(code.c_str(), nullptr, 10);
    if (n > 0) {
      code = std::to_string(n);
      if (code.size() < 3) code.insert(0, 3 - code.size(), '0');
      r.dxcc = code;
    }
  }

  auto yes = [&f](const char* name) {
    const std::string* v = field(f, name);
    return v && upper(trimmed(*v)) == "Y";
  };
  r.confirmed = yes("QSL_RCVD") || yes("LOTW_QSL_RCVD");
  return r;
}

std::vector<ContactRecord> parse_adif(const std::string& text) {
  std::vector<ContactRecord> out;
  for (const AdifFields& f : parse_adif_fields(text)) {
    if (auto r = to_contact(f)) out.push_back(std::move(*r));
  }
  return out;
}

bool load_adif_file(const std::string& path, std::vector<ContactRecord>& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    log(LogLevel::Error, "adif: cannot open " + path);
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  std::vector<ContactRecord> records = parse_adif(buf.str());

  std::ostringstream os;
  os << "adif: loaded " << records.size() << " contact(s) from " << path;
  log(LogLevel::Info, os.str());

  out.insert(out.end(), records.begin(), records.end());
  return true;
}

} // namespace wbf
