// ============================================================================
// band.cpp - implementation for band.hpp
// ============================================================================
#include "wbf/band.hpp"

#include <cctype>

namespace wbf {

namespace {

struct BandEdge {
  const char* name;
  uint64_t    low_hz;
  uint64_t    high_hz;
};

// Inclusive edges in Hz, ascending.
constexpr BandEdge BANDS[] = {
  { "2190m",       135700ull,       137800ull },
  { "630m",        472000ull,       479000ull },
  { "560m",        501000ull,       504000ull },
  { "160m",       1800000ull,      2000000ull },
  { "80m",        3500000ull,      4000000ull },
  { "60m",        5060000ull,      5450000ull },
  { "40m",        7000000ull,      7300000ull },
  { "30m",       10100000ull,     10150000ull },
  { "20m",       14000000ull,     14350000ull },
  { "17m",       18068000ull,     18168000ull },
  { "15m",       21000000ull,     21450000ull },
  { "12m",       24890000ull,     24990000ull },
  { "10m",       28000000ull,     29700000ull },
  { "8m",        40000000ull,     45000000ull },
  { "6m",        50000000ull,     54000000ull },
  { "4m",        70000000ull,     71000000ull },
  { "2m",       144000000ull,    148000000ull },
  { "1.25m",    222000000ull,    225000000ull },
  { "70cm",     420000000ull,    450000000ull },
  { "33cm",     902000000ull,    928000000ull },
  { "23cm",    1240000000ull,   1300000000ull },
};

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

} // namespace

std::optional<std::string> band_for_frequency(uint64_t hz) {
  for (const auto& b : BANDS) {
    if (hz >= b.low_hz && hz <= b.high_hz) return std::string(b.name);
  }
  return std::nullopt;
}

std::string normalize_band(const std::string& band) {
  std::string s = trim(band);
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string normalize_mode(const std::string& mode, const std::string& submode) {
  auto upper = [](std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
  };
  std::string m = upper(trim(mode));
  std::string sm = upper(trim(submode));
  if (m == "MFSK" && !sm.empty()) return sm;
  return m;
}

} // namespace wbf
