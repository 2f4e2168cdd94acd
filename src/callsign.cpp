// ============================================================================
// callsign.cpp - implementation for callsign.hpp
// Message shapes are listed in the .hpp. Tests: tests/test_callsign.cpp
// ============================================================================
#include "wbf/callsign.hpp"

#include <sstream>
#include <vector>

namespace wbf {

static inline bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string w;
  while (in >> w) out.push_back(w);
  return out;
}

bool is_locator(const std::string& s) {
  return s.size() >= 4 && is_upper(s[0]) && is_upper(s[1]) && is_digit(s[2]) && is_digit(s[3]);
}

bool is_report(const std::string& s) {
  std::size_t i = 0;
  if (i < s.size() && s[i] == 'R') ++i;
  if (i >= s.size() || (s[i] != '-' && s[i] != '+')) return false;
  ++i;
  return i + 2 <= s.size() && is_digit(s[i]) && is_digit(s[i + 1]);
}

// ---------------------------------------------------------------------------
// is_standard_callsign()
// ----------------------
// Prefix is one of:  A   |  AA / A9  |  9A
// followed by one digit and one to three letters. Only the start is matched;
// portable suffixes and the like after it are allowed.
// ---------------------------------------------------------------------------
bool is_standard_callsign(const std::string& s) {
  auto body_from = [&s](std::size_t i) {
    if (i >= s.size() || !is_digit(s[i])) return false;
    ++i;
    return i < s.size() && is_upper(s[i]);      // {1,3}: at least one letter suffices for a prefix match
  };
  if (s.empty()) return false;
  if (is_upper(s[0]) && body_from(1)) return true;                                     // A9X
  if (s.size() > 1 && is_upper(s[0]) && (is_upper(s[1]) || is_digit(s[1])) && body_from(2)) return true;  // AA9X, A99X
  if (s.size() > 1 && is_digit(s[0]) && is_upper(s[1]) && body_from(2)) return true;   // 9A9X
  return false;
}

// A plausible final result: A-Z 0-9 / only, at least one letter and one digit.
static bool looks_like_callsign(const std::string& s) {
  bool letter = false, digit = false;
  for (char c : s) {
    if (is_upper(c))      letter = true;
    else if (is_digit(c)) digit = true;
    else if (c != '/')    return false;
  }
  return letter && digit;
}

// Hashed calls arrive as <CALL>; "<...>" is an unresolved hash.
std::optional<std::string> normalize_callsign(std::string call) {
  if (!call.empty() && call.front() == '<') call.erase(0, 1);
  if (!call.empty() && call.back() == '>')  call.pop_back();
  if (call.empty() || call == "...") return std::nullopt;
  if (!looks_like_callsign(call)) return std::nullopt;
  return call;
}

// ---------------------------------------------------------------------------
// extract_callsign()
// ------------------
// Phases:
//   1) reject empty / contest-style ';' messages, split on whitespace
//   2) drop decoder annotations at the end ("a1".."a7", then "?")
//   3) CQ / QRZ forms
//   4) directed forms (second word is the sender)
//   5) strip hash brackets, sanity check the token
// ---------------------------------------------------------------------------
std::optional<std::string> extract_callsign(const std::string& message) {
  if (message.empty() || message.find(';') != std::string::npos) return std::nullopt;

  std::vector<std::string> w = split_words(message);
  if (!w.empty() && w.back()[0] == 'a') w.pop_back();
  if (!w.empty() && w.back() == "?")    w.pop_back();
  if (w.size() < 2) return std::nullopt;

  if (w[0] == "CQ" || w[0] == "QRZ") {
    if (w.size() == 4 && w[2].size() >= 3) return normalize_callsign(w[2]);
    if (w.size() == 3 && w[2].size() != 4 && w[1].size() <= 4 && w[2].size() >= 3) {
      return normalize_callsign(w[2]);
    }
    if (w[1].size() >= 3) return normalize_callsign(w[1]);
    return std::nullopt;
  }

  if (w.size() == 2) {
    if (w[1].size() >= 3) return normalize_callsign(w[1]);
    return std::nullopt;
  }
  if (w.size() == 4 && w[2] == "R" && w[1].size() >= 3) return normalize_callsign(w[1]);
  if (w.size() == 3 && w[1].size() >= 3) {
    if (w[1].size() > 3 || is_standard_callsign(w[1])) return normalize_callsign(w[1]);
    if (is_locator(w[2]) || is_report(w[2]))            return normalize_callsign(w[1]);
  }
  return std::nullopt;
}

} // namespace wbf
