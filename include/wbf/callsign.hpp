/**
 * @file callsign.hpp
 * @brief Pull the "other station" callsign out of a WSJT-X decode message.
 *
 * @details
 * Decode text follows a small, fixed grammar. The shapes we care about:
 *
 * | Message                   | Callsign  | Shape                      |
 * |---------------------------|-----------|----------------------------|
 * | `CQ K1ABC FN42`           | K1ABC     | CQ call grid               |
 * | `CQ DX IK2XX`             | IK2XX     | CQ directed, no grid       |
 * | `CQ NA PD0XXX JO22`       | PD0XXX    | CQ directed with grid      |
 * | `JA1XXX YL2XXX R-18`      | YL2XXX    | report exchange            |
 * | `9H1XX EA8XX IL18`        | EA8XX     | answer with grid           |
 * | `F1XXX D1X RR73`          | D1X       | short standard call        |
 * | `JA1XXX YL2XXX R JO22`    | YL2XXX    | R then grid (EU VHF)       |
 * | `TM50XXX <F6XXX> RR73`    | F6XXX     | hashed call                |
 * | `E73XXX 73`               | (none)    | sign-off, no second call   |
 *
 * The second word is the sender, except for CQ/QRZ where the caller comes
 * after the optional direction token. Decoder annotations (`a1`, `a2`, `?`)
 * at the end are dropped first.
 *
 * Pure functions, no state, no allocation beyond the result.
 */
#ifndef WBF_CALLSIGN_HPP
#define WBF_CALLSIGN_HPP

#include <optional>
#include <string>

namespace wbf {

/// Callsign of the transmitting station, or nullopt when none is recognizable.
std::optional<std::string> extract_callsign(const std::string& message);

/// Strip `<...>` hash brackets and check the shape (`A-Z 0-9 /`, a letter and a digit).
std::optional<std::string> normalize_callsign(std::string call);

/// Starts with a 4-character Maidenhead locator (`JN88`; uppercase only).
bool is_locator(const std::string& s);

/// Starts with a signal report (`-07`, `+12`, `R-18`).
bool is_report(const std::string& s);

/// Starts with a standard-format callsign: prefix, digit, 1..3 letter suffix.
bool is_standard_callsign(const std::string& s);

} // namespace wbf

#endif // WBF_CALLSIGN_HPP
