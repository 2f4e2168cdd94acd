#pragma once
/**
 * @file contact_lookup.hpp
 * @brief What the worked-before engine asks of a contact log.
 *
 * Header-only interface. The engine consumes it, collaborators implement it
 * (wbf::ContactLog for an ADIF-fed log, test fakes in tests/).
 */

#include <optional>
#include <string>

namespace wbf {

/// Band value meaning "any band".
constexpr const char* ANY_BAND = "ALL";

/**
 * @brief Answer for one (callsign, band, mode) query.
 *
 * - `worked`      a contact with this callsign exists on exactly this band and mode
 * - `confirmed`   the callsign's DXCC entity is already credited on this band and mode
 * - `dxcc_entity` ADIF entity code ("230", "291", ...) when known
 */
struct LookupResult {
  bool worked{false};
  bool confirmed{false};
  std::optional<std::string> dxcc_entity;
};

/**
 * @brief Contact log query capability.
 *
 * Contract:
 *  - Callsign is uppercase, band is normalized (`20m`) or ANY_BAND, mode is
 *    normalized uppercase (`FT8`).
 *  - May block. Must be safe to call from several threads at once.
 *  - Throws wbf::LookupUnavailableError when it cannot answer. Never guesses.
 */
class ContactLookup {
public:
  virtual ~ContactLookup() = default;
  virtual LookupResult lookup(const std::string& callsign,
                              const std::string& band,
                              const std::string& mode) const = 0;
};

} // namespace wbf
