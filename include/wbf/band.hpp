/**
 * @file band.hpp
 * @brief Frequency-to-band table and the band/mode normalization used for lookup keys.
 *
 * @details
 * Band names are the ADIF band enumeration (`160m`, `20m`, `70cm`, ...) so a
 * band derived from a Status dial frequency compares equal to the `BAND`
 * field of a logged contact. Edges follow the IARU Region 1 allocations.
 *
 * Modes are compared uppercase. ADIF files log FT4, FST4, JS8 and friends as
 * `MODE=MFSK SUBMODE=FT4`, while Status says `FT4`; `normalize_mode` folds the
 * first into the second.
 */
#ifndef WBF_BAND_HPP
#define WBF_BAND_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace wbf {

/// ADIF band name for a frequency in Hz, or nullopt when it is in no amateur band.
std::optional<std::string> band_for_frequency(uint64_t hz);

/// Lowercase, trimmed ("20M " -> "20m").
std::string normalize_band(const std::string& band);

/// Uppercase, trimmed; MFSK with a submode becomes the submode.
std::string normalize_mode(const std::string& mode, const std::string& submode = {});

} // namespace wbf

#endif // WBF_BAND_HPP
