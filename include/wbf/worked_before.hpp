/**
 * @file worked_before.hpp
 * @brief Decide whether a decoded station deserves a highlight, and in which colors.
 *
 * @details
 * PURPOSE
 * -------
 * For every Decode (or WSPR spot) the sender reports, answer one question:
 * is the transmitting station something the operator still needs? If so the
 * answer goes back as a HighlightCallsign telegram and the sender paints the
 * callsign in its band activity window.
 *
 * CLASSES (most to least interesting)
 * -----------------------------------
 * | class           | meaning                                                |
 * |-----------------|--------------------------------------------------------|
 * | NewDxcc         | entity never credited in this mode on any band         |
 * | NewDxccOnBand   | entity credited in this mode, but not on this band     |
 * | NewCall         | entity credited here, call never worked in this mode   |
 * | NewCallOnBand   | call worked in this mode elsewhere, not on this band   |
 * | Highlight       | entity credited here but on the operator's watch list  |
 * | Worked          | call already worked on this band and mode: no telegram |
 *
 * SCOPE
 * -----
 * Band and mode come from the sender's last Status. Without a Status, or on
 * a dial frequency outside every band, nothing is highlighted. The "worked"
 * decision is always band-and-mode scoped; only the DXCC and call-history
 * follow-up queries relax to ANY_BAND.
 *
 * The engine keeps no state between calls. Lookup failures propagate as
 * wbf::LookupUnavailableError. Remembering which calls were painted, and
 * taking the paint off again, is the dispatcher's job (clear_highlight()).
 */
#ifndef WBF_WORKED_BEFORE_HPP
#define WBF_WORKED_BEFORE_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "wbf/contact_lookup.hpp"
#include "wbf/telegram.hpp"

namespace wbf {

enum class Classification : uint8_t {
  Worked = 0,
  NewDxcc,
  NewDxccOnBand,
  NewCall,
  NewCallOnBand,
  Highlight
};

const char* to_string(Classification c);

struct ColorPair {
  Color foreground{Color::invalid()};
  Color background{Color::invalid()};
};

/// Colors per class. Defaults are black text on pink / light pink / cyan / light cyan / orange.
struct Palette {
  ColorPair new_dxcc         { Color::rgb(0, 0, 0), Color::rgb(0xFFFF, 0x0000, 0xFFFF) };
  ColorPair new_dxcc_on_band { Color::rgb(0, 0, 0), Color::rgb(0xFFFF, 0xAAAA, 0xFFFF) };
  ColorPair new_call         { Color::rgb(0, 0, 0), Color::rgb(0x0000, 0xFFFF, 0xFFFF) };
  ColorPair new_call_on_band { Color::rgb(0, 0, 0), Color::rgb(0x9999, 0xFFFF, 0xFFFF) };
  ColorPair highlight        { Color::rgb(0, 0, 0), Color::rgb(0xFFFF, 0xA0A0, 0x0000) };

  /// Entry for a class. Worked has no entry and yields two invalid colors.
  ColorPair for_class(Classification c) const;
};

/// Station found in a decode and how it classifies on the current band and mode.
struct Assessment {
  std::string    callsign;
  Classification classification{Classification::Worked};
};

class WorkedBeforeEngine {
public:
  WorkedBeforeEngine(const ContactLookup& lookup,
                     Palette palette = {},
                     std::set<std::string> highlight_dxcc = {});

  /// Classify one callsign on a normalized band and mode.
  Classification classify(const std::string& callsign,
                          const std::string& band,
                          const std::string& mode) const;

  /// Callsign and class, or nullopt when there is no callsign or no usable Status.
  std::optional<Assessment> assess(const Decode& decode, const Status* status) const;

  /// Same for a WSPR spot; the callsign field goes through normalize_callsign().
  std::optional<Assessment> assess(const WsprDecode& spot, const Status* status) const;

  /// Highlight in the palette colors, nullopt for Worked.
  std::optional<HighlightCallsign> highlight_for(const Assessment& a) const;

  /// assess() then highlight_for().
  std::optional<HighlightCallsign> evaluate(const Decode& decode, const Status* status) const;
  std::optional<HighlightCallsign> evaluate(const WsprDecode& spot, const Status* status) const;

  const Palette& palette() const { return palette_; }

private:
  std::optional<Assessment> assess_call(const std::string& callsign, const Status* status) const;

  const ContactLookup&  lookup_;
  Palette               palette_;
  std::set<std::string> highlight_dxcc_;
};

/// Highlight that removes the colors from @p callsign: two invalid colors, all rows.
HighlightCallsign clear_highlight(const std::string& callsign);

/// Band and lookup mode of a Status, or nullopt when either cannot be derived.
std::optional<std::pair<std::string, std::string>> band_and_mode(const Status& status);

} // namespace wbf

#endif // WBF_WORKED_BEFORE_HPP
