// ============================================================================
// worked_before.cpp - implementation for worked_before.hpp
// Tests: tests/test_worked_before.cpp
// ============================================================================
#include "wbf/worked_before.hpp"
#include "wbf/band.hpp"
#include "wbf/callsign.hpp"

#include <utility>

namespace wbf {

const char* to_string(Classification c) {
  switch (c) {
    case Classification::Worked:        return "worked";
    case Classification::NewDxcc:       return "new-dxcc";
    case Classification::NewDxccOnBand: return "new-dxcc-on-band";
    case Classification::NewCall:       return "new-call";
    case Classification::NewCallOnBand: return "new-call-on-band";
    case Classification::Highlight:     return "highlight";
  }
  return "worked";
}

ColorPair Palette::for_class(Classification c) const {
  switch (c) {
    case Classification::NewDxcc:       return new_dxcc;
    case Classification::NewDxccOnBand: return new_dxcc_on_band;
    case Classification::NewCall:       return new_call;
    case Classification::NewCallOnBand: return new_call_on_band;
    case Classification::Highlight:     return highlight;
    case Classification::Worked:        break;
  }
  return ColorPair{};
}

std::optional<std::pair<std::string, std::string>> band_and_mode(const Status& status) {
  auto band = band_for_frequency(status.dial_frequency_hz);
  if (!band) return std::nullopt;

  std::string mode = normalize_mode(text_or(status.mode));
  if (mode.empty()) mode = normalize_mode(text_or(status.sub_mode));
  if (mode.empty()) return std::nullopt;

  return std::make_pair(*band, mode);
}

WorkedBeforeEngine::WorkedBeforeEngine(const ContactLookup& lookup,
                                       Palette palette,
                                       std::set<std::string> highlight_dxcc)
  : lookup_(lookup),
    palette_(std::move(palette)),
    highlight_dxcc_(std::move(highlight_dxcc)) {}

// ---------------------------------------------------------------------------
// classify()
// ----------
// One band-scoped query decides worked / not worked. The follow-up query on
// ANY_BAND only splits the "new" classes:
//   entity credited here   -> Highlight (watch list) | NewCallOnBand | NewCall
//   entity not credited    -> NewDxccOnBand | NewDxcc
// ---------------------------------------------------------------------------
Classification WorkedBeforeEngine::classify(const std::string& callsign,
                                            const std::string& band,
                                            const std::string& mode) const {
  const LookupResult here = lookup_.lookup(callsign, band, mode);
  if (here.worked) return Classification::Worked;

  if (here.confirmed) {
    if (here.dxcc_entity && highlight_dxcc_.count(*here.dxcc_entity) != 0) {
      return Classification::Highlight;
    }
    const LookupResult any = lookup_.lookup(callsign, ANY_BAND, mode);
    return any.worked ? Classification::NewCallOnBand : Classification::NewCall;
  }

  const LookupResult any = lookup_.lookup(callsign, ANY_BAND, mode);
  return any.confirmed ? Classification::NewDxccOnBand : Classification::NewDxcc;
}

std::optional<Assessment>
WorkedBeforeEngine::assess_call(const std::string& callsign, const Status* status) const {
  if (!status) return std::nullopt;
  auto scope = band_and_mode(*status);
  if (!scope) return std::nullopt;

  Assessment a;
  a.callsign       = callsign;
  a.classification = classify(callsign, scope->first, scope->second);
  return a;
}

std::optional<Assessment>
WorkedBeforeEngine::assess(const Decode& decode, const Status* status) const {
  if (!decode.message) return std::nullopt;
  auto call = extract_callsign(*decode.message);
  if (!call) return std::nullopt;
  return assess_call(*call, status);
}

// WSPR spots carry the call in its own field, but hashed and type-3 spots
// still arrive as <CALL> or <...>.
std::optional<Assessment>
WorkedBeforeEngine::assess(const WsprDecode& spot, const Status* status) const {
  auto call = normalize_callsign(text_or(spot.callsign));
  if (!call) return std::nullopt;
  return assess_call(*call, status);
}

std::optional<HighlightCallsign> WorkedBeforeEngine::highlight_for(const Assessment& a) const {
  if (a.classification == Classification::Worked) return std::nullopt;

  const ColorPair colors = palette_.for_class(a.classification);
  HighlightCallsign h;
  h.callsign            = a.callsign;
  h.background_color    = colors.background;
  h.foreground_color    = colors.foreground;
  h.highlight_last_only = true;
  return h;
}

std::optional<HighlightCallsign>
WorkedBeforeEngine::evaluate(const Decode& decode, const Status* status) const {
  auto a = assess(decode, status);
  if (!a) return std::nullopt;
  return highlight_for(*a);
}

std::optional<HighlightCallsign>
WorkedBeforeEngine::evaluate(const WsprDecode& spot, const Status* status) const {
  auto a = assess(spot, status);
  if (!a) return std::nullopt;
  return highlight_for(*a);
}

HighlightCallsign clear_highlight(const std::string& callsign) {
  HighlightCallsign h;
  h.callsign            = callsign;
  h.background_color    = Color::invalid();
  h.foreground_color    = Color::invalid();
  h.highlight_last_only = false;
  return h;
}

} // namespace wbf
