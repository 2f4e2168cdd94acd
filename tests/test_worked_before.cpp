#include <doctest/doctest.h>
#include "wbf/errors.hpp"
#include "wbf/worked_before.hpp"

#include <map>
#include <tuple>

using namespace wbf;

// Canned answers per (call, band, mode); anything else is "never heard of it".
class FakeLookup : public ContactLookup {
public:
    void set(const std::string& call, const std::string& band, const std::string& mode, LookupResult r) {
        answers_[std::make_tuple(call, band, mode)] = std::move(r);
    }

    LookupResult lookup(const std::string& call, const std::string& band,
                        const std::string& mode) const override {
        ++calls;
        if (fail) throw LookupUnavailableError("log offline");
        auto it = answers_.find(std::make_tuple(call, band, mode));
        return it == answers_.end() ? LookupResult{} : it->second;
    }

    bool fail{false};
    mutable int calls{0};

private:
    std::map<std::tuple<std::string, std::string, std::string>, LookupResult> answers_;
};

static LookupResult result(bool worked, bool confirmed, std::optional<std::string> entity = std::nullopt) {
    LookupResult r;
    r.worked = worked;
    r.confirmed = confirmed;
    r.dxcc_entity = std::move(entity);
    return r;
}

static Status status_20m_ft8() {
    Status s;
    s.dial_frequency_hz = 14074000;
    s.mode = Text("FT8");
    return s;
}

static Decode decode_of(const std::string& message) {
    Decode d;
    d.mode = Text("~");
    d.message = message;
    return d;
}

TEST_CASE("Never-worked station on 20m FT8 gets a new-DXCC highlight") {
    FakeLookup lookup;
    WorkedBeforeEngine engine(lookup);
    const Status st = status_20m_ft8();

    auto h = engine.evaluate(decode_of("CQ K1ABC FN42"), &st);
    REQUIRE(h.has_value());
    CHECK(h->callsign == Text("K1ABC"));
    CHECK(h->background_color == Color::rgb(0xFFFF, 0x0000, 0xFFFF));
    CHECK(h->foreground_color == Color::rgb(0, 0, 0));
    CHECK(h->highlight_last_only);
}

TEST_CASE("Station already worked on band and mode gets nothing") {
    FakeLookup lookup;
    lookup.set("K1ABC", "20m", "FT8", result(true, true, std::string("291")));
    WorkedBeforeEngine engine(lookup);
    const Status st = status_20m_ft8();

    CHECK_FALSE(engine.evaluate(decode_of("CQ K1ABC FN42"), &st).has_value());
    CHECK(lookup.calls == 1);
}

TEST_CASE("Messages without a callsign never reach the lookup") {
    FakeLookup lookup;
    WorkedBeforeEngine engine(lookup);
    const Status st = status_20m_ft8();

    CHECK_FALSE(engine.evaluate(decode_of("HELLO WORLD"), &st).has_value());
    Decode null_message;
    null_message.message = std::nullopt;
    CHECK_FALSE(engine.evaluate(null_message, &st).has_value());
    CHECK(lookup.calls == 0);
}

TEST_CASE("No usable Status means no highlight") {
    FakeLookup lookup;
    WorkedBeforeEngine engine(lookup);

    CHECK_FALSE(engine.evaluate(decode_of("CQ K1ABC FN42"), nullptr).has_value());

    Status off_band = status_20m_ft8();
    off_band.dial_frequency_hz = 9000000;
    CHECK_FALSE(engine.evaluate(decode_of("CQ K1ABC FN42"), &off_band).has_value());

    Status no_mode = status_20m_ft8();
    no_mode.mode = std::nullopt;
    CHECK_FALSE(engine.evaluate(decode_of("CQ K1ABC FN42"), &no_mode).has_value());
    CHECK(lookup.calls == 0);
}

TEST_CASE("band_and_mode falls back to the submode") {
    Status s = status_20m_ft8();
    s.mode = Text(std::string());
    s.sub_mode = Text("ft4");
    auto bm = band_and_mode(s);
    REQUIRE(bm.has_value());
    CHECK(bm->first == "20m");
    CHECK(bm->second == "FT4");
}

TEST_CASE("Classification follows the lookup answers") {
    FakeLookup lookup;
    WorkedBeforeEngine engine(lookup, Palette{}, {"230"});

    SUBCASE("entity never credited") {
        CHECK(engine.classify("K1ABC", "20m", "FT8") == Classification::NewDxcc);
    }
    SUBCASE("entity credited on another band") {
        lookup.set("K1ABC", ANY_BAND, "FT8", result(false, true, std::string("291")));
        CHECK(engine.classify("K1ABC", "20m", "FT8") == Classification::NewDxccOnBand);
    }
    SUBCASE("entity credited here, call never worked") {
        lookup.set("K1ABC", "20m", "FT8", result(false, true, std::string("291")));
        CHECK(engine.classify("K1ABC", "20m", "FT8") == Classification::NewCall);
    }
    SUBCASE("entity credited here, call worked on another band") {
        lookup.set("K1ABC", "20m", "FT8", result(false, true, std::string("291")));
        lookup.set("K1ABC", ANY_BAND, "FT8", result(true, true, std::string("291")));
        CHECK(engine.classify("K1ABC", "20m", "FT8") == Classification::NewCallOnBand);
    }
    SUBCASE("entity on the watch list") {
        lookup.set("DL1ABC", "20m", "FT8", result(false, true, std::string("230")));
        CHECK(engine.classify("DL1ABC", "20m", "FT8") == Classification::Highlight);
    }
    SUBCASE("worked wins over everything") {
        lookup.set("DL1ABC", "20m", "FT8", result(true, true, std::string("230")));
        CHECK(engine.classify("DL1ABC", "20m", "FT8") == Classification::Worked);
    }
}

TEST_CASE("Each class is painted with its palette entry") {
    FakeLookup lookup;
    Palette p;
    p.new_call = ColorPair{Color::rgb(0xFFFF, 0xFFFF, 0xFFFF), Color::rgb(0, 0, 0xFFFF)};
    WorkedBeforeEngine engine(lookup, p);
    lookup.set("K1ABC", "20m", "FT8", result(false, true, std::string("291")));
    const Status st = status_20m_ft8();

    auto h = engine.evaluate(decode_of("W9XYZ K1ABC -12"), &st);
    REQUIRE(h.has_value());
    CHECK(h->foreground_color == Color::rgb(0xFFFF, 0xFFFF, 0xFFFF));
    CHECK(h->background_color == Color::rgb(0, 0, 0xFFFF));

    CHECK_FALSE(p.for_class(Classification::Worked).background.valid());
    CHECK(std::string(to_string(Classification::NewDxccOnBand)) == "new-dxcc-on-band");
}

TEST_CASE("WSPR spots use the callsign field") {
    FakeLookup lookup;
    WorkedBeforeEngine engine(lookup);
    Status st = status_20m_ft8();
    st.mode = Text("WSPR");

    WsprDecode w;
    w.callsign = Text("K1ABC");
    w.grid = Text("FN42");
    auto h = engine.evaluate(w, &st);
    REQUIRE(h.has_value());
    CHECK(h->callsign == Text("K1ABC"));

    w.callsign = Text(std::string());
    CHECK_FALSE(engine.evaluate(w, &st).has_value());
}

TEST_CASE("WSPR callsigns lose hash brackets and junk never reaches the lookup") {
    FakeLookup lookup;
    WorkedBeforeEngine engine(lookup);
    Status st = status_20m_ft8();
    st.mode = Text("WSPR");

    WsprDecode w;
    w.callsign = Text("<PJ4/K1ABC>");
    auto h = engine.evaluate(w, &st);
    REQUIRE(h.has_value());
    CHECK(h->callsign == Text("PJ4/K1ABC"));

    const int before = lookup.calls;
    for (const char* junk : {"<...>", "<>", "k1abc", "K1-ABC", "ABCDEF"}) {
        CAPTURE(junk);
        w.callsign = Text(junk);
        CHECK_FALSE(engine.evaluate(w, &st).has_value());
    }
    w.callsign = Text(std::nullopt);
    CHECK_FALSE(engine.evaluate(w, &st).has_value());
    CHECK(lookup.calls == before);
}

TEST_CASE("assess reports Worked where evaluate stays silent") {
    FakeLookup lookup;
    lookup.set("K1ABC", "20m", "FT8", result(true, true));
    WorkedBeforeEngine engine(lookup);
    const Status st = status_20m_ft8();

    auto a = engine.assess(decode_of("CQ K1ABC FN42"), &st);
    REQUIRE(a.has_value());
    CHECK(a->callsign == "K1ABC");
    CHECK(a->classification == Classification::Worked);
    CHECK_FALSE(engine.highlight_for(*a).has_value());

    const HighlightCallsign c = clear_highlight("K1ABC");
    CHECK(c.callsign == Text("K1ABC"));
    CHECK_FALSE(c.background_color.valid());
    CHECK_FALSE(c.foreground_color.valid());
    CHECK_FALSE(c.highlight_last_only);
}

TEST_CASE("Lookup failures propagate") {
    FakeLookup lookup;
    lookup.fail = true;
    WorkedBeforeEngine engine(lookup);
    const Status st = status_20m_ft8();
    CHECK_THROWS_AS(engine.evaluate(decode_of("CQ K1ABC FN42"), &st), LookupUnavailableError);
}
