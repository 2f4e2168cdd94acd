#include <doctest/doctest.h>
#include "wbf/callsign.hpp"

using namespace wbf;

static std::string call_of(const std::string& msg) {
    auto c = extract_callsign(msg);
    return c ? *c : std::string("<none>");
}

TEST_CASE("CQ forms yield the calling station") {
    CHECK(call_of("CQ K1ABC FN42") == "K1ABC");
    CHECK(call_of("CQ DX IK2XX") == "IK2XX");
    CHECK(call_of("CQ NA PD0XXX JO22") == "PD0XXX");
    CHECK(call_of("QRZ W1AW") == "W1AW");
}

TEST_CASE("Directed messages yield the second word") {
    CHECK(call_of("JA1XXX YL2XXX R-18") == "YL2XXX");
    CHECK(call_of("9H1XX EA8XX IL18") == "EA8XX");
    CHECK(call_of("F1XXX D1X RR73") == "D1X");
    CHECK(call_of("F1XXX D1X 73") == "D1X");
    CHECK(call_of("JA1XXX YL2XXX R JO22") == "YL2XXX");
}

TEST_CASE("Hashed calls lose their brackets, unresolved hashes give nothing") {
    CHECK(call_of("TM50XXX <F6XXX> RR73") == "F6XXX");
    CHECK(call_of("W1AW <...> RR73") == "<none>");
    CHECK(call_of("<...> W1AW RR73") == "W1AW");
}

TEST_CASE("Decoder annotations are ignored") {
    CHECK(call_of("CQ K1ABC FN42 a1") == "K1ABC");
    CHECK(call_of("K1ABC W9XYZ -12 ?") == "W9XYZ");
    CHECK(call_of("CQ E73XXX OI32 ? a1") == "E73XXX");
}

TEST_CASE("Messages without a second callsign give nothing") {
    CHECK(call_of("E73XXX 73") == "<none>");
    CHECK(call_of("EFHW 50W 73") == "<none>");
    CHECK(call_of("OZ1XXX 0") == "<none>");
    CHECK(call_of("HELLO WORLD") == "<none>");
    CHECK(call_of("CQ POTA") == "<none>");
    CHECK(call_of("") == "<none>");
    CHECK(call_of("K1ABC") == "<none>");
    CHECK(call_of("W9XYZ K1ABC R 589 0013; FD") == "<none>");
}

TEST_CASE("Token classifiers") {
    CHECK(is_locator("FN42"));
    CHECK(is_locator("JO22ab"));
    CHECK_FALSE(is_locator("fn42"));
    CHECK(is_locator("RR73"));   // same shape as a grid

    CHECK(is_report("-07"));
    CHECK(is_report("+12"));
    CHECK(is_report("R-18"));
    CHECK_FALSE(is_report("RR73"));
    CHECK_FALSE(is_report("-7"));

    CHECK(is_standard_callsign("K1ABC"));
    CHECK(is_standard_callsign("D1X"));
    CHECK(is_standard_callsign("9H1XX"));
    CHECK(is_standard_callsign("A61AB"));
    CHECK_FALSE(is_standard_callsign("73"));
    CHECK_FALSE(is_standard_callsign("CQ"));
}

TEST_CASE("normalize_callsign strips hash brackets and rejects malformed calls") {
    CHECK(normalize_callsign("<F6XXX>") == std::optional<std::string>("F6XXX"));
    CHECK(normalize_callsign("G4ABC") == std::optional<std::string>("G4ABC"));
    CHECK_FALSE(normalize_callsign("<...>").has_value());
    CHECK_FALSE(normalize_callsign("").has_value());
    CHECK_FALSE(normalize_callsign("g4abc").has_value());
    CHECK_FALSE(normalize_callsign("TEST").has_value());
}
