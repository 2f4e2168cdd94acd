#include <doctest/doctest.h>
#include "config.hpp"

#include <map>
#include <string>

using namespace wbf;

static EnvLookup fake_env(const std::map<std::string, std::string>& vars) {
    return [&vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

TEST_CASE("Defaults resolve against HOME and XDG_CONFIG_HOME") {
    const std::map<std::string, std::string> vars = {{"HOME", "/home/op"}};
    ServerConfig cfg = default_config(fake_env(vars));
    CHECK(cfg.bind == "127.0.0.1");
    CHECK(cfg.port == 2237);
    CHECK(cfg.id == "wbf-srv");
    CHECK(cfg.adif_path == "/home/op/.local/share/WSJT-X/wsjtx_log.adi");
    CHECK(default_config_path(fake_env(vars)) == "/home/op/.config/wbf/config.json");

    const std::map<std::string, std::string> xdg = {{"HOME", "/home/op"}, {"XDG_CONFIG_HOME", "/etc/xdg"}};
    CHECK(default_config_path(fake_env(xdg)) == "/etc/xdg/wbf/config.json");
}

TEST_CASE("Config text overrides the defaults it names") {
    ServerConfig cfg;
    REQUIRE(apply_config_text(R"({
        "bind": "0.0.0.0",
        "port": 2238,
        "highlight_dxcc": ["230", 6],
        "dxcc_confirmed_only": true,
        "format": "json",
        "palette": { "highlight": { "fg": null, "bg": "#ffa000" } },
        "unknown_key": 1
    })", cfg));

    CHECK(cfg.bind == "0.0.0.0");
    CHECK(cfg.port == 2238);
    CHECK(cfg.id == "wbf-srv");
    CHECK(cfg.highlight_dxcc == std::set<std::string>{"230", "006"});
    CHECK(cfg.dxcc_confirmed_only);
    CHECK(cfg.reply_heartbeat);
    CHECK(cfg.format == "json");
    CHECK_FALSE(cfg.palette.highlight.foreground.valid());
    CHECK(cfg.palette.highlight.background == Color::rgb(0xFFFF, 0xA0A0, 0x0000));
    CHECK(cfg.palette.new_dxcc.background == Palette{}.new_dxcc.background);
}

TEST_CASE("Bad config values are rejected") {
    ServerConfig cfg;
    CHECK_FALSE(apply_config_text("[]", cfg));
    CHECK_FALSE(apply_config_text("{ \"port\": ", cfg));
    CHECK_FALSE(apply_config_text(R"({ "port": 0 })", cfg));
    CHECK_FALSE(apply_config_text(R"({ "port": 70000 })", cfg));
    CHECK_FALSE(apply_config_text(R"({ "bind": 5 })", cfg));
    CHECK_FALSE(apply_config_text(R"({ "format": "xml" })", cfg));
    ServerConfig fresh;
    CHECK_FALSE(apply_config_text(R"({ "log_level": "loud" })", fresh));
    CHECK_FALSE(apply_config_text(R"({ "palette": { "new_call": { "bg": "cyan" } } })", fresh));
}

TEST_CASE("Missing optional config file is fine, missing required one is not") {
    ServerConfig cfg;
    CHECK(load_config_file("/nonexistent/wbf/config.json", cfg, false));
    CHECK_FALSE(load_config_file("/nonexistent/wbf/config.json", cfg, true));
}

TEST_CASE("Environment overrides") {
    const std::map<std::string, std::string> vars = {
        {"WBF_PATH", "/data/log.adi"},
        {"WBF_HIGHLIGHT", "230, 6,,291"},
        {"WBF_PORT", "2240"},
    };
    ServerConfig cfg;
    REQUIRE(apply_env(cfg, fake_env(vars)));
    CHECK(cfg.adif_path == "/data/log.adi");
    CHECK(cfg.highlight_dxcc == std::set<std::string>{"006", "230", "291"});
    CHECK(cfg.port == 2240);

    const std::map<std::string, std::string> bad = {{"WBF_PORT", "twenty"}};
    CHECK_FALSE(apply_env(cfg, fake_env(bad)));
}

TEST_CASE("Colors and entity codes") {
    Color c;
    REQUIRE(parse_color("#ff8000", c));
    CHECK(c == Color::rgb(0xFFFF, 0x8080, 0x0000));
    CHECK_FALSE(parse_color("ff8000", c));
    CHECK_FALSE(parse_color("#ff80zz", c));
    CHECK_FALSE(parse_color("#fff", c));

    CHECK(normalize_entity(" 6 ") == "006");
    CHECK(normalize_entity("0291") == "291");
    CHECK(normalize_entity("KL") == "KL");
}
