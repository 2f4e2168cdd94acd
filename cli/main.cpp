/**
 * @file main.cpp
 * @brief wbf-srv - worked-before server for WSJT-X class programs.
 *
 * Responsibilities:
 *  - Resolve settings: defaults < config file < environment < CLI11 options.
 *  - Load the ADIF log (and optionally a DXCC prefix table) into a wbf::ContactLog.
 *  - Run the UDP receive loop: every Decode / WSPRDecode is classified and,
 *    when the station is still needed, answered with a HighlightCallsign.
 *  - Keep the log current from LoggedADIF telegrams.
 *  - Print the telegrams nobody else consumes (pretty / json / none).
 *
 * Notes:
 *  - SIGINT / SIGTERM stop the loop after the datagram in flight.
 *  - Exit codes: 0 clean stop, 1 startup failure, CLI11's code for bad options.
 */

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"

#include "adif.hpp"
#include "config.hpp"
#include "server.hpp"
#include "telegram_json.hpp"
#include "wbf/contact_log.hpp"
#include "wbf/dispatcher.hpp"
#include "wbf/log.hpp"
#include "wbf/worked_before.hpp"

#ifndef WBF_VERSION
#define WBF_VERSION "0.0.0"
#endif

using namespace wbf;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static Server* g_server = nullptr;

static void on_signal(int) {
  if (g_server) g_server->stop();
}

static void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT,  &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static const char* env_lookup(const char* name) { return std::getenv(name); }

// Types another handler (or the engine) already deals with; everything else is printed.
static bool consumed_elsewhere(TelegramType t) {
  switch (t) {
    case TelegramType::Decode:
    case TelegramType::Status:
    case TelegramType::Heartbeat:
    case TelegramType::QsoLogged:
    case TelegramType::LoggedAdif:
      return true;
    default:
      return false;
  }
}

static void print_telegram(const std::string& format, const Ansi& ansi,
                           const Endpoint& peer, const Telegram& t) {
  if (format == "json") {
    std::cout << telegram_json_line(peer, t) << std::endl;
  } else if (format == "pretty") {
    std::cout << ansi.bold(to_string(t.type())) << " " << ansi.dim(peer.to_string())
              << "  " << describe(t) << std::endl;
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_bind, opt_id, opt_adif, opt_dxcc_table, opt_format, opt_log_level, opt_config;
  uint16_t opt_port = 0;
  std::vector<std::string> opt_highlight;
  bool opt_confirmed_only = false;
  bool opt_no_heartbeat = false;
  bool opt_exit_on_close = false;
  bool opt_no_color = false;

  CLI::App app{"wbf-srv: worked-before highlighting for WSJT-X"};
  app.set_version_flag("--version", WBF_VERSION);

  auto* o_bind   = app.add_option("--bind", opt_bind, "Bind address (default 127.0.0.1)");
  auto* o_port   = app.add_option("--port", opt_port, "UDP port (default 2237)")
                      ->check(CLI::Range(uint16_t{1}, uint16_t{65535}));
  auto* o_id     = app.add_option("--id", opt_id, "Our id in reply headers (default wbf-srv)");
  auto* o_adif   = app.add_option("--adif", opt_adif, "ADIF log (default $WBF_PATH or ~/.local/share/WSJT-X/wsjtx_log.adi)");
  auto* o_table  = app.add_option("--dxcc-table", opt_dxcc_table, "JSON prefix -> DXCC entity table");
  auto* o_hl     = app.add_option("--highlight-dxcc", opt_highlight, "DXCC entity to highlight (repeatable, or $WBF_HIGHLIGHT)");
  auto* o_conf   = app.add_flag("--dxcc-confirmed-only", opt_confirmed_only, "Credit an entity only once confirmed (QSL/LoTW)");
  auto* o_nohb   = app.add_flag("--no-heartbeat", opt_no_heartbeat, "Do not answer Heartbeat telegrams");
  auto* o_close  = app.add_flag("--exit-on-close", opt_exit_on_close, "Stop when a peer sends Close");
  auto* o_format = app.add_option("--format", opt_format, "Print other telegrams as pretty|json|none")
                      ->check(CLI::IsMember({"pretty", "json", "none"}));
  auto* o_level  = app.add_option("--log-level", opt_log_level, "debug|info|warn|error")
                      ->check(CLI::IsMember({"debug", "info", "warn", "error"}));
  auto* o_config = app.add_option("--config", opt_config, "Config file (default $XDG_CONFIG_HOME/wbf/config.json)");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  // Settings: defaults < config file < environment < command line
  ServerConfig cfg = default_config(env_lookup);
  const bool explicit_config = o_config->count() > 0;
  const std::string config_path = explicit_config ? opt_config : default_config_path(env_lookup);
  if (!load_config_file(config_path, cfg, explicit_config)) return 1;
  if (!apply_env(cfg, env_lookup)) return 1;

  if (o_bind->count())   cfg.bind = opt_bind;
  if (o_port->count())   cfg.port = opt_port;
  if (o_id->count())     cfg.id = opt_id;
  if (o_adif->count())   cfg.adif_path = opt_adif;
  if (o_table->count())  cfg.dxcc_table = opt_dxcc_table;
  if (o_hl->count()) {
    cfg.highlight_dxcc.clear();
    for (const auto& h : opt_highlight) {
      for (const auto& e : parse_entity_list(h)) cfg.highlight_dxcc.insert(e);
    }
  }
  if (o_conf->count())   cfg.dxcc_confirmed_only = true;
  if (o_nohb->count())   cfg.reply_heartbeat = false;
  if (o_close->count())  cfg.exit_on_close = true;
  if (o_format->count()) cfg.format = opt_format;
  if (o_level->count())  cfg.log_level = opt_log_level;

  LogLevel level = LogLevel::Info;
  if (!parse_log_level(cfg.log_level, level)) {
    std::cerr << "error: bad log level " << cfg.log_level << "\n";
    return 1;
  }
  set_log_level(level);

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && cfg.format == "pretty";

  // Contact log
  std::shared_ptr<PrefixDxccTable> table;
  if (!cfg.dxcc_table.empty()) {
    table = std::make_shared<PrefixDxccTable>();
    if (!table->load_file(cfg.dxcc_table)) return 1;
  }
  ContactLog contacts(cfg.dxcc_confirmed_only ? DxccCredit::Confirmed : DxccCredit::Worked, table);
  {
    std::vector<ContactRecord> records;
    if (!load_adif_file(cfg.adif_path, records)) {
      log(LogLevel::Warn, "starting with an empty contact log");
    }
    for (const auto& r : records) contacts.add(r);
  }

  // Engine, dispatcher, server
  WorkedBeforeEngine engine(contacts, cfg.palette, cfg.highlight_dxcc);

  DispatcherConfig dcfg;
  dcfg.id              = cfg.id;
  dcfg.reply_heartbeat = cfg.reply_heartbeat;
  dcfg.version         = WBF_VERSION;
  Dispatcher dispatcher(engine, dcfg);

  Server server(dispatcher, cfg.bind, cfg.port);

  dispatcher.add_handler([&cfg, &ansi](const Endpoint& peer, const Telegram& t) {
    if (!consumed_elsewhere(t.type())) print_telegram(cfg.format, ansi, peer, t);
  });

  dispatcher.add_handler([&contacts](const Endpoint& peer, const Telegram& t) {
    const LoggedAdif* la = t.get_if<LoggedAdif>();
    if (!la || !la->adif_text) return;
    std::size_t added = 0;
    for (const auto& r : parse_adif(*la->adif_text)) {
      if (contacts.add(r)) ++added;
    }
    log(LogLevel::Info, "logged " + std::to_string(added) + " contact(s) from " + peer.to_string()
                        + ", log size " + std::to_string(contacts.size()));
  });

  dispatcher.add_handler([&cfg, &server](const Endpoint& peer, const Telegram& t) {
    if (!t.is<Close>()) return;
    log(LogLevel::Info, "peer " + peer.to_string() + " (" + t.id + ") closed");
    if (cfg.exit_on_close) server.stop();
  });

  if (!server.open()) {
    std::cerr << ansi.red("error: cannot bind " + cfg.bind + ":" + std::to_string(cfg.port)) << "\n";
    return 1;
  }

  g_server = &server;
  install_signal_handlers();
  server.run();
  g_server = nullptr;
  return 0;
}
