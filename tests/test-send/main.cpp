/**
 * @file main.cpp
 * @brief wbf-send - hand-driven WSJT-X telegram sender for poking a running wbf-srv.
 *
 * Builds one telegram from the command line, sends it to the server, then
 * prints every reply that arrives within `--wait` milliseconds.
 *
 * @section usage Basic Usage
 *
 * @code
 *   # tell the server which band and mode we are on (20m FT8)
 *   ./wbf-send status --dial 14074000 --mode FT8
 *
 *   # a decode; expect a HighlightCallsign back unless K1ABC is in the log
 *   ./wbf-send decode --message "CQ K1ABC FN42"
 *
 *   # liveness; expect our Heartbeat answered
 *   ./wbf-send heartbeat
 *
 *   # feed a logged contact
 *   ./wbf-send adif --text "<call:5>K1ABC<band:3>20m<mode:3>FT8<eor>"
 *
 *   # raw bytes as hex (protocol error testing)
 *   ./wbf-send raw --hex "adbccbda00000002"
 * @endcode
 *
 * Status and decode come from the same peer (one socket) so the server's
 * per-peer Status cache applies when both are given in one run:
 * @code
 *   ./wbf-send decode --message "CQ K1ABC FN42" --dial 14074000 --mode FT8
 * @endcode
 *
 * @note Not part of the automated tests. Use it against a live wbf-srv.
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "udp_io.hpp"
#include "wbf/codec.hpp"
#include "wbf/errors.hpp"
#include "wbf/telegram.hpp"

using namespace wbf;

static bool parse_hex(const std::string& hex, std::vector<uint8_t>& out) {
  std::string digits;
  for (char c : hex) if (c != ' ' && c != ':') digits.push_back(c);
  if (digits.size() % 2 != 0) return false;
  out.clear();
  for (std::size_t i = 0; i < digits.size(); i += 2) {
    char* end = nullptr;
    std::string byte = digits.substr(i, 2);
    unsigned long v = std::strtoul(byte.c_str(), &end, 16);
    if (*end != '\0') return false;
    out.push_back(static_cast<uint8_t>(v));
  }
  return true;
}

static void print_reply(const Datagram& d) {
  std::cout << "<- " << d.peer.to_string() << "  ";
  try {
    std::cout << describe(decode(d.bytes)) << "\n";
  } catch (const TelegramError& e) {
    std::cout << "undecodable (" << e.what() << ")\n";
  }
}

int main(int argc, char** argv) {
  CLI::App app{"wbf-send: send one WSJT-X telegram and print the replies"};
  app.require_subcommand(1);

  std::string host = "127.0.0.1";
  uint16_t port = 2237;
  std::string id = "WSJT-X";
  uint32_t schema = MAX_SCHEMA_VERSION;
  int wait_ms = 500;
  app.add_option("--host", host, "Server address")->capture_default_str();
  app.add_option("--port", port, "Server port")->capture_default_str();
  app.add_option("--id", id, "Sender id")->capture_default_str();
  app.add_option("--schema", schema, "Schema version")->capture_default_str()
     ->check(CLI::Range(0u, 3u));
  app.add_option("--wait", wait_ms, "Milliseconds to wait for replies")->capture_default_str();

  // Status: also used as a prelude to decode / wspr
  uint64_t dial = 0;
  std::string mode = "FT8";

  auto* cmd_hb = app.add_subcommand("heartbeat", "Send a Heartbeat");

  auto* cmd_status = app.add_subcommand("status", "Send a Status");
  cmd_status->add_option("--dial", dial, "Dial frequency in Hz")->required();
  cmd_status->add_option("--mode", mode, "Mode")->capture_default_str();

  std::string message;
  int32_t snr = -10;
  auto* cmd_decode = app.add_subcommand("decode", "Send a Decode (after a Status when --dial is given)");
  cmd_decode->add_option("--message", message, "Decoded message text")->required();
  cmd_decode->add_option("--snr", snr, "SNR in dB")->capture_default_str();
  cmd_decode->add_option("--dial", dial, "Send a Status with this dial frequency first");
  cmd_decode->add_option("--mode", mode, "Mode for that Status")->capture_default_str();

  std::string wspr_call, wspr_grid;
  auto* cmd_wspr = app.add_subcommand("wspr", "Send a WSPRDecode (after a Status when --dial is given)");
  cmd_wspr->add_option("--call", wspr_call, "Spotted callsign")->required();
  cmd_wspr->add_option("--grid", wspr_grid, "Spotted grid");
  cmd_wspr->add_option("--dial", dial, "Send a Status with this dial frequency first");

  std::string adif_text;
  auto* cmd_adif = app.add_subcommand("adif", "Send a LoggedADIF");
  cmd_adif->add_option("--text", adif_text, "ADIF record text")->required();

  auto* cmd_close = app.add_subcommand("close", "Send a Close");

  std::string raw_hex;
  auto* cmd_raw = app.add_subcommand("raw", "Send raw bytes");
  cmd_raw->add_option("--hex", raw_hex, "Datagram as hex")->required();

  CLI11_PARSE(app, argc, argv);

  auto frame = [&](Payload p) {
    Telegram t;
    t.schema_version = schema;
    t.id = id;
    t.payload = std::move(p);
    return encode(t);
  };
  auto status_for = [&]() {
    Status s;
    s.dial_frequency_hz = dial;
    s.mode = mode;
    s.tx_mode = mode;
    s.decoding = true;
    return s;
  };

  std::vector<std::vector<uint8_t>> out;
  if (*cmd_hb) {
    Heartbeat hb;
    hb.version = Text("wbf-send");
    hb.revision = Text(std::string());
    out.push_back(frame(hb));
  } else if (*cmd_status) {
    out.push_back(frame(status_for()));
  } else if (*cmd_decode) {
    if (dial) out.push_back(frame(status_for()));
    Decode d;
    d.snr = snr;
    d.mode = Text("~");
    d.message = message;
    out.push_back(frame(d));
  } else if (*cmd_wspr) {
    if (dial) { mode = "WSPR"; out.push_back(frame(status_for())); }
    WsprDecode w;
    w.callsign = wspr_call;
    w.grid = wspr_grid;
    out.push_back(frame(w));
  } else if (*cmd_adif) {
    out.push_back(frame(LoggedAdif{Text(adif_text)}));
  } else if (*cmd_close) {
    out.push_back(frame(Close{}));
  } else if (*cmd_raw) {
    std::vector<uint8_t> bytes;
    if (!parse_hex(raw_hex, bytes)) {
      std::cerr << "error: --hex is not an even number of hex digits\n";
      return 2;
    }
    out.push_back(bytes);
  }

  int fd = open_udp("0.0.0.0", 0);
  if (fd < 0) {
    std::cerr << "error: cannot open a UDP socket\n";
    return 1;
  }

  Datagram d;
  d.peer.address = host;
  d.peer.port = port;
  for (auto& bytes : out) {
    d.bytes = bytes;
    std::cout << "-> " << d.peer.to_string() << "  " << bytes.size() << " bytes\n";
    if (!send_datagram(fd, d)) {
      close_udp(fd);
      return 1;
    }
  }

  Datagram reply;
  int replies = 0;
  while (recv_datagram(fd, reply, wait_ms)) {
    print_reply(reply);
    ++replies;
  }
  std::cout << replies << " reply(ies)\n";

  close_udp(fd);
  return 0;
}
