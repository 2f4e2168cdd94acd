#include <doctest/doctest.h>
#include "server.hpp"
#include "udp_io.hpp"
#include "wbf/codec.hpp"
#include "wbf/contact_log.hpp"

#include <stdexcept>
#include <thread>

using namespace wbf;

namespace {

class BrokenLookup : public ContactLookup {
public:
    LookupResult lookup(const std::string&, const std::string&, const std::string&) const override {
        throw std::runtime_error("index corrupt");
    }
};

Datagram to_server(uint16_t port, Payload p) {
    Telegram t;
    t.id = "WSJT-X";
    t.payload = std::move(p);
    return Datagram{Endpoint{"127.0.0.1", port}, encode(t)};
}

Status status_20m_ft8() {
    Status s;
    s.dial_frequency_hz = 14074000;
    s.mode = Text("FT8");
    return s;
}

Decode decode_of(const std::string& message) {
    Decode d;
    d.mode = Text("~");
    d.message = message;
    return d;
}

} // namespace

TEST_CASE("Server answers a Heartbeat over loopback and stops on request") {
    ContactLog log;
    WorkedBeforeEngine engine(log);
    Dispatcher disp(engine);
    Server server(disp, "127.0.0.1", 0);
    REQUIRE(server.open());
    const uint16_t port = server.port();
    REQUIRE(port != 0);

    std::thread loop([&server] { server.run(); });

    int fd = open_udp("127.0.0.1", 0);
    REQUIRE(fd >= 0);

    Telegram hb;
    hb.id = "WSJT-X";
    hb.payload = Heartbeat{};
    Datagram out{Endpoint{"127.0.0.1", port}, encode(hb)};
    CHECK(send_datagram(fd, out));

    Datagram reply;
    const bool got = recv_datagram(fd, reply, 2000);

    server.stop();
    loop.join();
    close_udp(fd);

    REQUIRE(got);
    CHECK(reply.peer.port == port);
    Telegram t = decode(reply.bytes);
    CHECK(t.is<Heartbeat>());
    CHECK(t.id == "wbf-srv");
}

TEST_CASE("Binding a bad address fails") {
    CHECK(open_udp("not-an-address", 0) < 0);
}

TEST_CASE("A datagram whose dispatch throws is skipped and the loop keeps serving") {
    BrokenLookup lookup;
    WorkedBeforeEngine engine(lookup);
    Dispatcher disp(engine);
    Server server(disp, "127.0.0.1", 0);
    REQUIRE(server.open());
    const uint16_t port = server.port();

    std::thread loop([&server] { server.run(); });

    int fd = open_udp("127.0.0.1", 0);
    REQUIRE(fd >= 0);
    CHECK(send_datagram(fd, to_server(port, status_20m_ft8())));
    CHECK(send_datagram(fd, to_server(port, decode_of("CQ K1ABC FN42"))));
    CHECK(send_datagram(fd, to_server(port, Heartbeat{})));

    Datagram reply;
    const bool got = recv_datagram(fd, reply, 2000);

    server.stop();
    loop.join();
    close_udp(fd);

    REQUIRE(got);
    CHECK(decode(reply.bytes).is<Heartbeat>());
}

TEST_CASE("Stopping the server clears the calls it painted") {
    ContactLog log;
    WorkedBeforeEngine engine(log);
    Dispatcher disp(engine);
    Server server(disp, "127.0.0.1", 0);
    REQUIRE(server.open());
    const uint16_t port = server.port();

    std::thread loop([&server] { server.run(); });

    int fd = open_udp("127.0.0.1", 0);
    REQUIRE(fd >= 0);
    CHECK(send_datagram(fd, to_server(port, status_20m_ft8())));
    CHECK(send_datagram(fd, to_server(port, decode_of("CQ K1ABC FN42"))));

    Datagram painted;
    const bool got_paint = recv_datagram(fd, painted, 2000);

    server.stop();
    Datagram cleared;
    const bool got_clear = recv_datagram(fd, cleared, 2000);
    loop.join();
    close_udp(fd);

    REQUIRE(got_paint);
    CHECK(decode(painted.bytes).get_if<HighlightCallsign>()->background_color.valid());

    REQUIRE(got_clear);
    const HighlightCallsign* h = decode(cleared.bytes).get_if<HighlightCallsign>();
    REQUIRE(h != nullptr);
    CHECK(h->callsign == Text("K1ABC"));
    CHECK_FALSE(h->background_color.valid());
    CHECK_FALSE(h->foreground_color.valid());
    CHECK(disp.clear_all().empty());
}
