#include <unity.h>

#include <chrono>
#include <memory>

#include <boost/asio/error.hpp>
#include <boost/beast/websocket/error.hpp>

#include "ConnectionSupervisor.hpp"
#include "WebSocketSession.hpp"
#include "fakes/FakeBusClient.h"
#include "fakes/FakeStreamSession.h"
#include "test_support.h"

using std::chrono::milliseconds;
using State = wsb::ConnectionSupervisor::State;

namespace {
struct Bridge {
    wsb::AppConfig cfg = bridge_config();
    FakeBusClient bus;
    wsb::Publisher publisher {bus, cfg};
    wsb::FieldExtractor extractor {cfg.mappings};
    wsb::FrameProcessor processor {extractor, publisher, cfg.debug};
};

boost::system::error_code refused() {
    return boost::asio::error::make_error_code(boost::asio::error::connection_refused);
}
} // namespace

void test_supervisor_republishes_discovery_after_upstream_close() {
    boost::asio::io_context io;
    Bridge b;
    FakeUpstream upstream;
    upstream.attempts.push_back({{}, {R"({"progress":0.42})"}, boost::beast::websocket::error::closed});
    wsb::ConnectionSupervisor sup(io, make_fake_factory(io, upstream), b.processor,
                                  wsb::Backoff(milliseconds(10), milliseconds(40)));
    sup.start();
    TEST_ASSERT_TRUE(sup.state() == State::Connecting);

    TEST_ASSERT_TRUE(run_until(io, [&] { return sup.connections() == 2 && sup.state() == State::Connected; }));
    TEST_ASSERT_EQUAL_UINT(1, sup.failures());
    TEST_ASSERT_EQUAL_INT(2, upstream.created);
    TEST_ASSERT_EQUAL_INT(10, static_cast<int>(sup.currentBackoff().count()));

    auto disc = b.bus.on_topic("homeassistant/sensor/k1max/p/config");
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(disc.size()));
    TEST_ASSERT_EQUAL_STRING(disc[0].payload.c_str(), disc[1].payload.c_str());
    TEST_ASSERT_EQUAL_INT(4, static_cast<int>(b.bus.count_suffix("/config")));

    auto state = b.bus.on_topic("k1/state/p");
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(state.size()));
    TEST_ASSERT_EQUAL_STRING("42.0", state[0].payload.c_str());

    sup.stop();
    TEST_ASSERT_TRUE(run_until(io, [&] { return sup.state() == State::Disconnected; }));
    TEST_ASSERT_EQUAL_INT(2, upstream.closed);
}

void test_supervisor_backs_off_across_consecutive_failures() {
    boost::asio::io_context io;
    Bridge b;
    FakeUpstream upstream;
    for (int i = 0; i < 3; ++i) upstream.attempts.push_back({refused(), {}, {}});
    wsb::ConnectionSupervisor sup(io, make_fake_factory(io, upstream), b.processor,
                                  wsb::Backoff(milliseconds(5), milliseconds(100)));
    sup.start();

    TEST_ASSERT_TRUE(run_until(io, [&] { return sup.failures() == 3; }));
    TEST_ASSERT_EQUAL_INT(40, static_cast<int>(sup.currentBackoff().count()));
    TEST_ASSERT_TRUE(sup.state() == State::Disconnected);
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(b.bus.messages().size()));

    TEST_ASSERT_TRUE(run_until(io, [&] { return sup.state() == State::Connected; }));
    TEST_ASSERT_EQUAL_UINT(1, sup.connections());
    TEST_ASSERT_EQUAL_INT(5, static_cast<int>(sup.currentBackoff().count()));
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(b.bus.count_suffix("/config")));

    sup.stop();
    TEST_ASSERT_TRUE(run_until(io, [&] { return sup.state() == State::Disconnected; }));
}

void test_supervisor_stays_connected_through_malformed_frames() {
    boost::asio::io_context io;
    Bridge b;
    FakeUpstream upstream;
    upstream.attempts.push_back({{}, {"<html>not json</html>", R"({"time_left": 125})"}, {}});
    wsb::ConnectionSupervisor sup(io, make_fake_factory(io, upstream), b.processor,
                                  wsb::Backoff(milliseconds(5), milliseconds(20)));
    sup.start();

    TEST_ASSERT_TRUE(run_until(io, [&] { return !b.bus.on_topic("k1/state/t").empty(); }));
    TEST_ASSERT_TRUE(sup.state() == State::Connected);
    TEST_ASSERT_EQUAL_UINT(0, sup.failures());
    TEST_ASSERT_EQUAL_STRING("00:02:05", b.bus.on_topic("k1/state/t")[0].payload.c_str());
    // One discovery per mapping plus one state per mapping from the valid frame.
    TEST_ASSERT_EQUAL_INT(4, static_cast<int>(b.bus.messages().size()));

    sup.stop();
    TEST_ASSERT_TRUE(run_until(io, [&] { return sup.state() == State::Disconnected; }));
    TEST_ASSERT_EQUAL_INT(1, upstream.closed);
}

void test_supervisor_stop_cancels_backoff_wait() {
    boost::asio::io_context io;
    Bridge b;
    FakeUpstream upstream;
    upstream.attempts.push_back({refused(), {}, {}});
    wsb::ConnectionSupervisor sup(io, make_fake_factory(io, upstream), b.processor,
                                  wsb::Backoff(std::chrono::seconds(30), std::chrono::seconds(60)));
    sup.start();
    TEST_ASSERT_TRUE(run_until(io, [&] { return sup.failures() == 1; }));
    sup.stop();
    io.restart();
    io.run_for(milliseconds(500));
    TEST_ASSERT_TRUE(io.stopped());
    TEST_ASSERT_EQUAL_INT(1, upstream.created);
    TEST_ASSERT_EQUAL_UINT(0, sup.connections());
}

void test_supervisor_treats_invalid_url_as_transport_failure() {
    boost::asio::io_context io;
    Bridge b;
    int created = 0;
    wsb::SessionFactory factory = [&]() -> std::unique_ptr<wsb::IStreamSession> {
        ++created;
        return std::make_unique<wsb::WebSocketSession>(io, "not a url", std::map<std::string, std::string>());
    };
    wsb::ConnectionSupervisor sup(io, factory, b.processor, wsb::Backoff(milliseconds(5), milliseconds(10)));
    sup.start();
    TEST_ASSERT_TRUE(run_until(io, [&] { return sup.failures() >= 2; }));
    TEST_ASSERT_TRUE(created >= 2);
    TEST_ASSERT_EQUAL_UINT(0, sup.connections());
    sup.stop();
    io.restart();
    io.run_for(milliseconds(500));
    TEST_ASSERT_TRUE(io.stopped());
}

void test_ws_url_parsing() {
    auto ep = wsb::parseWsUrl("ws://192.168.1.50:9999");
    TEST_ASSERT_TRUE(ep.has_value());
    TEST_ASSERT_EQUAL_STRING("192.168.1.50", ep->host.c_str());
    TEST_ASSERT_EQUAL_STRING("9999", ep->port.c_str());
    TEST_ASSERT_EQUAL_STRING("/", ep->target.c_str());
    TEST_ASSERT_EQUAL_STRING("192.168.1.50:9999", ep->hostHeader.c_str());
    TEST_ASSERT_FALSE(ep->tls);

    ep = wsb::parseWsUrl("WS://printer.local/websocket?token=1");
    TEST_ASSERT_TRUE(ep.has_value());
    TEST_ASSERT_EQUAL_STRING("printer.local", ep->host.c_str());
    TEST_ASSERT_EQUAL_STRING("80", ep->port.c_str());
    TEST_ASSERT_EQUAL_STRING("/websocket?token=1", ep->target.c_str());

    ep = wsb::parseWsUrl("ws://[fe80::1]:7125/ws");
    TEST_ASSERT_TRUE(ep.has_value());
    TEST_ASSERT_EQUAL_STRING("fe80::1", ep->host.c_str());
    TEST_ASSERT_EQUAL_STRING("7125", ep->port.c_str());

    TEST_ASSERT_FALSE(wsb::parseWsUrl("http://printer.local").has_value());
    TEST_ASSERT_FALSE(wsb::parseWsUrl("ws://").has_value());
    TEST_ASSERT_FALSE(wsb::parseWsUrl("ws://host:").has_value());
    TEST_ASSERT_FALSE(wsb::parseWsUrl("ws://host:99999").has_value());
    TEST_ASSERT_FALSE(wsb::parseWsUrl("ws://host:abc").has_value());
}

void test_wss_url_parsing() {
    auto ep = wsb::parseWsUrl("wss://printer.example.com/ws");
    TEST_ASSERT_TRUE(ep.has_value());
    TEST_ASSERT_TRUE(ep->tls);
    TEST_ASSERT_EQUAL_STRING("printer.example.com", ep->host.c_str());
    TEST_ASSERT_EQUAL_STRING("443", ep->port.c_str());
    TEST_ASSERT_EQUAL_STRING("/ws", ep->target.c_str());

    ep = wsb::parseWsUrl("WSS://10.0.0.7:8443");
    TEST_ASSERT_TRUE(ep.has_value());
    TEST_ASSERT_TRUE(ep->tls);
    TEST_ASSERT_EQUAL_STRING("8443", ep->port.c_str());
    TEST_ASSERT_EQUAL_STRING("/", ep->target.c_str());

    TEST_ASSERT_FALSE(wsb::parseWsUrl("wss://").has_value());
    TEST_ASSERT_FALSE(wsb::parseWsUrl("wss:/printer.local").has_value());
}
