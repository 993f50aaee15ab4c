#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "castlink/config.hpp"
#include "castlink/event_bus.hpp"
#include "castlink/heartbeat_monitor.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/transport_channel.hpp"
#include "support/fake_device.hpp"
#include "support/fake_stream.hpp"
#include "support/timers.hpp"

using namespace castlink;
using namespace castlink::test;
using namespace std::chrono_literals;

namespace {

Config fast_heartbeat() {
    Config config;
    config.heartbeat_interval = 20ms;
    config.heartbeat_miss_threshold = 3;
    return config;
}

struct Harness {
    Config config = fast_heartbeat();
    std::shared_ptr<FakeStream> stream = std::make_shared<FakeStream>();
    TransportChannel channel{stream};
    TimerThread timers;
    EventBus bus{16};
    std::shared_ptr<HeartbeatMonitor> heartbeat =
        std::make_shared<HeartbeatMonitor>(channel, bus, timers.io(), config);
    std::atomic<int> lost{0};

    Harness() {
        bus.subscribe_all([this](const Event& e) {
            if (e.kind == Event::Kind::ConnectionLost) ++lost;
        });
    }

    ~Harness() {
        heartbeat->stop();
        timers.stop();
        bus.stop();
    }

    // Device that answers every PING with a PONG.
    void answer_pings() {
        std::weak_ptr<HeartbeatMonitor> weak = heartbeat;
        stream->set_responder([weak](const Envelope& sent) {
            if (sent.ns != ns::kHeartbeat || message_type(body_of(sent)) != "PING") return;
            Json::Value pong;
            pong["type"] = "PONG";
            if (auto hb = weak.lock()) hb->observe(Envelope::json("receiver-0", "sender-0", ns::kHeartbeat, pong));
        });
    }
};

} // namespace

TEST_CASE("Silent device is declared dead after the miss threshold") {
    Harness h;
    h.heartbeat->start();

    REQUIRE(eventually([&] { return h.heartbeat->state() == HeartbeatMonitor::State::Dead; }));
    CHECK(h.channel.closed());
    CHECK(h.stream->is_closed());
    CHECK(eventually([&] { return h.lost == 1; }));
    CHECK(h.stream->sent_on(ns::kHeartbeat).size() == 3);
}

TEST_CASE("Answered pings keep the connection alive") {
    Harness h;
    h.answer_pings();
    h.heartbeat->start();

    std::this_thread::sleep_for(200ms);
    CHECK(h.heartbeat->state() != HeartbeatMonitor::State::Dead);
    CHECK(h.heartbeat->missed() == 0);
    CHECK_FALSE(h.channel.closed());
    CHECK(h.stream->sent_on(ns::kHeartbeat).size() >= 5);
    CHECK(h.lost == 0);
}

TEST_CASE("Pings go to the receiver without a requestId") {
    Harness h;
    h.heartbeat->start();
    REQUIRE(h.stream->wait_for_sent(ns::kHeartbeat, 1));

    Envelope ping = h.stream->sent_on(ns::kHeartbeat).front();
    CHECK(ping.source_id == "sender-0");
    CHECK(ping.destination_id == "receiver-0");
    CHECK(message_type(body_of(ping)) == "PING");
    CHECK(request_id_of(body_of(ping)) == 0);
}

TEST_CASE("Stopped monitor sends no more pings") {
    Harness h;
    h.answer_pings();
    h.heartbeat->start();
    REQUIRE(h.stream->wait_for_sent(ns::kHeartbeat, 2));

    h.heartbeat->stop();
    std::this_thread::sleep_for(30ms);
    const auto count = h.stream->sent_on(ns::kHeartbeat).size();
    std::this_thread::sleep_for(100ms);
    CHECK(h.stream->sent_on(ns::kHeartbeat).size() == count);
    CHECK_FALSE(h.channel.closed());
}

TEST_CASE("Heartbeat stops quietly once the channel is closed") {
    Harness h;
    h.heartbeat->start();
    REQUIRE(h.stream->wait_for_sent(ns::kHeartbeat, 1));

    h.channel.close();
    std::this_thread::sleep_for(100ms);
    CHECK(h.heartbeat->state() != HeartbeatMonitor::State::Dead);
    CHECK(h.lost == 0);
}
