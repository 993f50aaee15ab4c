#include <doctest/doctest.h>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "castlink/error.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/receiver_controller.hpp"
#include "support/device_harness.hpp"

using namespace castlink;
using namespace castlink::test;
using namespace std::chrono_literals;

namespace {

ErrorKind kind_of(const std::function<void()>& call) {
    try {
        call();
    } catch (const CastError& e) {
        return e.kind();
    }
    FAIL("call did not throw");
    return ErrorKind::EncodingError;
}

const FakeApp kBackdrop{"E8C28D3C", "session-b", "web-0", true, "Backdrop"};
const FakeApp kYouTube{"YouTube", "session-yt", "web-5", false, "YouTube"};

} // namespace

TEST_CASE("get_status parses applications and volume") {
    DeviceHarness h;
    h.script.set_running({kBackdrop});

    ReceiverStatus status = h.device->receiver().get_status();
    REQUIRE(status.applications.size() == 1);
    CHECK(status.applications[0].app_id == "E8C28D3C");
    CHECK(status.applications[0].transport_id == "web-0");
    CHECK(status.applications[0].is_idle);
    CHECK(status.applications[0].namespaces == std::vector<std::string>{ns::kMedia});
    REQUIRE(status.volume.level);
    CHECK(*status.volume.level == doctest::Approx(0.5));
    CHECK(status.is_active_input);
    CHECK_FALSE(status.is_stand_by);

    auto sent = h.stream->sent_on(ns::kReceiver);
    REQUIRE(sent.size() == 1);
    CHECK(message_type(body_of(sent[0])) == "GET_STATUS");
    CHECK(request_id_of(body_of(sent[0])) > 0);
}

TEST_CASE("Launching YouTube exposes its session and transport") {
    DeviceHarness h;
    h.script.add_launchable(kYouTube);

    h.device->receiver().get_status();
    CHECK(h.device->receiver().applications().empty());

    Application app = h.device->receiver().launch("YouTube");
    CHECK(app.transport_id == "web-5");
    CHECK(app.session_id == "session-yt");
    CHECK_FALSE(app.is_idle);

    ReceiverStatus status = h.device->receiver().get_status();
    REQUIRE(status.applications.size() == 1);
    CHECK(status.applications[0].transport_id == "web-5");
    CHECK_FALSE(status.applications[0].is_idle);

    auto launches = h.stream->sent_on(ns::kReceiver);
    REQUIRE(launches.size() == 3);
    CHECK(message_type(body_of(launches[1])) == "LAUNCH");
    CHECK(body_of(launches[1])["appId"].asString() == "YouTube");
}

TEST_CASE("LAUNCH_ERROR is a rejected command") {
    DeviceHarness h;
    CHECK(kind_of([&] { h.device->receiver().launch("NOPE"); }) == ErrorKind::CommandRejected);
}

TEST_CASE("Launch waits for the status that shows the app running") {
    DeviceHarness h;
    h.script.add_launchable(kYouTube);
    h.script.on(ns::kReceiver, "LAUNCH", [&](const Envelope& request, const Json::Value&) {
        // Acknowledge with the old status, then report the app a moment later.
        h.script.reply(request, receiver_status({kBackdrop}));
        h.script.set_running({kYouTube});
        h.script.push_status();
        return true;
    });

    Application app = h.device->receiver().launch("YouTube");
    CHECK(app.transport_id == "web-5");
}

TEST_CASE("Launch fails when the app never shows up") {
    DeviceHarness h;
    h.script.on(ns::kReceiver, "LAUNCH", [&](const Envelope& request, const Json::Value&) {
        h.script.reply(request, receiver_status({kBackdrop}));
        return true;
    });
    h.script.set_running({kBackdrop});

    CHECK(kind_of([&] { h.device->receiver().launch("YouTube", 300ms); }) == ErrorKind::LaunchFailed);
}

TEST_CASE("LAUNCH_STATUS acknowledgment is followed by the status that confirms the app") {
    DeviceHarness h;
    h.script.on(ns::kReceiver, "LAUNCH", [&](const Envelope& request, const Json::Value&) {
        Json::Value ack;
        ack["type"] = "LAUNCH_STATUS";
        ack["status"] = "USER_ALLOWED";
        h.script.reply(request, ack);
        h.script.set_running({kYouTube});
        h.script.push_status();
        return true;
    });

    Application app = h.device->receiver().launch("YouTube");
    CHECK(app.transport_id == "web-5");
    CHECK(app.session_id == "session-yt");
}

TEST_CASE("Launch of an already cached app waits for a newer status") {
    DeviceHarness h;
    h.script.set_running({kYouTube});
    h.device->receiver().get_status();
    REQUIRE(h.device->receiver().find_running("YouTube"));

    SUBCASE("silent device") {
        h.script.on(ns::kReceiver, "LAUNCH", [](const Envelope&, const Json::Value&) { return true; });
        h.script.on(ns::kReceiver, "GET_STATUS", [](const Envelope&, const Json::Value&) { return true; });

        CHECK(kind_of([&] { h.device->receiver().launch("YouTube", 300ms); }) == ErrorKind::LaunchFailed);
    }

    SUBCASE("relaunch moves the app to a new transport") {
        const FakeApp relaunched{"YouTube", "session-yt2", "web-6", false, "YouTube"};
        h.script.on(ns::kReceiver, "LAUNCH", [&](const Envelope&, const Json::Value&) {
            h.script.set_running({relaunched});
            h.script.push_status();
            return true;
        });

        Application app = h.device->receiver().launch("YouTube");
        CHECK(app.transport_id == "web-6");
        CHECK(app.session_id == "session-yt2");
    }
}

TEST_CASE("Stopping an unknown session fails before anything is sent") {
    DeviceHarness h;
    h.script.set_running({kBackdrop});
    h.device->receiver().get_status();
    const auto before = h.sent_count(ns::kReceiver);

    CHECK(kind_of([&] { h.device->receiver().stop("web-77"); }) == ErrorKind::NotRunning);
    CHECK(h.sent_count(ns::kReceiver) == before);
}

TEST_CASE("Stop sends the session id and the app disappears") {
    DeviceHarness h;
    h.script.set_running({kYouTube});
    h.device->receiver().get_status();

    ReceiverStatus status = h.device->receiver().stop("web-5");
    CHECK(status.applications.empty());
    CHECK(h.device->receiver().applications().empty());

    auto sent = h.stream->sent_on(ns::kReceiver);
    CHECK(message_type(body_of(sent.back())) == "STOP");
    CHECK(body_of(sent.back())["sessionId"].asString() == "session-yt");
}

TEST_CASE("Volume level is validated and applied") {
    DeviceHarness h;
    const auto before = h.sent_count(ns::kReceiver);
    CHECK(kind_of([&] { h.device->receiver().set_volume(1.5); }) == ErrorKind::CommandRejected);
    CHECK(kind_of([&] { h.device->receiver().set_volume(-0.1); }) == ErrorKind::CommandRejected);
    CHECK(h.sent_count(ns::kReceiver) == before);

    Volume v = h.device->receiver().set_volume(0.3);
    REQUIRE(v.level);
    CHECK(*v.level == doctest::Approx(0.3));
    CHECK(body_of(h.stream->sent_on(ns::kReceiver).back())["volume"]["level"].asDouble() == doctest::Approx(0.3));

    Volume m = h.device->receiver().set_muted(true);
    REQUIRE(m.muted);
    CHECK(*m.muted);
}

TEST_CASE("Status push replaces the application list wholesale") {
    DeviceHarness h;
    h.script.set_running({kBackdrop});
    h.device->receiver().get_status();

    h.script.set_running({kYouTube});
    h.script.push_status();

    REQUIRE(eventually([&] {
        auto apps = h.device->receiver().applications();
        return apps.size() == 1 && apps[0].transport_id == "web-5";
    }));
    CHECK(h.device->receiver().find_running("YouTube"));
    CHECK_FALSE(h.device->receiver().find_running("E8C28D3C"));
}

TEST_CASE("Unanswered status request times out") {
    Config config = quick_config();
    config.status_timeout = 50ms;
    DeviceHarness h(config);
    h.script.on(ns::kReceiver, "GET_STATUS", [](const Envelope&, const Json::Value&) { return true; });

    CHECK(kind_of([&] { h.device->receiver().get_status(); }) == ErrorKind::Timeout);
}

TEST_CASE("Receiver status parsing tolerates missing fields") {
    Json::Value status;
    status["applications"][0]["appId"] = "X";
    ReceiverStatus parsed = parse_receiver_status(status);
    REQUIRE(parsed.applications.size() == 1);
    CHECK(parsed.applications[0].app_id == "X");
    CHECK_FALSE(parsed.applications[0].is_idle);
    CHECK_FALSE(parsed.volume.level);

    CHECK_THROWS_AS(parse_receiver_status(Json::Value("nope")), CastError);
}
