#include "doctest/doctest.h"
#include "monitor/SyncCoordinator.h"
#include "FakeTransport.h"
#include "TestFixtures.h"

using namespace CamSync;
using namespace CamSync::Testing;

namespace {
const std::string HOMESCREEN_URL = std::string(REGION_BASE) + "/homescreen";
const std::string SYNCMODULE_URL = std::string(REGION_BASE) + "/network/1234/syncmodules";
const std::string THUMB_URL = std::string(REGION_BASE) + "/thumb/front.jpg";

std::string homescreen(const std::string& frontThumb) {
    nlohmann::json body = {
        {"cameras", {
            camera(1, "Front", 1234, frontThumb),
            camera(2, "Garage", 1234),
            camera(3, "Lake", 5678)
        }}
    };
    return body.dump();
}

struct CoordinatorFixture {
    FakeTransport transport;
    SessionManager session{&transport};

    CoordinatorFixture() {
        transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(loginBody()));
        auto login = session.authenticate({"user@example.com", "secret"});
        DOCTEST_REQUIRE(login);
    }
};
} // anonymous namespace

DOCTEST_TEST_CASE_FIXTURE(CoordinatorFixture, "start reads sync module status and caches this network's cameras") {
    transport.enqueue(SYNCMODULE_URL, FakeTransport::ok(R"({"syncmodule": {"id": 77, "status": "online"}})"));
    transport.enqueue(HOMESCREEN_URL, FakeTransport::ok(homescreen("/thumb/front")));
    transport.enqueue(THUMB_URL, FakeTransport::ok("JPEGDATA"));

    SyncCoordinator coordinator(session, "Home", "1234");
    DOCTEST_REQUIRE(coordinator.start());

    DOCTEST_CHECK(coordinator.online());
    DOCTEST_CHECK_EQ(coordinator.syncModuleId().value(), "77");
    DOCTEST_CHECK(coordinator.state() == SyncState::Idle);
    DOCTEST_CHECK(!coordinator.lastRefreshError());

    DeviceCache devices = coordinator.devices();
    DOCTEST_CHECK_EQ(devices.size(), 2u);
    DOCTEST_CHECK(devices.contains("front"));
    DOCTEST_CHECK(!devices.contains("Lake"));

    const DeviceState* front = devices.find("Front");
    DOCTEST_REQUIRE(front);
    DOCTEST_CHECK_EQ(std::string(front->imageCache.begin(), front->imageCache.end()), "JPEGDATA");
}

DOCTEST_TEST_CASE_FIXTURE(CoordinatorFixture, "refresh reuses cached images unless forced or changed") {
    transport.enqueue(HOMESCREEN_URL, FakeTransport::ok(homescreen("/thumb/front")));
    transport.enqueue(THUMB_URL, FakeTransport::ok("JPEGDATA"));

    SyncCoordinator coordinator(session, "Home", "1234");
    DOCTEST_REQUIRE(coordinator.refresh(false));
    DOCTEST_CHECK_EQ(transport.count(THUMB_URL), 1);

    DOCTEST_REQUIRE(coordinator.refresh(false));
    DOCTEST_CHECK_EQ(transport.count(THUMB_URL), 1);
    DOCTEST_CHECK_EQ(coordinator.devices().find("Front")->imageCache.size(), 8u);

    DOCTEST_REQUIRE(coordinator.refresh(true));
    DOCTEST_CHECK_EQ(transport.count(THUMB_URL), 2);
}

DOCTEST_TEST_CASE_FIXTURE(CoordinatorFixture, "failed refresh keeps the previous cache") {
    transport.enqueue(HOMESCREEN_URL, FakeTransport::ok(homescreen("")));
    transport.enqueue(HOMESCREEN_URL, FakeTransport::status(500));

    SyncCoordinator coordinator(session, "Home", "1234");
    DOCTEST_REQUIRE(coordinator.refresh(false));
    DOCTEST_CHECK_EQ(coordinator.devices().size(), 2u);

    auto result = coordinator.refresh(false);
    DOCTEST_REQUIRE(!result);
    DOCTEST_CHECK(result.error().code() == ErrorCode::NETWORK_BAD_STATUS);
    DOCTEST_CHECK(coordinator.state() == SyncState::Idle);
    DOCTEST_CHECK_EQ(coordinator.devices().size(), 2u);
    DOCTEST_REQUIRE(coordinator.lastRefreshError());
    DOCTEST_CHECK_EQ(coordinator.lastRefreshError()->httpStatus(), 500);
}

DOCTEST_TEST_CASE_FIXTURE(CoordinatorFixture, "sync module failure leaves the network offline but still refreshes") {
    transport.enqueue(SYNCMODULE_URL, FakeTransport::status(404));
    transport.enqueue(HOMESCREEN_URL, FakeTransport::ok(homescreen("")));

    SyncCoordinator coordinator(session, "Home", "1234");
    DOCTEST_REQUIRE(coordinator.start());
    DOCTEST_CHECK(!coordinator.online());
    DOCTEST_CHECK(!coordinator.syncModuleId());
    DOCTEST_CHECK_EQ(coordinator.devices().size(), 2u);
}

DOCTEST_TEST_CASE_FIXTURE(CoordinatorFixture, "non-string sync module status reads as offline") {
    transport.enqueue(SYNCMODULE_URL, FakeTransport::ok(R"({"syncmodule": {"id": 77, "status": 1}})"));
    transport.enqueue(HOMESCREEN_URL, FakeTransport::ok(homescreen("")));

    SyncCoordinator coordinator(session, "Home", "1234");
    DOCTEST_REQUIRE(coordinator.start());
    DOCTEST_CHECK(!coordinator.online());
    DOCTEST_CHECK_EQ(coordinator.syncModuleId().value(), "77");
}

DOCTEST_TEST_CASE_FIXTURE(CoordinatorFixture, "last clip address resolves against the region and survives a listing without it") {
    nlohmann::json front = camera(1, "Front", 1234);
    front["clip"] = "/media/front/clip_1.mp4";
    nlohmann::json withClip = {{"cameras", nlohmann::json::array({front})}};
    transport.enqueue(HOMESCREEN_URL, FakeTransport::ok(withClip.dump()));
    nlohmann::json withoutClip = {{"cameras", nlohmann::json::array({camera(1, "Front", 1234)})}};
    transport.enqueue(HOMESCREEN_URL, FakeTransport::ok(withoutClip.dump()));

    SyncCoordinator coordinator(session, "Home", "1234");
    DOCTEST_REQUIRE(coordinator.refresh(false));
    const std::string expected = std::string(REGION_BASE) + "/media/front/clip_1.mp4";
    DOCTEST_CHECK_EQ(coordinator.devices().find("Front")->lastClipAddress.value(), expected);
    DOCTEST_CHECK_EQ(coordinator.devices().find("Front")->toJson()["last_clip"], expected);

    DOCTEST_REQUIRE(coordinator.refresh(false));
    DOCTEST_CHECK_EQ(coordinator.devices().find("Front")->lastClipAddress.value(), expected);
}
