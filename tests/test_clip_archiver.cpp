#include "doctest/doctest.h"
#include "features/ClipArchiver.h"
#include "core/TimeUtils.h"
#include "FakeTransport.h"
#include "TestFixtures.h"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace CamSync;
using namespace CamSync::Testing;

namespace {
const int64_t SINCE = 1532781180;   // 2018-07-28T12:33:00+0000

std::string pageUrl(int page) {
    return std::string(REGION_BASE) + "/api/v2/videos/changed?since=2018-07-28T12:33:00+0000&page=" +
           std::to_string(page);
}

nlohmann::json clip(const std::string& camera, const std::string& createdAt,
                    const std::string& address, bool deleted = false) {
    return {
        {"camera_name", camera},
        {"created_at", createdAt},
        {"address", address},
        {"deleted", deleted}
    };
}

std::string page(const std::vector<nlohmann::json>& videos) {
    nlohmann::json body;
    body["videos"] = videos;
    return body.dump();
}

std::string emptyPage() {
    nlohmann::json body;
    body["videos"] = nlohmann::json::array();
    return body.dump();
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

struct ArchiverFixture {
    FakeTransport transport;
    SessionManager session{&transport};
    TempDir dir;

    ArchiverFixture() {
        transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(loginBody()));
        auto login = session.authenticate({"user@example.com", "secret"});
        DOCTEST_REQUIRE(login);
    }

    ClipQuery query(int maxPages = 10) const {
        ClipQuery q;
        q.destination = dir.path();
        q.since = ClipSince(SINCE);
        q.maxPages = maxPages;
        return q;
    }

    void serveClip(const std::string& address, const std::string& bytes) {
        transport.enqueue(std::string(REGION_BASE) + address, FakeTransport::ok(bytes));
    }
};
} // anonymous namespace

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "downloadClips saves clips and is idempotent") {
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({
        clip("Front", "2018-07-28T13:00:00", "/clips/1.mp4"),
        clip("Garage", "2018-07-28T14:00:00", "/clips/2.mp4")
    })));
    transport.enqueue(pageUrl(2), FakeTransport::ok(emptyPage()));
    serveClip("/clips/1.mp4", "one");
    serveClip("/clips/2.mp4", "two");

    ClipArchiver archiver(session);
    auto first = archiver.downloadClips(query());
    DOCTEST_REQUIRE(first);
    DOCTEST_CHECK_EQ(first.value().downloaded.size(), 2u);
    DOCTEST_CHECK_EQ(first.value().pagesFetched, 1);
    DOCTEST_CHECK_EQ(first.value().since, "2018-07-28T12:33:00+0000");
    DOCTEST_CHECK_EQ(readFile(dir.file("Front_2018-07-28T13:00:00.mp4")), "one");
    DOCTEST_CHECK_EQ(readFile(dir.file("Garage_2018-07-28T14:00:00.mp4")), "two");

    auto second = archiver.downloadClips(query());
    DOCTEST_REQUIRE(second);
    DOCTEST_CHECK(second.value().downloaded.empty());
    DOCTEST_CHECK_EQ(second.value().skippedExisting, 2);
    DOCTEST_CHECK_EQ(transport.count(std::string(REGION_BASE) + "/clips/1.mp4"), 1);

    int files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        (void)entry;
        files++;
    }
    DOCTEST_CHECK_EQ(files, 2);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "empty videos list on page 3 stops pagination") {
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({clip("Front", "t1", "/c/1.mp4")})));
    transport.enqueue(pageUrl(2), FakeTransport::ok(page({clip("Front", "t2", "/c/2.mp4")})));
    transport.enqueue(pageUrl(3), FakeTransport::ok(emptyPage()));
    serveClip("/c/1.mp4", "1");
    serveClip("/c/2.mp4", "2");

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(query(10));
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().pagesFetched, 2);
    DOCTEST_CHECK_EQ(transport.count(pageUrl(3)), 1);
    DOCTEST_CHECK_EQ(transport.count(pageUrl(4)), 0);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "missing videos field stops pagination") {
    transport.enqueue(pageUrl(1), FakeTransport::ok(R"({"limit": 25})"));

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(query());
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().pagesFetched, 0);
    DOCTEST_CHECK_EQ(transport.count(pageUrl(2)), 0);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "pages stop before maxPages") {
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({clip("Front", "t1", "/c/1.mp4")})));
    transport.enqueue(pageUrl(2), FakeTransport::ok(page({clip("Front", "t2", "/c/2.mp4")})));
    serveClip("/c/1.mp4", "1");
    serveClip("/c/2.mp4", "2");

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(query(2));
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().pagesFetched, 1);
    DOCTEST_CHECK_EQ(transport.count(pageUrl(2)), 0);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "record without address is skipped and the page continues") {
    nlohmann::json broken = clip("Front", "t1", "/c/1.mp4");
    broken.erase("address");
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({broken, clip("Front", "t2", "/c/2.mp4")})));
    transport.enqueue(pageUrl(2), FakeTransport::ok(emptyPage()));
    serveClip("/c/2.mp4", "2");

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(query());
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().skippedMalformed, 1);
    DOCTEST_REQUIRE_EQ(summary.value().downloaded.size(), 1u);
    DOCTEST_CHECK(std::filesystem::exists(dir.file("Front_t2.mp4")));
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "deleted clips are never downloaded") {
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({
        clip("Front", "t1", "/c/1.mp4", true),
        clip("Garage", "t2", "/c/2.mp4", true)
    })));
    transport.enqueue(pageUrl(2), FakeTransport::ok(emptyPage()));

    ClipArchiver archiver(session);

    ClipQuery all = query();
    auto summary = archiver.downloadClips(all);
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().skippedDeleted, 2);

    ClipQuery named = query();
    named.cameras = CameraFilter::named({"Front"});
    summary = archiver.downloadClips(named);
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().skippedDeleted, 1);
    DOCTEST_CHECK_EQ(summary.value().skippedFiltered, 1);

    DOCTEST_CHECK_EQ(transport.countPrefix(std::string(REGION_BASE) + "/c/"), 0);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "numeric deleted flags follow truthiness") {
    nlohmann::json gone = clip("Front", "t1", "/c/1.mp4");
    gone["deleted"] = 1;
    nlohmann::json kept = clip("Front", "t2", "/c/2.mp4");
    kept["deleted"] = 0;
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({gone, kept})));
    transport.enqueue(pageUrl(2), FakeTransport::ok(emptyPage()));
    serveClip("/c/2.mp4", "2");

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(query());
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().skippedDeleted, 1);
    DOCTEST_CHECK_EQ(summary.value().skippedMalformed, 0);
    DOCTEST_REQUIRE_EQ(summary.value().downloaded.size(), 1u);
    DOCTEST_CHECK_EQ(transport.count(std::string(REGION_BASE) + "/c/1.mp4"), 0);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "named camera filter skips other cameras") {
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({
        clip("Front", "t1", "/c/1.mp4"),
        clip("Garage", "t2", "/c/2.mp4")
    })));
    transport.enqueue(pageUrl(2), FakeTransport::ok(emptyPage()));
    serveClip("/c/2.mp4", "2");

    ClipQuery q = query();
    q.cameras = CameraFilter::fromList({"Garage"});

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(q);
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().skippedFiltered, 1);
    DOCTEST_CHECK_EQ(summary.value().downloaded.size(), 1u);
    DOCTEST_CHECK(!std::filesystem::exists(dir.file("Front_t1.mp4")));
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "camera names that escape the destination are skipped") {
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({clip("../evil", "t1", "/c/1.mp4")})));
    transport.enqueue(pageUrl(2), FakeTransport::ok(emptyPage()));

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(query());
    DOCTEST_REQUIRE(summary);
    DOCTEST_CHECK_EQ(summary.value().skippedMalformed, 1);
    DOCTEST_CHECK_EQ(transport.countPrefix(std::string(REGION_BASE) + "/c/"), 0);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "failed download removes the partial file and aborts") {
    transport.enqueue(pageUrl(1), FakeTransport::ok(page({
        clip("Front", "t1", "/c/1.mp4"),
        clip("Front", "t2", "/c/2.mp4")
    })));
    FakeTransport::Reply broken = FakeTransport::failure(Error(ErrorCode::NETWORK_CONNECTION_FAILED, "reset"));
    broken.body = "partial";
    transport.enqueue(std::string(REGION_BASE) + "/c/1.mp4", broken);

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(query());
    DOCTEST_REQUIRE(!summary);
    DOCTEST_CHECK(summary.error().code() == ErrorCode::NETWORK_CONNECTION_FAILED);
    DOCTEST_CHECK(!std::filesystem::exists(dir.file("Front_t1.mp4")));
    DOCTEST_CHECK_EQ(transport.count(std::string(REGION_BASE) + "/c/2.mp4"), 0);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "page transport failure aborts the run") {
    transport.enqueue(pageUrl(1), FakeTransport::failure(Error(ErrorCode::NETWORK_TIMEOUT, "slow")));

    ClipArchiver archiver(session);
    auto summary = archiver.downloadClips(query());
    DOCTEST_REQUIRE(!summary);
    DOCTEST_CHECK(summary.error().code() == ErrorCode::NETWORK_TIMEOUT);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "since accepts date text and rejects garbage") {
    ClipArchiver archiver(session, Logger(LogCategory::Download), []() { return int64_t(42); });

    auto parsed = archiver.resolveSince(ClipSince(std::string("clips after 2018-07-28T12:33:00Z")));
    DOCTEST_REQUIRE(parsed);
    DOCTEST_CHECK_EQ(parsed.value(), SINCE);

    auto fallback = archiver.resolveSince(std::nullopt);
    DOCTEST_REQUIRE(fallback);
    DOCTEST_CHECK_EQ(fallback.value(), 42);

    ClipQuery q = query();
    q.since = ClipSince(std::string("whenever"));
    auto summary = archiver.downloadClips(q);
    DOCTEST_REQUIRE(!summary);
    DOCTEST_CHECK(summary.error().code() == ErrorCode::VALIDATION_INVALID_FORMAT);
    DOCTEST_CHECK_EQ(transport.countPrefix(std::string(REGION_BASE) + "/api/"), 0);
}

DOCTEST_TEST_CASE_FIXTURE(ArchiverFixture, "since without a year takes it from the clock") {
    ClipArchiver archiver(session, Logger(LogCategory::Download), []() { return int64_t(1530000000); });

    auto parsed = archiver.resolveSince(ClipSince(std::string("July 28")));
    DOCTEST_REQUIRE(parsed);
    DOCTEST_CHECK_EQ(parsed.value(), TimeUtils::parseFuzzyDate("2018-07-28").value());
}

DOCTEST_TEST_CASE("CameraFilter normalizes lists containing all") {
    DOCTEST_CHECK(CameraFilter::fromList({}).isAll());
    DOCTEST_CHECK(CameraFilter::fromList({"Front", "all"}).isAll());

    CameraFilter named = CameraFilter::fromList({"Front", "Back"});
    DOCTEST_CHECK(!named.isAll());
    DOCTEST_CHECK(named.matches("Front"));
    DOCTEST_CHECK(!named.matches("Garage"));
    DOCTEST_CHECK_EQ(named.names().size(), 2u);
    DOCTEST_CHECK(CameraFilter::all().matches("anything"));
}
