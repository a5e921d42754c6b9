#include "doctest/doctest.h"
#include "core/SessionManager.h"
#include "FakeTransport.h"
#include "TestFixtures.h"

#include <sstream>

using namespace CamSync;
using namespace CamSync::Testing;

DOCTEST_TEST_CASE("authenticate rejects missing username before password") {
    FakeTransport transport;
    SessionManager manager(&transport);

    auto result = manager.authenticate({"", ""});
    DOCTEST_REQUIRE(!result);
    DOCTEST_CHECK(result.error().code() == ErrorCode::AUTH_MISSING_USERNAME);

    result = manager.authenticate({"user@example.com", ""});
    DOCTEST_REQUIRE(!result);
    DOCTEST_CHECK(result.error().code() == ErrorCode::AUTH_MISSING_PASSWORD);
    DOCTEST_CHECK(transport.requests().empty());
}

DOCTEST_TEST_CASE("successful login builds host and auth header from region") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(loginBody("abc")));
    SessionManager manager(&transport);

    DOCTEST_CHECK(!manager.authHeader());

    auto result = manager.authenticate({"user@example.com", "secret"});
    DOCTEST_REQUIRE(result);
    DOCTEST_CHECK_EQ(result.value().regionId, "test");
    DOCTEST_CHECK_EQ(result.value().region, "Testland");
    DOCTEST_CHECK_EQ(result.value().host, "test.immedia-semi.com");
    DOCTEST_CHECK_EQ(result.value().baseUrl, REGION_BASE);
    DOCTEST_CHECK_EQ(result.value().generation, 1u);
    DOCTEST_CHECK_EQ(result.value().networks.size(), 2u);

    auto header = manager.authHeader();
    DOCTEST_REQUIRE(header);
    DOCTEST_CHECK_EQ(header->host, "test.immedia-semi.com");
    DOCTEST_CHECK_EQ(header->token, "abc");

    auto sent = transport.requests();
    DOCTEST_REQUIRE_EQ(sent.size(), 1u);
    DOCTEST_CHECK_EQ(sent[0].method, "POST");
    DOCTEST_CHECK_EQ(sent[0].headers["Host"], "prod.immedia-semi.com");
    DOCTEST_CHECK_EQ(sent[0].headers["Content-Type"], "application/json");
    auto body = nlohmann::json::parse(sent[0].body);
    DOCTEST_CHECK_EQ(body["email"], "user@example.com");
    DOCTEST_CHECK_EQ(body["password"], "secret");
    DOCTEST_CHECK_EQ(body["client_specifier"], Endpoints::CLIENT_SPECIFIER);
}

DOCTEST_TEST_CASE("non-200 primary login retries the backup endpoint exactly once") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::status(500));
    transport.enqueue(Endpoints::LOGIN_BACKUP_URL, FakeTransport::ok(loginBody()));
    SessionManager manager(&transport);

    auto result = manager.authenticate({"user@example.com", "secret"});
    DOCTEST_REQUIRE(result);
    DOCTEST_CHECK_EQ(result.value().loginUrl, Endpoints::LOGIN_BACKUP_URL);

    auto sent = transport.requests();
    DOCTEST_REQUIRE_EQ(sent.size(), 2u);
    DOCTEST_CHECK_EQ(sent[0].url, Endpoints::LOGIN_URL);
    DOCTEST_CHECK_EQ(sent[1].url, Endpoints::LOGIN_BACKUP_URL);
    DOCTEST_CHECK_EQ(sent[0].body, sent[1].body);
}

DOCTEST_TEST_CASE("login fails when both endpoints reject") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::status(401));
    transport.enqueue(Endpoints::LOGIN_BACKUP_URL, FakeTransport::status(401));
    SessionManager manager(&transport);

    auto result = manager.authenticate({"user@example.com", "wrong"});
    DOCTEST_REQUIRE(!result);
    DOCTEST_CHECK(result.error().code() == ErrorCode::AUTH_LOGIN_REJECTED);
    DOCTEST_CHECK_EQ(result.error().httpStatus(), 401);
    DOCTEST_CHECK_EQ(transport.count(Endpoints::LOGIN_URL), 1);
    DOCTEST_CHECK_EQ(transport.count(Endpoints::LOGIN_BACKUP_URL), 1);
    DOCTEST_CHECK(!manager.isLoggedIn());
}

DOCTEST_TEST_CASE("transport failure does not try the backup endpoint") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL,
        FakeTransport::failure(Error(ErrorCode::NETWORK_TIMEOUT, "timed out")));
    SessionManager manager(&transport);

    auto result = manager.authenticate({"user@example.com", "secret"});
    DOCTEST_REQUIRE(!result);
    DOCTEST_CHECK(result.error().code() == ErrorCode::NETWORK_TIMEOUT);
    DOCTEST_CHECK(result.error().isRetryable());
    DOCTEST_CHECK_EQ(transport.count(Endpoints::LOGIN_BACKUP_URL), 0);
}

DOCTEST_TEST_CASE("missing region falls back to the sentinel region") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL,
        FakeTransport::ok(R"({"authtoken": {"authtoken": "abc"}})"));
    SessionManager manager(&transport);

    auto result = manager.authenticate({"user@example.com", "secret"});
    DOCTEST_REQUIRE(result);
    DOCTEST_CHECK_EQ(result.value().regionId, "piri");
    DOCTEST_CHECK_EQ(result.value().region, "UNKNOWN");
    DOCTEST_CHECK_EQ(result.value().host, "piri.immedia-semi.com");
    DOCTEST_CHECK_EQ(manager.authHeader()->host, "piri.immedia-semi.com");
}

DOCTEST_TEST_CASE("region with more than one pair is treated as missing") {
    FakeTransport transport;
    SessionManager manager(&transport);

    auto parsed = manager.parseLoginResponse(
        R"({"authtoken": {"authtoken": "abc"}, "region": {"a": "A", "b": "B"}})");
    DOCTEST_REQUIRE(parsed);
    DOCTEST_CHECK_EQ(parsed.value().regionId, "piri");
}

DOCTEST_TEST_CASE("auth header exists only when a token was returned") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(R"({"region": {"test": "Testland"}})"));
    SessionManager manager(&transport);

    auto result = manager.authenticate({"user@example.com", "secret"});
    DOCTEST_REQUIRE(!result);
    DOCTEST_CHECK(result.error().code() == ErrorCode::DATA_MISSING_FIELD);
    DOCTEST_CHECK(!manager.authHeader());
    DOCTEST_CHECK_EQ(manager.generation(), 0u);
}

DOCTEST_TEST_CASE("non-object login body is malformed") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok("[1, 2, 3]"));
    SessionManager manager(&transport);

    auto result = manager.authenticate({"user@example.com", "secret"});
    DOCTEST_REQUIRE(!result);
    DOCTEST_CHECK(result.error().code() == ErrorCode::DATA_MALFORMED_RESPONSE);
    DOCTEST_CHECK(!manager.isLoggedIn());
}

DOCTEST_TEST_CASE("authorized request re-authenticates once on 401") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(loginBody("first")));
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(loginBody("second")));
    const std::string url = std::string(REGION_BASE) + "/homescreen";
    transport.enqueue(url, FakeTransport::status(401));
    transport.enqueue(url, FakeTransport::ok(R"({"cameras": []})"));
    SessionManager manager(&transport);

    DOCTEST_REQUIRE(manager.authenticate({"user@example.com", "secret"}));

    auto response = manager.authorizedRequest(HttpRequest::get(url));
    DOCTEST_REQUIRE(response);
    DOCTEST_CHECK_EQ(response.value().statusCode, 200);
    DOCTEST_CHECK_EQ(manager.generation(), 2u);
    DOCTEST_CHECK_EQ(manager.authHeader()->token, "second");

    auto sent = transport.requests();
    DOCTEST_REQUIRE_EQ(sent.size(), 4u);
    DOCTEST_CHECK_EQ(sent[1].headers["TOKEN_AUTH"], "first");
    DOCTEST_CHECK_EQ(sent[1].headers["Host"], "test.immedia-semi.com");
    DOCTEST_CHECK_EQ(sent[3].headers["TOKEN_AUTH"], "second");
}

DOCTEST_TEST_CASE("authorized request requires a session") {
    FakeTransport transport;
    SessionManager manager(&transport);

    auto response = manager.authorizedRequest(HttpRequest::get("https://example.invalid/"));
    DOCTEST_REQUIRE(!response);
    DOCTEST_CHECK(response.error().code() == ErrorCode::AUTH_NOT_LOGGED_IN);
    DOCTEST_CHECK(transport.requests().empty());
}

DOCTEST_TEST_CASE("authorized download reports non-2xx as error") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(loginBody()));
    const std::string url = std::string(REGION_BASE) + "/clip.mp4";
    transport.enqueue(url, FakeTransport::status(404));
    SessionManager manager(&transport);
    DOCTEST_REQUIRE(manager.authenticate({"user@example.com", "secret"}));

    std::ostringstream sink;
    auto result = manager.authorizedDownload(HttpRequest::get(url), sink);
    DOCTEST_REQUIRE(!result);
    DOCTEST_CHECK(result.error().code() == ErrorCode::NETWORK_BAD_STATUS);
    DOCTEST_CHECK_EQ(result.error().httpStatus(), 404);
    DOCTEST_CHECK(sink.str().empty());
}

DOCTEST_TEST_CASE("reauthenticate starts at the endpoint that accepted the last login") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::status(503));
    transport.enqueue(Endpoints::LOGIN_BACKUP_URL, FakeTransport::ok(loginBody()));
    SessionManager manager(&transport);
    DOCTEST_REQUIRE(manager.authenticate({"user@example.com", "secret"}));

    auto again = manager.reauthenticate();
    DOCTEST_REQUIRE(again);
    auto sent = transport.requests();
    DOCTEST_REQUIRE_EQ(sent.size(), 3u);
    DOCTEST_CHECK_EQ(sent[2].url, Endpoints::LOGIN_BACKUP_URL);
    DOCTEST_CHECK_EQ(again.value().generation, 2u);
}

DOCTEST_TEST_CASE("logout clears the session and credentials") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(loginBody()));
    SessionManager manager(&transport);
    DOCTEST_REQUIRE(manager.authenticate({"user@example.com", "secret"}));

    manager.logout();
    DOCTEST_CHECK(!manager.isLoggedIn());
    DOCTEST_CHECK(!manager.authHeader());

    auto again = manager.reauthenticate();
    DOCTEST_REQUIRE(!again);
    DOCTEST_CHECK(again.error().code() == ErrorCode::AUTH_NOT_LOGGED_IN);
}

DOCTEST_TEST_CASE("network entries with mistyped fields do not abort login") {
    FakeTransport transport;
    transport.enqueue(Endpoints::LOGIN_URL, FakeTransport::ok(R"({
        "region": {"test": "Testland"},
        "authtoken": {"authtoken": "tok"},
        "networks": {
            "1": {"name": null, "onboarded": true},
            "2": {"name": "Barn", "onboarded": 1},
            "3": {"name": "Home", "onboarded": true}
        }
    })"));
    SessionManager manager(&transport);

    auto result = manager.authenticate({"user@example.com", "secret"});
    DOCTEST_REQUIRE(result);
    const auto& networks = result.value().networks;
    DOCTEST_REQUIRE_EQ(networks.size(), 2u);
    DOCTEST_CHECK_EQ(networks[0].id, "2");
    DOCTEST_CHECK(!networks[0].onboarded);
    DOCTEST_CHECK_EQ(networks[1].name, "Home");
    DOCTEST_CHECK(networks[1].onboarded);
}
