/*
===============================================================================
 protocol::Hub / protocol::Delegator
===============================================================================

Scope:
------
Connection ownership from accept to teardown, with several browser-side
executors attached through MockTransport.

Covered:
- Authenticated connections are registered, unauthenticated ones are not
- Reconnect of the same user supersedes the old connection
- tick() drives auth timeouts and prunes terminal sessions
- notify() / notify_all() server push
- Delegator: NoDelegateAvailable without an Open connection, routing otherwise
- close_all() teardown
- StaticTokenValidator as the Hub authenticator

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "relaygate/core/protocol/delegator.hpp"
#include "relaygate/core/protocol/hub.hpp"
#include "relaygate/core/protocol/token_validator.hpp"
#include "common/harness/session.hpp"

using namespace relaygate::core::protocol::test;
using namespace std::chrono_literals;

using HubUnderTest = protocol::Hub<WebSocketUnderTest>;
using DelegatorUnderTest = protocol::Delegator<WebSocketUnderTest>;


namespace {

std::shared_ptr<WebSocketUnderTest> attach_client(HubUnderTest& hub, const std::string& token) {
    auto ws = std::make_shared<WebSocketUnderTest>();
    (void)hub.attach(ws);
    if (!token.empty()) {
        ws->emit_message(json::frame::auth(token));
    }
    return ws;
}

// Auth window long enough that tick() never closes a pending handshake
config::Gateway relaxed_config() {
    auto cfg = fast_config();
    cfg.auth_timeout = std::chrono::seconds(10);
    return cfg;
}

} // namespace


void test_registration_and_stats() {
    std::cout << "[TEST] Authenticated connections are registered\n";

    HubUnderTest hub(relaxed_config(), accept_test_tokens);
    auto alice = attach_client(hub, "good-token");
    auto bob = attach_client(hub, "bob-token");
    auto anon = attach_client(hub, "");

    auto s = hub.stats();
    TEST_CHECK(s.connections == 3);
    TEST_CHECK(s.authenticated == 2);
    TEST_CHECK(s.pending_calls == 0);

    TEST_CHECK(hub.registry().lookup("alice") != nullptr);
    TEST_CHECK(hub.registry().lookup("bob") != nullptr);

    // Rejected token: connection torn down, nothing registered
    auto mallory = attach_client(hub, "forged");
    TEST_CHECK(!mallory->is_open());
    hub.tick();
    s = hub.stats();
    TEST_CHECK(s.connections == 3);
    TEST_CHECK(s.authenticated == 2);

    std::cout << "[TEST] OK\n";
}

void test_reconnect_supersedes() {
    std::cout << "[TEST] Reconnect supersedes the previous connection\n";

    HubUnderTest hub(relaxed_config(), accept_test_tokens);
    auto old_ws = attach_client(hub, "good-token");
    auto old_session = hub.registry().lookup("alice");
    TEST_CHECK(old_session != nullptr);

    auto new_ws = attach_client(hub, "good-token");
    auto new_session = hub.registry().lookup("alice");
    TEST_CHECK(new_session != nullptr);
    TEST_CHECK(new_session != old_session);

    TEST_CHECK(!old_ws->is_open());
    TEST_CHECK(old_session->close_reason() == transport::DisconnectReason::Superseded);
    TEST_CHECK(new_ws->is_open());

    hub.tick();
    const auto s = hub.stats();
    TEST_CHECK(s.connections == 1);
    TEST_CHECK(s.authenticated == 1);

    std::cout << "[TEST] OK\n";
}

void test_tick_auth_timeout() {
    std::cout << "[TEST] tick() enforces the auth window\n";

    HubUnderTest hub(fast_config(), accept_test_tokens);
    const auto t0 = SessionUnderTest::Clock::now();
    auto ws = std::make_shared<WebSocketUnderTest>();
    (void)hub.attach(ws, t0);

    hub.tick(t0 + 50ms);
    TEST_CHECK(ws->is_open());
    TEST_CHECK(hub.stats().connections == 1);

    hub.tick(t0 + 250ms);
    TEST_CHECK(!ws->is_open());
    TEST_CHECK(json::inspect::int_field(ws->last_frame(), "code") == 4002);
    TEST_CHECK(hub.stats().connections == 0);

    std::cout << "[TEST] OK\n";
}

void test_notifications() {
    std::cout << "[TEST] notify() / notify_all()\n";

    HubUnderTest hub(relaxed_config(), accept_test_tokens);
    auto alice = attach_client(hub, "good-token");
    auto bob = attach_client(hub, "bob-token");
    alice->clear_frames();
    bob->clear_frames();

    TEST_CHECK(hub.notify("alice", std::string("Heads up"), "Session expires soon", "warning"));
    TEST_CHECK(alice->frame_count() == 1);
    TEST_CHECK(alice->frame(0) ==
        R"({"type":"notification","title":"Heads up","message":"Session expires soon","level":"warning"})");
    TEST_CHECK(bob->frame_count() == 0);

    TEST_CHECK(!hub.notify("carol", {}, "nobody home"));

    TEST_CHECK(hub.notify_all({}, "Maintenance") == 2);
    TEST_CHECK(json::inspect::string_field(alice->last_frame(), "message") == "Maintenance");
    TEST_CHECK(json::inspect::string_field(bob->last_frame(), "level") == "info");

    std::cout << "[TEST] OK\n";
}

void test_delegator() {
    std::cout << "[TEST] Delegator routes to the user's Open connection\n";

    HubUnderTest hub(relaxed_config(), accept_test_tokens);
    DelegatorUnderTest delegator(hub.registry());

    // Nobody connected: immediate failure, nothing written
    const auto none = delegator.delegate("alice", logical_request(), built_request(), 1s);
    TEST_CHECK(none.error == Error::NoDelegateAvailable);

    auto alice = attach_client(hub, "good-token");
    auto bob = attach_client(hub, "bob-token");
    alice->clear_frames();
    bob->clear_frames();

    Reply reply;
    std::thread caller([&] { reply = delegator.delegate("alice", logical_request(), built_request(), 5s); });
    TEST_CHECK(alice->wait_for_frames(1));
    TEST_CHECK(bob->frame_count() == 0);

    const auto id = json::inspect::string_field(alice->frame(0), "request_id");
    alice->emit_message(json::frame::response_ok(id, R"({"ok":1})"));
    caller.join();
    TEST_CHECK(reply.ok());
    TEST_CHECK(reply.payload == R"({"ok":1})");

    std::cout << "[TEST] OK\n";
}

void test_close_all() {
    std::cout << "[TEST] close_all() tears everything down\n";

    HubUnderTest hub(relaxed_config(), accept_test_tokens);
    auto alice = attach_client(hub, "good-token");
    auto bob = attach_client(hub, "bob-token");

    hub.close_all();
    TEST_CHECK(!alice->is_open());
    TEST_CHECK(!bob->is_open());
    TEST_CHECK(hub.registry().size() == 0);
    TEST_CHECK(hub.stats().connections == 0);

    std::cout << "[TEST] OK\n";
}

void test_static_tokens() {
    std::cout << "[TEST] StaticTokenValidator drives authentication\n";

    StaticTokenValidator tokens;
    tokens.add("t-1", "alice");
    tokens.add("t-2", "bob");
    TEST_CHECK(tokens.size() == 2);

    UserId user;
    TEST_CHECK(tokens("t-1", user));
    TEST_CHECK(user == "alice");
    TEST_CHECK(!tokens("t-3", user));

    HubUnderTest hub(relaxed_config(), [&tokens](std::string_view token, UserId& u) { return tokens(token, u); });
    auto alice = attach_client(hub, "t-1");
    TEST_CHECK(json::inspect::string_field(alice->last_frame(), "user_id") == "alice");

    // Revoked tokens stop working for new connections only
    TEST_CHECK(tokens.revoke("t-2"));
    TEST_CHECK(!tokens.revoke("t-2"));
    auto bob = attach_client(hub, "t-2");
    TEST_CHECK(!bob->is_open());
    TEST_CHECK(json::inspect::int_field(bob->last_frame(), "code") == 4001);
    TEST_CHECK(alice->is_open());

    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_registration_and_stats();
    test_reconnect_supersedes();
    test_tick_auth_timeout();
    test_notifications();
    test_delegator();
    test_close_all();
    test_static_tokens();

    std::cout << "\n[HUB TESTS PASSED]\n";
    return 0;
}
