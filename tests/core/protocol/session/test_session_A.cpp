/*
===============================================================================
 protocol::Session - Group A Handshake & Protocol Error Tests
===============================================================================

Scope:
------
Connection lifecycle up to and around authentication.

Covered:
A1 Valid token opens the connection
A2 Rejected token closes with code 4001
A3 First message other than auth is a protocol violation
A4 Malformed frame after auth tears the connection down
A5 Duplicate auth is a protocol violation
A6 Client ping answered with pong (id echoed, server_time set)
A7 Client error notice is logged, connection stays open
A8 Remote close / local close final states
A9 call() on a connection that is not Open

These tests assume:
- MockTransport
- Inbound frames delivered synchronously on the test thread
- No real network I/O

===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/session.hpp"

using namespace relaygate::core::protocol::test;


// ----------------------------------------------------------------------------
// A1 Valid token opens the connection
// ----------------------------------------------------------------------------

void test_valid_token_opens() {
    std::cout << "[TEST] A1 Valid token opens the connection\n";

    SessionHarness h;
    TEST_CHECK(h.session->state() == transport::State::Connecting);
    TEST_CHECK(h.session->user().empty());

    h.ws->emit_message(json::frame::auth("good-token"));

    TEST_CHECK(h.session->state() == transport::State::Open);
    TEST_CHECK(h.session->user() == "alice");
    TEST_CHECK(h.opened == 1);
    TEST_CHECK(h.ws->frame_count() == 1);
    TEST_CHECK(h.ws->frame(0) == R"({"type":"auth_success","user_id":"alice"})");

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// A2 Rejected token closes with code 4001
// ----------------------------------------------------------------------------

void test_rejected_token() {
    std::cout << "[TEST] A2 Rejected token closes with code 4001\n";

    SessionHarness h;
    h.ws->emit_message(json::frame::auth("stolen-token"));

    TEST_CHECK(h.ws->frame_count() == 1);
    TEST_CHECK(json::inspect::type_of(h.ws->frame(0)) == "error");
    TEST_CHECK(json::inspect::int_field(h.ws->frame(0), "code") == 4001);
    TEST_CHECK(json::inspect::string_field(h.ws->frame(0), "message") == "Authentication failed");

    TEST_CHECK(h.session->state() == transport::State::Disconnected);
    TEST_CHECK(h.session->close_reason() == transport::DisconnectReason::AuthRejected);
    TEST_CHECK(h.ws->close_count() == 1);
    TEST_CHECK(h.opened == 0);
    TEST_CHECK(h.closed == 0); // never authenticated, nothing to deregister

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// A3 First message other than auth
// ----------------------------------------------------------------------------

void test_first_message_must_be_auth() {
    std::cout << "[TEST] A3 First message other than auth is a violation\n";

    SessionHarness h;
    h.ws->emit_message(json::frame::ping("p1"));

    TEST_CHECK(h.ws->frame_count() == 1);
    TEST_CHECK(json::inspect::int_field(h.ws->frame(0), "code") == 4000);
    TEST_CHECK(json::inspect::string_field(h.ws->frame(0), "message").rfind("Protocol error:", 0) == 0);
    TEST_CHECK(h.session->state() == transport::State::Disconnected);
    TEST_CHECK(h.session->close_reason() == transport::DisconnectReason::ProtocolError);
    TEST_CHECK(h.opened == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// A4 Malformed frame after auth
// ----------------------------------------------------------------------------

void test_malformed_after_auth() {
    std::cout << "[TEST] A4 Malformed frame after auth tears down\n";

    SessionHarness h;
    h.authenticate();

    h.ws->emit_message("{\"type\":\"response\",");

    TEST_CHECK(h.ws->frame_count() == 1);
    TEST_CHECK(json::inspect::int_field(h.ws->frame(0), "code") == 4000);
    TEST_CHECK(h.session->state() == transport::State::Disconnected);
    TEST_CHECK(h.session->close_reason() == transport::DisconnectReason::ProtocolError);
    TEST_CHECK(h.closed == 1);

    // Frames after teardown are dropped without further output
    h.ws->emit_message(json::frame::ping("late"));
    TEST_CHECK(h.ws->frame_count() == 1);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// A5 Duplicate auth
// ----------------------------------------------------------------------------

void test_duplicate_auth() {
    std::cout << "[TEST] A5 Duplicate auth is a violation\n";

    SessionHarness h;
    h.authenticate();

    h.ws->emit_message(json::frame::auth("bob-token"));

    TEST_CHECK(json::inspect::int_field(h.ws->last_frame(), "code") == 4000);
    TEST_CHECK(h.session->state() == transport::State::Disconnected);
    TEST_CHECK(h.session->user() == "alice");
    TEST_CHECK(h.opened == 1);
    TEST_CHECK(h.closed == 1);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// A6 Client ping answered with pong
// ----------------------------------------------------------------------------

void test_client_ping_answered() {
    std::cout << "[TEST] A6 Client ping answered with pong\n";

    SessionHarness h;
    h.authenticate();

    h.ws->emit_message(json::frame::ping("hb-42"));

    TEST_CHECK(h.ws->frame_count() == 1);
    const auto pong = h.ws->frame(0);
    TEST_CHECK(json::inspect::type_of(pong) == "pong");
    TEST_CHECK(json::inspect::string_field(pong, "id") == "hb-42");
    TEST_CHECK(json::inspect::int_field(pong, "server_time") > 0);
    TEST_CHECK(h.session->state() == transport::State::Open);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// A7 Client error notice
// ----------------------------------------------------------------------------

void test_client_error_notice() {
    std::cout << "[TEST] A7 Client error notice keeps the connection open\n";

    SessionHarness h;
    h.authenticate();

    h.ws->emit_message(R"({"type":"error","message":"extension reloaded","code":7})");

    TEST_CHECK(h.ws->frame_count() == 0);
    TEST_CHECK(h.session->state() == transport::State::Open);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// A8 Remote close / local close
// ----------------------------------------------------------------------------

void test_close_final_states() {
    std::cout << "[TEST] A8 Remote close and local close final states\n";

    {
        SessionHarness h;
        h.authenticate();
        h.ws->emit_close();
        TEST_CHECK(h.session->state() == transport::State::Disconnected);
        TEST_CHECK(h.session->close_reason() == transport::DisconnectReason::RemoteClose);
        TEST_CHECK(h.closed == 1);
    }
    {
        SessionHarness h;
        h.authenticate();
        h.session->close();
        TEST_CHECK(h.session->state() == transport::State::Closed);
        TEST_CHECK(h.session->close_reason() == transport::DisconnectReason::LocalClose);
        TEST_CHECK(h.ws->close_count() == 1);
        TEST_CHECK(h.closed == 1);

        // Idempotent
        h.session->close();
        h.ws->emit_close();
        TEST_CHECK(h.ws->close_count() == 1);
        TEST_CHECK(h.closed == 1);
    }
    {
        SessionHarness h;
        h.authenticate();
        h.session->close(transport::DisconnectReason::Superseded);
        TEST_CHECK(h.session->state() == transport::State::Closed);
        TEST_CHECK(h.session->close_reason() == transport::DisconnectReason::Superseded);
    }

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// A9 call() on a connection that is not Open
// ----------------------------------------------------------------------------

void test_call_requires_open() {
    std::cout << "[TEST] A9 call() on a connection that is not Open\n";

    SessionHarness h;
    auto reply = h.session->call(logical_request(), built_request(), std::chrono::milliseconds(100));
    TEST_CHECK(reply.error == Error::Disconnected);
    TEST_CHECK(h.ws->frame_count() == 0);

    h.authenticate();
    h.session->close();
    reply = h.session->call(logical_request(), built_request(), std::chrono::milliseconds(100));
    TEST_CHECK(reply.error == Error::Disconnected);
    TEST_CHECK(h.session->pending_count() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_valid_token_opens();
    test_rejected_token();
    test_first_message_must_be_auth();
    test_malformed_after_auth();
    test_duplicate_auth();
    test_client_ping_answered();
    test_client_error_notice();
    test_close_final_states();
    test_call_requires_open();

    std::cout << "\n[GROUP A - SESSION HANDSHAKE TESTS PASSED]\n";
    return 0;
}
