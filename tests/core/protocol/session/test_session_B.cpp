/*
===============================================================================
 protocol::Session - Group B Correlation Tests
===============================================================================

Scope:
------
Delegated calls multiplexed over one connection.

Covered:
B1 Single call resolved by its response
B2 Concurrent calls resolved by responses in permuted order
B3 Client-reported failure is DelegateFailed
B4 Caller deadline: Timeout, late response discarded
B5 Response for an unknown id is ignored
B6 Write failure is TransportFailure
B7 poll() sweep resolves expired calls

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "common/harness/session.hpp"

using namespace relaygate::core::protocol::test;
using namespace std::chrono_literals;


// ----------------------------------------------------------------------------
// B1 Single call resolved by its response
// ----------------------------------------------------------------------------

void test_single_call() {
    std::cout << "[TEST] B1 Single call resolved by its response\n";

    SessionHarness h;
    h.authenticate();

    const auto logical = logical_request("feed");
    const auto http = built_request();

    Reply reply;
    std::thread caller([&] { reply = h.session->call(logical, http, 5s); });

    const auto ids = h.wait_for_requests(1);
    TEST_CHECK(ids.size() == 1);
    TEST_CHECK(ids[0] == "c-1");
    TEST_CHECK(h.session->is_pending(ids[0]));

    const auto frame = h.ws->frame(0);
    TEST_CHECK(json::inspect::string_field(frame, "endpoint") == "feed");
    TEST_CHECK(json::inspect::http_field(frame, "url") == http.url);
    TEST_CHECK(json::inspect::http_field(frame, "method") == "GET");

    h.respond_ok(ids[0], R"({"status_code":200,"body":"ok"})");
    caller.join();

    TEST_CHECK(reply.ok());
    TEST_CHECK(reply.payload == R"({"status_code":200,"body":"ok"})");
    TEST_CHECK(h.session->pending_count() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B2 Concurrent calls, permuted responses
// ----------------------------------------------------------------------------

void test_concurrent_permuted() {
    std::cout << "[TEST] B2 Concurrent calls resolved in permuted order\n";

    constexpr int K = 8;
    SessionHarness h;
    h.authenticate();

    std::vector<request::BuiltRequest> requests;
    for (int i = 0; i < K; ++i) {
        requests.push_back(built_request("https://example.test/item/" + std::to_string(i)));
    }

    std::vector<Reply> replies(K);
    std::vector<std::thread> callers;
    for (int i = 0; i < K; ++i) {
        callers.emplace_back([&, i] {
            replies[i] = h.session->call(logical_request("feed"), requests[i], 5s);
        });
    }

    const auto ids = h.wait_for_requests(K);
    TEST_CHECK(ids.size() == static_cast<std::size_t>(K));
    TEST_CHECK(h.session->pending_count() == static_cast<std::size_t>(K));

    // Correlation ids are unique
    std::vector<std::string> sorted = ids;
    std::sort(sorted.begin(), sorted.end());
    TEST_CHECK(std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end());

    // request_id → URL the frame carried
    std::map<std::string, std::string> url_of;
    for (const auto& f : h.ws->frames()) {
        url_of[json::inspect::string_field(f, "request_id")] = json::inspect::http_field(f, "url");
    }

    // Answer in reverse, interleaving a reversed middle pair
    std::vector<std::string> order(ids.rbegin(), ids.rend());
    std::swap(order[2], order[5]);
    for (const auto& id : order) {
        h.respond_ok(id, "\"" + url_of[id] + "\"");
    }

    for (auto& t : callers) {
        t.join();
    }

    for (int i = 0; i < K; ++i) {
        TEST_CHECK(replies[i].ok());
        TEST_CHECK(replies[i].payload == "\"" + requests[i].url + "\"");
    }
    TEST_CHECK(h.session->pending_count() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B3 Client-reported failure
// ----------------------------------------------------------------------------

void test_delegate_failure() {
    std::cout << "[TEST] B3 Client-reported failure is DelegateFailed\n";

    SessionHarness h;
    h.authenticate();

    Reply reply;
    std::thread caller([&] { reply = h.session->call(logical_request(), built_request(), 5s); });

    const auto ids = h.wait_for_requests(1);
    h.respond_fail(ids[0], "NetworkError when attempting to fetch resource");
    caller.join();

    TEST_CHECK(reply.error == Error::DelegateFailed);
    TEST_CHECK(reply.message == "NetworkError when attempting to fetch resource");
    TEST_CHECK(h.session->state() == transport::State::Open);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B4 Caller deadline
// ----------------------------------------------------------------------------

void test_timeout_then_late_response() {
    std::cout << "[TEST] B4 Timeout, then late response discarded\n";

    SessionHarness h;
    h.authenticate();

    const auto start = std::chrono::steady_clock::now();
    const Reply reply = h.session->call(logical_request(), built_request(), 50ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    TEST_CHECK(reply.error == Error::Timeout);
    TEST_CHECK(elapsed >= 50ms);
    TEST_CHECK(h.session->pending_count() == 0);

    const auto ids = h.request_ids();
    TEST_CHECK(ids.size() == 1);
    TEST_CHECK(!h.session->is_pending(ids[0]));

    // The remote side finishes after the deadline: no effect, no violation
    h.respond_ok(ids[0], R"({"late":true})");
    TEST_CHECK(h.session->state() == transport::State::Open);
    TEST_CHECK(h.ws->frame_count() == 1);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B5 Unknown id
// ----------------------------------------------------------------------------

void test_unknown_id_ignored() {
    std::cout << "[TEST] B5 Response for an unknown id is ignored\n";

    SessionHarness h;
    h.authenticate();

    Reply reply;
    std::thread caller([&] { reply = h.session->call(logical_request(), built_request(), 5s); });
    const auto ids = h.wait_for_requests(1);

    h.respond_ok("c-999", R"({"x":1})");
    TEST_CHECK(h.session->state() == transport::State::Open);
    TEST_CHECK(h.session->is_pending(ids[0]));

    h.respond_ok(ids[0], R"({"x":2})");
    caller.join();
    TEST_CHECK(reply.payload == R"({"x":2})");

    // Answering the same id twice: second one finds nothing
    h.respond_ok(ids[0], R"({"x":3})");
    TEST_CHECK(h.session->state() == transport::State::Open);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B6 Write failure
// ----------------------------------------------------------------------------

void test_write_failure() {
    std::cout << "[TEST] B6 Write failure is TransportFailure\n";

    SessionHarness h;
    h.authenticate();
    h.ws->fail_sends(true);

    const Reply reply = h.session->call(logical_request(), built_request(), 5s);
    TEST_CHECK(reply.error == Error::TransportFailure);
    TEST_CHECK(h.session->pending_count() == 0);
    TEST_CHECK(h.ws->frame_count() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B7 poll() sweep
// ----------------------------------------------------------------------------

void test_poll_sweep() {
    std::cout << "[TEST] B7 poll() sweep resolves expired calls\n";

    auto cfg = fast_config();
    cfg.ping_interval = std::chrono::hours(1);
    cfg.liveness_window = std::chrono::hours(2);
    SessionHarness h(cfg);
    h.authenticate();

    Reply reply;
    const auto start = std::chrono::steady_clock::now();
    std::thread caller([&] { reply = h.session->call(logical_request(), built_request(), 2s); });
    (void)h.wait_for_requests(1);

    // Sweep at a point past the call deadline
    h.session->poll(SessionHarness::Clock::now() + 3s);
    caller.join();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    TEST_CHECK(reply.error == Error::Timeout);
    TEST_CHECK(elapsed < 1500ms);
    TEST_CHECK(h.session->pending_count() == 0);
    TEST_CHECK(h.session->state() == transport::State::Open);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_single_call();
    test_concurrent_permuted();
    test_delegate_failure();
    test_timeout_then_late_response();
    test_unknown_id_ignored();
    test_write_failure();
    test_poll_sweep();

    std::cout << "\n[GROUP B - SESSION CORRELATION TESTS PASSED]\n";
    return 0;
}
