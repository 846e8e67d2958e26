/*
===============================================================================
 gateway::ExecutionRouter
===============================================================================

Scope:
------
End-to-end routing over a scripted HTTP client on the server path and a
MockTransport-backed browser executor on the delegated path.

Covered:
- Route resolution: explicit argument, then per-user override, then fallback
- Delegated call answered after a delay, within the caller timeout
- NoDelegateAvailable without any I/O
- Server and delegated paths build the same URL and header shape
- No fallback from one path to the other
- IncompleteCredentials on the server path without any I/O
- Build errors reported before any I/O

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "relaygate/core/config/route_policy.hpp"
#include "relaygate/core/credentials/store.hpp"
#include "relaygate/core/executor/server_executor.hpp"
#include "relaygate/core/gateway/router.hpp"
#include "relaygate/core/protocol/delegator.hpp"
#include "relaygate/core/protocol/hub.hpp"
#include "common/harness/session.hpp"
#include "common/mock_http_client.hpp"

using namespace relaygate::core::protocol::test;
using namespace std::chrono_literals;

using MockClient = http::test::MockHttpClient;
using Store = credentials::InMemoryCredentialStore;
using HubUnderTest = protocol::Hub<WebSocketUnderTest>;
using RouterUnderTest = gateway::ExecutionRouter<MockClient, Store, WebSocketUnderTest>;


namespace {

credentials::CredentialSnapshot ready_snapshot() {
    credentials::CredentialSnapshot s;
    s.csrf_token = std::string("ajax:4242");
    s.cookies.emplace("li_at", "AQEDAT");
    s.cookies.emplace("JSESSIONID", "\"ajax:4242\"");
    return s;
}

// Names of http.headers in a request frame, in frame order
std::vector<std::string> frame_header_names(const std::string& frame) {
    std::vector<std::string> names;
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(frame).get(root)) {
        return names;
    }
    simdjson::dom::object headers;
    if (root["http"]["headers"].get(headers)) {
        return names;
    }
    for (auto field : headers) {
        names.emplace_back(field.key);
    }
    return names;
}

// Everything one routing test needs, wired the way the gateway wires it
struct RouterFixture {
    config::Gateway cfg;
    config::RoutePolicy policy;
    Store store;
    MockClient client;
    executor::ServerExecutor<MockClient> server{client};
    HubUnderTest hub;
    protocol::Delegator<WebSocketUnderTest> delegator{hub.registry()};
    RouterUnderTest router;

    explicit RouterFixture(Route fallback = Route::Delegated)
        : cfg(relaxed())
        , policy(fallback)
        , hub(cfg, accept_test_tokens)
        , router(cfg, policy, store, server, delegator)
    {}

    // Attaches and authenticates a browser executor for alice
    std::shared_ptr<WebSocketUnderTest> connect_alice() {
        auto ws = std::make_shared<WebSocketUnderTest>();
        (void)hub.attach(ws);
        ws->emit_message(json::frame::auth("good-token"));
        TEST_CHECK(ws->is_open());
        ws->clear_frames();
        return ws;
    }

    static config::Gateway relaxed() {
        auto c = fast_config();
        c.auth_timeout = 10s;
        c.default_call_timeout = 5s;
        return c;
    }
};

// Answers the first request frame on 'ws' after 'delay'
std::thread answer_after(std::shared_ptr<WebSocketUnderTest> ws, std::chrono::milliseconds delay, std::string payload) {
    return std::thread([ws, delay, payload = std::move(payload)] {
        if (!ws->wait_for_frames(1)) {
            return;
        }
        std::this_thread::sleep_for(delay);
        const auto id = json::inspect::string_field(ws->frame(0), "request_id");
        ws->emit_message(json::frame::response_ok(id, payload));
    });
}

} // namespace


void test_route_resolution() {
    std::cout << "[TEST] Explicit route, then override, then fallback\n";

    config::RoutePolicy policy;
    TEST_CHECK(policy.resolve("alice") == Route::Delegated);

    policy.set("alice", Route::Server);
    TEST_CHECK(policy.resolve("alice") == Route::Server);
    TEST_CHECK(policy.resolve("bob") == Route::Delegated);
    TEST_CHECK(policy.resolve("alice", lcr::optional<Route>(Route::Delegated)) == Route::Delegated);

    policy.set_fallback(Route::Server);
    TEST_CHECK(policy.resolve("bob") == Route::Server);

    TEST_CHECK(policy.clear("alice"));
    TEST_CHECK(!policy.clear("alice"));
    TEST_CHECK(policy.size() == 0);

    std::cout << "[TEST] OK\n";
}

void test_delayed_delegate_succeeds() {
    std::cout << "[TEST] Delegated call answered after 200 ms\n";

    RouterFixture f;
    auto ws = f.connect_alice();
    auto responder = answer_after(ws, 200ms, json::frame::envelope(200, R"({"elements":[]})"));

    const auto start = std::chrono::steady_clock::now();
    const auto r = f.router.execute("alice", "feed", {{"count", 10}}, {}, lcr::optional<std::chrono::milliseconds>(5000ms));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    responder.join();

    TEST_CHECK(r.ok());
    TEST_CHECK(r.route == Route::Delegated);
    TEST_CHECK(r.status_code == 200);
    TEST_CHECK(r.body == R"({"elements":[]})");
    TEST_CHECK(elapsed >= 200ms);
    TEST_CHECK(elapsed < 5s);
    TEST_CHECK(f.client.call_count() == 0);

    std::cout << "[TEST] OK\n";
}

void test_no_delegate_available() {
    std::cout << "[TEST] No Open connection: NoDelegateAvailable, no I/O\n";

    RouterFixture f;
    f.store.put("alice", ready_snapshot());

    // Connected but never authenticated: not a delegate
    auto ws = std::make_shared<WebSocketUnderTest>();
    (void)f.hub.attach(ws);

    const auto r = f.router.execute("alice", "feed", {});
    TEST_CHECK(r.error == Error::NoDelegateAvailable);
    TEST_CHECK(r.route == Route::Delegated);
    TEST_CHECK(ws->frame_count() == 0);
    TEST_CHECK(f.client.call_count() == 0);

    std::cout << "[TEST] OK\n";
}

void test_path_parity() {
    std::cout << "[TEST] Both paths build the same URL and header shape\n";

    RouterFixture f;
    f.store.put("alice", ready_snapshot());
    auto ws = f.connect_alice();
    const request::Params params{{"count", 25}, {"start", 50}};

    const auto server = f.router.execute("alice", "feed", params, lcr::optional<Route>(Route::Server));
    TEST_CHECK(server.ok());
    TEST_CHECK(server.route == Route::Server);
    const auto sent = f.client.last_request();

    auto responder = answer_after(ws, 0ms, json::frame::envelope(200, "{}"));
    const auto delegated = f.router.execute("alice", "feed", params, lcr::optional<Route>(Route::Delegated));
    responder.join();
    TEST_CHECK(delegated.ok());

    const auto frame = ws->frame(0);
    TEST_CHECK(json::inspect::http_field(frame, "url") == sent.url);
    TEST_CHECK(json::inspect::http_field(frame, "method") == sent.method);

    // Same headers in the same order; only the cookie is left to the browser jar
    const auto names = frame_header_names(frame);
    TEST_CHECK(names.size() + 1 == sent.headers.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        TEST_CHECK(names[i] == sent.headers[i].name);
    }
    TEST_CHECK(sent.headers.back().name == "cookie");

    std::cout << "[TEST] OK\n";
}

void test_no_fallback() {
    std::cout << "[TEST] A failed path is never retried on the other\n";

    RouterFixture f;
    f.store.put("alice", ready_snapshot());
    auto ws = f.connect_alice();

    // Server path fails upstream: the open delegate stays untouched
    f.client.push_response(503, "unavailable");
    const auto server = f.router.execute("alice", "feed", {}, lcr::optional<Route>(Route::Server));
    TEST_CHECK(server.error == Error::UpstreamError);
    TEST_CHECK(server.route == Route::Server);
    TEST_CHECK(ws->frame_count() == 0);

    f.client.push_failure("Could not resolve host");
    const auto transport = f.router.execute("alice", "feed", {}, lcr::optional<Route>(Route::Server));
    TEST_CHECK(transport.error == Error::TransportFailure);
    TEST_CHECK(ws->frame_count() == 0);
    TEST_CHECK(f.client.call_count() == 2);

    // Delegated path fails in the browser: the HTTP client stays untouched
    std::thread responder([ws] {
        if (ws->wait_for_frames(1)) {
            const auto id = json::inspect::string_field(ws->frame(0), "request_id");
            ws->emit_message(json::frame::response_fail(id, "TypeError: Failed to fetch"));
        }
    });
    const auto delegated = f.router.execute("alice", "feed", {});
    responder.join();
    TEST_CHECK(delegated.error == Error::DelegateFailed);
    TEST_CHECK(delegated.route == Route::Delegated);
    TEST_CHECK(delegated.message == "TypeError: Failed to fetch");
    TEST_CHECK(f.client.call_count() == 2);

    // Delegated timeout: still no server attempt
    ws->clear_frames();
    const auto timed_out = f.router.execute("alice", "feed", {}, {}, lcr::optional<std::chrono::milliseconds>(50ms));
    TEST_CHECK(timed_out.error == Error::Timeout);
    TEST_CHECK(f.client.call_count() == 2);

    std::cout << "[TEST] OK\n";
}

void test_policy_drives_route() {
    std::cout << "[TEST] Route comes from policy, never from stored credentials\n";

    RouterFixture f(Route::Delegated);
    f.store.put("alice", ready_snapshot());

    // Complete credentials stored, but the fallback says delegated
    auto r = f.router.execute("alice", "feed", {});
    TEST_CHECK(r.error == Error::NoDelegateAvailable);
    TEST_CHECK(f.client.call_count() == 0);

    f.policy.set("alice", Route::Server);
    r = f.router.execute("alice", "feed", {});
    TEST_CHECK(r.ok());
    TEST_CHECK(r.route == Route::Server);
    TEST_CHECK(f.client.call_count() == 1);

    // Explicit argument beats the override
    r = f.router.execute("alice", "feed", {}, lcr::optional<Route>(Route::Delegated));
    TEST_CHECK(r.error == Error::NoDelegateAvailable);
    TEST_CHECK(f.client.call_count() == 1);

    std::cout << "[TEST] OK\n";
}

void test_incomplete_credentials() {
    std::cout << "[TEST] Server path with incomplete credentials: no I/O\n";

    RouterFixture f(Route::Server);

    // Nothing stored at all
    auto r = f.router.execute("alice", "feed", {});
    TEST_CHECK(r.error == Error::IncompleteCredentials);
    TEST_CHECK(r.route == Route::Server);

    auto partial = ready_snapshot();
    partial.csrf_token.reset();
    f.store.put("alice", partial);
    r = f.router.execute("alice", "feed", {});
    TEST_CHECK(r.error == Error::IncompleteCredentials);

    TEST_CHECK(f.client.call_count() == 0);

    std::cout << "[TEST] OK\n";
}

void test_build_errors_before_io() {
    std::cout << "[TEST] Build errors are reported before any I/O\n";

    RouterFixture f;
    f.store.put("alice", ready_snapshot());
    auto ws = f.connect_alice();

    auto r = f.router.execute("alice", "unknown_endpoint", {});
    TEST_CHECK(r.error == Error::UnsupportedEndpoint);
    TEST_CHECK(r.route == Route::Delegated);

    r = f.router.execute("alice", "feed", {{"count", "ten"}}, lcr::optional<Route>(Route::Server));
    TEST_CHECK(r.error == Error::InvalidParameters);
    TEST_CHECK(r.route == Route::Server);

    r = f.router.execute("alice", "comments", {});
    TEST_CHECK(r.error == Error::InvalidParameters);
    TEST_CHECK(r.message.find("post_url") != std::string::npos);

    TEST_CHECK(ws->frame_count() == 0);
    TEST_CHECK(f.client.call_count() == 0);

    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_route_resolution();
    test_delayed_delegate_succeeds();
    test_no_delegate_available();
    test_path_parity();
    test_no_fallback();
    test_policy_drives_route();
    test_incomplete_credentials();
    test_build_errors_before_io();

    std::cout << "\n[EXECUTION ROUTER TESTS PASSED]\n";
    return 0;
}
