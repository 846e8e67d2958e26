#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "relaygate/core.hpp"
#include "lcr/worker_set.hpp"
#include "common/cli/gateway_params.hpp"

using namespace relaygate;
using namespace relaygate::core;


/*
RelayGate daemon.

Listens for browser-side executors on a WebSocket endpoint and executes logical
calls typed on stdin on either path:

  alice feed count=10 start=0
  alice comments post_url=urn:li:activity:7123 route=server
  alice post_comment post_url=https://www.linkedin.com/feed/update/urn:li:activity:7123/ text=hello timeout=5000
  notify * maintenance in 5 minutes
  stats

Each call runs on its own thread, at most --max-calls at once; the main thread
keeps the hub ticking and joins finished calls.
*/

std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

namespace {

std::mutex console_mutex;

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream is(line);
    std::vector<std::string> words;
    for (std::string w; is >> w;) {
        words.push_back(std::move(w));
    }
    return words;
}

request::ParamValue to_param_value(std::string_view text) {
    if (text == "true")  return true;
    if (text == "false") return false;
    std::int64_t n = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
        return n;
    }
    return std::string(text);
}

void print_result(const std::string& user, const std::string& endpoint, const Result& r) {
    std::lock_guard<std::mutex> lock(console_mutex);
    std::cout << "[" << user << " " << endpoint << "] via " << to_string(r.route)
              << " -> " << (r.ok() ? "OK" : to_string(r.error));
    if (r.status_code != 0) {
        std::cout << " HTTP " << r.status_code;
    }
    if (r.retry_after.has()) {
        std::cout << " retry-after " << r.retry_after.value().count() << "s";
    }
    if (!r.message.empty()) {
        std::cout << " (" << r.message << ")";
    }
    std::cout << "\n";
    if (!r.body.empty()) {
        constexpr std::size_t max_body = 512;
        std::cout << "  " << r.body.substr(0, max_body) << (r.body.size() > max_body ? " ..." : "") << "\n";
    }
    std::cout.flush();
}

void print_stats(const protocol::HubStats& s) {
    std::lock_guard<std::mutex> lock(console_mutex);
    std::cout << "connections=" << s.connections
              << " authenticated=" << s.authenticated
              << " pending_calls=" << s.pending_calls << std::endl;
}

// <user> <endpoint> [route=..] [timeout=..] [name=value ...]
void dispatch_call(Router& router, const std::vector<std::string>& words, lcr::worker_set& workers) {
    UserId user = words[0];
    std::string endpoint = words[1];
    request::Params params;
    lcr::optional<Route> route;
    lcr::optional<std::chrono::milliseconds> timeout;

    for (std::size_t i = 2; i < words.size(); ++i) {
        const auto& w = words[i];
        const auto eq = w.find('=');
        if (eq == std::string::npos || eq == 0) {
            RG_WARN("Ignoring malformed argument '" << w << "' (expected name=value)");
            continue;
        }
        const std::string_view name(w.data(), eq);
        const std::string_view value(w.data() + eq + 1, w.size() - eq - 1);
        if (name == "route") {
            Route r;
            if (!parse_route(value, r)) {
                RG_WARN("Ignoring unknown route '" << value << "'");
                continue;
            }
            route = r;
        }
        else if (name == "timeout") {
            std::int64_t ms = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
            if (ec != std::errc() || ms <= 0) {
                RG_WARN("Ignoring invalid timeout '" << value << "'");
                continue;
            }
            timeout = std::chrono::milliseconds(ms);
        }
        else {
            params.set(name, to_param_value(value));
        }
    }

    const bool started = workers.spawn([&router, user, endpoint, params = std::move(params), route, timeout]() {
        const Result r = router.execute(user, endpoint, params, route, timeout);
        print_result(user, endpoint, r);
    });
    if (!started) {
        RG_WARN("Call '" << user << " " << endpoint << "' rejected: " << workers.capacity() << " calls already in flight");
    }
}

void handle_line(Router& router, Hub& hub, const std::string& line, lcr::worker_set& workers) {
    const auto words = split_words(line);
    if (words.empty()) {
        return;
    }
    if (words[0] == "stats") {
        print_stats(hub.stats());
        return;
    }
    if (words[0] == "notify") {
        if (words.size() < 3) {
            RG_WARN("Usage: notify <user|*> <message>");
            return;
        }
        std::string message;
        for (std::size_t i = 2; i < words.size(); ++i) {
            if (i > 2) message += ' ';
            message += words[i];
        }
        if (words[1] == "*") {
            const auto n = hub.notify_all({}, message);
            RG_INFO("Notification delivered to " << n << " user(s)");
        }
        else if (!hub.notify(words[1], {}, message)) {
            RG_WARN("Notification to " << words[1] << " not delivered");
        }
        return;
    }
    if (words.size() < 2) {
        RG_WARN("Usage: <user> <endpoint> [route=server|delegated] [timeout=<ms>] [name=value ...]");
        return;
    }
    dispatch_call(router, words, workers);
}

// True when a full line may be read without blocking the tick loop.
bool stdin_ready(std::chrono::milliseconds wait) {
    if (std::cin.rdbuf()->in_avail() > 0) {
        return true;
    }
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    return ::poll(&pfd, 1, static_cast<int>(wait.count())) > 0 && (pfd.revents & (POLLIN | POLLHUP)) != 0;
}

} // namespace


int main(int argc, char** argv) {
    const auto params = examples::cli::gateway::configure(argc, argv, "RelayGate dual-path execution gateway");
    params.dump("=== RelayGate Parameters ===", std::cout);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    const config::Gateway gw = params.gateway();

    // -------------------------------------------------------------
    // Routing policy
    // -------------------------------------------------------------
    config::RoutePolicy policy(gw.default_route);
    for (const auto& entry : params.routes) {
        const auto eq = entry.find('=');
        Route r;
        if (parse_route(std::string_view(entry).substr(eq + 1), r)) {
            policy.set(entry.substr(0, eq), r);
        }
    }

    // -------------------------------------------------------------
    // Identity and credentials
    // -------------------------------------------------------------
    protocol::StaticTokenValidator tokens;
    for (const auto& entry : params.tokens) {
        const auto eq = entry.find('=');
        tokens.add(entry.substr(0, eq), entry.substr(eq + 1));
    }
    if (tokens.size() == 0) {
        RG_WARN("No --token given: every delegate connection will be rejected");
    }

    credentials::InMemoryCredentialStore store;
    if (!params.credentials_file.empty() && !store.load_file(params.credentials_file)) {
        RG_ERROR("Failed to load credentials from " << params.credentials_file);
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Execution paths
    // -------------------------------------------------------------
    http::curl::Global curl_global;
    http::curl::ClientConfig http_cfg;
    http_cfg.total_timeout = gw.upstream_timeout;
    http_cfg.verify_peer = !params.insecure;
    http::curl::Client http_client(http_cfg);
    Executor executor(http_client);

    Hub hub(gw, [&tokens](std::string_view token, UserId& user) { return tokens(token, user); });
    Delegator delegator(hub.registry());
    Router router(gw, policy, store, executor, delegator);

    transport::beast::Server server(params.server(), [&hub](std::shared_ptr<Channel> channel) {
        hub.attach(std::move(channel));
    });
    if (!server.start()) {
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Main loop: stdin commands + hub maintenance
    // -------------------------------------------------------------
    lcr::worker_set workers(params.max_calls);
    bool stdin_open = true;
    while (running.load()) {
        if (stdin_open && stdin_ready(std::chrono::milliseconds(200))) {
            std::string line;
            if (std::getline(std::cin, line)) {
                handle_line(router, hub, line, workers);
            }
            else {
                RG_INFO("stdin closed, running until interrupted");
                stdin_open = false;
            }
        }
        else if (!stdin_open) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        hub.tick();
        workers.reap();
    }

    RG_INFO("Shutting down");
    server.stop();
    hub.close_all();
    workers.join_all();
    print_stats(hub.stats());
    return 0;
}
