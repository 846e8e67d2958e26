#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "relaygate/core/config/gateway.hpp"
#include "relaygate/core/config/server.hpp"
#include "relaygate/core/route.hpp"
#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace relaygate::examples::cli::gateway {

    // -------------------------------------------------------------
    // Gateway daemon parameters
    // -------------------------------------------------------------
    struct Params {
        std::string bind                    = "127.0.0.1";
        std::uint16_t port                  = 8765;
        std::string path                    = "/ws";
        std::uint32_t ping_interval_s       = 15;
        std::uint32_t liveness_window_s     = 45;
        std::uint32_t auth_timeout_s        = 10;
        std::uint32_t call_timeout_s        = 60;
        std::uint32_t upstream_timeout_s    = 30;
        std::uint32_t max_calls             = 64;
        std::string default_route           = "delegated";
        std::vector<std::string> tokens;            // TOKEN=USER
        std::vector<std::string> routes;            // USER=server|delegated
        std::string credentials_file;
        bool insecure                       = false;
        std::string log_level               = "info";

        [[nodiscard]]
        inline core::config::Server server() const {
            core::config::Server cfg;
            cfg.bind_address = bind;
            cfg.port = port;
            cfg.path = path;
            return cfg;
        }

        [[nodiscard]]
        inline core::config::Gateway gateway() const {
            core::config::Gateway cfg;
            cfg.ping_interval = std::chrono::seconds(ping_interval_s);
            cfg.liveness_window = std::chrono::seconds(liveness_window_s);
            cfg.auth_timeout = std::chrono::seconds(auth_timeout_s);
            cfg.default_call_timeout = std::chrono::seconds(call_timeout_s);
            cfg.upstream_timeout = std::chrono::seconds(upstream_timeout_s);
            if (!core::parse_route(default_route, cfg.default_route)) {
                cfg.default_route = core::Route::Delegated;
            }
            return cfg;
        }

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Listen          : ws://" << bind << ":" << port << path << "\n"
               << "  Ping interval   : " << ping_interval_s << " s\n"
               << "  Liveness window : " << liveness_window_s << " s\n"
               << "  Auth timeout    : " << auth_timeout_s << " s\n"
               << "  Call timeout    : " << call_timeout_s << " s\n"
               << "  Upstream timeout: " << upstream_timeout_s << " s\n"
               << "  Max calls       : " << max_calls << "\n"
               << "  Default route   : " << default_route << "\n"
               << "  Tokens          : " << tokens.size() << "\n"
               << "  Route overrides : " << routes.size() << "\n"
               << "  Credentials     : " << (credentials_file.empty() ? "(none)" : credentials_file) << "\n"
               << "  Log Level       : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};

        app.add_option("-b,--bind", params.bind, "Bind address")->default_val(params.bind);
        app.add_option("-p,--port", params.port, "Listening port (0 = ephemeral)")->check(CLI::Range(0, 65535))->default_val(params.port);
        app.add_option("--path", params.path, "WebSocket upgrade path")->default_val(params.path);
        app.add_option("--ping-interval", params.ping_interval_s, "Seconds between gateway pings")->check(CLI::Range(1, 3600))->default_val(params.ping_interval_s);
        app.add_option("--liveness-window", params.liveness_window_s, "Seconds without pong before a connection is dropped")->check(CLI::Range(2, 7200))->default_val(params.liveness_window_s);
        app.add_option("--auth-timeout", params.auth_timeout_s, "Seconds a new connection has to authenticate")->check(CLI::Range(1, 600))->default_val(params.auth_timeout_s);
        app.add_option("--call-timeout", params.call_timeout_s, "Default delegated call timeout in seconds")->check(CLI::Range(1, 3600))->default_val(params.call_timeout_s);
        app.add_option("--upstream-timeout", params.upstream_timeout_s, "Server path HTTP timeout in seconds")->check(CLI::Range(1, 600))->default_val(params.upstream_timeout_s);
        app.add_option("--max-calls", params.max_calls, "Stdin calls allowed in flight at once")->check(CLI::Range(1, 4096))->default_val(params.max_calls);
        app.add_option("-r,--default-route", params.default_route, "Route for users without override: server | delegated")->check(route_validator)->default_val(params.default_route);
        app.add_option("-t,--token", params.tokens, "Accepted auth token (TOKEN=USER, repeatable)")->check(token_mapping_validator);
        app.add_option("--route", params.routes, "Per-user route override (USER=server|delegated, repeatable)")->check(route_override_validator);
        app.add_option("-c,--credentials", params.credentials_file, "Credential snapshots JSON file")->check(CLI::ExistingFile);
        app.add_flag("--insecure", params.insecure, "Skip TLS peer verification on the server path");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

        app.footer(
            "Commands on stdin, one per line:\n"
            "  <user> <endpoint> [route=server|delegated] [timeout=<ms>] [name=value ...]\n"
            "  notify <user|*> <message>\n"
            "  stats\n"
            "Press Ctrl+C to exit."
        );

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }

        if (params.liveness_window_s <= params.ping_interval_s) {
            std::cerr << "--liveness-window must be larger than --ping-interval" << std::endl;
            std::exit(EXIT_FAILURE);
        }

        set_log_level(params.log_level);
        return params;
    }

} // namespace relaygate::examples::cli::gateway
