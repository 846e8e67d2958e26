#include "relaygate/core/credentials/store.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include "relaygate/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace relaygate::core::credentials {

namespace helper = protocol::parser::helper;
using protocol::parser::Result;

bool InMemoryCredentialStore::load_json(std::string_view json) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(json.data(), json.size()).get(root);
    if (error) {
        RG_WARN("[CREDENTIALS] JSON parse error: " << error);
        return false;
    }
    simdjson::dom::object users;
    if (root.get(users)) {
        RG_WARN("[CREDENTIALS] Root must be an object keyed by user id");
        return false;
    }

    const auto captured = std::chrono::system_clock::now();
    std::vector<std::pair<UserId, CredentialSnapshot>> parsed;

    for (auto entry : users) {
        CredentialSnapshot snap;
        snap.captured_at = captured;

        if (helper::require_object(entry.value) != Result::Parsed) {
            RG_WARN("[CREDENTIALS] Entry for user '" << entry.key << "' is not an object");
            return false;
        }
        if (helper::parse_string_optional(entry.value, "csrf_token", snap.csrf_token) != Result::Parsed) {
            RG_WARN("[CREDENTIALS] Field 'csrf_token' invalid for user '" << entry.key << "'");
            return false;
        }

        simdjson::dom::element cookies_el;
        bool has_cookies = false;
        if (helper::parse_element_optional(entry.value, "cookies", cookies_el, has_cookies) != Result::Parsed) {
            return false;
        }
        if (has_cookies) {
            simdjson::dom::object cookies;
            if (cookies_el.get(cookies)) {
                RG_WARN("[CREDENTIALS] Field 'cookies' must be an object for user '" << entry.key << "'");
                return false;
            }
            auto r = helper::parse_string_map(cookies, [&snap](std::string_view name, std::string_view value) {
                snap.cookies.emplace(std::string(name), std::string(value));
            });
            if (r != Result::Parsed) {
                RG_WARN("[CREDENTIALS] Cookie values must be strings for user '" << entry.key << "'");
                return false;
            }
        }
        parsed.emplace_back(UserId(entry.key), std::move(snap));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [user, snap] : parsed) {
        snapshots_[user] = std::move(snap);
    }
    RG_INFO("[CREDENTIALS] Loaded " << parsed.size() << " credential snapshot(s)");
    return true;
}

bool InMemoryCredentialStore::load_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        RG_ERROR("[CREDENTIALS] Cannot open credentials file: " << path);
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return load_json(ss.str());
}

} // namespace relaygate::core::credentials
