#include "relaygate/core/request/template_engine.hpp"

#include <cstdint>
#include <string>
#include <variant>

#include "relaygate/core/request/percent_encoding.hpp"
#include "relaygate/core/request/urn.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"

namespace relaygate::core::request {

namespace {

namespace query_id {
constexpr std::string_view COMMENTS       = "voyagerSocialDashComments.95ed44bc87596acce7c460c70934d0ff";
constexpr std::string_view REACTIONS      = "voyagerSocialDashReactions.41ebf31a9f4c4a84e35a49d5abc9010b";
constexpr std::string_view USER_COMMENTS  = "voyagerFeedDashProfileUpdates.8f05a4e5ad12d9cb2b56eaa22afbcab9";
constexpr std::string_view UPDATE_ACTIONS = "voyagerFeedDashUpdateActions.e826a55733c1fd7da926544b655f05c0";

constexpr std::string_view PROFILE_IDENTITY        = "voyagerIdentityDashProfileCards.c5c6ae006152475b00720b4f9b83f6ff";
constexpr std::string_view PROFILE_ABOUT_SKILLS    = "voyagerIdentityDashProfileCards.f0415f0ff9d9968bab1cd89c0352f7c8";
constexpr std::string_view PROFILE_RECOMMENDATIONS = "voyagerIdentityDashProfileCards.ddf85b42590c29d8ca29c09533f87160";
constexpr std::string_view PROFILE_CONTACT         = "voyagerIdentityDashProfiles.c7452e58fa37646d09dae4920fc5b4b9";
constexpr std::string_view PROFILE_EXPERIENCES     = "voyagerIdentityDashProfileComponents.c5d4db426a0f8247b8ab7bc1d660775a";
} // namespace query_id

namespace decoration {
constexpr std::string_view NORM_COMMENT = "com.linkedin.voyager.dash.deco.social.NormComment-43";
constexpr std::string_view INVITATION   = "com.linkedin.voyager.dash.deco.relationships.InvitationCreationResultWithInvitee-2";
} // namespace decoration

constexpr std::string_view TEXT_VIEW_MODEL = "com.linkedin.voyager.dash.common.text.TextViewModel";

// Upper bound for every page size a caller may request
constexpr std::int64_t MAX_PAGE_COUNT = 100;

// -----------------------------------------------------------------------------
// Parameter access with uniform diagnostics
// -----------------------------------------------------------------------------
class ParamReader {
public:
    ParamReader(const Params& params, std::string& detail) noexcept
        : params_(params)
        , detail_(detail)
    {}

    [[nodiscard]]
    bool integer(std::string_view name, std::int64_t& out, lcr::optional<std::int64_t> fallback = {}) {
        const ParamValue* v = params_.find(name);
        if (!v) {
            if (fallback.has()) {
                out = fallback.value();
                return true;
            }
            return missing_(name);
        }
        if (const auto* i = std::get_if<std::int64_t>(v)) {
            out = *i;
            return true;
        }
        return mistyped_(name, "an integer");
    }

    [[nodiscard]]
    bool text(std::string_view name, std::string& out) {
        const ParamValue* v = params_.find(name);
        if (!v) {
            return missing_(name);
        }
        const auto* s = std::get_if<std::string>(v);
        if (!s) {
            return mistyped_(name, "a string");
        }
        if (s->empty()) {
            detail_ = "parameter '" + std::string(name) + "' must not be empty";
            return false;
        }
        out = *s;
        return true;
    }

    // Absent and empty are both "not provided"
    [[nodiscard]]
    bool optional_text(std::string_view name, lcr::optional<std::string>& out) {
        out.reset();
        const ParamValue* v = params_.find(name);
        if (!v) {
            return true;
        }
        const auto* s = std::get_if<std::string>(v);
        if (!s) {
            return mistyped_(name, "a string");
        }
        if (!s->empty()) {
            out = *s;
        }
        return true;
    }

    [[nodiscard]]
    bool positive(std::string_view name, std::int64_t v) {
        if (v > 0) return true;
        detail_ = "parameter '" + std::string(name) + "' must be positive";
        return false;
    }

    [[nodiscard]]
    bool at_most(std::string_view name, std::int64_t v, std::int64_t limit) {
        if (v <= limit) return true;
        detail_ = "parameter '" + std::string(name) + "' must not exceed " + std::to_string(limit);
        return false;
    }

    [[nodiscard]]
    bool non_negative(std::string_view name, std::int64_t v) {
        if (v >= 0) return true;
        detail_ = "parameter '" + std::string(name) + "' must be non-negative";
        return false;
    }

    [[nodiscard]]
    bool fail(std::string msg) {
        detail_ = std::move(msg);
        return false;
    }

private:
    bool missing_(std::string_view name) {
        detail_ = "missing required parameter '" + std::string(name) + "'";
        return false;
    }

    bool mistyped_(std::string_view name, std::string_view expected) {
        detail_ = "parameter '" + std::string(name) + "' must be " + std::string(expected);
        return false;
    }

    const Params& params_;
    std::string& detail_;
};

// Paging triple shared by the GraphQL list endpoints
struct Page {
    std::int64_t start{0};
    std::int64_t count{0};
    lcr::optional<std::string> token{};
};

[[nodiscard]]
bool read_page(ParamReader& rd, std::int64_t default_count, Page& out) {
    return rd.integer("start", out.start, std::int64_t{0})
        && rd.non_negative("start", out.start)
        && rd.integer("count", out.count, default_count)
        && rd.positive("count", out.count)
        && rd.at_most("count", out.count, MAX_PAGE_COUNT)
        && rd.optional_text("pagination_token", out.token);
}

[[nodiscard]]
bool read_post(ParamReader& rd, PostUrn& out) {
    std::string post_url;
    if (!rd.text("post_url", post_url)) {
        return false;
    }
    if (!parse_post_reference(post_url, out)) {
        return rd.fail("parameter 'post_url' does not reference a post: " + post_url);
    }
    return true;
}

inline void append_int(std::string& out, std::int64_t v) {
    lcr::json::append(out, v);
}

[[nodiscard]]
std::string unquote(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '"') out += c;
    }
    return out;
}

// -----------------------------------------------------------------------------
// Cookie header value. Empty when no stable cookie is present.
// -----------------------------------------------------------------------------
[[nodiscard]]
std::string cookie_header(const credentials::CredentialSnapshot& creds) {
    std::string out;
    auto add = [&out](std::string_view name, std::string_view value, bool quoted) {
        if (!out.empty()) out += "; ";
        out += name;
        out += '=';
        if (quoted) out += '"';
        out += value;
        if (quoted) out += '"';
    };
    if (const auto* v = creds.cookie(credentials::cookie::LI_AT)) {
        add(credentials::cookie::LI_AT, *v, false);
    }
    if (const auto* v = creds.cookie(credentials::cookie::JSESSIONID)) {
        add(credentials::cookie::JSESSIONID, unquote(*v), true);
    }
    if (const auto* v = creds.cookie(credentials::cookie::LIAP)) {
        add(credentials::cookie::LIAP, *v, false);
    }
    return out;
}

// -----------------------------------------------------------------------------
// Endpoint builders. Each returns false with 'detail' set on bad parameters.
// -----------------------------------------------------------------------------

bool build_feed(ParamReader& rd, BuiltRequest& out) {
    std::int64_t count = 0, start = 0;
    if (!rd.integer("count", count, std::int64_t{10}) || !rd.positive("count", count)) return false;
    if (!rd.at_most("count", count, MAX_PAGE_COUNT)) return false;
    if (!rd.integer("start", start, std::int64_t{0}) || !rd.non_negative("start", start)) return false;

    out.method = "GET";
    out.url = upstream::VOYAGER_BASE_URL;
    out.url += "/feed/updatesV2?count=";
    append_int(out.url, count + 1); // one extra row marks the existence of a next page
    out.url += "&start=";
    append_int(out.url, start);
    out.url += "&q=feed&includeLongTermHistory=true&useCase=DEFAULT";
    return true;
}

bool build_comments(ParamReader& rd, BuiltRequest& out) {
    PostUrn post;
    Page page;
    std::int64_t num_replies = 0;
    if (!read_post(rd, post)) return false;
    if (!read_page(rd, 10, page)) return false;
    if (!rd.integer("num_replies", num_replies, std::int64_t{1}) || !rd.non_negative("num_replies", num_replies)) return false;

    const std::string urn = post.str();
    std::string social_detail = "urn:li:fsd_socialDetail:(";
    social_detail += urn;
    social_detail += ',';
    social_detail += urn;
    social_detail += ",urn:li:highlightedReply:-)";

    out.method = "GET";
    out.url = upstream::GRAPHQL_BASE_URL;
    out.url += "?variables=(count:";
    append_int(out.url, page.count);
    out.url += ",numReplies:";
    append_int(out.url, num_replies);
    if (page.token.has()) {
        out.url += ",paginationToken:";
        percent_encode(out.url, page.token.value());
    }
    out.url += ",socialDetailUrn:";
    percent_encode(out.url, social_detail);
    out.url += ",sortOrder:RELEVANCE,start:";
    append_int(out.url, page.start);
    out.url += ")&queryId=";
    out.url += query_id::COMMENTS;
    return true;
}

bool build_reactions(ParamReader& rd, BuiltRequest& out) {
    PostUrn post;
    Page page;
    if (!read_post(rd, post)) return false;
    if (!read_page(rd, 10, page)) return false;

    out.method = "GET";
    out.url = upstream::GRAPHQL_BASE_URL;
    out.url += "?includeWebMetadata=true&variables=(count:";
    append_int(out.url, page.count);
    out.url += ",start:";
    append_int(out.url, page.start);
    out.url += ",threadUrn:";
    percent_encode(out.url, post.str());
    if (page.token.has()) {
        out.url += ",paginationToken:";
        percent_encode(out.url, page.token.value());
    }
    out.url += ")&queryId=";
    out.url += query_id::REACTIONS;
    return true;
}

bool build_user_comments(ParamReader& rd, BuiltRequest& out) {
    std::string profile_id;
    Page page;
    if (!rd.text("profile_id", profile_id)) return false;
    if (!read_page(rd, 20, page)) return false;

    out.method = "GET";
    out.url = upstream::GRAPHQL_BASE_URL;
    out.url += "?variables=(count:";
    append_int(out.url, page.count);
    out.url += ",start:";
    append_int(out.url, page.start);
    out.url += ",profileUrn:";
    percent_encode(out.url, "urn:li:fsd_profile:" + profile_id);
    if (page.token.has()) {
        out.url += ",paginationToken:";
        percent_encode(out.url, page.token.value());
    }
    out.url += ")&queryId=";
    out.url += query_id::USER_COMMENTS;
    return true;
}

bool build_update_actions(ParamReader& rd, BuiltRequest& out) {
    std::string activity_id;
    if (!rd.text("activity_id", activity_id)) return false;
    for (char c : activity_id) {
        if (c < '0' || c > '9') {
            return rd.fail("parameter 'activity_id' must be numeric");
        }
    }

    std::string update_actions = "urn:li:fsd_updateActions:(urn:li:activity:";
    update_actions += activity_id;
    update_actions += ",FEED_DETAIL,EMPTY,urn:li:reason:-,urn:li:adCreative:-)";

    out.method = "GET";
    out.url = upstream::VOYAGER_BASE_URL;
    out.url += "/graphql?variables=(updateActionsUrn:";
    percent_encode(out.url, update_actions);
    out.url += ")&queryId=";
    out.url += query_id::UPDATE_ACTIONS;
    return true;
}

void write_comment_body(std::string& body, std::string_view text, std::string_view thread_urn) {
    body += "{\"commentary\":{\"text\":";
    lcr::json::append_string(body, text);
    body += ",\"attributesV2\":[],\"$type\":";
    lcr::json::append_string(body, TEXT_VIEW_MODEL);
    body += "},\"threadUrn\":";
    lcr::json::append_string(body, thread_urn);
    body += '}';
}

void set_comment_target(BuiltRequest& out) {
    out.method = "POST";
    out.url = upstream::VOYAGER_BASE_URL;
    out.url += "/voyagerSocialDashNormComments?decorationId=";
    out.url += decoration::NORM_COMMENT;
}

bool build_post_comment(ParamReader& rd, BuiltRequest& out) {
    PostUrn post;
    std::string text;
    if (!read_post(rd, post)) return false;
    if (!rd.text("text", text)) return false;

    set_comment_target(out);
    std::string body;
    write_comment_body(body, text, post.str());
    out.body = std::move(body);
    return true;
}

bool build_reply_comment(ParamReader& rd, BuiltRequest& out) {
    std::string comment_urn, text;
    if (!rd.text("comment_urn", comment_urn)) return false;
    if (!rd.text("text", text)) return false;

    CommentUrn parsed;
    if (!parse_comment_urn(comment_urn, parsed)) {
        return rd.fail("parameter 'comment_urn' is not a comment URN: " + comment_urn);
    }

    set_comment_target(out);
    std::string body;
    write_comment_body(body, text, parsed.thread_urn());
    out.body = std::move(body);
    return true;
}

bool build_connect(ParamReader& rd, BuiltRequest& out) {
    std::string profile_id;
    lcr::optional<std::string> message;
    if (!rd.text("profile_id", profile_id)) return false;
    if (!rd.optional_text("message", message)) return false;

    out.method = "POST";
    out.url = upstream::VOYAGER_BASE_URL;
    out.url += "/voyagerRelationshipsDashMemberRelationships?action=verifyQuotaAndCreateV2&decorationId=";
    out.url += decoration::INVITATION;

    std::string body = "{\"invitee\":{\"inviteeUnion\":{\"memberProfile\":";
    lcr::json::append_string(body, "urn:li:fsd_profile:" + profile_id);
    body += "}}";
    if (message.has()) {
        body += ",\"customMessage\":";
        lcr::json::append_string(body, message.value());
    }
    body += '}';
    out.body = std::move(body);
    return true;
}

// -----------------------------------------------------------------------------
// Profile sections. One GraphQL query each, keyed by the profile URN.
// -----------------------------------------------------------------------------

void write_profile_card_url(std::string& url, std::string_view profile_id, std::string_view query) {
    url = upstream::GRAPHQL_BASE_URL;
    url += "?includeWebMetadata=true&variables=(profileUrn:";
    percent_encode(url, "urn:li:fsd_profile:" + std::string(profile_id));
    url += ")&queryId=";
    url += query;
}

bool build_profile_card(ParamReader& rd, std::string_view query, BuiltRequest& out) {
    std::string profile_id;
    if (!rd.text("profile_id", profile_id)) return false;

    out.method = "GET";
    write_profile_card_url(out.url, profile_id, query);
    return true;
}

bool build_profile_contact(ParamReader& rd, BuiltRequest& out) {
    std::string vanity_name;
    if (!rd.text("vanity_name", vanity_name)) return false;

    out.method = "GET";
    out.url = upstream::GRAPHQL_BASE_URL;
    out.url += "?includeWebMetadata=true&variables=(memberIdentity:";
    percent_encode(out.url, vanity_name);
    out.url += ")&queryId=";
    out.url += query_id::PROFILE_CONTACT;
    return true;
}

bool build_profile_experiences(ParamReader& rd, BuiltRequest& out) {
    std::string profile_id;
    if (!rd.text("profile_id", profile_id)) return false;

    out.method = "GET";
    out.url = upstream::GRAPHQL_BASE_URL;
    out.url += "?variables=(profileUrn:";
    percent_encode(out.url, "urn:li:fsd_profile:" + profile_id);
    out.url += ",sectionType:experience,locale:en_US)&queryId=";
    out.url += query_id::PROFILE_EXPERIENCES;
    return true;
}

// Existing conversation lookup ahead of a direct message
bool build_compose_options(ParamReader& rd, BuiltRequest& out) {
    std::string profile_id;
    if (!rd.text("profile_id", profile_id)) return false;

    out.method = "GET";
    out.url = upstream::VOYAGER_BASE_URL;
    out.url += "/voyagerMessagingDashComposeOptions/";
    percent_encode(out.url, "urn:li:fsd_composeOption:(" + profile_id + ",NONE,EMPTY_CONTEXT_ENTITY_URN)");
    return true;
}

} // namespace


void append_standard_headers(http::HeaderList& headers, const credentials::CredentialSnapshot& creds, bool has_body) {
    headers.push_back({"accept", std::string(upstream::ACCEPT)});
    headers.push_back({"accept-language", std::string(upstream::ACCEPT_LANGUAGE)});
    if (creds.has_csrf()) {
        headers.push_back({"csrf-token", unquote(creds.csrf_token.value())});
    }
    headers.push_back({"x-restli-protocol-version", std::string(upstream::RESTLI_VERSION)});
    if (has_body) {
        headers.push_back({"content-type", std::string(upstream::JSON_CONTENT)});
    }
    std::string cookies = cookie_header(creds);
    if (!cookies.empty()) {
        headers.push_back({"cookie", std::move(cookies)});
    }
}


Error build(Endpoint endpoint, const Params& params, const credentials::CredentialSnapshot& creds,
            BuiltRequest& out, std::string& detail) {
    BuiltRequest built;
    ParamReader rd(params, detail);

    bool ok = false;
    switch (endpoint) {
        case Endpoint::Feed:          ok = build_feed(rd, built);           break;
        case Endpoint::Comments:      ok = build_comments(rd, built);       break;
        case Endpoint::Reactions:     ok = build_reactions(rd, built);      break;
        case Endpoint::UserComments:  ok = build_user_comments(rd, built);  break;
        case Endpoint::UpdateActions: ok = build_update_actions(rd, built); break;
        case Endpoint::PostComment:   ok = build_post_comment(rd, built);   break;
        case Endpoint::ReplyComment:  ok = build_reply_comment(rd, built);  break;
        case Endpoint::Connect:       ok = build_connect(rd, built);        break;
        case Endpoint::ProfileIdentity:
            ok = build_profile_card(rd, query_id::PROFILE_IDENTITY, built);
            break;
        case Endpoint::ProfileAboutSkills:
            ok = build_profile_card(rd, query_id::PROFILE_ABOUT_SKILLS, built);
            break;
        case Endpoint::ProfileRecommendations:
            ok = build_profile_card(rd, query_id::PROFILE_RECOMMENDATIONS, built);
            break;
        case Endpoint::ProfileContact:     ok = build_profile_contact(rd, built);     break;
        case Endpoint::ProfileExperiences: ok = build_profile_experiences(rd, built); break;
        case Endpoint::ComposeOptions:     ok = build_compose_options(rd, built);     break;
        default:
            detail = "unsupported endpoint";
            return Error::UnsupportedEndpoint;
    }
    if (!ok) {
        RG_DEBUG("[TEMPLATE] Rejected '" << to_string(endpoint) << "' parameters: " << detail);
        return Error::InvalidParameters;
    }

    append_standard_headers(built.headers, creds, built.body.has());
    out = std::move(built);
    return Error::None;
}


Error build(std::string_view endpoint, const Params& params, const credentials::CredentialSnapshot& creds,
            BuiltRequest& out, std::string& detail) {
    Endpoint e;
    if (!parse_endpoint(endpoint, e)) {
        detail = "unsupported endpoint '" + std::string(endpoint) + "'";
        RG_DEBUG("[TEMPLATE] " << detail);
        return Error::UnsupportedEndpoint;
    }
    return build(e, params, creds, out, detail);
}

} // namespace relaygate::core::request
