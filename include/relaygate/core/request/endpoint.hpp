#pragma once

#include <cstdint>
#include <string_view>

namespace relaygate::core::request {

// ===============================================================
// Supported logical endpoints
// ===============================================================
enum class Endpoint : uint8_t {
    Feed,           // GET  home feed page
    Comments,       // GET  comments under a post
    Reactions,      // GET  reactions on a post
    UserComments,   // GET  comments authored by a profile
    UpdateActions,  // GET  update actions for an activity (ugcPost lookup)
    PostComment,    // POST top-level comment on a post
    ReplyComment,   // POST reply to an existing comment
    Connect,        // POST connection invitation
    ProfileIdentity,        // GET  name, vanity name, follower count
    ProfileContact,         // GET  contact info, keyed by vanity name
    ProfileAboutSkills,     // GET  about section and skills
    ProfileExperiences,     // GET  work experience section
    ProfileRecommendations, // GET  received recommendations
    ComposeOptions          // GET  messaging compose options (existing conversation lookup)
};

[[nodiscard]]
inline constexpr std::string_view to_string(Endpoint e) noexcept {
    switch (e) {
        case Endpoint::Feed:          return "feed";
        case Endpoint::Comments:      return "comments";
        case Endpoint::Reactions:     return "reactions";
        case Endpoint::UserComments:  return "user_comments";
        case Endpoint::UpdateActions: return "update_actions";
        case Endpoint::PostComment:   return "post_comment";
        case Endpoint::ReplyComment:  return "reply_comment";
        case Endpoint::Connect:       return "connect";
        case Endpoint::ProfileIdentity:        return "profile_identity";
        case Endpoint::ProfileContact:         return "profile_contact";
        case Endpoint::ProfileAboutSkills:     return "profile_about_skills";
        case Endpoint::ProfileExperiences:     return "profile_experiences";
        case Endpoint::ProfileRecommendations: return "profile_recommendations";
        case Endpoint::ComposeOptions:         return "compose_options";
        default:                      return "unknown";
    }
}

// Exact, case-sensitive match on the wire name.
[[nodiscard]]
inline constexpr bool parse_endpoint(std::string_view s, Endpoint& out) noexcept {
    constexpr Endpoint all[] = {
        Endpoint::Feed, Endpoint::Comments, Endpoint::Reactions, Endpoint::UserComments,
        Endpoint::UpdateActions, Endpoint::PostComment, Endpoint::ReplyComment, Endpoint::Connect,
        Endpoint::ProfileIdentity, Endpoint::ProfileContact, Endpoint::ProfileAboutSkills,
        Endpoint::ProfileExperiences, Endpoint::ProfileRecommendations, Endpoint::ComposeOptions
    };
    for (Endpoint e : all) {
        if (to_string(e) == s) {
            out = e;
            return true;
        }
    }
    return false;
}

} // namespace relaygate::core::request
