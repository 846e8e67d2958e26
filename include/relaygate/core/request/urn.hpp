#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace relaygate::core::request {

enum class PostKind : uint8_t {
    Activity,
    UgcPost
};

[[nodiscard]]
inline constexpr std::string_view to_string(PostKind k) noexcept {
    switch (k) {
        case PostKind::Activity: return "activity";
        case PostKind::UgcPost:  return "ugcPost";
        default:                 return "unknown";
    }
}

// urn:li:<kind>:<id>
struct PostUrn {
    PostKind    kind{PostKind::Activity};
    std::string id;

    [[nodiscard]]
    std::string str() const {
        std::string out = "urn:li:";
        out += to_string(kind);
        out += ':';
        out += id;
        return out;
    }
};

// urn:li:fsd_comment:(<comment_id>,urn:li:<kind>:<post_id>)
struct CommentUrn {
    PostUrn     post;
    std::string comment_id;

    // Thread URN used when replying: urn:li:comment:(<kind>:<post_id>,<comment_id>)
    [[nodiscard]]
    std::string thread_urn() const {
        std::string out = "urn:li:comment:(";
        out += to_string(post.kind);
        out += ':';
        out += post.id;
        out += ',';
        out += comment_id;
        out += ')';
        return out;
    }
};

// Extracts a post reference from a bare URN or any post URL.
// Recognized forms, tried in this order (leftmost match wins within a step):
//   1. "urn:li:activity:<digits>" / "urn:li:ugcPost:<digits>"
//   2. "activity:<digits>" / "ugcPost:<digits>"
//   3. "activity-<digits>"
//   4. "ugcPost-<digits>"
[[nodiscard]]
bool parse_post_reference(std::string_view input, PostUrn& out);

// Strict parse of a comment entity URN. Returns false on any deviation.
[[nodiscard]]
bool parse_comment_urn(std::string_view input, CommentUrn& out);

} // namespace relaygate::core::request
