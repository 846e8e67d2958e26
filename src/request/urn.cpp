#include "relaygate/core/request/urn.hpp"

namespace relaygate::core::request {

namespace {

[[nodiscard]]
inline bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// Leftmost occurrence of 'prefix' immediately followed by at least one digit.
// On success 'pos' is the prefix position and 'digits' the digit run.
[[nodiscard]]
bool find_prefixed_digits(std::string_view s, std::string_view prefix, std::size_t& pos, std::string_view& digits) noexcept {
    std::size_t from = 0;
    while (true) {
        const std::size_t at = s.find(prefix, from);
        if (at == std::string_view::npos) {
            return false;
        }
        const std::size_t begin = at + prefix.size();
        std::size_t end = begin;
        while (end < s.size() && is_digit(s[end])) {
            ++end;
        }
        if (end > begin) {
            pos = at;
            digits = s.substr(begin, end - begin);
            return true;
        }
        from = at + 1;
    }
}

// Tries both kinds with the given prefixes and keeps the leftmost hit.
[[nodiscard]]
bool match_either(std::string_view s, std::string_view activity_prefix, std::string_view ugc_prefix, PostUrn& out) {
    std::size_t a_pos = 0, u_pos = 0;
    std::string_view a_digits, u_digits;
    const bool a = find_prefixed_digits(s, activity_prefix, a_pos, a_digits);
    const bool u = find_prefixed_digits(s, ugc_prefix, u_pos, u_digits);
    if (!a && !u) {
        return false;
    }
    if (a && (!u || a_pos <= u_pos)) {
        out.kind = PostKind::Activity;
        out.id = std::string(a_digits);
    }
    else {
        out.kind = PostKind::UgcPost;
        out.id = std::string(u_digits);
    }
    return true;
}

[[nodiscard]]
bool all_digits(std::string_view s) noexcept {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_digit(c)) return false;
    }
    return true;
}

} // namespace


bool parse_post_reference(std::string_view input, PostUrn& out) {
    if (input.empty()) {
        return false;
    }
    if (match_either(input, "urn:li:activity:", "urn:li:ugcPost:", out)) {
        return true;
    }
    if (match_either(input, "activity:", "ugcPost:", out)) {
        return true;
    }
    std::size_t pos = 0;
    std::string_view digits;
    if (find_prefixed_digits(input, "activity-", pos, digits)) {
        out.kind = PostKind::Activity;
        out.id = std::string(digits);
        return true;
    }
    if (find_prefixed_digits(input, "ugcPost-", pos, digits)) {
        out.kind = PostKind::UgcPost;
        out.id = std::string(digits);
        return true;
    }
    return false;
}


bool parse_comment_urn(std::string_view input, CommentUrn& out) {
    constexpr std::string_view prefix = "urn:li:fsd_comment:(";
    if (input.size() <= prefix.size() || input.substr(0, prefix.size()) != prefix || input.back() != ')') {
        return false;
    }
    const std::string_view inner = input.substr(prefix.size(), input.size() - prefix.size() - 1);
    const std::size_t comma = inner.find(',');
    if (comma == std::string_view::npos) {
        return false;
    }
    const std::string_view comment_id = inner.substr(0, comma);
    const std::string_view post = inner.substr(comma + 1);
    if (!all_digits(comment_id)) {
        return false;
    }

    PostUrn post_urn;
    if (post.rfind("urn:li:activity:", 0) == 0) {
        post_urn.kind = PostKind::Activity;
        post_urn.id = std::string(post.substr(16));
    }
    else if (post.rfind("urn:li:ugcPost:", 0) == 0) {
        post_urn.kind = PostKind::UgcPost;
        post_urn.id = std::string(post.substr(15));
    }
    else {
        return false;
    }
    if (!all_digits(post_urn.id)) {
        return false;
    }

    out.post = std::move(post_urn);
    out.comment_id = std::string(comment_id);
    return true;
}

} // namespace relaygate::core::request
