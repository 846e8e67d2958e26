#pragma once

#include <array>
#include <string>
#include <string_view>

/*
===============================================================================
Percent-encoding table
===============================================================================

One table for every call site that embeds a value inside a URL component.
RFC 3986 unreserved characters (ALPHA / DIGIT / "-" / "." / "_" / "~") are
copied through; every other byte, including "/", ":", "(", ")" and ",", is
written as %XX with uppercase hex digits. Non-ASCII input is encoded byte by
byte (UTF-8 in, UTF-8 percent-escapes out).

There is no per-call-site "safe" set. A composite value either goes through
this table whole or is assembled from literal text.
===============================================================================
*/

namespace relaygate::core::request {

namespace detail {

[[nodiscard]]
inline constexpr std::array<bool, 256> make_unreserved_table() noexcept {
    std::array<bool, 256> t{};
    for (int c = 'A'; c <= 'Z'; ++c) t[static_cast<std::size_t>(c)] = true;
    for (int c = 'a'; c <= 'z'; ++c) t[static_cast<std::size_t>(c)] = true;
    for (int c = '0'; c <= '9'; ++c) t[static_cast<std::size_t>(c)] = true;
    t[static_cast<std::size_t>('-')] = true;
    t[static_cast<std::size_t>('.')] = true;
    t[static_cast<std::size_t>('_')] = true;
    t[static_cast<std::size_t>('~')] = true;
    return t;
}

inline constexpr std::array<bool, 256> UNRESERVED = make_unreserved_table();

} // namespace detail

[[nodiscard]]
inline constexpr bool is_unreserved(unsigned char c) noexcept {
    return detail::UNRESERVED[c];
}

inline void percent_encode(std::string& out, std::string_view in) {
    static constexpr char hex[] = "0123456789ABCDEF";
    for (char ch : in) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out += ch;
        }
        else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
}

[[nodiscard]]
inline std::string percent_encode(std::string_view in) {
    std::string out;
    out.reserve(in.size() * 3);
    percent_encode(out, in);
    return out;
}

} // namespace relaygate::core::request
