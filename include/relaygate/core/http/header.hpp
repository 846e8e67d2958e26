#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace relaygate::core::http {

struct Header {
    std::string name;
    std::string value;

    [[nodiscard]]
    bool operator==(const Header&) const = default;
};

// Ordered header list. Order is significant and preserved end to end.
using HeaderList = std::vector<Header>;

[[nodiscard]]
inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

// Case-insensitive lookup. Returns nullptr when absent.
[[nodiscard]]
inline const Header* find_header(const HeaderList& headers, std::string_view name) noexcept {
    for (const auto& h : headers) {
        if (iequals(h.name, name)) {
            return &h;
        }
    }
    return nullptr;
}

} // namespace relaygate::core::http
