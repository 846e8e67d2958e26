#pragma once

#include <cstdint>
#include <cstring>
#include <string>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace relaygate::core::protocol::schema {

// Liveness check sent by the gateway.
//
// PRECONDITION for write_json():
//   Caller must provide a buffer of at least max_json_size() bytes.
struct Ping {
    lcr::optional<std::uint64_t> id{};

public:
    [[nodiscard]]
    static constexpr std::size_t max_json_size() noexcept {
        // Worst case:
        // {"type":"ping","id":"18446744073709551615"}
        return 64;
    }

    // Writes JSON into raw buffer. Returns number of bytes written.
    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        std::size_t pos = 0;

        static constexpr char prefix[] = "{\"type\":\"ping\"";
        std::memcpy(buffer + pos, prefix, sizeof(prefix) - 1);
        pos += sizeof(prefix) - 1;

        if (id.has()) {
            static constexpr char id_prefix[] = ",\"id\":\"";
            std::memcpy(buffer + pos, id_prefix, sizeof(id_prefix) - 1);
            pos += sizeof(id_prefix) - 1;

            char digits[24];
            std::size_t n = 0;
            std::uint64_t v = id.value();
            do {
                digits[n++] = static_cast<char>('0' + (v % 10));
                v /= 10;
            } while (v > 0);
            while (n > 0) {
                buffer[pos++] = digits[--n];
            }
            buffer[pos++] = '"';
        }

        buffer[pos++] = '}';
        return pos;
    }

    std::string to_json() const {
        char buffer[max_json_size()];
        const std::size_t size = write_json(buffer);
        return std::string(buffer, size);
    }
};

// Client-originated ping (inbound). The id is echoed back in the pong.
struct PingIn {
    lcr::optional<std::string> id{};
};

} // namespace relaygate::core::protocol::schema
