#pragma once

#include <cstdint>
#include <initializer_list>
#include <type_traits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "lcr/json.hpp"

namespace relaygate::core::request {

// Typed parameter value. Integers are always carried as int64.
using ParamValue = std::variant<std::int64_t, bool, std::string>;

struct Param {
    std::string name;
    ParamValue  value;

    Param(std::string n, std::int64_t v) : name(std::move(n)), value(v) {}
    Param(std::string n, int v) : name(std::move(n)), value(static_cast<std::int64_t>(v)) {}
    Param(std::string n, bool v) : name(std::move(n)), value(v) {}
    Param(std::string n, std::string v) : name(std::move(n)), value(std::move(v)) {}
    Param(std::string n, const char* v) : name(std::move(n)), value(std::string(v)) {}

    [[nodiscard]]
    bool operator==(const Param&) const = default;
};

// ===============================================================
// Ordered parameter map
// ===============================================================
//
// Insertion order is preserved and is part of the value: two Params with
// the same entries in a different order compare unequal and serialize
// differently. Setting an existing name replaces the value in place.
class Params {
public:
    Params() = default;
    Params(std::initializer_list<Param> init) {
        for (const auto& p : init) {
            set(p.name, p.value);
        }
    }

    Params& set(std::string_view name, ParamValue value) {
        for (auto& p : items_) {
            if (p.name == name) {
                p.value = std::move(value);
                return *this;
            }
        }
        items_.push_back(Param{std::string(name), std::string()});
        items_.back().value = std::move(value);
        return *this;
    }

    [[nodiscard]]
    const ParamValue* find(std::string_view name) const noexcept {
        for (const auto& p : items_) {
            if (p.name == name) {
                return &p.value;
            }
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return items_.begin(); }
    [[nodiscard]] auto end() const noexcept { return items_.end(); }

    [[nodiscard]]
    bool operator==(const Params&) const = default;

    // {"name":value,...} in insertion order
    void write_json(std::string& out) const {
        out += '{';
        bool first = true;
        for (const auto& p : items_) {
            if (!first) out += ',';
            first = false;
            lcr::json::append_string(out, p.name);
            out += ':';
            std::visit([&out](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::int64_t>) {
                    lcr::json::append(out, v);
                }
                else if constexpr (std::is_same_v<T, bool>) {
                    out += v ? "true" : "false";
                }
                else {
                    lcr::json::append_string(out, v);
                }
            }, p.value);
        }
        out += '}';
    }

private:
    std::vector<Param> items_;
};

} // namespace relaygate::core::request
