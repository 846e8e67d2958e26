#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "relaygate/core/protocol/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level functions used by the message parsers (and the credential loader)
to extract primitive values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structure (object presence, type correctness)
  • Parse primitive field types (bool, integer, string)
  • Strict optional-field semantics: absent is fine, present-but-wrong is not

Helpers never interpret values, never log and never throw. Logging and
control-flow decisions belong to the message parsers built on top.
================================================================================
*/


namespace relaygate::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// OBJECT FIELDS
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::object& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_element_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    out = field.value_unsafe();
    present = true;
    return Result::Parsed;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_required(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

// Ids on the wire may be either strings or integers; both normalize to text.
[[nodiscard]]
inline Result parse_id_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed;
    }
    std::string_view sv;
    if (!field.get(sv)) {
        out = std::string(sv);
        return Result::Parsed;
    }
    std::uint64_t n = 0;
    if (!field.get(n)) {
        out = std::to_string(n);
        return Result::Parsed;
    }
    if (field.is_null()) {
        return Result::Parsed;
    }
    return Result::InvalidSchema;
}

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.is_null()) {
        return Result::Parsed;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.is_null()) {
        return Result::Parsed;
    }
    std::int64_t v = 0;
    if (field.get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Parsed;
}

// ============================================================================
// STRING MAP
// ============================================================================

// Visits every "name": "value" pair of an object. Non-string values fail the whole parse.
template<class Fn>
[[nodiscard]]
inline Result parse_string_map(const simdjson::dom::object& obj, Fn&& fn) {
    for (auto field : obj) {
        std::string_view value;
        if (field.value.get(value)) {
            return Result::InvalidSchema;
        }
        fn(field.key, value);
    }
    return Result::Parsed;
}

} // namespace relaygate::core::protocol::parser::helper
