#pragma once

#include <string_view>

#include "fluxwire/core/protocol/flux/parser/result.hpp"

#include <simdjson.h>

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the subscription parsers to extract primitive JSON
values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types
  • Provide strict optional-field handling semantics

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

Returned string views point into the parser's document and are only valid
until the next parse.
================================================================================
*/


namespace fluxwire::core::protocol::flux::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline parser::Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? parser::Result::Parsed : parser::Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline parser::Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(parent) != parser::Result::Parsed) {
        return parser::Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return parser::Result::InvalidSchema;
    }
    out = field.value_unsafe();
    return require_object(out);
}

// ------------------------------------------------------------
// OPTIONAL OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline parser::Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != parser::Result::Parsed) {
        return parser::Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return parser::Result::Parsed; // optional, not present
    }
    out = field.value_unsafe();
    if (require_object(out) != parser::Result::Parsed) {
        return parser::Result::InvalidSchema;
    }
    present = true;
    return parser::Result::Parsed;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline parser::Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != parser::Result::Parsed) {
        return parser::Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::InvalidSchema;
    }
    if (field.get(out)) {
        return parser::Result::InvalidSchema;
    }
    return parser::Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

// Absent and explicit null both count as "not present"
[[nodiscard]]
inline parser::Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& presence) noexcept {
    presence = false;
    if (require_object(obj) != parser::Result::Parsed) {
        return parser::Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::Parsed;
    }
    simdjson::dom::element value = field.value_unsafe();
    if (value.is_null()) {
        return parser::Result::Parsed;
    }
    if (value.get(out)) {
        return parser::Result::InvalidSchema;
    }
    presence = true;
    return parser::Result::Parsed;
}

} // namespace fluxwire::core::protocol::flux::parser::helper
