#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <simdjson.h>

#include "fluxwire/core/error.hpp"
#include "fluxwire/core/property/value.hpp"
#include "fluxwire/core/property/map.hpp"

/*
================================================================================
Property Codec
================================================================================

Converts free-form `key=value` text into typed property values and writes
property values back as JSON.

Decoding rule (applied identically wherever text becomes a property value):

  1) Attempt a strict JSON parse of the whole text
       "22.5"          → Number 22.5
       "true"          → Boolean true
       "null"          → Null
       "\"quoted\""    → String quoted
       "{\"a\":1}"     → Json {"a":1}
  2) On ANY parse failure keep the original text as a String
       "online"        → String online
       "NaN"           → String NaN   (not strict JSON)

Number literals are read as doubles whatever their size. simdjson's DOM
rejects integers wider than 64 bits and magnitudes beyond double range
although they are valid JSON; such documents are re-read on demand
       "123456789012345678901234567890" → Number 1.2345678901234568e29
       "1e999"                          → Number +inf

The fallback is the designed behavior, not an error condition.

Encoding is deterministic: map entries in insertion order, numbers in their
shortest round-trip form, integral numbers without a fraction.
================================================================================
*/

namespace fluxwire::core::property {

// Strict JSON decode with string fallback. Never fails.
[[nodiscard]]
Value decode(std::string_view text);

// Split `key=value` on the FIRST '=' and decode the value.
// Returns Error::FormatError when the token contains no '='.
[[nodiscard]]
Error parse_token(std::string_view token, Property& out);

// Parse a list of tokens into `out` (later duplicates replace earlier ones).
// Stops at the first malformed token and returns Error::FormatError;
// `bad_token` (when provided) receives the offending token.
[[nodiscard]]
Error parse_tokens(const std::vector<std::string>& tokens, Map& out, std::string* bad_token = nullptr);

// Convert a simdjson DOM element into a property value.
// Objects and arrays become Json (minified text).
[[nodiscard]]
Value from_element(const simdjson::dom::element& element);

// Convert a simdjson DOM object into a property map.
[[nodiscard]]
Map from_object(const simdjson::dom::object& object);

// -----------------------------------------------------------------------------
// Number range fallback
// -----------------------------------------------------------------------------

// DOM errors raised by a valid number literal the DOM cannot store
// (BIGINT_ERROR: wider than 64 bits, NUMBER_ERROR: beyond double range).
// NUMBER_ERROR is also raised by malformed numbers; the on-demand readers
// below reject those.
[[nodiscard]]
inline bool is_number_range_error(simdjson::error_code error) noexcept {
    return error == simdjson::BIGINT_ERROR || error == simdjson::NUMBER_ERROR;
}

// Strict JSON number literal (surrounding whitespace allowed) to double,
// saturating to ±inf beyond range. Returns false when `text` is not a JSON
// number literal.
[[nodiscard]]
bool parse_number(std::string_view text, double& out);

// On-demand counterparts of from_element() / from_object().
// Every value reached is validated; numbers go through parse_number().
[[nodiscard]]
simdjson::error_code from_value(simdjson::ondemand::value& value, Value& out);

[[nodiscard]]
simdjson::error_code from_object(simdjson::ondemand::object& object, Map& out);

// JSON writers
void write_json(std::string& out, const Value& value);
void write_json(std::string& out, const Map& map);

[[nodiscard]]
inline std::string to_json(const Value& value) {
    std::string out;
    write_json(out, value);
    return out;
}

[[nodiscard]]
inline std::string to_json(const Map& map) {
    std::string out;
    write_json(out, map);
    return out;
}

} // namespace fluxwire::core::property
