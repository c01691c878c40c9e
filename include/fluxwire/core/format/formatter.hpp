#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "fluxwire/core/api/receipt.hpp"
#include "fluxwire/core/entity.hpp"
#include "fluxwire/core/property/map.hpp"
#include "fluxwire/core/property/value.hpp"
#include "fluxwire/core/protocol/flux/schema/message.hpp"


/*
================================================================================
Message Formatter
================================================================================

Human-readable rendering of messages, entities and receipts. Pure functions:
no I/O, no state.

  Update      [2024-01-01T00:00:00] sensor-1: t=22.5, online=true
  Snapshot    [SNAPSHOT] sensor-1: {"t": 22.5, "online": true}
  Other       the raw frame text, unchanged

  Entity (compact)     sensor-1: t=22.5 (updated: 2024-01-01T00:00:00)
  Entity (multi-line)  Entity: sensor-1
                       Last Updated: 2024-01-01T00:00:00Z
                       Properties:
                       {
                         "t": 22.5
                       }

Timestamps in the one-line forms are cut to their first 19 characters
(seconds precision, no zone).
================================================================================
*/

namespace fluxwire::core::format {

enum class Style : std::uint8_t {
    Compact,
    Multiline
};

[[nodiscard]]
std::string format(const protocol::flux::schema::Message& msg, Style style = Style::Compact);

[[nodiscard]]
std::string format(const Entity& entity, Style style = Style::Compact);

[[nodiscard]]
std::string format(const api::PublishReceipt& receipt);

[[nodiscard]]
std::string format(const api::BatchReceipt& receipt);

// Display text of a single value: strings bare, everything else as JSON
[[nodiscard]]
std::string display(const property::Value& value);

// "k=v, k=v" in insertion order
[[nodiscard]]
std::string key_values(const property::Map& properties);

// JSON object with ", " / ": " separators, or indented by `indent` spaces
// per level when indent > 0
[[nodiscard]]
std::string properties_json(const property::Map& properties, int indent = 0);

} // namespace fluxwire::core::format
