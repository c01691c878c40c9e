#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "fluxwire/core/error.hpp"
#include "fluxwire/core/property/map.hpp"
#include "lcr/optional.hpp"


namespace fluxwire::core::event {

/*
===============================================================================
 event::Event
===============================================================================

Publishable event record.

  stream      logical namespace (non-empty)
  source      producer identity (non-empty)
  timestamp   epoch milliseconds, stamped by build(); never caller-supplied
  entity_id   target entity (non-empty)
  properties  property set carried in the payload
  key         optional ordering / grouping hint
  schema      optional metadata tag

Wire form (POST /api/events):

  {"stream":"..","source":"..","timestamp":<ms>,
   "payload":{"entity_id":"..","properties":{..}},
   "key":".." , "schema":".."}

`key` and `schema` are omitted entirely when absent (never sent as null).
===============================================================================
*/
struct Event {
    std::string   stream;
    std::string   source;
    std::int64_t  timestamp{0};
    std::string   entity_id;
    property::Map properties;
    lcr::optional<std::string> key{};
    lcr::optional<std::string> schema{};

    // Deterministic wire serialization (pure function of the value)
    void write_json(std::string& out) const;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        write_json(out);
        return out;
    }
};

// -----------------------------------------------------------------------------
// Build an event, stamping the current wall-clock time (read once).
//
// Returns Error::InvalidArgument when stream, source or entity_id is empty;
// `out` is left untouched in that case. `properties` is copied, never mutated.
// -----------------------------------------------------------------------------
[[nodiscard]]
Error build(std::string_view stream,
            std::string_view source,
            std::string_view entity_id,
            const property::Map& properties,
            Event& out,
            const lcr::optional<std::string>& key = {},
            const lcr::optional<std::string>& schema = {});

// -----------------------------------------------------------------------------
// Stream naming rule enforced by the service:
//   lowercase letters, digits and dots; no leading, trailing or repeated dots.
// Advisory on the client side (the service has the final word).
// -----------------------------------------------------------------------------
[[nodiscard]]
bool is_valid_stream_name(std::string_view stream) noexcept;

} // namespace fluxwire::core::event
