#pragma once

#include <string>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace fluxwire::core {
namespace protocol {
namespace flux {
namespace schema {

// Subscription request, sent exactly once right after the connection opens.
//
//   {"type":"subscribe"}                         all entities
//   {"type":"subscribe","entityId":"<id>"}       a single entity
//
// The scope is fixed for the lifetime of the session.
struct Subscribe {
    lcr::optional<std::string> entity_id{};

    inline void write_json(std::string& out) const {
        out.append("{\"type\":\"subscribe\"");
        if (entity_id.has()) {
            out.append(",\"entityId\":");
            lcr::json::append_string(out, entity_id.value());
        }
        out.push_back('}');
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        write_json(out);
        return out;
    }
};

} // namespace schema
} // namespace flux
} // namespace protocol
} // namespace fluxwire::core
