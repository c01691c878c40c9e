#pragma once

#include <string>
#include <string_view>
#include <ostream>

#include "fluxwire/core/property/map.hpp"
#include "fluxwire/core/timestamp.hpp"
#include "lcr/optional.hpp"


namespace fluxwire::core {

// -----------------------------
// Entity (service-owned state)
// -----------------------------
// Read-only copy of an entity as served by the service.
// `last_updated` is the absolute time exactly as sent on the wire;
// `updated_at` is its parsed UTC value when the text is RFC 3339.
struct Entity {
    std::string     id;
    property::Map   properties;
    std::string     last_updated;
    lcr::optional<Timestamp> updated_at{};

    bool operator==(const Entity&) const = default;
};

// Compact one-line form (see format::format)
std::ostream& operator<<(std::ostream&, const Entity&);

} // namespace fluxwire::core
