#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>
#include <variant>

#include "fluxwire/core/entity.hpp"


namespace fluxwire::core {
namespace protocol {
namespace flux {
namespace schema {

/*
===============================================================================
 Subscription messages
===============================================================================

Every inbound frame is classified into exactly one of:

  Snapshot      {"type":"snapshot","entity":{...}}
                Full current state of one entity, sent on subscribe.

  Update        {"type":"update","entity":{...}}
                New full state of one entity after a change.

  Unrecognized  Anything else: not JSON, an unknown `type`, or a known type
                whose `entity` is malformed. Carries the raw frame text and
                is always surfaced, never dropped.

Consumers handle the sum type exhaustively with std::visit.
===============================================================================
*/

struct Snapshot {
    Entity entity;

    bool operator==(const Snapshot&) const = default;
};

struct Update {
    Entity entity;

    bool operator==(const Update&) const = default;
};

struct Unrecognized {
    std::string raw;

    bool operator==(const Unrecognized&) const = default;
};

using Message = std::variant<Snapshot, Update, Unrecognized>;


enum class MessageKind : std::uint8_t {
    Snapshot,
    Update,
    Unrecognized
};

[[nodiscard]]
inline MessageKind kind_of(const Message& msg) noexcept {
    return static_cast<MessageKind>(msg.index());
}

[[nodiscard]]
inline constexpr std::string_view to_string(MessageKind k) noexcept {
    switch (k) {
        case MessageKind::Snapshot:     return "snapshot";
        case MessageKind::Update:       return "update";
        case MessageKind::Unrecognized: return "unrecognized";
        default:                        return "unknown";
    }
}

// Entity carried by a snapshot or update (nullptr for Unrecognized)
[[nodiscard]]
inline const Entity* entity_of(const Message& msg) noexcept {
    if (const auto* s = std::get_if<Snapshot>(&msg)) {
        return &s->entity;
    }
    if (const auto* u = std::get_if<Update>(&msg)) {
        return &u->entity;
    }
    return nullptr;
}

// Compact one-line form (see format::format)
std::ostream& operator<<(std::ostream&, const Message&);

} // namespace schema
} // namespace flux
} // namespace protocol
} // namespace fluxwire::core
