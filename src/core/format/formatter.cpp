#include "fluxwire/core/format/formatter.hpp"

#include <ostream>
#include <variant>
#include <type_traits>

#include "fluxwire/core/property/codec.hpp"
#include "lcr/json.hpp"


namespace fluxwire::core::format {

namespace {

[[nodiscard]]
inline std::string_view first_19(std::string_view ts) noexcept {
    return ts.substr(0, 19);
}

inline void append_indent(std::string& out, int n) {
    out.append(static_cast<std::size_t>(n), ' ');
}

[[nodiscard]]
std::string entity_block(const Entity& e) {
    std::string out;
    out += "Entity: ";
    out += e.id;
    out += "\nLast Updated: ";
    out += e.last_updated;
    out += "\nProperties:\n";
    out += properties_json(e.properties, 2);
    out += '\n';
    return out;
}

} // namespace


std::string display(const property::Value& value) {
    if (value.is_string()) {
        return value.as_string();
    }
    return property::to_json(value);
}

std::string key_values(const property::Map& properties) {
    std::string out;
    bool first = true;
    for (const auto& p : properties) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += p.key;
        out += '=';
        out += display(p.value);
    }
    return out;
}

std::string properties_json(const property::Map& properties, int indent) {
    if (properties.empty()) {
        return "{}";
    }
    std::string out;
    out += '{';
    bool first = true;
    for (const auto& p : properties) {
        if (!first) {
            out += indent > 0 ? "," : ", ";
        }
        first = false;
        if (indent > 0) {
            out += '\n';
            append_indent(out, indent);
        }
        lcr::json::append_string(out, p.key);
        out += ": ";
        property::write_json(out, p.value);
    }
    if (indent > 0) {
        out += '\n';
    }
    out += '}';
    return out;
}


std::string format(const Entity& entity, Style style) {
    if (style == Style::Multiline) {
        return entity_block(entity);
    }
    std::string out;
    out += entity.id;
    out += ": ";
    out += key_values(entity.properties);
    out += " (updated: ";
    out += first_19(entity.last_updated);
    out += ')';
    return out;
}

std::string format(const protocol::flux::schema::Message& msg, Style style) {
    using namespace protocol::flux::schema;

    return std::visit([style](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Snapshot>) {
            if (style == Style::Multiline) {
                return "[SNAPSHOT]\n" + entity_block(m.entity);
            }
            return "[SNAPSHOT] " + m.entity.id + ": " + properties_json(m.entity.properties);
        }
        else if constexpr (std::is_same_v<T, Update>) {
            if (style == Style::Multiline) {
                return "[UPDATE]\n" + entity_block(m.entity);
            }
            return "[" + std::string(first_19(m.entity.last_updated)) + "] " + m.entity.id + ": "
                   + key_values(m.entity.properties);
        }
        else {
            static_assert(std::is_same_v<T, Unrecognized>, "non-exhaustive message visitor");
            return m.raw;
        }
    }, msg);
}

std::string format(const api::PublishReceipt& receipt) {
    return "Published event " + receipt.event_id + " to stream " + receipt.stream;
}

std::string format(const api::BatchReceipt& receipt) {
    std::string out = "Batch: " + std::to_string(receipt.successful) + " accepted, "
                    + std::to_string(receipt.failed) + " rejected";
    for (std::size_t i = 0; i < receipt.results.size(); ++i) {
        const auto& r = receipt.results[i];
        out += "\n  [" + std::to_string(i) + "] ";
        if (!r.ok()) {
            out += "error: " + r.error.value();
        } else {
            out += r.event_id.value_or("?") + " (" + r.stream.value_or("?") + ")";
        }
    }
    return out;
}

} // namespace fluxwire::core::format


// ---------------------------------
// Debug / logging helpers
// ---------------------------------

namespace fluxwire::core {

std::ostream& operator<<(std::ostream& os, const Entity& e) {
    return os << format::format(e, format::Style::Compact);
}

namespace protocol::flux::schema {

std::ostream& operator<<(std::ostream& os, const Message& m) {
    return os << format::format(m, format::Style::Compact);
}

} // namespace protocol::flux::schema

namespace api {

std::ostream& operator<<(std::ostream& os, const PublishReceipt& r) {
    return os << format::format(r);
}

} // namespace api

} // namespace fluxwire::core
