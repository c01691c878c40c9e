#pragma once

#include <string>
#include <string_view>

#include "fluxwire/core/entity.hpp"
#include "fluxwire/core/property/codec.hpp"
#include "fluxwire/core/protocol/flux/parser/helpers.hpp"
#include "fluxwire/core/timestamp.hpp"
#include "lcr/log/logger.hpp"

#include <simdjson.h>

namespace fluxwire::core::protocol::flux::parser {

// Entity object, shared by subscription frames and query responses:
//
//   {"id":"sensor-1","properties":{"t":22.5},"lastUpdated":"2024-01-01T00:00:00Z"}
//
//   id           required, non-empty string
//   properties   optional object (absent → empty map)
//   lastUpdated  optional string, kept verbatim; parsed to UTC when RFC 3339
struct entity {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, Entity& out) noexcept {
        out = Entity{};

        // Root must be object
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            FW_DEBUG("[PARSER] Entity is not an object -> reject.");
            return r;
        }

        // id (required)
        std::string_view sv;
        r = helper::parse_string_required(root, "id", sv);
        if (r != Result::Parsed) {
            FW_DEBUG("[PARSER] Field 'id' missing or not a string in entity -> reject.");
            return r;
        }
        if (sv.empty()) {
            FW_DEBUG("[PARSER] Field 'id' empty in entity -> reject.");
            return Result::InvalidValue;
        }
        out.id = std::string(sv);

        // properties (optional)
        simdjson::dom::element props;
        bool present = false;
        r = helper::parse_object_optional(root, "properties", props, present);
        if (r != Result::Parsed) {
            FW_DEBUG("[PARSER] Field 'properties' not an object in entity '" << out.id << "' -> reject.");
            return r;
        }
        if (present) {
            out.properties = property::from_object(props.get_object().value_unsafe());
        }

        // lastUpdated (optional)
        r = helper::parse_string_optional(root, "lastUpdated", sv, present);
        if (r != Result::Parsed) {
            FW_DEBUG("[PARSER] Field 'lastUpdated' not a string in entity '" << out.id << "' -> reject.");
            return r;
        }
        if (present) {
            set_last_updated_(sv, out);
        }

        return Result::Parsed;
    }

    // Same rules over a simdjson on-demand object, for documents the DOM
    // parser rejects only because of a number it cannot store
    // (see property::is_number_range_error).
    [[nodiscard]]
    static inline Result parse(simdjson::ondemand::object& root, Entity& out) noexcept {
        out = Entity{};

        bool has_id = false;
        for (auto item : root) {
            if (item.error()) {
                return Result::InvalidJson;
            }
            simdjson::ondemand::field& field = item.value_unsafe();
            std::string_view key;
            if (field.unescaped_key().get(key)) {
                return Result::InvalidJson;
            }

            if (key == "id") {
                property::Value id;
                if (property::from_value(field.value(), id)) {
                    return Result::InvalidJson;
                }
                if (!id.is_string()) {
                    FW_DEBUG("[PARSER] Field 'id' not a string in entity -> reject.");
                    return Result::InvalidSchema;
                }
                out.id = id.as_string();
                has_id = true;
            }
            else if (key == "properties") {
                simdjson::ondemand::object props;
                if (field.value().get_object().get(props)) {
                    FW_DEBUG("[PARSER] Field 'properties' not an object in entity -> reject.");
                    return Result::InvalidSchema;
                }
                if (property::from_object(props, out.properties)) {
                    return Result::InvalidJson;
                }
            }
            else if (key == "lastUpdated") {
                property::Value ts;
                if (property::from_value(field.value(), ts)) {
                    return Result::InvalidJson;
                }
                if (ts.is_string()) {
                    set_last_updated_(ts.as_string(), out);
                } else if (!ts.is_null()) {
                    FW_DEBUG("[PARSER] Field 'lastUpdated' not a string in entity -> reject.");
                    return Result::InvalidSchema;
                }
            }
        }

        if (!has_id) {
            FW_DEBUG("[PARSER] Field 'id' missing in entity -> reject.");
            return Result::InvalidSchema;
        }
        if (out.id.empty()) {
            FW_DEBUG("[PARSER] Field 'id' empty in entity -> reject.");
            return Result::InvalidValue;
        }
        return Result::Parsed;
    }

private:
    static inline void set_last_updated_(std::string_view sv, Entity& out) {
        out.last_updated = std::string(sv);
        Timestamp ts;
        if (parse_rfc3339(sv, ts)) {
            out.updated_at = ts;
        } else {
            FW_DEBUG("[PARSER] Field 'lastUpdated' of entity '" << out.id << "' is not RFC 3339: " << sv);
        }
    }
};

} // namespace fluxwire::core::protocol::flux::parser
