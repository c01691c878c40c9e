#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <simdjson.h>

#include "fluxwire/core/protocol/flux/schema/message.hpp"
#include "fluxwire/core/protocol/flux/parser/entity.hpp"
#include "fluxwire/core/protocol/flux/parser/helpers.hpp"
#include "fluxwire/core/protocol/flux/parser/result.hpp"
#include "fluxwire/core/property/codec.hpp"
#include "fluxwire/core/entity.hpp"
#include "lcr/log/logger.hpp"


namespace fluxwire::core {
namespace protocol {
namespace flux {
namespace parser {

/*
================================================================================
Subscription Frame Router
================================================================================

Classifies one raw WebSocket frame into a schema::Message.

  1) JSON parse (simdjson DOM)              failure → Unrecognized
     A frame the DOM rejects only for a number it cannot store (wider than
     64 bits, beyond double range) is valid JSON and is routed on demand
     with the same rules.
  2) `type` dispatch ("snapshot" | "update") other   → Unrecognized
  3) `entity` object parsed into an Entity   invalid → Unrecognized

Classification is total: every frame yields exactly one message and a bad
frame never aborts the stream. The returned Result tells the caller WHY a
frame ended up Unrecognized (Ignored for an unknown type, InvalidJson /
InvalidSchema / InvalidValue for damaged frames).

The router owns its simdjson parser; one router per session, used from the
session's thread only.
================================================================================
*/

class Router {
public:
    Router() = default;

    // Main entry point
    [[nodiscard]]
    inline Result parse_and_route(std::string_view raw_msg, schema::Message& out) noexcept {
        // Parse JSON message
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error && property::is_number_range_error(error)) {
            FW_DEBUG("[PARSER] " << error << " -> routing on demand");
            return route_on_demand_(raw_msg, out);
        }
        if (error) {
            FW_WARN("[PARSER] JSON parse error: " << error << " in message: " << raw_msg);
            out = schema::Unrecognized{std::string(raw_msg)};
            return Result::InvalidJson;
        }

        // TYPE DISPATCH
        std::string_view type;
        if (helper::parse_string_required(root, "type", type) != Result::Parsed) {
            FW_DEBUG("[PARSER] Frame without 'type' -> unrecognized: " << raw_msg);
            out = schema::Unrecognized{std::string(raw_msg)};
            return Result::Ignored;
        }
        if (type == "snapshot") {
            return parse_entity_message_<schema::Snapshot>(root, raw_msg, out);
        }
        if (type == "update") {
            return parse_entity_message_<schema::Update>(root, raw_msg, out);
        }

        FW_DEBUG("[PARSER] Unhandled type '" << type << "' -> unrecognized");
        out = schema::Unrecognized{std::string(raw_msg)};
        return Result::Ignored;
    }

private:
    // Underlying simdjson parsers
    simdjson::dom::parser parser_;
    simdjson::ondemand::parser ondemand_parser_;

private:
    template<class MessageT>
    [[nodiscard]]
    inline Result parse_entity_message_(const simdjson::dom::element& root, std::string_view raw_msg, schema::Message& out) noexcept {
        simdjson::dom::element node;
        auto r = helper::parse_object_required(root, "entity", node);
        if (r != Result::Parsed) {
            FW_WARN("[PARSER] Field 'entity' missing or invalid in '" << root["type"].get_string().value_unsafe()
                    << "' message -> unrecognized: " << raw_msg);
            out = schema::Unrecognized{std::string(raw_msg)};
            return r;
        }
        MessageT msg;
        r = entity::parse(node, msg.entity);
        if (r != Result::Parsed) {
            FW_WARN("[PARSER] Malformed entity (" << to_string(r) << ") -> unrecognized: " << raw_msg);
            out = schema::Unrecognized{std::string(raw_msg)};
            return r;
        }
        out = std::move(msg);
        return Result::Parsed;
    }

    [[nodiscard]]
    inline Result route_on_demand_(std::string_view raw_msg, schema::Message& out) noexcept {
        out = schema::Unrecognized{std::string(raw_msg)};

        simdjson::padded_string padded(raw_msg);
        simdjson::ondemand::document doc;
        simdjson::ondemand::object root;
        if (ondemand_parser_.iterate(padded).get(doc) || doc.get_object().get(root)) {
            FW_WARN("[PARSER] JSON parse error in message: " << raw_msg);
            return Result::InvalidJson;
        }

        // Single pass: `type` may follow `entity`
        std::string type;
        bool has_type = false;
        Entity parsed;
        Result entity_result = Result::InvalidSchema;   // absent until seen
        for (auto item : root) {
            if (item.error()) {
                FW_WARN("[PARSER] JSON parse error in message: " << raw_msg);
                return Result::InvalidJson;
            }
            simdjson::ondemand::field& field = item.value_unsafe();
            std::string_view key;
            if (field.unescaped_key().get(key)) {
                FW_WARN("[PARSER] JSON parse error in message: " << raw_msg);
                return Result::InvalidJson;
            }
            if (key == "type") {
                property::Value value;
                if (property::from_value(field.value(), value)) {
                    FW_WARN("[PARSER] JSON parse error in message: " << raw_msg);
                    return Result::InvalidJson;
                }
                has_type = value.is_string();
                if (has_type) {
                    type = value.as_string();
                }
            }
            else if (key == "entity") {
                simdjson::ondemand::object node;
                entity_result = field.value().get_object().get(node)
                              ? Result::InvalidSchema
                              : entity::parse(node, parsed);
            }
        }
        if (!doc.at_end()) {
            FW_WARN("[PARSER] Trailing content in message: " << raw_msg);
            return Result::InvalidJson;
        }

        if (!has_type) {
            FW_DEBUG("[PARSER] Frame without 'type' -> unrecognized: " << raw_msg);
            return Result::Ignored;
        }
        if (type != "snapshot" && type != "update") {
            FW_DEBUG("[PARSER] Unhandled type '" << type << "' -> unrecognized");
            return Result::Ignored;
        }
        if (entity_result != Result::Parsed) {
            FW_WARN("[PARSER] Field 'entity' missing or malformed (" << to_string(entity_result)
                    << ") in '" << type << "' message -> unrecognized: " << raw_msg);
            return entity_result;
        }
        if (type == "snapshot") {
            out = schema::Snapshot{std::move(parsed)};
        } else {
            out = schema::Update{std::move(parsed)};
        }
        return Result::Parsed;
    }
};

} // namespace parser
} // namespace flux
} // namespace protocol
} // namespace fluxwire::core
