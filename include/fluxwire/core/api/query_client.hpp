#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <simdjson.h>

#include "fluxwire/core/api/config.hpp"
#include "fluxwire/core/api/detail/exchange.hpp"
#include "fluxwire/core/api/detail/percent_encode.hpp"
#include "fluxwire/core/entity.hpp"
#include "fluxwire/core/error.hpp"
#include "fluxwire/core/property/codec.hpp"
#include "fluxwire/core/protocol/flux/parser/entity.hpp"
#include "fluxwire/core/transport/concepts.hpp"
#include "fluxwire/core/transport/http/message.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace fluxwire::core::api {

// Server-side filters for query_all (combined with AND)
//
//   namespace_name  entities whose id is "<namespace_name>/..."
//   prefix          entities whose id starts with `prefix`
struct EntityFilter {
    lcr::optional<std::string> namespace_name{};
    lcr::optional<std::string> prefix{};
};

/*
===============================================================================
 api::QueryClient
===============================================================================

Point-in-time reads of entity state.

  GET /api/state/entities/<id>   → query_one
  GET /api/state/entities        → query_all

Failure codes:
  NotFound       the entity does not exist (query_one only); an expected
                 outcome, distinct from ServerError
  Unreachable    no connection could be established
  Timeout        no complete response within Config::timeout
  ServerError    any other non-2xx status; detail = response body verbatim
  ProtocolError  2xx response whose body is not the expected entity shape

No retries. The client holds only immutable configuration and may be shared
across threads when Http allows it (the Beast client does).
===============================================================================
*/
template<transport::HttpConcept Http>
class QueryClient {
public:
    explicit QueryClient(Config cfg = {}, Http http = Http{})
        : cfg_(std::move(cfg))
        , http_(std::move(http))
    {
    }

    [[nodiscard]]
    inline Failure query_one(std::string_view entity_id, Entity& out) const {
        if (entity_id.empty()) {
            return Failure::make(Error::InvalidArgument, "entity id must not be empty");
        }
        transport::http::Request req;
        Failure f = detail::make_request(cfg_, transport::http::Method::Get,
                                         "/api/state/entities/" + detail::percent_encode(entity_id), req);
        if (!f.ok()) {
            return f;
        }
        transport::http::Response res;
        f = detail::exchange(http_, req, res, "[QUERY]");
        if (f.code == Error::ServerError && f.status == 404) {
            FW_DEBUG("[QUERY] Entity '" << entity_id << "' not found");
            return Failure::make(Error::NotFound, "entity '" + std::string(entity_id) + "' not found", 404);
        }
        if (!f.ok()) {
            return f;
        }

        simdjson::dom::parser parser;
        simdjson::dom::element root;
        auto error = parser.parse(res.body).get(root);
        if (error && property::is_number_range_error(error)) {
            Entity entity;
            if (!parse_entity_on_demand_(res.body, entity)) {
                FW_ERROR("[QUERY] Response is not an entity (" << error << ")");
                return Failure::make(Error::ProtocolError, "response is not an entity: " + res.body, res.status);
            }
            out = std::move(entity);
            return Failure::none();
        }
        if (error) {
            FW_ERROR("[QUERY] Response is not JSON: " << error);
            return Failure::make(Error::ProtocolError, "response is not JSON: " + res.body, res.status);
        }
        Entity entity;
        const auto r = protocol::flux::parser::entity::parse(root, entity);
        if (r != protocol::flux::parser::Result::Parsed) {
            FW_ERROR("[QUERY] Response is not an entity (" << protocol::flux::parser::to_string(r) << ")");
            return Failure::make(Error::ProtocolError, "response is not an entity: " + res.body, res.status);
        }
        out = std::move(entity);
        return Failure::none();
    }

    [[nodiscard]]
    inline Failure query_all(std::vector<Entity>& out) const {
        return query_all(EntityFilter{}, out);
    }

    [[nodiscard]]
    inline Failure query_all(const EntityFilter& filter, std::vector<Entity>& out) const {
        std::string path = "/api/state/entities";
        char sep = '?';
        if (filter.namespace_name.has()) {
            path += sep;
            path += "namespace=" + detail::percent_encode(filter.namespace_name.value());
            sep = '&';
        }
        if (filter.prefix.has()) {
            path += sep;
            path += "prefix=" + detail::percent_encode(filter.prefix.value());
        }

        transport::http::Request req;
        Failure f = detail::make_request(cfg_, transport::http::Method::Get, path, req);
        if (!f.ok()) {
            return f;
        }
        transport::http::Response res;
        f = detail::exchange(http_, req, res, "[QUERY]");
        if (!f.ok()) {
            return f;
        }

        simdjson::dom::parser parser;
        simdjson::dom::array items;
        auto error = parser.parse(res.body).get(items);
        if (error && property::is_number_range_error(error)) {
            std::vector<Entity> entities;
            if (!parse_entities_on_demand_(res.body, entities)) {
                FW_ERROR("[QUERY] Response is not an entity list (" << error << ")");
                return Failure::make(Error::ProtocolError, "response is not an entity list: " + res.body, res.status);
            }
            FW_DEBUG("[QUERY] Received " << entities.size() << " entities");
            out = std::move(entities);
            return Failure::none();
        }
        if (error) {
            FW_ERROR("[QUERY] Response is not a JSON array: " << error);
            return Failure::make(Error::ProtocolError, "response is not an entity list: " + res.body, res.status);
        }
        std::vector<Entity> entities;
        entities.reserve(items.size());
        for (simdjson::dom::element item : items) {
            Entity entity;
            const auto r = protocol::flux::parser::entity::parse(item, entity);
            if (r != protocol::flux::parser::Result::Parsed) {
                FW_ERROR("[QUERY] Entity #" << entities.size() << " in list is malformed ("
                         << protocol::flux::parser::to_string(r) << ")");
                return Failure::make(Error::ProtocolError,
                                     "malformed entity at index " + std::to_string(entities.size()), res.status);
            }
            entities.push_back(std::move(entity));
        }
        FW_DEBUG("[QUERY] Received " << entities.size() << " entities");
        out = std::move(entities);
        return Failure::none();
    }

    [[nodiscard]]
    inline const Config& config() const noexcept {
        return cfg_;
    }

#ifdef FW_UNIT_TEST
public:
    const Http& http() const {
        return http_;
    }
#endif // FW_UNIT_TEST

private:
    Config cfg_;
    Http http_;

private:
    // Bodies the DOM rejects only for a number it cannot store are re-read
    // on demand (see property::is_number_range_error)
    [[nodiscard]]
    static inline bool parse_entity_on_demand_(const std::string& body, Entity& out) {
        simdjson::padded_string padded(body);
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document doc;
        simdjson::ondemand::object root;
        if (parser.iterate(padded).get(doc) || doc.get_object().get(root)) {
            return false;
        }
        return protocol::flux::parser::entity::parse(root, out) == protocol::flux::parser::Result::Parsed
               && doc.at_end();
    }

    [[nodiscard]]
    static inline bool parse_entities_on_demand_(const std::string& body, std::vector<Entity>& out) {
        simdjson::padded_string padded(body);
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document doc;
        simdjson::ondemand::array items;
        if (parser.iterate(padded).get(doc) || doc.get_array().get(items)) {
            return false;
        }
        for (auto item : items) {
            simdjson::ondemand::object object;
            if (item.get_object().get(object)) {
                return false;
            }
            Entity entity;
            if (protocol::flux::parser::entity::parse(object, entity) != protocol::flux::parser::Result::Parsed) {
                FW_ERROR("[QUERY] Entity #" << out.size() << " in list is malformed");
                return false;
            }
            out.push_back(std::move(entity));
        }
        return doc.at_end();
    }
};

} // namespace fluxwire::core::api
