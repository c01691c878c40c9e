#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <simdjson.h>

#include "fluxwire/core/api/config.hpp"
#include "fluxwire/core/api/detail/exchange.hpp"
#include "fluxwire/core/api/receipt.hpp"
#include "fluxwire/core/error.hpp"
#include "fluxwire/core/event/envelope.hpp"
#include "fluxwire/core/protocol/flux/parser/helpers.hpp"
#include "fluxwire/core/transport/concepts.hpp"
#include "fluxwire/core/transport/http/message.hpp"
#include "lcr/log/logger.hpp"


namespace fluxwire::core::api {

/*
===============================================================================
 api::Publisher
===============================================================================

Sends events to the service.

  POST /api/events         {event}                → {"eventId","stream"}
  POST /api/events/batch   {"events":[{event},..]} → {"successful","failed",
                                                      "results":[{"eventId",
                                                      "stream","error"},..]}

Same failure taxonomy and deadline as QueryClient; no retries.
Stream names that break the service's naming rule are logged as a warning
and still sent: the service has the final word.
===============================================================================
*/
template<transport::HttpConcept Http>
class Publisher {
    using Result = protocol::flux::parser::Result;

public:
    explicit Publisher(Config cfg = {}, Http http = Http{})
        : cfg_(std::move(cfg))
        , http_(std::move(http))
    {
    }

    [[nodiscard]]
    inline Failure publish(const event::Event& ev, PublishReceipt& out) const {
        warn_on_stream_name_(ev.stream);

        transport::http::Request req;
        Failure f = detail::make_request(cfg_, transport::http::Method::Post, "/api/events", req);
        if (!f.ok()) {
            return f;
        }
        req.content_type = "application/json";
        ev.write_json(req.body);
        FW_DEBUG("[PUBLISH] " << req.body);

        transport::http::Response res;
        f = detail::exchange(http_, req, res, "[PUBLISH]");
        if (!f.ok()) {
            return f;
        }

        simdjson::dom::parser parser;
        simdjson::dom::element root;
        std::string_view event_id;
        std::string_view stream;
        if (parser.parse(res.body).get(root) ||
            protocol::flux::parser::helper::parse_string_required(root, "eventId", event_id) != Result::Parsed ||
            protocol::flux::parser::helper::parse_string_required(root, "stream", stream) != Result::Parsed) {
            FW_ERROR("[PUBLISH] Unexpected publish response: " << res.body);
            return Failure::make(Error::ProtocolError, "unexpected publish response: " + res.body, res.status);
        }
        out = PublishReceipt{std::string(event_id), std::string(stream)};
        FW_INFO("[PUBLISH] Event " << out.event_id << " accepted on stream " << out.stream);
        return Failure::none();
    }

    // A partially rejected batch is NOT a failure: per-event errors are
    // reported in `out.results`.
    [[nodiscard]]
    inline Failure publish_batch(const std::vector<event::Event>& events, BatchReceipt& out) const {
        if (events.empty()) {
            return Failure::make(Error::InvalidArgument, "batch must contain at least one event");
        }
        for (const auto& ev : events) {
            warn_on_stream_name_(ev.stream);
        }

        transport::http::Request req;
        Failure f = detail::make_request(cfg_, transport::http::Method::Post, "/api/events/batch", req);
        if (!f.ok()) {
            return f;
        }
        req.content_type = "application/json";
        req.body.append("{\"events\":[");
        for (std::size_t i = 0; i < events.size(); ++i) {
            if (i != 0) {
                req.body.push_back(',');
            }
            events[i].write_json(req.body);
        }
        req.body.append("]}");

        transport::http::Response res;
        f = detail::exchange(http_, req, res, "[PUBLISH]");
        if (!f.ok()) {
            return f;
        }

        BatchReceipt receipt;
        if (!parse_batch_(res.body, receipt)) {
            FW_ERROR("[PUBLISH] Unexpected batch response: " << res.body);
            return Failure::make(Error::ProtocolError, "unexpected batch response: " + res.body, res.status);
        }
        FW_INFO("[PUBLISH] Batch of " << events.size() << ": " << receipt.successful << " accepted, "
                << receipt.failed << " rejected");
        out = std::move(receipt);
        return Failure::none();
    }

    [[nodiscard]]
    inline const Config& config() const noexcept {
        return cfg_;
    }

private:
    Config cfg_;
    Http http_;

private:
    static inline void warn_on_stream_name_(std::string_view stream) {
        if (!event::is_valid_stream_name(stream)) {
            FW_WARN("[PUBLISH] Stream name '" << stream
                    << "' breaks the naming rule (lowercase letters, digits, single dots); the service may reject it");
        }
    }

    [[nodiscard]]
    static inline bool parse_batch_(const std::string& body, BatchReceipt& out) {
        namespace helper = protocol::flux::parser::helper;

        simdjson::dom::parser parser;
        simdjson::dom::element root;
        if (parser.parse(body).get(root) || helper::require_object(root) != Result::Parsed) {
            return false;
        }
        if (root["successful"].get(out.successful) || root["failed"].get(out.failed)) {
            return false;
        }
        simdjson::dom::array results;
        if (root["results"].get(results)) {
            return false;
        }
        for (simdjson::dom::element item : results) {
            BatchResult r;
            std::string_view sv;
            bool present = false;
            if (helper::parse_string_optional(item, "eventId", sv, present) != Result::Parsed) {
                return false;
            }
            if (present) {
                r.event_id = std::string(sv);
            }
            if (helper::parse_string_optional(item, "stream", sv, present) != Result::Parsed) {
                return false;
            }
            if (present) {
                r.stream = std::string(sv);
            }
            if (helper::parse_string_optional(item, "error", sv, present) != Result::Parsed) {
                return false;
            }
            if (present) {
                r.error = std::string(sv);
            }
            out.results.push_back(std::move(r));
        }
        return true;
    }
};

} // namespace fluxwire::core::api
