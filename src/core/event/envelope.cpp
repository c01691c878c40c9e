#include "fluxwire/core/event/envelope.hpp"

#include "fluxwire/core/property/codec.hpp"
#include "fluxwire/core/timestamp.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace fluxwire::core::event {

void Event::write_json(std::string& out) const {
    out += "{\"stream\":";
    lcr::json::append_string(out, stream);

    out += ",\"source\":";
    lcr::json::append_string(out, source);

    out += ",\"timestamp\":";
    lcr::json::append(out, timestamp);

    out += ",\"payload\":{\"entity_id\":";
    lcr::json::append_string(out, entity_id);
    out += ",\"properties\":";
    property::write_json(out, properties);
    out += '}'; // close payload

    if (key.has()) {
        out += ",\"key\":";
        lcr::json::append_string(out, key.value());
    }

    if (schema.has()) {
        out += ",\"schema\":";
        lcr::json::append_string(out, schema.value());
    }

    out += '}';
}


Error build(std::string_view stream,
            std::string_view source,
            std::string_view entity_id,
            const property::Map& properties,
            Event& out,
            const lcr::optional<std::string>& key,
            const lcr::optional<std::string>& schema)
{
    if (stream.empty()) {
        FW_DEBUG("[EVENT] Rejecting event: stream is required");
        return Error::InvalidArgument;
    }
    if (source.empty()) {
        FW_DEBUG("[EVENT] Rejecting event: source is required");
        return Error::InvalidArgument;
    }
    if (entity_id.empty()) {
        FW_DEBUG("[EVENT] Rejecting event: entity_id is required");
        return Error::InvalidArgument;
    }

    Event ev;
    ev.stream     = std::string(stream);
    ev.source     = std::string(source);
    ev.timestamp  = now_epoch_ms();
    ev.entity_id  = std::string(entity_id);
    ev.properties = properties;
    ev.key        = key;
    ev.schema     = schema;

    out = std::move(ev);
    return Error::None;
}


bool is_valid_stream_name(std::string_view stream) noexcept {
    if (stream.empty()) {
        return false;
    }
    if (stream.front() == '.' || stream.back() == '.') {
        return false;
    }
    char prev = '\0';
    for (char c : stream) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.';
        if (!ok) {
            return false;
        }
        if (c == '.' && prev == '.') {
            return false;
        }
        prev = c;
    }
    return true;
}

} // namespace fluxwire::core::event
