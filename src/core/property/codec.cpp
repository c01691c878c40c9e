#include "fluxwire/core/property/codec.hpp"

#include <cstdint>
#include <cstdlib>

#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace fluxwire::core::property {

namespace {

// One DOM parser per thread: the parser owns its buffers and is not
// thread-safe, but decode() must be callable from any thread.
simdjson::dom::parser& thread_parser() {
    thread_local simdjson::dom::parser parser;
    return parser;
}

simdjson::ondemand::parser& thread_ondemand_parser() {
    thread_local simdjson::ondemand::parser parser;
    return parser;
}

constexpr std::string_view JSON_WHITESPACE = " \t\n\r";

[[nodiscard]]
std::string_view trim(std::string_view sv) noexcept {
    const auto first = sv.find_first_not_of(JSON_WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = sv.find_last_not_of(JSON_WHITESPACE);
    return sv.substr(first, last - first + 1);
}

[[nodiscard]]
inline bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
[[nodiscard]]
bool is_json_number(std::string_view s) noexcept {
    std::size_t i = 0;
    const std::size_t n = s.size();
    auto digits = [&]() {
        const std::size_t start = i;
        while (i < n && is_digit(s[i])) {
            ++i;
        }
        return i > start;
    };
    if (i < n && s[i] == '-') {
        ++i;
    }
    if (i < n && s[i] == '0') {
        ++i;
    } else if (i >= n || !is_digit(s[i]) || !digits()) {
        return false;
    }
    if (i < n && s[i] == '.') {
        ++i;
        if (!digits()) {
            return false;
        }
    }
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) {
            ++i;
        }
        if (!digits()) {
            return false;
        }
    }
    return i == n;
}

// Minified re-encoding of an on-demand array / object. Numbers keep their
// literal text so nothing is rounded inside structured values.
simdjson::error_code write_minified(simdjson::ondemand::value& value, std::string& out) {
    using simdjson::ondemand::json_type;

    json_type type;
    if (auto error = value.type().get(type)) {
        return error;
    }
    if (type == json_type::object) {
        simdjson::ondemand::object object;
        if (auto error = value.get_object().get(object)) {
            return error;
        }
        out += '{';
        bool first = true;
        for (auto item : object) {
            if (auto error = item.error()) {
                return error;
            }
            simdjson::ondemand::field& field = item.value_unsafe();
            std::string_view key;
            if (auto error = field.unescaped_key().get(key)) {
                return error;
            }
            if (!first) {
                out += ',';
            }
            first = false;
            lcr::json::append_string(out, key);
            out += ':';
            if (auto error = write_minified(field.value(), out)) {
                return error;
            }
        }
        out += '}';
        return simdjson::SUCCESS;
    }
    if (type == json_type::array) {
        simdjson::ondemand::array array;
        if (auto error = value.get_array().get(array)) {
            return error;
        }
        out += '[';
        bool first = true;
        for (auto item : array) {
            if (auto error = item.error()) {
                return error;
            }
            simdjson::ondemand::value& element = item.value_unsafe();
            if (!first) {
                out += ',';
            }
            first = false;
            if (auto error = write_minified(element, out)) {
                return error;
            }
        }
        out += ']';
        return simdjson::SUCCESS;
    }

    Value scalar;
    if (auto error = from_value(value, scalar)) {
        return error;
    }
    if (scalar.is_number()) {
        out += trim(value.raw_json_token());
    } else {
        write_json(out, scalar);
    }
    return simdjson::SUCCESS;
}

// Second pass for documents the DOM rejected for number range only
[[nodiscard]]
bool decode_on_demand(std::string_view text, Value& out) {
    double number = 0.0;
    if (parse_number(text, number)) {
        out = Value::number(number);
        return true;
    }
    simdjson::padded_string padded(text);
    simdjson::ondemand::document doc;
    simdjson::ondemand::value root;
    if (thread_ondemand_parser().iterate(padded).get(doc) || doc.get_value().get(root)) {
        return false;
    }
    Value value;
    if (from_value(root, value) || !doc.at_end()) {
        return false;
    }
    out = std::move(value);
    return true;
}

} // namespace


Value decode(std::string_view text) {
    simdjson::dom::element root;
    auto error = thread_parser().parse(text.data(), text.size()).get(root);
    if (error && is_number_range_error(error)) {
        Value value;
        if (decode_on_demand(text, value)) {
            FW_TRACE("[CODEC] '" << text << "' read on demand (" << simdjson::error_message(error) << ")");
            return value;
        }
    }
    if (error) {
        FW_TRACE("[CODEC] '" << text << "' is not JSON (" << simdjson::error_message(error) << ") -> string");
        return Value::string(std::string(text));
    }
    return from_element(root);
}


bool parse_number(std::string_view text, double& out) {
    const std::string_view token = trim(text);
    if (!is_json_number(token)) {
        return false;
    }
    // strtod saturates to ±HUGE_VAL (±inf) beyond double range
    const std::string literal(token);
    out = std::strtod(literal.c_str(), nullptr);
    return true;
}


simdjson::error_code from_value(simdjson::ondemand::value& value, Value& out) {
    using simdjson::ondemand::json_type;

    json_type type;
    if (auto error = value.type().get(type)) {
        return error;
    }
    switch (type) {
        case json_type::null:
            if (trim(value.raw_json_token()) != "null") {
                return simdjson::N_ATOM_ERROR;
            }
            out = Value::null();
            return simdjson::SUCCESS;
        case json_type::boolean: {
            bool b = false;
            if (auto error = value.get_bool().get(b)) {
                return error;
            }
            out = Value::boolean(b);
            return simdjson::SUCCESS;
        }
        case json_type::number: {
            double d = 0.0;
            if (!parse_number(value.raw_json_token(), d)) {
                return simdjson::NUMBER_ERROR;
            }
            out = Value::number(d);
            return simdjson::SUCCESS;
        }
        case json_type::string: {
            std::string_view sv;
            if (auto error = value.get_string().get(sv)) {
                return error;
            }
            out = Value::string(std::string(sv));
            return simdjson::SUCCESS;
        }
        case json_type::array:
        case json_type::object: {
            std::string text;
            if (auto error = write_minified(value, text)) {
                return error;
            }
            out = Value::json(std::move(text));
            return simdjson::SUCCESS;
        }
        default:
            break;
    }
    return simdjson::INCORRECT_TYPE;
}


simdjson::error_code from_object(simdjson::ondemand::object& object, Map& out) {
    for (auto item : object) {
        if (auto error = item.error()) {
            return error;
        }
        simdjson::ondemand::field& field = item.value_unsafe();
        std::string_view key;
        if (auto error = field.unescaped_key().get(key)) {
            return error;
        }
        std::string name(key);
        Value value;
        if (auto error = from_value(field.value(), value)) {
            return error;
        }
        out.set(std::move(name), std::move(value));
    }
    return simdjson::SUCCESS;
}


Error parse_token(std::string_view token, Property& out) {
    const auto sep = token.find('=');
    if (sep == std::string_view::npos) {
        FW_DEBUG("[CODEC] Invalid property token '" << token << "' (expected key=value)");
        return Error::FormatError;
    }
    out.key   = std::string(token.substr(0, sep));
    out.value = decode(token.substr(sep + 1));
    return Error::None;
}


Error parse_tokens(const std::vector<std::string>& tokens, Map& out, std::string* bad_token) {
    for (const auto& token : tokens) {
        Property p;
        if (parse_token(token, p) != Error::None) {
            if (bad_token) {
                *bad_token = token;
            }
            return Error::FormatError;
        }
        out.set(std::move(p.key), std::move(p.value));
    }
    return Error::None;
}


Value from_element(const simdjson::dom::element& element) {
    using simdjson::dom::element_type;
    switch (element.type()) {
        case element_type::NULL_VALUE:
            return Value::null();
        case element_type::BOOL:
            return Value::boolean(element.get_bool().value_unsafe());
        case element_type::INT64:
            return Value::number(static_cast<double>(element.get_int64().value_unsafe()));
        case element_type::UINT64:
            return Value::number(static_cast<double>(element.get_uint64().value_unsafe()));
        case element_type::DOUBLE:
            return Value::number(element.get_double().value_unsafe());
        case element_type::STRING:
            return Value::string(std::string(element.get_string().value_unsafe()));
        case element_type::ARRAY:
        case element_type::OBJECT:
            return Value::json(simdjson::minify(element));
    }
    return Value::null();
}


Map from_object(const simdjson::dom::object& object) {
    Map out;
    for (auto field : object) {
        out.set(std::string(field.key), from_element(field.value));
    }
    return out;
}


void write_json(std::string& out, const Value& value) {
    switch (value.kind()) {
        case Kind::Null:
            out += "null";
            break;
        case Kind::Boolean:
            out += value.as_boolean() ? "true" : "false";
            break;
        case Kind::Number:
            lcr::json::append(out, value.as_number());
            break;
        case Kind::String:
            lcr::json::append_string(out, value.as_string());
            break;
        case Kind::Json:
            out += value.as_json();
            break;
    }
}


void write_json(std::string& out, const Map& map) {
    out += '{';
    bool first = true;
    for (const auto& p : map) {
        if (!first) {
            out += ',';
        }
        first = false;
        lcr::json::append_string(out, p.key);
        out += ':';
        write_json(out, p.value);
    }
    out += '}';
}

} // namespace fluxwire::core::property
