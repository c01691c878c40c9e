#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <utility>


namespace fluxwire::core::property {

// ===============================================================
// PROPERTY VALUE KIND
// ===============================================================
enum class Kind : std::uint8_t {
    Null,
    Boolean,
    Number,
    String,
    Json        // object or array, kept as minified JSON text
};

[[nodiscard]]
inline constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
        case Kind::Null:    return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Number:  return "number";
        case Kind::String:  return "string";
        case Kind::Json:    return "json";
        default:            return "unknown";
    }
}

// Structured JSON payload (object or array).
// `text` is always minified, valid JSON.
struct Json {
    std::string text;

    bool operator==(const Json&) const = default;
};

/*
===============================================================================
 property::Value
===============================================================================

Typed property value: a tagged union over
{ null, boolean, number (double), string, structured JSON }.

Values are produced by property::decode() from free-form text and by the
protocol parsers from inbound JSON documents. They are plain value types:
copyable, comparable, and independent of any parser buffer.
===============================================================================
*/
class Value {
    using storage_t = std::variant<std::monostate, bool, double, std::string, Json>;

public:
    Value() = default;

    [[nodiscard]] static inline Value null() { return Value{}; }
    [[nodiscard]] static inline Value boolean(bool b) { return Value{storage_t{b}}; }
    [[nodiscard]] static inline Value number(double d) { return Value{storage_t{d}}; }
    [[nodiscard]] static inline Value string(std::string s) { return Value{storage_t{std::move(s)}}; }
    [[nodiscard]] static inline Value json(std::string minified) { return Value{storage_t{Json{std::move(minified)}}}; }

    [[nodiscard]]
    inline Kind kind() const noexcept {
        return static_cast<Kind>(data_.index());
    }

    [[nodiscard]] inline bool is_null() const noexcept    { return kind() == Kind::Null; }
    [[nodiscard]] inline bool is_boolean() const noexcept { return kind() == Kind::Boolean; }
    [[nodiscard]] inline bool is_number() const noexcept  { return kind() == Kind::Number; }
    [[nodiscard]] inline bool is_string() const noexcept  { return kind() == Kind::String; }
    [[nodiscard]] inline bool is_json() const noexcept    { return kind() == Kind::Json; }

    // Accessors (precondition: matching kind)
    [[nodiscard]] inline bool as_boolean() const { return std::get<bool>(data_); }
    [[nodiscard]] inline double as_number() const { return std::get<double>(data_); }
    [[nodiscard]] inline const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] inline const std::string& as_json() const { return std::get<Json>(data_).text; }

    bool operator==(const Value&) const = default;

private:
    explicit Value(storage_t data) : data_(std::move(data)) {}

    storage_t data_{};
};

// Keep Kind in sync with the variant alternatives
static_assert(static_cast<int>(Kind::Json) == 4);

} // namespace fluxwire::core::property
