#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <initializer_list>

#include "fluxwire/core/property/value.hpp"


namespace fluxwire::core::property {

// A single key=value pair
struct Property {
    std::string key;
    Value value;

    bool operator==(const Property&) const = default;
};

/*
===============================================================================
 property::Map
===============================================================================

Mapping string → Value with unique keys, iterated in first-insertion order.

  - set() on an existing key replaces the value in place (position kept)
  - Equality is order-insensitive: two maps are equal when they hold the
    same keys with the same values

Property sets are small (a handful of readings per entity), so a flat
vector with linear lookup beats node-based maps here.
===============================================================================
*/
class Map {
public:
    using container_t    = std::vector<Property>;
    using const_iterator = container_t::const_iterator;

    Map() = default;

    Map(std::initializer_list<Property> init) {
        for (const auto& p : init) {
            set(p.key, p.value);
        }
    }

    inline void set(std::string key, Value value) {
        for (auto& p : items_) {
            if (p.key == key) {
                p.value = std::move(value);
                return;
            }
        }
        items_.push_back(Property{std::move(key), std::move(value)});
    }

    [[nodiscard]]
    inline const Value* find(std::string_view key) const noexcept {
        for (const auto& p : items_) {
            if (p.key == key) {
                return &p.value;
            }
        }
        return nullptr;
    }

    [[nodiscard]]
    inline bool contains(std::string_view key) const noexcept {
        return find(key) != nullptr;
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return items_.empty(); }

    inline void clear() noexcept { items_.clear(); }

    [[nodiscard]] inline const_iterator begin() const noexcept { return items_.begin(); }
    [[nodiscard]] inline const_iterator end() const noexcept { return items_.end(); }

    friend bool operator==(const Map& a, const Map& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (const auto& p : a.items_) {
            const Value* other = b.find(p.key);
            if (!other || !(*other == p.value)) {
                return false;
            }
        }
        return true;
    }

private:
    container_t items_;
};

} // namespace fluxwire::core::property
