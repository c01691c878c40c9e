#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "lcr/optional.hpp"


namespace fluxwire::core::api {

// Acknowledgement of one accepted event (POST /api/events)
struct PublishReceipt {
    std::string event_id;
    std::string stream;

    bool operator==(const PublishReceipt&) const = default;
};

// Per-event outcome inside a batch; either an id or an error is present
struct BatchResult {
    lcr::optional<std::string> event_id{};
    lcr::optional<std::string> stream{};
    lcr::optional<std::string> error{};

    [[nodiscard]]
    inline bool ok() const noexcept {
        return !error.has();
    }

    bool operator==(const BatchResult&) const = default;
};

// Outcome of POST /api/events/batch. `results` follows the request order.
struct BatchReceipt {
    std::uint64_t successful{0};
    std::uint64_t failed{0};
    std::vector<BatchResult> results;

    bool operator==(const BatchReceipt&) const = default;
};

// "Published event <id> to stream <stream>" (see format::format)
std::ostream& operator<<(std::ostream&, const PublishReceipt&);

} // namespace fluxwire::core::api
