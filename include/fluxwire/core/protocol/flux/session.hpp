/*
===============================================================================
Flux subscription Session
===============================================================================

Live entity-state subscription over WebSocket.

Design principles:
  - Composition over inheritance
  - Clear separation between transport and protocol logic
  - Zero runtime polymorphism
  - Compile-time safety via C++20 concepts

Architecture:
  - transport::*          → WebSocket transport (Boost.Beast, mockable)
  - parser::Router        → frame classification (snapshot / update / other)
  - Session               → lifecycle state machine
                             • endpoint derivation and subscribe request
                             • arrival-ordered delivery of messages
                             • per-session reconciliation cache
                             • cooperative cancellation

Data-plane model:
  - Pull-based: the owner calls next() (or run()) on its own thread
  - Every frame produces exactly one message, in arrival order
  - Snapshot and Update fully replace the cached entity (last write wins)
    BEFORE the message is handed out; Unrecognized never touches the cache
  - No automatic reconnection; a dropped stream ends in Failed and the owner
    decides whether to open() again (every open starts with an empty cache)

Threading:
  - All methods except cancel() belong to the owning thread
  - cancel() only raises an atomic flag; it is observed at the next receive
    tick (at most one receive interval later)
===============================================================================
*/

#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

#include "fluxwire/core/config/timeouts.hpp"
#include "fluxwire/core/entity.hpp"
#include "fluxwire/core/error.hpp"
#include "fluxwire/core/protocol/flux/parser/router.hpp"
#include "fluxwire/core/protocol/flux/schema/message.hpp"
#include "fluxwire/core/protocol/flux/schema/subscribe.hpp"
#include "fluxwire/core/protocol/flux/session/config.hpp"
#include "fluxwire/core/protocol/flux/session/state.hpp"
#include "fluxwire/core/transport/concepts.hpp"
#include "fluxwire/core/transport/error.hpp"
#include "fluxwire/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace fluxwire::core {
namespace protocol {
namespace flux {

template<transport::WebSocketConcept WS>
class Session {
public:
    using cache_t = std::unordered_map<std::string, Entity>;

public:
    explicit Session(session::Config cfg = {})
        : cfg_(std::move(cfg))
    {
    }

    ~Session() {
        close();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // open()
    //
    // Connect to the subscription endpoint and send the subscribe request.
    //
    //   Unreachable  → nothing accepted the connection (refused, DNS, upgrade
    //                  rejected)
    //   Timeout      → the opening sequence exceeded connect_timeout
    //   InvalidUrl   → the configured address cannot be used
    //   InvalidState → the session is already open
    //
    // No retries. On success the session is Subscribing; the first inbound
    // frame moves it to Streaming.
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Failure open() {
        // 0) PRECONDITION: not already running
        const session::State state = state_;
        if (!session::can_open(state)) {
            FW_WARN("[SESSION] open() called while " << session::to_string(state) << ". Ignoring.");
            return Failure::make(Error::InvalidState,
                                 "open() called while " + std::string(session::to_string(state)));
        }
        // 1) Fresh start: a new subscription never sees a previous cache
        cache_.clear();
        rx_frames_ = 0;
        unrecognized_frames_ = 0;
        last_failure_ = Failure::none();
        cancel_requested_.store(false, std::memory_order_release);

        // 2) PRECONDITION: derive and validate the endpoint
        transport::ParsedUrl endpoint;
        if (transport::to_websocket_url(cfg_.url, config::SUBSCRIPTION_PATH, endpoint) != transport::Error::None) {
            FW_ERROR("[SESSION] Invalid service URL: " << cfg_.url);
            last_failure_ = Failure::make(Error::InvalidUrl, "invalid service URL '" + cfg_.url + "'");
            return last_failure_;
        }
        if (endpoint.secure) {
            FW_ERROR("[SESSION] Secure endpoints are not supported: " << cfg_.url);
            last_failure_ = Failure::make(Error::InvalidUrl,
                                          "secure endpoint '" + transport::to_string(endpoint) + "' is not supported");
            return last_failure_;
        }
        endpoint_ = transport::to_string(endpoint);

        // 3) Connect
        set_state_(session::State::Connecting);
        create_transport_();
        transport::Error err = ws_->connect(endpoint.host, endpoint.port, endpoint.path, cfg_.connect_timeout);
        if (err != transport::Error::None) {
            const Error code = transport::to_client_error(err);
            if (code == Error::Timeout) {
                return fail_(code, "no response from " + endpoint_ + " within "
                                   + std::to_string(cfg_.connect_timeout.count()) + " ms");
            }
            return fail_(code, "cannot connect to " + endpoint_ + " ("
                               + std::string(transport::to_string(err)) + "); is the service running?");
        }

        // 4) Subscribe (exactly one request, scope fixed for the session)
        set_state_(session::State::Subscribing);
        const std::string request = schema::Subscribe{cfg_.entity_id}.to_json();
        FW_DEBUG("[SESSION] Sending subscription request: " << request);
        err = ws_->send(request, cfg_.send_timeout);
        if (err != transport::Error::None) {
            const Error code = (err == transport::Error::Timeout) ? Error::Timeout : Error::Disconnected;
            return fail_(code, "failed to send subscription request to " + endpoint_ + " ("
                               + std::string(transport::to_string(err)) + ")");
        }

        if (cfg_.entity_id.has()) {
            FW_INFO("[SESSION] Subscribed to entity '" << cfg_.entity_id.value() << "' at " << endpoint_);
        } else {
            FW_INFO("[SESSION] Subscribed to all entities at " << endpoint_);
        }
        return Failure::none();
    }

    // -------------------------------------------------------------------------
    // next()
    //
    // Block until the next message is available (true), or until the session
    // ends through cancel(), close() or a transport failure (false).
    //
    // An idle receive interval is not an error and is never surfaced; it is
    // where a pending cancel() is observed.
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline bool next(schema::Message& out) {
        for (;;) {
            if (!session::is_active(state_)) {
                return false;
            }
            if (cancel_requested_.load(std::memory_order_acquire)) {
                FW_INFO("[SESSION] Cancellation requested -> closing");
                close();
                return false;
            }

            const transport::Error err = ws_->receive(rx_buffer_, cfg_.receive_timeout);
            if (err == transport::Error::Timeout) {
                FW_TRACE("[SESSION] Idle receive interval elapsed");
                continue;
            }
            if (err != transport::Error::None) {
                fail_(Error::Disconnected, disconnect_detail_(err));
                return false;
            }

            ++rx_frames_;
            if (state_ == session::State::Subscribing) {
                set_state_(session::State::Streaming);
            }
            handle_frame_(rx_buffer_, out);
            return true;
        }
    }

    // -------------------------------------------------------------------------
    // run()
    //
    // Open the session if needed, then deliver every message to
    // `handler(const schema::Message&)` until the session ends.
    // Returns the terminal failure (Error::None after cancel() / close()).
    // -------------------------------------------------------------------------
    template<class Handler>
    [[nodiscard]]
    inline Failure run(Handler&& handler) requires std::invocable<Handler&, const schema::Message&> {
        if (!session::is_active(state_)) {
            Failure f = open();
            if (!f.ok()) {
                return f;
            }
        }
        schema::Message msg;
        while (next(msg)) {
            handler(static_cast<const schema::Message&>(msg));
        }
        return last_failure_;
    }

    // Request cancellation. Safe from any thread (e.g. a signal handler's
    // relay) and idempotent.
    inline void cancel() noexcept {
        cancel_requested_.store(true, std::memory_order_release);
    }

    // Close the session from the owning thread. Idempotent.
    // The reconciliation cache is discarded.
    inline void close() noexcept {
        const session::State state = state_;
        if (state == session::State::Closing) {
            return;
        }
        if (session::is_active(state) || state == session::State::Connecting) {
            set_state_(session::State::Closing);
            if (ws_) {
                ws_->close();
            }
            set_state_(session::State::Closed);
            FW_INFO("[SESSION] Closed after " << rx_frames_ << " frame(s)");
        } else if (ws_) {
            ws_->close();
        }
        cache_.clear();
    }

    // -------------------------------------------------------------------------
    // Observability
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline session::State state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline const Failure& last_failure() const noexcept {
        return last_failure_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_frames() const noexcept {
        return rx_frames_;
    }

    [[nodiscard]]
    inline std::uint64_t unrecognized_frames() const noexcept {
        return unrecognized_frames_;
    }

    [[nodiscard]]
    inline const cache_t& cache() const noexcept {
        return cache_;
    }

    [[nodiscard]]
    inline const Entity* find(std::string_view id) const {
        auto it = cache_.find(std::string(id));
        return it == cache_.end() ? nullptr : &it->second;
    }

    [[nodiscard]]
    inline const session::Config& config() const noexcept {
        return cfg_;
    }

    // Derived subscription endpoint (empty before the first open())
    [[nodiscard]]
    inline const std::string& endpoint() const noexcept {
        return endpoint_;
    }

#ifdef FW_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }
#endif // FW_UNIT_TEST

private:
    session::Config cfg_;
    std::string endpoint_;

    std::unique_ptr<WS> ws_;
    parser::Router router_;
    std::string rx_buffer_;

    session::State state_{session::State::Disconnected};
    Failure last_failure_{};
    std::atomic<bool> cancel_requested_{false};

    cache_t cache_;
    std::uint64_t rx_frames_{0};
    std::uint64_t unrecognized_frames_{0};

private:
    // State mutator with logging
    inline void set_state_(session::State new_state) noexcept {
        FW_TRACE("[SESSION] State: " << session::to_string(state_) << " -> " << session::to_string(new_state));
        state_ = new_state;
    }

    inline void create_transport_() {
        // If exists, ensure old transport is torn down deterministically
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        ws_ = std::make_unique<WS>();
    }

    inline Failure fail_(Error code, std::string detail) {
        last_failure_ = Failure::make(code, std::move(detail));
        FW_ERROR("[SESSION] " << last_failure_);
        if (ws_) {
            ws_->close();
        }
        set_state_(session::State::Failed);
        return last_failure_;
    }

    [[nodiscard]]
    inline std::string disconnect_detail_(transport::Error err) const {
        std::string detail = "peer disconnected from " + endpoint_;
        if (rx_frames_ == 0) {
            detail += " before sending any frame";
        } else {
            detail += " after " + std::to_string(rx_frames_) + " frame(s) of normal streaming";
        }
        detail += " (" + std::string(transport::to_string(err)) + ")";
        return detail;
    }

    // Classify, then reconcile into the cache before the caller sees it
    inline void handle_frame_(std::string_view raw, schema::Message& out) {
        const parser::Result r = router_.parse_and_route(raw, out);
        FW_TRACE("[SESSION] Frame #" << rx_frames_ << " classified as "
                 << schema::to_string(schema::kind_of(out)) << " (" << parser::to_string(r) << ")");
        std::visit([this](const auto& msg) {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, schema::Unrecognized>) {
                ++unrecognized_frames_;
            } else {
                cache_.insert_or_assign(msg.entity.id, msg.entity);
            }
        }, out);
    }
};

} // namespace flux
} // namespace protocol
} // namespace fluxwire::core
