#include "fluxwire/core/transport/beast/websocket.hpp"

#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include "fluxwire/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace fluxwire::core {
namespace transport {
namespace beast {

namespace net = boost::asio;
namespace bst = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using steady_clock = std::chrono::steady_clock;

namespace {

// Completion state shared with the handler. Handlers only ever touch this
// block, never the transport, so a late completion is always harmless.
struct OpState {
    bool done{false};
    bst::error_code ec{};
};

struct ResolveState {
    bool done{false};
    bst::error_code ec{};
    tcp::resolver::results_type results{};
};

struct WriteState {
    bool done{false};
    bst::error_code ec{};
    std::string payload;
};

} // namespace

struct WebSocket::ReadState {
    bool done{false};
    bst::error_code ec{};
    bst::flat_buffer buffer{};
};


WebSocket::WebSocket() = default;

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path,
                         std::chrono::milliseconds timeout) noexcept {
    if (ws_) {
        FW_WARN("[WS] connect() called on an active transport, dropping previous connection");
        close();
    }
    const auto deadline = steady_clock::now() + timeout;
    const std::string authority = transport::host_header(host, port);

    FW_DEBUG("[WS] Connecting to ws://" << authority << path << " (timeout " << timeout.count() << " ms)");

    if (ioc_.stopped()) {
        ioc_.restart();
    }
    ws_ = std::make_unique<ws_stream_t>(ioc_);

    // 1) Resolve
    tcp::resolver resolver(ioc_);
    auto resolved = std::make_shared<ResolveState>();
    resolver.async_resolve(host, port,
        [resolved](const bst::error_code& ec, tcp::resolver::results_type results) {
            resolved->ec = ec;
            resolved->results = std::move(results);
            resolved->done = true;
        });
    Error err = drive_(resolved, deadline);
    if (err != Error::None) {
        resolver.cancel();
        FW_ERROR("[WS] Resolving " << host << " did not complete in time");
        teardown_();
        return err;
    }
    if (resolved->ec) {
        FW_ERROR("[WS] Failed to resolve " << host << ":" << port << " (" << resolved->ec.message() << ")");
        teardown_();
        return Error::ConnectionFailed;
    }

    // 2) TCP connect, bounded by what is left of the deadline
    auto& lowest = bst::get_lowest_layer(*ws_);
    lowest.expires_at(deadline);
    auto connected = std::make_shared<OpState>();
    lowest.async_connect(resolved->results,
        [connected](const bst::error_code& ec, const tcp::endpoint&) {
            connected->ec = ec;
            connected->done = true;
        });
    err = drive_(connected, deadline);
    if (err == Error::None && connected->ec == bst::error::timeout) {
        err = Error::Timeout;
    }
    if (err != Error::None) {
        FW_ERROR("[WS] TCP connect to " << authority << " timed out");
        teardown_();
        return err;
    }
    if (connected->ec) {
        FW_ERROR("[WS] TCP connect to " << authority << " failed (" << connected->ec.message() << ")");
        teardown_();
        return Error::ConnectionFailed;
    }

    // 3) WebSocket upgrade, still under the same deadline
    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(bst::http::field::user_agent, "fluxwire/1.0");
    }));
    auto upgraded = std::make_shared<OpState>();
    ws_->async_handshake(authority, path,
        [upgraded](const bst::error_code& ec) {
            upgraded->ec = ec;
            upgraded->done = true;
        });
    err = drive_(upgraded, deadline);
    if (err == Error::None && upgraded->ec == bst::error::timeout) {
        err = Error::Timeout;
    }
    if (err != Error::None) {
        FW_ERROR("[WS] WebSocket handshake with " << authority << " timed out");
        teardown_();
        return err;
    }
    if (upgraded->ec) {
        FW_ERROR("[WS] WebSocket handshake with " << authority << " failed (" << upgraded->ec.message() << ")");
        teardown_();
        return Error::HandshakeFailed;
    }

    // The stream deadline only covered the opening sequence
    lowest.expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(bst::role_type::client));
    ws_->text(true);
    open_ = true;

    FW_INFO("[WS] Connected to ws://" << authority << path);
    return Error::None;
}

Error WebSocket::send(std::string_view msg, std::chrono::milliseconds timeout) noexcept {
    if (!open_) {
        FW_ERROR("[WS] send() called on unconnected WebSocket");
        return Error::InvalidState;
    }
    FW_TRACE("[WS] Sending message ... (size " << msg.size() << ")");

    auto sent = std::make_shared<WriteState>();
    sent->payload.assign(msg.data(), msg.size());
    ws_->async_write(net::buffer(sent->payload),
        [sent](const bst::error_code& ec, std::size_t) {
            sent->ec = ec;
            sent->done = true;
        });
    const Error err = drive_(sent, steady_clock::now() + timeout);
    if (err != Error::None) {
        // A half-written frame cannot be taken back
        FW_ERROR("[WS] send() did not complete within " << timeout.count() << " ms");
        teardown_();
        return err;
    }
    if (sent->ec) {
        FW_ERROR("[WS] send() failed (" << sent->ec.message() << ")");
        const Error mapped = classify_read_error_(sent->ec);
        teardown_();
        return mapped;
    }
    return Error::None;
}

Error WebSocket::receive(std::string& out, std::chrono::milliseconds timeout) noexcept {
    if (!open_) {
        return Error::InvalidState;
    }
    if (!read_) {
        read_ = std::make_shared<ReadState>();
        auto state = read_;
        ws_->async_read(state->buffer,
            [state](const bst::error_code& ec, std::size_t) {
                state->ec = ec;
                state->done = true;
            });
    }

    const Error err = drive_(read_, steady_clock::now() + timeout);
    if (err == Error::Timeout) {
        return Error::Timeout;  // read stays pending for the next call
    }
    if (err != Error::None) {
        teardown_();
        return err;
    }

    std::shared_ptr<ReadState> state = std::move(read_);
    if (state->ec) {
        const Error mapped = classify_read_error_(state->ec);
        if (mapped == Error::RemoteClosed) {
            FW_INFO("[WS] Connection closed by peer (" << state->ec.message() << ")");
        } else {
            FW_ERROR("[WS] receive() failed (" << state->ec.message() << ")");
        }
        teardown_();
        return mapped;
    }

    out = bst::buffers_to_string(state->buffer.data());
    FW_TRACE("[WS] Received message (size " << out.size() << ")");
    return Error::None;
}

void WebSocket::close() noexcept {
    if (!ws_) {
        return;
    }
    if (open_) {
        open_ = false;
        FW_TRACE("[WS] Closing WebSocket ...");
        auto closed = std::make_shared<OpState>();
        ws_->async_close(websocket::close_code::normal,
            [closed](const bst::error_code& ec) {
                closed->ec = ec;
                closed->done = true;
            });
        const Error err = drive_(closed, steady_clock::now() + CLOSE_TIMEOUT);
        if (err != Error::None) {
            FW_WARN("[WS] Close handshake not completed within "
                    << std::chrono::duration_cast<std::chrono::milliseconds>(CLOSE_TIMEOUT).count()
                    << " ms, dropping connection");
        } else if (closed->ec) {
            FW_DEBUG("[WS] Close handshake ended with: " << closed->ec.message());
        }
    }
    teardown_();
    FW_TRACE("[WS] WebSocket closed.");
}

bool WebSocket::is_open() const noexcept {
    return open_ && ws_ && ws_->is_open();
}

template<class State>
Error WebSocket::drive_(const std::shared_ptr<State>& state, steady_clock::time_point deadline) noexcept {
    while (!state->done) {
        if (steady_clock::now() >= deadline) {
            return Error::Timeout;
        }
        if (ioc_.stopped()) {
            ioc_.restart();
        }
        const std::size_t ran = ioc_.run_one_until(deadline);
        if (ran == 0 && ioc_.stopped() && !state->done) {
            // No outstanding work: the operation can never complete
            return Error::TransportFailure;
        }
    }
    return Error::None;
}

void WebSocket::teardown_() noexcept {
    open_ = false;
    if (ws_) {
        auto& lowest = bst::get_lowest_layer(*ws_);
        bst::error_code ignored;
        lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
        lowest.close();
    }
    drain_();
    read_.reset();
    ws_.reset();
}

void WebSocket::drain_() noexcept {
    // Aborted operations complete through posted handlers; run them before the
    // stream they belong to goes away.
    for (;;) {
        if (ioc_.stopped()) {
            ioc_.restart();
        }
        if (ioc_.poll() == 0) {
            break;
        }
    }
}

Error WebSocket::classify_read_error_(const bst::error_code& ec) noexcept {
    if (ec == websocket::error::closed ||
        ec == net::error::eof ||
        ec == net::error::connection_reset ||
        ec == net::error::connection_aborted ||
        ec == net::error::broken_pipe) {
        return Error::RemoteClosed;
    }
    if (ec == net::error::operation_aborted) {
        return Error::LocalShutdown;
    }
    if (ec == websocket::condition::protocol_violation) {
        return Error::ProtocolError;
    }
    return Error::TransportFailure;
}

} // namespace beast
} // namespace transport
} // namespace fluxwire::core
