#include "infra/net/WsTransport.hpp"

#include <sstream>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace infra::net {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;

domain::FeedError make_error(const std::string& message,
                             domain::ErrorKind kind = domain::ErrorKind::TransientNetwork) {
    return domain::FeedError(kind, "WsTransport: " + message);
}

// A rejected upgrade carries the HTTP status of the venue's answer.
domain::ErrorKind classify_handshake(const beast::error_code& ec, unsigned status) {
    if (ec == websocket::error::upgrade_declined && status >= 400U) {
        return domain::classify_http_status(static_cast<int>(status));
    }
    return domain::ErrorKind::TransientNetwork;
}

}  // namespace

WsTransport::WsTransport(std::string userAgent)
    : userAgent_(std::move(userAgent)), sslCtx_(ssl::context::tls_client) {
    sslCtx_.set_default_verify_paths();
    sslCtx_.set_verify_mode(ssl::verify_peer);
}

WsTransport::~WsTransport() {
    close();
    if (ws_) {
        // Drain the cancelled read so its handler does not outlive the stream.
        ioc_.restart();
        ioc_.poll();
    }
}

void WsTransport::connect(const domain::StreamEndpoint& endpoint) {
    if (closed_.load(std::memory_order_acquire)) {
        throw make_error("connect after close");
    }
    host_ = endpoint.host;
    ws_ = std::make_unique<WsStream>(ioc_, sslCtx_);

    ws_->next_layer().set_verify_mode(ssl::verify_peer);
    ws_->next_layer().set_verify_callback(ssl::rfc2818_verification(endpoint.host));
    if (!::SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), endpoint.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "failed to set SNI host name to '" << endpoint.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw make_error(oss.str());
    }

    beast::error_code ec;
    asio::ip::tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
    if (ec) {
        throw make_error("DNS resolve failed for " + endpoint.host + ": " + ec.message());
    }

    beast::get_lowest_layer(*ws_).connect(results, ec);
    if (ec) {
        throw make_error("connect to " + endpoint.host + ":" + endpoint.port + " failed: " + ec.message());
    }

    ws_->next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw make_error("TLS handshake failed: " + ec.message());
    }

    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->set_option(websocket::stream_base::decorator([agent = userAgent_](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, agent);
    }));

    websocket::response_type response;
    ws_->handshake(response, endpoint.host + ":" + endpoint.port, endpoint.target, ec);
    if (ec) {
        const auto status = static_cast<unsigned>(response.result_int());
        throw make_error("WebSocket handshake failed (HTTP " + std::to_string(status) + "): " + ec.message(),
                         classify_handshake(ec, status));
    }

    LOG_INFO("WsTransport connected to " << endpoint.host << ":" << endpoint.port << endpoint.target);
}

void WsTransport::send(const std::string& frame) {
    if (!ws_ || closed_.load(std::memory_order_acquire)) {
        throw make_error("send on a closed connection");
    }
    beast::error_code ec;
    ws_->text(true);
    ws_->write(asio::buffer(frame), ec);
    if (ec) {
        throw make_error("write failed: " + ec.message());
    }
}

domain::ReadStatus WsTransport::read(std::string& out, std::chrono::milliseconds timeout) {
    if (!ws_ || closed_.load(std::memory_order_acquire)) {
        return domain::ReadStatus::Closed;
    }

    if (!pending_) {
        pending_ = std::make_shared<PendingRead>();
        buffer_.clear();
        ws_->async_read(buffer_, [pending = pending_](const beast::error_code& ec, std::size_t) {
            pending->done = true;
            pending->ec = ec;
        });
    }

    ioc_.restart();
    ioc_.run_for(timeout);

    if (!pending_->done) {
        return domain::ReadStatus::Timeout;
    }

    const auto ec = pending_->ec;
    pending_.reset();

    if (ec == websocket::error::closed || closed_.load(std::memory_order_acquire)) {
        return domain::ReadStatus::Closed;
    }
    if (ec) {
        throw make_error("read failed: " + ec.message());
    }

    out = beast::buffers_to_string(buffer_.cdata());
    buffer_.consume(buffer_.size());
    return domain::ReadStatus::Message;
}

void WsTransport::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (!ws_) {
        return;
    }
    // Runs on whichever thread next drives the io_context; closing the socket
    // completes any pending read with an error.
    asio::post(ioc_, [ws = ws_.get()]() {
        beast::error_code ec;
        beast::get_lowest_layer(*ws).socket().close(ec);
    });
}

}  // namespace infra::net
