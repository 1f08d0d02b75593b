#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "domain/StreamMessages.hpp"

namespace infra::net {

// TLS websocket connection driven from the calling thread. connect() and
// send() are synchronous; read() runs the io_context for at most the given
// timeout so the owner can interleave keep-alives and stop checks.
class WsTransport : public domain::IStreamTransport {
public:
    explicit WsTransport(std::string userAgent = "mdi-collector/1.0");
    ~WsTransport() override;

    void connect(const domain::StreamEndpoint& endpoint) override;
    void send(const std::string& frame) override;
    domain::ReadStatus read(std::string& out, std::chrono::milliseconds timeout) override;
    void close() noexcept override;

private:
    using WsStream = boost::beast::websocket::stream<boost::asio::ssl::stream<boost::beast::tcp_stream>>;

    struct PendingRead {
        bool done = false;
        boost::beast::error_code ec;
    };

    const std::string userAgent_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslCtx_;
    std::unique_ptr<WsStream> ws_;
    boost::beast::flat_buffer buffer_;
    std::shared_ptr<PendingRead> pending_;
    std::atomic<bool> closed_{false};
    std::string host_;
};

}  // namespace infra::net
