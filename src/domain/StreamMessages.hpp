#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/Types.hpp"

namespace domain {

struct SubscribeAck {
    std::string detail;
};

struct StreamError {
    std::optional<std::int64_t> code;
    std::string message;
    ErrorKind kind{ErrorKind::Protocol};
};

struct TradeUpdate {
    std::vector<Trade> trades;
};

struct OrderbookUpdate {
    Symbol symbol;
    TimestampMs timestamp{0};
};

using StreamMessage = std::variant<SubscribeAck, StreamError, TradeUpdate, OrderbookUpdate>;

struct StreamEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

// Venue wire codec: endpoints, subscribe frames and inbound frame parsing.
class IStreamProtocol {
public:
    virtual ~IStreamProtocol() = default;

    virtual std::string venue() const = 0;
    virtual StreamEndpoint endpoint(MarketType market) const = 0;
    virtual std::string subscribe_frame(const std::vector<Symbol>& symbols,
                                        MarketType market,
                                        std::uint64_t requestId) const = 0;

    // std::nullopt for keep-alive replies. Throws FeedError(Protocol) on
    // malformed or unrecognised frames.
    virtual std::optional<StreamMessage> parse(std::string_view frame, MarketType market) const = 0;

    // Application-level ping the venue expects, if any.
    virtual std::optional<std::string> keepalive_frame() const { return std::nullopt; }
    virtual std::chrono::seconds keepalive_interval() const { return std::chrono::seconds{30}; }
};

enum class ReadStatus {
    Message,
    Timeout,
    Closed,
};

// One streaming connection. connect/send/read are called from the owning
// worker only; close() may be called from any thread to unblock a read.
class IStreamTransport {
public:
    virtual ~IStreamTransport() = default;

    virtual void connect(const StreamEndpoint& endpoint) = 0;
    virtual void send(const std::string& frame) = 0;
    virtual ReadStatus read(std::string& out, std::chrono::milliseconds timeout) = 0;
    virtual void close() noexcept = 0;
};

}  // namespace domain
