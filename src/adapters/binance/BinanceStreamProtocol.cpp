#include "adapters/binance/BinanceStreamProtocol.hpp"

#include <algorithm>
#include <cctype>

#include <boost/json.hpp>

#include "adapters/json/JsonUtil.hpp"
#include "common/Config.hpp"
#include "domain/Errors.hpp"

namespace adapters::binance {
namespace {

constexpr std::string_view kWho = "BinanceStreamProtocol";

domain::StreamError make_stream_error(const boost::json::value& code, std::string message) {
    domain::StreamError error;
    error.code = json::to_int64(code);
    error.message = std::move(message);
    // -2014/-2015 are API-key rejections; -1003 is the request-weight ban.
    if (error.code && (*error.code == -2014 || *error.code == -2015)) {
        error.kind = domain::ErrorKind::Authentication;
    } else if ((error.code && *error.code == -1003) || domain::looks_like_throttle(error.message)) {
        error.kind = domain::ErrorKind::RateLimited;
    } else {
        error.kind = domain::ErrorKind::Protocol;
    }
    return error;
}

domain::Trade parse_agg_trade(const boost::json::object& obj, domain::MarketType market) {
    domain::Trade trade;
    trade.venue = BinanceStreamProtocol::kVenue;
    trade.symbol = json::require_string(obj, "s", kWho);
    trade.market = market;
    trade.price = json::require_double(obj, "p", kWho);
    trade.size = json::require_double(obj, "q", kWho);
    trade.timestamp = json::require_int64(obj, "T", kWho);
    trade.tradeId = std::to_string(json::require_int64(obj, "a", kWho));

    const auto* maker = obj.if_contains("m");
    if (maker == nullptr || !maker->is_bool()) {
        throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": aggTrade missing 'm'");
    }
    // Buyer is the maker, so the aggressor sold.
    trade.side = maker->as_bool() ? domain::Side::Sell : domain::Side::Buy;
    return trade;
}

}  // namespace

domain::StreamEndpoint BinanceStreamProtocol::endpoint(domain::MarketType market) const {
    switch (market) {
    case domain::MarketType::Spot:
        return {"stream.binance.com", "9443", "/ws"};
    case domain::MarketType::UsdtFutures:
        return {"fstream.binance.com", "443", "/ws"};
    case domain::MarketType::CoinFutures:
        return {"dstream.binance.com", "443", "/ws"};
    case domain::MarketType::UsdcFutures:
        break;
    }
    throw mdi::common::ConfigurationError("binance has no stream for market " +
                                          std::string(domain::to_string(market)));
}

std::string BinanceStreamProtocol::stream_name(const domain::Symbol& symbol) {
    std::string lower = symbol;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower + "@aggTrade";
}

std::string BinanceStreamProtocol::subscribe_frame(const std::vector<domain::Symbol>& symbols,
                                                   domain::MarketType /*market*/,
                                                   std::uint64_t requestId) const {
    boost::json::array params;
    for (const auto& symbol : symbols) {
        params.emplace_back(stream_name(symbol));
    }
    boost::json::object frame;
    frame["method"] = "SUBSCRIBE";
    frame["params"] = std::move(params);
    frame["id"] = requestId;
    return boost::json::serialize(frame);
}

std::optional<domain::StreamMessage> BinanceStreamProtocol::parse(std::string_view frame,
                                                                  domain::MarketType market) const {
    const auto root = json::parse(frame, kWho);
    if (!root.is_object()) {
        throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": frame is not an object");
    }
    const auto* outer = &root.as_object();

    // Combined streams wrap the event as {"stream": ..., "data": {...}}.
    if (const auto* data = outer->if_contains("data"); data != nullptr && outer->contains("stream")) {
        if (!data->is_object()) {
            throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": 'data' is not an object");
        }
        outer = &data->as_object();
    }
    const auto& obj = *outer;

    if (const auto* error = obj.if_contains("error"); error != nullptr && error->is_object()) {
        const auto& err = error->as_object();
        const auto* code = err.if_contains("code");
        return domain::StreamMessage{make_stream_error(code ? *code : boost::json::value{},
                                                       json::optional_string(err, "msg").value_or("error"))};
    }
    if (obj.contains("code") && obj.contains("msg")) {
        return domain::StreamMessage{make_stream_error(obj.at("code"), json::optional_string(obj, "msg").value_or(""))};
    }

    if (obj.contains("result") && obj.contains("id")) {
        if (!obj.at("result").is_null()) {
            // Replies to LIST_SUBSCRIPTIONS and similar requests.
            return std::nullopt;
        }
        return domain::StreamMessage{domain::SubscribeAck{"id=" + boost::json::serialize(obj.at("id"))}};
    }

    const auto event = json::optional_string(obj, "e");
    if (!event) {
        throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": frame has no event type");
    }
    if (*event == "aggTrade") {
        return domain::StreamMessage{domain::TradeUpdate{{parse_agg_trade(obj, market)}}};
    }
    if (*event == "depthUpdate") {
        domain::OrderbookUpdate update;
        update.symbol = json::require_string(obj, "s", kWho);
        update.timestamp = json::require_int64(obj, "E", kWho);
        return domain::StreamMessage{std::move(update)};
    }
    throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": unsupported event '" + *event + "'");
}

}  // namespace adapters::binance
