#include "adapters/bitget/BitgetStreamProtocol.hpp"

#include <boost/json.hpp>

#include "adapters/json/JsonUtil.hpp"
#include "domain/Errors.hpp"

namespace adapters::bitget {
namespace {

constexpr std::string_view kWho = "BitgetStreamProtocol";

[[noreturn]] void fail(const std::string& message) {
    throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": " + message);
}

domain::ErrorKind classify_error_code(std::optional<std::int64_t> code, const std::string& message) {
    if (code) {
        switch (*code) {
        case 30004:  // login required
        case 30005:  // login failed
        case 30011:
        case 30012:
        case 30013:
        case 30014:
        case 30015:  // key, passphrase, timestamp or signature rejected
            return domain::ErrorKind::Authentication;
        case 30006:
            return domain::ErrorKind::RateLimited;
        default:
            break;
        }
    }
    return domain::looks_like_throttle(message) ? domain::ErrorKind::RateLimited : domain::ErrorKind::Protocol;
}

domain::Trade parse_trade_row(const boost::json::value& rowValue,
                              const domain::Symbol& symbol,
                              domain::MarketType market) {
    if (!rowValue.is_array()) {
        fail("trade row is not an array");
    }
    const auto& row = rowValue.as_array();
    if (row.size() < 4) {
        fail("trade row has " + std::to_string(row.size()) + " fields");
    }
    domain::Trade trade;
    trade.venue = BitgetStreamProtocol::kVenue;
    trade.symbol = symbol;
    trade.market = market;
    trade.timestamp = json::require_int64(row.at(0), "ts", kWho);
    trade.price = json::require_double(row.at(1), "price", kWho);
    trade.size = json::require_double(row.at(2), "size", kWho);
    if (!row.at(3).is_string()) {
        fail("trade side is not a string");
    }
    const auto& sideText = row.at(3).as_string();
    const auto side = domain::side_from_string(std::string_view(sideText.data(), sideText.size()));
    if (!side) {
        fail("unknown trade side '" + std::string(sideText.data(), sideText.size()) + "'");
    }
    trade.side = *side;
    // The channel carries no trade id; five fields means the id is present.
    if (row.size() > 4) {
        if (auto id = json::to_int64(row.at(4))) {
            trade.tradeId = std::to_string(*id);
        } else if (row.at(4).is_string()) {
            trade.tradeId = std::string(row.at(4).as_string().c_str());
        }
    }
    return trade;
}

}  // namespace

MarketMapping market_mapping(domain::MarketType market) {
    switch (market) {
    case domain::MarketType::Spot:
        return {"/spot/v1/stream", "SP", "_SPBL"};
    case domain::MarketType::UsdtFutures:
        return {"/mix/v1/stream", "UMCBL", "_UMCBL"};
    case domain::MarketType::CoinFutures:
        return {"/mix/v1/stream", "DMCBL", "_DMCBL"};
    case domain::MarketType::UsdcFutures:
        return {"/mix/v1/stream", "CMCBL", "_CMCBL"};
    }
    return {"/spot/v1/stream", "SP", "_SPBL"};
}

domain::StreamEndpoint BitgetStreamProtocol::endpoint(domain::MarketType market) const {
    return {kHost, "443", market_mapping(market).target};
}

std::string BitgetStreamProtocol::inst_id(const domain::Symbol& symbol, domain::MarketType market) {
    return symbol + market_mapping(market).suffix;
}

domain::Symbol BitgetStreamProtocol::symbol_from_inst_id(std::string_view instId, domain::MarketType market) {
    const std::string_view suffix = market_mapping(market).suffix;
    if (instId.size() > suffix.size() && instId.substr(instId.size() - suffix.size()) == suffix) {
        instId.remove_suffix(suffix.size());
    }
    return domain::Symbol(instId);
}

std::string BitgetStreamProtocol::subscribe_frame(const std::vector<domain::Symbol>& symbols,
                                                  domain::MarketType market,
                                                  std::uint64_t /*requestId*/) const {
    const auto mapping = market_mapping(market);
    boost::json::array args;
    for (const auto& symbol : symbols) {
        boost::json::object arg;
        arg["instType"] = mapping.instType;
        arg["channel"] = "trade";
        arg["instId"] = inst_id(symbol, market);
        args.emplace_back(std::move(arg));
    }
    boost::json::object frame;
    frame["op"] = "subscribe";
    frame["args"] = std::move(args);
    return boost::json::serialize(frame);
}

std::optional<domain::StreamMessage> BitgetStreamProtocol::parse(std::string_view frame,
                                                                 domain::MarketType market) const {
    if (frame == "pong") {
        return std::nullopt;
    }

    const auto root = json::parse(frame, kWho);
    if (!root.is_object()) {
        fail("frame is not an object");
    }
    const auto& obj = root.as_object();

    if (const auto event = json::optional_string(obj, "event")) {
        if (*event == "subscribe") {
            std::string detail = "subscribe";
            if (const auto* arg = obj.if_contains("arg"); arg != nullptr && arg->is_object()) {
                detail += " " + json::optional_string(arg->as_object(), "instId").value_or("");
            }
            return domain::StreamMessage{domain::SubscribeAck{std::move(detail)}};
        }
        if (*event == "error") {
            domain::StreamError error;
            if (const auto* code = obj.if_contains("code")) {
                error.code = json::to_int64(*code);
            }
            error.message = json::optional_string(obj, "msg").value_or("error");
            error.kind = classify_error_code(error.code, error.message);
            return domain::StreamMessage{std::move(error)};
        }
        if (*event == "unsubscribe") {
            return std::nullopt;
        }
        fail("unsupported event '" + *event + "'");
    }

    const auto action = json::optional_string(obj, "action");
    const auto* argValue = obj.if_contains("arg");
    if (!action || argValue == nullptr || !argValue->is_object()) {
        fail("frame has neither event nor action");
    }
    const auto& arg = argValue->as_object();
    const auto channel = json::require_string(arg, "channel", kWho);
    const auto symbol = symbol_from_inst_id(json::require_string(arg, "instId", kWho), market);

    if (channel == "trade") {
        // Replayed on every subscribe and carries no trade ids.
        if (*action == "snapshot") {
            return std::nullopt;
        }
        const auto* data = obj.if_contains("data");
        if (data == nullptr || !data->is_array()) {
            fail("trade push without data array");
        }
        domain::TradeUpdate update;
        update.trades.reserve(data->as_array().size());
        for (const auto& row : data->as_array()) {
            update.trades.push_back(parse_trade_row(row, symbol, market));
        }
        return domain::StreamMessage{std::move(update)};
    }
    if (channel.rfind("books", 0) == 0) {
        domain::OrderbookUpdate update;
        update.symbol = symbol;
        if (const auto* ts = obj.if_contains("ts")) {
            update.timestamp = json::to_int64(*ts).value_or(0);
        }
        return domain::StreamMessage{std::move(update)};
    }
    fail("unsupported channel '" + channel + "'");
}

}  // namespace adapters::bitget
