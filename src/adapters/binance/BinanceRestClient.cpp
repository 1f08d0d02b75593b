#include "adapters/binance/BinanceRestClient.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "adapters/binance/BinanceStreamProtocol.hpp"
#include "adapters/json/JsonUtil.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace adapters::binance {
namespace {

constexpr std::string_view kWho = "BinanceRestClient";

std::optional<int> parse_used_weight(const std::string& header) {
    if (header.empty()) {
        return std::nullopt;
    }
    try {
        return std::stoi(header);
    } catch (const std::exception&) {
        LOG_DEBUG("Binance REST ignoring malformed used-weight header '" << header << "'");
        return std::nullopt;
    }
}

const boost::json::array& expect_array(const boost::json::value& value, std::string_view what) {
    if (!value.is_array()) {
        throw domain::FeedError(domain::ErrorKind::Protocol,
                                std::string(kWho) + ": unexpected " + std::string(what) + " response (expected array)");
    }
    return value.as_array();
}

domain::Trade parse_agg_trade(const boost::json::value& row,
                              const domain::Symbol& symbol,
                              domain::MarketType market) {
    if (!row.is_object()) {
        throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": aggTrades row is not an object");
    }
    const auto& obj = row.as_object();
    domain::Trade trade;
    trade.venue = BinanceStreamProtocol::kVenue;
    trade.symbol = symbol;
    trade.market = market;
    trade.price = json::require_double(obj, "p", kWho);
    trade.size = json::require_double(obj, "q", kWho);
    trade.timestamp = json::require_int64(obj, "T", kWho);
    trade.tradeId = std::to_string(json::require_int64(obj, "a", kWho));
    const auto* maker = obj.if_contains("m");
    trade.side = (maker != nullptr && maker->is_bool() && maker->as_bool()) ? domain::Side::Sell : domain::Side::Buy;
    return trade;
}

}  // namespace

BinanceRestClient::BinanceRestClient(infra::http::HttpGet get) : get_impl_(std::move(get)) {
    if (!get_impl_) {
        throw std::invalid_argument("BinanceRestClient requires an HTTP transport");
    }
}

BinanceRestClient::Route BinanceRestClient::route_(domain::MarketType market) {
    switch (market) {
    case domain::MarketType::Spot:
        return {"api.binance.com", "/api/v3", 1000};
    case domain::MarketType::UsdtFutures:
        return {"fapi.binance.com", "/fapi/v1", 1500};
    case domain::MarketType::CoinFutures:
        return {"dapi.binance.com", "/dapi/v1", 1500};
    case domain::MarketType::UsdcFutures:
        break;
    }
    throw mdi::common::ConfigurationError("binance has no REST market " + std::string(domain::to_string(market)));
}

infra::http::JsonResponse BinanceRestClient::get_(const std::string& host, const std::string& target) {
    LOG_DEBUG("Binance REST GET " << host << target);
    auto response = get_impl_(host, target);
    infra::http::raise_for_status(response);
    return response;
}

domain::contracts::TradePage BinanceRestClient::fetch_trades(const domain::Symbol& symbol,
                                                             domain::MarketType market,
                                                             domain::TimestampMs startMs,
                                                             domain::TimestampMs endMs,
                                                             const std::optional<std::string>& after) {
    domain::contracts::TradePage page;
    if (symbol.empty() || endMs <= startMs) {
        return page;
    }
    const auto route = route_(market);

    // The time filter only applies to the first request; later ones continue
    // by aggregate id until they pass endMs.
    std::ostringstream target;
    target << route.prefix << "/aggTrades?symbol=" << symbol;
    if (after) {
        target << "&fromId=" << *after;
    } else {
        target << "&startTime=" << startMs << "&endTime=" << (endMs - 1);
    }
    target << "&limit=" << kTradePageLimit;

    const auto response = get_(route.host, target.str());
    page.usedWeight = parse_used_weight(response.used_weight_header);

    const auto body = json::parse(response.body, kWho);
    const auto& rows = expect_array(body, "aggTrades");

    std::int64_t lastId = 0;
    bool passedEnd = false;
    for (const auto& row : rows) {
        auto trade = parse_agg_trade(row, symbol, market);
        lastId = json::require_int64(row.as_object(), "a", kWho);
        if (trade.timestamp >= endMs) {
            passedEnd = true;
            break;
        }
        if (trade.timestamp >= startMs) {
            page.trades.push_back(std::move(trade));
        }
    }
    if (!passedEnd && rows.size() >= kTradePageLimit) {
        page.next = std::to_string(lastId + 1);
    }

    std::stable_sort(page.trades.begin(), page.trades.end(),
                     [](const domain::Trade& a, const domain::Trade& b) { return a.timestamp < b.timestamp; });
    return page;
}

domain::contracts::CandlePage BinanceRestClient::fetch_candles(const domain::Symbol& symbol,
                                                               domain::MarketType market,
                                                               const std::string& interval,
                                                               domain::TimestampMs endMs,
                                                               std::size_t limit) {
    domain::contracts::CandlePage page;
    if (symbol.empty() || limit == 0) {
        return page;
    }
    const auto seconds = domain::interval_seconds(interval);
    if (!seconds) {
        throw mdi::common::ConfigurationError("Unsupported candle interval: " + interval);
    }
    const auto route = route_(market);
    const auto requestLimit = std::min(limit, route.maxKlines);

    std::ostringstream target;
    target << route.prefix << "/klines?symbol=" << symbol << "&interval=" << interval << "&endTime=" << endMs
           << "&limit=" << requestLimit;
    const auto response = get_(route.host, target.str());
    page.usedWeight = parse_used_weight(response.used_weight_header);

    const auto body = json::parse(response.body, kWho);
    const auto& rows = expect_array(body, "klines");
    const auto nowMs = domain::now_ms();
    for (const auto& rowValue : rows) {
        const auto& row = expect_array(rowValue, "kline row");
        if (row.size() < 7) {
            throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": incomplete kline row");
        }
        const auto closeMs = json::require_int64(row.at(6), "closeTime", kWho);
        if (closeMs >= nowMs) {
            // Still forming.
            continue;
        }
        domain::Bar bar;
        bar.venue = BinanceStreamProtocol::kVenue;
        bar.symbol = symbol;
        bar.market = market;
        bar.resolution = *seconds;
        bar.start = json::require_int64(row.at(0), "openTime", kWho);
        bar.end = bar.start + *seconds * 1000;
        bar.open = json::require_double(row.at(1), "open", kWho);
        bar.high = json::require_double(row.at(2), "high", kWho);
        bar.low = json::require_double(row.at(3), "low", kWho);
        bar.close = json::require_double(row.at(4), "close", kWho);
        bar.volume = json::require_double(row.at(5), "volume", kWho);
        if (row.size() > 8) {
            bar.tradeCount = static_cast<std::uint32_t>(json::to_int64(row.at(8)).value_or(0));
        }
        bar.lastUpdate = closeMs;
        page.bars.push_back(std::move(bar));
    }
    return page;
}

}  // namespace adapters::binance
