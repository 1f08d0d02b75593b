#include "adapters/bitget/BitgetRestClient.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "adapters/bitget/BitgetStreamProtocol.hpp"
#include "adapters/json/JsonUtil.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace adapters::bitget {
namespace {

constexpr std::string_view kWho = "BitgetRestClient";

bool is_spot(domain::MarketType market) {
    return market == domain::MarketType::Spot;
}

}  // namespace

BitgetRestClient::BitgetRestClient(infra::http::HttpGet get) : get_impl_(std::move(get)) {
    if (!get_impl_) {
        throw std::invalid_argument("BitgetRestClient requires an HTTP transport");
    }
}

std::string BitgetRestClient::product_type(domain::MarketType market) {
    switch (market) {
    case domain::MarketType::Spot:
        return {};
    case domain::MarketType::UsdtFutures:
        return "USDT-FUTURES";
    case domain::MarketType::CoinFutures:
        return "COIN-FUTURES";
    case domain::MarketType::UsdcFutures:
        return "USDC-FUTURES";
    }
    return {};
}

std::string BitgetRestClient::granularity(const std::string& interval, domain::MarketType market) {
    if (!domain::interval_seconds(interval)) {
        throw mdi::common::ConfigurationError("Unsupported candle interval: " + interval);
    }
    if (is_spot(market)) {
        if (interval == "1d") {
            return "1day";
        }
        if (interval.back() == 'm') {
            return interval.substr(0, interval.size() - 1) + "min";
        }
        return interval;
    }
    if (interval.back() == 'h' || interval.back() == 'd') {
        std::string upper = interval;
        upper.back() = static_cast<char>(upper.back() - 'a' + 'A');
        return upper;
    }
    return interval;
}

boost::json::array BitgetRestClient::get_data_(const std::string& target) {
    LOG_DEBUG("Bitget REST GET " << kHost << target);
    const auto response = get_impl_(kHost, target);
    infra::http::raise_for_status(response);

    const auto root = json::parse(response.body, kWho);
    if (!root.is_object()) {
        throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": response is not an object");
    }
    const auto& obj = root.as_object();
    const auto code = json::optional_string(obj, "code").value_or("");
    if (code != "00000") {
        const auto msg = json::optional_string(obj, "msg").value_or("");
        const auto kind = (code == "429" || domain::looks_like_throttle(msg)) ? domain::ErrorKind::RateLimited
                                                                             : domain::ErrorKind::Protocol;
        throw domain::FeedError(kind, std::string(kWho) + ": " + target + " returned code " + code + ": " + msg);
    }
    const auto* data = obj.if_contains("data");
    if (data == nullptr || data->is_null()) {
        return {};
    }
    if (!data->is_array()) {
        throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": 'data' is not an array");
    }
    return data->as_array();
}

domain::contracts::TradePage BitgetRestClient::fetch_trades(const domain::Symbol& symbol,
                                                            domain::MarketType market,
                                                            domain::TimestampMs startMs,
                                                            domain::TimestampMs endMs,
                                                            const std::optional<std::string>& after) {
    domain::contracts::TradePage page;
    if (symbol.empty() || endMs <= startMs) {
        return page;
    }

    std::ostringstream target;
    if (is_spot(market)) {
        target << "/api/v2/spot/market/fills-history?symbol=" << symbol;
    } else {
        target << "/api/v2/mix/market/fills-history?symbol=" << symbol << "&productType=" << product_type(market);
    }
    target << "&startTime=" << startMs << "&endTime=" << (endMs - 1) << "&limit=" << kFillsPageLimit;
    // Newest first; older rows continue with idLessThan.
    if (after) {
        target << "&idLessThan=" << *after;
    }

    const auto rows = get_data_(target.str());
    std::string oldestId;
    for (const auto& rowValue : rows) {
        if (!rowValue.is_object()) {
            throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": fill row is not an object");
        }
        const auto& row = rowValue.as_object();
        domain::Trade trade;
        trade.venue = BitgetStreamProtocol::kVenue;
        trade.symbol = symbol;
        trade.market = market;
        trade.price = json::require_double(row, "price", kWho);
        trade.size = json::require_double(row, "size", kWho);
        trade.timestamp = json::require_int64(row, "ts", kWho);
        trade.tradeId = json::require_string(row, "tradeId", kWho);
        const auto side = domain::side_from_string(json::require_string(row, "side", kWho));
        if (!side) {
            throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": unknown fill side");
        }
        trade.side = *side;
        oldestId = trade.tradeId;
        if (trade.timestamp >= startMs && trade.timestamp < endMs) {
            page.trades.push_back(std::move(trade));
        }
    }
    if (rows.size() >= kFillsPageLimit) {
        page.next = std::move(oldestId);
    }

    std::stable_sort(page.trades.begin(), page.trades.end(),
                     [](const domain::Trade& a, const domain::Trade& b) { return a.timestamp < b.timestamp; });
    return page;
}

domain::contracts::CandlePage BitgetRestClient::fetch_candles(const domain::Symbol& symbol,
                                                              domain::MarketType market,
                                                              const std::string& interval,
                                                              domain::TimestampMs endMs,
                                                              std::size_t limit) {
    domain::contracts::CandlePage page;
    if (symbol.empty() || limit == 0) {
        return page;
    }
    const auto seconds = *domain::interval_seconds(interval);
    const auto gran = granularity(interval, market);

    std::ostringstream target;
    if (is_spot(market)) {
        target << "/api/v2/spot/market/candles?symbol=" << symbol;
    } else {
        target << "/api/v2/mix/market/candles?symbol=" << symbol << "&productType=" << product_type(market);
    }
    target << "&granularity=" << gran << "&endTime=" << endMs << "&limit=" << std::min(limit, kMaxCandles);

    const auto rows = get_data_(target.str());
    const auto nowMs = domain::now_ms();
    for (const auto& rowValue : rows) {
        if (!rowValue.is_array() || rowValue.as_array().size() < 6) {
            throw domain::FeedError(domain::ErrorKind::Protocol, std::string(kWho) + ": malformed candle row");
        }
        const auto& row = rowValue.as_array();
        domain::Bar bar;
        bar.venue = BitgetStreamProtocol::kVenue;
        bar.symbol = symbol;
        bar.market = market;
        bar.resolution = seconds;
        bar.start = json::require_int64(row.at(0), "ts", kWho);
        bar.end = bar.start + seconds * 1000;
        if (*bar.end > nowMs) {
            continue;
        }
        bar.open = json::require_double(row.at(1), "open", kWho);
        bar.high = json::require_double(row.at(2), "high", kWho);
        bar.low = json::require_double(row.at(3), "low", kWho);
        bar.close = json::require_double(row.at(4), "close", kWho);
        bar.volume = json::require_double(row.at(5), "baseVolume", kWho);
        bar.lastUpdate = *bar.end - 1;
        page.bars.push_back(std::move(bar));
    }
    std::sort(page.bars.begin(), page.bars.end(),
              [](const domain::Bar& a, const domain::Bar& b) { return a.start < b.start; });
    return page;
}

}  // namespace adapters::bitget
