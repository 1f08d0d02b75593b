#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <boost/json.hpp>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::bitget {

// v2 public market endpoints. Responses are wrapped as
// {"code":"00000","msg":...,"data":...}; any other code is an error.
class BitgetRestClient : public domain::contracts::ITradeHistory, public domain::contracts::ICandleHistory {
public:
    static constexpr const char* kHost = "api.bitget.com";
    static constexpr std::size_t kFillsPageLimit = 1000;
    static constexpr std::size_t kMaxCandles = 1000;

    explicit BitgetRestClient(infra::http::HttpGet get = infra::http::default_http_get());

    domain::contracts::TradePage fetch_trades(const domain::Symbol& symbol,
                                              domain::MarketType market,
                                              domain::TimestampMs startMs,
                                              domain::TimestampMs endMs,
                                              const std::optional<std::string>& after) override;

    domain::contracts::CandlePage fetch_candles(const domain::Symbol& symbol,
                                                domain::MarketType market,
                                                const std::string& interval,
                                                domain::TimestampMs endMs,
                                                std::size_t limit) override;

    // USDT-FUTURES, COIN-FUTURES or USDC-FUTURES; empty for spot.
    static std::string product_type(domain::MarketType market);
    // Spot and mix spell candle granularities differently.
    static std::string granularity(const std::string& interval, domain::MarketType market);

private:
    boost::json::array get_data_(const std::string& target);

    infra::http::HttpGet get_impl_;
};

}  // namespace adapters::bitget
