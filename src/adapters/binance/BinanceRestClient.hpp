#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

// Public market-data REST endpoints for spot (api/v3), USDT-M (fapi/v1) and
// COIN-M (dapi/v1). Every call is a single HTTP request; pacing and retries
// belong to the caller's rate limiter.
class BinanceRestClient : public domain::contracts::ITradeHistory, public domain::contracts::ICandleHistory {
public:
    explicit BinanceRestClient(infra::http::HttpGet get = infra::http::default_http_get());

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

    static constexpr std::size_t kTradePageLimit = 1000;

private:
    struct Route {
        const char* host;
        const char* prefix;
        std::size_t maxKlines;
    };

    static Route route_(domain::MarketType market);
    infra::http::JsonResponse get_(const std::string& host, const std::string& target);

    infra::http::HttpGet get_impl_;
};

}  // namespace adapters::binance
