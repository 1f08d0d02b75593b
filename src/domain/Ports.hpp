#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.hpp"

namespace domain::contracts {

// Time-series sink for raw trades and closed bars. A false return means the
// write was lost; callers log it and escalate to health, never retry.
class IMarketSink {
public:
    virtual ~IMarketSink() = default;

    virtual bool append_trade(const Trade& trade) = 0;
    virtual bool append_bar(const Bar& bar) = 0;

    virtual bool append_trades(const std::vector<Trade>& trades) {
        bool ok = true;
        for (const auto& trade : trades) {
            ok = append_trade(trade) && ok;
        }
        return ok;
    }

    virtual bool append_bars(const std::vector<Bar>& bars) {
        bool ok = true;
        for (const auto& bar : bars) {
            ok = append_bar(bar) && ok;
        }
        return ok;
    }
};

class IStateStore {
public:
    virtual ~IStateStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool set(const std::string& key,
                     const std::string& value,
                     std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;
    virtual bool remove(const std::string& key) = 0;
};

struct TradePage {
    std::vector<Trade> trades;  // ascending by timestamp
    std::optional<int> usedWeight;
    std::optional<std::string> next;  // set while the window has more trades
};

struct CandlePage {
    std::vector<Bar> bars;  // ascending by start, all closed
    std::optional<int> usedWeight;
};

// Historical trades inside [startMs, endMs), one HTTP request per call. A
// page with `next` set is partial: call again with it as `after` to continue
// the same window. Failures are thrown as domain::FeedError.
class ITradeHistory {
public:
    virtual ~ITradeHistory() = default;

    virtual TradePage fetch_trades(const Symbol& symbol,
                                   MarketType market,
                                   TimestampMs startMs,
                                   TimestampMs endMs,
                                   const std::optional<std::string>& after) = 0;
};

// Up to `limit` candles whose open time is <= endMs, newest page first.
class ICandleHistory {
public:
    virtual ~ICandleHistory() = default;

    virtual CandlePage fetch_candles(const Symbol& symbol,
                                     MarketType market,
                                     const std::string& interval,
                                     TimestampMs endMs,
                                     std::size_t limit) = 0;
};

}  // namespace domain::contracts
