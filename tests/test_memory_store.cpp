#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

#include "adapters/memory/MemoryStore.hpp"

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << "\n";
        ++failures;
    }
}

domain::Trade makeTrade(int id) {
    domain::Trade trade;
    trade.venue = "binance";
    trade.symbol = "BTCUSDT";
    trade.market = domain::MarketType::Spot;
    trade.tradeId = std::to_string(id);
    trade.price = 100.0 + id;
    trade.size = 1.0;
    trade.timestamp = id * 1'000LL;
    return trade;
}

domain::Bar makeBar(std::int64_t resolution, domain::TimestampMs start, double close) {
    domain::Bar bar;
    bar.venue = "binance";
    bar.symbol = "BTCUSDT";
    bar.market = domain::MarketType::Spot;
    bar.resolution = resolution;
    bar.start = start;
    bar.end = start + resolution * 1000;
    bar.open = bar.high = bar.low = bar.close = close;
    return bar;
}

void testTradesCappedOldestFirst() {
    adapters::memory::MemoryStore store({}, 3);
    for (int id = 1; id <= 5; ++id) {
        expect(store.append_trade(makeTrade(id)), "trade accepted");
    }
    expect(store.trade_count() == 3, "only the newest trades kept");
    expect(store.dropped_trades() == 2, "evictions counted");
    const auto trades = store.trades();
    expect(!trades.empty() && trades.front().tradeId == "3" && trades.back().tradeId == "5", "oldest evicted first");
}

void testBarsKeyedByBucket() {
    adapters::memory::MemoryStore store;
    expect(store.append_bars({makeBar(60, 0, 1.0), makeBar(60, 60'000, 2.0), makeBar(300, 0, 3.0)}), "bars written");
    expect(store.append_bar(makeBar(60, 60'000, 4.0)), "same bucket rewritten");
    expect(store.bar_count() == 3, "one bar per bucket and resolution");

    auto other = makeBar(60, 0, 5.0);
    other.market = domain::MarketType::UsdtFutures;
    expect(store.append_bar(other), "other market written");
    expect(store.bar_count() == 4, "market is part of the key");

    bool replaced = false;
    for (const auto& bar : store.bars()) {
        if (bar.market == domain::MarketType::Spot && bar.resolution == 60 && bar.start == 60'000) {
            replaced = bar.close == 4.0;
        }
    }
    expect(replaced, "latest write wins");
}

void testStateExpiresOnTheInjectedClock() {
    domain::TimestampMs now = 10'000;
    adapters::memory::MemoryStore store([&now] { return now; });
    expect(store.set("lease", "held", std::chrono::seconds(5)), "lease written");
    expect(store.get("lease").value_or("") == "held", "lease live");
    now = 15'000;
    expect(!store.get("lease"), "lease expired");

    store.fail_state_writes(true);
    expect(!store.set("k", "v"), "state write failure reported");
}

}  // namespace

int main() {
    testTradesCappedOldestFirst();
    testBarsKeyedByBucket();
    testStateExpiresOnTheInjectedClock();
    return failures == 0 ? 0 : 1;
}
