#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <string>
#include <vector>

#include "adapters/duckdb/DuckMarketStore.hpp"
#include "adapters/duckdb/DuckStore.hpp"

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << "\n";
        ++failures;
    }
}

domain::Bar makeBar(domain::TimestampMs start, double close) {
    domain::Bar bar;
    bar.venue = "binance";
    bar.symbol = "BTCUSDT";
    bar.market = domain::MarketType::Spot;
    bar.resolution = 60;
    bar.start = start;
    bar.end = start + 60'000;
    bar.open = bar.high = bar.low = bar.close = close;
    bar.volume = 1.0;
    bar.tradeCount = 1;
    bar.lastUpdate = start + 59'000;
    return bar;
}

}  // namespace

int main() {
    const std::filesystem::path dir = "/tmp/mdi_duck_store_test";
    std::filesystem::remove_all(dir);

    try {
        adapters::duckdb::DuckStore store((dir / "market.duckdb").string());
        store.migrate();
        store.migrate();
        expect(std::filesystem::exists(dir), "parent directory created");

        adapters::duckdb::DuckMarketStore market(store);

        domain::Trade trade;
        trade.venue = "binance";
        trade.symbol = "BTCUSDT";
        trade.market = domain::MarketType::Spot;
        trade.tradeId = "1";
        trade.price = 100.0;
        trade.size = 0.5;
        trade.side = domain::Side::Sell;
        trade.timestamp = 1'000;
        expect(market.append_trades({trade, trade}), "trade batch written");

        expect(market.append_bars({makeBar(0, 1.0), makeBar(60'000, 2.0)}), "bar batch written");
        expect(market.append_bar(makeBar(60'000, 3.0)), "same bar key replaced");
        const auto count = market.count_bars("binance", "BTCUSDT", 60);
        expect(count && *count == 2, "bars keyed by start");

        std::vector<std::future<bool>> writers;
        for (int writer = 0; writer < 4; ++writer) {
            writers.push_back(std::async(std::launch::async, [&market, writer] {
                std::vector<domain::Bar> chunk;
                for (int i = 0; i < 50; ++i) {
                    auto bar = makeBar((writer * 50 + i) * 60'000LL, 1.0);
                    bar.symbol = "ETHUSDT";
                    chunk.push_back(bar);
                }
                return market.append_bars(chunk);
            }));
        }
        bool allWritten = true;
        for (auto& writer : writers) {
            allWritten = writer.get() && allWritten;
        }
        expect(allWritten, "concurrent batch writers succeed");
        const auto concurrent = market.count_bars("binance", "ETHUSDT", 60);
        expect(concurrent && *concurrent == 200, "every concurrent batch landed");

        expect(market.set("backfill:binance:BTCUSDT:spot", "{\"current\":1}"), "state written");
        const auto value = market.get("backfill:binance:BTCUSDT:spot");
        expect(value && *value == "{\"current\":1}", "state read back");
        expect(market.set("backfill:binance:BTCUSDT:spot", "{\"current\":2}"), "state overwritten");
        expect(market.get("backfill:binance:BTCUSDT:spot").value_or("") == "{\"current\":2}", "latest value wins");

        expect(market.set("lease", "held", std::chrono::seconds(0)), "expiring state written");
        expect(!market.get("lease"), "expired key reads as absent");
        expect(!market.get("missing"), "missing key absent");

        expect(market.remove("backfill:binance:BTCUSDT:spot"), "state removed");
        expect(!market.get("backfill:binance:BTCUSDT:spot"), "removed key absent");
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        ++failures;
    }

    std::filesystem::remove_all(dir);
    return failures == 0 ? 0 : 1;
}
