#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/json.hpp>

#include "adapters/binance/BinanceStreamProtocol.hpp"
#include "adapters/memory/MemoryStore.hpp"
#include "app/Collector.hpp"
#include "common/Config.hpp"
#include "common/Metrics.hpp"

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << "\n";
        ++failures;
    }
}

// Hands out its frames, then idles until closed.
class IdleTransport : public domain::IStreamTransport {
public:
    explicit IdleTransport(std::deque<std::string> frames) : frames_(std::move(frames)) {}

    void connect(const domain::StreamEndpoint&) override {}
    void send(const std::string&) override {}

    domain::ReadStatus read(std::string& out, std::chrono::milliseconds timeout) override {
        if (closed_.load()) {
            return domain::ReadStatus::Closed;
        }
        if (!frames_.empty()) {
            out = frames_.front();
            frames_.pop_front();
            return domain::ReadStatus::Message;
        }
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(10)));
        return closed_.load() ? domain::ReadStatus::Closed : domain::ReadStatus::Timeout;
    }

    void close() noexcept override { closed_.store(true); }

private:
    std::deque<std::string> frames_;
    std::atomic<bool> closed_{false};
};

class EmptyTradeHistory : public domain::contracts::ITradeHistory {
public:
    domain::contracts::TradePage fetch_trades(const domain::Symbol&,
                                              domain::MarketType,
                                              domain::TimestampMs,
                                              domain::TimestampMs,
                                              const std::optional<std::string>&) override {
        ++calls;
        return {};
    }

    std::atomic<int> calls{0};
};

struct Services {
    app::HealthRegistry health;
    app::RateLimiterRegistry limiters;
    mdi::common::metrics::Registry metrics;
    adapters::memory::MemoryStore store;

    app::CollectorServices view() { return app::CollectorServices{health, limiters, metrics, store, store}; }
};

app::StreamClient::TransportFactory factoryWith(std::deque<std::string> frames) {
    return [frames]() -> std::unique_ptr<domain::IStreamTransport> {
        return std::make_unique<IdleTransport>(frames);
    };
}

bool waitUntil(const std::function<bool()>& predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

void testSymbolsGroupedPerConnection() {
    adapters::binance::BinanceStreamProtocol protocol;
    Services services;
    app::CollectorOptions options;
    options.symbols = {"BTCUSDT", "ETHUSDT", "SOLUSDT", "BNBUSDT", "XRPUSDT"};
    options.markets = {domain::MarketType::Spot, domain::MarketType::UsdtFutures};
    options.maxSymbolsPerConnection = 2;

    app::Collector collector(options, app::VenueAdapters{protocol, factoryWith({})}, services.view());
    expect(collector.stream_count() == 6, "three groups per market");
    expect(collector.backfill_count() == 0, "no backfill unless enabled");

    const auto stats = collector.get_connection_stats();
    expect(stats.size() == 6, "stats per connection");
    if (stats.size() == 6) {
        expect(stats[0].group == "binance:spot:0" && stats[0].symbols.size() == 2, "first spot group");
        expect(stats[2].group == "binance:spot:2" && stats[2].symbols.size() == 1, "remainder group");
        expect(stats[3].group == "binance:usdtm:0", "futures groups follow");
    }
    expect(services.health.status_all().count("binance_storage") == 1, "components registered up front");
    expect(collector.state_key() == "collector:binance:state", "snapshot key");
}

void testInvalidSetupRejected() {
    adapters::binance::BinanceStreamProtocol protocol;
    Services services;

    app::CollectorOptions empty;
    empty.markets = {domain::MarketType::Spot};
    bool threw = false;
    try {
        app::Collector collector(empty, app::VenueAdapters{protocol, factoryWith({})}, services.view());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "symbols are required");

    app::CollectorOptions usdc;
    usdc.symbols = {"BTCUSDC"};
    usdc.markets = {domain::MarketType::UsdcFutures};
    threw = false;
    try {
        app::Collector collector(usdc, app::VenueAdapters{protocol, factoryWith({})}, services.view());
    } catch (const mdi::common::ConfigurationError&) {
        threw = true;
    }
    expect(threw, "unsupported market fails at construction");

    app::CollectorOptions mismatch;
    mismatch.venue = "bitget";
    mismatch.symbols = {"BTCUSDT"};
    mismatch.markets = {domain::MarketType::Spot};
    threw = false;
    try {
        app::Collector collector(mismatch, app::VenueAdapters{protocol, factoryWith({})}, services.view());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "venue must match the protocol");
}

void testStopFlushesAndWritesSnapshot() {
    adapters::binance::BinanceStreamProtocol protocol;
    Services services;
    EmptyTradeHistory history;

    app::CollectorOptions options;
    options.symbols = {"BTCUSDT"};
    options.markets = {domain::MarketType::Spot};
    options.resolutions = {60, 300};
    options.shutdownTimeout = std::chrono::seconds(5);
    options.backfill = true;
    options.backfillOptions.step = std::chrono::seconds(300);
    options.backfillOptions.delay = std::chrono::milliseconds(1);
    options.backfillOptions.horizonMs = domain::now_ms() - 500'000;

    const std::deque<std::string> frames{
        R"({"result":null,"id":1})",
        R"({"e":"aggTrade","E":61000,"s":"BTCUSDT","a":9,"p":"100.5","q":"2","f":1,"l":1,"T":61000,"m":false})",
    };
    app::Collector collector(options, app::VenueAdapters{protocol, factoryWith(frames), &history}, services.view());
    expect(collector.backfill_count() == 1, "one backfill per symbol and market");

    collector.start();
    expect(collector.running(), "running after start");
    expect(waitUntil([&] { return services.store.trade_count() == 1; }), "streamed trade stored");
    expect(waitUntil([&] {
               const auto backfills = collector.get_status().backfills;
               return !backfills.empty() && backfills.front().completed;
           }),
           "backfill walked to its horizon");
    // The walk spans whole 5m buckets below the current minute.
    expect(history.calls.load() >= 2 && history.calls.load() <= 3, "one request per backfill window");

    expect(waitUntil([&] {
               const auto active = collector.get_status().activeBars;
               return active.at(60) == 1 && active.at(300) == 1;
           }),
           "trade open in every resolution");

    const auto live = boost::json::parse(collector.stats_json()).as_object();
    expect(live.at("running").as_bool(), "stats report running");
    expect(live.at("connections").as_array().size() == 1, "stats list the connection");
    expect(live.at("health").as_object().contains("binance_websocket"), "stats include health");
    expect(live.at("backfills").as_array().size() == 1, "stats include backfill");
    const auto& counters = live.at("metrics").as_object().at("counters").as_object();
    expect(counters.contains("trades_total") && counters.at("trades_total").to_number<std::int64_t>() == 1,
           "stats include published counters");
    expect(live.at("metrics").as_object().contains("gauges"), "stats include gauges");

    collector.stop();
    expect(!collector.running(), "stopped");
    expect(services.store.bar_count() == 2, "final flush writes the open bars");

    const auto snapshotText = services.store.get(collector.state_key());
    expect(snapshotText.has_value(), "shutdown snapshot written");
    if (snapshotText) {
        const auto snapshot = boost::json::parse(*snapshotText).as_object();
        expect(snapshot.at("venue").as_string() == "binance", "snapshot venue");
        expect(snapshot.at("bars_flushed").to_number<std::int64_t>() == 2, "snapshot counts flushed bars");
        expect(snapshot.at("open_bars").to_number<std::int64_t>() == 0, "no bars left open");
        expect(snapshot.at("abandoned_tasks").to_number<std::int64_t>() == 0, "every task stopped in time");
        expect(snapshot.at("connections").as_array().size() == 1, "snapshot lists connections");
    }

    collector.stop();
    expect(services.store.bar_count() == 2, "second stop is a no-op");
}

void testFlushOnceWritesCompleteBarsOnly() {
    adapters::binance::BinanceStreamProtocol protocol;
    Services services;
    app::CollectorOptions options;
    options.symbols = {"BTCUSDT"};
    options.markets = {domain::MarketType::Spot};
    options.resolutions = {60};

    app::Collector collector(options, app::VenueAdapters{protocol, factoryWith({})}, services.view());
    expect(collector.flush_once(1'000) == 0, "nothing to flush before any trade");
    expect(collector.get_status().barsFlushed == 0, "flushed counter untouched");
}

}  // namespace

int main() {
    testSymbolsGroupedPerConnection();
    testInvalidSetupRejected();
    testStopFlushesAndWritesSnapshot();
    testFlushOnceWritesCompleteBarsOnly();
    return failures == 0 ? 0 : 1;
}
