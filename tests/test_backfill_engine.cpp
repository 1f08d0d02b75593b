#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "adapters/memory/MemoryStore.hpp"
#include "app/BackfillEngine.hpp"
#include "app/BulkCandleBackfill.hpp"
#include "app/CandleAggregator.hpp"
#include "app/CursorStore.hpp"
#include "app/HealthRegistry.hpp"
#include "app/RateLimiter.hpp"
#include "app/TradeDeduplicator.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << "\n";
        ++failures;
    }
}

constexpr domain::TimestampMs kNow = 1'000'000;
constexpr domain::TimestampMs kHorizon = 360'000;

domain::Trade makeTrade(const std::string& id, domain::TimestampMs ts, double price) {
    domain::Trade trade;
    trade.venue = "binance";
    trade.symbol = "BTCUSDT";
    trade.market = domain::MarketType::Spot;
    trade.tradeId = id;
    trade.price = price;
    trade.size = 1.0;
    trade.side = domain::Side::Buy;
    trade.timestamp = ts;
    return trade;
}

// One trade per minute, in the middle of the minute, priced 100 + index.
std::vector<domain::Trade> minuteTrades(int count) {
    std::vector<domain::Trade> trades;
    for (int i = 0; i < count; ++i) {
        trades.push_back(makeTrade(std::to_string(i), i * 60'000LL + 30'000, 100.0 + i));
    }
    return trades;
}

struct Request {
    domain::TimestampMs start;
    domain::TimestampMs end;
    std::optional<std::string> after;
};

// Serves `trades` inside [start, end) in pages of `pageSize`, continuing by offset.
class FakeTradeHistory : public domain::contracts::ITradeHistory {
public:
    domain::contracts::TradePage fetch_trades(const domain::Symbol&,
                                              domain::MarketType,
                                              domain::TimestampMs startMs,
                                              domain::TimestampMs endMs,
                                              const std::optional<std::string>& after) override {
        requests.push_back({startMs, endMs, after});
        if (failOnCall && requests.size() == *failOnCall) {
            throw domain::FeedError(domain::ErrorKind::TransientNetwork, "connection reset by peer");
        }
        domain::contracts::TradePage page;
        page.usedWeight = usedWeight;
        if (stuckContinuation) {
            page.next = "0";
            return page;
        }

        std::vector<domain::Trade> inWindow;
        for (const auto& trade : trades) {
            if (trade.timestamp >= startMs && trade.timestamp < endMs) {
                inWindow.push_back(trade);
            }
        }
        const std::size_t offset = after ? std::stoul(*after) : 0;
        const std::size_t last = std::min(inWindow.size(), offset + pageSize);
        for (std::size_t i = offset; i < last; ++i) {
            page.trades.push_back(inWindow[i]);
        }
        if (last < inWindow.size()) {
            page.next = std::to_string(last);
        }
        return page;
    }

    std::vector<domain::Trade> trades;
    std::vector<Request> requests;
    std::size_t pageSize = 1000;
    std::optional<std::size_t> failOnCall;
    std::optional<int> usedWeight;
    bool stuckContinuation = false;
};

struct Fixture {
    FakeTradeHistory history;
    adapters::memory::MemoryStore store;
    app::CursorStore cursors{store, "binance"};
    app::RateLimiter limiter{"binance_rest_api", app::RateLimiterOptions{}};
    app::HealthRegistry health;
    mdi::common::metrics::Registry metrics;
    app::TradeDeduplicator dedup;
    app::CandleAggregator minute{60};
    std::vector<std::chrono::milliseconds> sleeps;
    std::optional<std::size_t> stopAtSleep;

    std::shared_ptr<app::BackfillEngine> makeEngine() {
        return makeEngine({&minute}, kNow, kHorizon, &dedup);
    }

    std::shared_ptr<app::BackfillEngine> makeEngine(std::vector<app::CandleAggregator*> aggregators,
                                                    domain::TimestampMs now,
                                                    domain::TimestampMs horizon,
                                                    app::TradeDeduplicator* filter) {
        app::BackfillOptions options{};
        options.step = std::chrono::seconds(300);
        options.horizonMs = horizon;
        auto engine = std::make_shared<app::BackfillEngine>(
            "binance", "BTCUSDT", domain::MarketType::Spot, history, cursors, limiter, health, store,
            std::move(aggregators), metrics, options, filter);
        engine->set_clock([now] { return now; });
        engine->set_sleeper([this](std::chrono::milliseconds delay) {
            sleeps.push_back(delay);
            return !(stopAtSleep && sleeps.size() >= *stopAtSleep);
        });
        return engine;
    }
};

const domain::Bar* findBar(const std::vector<domain::Bar>& bars, std::int64_t resolution, domain::TimestampMs start) {
    for (const auto& bar : bars) {
        if (bar.resolution == resolution && bar.start == start) {
            return &bar;
        }
    }
    return nullptr;
}

void testFreshRunWalksToHorizon() {
    Fixture fx;
    fx.history.trades = {makeTrade("1", 650'000, 10.0), makeTrade("2", 800'000, 11.0),
                         makeTrade("3", 800'500, 12.0)};
    auto engine = fx.makeEngine();
    engine->run();

    expect(fx.history.requests.size() == 2, "two windows between now and the horizon");
    if (fx.history.requests.size() == 2) {
        expect(fx.history.requests[0].start == 660'000 && fx.history.requests[0].end == 960'000,
               "first window ends at the last whole minute");
        expect(fx.history.requests[1].start == kHorizon && fx.history.requests[1].end == 660'000,
               "second window stops at the horizon");
        expect(!fx.history.requests[0].after, "first request of a window has no continuation");
    }
    expect(fx.sleeps.size() == 1, "delay only between windows");

    const auto status = engine->status();
    expect(status.completed && !status.failed && !status.running, "run completed");
    expect(status.pages == 2, "pages counted");
    expect(status.trades == 3, "trades counted");
    expect(status.bars == 2, "one bar per touched minute");
    expect(std::fabs(status.progress - 100.0) < 1e-9, "progress reaches 100");
    expect(fx.store.trade_count() == 3, "trades written");
    expect(fx.store.bar_count() == 2, "bars written");

    const auto saved = fx.cursors.load("BTCUSDT", domain::MarketType::Spot);
    expect(saved && saved->current == kHorizon && saved->target == kHorizon, "cursor persisted at the horizon");
    expect(saved && !saved->resumeFrom, "nothing left to resume");
}

void testResumesFromSavedCursor() {
    Fixture fx;
    domain::BackfillCursor cursor{"BTCUSDT", domain::MarketType::Spot, 660'000, kHorizon};
    expect(fx.cursors.save(cursor, kNow), "cursor saved");

    auto engine = fx.makeEngine();
    engine->run();

    expect(fx.history.requests.size() == 1, "only the remaining window fetched");
    expect(!fx.history.requests.empty() && fx.history.requests.front().end == 660'000,
           "first window ends at the persisted cursor");
    expect(engine->status().completed, "resumed run completed");
}

void testFetchFailureStopsRun() {
    Fixture fx;
    fx.history.failOnCall = 2;
    auto engine = fx.makeEngine();
    engine->run();

    expect(fx.history.requests.size() == 2, "no retry after a failed fetch");
    const auto status = engine->status();
    expect(status.failed && !status.completed, "run marked failed");
    expect(status.lastError.find("connection reset") != std::string::npos, "error recorded");
    expect(fx.health.status("binance_rest_api").state == app::HealthState::Degraded, "failure escalated");

    const auto saved = fx.cursors.load("BTCUSDT", domain::MarketType::Spot);
    expect(saved && saved->current == 660'000, "cursor kept at the last completed window");
}

void testUsedWeightThrottles() {
    Fixture fx;
    fx.history.usedWeight = 1150;
    auto engine = fx.makeEngine();
    engine->run();
    expect(fx.limiter.stats().throttles == 2, "used weight above 90% throttles every page");
    expect(fx.limiter.stats().currentRps < 8.0, "rate reduced");
}

void testBoundaryTradeFetchedOnce() {
    Fixture fx;
    fx.history.trades = {makeTrade("42", 660'000, 10.0)};
    auto engine = fx.makeEngine();
    engine->run();

    int windowsHolding = 0;
    for (const auto& request : fx.history.requests) {
        if (660'000 >= request.start && 660'000 < request.end) {
            ++windowsHolding;
        }
    }
    expect(windowsHolding == 1, "windows are half-open");
    expect(engine->status().trades == 1, "boundary trade stored once");
    expect(fx.dedup.duplicates() == 0, "nothing for the filter to drop");
}

void testContinuationPagesEachPaced() {
    Fixture fx;
    fx.history.pageSize = 1;
    fx.history.trades = {makeTrade("7", 800'000, 10.0), makeTrade("7", 800'000, 10.0),
                         makeTrade("8", 800'100, 11.0)};
    auto engine = fx.makeEngine();
    engine->run();

    expect(fx.history.requests.size() == 4, "three requests for the busy window, one for the quiet one");
    if (fx.history.requests.size() == 4) {
        expect(fx.history.requests[1].after && *fx.history.requests[1].after == "1", "continuation passed back");
        expect(fx.history.requests[1].start == 660'000 && fx.history.requests[1].end == 960'000,
               "continuation stays in the window");
    }
    const auto status = engine->status();
    expect(status.requests == 4 && status.pages == 2, "requests and windows counted apart");
    expect(fx.limiter.stats().successes == 4, "every request goes through the limiter");
    expect(fx.store.trade_count() == 2, "repeated trade id stored once");
    expect(fx.dedup.duplicates() == 1, "duplicate seen by the filter");
}

void testRepeatedContinuationFails() {
    Fixture fx;
    fx.history.stuckContinuation = true;
    auto engine = fx.makeEngine();
    engine->run();

    const auto status = engine->status();
    expect(fx.history.requests.size() == 2, "stopped at the repeated token");
    expect(status.failed && !status.completed, "stuck paging fails the run");
    expect(status.lastError.find("repeated continuation") != std::string::npos, "reason recorded");
    expect(!fx.cursors.load("BTCUSDT", domain::MarketType::Spot), "window not marked done");
}

void testHourOfTradesBuildsWholeBars() {
    Fixture fx;
    // 67 minutes of trades; now sits inside the fifth quarter hour.
    fx.history.trades = minuteTrades(67);
    app::CandleAggregator hour{3600};
    app::CandleAggregator quarter{900};
    auto engine = fx.makeEngine({&hour, &quarter}, 4'020'000, 0, &fx.dedup);
    engine->run();

    expect(fx.history.requests.size() == 12, "five-minute windows below the last whole quarter hour");
    expect(hour.late_trades() == 0 && quarter.late_trades() == 0, "no trade dropped as late");
    expect(hour.active_count() == 0 && quarter.active_count() == 0, "nothing left open");

    const auto bars = fx.store.bars();
    expect(bars.size() == 5, "one hour bar and four quarter bars");
    const auto* full = findBar(bars, 3600, 0);
    expect(full != nullptr, "hour bar written");
    if (full != nullptr) {
        expect(full->tradeCount == 60 && full->volume == 60.0, "hour bar holds every trade");
        expect(full->open == 100.0 && full->close == 159.0, "hour open and close");
        expect(full->high == 159.0 && full->low == 100.0, "hour high and low");
        expect(full->end && *full->end == 3'600'000, "hour bar closed");
    }
    for (int q = 0; q < 4; ++q) {
        const auto* bar = findBar(bars, 900, q * 900'000LL);
        expect(bar != nullptr, "quarter bar " + std::to_string(q) + " written");
        if (bar != nullptr) {
            expect(bar->tradeCount == 15 && bar->volume == 15.0, "quarter bar holds fifteen trades");
            expect(bar->open == 100.0 + q * 15 && bar->close == 114.0 + q * 15, "quarter open and close");
        }
    }
    expect(!findBar(bars, 900, 3'600'000), "bucket still forming is left to the live stream");
}

void testStopInsideBucketResumesWholeBucket() {
    Fixture fx;
    fx.history.trades = minuteTrades(60);
    fx.stopAtSleep = 1;
    app::CandleAggregator quarter{900};
    auto first = fx.makeEngine({&quarter}, 3'600'000, 0, &fx.dedup);
    first->run();

    expect(!first->status().completed, "first run stopped after one window");
    expect(fx.store.trade_count() == 5 && fx.store.bar_count() == 0, "partial quarter held back");
    const auto saved = fx.cursors.load("BTCUSDT", domain::MarketType::Spot);
    expect(saved && saved->current == 3'300'000, "walk position saved");
    expect(saved && saved->resumeFrom && *saved->resumeFrom == 3'600'000, "resume point covers the open bucket");

    // A restarted process starts with an empty duplicate filter.
    fx.stopAtSleep.reset();
    auto second = fx.makeEngine({&quarter}, 3'600'000, 0, nullptr);
    second->run();

    expect(second->status().completed, "second run completed");
    expect(!fx.history.requests.empty() && fx.history.requests[1].end == 3'600'000, "resumed at the resume point");
    expect(fx.store.trade_count() == 60, "refetched trades not written twice");
    const auto bars = fx.store.bars();
    expect(bars.size() == 4, "every quarter written");
    const auto* straddled = findBar(bars, 900, 2'700'000);
    expect(straddled != nullptr && straddled->tradeCount == 15, "interrupted quarter rebuilt whole");
    if (straddled != nullptr) {
        expect(straddled->open == 145.0 && straddled->close == 159.0, "interrupted quarter open and close");
    }
}

void testFailedOverSkipsRun() {
    Fixture fx;
    for (int i = 0; i < 5; ++i) {
        fx.health.handle_failure("binance_rest_api", "HTTP 503");
    }
    auto engine = fx.makeEngine();
    engine->run();
    expect(fx.history.requests.empty(), "no fetch while failed over");
    expect(engine->status().failed, "skipped run reported as failed");
}

void testStorageFailureEscalates() {
    Fixture fx;
    fx.store.fail_trade_writes(true);
    fx.history.trades = {makeTrade("1", 900'000, 10.0)};
    auto engine = fx.makeEngine();
    engine->run();
    expect(engine->status().completed, "storage failure does not stop the walk");
    expect(fx.health.status("binance_storage").totalFailures == 1, "storage failure escalated");
}

void testEngineReleasedAfterThreadedRun() {
    Fixture fx;
    std::weak_ptr<app::BackfillEngine> weak;
    {
        auto engine = fx.makeEngine();
        weak = engine;
        engine->start();
        expect(engine->wait_for(std::chrono::seconds(5)), "threaded run finished");
    }
    expect(weak.expired(), "worker does not keep the engine alive");
}

void testCursorEncoding() {
    domain::BackfillCursor cursor{"ETHUSDT", domain::MarketType::UsdtFutures, 1'500, 1'000};
    const auto decoded = app::CursorStore::decode(app::CursorStore::encode(cursor, 2'000));
    expect(decoded && decoded->symbol == "ETHUSDT" && decoded->market == domain::MarketType::UsdtFutures,
           "identity decoded");
    expect(decoded && decoded->current == 1'500 && decoded->target == 1'000, "positions decoded");
    expect(decoded && !decoded->resumeFrom, "no resume point unless one was saved");

    auto straddling = cursor;
    straddling.resumeFrom = 1'800;
    const auto resumed = app::CursorStore::decode(app::CursorStore::encode(straddling, 2'000));
    expect(resumed && resumed->resumeFrom && *resumed->resumeFrom == 1'800, "resume point decoded");
    expect(!app::CursorStore::decode("not json"), "garbage ignored");
    expect(!app::CursorStore::decode(R"({"symbol":"X","market":"moon","current":1,"target":0})"),
           "unknown market ignored");

    adapters::memory::MemoryStore store;
    app::CursorStore cursors(store, "bitget");
    expect(cursors.key("ETHUSDT", domain::MarketType::Spot) == "backfill:bitget:ETHUSDT:spot", "cursor key");
    expect(store.set(cursors.key("ETHUSDT", domain::MarketType::Spot), "{broken"), "raw write");
    expect(!cursors.load("ETHUSDT", domain::MarketType::Spot), "unreadable cursor treated as absent");
}

class FakeCandleHistory : public domain::contracts::ICandleHistory {
public:
    domain::contracts::CandlePage fetch_candles(const domain::Symbol& symbol,
                                                domain::MarketType market,
                                                const std::string&,
                                                domain::TimestampMs endMs,
                                                std::size_t limit) override {
        ++calls;
        domain::contracts::CandlePage page;
        const auto newest = endMs - endMs % 60'000;
        for (std::size_t i = limit; i > 0; --i) {
            domain::Bar bar;
            bar.venue = "binance";
            bar.symbol = symbol;
            bar.market = market;
            bar.resolution = 60;
            bar.start = newest - static_cast<domain::TimestampMs>(i - 1) * 60'000;
            bar.end = bar.start + 60'000;
            bar.open = bar.high = bar.low = bar.close = 1.0;
            page.bars.push_back(bar);
        }
        return page;
    }

    int calls = 0;
};

void testBulkCandlesFlushInBatches() {
    FakeCandleHistory history;
    adapters::memory::MemoryStore store;
    app::RateLimiter limiter("binance_rest_api", app::RateLimiterOptions{});
    app::HealthRegistry health;
    app::BulkCandleBackfill bulk("binance", history, store, limiter, health);

    const auto fetched = bulk.run("BTCUSDT", domain::MarketType::Spot, 600'000'000, "1m", 1200);
    expect(fetched == 1200, "limit honoured");
    expect(history.calls == 2, "paged at 1000 per request");
    expect(bulk.batches_flushed() == 3, "two full batches of 500 plus the remainder");
    expect(store.bar_count() == 1200, "every candle written");
}

void testBulkCandlesStopOnFailure() {
    class Failing : public domain::contracts::ICandleHistory {
    public:
        domain::contracts::CandlePage fetch_candles(const domain::Symbol&,
                                                    domain::MarketType,
                                                    const std::string&,
                                                    domain::TimestampMs,
                                                    std::size_t) override {
            throw domain::FeedError(domain::ErrorKind::RateLimited, "HTTP 429", 429);
        }
    } history;
    adapters::memory::MemoryStore store;
    app::RateLimiter limiter("binance_rest_api", app::RateLimiterOptions{});
    app::HealthRegistry health;
    app::BulkCandleBackfill bulk("binance", history, store, limiter, health);

    expect(bulk.run("BTCUSDT", domain::MarketType::Spot, 600'000'000, "1m", 100) == 0, "nothing fetched");
    expect(limiter.stats().throttles == 1, "429 throttles the limiter");
    expect(health.status("binance_rest_api").totalFailures == 1, "failure escalated");
}

}  // namespace

int main() {
    testFreshRunWalksToHorizon();
    testResumesFromSavedCursor();
    testFetchFailureStopsRun();
    testUsedWeightThrottles();
    testBoundaryTradeFetchedOnce();
    testContinuationPagesEachPaced();
    testRepeatedContinuationFails();
    testHourOfTradesBuildsWholeBars();
    testStopInsideBucketResumesWholeBucket();
    testFailedOverSkipsRun();
    testStorageFailureEscalates();
    testEngineReleasedAfterThreadedRun();
    testCursorEncoding();
    testBulkCandlesFlushInBatches();
    testBulkCandlesStopOnFailure();
    return failures == 0 ? 0 : 1;
}
