#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app/BackfillEngine.hpp"
#include "app/CandleAggregator.hpp"
#include "app/CursorStore.hpp"
#include "app/HealthRegistry.hpp"
#include "app/RateLimiter.hpp"
#include "app/StreamClient.hpp"
#include "app/TradeDeduplicator.hpp"
#include "app/Worker.hpp"
#include "common/Metrics.hpp"
#include "common/StopSignal.hpp"
#include "domain/Ports.hpp"
#include "domain/StreamMessages.hpp"

namespace app {

struct CollectorOptions {
    std::string venue = "binance";
    std::vector<domain::Symbol> symbols;
    std::vector<domain::MarketType> markets;
    std::vector<std::int64_t> resolutions{1, 60, 300, 900};
    std::size_t maxSymbolsPerConnection = 50;

    RateLimiterOptions wsLimiter{};
    RateLimiterOptions restLimiter{};
    StreamClientOptions stream{};

    bool backfill = false;
    BackfillOptions backfillOptions{};

    std::chrono::seconds flushInterval{10};
    std::chrono::seconds stalenessTtl{900};
    std::chrono::seconds shutdownTimeout{30};
    std::chrono::seconds dedupWindow{3600};
};

// Venue-specific collaborators. tradeHistory may be null when backfill is off.
struct VenueAdapters {
    const domain::IStreamProtocol& protocol;
    StreamClient::TransportFactory transportFactory;
    domain::contracts::ITradeHistory* tradeHistory = nullptr;
};

// Process-wide services constructed once in main.
struct CollectorServices {
    HealthRegistry& health;
    RateLimiterRegistry& limiters;
    mdi::common::metrics::Registry& metrics;
    domain::contracts::IMarketSink& sink;
    domain::contracts::IStateStore& state;
};

struct CollectorStatus {
    std::string venue;
    bool running{false};
    std::map<std::int64_t, std::size_t> activeBars;
    std::uint64_t barsFlushed{0};
    std::vector<ConnectionStats> connections;
    std::vector<BackfillStatus> backfills;
    std::map<std::string, ComponentHealth> health;
    std::vector<RateLimiterStats> limiters;
    mdi::common::metrics::Registry::Snapshot metrics;
};

// Owns every streaming connection, backfill task, aggregator and the periodic
// flush ticker for one venue.
class Collector {
public:
    Collector(CollectorOptions options, VenueAdapters adapters, CollectorServices services);
    ~Collector();

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    void start();
    // Cancels all tasks, waits up to the shutdown timeout, flushes once and
    // writes the shutdown snapshot.
    void stop();

    bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    // One flush pass over the live aggregators; returns the number of bars written.
    // Backfill engines close their own bars page by page.
    std::size_t flush_once(domain::TimestampMs nowMs = domain::now_ms());

    CollectorStatus get_status() const;
    std::vector<ConnectionStats> get_connection_stats() const;
    std::string stats_json() const;

    std::string state_key() const;
    std::size_t stream_count() const noexcept { return streams_.size(); }
    std::size_t backfill_count() const noexcept { return backfills_.size(); }

private:
    using AggregatorSet = std::vector<std::unique_ptr<CandleAggregator>>;

    AggregatorSet make_aggregators_() const;
    static std::vector<CandleAggregator*> view_(const AggregatorSet& set);
    void build_streams_();
    void build_backfills_();
    void flush_loop_();
    void write_snapshot_(std::size_t abandoned);

    const CollectorOptions options_;
    VenueAdapters adapters_;
    CollectorServices services_;

    RateLimiter& wsLimiter_;
    RateLimiter& restLimiter_;
    TradeDeduplicator dedup_;
    CursorStore cursors_;

    AggregatorSet liveAggregators_;
    std::vector<AggregatorSet> backfillAggregators_;
    std::vector<std::shared_ptr<StreamClient>> streams_;
    std::vector<std::shared_ptr<BackfillEngine>> backfills_;

    mdi::common::StopSignal stop_;
    std::unique_ptr<Worker> flusher_;
    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
    std::mutex flushMutex_;
    std::atomic<std::uint64_t> barsFlushed_{0};
};

}  // namespace app
