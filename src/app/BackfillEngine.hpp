#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "app/CandleAggregator.hpp"
#include "app/CursorStore.hpp"
#include "app/HealthRegistry.hpp"
#include "app/RateLimiter.hpp"
#include "app/TradeDeduplicator.hpp"
#include "app/Worker.hpp"
#include "common/Metrics.hpp"
#include "common/StopSignal.hpp"
#include "domain/Ports.hpp"
#include "domain/Types.hpp"

namespace app {

struct BackfillOptions {
    std::chrono::seconds step{300};
    std::chrono::milliseconds delay{100};
    domain::TimestampMs horizonMs{0};
    int usedWeightLimit = 1200;
    double usedWeightThreshold = 0.9;
};

struct BackfillStatus {
    std::string key;
    std::optional<domain::BackfillCursor> cursor;
    double progress{0.0};
    std::uint64_t pages{0};
    std::uint64_t requests{0};
    std::uint64_t trades{0};
    std::uint64_t bars{0};
    bool running{false};
    bool completed{false};
    bool failed{false};
    std::string lastError;
};

// Walks one (symbol, market) backward from now to the configured horizon in
// fixed half-open windows, persisting the cursor after every step so a restart
// resumes where the last run stopped. A failed fetch ends the run without
// retrying.
//
// Bars are rebuilt per window. A bucket that straddles the window start is held
// back and merged with the older part fetched by the next window; buckets that
// reach past the first window end are left to the live stream.
class BackfillEngine : public std::enable_shared_from_this<BackfillEngine> {
public:
    using NowFn = std::function<domain::TimestampMs()>;
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    BackfillEngine(std::string venue,
                   domain::Symbol symbol,
                   domain::MarketType market,
                   domain::contracts::ITradeHistory& history,
                   CursorStore& cursors,
                   RateLimiter& limiter,
                   HealthRegistry& health,
                   domain::contracts::IMarketSink& sink,
                   std::vector<CandleAggregator*> aggregators,
                   mdi::common::metrics::Registry& metrics,
                   BackfillOptions options,
                   TradeDeduplicator* dedup = nullptr);
    ~BackfillEngine();

    BackfillEngine(const BackfillEngine&) = delete;
    BackfillEngine& operator=(const BackfillEngine&) = delete;

    void set_clock(NowFn now);
    void set_sleeper(Sleeper sleeper);

    void start();
    void stop();
    bool wait_for(std::chrono::milliseconds timeout);
    void abandon();

    // Blocking walk; returns when the horizon is reached, on stop or on failure.
    void run();

    BackfillStatus status() const;
    const std::string& key() const noexcept { return key_; }

private:
    enum class FetchOutcome { Complete, Stopped, Failed };

    domain::TimestampMs now_() const;
    bool sleep_(std::chrono::milliseconds delay);
    void fail_(const std::string& message);
    FetchOutcome fetch_window_(domain::TimestampMs windowStart,
                               domain::TimestampMs windowEnd,
                               std::vector<domain::Trade>& trades);
    void store_window_(std::vector<domain::Trade> trades, domain::TimestampMs windowStart, bool last);
    std::optional<domain::TimestampMs> resume_point_() const;

    const std::string venue_;
    const domain::Symbol symbol_;
    const domain::MarketType market_;
    domain::contracts::ITradeHistory& history_;
    CursorStore& cursors_;
    RateLimiter& limiter_;
    HealthRegistry& health_;
    domain::contracts::IMarketSink& sink_;
    const std::vector<CandleAggregator*> aggregators_;
    mdi::common::metrics::Registry& metrics_;
    const BackfillOptions options_;
    TradeDeduplicator* dedup_;

    const std::string key_;
    const std::string restComponent_;
    const std::string storageComponent_;
    domain::TimestampMs minResolutionMs_{1};
    domain::TimestampMs maxResolutionMs_{1};

    // Per-run walk state, touched only by the thread inside run().
    domain::TimestampMs runTop_{0};
    domain::TimestampMs rawFloor_{0};
    std::vector<std::optional<domain::Bar>> carry_;

    mdi::common::StopSignal stop_;
    NowFn nowFn_;
    Sleeper sleeper_;
    std::unique_ptr<Worker> worker_;

    mutable std::mutex statusMutex_;
    BackfillStatus status_;
};

}  // namespace app
