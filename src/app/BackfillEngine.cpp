#include "app/BackfillEngine.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace app {
namespace {

domain::TimestampMs bucket_end(const domain::Bar& bar) {
    return bar.start + bar.resolution * 1000;
}

// Joins two fragments of the same bucket fetched by adjacent windows.
domain::Bar merge_fragments(const domain::Bar& older, const domain::Bar& newer) {
    domain::Bar merged = older;
    merged.high = std::max(older.high, newer.high);
    merged.low = std::min(older.low, newer.low);
    merged.close = newer.close;
    merged.volume = older.volume + newer.volume;
    merged.tradeCount = older.tradeCount + newer.tradeCount;
    merged.lastUpdate = std::max(older.lastUpdate, newer.lastUpdate);
    return merged;
}

}  // namespace

BackfillEngine::BackfillEngine(std::string venue,
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
                               TradeDeduplicator* dedup)
    : venue_(std::move(venue)),
      symbol_(std::move(symbol)),
      market_(market),
      history_(history),
      cursors_(cursors),
      limiter_(limiter),
      health_(health),
      sink_(sink),
      aggregators_(std::move(aggregators)),
      metrics_(metrics),
      options_(options),
      dedup_(dedup),
      key_(venue_ + ":" + symbol_ + ":" + std::string(domain::to_string(market_))),
      restComponent_(venue_ + "_rest_api"),
      storageComponent_(venue_ + "_storage") {
    if (options_.step.count() <= 0) {
        throw std::invalid_argument("BackfillEngine step must be > 0");
    }
    if (!aggregators_.empty()) {
        minResolutionMs_ = std::numeric_limits<domain::TimestampMs>::max();
        for (const auto* aggregator : aggregators_) {
            const auto resolutionMs = aggregator->resolution() * 1000;
            minResolutionMs_ = std::min(minResolutionMs_, resolutionMs);
            maxResolutionMs_ = std::max(maxResolutionMs_, resolutionMs);
        }
    }
    carry_.resize(aggregators_.size());
    status_.key = key_;
    health_.register_component(restComponent_);
    health_.register_component(storageComponent_);
}

BackfillEngine::~BackfillEngine() {
    stop();
}

void BackfillEngine::set_clock(NowFn now) {
    nowFn_ = std::move(now);
}

void BackfillEngine::set_sleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

domain::TimestampMs BackfillEngine::now_() const {
    return nowFn_ ? nowFn_() : domain::now_ms();
}

bool BackfillEngine::sleep_(std::chrono::milliseconds delay) {
    if (sleeper_) {
        return sleeper_(delay);
    }
    return stop_.wait_for(delay);
}

void BackfillEngine::start() {
    if (worker_) {
        throw std::logic_error("BackfillEngine " + key_ + " already started");
    }
    stop_.reset();
    auto self = shared_from_this();
    worker_ = std::make_unique<Worker>("backfill:" + key_, [self]() { self->run(); });
    worker_->start();
}

void BackfillEngine::stop() {
    stop_.request();
}

bool BackfillEngine::wait_for(std::chrono::milliseconds timeout) {
    return !worker_ || worker_->wait_for(timeout);
}

void BackfillEngine::abandon() {
    if (worker_) {
        worker_->abandon();
    }
}

BackfillStatus BackfillEngine::status() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

void BackfillEngine::fail_(const std::string& message) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    status_.failed = true;
    status_.lastError = message;
}

BackfillEngine::FetchOutcome BackfillEngine::fetch_window_(domain::TimestampMs windowStart,
                                                           domain::TimestampMs windowEnd,
                                                           std::vector<domain::Trade>& trades) {
    const auto weightThreshold = static_cast<double>(options_.usedWeightLimit) * options_.usedWeightThreshold;

    std::optional<std::string> after;
    do {
        if (!limiter_.acquire(&stop_)) {
            return FetchOutcome::Stopped;
        }

        domain::contracts::TradePage page;
        try {
            page = history_.fetch_trades(symbol_, market_, windowStart, windowEnd, after);
            if (page.next && after && *page.next == *after) {
                throw domain::FeedError(domain::ErrorKind::Protocol, "trade history repeated continuation " + *after);
            }
        } catch (const domain::FeedError& ex) {
            LOG_ERR("BackfillEngine " << key_ << " fetch failed for window [" << windowStart << ", " << windowEnd
                                      << ") (" << domain::to_string(ex.kind()) << "): " << ex.what());
            limiter_.report_error(ex.kind(), ex.what());
            health_.handle_failure(restComponent_, ex.what());
            fail_(ex.what());
            return FetchOutcome::Failed;
        } catch (const std::exception& ex) {
            LOG_ERR("BackfillEngine " << key_ << " fetch failed for window [" << windowStart << ", " << windowEnd
                                      << "): " << ex.what());
            limiter_.report_error(domain::ErrorKind::BackfillFetch, ex.what());
            health_.handle_failure(restComponent_, ex.what());
            fail_(ex.what());
            return FetchOutcome::Failed;
        }

        limiter_.report_success();
        health_.record_success(restComponent_);
        if (page.usedWeight && static_cast<double>(*page.usedWeight) > weightThreshold) {
            limiter_.report_error(domain::ErrorKind::RateLimited,
                                  "used weight " + std::to_string(*page.usedWeight) + " above threshold");
        }
        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            ++status_.requests;
        }

        std::move(page.trades.begin(), page.trades.end(), std::back_inserter(trades));
        after = std::move(page.next);
    } while (after && !stop_.requested());

    return after ? FetchOutcome::Stopped : FetchOutcome::Complete;
}

void BackfillEngine::store_window_(std::vector<domain::Trade> trades, domain::TimestampMs windowStart, bool last) {
    if (dedup_ != nullptr) {
        trades = dedup_->filter(std::move(trades));
    }
    std::sort(trades.begin(), trades.end(), [](const domain::Trade& a, const domain::Trade& b) {
        return a.timestamp < b.timestamp;
    });

    // Trades at or above the floor were written by the run that left the cursor.
    std::vector<domain::Trade> fresh;
    fresh.reserve(trades.size());
    std::copy_if(trades.begin(), trades.end(), std::back_inserter(fresh),
                 [this](const domain::Trade& trade) { return trade.timestamp < rawFloor_; });
    bool stored = fresh.empty() || sink_.append_trades(fresh);

    std::vector<domain::Bar> bars;
    for (std::size_t i = 0; i < aggregators_.size(); ++i) {
        auto* aggregator = aggregators_[i];
        std::vector<domain::Bar> window;
        for (const auto& trade : trades) {
            if (auto bar = aggregator->process_trade(trade)) {
                window.push_back(std::move(*bar));
            }
        }
        auto open = aggregator->close_all();
        std::move(open.begin(), open.end(), std::back_inserter(window));

        auto& carry = carry_[i];
        if (carry) {
            if (!window.empty() && window.back().start == carry->start) {
                window.back() = merge_fragments(window.back(), *carry);
            } else {
                window.push_back(*carry);
            }
            carry.reset();
        }

        for (auto& bar : window) {
            if (bucket_end(bar) > runTop_) {
                continue;
            }
            if (bar.start < windowStart && !last) {
                carry = std::move(bar);
                continue;
            }
            bars.push_back(std::move(bar));
        }
    }
    if (!bars.empty()) {
        stored = sink_.append_bars(bars) && stored;
    }

    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.trades += fresh.size();
        status_.bars += bars.size();
    }
    metrics_.incrementCounter("backfill_trades_total", fresh.size());

    if (!stored) {
        LOG_WARN("BackfillEngine " << key_ << " storage write failed for " << fresh.size() << " trades / "
                                   << bars.size() << " bars");
        health_.handle_failure(storageComponent_, "backfill write failed for " + key_);
    }
}

std::optional<domain::TimestampMs> BackfillEngine::resume_point_() const {
    std::optional<domain::TimestampMs> resume;
    for (const auto& carry : carry_) {
        if (carry) {
            resume = std::max(resume.value_or(0), bucket_end(*carry));
        }
    }
    return resume;
}

void BackfillEngine::run() {
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.running = true;
        status_.failed = false;
        status_.lastError.clear();
    }

    if (!health_.allows_work(restComponent_)) {
        LOG_WARN("BackfillEngine " << key_ << " skipped: " << restComponent_ << " is failed over");
        fail_(restComponent_ + " failed over");
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.running = false;
        return;
    }

    auto cursor = cursors_.load(symbol_, market_);
    if (cursor) {
        LOG_INFO("BackfillEngine " << key_ << " resuming from cursor current=" << cursor->current
                                   << " target=" << cursor->target);
    } else {
        // Whole buckets only: the top at the finest resolution, the horizon at the coarsest.
        cursor = domain::BackfillCursor{symbol_,
                                        market_,
                                        domain::align_down_ms(now_(), minResolutionMs_),
                                        domain::align_down_ms(options_.horizonMs, maxResolutionMs_)};
        LOG_INFO("BackfillEngine " << key_ << " starting fresh current=" << cursor->current
                                   << " target=" << cursor->target);
    }

    rawFloor_ = cursor->current;
    runTop_ = cursor->resumeFrom.value_or(cursor->current);
    for (auto& carry : carry_) {
        carry.reset();
    }

    const auto stepMs = static_cast<domain::TimestampMs>(options_.step.count()) * 1000;
    auto windowEnd = runTop_;

    while (windowEnd > cursor->target && !stop_.requested()) {
        const auto windowTop = windowEnd;
        const auto windowStart = std::max(windowTop - stepMs, cursor->target);

        std::vector<domain::Trade> trades;
        if (fetch_window_(windowStart, windowTop, trades) != FetchOutcome::Complete) {
            break;
        }

        const auto fetched = trades.size();
        const bool last = windowStart <= cursor->target;
        store_window_(std::move(trades), windowStart, last);

        windowEnd = windowStart;
        cursor->current = std::min(cursor->current, windowStart);
        cursor->resumeFrom = resume_point_();
        if (cursor->resumeFrom && *cursor->resumeFrom <= cursor->current) {
            cursor->resumeFrom.reset();
        }
        const auto nowMs = now_();
        if (!cursors_.save(*cursor, nowMs)) {
            LOG_WARN("BackfillEngine " << key_ << " failed to persist cursor at " << cursor->current);
            health_.handle_failure(storageComponent_, "cursor write failed for " + key_);
        }

        const auto progress = cursor->progress_percent(nowMs);
        metrics_.setGauge("backfill_progress." + key_, progress);
        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            status_.cursor = cursor;
            status_.progress = progress;
            ++status_.pages;
        }
        LOG_DEBUG("BackfillEngine " << key_ << " window [" << windowStart << ", " << windowTop << ") trades="
                                    << fetched << " progress=" << progress << "%");

        if (windowEnd > cursor->target && !sleep_(options_.delay)) {
            break;
        }
    }

    const bool completed = windowEnd <= cursor->target;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.cursor = cursor;
        status_.completed = completed;
        status_.running = false;
    }
    if (completed) {
        LOG_INFO("BackfillEngine " << key_ << " reached horizon " << cursor->target);
    } else {
        LOG_INFO("BackfillEngine " << key_ << " stopped at " << cursor->current);
    }
}

}  // namespace app
