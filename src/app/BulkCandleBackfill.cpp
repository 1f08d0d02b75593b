#include "app/BulkCandleBackfill.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <future>
#include <utility>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace app {

BulkCandleBackfill::BulkCandleBackfill(std::string venue,
                                       domain::contracts::ICandleHistory& history,
                                       domain::contracts::IMarketSink& sink,
                                       RateLimiter& limiter,
                                       HealthRegistry& health,
                                       BulkCandleOptions options)
    : venue_(std::move(venue)),
      history_(history),
      sink_(sink),
      limiter_(limiter),
      health_(health),
      options_(options) {}

void BulkCandleBackfill::flush_(std::vector<domain::Bar>& buffer) {
    if (buffer.empty()) {
        return;
    }

    const auto chunkSize = std::max<std::size_t>(1, options_.writeChunk);
    std::vector<std::future<bool>> writes;
    for (std::size_t offset = 0; offset < buffer.size(); offset += chunkSize) {
        const auto last = std::min(buffer.size(), offset + chunkSize);
        std::vector<domain::Bar> chunk(buffer.begin() + static_cast<std::ptrdiff_t>(offset),
                                       buffer.begin() + static_cast<std::ptrdiff_t>(last));
        writes.push_back(std::async(std::launch::async, [this, chunk = std::move(chunk)]() {
            return sink_.append_bars(chunk);
        }));
    }

    bool ok = true;
    for (auto& write : writes) {
        try {
            ok = write.get() && ok;
        } catch (const std::exception& ex) {
            LOG_WARN("BulkCandleBackfill " << venue_ << " chunk write threw: " << ex.what());
            ok = false;
        }
    }

    ++batches_;
    LOG_INFO("BulkCandleBackfill " << venue_ << " flushed " << buffer.size() << " candles in " << writes.size()
                                   << " writes" << (ok ? "" : " (with failures)"));
    if (!ok) {
        health_.handle_failure(venue_ + "_storage", "bulk candle write failed");
    }
    buffer.clear();
}

std::size_t BulkCandleBackfill::run(const domain::Symbol& symbol,
                                    domain::MarketType market,
                                    domain::TimestampMs endMs,
                                    const std::string& interval,
                                    std::size_t limit,
                                    const mdi::common::StopSignal* stop) {
    const std::string restComponent = venue_ + "_rest_api";
    std::vector<domain::Bar> buffer;
    buffer.reserve(options_.batchSize);

    std::size_t total = 0;
    auto cursorEnd = endMs;

    LOG_INFO("BulkCandleBackfill " << venue_ << " " << symbol << " " << domain::to_string(market) << " interval="
                                   << interval << " limit=" << limit);

    while (total < limit) {
        if (stop != nullptr && stop->requested()) {
            break;
        }
        if (!limiter_.acquire(stop)) {
            break;
        }

        const auto request = std::min(options_.pageLimit, limit - total);
        domain::contracts::CandlePage page;
        try {
            page = history_.fetch_candles(symbol, market, interval, cursorEnd, request);
        } catch (const domain::FeedError& ex) {
            LOG_ERR("BulkCandleBackfill " << venue_ << " " << symbol << " fetch failed: " << ex.what());
            limiter_.report_error(ex.kind(), ex.what());
            health_.handle_failure(restComponent, ex.what());
            break;
        } catch (const std::exception& ex) {
            LOG_ERR("BulkCandleBackfill " << venue_ << " " << symbol << " fetch failed: " << ex.what());
            limiter_.report_error(domain::ErrorKind::BackfillFetch, ex.what());
            health_.handle_failure(restComponent, ex.what());
            break;
        }
        limiter_.report_success();
        health_.record_success(restComponent);

        if (page.bars.empty()) {
            break;
        }

        const auto oldest = std::min_element(page.bars.begin(), page.bars.end(),
                                             [](const domain::Bar& a, const domain::Bar& b) {
                                                 return a.start < b.start;
                                             })->start;
        // Pages are ascending; when trimming to the limit keep the newest rows.
        const auto fetched = std::min(page.bars.size(), limit - total);
        for (std::size_t i = page.bars.size() - fetched; i < page.bars.size(); ++i) {
            buffer.push_back(std::move(page.bars[i]));
            if (buffer.size() >= options_.batchSize) {
                flush_(buffer);
            }
        }
        total += fetched;

        if (oldest - 1 >= cursorEnd) {
            break;
        }
        cursorEnd = oldest - 1;
    }

    flush_(buffer);
    LOG_INFO("BulkCandleBackfill " << venue_ << " " << symbol << " fetched " << total << " candles");
    return total;
}

}  // namespace app
