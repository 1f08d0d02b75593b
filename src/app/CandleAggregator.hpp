#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/Types.hpp"

namespace app {

// Turns a trade stream into bars of one resolution. Exactly one open bar per
// (venue, symbol, market); all map access is serialized by one mutex so the
// live, backfill and flush paths can share an instance.
class CandleAggregator {
public:
    static constexpr std::chrono::seconds kDefaultStalenessTtl{15 * 60};

    explicit CandleAggregator(std::int64_t resolutionSec,
                              std::chrono::seconds stalenessTtl = kDefaultStalenessTtl);

    CandleAggregator(const CandleAggregator&) = delete;
    CandleAggregator& operator=(const CandleAggregator&) = delete;

    // Returns the bar closed by this trade, if it rolled the key into a new bucket.
    std::optional<domain::Bar> process_trade(const domain::Trade& trade);

    // Closes every bar that is time-complete or has been idle longer than the TTL.
    std::vector<domain::Bar> flush_all(domain::TimestampMs nowMs = domain::now_ms());

    // Closes every open bar regardless of time, oldest first.
    std::vector<domain::Bar> close_all();

    std::size_t active_count() const;
    std::uint64_t late_trades() const;

    std::int64_t resolution() const noexcept { return resolutionSec_; }

private:
    static std::string key_(const domain::Trade& trade);
    domain::Bar open_bar_(const domain::Trade& trade) const;
    domain::Bar close_bar_(const domain::Bar& bar) const;

    const std::int64_t resolutionSec_;
    const std::int64_t resolutionMs_;
    const std::int64_t stalenessTtlMs_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Bar> open_;
    std::uint64_t lateTrades_{0};
};

}  // namespace app
