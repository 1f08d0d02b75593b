#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "domain/Types.hpp"

namespace app {

// Remembers venue trade ids for a bounded time window so reconnect replays
// and overlapping backfill pages are not counted twice.
class TradeDeduplicator {
public:
    explicit TradeDeduplicator(std::chrono::seconds window = std::chrono::seconds{3600},
                               std::size_t maxEntries = 500000);

    // True the first time a trade id is seen inside the window.
    bool first_seen(const domain::Trade& trade);

    // Keeps only the trades not seen before, preserving order.
    std::vector<domain::Trade> filter(std::vector<domain::Trade> trades);

    std::size_t size() const;
    std::uint64_t duplicates() const;

private:
    using Clock = std::chrono::steady_clock;

    void prune_(Clock::time_point now);

    const std::chrono::seconds window_;
    const std::size_t maxEntries_;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> seen_;
    std::deque<std::pair<Clock::time_point, std::string>> order_;
    std::uint64_t duplicates_{0};
};

}  // namespace app
