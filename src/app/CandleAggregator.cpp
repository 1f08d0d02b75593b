#include "app/CandleAggregator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"

namespace app {

CandleAggregator::CandleAggregator(std::int64_t resolutionSec, std::chrono::seconds stalenessTtl)
    : resolutionSec_(resolutionSec),
      resolutionMs_(resolutionSec * 1000),
      stalenessTtlMs_(std::chrono::duration_cast<std::chrono::milliseconds>(stalenessTtl).count()) {
    if (resolutionSec <= 0) {
        throw std::invalid_argument("CandleAggregator resolution must be > 0");
    }
}

std::string CandleAggregator::key_(const domain::Trade& trade) {
    std::string key;
    key.reserve(trade.venue.size() + trade.symbol.size() + 8);
    key.append(trade.venue).append(":").append(trade.symbol).append(":");
    key.append(domain::to_string(trade.market));
    return key;
}

domain::Bar CandleAggregator::open_bar_(const domain::Trade& trade) const {
    domain::Bar bar{};
    bar.venue = trade.venue;
    bar.symbol = trade.symbol;
    bar.market = trade.market;
    bar.resolution = resolutionSec_;
    bar.start = domain::align_down_ms(trade.timestamp, resolutionMs_);
    bar.open = trade.price;
    bar.high = trade.price;
    bar.low = trade.price;
    bar.close = trade.price;
    bar.volume = trade.size;
    bar.tradeCount = 1;
    bar.lastUpdate = trade.timestamp;
    return bar;
}

domain::Bar CandleAggregator::close_bar_(const domain::Bar& bar) const {
    domain::Bar closed = bar;
    closed.end = bar.start + resolutionMs_;
    return closed;
}

std::optional<domain::Bar> CandleAggregator::process_trade(const domain::Trade& trade) {
    const auto key = key_(trade);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_.find(key);
    if (it == open_.end()) {
        open_.emplace(key, open_bar_(trade));
        return std::nullopt;
    }

    auto& bar = it->second;
    const auto barEnd = bar.start + resolutionMs_;

    if (trade.timestamp >= barEnd) {
        auto closed = close_bar_(bar);
        bar = open_bar_(trade);
        return closed;
    }

    if (trade.timestamp < bar.start) {
        ++lateTrades_;
        LOG_DEBUG("CandleAggregator res=" << resolutionSec_ << " dropped late trade key=" << key
                                          << " ts=" << trade.timestamp << " bar_start=" << bar.start);
        return std::nullopt;
    }

    bar.high = std::max(bar.high, trade.price);
    bar.low = std::min(bar.low, trade.price);
    bar.close = trade.price;
    bar.volume += trade.size;
    bar.tradeCount += 1;
    bar.lastUpdate = std::max(bar.lastUpdate, trade.timestamp);
    return std::nullopt;
}

std::vector<domain::Bar> CandleAggregator::flush_all(domain::TimestampMs nowMs) {
    std::vector<domain::Bar> flushed;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = open_.begin(); it != open_.end();) {
        const auto& bar = it->second;
        const bool complete = nowMs >= bar.start + resolutionMs_;
        const bool stale = nowMs - bar.lastUpdate > stalenessTtlMs_;
        if (complete || stale) {
            flushed.push_back(close_bar_(bar));
            it = open_.erase(it);
        } else {
            ++it;
        }
    }

    std::sort(flushed.begin(), flushed.end(), [](const domain::Bar& a, const domain::Bar& b) {
        return a.start < b.start;
    });
    return flushed;
}

std::vector<domain::Bar> CandleAggregator::close_all() {
    std::vector<domain::Bar> closed;

    std::lock_guard<std::mutex> lock(mutex_);
    closed.reserve(open_.size());
    for (const auto& entry : open_) {
        closed.push_back(close_bar_(entry.second));
    }
    open_.clear();

    std::sort(closed.begin(), closed.end(), [](const domain::Bar& a, const domain::Bar& b) {
        return a.start < b.start;
    });
    return closed;
}

std::size_t CandleAggregator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_.size();
}

std::uint64_t CandleAggregator::late_trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lateTrades_;
}

}  // namespace app
