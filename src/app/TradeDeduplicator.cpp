#include "app/TradeDeduplicator.hpp"

namespace app {
namespace {

std::string dedup_key(const domain::Trade& trade) {
    std::string key;
    key.reserve(trade.venue.size() + trade.symbol.size() + trade.tradeId.size() + 10);
    key.append(trade.venue).append("|");
    key.append(domain::to_string(trade.market)).append("|");
    key.append(trade.symbol).append("|").append(trade.tradeId);
    return key;
}

}  // namespace

TradeDeduplicator::TradeDeduplicator(std::chrono::seconds window, std::size_t maxEntries)
    : window_(window), maxEntries_(maxEntries == 0 ? 1 : maxEntries) {}

void TradeDeduplicator::prune_(Clock::time_point now) {
    const auto horizon = now - window_;
    while (!order_.empty() && (order_.front().first < horizon || order_.size() > maxEntries_)) {
        seen_.erase(order_.front().second);
        order_.pop_front();
    }
}

bool TradeDeduplicator::first_seen(const domain::Trade& trade) {
    if (trade.tradeId.empty()) {
        return true;
    }
    auto key = dedup_key(trade);
    const auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    prune_(now);
    if (!seen_.insert(key).second) {
        ++duplicates_;
        return false;
    }
    order_.emplace_back(now, std::move(key));
    return true;
}

std::vector<domain::Trade> TradeDeduplicator::filter(std::vector<domain::Trade> trades) {
    std::vector<domain::Trade> fresh;
    fresh.reserve(trades.size());
    for (auto& trade : trades) {
        if (first_seen(trade)) {
            fresh.push_back(std::move(trade));
        }
    }
    return fresh;
}

std::size_t TradeDeduplicator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

std::uint64_t TradeDeduplicator::duplicates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duplicates_;
}

}  // namespace app
