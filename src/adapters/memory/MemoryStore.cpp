#include "adapters/memory/MemoryStore.hpp"

#include <utility>

namespace adapters::memory {

MemoryStore::MemoryStore(NowFn now, std::size_t maxTrades) : now_(std::move(now)), maxTrades_(maxTrades) {
    if (!now_) {
        now_ = [] { return domain::now_ms(); };
    }
}

bool MemoryStore::append_trade(const domain::Trade& trade) {
    if (failTrades_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.push_back(trade);
    while (trades_.size() > maxTrades_) {
        trades_.pop_front();
        ++droppedTrades_;
    }
    return true;
}

bool MemoryStore::append_bar(const domain::Bar& bar) {
    if (failBars_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // Same key replaces, as the bars table's primary key does.
    bars_[BarKey{bar.venue, bar.market, bar.symbol, bar.resolution, bar.start}] = bar;
    return true;
}

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.find(key);
    if (it == state_.end()) {
        return std::nullopt;
    }
    if (it->second.expiresAt && *it->second.expiresAt <= now_()) {
        state_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

bool MemoryStore::set(const std::string& key, const std::string& value, std::optional<std::chrono::seconds> ttl) {
    if (failState_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry{value, std::nullopt};
    if (ttl) {
        entry.expiresAt = now_() + std::chrono::duration_cast<std::chrono::milliseconds>(*ttl).count();
    }
    state_[key] = std::move(entry);
    return true;
}

bool MemoryStore::remove(const std::string& key) {
    if (failState_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state_.erase(key);
    return true;
}

std::vector<domain::Trade> MemoryStore::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<domain::Trade>(trades_.begin(), trades_.end());
}

std::vector<domain::Bar> MemoryStore::bars() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::Bar> bars;
    bars.reserve(bars_.size());
    for (const auto& entry : bars_) {
        bars.push_back(entry.second);
    }
    return bars;
}

std::size_t MemoryStore::trade_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

std::size_t MemoryStore::bar_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bars_.size();
}

std::uint64_t MemoryStore::dropped_trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return droppedTrades_;
}

}  // namespace adapters::memory
