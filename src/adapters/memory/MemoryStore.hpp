#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::memory {

// In-process IMarketSink/IStateStore for dry runs and tests. Only the newest
// `maxTrades` raw trades are kept; bars are kept one per bucket. Writes can be
// made to fail on demand to exercise storage-failure paths.
class MemoryStore : public domain::contracts::IMarketSink, public domain::contracts::IStateStore {
public:
    using NowFn = std::function<domain::TimestampMs()>;

    static constexpr std::size_t kDefaultMaxTrades = 1'000'000;

    explicit MemoryStore(NowFn now = {}, std::size_t maxTrades = kDefaultMaxTrades);

    bool append_trade(const domain::Trade& trade) override;
    bool append_bar(const domain::Bar& bar) override;

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key,
             const std::string& value,
             std::optional<std::chrono::seconds> ttl = std::nullopt) override;
    bool remove(const std::string& key) override;

    void fail_trade_writes(bool fail) { failTrades_.store(fail); }
    void fail_bar_writes(bool fail) { failBars_.store(fail); }
    void fail_state_writes(bool fail) { failState_.store(fail); }

    std::vector<domain::Trade> trades() const;
    std::vector<domain::Bar> bars() const;
    std::size_t trade_count() const;
    std::size_t bar_count() const;
    std::uint64_t dropped_trades() const;

private:
    struct Entry {
        std::string value;
        std::optional<domain::TimestampMs> expiresAt;
    };

    // venue, market, symbol, resolution, start
    using BarKey = std::tuple<std::string, domain::MarketType, domain::Symbol, std::int64_t, domain::TimestampMs>;

    NowFn now_;
    const std::size_t maxTrades_;
    mutable std::mutex mutex_;
    std::deque<domain::Trade> trades_;
    std::uint64_t droppedTrades_{0};
    std::map<BarKey, domain::Bar> bars_;
    std::unordered_map<std::string, Entry> state_;
    std::atomic<bool> failTrades_{false};
    std::atomic<bool> failBars_{false};
    std::atomic<bool> failState_{false};
};

}  // namespace adapters::memory
