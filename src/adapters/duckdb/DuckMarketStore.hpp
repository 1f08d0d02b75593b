#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace duckdb {
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

class DuckStore;

// Trades, closed bars and key/value state in one DuckDB file. Each trade or
// bar batch is one transaction on a connection of its own, so concurrent
// batch writers proceed in parallel; key/value calls share one connection.
class DuckMarketStore : public domain::contracts::IMarketSink, public domain::contracts::IStateStore {
public:
    explicit DuckMarketStore(DuckStore& store);
    ~DuckMarketStore() override;

    bool append_trade(const domain::Trade& trade) override;
    bool append_bar(const domain::Bar& bar) override;
    bool append_trades(const std::vector<domain::Trade>& trades) override;
    bool append_bars(const std::vector<domain::Bar>& bars) override;

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key,
             const std::string& value,
             std::optional<std::chrono::seconds> ttl = std::nullopt) override;
    bool remove(const std::string& key) override;

    std::optional<std::int64_t> count_bars(const std::string& venue,
                                           const std::string& symbol,
                                           std::int64_t resolution);

private:
    template <typename Fn>
    bool in_transaction_(const char* what, Fn&& body);
    template <typename Fn>
    bool in_batch_transaction_(const char* what, Fn&& body);

    DuckStore& store_;
    std::mutex mutex_;
    std::unique_ptr<::duckdb::Connection> connection_;
};

}  // namespace adapters::duckdb
