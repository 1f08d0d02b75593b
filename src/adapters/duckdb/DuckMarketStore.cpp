#include "adapters/duckdb/DuckMarketStore.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckStore.hpp"
#include "common/Log.hpp"
#include "domain/Types.hpp"

namespace adapters::duckdb {
namespace {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr const char* kInsertTrade =
    "INSERT INTO trades (venue, market, symbol, trade_id, ts, price, size, side) VALUES (?, ?, ?, ?, ?, ?, ?, ?)";
constexpr const char* kUpsertBar =
    "INSERT OR REPLACE INTO bars (venue, market, symbol, resolution, start_ts, end_ts, o, h, l, c, v, trades, "
    "last_update) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

void bind_trade(DuckdbValueVector& parameters, const domain::Trade& trade) {
    parameters.clear();
    parameters.emplace_back(trade.venue);
    parameters.emplace_back(std::string(domain::to_string(trade.market)));
    parameters.emplace_back(trade.symbol);
    parameters.emplace_back(trade.tradeId);
    parameters.emplace_back(::duckdb::Value::BIGINT(trade.timestamp));
    parameters.emplace_back(::duckdb::Value::DOUBLE(trade.price));
    parameters.emplace_back(::duckdb::Value::DOUBLE(trade.size));
    parameters.emplace_back(std::string(domain::to_string(trade.side)));
}

void bind_bar(DuckdbValueVector& parameters, const domain::Bar& bar) {
    parameters.clear();
    parameters.emplace_back(bar.venue);
    parameters.emplace_back(std::string(domain::to_string(bar.market)));
    parameters.emplace_back(bar.symbol);
    parameters.emplace_back(::duckdb::Value::BIGINT(bar.resolution));
    parameters.emplace_back(::duckdb::Value::BIGINT(bar.start));
    parameters.emplace_back(bar.end ? ::duckdb::Value::BIGINT(*bar.end) : ::duckdb::Value(::duckdb::LogicalType::BIGINT));
    parameters.emplace_back(::duckdb::Value::DOUBLE(bar.open));
    parameters.emplace_back(::duckdb::Value::DOUBLE(bar.high));
    parameters.emplace_back(::duckdb::Value::DOUBLE(bar.low));
    parameters.emplace_back(::duckdb::Value::DOUBLE(bar.close));
    parameters.emplace_back(::duckdb::Value::DOUBLE(bar.volume));
    parameters.emplace_back(::duckdb::Value::INTEGER(static_cast<std::int32_t>(bar.tradeCount)));
    parameters.emplace_back(::duckdb::Value::BIGINT(bar.lastUpdate));
}

bool execute_all(::duckdb::Connection& connection, const char* sql, std::size_t count,
                 const std::function<void(DuckdbValueVector&, std::size_t)>& bind) {
    auto statement = connection.Prepare(sql);
    if (!statement || statement->HasError()) {
        const std::string errorMessage = statement ? statement->GetError() : std::string{"failed to prepare statement"};
        LOG_WARN("DuckMarketStore failed to prepare statement error=" << errorMessage);
        return false;
    }
    DuckdbValueVector parameters;
    for (std::size_t index = 0; index < count; ++index) {
        bind(parameters, index);
        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string{"failed to execute statement"};
            LOG_WARN("DuckMarketStore write failed error=" << errorMessage);
            return false;
        }
    }
    return true;
}

template <typename Fn>
bool run_transaction(::duckdb::Connection& connection, const char* what, Fn&& body) {
    bool inTransaction = false;
    try {
        connection.BeginTransaction();
        inTransaction = true;
        if (!body(connection)) {
            connection.Rollback();
            return false;
        }
        connection.Commit();
        return true;
    } catch (const std::exception& ex) {
        LOG_WARN("DuckMarketStore " << what << " failed: " << ex.what());
        if (inTransaction) {
            try {
                connection.Rollback();
            } catch (const std::exception& rollbackError) {
                LOG_WARN("DuckMarketStore rollback failed: " << rollbackError.what());
            }
        }
        return false;
    }
}

}  // namespace

DuckMarketStore::DuckMarketStore(DuckStore& store)
    : store_(store), connection_(std::make_unique<::duckdb::Connection>(store.database())) {}

DuckMarketStore::~DuckMarketStore() = default;

template <typename Fn>
bool DuckMarketStore::in_transaction_(const char* what, Fn&& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_transaction(*connection_, what, std::forward<Fn>(body));
}

template <typename Fn>
bool DuckMarketStore::in_batch_transaction_(const char* what, Fn&& body) {
    std::unique_ptr<::duckdb::Connection> connection;
    try {
        connection = std::make_unique<::duckdb::Connection>(store_.database());
    } catch (const std::exception& ex) {
        LOG_WARN("DuckMarketStore " << what << " could not open a connection: " << ex.what());
        return false;
    }
    return run_transaction(*connection, what, std::forward<Fn>(body));
}

bool DuckMarketStore::append_trade(const domain::Trade& trade) {
    return append_trades({trade});
}

bool DuckMarketStore::append_bar(const domain::Bar& bar) {
    return append_bars({bar});
}

bool DuckMarketStore::append_trades(const std::vector<domain::Trade>& trades) {
    if (trades.empty()) {
        return true;
    }
    return in_batch_transaction_("append_trades", [&](::duckdb::Connection& connection) {
        return execute_all(connection, kInsertTrade, trades.size(),
                           [&](DuckdbValueVector& parameters, std::size_t i) { bind_trade(parameters, trades[i]); });
    });
}

bool DuckMarketStore::append_bars(const std::vector<domain::Bar>& bars) {
    if (bars.empty()) {
        return true;
    }
    return in_batch_transaction_("append_bars", [&](::duckdb::Connection& connection) {
        return execute_all(connection, kUpsertBar, bars.size(),
                           [&](DuckdbValueVector& parameters, std::size_t i) { bind_bar(parameters, bars[i]); });
    });
}

std::optional<std::string> DuckMarketStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto statement = connection_->Prepare("SELECT value, expires_at FROM kv_state WHERE key = ?");
        if (!statement || statement->HasError()) {
            LOG_WARN("DuckMarketStore get prepare failed: " << (statement ? statement->GetError() : std::string{}));
            return std::nullopt;
        }
        DuckdbValueVector parameters;
        parameters.emplace_back(key);
        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            LOG_WARN("DuckMarketStore get failed: " << (result ? result->GetError() : std::string{}));
            return std::nullopt;
        }
        auto chunk = result->Fetch();
        if (!chunk || chunk->size() == 0) {
            return std::nullopt;
        }
        const auto expires = chunk->GetValue(1, 0);
        if (!expires.IsNull() && expires.GetValue<std::int64_t>() <= domain::now_ms()) {
            return std::nullopt;
        }
        const auto value = chunk->GetValue(0, 0);
        if (value.IsNull()) {
            return std::nullopt;
        }
        return value.GetValue<std::string>();
    } catch (const std::exception& ex) {
        LOG_WARN("DuckMarketStore get '" << key << "' failed: " << ex.what());
        return std::nullopt;
    }
}

bool DuckMarketStore::set(const std::string& key, const std::string& value, std::optional<std::chrono::seconds> ttl) {
    const auto now = domain::now_ms();
    return in_transaction_("set", [&](::duckdb::Connection& connection) {
        return execute_all(connection,
                           "INSERT OR REPLACE INTO kv_state (key, value, expires_at, updated_at) VALUES (?, ?, ?, ?)",
                           1, [&](DuckdbValueVector& parameters, std::size_t) {
                               parameters.clear();
                               parameters.emplace_back(key);
                               parameters.emplace_back(value);
                               parameters.emplace_back(
                                   ttl ? ::duckdb::Value::BIGINT(now + ttl->count() * 1000)
                                       : ::duckdb::Value(::duckdb::LogicalType::BIGINT));
                               parameters.emplace_back(::duckdb::Value::BIGINT(now));
                           });
    });
}

bool DuckMarketStore::remove(const std::string& key) {
    return in_transaction_("remove", [&](::duckdb::Connection& connection) {
        return execute_all(connection, "DELETE FROM kv_state WHERE key = ?", 1,
                           [&](DuckdbValueVector& parameters, std::size_t) {
                               parameters.clear();
                               parameters.emplace_back(key);
                           });
    });
}

std::optional<std::int64_t> DuckMarketStore::count_bars(const std::string& venue,
                                                        const std::string& symbol,
                                                        std::int64_t resolution) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto statement =
            connection_->Prepare("SELECT COUNT(*) FROM bars WHERE venue = ? AND symbol = ? AND resolution = ?");
        if (!statement || statement->HasError()) {
            return std::nullopt;
        }
        DuckdbValueVector parameters;
        parameters.emplace_back(venue);
        parameters.emplace_back(symbol);
        parameters.emplace_back(::duckdb::Value::BIGINT(resolution));
        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            return std::nullopt;
        }
        auto chunk = result->Fetch();
        if (!chunk || chunk->size() == 0) {
            return std::int64_t{0};
        }
        return chunk->GetValue(0, 0).GetValue<std::int64_t>();
    } catch (const std::exception& ex) {
        LOG_WARN("DuckMarketStore count_bars failed: " << ex.what());
        return std::nullopt;
    }
}

}  // namespace adapters::duckdb
