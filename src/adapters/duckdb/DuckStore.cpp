#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr const char* kCreateTrades = R"SQL(
    CREATE TABLE IF NOT EXISTS trades (
        venue TEXT,
        market TEXT,
        symbol TEXT,
        trade_id TEXT,
        ts BIGINT,
        price DOUBLE,
        size DOUBLE,
        side TEXT
    )
)SQL";

constexpr const char* kCreateBars = R"SQL(
    CREATE TABLE IF NOT EXISTS bars (
        venue TEXT,
        market TEXT,
        symbol TEXT,
        resolution BIGINT,
        start_ts BIGINT,
        end_ts BIGINT,
        o DOUBLE,
        h DOUBLE,
        l DOUBLE,
        c DOUBLE,
        v DOUBLE,
        trades INTEGER,
        last_update BIGINT,
        PRIMARY KEY(venue, market, symbol, resolution, start_ts)
    )
)SQL";

constexpr const char* kCreateState = R"SQL(
    CREATE TABLE IF NOT EXISTS kv_state (
        key TEXT PRIMARY KEY,
        value TEXT,
        expires_at BIGINT,
        updated_at BIGINT
    )
)SQL";

constexpr const char* kCreateTradesIndex =
    "CREATE INDEX IF NOT EXISTS trades_by_symbol_ts ON trades(venue, market, symbol, ts)";

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    const fs::path path{dbPath_};
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("DuckStore: unable to create directory '" + path.parent_path().string() +
                                     "': " + ec.message());
        }
    }
    db_ = std::make_unique<::duckdb::DuckDB>(dbPath_);
}

DuckStore::~DuckStore() = default;

void DuckStore::migrate() {
    ::duckdb::Connection connection(*db_);
    for (const char* statement : {kCreateTrades, kCreateBars, kCreateState, kCreateTradesIndex}) {
        auto result = connection.Query(statement);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string("unknown migration error");
            throw std::runtime_error("DuckStore: migration failed: " + errorMessage);
        }
    }
    LOG_INFO("DuckStore migration finished for " << dbPath_);
}

}  // namespace adapters::duckdb
