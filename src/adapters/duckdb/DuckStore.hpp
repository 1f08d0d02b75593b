#pragma once

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the process's DuckDB database handle. DuckDB admits one writing
// process per file, so every store shares this instance.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/market.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    // Creates the trades, bars and kv_state tables when missing.
    void migrate();

    ::duckdb::DuckDB& database() { return *db_; }
    const std::string& path() const noexcept { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> db_;
};

}  // namespace adapters::duckdb
