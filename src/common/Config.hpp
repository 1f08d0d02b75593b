#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "domain/Types.hpp"

namespace mdi::common {

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    mdi::log::Level logLevel = mdi::log::Level::Info;
    std::string logFile;
    std::string storage = "duck";
    std::string duckdbPath = "data/market.duckdb";

    std::string venue = "binance";
    std::vector<std::string> symbols{"BTCUSDT", "ETHUSDT", "SOLUSDT"};
    std::vector<domain::MarketType> markets{domain::MarketType::Spot, domain::MarketType::UsdtFutures};
    std::vector<std::int64_t> resolutions{1, 60, 300, 900};
    std::size_t maxSymbolsPerConnection = 50;

    double wsRps = 8.0;
    double restRps = 3.0;
    std::uint32_t backoffBaseMs = 2000;
    std::uint32_t backoffCapMs = 60000;

    std::uint32_t flushIntervalSec = 10;
    std::uint32_t stalenessTtlSec = 900;
    std::uint32_t shutdownTimeoutSec = 30;

    bool backfill = false;
    std::string backfillFrom = "2020-01-01";
    domain::TimestampMs backfillHorizonMs = 0;
    std::uint32_t backfillStepSec = 300;
    std::uint32_t backfillDelayMs = 100;

    std::uint32_t healthThreshold = 5;
    std::uint32_t healthWindowSec = 60;
    std::uint32_t healthCooldownSec = 60;

    bool bulkCandles = false;
    std::string bulkInterval = "1m";
    std::size_t bulkLimit = 5000;
    std::size_t bulkBatchSize = 500;

    static Config fromArgs(int argc, char** argv);
};

// UTC midnight of a YYYY-MM-DD date in epoch milliseconds.
domain::TimestampMs parseDateToMs(const std::string& value);

}  // namespace mdi::common
