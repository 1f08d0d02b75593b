#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "app/HealthRegistry.hpp"
#include "app/RateLimiter.hpp"
#include "common/StopSignal.hpp"
#include "domain/Ports.hpp"
#include "domain/Types.hpp"

namespace app {

struct BulkCandleOptions {
    std::size_t batchSize = 500;
    std::size_t pageLimit = 1000;
    std::size_t writeChunk = 100;
};

// Pages venue candles backward from `end` and writes them in batches, each
// batch split into chunks written concurrently.
class BulkCandleBackfill {
public:
    BulkCandleBackfill(std::string venue,
                       domain::contracts::ICandleHistory& history,
                       domain::contracts::IMarketSink& sink,
                       RateLimiter& limiter,
                       HealthRegistry& health,
                       BulkCandleOptions options = {});

    // Returns the number of candles fetched.
    std::size_t run(const domain::Symbol& symbol,
                    domain::MarketType market,
                    domain::TimestampMs endMs,
                    const std::string& interval,
                    std::size_t limit,
                    const mdi::common::StopSignal* stop = nullptr);

    std::size_t batches_flushed() const noexcept { return batches_; }

private:
    void flush_(std::vector<domain::Bar>& buffer);

    const std::string venue_;
    domain::contracts::ICandleHistory& history_;
    domain::contracts::IMarketSink& sink_;
    RateLimiter& limiter_;
    HealthRegistry& health_;
    const BulkCandleOptions options_;
    std::size_t batches_{0};
};

}  // namespace app
