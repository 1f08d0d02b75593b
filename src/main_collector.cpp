#include <cstdlib>
#include <csignal>
#include <cstdio>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "adapters/binance/BinanceRestClient.hpp"
#include "adapters/binance/BinanceStreamProtocol.hpp"
#include "adapters/bitget/BitgetRestClient.hpp"
#include "adapters/bitget/BitgetStreamProtocol.hpp"
#include "adapters/duckdb/DuckMarketStore.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/memory/MemoryStore.hpp"
#include "app/BulkCandleBackfill.hpp"
#include "app/Collector.hpp"
#include "app/HealthRegistry.hpp"
#include "app/RateLimiter.hpp"
#include "app/Worker.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "common/StopSignal.hpp"
#include "infra/net/WsTransport.hpp"

namespace {

constexpr int kExitConfiguration = 2;

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

std::string joinMarkets(const std::vector<domain::MarketType>& markets) {
    std::vector<std::string> labels;
    for (auto market : markets) {
        labels.emplace_back(domain::to_string(market));
    }
    return joinList(labels);
}

struct VenueBundle {
    std::unique_ptr<domain::IStreamProtocol> protocol;
    std::unique_ptr<domain::contracts::ITradeHistory> trades;
    domain::contracts::ICandleHistory* candles = nullptr;
};

VenueBundle makeVenue(const std::string& venue) {
    VenueBundle bundle;
    if (venue == "bitget") {
        auto rest = std::make_unique<adapters::bitget::BitgetRestClient>();
        bundle.candles = rest.get();
        bundle.trades = std::move(rest);
        bundle.protocol = std::make_unique<adapters::bitget::BitgetStreamProtocol>();
    } else {
        auto rest = std::make_unique<adapters::binance::BinanceRestClient>();
        bundle.candles = rest.get();
        bundle.trades = std::move(rest);
        bundle.protocol = std::make_unique<adapters::binance::BinanceStreamProtocol>();
    }
    return bundle;
}

void waitForSignal(const std::function<bool()>& done = {}) {
    while (gSignalStatus == 0 && !(done && done())) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int runBulkCandles(const mdi::common::Config& config,
                   domain::contracts::ICandleHistory& history,
                   domain::contracts::IMarketSink& sink,
                   app::HealthRegistry& health,
                   app::RateLimiterRegistry& limiters) {
    const std::string restComponent = config.venue + "_rest_api";
    health.register_component(restComponent);
    health.register_component(config.venue + "_storage");

    app::RateLimiterOptions restOptions{};
    restOptions.baseRps = config.restRps;
    auto& limiter = limiters.scope(restComponent, restOptions);

    app::BulkCandleOptions options{};
    options.batchSize = config.bulkBatchSize;
    app::BulkCandleBackfill bulk(config.venue, history, sink, limiter, health, options);

    mdi::common::StopSignal stop;
    std::size_t total = 0;
    app::Worker worker("bulk-candles", [&] {
        const auto endMs = domain::now_ms();
        for (const auto market : config.markets) {
            for (const auto& symbol : config.symbols) {
                if (stop.requested()) {
                    return;
                }
                total += bulk.run(symbol, market, endMs, config.bulkInterval, config.bulkLimit, &stop);
            }
        }
    });
    worker.start();

    waitForSignal([&worker] { return worker.finished(); });
    if (gSignalStatus != 0) {
        LOG_INFO("Signal " << gSignalStatus << " received, stopping bulk candle backfill");
        stop.request();
    }
    if (!worker.wait_for(std::chrono::seconds(config.shutdownTimeoutSec))) {
        LOG_WARN("Bulk candle backfill did not finish within the shutdown timeout");
        worker.abandon();
        return EXIT_FAILURE;
    }

    LOG_INFO("Bulk candle backfill finished: " << total << " candles in " << bulk.batches_flushed() << " batches");
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    mdi::common::Config config;
    try {
        config = mdi::common::Config::fromArgs(argc, argv);
    } catch (const mdi::common::ConfigurationError& ex) {
        std::fprintf(stderr, "Configuration error: %s\n", ex.what());
        return kExitConfiguration;
    }

    try {
        mdi::log::setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            mdi::log::setOutputFile(config.logFile);
        }

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Venue: " << config.venue);
        LOG_INFO("  Symbols: " << joinList(config.symbols));
        LOG_INFO("  Markets: " << joinMarkets(config.markets));
        LOG_INFO("  Log level: " << mdi::log::levelToString(config.logLevel));
        LOG_INFO("  Storage: " << config.storage);
        LOG_INFO("  WS rps: " << config.wsRps << ", REST rps: " << config.restRps);
        LOG_INFO("  Backoff: " << config.backoffBaseMs << "-" << config.backoffCapMs << " ms");
        LOG_INFO("  Backfill: " << (config.backfill ? "on from " + config.backfillFrom : std::string{"off"}));

        std::unique_ptr<adapters::duckdb::DuckStore> duckStore;
        std::unique_ptr<adapters::duckdb::DuckMarketStore> duckMarket;
        std::unique_ptr<adapters::memory::MemoryStore> memoryStore;
        domain::contracts::IMarketSink* sink = nullptr;
        domain::contracts::IStateStore* state = nullptr;
        if (config.storage == "duck") {
            duckStore = std::make_unique<adapters::duckdb::DuckStore>(config.duckdbPath);
            duckStore->migrate();
            duckMarket = std::make_unique<adapters::duckdb::DuckMarketStore>(*duckStore);
            sink = duckMarket.get();
            state = duckMarket.get();
            LOG_INFO("Market store: DuckDB -> " << config.duckdbPath);
        } else {
            memoryStore = std::make_unique<adapters::memory::MemoryStore>();
            sink = memoryStore.get();
            state = memoryStore.get();
            LOG_INFO("Market store: in-memory (nothing is persisted, newest "
                     << adapters::memory::MemoryStore::kDefaultMaxTrades << " trades kept)");
        }

        app::HealthOptions healthOptions{};
        healthOptions.threshold = config.healthThreshold;
        healthOptions.window = std::chrono::seconds(config.healthWindowSec);
        healthOptions.cooldown = std::chrono::seconds(config.healthCooldownSec);
        app::HealthRegistry health(healthOptions);
        app::RateLimiterRegistry limiters;
        mdi::common::metrics::Registry metrics;

        auto venue = makeVenue(config.venue);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        if (config.bulkCandles) {
            return runBulkCandles(config, *venue.candles, *sink, health, limiters);
        }

        app::CollectorOptions options{};
        options.venue = config.venue;
        options.symbols = config.symbols;
        options.markets = config.markets;
        options.resolutions = config.resolutions;
        options.maxSymbolsPerConnection = config.maxSymbolsPerConnection;
        options.wsLimiter.baseRps = config.wsRps;
        options.restLimiter.baseRps = config.restRps;
        options.stream.backoffBase = std::chrono::milliseconds(config.backoffBaseMs);
        options.stream.backoffCap = std::chrono::milliseconds(config.backoffCapMs);
        options.stream.jitter = true;
        options.backfill = config.backfill;
        options.backfillOptions.step = std::chrono::seconds(config.backfillStepSec);
        options.backfillOptions.delay = std::chrono::milliseconds(config.backfillDelayMs);
        options.backfillOptions.horizonMs = config.backfillHorizonMs;
        options.flushInterval = std::chrono::seconds(config.flushIntervalSec);
        options.stalenessTtl = std::chrono::seconds(config.stalenessTtlSec);
        options.shutdownTimeout = std::chrono::seconds(config.shutdownTimeoutSec);

        app::VenueAdapters adapters{*venue.protocol,
                                    [] { return std::make_unique<infra::net::WsTransport>(); },
                                    venue.trades.get()};
        app::CollectorServices services{health, limiters, metrics, *sink, *state};

        app::Collector collector(std::move(options), std::move(adapters), services);
        collector.start();
        LOG_INFO("Collector running with " << collector.stream_count() << " connections and "
                                           << collector.backfill_count() << " backfill tasks");

        waitForSignal();

        LOG_INFO("Signal " << gSignalStatus << " received, stopping collector...");
        collector.stop();
        LOG_INFO("Final status: " << collector.stats_json());
        LOG_INFO("Shutdown complete");
    } catch (const mdi::common::ConfigurationError& ex) {
        LOG_ERR("Configuration error: " << ex.what());
        return kExitConfiguration;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal collector error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
