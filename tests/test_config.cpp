#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "common/Config.hpp"

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << "\n";
        ++failures;
    }
}

struct EnvGuard {
    explicit EnvGuard(std::string name) : name(std::move(name)) {
        const char* current = std::getenv(this->name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

mdi::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return mdi::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool rejects(const std::vector<std::string>& args) {
    try {
        (void)runConfig(args);
    } catch (const mdi::common::ConfigurationError&) {
        return true;
    }
    return false;
}

void testDefaults() {
    auto config = runConfig({"app", "--storage", "memory"});
    expect(config.venue == "binance", "default venue");
    expect(config.symbols.size() == 3 && config.symbols.front() == "BTCUSDT", "default symbols");
    expect(config.markets.size() == 2, "spot and usdt-m by default");
    expect(config.resolutions == std::vector<std::int64_t>({1, 60, 300, 900}), "default resolutions");
    expect(config.maxSymbolsPerConnection == 50, "default group size");
    expect(config.wsRps == 8.0 && config.restRps == 3.0, "default rates");
    expect(config.backoffBaseMs == 2000 && config.backoffCapMs == 60000, "default backoff");
    expect(!config.backfill && !config.bulkCandles, "modes off by default");
    expect(config.backfillHorizonMs == 1577836800000LL, "default horizon is 2020-01-01");
}

void testFlagsParsed() {
    auto config = runConfig({"app", "--storage=memory", "--venue", "Bitget", "--symbols", "ethusdt, btcusdt,ETHUSDT",
                             "--markets", "spot,coinm", "--resolutions", "300,60,60", "--max-symbols-per-connection",
                             "2", "--ws-rps", "2.5", "--backfill", "--backfill-from", "2024-03-01",
                             "--bulk-candles", "--bulk-interval", "1H", "--health-threshold", "3"});
    expect(config.venue == "bitget", "venue normalised");
    expect(config.symbols == std::vector<std::string>({"ETHUSDT", "BTCUSDT"}), "symbols upper-cased and unique");
    expect(config.markets.size() == 2 && config.markets.back() == domain::MarketType::CoinFutures, "markets parsed");
    expect(config.resolutions == std::vector<std::int64_t>({60, 300}), "resolutions sorted and unique");
    expect(config.maxSymbolsPerConnection == 2, "group size");
    expect(config.wsRps == 2.5, "ws rate");
    expect(config.backfill && config.bulkCandles, "mode switches");
    expect(config.backfillHorizonMs == 1709251200000LL, "horizon from date");
    expect(config.bulkInterval == "1h", "interval normalised");
    expect(config.healthThreshold == 3, "health threshold");
}

void testInvalidValuesRejected() {
    expect(rejects({"app", "--storage", "memory", "--venue", "kraken"}), "unknown venue");
    expect(rejects({"app", "--storage", "sqlite"}), "unknown storage");
    expect(rejects({"app", "--storage", "memory", "--markets", "options"}), "unknown market");
    expect(rejects({"app", "--storage", "memory", "--resolutions", "60,0"}), "zero resolution");
    expect(rejects({"app", "--storage", "memory", "--ws-rps", "-1"}), "negative rate");
    expect(rejects({"app", "--storage", "memory", "--max-symbols-per-connection", "ten"}), "non-numeric size");
    expect(rejects({"app", "--storage", "memory", "--backoff-base-ms", "5000", "--backoff-cap-ms", "1000"}),
           "cap below base");
    expect(rejects({"app", "--storage", "memory", "--markets", "usdcm"}), "usdc-m on binance");
    expect(!rejects({"app", "--storage", "memory", "--venue", "bitget", "--markets", "usdcm"}), "usdc-m on bitget");
    expect(rejects({"app", "--storage", "memory", "--backfill-from", "yesterday"}), "bad date");
    expect(rejects({"app", "--storage", "memory", "--bulk-interval", "7m"}), "unsupported interval");
    expect(rejects({"app", "--storage", "memory", "--log-level", "chatty"}), "unknown log level");
}

void testLogLevelPrecedence() {
    EnvGuard levelGuard("LOG_LEVEL");
    levelGuard.set("warn");
    expect(runConfig({"app", "--storage", "memory"}).logLevel == mdi::log::Level::Warn, "env level");
    expect(runConfig({"app", "--storage", "memory", "--log-level", "debug"}).logLevel == mdi::log::Level::Debug,
           "flag beats env");
}

void testDuckdbPathPrecedence() {
    EnvGuard envGuard("DUCKDB_PATH");
    const std::string flagPath = "/tmp/mdi_config_test/flag/market.duckdb";
    const std::string envPath = "/tmp/mdi_config_test/env/market.duckdb";

    // Environment variable overrides default.
    envGuard.set(envPath);
    std::filesystem::remove_all(std::filesystem::path(envPath).parent_path());
    auto configEnv = runConfig({"app"});
    expect(configEnv.duckdbPath == envPath, "env DuckDB path");
    expect(std::filesystem::exists(std::filesystem::path(envPath).parent_path()), "env parent created");

    // CLI flag overrides environment variable.
    auto configFlag = runConfig({"app", "--duckdb", flagPath});
    expect(configFlag.duckdbPath == flagPath, "flag DuckDB path");
    expect(std::filesystem::exists(std::filesystem::path(flagPath).parent_path()), "flag parent created");

    envGuard.clear();
    std::filesystem::remove_all("/tmp/mdi_config_test");
}

void testParseDate() {
    expect(mdi::common::parseDateToMs("1970-01-02") == 86400000LL, "one day after epoch");
    expect(mdi::common::parseDateToMs(" 2020-01-01 ") == 1577836800000LL, "surrounding spaces trimmed");
    bool threw = false;
    try {
        (void)mdi::common::parseDateToMs("01/02/2020");
    } catch (const mdi::common::ConfigurationError&) {
        threw = true;
    }
    expect(threw, "wrong date format rejected");
}

}  // namespace

int main() {
    testDefaults();
    testFlagsParsed();
    testInvalidValuesRejected();
    testLogLevelPrecedence();
    testDuckdbPathPrecedence();
    testParseDate();
    return failures == 0 ? 0 : 1;
}
