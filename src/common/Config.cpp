#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace mdi::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::uint32_t parsePositive(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed == 0U ||
            parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("value out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid value for " + label + ": " + value);
    }
}

double parseRate(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !(parsed > 0.0)) {
            throw std::out_of_range("rate must be > 0");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid value for " + label + ": " + value);
    }
}

std::string parseStorage(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "duck" || normalized == "memory") {
        return normalized;
    }
    throw ConfigurationError("Invalid value for --storage: " + value);
}

std::string parseVenue(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "binance" || normalized == "bitget") {
        return normalized;
    }
    throw ConfigurationError("Invalid value for --venue: " + value);
}

std::vector<std::string> parseSymbols(const std::string& value) {
    std::vector<std::string> unique;
    for (auto& symbol : parseCsvList(value)) {
        auto upper = toUpper(std::move(symbol));
        if (std::find(unique.begin(), unique.end(), upper) == unique.end()) {
            unique.push_back(std::move(upper));
        }
    }
    if (unique.empty()) {
        throw ConfigurationError("Invalid value for --symbols: " + value);
    }
    return unique;
}

std::vector<domain::MarketType> parseMarkets(const std::string& value) {
    std::vector<domain::MarketType> markets;
    for (const auto& label : parseCsvList(value)) {
        const auto market = domain::market_type_from_string(label);
        if (!market) {
            throw ConfigurationError("Invalid value for --markets: " + label);
        }
        if (std::find(markets.begin(), markets.end(), *market) == markets.end()) {
            markets.push_back(*market);
        }
    }
    if (markets.empty()) {
        throw ConfigurationError("Invalid value for --markets: " + value);
    }
    return markets;
}

std::vector<std::int64_t> parseResolutions(const std::string& value) {
    std::vector<std::int64_t> resolutions;
    for (const auto& item : parseCsvList(value)) {
        const auto seconds = static_cast<std::int64_t>(parsePositive(item, "--resolutions"));
        if (std::find(resolutions.begin(), resolutions.end(), seconds) == resolutions.end()) {
            resolutions.push_back(seconds);
        }
    }
    if (resolutions.empty()) {
        throw ConfigurationError("Invalid value for --resolutions: " + value);
    }
    std::sort(resolutions.begin(), resolutions.end());
    return resolutions;
}

std::string parseBulkInterval(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (!domain::interval_seconds(normalized)) {
        throw ConfigurationError("Invalid value for --bulk-interval: " + value);
    }
    return normalized;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

void parseLevel(Config& config, const std::string& value) {
    try {
        config.logLevel = mdi::log::levelFromString(toLower(trim(value)));
    } catch (const std::invalid_argument& ex) {
        throw ConfigurationError(ex.what());
    }
}

}  // namespace

domain::TimestampMs parseDateToMs(const std::string& value) {
    std::tm tm{};
    std::istringstream input(trim(value));
    input >> std::get_time(&tm, "%Y-%m-%d");
    if (input.fail()) {
        throw ConfigurationError("Invalid date (expected YYYY-MM-DD): " + value);
    }
    tm.tm_isdst = 0;
    const auto raw = timegm(&tm);
    if (raw < 0) {
        throw ConfigurationError("Date before epoch: " + value);
    }
    return static_cast<domain::TimestampMs>(raw) * 1000;
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        parseLevel(config, envLogLevel);
    }
    if (const char* envDuck = std::getenv("DUCKDB_PATH")) {
        auto pathValue = trim(envDuck);
        if (!pathValue.empty()) {
            config.duckdbPath = std::move(pathValue);
        }
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        parseLevel(config, levelArg);
    }
    if (auto fileArg = valueFromArgs(argc, argv, "--log-file"); !fileArg.empty()) {
        config.logFile = trim(fileArg);
    }
    if (auto storageArg = valueFromArgs(argc, argv, "--storage"); !storageArg.empty()) {
        config.storage = parseStorage(storageArg);
    }
    if (auto duckArg = valueFromArgs(argc, argv, "--duckdb"); !duckArg.empty()) {
        config.duckdbPath = trim(duckArg);
    }
    if (auto venueArg = valueFromArgs(argc, argv, "--venue"); !venueArg.empty()) {
        config.venue = parseVenue(venueArg);
    }
    if (auto symbolsArg = valueFromArgs(argc, argv, "--symbols"); !symbolsArg.empty()) {
        config.symbols = parseSymbols(symbolsArg);
    }
    if (auto marketsArg = valueFromArgs(argc, argv, "--markets"); !marketsArg.empty()) {
        config.markets = parseMarkets(marketsArg);
    }
    if (auto resArg = valueFromArgs(argc, argv, "--resolutions"); !resArg.empty()) {
        config.resolutions = parseResolutions(resArg);
    }
    if (auto groupArg = valueFromArgs(argc, argv, "--max-symbols-per-connection"); !groupArg.empty()) {
        config.maxSymbolsPerConnection = parsePositive(groupArg, "--max-symbols-per-connection");
    }
    if (auto wsRpsArg = valueFromArgs(argc, argv, "--ws-rps"); !wsRpsArg.empty()) {
        config.wsRps = parseRate(wsRpsArg, "--ws-rps");
    }
    if (auto restRpsArg = valueFromArgs(argc, argv, "--rest-rps"); !restRpsArg.empty()) {
        config.restRps = parseRate(restRpsArg, "--rest-rps");
    }
    if (auto baseArg = valueFromArgs(argc, argv, "--backoff-base-ms"); !baseArg.empty()) {
        config.backoffBaseMs = parsePositive(baseArg, "--backoff-base-ms");
    }
    if (auto capArg = valueFromArgs(argc, argv, "--backoff-cap-ms"); !capArg.empty()) {
        config.backoffCapMs = parsePositive(capArg, "--backoff-cap-ms");
    }
    if (auto flushArg = valueFromArgs(argc, argv, "--flush-interval-sec"); !flushArg.empty()) {
        config.flushIntervalSec = parsePositive(flushArg, "--flush-interval-sec");
    }
    if (auto ttlArg = valueFromArgs(argc, argv, "--staleness-ttl-sec"); !ttlArg.empty()) {
        config.stalenessTtlSec = parsePositive(ttlArg, "--staleness-ttl-sec");
    }
    if (auto shutdownArg = valueFromArgs(argc, argv, "--shutdown-timeout-sec"); !shutdownArg.empty()) {
        config.shutdownTimeoutSec = parsePositive(shutdownArg, "--shutdown-timeout-sec");
    }

    if (hasFlag(argc, argv, "--backfill")) {
        config.backfill = true;
    }
    if (auto fromArg = valueFromArgs(argc, argv, "--backfill-from"); !fromArg.empty()) {
        config.backfillFrom = trim(fromArg);
    }
    if (auto stepArg = valueFromArgs(argc, argv, "--backfill-step-sec"); !stepArg.empty()) {
        config.backfillStepSec = parsePositive(stepArg, "--backfill-step-sec");
    }
    if (auto delayArg = valueFromArgs(argc, argv, "--backfill-delay-ms"); !delayArg.empty()) {
        config.backfillDelayMs = parsePositive(delayArg, "--backfill-delay-ms");
    }

    if (auto thresholdArg = valueFromArgs(argc, argv, "--health-threshold"); !thresholdArg.empty()) {
        config.healthThreshold = parsePositive(thresholdArg, "--health-threshold");
    }
    if (auto windowArg = valueFromArgs(argc, argv, "--health-window-sec"); !windowArg.empty()) {
        config.healthWindowSec = parsePositive(windowArg, "--health-window-sec");
    }
    if (auto cooldownArg = valueFromArgs(argc, argv, "--health-cooldown-sec"); !cooldownArg.empty()) {
        config.healthCooldownSec = parsePositive(cooldownArg, "--health-cooldown-sec");
    }

    if (hasFlag(argc, argv, "--bulk-candles")) {
        config.bulkCandles = true;
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--bulk-interval"); !intervalArg.empty()) {
        config.bulkInterval = parseBulkInterval(intervalArg);
    }
    if (auto limitArg = valueFromArgs(argc, argv, "--bulk-limit"); !limitArg.empty()) {
        config.bulkLimit = parsePositive(limitArg, "--bulk-limit");
    }
    if (auto batchArg = valueFromArgs(argc, argv, "--bulk-batch-size"); !batchArg.empty()) {
        config.bulkBatchSize = parsePositive(batchArg, "--bulk-batch-size");
    }

    if (config.backoffCapMs < config.backoffBaseMs) {
        throw ConfigurationError("--backoff-cap-ms must be >= --backoff-base-ms");
    }
    if (config.venue == "binance" &&
        std::find(config.markets.begin(), config.markets.end(), domain::MarketType::UsdcFutures) !=
            config.markets.end()) {
        throw ConfigurationError("Market usdcm is not supported for venue binance");
    }

    config.backfillHorizonMs = parseDateToMs(config.backfillFrom);

    if (config.storage == "duck") {
        const std::filesystem::path duckPath{config.duckdbPath};
        const auto parentDir = duckPath.parent_path();
        if (!parentDir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parentDir, ec);
            if (ec) {
                throw ConfigurationError("Unable to create DuckDB directory (" + parentDir.string() +
                                         "): " + ec.message());
            }
        }
        LOG_INFO("DuckDB path: " << duckPath.string());
    }

    return config;
}

}  // namespace mdi::common
