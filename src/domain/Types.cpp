#include "domain/Types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace domain {
namespace {

std::string to_lower_copy(std::string_view value) {
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return lower;
}

}  // namespace

std::string_view to_string(MarketType market) noexcept {
    switch (market) {
    case MarketType::Spot:
        return "spot";
    case MarketType::UsdtFutures:
        return "usdtm";
    case MarketType::CoinFutures:
        return "coinm";
    case MarketType::UsdcFutures:
        return "usdcm";
    }
    return "spot";
}

std::optional<MarketType> market_type_from_string(std::string_view value) {
    const auto normalized = to_lower_copy(value);
    if (normalized == "spot") {
        return MarketType::Spot;
    }
    if (normalized == "usdtm" || normalized == "usdt-futures" || normalized == "umcbl") {
        return MarketType::UsdtFutures;
    }
    if (normalized == "coinm" || normalized == "coin-futures" || normalized == "dmcbl") {
        return MarketType::CoinFutures;
    }
    if (normalized == "usdcm" || normalized == "usdc-futures" || normalized == "cmcbl") {
        return MarketType::UsdcFutures;
    }
    return std::nullopt;
}

std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "buy" : "sell";
}

std::optional<Side> side_from_string(std::string_view value) {
    const auto normalized = to_lower_copy(value);
    if (normalized == "buy" || normalized == "b") {
        return Side::Buy;
    }
    if (normalized == "sell" || normalized == "s") {
        return Side::Sell;
    }
    return std::nullopt;
}

std::optional<std::int64_t> interval_seconds(std::string_view label) {
    if (label == "1m") {
        return 60;
    }
    if (label == "5m") {
        return 5 * 60;
    }
    if (label == "15m") {
        return 15 * 60;
    }
    if (label == "30m") {
        return 30 * 60;
    }
    if (label == "1h") {
        return 60 * 60;
    }
    if (label == "4h") {
        return 4 * 60 * 60;
    }
    if (label == "1d") {
        return 24 * 60 * 60;
    }
    return std::nullopt;
}

double BackfillCursor::progress_percent(TimestampMs now) const noexcept {
    const auto total = now - target;
    if (total <= 0) {
        return 100.0;
    }
    const auto completed = now - current;
    const double percent = static_cast<double>(completed) * 100.0 / static_cast<double>(total);
    return std::clamp(percent, 0.0, 100.0);
}

}  // namespace domain
