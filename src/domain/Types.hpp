#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace domain {

using TimestampMs = std::int64_t;
using Symbol = std::string;

enum class MarketType {
    Spot,
    UsdtFutures,
    CoinFutures,
    UsdcFutures,
};

enum class Side {
    Buy,
    Sell,
};

// Short labels used on the command line and in storage keys: spot, usdtm, coinm, usdcm.
std::string_view to_string(MarketType market) noexcept;
std::optional<MarketType> market_type_from_string(std::string_view value);

std::string_view to_string(Side side) noexcept;
std::optional<Side> side_from_string(std::string_view value);

// Candle interval labels 1m, 5m, 15m, 30m, 1h, 4h and 1d.
std::optional<std::int64_t> interval_seconds(std::string_view label);

inline TimestampMs align_down_ms(TimestampMs t, TimestampMs step) {
    if (step <= 0) {
        return t;
    }
    // Floor division, so pre-epoch timestamps still land on the bucket below.
    TimestampMs q = t / step;
    if ((t % step) != 0 && t < 0) {
        --q;
    }
    return q * step;
}

inline TimestampMs now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Created once by a parser from wire data and never mutated afterwards.
struct Trade {
    std::string venue;
    Symbol symbol;
    MarketType market{MarketType::Spot};
    double price{0.0};
    double size{0.0};
    Side side{Side::Buy};
    TimestampMs timestamp{0};
    std::string tradeId;
};

struct Bar {
    std::string venue;
    Symbol symbol;
    MarketType market{MarketType::Spot};
    std::int64_t resolution{0};  // seconds
    TimestampMs start{0};
    std::optional<TimestampMs> end{};  // set only when the bar is closed
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
    std::uint32_t tradeCount{0};
    TimestampMs lastUpdate{0};

    bool closed() const noexcept { return end.has_value(); }
};

struct BackfillCursor {
    Symbol symbol;
    MarketType market{MarketType::Spot};
    TimestampMs current{0};  // walks backward; raw trades at or above it are stored
    TimestampMs target{0};   // historical horizon
    // Set when a bar straddles `current`: bars are only complete at or above
    // this point, so a resumed walk refetches [current, resumeFrom).
    std::optional<TimestampMs> resumeFrom;

    // Share of [target, now] already covered, clamped to [0, 100].
    double progress_percent(TimestampMs now) const noexcept;
};

}  // namespace domain
