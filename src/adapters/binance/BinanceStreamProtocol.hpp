#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/StreamMessages.hpp"

namespace adapters::binance {

// aggTrade streams on the spot, USDT-M and COIN-M websocket hosts.
class BinanceStreamProtocol : public domain::IStreamProtocol {
public:
    static constexpr const char* kVenue = "binance";

    std::string venue() const override { return kVenue; }
    domain::StreamEndpoint endpoint(domain::MarketType market) const override;
    std::string subscribe_frame(const std::vector<domain::Symbol>& symbols,
                                domain::MarketType market,
                                std::uint64_t requestId) const override;
    std::optional<domain::StreamMessage> parse(std::string_view frame, domain::MarketType market) const override;

    static std::string stream_name(const domain::Symbol& symbol);
};

}  // namespace adapters::binance
