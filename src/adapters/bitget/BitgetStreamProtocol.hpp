#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/StreamMessages.hpp"

namespace adapters::bitget {

struct MarketMapping {
    const char* target;
    const char* instType;
    const char* suffix;
};

// Stream path, instType and instId suffix for a market.
MarketMapping market_mapping(domain::MarketType market);

// Public trade channel on the v1 spot and mix streams. The venue expects a
// literal "ping" at least every 30 s and answers "pong".
class BitgetStreamProtocol : public domain::IStreamProtocol {
public:
    static constexpr const char* kVenue = "bitget";
    static constexpr const char* kHost = "ws.bitget.com";

    std::string venue() const override { return kVenue; }
    domain::StreamEndpoint endpoint(domain::MarketType market) const override;
    std::string subscribe_frame(const std::vector<domain::Symbol>& symbols,
                                domain::MarketType market,
                                std::uint64_t requestId) const override;
    std::optional<domain::StreamMessage> parse(std::string_view frame, domain::MarketType market) const override;

    std::optional<std::string> keepalive_frame() const override { return std::string{"ping"}; }

    static std::string inst_id(const domain::Symbol& symbol, domain::MarketType market);
    static domain::Symbol symbol_from_inst_id(std::string_view instId, domain::MarketType market);
};

}  // namespace adapters::bitget
