#pragma once

#include <optional>
#include <string>

#include "domain/Ports.hpp"
#include "domain/Types.hpp"

namespace app {

// Persists backfill cursors as JSON documents in the key-value state store.
class CursorStore {
public:
    CursorStore(domain::contracts::IStateStore& store, std::string venue);

    std::string key(const domain::Symbol& symbol, domain::MarketType market) const;

    std::optional<domain::BackfillCursor> load(const domain::Symbol& symbol, domain::MarketType market);
    bool save(const domain::BackfillCursor& cursor, domain::TimestampMs nowMs);

    static std::string encode(const domain::BackfillCursor& cursor, domain::TimestampMs nowMs);
    static std::optional<domain::BackfillCursor> decode(const std::string& text);

private:
    domain::contracts::IStateStore& store_;
    const std::string venue_;
};

}  // namespace app
