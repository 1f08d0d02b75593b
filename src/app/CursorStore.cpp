#include "app/CursorStore.hpp"

#include <utility>

#include <boost/json.hpp>

#include "adapters/json/JsonUtil.hpp"
#include "common/Log.hpp"

namespace app {

CursorStore::CursorStore(domain::contracts::IStateStore& store, std::string venue)
    : store_(store), venue_(std::move(venue)) {}

std::string CursorStore::key(const domain::Symbol& symbol, domain::MarketType market) const {
    return "backfill:" + venue_ + ":" + symbol + ":" + std::string(domain::to_string(market));
}

std::string CursorStore::encode(const domain::BackfillCursor& cursor, domain::TimestampMs nowMs) {
    boost::json::object obj;
    obj["symbol"] = cursor.symbol;
    obj["market"] = std::string(domain::to_string(cursor.market));
    obj["current"] = cursor.current;
    obj["target"] = cursor.target;
    if (cursor.resumeFrom) {
        obj["resume_from"] = *cursor.resumeFrom;
    }
    obj["progress"] = cursor.progress_percent(nowMs);
    obj["updated_at"] = nowMs;
    return boost::json::serialize(obj);
}

std::optional<domain::BackfillCursor> CursorStore::decode(const std::string& text) {
    boost::json::error_code ec;
    const auto value = boost::json::parse(text, ec);
    if (ec || !value.is_object()) {
        return std::nullopt;
    }
    const auto& obj = value.as_object();
    const auto* symbol = obj.if_contains("symbol");
    const auto* market = obj.if_contains("market");
    const auto* current = obj.if_contains("current");
    const auto* target = obj.if_contains("target");
    if (symbol == nullptr || !symbol->is_string() || market == nullptr || !market->is_string() ||
        current == nullptr || target == nullptr) {
        return std::nullopt;
    }
    const auto marketType = domain::market_type_from_string(std::string(market->as_string().c_str()));
    const auto currentMs = adapters::json::to_int64(*current);
    const auto targetMs = adapters::json::to_int64(*target);
    if (!marketType || !currentMs || !targetMs) {
        return std::nullopt;
    }

    domain::BackfillCursor cursor;
    cursor.symbol = std::string(symbol->as_string().c_str());
    cursor.market = *marketType;
    cursor.current = *currentMs;
    cursor.target = *targetMs;
    if (const auto* resume = obj.if_contains("resume_from")) {
        const auto resumeMs = adapters::json::to_int64(*resume);
        if (resumeMs && *resumeMs > cursor.current) {
            cursor.resumeFrom = *resumeMs;
        }
    }
    return cursor;
}

std::optional<domain::BackfillCursor> CursorStore::load(const domain::Symbol& symbol, domain::MarketType market) {
    const auto stored = store_.get(key(symbol, market));
    if (!stored) {
        return std::nullopt;
    }
    auto cursor = decode(*stored);
    if (!cursor) {
        LOG_WARN("CursorStore ignoring unreadable cursor at " << key(symbol, market));
    }
    return cursor;
}

bool CursorStore::save(const domain::BackfillCursor& cursor, domain::TimestampMs nowMs) {
    return store_.set(key(cursor.symbol, cursor.market), encode(cursor, nowMs));
}

}  // namespace app
