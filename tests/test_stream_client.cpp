#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "adapters/binance/BinanceStreamProtocol.hpp"
#include "adapters/bitget/BitgetStreamProtocol.hpp"
#include "adapters/memory/MemoryStore.hpp"
#include "app/CandleAggregator.hpp"
#include "app/HealthRegistry.hpp"
#include "app/RateLimiter.hpp"
#include "app/StreamClient.hpp"
#include "app/TradeDeduplicator.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << "\n";
        ++failures;
    }
}

// One scripted connection: optionally fail on connect, then hand out frames
// and report Closed when they run out.
struct Session {
    bool failConnect = false;
    domain::ErrorKind connectError = domain::ErrorKind::TransientNetwork;
    std::deque<std::string> frames;
};

struct Script {
    std::deque<Session> sessions;
    std::vector<std::string> sent;
    int connects = 0;
};

class FakeTransport : public domain::IStreamTransport {
public:
    FakeTransport(Script& script, Session session) : script_(script), session_(std::move(session)) {}

    void connect(const domain::StreamEndpoint& endpoint) override {
        ++script_.connects;
        if (endpoint.host.empty()) {
            throw domain::FeedError(domain::ErrorKind::Configuration, "no host");
        }
        if (session_.failConnect) {
            throw domain::FeedError(session_.connectError, "scripted connect failure");
        }
    }

    void send(const std::string& frame) override { script_.sent.push_back(frame); }

    domain::ReadStatus read(std::string& out, std::chrono::milliseconds) override {
        if (closed_ || session_.frames.empty()) {
            return domain::ReadStatus::Closed;
        }
        out = session_.frames.front();
        session_.frames.pop_front();
        return domain::ReadStatus::Message;
    }

    void close() noexcept override { closed_ = true; }

private:
    Script& script_;
    Session session_;
    bool closed_ = false;
};

app::StreamClient::TransportFactory factoryFor(Script& script) {
    return [&script]() -> std::unique_ptr<domain::IStreamTransport> {
        Session session;
        if (!script.sessions.empty()) {
            session = script.sessions.front();
            script.sessions.pop_front();
        } else {
            session.failConnect = true;
        }
        return std::make_unique<FakeTransport>(script, std::move(session));
    };
}

struct Fixture {
    adapters::binance::BinanceStreamProtocol protocol;
    app::HealthRegistry health;
    app::RateLimiter limiter{"binance_websocket", app::RateLimiterOptions{}};
    adapters::memory::MemoryStore store;
    mdi::common::metrics::Registry metrics;
    app::TradeDeduplicator dedup;
    app::CandleAggregator minute{60};
    Script script;
    std::vector<std::chrono::milliseconds> sleeps;

    std::shared_ptr<app::StreamClient> makeClient(std::size_t maxSleeps) {
        auto client = std::make_shared<app::StreamClient>(
            "binance:spot:0", std::vector<domain::Symbol>{"BTCUSDT"}, domain::MarketType::Spot, protocol,
            factoryFor(script), limiter, health, store, std::vector<app::CandleAggregator*>{&minute}, metrics,
            app::StreamClientOptions{}, &dedup);
        std::weak_ptr<app::StreamClient> weak = client;
        client->set_sleeper([this, weak, maxSleeps](std::chrono::milliseconds delay) {
            sleeps.push_back(delay);
            if (sleeps.size() >= maxSleeps) {
                if (auto self = weak.lock()) {
                    self->stop();
                }
                return false;
            }
            return true;
        });
        return client;
    }
};

std::string aggTrade(long long id, long long ts, const std::string& price, bool buyerMaker = false) {
    return std::string{"{\"e\":\"aggTrade\",\"E\":"} + std::to_string(ts) + ",\"s\":\"BTCUSDT\",\"a\":" +
           std::to_string(id) + ",\"p\":\"" + price + "\",\"q\":\"0.5\",\"f\":1,\"l\":1,\"T\":" + std::to_string(ts) +
           ",\"m\":" + (buyerMaker ? "true" : "false") + "}";
}

void testBackoffDoublesAndResetsAfterConnect() {
    Fixture fx;
    Session failing;
    failing.failConnect = true;
    Session connected;
    connected.frames = {"{\"result\":null,\"id\":1}"};
    fx.script.sessions = {failing, failing, failing, connected};

    auto client = fx.makeClient(4);
    client->run();

    const std::vector<std::chrono::milliseconds> expected{std::chrono::milliseconds(2000),
                                                          std::chrono::milliseconds(4000),
                                                          std::chrono::milliseconds(8000),
                                                          std::chrono::milliseconds(2000)};
    expect(fx.sleeps == expected, "backoff is 2s, 4s, 8s, then 2s after a successful connect");
    expect(fx.script.connects == 4, "four connect attempts");
    expect(fx.script.sent.size() == 1, "subscribe sent once");
    if (!fx.script.sent.empty()) {
        expect(fx.script.sent.front().find("btcusdt@aggTrade") != std::string::npos, "subscribe names the stream");
    }
    const auto stats = client->stats();
    expect(stats.reconnects == 4, "reconnects counted");
    expect(stats.lastBackoff == std::chrono::milliseconds(2000), "last backoff recorded");
    expect(client->state() == app::StreamState::Closed, "client closed after stop");
    expect(fx.metrics.counter("reconnect_attempts_total") == 4, "reconnect counter published");
}

void testBackoffIsCapped() {
    Fixture fx;
    auto client = fx.makeClient(1);
    expect(client->backoff_for_attempt(1) == std::chrono::milliseconds(2000), "attempt 1");
    expect(client->backoff_for_attempt(5) == std::chrono::milliseconds(32000), "attempt 5");
    expect(client->backoff_for_attempt(6) == std::chrono::milliseconds(60000), "attempt 6 capped");
    expect(client->backoff_for_attempt(40) == std::chrono::milliseconds(60000), "large attempt capped");
}

void testTradesFlowToSinkAndAggregators() {
    Fixture fx;
    Session session;
    session.frames = {
        "{\"result\":null,\"id\":1}",
        aggTrade(5, 60'000, "100.0"),
        "this is not json",
        aggTrade(5, 60'000, "100.0"),
        aggTrade(6, 61'000, "101.0", true),
        "{\"e\":\"depthUpdate\",\"E\":61000,\"s\":\"BTCUSDT\",\"b\":[],\"a\":[]}",
        aggTrade(7, 120'500, "99.0"),
    };
    fx.script.sessions = {session};

    auto client = fx.makeClient(1);
    client->run();

    const auto trades = fx.store.trades();
    expect(trades.size() == 3, "duplicate trade filtered before the sink");
    if (trades.size() == 3) {
        expect(trades[0].tradeId == "5", "trade id carried");
        expect(trades[1].side == domain::Side::Sell, "buyer-maker trade is a sell");
    }
    const auto bars = fx.store.bars();
    expect(bars.size() == 1, "rolled bar written");
    if (!bars.empty()) {
        expect(bars.front().start == 60'000 && bars.front().tradeCount == 2, "bar holds the two trades");
    }
    expect(fx.minute.active_count() == 1, "next bar still open");

    const auto stats = client->stats();
    expect(stats.malformed == 1, "malformed message counted and skipped");
    expect(stats.duplicates == 1, "duplicate counted");
    expect(stats.trades == 3, "trades counted");
    expect(stats.lastData.at("BTCUSDT") == 120'500, "last data timestamp tracked");
    expect(fx.metrics.counter("messages_malformed_total") == 1, "malformed counter published");
    expect(fx.metrics.counter("trades_total") == 3, "trade counter published");
    expect(fx.health.status("binance_websocket").state == app::HealthState::Healthy, "ack keeps health green");
}

void testStorageFailureEscalates() {
    Fixture fx;
    fx.store.fail_trade_writes(true);
    Session session;
    session.frames = {"{\"result\":null,\"id\":1}", aggTrade(1, 1'000, "10.0")};
    fx.script.sessions = {session};

    auto client = fx.makeClient(1);
    client->run();

    expect(client->stats().storageFailures == 1, "storage failure counted");
    expect(fx.health.status("binance_storage").state == app::HealthState::Degraded, "storage failure escalated");
}

void testAuthenticationErrorClosesGroup() {
    Fixture fx;
    Session session;
    session.frames = {"{\"error\":{\"code\":-2015,\"msg\":\"Invalid API-key, IP, or permissions for action.\"},\"id\":1}"};
    fx.script.sessions = {session};

    auto client = fx.makeClient(5);
    client->run();

    expect(fx.sleeps.empty(), "no reconnect after an authentication error");
    expect(client->state() == app::StreamState::Closed, "group closed");
    expect(fx.health.status("binance_websocket").totalFailures == 1, "authentication escalated to health");
    expect(client->stats().lastError.find("Invalid API-key") != std::string::npos, "error recorded");
}

void testFailedOverWaitsWithoutConnecting() {
    Fixture fx;
    for (int i = 0; i < 5; ++i) {
        fx.health.handle_failure("binance_websocket", "down");
    }
    auto client = fx.makeClient(1);
    client->run();
    expect(fx.script.connects == 0, "no connect while failed over");
    expect(fx.sleeps.size() == 1 && fx.sleeps.front() > std::chrono::seconds(50), "waited out the cooldown");
}

void testBitgetSnapshotNotCountedAgainOnReconnect() {
    Fixture fx;
    adapters::bitget::BitgetStreamProtocol bitget;
    const std::string ack = R"({"event":"subscribe","arg":{"instType":"SP","channel":"trade","instId":"BTCUSDT"}})";
    const std::string snapshot =
        R"({"action":"snapshot","arg":{"instType":"SP","channel":"trade","instId":"BTCUSDT"},"data":[["1699999990000","42990.0","1","buy"],["1699999995000","42991.0","1","sell"],["1699999999000","42992.0","1","buy"]]})";
    Session first;
    first.frames = {ack, snapshot,
                    R"({"action":"update","arg":{"instType":"SP","channel":"trade","instId":"BTCUSDT"},"data":[["1700000001000","43000.0","0.5","buy"]]})"};
    Session second;
    second.frames = {ack, snapshot,
                     R"({"action":"update","arg":{"instType":"SP","channel":"trade","instId":"BTCUSDT"},"data":[["1700000002000","43001.0","0.5","sell"]]})"};
    fx.script.sessions = {first, second};

    auto client = std::make_shared<app::StreamClient>(
        "bitget:spot:0", std::vector<domain::Symbol>{"BTCUSDT"}, domain::MarketType::Spot, bitget,
        factoryFor(fx.script), fx.limiter, fx.health, fx.store, std::vector<app::CandleAggregator*>{&fx.minute},
        fx.metrics, app::StreamClientOptions{}, &fx.dedup);
    std::weak_ptr<app::StreamClient> weak = client;
    client->set_sleeper([&fx, weak](std::chrono::milliseconds delay) {
        fx.sleeps.push_back(delay);
        if (fx.sleeps.size() >= 2) {
            if (auto self = weak.lock()) {
                self->stop();
            }
            return false;
        }
        return true;
    });
    client->run();

    expect(fx.script.connects == 2, "reconnected once");
    expect(fx.store.trade_count() == 2, "only live updates stored across both sessions");
    const auto bars = fx.minute.flush_all(1'800'000'000'000);
    expect(bars.size() == 1, "one open minute");
    if (!bars.empty()) {
        expect(bars.front().tradeCount == 2 && bars.front().volume == 1.0, "bar counts each live trade once");
        expect(bars.front().open == 43000.0 && bars.front().close == 43001.0, "bar spans the live updates");
    }
}

void testClientReleasedAfterThreadedRun() {
    Fixture fx;
    std::weak_ptr<app::StreamClient> weak;
    {
        auto client = fx.makeClient(1);
        weak = client;
        client->start();
        expect(client->wait_for(std::chrono::seconds(5)), "threaded run finished");
    }
    expect(weak.expired(), "worker does not keep the client alive");
}

}  // namespace

int main() {
    testBackoffDoublesAndResetsAfterConnect();
    testBackoffIsCapped();
    testTradesFlowToSinkAndAggregators();
    testStorageFailureEscalates();
    testAuthenticationErrorClosesGroup();
    testFailedOverWaitsWithoutConnecting();
    testBitgetSnapshotNotCountedAgainOnReconnect();
    testClientReleasedAfterThreadedRun();
    return failures == 0 ? 0 : 1;
}
