#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "app/CandleAggregator.hpp"
#include "app/HealthRegistry.hpp"
#include "app/RateLimiter.hpp"
#include "app/TradeDeduplicator.hpp"
#include "app/Worker.hpp"
#include "common/Metrics.hpp"
#include "common/StopSignal.hpp"
#include "domain/Errors.hpp"
#include "domain/Ports.hpp"
#include "domain/StreamMessages.hpp"

namespace app {

enum class StreamState {
    Disconnected,
    Connecting,
    Subscribed,
    Streaming,
    Reconnecting,
    Closed,
};

std::string_view to_string(StreamState state) noexcept;

struct StreamClientOptions {
    std::chrono::milliseconds backoffBase{2000};
    std::chrono::milliseconds backoffCap{60000};
    bool jitter = false;
    std::chrono::milliseconds readTimeout{1000};
};

struct ConnectionStats {
    std::string group;
    std::string venue;
    domain::MarketType market{domain::MarketType::Spot};
    std::vector<domain::Symbol> symbols;
    StreamState state{StreamState::Disconnected};
    std::uint64_t reconnects{0};
    std::uint64_t messages{0};
    std::uint64_t trades{0};
    std::uint64_t malformed{0};
    std::uint64_t duplicates{0};
    std::uint64_t storageFailures{0};
    std::chrono::milliseconds lastBackoff{0};
    std::map<domain::Symbol, domain::TimestampMs> lastData;
    std::string lastError;
};

// One persistent streaming connection for a group of symbols of one market.
// Runs connect -> subscribe -> stream on its own worker and reconnects with
// capped exponential backoff until stopped.
class StreamClient : public std::enable_shared_from_this<StreamClient> {
public:
    using TransportFactory = std::function<std::unique_ptr<domain::IStreamTransport>()>;
    // Sleeps for the given delay; returns false when interrupted by stop.
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    StreamClient(std::string group,
                 std::vector<domain::Symbol> symbols,
                 domain::MarketType market,
                 const domain::IStreamProtocol& protocol,
                 TransportFactory transportFactory,
                 RateLimiter& limiter,
                 HealthRegistry& health,
                 domain::contracts::IMarketSink& sink,
                 std::vector<CandleAggregator*> aggregators,
                 mdi::common::metrics::Registry& metrics,
                 StreamClientOptions options = {},
                 TradeDeduplicator* dedup = nullptr);
    ~StreamClient();

    StreamClient(const StreamClient&) = delete;
    StreamClient& operator=(const StreamClient&) = delete;

    void set_sleeper(Sleeper sleeper);

    // Spawns the worker; the worker holds a reference to this client.
    void start();
    // Requests stop and unblocks any pending read; does not wait.
    void stop();
    bool wait_for(std::chrono::milliseconds timeout);
    void abandon();

    // The connection loop itself; returns once stopped or on a fatal error.
    void run();

    StreamState state() const noexcept { return state_.load(std::memory_order_acquire); }
    ConnectionStats stats() const;
    const std::string& group() const noexcept { return group_; }

    std::chrono::milliseconds backoff_for_attempt(std::uint32_t attempt);

private:
    void set_state_(StreamState state);
    bool session_(domain::IStreamTransport& transport);
    void handle_frame_(const std::string& frame);
    void handle_trades_(std::vector<domain::Trade> trades);
    void handle_stream_error_(const domain::StreamError& error);
    void record_error_(const std::string& message);
    void publish_transport_(std::shared_ptr<domain::IStreamTransport> transport);
    bool sleep_(std::chrono::milliseconds delay);

    const std::string group_;
    const std::vector<domain::Symbol> symbols_;
    const domain::MarketType market_;
    const domain::IStreamProtocol& protocol_;
    const TransportFactory transportFactory_;
    RateLimiter& limiter_;
    HealthRegistry& health_;
    domain::contracts::IMarketSink& sink_;
    const std::vector<CandleAggregator*> aggregators_;
    mdi::common::metrics::Registry& metrics_;
    const StreamClientOptions options_;
    TradeDeduplicator* dedup_;

    const std::string venue_;
    const std::string wsComponent_;
    const std::string storageComponent_;

    mdi::common::StopSignal stop_;
    Sleeper sleeper_;
    std::unique_ptr<Worker> worker_;
    std::atomic<StreamState> state_{StreamState::Disconnected};
    std::uint32_t attempt_{0};
    std::uint64_t requestId_{0};
    std::mt19937 rng_{std::random_device{}()};

    std::mutex transportMutex_;
    std::shared_ptr<domain::IStreamTransport> activeTransport_;

    mutable std::mutex statsMutex_;
    ConnectionStats stats_;
};

}  // namespace app
