#include "app/StreamClient.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "common/Log.hpp"

namespace app {
namespace {

constexpr std::uint32_t kMaxBackoffExponent = 16;

double state_gauge(StreamState state) {
    return static_cast<double>(static_cast<int>(state));
}

}  // namespace

std::string_view to_string(StreamState state) noexcept {
    switch (state) {
    case StreamState::Disconnected:
        return "disconnected";
    case StreamState::Connecting:
        return "connecting";
    case StreamState::Subscribed:
        return "subscribed";
    case StreamState::Streaming:
        return "streaming";
    case StreamState::Reconnecting:
        return "reconnecting";
    case StreamState::Closed:
        return "closed";
    }
    return "unknown";
}

StreamClient::StreamClient(std::string group,
                           std::vector<domain::Symbol> symbols,
                           domain::MarketType market,
                           const domain::IStreamProtocol& protocol,
                           TransportFactory transportFactory,
                           RateLimiter& limiter,
                           HealthRegistry& health,
                           domain::contracts::IMarketSink& sink,
                           std::vector<CandleAggregator*> aggregators,
                           mdi::common::metrics::Registry& metrics,
                           StreamClientOptions options,
                           TradeDeduplicator* dedup)
    : group_(std::move(group)),
      symbols_(std::move(symbols)),
      market_(market),
      protocol_(protocol),
      transportFactory_(std::move(transportFactory)),
      limiter_(limiter),
      health_(health),
      sink_(sink),
      aggregators_(std::move(aggregators)),
      metrics_(metrics),
      options_(options),
      dedup_(dedup),
      venue_(protocol.venue()),
      wsComponent_(protocol.venue() + "_websocket"),
      storageComponent_(protocol.venue() + "_storage") {
    if (symbols_.empty()) {
        throw std::invalid_argument("StreamClient " + group_ + " requires at least one symbol");
    }
    if (!transportFactory_) {
        throw std::invalid_argument("StreamClient " + group_ + " requires a transport factory");
    }

    stats_.group = group_;
    stats_.venue = venue_;
    stats_.market = market_;
    stats_.symbols = symbols_;

    health_.register_component(wsComponent_);
    health_.register_component(storageComponent_);
    metrics_.setGauge("ws_state." + group_, state_gauge(StreamState::Disconnected));
}

StreamClient::~StreamClient() {
    stop();
}

void StreamClient::set_sleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

void StreamClient::start() {
    if (worker_) {
        throw std::logic_error("StreamClient " + group_ + " already started");
    }
    stop_.reset();
    auto self = shared_from_this();
    worker_ = std::make_unique<Worker>("stream:" + group_, [self]() { self->run(); });
    worker_->start();
}

void StreamClient::stop() {
    stop_.request();
    std::shared_ptr<domain::IStreamTransport> transport;
    {
        std::lock_guard<std::mutex> lock(transportMutex_);
        transport = activeTransport_;
    }
    if (transport) {
        transport->close();
    }
}

bool StreamClient::wait_for(std::chrono::milliseconds timeout) {
    return !worker_ || worker_->wait_for(timeout);
}

void StreamClient::abandon() {
    if (worker_) {
        worker_->abandon();
    }
}

ConnectionStats StreamClient::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    auto copy = stats_;
    copy.state = state();
    return copy;
}

void StreamClient::set_state_(StreamState state) {
    const auto previous = state_.exchange(state, std::memory_order_acq_rel);
    if (previous == state) {
        return;
    }
    metrics_.setGauge("ws_state." + group_, state_gauge(state));
    LOG_DEBUG("StreamClient " << group_ << " " << to_string(previous) << " -> " << to_string(state));
}

std::chrono::milliseconds StreamClient::backoff_for_attempt(std::uint32_t attempt) {
    if (attempt == 0) {
        return std::chrono::milliseconds{0};
    }
    const auto exponent = std::min(attempt - 1, kMaxBackoffExponent);
    auto delay = options_.backoffBase * (std::int64_t{1} << exponent);
    delay = std::min(delay, options_.backoffCap);
    if (options_.jitter && delay.count() > 1) {
        std::uniform_int_distribution<std::int64_t> jitterDist(0, delay.count() / 2);
        delay = std::min(delay + std::chrono::milliseconds(jitterDist(rng_)), options_.backoffCap);
    }
    return delay;
}

bool StreamClient::sleep_(std::chrono::milliseconds delay) {
    if (sleeper_) {
        return sleeper_(delay);
    }
    return stop_.wait_for(delay);
}

void StreamClient::publish_transport_(std::shared_ptr<domain::IStreamTransport> transport) {
    std::lock_guard<std::mutex> lock(transportMutex_);
    activeTransport_ = std::move(transport);
}

void StreamClient::record_error_(const std::string& message) {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_.lastError = message;
}

void StreamClient::run() {
    LOG_INFO("StreamClient " << group_ << " starting symbols=" << symbols_.size()
                             << " market=" << domain::to_string(market_));

    while (!stop_.requested()) {
        if (!health_.allows_work(wsComponent_)) {
            const auto remaining = std::max(health_.cooldown_remaining(wsComponent_), std::chrono::milliseconds{100});
            LOG_WARN("StreamClient " << group_ << " " << wsComponent_ << " failed over; waiting "
                                     << remaining.count() << "ms before connecting");
            if (!sleep_(remaining)) {
                break;
            }
            continue;
        }

        set_state_(StreamState::Connecting);
        std::shared_ptr<domain::IStreamTransport> transport = transportFactory_();
        publish_transport_(transport);

        bool keepGoing = true;
        if (!stop_.requested()) {
            keepGoing = session_(*transport);
        }

        transport->close();
        publish_transport_(nullptr);

        if (!keepGoing || stop_.requested()) {
            break;
        }

        ++attempt_;
        const auto delay = backoff_for_attempt(attempt_);
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            ++stats_.reconnects;
            stats_.lastBackoff = delay;
        }
        metrics_.incrementCounter("reconnect_attempts_total");
        set_state_(StreamState::Reconnecting);
        LOG_INFO("StreamClient " << group_ << " reconnect attempt=" << attempt_ << " wait_ms=" << delay.count());
        if (!sleep_(delay)) {
            break;
        }
    }

    set_state_(StreamState::Closed);
    LOG_INFO("StreamClient " << group_ << " stopped");
}

bool StreamClient::session_(domain::IStreamTransport& transport) {
    try {
        const auto endpoint = protocol_.endpoint(market_);
        LOG_INFO("StreamClient " << group_ << " connecting to " << endpoint.host << ":" << endpoint.port
                                 << endpoint.target);
        transport.connect(endpoint);
        attempt_ = 0;

        if (!limiter_.acquire(&stop_)) {
            return true;
        }
        transport.send(protocol_.subscribe_frame(symbols_, market_, ++requestId_));
        set_state_(StreamState::Subscribed);
        LOG_INFO("StreamClient " << group_ << " subscribe sent for " << symbols_.size() << " symbols");

        const auto keepalive = protocol_.keepalive_frame();
        auto lastKeepalive = std::chrono::steady_clock::now();

        std::string frame;
        while (!stop_.requested()) {
            frame.clear();
            const auto status = transport.read(frame, options_.readTimeout);
            if (status == domain::ReadStatus::Closed) {
                LOG_WARN("StreamClient " << group_ << " connection closed by peer");
                record_error_("connection closed by peer");
                return true;
            }
            if (status == domain::ReadStatus::Message) {
                {
                    std::lock_guard<std::mutex> lock(statsMutex_);
                    ++stats_.messages;
                }
                handle_frame_(frame);
            }

            if (keepalive) {
                const auto now = std::chrono::steady_clock::now();
                if (now - lastKeepalive >= protocol_.keepalive_interval()) {
                    transport.send(*keepalive);
                    lastKeepalive = now;
                }
            }
        }
        return true;
    } catch (const domain::FeedError& ex) {
        record_error_(ex.what());
        if (stop_.requested()) {
            return true;
        }
        limiter_.report_error(ex.kind(), ex.what());
        if (ex.kind() == domain::ErrorKind::Authentication) {
            health_.handle_failure(wsComponent_, ex.what());
            LOG_ERR("StreamClient " << group_ << " authentication failure, closing group: " << ex.what());
            return false;
        }
        LOG_WARN("StreamClient " << group_ << " connection error (" << domain::to_string(ex.kind())
                                 << "): " << ex.what());
        return true;
    } catch (const std::exception& ex) {
        record_error_(ex.what());
        if (!stop_.requested()) {
            limiter_.report_error(domain::ErrorKind::TransientNetwork, ex.what());
            LOG_WARN("StreamClient " << group_ << " connection error: " << ex.what());
        }
        return true;
    }
}

void StreamClient::handle_frame_(const std::string& frame) {
    std::optional<domain::StreamMessage> message;
    try {
        message = protocol_.parse(frame, market_);
    } catch (const domain::FeedError& ex) {
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            ++stats_.malformed;
        }
        metrics_.incrementCounter("messages_malformed_total");
        LOG_WARN("StreamClient " << group_ << " skipped malformed message: " << ex.what());
        return;
    }
    if (!message) {
        return;
    }

    if (const auto* ack = std::get_if<domain::SubscribeAck>(&*message)) {
        set_state_(StreamState::Streaming);
        limiter_.report_success();
        health_.record_success(wsComponent_);
        LOG_INFO("StreamClient " << group_ << " subscription confirmed " << ack->detail);
        return;
    }
    if (const auto* error = std::get_if<domain::StreamError>(&*message)) {
        handle_stream_error_(*error);
        return;
    }
    if (auto* update = std::get_if<domain::TradeUpdate>(&*message)) {
        if (state() == StreamState::Subscribed) {
            set_state_(StreamState::Streaming);
            health_.record_success(wsComponent_);
        }
        handle_trades_(std::move(update->trades));
        return;
    }
    if (const auto* book = std::get_if<domain::OrderbookUpdate>(&*message)) {
        LOG_DEBUG("StreamClient " << group_ << " orderbook update " << book->symbol);
    }
}

void StreamClient::handle_stream_error_(const domain::StreamError& error) {
    const auto text = error.message + (error.code ? " (code " + std::to_string(*error.code) + ")" : "");
    record_error_(text);
    limiter_.report_error(error.kind, error.message);
    if (error.kind == domain::ErrorKind::Authentication) {
        // Ends the session; run() treats it as fatal for this group.
        throw domain::FeedError(domain::ErrorKind::Authentication, "venue rejected subscription: " + text);
    }
    LOG_WARN("StreamClient " << group_ << " venue error: " << text);
}

void StreamClient::handle_trades_(std::vector<domain::Trade> trades) {
    if (trades.empty()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        for (const auto& trade : trades) {
            auto& last = stats_.lastData[trade.symbol];
            last = std::max(last, trade.timestamp);
        }
    }

    const auto received = trades.size();
    if (dedup_ != nullptr) {
        trades = dedup_->filter(std::move(trades));
    }
    const auto duplicates = received - trades.size();
    if (trades.empty()) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.duplicates += duplicates;
        return;
    }

    bool stored = sink_.append_trades(trades);

    std::vector<domain::Bar> closed;
    for (const auto& trade : trades) {
        for (auto* aggregator : aggregators_) {
            if (auto bar = aggregator->process_trade(trade)) {
                closed.push_back(std::move(*bar));
            }
        }
    }
    if (!closed.empty()) {
        stored = sink_.append_bars(closed) && stored;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.trades += trades.size();
        stats_.duplicates += duplicates;
        if (!stored) {
            ++stats_.storageFailures;
        }
    }
    metrics_.incrementCounter("trades_total", trades.size());

    if (!stored) {
        LOG_WARN("StreamClient " << group_ << " storage write failed for " << trades.size() << " trades / "
                                 << closed.size() << " bars");
        health_.handle_failure(storageComponent_, "stream write failed for group " + group_);
    }
}

}  // namespace app
