#include "app/Collector.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "common/Log.hpp"

namespace app {
namespace {

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

boost::json::object connection_to_json(const ConnectionStats& stats) {
    boost::json::object obj;
    obj["group"] = stats.group;
    obj["market"] = std::string(domain::to_string(stats.market));
    obj["state"] = std::string(to_string(stats.state));
    obj["symbols"] = stats.symbols.size();
    obj["reconnects"] = stats.reconnects;
    obj["messages"] = stats.messages;
    obj["trades"] = stats.trades;
    obj["malformed"] = stats.malformed;
    obj["duplicates"] = stats.duplicates;
    obj["storage_failures"] = stats.storageFailures;
    obj["last_backoff_ms"] = stats.lastBackoff.count();
    boost::json::object lastData;
    for (const auto& [symbol, ts] : stats.lastData) {
        lastData[symbol] = ts;
    }
    obj["last_data"] = std::move(lastData);
    if (!stats.lastError.empty()) {
        obj["last_error"] = stats.lastError;
    }
    return obj;
}

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace

Collector::Collector(CollectorOptions options, VenueAdapters adapters, CollectorServices services)
    : options_(std::move(options)),
      adapters_(std::move(adapters)),
      services_(services),
      wsLimiter_(services.limiters.scope(options_.venue + "_websocket", options_.wsLimiter)),
      restLimiter_(services.limiters.scope(options_.venue + "_rest_api", options_.restLimiter)),
      dedup_(options_.dedupWindow),
      cursors_(services.state, options_.venue) {
    if (options_.symbols.empty() || options_.markets.empty()) {
        throw std::invalid_argument("Collector requires symbols and markets");
    }
    if (options_.resolutions.empty()) {
        throw std::invalid_argument("Collector requires at least one resolution");
    }
    if (adapters_.protocol.venue() != options_.venue) {
        throw std::invalid_argument("Collector venue " + options_.venue + " does not match protocol " +
                                    adapters_.protocol.venue());
    }
    // Surfaces unsupported markets as a startup error rather than a reconnect loop.
    for (const auto market : options_.markets) {
        (void)adapters_.protocol.endpoint(market);
    }

    services_.health.register_component(options_.venue + "_websocket");
    services_.health.register_component(options_.venue + "_rest_api");
    services_.health.register_component(options_.venue + "_storage");

    liveAggregators_ = make_aggregators_();
    build_streams_();
    if (options_.backfill) {
        build_backfills_();
    }

    LOG_INFO("Collector " << options_.venue << " configured streams=" << streams_.size()
                          << " backfills=" << backfills_.size() << " resolutions=" << options_.resolutions.size());
}

Collector::~Collector() {
    stop();
}

Collector::AggregatorSet Collector::make_aggregators_() const {
    AggregatorSet set;
    set.reserve(options_.resolutions.size());
    for (const auto resolution : options_.resolutions) {
        set.push_back(std::make_unique<CandleAggregator>(resolution, options_.stalenessTtl));
    }
    return set;
}

std::vector<CandleAggregator*> Collector::view_(const AggregatorSet& set) {
    std::vector<CandleAggregator*> view;
    view.reserve(set.size());
    for (const auto& aggregator : set) {
        view.push_back(aggregator.get());
    }
    return view;
}

void Collector::build_streams_() {
    const auto groupSize = std::max<std::size_t>(1, options_.maxSymbolsPerConnection);
    for (const auto market : options_.markets) {
        std::size_t index = 0;
        for (std::size_t offset = 0; offset < options_.symbols.size(); offset += groupSize, ++index) {
            const auto last = std::min(options_.symbols.size(), offset + groupSize);
            std::vector<domain::Symbol> group(options_.symbols.begin() + static_cast<std::ptrdiff_t>(offset),
                                              options_.symbols.begin() + static_cast<std::ptrdiff_t>(last));
            const auto name =
                options_.venue + ":" + std::string(domain::to_string(market)) + ":" + std::to_string(index);
            streams_.push_back(std::make_shared<StreamClient>(name,
                                                              std::move(group),
                                                              market,
                                                              adapters_.protocol,
                                                              adapters_.transportFactory,
                                                              wsLimiter_,
                                                              services_.health,
                                                              services_.sink,
                                                              view_(liveAggregators_),
                                                              services_.metrics,
                                                              options_.stream,
                                                              &dedup_));
        }
    }
}

void Collector::build_backfills_() {
    if (adapters_.tradeHistory == nullptr) {
        LOG_WARN("Collector " << options_.venue << " backfill requested without a trade history adapter");
        return;
    }
    for (const auto market : options_.markets) {
        for (const auto& symbol : options_.symbols) {
            backfillAggregators_.push_back(make_aggregators_());
            backfills_.push_back(std::make_shared<BackfillEngine>(options_.venue,
                                                                  symbol,
                                                                  market,
                                                                  *adapters_.tradeHistory,
                                                                  cursors_,
                                                                  restLimiter_,
                                                                  services_.health,
                                                                  services_.sink,
                                                                  view_(backfillAggregators_.back()),
                                                                  services_.metrics,
                                                                  options_.backfillOptions,
                                                                  &dedup_));
        }
    }
}

std::string Collector::state_key() const {
    return "collector:" + options_.venue + ":state";
}

void Collector::start() {
    if (started_.exchange(true)) {
        throw std::logic_error("Collector " + options_.venue + " already started");
    }
    running_.store(true, std::memory_order_release);
    LOG_INFO("Collector " << options_.venue << " starting");

    for (auto& stream : streams_) {
        stream->start();
    }
    for (auto& backfill : backfills_) {
        backfill->start();
    }
    flusher_ = std::make_unique<Worker>("flush:" + options_.venue, [this]() { flush_loop_(); });
    flusher_->start();
}

void Collector::flush_loop_() {
    LOG_INFO("Collector " << options_.venue << " flush ticker every " << options_.flushInterval.count() << "s");
    while (stop_.wait_for(options_.flushInterval)) {
        const auto flushed = flush_once();
        if (flushed > 0) {
            LOG_INFO("Collector " << options_.venue << " flushed " << flushed << " bars");
        }
    }
}

std::size_t Collector::flush_once(domain::TimestampMs nowMs) {
    std::lock_guard<std::mutex> lock(flushMutex_);
    std::vector<domain::Bar> bars;
    for (const auto& aggregator : liveAggregators_) {
        auto flushed = aggregator->flush_all(nowMs);
        std::move(flushed.begin(), flushed.end(), std::back_inserter(bars));
    }
    if (bars.empty()) {
        return 0;
    }
    if (!services_.sink.append_bars(bars)) {
        LOG_WARN("Collector " << options_.venue << " failed to write " << bars.size() << " flushed bars");
        services_.health.handle_failure(options_.venue + "_storage", "flush write failed");
    }
    barsFlushed_.fetch_add(bars.size(), std::memory_order_relaxed);
    return bars.size();
}

void Collector::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    LOG_INFO("Collector " << options_.venue << " stopping");

    stop_.request();
    for (auto& stream : streams_) {
        stream->stop();
    }
    for (auto& backfill : backfills_) {
        backfill->stop();
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.shutdownTimeout;
    std::size_t abandoned = 0;
    for (auto& stream : streams_) {
        if (!stream->wait_for(remaining_until(deadline))) {
            LOG_WARN("Collector " << options_.venue << " stream " << stream->group()
                                  << " did not stop in time; abandoning");
            stream->abandon();
            ++abandoned;
        }
    }
    for (auto& backfill : backfills_) {
        if (!backfill->wait_for(remaining_until(deadline))) {
            LOG_WARN("Collector " << options_.venue << " backfill " << backfill->key()
                                  << " did not stop in time; abandoning");
            backfill->abandon();
            ++abandoned;
        }
    }
    if (flusher_ && !flusher_->wait_for(remaining_until(deadline))) {
        flusher_->abandon();
        ++abandoned;
    }

    const auto flushed = flush_once();
    LOG_INFO("Collector " << options_.venue << " final flush wrote " << flushed << " bars");
    write_snapshot_(abandoned);
    LOG_INFO("Collector " << options_.venue << " stopped (abandoned tasks: " << abandoned << ")");
}

void Collector::write_snapshot_(std::size_t abandoned) {
    std::size_t openBars = 0;
    for (const auto& aggregator : liveAggregators_) {
        openBars += aggregator->active_count();
    }

    boost::json::object snapshot;
    snapshot["venue"] = options_.venue;
    snapshot["shutdown_at"] = domain::now_ms();
    snapshot["open_bars"] = openBars;
    snapshot["bars_flushed"] = barsFlushed_.load(std::memory_order_relaxed);
    snapshot["abandoned_tasks"] = abandoned;
    boost::json::array connections;
    for (const auto& stats : get_connection_stats()) {
        connections.push_back(connection_to_json(stats));
    }
    snapshot["connections"] = std::move(connections);

    if (!services_.state.set(state_key(), boost::json::serialize(snapshot))) {
        LOG_WARN("Collector " << options_.venue << " failed to persist shutdown snapshot");
        services_.health.handle_failure(options_.venue + "_storage", "shutdown snapshot write failed");
    }
}

std::vector<ConnectionStats> Collector::get_connection_stats() const {
    std::vector<ConnectionStats> all;
    all.reserve(streams_.size());
    for (const auto& stream : streams_) {
        all.push_back(stream->stats());
    }
    return all;
}

CollectorStatus Collector::get_status() const {
    CollectorStatus status;
    status.venue = options_.venue;
    status.running = running();
    for (const auto& aggregator : liveAggregators_) {
        status.activeBars[aggregator->resolution()] = aggregator->active_count();
    }
    status.barsFlushed = barsFlushed_.load(std::memory_order_relaxed);
    status.connections = get_connection_stats();
    for (const auto& backfill : backfills_) {
        status.backfills.push_back(backfill->status());
    }
    status.health = services_.health.status_all();
    status.limiters = services_.limiters.stats_all();
    status.metrics = services_.metrics.snapshot();
    return status;
}

std::string Collector::stats_json() const {
    const auto status = get_status();

    boost::json::object root;
    root["venue"] = status.venue;
    root["running"] = status.running;
    root["bars_flushed"] = status.barsFlushed;

    boost::json::object bars;
    for (const auto& [resolution, count] : status.activeBars) {
        bars[std::to_string(resolution)] = count;
    }
    root["active_bars"] = std::move(bars);

    boost::json::array connections;
    for (const auto& stats : status.connections) {
        connections.push_back(connection_to_json(stats));
    }
    root["connections"] = std::move(connections);

    boost::json::array backfills;
    for (const auto& backfill : status.backfills) {
        boost::json::object obj;
        obj["key"] = backfill.key;
        obj["running"] = backfill.running;
        obj["completed"] = backfill.completed;
        obj["failed"] = backfill.failed;
        obj["progress"] = backfill.progress;
        obj["pages"] = backfill.pages;
        obj["trades"] = backfill.trades;
        if (backfill.cursor) {
            obj["current"] = backfill.cursor->current;
            obj["target"] = backfill.cursor->target;
        }
        if (!backfill.lastError.empty()) {
            obj["last_error"] = backfill.lastError;
        }
        backfills.push_back(std::move(obj));
    }
    root["backfills"] = std::move(backfills);

    boost::json::object health;
    for (const auto& [name, component] : status.health) {
        boost::json::object obj;
        obj["state"] = std::string(to_string(component.state));
        obj["consecutive_failures"] = component.consecutiveFailures;
        obj["total_failures"] = component.totalFailures;
        if (component.lastFailure) {
            obj["last_failure"] = to_epoch_ms(*component.lastFailure);
        }
        if (component.cooldownUntil) {
            obj["cooldown_until"] = to_epoch_ms(*component.cooldownUntil);
        }
        if (!component.lastError.empty()) {
            obj["last_error"] = component.lastError;
        }
        health[name] = std::move(obj);
    }
    root["health"] = std::move(health);

    boost::json::array limiters;
    for (const auto& limiter : status.limiters) {
        boost::json::object obj;
        obj["scope"] = limiter.scope;
        obj["base_rps"] = limiter.baseRps;
        obj["current_rps"] = limiter.currentRps;
        obj["window_count"] = limiter.windowCount;
        obj["errors"] = limiter.errors;
        obj["throttles"] = limiter.throttles;
        limiters.push_back(std::move(obj));
    }
    root["limiters"] = std::move(limiters);

    boost::json::object counters;
    for (const auto& [name, counter] : status.metrics.counters) {
        counters[name] = counter.value;
    }
    boost::json::object gauges;
    for (const auto& [name, gauge] : status.metrics.gauges) {
        gauges[name] = gauge.value;
    }
    boost::json::object metrics;
    metrics["uptime_sec"] = std::chrono::duration_cast<std::chrono::seconds>(status.metrics.capturedAt -
                                                                             status.metrics.startTime)
                                .count();
    metrics["counters"] = std::move(counters);
    metrics["gauges"] = std::move(gauges);
    root["metrics"] = std::move(metrics);

    return boost::json::serialize(root);
}

}  // namespace app
