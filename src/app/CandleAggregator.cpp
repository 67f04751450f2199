#include "app/CandleAggregator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.h"

namespace app {

CandleAggregator::CandleAggregator(Config config, CandleSink sink)
    : config_(config), sink_(std::move(sink)) {
    if (config_.bucketMs <= 0) {
        throw std::invalid_argument("CandleAggregator: bucketMs must be positive");
    }
    if (config_.maxFillSpanBuckets < 1) {
        config_.maxFillSpanBuckets = 1;
    }
}

bool CandleAggregator::onTick(const domain::Tick& tick) {
    auto& metrics = slob::common::metrics::Registry::instance();
    if (tick.symbol.empty() || !std::isfinite(tick.price) || tick.price <= 0.0 || !std::isfinite(tick.size) ||
        tick.size < 0.0) {
        metrics.incrementCounter("ticks_rejected_total");
        LOG_WARN("CandleAggregator rejected malformed tick symbol='" << tick.symbol << "' price=" << tick.price
                                                                     << " size=" << tick.size);
        if (!tick.symbol.empty()) {
            ++symbols_[tick.symbol].stats.rejectedTicks;
        }
        return false;
    }

    auto& state = symbols_[tick.symbol];
    const auto bucket = domain::floorToBucketMs(tick.ts, config_.bucketMs);

    if (state.open && bucket < state.open->ts) {
        ++state.stats.rejectedTicks;
        metrics.incrementCounter("ticks_rejected_total");
        LOG_WARN("CandleAggregator dropped late tick for " << tick.symbol << " ts=" << tick.ts
                                                           << " open_bucket=" << state.open->ts);
        return false;
    }
    if (!state.open && state.lastEmittedTs && bucket <= *state.lastEmittedTs) {
        ++state.stats.rejectedTicks;
        metrics.incrementCounter("ticks_rejected_total");
        LOG_WARN("CandleAggregator dropped tick for already completed bucket " << tick.symbol << " ts=" << tick.ts);
        return false;
    }

    if (state.open && bucket > state.open->ts) {
        finalize_(state);
        fillGap_(tick.symbol, state, bucket);
    } else if (!state.open && state.lastEmittedTs) {
        fillGap_(tick.symbol, state, bucket);
    }

    if (!state.open) {
        domain::Candle candle;
        candle.symbol = tick.symbol;
        candle.ts = bucket;
        candle.o = tick.price;
        candle.h = tick.price;
        candle.l = tick.price;
        candle.c = tick.price;
        candle.v = 0.0;
        candle.tickCount = 0;
        state.open = candle;
    }

    auto& candle = *state.open;
    candle.h = std::max(candle.h, tick.price);
    candle.l = std::min(candle.l, tick.price);
    candle.c = tick.price;
    candle.v += tick.size;
    ++candle.tickCount;
    ++state.stats.ticks;
    metrics.incrementCounter("ticks_processed_total");
    return true;
}

std::size_t CandleAggregator::forceCompleteAll() {
    std::size_t emitted = 0;
    for (auto& [symbol, state] : symbols_) {
        if (state.open) {
            LOG_INFO("CandleAggregator force-completing open bucket " << symbol << " ts=" << state.open->ts);
            finalize_(state);
            ++emitted;
        }
    }
    return emitted;
}

std::optional<domain::Candle> CandleAggregator::openCandle(const std::string& symbol) const {
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::nullopt;
    }
    return it->second.open;
}

std::optional<domain::TimestampMs> CandleAggregator::lastCompleted(const std::string& symbol) const {
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::nullopt;
    }
    return it->second.lastEmittedTs;
}

CandleAggregator::SymbolStats CandleAggregator::stats(const std::string& symbol) const {
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return {};
    }
    return it->second.stats;
}

void CandleAggregator::finalize_(SymbolState& state) {
    if (!state.open) {
        return;
    }
    const domain::Candle candle = *state.open;
    state.open.reset();
    emit_(state, candle, false);
}

void CandleAggregator::fillGap_(const std::string& symbol, SymbolState& state, domain::TimestampMs nextBucket) {
    if (!state.lastEmittedTs) {
        return;
    }
    const auto span = (nextBucket - *state.lastEmittedTs) / config_.bucketMs;
    if (span <= 1) {
        return;
    }
    if (span > config_.maxFillSpanBuckets) {
        ++state.stats.largeGaps;
        LOG_WARN("CandleAggregator large gap for " << symbol << ": " << (span - 1)
                                                   << " missing buckets after ts=" << *state.lastEmittedTs
                                                   << ", not filling");
        return;
    }

    LOG_INFO("CandleAggregator filling " << (span - 1) << " gap bucket(s) for " << symbol);
    for (auto ts = *state.lastEmittedTs + config_.bucketMs; ts < nextBucket; ts += config_.bucketMs) {
        domain::Candle flat;
        flat.symbol = symbol;
        flat.ts = ts;
        flat.o = state.lastClose;
        flat.h = state.lastClose;
        flat.l = state.lastClose;
        flat.c = state.lastClose;
        flat.v = 0.0;
        flat.tickCount = 0;
        ++state.stats.gapCandles;
        emit_(state, flat, true);
    }
}

void CandleAggregator::emit_(SymbolState& state, const domain::Candle& candle, bool synthetic) {
    if (state.lastEmittedTs && candle.ts <= *state.lastEmittedTs) {
        LOG_WARN("CandleAggregator suppressed duplicate completion " << candle.symbol << " ts=" << candle.ts);
        return;
    }
    state.lastEmittedTs = candle.ts;
    state.lastClose = candle.c;
    ++state.stats.candles;
    slob::common::metrics::Registry::instance().incrementCounter("candles_completed_total");
    if (sink_) {
        sink_(candle, synthetic);
    }
}

}  // namespace app
