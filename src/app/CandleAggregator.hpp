#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

#include "domain/Models.hpp"

namespace app {

class CandleAggregator {
public:
    struct Config {
        std::int64_t bucketMs{60'000};
        // A gap spanning up to this many buckets is filled with flat candles.
        std::int64_t maxFillSpanBuckets{2};
    };

    struct SymbolStats {
        std::uint64_t ticks{0};
        std::uint64_t rejectedTicks{0};
        std::uint64_t candles{0};
        std::uint64_t gapCandles{0};
        std::uint64_t largeGaps{0};
    };

    using CandleSink = std::function<void(const domain::Candle& candle, bool synthetic)>;

    CandleAggregator(Config config, CandleSink sink);

    // Returns false when the tick was rejected.
    bool onTick(const domain::Tick& tick);

    // Finalizes every open bucket. Returns the number of candles emitted.
    std::size_t forceCompleteAll();

    std::optional<domain::Candle> openCandle(const std::string& symbol) const;
    std::optional<domain::TimestampMs> lastCompleted(const std::string& symbol) const;
    SymbolStats stats(const std::string& symbol) const;

private:
    struct SymbolState {
        std::optional<domain::Candle> open;
        std::optional<domain::TimestampMs> lastEmittedTs;
        double lastClose{0.0};
        SymbolStats stats;
    };

    void finalize_(SymbolState& state);
    void fillGap_(const std::string& symbol, SymbolState& state, domain::TimestampMs nextBucket);
    void emit_(SymbolState& state, const domain::Candle& candle, bool synthetic);

    Config config_;
    CandleSink sink_;
    std::unordered_map<std::string, SymbolState> symbols_;
};

}  // namespace app
