#include <iostream>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "app/CandleAggregator.hpp"

using app::CandleAggregator;
using testsupport::check;
using testsupport::near;

namespace {

struct Emitted {
    domain::Candle candle;
    bool synthetic{false};
};

domain::Tick tick(const std::string& symbol, domain::TimestampMs ts, double price, double size = 1.0) {
    domain::Tick out;
    out.symbol = symbol;
    out.ts = ts;
    out.price = price;
    out.size = size;
    return out;
}

void testOhlcvAndSingleEmission() {
    std::vector<Emitted> emitted;
    CandleAggregator aggregator({60'000, 2}, [&](const domain::Candle& c, bool synthetic) {
        emitted.push_back({c, synthetic});
    });

    const domain::TimestampMs base = testsupport::at(10, 0);
    check(aggregator.onTick(tick("NQ", base + 1'000, 100.0, 2.0)), "first tick accepted");
    check(aggregator.onTick(tick("NQ", base + 20'000, 104.0, 1.0)), "second tick accepted");
    check(aggregator.onTick(tick("NQ", base + 40'000, 98.0, 3.0)), "third tick accepted");
    check(aggregator.onTick(tick("NQ", base + 59'999, 101.0, 1.0)), "fourth tick accepted");
    check(emitted.empty(), "bucket must stay open until the next bucket starts");

    check(aggregator.onTick(tick("NQ", base + 60'000, 102.0, 1.0)), "next bucket tick accepted");
    check(emitted.size() == 1, "exactly one candle after crossing the boundary");
    if (emitted.size() == 1) {
        const auto& c = emitted.front().candle;
        check(c.ts == base, "candle timestamp is the bucket start");
        check(near(c.o, 100.0) && near(c.h, 104.0) && near(c.l, 98.0) && near(c.c, 101.0), "ohlc values");
        check(near(c.v, 7.0), "volume is the sum of tick sizes");
        check(c.tickCount == 4, "tick count");
        check(!emitted.front().synthetic, "real candle is not synthetic");
    }

    check(!aggregator.onTick(tick("NQ", base + 30'000, 99.0)), "late tick for a completed bucket is dropped");
    check(aggregator.stats("NQ").rejectedTicks == 1, "late tick counted as rejected");

    check(aggregator.forceCompleteAll() == 1, "force completes the open bucket");
    check(aggregator.forceCompleteAll() == 0, "second force complete emits nothing");
    check(emitted.size() == 2, "open bucket emitted exactly once");
    check(!aggregator.onTick(tick("NQ", base + 61'000, 99.0)), "tick for a force-completed bucket is dropped");
    check(emitted.size() == 2, "no duplicate completion");
}

void testSmallGapIsFilled() {
    std::vector<Emitted> emitted;
    CandleAggregator aggregator({60'000, 2}, [&](const domain::Candle& c, bool synthetic) {
        emitted.push_back({c, synthetic});
    });

    const domain::TimestampMs base = testsupport::at(11, 0);
    aggregator.onTick(tick("ES", base + 5'000, 50.0));
    aggregator.onTick(tick("ES", base + 10'000, 51.5));
    aggregator.onTick(tick("ES", base + 120'000 + 1'000, 52.0));

    check(emitted.size() == 2, "one real candle plus one flat gap candle");
    if (emitted.size() == 2) {
        const auto& flat = emitted[1];
        check(flat.synthetic, "gap candle is synthetic");
        check(flat.candle.ts == base + 60'000, "gap candle sits in the missing bucket");
        check(near(flat.candle.o, 51.5) && near(flat.candle.h, 51.5) && near(flat.candle.l, 51.5) &&
                  near(flat.candle.c, 51.5),
              "gap candle is flat at the previous close");
        check(flat.candle.v == 0.0 && flat.candle.tickCount == 0, "gap candle has no volume");
    }
    check(aggregator.stats("ES").gapCandles == 1, "gap candle counted");
}

void testLargeGapIsNotFilled() {
    std::vector<Emitted> emitted;
    CandleAggregator aggregator({60'000, 2}, [&](const domain::Candle& c, bool synthetic) {
        emitted.push_back({c, synthetic});
    });

    const domain::TimestampMs base = testsupport::at(12, 0);
    aggregator.onTick(tick("NQ", base, 10.0));
    aggregator.onTick(tick("NQ", base + 10 * 60'000, 11.0));

    check(emitted.size() == 1, "a long gap emits only the real candle");
    check(aggregator.stats("NQ").largeGaps == 1, "long gap counted");
    check(aggregator.stats("NQ").gapCandles == 0, "no flat candles for a long gap");
}

void testMalformedTicksAndSymbolIsolation() {
    std::vector<Emitted> emitted;
    CandleAggregator aggregator({60'000, 2}, [&](const domain::Candle& c, bool synthetic) {
        emitted.push_back({c, synthetic});
    });

    const domain::TimestampMs base = testsupport::at(13, 0);
    check(!aggregator.onTick(tick("", base, 10.0)), "empty symbol rejected");
    check(!aggregator.onTick(tick("NQ", base, -1.0)), "negative price rejected");
    check(!aggregator.onTick(tick("NQ", base, 10.0, -2.0)), "negative size rejected");
    check(!aggregator.openCandle("NQ"), "rejected ticks do not open a bucket");

    aggregator.onTick(tick("NQ", base, 10.0));
    aggregator.onTick(tick("ES", base + 61'000, 20.0));
    check(emitted.empty(), "a tick for another symbol does not close NQ");
    check(aggregator.openCandle("NQ").has_value() && aggregator.openCandle("ES").has_value(),
          "both symbols keep their own bucket");
}

}  // namespace

int main() {
    testOhlcvAndSingleEmission();
    testSmallGapIsFilled();
    testLargeGapIsNotFilled();
    testMalformedTicksAndSymbolIsolation();
    return testsupport::exitCode();
}
