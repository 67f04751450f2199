#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "TestSupport.hpp"
#include "adapters/paper/PaperVenue.hpp"
#include "adapters/paper/TickReplay.hpp"

using adapters::paper::PaperVenue;
using adapters::paper::TickReplay;
using testsupport::check;
using testsupport::near;

namespace {

void testParseCsv() {
    std::istringstream input(
        "ts,symbol,price,size\n"
        "1704211800000,NQ,15290.25,2\n"
        "\n"
        "1704211801000, NQ ,15291.5\n"
        "not-a-number,NQ,15292\n"
        "1704211802000,NQ\n"
        "1704211803000,ES,4800.75,1\n");
    std::size_t skipped = 0;
    const auto ticks = adapters::paper::parseTicksCsv(input, &skipped);
    check(ticks.size() == 3, "three valid ticks");
    check(skipped == 2, "two malformed lines skipped");
    if (ticks.size() == 3) {
        check(ticks[0].ts == 1704211800000LL && ticks[0].symbol == "NQ" && near(ticks[0].price, 15290.25),
              "first tick fields");
        check(near(ticks[0].size, 2.0) && near(ticks[1].size, 0.0), "size optional");
        check(ticks[1].symbol == "NQ", "fields trimmed");
        check(ticks[2].symbol == "ES", "symbol per line");
    }

    bool threw = false;
    try {
        adapters::paper::loadTicksCsv("/nonexistent/slob/ticks.csv");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "missing file reported");
}

std::vector<domain::Tick> ticks(std::size_t count) {
    std::vector<domain::Tick> out;
    for (std::size_t i = 0; i < count; ++i) {
        domain::Tick tick;
        tick.symbol = "NQ";
        tick.ts = 1704211800000LL + static_cast<domain::TimestampMs>(i) * 1000;
        tick.price = 15000.0 + static_cast<double>(i);
        tick.size = 1.0;
        out.push_back(tick);
    }
    return out;
}

void testReplayDeliversEveryTick() {
    boost::asio::io_context ioc;
    PaperVenue venue;
    venue.connect();
    venue.subscribe("NQ");
    std::vector<double> seen;
    venue.setTickHandler([&](const domain::Tick& tick) { seen.push_back(tick.price); });

    int finishedCalls = 0;
    auto replay = std::make_shared<TickReplay>(ioc, venue, ticks(5));
    replay->start([&]() { ++finishedCalls; });
    ioc.run();

    check(seen.size() == 5, "every tick forwarded");
    check(!seen.empty() && near(seen.front(), 15000.0) && near(seen.back(), 15004.0), "ticks in order");
    check(replay->finished() && replay->delivered() == 5, "replay finished");
    check(finishedCalls == 1, "completion callback ran once");
}

void testPacedReplayCancel() {
    boost::asio::io_context ioc;
    PaperVenue venue;
    venue.connect();
    venue.subscribe("NQ");
    std::size_t seen = 0;
    venue.setTickHandler([&](const domain::Tick&) { ++seen; });

    int finishedCalls = 0;
    auto replay = std::make_shared<TickReplay>(ioc, venue, ticks(100), std::chrono::milliseconds(20));
    replay->start([&]() { ++finishedCalls; });
    ioc.run_for(std::chrono::milliseconds(50));
    replay->cancel();
    ioc.restart();
    ioc.run();

    check(replay->finished(), "cancelled replay reports finished");
    check(seen > 0 && seen < 100, "cancel stopped the replay part way");
    check(replay->delivered() == seen, "delivered count matches the forwarded ticks");
    check(finishedCalls == 0, "completion callback not run on cancel");
}

}  // namespace

int main() {
    testParseCsv();
    testReplayDeliversEveryTick();
    testPacedReplayCancel();
    return testsupport::exitCode();
}
