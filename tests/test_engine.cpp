#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "TestSupport.hpp"
#include "adapters/memory/MemoryStateStore.hpp"
#include "adapters/paper/PaperVenue.hpp"
#include "app/Engine.hpp"
#include "common/Log.hpp"
#include "core/BackgroundTask.hpp"

using app::Engine;
using testsupport::at;
using testsupport::check;
using testsupport::FakeVenue;
using testsupport::near;
using namespace std::chrono_literals;

namespace {

// Ignores cancellation entirely.
class StubbornTask : public core::BackgroundTask {
public:
    std::string name() const override { return "stubborn"; }
    void cancel() override { ++cancelRequests; }
    bool finished() const override { return false; }

    int cancelRequests{0};
};

class PoliteTask : public core::BackgroundTask {
public:
    std::string name() const override { return "polite"; }
    void cancel() override { done = true; }
    bool finished() const override { return done; }

    bool done{false};
};

void pump(boost::asio::io_context& ioc) {
    if (ioc.stopped()) {
        ioc.restart();
    }
    ioc.poll();
}

domain::Tick tick(const std::string& symbol, domain::TimestampMs ts, double price) {
    domain::Tick out;
    out.symbol = symbol;
    out.ts = ts;
    out.price = price;
    out.size = 1.0;
    return out;
}

Engine::Config engineConfig(std::vector<std::string> symbols) {
    Engine::Config config;
    config.symbols = std::move(symbols);
    return config;
}

void testReconciliationOnConnect() {
    boost::asio::io_context ioc;
    FakeVenue venue;
    adapters::memory::MemoryStateStore store;

    domain::Trade local;
    local.setupId = "ES-L-1";
    local.symbol = "ES";
    local.direction = domain::TradeDirection::Long;
    local.entryPrice = 4800.0;
    local.size = 1;
    local.status = domain::TradeStatus::Open;
    store.saveTrade(local);

    venue.positions.push_back(domain::VenuePosition{"NQ", -2, 15300.0});

    const auto criticalsBefore = slob::log::criticalCount();
    Engine engine(ioc, venue, store, engineConfig({"NQ", "ES"}));
    const auto recovered = engine.start();
    check(recovered.trades == 1, "open trade recovered from the store");
    pump(ioc);
    check(slob::log::criticalCount() > criticalsBefore, "reconciliation alert logged as critical");

    check(engine.supervisor().isHealthy(), "connected");
    const auto alerts = engine.bus().history(core::EventKind::ReconciliationAlert);
    check(alerts.size() == 1, "unknown venue position raised one alert");
    if (alerts.size() == 1) {
        const auto& alert = std::get<core::ReconciliationAlert>(alerts.front().payload);
        check(alert.symbol == "NQ" && alert.venueQuantity == -2, "alert names the position");
    }
    check(engine.executor().trade("NQ-S-1") == nullptr, "no local record invented for the venue position");

    const auto* finalized = engine.executor().trade("ES-L-1");
    check(finalized != nullptr && finalized->status == domain::TradeStatus::Closed,
          "local trade without a venue position finalized");
    check(finalized != nullptr && finalized->exitReason == domain::ExitReason::External, "external exit");
    check(store.loadOpenTrades().empty(), "finalized trade persisted");

    const auto again = engine.reconcile();
    check(again.ok && again.alerts == 1 && again.finalized == 0, "second pass only repeats the alert");

    venue.failQueries = true;
    check(!engine.reconcile().ok, "failed position query reported");
    engine.shutdown();
}

void testShutdownWithStubbornTask() {
    boost::asio::io_context ioc;
    FakeVenue venue;
    adapters::memory::MemoryStateStore store;

    auto config = engineConfig({"NQ"});
    config.shutdownTimeout = 2000ms;
    config.taskWait = 50ms;
    Engine engine(ioc, venue, store, config);
    engine.start();
    pump(ioc);

    auto stubborn = std::make_shared<StubbornTask>();
    auto polite = std::make_shared<PoliteTask>();
    engine.addBackgroundTask(stubborn);
    engine.addBackgroundTask(polite);

    engine.onTick(tick("NQ", at(10, 0) + 5'000, 15000.0));
    engine.onTick(tick("NQ", at(10, 0) + 9'000, 15004.0));
    check(engine.aggregator().openCandle("NQ").has_value(), "bucket open before shutdown");

    const auto report = engine.shutdown();
    check(stubborn->cancelRequests == 1 && polite->done, "every task asked to cancel");
    check(report.tasksCancelled == 2, "cancelled count");
    check(report.tasksAbandoned.size() == 1 && report.tasksAbandoned.front() == "stubborn",
          "stubborn task abandoned");
    check(report.candlesFlushed == 1, "open bucket flushed");
    check(store.candleCount() == 1, "flushed candle persisted before exit");
    check(!report.timedOut, "finished inside the timeout");
    check(report.elapsed < 2000ms, "bounded by the shutdown timeout");
    check(!engine.accepting(), "no longer accepting");

    engine.onTick(tick("NQ", at(10, 2), 15010.0));
    check(!engine.aggregator().openCandle("NQ").has_value(), "ticks ignored after shutdown");
    check(engine.supervisor().state().phase == domain::ConnectionPhase::Disconnected, "venue link closed");
}

void testShutdownTimeoutWinsOverTaskWait() {
    boost::asio::io_context ioc;
    FakeVenue venue;
    adapters::memory::MemoryStateStore store;

    auto config = engineConfig({"NQ"});
    config.shutdownTimeout = 200ms;
    config.taskWait = 5000ms;
    Engine engine(ioc, venue, store, config);
    engine.start();
    pump(ioc);
    engine.addBackgroundTask(std::make_shared<StubbornTask>());

    engine.onTick(tick("NQ", at(11, 0) + 1'000, 15100.0));
    engine.onTick(tick("NQ", at(11, 0) + 2'000, 15102.0));

    const auto begin = std::chrono::steady_clock::now();
    const auto report = engine.shutdown();
    const auto took = std::chrono::steady_clock::now() - begin;
    check(report.tasksAbandoned.size() == 1, "task abandoned");
    check(took < 1000ms, "shutdown returned near its deadline");
    check(report.candlesFlushed == 1, "open bucket flushed despite the hung task");
    check(store.candleCount() == 1, "flushed candle reached the store");
    check(store.flushCount() == 1, "store flushed once");
    check(!report.timedOut, "task wait capped inside the shutdown budget");
}

std::vector<domain::Tick> ticksFor(const domain::Candle& c) {
    return {tick(c.symbol, c.ts, c.o), tick(c.symbol, c.ts + 10'000, c.h), tick(c.symbol, c.ts + 20'000, c.l),
            tick(c.symbol, c.ts + 30'000, c.c)};
}

void testTickToTradePipeline() {
    using testsupport::candle;
    boost::asio::io_context ioc;
    adapters::paper::PaperVenue venue;
    adapters::memory::MemoryStateStore store;

    Engine engine(ioc, venue, store, engineConfig({"NQ"}));
    engine.start();
    pump(ioc);
    check(venue.connected() && venue.subscriptions().count("NQ") == 1, "paper venue connected and subscribed");

    std::vector<domain::Candle> candles;
    candles.push_back(candle("NQ", at(9, 0), 15250, 15300, 15200, 15260));
    candles.push_back(candle("NQ", at(9, 1), 15260, 15280, 15230, 15270));
    candles.push_back(candle("NQ", at(15, 30), 15290, 15320, 15285, 15310));
    candles.push_back(candle("NQ", at(15, 31), 15298, 15300, 15282, 15285));
    candles.push_back(candle("NQ", at(15, 32), 15290, 15295, 15280, 15284));
    candles.push_back(candle("NQ", at(15, 33), 15284, 15297, 15283, 15296));
    for (int minute = 34; minute <= 45; ++minute) {
        candles.push_back(candle("NQ", at(15, minute), 15295, 15299, 15285, 15290));
    }
    candles.push_back(candle("NQ", at(15, 46), 15290, 15350, 15285, 15305));
    candles.push_back(candle("NQ", at(15, 47), 15290, 15295, 15270, 15275));

    for (const auto& c : candles) {
        for (const auto& t : ticksFor(c)) {
            venue.feedTick(t);
            pump(ioc);
        }
    }

    // Completes the 15:47 candle, which triggers the entry.
    venue.feedTick(tick("NQ", at(15, 48), 15276.0));
    pump(ioc);
    check(venue.submittedBrackets() == 1, "completed setup submitted to the venue");
    check(engine.bus().history(core::EventKind::SetupDetected).size() == 1, "setup detected event");

    const std::string setupId = "NQ-S-" + std::to_string(at(15, 30));
    const auto* bracket = engine.executor().bracket(setupId);
    check(bracket != nullptr && near(bracket->stopPrice, 15307.0) && near(bracket->targetPrice, 15199.0),
          "bracket carries the setup levels");

    venue.feedTick(tick("NQ", at(15, 48) + 5'000, 15274.0));
    pump(ioc);
    const auto* trade = engine.executor().trade(setupId);
    check(trade != nullptr && trade->status == domain::TradeStatus::Open, "entry filled");

    venue.feedTick(tick("NQ", at(15, 48) + 20'000, 15250.0));
    venue.feedTick(tick("NQ", at(15, 48) + 40'000, 15199.0));
    pump(ioc);
    trade = engine.executor().trade(setupId);
    check(trade != nullptr && trade->status == domain::TradeStatus::Closed, "target filled");
    check(trade != nullptr && trade->exitReason == domain::ExitReason::TakeProfit, "take profit exit");
    check(trade != nullptr && near(trade->pnl, (15274.0 - 15199.0) * 20.0), "profit booked");
    check(near(engine.risk().account().equity, 50'000.0 + 1'500.0), "equity updated");
    check(engine.reconcile().alerts == 0, "flat after the exit");

    const auto report = engine.shutdown();
    check(report.candlesFlushed == 1, "last bucket flushed");
    check(store.candleCount() >= candles.size(), "completed candles stored");
}

void testOperatorClearsSafeModeAndHalt() {
    boost::asio::io_context ioc;
    FakeVenue venue;
    venue.connectFailures = 2;
    adapters::memory::MemoryStateStore store;

    auto config = engineConfig({"NQ"});
    config.supervisor.backoffBase = 1ms;
    config.supervisor.backoffCap = 4ms;
    config.supervisor.maxAttempts = 2;
    Engine engine(ioc, venue, store, config);
    engine.start();

    check(testsupport::runUntil(ioc, [&]() { return engine.supervisor().inSafeMode(); }, 2s),
          "link gives up after two failures");
    check(engine.bus().history(core::EventKind::SafeModeEntered).size() == 1, "safe mode announced once");

    engine.clearSafeMode();
    check(testsupport::runUntil(ioc, [&]() { return engine.supervisor().isHealthy(); }, 2s),
          "operator clear reconnects");

    check(engine.risk().recordTradeResult(-20'000.0), "deep drawdown trips the halt");
    check(engine.risk().halted(), "trading halted");
    engine.clearRiskHalt();
    check(!engine.risk().halted(), "operator clear lifts the halt");

    engine.shutdown();
}

void testDrawdownHaltSurvivesRestart() {
    adapters::memory::MemoryStateStore store;

    domain::Trade trade;
    trade.setupId = "NQ-S-77";
    trade.symbol = "NQ";
    trade.direction = domain::TradeDirection::Short;
    trade.entryPrice = 15000.0;
    trade.size = 5;
    trade.openedAt = at(10, 5);
    check(store.saveTrade(trade), "open trade seeded");

    domain::BracketOrder bracket;
    bracket.setupId = "NQ-S-77";
    bracket.symbol = "NQ";
    bracket.direction = domain::TradeDirection::Short;
    bracket.idempotencyKey = "SLOB-NQ-S-77";
    bracket.submittedAt = at(10, 4);
    bracket.entryRef = "SLOB-NQ-S-77-1-ENTRY";
    bracket.stopRef = "SLOB-NQ-S-77-1-STOP";
    bracket.targetRef = "SLOB-NQ-S-77-1-TARGET";
    bracket.quantity = 5;
    bracket.entryPrice = 15000.0;
    bracket.stopPrice = 15200.0;
    bracket.targetPrice = 14800.0;
    bracket.status = domain::OrderStatus::Filled;
    check(store.saveBracket(bracket), "filled bracket seeded");

    {
        boost::asio::io_context ioc;
        FakeVenue venue;
        venue.positions.push_back({"NQ", -5, 15000.0});
        Engine engine(ioc, venue, store, engineConfig({"NQ"}));
        const auto recovered = engine.start();
        pump(ioc);
        check(!recovered.accountRestored && recovered.trades == 1, "fresh account, one open trade");

        domain::OrderStatusUpdate stop;
        stop.reference = "SLOB-NQ-S-77-1-STOP";
        stop.symbol = "NQ";
        stop.status = domain::OrderStatus::Filled;
        stop.fillPrice = 15200.0;
        stop.filledQuantity = 5;
        stop.ts = at(10, 30);
        engine.executor().onOrderStatus(stop);
        check(engine.risk().halted(), "stop-out halts trading");
        engine.shutdown();
    }

    {
        boost::asio::io_context ioc;
        FakeVenue venue;
        Engine engine(ioc, venue, store, engineConfig({"NQ"}));
        const auto recovered = engine.start();
        pump(ioc);
        check(recovered.accountRestored, "account restored on restart");
        check(engine.risk().halted(), "halt still in force after restart");
        check(near(engine.risk().account().equity, 30'000.0), "equity carried across restart");
        check(engine.risk().account().trades == 1, "trade count carried across restart");
        engine.clearRiskHalt();
        engine.shutdown();
    }

    {
        boost::asio::io_context ioc;
        FakeVenue venue;
        Engine engine(ioc, venue, store, engineConfig({"NQ"}));
        engine.start();
        pump(ioc);
        check(!engine.risk().halted(), "operator clear is persisted too");
        check(near(engine.risk().account().drawdown, 0.0), "drawdown measured from the cleared equity");
        engine.shutdown();
    }
}

}  // namespace

int main() {
    testReconciliationOnConnect();
    testShutdownWithStubbornTask();
    testShutdownTimeoutWinsOverTaskWait();
    testTickToTradePipeline();
    testOperatorClearsSafeModeAndHalt();
    testDrawdownHaltSurvivesRestart();
    return testsupport::exitCode();
}
