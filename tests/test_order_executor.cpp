#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "TestSupport.hpp"
#include "adapters/memory/MemoryStateStore.hpp"
#include "app/ConnectionSupervisor.hpp"
#include "app/OrderExecutor.hpp"
#include "app/RiskManager.hpp"
#include "core/EventBus.h"

using app::OrderExecutor;
using app::SubmitStatus;
using domain::LegRole;
using domain::OrderStatus;
using testsupport::check;
using testsupport::FakeVenue;
using testsupport::near;
using namespace std::chrono_literals;

namespace {

constexpr domain::TimestampMs kSubmitTs = 1704213000000LL;

struct Harness {
    explicit Harness(bool connect = true, std::uint32_t maxAttempts = 10) {
        app::ConnectionSupervisor::Config supervisorConfig;
        supervisorConfig.maxAttempts = maxAttempts;
        supervisor = std::make_unique<app::ConnectionSupervisor>(ioc, venue, bus, supervisorConfig);
        executor = makeExecutor();
        if (connect) {
            supervisor->start();
            ioc.poll();
        }
    }

    ~Harness() { supervisor->stop(); }

    std::unique_ptr<OrderExecutor> makeExecutor() {
        return std::make_unique<OrderExecutor>(venue, store, *supervisor, risk, bus, OrderExecutor::Config{},
                                               [] { return kSubmitTs; });
    }

    boost::asio::io_context ioc;
    core::EventBus bus{ioc};
    FakeVenue venue;
    adapters::memory::MemoryStateStore store;
    app::RiskManager risk{app::RiskManager::Config{}};
    std::unique_ptr<app::ConnectionSupervisor> supervisor;
    std::unique_ptr<OrderExecutor> executor;
};

domain::SetupCandidate completeSetup(const std::string& id = "NQ-S-1") {
    domain::SetupCandidate setup;
    setup.id = id;
    setup.symbol = "NQ";
    setup.direction = domain::TradeDirection::Short;
    setup.state = domain::SetupState::SetupComplete;
    setup.entryPrice = 15275.0;
    setup.stopPrice = 15307.0;
    setup.targetPrice = 15199.0;
    setup.riskReward = 76.0 / 32.0;
    return setup;
}

void testDuplicateSubmissionYieldsOneBracket() {
    Harness h;
    const auto setup = completeSetup();

    const auto first = h.executor->submitBracket(setup, 1);
    check(first.status == SubmitStatus::Submitted, "first submission accepted");
    const auto second = h.executor->submitBracket(setup, 1);
    check(second.status == SubmitStatus::DuplicateOrder, "second submission is a duplicate");
    check(h.venue.submitted.size() == 1, "exactly one bracket reached the venue");

    // A fresh executor (restart without local state) asks the venue first.
    auto restarted = h.makeExecutor();
    const auto third = restarted->execute(setup);
    check(third.status == SubmitStatus::DuplicateOrder, "venue-side key detected after restart");
    check(h.venue.submitted.size() == 1, "still one bracket at the venue");
    check(third.bracket && third.bracket->entryOrderId == "E1", "existing venue orders adopted");

    const auto& request = h.venue.submitted.front();
    const auto key = h.executor->idempotencyKey(setup.id);
    check(request.entryRef == OrderExecutor::legReference(key, kSubmitTs, LegRole::Entry), "entry reference");
    check(request.stopRef == key + "-" + std::to_string(kSubmitTs) + "-STOP", "stop reference format");
    check(request.targetRef.find(key) == 0, "target reference carries the key");
    check(!h.bus.history(core::EventKind::OrderPlaced).empty(), "order placed event");
}

void testRetriesReuseReferences() {
    Harness h;
    h.venue.submitFailures = 2;
    const auto result = h.executor->submitBracket(completeSetup(), 2);
    check(result.status == SubmitStatus::Submitted, "third attempt succeeds");
    check(h.venue.submitted.size() == 1, "one bracket after retries");
    check(h.venue.queryCalls == 3, "venue re-queried before each retry");
    const auto* bracket = h.executor->bracket("NQ-S-1");
    check(bracket != nullptr && bracket->submittedAt == kSubmitTs, "submission timestamp fixed at first attempt");
    check(bracket != nullptr && bracket->status == OrderStatus::Submitted, "bracket submitted");
}

void testExhaustedAttemptsReject() {
    Harness h;
    h.venue.submitFailures = 10;
    const auto setup = completeSetup();
    const auto result = h.executor->submitBracket(setup, 1);
    check(result.status == SubmitStatus::VenueRejected, "exhausted attempts reported");
    check(h.bus.history(core::EventKind::OrderRejected).size() == 1, "order rejected event");
    const auto* bracket = h.executor->bracket(setup.id);
    check(bracket != nullptr && bracket->status == OrderStatus::Rejected, "bracket marked rejected");
    const std::string firstRef = bracket != nullptr ? bracket->entryRef : std::string{};

    h.venue.submitFailures = 0;
    const auto retry = h.executor->submitBracket(setup, 1);
    check(retry.status == SubmitStatus::Submitted, "rejected bracket can be submitted again");
    check(!h.venue.submitted.empty() && h.venue.submitted.front().entryRef == firstRef,
          "resubmission keeps the original references");
}

void testConnectionUnavailable() {
    Harness h(false);
    h.venue.connectFailures = -1;
    const auto result = h.executor->submitBracket(completeSetup(), 1);
    check(result.status == SubmitStatus::ConnectionUnavailable, "dead link aborts the submission");
    check(h.venue.connectCalls == 1, "reconnect path attempted");
    check(h.venue.submitted.empty(), "nothing sent on a dead link");
    check(h.venue.queryCalls == 0, "no venue queries on a dead link");
}

domain::BracketOrder persistedPending(const std::string& setupId) {
    domain::BracketOrder pending;
    pending.setupId = setupId;
    pending.symbol = "NQ";
    pending.direction = domain::TradeDirection::Long;
    pending.idempotencyKey = "SLOB-" + setupId;
    pending.submittedAt = 42;
    pending.entryRef = OrderExecutor::legReference(pending.idempotencyKey, 42, LegRole::Entry);
    pending.stopRef = OrderExecutor::legReference(pending.idempotencyKey, 42, LegRole::StopLoss);
    pending.targetRef = OrderExecutor::legReference(pending.idempotencyKey, 42, LegRole::TakeProfit);
    pending.quantity = 1;
    pending.entryPrice = 15000.0;
    pending.stopPrice = 14980.0;
    pending.targetPrice = 15050.0;
    return pending;
}

void testRefusedSubmissionIsNotResumed() {
    Harness h(false);
    h.supervisor->setOnConnected([&h]() { h.executor->resumePending(); });
    h.venue.connectFailures = 1;
    const auto setup = completeSetup();

    const auto refused = h.executor->submitBracket(setup, 1);
    check(refused.status == SubmitStatus::ConnectionUnavailable, "dead link refuses the submission");
    check(h.executor->bracket(setup.id) == nullptr, "no bracket recorded for a refused submission");
    check(h.executor->pendingBrackets().empty(), "nothing left pending");
    check(h.store.loadBrackets().empty(), "nothing persisted");

    check(h.supervisor->reconnectNow(), "link comes back");
    check(h.executor->resumePending() == 0, "nothing to resume");
    check(h.venue.submitted.empty(), "refused order never sent on reconnect");

    const auto again = h.executor->submitBracket(setup, 1);
    check(again.status == SubmitStatus::Submitted, "caller can submit again once connected");
    check(h.venue.submitted.size() == 1, "one bracket at the venue");
}

void testInlineReconnectSubmitsOnce() {
    Harness h;
    h.supervisor->setOnConnected([&h]() { h.executor->resumePending(); });
    h.executor->restore({persistedPending("NQ-L-7")}, {});
    h.venue.alive = false;

    const auto outcome = h.executor->submitBracket(completeSetup(), 1);
    check(outcome.status == SubmitStatus::Submitted, "first submission after an in-line reconnect is not a duplicate");
    check(h.venue.connectCalls == 2, "one in-line reconnect");
    check(h.venue.submitted.size() == 2, "restored bracket resumed and new bracket sent once each");
    check(h.venue.submitted.front().entryRef == persistedPending("NQ-L-7").entryRef,
          "restored bracket resumed by the reconnect");
    const auto* placed = h.executor->bracket("NQ-S-1");
    check(placed != nullptr && placed->status == OrderStatus::Submitted && placed->entryOrderId == "E2",
          "new bracket holds its own venue ids");
}

void testSafeModeRefuses() {
    Harness h(false, 1);
    h.venue.connectFailures = -1;
    const auto result = h.executor->submitBracket(completeSetup(), 1);
    check(result.status == SubmitStatus::SafeMode, "exhausted reconnect enters safe mode");
    check(h.supervisor->inSafeMode(), "supervisor in safe mode");

    h.venue.connectFailures = 0;
    const auto again = h.executor->submitBracket(completeSetup(), 1);
    check(again.status == SubmitStatus::SafeMode, "no submission until safe mode is cleared");
    check(h.venue.connectCalls == 1, "safe mode makes no further attempts");
}

void testFillLifecycle() {
    Harness h;
    const auto setup = completeSetup();
    const auto result = h.executor->submitBracket(setup, 1);
    check(result.ok(), "submitted");

    domain::OrderStatusUpdate entry;
    entry.orderId = "E1";
    entry.status = OrderStatus::Filled;
    entry.fillPrice = 15275.0;
    entry.filledQuantity = 1;
    entry.ts = kSubmitTs + 60'000;
    h.executor->onOrderStatus(entry);
    h.executor->onOrderStatus(entry);

    const auto* trade = h.executor->trade(setup.id);
    check(trade != nullptr && trade->status == domain::TradeStatus::Open, "entry fill opens a trade");
    check(h.store.loadOpenTrades().size() == 1, "open trade persisted");
    check(h.bus.history(core::EventKind::OrderFilled).size() == 1, "repeated fill ignored");

    domain::OrderStatusUpdate stop;
    stop.reference = h.executor->bracket(setup.id)->stopRef;
    stop.status = OrderStatus::Filled;
    stop.fillPrice = 15307.0;
    stop.ts = kSubmitTs + 120'000;
    h.executor->onOrderStatus(stop);

    trade = h.executor->trade(setup.id);
    check(trade != nullptr && trade->status == domain::TradeStatus::Closed, "stop fill closes the trade");
    check(trade != nullptr && trade->exitReason == domain::ExitReason::StopLoss, "exit reason");
    check(trade != nullptr && near(trade->pnl, -640.0), "pnl in account currency");
    check(near(h.risk.account().equity, 50'000.0 - 640.0), "risk manager saw the loss");
    check(h.store.loadOpenTrades().empty(), "closed trade persisted");
    check(h.bus.history(core::EventKind::PositionClosed).size() == 1, "position closed event");
    check(h.executor->bracket(setup.id)->status == OrderStatus::Closed, "bracket closed");
}

void testRiskAndValidationGates() {
    Harness h;
    auto invalid = completeSetup("NQ-S-2");
    invalid.state = domain::SetupState::WaitingEntry;
    check(h.executor->execute(invalid).status == SubmitStatus::InvalidSetup, "incomplete setup refused");

    auto inverted = completeSetup("NQ-S-3");
    inverted.stopPrice = 15200.0;
    check(h.executor->submitBracket(inverted, 1).status == SubmitStatus::InvalidSetup,
          "stop on the wrong side refused");

    h.risk.recordTradeResult(-20'000.0);
    const auto halted = h.executor->execute(completeSetup("NQ-S-4"));
    check(halted.status == SubmitStatus::RiskRejected, "halted account refuses new orders");
    check(h.venue.submitted.empty(), "nothing submitted");
}

void testExternalCloseAndResume() {
    Harness h;
    const auto setup = completeSetup();
    h.executor->submitBracket(setup, 1);
    domain::OrderStatusUpdate entry;
    entry.orderId = "E1";
    entry.status = OrderStatus::Filled;
    h.executor->onOrderStatus(entry);

    check(h.executor->finalizeExternallyClosed("NQ") == 1, "open trade finalized");
    const auto* trade = h.executor->trade(setup.id);
    check(trade != nullptr && trade->exitReason == domain::ExitReason::External, "external exit reason");
    check(h.executor->openTrades().empty(), "no open trades left");
    check(h.executor->finalizeExternallyClosed("NQ") == 0, "finalizing twice is a no-op");

    const auto pending = persistedPending("NQ-L-9");

    auto resumed = h.makeExecutor();
    resumed->restore({pending}, {});
    check(resumed->pendingBrackets().size() == 1, "pending bracket restored");
    check(resumed->resumePending() == 1, "pending bracket resubmitted");
    check(h.venue.submitted.size() == 2 && h.venue.submitted.back().entryRef == pending.entryRef,
          "resubmission reuses the persisted references");
}

}  // namespace

int main() {
    testDuplicateSubmissionYieldsOneBracket();
    testRetriesReuseReferences();
    testExhaustedAttemptsReject();
    testConnectionUnavailable();
    testRefusedSubmissionIsNotResumed();
    testInlineReconnectSubmitsOnce();
    testSafeModeRefuses();
    testFillLifecycle();
    testRiskAndValidationGates();
    testExternalCloseAndResume();
    return testsupport::exitCode();
}
