#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "TestSupport.hpp"
#include "core/EventBus.h"

using core::EventBus;
using core::EventKind;
using testsupport::check;

namespace {

core::OrderRejected rejected(const std::string& id) {
    core::OrderRejected payload;
    payload.setupId = id;
    payload.symbol = "NQ";
    payload.reason = "test";
    return payload;
}

void testFailingHandlerDoesNotStopOthers() {
    boost::asio::io_context ioc;
    EventBus bus(ioc);

    int delivered = 0;
    auto bad = bus.subscribe(
        EventKind::OrderRejected, [](const core::Event&) { throw std::runtime_error("boom"); }, "bad");
    auto good = bus.subscribe(
        EventKind::OrderRejected, [&](const core::Event&) { ++delivered; }, "good");

    bus.publish(rejected("a"));
    check(delivered == 0, "publish must not run handlers inline");
    check(bus.pendingDispatches() == 2, "one dispatch per subscriber");

    bus.drain();
    check(delivered == 1, "healthy subscriber still receives the event");
    check(bus.stats().failures == 1, "failure recorded");
    check(bus.pendingDispatches() == 0, "drain runs every dispatch");
}

void testPublishAndWaitRunsInline() {
    boost::asio::io_context ioc;
    EventBus bus(ioc);

    std::vector<std::string> seen;
    auto sub = bus.subscribe(EventKind::SafeModeEntered, [&](const core::Event& event) {
        seen.push_back(std::get<core::SafeModeEntered>(event.payload).reason);
    });
    bus.publishAndWait(core::SafeModeEntered{"budget exhausted", 10});
    check(seen.size() == 1 && seen.front() == "budget exhausted", "handler ran before publishAndWait returned");
    check(bus.pendingDispatches() == 0, "nothing left scheduled");
}

void testUnsubscribeAndHistory() {
    boost::asio::io_context ioc;
    EventBus bus(ioc, 3);

    int calls = 0;
    {
        auto scoped = bus.subscribe(EventKind::OrderRejected, [&](const core::Event&) { ++calls; });
        bus.publish(rejected("1"));
        bus.drain();
    }
    bus.publish(rejected("2"));
    bus.drain();
    check(calls == 1, "released subscription receives nothing");

    // Unsubscribed after scheduling: the queued dispatch is skipped.
    auto late = bus.subscribe(EventKind::OrderRejected, [&](const core::Event&) { ++calls; });
    bus.publish(rejected("3"));
    late.reset();
    bus.drain();
    check(calls == 1, "dispatch for a removed subscriber is skipped");

    bus.publish(core::ConnectionLost{"heartbeat"});
    bus.publish(rejected("4"));
    const auto all = bus.history();
    check(all.size() == 3, "history is bounded by its capacity");
    check(all.front().sequence < all.back().sequence, "history keeps publication order");
    const auto onlyLost = bus.history(EventKind::ConnectionLost);
    check(onlyLost.size() == 1, "history can be filtered by kind");
}

void testClearAllCancelsScheduledDispatches() {
    boost::asio::io_context ioc;
    EventBus bus(ioc);

    int stale = 0;
    auto first = bus.subscribe(EventKind::OrderRejected, [&](const core::Event&) { ++stale; });
    bus.publish(rejected("1"));
    bus.publish(rejected("2"));
    check(bus.pendingDispatches() == 2, "two dispatches scheduled");

    bus.clearAll();
    check(bus.pendingDispatches() == 0, "reset clears the pending count");
    check(bus.history().empty() && bus.stats().published == 0, "reset clears history and stats");

    int fresh = 0;
    auto second = bus.subscribe(EventKind::OrderRejected, [&](const core::Event&) { ++fresh; });
    ioc.poll();
    check(stale == 0 && fresh == 0, "dispatches scheduled before the reset are dropped");
    check(bus.pendingDispatches() == 0, "dropped dispatches leave the count alone");

    first.reset();
    bus.publish(rejected("3"));
    check(bus.pendingDispatches() == 1, "new publication counted once");
    bus.drain();
    check(fresh == 1, "listener added after the reset still receives events");
    check(bus.pendingDispatches() == 0, "drained");
}

}  // namespace

int main() {
    testFailingHandlerDoesNotStopOthers();
    testPublishAndWaitRunsInline();
    testUnsubscribeAndHistory();
    testClearAllCancelsScheduledDispatches();
    return testsupport::exitCode();
}
