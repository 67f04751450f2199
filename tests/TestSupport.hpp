#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace testsupport {

inline int& failureCount() {
    static int failures = 0;
    return failures;
}

inline void check(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << "\n";
        ++failureCount();
    }
}

inline bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

inline int exitCode() {
    return failureCount() == 0 ? 0 : 1;
}

// Runs handlers until the predicate holds or the timeout expires.
template <typename Predicate>
bool runUntil(boost::asio::io_context& ioc, Predicate predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate() && std::chrono::steady_clock::now() < deadline) {
        if (ioc.stopped()) {
            ioc.restart();
        }
        if (ioc.run_one_for(std::chrono::milliseconds(5)) == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    return predicate();
}

// 2024-01-02T00:00:00Z
constexpr domain::TimestampMs kDay = 1704153600000LL;

inline domain::TimestampMs at(int hour, int minute) {
    return kDay + (static_cast<domain::TimestampMs>(hour) * 60 + minute) * 60'000LL;
}

inline domain::Candle candle(const std::string& symbol,
                             domain::TimestampMs ts,
                             double o,
                             double h,
                             double l,
                             double c) {
    domain::Candle out;
    out.symbol = symbol;
    out.ts = ts;
    out.o = o;
    out.h = h;
    out.l = l;
    out.c = c;
    out.v = 10.0;
    out.tickCount = 5;
    return out;
}

// Scriptable venue link used by executor, supervisor and engine tests.
class FakeVenue : public domain::IVenueLink {
public:
    // Remaining connect calls that fail; negative fails forever.
    int connectFailures{0};
    int submitFailures{0};
    bool failQueries{false};
    bool alive{true};
    bool connected{false};

    int connectCalls{0};
    int disconnectCalls{0};
    int queryCalls{0};
    std::vector<domain::BracketRequest> submitted;
    std::vector<domain::VenueOrder> orders;
    std::vector<domain::VenuePosition> positions;
    std::set<std::string> subscriptions;
    std::vector<std::string> subscribeCalls;

    TickHandler tickHandler;
    OrderStatusHandler statusHandler;

    void connect() override {
        ++connectCalls;
        if (connectFailures != 0) {
            if (connectFailures > 0) {
                --connectFailures;
            }
            throw domain::VenueError("fake: connection refused");
        }
        connected = true;
        alive = true;
    }

    void disconnect() override {
        ++disconnectCalls;
        connected = false;
    }

    bool isAlive() override { return connected && alive; }

    void subscribe(const std::string& symbol) override {
        subscribeCalls.push_back(symbol);
        subscriptions.insert(symbol);
    }

    void unsubscribe(const std::string& symbol) override { subscriptions.erase(symbol); }

    domain::BracketAck submitBracket(const domain::BracketRequest& request) override {
        if (submitFailures > 0) {
            --submitFailures;
            throw domain::VenueError("fake: submit timeout");
        }
        submitted.push_back(request);
        const auto n = std::to_string(submitted.size());
        domain::BracketAck ack{"E" + n, "S" + n, "T" + n};
        orders.push_back(domain::VenueOrder{ack.entryOrderId, request.entryRef, request.symbol,
                                            domain::LegRole::Entry, domain::OrderStatus::Submitted});
        orders.push_back(domain::VenueOrder{ack.stopOrderId, request.stopRef, request.symbol,
                                            domain::LegRole::StopLoss, domain::OrderStatus::Submitted});
        orders.push_back(domain::VenueOrder{ack.targetOrderId, request.targetRef, request.symbol,
                                            domain::LegRole::TakeProfit, domain::OrderStatus::Submitted});
        return ack;
    }

    std::vector<domain::VenueOrder> queryOpenOrders() override {
        ++queryCalls;
        if (failQueries) {
            throw domain::VenueError("fake: query failed");
        }
        return orders;
    }

    std::vector<domain::VenuePosition> queryPositions() override {
        if (failQueries) {
            throw domain::VenueError("fake: query failed");
        }
        return positions;
    }

    void setTickHandler(TickHandler handler) override { tickHandler = std::move(handler); }
    void setOrderStatusHandler(OrderStatusHandler handler) override { statusHandler = std::move(handler); }
};

}  // namespace testsupport
