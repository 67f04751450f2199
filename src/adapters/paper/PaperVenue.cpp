#include "adapters/paper/PaperVenue.hpp"

#include <exception>
#include <utility>

#include "common/Log.hpp"

namespace adapters::paper {

using domain::LegRole;
using domain::OrderStatus;
using domain::TradeDirection;

void PaperVenue::connect() {
    if (connectFailures_ > 0) {
        --connectFailures_;
        throw domain::VenueError("PaperVenue: connection refused");
    }
    connected_ = true;
    dropped_ = false;
    LOG_INFO("PaperVenue: connected");
}

void PaperVenue::disconnect() {
    connected_ = false;
    subscriptions_.clear();
}

bool PaperVenue::isAlive() {
    return connected_ && !dropped_;
}

void PaperVenue::subscribe(const std::string& symbol) {
    requireConnected_("subscribe");
    subscriptions_.insert(symbol);
}

void PaperVenue::unsubscribe(const std::string& symbol) {
    requireConnected_("unsubscribe");
    subscriptions_.erase(symbol);
}

domain::BracketAck PaperVenue::submitBracket(const domain::BracketRequest& request) {
    requireConnected_("submitBracket");
    if (submitFailures_ > 0) {
        --submitFailures_;
        throw domain::VenueError("PaperVenue: submission timed out");
    }
    if (request.quantity <= 0 || request.entryRef.empty()) {
        throw domain::VenueError("PaperVenue: malformed bracket request");
    }

    WorkingBracket bracket;
    bracket.request = request;
    bracket.entryId = nextId_();
    bracket.stopId = nextId_();
    bracket.targetId = nextId_();
    brackets_.push_back(bracket);

    LOG_INFO("PaperVenue: accepted bracket " << request.entryRef << " " << domain::toString(request.direction) << " x"
                                             << request.quantity);
    return domain::BracketAck{bracket.entryId, bracket.stopId, bracket.targetId};
}

std::vector<domain::VenueOrder> PaperVenue::queryOpenOrders() {
    requireConnected_("queryOpenOrders");
    std::vector<domain::VenueOrder> orders;
    for (const auto& bracket : brackets_) {
        const auto& symbol = bracket.request.symbol;
        orders.push_back(domain::VenueOrder{bracket.entryId, bracket.request.entryRef, symbol, LegRole::Entry,
                                            bracket.entryFilled ? OrderStatus::Filled : OrderStatus::Submitted});
        if (bracket.closed) {
            continue;
        }
        orders.push_back(domain::VenueOrder{bracket.stopId, bracket.request.stopRef, symbol, LegRole::StopLoss,
                                            OrderStatus::Submitted});
        orders.push_back(domain::VenueOrder{bracket.targetId, bracket.request.targetRef, symbol,
                                            LegRole::TakeProfit, OrderStatus::Submitted});
    }
    return orders;
}

std::vector<domain::VenuePosition> PaperVenue::queryPositions() {
    requireConnected_("queryPositions");
    std::vector<domain::VenuePosition> out;
    for (const auto& [symbol, position] : positions_) {
        if (position.quantity != 0) {
            out.push_back(position);
        }
    }
    return out;
}

void PaperVenue::setTickHandler(TickHandler handler) {
    tickHandler_ = std::move(handler);
}

void PaperVenue::setOrderStatusHandler(OrderStatusHandler handler) {
    statusHandler_ = std::move(handler);
}

void PaperVenue::setPosition(const std::string& symbol, int quantity, double averagePrice) {
    positions_[symbol] = domain::VenuePosition{symbol, quantity, averagePrice};
}

void PaperVenue::feedTick(const domain::Tick& tick) {
    if (!isAlive()) {
        return;
    }

    for (auto& bracket : brackets_) {
        const auto& request = bracket.request;
        if (bracket.closed || request.symbol != tick.symbol) {
            continue;
        }
        const int signedQty = request.direction == TradeDirection::Long ? request.quantity : -request.quantity;
        auto& position = positions_[request.symbol];
        position.symbol = request.symbol;

        if (!bracket.entryFilled) {
            bracket.entryFilled = true;
            position.quantity += signedQty;
            position.averagePrice = tick.price;
            emit_(bracket.entryId, request.entryRef, request.symbol, OrderStatus::Filled, tick.price, request.quantity,
                  tick.ts);
            continue;
        }

        const bool isShort = request.direction == TradeDirection::Short;
        const bool stopHit = isShort ? tick.price >= request.stopPrice : tick.price <= request.stopPrice;
        const bool targetHit = isShort ? tick.price <= request.targetPrice : tick.price >= request.targetPrice;
        if (!stopHit && !targetHit) {
            continue;
        }
        bracket.closed = true;
        position.quantity -= signedQty;
        if (stopHit) {
            emit_(bracket.stopId, request.stopRef, request.symbol, OrderStatus::Filled, request.stopPrice,
                  request.quantity, tick.ts);
            emit_(bracket.targetId, request.targetRef, request.symbol, OrderStatus::Cancelled, 0.0, 0, tick.ts);
        } else {
            emit_(bracket.targetId, request.targetRef, request.symbol, OrderStatus::Filled, request.targetPrice,
                  request.quantity, tick.ts);
            emit_(bracket.stopId, request.stopRef, request.symbol, OrderStatus::Cancelled, 0.0, 0, tick.ts);
        }
    }

    if (tickHandler_ && subscriptions_.count(tick.symbol) != 0) {
        tickHandler_(tick);
    }
}

void PaperVenue::requireConnected_(const char* operation) const {
    if (!connected_ || dropped_) {
        throw domain::VenueError(std::string{"PaperVenue: "} + operation + " while disconnected");
    }
}

std::string PaperVenue::nextId_() {
    return "P-" + std::to_string(++sequence_);
}

void PaperVenue::emit_(const std::string& orderId,
                       const std::string& reference,
                       const std::string& symbol,
                       OrderStatus status,
                       double price,
                       int quantity,
                       domain::TimestampMs ts) {
    if (!statusHandler_) {
        return;
    }
    domain::OrderStatusUpdate update;
    update.orderId = orderId;
    update.reference = reference;
    update.symbol = symbol;
    update.status = status;
    update.fillPrice = price;
    update.filledQuantity = quantity;
    update.ts = ts;
    try {
        statusHandler_(update);
    } catch (const std::exception& ex) {
        LOG_WARN("PaperVenue: order status handler failed: " << ex.what());
    }
}

}  // namespace adapters::paper
