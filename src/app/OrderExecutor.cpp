#include "app/OrderExecutor.hpp"

#include <cmath>
#include <exception>
#include <stdexcept>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.h"

namespace app {

using domain::BracketOrder;
using domain::LegRole;
using domain::OrderStatus;
using domain::TradeDirection;

const char* toString(SubmitStatus status) noexcept {
    switch (status) {
    case SubmitStatus::Submitted:
        return "SUBMITTED";
    case SubmitStatus::DuplicateOrder:
        return "DUPLICATE_ORDER";
    case SubmitStatus::ConnectionUnavailable:
        return "CONNECTION_UNAVAILABLE";
    case SubmitStatus::SafeMode:
        return "SAFE_MODE";
    case SubmitStatus::RiskRejected:
        return "RISK_REJECTED";
    case SubmitStatus::InvalidSetup:
        return "INVALID_SETUP";
    case SubmitStatus::VenueRejected:
        return "VENUE_REJECTED";
    }
    return "UNKNOWN";
}

namespace {

SubmitResult result(SubmitStatus status, std::string message, std::optional<BracketOrder> bracket = std::nullopt) {
    SubmitResult out;
    out.status = status;
    out.message = std::move(message);
    out.bracket = std::move(bracket);
    return out;
}

bool pricesValid(const domain::SetupCandidate& setup) {
    for (const double value : {setup.entryPrice, setup.stopPrice, setup.targetPrice}) {
        if (!std::isfinite(value) || value <= 0.0) {
            return false;
        }
    }
    if (setup.direction == TradeDirection::Short) {
        return setup.stopPrice > setup.entryPrice && setup.targetPrice < setup.entryPrice;
    }
    return setup.stopPrice < setup.entryPrice && setup.targetPrice > setup.entryPrice;
}

}  // namespace

OrderExecutor::OrderExecutor(domain::IVenueLink& venue,
                             domain::IStateStore& store,
                             ConnectionSupervisor& supervisor,
                             RiskManager& risk,
                             core::EventBus& bus,
                             Config config,
                             Clock clock)
    : venue_(venue),
      store_(store),
      supervisor_(supervisor),
      risk_(risk),
      bus_(bus),
      config_(std::move(config)),
      clock_(std::move(clock)) {
    if (config_.maxSubmitAttempts < 1) {
        throw std::invalid_argument("OrderExecutor: maxSubmitAttempts must be at least 1");
    }
    if (!(config_.pointValue > 0.0)) {
        throw std::invalid_argument("OrderExecutor: point value must be positive");
    }
    if (!clock_) {
        clock_ = [] { return core::nowMs(); };
    }
}

std::string OrderExecutor::idempotencyKey(const std::string& setupId) const {
    return config_.keyPrefix + setupId;
}

std::string OrderExecutor::legReference(const std::string& key, domain::TimestampMs submittedAt, LegRole role) {
    return key + "-" + std::to_string(submittedAt) + "-" + domain::toString(role);
}

SubmitResult OrderExecutor::execute(const domain::SetupCandidate& setup) {
    const auto decision = risk_.size(setup.entryPrice, setup.stopPrice,
                                     setup.atrAtEntry > 0.0 ? std::optional<double>(setup.atrAtEntry) : std::nullopt);
    if (decision.halted || decision.contracts <= 0) {
        LOG_WARN("OrderExecutor: " << setup.id << " refused by risk: " << decision.reason);
        slob::common::metrics::Registry::instance().incrementCounter("orders_risk_rejected_total");
        bus_.publish(core::OrderRejected{setup.id, setup.symbol, decision.reason});
        return result(SubmitStatus::RiskRejected, decision.reason);
    }
    LOG_INFO("OrderExecutor: sized " << setup.id << " at " << decision.contracts << " contract(s): "
                                     << decision.reason);
    return submitBracket(setup, decision.contracts);
}

SubmitResult OrderExecutor::submitBracket(const domain::SetupCandidate& setup, int quantity) {
    if (setup.id.empty() || setup.state != domain::SetupState::SetupComplete || !pricesValid(setup)) {
        LOG_WARN("OrderExecutor: invalid setup '" << setup.id << "' state=" << domain::toString(setup.state)
                                                  << " entry=" << setup.entryPrice << " stop=" << setup.stopPrice
                                                  << " target=" << setup.targetPrice);
        return result(SubmitStatus::InvalidSetup, "setup is not complete or has inconsistent prices");
    }
    if (quantity <= 0) {
        return result(SubmitStatus::RiskRejected, "quantity must be positive");
    }

    auto existing = brackets_.find(setup.id);
    const bool retry = existing != brackets_.end() && (existing->second.status == OrderStatus::Rejected ||
                                                       existing->second.status == OrderStatus::Cancelled);
    if (existing != brackets_.end() && !retry && existing->second.status != OrderStatus::Pending) {
        LOG_WARN("OrderExecutor: duplicate submission for " << setup.id << " (local status "
                                                            << domain::toString(existing->second.status) << ")");
        slob::common::metrics::Registry::instance().incrementCounter("orders_duplicate_total");
        return result(SubmitStatus::DuplicateOrder, "bracket already exists for setup", existing->second);
    }

    // Nothing is recorded for a setup until the link is usable, so a refused
    // submission cannot be picked up by a later resume.
    inFlight_ = setup.id;
    auto refused = gate_(setup.id);
    inFlight_.clear();
    if (refused) {
        return *refused;
    }

    if (retry) {
        LOG_INFO("OrderExecutor: resubmitting " << setup.id << " after "
                                                << domain::toString(existing->second.status));
        existing->second.status = OrderStatus::Pending;
        existing->second.quantity = quantity;
    }
    if (existing == brackets_.end()) {
        BracketOrder bracket;
        bracket.setupId = setup.id;
        bracket.symbol = setup.symbol;
        bracket.direction = setup.direction;
        bracket.idempotencyKey = idempotencyKey(setup.id);
        bracket.quantity = quantity;
        bracket.entryPrice = setup.entryPrice;
        bracket.stopPrice = setup.stopPrice;
        bracket.targetPrice = setup.targetPrice;
        bracket.status = OrderStatus::Pending;
        existing = brackets_.emplace(setup.id, std::move(bracket)).first;
    }

    auto outcome = submit_(existing->second);
    if (existing->second.status == OrderStatus::Pending && existing->second.submittedAt == 0) {
        // The duplicate check failed before anything reached the store or the venue.
        brackets_.erase(existing);
    }
    return outcome;
}

std::optional<SubmitResult> OrderExecutor::gate_(const std::string& setupId) {
    if (supervisor_.inSafeMode()) {
        LOG_WARN("OrderExecutor: " << setupId << " refused, venue link in safe mode");
        return result(SubmitStatus::SafeMode, "venue link in safe mode");
    }
    if (!supervisor_.isHealthy()) {
        LOG_WARN("OrderExecutor: venue link unhealthy before submitting " << setupId << ", reconnecting");
        if (!supervisor_.reconnectNow()) {
            const auto status = supervisor_.inSafeMode() ? SubmitStatus::SafeMode : SubmitStatus::ConnectionUnavailable;
            LOG_ERR("OrderExecutor: aborting " << setupId << ": " << toString(status));
            return result(status, "venue connection unavailable");
        }
    }
    return std::nullopt;
}

SubmitResult OrderExecutor::submit_(BracketOrder& bracket) {
    std::vector<domain::VenueOrder> orders;
    try {
        slob::common::metrics::Registry::ScopedTimer timer("venue_query_orders");
        orders = venue_.queryOpenOrders();
    } catch (const std::exception& ex) {
        LOG_ERR("OrderExecutor: duplicate check failed for " << bracket.setupId << ": " << ex.what());
        return result(SubmitStatus::ConnectionUnavailable, std::string{"duplicate check failed: "} + ex.what());
    }
    if (adoptFromVenue_(bracket, orders)) {
        LOG_WARN("OrderExecutor: venue already holds orders for " << bracket.idempotencyKey
                                                                  << ", nothing submitted");
        slob::common::metrics::Registry::instance().incrementCounter("orders_duplicate_total");
        return result(SubmitStatus::DuplicateOrder, "venue already holds orders for setup", bracket);
    }

    if (bracket.submittedAt == 0) {
        bracket.submittedAt = clock_();
        bracket.entryRef = legReference(bracket.idempotencyKey, bracket.submittedAt, LegRole::Entry);
        bracket.stopRef = legReference(bracket.idempotencyKey, bracket.submittedAt, LegRole::StopLoss);
        bracket.targetRef = legReference(bracket.idempotencyKey, bracket.submittedAt, LegRole::TakeProfit);
    }
    index_(bracket);
    persist_(bracket);

    domain::BracketRequest request;
    request.symbol = bracket.symbol;
    request.direction = bracket.direction;
    request.quantity = bracket.quantity;
    request.entryPrice = bracket.entryPrice;
    request.stopPrice = bracket.stopPrice;
    request.targetPrice = bracket.targetPrice;
    request.entryRef = bracket.entryRef;
    request.stopRef = bracket.stopRef;
    request.targetRef = bracket.targetRef;

    std::string lastError;
    for (int attempt = 1; attempt <= config_.maxSubmitAttempts; ++attempt) {
        if (attempt > 1) {
            try {
                if (adoptFromVenue_(bracket, venue_.queryOpenOrders())) {
                    LOG_INFO("OrderExecutor: adopted bracket " << bracket.idempotencyKey
                                                               << " found on venue after failed attempt");
                    persist_(bracket);
                    bus_.publish(core::OrderPlaced{bracket});
                    return result(SubmitStatus::Submitted, "adopted existing venue orders", bracket);
                }
            } catch (const std::exception& ex) {
                LOG_WARN("OrderExecutor: re-query before retry failed: " << ex.what());
            }
        }
        try {
            slob::common::metrics::Registry::ScopedTimer timer("venue_submit_bracket");
            const auto ack = venue_.submitBracket(request);
            bracket.entryOrderId = ack.entryOrderId;
            bracket.stopOrderId = ack.stopOrderId;
            bracket.targetOrderId = ack.targetOrderId;
            bracket.status = OrderStatus::Submitted;
            persist_(bracket);
            slob::common::metrics::Registry::instance().incrementCounter("orders_submitted_total");
            LOG_INFO("OrderExecutor: bracket " << bracket.idempotencyKey << ' ' << domain::toString(bracket.direction)
                                               << " x" << bracket.quantity << " entry=" << bracket.entryPrice
                                               << " stop=" << bracket.stopPrice << " target=" << bracket.targetPrice
                                               << " submitted on attempt " << attempt);
            bus_.publish(core::OrderPlaced{bracket});
            return result(SubmitStatus::Submitted, "submitted", bracket);
        } catch (const std::exception& ex) {
            lastError = ex.what();
            LOG_WARN("OrderExecutor: submit attempt " << attempt << "/" << config_.maxSubmitAttempts << " for "
                                                      << bracket.setupId << " failed: " << lastError);
        }
    }

    bracket.status = OrderStatus::Rejected;
    persist_(bracket);
    slob::common::metrics::Registry::instance().incrementCounter("orders_rejected_total");
    LOG_ERR("OrderExecutor: giving up on " << bracket.setupId << " after " << config_.maxSubmitAttempts
                                           << " attempts: " << lastError);
    bus_.publish(core::OrderRejected{bracket.setupId, bracket.symbol, lastError});
    return result(SubmitStatus::VenueRejected, lastError, bracket);
}

bool OrderExecutor::adoptFromVenue_(BracketOrder& bracket, const std::vector<domain::VenueOrder>& orders) {
    const std::string marker = bracket.idempotencyKey + "-";
    bool found = false;
    for (const auto& order : orders) {
        if (order.reference.find(marker) == std::string::npos) {
            continue;
        }
        found = true;
        switch (order.role) {
        case LegRole::Entry:
            bracket.entryOrderId = order.orderId;
            bracket.entryRef = order.reference;
            break;
        case LegRole::StopLoss:
            bracket.stopOrderId = order.orderId;
            bracket.stopRef = order.reference;
            break;
        case LegRole::TakeProfit:
            bracket.targetOrderId = order.orderId;
            bracket.targetRef = order.reference;
            break;
        }
        if (order.role == LegRole::Entry && order.status == OrderStatus::Filled) {
            bracket.status = OrderStatus::Filled;
        }
    }
    if (found) {
        if (bracket.status == OrderStatus::Pending || bracket.status == OrderStatus::Rejected) {
            bracket.status = OrderStatus::Submitted;
        }
        index_(bracket);
        persist_(bracket);
    }
    return found;
}

void OrderExecutor::index_(const BracketOrder& bracket) {
    const std::pair<const std::string*, LegRole> refs[] = {
        {&bracket.entryRef, LegRole::Entry},
        {&bracket.stopRef, LegRole::StopLoss},
        {&bracket.targetRef, LegRole::TakeProfit},
        {&bracket.entryOrderId, LegRole::Entry},
        {&bracket.stopOrderId, LegRole::StopLoss},
        {&bracket.targetOrderId, LegRole::TakeProfit},
    };
    for (const auto& [ref, role] : refs) {
        if (!ref->empty()) {
            legs_[*ref] = {bracket.setupId, role};
        }
    }
}

std::optional<std::pair<std::string, LegRole>> OrderExecutor::locate_(const domain::OrderStatusUpdate& update) const {
    if (!update.reference.empty()) {
        auto it = legs_.find(update.reference);
        if (it != legs_.end()) {
            return it->second;
        }
    }
    if (!update.orderId.empty()) {
        auto it = legs_.find(update.orderId);
        if (it != legs_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

void OrderExecutor::persist_(const BracketOrder& bracket) {
    if (!store_.saveBracket(bracket)) {
        LOG_ERR("OrderExecutor: failed to persist bracket " << bracket.setupId << " status "
                                                            << domain::toString(bracket.status));
    }
}

void OrderExecutor::persist_(const domain::Trade& trade) {
    if (!store_.saveTrade(trade)) {
        LOG_ERR("OrderExecutor: failed to persist trade " << trade.setupId);
    }
}

void OrderExecutor::persist_(const domain::AccountState& account) {
    if (!store_.saveAccount(account)) {
        LOG_ERR("OrderExecutor: failed to persist account after " << account.trades << " trade(s)");
    }
}

void OrderExecutor::onOrderStatus(const domain::OrderStatusUpdate& update) {
    const auto located = locate_(update);
    if (!located) {
        LOG_DEBUG("OrderExecutor: status for unknown order id=" << update.orderId << " ref=" << update.reference);
        return;
    }
    auto it = brackets_.find(located->first);
    if (it == brackets_.end()) {
        return;
    }
    auto& bracket = it->second;
    const auto role = located->second;

    switch (update.status) {
    case OrderStatus::Filled:
        if (role == LegRole::Entry) {
            onEntryFilled_(bracket, update);
        } else {
            onExitFilled_(bracket, role, update);
        }
        break;
    case OrderStatus::Rejected:
    case OrderStatus::Cancelled:
        if (role == LegRole::Entry) {
            onEntryFailed_(bracket, update);
        } else {
            LOG_DEBUG("OrderExecutor: " << domain::toString(role) << " leg of " << bracket.setupId << ' '
                                        << domain::toString(update.status));
        }
        break;
    case OrderStatus::Pending:
    case OrderStatus::Submitted:
    case OrderStatus::Closed:
        break;
    }
}

void OrderExecutor::onEntryFilled_(BracketOrder& bracket, const domain::OrderStatusUpdate& update) {
    if (trades_.count(bracket.setupId) != 0) {
        LOG_DEBUG("OrderExecutor: repeated entry fill for " << bracket.setupId);
        return;
    }
    bracket.status = OrderStatus::Filled;
    persist_(bracket);

    domain::Trade trade;
    trade.setupId = bracket.setupId;
    trade.symbol = bracket.symbol;
    trade.direction = bracket.direction;
    trade.entryPrice = update.fillPrice > 0.0 ? update.fillPrice : bracket.entryPrice;
    trade.size = update.filledQuantity > 0 ? update.filledQuantity : bracket.quantity;
    trade.status = domain::TradeStatus::Open;
    trade.openedAt = update.ts != 0 ? update.ts : clock_();
    persist_(trade);
    trades_[trade.setupId] = trade;

    slob::common::metrics::Registry::instance().incrementCounter("orders_filled_total");
    LOG_INFO("OrderExecutor: entry filled for " << trade.setupId << ' ' << domain::toString(trade.direction) << " x"
                                                << trade.size << " @ " << trade.entryPrice);
    bus_.publish(core::OrderFilled{trade.setupId, trade.symbol, LegRole::Entry, trade.entryPrice, trade.size});
}

void OrderExecutor::onExitFilled_(BracketOrder& bracket, LegRole role, const domain::OrderStatusUpdate& update) {
    auto it = trades_.find(bracket.setupId);
    if (it == trades_.end() || it->second.status != domain::TradeStatus::Open) {
        LOG_DEBUG("OrderExecutor: exit fill for " << bracket.setupId << " without an open trade");
        return;
    }
    auto& trade = it->second;
    const double exit = update.fillPrice > 0.0
                            ? update.fillPrice
                            : (role == LegRole::StopLoss ? bracket.stopPrice : bracket.targetPrice);
    const double points = trade.direction == TradeDirection::Short ? trade.entryPrice - exit : exit - trade.entryPrice;

    trade.exitPrice = exit;
    trade.exitReason = role == LegRole::StopLoss ? domain::ExitReason::StopLoss : domain::ExitReason::TakeProfit;
    trade.pnl = points * trade.size * config_.pointValue;
    trade.status = domain::TradeStatus::Closed;
    trade.closedAt = update.ts != 0 ? update.ts : clock_();
    persist_(trade);

    bracket.status = OrderStatus::Closed;
    persist_(bracket);

    LOG_INFO("OrderExecutor: " << trade.setupId << " closed by " << domain::toString(trade.exitReason) << " @ "
                               << exit << " pnl=" << trade.pnl);
    bus_.publish(core::OrderFilled{trade.setupId, trade.symbol, role, exit, trade.size});
    bus_.publish(core::PositionClosed{trade});

    const bool halted = risk_.recordTradeResult(trade.pnl);
    persist_(risk_.account());
    if (halted) {
        bus_.publish(core::TradingHalted{risk_.account().drawdown, risk_.account().equity});
    }
}

void OrderExecutor::onEntryFailed_(BracketOrder& bracket, const domain::OrderStatusUpdate& update) {
    if (bracket.status == OrderStatus::Filled || bracket.status == OrderStatus::Closed) {
        return;
    }
    bracket.status = update.status;
    persist_(bracket);
    LOG_WARN("OrderExecutor: entry for " << bracket.setupId << ' ' << domain::toString(update.status) << ": "
                                         << update.message);
    bus_.publish(core::OrderRejected{bracket.setupId, bracket.symbol,
                                     update.message.empty() ? domain::toString(update.status) : update.message});
}

std::size_t OrderExecutor::finalizeExternallyClosed(const std::string& symbol) {
    std::size_t closed = 0;
    for (auto& [setupId, trade] : trades_) {
        if (trade.symbol != symbol || trade.status != domain::TradeStatus::Open) {
            continue;
        }
        trade.status = domain::TradeStatus::Closed;
        trade.exitReason = domain::ExitReason::External;
        trade.exitPrice = trade.entryPrice;
        trade.pnl = 0.0;
        trade.closedAt = clock_();
        persist_(trade);

        auto bracketIt = brackets_.find(setupId);
        if (bracketIt != brackets_.end()) {
            bracketIt->second.status = OrderStatus::Closed;
            persist_(bracketIt->second);
        }
        LOG_WARN("OrderExecutor: trade " << setupId << " finalized locally, venue holds no " << symbol
                                         << " position");
        bus_.publish(core::PositionClosed{trade});
        ++closed;
    }
    return closed;
}

void OrderExecutor::restore(const std::vector<BracketOrder>& brackets, const std::vector<domain::Trade>& trades) {
    for (const auto& bracket : brackets) {
        brackets_[bracket.setupId] = bracket;
        index_(bracket);
    }
    for (const auto& trade : trades) {
        trades_[trade.setupId] = trade;
    }
    LOG_INFO("OrderExecutor: restored " << brackets.size() << " bracket(s) and " << trades.size()
                                        << " open trade(s)");
}

std::size_t OrderExecutor::resumePending() {
    std::vector<std::string> ids;
    for (const auto& [setupId, bracket] : brackets_) {
        // Only brackets that were persisted with their leg references count as
        // in flight; the submission that triggered a reconnect resumes itself.
        if (bracket.status == OrderStatus::Pending && bracket.submittedAt != 0 && setupId != inFlight_) {
            ids.push_back(setupId);
        }
    }
    if (ids.empty()) {
        return 0;
    }
    if (auto refused = gate_(ids.front())) {
        LOG_WARN("OrderExecutor: " << ids.size() << " pending bracket(s) left for the next connect: "
                                   << refused->message);
        return 0;
    }

    std::size_t resumed = 0;
    for (const auto& setupId : ids) {
        auto it = brackets_.find(setupId);
        if (it == brackets_.end() || it->second.status != OrderStatus::Pending) {
            continue;
        }
        LOG_INFO("OrderExecutor: resuming pending bracket " << setupId);
        const auto outcome = submit_(it->second);
        LOG_INFO("OrderExecutor: resume of " << setupId << " -> " << toString(outcome.status));
        if (outcome.status == SubmitStatus::Submitted || outcome.status == SubmitStatus::DuplicateOrder) {
            ++resumed;
        }
    }
    return resumed;
}

const BracketOrder* OrderExecutor::bracket(const std::string& setupId) const {
    auto it = brackets_.find(setupId);
    return it == brackets_.end() ? nullptr : &it->second;
}

const domain::Trade* OrderExecutor::trade(const std::string& setupId) const {
    auto it = trades_.find(setupId);
    return it == trades_.end() ? nullptr : &it->second;
}

std::vector<domain::Trade> OrderExecutor::openTrades() const {
    std::vector<domain::Trade> out;
    for (const auto& [id, trade] : trades_) {
        if (trade.status == domain::TradeStatus::Open) {
            out.push_back(trade);
        }
    }
    return out;
}

std::vector<BracketOrder> OrderExecutor::pendingBrackets() const {
    std::vector<BracketOrder> out;
    for (const auto& [id, bracket] : brackets_) {
        if (bracket.status == OrderStatus::Pending) {
            out.push_back(bracket);
        }
    }
    return out;
}

}  // namespace app
