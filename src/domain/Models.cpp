#include "domain/Models.hpp"

namespace domain {

const char* toString(TradeDirection direction) noexcept {
    switch (direction) {
    case TradeDirection::Short:
        return "SHORT";
    case TradeDirection::Long:
        return "LONG";
    }
    return "SHORT";
}

const char* toString(SetupState state) noexcept {
    switch (state) {
    case SetupState::WatchingLiq1:
        return "WATCHING_LIQ1";
    case SetupState::WatchingConsol:
        return "WATCHING_CONSOL";
    case SetupState::WatchingLiq2:
        return "WATCHING_LIQ2";
    case SetupState::WaitingEntry:
        return "WAITING_ENTRY";
    case SetupState::SetupComplete:
        return "SETUP_COMPLETE";
    case SetupState::Invalidated:
        return "INVALIDATED";
    }
    return "WATCHING_LIQ1";
}

const char* toString(InvalidationReason reason) noexcept {
    switch (reason) {
    case InvalidationReason::None:
        return "NONE";
    case InvalidationReason::ConsolTimeout:
        return "CONSOL_TIMEOUT";
    case InvalidationReason::ConsolRangeInvalid:
        return "CONSOL_RANGE_INVALID";
    case InvalidationReason::NoWickNotFound:
        return "NO_WICK_NOT_FOUND";
    case InvalidationReason::Liq2Timeout:
        return "LIQ2_TIMEOUT";
    case InvalidationReason::RetracementExceeded:
        return "RETRACEMENT_EXCEEDED";
    case InvalidationReason::EntryTimeout:
        return "ENTRY_TIMEOUT";
    case InvalidationReason::MarketClosed:
        return "MARKET_CLOSED";
    case InvalidationReason::NegativeRiskReward:
        return "NEGATIVE_RISK_REWARD";
    }
    return "NONE";
}

const char* toString(LegRole role) noexcept {
    switch (role) {
    case LegRole::Entry:
        return "ENTRY";
    case LegRole::StopLoss:
        return "STOP";
    case LegRole::TakeProfit:
        return "TARGET";
    }
    return "ENTRY";
}

const char* toString(OrderStatus status) noexcept {
    switch (status) {
    case OrderStatus::Pending:
        return "PENDING";
    case OrderStatus::Submitted:
        return "SUBMITTED";
    case OrderStatus::Filled:
        return "FILLED";
    case OrderStatus::Closed:
        return "CLOSED";
    case OrderStatus::Rejected:
        return "REJECTED";
    case OrderStatus::Cancelled:
        return "CANCELLED";
    }
    return "PENDING";
}

const char* toString(TradeStatus status) noexcept {
    return status == TradeStatus::Open ? "OPEN" : "CLOSED";
}

const char* toString(ExitReason reason) noexcept {
    switch (reason) {
    case ExitReason::None:
        return "NONE";
    case ExitReason::StopLoss:
        return "STOP_LOSS";
    case ExitReason::TakeProfit:
        return "TAKE_PROFIT";
    case ExitReason::External:
        return "EXTERNAL";
    }
    return "NONE";
}

const char* toString(ConnectionPhase phase) noexcept {
    switch (phase) {
    case ConnectionPhase::Disconnected:
        return "disconnected";
    case ConnectionPhase::Connecting:
        return "connecting";
    case ConnectionPhase::Connected:
        return "connected";
    case ConnectionPhase::SafeMode:
        return "safe_mode";
    }
    return "disconnected";
}

std::optional<TradeDirection> directionFromString(std::string_view text) {
    if (text == "SHORT") {
        return TradeDirection::Short;
    }
    if (text == "LONG") {
        return TradeDirection::Long;
    }
    return std::nullopt;
}

std::optional<SetupState> setupStateFromString(std::string_view text) {
    for (auto state : {SetupState::WatchingLiq1,
                       SetupState::WatchingConsol,
                       SetupState::WatchingLiq2,
                       SetupState::WaitingEntry,
                       SetupState::SetupComplete,
                       SetupState::Invalidated}) {
        if (text == toString(state)) {
            return state;
        }
    }
    return std::nullopt;
}

std::optional<InvalidationReason> invalidationReasonFromString(std::string_view text) {
    for (auto reason : {InvalidationReason::None,
                        InvalidationReason::ConsolTimeout,
                        InvalidationReason::ConsolRangeInvalid,
                        InvalidationReason::NoWickNotFound,
                        InvalidationReason::Liq2Timeout,
                        InvalidationReason::RetracementExceeded,
                        InvalidationReason::EntryTimeout,
                        InvalidationReason::MarketClosed,
                        InvalidationReason::NegativeRiskReward}) {
        if (text == toString(reason)) {
            return reason;
        }
    }
    return std::nullopt;
}

std::optional<OrderStatus> orderStatusFromString(std::string_view text) {
    for (auto status : {OrderStatus::Pending,
                        OrderStatus::Submitted,
                        OrderStatus::Filled,
                        OrderStatus::Closed,
                        OrderStatus::Rejected,
                        OrderStatus::Cancelled}) {
        if (text == toString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<TradeStatus> tradeStatusFromString(std::string_view text) {
    if (text == "OPEN") {
        return TradeStatus::Open;
    }
    if (text == "CLOSED") {
        return TradeStatus::Closed;
    }
    return std::nullopt;
}

std::optional<ExitReason> exitReasonFromString(std::string_view text) {
    for (auto reason : {ExitReason::None, ExitReason::StopLoss, ExitReason::TakeProfit, ExitReason::External}) {
        if (text == toString(reason)) {
            return reason;
        }
    }
    return std::nullopt;
}

}  // namespace domain
