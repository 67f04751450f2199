#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using TimestampMs = std::int64_t;

struct Tick {
    std::string symbol;
    double price{0.0};
    double size{0.0};
    TimestampMs ts{0};
};

struct Candle {
    std::string symbol;
    TimestampMs ts{0};
    double o{0.0};
    double h{0.0};
    double l{0.0};
    double c{0.0};
    double v{0.0};
    std::uint32_t tickCount{0};

    double body() const { return c >= o ? c - o : o - c; }
    double bodyTop() const { return c >= o ? c : o; }
    double bodyBottom() const { return c >= o ? o : c; }
    double upperWick() const { return h - bodyTop(); }
    double lowerWick() const { return bodyBottom() - l; }
    bool bullish() const { return c > o; }
    bool bearish() const { return c < o; }
};

enum class TradeDirection { Short, Long };

enum class SetupState {
    WatchingLiq1,
    WatchingConsol,
    WatchingLiq2,
    WaitingEntry,
    SetupComplete,
    Invalidated,
};

enum class InvalidationReason {
    None,
    ConsolTimeout,
    ConsolRangeInvalid,
    NoWickNotFound,
    Liq2Timeout,
    RetracementExceeded,
    EntryTimeout,
    MarketClosed,
    NegativeRiskReward,
};

struct SetupCandidate {
    std::string id;
    std::string symbol;
    TradeDirection direction{TradeDirection::Short};
    SetupState state{SetupState::WatchingLiq1};

    double sessionHigh{0.0};
    double sessionLow{0.0};

    TimestampMs liq1Time{0};
    double liq1Price{0.0};

    std::vector<Candle> consolCandles;
    double consolHigh{0.0};
    double consolLow{0.0};
    bool consolFrozen{false};
    TimestampMs consolConfirmedTime{0};
    std::uint32_t candlesSinceConsol{0};

    std::optional<Candle> noWickCandle;
    std::optional<Candle> liq2Candle;
    TimestampMs liq2Time{0};
    std::uint32_t candlesSinceLiq2{0};

    double entryPrice{0.0};
    double stopPrice{0.0};
    double targetPrice{0.0};
    double riskReward{0.0};
    double atrAtEntry{0.0};
    TimestampMs entryTriggerTime{0};

    TimestampMs createdAt{0};
    TimestampMs updatedAt{0};
    TimestampMs invalidatedAt{0};
    InvalidationReason invalidationReason{InvalidationReason::None};

    bool isTerminal() const {
        return state == SetupState::SetupComplete || state == SetupState::Invalidated;
    }
};

enum class LegRole { Entry, StopLoss, TakeProfit };

enum class OrderStatus { Pending, Submitted, Filled, Closed, Rejected, Cancelled };

struct BracketOrder {
    std::string setupId;
    std::string symbol;
    TradeDirection direction{TradeDirection::Short};
    std::string idempotencyKey;
    TimestampMs submittedAt{0};
    std::string entryRef;
    std::string stopRef;
    std::string targetRef;
    std::string entryOrderId;
    std::string stopOrderId;
    std::string targetOrderId;
    int quantity{0};
    double entryPrice{0.0};
    double stopPrice{0.0};
    double targetPrice{0.0};
    OrderStatus status{OrderStatus::Pending};
};

enum class TradeStatus { Open, Closed };

enum class ExitReason { None, StopLoss, TakeProfit, External };

struct Trade {
    std::string setupId;
    std::string symbol;
    TradeDirection direction{TradeDirection::Short};
    double entryPrice{0.0};
    double exitPrice{0.0};
    int size{0};
    TradeStatus status{TradeStatus::Open};
    ExitReason exitReason{ExitReason::None};
    double pnl{0.0};
    TimestampMs openedAt{0};
    TimestampMs closedAt{0};
};

// Running account figures behind position sizing and the drawdown halt.
struct AccountState {
    double equity{0.0};
    double peakEquity{0.0};
    double drawdown{0.0};
    bool halted{false};
    std::uint64_t trades{0};
};

enum class ConnectionPhase { Disconnected, Connecting, Connected, SafeMode };

struct ConnectionState {
    ConnectionPhase phase{ConnectionPhase::Disconnected};
    std::uint32_t consecutiveFailures{0};
};

struct VenueOrder {
    std::string orderId;
    std::string reference;
    std::string symbol;
    LegRole role{LegRole::Entry};
    OrderStatus status{OrderStatus::Submitted};
};

struct VenuePosition {
    std::string symbol;
    int quantity{0};
    double averagePrice{0.0};
};

struct OrderStatusUpdate {
    std::string orderId;
    std::string reference;
    std::string symbol;
    OrderStatus status{OrderStatus::Submitted};
    double fillPrice{0.0};
    int filledQuantity{0};
    TimestampMs ts{0};
    std::string message;
};

const char* toString(TradeDirection direction) noexcept;
const char* toString(SetupState state) noexcept;
const char* toString(InvalidationReason reason) noexcept;
const char* toString(LegRole role) noexcept;
const char* toString(OrderStatus status) noexcept;
const char* toString(TradeStatus status) noexcept;
const char* toString(ExitReason reason) noexcept;
const char* toString(ConnectionPhase phase) noexcept;

std::optional<TradeDirection> directionFromString(std::string_view text);
std::optional<SetupState> setupStateFromString(std::string_view text);
std::optional<InvalidationReason> invalidationReasonFromString(std::string_view text);
std::optional<OrderStatus> orderStatusFromString(std::string_view text);
std::optional<TradeStatus> tradeStatusFromString(std::string_view text);
std::optional<ExitReason> exitReasonFromString(std::string_view text);

}  // namespace domain
