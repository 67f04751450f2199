#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "domain/Models.hpp"

namespace core {

// Order matches the alternatives of EventPayload.
enum class EventKind : std::size_t {
    CandleCompleted = 0,
    SetupDetected,
    SetupInvalidated,
    OrderPlaced,
    OrderFilled,
    OrderRejected,
    PositionClosed,
    ConnectionLost,
    ConnectionRestored,
    SafeModeEntered,
    ReconciliationAlert,
    TradingHalted,
};

struct CandleCompleted {
    domain::Candle candle;
    bool synthetic{false};
};

struct SetupDetected {
    domain::SetupCandidate setup;
};

struct SetupInvalidated {
    std::string setupId;
    std::string symbol;
    domain::SetupState lastState{domain::SetupState::WatchingLiq1};
    domain::InvalidationReason reason{domain::InvalidationReason::None};
    domain::TimestampMs ts{0};
};

struct OrderPlaced {
    domain::BracketOrder bracket;
};

struct OrderFilled {
    std::string setupId;
    std::string symbol;
    domain::LegRole role{domain::LegRole::Entry};
    double price{0.0};
    int quantity{0};
};

struct OrderRejected {
    std::string setupId;
    std::string symbol;
    std::string reason;
};

struct PositionClosed {
    domain::Trade trade;
};

struct ConnectionLost {
    std::string reason;
};

struct ConnectionRestored {
    std::uint32_t attempts{0};
};

struct SafeModeEntered {
    std::string reason;
    std::uint32_t consecutiveFailures{0};
};

struct ReconciliationAlert {
    std::string symbol;
    int venueQuantity{0};
    std::string message;
};

struct TradingHalted {
    double drawdown{0.0};
    double equity{0.0};
};

using EventPayload = std::variant<CandleCompleted,
                                  SetupDetected,
                                  SetupInvalidated,
                                  OrderPlaced,
                                  OrderFilled,
                                  OrderRejected,
                                  PositionClosed,
                                  ConnectionLost,
                                  ConnectionRestored,
                                  SafeModeEntered,
                                  ReconciliationAlert,
                                  TradingHalted>;

struct Event {
    EventKind kind{EventKind::CandleCompleted};
    std::uint64_t sequence{0};
    domain::TimestampMs publishedAt{0};
    EventPayload payload;
};

inline EventKind kindOf(const EventPayload& payload) {
    return static_cast<EventKind>(payload.index());
}

inline const char* toString(EventKind kind) {
    switch (kind) {
    case EventKind::CandleCompleted:
        return "CandleCompleted";
    case EventKind::SetupDetected:
        return "SetupDetected";
    case EventKind::SetupInvalidated:
        return "SetupInvalidated";
    case EventKind::OrderPlaced:
        return "OrderPlaced";
    case EventKind::OrderFilled:
        return "OrderFilled";
    case EventKind::OrderRejected:
        return "OrderRejected";
    case EventKind::PositionClosed:
        return "PositionClosed";
    case EventKind::ConnectionLost:
        return "ConnectionLost";
    case EventKind::ConnectionRestored:
        return "ConnectionRestored";
    case EventKind::SafeModeEntered:
        return "SafeModeEntered";
    case EventKind::ReconciliationAlert:
        return "ReconciliationAlert";
    case EventKind::TradingHalted:
        return "TradingHalted";
    }
    return "Unknown";
}

}  // namespace core
