#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/Models.hpp"

namespace domain {

class VenueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BracketRequest {
    std::string symbol;
    TradeDirection direction{TradeDirection::Short};
    int quantity{0};
    double entryPrice{0.0};
    double stopPrice{0.0};
    double targetPrice{0.0};
    std::string entryRef;
    std::string stopRef;
    std::string targetRef;
};

struct BracketAck {
    std::string entryOrderId;
    std::string stopOrderId;
    std::string targetOrderId;
};

// Typed capability set of the execution venue. Implementations throw VenueError
// when a call cannot be completed.
class IVenueLink {
public:
    using TickHandler = std::function<void(const Tick&)>;
    using OrderStatusHandler = std::function<void(const OrderStatusUpdate&)>;

    virtual ~IVenueLink() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isAlive() = 0;

    virtual void subscribe(const std::string& symbol) = 0;
    virtual void unsubscribe(const std::string& symbol) = 0;

    virtual BracketAck submitBracket(const BracketRequest& request) = 0;
    // Open orders plus orders filled recently enough to matter for duplicate checks.
    virtual std::vector<VenueOrder> queryOpenOrders() = 0;
    virtual std::vector<VenuePosition> queryPositions() = 0;

    virtual void setTickHandler(TickHandler handler) = 0;
    virtual void setOrderStatusHandler(OrderStatusHandler handler) = 0;
};

class IStateStore {
public:
    virtual ~IStateStore() = default;

    virtual bool saveSetup(const SetupCandidate& setup) = 0;
    virtual std::vector<SetupCandidate> loadActiveSetups() = 0;

    virtual bool saveTrade(const Trade& trade) = 0;
    virtual std::vector<Trade> loadOpenTrades() = 0;

    virtual bool saveBracket(const BracketOrder& bracket) = 0;
    virtual std::vector<BracketOrder> loadBrackets() = 0;

    // Single-row account snapshot; loadAccount() is empty until the first save.
    virtual bool saveAccount(const AccountState& account) = 0;
    virtual std::optional<AccountState> loadAccount() = 0;

    virtual bool saveCandle(const Candle& candle) {
        (void)candle;
        return true;
    }

    virtual void flush() {}
};

}  // namespace domain
