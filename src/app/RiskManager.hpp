#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/Models.hpp"

namespace app {

// Position sizing and drawdown control. Equity, peak and drawdown are owned here
// and only change through recordTradeResult(), clearHalt() and restore().
class RiskManager {
public:
    struct Config {
        double initialEquity{50'000.0};
        double riskPerTrade{0.02};
        double pointValue{20.0};
        int maxContracts{5};
        double warnDrawdown{0.15};
        double haltDrawdown{0.25};
    };

    struct SizingDecision {
        int contracts{0};
        bool halted{false};
        bool reduced{false};
        std::string reason;
    };

    using AccountState = domain::AccountState;

    explicit RiskManager(Config config);

    SizingDecision size(double entry, double stop, std::optional<double> atr = std::nullopt) const;

    // Returns true when this result tripped the halt threshold.
    bool recordTradeResult(double pnl);
    void clearHalt();
    // Replaces the running figures with persisted ones; drawdown is recomputed.
    // Throws std::invalid_argument on non-finite figures or a peak below equity.
    void restore(const AccountState& state);

    const AccountState& account() const { return account_; }
    bool halted() const { return account_.halted; }
    double drawdownScale() const;
    const Config& config() const { return config_; }

private:
    Config config_;
    AccountState account_;
};

}  // namespace app
