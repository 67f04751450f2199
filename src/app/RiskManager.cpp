#include "app/RiskManager.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {

RiskManager::RiskManager(Config config) : config_(config) {
    if (!(config_.initialEquity > 0.0)) {
        throw std::invalid_argument("RiskManager: initial equity must be positive");
    }
    if (!(config_.riskPerTrade > 0.0) || config_.riskPerTrade >= 1.0) {
        throw std::invalid_argument("RiskManager: risk per trade must be in (0, 1)");
    }
    if (!(config_.pointValue > 0.0) || config_.maxContracts < 1) {
        throw std::invalid_argument("RiskManager: point value and contract cap must be positive");
    }
    if (!(config_.warnDrawdown >= 0.0) || !(config_.haltDrawdown > config_.warnDrawdown) ||
        config_.haltDrawdown >= 1.0) {
        throw std::invalid_argument("RiskManager: drawdown thresholds must satisfy 0 <= warn < halt < 1");
    }
    account_.equity = config_.initialEquity;
    account_.peakEquity = config_.initialEquity;
}

double RiskManager::drawdownScale() const {
    if (account_.drawdown <= config_.warnDrawdown) {
        return 1.0;
    }
    const double scale = (config_.haltDrawdown - account_.drawdown) / (config_.haltDrawdown - config_.warnDrawdown);
    return std::clamp(scale, 0.0, 1.0);
}

RiskManager::SizingDecision RiskManager::size(double entry, double stop, std::optional<double> atr) const {
    SizingDecision decision;
    if (account_.halted) {
        decision.halted = true;
        decision.reason = "trading halted at drawdown " + std::to_string(account_.drawdown);
        return decision;
    }

    const double stopDistance = std::abs(entry - stop);
    if (!std::isfinite(stopDistance) || stopDistance <= 0.0) {
        decision.reason = "invalid stop distance";
        return decision;
    }

    const double riskAmount = account_.equity * config_.riskPerTrade;
    double contracts = riskAmount / (stopDistance * config_.pointValue);
    std::ostringstream reason;
    reason << "risk=" << riskAmount << " stop_distance=" << stopDistance;

    if (atr && std::isfinite(*atr) && *atr > stopDistance) {
        contracts *= stopDistance / *atr;
        decision.reduced = true;
        reason << " volatility_scale=" << stopDistance / *atr;
    }

    const double scale = drawdownScale();
    if (scale < 1.0) {
        contracts *= scale;
        decision.reduced = true;
        reason << " drawdown_scale=" << scale;
    }

    int whole = static_cast<int>(std::floor(contracts));
    if (whole > config_.maxContracts) {
        whole = config_.maxContracts;
        reason << " capped";
    }
    if (whole < 1) {
        whole = 1;
        reason << " floor";
    }
    decision.contracts = whole;
    decision.reason = reason.str();
    return decision;
}

bool RiskManager::recordTradeResult(double pnl) {
    if (!std::isfinite(pnl)) {
        LOG_WARN("RiskManager: ignoring non-finite trade result");
        return false;
    }
    account_.equity += pnl;
    ++account_.trades;
    account_.peakEquity = std::max(account_.peakEquity, account_.equity);
    account_.drawdown =
        account_.peakEquity > 0.0 ? (account_.peakEquity - account_.equity) / account_.peakEquity : 0.0;

    auto& metrics = slob::common::metrics::Registry::instance();
    metrics.setGauge("account_equity", account_.equity);
    metrics.setGauge("account_drawdown", account_.drawdown);

    LOG_INFO("RiskManager: pnl=" << pnl << " equity=" << account_.equity << " drawdown=" << account_.drawdown);

    if (!account_.halted && account_.drawdown >= config_.haltDrawdown) {
        account_.halted = true;
        metrics.incrementCounter("trading_halts_total");
        LOG_CRIT("RiskManager: drawdown " << account_.drawdown << " reached halt threshold " << config_.haltDrawdown
                                          << "; new orders refused");
        return true;
    }
    if (account_.drawdown >= config_.warnDrawdown) {
        LOG_WARN("RiskManager: drawdown " << account_.drawdown << " above warning threshold, sizes reduced");
    }
    return false;
}

void RiskManager::clearHalt() {
    if (!account_.halted) {
        return;
    }
    account_.halted = false;
    // Drawdown is measured from the equity at the time of the clear.
    account_.peakEquity = account_.equity;
    account_.drawdown = 0.0;
    LOG_WARN("RiskManager: halt cleared by operator at equity " << account_.equity);
}

void RiskManager::restore(const AccountState& state) {
    if (!std::isfinite(state.equity) || !std::isfinite(state.peakEquity) || state.peakEquity < state.equity) {
        throw std::invalid_argument("RiskManager: persisted account has equity " + std::to_string(state.equity) +
                                    " and peak " + std::to_string(state.peakEquity));
    }
    account_ = state;
    account_.drawdown =
        account_.peakEquity > 0.0 ? (account_.peakEquity - account_.equity) / account_.peakEquity : 0.0;

    auto& metrics = slob::common::metrics::Registry::instance();
    metrics.setGauge("account_equity", account_.equity);
    metrics.setGauge("account_drawdown", account_.drawdown);
    if (account_.halted) {
        LOG_CRIT("RiskManager: restored in halted state at drawdown " << account_.drawdown
                                                                     << ", operator clear required");
    } else {
        LOG_INFO("RiskManager: restored equity=" << account_.equity << " drawdown=" << account_.drawdown);
    }
}

}  // namespace app
