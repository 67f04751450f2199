#include "app/SetupTracker.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.h"

namespace app {

using domain::Candle;
using domain::InvalidationReason;
using domain::SetupCandidate;
using domain::SetupState;
using domain::TradeDirection;

double spikeRuleStop(const Candle& liq2Candle, TradeDirection direction, double buffer) {
    const double body = liq2Candle.body();
    if (direction == TradeDirection::Short) {
        if (body > 0.0 && liq2Candle.upperWick() > 2.0 * body) {
            return liq2Candle.bodyTop() + buffer;
        }
        return liq2Candle.h + buffer;
    }
    if (body > 0.0 && liq2Candle.lowerWick() > 2.0 * body) {
        return liq2Candle.bodyBottom() - buffer;
    }
    return liq2Candle.l - buffer;
}

bool SetupTracker::Transition::operator==(const Transition& other) const {
    return setupId == other.setupId && direction == other.direction && from == other.from && to == other.to &&
           candleTs == other.candleTs && price == other.price && reason == other.reason;
}

SetupTracker::SetupTracker(std::string symbol, Config config)
    : symbol_(std::move(symbol)), config_(config) {
    if (symbol_.empty()) {
        throw std::invalid_argument("SetupTracker: symbol must not be empty");
    }
    if (config_.referenceStartMinute >= config_.referenceEndMinute ||
        config_.referenceEndMinute >= config_.tradingEndMinute) {
        throw std::invalid_argument("SetupTracker: session windows must be ordered");
    }
    if (config_.consolMinCandles == 0 || config_.consolMinCandles > config_.consolMaxCandles) {
        throw std::invalid_argument("SetupTracker: invalid consolidation duration bounds");
    }
    if (config_.atrPeriod == 0) {
        config_.atrPeriod = 1;
    }
}

SetupTracker::Update SetupTracker::onCandle(const Candle& candle) {
    Update update;
    if (!validate_(candle)) {
        update.rejected = true;
        ++stats_.rejectedCandles;
        slob::common::metrics::Registry::instance().incrementCounter("candles_rejected_total");
        LOG_WARN("SetupTracker[" << symbol_ << "] rejected malformed candle ts=" << candle.ts << " o=" << candle.o
                                 << " h=" << candle.h << " l=" << candle.l << " c=" << candle.c);
        return update;
    }
    if (lastTs_ && candle.ts <= *lastTs_) {
        update.rejected = true;
        ++stats_.rejectedCandles;
        slob::common::metrics::Registry::instance().incrementCounter("candles_rejected_total");
        LOG_WARN("SetupTracker[" << symbol_ << "] rejected out-of-order candle ts=" << candle.ts
                                 << " last=" << *lastTs_);
        return update;
    }
    lastTs_ = candle.ts;
    ++stats_.candles;

    const auto day = domain::utcDay(candle.ts);
    if (!currentDay_ || day != *currentDay_) {
        if (currentDay_) {
            closeAll_(candle, update);
        }
        currentDay_ = day;
        refHigh_.reset();
        refLow_.reset();
    }

    updateAtr_(candle);

    switch (phaseOf_(candle.ts)) {
    case Phase::Reference:
        refHigh_ = refHigh_ ? std::max(*refHigh_, candle.h) : candle.h;
        refLow_ = refLow_ ? std::min(*refLow_, candle.l) : candle.l;
        break;
    case Phase::Trading: {
        const auto ids = order_;
        for (const auto& id : ids) {
            auto it = setups_.find(id);
            if (it != setups_.end() && !it->second.isTerminal()) {
                step_(it->second, candle, update);
            }
        }
        // New candidates start after the existing ones so the sweep candle is
        // never fed back into the candidate it created.
        detectLiq1_(candle, update);
        break;
    }
    case Phase::Idle:
    case Phase::Closed:
        closeAll_(candle, update);
        break;
    }

    for (auto it = order_.begin(); it != order_.end();) {
        auto found = setups_.find(*it);
        if (found == setups_.end() || found->second.isTerminal()) {
            if (found != setups_.end()) {
                setups_.erase(found);
            }
            it = order_.erase(it);
        } else {
            ++it;
        }
    }

    slob::common::metrics::Registry::instance().setGauge("active_setups_" + symbol_,
                                                          static_cast<double>(setups_.size()));
    return update;
}

std::vector<SetupTracker::Transition> SetupTracker::replay(const std::vector<Candle>& candles) {
    std::vector<Transition> transitions;
    for (const auto& candle : candles) {
        auto update = onCandle(candle);
        transitions.insert(transitions.end(), update.transitions.begin(), update.transitions.end());
    }
    return transitions;
}

std::size_t SetupTracker::restore(const std::vector<SetupCandidate>& setups) {
    std::vector<SetupCandidate> accepted;
    for (const auto& setup : setups) {
        if (setup.symbol != symbol_ || setup.isTerminal() || setups_.count(setup.id) != 0) {
            continue;
        }
        accepted.push_back(setup);
    }
    std::sort(accepted.begin(), accepted.end(), [](const SetupCandidate& a, const SetupCandidate& b) {
        return a.createdAt == b.createdAt ? a.id < b.id : a.createdAt < b.createdAt;
    });

    for (auto& setup : accepted) {
        const auto day = domain::utcDay(setup.liq1Time);
        if (!currentDay_ || day >= *currentDay_) {
            currentDay_ = day;
            refHigh_ = setup.sessionHigh;
            refLow_ = setup.sessionLow;
        }
        if (!lastTs_ || setup.updatedAt > *lastTs_) {
            lastTs_ = setup.updatedAt;
        }
        order_.push_back(setup.id);
        LOG_INFO("SetupTracker[" << symbol_ << "] restored setup " << setup.id << " in "
                                 << domain::toString(setup.state));
        setups_.emplace(setup.id, std::move(setup));
    }
    return accepted.size();
}

std::vector<SetupCandidate> SetupTracker::activeSetups() const {
    std::vector<SetupCandidate> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = setups_.find(id);
        if (it != setups_.end()) {
            out.push_back(it->second);
        }
    }
    return out;
}

const SetupCandidate* SetupTracker::find(const std::string& id) const {
    auto it = setups_.find(id);
    return it == setups_.end() ? nullptr : &it->second;
}

std::optional<double> SetupTracker::atr() const {
    if (trueRanges_.size() < config_.atrPeriod) {
        return std::nullopt;
    }
    const double sum = std::accumulate(trueRanges_.begin(), trueRanges_.end(), 0.0);
    return sum / static_cast<double>(trueRanges_.size());
}

bool SetupTracker::validate_(const Candle& candle) const {
    if (candle.symbol != symbol_) {
        return false;
    }
    for (const double value : {candle.o, candle.h, candle.l, candle.c}) {
        if (!std::isfinite(value) || value <= 0.0) {
            return false;
        }
    }
    return candle.h >= std::max(candle.o, candle.c) && candle.l <= std::min(candle.o, candle.c);
}

SetupTracker::Phase SetupTracker::phaseOf_(domain::TimestampMs ts) const {
    const auto minute = domain::utcMinuteOfDay(ts);
    if (minute < config_.referenceStartMinute) {
        return Phase::Idle;
    }
    if (minute < config_.referenceEndMinute) {
        return Phase::Reference;
    }
    if (minute < config_.tradingEndMinute) {
        return Phase::Trading;
    }
    return Phase::Closed;
}

void SetupTracker::updateAtr_(const Candle& candle) {
    double trueRange = candle.h - candle.l;
    if (prevClose_) {
        trueRange = std::max({trueRange, std::abs(candle.h - *prevClose_), std::abs(candle.l - *prevClose_)});
    }
    prevClose_ = candle.c;
    trueRanges_.push_back(trueRange);
    while (trueRanges_.size() > config_.atrPeriod) {
        trueRanges_.pop_front();
    }
}

void SetupTracker::closeAll_(const Candle& candle, Update& update) {
    for (const auto& id : order_) {
        auto it = setups_.find(id);
        if (it == setups_.end() || it->second.isTerminal()) {
            continue;
        }
        it->second.updatedAt = candle.ts;
        invalidate_(it->second, InvalidationReason::MarketClosed, candle, update);
        update.touched.push_back(it->second);
    }
}

bool SetupTracker::inCooldown_(TradeDirection direction, domain::TimestampMs ts) const {
    const auto cooldown = domain::minutesToMillis(config_.liq1CooldownMinutes);
    for (const auto& [id, setup] : setups_) {
        if (setup.direction == direction && setup.state == SetupState::WatchingConsol &&
            ts - setup.liq1Time < cooldown) {
            return true;
        }
    }
    return false;
}

void SetupTracker::detectLiq1_(const Candle& candle, Update& update) {
    if (!refHigh_ || !refLow_) {
        return;
    }

    auto create = [&](TradeDirection direction, double price) {
        const std::string id = symbol_ + (direction == TradeDirection::Short ? "-S-" : "-L-") +
                               std::to_string(candle.ts);
        if (setups_.count(id) != 0) {
            return;
        }
        if (inCooldown_(direction, candle.ts)) {
            LOG_DEBUG("SetupTracker[" << symbol_ << "] LIQ#1 " << domain::toString(direction)
                                      << " suppressed by cooldown at ts=" << candle.ts);
            return;
        }

        SetupCandidate setup;
        setup.id = id;
        setup.symbol = symbol_;
        setup.direction = direction;
        setup.state = SetupState::WatchingLiq1;
        setup.sessionHigh = *refHigh_;
        setup.sessionLow = *refLow_;
        setup.liq1Time = candle.ts;
        setup.liq1Price = price;
        setup.createdAt = candle.ts;
        setup.updatedAt = candle.ts;

        auto [it, inserted] = setups_.emplace(id, std::move(setup));
        if (!inserted) {
            return;
        }
        order_.push_back(id);
        ++stats_.created;
        slob::common::metrics::Registry::instance().incrementCounter("setups_created_total");
        transition_(it->second, SetupState::WatchingConsol, candle, price, update);
        update.touched.push_back(it->second);
    };

    if (config_.enableShort) {
        const bool swept = config_.liq1OnWick ? candle.h > *refHigh_ : candle.c > *refHigh_;
        if (swept) {
            create(TradeDirection::Short, candle.h);
        }
    }
    if (config_.enableLong) {
        const bool swept = config_.liq1OnWick ? candle.l < *refLow_ : candle.c < *refLow_;
        if (swept) {
            create(TradeDirection::Long, candle.l);
        }
    }
}

void SetupTracker::step_(SetupCandidate& setup, const Candle& candle, Update& update) {
    setup.updatedAt = candle.ts;
    switch (setup.state) {
    case SetupState::WatchingConsol:
        stepConsol_(setup, candle, update);
        break;
    case SetupState::WatchingLiq2:
        stepLiq2_(setup, candle, update, false);
        break;
    case SetupState::WaitingEntry:
        stepEntry_(setup, candle, update);
        break;
    case SetupState::WatchingLiq1:
    case SetupState::SetupComplete:
    case SetupState::Invalidated:
        break;
    }
    update.touched.push_back(setup);
}

void SetupTracker::stepConsol_(SetupCandidate& setup, const Candle& candle, Update& update) {
    if (setup.consolCandles.size() >= config_.consolMaxCandles) {
        const auto reason = findNoWick_(setup) ? InvalidationReason::ConsolTimeout
                                               : InvalidationReason::NoWickNotFound;
        invalidate_(setup, reason, candle, update);
        return;
    }

    const bool mature = setup.consolCandles.size() >= config_.consolMinCandles;
    const double pct = rangePct_(setup);
    const bool rangeOk = pct >= config_.consolMinRangePct && pct <= config_.consolMaxRangePct;
    if (mature && rangeOk && breaksConsol_(setup, candle)) {
        if (auto noWick = findNoWick_(setup)) {
            // The breaking candle is never admitted: bounds are recomputed from the
            // strictly earlier candles and stay frozen from here on.
            recomputeBounds_(setup);
            setup.consolFrozen = true;
            setup.consolConfirmedTime = candle.ts;
            setup.noWickCandle = *noWick;
            setup.candlesSinceConsol = 0;
            const double level = setup.direction == TradeDirection::Short ? setup.consolHigh : setup.consolLow;
            transition_(setup, SetupState::WatchingLiq2, candle, level, update);
            stepLiq2_(setup, candle, update, true);
            return;
        }
    }

    setup.consolCandles.push_back(candle);
    recomputeBounds_(setup);

    if (setup.consolCandles.size() >= config_.consolMinCandles && rangePct_(setup) > config_.consolMaxRangePct) {
        invalidate_(setup, InvalidationReason::ConsolRangeInvalid, candle, update);
    }
}

void SetupTracker::stepLiq2_(SetupCandidate& setup, const Candle& candle, Update& update, bool sameStep) {
    if (!sameStep) {
        ++setup.candlesSinceConsol;
    }
    if (setup.candlesSinceConsol > config_.maxEntryWaitCandles) {
        invalidate_(setup, InvalidationReason::Liq2Timeout, candle, update);
        return;
    }
    if (!setup.noWickCandle) {
        invalidate_(setup, InvalidationReason::NoWickNotFound, candle, update);
        return;
    }

    const auto& noWick = *setup.noWickCandle;
    if (setup.direction == TradeDirection::Short) {
        const double allowance =
            std::min(config_.maxRetracementPoints, candle.h * config_.maxRetracementPct / 100.0);
        if (candle.h > noWick.h + allowance) {
            invalidate_(setup, InvalidationReason::RetracementExceeded, candle, update);
            return;
        }
    } else {
        const double allowance =
            std::min(config_.maxRetracementPoints, candle.l * config_.maxRetracementPct / 100.0);
        if (candle.l < noWick.l - allowance) {
            invalidate_(setup, InvalidationReason::RetracementExceeded, candle, update);
            return;
        }
    }

    if (candle.ts - setup.consolConfirmedTime < domain::minutesToMillis(config_.liq2MinWaitMinutes)) {
        return;
    }

    if (breaksConsol_(setup, candle)) {
        setup.liq2Candle = candle;
        setup.liq2Time = candle.ts;
        setup.candlesSinceLiq2 = 0;
        const double price = setup.direction == TradeDirection::Short ? candle.h : candle.l;
        transition_(setup, SetupState::WaitingEntry, candle, price, update);
    }
}

void SetupTracker::stepEntry_(SetupCandidate& setup, const Candle& candle, Update& update) {
    ++setup.candlesSinceConsol;
    ++setup.candlesSinceLiq2;
    if (setup.candlesSinceLiq2 > config_.maxEntryWaitCandles) {
        invalidate_(setup, InvalidationReason::EntryTimeout, candle, update);
        return;
    }
    if (!setup.noWickCandle || !setup.liq2Candle) {
        invalidate_(setup, InvalidationReason::NoWickNotFound, candle, update);
        return;
    }

    const bool isShort = setup.direction == TradeDirection::Short;
    const bool triggered = isShort ? candle.c < setup.noWickCandle->l : candle.c > setup.noWickCandle->h;
    if (!triggered) {
        return;
    }

    const double entry = candle.c;
    const double stop = spikeRuleStop(*setup.liq2Candle, setup.direction, config_.stopBuffer);
    const double target =
        isShort ? setup.sessionLow - config_.targetBuffer : setup.sessionHigh + config_.targetBuffer;
    const double risk = isShort ? stop - entry : entry - stop;
    const double reward = isShort ? entry - target : target - entry;
    if (risk <= 0.0 || reward <= 0.0) {
        LOG_INFO("SetupTracker[" << symbol_ << "] " << setup.id << " rejected: entry=" << entry << " stop=" << stop
                                 << " target=" << target);
        invalidate_(setup, InvalidationReason::NegativeRiskReward, candle, update);
        return;
    }

    setup.entryPrice = entry;
    setup.stopPrice = stop;
    setup.targetPrice = target;
    setup.riskReward = reward / risk;
    setup.atrAtEntry = atr().value_or(0.0);
    setup.entryTriggerTime = candle.ts;
    transition_(setup, SetupState::SetupComplete, candle, entry, update);
}

void SetupTracker::transition_(SetupCandidate& setup,
                               SetupState to,
                               const Candle& candle,
                               double price,
                               Update& update) {
    Transition transition;
    transition.setupId = setup.id;
    transition.direction = setup.direction;
    transition.from = setup.state;
    transition.to = to;
    transition.candleTs = candle.ts;
    transition.price = price;
    update.transitions.push_back(transition);

    setup.state = to;
    LOG_INFO("SetupTracker[" << symbol_ << "] " << setup.id << ' ' << domain::toString(transition.from) << " -> "
                             << domain::toString(to) << " ts=" << candle.ts << " price=" << price);

    if (to == SetupState::SetupComplete) {
        ++stats_.completed;
        slob::common::metrics::Registry::instance().incrementCounter("setups_completed_total");
        LOG_INFO("SetupTracker[" << symbol_ << "] setup complete " << setup.id << ' '
                                 << domain::toString(setup.direction) << " entry=" << setup.entryPrice
                                 << " stop=" << setup.stopPrice << " target=" << setup.targetPrice
                                 << " rr=" << setup.riskReward);
        update.completed.push_back(setup);
    }
}

void SetupTracker::invalidate_(SetupCandidate& setup,
                               InvalidationReason reason,
                               const Candle& candle,
                               Update& update) {
    Transition transition;
    transition.setupId = setup.id;
    transition.direction = setup.direction;
    transition.from = setup.state;
    transition.to = SetupState::Invalidated;
    transition.candleTs = candle.ts;
    transition.price = candle.c;
    transition.reason = reason;
    update.transitions.push_back(transition);

    setup.state = SetupState::Invalidated;
    setup.invalidationReason = reason;
    setup.invalidatedAt = candle.ts;
    ++stats_.invalidated[reason];
    slob::common::metrics::Registry::instance().incrementCounter("setups_invalidated_total");
    LOG_INFO("SetupTracker[" << symbol_ << "] " << setup.id << " invalidated from "
                             << domain::toString(transition.from) << ": " << domain::toString(reason));
    update.invalidated.push_back(setup);
}

void SetupTracker::recomputeBounds_(SetupCandidate& setup) const {
    if (setup.consolCandles.empty()) {
        setup.consolHigh = 0.0;
        setup.consolLow = 0.0;
        return;
    }
    double high = setup.consolCandles.front().h;
    double low = setup.consolCandles.front().l;
    for (const auto& candle : setup.consolCandles) {
        high = std::max(high, candle.h);
        low = std::min(low, candle.l);
    }
    setup.consolHigh = high;
    setup.consolLow = low;
}

double SetupTracker::rangePct_(const SetupCandidate& setup) const {
    if (setup.consolCandles.empty() || setup.consolHigh <= 0.0) {
        return 0.0;
    }
    return (setup.consolHigh - setup.consolLow) / setup.consolHigh * 100.0;
}

std::optional<Candle> SetupTracker::findNoWick_(const SetupCandidate& setup) const {
    if (setup.consolCandles.size() < config_.noWickMinCandles) {
        return std::nullopt;
    }
    for (const auto& candle : setup.consolCandles) {
        const double body = candle.body();
        if (body <= 0.0) {
            continue;
        }
        if (setup.direction == TradeDirection::Short) {
            if (candle.bullish() && candle.upperWick() / body < config_.noWickMaxWickRatio) {
                return candle;
            }
        } else if (candle.bearish() && candle.lowerWick() / body < config_.noWickMaxWickRatio) {
            return candle;
        }
    }
    return std::nullopt;
}

bool SetupTracker::breaksConsol_(const SetupCandidate& setup, const Candle& candle) const {
    if (setup.consolCandles.empty()) {
        return false;
    }
    return setup.direction == TradeDirection::Short ? candle.h > setup.consolHigh : candle.l < setup.consolLow;
}

}  // namespace app
