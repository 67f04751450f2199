#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/Models.hpp"

namespace app {

// Stop for a setup, computed from the frozen LIQ#2 candle only. When the wick on
// the sweep side is more than twice the body (and the body is non-zero) the body
// edge replaces the wick extreme.
double spikeRuleStop(const domain::Candle& liq2Candle, domain::TradeDirection direction, double buffer);

// Causal setup detector for a single symbol. Candles must arrive in timestamp
// order; every decision uses the current candle and earlier ones only.
class SetupTracker {
public:
    struct Config {
        // Session windows in UTC minutes of day.
        int referenceStartMinute{9 * 60};
        int referenceEndMinute{15 * 60 + 30};
        int tradingEndMinute{22 * 60};

        bool enableShort{true};
        bool enableLong{true};
        bool liq1OnWick{false};
        std::int64_t liq1CooldownMinutes{5};

        std::size_t consolMinCandles{15};
        std::size_t consolMaxCandles{120};
        double consolMinRangePct{0.1};
        double consolMaxRangePct{0.5};

        std::size_t noWickMinCandles{3};
        double noWickMaxWickRatio{0.20};

        std::int64_t liq2MinWaitMinutes{0};
        std::uint32_t maxEntryWaitCandles{20};
        double maxRetracementPoints{100.0};
        double maxRetracementPct{1.0};

        double stopBuffer{2.0};
        double targetBuffer{1.0};
        std::size_t atrPeriod{14};
    };

    struct Transition {
        std::string setupId;
        domain::TradeDirection direction{domain::TradeDirection::Short};
        domain::SetupState from{domain::SetupState::WatchingLiq1};
        domain::SetupState to{domain::SetupState::WatchingLiq1};
        domain::TimestampMs candleTs{0};
        double price{0.0};
        domain::InvalidationReason reason{domain::InvalidationReason::None};

        bool operator==(const Transition& other) const;
    };

    struct Update {
        bool rejected{false};
        std::vector<Transition> transitions;
        // Snapshot of every candidate the candle touched, after the candle.
        std::vector<domain::SetupCandidate> touched;
        std::vector<domain::SetupCandidate> completed;
        std::vector<domain::SetupCandidate> invalidated;
    };

    struct Stats {
        std::uint64_t candles{0};
        std::uint64_t rejectedCandles{0};
        std::uint64_t created{0};
        std::uint64_t completed{0};
        std::map<domain::InvalidationReason, std::uint64_t> invalidated;
    };

    SetupTracker(std::string symbol, Config config);

    Update onCandle(const domain::Candle& candle);
    std::vector<Transition> replay(const std::vector<domain::Candle>& candles);

    // Rehydrates non-terminal candidates from persisted snapshots.
    std::size_t restore(const std::vector<domain::SetupCandidate>& setups);

    std::vector<domain::SetupCandidate> activeSetups() const;
    const domain::SetupCandidate* find(const std::string& id) const;

    const std::string& symbol() const { return symbol_; }
    std::optional<double> referenceHigh() const { return refHigh_; }
    std::optional<double> referenceLow() const { return refLow_; }
    std::optional<double> atr() const;
    std::optional<domain::TimestampMs> lastCandleTs() const { return lastTs_; }
    const Stats& stats() const { return stats_; }

private:
    enum class Phase { Idle, Reference, Trading, Closed };

    bool validate_(const domain::Candle& candle) const;
    Phase phaseOf_(domain::TimestampMs ts) const;
    void updateAtr_(const domain::Candle& candle);
    void closeAll_(const domain::Candle& candle, Update& update);
    void detectLiq1_(const domain::Candle& candle, Update& update);
    bool inCooldown_(domain::TradeDirection direction, domain::TimestampMs ts) const;

    void step_(domain::SetupCandidate& setup, const domain::Candle& candle, Update& update);
    void stepConsol_(domain::SetupCandidate& setup, const domain::Candle& candle, Update& update);
    void stepLiq2_(domain::SetupCandidate& setup, const domain::Candle& candle, Update& update, bool sameStep);
    void stepEntry_(domain::SetupCandidate& setup, const domain::Candle& candle, Update& update);

    void transition_(domain::SetupCandidate& setup,
                     domain::SetupState to,
                     const domain::Candle& candle,
                     double price,
                     Update& update);
    void invalidate_(domain::SetupCandidate& setup,
                     domain::InvalidationReason reason,
                     const domain::Candle& candle,
                     Update& update);

    void recomputeBounds_(domain::SetupCandidate& setup) const;
    double rangePct_(const domain::SetupCandidate& setup) const;
    std::optional<domain::Candle> findNoWick_(const domain::SetupCandidate& setup) const;
    bool breaksConsol_(const domain::SetupCandidate& setup, const domain::Candle& candle) const;

    std::string symbol_;
    Config config_;

    std::map<std::string, domain::SetupCandidate> setups_;
    std::vector<std::string> order_;

    std::optional<std::int64_t> currentDay_;
    std::optional<double> refHigh_;
    std::optional<double> refLow_;
    std::optional<domain::TimestampMs> lastTs_;
    std::optional<double> prevClose_;
    std::deque<double> trueRanges_;
    Stats stats_;
};

}  // namespace app
