#include "app/Engine.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {

using Clock = std::chrono::steady_clock;

Engine::Engine(boost::asio::io_context& ioc,
               domain::IVenueLink& venue,
               domain::IStateStore& store,
               Config config,
               OrderExecutor::Clock clock)
    : ioc_(ioc),
      venue_(venue),
      store_(store),
      config_(std::move(config)),
      bus_(ioc, config_.eventHistory),
      aggregator_(config_.aggregator,
                  [this](const domain::Candle& candle, bool synthetic) {
                      bus_.publish(core::CandleCompleted{candle, synthetic});
                  }),
      risk_(config_.risk),
      supervisor_(ioc, venue, bus_, config_.supervisor),
      executor_(venue, store, supervisor_, risk_, bus_, config_.executor, std::move(clock)) {
    if (config_.symbols.empty()) {
        throw std::invalid_argument("Engine: at least one symbol is required");
    }
    for (const auto& symbol : config_.symbols) {
        trackers_.emplace(symbol, std::make_unique<SetupTracker>(symbol, config_.tracker));
    }
}

Engine::~Engine() {
    venue_.setTickHandler(nullptr);
    venue_.setOrderStatusHandler(nullptr);
    supervisor_.setOnConnected(nullptr);
}

const SetupTracker* Engine::tracker(const std::string& symbol) const {
    auto it = trackers_.find(symbol);
    return it == trackers_.end() ? nullptr : it->second.get();
}

Engine::RecoveryReport Engine::start() {
    if (started_) {
        throw std::runtime_error("Engine: already started");
    }
    started_ = true;

    RecoveryReport report;
    std::map<std::string, std::vector<domain::SetupCandidate>> bySymbol;
    for (auto& setup : store_.loadActiveSetups()) {
        bySymbol[setup.symbol].push_back(std::move(setup));
    }
    for (auto& [symbol, setups] : bySymbol) {
        auto it = trackers_.find(symbol);
        if (it == trackers_.end()) {
            LOG_WARN("Engine: " << setups.size() << " persisted setup(s) for unconfigured symbol " << symbol
                                << " left untouched");
            continue;
        }
        report.setups += it->second->restore(setups);
    }

    if (const auto account = store_.loadAccount()) {
        risk_.restore(*account);
        report.accountRestored = true;
    }

    const auto brackets = store_.loadBrackets();
    const auto trades = store_.loadOpenTrades();
    executor_.restore(brackets, trades);
    report.brackets = brackets.size();
    report.trades = trades.size();
    LOG_INFO("Engine: recovered " << report.setups << " setup(s), " << report.brackets << " bracket(s), "
                                  << report.trades << " open trade(s)");

    wire_();
    accepting_ = true;
    for (const auto& symbol : config_.symbols) {
        supervisor_.subscribe(symbol);
    }
    supervisor_.start();
    return report;
}

void Engine::wire_() {
    venue_.setTickHandler([this](const domain::Tick& tick) {
        boost::asio::post(ioc_, [this, tick]() { onTick(tick); });
    });
    venue_.setOrderStatusHandler([this](const domain::OrderStatusUpdate& update) {
        boost::asio::post(ioc_, [this, update]() { executor_.onOrderStatus(update); });
    });
    supervisor_.setOnConnected([this]() { onConnected_(); });

    subscriptions_.push_back(bus_.subscribe(
        core::EventKind::CandleCompleted,
        [this](const core::Event& event) { onCandle_(std::get<core::CandleCompleted>(event.payload)); },
        "setup-tracker"));
    subscriptions_.push_back(bus_.subscribe(
        core::EventKind::CandleCompleted,
        [this](const core::Event& event) {
            const auto& candle = std::get<core::CandleCompleted>(event.payload).candle;
            if (!store_.saveCandle(candle)) {
                LOG_WARN("Engine: failed to persist candle " << candle.symbol << " ts=" << candle.ts);
            }
        },
        "candle-store"));
    subscriptions_.push_back(bus_.subscribe(
        core::EventKind::TradingHalted,
        [](const core::Event& event) {
            const auto& halted = std::get<core::TradingHalted>(event.payload);
            LOG_CRIT("Engine: trading halted, drawdown=" << halted.drawdown << " equity=" << halted.equity);
        },
        "halt-alert"));
    subscriptions_.push_back(bus_.subscribe(
        core::EventKind::SafeModeEntered,
        [](const core::Event& event) {
            const auto& safe = std::get<core::SafeModeEntered>(event.payload);
            LOG_CRIT("Engine: venue link in safe mode after " << safe.consecutiveFailures
                                                              << " failures, order submission halted: "
                                                              << safe.reason);
        },
        "safe-mode-alert"));
}

void Engine::onTick(const domain::Tick& tick) {
    if (!accepting_) {
        return;
    }
    aggregator_.onTick(tick);
}

void Engine::onCandle_(const core::CandleCompleted& event) {
    auto it = trackers_.find(event.candle.symbol);
    if (it == trackers_.end()) {
        LOG_DEBUG("Engine: no tracker for " << event.candle.symbol);
        return;
    }
    auto update = it->second->onCandle(event.candle);
    if (update.rejected) {
        return;
    }

    for (const auto& setup : update.touched) {
        if (!store_.saveSetup(setup)) {
            LOG_ERR("Engine: failed to persist setup " << setup.id << " in " << domain::toString(setup.state));
        }
    }
    for (const auto& setup : update.invalidated) {
        const auto last = std::find_if(update.transitions.begin(), update.transitions.end(), [&](const auto& t) {
            return t.setupId == setup.id && t.to == domain::SetupState::Invalidated;
        });
        const auto lastState = last != update.transitions.end() ? last->from : setup.state;
        bus_.publish(core::SetupInvalidated{setup.id, setup.symbol, lastState, setup.invalidationReason,
                                            setup.invalidatedAt});
    }
    for (const auto& setup : update.completed) {
        bus_.publish(core::SetupDetected{setup});
        if (!accepting_) {
            LOG_WARN("Engine: setup " << setup.id << " completed during shutdown, not traded");
            continue;
        }
        const auto outcome = executor_.execute(setup);
        LOG_INFO("Engine: setup " << setup.id << " -> " << toString(outcome.status) << " (" << outcome.message
                                  << ")");
    }
}

void Engine::onConnected_() {
    const auto report = reconcile();
    if (!report.ok) {
        LOG_WARN("Engine: reconciliation after connect did not complete");
    }
    if (accepting_) {
        const auto resumed = executor_.resumePending();
        if (resumed > 0) {
            LOG_INFO("Engine: resumed " << resumed << " pending bracket(s)");
        }
    }
}

Engine::ReconcileReport Engine::reconcile() {
    ReconcileReport report;
    std::vector<domain::VenuePosition> positions;
    try {
        positions = venue_.queryPositions();
    } catch (const std::exception& ex) {
        LOG_ERR("Engine: reconciliation could not query positions: " << ex.what());
        return report;
    }

    std::set<std::string> localSymbols;
    for (const auto& trade : executor_.openTrades()) {
        localSymbols.insert(trade.symbol);
    }
    std::set<std::string> venueSymbols;
    for (const auto& position : positions) {
        if (position.quantity == 0) {
            continue;
        }
        venueSymbols.insert(position.symbol);
        if (localSymbols.count(position.symbol) == 0) {
            ++report.alerts;
            slob::common::metrics::Registry::instance().incrementCounter("reconciliation_alerts_total");
            const std::string message = "venue holds an unknown position; manual intervention required";
            LOG_CRIT("Engine: RECONCILIATION ALERT " << position.symbol << " qty=" << position.quantity
                                                     << " avg=" << position.averagePrice << ": " << message);
            bus_.publish(core::ReconciliationAlert{position.symbol, position.quantity, message});
        }
    }
    for (const auto& symbol : localSymbols) {
        if (venueSymbols.count(symbol) == 0) {
            report.finalized += executor_.finalizeExternallyClosed(symbol);
        }
    }
    report.ok = true;
    LOG_INFO("Engine: reconciliation done, " << report.alerts << " alert(s), " << report.finalized
                                             << " trade(s) finalized");
    return report;
}

void Engine::addBackgroundTask(std::shared_ptr<core::BackgroundTask> task) {
    if (task) {
        tasks_.push_back(std::move(task));
    }
}

void Engine::clearSafeMode() {
    supervisor_.clearSafeMode();
}

void Engine::clearRiskHalt() {
    risk_.clearHalt();
    persistAccount_();
}

std::size_t Engine::persistSetups_() {
    std::size_t saved = 0;
    for (const auto& [symbol, tracker] : trackers_) {
        for (const auto& setup : tracker->activeSetups()) {
            if (store_.saveSetup(setup)) {
                ++saved;
            } else {
                LOG_ERR("Engine: failed to persist setup " << setup.id << " at shutdown");
            }
        }
    }
    return saved;
}

void Engine::persistAccount_() {
    if (!store_.saveAccount(risk_.account())) {
        LOG_ERR("Engine: failed to persist account state");
    }
}

bool Engine::pollUntil_(Clock::time_point deadline, const std::function<bool()>& done) {
    while (!done()) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        if (ioc_.stopped()) {
            ioc_.restart();
        }
        const auto slice = std::min<Clock::duration>(deadline - now, std::chrono::milliseconds{10});
        if (ioc_.run_one_for(slice) == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
    }
    return true;
}

Engine::ShutdownReport Engine::shutdown() {
    ShutdownReport report;
    if (shutDown_) {
        return report;
    }
    shutDown_ = true;
    const auto begin = Clock::now();
    const auto deadline = begin + config_.shutdownTimeout;
    LOG_INFO("Engine: shutdown requested");

    // 1. No new setups are traded from here on.
    accepting_ = false;

    // 2. Cooperative cancellation, bounded by the task wait and the overall deadline.
    for (const auto& task : tasks_) {
        if (!task->finished()) {
            task->cancel();
            ++report.tasksCancelled;
        }
    }
    // A quarter of the budget stays reserved for flushing and persisting state.
    const auto reserve = config_.shutdownTimeout / 4;
    const auto taskDeadline = std::min(deadline - reserve, begin + config_.taskWait);
    const bool tasksDone = pollUntil_(taskDeadline, [this]() {
        return std::all_of(tasks_.begin(), tasks_.end(), [](const auto& task) { return task->finished(); });
    });
    if (!tasksDone) {
        for (const auto& task : tasks_) {
            if (!task->finished()) {
                report.tasksAbandoned.push_back(task->name());
                LOG_WARN("Engine: background task '" << task->name() << "' did not finish in time, abandoned");
            }
        }
    }

    // 3. Open positions stay under the venue's bracket orders.
    const auto open = executor_.openTrades();
    if (!open.empty()) {
        LOG_INFO("Engine: leaving " << open.size() << " open position(s) under venue bracket management");
    }
    report.candlesFlushed = aggregator_.forceCompleteAll();

    // Let the tracker and the candle store see the flushed candles.
    if (!pollUntil_(deadline, [this]() { return bus_.pendingDispatches() == 0; })) {
        report.timedOut = true;
    }

    // 4. Final state is written even when the budget is already spent.
    report.setupsPersisted = persistSetups_();
    persistAccount_();
    store_.flush();

    // 5. Venue connection.
    supervisor_.stop();

    // 6. Remaining events.
    if (Clock::now() < deadline) {
        report.eventsDrained = bus_.drain();
    } else {
        report.timedOut = true;
    }

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - begin);
    if (report.timedOut) {
        LOG_WARN("Engine: shutdown exceeded " << config_.shutdownTimeout.count() << "ms, degraded exit");
    }
    LOG_INFO("Engine: shutdown finished in " << report.elapsed.count() << "ms, " << report.candlesFlushed
                                             << " candle(s) flushed, " << report.setupsPersisted
                                             << " setup(s) persisted, " << report.tasksAbandoned.size()
                                             << " task(s) abandoned");
    slob::common::metrics::logSnapshot(slob::common::metrics::Registry::instance().snapshot());
    return report;
}

}  // namespace app
