#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "app/CandleAggregator.hpp"
#include "app/ConnectionSupervisor.hpp"
#include "app/OrderExecutor.hpp"
#include "app/RiskManager.hpp"
#include "app/SetupTracker.hpp"
#include "core/BackgroundTask.hpp"
#include "core/EventBus.h"
#include "domain/Ports.hpp"

namespace app {

// Wires the pipeline together and owns startup recovery, reconciliation with the
// venue and the bounded shutdown sequence. Everything runs on one io_context.
class Engine {
public:
    struct Config {
        std::vector<std::string> symbols;
        CandleAggregator::Config aggregator{};
        SetupTracker::Config tracker{};
        RiskManager::Config risk{};
        OrderExecutor::Config executor{};
        ConnectionSupervisor::Config supervisor{};
        std::size_t eventHistory{1000};
        std::chrono::milliseconds shutdownTimeout{10'000};
        std::chrono::milliseconds taskWait{3'000};
    };

    struct RecoveryReport {
        std::size_t setups{0};
        std::size_t brackets{0};
        std::size_t trades{0};
        bool accountRestored{false};
    };

    struct ReconcileReport {
        bool ok{false};
        std::size_t alerts{0};
        std::size_t finalized{0};
    };

    struct ShutdownReport {
        std::size_t tasksCancelled{0};
        std::vector<std::string> tasksAbandoned;
        std::size_t candlesFlushed{0};
        std::size_t setupsPersisted{0};
        std::size_t eventsDrained{0};
        bool timedOut{false};
        std::chrono::milliseconds elapsed{0};
    };

    Engine(boost::asio::io_context& ioc,
           domain::IVenueLink& venue,
           domain::IStateStore& store,
           Config config,
           OrderExecutor::Clock clock = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Restores persisted state and schedules the venue connection.
    RecoveryReport start();

    // Must be called from outside io_context::run(); it polls the context itself.
    ShutdownReport shutdown();

    ReconcileReport reconcile();

    void onTick(const domain::Tick& tick);
    void addBackgroundTask(std::shared_ptr<core::BackgroundTask> task);

    void clearSafeMode();
    void clearRiskHalt();

    bool accepting() const { return accepting_; }
    core::EventBus& bus() { return bus_; }
    CandleAggregator& aggregator() { return aggregator_; }
    RiskManager& risk() { return risk_; }
    ConnectionSupervisor& supervisor() { return supervisor_; }
    OrderExecutor& executor() { return executor_; }
    const SetupTracker* tracker(const std::string& symbol) const;

private:
    void wire_();
    void onCandle_(const core::CandleCompleted& event);
    void onConnected_();
    std::size_t persistSetups_();
    void persistAccount_();
    bool pollUntil_(std::chrono::steady_clock::time_point deadline, const std::function<bool()>& done);

    boost::asio::io_context& ioc_;
    domain::IVenueLink& venue_;
    domain::IStateStore& store_;
    Config config_;

    core::EventBus bus_;
    CandleAggregator aggregator_;
    RiskManager risk_;
    ConnectionSupervisor supervisor_;
    OrderExecutor executor_;
    std::map<std::string, std::unique_ptr<SetupTracker>> trackers_;
    std::vector<std::shared_ptr<core::BackgroundTask>> tasks_;
    std::vector<core::EventBus::Subscription> subscriptions_;

    bool started_{false};
    bool accepting_{false};
    bool shutDown_{false};
};

}  // namespace app
