#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/EventBus.h"
#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

// Owns the lifecycle of one venue link: connect, heartbeat, exponential backoff
// and the safe-mode circuit breaker. ConnectionState is mutated only here.
class ConnectionSupervisor {
public:
    struct Config {
        std::chrono::milliseconds backoffBase{1000};
        std::chrono::milliseconds backoffCap{60'000};
        std::uint32_t maxAttempts{10};
        // Attempt budget after a heartbeat detects a lost link.
        std::uint32_t heartbeatAttempts{5};
        std::chrono::milliseconds heartbeatInterval{30'000};
    };

    ConnectionSupervisor(boost::asio::io_context& ioc,
                         domain::IVenueLink& venue,
                         core::EventBus& bus,
                         Config config);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    // Schedules the first connection attempt.
    void start();
    // Cancels timers and closes the link. No further attempts are made.
    void stop();

    // One immediate attempt. On failure the scheduled backoff path takes over.
    bool reconnectNow();

    bool isHealthy();
    bool inSafeMode() const { return state_.phase == domain::ConnectionPhase::SafeMode; }
    void clearSafeMode();

    void subscribe(const std::string& symbol);
    void unsubscribe(const std::string& symbol);
    const std::set<std::string>& activeSymbols() const { return symbols_; }

    const domain::ConnectionState& state() const { return state_; }
    std::chrono::milliseconds backoffDelay(std::uint32_t attempt) const;
    // Every backoff delay scheduled so far, oldest first.
    const std::vector<std::chrono::milliseconds>& scheduledDelays() const { return delays_; }

    void setOnConnected(std::function<void()> callback);

private:
    void attempt_();
    void handleConnected_();
    void handleFailure_(const std::string& reason);
    void handleLoss_(const std::string& reason);
    void enterSafeMode_(const std::string& reason);
    void scheduleRetry_(std::chrono::milliseconds delay);
    void scheduleHeartbeat_();
    void setPhase_(domain::ConnectionPhase phase);
    void cancelTimers_();

    boost::asio::io_context& ioc_;
    domain::IVenueLink& venue_;
    core::EventBus& bus_;
    Config config_;

    domain::ConnectionState state_{};
    std::uint32_t budget_{0};
    bool lost_{false};
    bool stopped_{false};
    std::set<std::string> symbols_;
    std::vector<std::chrono::milliseconds> delays_;
    std::function<void()> onConnected_;

    std::shared_ptr<boost::asio::steady_timer> retryTimer_;
    std::shared_ptr<boost::asio::steady_timer> heartbeatTimer_;
    // Guards timer callbacks against running after destruction.
    std::shared_ptr<bool> alive_;
};

}  // namespace app
