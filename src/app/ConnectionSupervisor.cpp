#include "app/ConnectionSupervisor.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {
namespace {

std::runtime_error make_error(const std::string& message) {
    return std::runtime_error("ConnectionSupervisor: " + message);
}

double phaseGauge(domain::ConnectionPhase phase) {
    switch (phase) {
    case domain::ConnectionPhase::Disconnected:
        return 0.0;
    case domain::ConnectionPhase::Connecting:
        return 1.0;
    case domain::ConnectionPhase::Connected:
        return 2.0;
    case domain::ConnectionPhase::SafeMode:
        return 3.0;
    }
    return 0.0;
}

}  // namespace

ConnectionSupervisor::ConnectionSupervisor(boost::asio::io_context& ioc,
                                           domain::IVenueLink& venue,
                                           core::EventBus& bus,
                                           Config config)
    : ioc_(ioc),
      venue_(venue),
      bus_(bus),
      config_(config),
      budget_(config.maxAttempts),
      retryTimer_(std::make_shared<boost::asio::steady_timer>(ioc)),
      heartbeatTimer_(std::make_shared<boost::asio::steady_timer>(ioc)),
      alive_(std::make_shared<bool>(true)) {
    if (config_.backoffBase.count() <= 0 || config_.backoffCap < config_.backoffBase) {
        throw make_error("backoff base must be positive and not above the cap");
    }
    if (config_.maxAttempts == 0 || config_.heartbeatAttempts == 0) {
        throw make_error("attempt budgets must be positive");
    }
    if (config_.heartbeatInterval.count() <= 0) {
        throw make_error("heartbeat interval must be positive");
    }
}

ConnectionSupervisor::~ConnectionSupervisor() {
    *alive_ = false;
    cancelTimers_();
}

void ConnectionSupervisor::setOnConnected(std::function<void()> callback) {
    onConnected_ = std::move(callback);
}

std::chrono::milliseconds ConnectionSupervisor::backoffDelay(std::uint32_t attempt) const {
    const auto exponent = std::min<std::uint32_t>(attempt, 30U);
    const auto base = config_.backoffBase.count();
    const auto cap = config_.backoffCap.count();
    const std::int64_t multiplier = std::int64_t{1} << exponent;
    if (base > cap / multiplier) {
        return config_.backoffCap;
    }
    return std::chrono::milliseconds(std::min(base * multiplier, cap));
}

void ConnectionSupervisor::start() {
    if (inSafeMode()) {
        LOG_WARN("ConnectionSupervisor: start ignored while in safe mode");
        return;
    }
    stopped_ = false;
    budget_ = config_.maxAttempts;
    setPhase_(domain::ConnectionPhase::Connecting);
    std::weak_ptr<bool> guard = alive_;
    boost::asio::post(ioc_, [this, guard]() {
        auto alive = guard.lock();
        if (!alive || !*alive || stopped_) {
            return;
        }
        attempt_();
    });
}

void ConnectionSupervisor::stop() {
    stopped_ = true;
    cancelTimers_();
    if (state_.phase == domain::ConnectionPhase::Connected) {
        try {
            venue_.disconnect();
        } catch (const std::exception& ex) {
            LOG_WARN("ConnectionSupervisor: disconnect failed: " << ex.what());
        }
    }
    if (!inSafeMode()) {
        setPhase_(domain::ConnectionPhase::Disconnected);
    }
    LOG_INFO("ConnectionSupervisor: stopped");
}

bool ConnectionSupervisor::reconnectNow() {
    if (inSafeMode()) {
        LOG_WARN("ConnectionSupervisor: reconnect refused in safe mode");
        return false;
    }
    if (stopped_) {
        return false;
    }
    if (isHealthy()) {
        return true;
    }
    retryTimer_->cancel();
    if (state_.phase == domain::ConnectionPhase::Connected) {
        handleLoss_("link not alive");
        retryTimer_->cancel();
    }
    attempt_();
    return state_.phase == domain::ConnectionPhase::Connected;
}

bool ConnectionSupervisor::isHealthy() {
    if (state_.phase != domain::ConnectionPhase::Connected) {
        return false;
    }
    try {
        return venue_.isAlive();
    } catch (const std::exception& ex) {
        LOG_WARN("ConnectionSupervisor: liveness probe failed: " << ex.what());
        return false;
    }
}

void ConnectionSupervisor::clearSafeMode() {
    if (!inSafeMode()) {
        return;
    }
    LOG_WARN("ConnectionSupervisor: safe mode cleared by operator");
    state_.consecutiveFailures = 0;
    slob::common::metrics::Registry::instance().setGauge("venue_consecutive_failures", 0.0);
    setPhase_(domain::ConnectionPhase::Disconnected);
    lost_ = false;
    start();
}

void ConnectionSupervisor::subscribe(const std::string& symbol) {
    if (symbol.empty()) {
        throw make_error("symbol cannot be empty");
    }
    symbols_.insert(symbol);
    if (state_.phase != domain::ConnectionPhase::Connected) {
        return;
    }
    try {
        venue_.subscribe(symbol);
    } catch (const std::exception& ex) {
        LOG_WARN("ConnectionSupervisor: subscribe " << symbol << " failed: " << ex.what());
    }
}

void ConnectionSupervisor::unsubscribe(const std::string& symbol) {
    if (symbols_.erase(symbol) == 0 || state_.phase != domain::ConnectionPhase::Connected) {
        return;
    }
    try {
        venue_.unsubscribe(symbol);
    } catch (const std::exception& ex) {
        LOG_WARN("ConnectionSupervisor: unsubscribe " << symbol << " failed: " << ex.what());
    }
}

void ConnectionSupervisor::attempt_() {
    if (stopped_ || inSafeMode()) {
        return;
    }
    setPhase_(domain::ConnectionPhase::Connecting);
    slob::common::metrics::Registry::instance().incrementCounter("reconnect_attempts_total");
    LOG_INFO("ConnectionSupervisor: connecting (attempt " << state_.consecutiveFailures + 1 << "/" << budget_
                                                          << ")");
    try {
        venue_.connect();
    } catch (const std::exception& ex) {
        handleFailure_(ex.what());
        return;
    }
    handleConnected_();
}

void ConnectionSupervisor::handleConnected_() {
    const auto attempts = state_.consecutiveFailures + 1;
    state_.consecutiveFailures = 0;
    budget_ = config_.maxAttempts;
    setPhase_(domain::ConnectionPhase::Connected);
    slob::common::metrics::Registry::instance().setGauge("venue_consecutive_failures", 0.0);
    LOG_INFO("ConnectionSupervisor: connected after " << attempts << " attempt(s)");

    for (const auto& symbol : symbols_) {
        try {
            venue_.subscribe(symbol);
        } catch (const std::exception& ex) {
            LOG_WARN("ConnectionSupervisor: resubscribe " << symbol << " failed: " << ex.what());
        }
    }

    if (lost_) {
        lost_ = false;
        bus_.publish(core::ConnectionRestored{attempts});
    }

    if (onConnected_) {
        try {
            onConnected_();
        } catch (const std::exception& ex) {
            LOG_WARN("ConnectionSupervisor: on_connected callback failed: " << ex.what());
        }
    }

    scheduleHeartbeat_();
}

void ConnectionSupervisor::handleFailure_(const std::string& reason) {
    ++state_.consecutiveFailures;
    slob::common::metrics::Registry::instance().setGauge("venue_consecutive_failures",
                                                          static_cast<double>(state_.consecutiveFailures));
    if (state_.consecutiveFailures >= budget_) {
        LOG_CRIT("ConnectionSupervisor: connection failed after " << state_.consecutiveFailures
                                                                  << " attempts: " << reason);
        enterSafeMode_(reason);
        return;
    }
    const auto delay = backoffDelay(state_.consecutiveFailures);
    LOG_WARN("ConnectionSupervisor: connection failed (attempt " << state_.consecutiveFailures << "/" << budget_
                                                                 << "): " << reason << ". Retrying in "
                                                                 << delay.count() << "ms");
    scheduleRetry_(delay);
}

void ConnectionSupervisor::handleLoss_(const std::string& reason) {
    LOG_ERR("ConnectionSupervisor: link lost: " << reason);
    heartbeatTimer_->cancel();
    try {
        venue_.disconnect();
    } catch (const std::exception& ex) {
        LOG_WARN("ConnectionSupervisor: disconnect after loss failed: " << ex.what());
    }
    lost_ = true;
    state_.consecutiveFailures = 0;
    budget_ = config_.heartbeatAttempts;
    setPhase_(domain::ConnectionPhase::Connecting);
    bus_.publish(core::ConnectionLost{reason});
}

void ConnectionSupervisor::enterSafeMode_(const std::string& reason) {
    cancelTimers_();
    setPhase_(domain::ConnectionPhase::SafeMode);
    LOG_CRIT("ConnectionSupervisor: ENTERING SAFE MODE after " << state_.consecutiveFailures
                                                               << " consecutive failures; manual clear required");
    bus_.publishAndWait(core::SafeModeEntered{reason, state_.consecutiveFailures});
}

void ConnectionSupervisor::scheduleRetry_(std::chrono::milliseconds delay) {
    delays_.push_back(delay);
    std::weak_ptr<bool> guard = alive_;
    retryTimer_->expires_after(delay);
    retryTimer_->async_wait([this, guard](const boost::system::error_code& ec) {
        auto alive = guard.lock();
        if (ec == boost::asio::error::operation_aborted || !alive || !*alive || stopped_) {
            return;
        }
        if (ec) {
            LOG_WARN("ConnectionSupervisor: retry timer error: " << ec.message());
            return;
        }
        attempt_();
    });
}

void ConnectionSupervisor::scheduleHeartbeat_() {
    std::weak_ptr<bool> guard = alive_;
    auto scheduler = std::make_shared<std::function<void()>>();
    std::weak_ptr<std::function<void()>> weakScheduler = scheduler;
    *scheduler = [this, guard, weakScheduler]() {
        heartbeatTimer_->expires_after(config_.heartbeatInterval);
        heartbeatTimer_->async_wait([this, guard, self = weakScheduler.lock()](const boost::system::error_code& ec) {
            auto alive = guard.lock();
            if (ec == boost::asio::error::operation_aborted || !alive || !*alive || stopped_) {
                return;
            }
            if (ec) {
                LOG_WARN("ConnectionSupervisor: heartbeat timer error: " << ec.message());
                return;
            }
            if (state_.phase != domain::ConnectionPhase::Connected) {
                return;
            }
            if (isHealthy()) {
                LOG_DEBUG("ConnectionSupervisor: heartbeat ok");
                if (self) {
                    (*self)();
                }
                return;
            }
            handleLoss_("heartbeat failed");
            attempt_();
        });
    };
    (*scheduler)();
}

void ConnectionSupervisor::setPhase_(domain::ConnectionPhase phase) {
    if (state_.phase == phase) {
        return;
    }
    LOG_DEBUG("ConnectionSupervisor: phase " << domain::toString(state_.phase) << " -> "
                                             << domain::toString(phase));
    state_.phase = phase;
    slob::common::metrics::Registry::instance().setGauge("venue_connection_phase", phaseGauge(phase));
}

void ConnectionSupervisor::cancelTimers_() {
    retryTimer_->cancel();
    heartbeatTimer_->cancel();
}

}  // namespace app
