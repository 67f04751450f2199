#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "app/ConnectionSupervisor.hpp"
#include "app/RiskManager.hpp"
#include "core/EventBus.h"
#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

enum class SubmitStatus {
    Submitted,
    DuplicateOrder,
    ConnectionUnavailable,
    SafeMode,
    RiskRejected,
    InvalidSetup,
    VenueRejected,
};

const char* toString(SubmitStatus status) noexcept;

struct SubmitResult {
    SubmitStatus status{SubmitStatus::InvalidSetup};
    std::optional<domain::BracketOrder> bracket;
    std::string message;

    bool ok() const { return status == SubmitStatus::Submitted; }
};

// Places at most one bracket per setup. Every leg carries a reference derived
// from the setup id, so the venue itself can answer whether a setup was already
// submitted, across retries and restarts.
class OrderExecutor {
public:
    struct Config {
        int maxSubmitAttempts{3};
        double pointValue{20.0};
        std::string keyPrefix{"SLOB-"};
    };

    using Clock = std::function<domain::TimestampMs()>;

    OrderExecutor(domain::IVenueLink& venue,
                  domain::IStateStore& store,
                  ConnectionSupervisor& supervisor,
                  RiskManager& risk,
                  core::EventBus& bus,
                  Config config,
                  Clock clock = {});

    std::string idempotencyKey(const std::string& setupId) const;
    static std::string legReference(const std::string& key, domain::TimestampMs submittedAt, domain::LegRole role);

    // Sizes the setup with the RiskManager and submits it.
    SubmitResult execute(const domain::SetupCandidate& setup);
    SubmitResult submitBracket(const domain::SetupCandidate& setup, int quantity);

    void onOrderStatus(const domain::OrderStatusUpdate& update);

    // Closes local open trades for a symbol the venue no longer holds.
    std::size_t finalizeExternallyClosed(const std::string& symbol);

    void restore(const std::vector<domain::BracketOrder>& brackets, const std::vector<domain::Trade>& trades);
    // Resubmits brackets persisted as pending with their leg references, reusing
    // those references. Submissions refused before that point are never resumed.
    std::size_t resumePending();

    const domain::BracketOrder* bracket(const std::string& setupId) const;
    const domain::Trade* trade(const std::string& setupId) const;
    std::vector<domain::Trade> openTrades() const;
    std::vector<domain::BracketOrder> pendingBrackets() const;

private:
    SubmitResult submit_(domain::BracketOrder& bracket);
    std::optional<SubmitResult> gate_(const std::string& setupId);
    bool adoptFromVenue_(domain::BracketOrder& bracket, const std::vector<domain::VenueOrder>& orders);
    void index_(const domain::BracketOrder& bracket);
    std::optional<std::pair<std::string, domain::LegRole>> locate_(const domain::OrderStatusUpdate& update) const;
    void persist_(const domain::BracketOrder& bracket);
    void persist_(const domain::Trade& trade);
    void persist_(const domain::AccountState& account);

    void onEntryFilled_(domain::BracketOrder& bracket, const domain::OrderStatusUpdate& update);
    void onExitFilled_(domain::BracketOrder& bracket, domain::LegRole role, const domain::OrderStatusUpdate& update);
    void onEntryFailed_(domain::BracketOrder& bracket, const domain::OrderStatusUpdate& update);

    domain::IVenueLink& venue_;
    domain::IStateStore& store_;
    ConnectionSupervisor& supervisor_;
    RiskManager& risk_;
    core::EventBus& bus_;
    Config config_;
    Clock clock_;

    std::map<std::string, domain::BracketOrder> brackets_;
    std::map<std::string, domain::Trade> trades_;
    std::unordered_map<std::string, std::pair<std::string, domain::LegRole>> legs_;
    // Setup whose submission is waiting on an in-line reconnect.
    std::string inFlight_;
};

}  // namespace app
