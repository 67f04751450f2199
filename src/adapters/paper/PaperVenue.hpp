#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::paper {

// Simulated venue link. Entries fill at the first tick after submission, stops
// and targets fill when a tick touches their price.
class PaperVenue : public domain::IVenueLink {
public:
    PaperVenue() = default;

    void connect() override;
    void disconnect() override;
    bool isAlive() override;

    void subscribe(const std::string& symbol) override;
    void unsubscribe(const std::string& symbol) override;

    domain::BracketAck submitBracket(const domain::BracketRequest& request) override;
    std::vector<domain::VenueOrder> queryOpenOrders() override;
    std::vector<domain::VenuePosition> queryPositions() override;

    void setTickHandler(TickHandler handler) override;
    void setOrderStatusHandler(OrderStatusHandler handler) override;

    // Market data entry point; drives fills before forwarding the tick.
    void feedTick(const domain::Tick& tick);

    // Failure injection.
    void failNextConnects(int count) { connectFailures_ = count; }
    void failNextSubmits(int count) { submitFailures_ = count; }
    void dropLink() { dropped_ = true; }
    void setPosition(const std::string& symbol, int quantity, double averagePrice);

    bool connected() const { return connected_; }
    std::size_t submittedBrackets() const { return brackets_.size(); }
    const std::set<std::string>& subscriptions() const { return subscriptions_; }

private:
    struct WorkingBracket {
        domain::BracketRequest request;
        std::string entryId;
        std::string stopId;
        std::string targetId;
        bool entryFilled{false};
        bool closed{false};
    };

    void requireConnected_(const char* operation) const;
    std::string nextId_();
    void emit_(const std::string& orderId,
               const std::string& reference,
               const std::string& symbol,
               domain::OrderStatus status,
               double price,
               int quantity,
               domain::TimestampMs ts);

    bool connected_{false};
    bool dropped_{false};
    int connectFailures_{0};
    int submitFailures_{0};
    std::uint64_t sequence_{0};
    std::set<std::string> subscriptions_;
    std::vector<WorkingBracket> brackets_;
    std::map<std::string, domain::VenuePosition> positions_;
    TickHandler tickHandler_;
    OrderStatusHandler statusHandler_;
};

}  // namespace adapters::paper
