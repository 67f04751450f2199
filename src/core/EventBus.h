#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "core/Events.hpp"

namespace core {

// Typed publish/subscribe on top of an io_context. publish() only schedules one
// handler per subscriber; publishAndWait() runs every subscriber before returning.
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;

    struct Stats {
        std::uint64_t published{0};
        std::uint64_t dispatched{0};
        std::uint64_t failures{0};
    };

    class Subscription {
    public:
        Subscription() = default;
        Subscription(EventBus* bus, std::size_t id);
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();
        bool active() const { return bus_ != nullptr && id_ != 0; }

    private:
        EventBus* bus_{nullptr};
        std::size_t id_{0};
    };

    explicit EventBus(boost::asio::io_context& ioc, std::size_t historyCapacity = 1000);

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    [[nodiscard]] Subscription subscribe(EventKind kind, Handler handler, std::string name = {});
    void unsubscribe(std::size_t id);

    void publish(EventPayload payload);
    void publishAndWait(EventPayload payload);

    // Runs scheduled dispatches until none are left. Must not be called from a
    // handler running on the same io_context.
    std::size_t drain();

    std::size_t pendingDispatches() const { return pending_; }
    std::vector<Event> history(std::optional<EventKind> kind = std::nullopt) const;
    Stats stats() const { return stats_; }
    // Drops listeners, history and stats, and cancels every scheduled dispatch.
    void clearAll();

private:
    struct Listener {
        std::size_t id{};
        std::string name;
        Handler handler;
    };

    Event makeEvent_(EventPayload payload);
    void record_(const Event& event);
    void dispatchTo_(std::size_t listenerId, const Event& event);
    const Listener* findListener_(EventKind kind, std::size_t id) const;

    boost::asio::io_context& ioc_;
    std::size_t historyCapacity_;
    std::unordered_map<EventKind, std::vector<Listener>> listeners_;
    std::unordered_map<std::size_t, EventKind> kindById_;
    std::deque<Event> history_;
    Stats stats_{};
    std::size_t pending_{0};
    std::uint64_t epoch_{0};
    std::size_t nextId_{1};
    std::uint64_t nextSequence_{1};
};

}  // namespace core
