#include "core/EventBus.h"

#include <exception>
#include <memory>
#include <utility>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.h"

namespace core {

EventBus::Subscription::Subscription(EventBus* bus, std::size_t id)
    : bus_(bus), id_(id) {}

EventBus::Subscription::~Subscription() {
    reset();
}

EventBus::Subscription::Subscription(Subscription&& other) noexcept {
    bus_ = other.bus_;
    id_ = other.id_;
    other.bus_ = nullptr;
    other.id_ = 0;
}

EventBus::Subscription& EventBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        id_ = other.id_;
        other.bus_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void EventBus::Subscription::reset() {
    if (bus_ && id_ != 0) {
        bus_->unsubscribe(id_);
    }
    bus_ = nullptr;
    id_ = 0;
}

EventBus::EventBus(boost::asio::io_context& ioc, std::size_t historyCapacity)
    : ioc_(ioc), historyCapacity_(historyCapacity) {}

EventBus::Subscription EventBus::subscribe(EventKind kind, Handler handler, std::string name) {
    const std::size_t id = nextId_++;
    listeners_[kind].push_back(Listener{id, std::move(name), std::move(handler)});
    kindById_[id] = kind;
    return Subscription(this, id);
}

void EventBus::unsubscribe(std::size_t id) {
    auto kindIt = kindById_.find(id);
    if (kindIt == kindById_.end()) {
        return;
    }
    auto& vec = listeners_[kindIt->second];
    kindById_.erase(kindIt);
    for (std::size_t idx = 0; idx < vec.size(); ++idx) {
        if (vec[idx].id == id) {
            vec.erase(vec.begin() + static_cast<std::ptrdiff_t>(idx));
            break;
        }
    }
}

void EventBus::publish(EventPayload payload) {
    auto event = std::make_shared<const Event>(makeEvent_(std::move(payload)));
    record_(*event);

    auto it = listeners_.find(event->kind);
    if (it == listeners_.end()) {
        return;
    }
    for (const auto& listener : it->second) {
        ++pending_;
        boost::asio::post(ioc_, [this, event, listenerId = listener.id, epoch = epoch_]() {
            if (epoch != epoch_) {
                return;
            }
            --pending_;
            dispatchTo_(listenerId, *event);
        });
    }
}

void EventBus::publishAndWait(EventPayload payload) {
    const Event event = makeEvent_(std::move(payload));
    record_(event);

    auto it = listeners_.find(event.kind);
    if (it == listeners_.end()) {
        return;
    }
    std::vector<std::size_t> ids;
    ids.reserve(it->second.size());
    for (const auto& listener : it->second) {
        ids.push_back(listener.id);
    }
    for (const auto id : ids) {
        dispatchTo_(id, event);
    }
}

std::size_t EventBus::drain() {
    std::size_t executed = 0;
    while (pending_ > 0) {
        if (ioc_.stopped()) {
            ioc_.restart();
        }
        const auto ran = ioc_.poll_one();
        if (ran == 0) {
            break;
        }
        executed += ran;
    }
    return executed;
}

std::vector<Event> EventBus::history(std::optional<EventKind> kind) const {
    std::vector<Event> out;
    for (const auto& event : history_) {
        if (!kind || event.kind == *kind) {
            out.push_back(event);
        }
    }
    return out;
}

void EventBus::clearAll() {
    listeners_.clear();
    kindById_.clear();
    history_.clear();
    stats_ = Stats{};
    // Dispatches already posted belong to the previous epoch and run as no-ops.
    // Listener ids keep counting so a stale Subscription cannot release a new listener.
    pending_ = 0;
    ++epoch_;
}

Event EventBus::makeEvent_(EventPayload payload) {
    Event event;
    event.kind = kindOf(payload);
    event.sequence = nextSequence_++;
    event.publishedAt = nowMs();
    event.payload = std::move(payload);
    ++stats_.published;
    return event;
}

void EventBus::record_(const Event& event) {
    if (historyCapacity_ == 0) {
        return;
    }
    history_.push_back(event);
    while (history_.size() > historyCapacity_) {
        history_.pop_front();
    }
}

const EventBus::Listener* EventBus::findListener_(EventKind kind, std::size_t id) const {
    auto it = listeners_.find(kind);
    if (it == listeners_.end()) {
        return nullptr;
    }
    for (const auto& listener : it->second) {
        if (listener.id == id) {
            return &listener;
        }
    }
    return nullptr;
}

void EventBus::dispatchTo_(std::size_t listenerId, const Event& event) {
    const auto* listener = findListener_(event.kind, listenerId);
    if (listener == nullptr || !listener->handler) {
        return;
    }
    // The handler may unsubscribe itself; keep a copy alive for the call.
    auto handler = listener->handler;
    const std::string name = listener->name;
    try {
        handler(event);
        ++stats_.dispatched;
    } catch (const std::exception& ex) {
        ++stats_.failures;
        slob::common::metrics::Registry::instance().incrementCounter("event_handler_failures_total");
        LOG_ERR("EventBus handler '" << name << "' failed on " << toString(event.kind) << ": "
                                     << ex.what());
    } catch (...) {
        ++stats_.failures;
        slob::common::metrics::Registry::instance().incrementCounter("event_handler_failures_total");
        LOG_ERR("EventBus handler '" << name << "' failed on " << toString(event.kind)
                                     << " with unknown error");
    }
}

}  // namespace core
