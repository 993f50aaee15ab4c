#include "castlink/event_bus.hpp"

#include <exception>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "castlink/log.hpp"

namespace castlink {

Event Event::message(Channel channel, Envelope envelope) {
    Event e;
    e.kind = Kind::Message;
    e.channel = channel;
    e.envelope = std::move(envelope);
    return e;
}

Event Event::connection_lost(std::string reason) {
    Event e;
    e.kind = Kind::ConnectionLost;
    e.reason = std::move(reason);
    return e;
}

EventBus::EventBus(std::size_t capacity)
    : capacity_(capacity),
      work_(boost::asio::make_work_guard(io_context_)) {
    worker_ = std::thread([this] { io_context_.run(); });
}

EventBus::~EventBus() {
    stop();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

EventBus::SubscriptionId EventBus::subscribe(Channel channel, EventHandler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    const SubscriptionId id = next_id_++;
    subscriptions_.emplace(id, Subscription{channel, std::move(handler)});
    return id;
}

EventBus::SubscriptionId EventBus::subscribe_all(EventHandler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    const SubscriptionId id = next_id_++;
    subscriptions_.emplace(id, Subscription{std::nullopt, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    subscriptions_.erase(id);
}

bool EventBus::publish(Event event) {
    if (stopped_) return false;

    // At most one ConnectionLost per connection, so it may exceed the bound.
    const bool droppable = event.kind != Event::Kind::ConnectionLost;
    if (queued_.fetch_add(1) >= capacity_ && droppable) {
        queued_.fetch_sub(1);
        const auto total = ++dropped_;
        log::warn("Bus") << "Event queue full (" << capacity_ << "), dropping event on "
                         << to_string(event.channel) << " (" << total << " dropped so far)";
        return false;
    }

    boost::asio::post(io_context_, [this, e = std::move(event)] {
        queued_.fetch_sub(1);
        deliver(e);
    });
    return true;
}

void EventBus::stop() {
    if (stopped_.exchange(true)) return;
    work_.reset();
    io_context_.stop();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}

void EventBus::deliver(const Event& event) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& entry : subscriptions_) {
            const Subscription& sub = entry.second;
            if (!sub.channel) {
                handlers.push_back(sub.handler);
            } else if (event.kind == Event::Kind::Message && *sub.channel == event.channel) {
                handlers.push_back(sub.handler);
            }
        }
    }

    for (auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            log::error("Bus") << "Subscriber failed on " << to_string(event.channel) << " event: " << e.what();
        }
    }
}

} // namespace castlink
