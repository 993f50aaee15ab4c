#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "castlink/envelope.hpp"
#include "castlink/namespaces.hpp"

namespace castlink {

struct Event {
    enum class Kind { Message, ConnectionLost };

    Kind kind = Kind::Message;
    Channel channel = Channel::Unknown;
    Envelope envelope;   // Message only
    std::string reason;  // ConnectionLost only

    static Event message(Channel channel, Envelope envelope);
    static Event connection_lost(std::string reason);
};

using EventHandler = std::function<void(const Event&)>;

// Hands unsolicited traffic from the reader loop to subscribers on a worker
// thread. The handoff queue is bounded: when subscribers fall behind, new
// events are dropped and counted so the reader loop never waits on them.
// ConnectionLost is never dropped.
class EventBus {
public:
    using SubscriptionId = std::uint64_t;

    explicit EventBus(std::size_t capacity);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Message events on one channel. Channel::Unknown subscribers receive
    // traffic for namespaces the library has no handler for.
    SubscriptionId subscribe(Channel channel, EventHandler handler);

    // Every event, including ConnectionLost.
    SubscriptionId subscribe_all(EventHandler handler);

    void unsubscribe(SubscriptionId id);

    // False when the event was dropped (queue full or bus stopped).
    bool publish(Event event);

    // Stops the worker; events still queued are discarded. Safe to call from
    // a handler.
    void stop();

    std::uint64_t dropped() const { return dropped_; }
    std::size_t queued() const { return queued_; }

private:
    struct Subscription {
        std::optional<Channel> channel;
        EventHandler handler;
    };

    void deliver(const Event& event);

    const std::size_t capacity_;
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread worker_;

    std::atomic<std::size_t> queued_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<bool> stopped_{false};

    std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_id_ = 1;
};

} // namespace castlink
