#include "castlink/heartbeat_monitor.hpp"

#include <boost/asio/post.hpp>
#include <json/json.h>

#include "castlink/event_bus.hpp"
#include "castlink/log.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/transport_channel.hpp"

namespace castlink {

namespace {

constexpr const char* kPing = "PING";
constexpr const char* kPong = "PONG";

} // namespace

const char* to_string(HeartbeatMonitor::State state) {
    switch (state) {
        case HeartbeatMonitor::State::Idle:         return "Idle";
        case HeartbeatMonitor::State::AwaitingPong: return "AwaitingPong";
        case HeartbeatMonitor::State::Dead:         return "Dead";
    }
    return "Unknown";
}

HeartbeatMonitor::HeartbeatMonitor(TransportChannel& channel, EventBus& bus, boost::asio::io_context& timers,
                                   const Config& config)
    : channel_(channel),
      bus_(bus),
      timers_(timers),
      sender_id_(config.sender_id),
      receiver_id_(config.receiver_id),
      interval_(config.heartbeat_interval),
      miss_threshold_(config.heartbeat_miss_threshold == 0 ? 1 : config.heartbeat_miss_threshold),
      timer_(timers) {}

void HeartbeatMonitor::start() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (running_ || state_ == State::Dead) return;
        running_ = true;
    }
    log::debug("Heartbeat") << "Starting, interval " << interval_.count() << "ms, miss threshold " << miss_threshold_;

    std::weak_ptr<HeartbeatMonitor> weak = shared_from_this();
    boost::asio::post(timers_, [weak] {
        if (auto self = weak.lock()) self->tick();
    });
}

void HeartbeatMonitor::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!running_) return;
        running_ = false;
    }
    std::weak_ptr<HeartbeatMonitor> weak = weak_from_this();
    boost::asio::post(timers_, [weak] {
        if (auto self = weak.lock()) self->timer_.cancel();
    });
}

void HeartbeatMonitor::observe(const Envelope& envelope) {
    auto body = parse_json(envelope);
    if (!body) {
        log::warn("Heartbeat") << body.error().what();
        return;
    }

    const std::string type = message_type(body.value());
    if (type == kPong) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (state_ == State::Dead) return;
        state_ = State::Idle;
        missed_ = 0;
    } else if (type == kPing) {
        log::debug("Heartbeat") << "PING from " << envelope.source_id << ", answering";
        // Written from the timers thread; observe() runs on the reader loop.
        std::weak_ptr<HeartbeatMonitor> weak = weak_from_this();
        boost::asio::post(timers_, [weak, to = envelope.source_id] {
            if (auto self = weak.lock()) self->send(kPong, to);
        });
    } else {
        log::debug("Heartbeat") << "Ignoring heartbeat message of type '" << type << "'";
    }
}

HeartbeatMonitor::State HeartbeatMonitor::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

unsigned HeartbeatMonitor::missed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return missed_;
}

void HeartbeatMonitor::tick() {
    bool dead = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!running_ || state_ == State::Dead) return;
        if (channel_.closed()) {
            running_ = false;
            return;
        }

        if (state_ == State::AwaitingPong) ++missed_;
        if (missed_ >= miss_threshold_) {
            state_ = State::Dead;
            running_ = false;
            dead = true;
        } else {
            state_ = State::AwaitingPong;
        }
    }

    if (dead) {
        const std::string reason = "no PONG for " + std::to_string(miss_threshold_) + " heartbeat interval(s)";
        log::error("Heartbeat") << "Connection lost: " << reason;
        bus_.publish(Event::connection_lost(reason));
        channel_.close();
        return;
    }

    send(kPing, receiver_id_);
    schedule();
}

void HeartbeatMonitor::schedule() {
    std::weak_ptr<HeartbeatMonitor> weak = shared_from_this();
    timer_.expires_after(interval_);
    timer_.async_wait([weak](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) self->tick();
    });
}

void HeartbeatMonitor::send(const std::string& type, const std::string& destination) {
    Json::Value payload;
    payload["type"] = type;
    try {
        // Fire-and-forget: no requestId, no pending slot.
        channel_.send(Envelope::json(sender_id_, destination, ns::kHeartbeat, payload));
    } catch (const CastError& e) {
        log::warn("Heartbeat") << "Failed to send " << type << ": " << e.what();
    }
}

} // namespace castlink
