#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "castlink/config.hpp"
#include "castlink/envelope.hpp"

namespace castlink {

class EventBus;
class TransportChannel;

// Keeps the connection alive and notices when it isn't. Every interval a PING
// goes to the receiver; a PONG before the next tick returns the monitor to
// Idle. After heartbeat_miss_threshold consecutive unanswered pings the
// monitor goes Dead, publishes ConnectionLost and closes the channel.
//
// PINGs from the device are answered with a PONG, written from the timers
// thread so a slow write never holds up the reader loop.
class HeartbeatMonitor : public std::enable_shared_from_this<HeartbeatMonitor> {
public:
    enum class State { Idle, AwaitingPong, Dead };

    HeartbeatMonitor(TransportChannel& channel, EventBus& bus, boost::asio::io_context& timers, const Config& config);

    // Sends the first ping right away and then one per interval. Must be
    // owned by a shared_ptr.
    void start();
    void stop();

    // Handles one heartbeat-namespace message.
    void observe(const Envelope& envelope);

    State state() const;
    unsigned missed() const;

private:
    void tick();
    void schedule();
    void send(const std::string& type, const std::string& destination);

    TransportChannel& channel_;
    EventBus& bus_;
    boost::asio::io_context& timers_;
    const std::string sender_id_;
    const std::string receiver_id_;
    const std::chrono::milliseconds interval_;
    const unsigned miss_threshold_;

    // Touched only from the timers io_context thread.
    boost::asio::steady_timer timer_;

    mutable std::mutex mutex_;
    State state_ = State::Idle;
    unsigned missed_ = 0;
    bool running_ = false;
};

const char* to_string(HeartbeatMonitor::State state);

} // namespace castlink
