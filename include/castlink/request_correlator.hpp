#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <json/json.h>

#include "castlink/envelope.hpp"
#include "castlink/error.hpp"
#include "castlink/transport_channel.hpp"

namespace castlink {

class RequestCorrelator;

// Caller's side of one outstanding request. Move-only; get() may be called once.
class PendingRequest {
public:
    PendingRequest() = default;

    RequestId id() const { return id_; }
    bool valid() const { return reply_.valid(); }

    // Blocks until the request is resolved. Returns the reply envelope or
    // throws CastError (Timeout, Closed, Cancelled, SessionExpired, IoError...).
    Envelope get();

    bool ready() const;

    // Forgets the request without telling the device; get() then throws
    // Cancelled and a late reply is dropped.
    void cancel();

private:
    friend class RequestCorrelator;
    PendingRequest(RequestId id, std::future<Envelope> reply, std::weak_ptr<RequestCorrelator> owner);

    RequestId id_ = 0;
    std::future<Envelope> reply_;
    std::weak_ptr<RequestCorrelator> owner_;
};

// Matches replies to requests by requestId. Owns the table of pending slots;
// every slot is settled exactly once, by a reply, its deadline, cancel(),
// fail_destination() or shutdown(), whichever gets the table lock first.
// Deadline timers run on the supplied io_context.
class RequestCorrelator : public std::enable_shared_from_this<RequestCorrelator> {
public:
    enum class Match {
        Resolved,   // settled a pending slot
        Stale,      // an id we issued and recently settled; dropped
        Unmatched   // no id, or one we never issued; belongs on the event path
    };

    RequestCorrelator(TransportChannel& channel, boost::asio::io_context& timers, std::string sender_id);

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    // Stamps payload["requestId"], records a slot and sends. A failed send
    // settles the slot straight away with the send error.
    PendingRequest send_request(const std::string& namespace_name, const std::string& destination,
                                Json::Value payload, std::chrono::milliseconds timeout);

    Match resolve(RequestId id, const Envelope& reply);

    // Deadline handler; true if the slot was still pending.
    bool expire(RequestId id);
    bool cancel(RequestId id);

    // Settles every slot addressed to destination with kind.
    std::size_t fail_destination(const std::string& destination, ErrorKind kind, const std::string& message);

    // Settles everything with Closed in request id order and refuses new requests.
    void shutdown();

    std::size_t pending() const;
    bool is_shut_down() const;

private:
    struct Slot {
        std::string ns;
        std::string destination;
        std::promise<Envelope> promise;
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    bool settle(RequestId id, ErrorKind kind, const std::string& message);
    void retire_locked(RequestId id);
    void disarm(const std::shared_ptr<boost::asio::steady_timer>& timer);

    TransportChannel& channel_;
    boost::asio::io_context& timers_;
    const std::string sender_id_;

    mutable std::mutex mutex_;
    std::map<RequestId, Slot> slots_;
    // Settled ids, oldest first. Ids wrap, so membership rather than
    // ordering decides whether a reply is stale.
    std::set<RequestId> retired_;
    std::deque<RequestId> retired_order_;
    bool shut_down_ = false;
};

} // namespace castlink
