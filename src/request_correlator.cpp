#include "castlink/request_correlator.hpp"

#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "castlink/log.hpp"

namespace castlink {

namespace {

// Replies this many settlements late are treated as unsolicited.
constexpr std::size_t kRetiredWindow = 1024;

} // namespace

PendingRequest::PendingRequest(RequestId id, std::future<Envelope> reply, std::weak_ptr<RequestCorrelator> owner)
    : id_(id), reply_(std::move(reply)), owner_(std::move(owner)) {}

Envelope PendingRequest::get() {
    return reply_.get();
}

bool PendingRequest::ready() const {
    return reply_.valid() && reply_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void PendingRequest::cancel() {
    if (auto owner = owner_.lock()) owner->cancel(id_);
}

RequestCorrelator::RequestCorrelator(TransportChannel& channel, boost::asio::io_context& timers, std::string sender_id)
    : channel_(channel), timers_(timers), sender_id_(std::move(sender_id)) {}

PendingRequest RequestCorrelator::send_request(const std::string& namespace_name, const std::string& destination,
                                               Json::Value payload, std::chrono::milliseconds timeout) {
    const RequestId id = channel_.next_request_id();
    payload["requestId"] = Json::UInt(id);

    std::promise<Envelope> promise;
    PendingRequest handle(id, promise.get_future(), weak_from_this());

    auto timer = std::make_shared<boost::asio::steady_timer>(timers_, timeout);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shut_down_) {
            promise.set_exception(std::make_exception_ptr(CastError(ErrorKind::Closed, "channel is closed")));
            return handle;
        }
        slots_.emplace(id, Slot{namespace_name, destination, std::move(promise), timer});
    }

    std::weak_ptr<RequestCorrelator> weak = weak_from_this();
    boost::asio::post(timers_, [weak, id, timer] {
        timer->async_wait([weak, id](const boost::system::error_code& ec) {
            if (ec) return;
            if (auto self = weak.lock()) self->expire(id);
        });
    });

    try {
        channel_.send(Envelope::json(sender_id_, destination, namespace_name, payload));
    } catch (const CastError& e) {
        settle(id, e.kind(), e.what());
    }
    return handle;
}

RequestCorrelator::Match RequestCorrelator::resolve(RequestId id, const Envelope& reply) {
    if (id == 0) return Match::Unmatched;

    std::promise<Envelope> promise;
    std::shared_ptr<boost::asio::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            if (retired_.count(id)) {
                log::debug("Correlator") << "Dropping reply for request " << id << " which is no longer pending";
                return Match::Stale;
            }
            return Match::Unmatched;
        }
        if (it->second.ns != reply.ns) {
            log::warn("Correlator") << "Request " << id << " was sent on " << it->second.ns
                                    << " but a reply arrived on " << reply.ns;
            return Match::Unmatched;
        }
        promise = std::move(it->second.promise);
        timer = std::move(it->second.timer);
        slots_.erase(it);
        retire_locked(id);
    }

    disarm(timer);
    promise.set_value(reply);
    return Match::Resolved;
}

bool RequestCorrelator::expire(RequestId id) {
    if (settle(id, ErrorKind::Timeout, "request " + std::to_string(id) + " timed out")) {
        log::warn("Correlator") << "Request " << id << " timed out";
        return true;
    }
    return false;
}

bool RequestCorrelator::cancel(RequestId id) {
    return settle(id, ErrorKind::Cancelled, "request " + std::to_string(id) + " cancelled");
}

std::size_t RequestCorrelator::fail_destination(const std::string& destination, ErrorKind kind,
                                                const std::string& message) {
    std::vector<RequestId> ids;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& entry : slots_) {
            if (entry.second.destination == destination) ids.push_back(entry.first);
        }
    }

    std::size_t failed = 0;
    for (RequestId id : ids) {
        if (settle(id, kind, message)) ++failed;
    }
    return failed;
}

void RequestCorrelator::shutdown() {
    std::map<RequestId, Slot> drained;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        drained.swap(slots_);
        for (const auto& entry : drained) retire_locked(entry.first);
    }

    if (!drained.empty()) {
        log::debug("Correlator") << "Failing " << drained.size() << " pending request(s): channel closed";
    }
    for (auto& entry : drained) {
        disarm(entry.second.timer);
        entry.second.promise.set_exception(
            std::make_exception_ptr(CastError(ErrorKind::Closed, "channel closed while awaiting reply")));
    }
}

std::size_t RequestCorrelator::pending() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return slots_.size();
}

bool RequestCorrelator::is_shut_down() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return shut_down_;
}

bool RequestCorrelator::settle(RequestId id, ErrorKind kind, const std::string& message) {
    std::promise<Envelope> promise;
    std::shared_ptr<boost::asio::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) return false;
        promise = std::move(it->second.promise);
        timer = std::move(it->second.timer);
        slots_.erase(it);
        retire_locked(id);
    }

    disarm(timer);
    promise.set_exception(std::make_exception_ptr(CastError(kind, message)));
    return true;
}

void RequestCorrelator::retire_locked(RequestId id) {
    if (!retired_.insert(id).second) return;
    retired_order_.push_back(id);
    if (retired_order_.size() > kRetiredWindow) {
        retired_.erase(retired_order_.front());
        retired_order_.pop_front();
    }
}

void RequestCorrelator::disarm(const std::shared_ptr<boost::asio::steady_timer>& timer) {
    // Timers are only touched on the timers thread. A late expiry finds no
    // slot and does nothing, so the cancel just frees the wait early.
    if (timer) boost::asio::post(timers_, [timer] { timer->cancel(); });
}

} // namespace castlink
