#include "castlink/namespace_router.hpp"

#include <exception>

#include "castlink/event_bus.hpp"
#include "castlink/heartbeat_monitor.hpp"
#include "castlink/log.hpp"
#include "castlink/request_correlator.hpp"

namespace castlink {

Inbound classify(const Envelope& envelope) {
    const Channel channel = channel_of(envelope.ns);
    if (envelope.payload_type == PayloadType::String && channel != Channel::Heartbeat) {
        auto body = parse_json(envelope);
        if (body) {
            const RequestId id = request_id_of(body.value());
            if (id != 0) return InboundReply{id, envelope};
        } else {
            log::warn("Router") << body.error().what();
        }
    }
    return InboundEvent{channel, envelope};
}

NamespaceRouter::NamespaceRouter(RequestCorrelator& correlator, HeartbeatMonitor& heartbeat, EventBus& bus)
    : correlator_(correlator), heartbeat_(heartbeat), bus_(bus) {}

void NamespaceRouter::route(const Envelope& envelope) {
    try {
        Inbound inbound = classify(envelope);

        if (auto* reply = std::get_if<InboundReply>(&inbound)) {
            switch (correlator_.resolve(reply->request_id, reply->envelope)) {
                case RequestCorrelator::Match::Resolved:
                case RequestCorrelator::Match::Stale:
                    return;
                case RequestCorrelator::Match::Unmatched:
                    bus_.publish(Event::message(channel_of(envelope.ns), envelope));
                    return;
            }
            return;
        }

        auto& event = std::get<InboundEvent>(inbound);
        if (event.channel == Channel::Heartbeat) {
            heartbeat_.observe(event.envelope);
            return;
        }
        if (event.channel == Channel::Unknown) {
            log::debug("Router") << "No handler for namespace " << envelope.ns << ", passing to raw subscribers";
        }
        bus_.publish(Event::message(event.channel, std::move(event.envelope)));
    } catch (const std::exception& e) {
        log::error("Router") << "Failed to route message on " << envelope.ns << ": " << e.what();
    }
}

} // namespace castlink
