#pragma once

#include <variant>

#include "castlink/envelope.hpp"
#include "castlink/namespaces.hpp"

namespace castlink {

class RequestCorrelator;
class HeartbeatMonitor;
class EventBus;

// An inbound message that carries a requestId and may answer a request.
struct InboundReply {
    RequestId request_id;
    Envelope envelope;
};

// Anything else: status pushes, device-initiated messages, binary payloads.
struct InboundEvent {
    Channel channel;
    Envelope envelope;
};

using Inbound = std::variant<InboundReply, InboundEvent>;

// The single classification step every inbound envelope goes through.
Inbound classify(const Envelope& envelope);

// Dispatches inbound envelopes from the reader loop. Heartbeat traffic goes
// straight to the monitor, replies to the correlator, and everything else
// (including replies nobody is waiting for) onto the event bus. Holds no
// state of its own and never throws.
class NamespaceRouter {
public:
    NamespaceRouter(RequestCorrelator& correlator, HeartbeatMonitor& heartbeat, EventBus& bus);

    void route(const Envelope& envelope);

private:
    RequestCorrelator& correlator_;
    HeartbeatMonitor& heartbeat_;
    EventBus& bus_;
};

} // namespace castlink
