#pragma once

#include <mutex>
#include <set>
#include <string>

#include "castlink/config.hpp"
#include "castlink/envelope.hpp"

namespace castlink {

class TransportChannel;

// Virtual connections on the connection namespace. A sender has to CONNECT
// to an endpoint (the receiver, or an application's transport id) before the
// endpoint accepts its messages.
class ConnectionController {
public:
    ConnectionController(TransportChannel& channel, const Config& config);

    // Sends CONNECT unless a virtual connection to transport_id is already open.
    void connect(const std::string& transport_id);

    // Sends CLOSE and forgets the connection.
    void disconnect(const std::string& transport_id);

    bool is_connected(const std::string& transport_id) const;

    // Device-initiated CLOSE for one of our virtual connections.
    void observe(const Envelope& envelope);

private:
    void send(const char* type, const std::string& transport_id);

    TransportChannel& channel_;
    const std::string sender_id_;
    const std::string user_agent_;

    mutable std::mutex mutex_;
    std::set<std::string> open_;
};

} // namespace castlink
