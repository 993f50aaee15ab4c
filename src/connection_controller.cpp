#include "castlink/connection_controller.hpp"

#include <json/json.h>

#include "castlink/log.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/transport_channel.hpp"

namespace castlink {

ConnectionController::ConnectionController(TransportChannel& channel, const Config& config)
    : channel_(channel), sender_id_(config.sender_id), user_agent_(config.user_agent) {}

void ConnectionController::connect(const std::string& transport_id) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (open_.count(transport_id)) return;
    }
    send("CONNECT", transport_id);
    std::lock_guard<std::mutex> lk(mutex_);
    open_.insert(transport_id);
    log::debug("Cast") << "Virtual connection to " << transport_id << " opened";
}

void ConnectionController::disconnect(const std::string& transport_id) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!open_.erase(transport_id)) return;
    }
    send("CLOSE", transport_id);
}

bool ConnectionController::is_connected(const std::string& transport_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_.count(transport_id) != 0;
}

void ConnectionController::observe(const Envelope& envelope) {
    auto body = parse_json(envelope);
    if (!body) {
        log::warn("Cast") << body.error().what();
        return;
    }
    if (message_type(body.value()) == "CLOSE") {
        std::lock_guard<std::mutex> lk(mutex_);
        if (open_.erase(envelope.source_id)) {
            log::info("Cast") << "Device closed the virtual connection to " << envelope.source_id;
        }
    }
}

void ConnectionController::send(const char* type, const std::string& transport_id) {
    Json::Value payload;
    payload["type"] = type;
    payload["userAgent"] = user_agent_;
    channel_.send(Envelope::json(sender_id_, transport_id, ns::kConnection, payload));
}

} // namespace castlink
