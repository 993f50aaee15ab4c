#include "castlink/namespaces.hpp"

namespace castlink {

Channel channel_of(const std::string& namespace_name) {
    if (namespace_name == ns::kReceiver) return Channel::Receiver;
    if (namespace_name == ns::kMedia) return Channel::Media;
    if (namespace_name == ns::kHeartbeat) return Channel::Heartbeat;
    if (namespace_name == ns::kConnection) return Channel::Connection;
    if (namespace_name == ns::kDeviceAuth) return Channel::DeviceAuth;
    return Channel::Unknown;
}

const char* to_string(Channel channel) {
    switch (channel) {
        case Channel::DeviceAuth: return "device-auth";
        case Channel::Connection: return "connection";
        case Channel::Heartbeat:  return "heartbeat";
        case Channel::Receiver:   return "receiver";
        case Channel::Media:      return "media";
        case Channel::Unknown:    return "unknown";
    }
    return "unknown";
}

std::string resolve_app_id(const std::string& name) {
    if (name == "default") return app::kDefaultMediaReceiver;
    if (name == "backdrop") return app::kBackdrop;
    if (name == "youtube") return app::kYouTube;
    return name;
}

} // namespace castlink
