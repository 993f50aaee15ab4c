#pragma once

#include <string>

namespace castlink {

namespace ns {

constexpr const char* kDeviceAuth = "urn:x-cast:com.google.cast.tp.deviceauth";
constexpr const char* kConnection = "urn:x-cast:com.google.cast.tp.connection";
constexpr const char* kHeartbeat = "urn:x-cast:com.google.cast.tp.heartbeat";
constexpr const char* kReceiver = "urn:x-cast:com.google.cast.receiver";
constexpr const char* kMedia = "urn:x-cast:com.google.cast.media";

} // namespace ns

// The logical channels multiplexed over one connection. Unknown covers any
// namespace a custom receiver application defines.
enum class Channel { DeviceAuth, Connection, Heartbeat, Receiver, Media, Unknown };

Channel channel_of(const std::string& namespace_name);
const char* to_string(Channel channel);

namespace app {

constexpr const char* kDefaultMediaReceiver = "CC1AD845";
constexpr const char* kBackdrop = "E8C28D3C";
constexpr const char* kYouTube = "233637DE";

} // namespace app

// Maps the short names "default", "backdrop" and "youtube" to their app ids.
// Anything else is taken to be an app id already.
std::string resolve_app_id(const std::string& name);

} // namespace castlink
