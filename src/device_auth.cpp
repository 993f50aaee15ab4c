#include "castlink/device_auth.hpp"

#include "cast_channel.pb.h"

#include "castlink/log.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/transport_channel.hpp"

namespace castlink {

DeviceAuthenticator::DeviceAuthenticator(TransportChannel& channel, const Config& config)
    : channel_(channel), sender_id_(config.sender_id), receiver_id_(config.receiver_id) {}

AuthOutcome DeviceAuthenticator::challenge(std::chrono::milliseconds timeout) {
    cast_channel::DeviceAuthMessage auth_msg;
    auth_msg.mutable_challenge();

    std::string auth_data;
    if (!auth_msg.SerializeToString(&auth_data)) {
        throw CastError(ErrorKind::EncodingError, "DeviceAuthMessage serialization failed");
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        outcome_.reset();
    }
    log::info("Auth") << "Sending device auth challenge";
    channel_.send(Envelope::binary(sender_id_, receiver_id_, ns::kDeviceAuth, std::move(auth_data)));

    std::unique_lock<std::mutex> lk(mutex_);
    if (!cv_.wait_for(lk, timeout, [this] { return outcome_.has_value(); })) {
        log::warn("Auth") << "No device auth reply within " << timeout.count() << "ms";
        return AuthOutcome{};
    }
    return *outcome_;
}

void DeviceAuthenticator::observe(const Envelope& envelope) {
    if (envelope.payload_type != PayloadType::Binary) {
        log::warn("Auth") << "Ignoring non-binary device auth message";
        return;
    }

    cast_channel::DeviceAuthMessage reply;
    if (!reply.ParseFromString(envelope.payload)) {
        log::warn("Auth") << "Malformed DeviceAuthMessage (" << envelope.payload.size() << " bytes)";
        return;
    }

    AuthOutcome outcome;
    if (reply.has_response()) {
        outcome.status = AuthOutcome::Status::Response;
        outcome.certificate_size = reply.response().client_auth_certificate().size();
        log::info("Auth") << "Device answered the auth challenge";
    } else if (reply.has_error()) {
        outcome.status = AuthOutcome::Status::Error;
        outcome.error_type = static_cast<int>(reply.error().error_type());
        log::warn("Auth") << "Device auth error: " << outcome.error_type;
    } else {
        log::warn("Auth") << "Device auth message carries neither response nor error";
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        outcome_ = outcome;
    }
    cv_.notify_all();
}

} // namespace castlink
