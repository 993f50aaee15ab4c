#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include "castlink/config.hpp"
#include "castlink/envelope.hpp"

namespace castlink {

class TransportChannel;

struct AuthOutcome {
    enum class Status { Response, Error, Timeout };

    Status status = Status::Timeout;
    int error_type = 0;             // AuthError::ErrorType when status is Error
    std::size_t certificate_size = 0;
};

// Device authentication challenge on the deviceauth namespace. Reports
// whether the device answered with a response or an error; checking the
// signature and certificate chain is left to the caller.
class DeviceAuthenticator {
public:
    DeviceAuthenticator(TransportChannel& channel, const Config& config);

    // Throws CastError if the challenge can't be sent.
    AuthOutcome challenge(std::chrono::milliseconds timeout);

    void observe(const Envelope& envelope);

private:
    TransportChannel& channel_;
    const std::string sender_id_;
    const std::string receiver_id_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<AuthOutcome> outcome_;
};

} // namespace castlink
