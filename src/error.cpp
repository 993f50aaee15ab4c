#include "castlink/error.hpp"

namespace castlink {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EncodingError:   return "EncodingError";
        case ErrorKind::DecodingError:   return "DecodingError";
        case ErrorKind::IoError:         return "IoError";
        case ErrorKind::Closed:          return "Closed";
        case ErrorKind::Timeout:         return "Timeout";
        case ErrorKind::Cancelled:       return "Cancelled";
        case ErrorKind::NotRunning:      return "NotRunning";
        case ErrorKind::NoActiveSession: return "NoActiveSession";
        case ErrorKind::SessionExpired:  return "SessionExpired";
        case ErrorKind::CommandRejected: return "CommandRejected";
        case ErrorKind::LaunchFailed:    return "LaunchFailed";
    }
    return "Unknown";
}

CastError::CastError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace castlink
