#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <json/json.h>

#include "castlink/error.hpp"

namespace castlink {

using RequestId = std::uint32_t;

enum class PayloadType { String, Binary };

// One protocol message: who sent it, who it's for, which namespace it rides
// on, and its payload (JSON text for String, opaque bytes for Binary).
struct Envelope {
    std::string source_id;
    std::string destination_id;
    std::string ns;
    PayloadType payload_type = PayloadType::String;
    std::string payload;

    static Envelope json(const std::string& source, const std::string& destination,
                         const std::string& namespace_name, const Json::Value& body);
    static Envelope binary(const std::string& source, const std::string& destination,
                           const std::string& namespace_name, std::string bytes);

    bool operator==(const Envelope& other) const;
    bool operator!=(const Envelope& other) const { return !(*this == other); }
};

constexpr std::size_t kLengthPrefixSize = 4;
constexpr std::size_t kDefaultMaxFrameSize = 64 * 1024;

// Serializes to CastMessage bytes (without the length prefix).
Result<std::string> encode(const Envelope& envelope, std::size_t max_frame_size = kDefaultMaxFrameSize);

// Parses CastMessage bytes. Malformed input yields DecodingError, never an exception.
Result<Envelope> decode(const std::string& bytes);

// Prepends the 4-byte big-endian length.
std::string frame(const std::string& message);

// Reads a length prefix from the first kLengthPrefixSize bytes of data.
// Zero and anything above max_frame_size are DecodingError.
Result<std::uint32_t> parse_length_prefix(const unsigned char* data, std::size_t max_frame_size);

bool is_valid_utf8(const std::string& text);

// JSON payload helpers shared by the namespace controllers.
Result<Json::Value> parse_json(const Envelope& envelope);
std::string to_json_text(const Json::Value& body);
std::string message_type(const Json::Value& body);

// 0 when the body carries no usable requestId.
RequestId request_id_of(const Json::Value& body);

} // namespace castlink
