#include "castlink/envelope.hpp"

#include "cast_channel.pb.h"

namespace castlink {

Envelope Envelope::json(const std::string& source, const std::string& destination,
                        const std::string& namespace_name, const Json::Value& body) {
    Envelope e;
    e.source_id = source;
    e.destination_id = destination;
    e.ns = namespace_name;
    e.payload_type = PayloadType::String;
    e.payload = to_json_text(body);
    return e;
}

Envelope Envelope::binary(const std::string& source, const std::string& destination,
                          const std::string& namespace_name, std::string bytes) {
    Envelope e;
    e.source_id = source;
    e.destination_id = destination;
    e.ns = namespace_name;
    e.payload_type = PayloadType::Binary;
    e.payload = std::move(bytes);
    return e;
}

bool Envelope::operator==(const Envelope& other) const {
    return source_id == other.source_id && destination_id == other.destination_id &&
           ns == other.ns && payload_type == other.payload_type && payload == other.payload;
}

bool is_valid_utf8(const std::string& text) {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        std::size_t extra;
        std::uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;

        if (i + extra >= n) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

Result<std::string> encode(const Envelope& envelope, std::size_t max_frame_size) {
    if (!is_valid_utf8(envelope.source_id) || !is_valid_utf8(envelope.destination_id) ||
        !is_valid_utf8(envelope.ns)) {
        return Result<std::string>::fail(ErrorKind::EncodingError, "envelope ids/namespace are not valid UTF-8");
    }

    cast_channel::CastMessage message;
    message.set_protocol_version(cast_channel::CastMessage::CASTV2_1_0);
    message.set_source_id(envelope.source_id);
    message.set_destination_id(envelope.destination_id);
    message.set_namespace_(envelope.ns);
    if (envelope.payload_type == PayloadType::String) {
        if (!is_valid_utf8(envelope.payload)) {
            return Result<std::string>::fail(ErrorKind::EncodingError, "string payload is not valid UTF-8");
        }
        message.set_payload_type(cast_channel::CastMessage::STRING);
        message.set_payload_utf8(envelope.payload);
    } else {
        message.set_payload_type(cast_channel::CastMessage::BINARY);
        message.set_payload_binary(envelope.payload);
    }

    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        return Result<std::string>::fail(ErrorKind::EncodingError, "CastMessage serialization failed");
    }
    if (serialized.size() > max_frame_size) {
        return Result<std::string>::fail(ErrorKind::EncodingError,
            "message of " + std::to_string(serialized.size()) + " bytes exceeds the " +
            std::to_string(max_frame_size) + " byte frame limit");
    }
    return serialized;
}

Result<Envelope> decode(const std::string& bytes) {
    cast_channel::CastMessage message;
    if (!message.ParseFromString(bytes)) {
        return Result<Envelope>::fail(ErrorKind::DecodingError,
            "malformed CastMessage (" + std::to_string(bytes.size()) + " bytes)");
    }
    if (!is_valid_utf8(message.source_id()) || !is_valid_utf8(message.destination_id()) ||
        !is_valid_utf8(message.namespace_())) {
        return Result<Envelope>::fail(ErrorKind::DecodingError, "CastMessage string field is not valid UTF-8");
    }

    Envelope e;
    e.source_id = message.source_id();
    e.destination_id = message.destination_id();
    e.ns = message.namespace_();
    if (message.payload_type() == cast_channel::CastMessage::BINARY) {
        e.payload_type = PayloadType::Binary;
        e.payload = message.payload_binary();
    } else {
        if (!is_valid_utf8(message.payload_utf8())) {
            return Result<Envelope>::fail(ErrorKind::DecodingError, "string payload is not valid UTF-8");
        }
        e.payload_type = PayloadType::String;
        e.payload = message.payload_utf8();
    }
    return e;
}

std::string frame(const std::string& message) {
    const auto len = static_cast<std::uint32_t>(message.size());
    std::string out;
    out.reserve(kLengthPrefixSize + message.size());
    out.push_back(static_cast<char>((len >> 24) & 0xFF));
    out.push_back(static_cast<char>((len >> 16) & 0xFF));
    out.push_back(static_cast<char>((len >> 8) & 0xFF));
    out.push_back(static_cast<char>(len & 0xFF));
    out.append(message);
    return out;
}

Result<std::uint32_t> parse_length_prefix(const unsigned char* data, std::size_t max_frame_size) {
    const std::uint32_t len = (static_cast<std::uint32_t>(data[0]) << 24) |
                              (static_cast<std::uint32_t>(data[1]) << 16) |
                              (static_cast<std::uint32_t>(data[2]) << 8) |
                              static_cast<std::uint32_t>(data[3]);
    if (len == 0 || len > max_frame_size) {
        return Result<std::uint32_t>::fail(ErrorKind::DecodingError,
            "invalid frame length " + std::to_string(len));
    }
    return len;
}

Result<Json::Value> parse_json(const Envelope& envelope) {
    if (envelope.payload_type != PayloadType::String) {
        return Result<Json::Value>::fail(ErrorKind::DecodingError, "binary payload on " + envelope.ns);
    }
    Json::Value body;
    Json::Reader reader;
    if (!reader.parse(envelope.payload, body, false) || !body.isObject()) {
        return Result<Json::Value>::fail(ErrorKind::DecodingError, "payload on " + envelope.ns + " is not a JSON object");
    }
    return body;
}

std::string to_json_text(const Json::Value& body) {
    std::string text = Json::FastWriter().write(body);
    // FastWriter terminates with a newline; the device doesn't need it.
    if (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}

std::string message_type(const Json::Value& body) {
    if (!body.isObject()) return std::string();
    const Json::Value& type = body["type"];
    return type.isString() ? type.asString() : std::string();
}

RequestId request_id_of(const Json::Value& body) {
    if (!body.isObject() || !body.isMember("requestId")) return 0;
    const Json::Value& id = body["requestId"];
    if (!id.isUInt()) return 0;
    return static_cast<RequestId>(id.asUInt());
}

} // namespace castlink
