#include <doctest/doctest.h>

#include <string>

#include "cast_channel.pb.h"

#include "castlink/envelope.hpp"
#include "castlink/namespaces.hpp"

using namespace castlink;

TEST_CASE("String envelope survives encode and decode") {
    Json::Value body;
    body["type"] = "GET_STATUS";
    body["requestId"] = 7;
    Envelope in = Envelope::json("sender-0", "receiver-0", ns::kReceiver, body);

    auto bytes = encode(in);
    REQUIRE(bytes.ok());
    auto out = decode(bytes.value());
    REQUIRE(out.ok());
    CHECK(out.value() == in);
    CHECK(out.value().payload_type == PayloadType::String);
    CHECK(message_type(parse_json(out.value()).value()) == "GET_STATUS");
    CHECK(request_id_of(parse_json(out.value()).value()) == 7);
}

TEST_CASE("Binary envelope keeps arbitrary bytes") {
    std::string bytes("\x00\x01\xff\xfe", 4);
    Envelope in = Envelope::binary("sender-0", "receiver-0", ns::kDeviceAuth, bytes);

    auto out = decode(encode(in).value());
    REQUIRE(out.ok());
    CHECK(out.value().payload_type == PayloadType::Binary);
    CHECK(out.value().payload == bytes);
}

TEST_CASE("Encoded message carries protocol version CASTV2_1_0") {
    Envelope in = Envelope::json("a", "b", ns::kConnection, Json::Value(Json::objectValue));
    cast_channel::CastMessage message;
    REQUIRE(message.ParseFromString(encode(in).value()));
    CHECK(message.protocol_version() == cast_channel::CastMessage::CASTV2_1_0);
    CHECK(message.namespace_() == ns::kConnection);
}

TEST_CASE("Oversized envelope is an encoding error") {
    Envelope in;
    in.source_id = "sender-0";
    in.destination_id = "receiver-0";
    in.ns = ns::kMedia;
    in.payload = std::string(200, 'x');

    auto bytes = encode(in, 100);
    REQUIRE_FALSE(bytes.ok());
    CHECK(bytes.error().kind() == ErrorKind::EncodingError);
}

TEST_CASE("Invalid UTF-8 in a string payload is an encoding error") {
    Envelope in;
    in.source_id = "sender-0";
    in.destination_id = "receiver-0";
    in.ns = ns::kMedia;
    in.payload = "\xc3\x28";

    auto bytes = encode(in);
    REQUIRE_FALSE(bytes.ok());
    CHECK(bytes.error().kind() == ErrorKind::EncodingError);
}

TEST_CASE("Malformed bytes decode to an error, not an exception") {
    auto garbage = decode(std::string("\xff\xff\xff\xff\x0f", 5));
    CHECK_FALSE(garbage.ok());
    CHECK(garbage.error().kind() == ErrorKind::DecodingError);

    auto empty = decode(std::string());
    CHECK_FALSE(empty.ok());
}

TEST_CASE("Length prefix is 4 bytes big-endian") {
    std::string framed = frame(std::string(258, 'a'));
    REQUIRE(framed.size() == 262);
    CHECK(static_cast<unsigned char>(framed[0]) == 0);
    CHECK(static_cast<unsigned char>(framed[1]) == 0);
    CHECK(static_cast<unsigned char>(framed[2]) == 1);
    CHECK(static_cast<unsigned char>(framed[3]) == 2);

    auto len = parse_length_prefix(reinterpret_cast<const unsigned char*>(framed.data()), kDefaultMaxFrameSize);
    REQUIRE(len.ok());
    CHECK(len.value() == 258);
}

TEST_CASE("Zero and oversized length prefixes are rejected") {
    const unsigned char zero[4] = {0, 0, 0, 0};
    CHECK_FALSE(parse_length_prefix(zero, kDefaultMaxFrameSize).ok());

    const unsigned char huge[4] = {0x00, 0x10, 0x00, 0x01};
    auto len = parse_length_prefix(huge, kDefaultMaxFrameSize);
    CHECK_FALSE(len.ok());
    CHECK(len.error().kind() == ErrorKind::DecodingError);
}

TEST_CASE("UTF-8 validation") {
    CHECK(is_valid_utf8("plain ascii"));
    CHECK(is_valid_utf8("\xc3\xa6\xc3\xb8\xc3\xa5"));
    CHECK(is_valid_utf8("\xf0\x9f\x93\xba"));
    CHECK_FALSE(is_valid_utf8("\xc0\xaf"));          // overlong
    CHECK_FALSE(is_valid_utf8("\xed\xa0\x80"));      // surrogate
    CHECK_FALSE(is_valid_utf8("\xe2\x82"));          // truncated
}

TEST_CASE("JSON helpers") {
    Envelope binary = Envelope::binary("a", "b", ns::kMedia, "x");
    CHECK_FALSE(parse_json(binary).ok());

    Envelope array;
    array.ns = ns::kMedia;
    array.payload = "[1,2]";
    CHECK_FALSE(parse_json(array).ok());

    Json::Value body;
    body["requestId"] = "12";
    CHECK(request_id_of(body) == 0);
    body["requestId"] = -3;
    CHECK(request_id_of(body) == 0);
    CHECK(message_type(Json::Value(3)).empty());

    Json::Value ping;
    ping["type"] = "PING";
    CHECK(to_json_text(ping) == "{\"type\":\"PING\"}");
}

TEST_CASE("Namespaces map to channels") {
    CHECK(channel_of(ns::kReceiver) == Channel::Receiver);
    CHECK(channel_of(ns::kMedia) == Channel::Media);
    CHECK(channel_of(ns::kHeartbeat) == Channel::Heartbeat);
    CHECK(channel_of("urn:x-cast:com.example.custom") == Channel::Unknown);

    CHECK(resolve_app_id("default") == app::kDefaultMediaReceiver);
    CHECK(resolve_app_id("youtube") == app::kYouTube);
    CHECK(resolve_app_id("ABCD1234") == "ABCD1234");
}
