#include <doctest/doctest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "castlink/error.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/transport_channel.hpp"
#include "support/fake_stream.hpp"

using namespace castlink;
using castlink::test::FakeStream;

namespace {

Envelope status_push(int n) {
    Json::Value body;
    body["type"] = "RECEIVER_STATUS";
    body["n"] = n;
    return Envelope::json("receiver-0", "sender-0", ns::kReceiver, body);
}

// Kind of the error receive() throws; nullopt if it returned normally.
std::optional<ErrorKind> receive_error(TransportChannel& channel) {
    try {
        channel.receive();
    } catch (const CastError& e) {
        return e.kind();
    }
    return std::nullopt;
}

} // namespace

TEST_CASE("Frames split across one-byte reads are reassembled") {
    auto stream = std::make_shared<FakeStream>();
    stream->set_chunk_size(1);
    stream->push(status_push(1));
    stream->push(status_push(2));

    TransportChannel channel(stream);
    CHECK(channel.receive() == status_push(1));
    CHECK(channel.receive() == status_push(2));
}

TEST_CASE("Several frames in one read are delivered one at a time") {
    auto stream = std::make_shared<FakeStream>();
    std::string bytes;
    for (int i = 0; i < 3; ++i) bytes += frame(encode(status_push(i)).value());
    stream->push_raw(bytes);

    TransportChannel channel(stream);
    for (int i = 0; i < 3; ++i) CHECK(channel.receive() == status_push(i));
}

TEST_CASE("Sent envelope arrives framed on the stream") {
    auto stream = std::make_shared<FakeStream>();
    TransportChannel channel(stream);

    Json::Value body;
    body["type"] = "CONNECT";
    Envelope env = Envelope::json("sender-0", "receiver-0", ns::kConnection, body);
    channel.send(env);

    auto sent = stream->sent();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0] == env);
}

TEST_CASE("Concurrent senders never interleave frames") {
    auto stream = std::make_shared<FakeStream>();
    TransportChannel channel(stream);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&channel, t] {
            for (int i = 0; i < kPerThread; ++i) {
                Json::Value body;
                body["type"] = "PING";
                body["from"] = t;
                body["pad"] = std::string(static_cast<std::size_t>(100 + i), 'p');
                channel.send(Envelope::json("sender-0", "receiver-0", ns::kHeartbeat, body));
            }
        });
    }
    for (auto& th : threads) th.join();

    // Every frame decoded cleanly, so none were interleaved.
    CHECK(stream->sent().size() == kThreads * kPerThread);
}

TEST_CASE("Invalid length prefix closes the channel") {
    auto stream = std::make_shared<FakeStream>();
    stream->push_raw(std::string("\x00\x00\x00\x00", 4));
    TransportChannel channel(stream);

    CHECK(receive_error(channel) == ErrorKind::DecodingError);
    CHECK(channel.closed());
    CHECK(stream->is_closed());
}

TEST_CASE("Undecodable frame closes the channel") {
    auto stream = std::make_shared<FakeStream>();
    stream->push_raw(frame("\xff\xff\xff"));
    TransportChannel channel(stream);

    CHECK(receive_error(channel) == ErrorKind::DecodingError);
    CHECK(channel.closed());
}

TEST_CASE("Device hanging up surfaces as Closed") {
    auto stream = std::make_shared<FakeStream>();
    stream->push(status_push(1));
    stream->push_eof();
    TransportChannel channel(stream);

    CHECK(channel.receive() == status_push(1));
    CHECK(receive_error(channel) == ErrorKind::Closed);
    CHECK(channel.closed());
}

TEST_CASE("close() unblocks a pending receive and is idempotent") {
    auto stream = std::make_shared<FakeStream>();
    TransportChannel channel(stream);

    std::atomic<int> listener_calls{0};
    channel.on_close([&] { ++listener_calls; });

    std::atomic<bool> got_closed{false};
    std::thread reader([&] { got_closed = receive_error(channel) == ErrorKind::Closed; });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    channel.close();
    reader.join();

    CHECK(got_closed);
    CHECK(listener_calls == 1);

    int late_calls = 0;
    channel.on_close([&] { ++late_calls; });
    CHECK(late_calls == 1);
}

TEST_CASE("Send after close fails with Closed") {
    auto stream = std::make_shared<FakeStream>();
    TransportChannel channel(stream);
    channel.close();

    try {
        channel.send(status_push(1));
        FAIL("send() did not throw");
    } catch (const CastError& e) {
        CHECK(e.kind() == ErrorKind::Closed);
    }
}

TEST_CASE("Write failure is an IoError and closes the channel") {
    auto stream = std::make_shared<FakeStream>();
    stream->fail_writes(true);
    TransportChannel channel(stream);

    try {
        channel.send(status_push(1));
        FAIL("send() did not throw");
    } catch (const CastError& e) {
        CHECK(e.kind() == ErrorKind::IoError);
    }
    CHECK(channel.closed());
}

TEST_CASE("Request ids start at 1 and increase") {
    TransportChannel channel(std::make_shared<FakeStream>());
    CHECK(channel.next_request_id() == 1);
    CHECK(channel.next_request_id() == 2);
    CHECK(channel.next_request_id() == 3);
}
