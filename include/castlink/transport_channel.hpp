#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "castlink/byte_stream.hpp"
#include "castlink/envelope.hpp"

namespace castlink {

// Length-prefixed envelope framing over one ByteStream. Owns the stream and
// the request id counter for the connection.
//
// send() may be called from any thread; frames are written whole. receive()
// is meant for a single reader loop. Both throw CastError: IoError on a stream
// fault, Closed once close() has run, EncodingError/DecodingError for bad
// envelopes. An inbound framing or decoding error closes the channel, since
// there's no way to resynchronise mid-stream.
class TransportChannel {
public:
    TransportChannel(std::shared_ptr<ByteStream> stream, std::size_t max_frame_size = kDefaultMaxFrameSize);
    ~TransportChannel();

    TransportChannel(const TransportChannel&) = delete;
    TransportChannel& operator=(const TransportChannel&) = delete;

    void send(const Envelope& envelope);
    Envelope receive();

    // Idempotent. Waits briefly for an in-flight write to finish, closes the
    // stream (unblocking receive) and runs the close listeners once.
    void close();
    bool closed() const { return closed_; }

    // Listeners run on the thread that closes the channel. Registering after
    // close runs the listener immediately.
    void on_close(std::function<void()> listener);

    // Next id for a request expecting a reply; never returns 0.
    RequestId next_request_id();

    std::size_t max_frame_size() const { return max_frame_size_; }

private:
    // Reads until read_buffer_ holds at least count bytes.
    void fill(std::size_t count);
    [[noreturn]] void fail_read(ErrorKind kind, const std::string& message);

    std::shared_ptr<ByteStream> stream_;
    const std::size_t max_frame_size_;

    std::timed_mutex write_mutex_;
    std::mutex read_mutex_;
    std::string read_buffer_;

    std::atomic<bool> closed_{false};
    std::atomic<RequestId> request_counter_{0};

    std::mutex listeners_mutex_;
    std::vector<std::function<void()>> close_listeners_;
};

} // namespace castlink
