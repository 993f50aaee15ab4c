#include "castlink/transport_channel.hpp"

#include <chrono>

#include <boost/asio/error.hpp>

#include "castlink/log.hpp"

namespace castlink {

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr std::chrono::milliseconds kFlushGrace{500};

} // namespace

TransportChannel::TransportChannel(std::shared_ptr<ByteStream> stream, std::size_t max_frame_size)
    : stream_(std::move(stream)), max_frame_size_(max_frame_size) {}

TransportChannel::~TransportChannel() {
    close();
}

void TransportChannel::send(const Envelope& envelope) {
    if (closed_) throw CastError(ErrorKind::Closed, "channel is closed");

    auto encoded = encode(envelope, max_frame_size_);
    if (!encoded) throw encoded.error();
    const std::string bytes = frame(encoded.value());

    boost::system::error_code ec;
    {
        std::lock_guard<std::timed_mutex> lk(write_mutex_);
        if (closed_) throw CastError(ErrorKind::Closed, "channel is closed");
        stream_->write_all(bytes.data(), bytes.size(), ec);
    }

    if (ec) {
        if (closed_) throw CastError(ErrorKind::Closed, "channel closed during write");
        log::error("Channel") << "Write to " << envelope.destination_id << " failed: " << ec.message();
        close();
        throw CastError(ErrorKind::IoError, "write failed: " + ec.message());
    }
    log::debug("Channel") << "Sent to " << envelope.destination_id << " on " << envelope.ns << ": "
                          << (envelope.payload_type == PayloadType::String ? envelope.payload : "<binary>");
}

Envelope TransportChannel::receive() {
    std::lock_guard<std::mutex> lk(read_mutex_);
    if (closed_) throw CastError(ErrorKind::Closed, "channel is closed");

    fill(kLengthPrefixSize);
    auto length = parse_length_prefix(reinterpret_cast<const unsigned char*>(read_buffer_.data()), max_frame_size_);
    if (!length) fail_read(ErrorKind::DecodingError, length.error().what());

    const std::size_t total = kLengthPrefixSize + length.value();
    fill(total);
    std::string message = read_buffer_.substr(kLengthPrefixSize, length.value());
    read_buffer_.erase(0, total);

    auto envelope = decode(message);
    if (!envelope) fail_read(ErrorKind::DecodingError, envelope.error().what());

    const Envelope& e = envelope.value();
    log::debug("Channel") << "Received from " << e.source_id << " on " << e.ns << ": "
                          << (e.payload_type == PayloadType::String ? e.payload : "<binary>");
    return envelope.take();
}

void TransportChannel::fill(std::size_t count) {
    char chunk[kReadChunk];
    while (read_buffer_.size() < count) {
        boost::system::error_code ec;
        const std::size_t n = stream_->read_some(chunk, sizeof(chunk), ec);
        if (n > 0) read_buffer_.append(chunk, n);
        if (ec) {
            if (closed_) throw CastError(ErrorKind::Closed, "channel is closed");
            if (ec == boost::asio::error::eof) fail_read(ErrorKind::Closed, "connection closed by device");
            fail_read(ErrorKind::IoError, "read failed: " + ec.message());
        }
    }
}

void TransportChannel::fail_read(ErrorKind kind, const std::string& message) {
    log::error("Channel") << message;
    read_buffer_.clear();
    close();
    throw CastError(kind, message);
}

void TransportChannel::close() {
    if (closed_.exchange(true)) return;

    // Let a frame that's already being written go out whole.
    std::unique_lock<std::timed_mutex> lk(write_mutex_, std::defer_lock);
    const bool flushed = lk.try_lock_for(kFlushGrace);
    stream_->close();
    if (flushed) lk.unlock();

    std::vector<std::function<void()>> listeners;
    {
        std::lock_guard<std::mutex> guard(listeners_mutex_);
        listeners.swap(close_listeners_);
    }
    for (auto& listener : listeners) listener();
    log::debug("Channel") << "Channel closed";
}

void TransportChannel::on_close(std::function<void()> listener) {
    {
        std::lock_guard<std::mutex> guard(listeners_mutex_);
        if (!closed_) {
            close_listeners_.push_back(std::move(listener));
            return;
        }
    }
    listener();
}

RequestId TransportChannel::next_request_id() {
    RequestId id = ++request_counter_;
    while (id == 0) id = ++request_counter_;
    return id;
}

} // namespace castlink
