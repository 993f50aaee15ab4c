#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/error.hpp>

#include "castlink/byte_stream.hpp"
#include "castlink/envelope.hpp"

namespace castlink {
namespace test {

// In-memory duplex stream standing in for a TLS connection to a device.
// Bytes pushed by the test come out of read_some (in chunks of at most
// chunk_size); every whole frame the client writes is decoded, recorded and
// handed to the responder, which plays the device.
class FakeStream : public ByteStream {
public:
    using Responder = std::function<void(const Envelope&)>;

    std::size_t read_some(char* data, std::size_t size, boost::system::error_code& ec) override {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return closed_ || eof_ || !inbound_.empty(); });
        if (closed_) {
            ec = boost::asio::error::operation_aborted;
            return 0;
        }
        if (inbound_.empty()) {
            ec = boost::asio::error::eof;
            return 0;
        }
        const std::size_t n = std::min({size, chunk_size_, inbound_.size()});
        std::copy(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(n), data);
        inbound_.erase(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(n));
        ec.clear();
        return n;
    }

    void write_all(const char* data, std::size_t size, boost::system::error_code& ec) override {
        std::vector<Envelope> frames;
        Responder responder;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (closed_) {
                ec = boost::asio::error::broken_pipe;
                return;
            }
            if (fail_writes_) {
                ec = boost::asio::error::connection_reset;
                return;
            }
            outbound_.append(data, size);
            while (outbound_.size() >= kLengthPrefixSize) {
                auto len = parse_length_prefix(reinterpret_cast<const unsigned char*>(outbound_.data()),
                                               64 * 1024 * 1024);
                if (!len) break;
                const std::size_t total = kLengthPrefixSize + len.value();
                if (outbound_.size() < total) break;
                auto env = decode(outbound_.substr(kLengthPrefixSize, len.value()));
                outbound_.erase(0, total);
                if (env) frames.push_back(env.value());
            }
            for (const auto& f : frames) sent_.push_back(f);
            responder = responder_;
        }
        ec.clear();
        cv_.notify_all();
        if (responder) {
            for (const auto& f : frames) responder(f);
        }
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Queues one framed envelope for the client to read.
    void push(const Envelope& envelope) {
        auto bytes = encode(envelope);
        push_raw(frame(bytes.value()));
    }

    void push_raw(const std::string& bytes) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            inbound_.insert(inbound_.end(), bytes.begin(), bytes.end());
        }
        cv_.notify_all();
    }

    // The device hangs up once everything queued has been read.
    void push_eof() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            eof_ = true;
        }
        cv_.notify_all();
    }

    void set_responder(Responder responder) {
        std::lock_guard<std::mutex> lk(mutex_);
        responder_ = std::move(responder);
    }

    void set_chunk_size(std::size_t chunk_size) {
        std::lock_guard<std::mutex> lk(mutex_);
        chunk_size_ = chunk_size == 0 ? 1 : chunk_size;
    }

    void fail_writes(bool fail) {
        std::lock_guard<std::mutex> lk(mutex_);
        fail_writes_ = fail;
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return closed_;
    }

    std::vector<Envelope> sent() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return sent_;
    }

    // Sent envelopes of one namespace, in order.
    std::vector<Envelope> sent_on(const std::string& ns) const {
        std::vector<Envelope> out;
        for (const auto& e : sent()) {
            if (e.ns == ns) out.push_back(e);
        }
        return out;
    }

    // Waits until at least count envelopes have been sent on ns.
    bool wait_for_sent(const std::string& ns, std::size_t count,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, timeout, [&] {
            std::size_t n = 0;
            for (const auto& e : sent_) {
                if (e.ns == ns) ++n;
            }
            return n >= count;
        });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<char> inbound_;
    std::string outbound_;
    std::vector<Envelope> sent_;
    Responder responder_;
    std::size_t chunk_size_ = 4096;
    bool closed_ = false;
    bool eof_ = false;
    bool fail_writes_ = false;
};

} // namespace test
} // namespace castlink
