#include "castlink/tls_stream.hpp"

#include <future>
#include <utility>

#include "castlink/log.hpp"

namespace castlink {

using boost::asio::ip::tcp;
using boost::system::error_code;

TlsStream::TlsStream()
    : ssl_ctx_(boost::asio::ssl::context::tlsv12_client),
      socket_(io_context_, ssl_ctx_),
      strand_(io_context_.get_executor()),
      work_(boost::asio::make_work_guard(io_context_)) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_none);
}

std::unique_ptr<TlsStream> TlsStream::connect(const std::string& host, std::uint16_t port) {
    std::unique_ptr<TlsStream> stream(new TlsStream());

    tcp::resolver resolver(stream->io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port));

    log::info("Cast") << "Connecting to " << host << ":" << port << "...";
    boost::asio::connect(stream->socket_.lowest_layer(), endpoints);
    stream->socket_.lowest_layer().set_option(tcp::no_delay(true));

    log::debug("Cast") << "Performing TLS handshake...";
    stream->socket_.handshake(boost::asio::ssl::stream_base::client);
    stream->local_address_ = stream->socket_.lowest_layer().local_endpoint().address().to_string();
    log::info("Cast") << "TLS connection established (local address " << stream->local_address_ << ")";

    TlsStream* raw = stream.get();
    stream->io_thread_ = std::thread([raw] { raw->io_context_.run(); });
    return stream;
}

TlsStream::~TlsStream() {
    close();
    work_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) io_thread_.join();
}

std::size_t TlsStream::read_some(char* data, std::size_t size, error_code& ec) {
    if (closed_) {
        ec = boost::asio::error::operation_aborted;
        return 0;
    }

    std::promise<std::pair<error_code, std::size_t>> done;
    auto result = done.get_future();
    boost::asio::post(strand_, [this, data, size, &done] {
        socket_.async_read_some(boost::asio::buffer(data, size),
            boost::asio::bind_executor(strand_, [&done](const error_code& e, std::size_t n) {
                done.set_value(std::make_pair(e, n));
            }));
    });

    auto outcome = result.get();
    ec = outcome.first;
    return outcome.second;
}

void TlsStream::write_all(const char* data, std::size_t size, error_code& ec) {
    if (closed_) {
        ec = boost::asio::error::operation_aborted;
        return;
    }

    std::promise<error_code> done;
    auto result = done.get_future();
    boost::asio::post(strand_, [this, data, size, &done] {
        boost::asio::async_write(socket_, boost::asio::buffer(data, size),
            boost::asio::bind_executor(strand_, [&done](const error_code& e, std::size_t) {
                done.set_value(e);
            }));
    });
    ec = result.get();
}

void TlsStream::close() {
    if (closed_.exchange(true)) return;
    if (!io_thread_.joinable()) {
        error_code ignored;
        socket_.lowest_layer().close(ignored);
        return;
    }

    // Runs on the strand so it can't race an in-flight read or write; the
    // cancel completes those with operation_aborted.
    std::promise<void> done;
    auto result = done.get_future();
    boost::asio::post(strand_, [this, &done] {
        error_code ec;
        socket_.lowest_layer().cancel(ec);
        socket_.lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
        socket_.lowest_layer().close(ec);
        done.set_value();
    });
    result.wait();
    log::debug("Cast") << "TLS connection closed";
}

std::string TlsStream::local_address() const {
    return local_address_;
}

} // namespace castlink
