#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "castlink/byte_stream.hpp"

namespace castlink {

// TLS connection to a receiver on port 8009. Receivers present self-signed
// certificates, so peer verification is off; trust is established at the
// protocol level by device authentication instead.
//
// Reads and writes are issued as async operations on one strand and the
// caller blocks on their completion, which keeps the SSL state single-threaded
// while still letting a write go out during a pending read.
class TlsStream : public ByteStream {
public:
    using ssl_socket = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

    // Resolves, connects and performs the TLS handshake. Throws
    // boost::system::system_error on failure.
    static std::unique_ptr<TlsStream> connect(const std::string& host, std::uint16_t port);

    ~TlsStream() override;

    std::size_t read_some(char* data, std::size_t size, boost::system::error_code& ec) override;
    void write_all(const char* data, std::size_t size, boost::system::error_code& ec) override;
    void close() override;

    // Local address of the connection, e.g. to build URLs the device can reach.
    std::string local_address() const;

private:
    TlsStream();

    boost::asio::io_context io_context_;
    boost::asio::ssl::context ssl_ctx_;
    ssl_socket socket_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread io_thread_;
    std::atomic<bool> closed_{false};
    std::string local_address_;
};

} // namespace castlink
