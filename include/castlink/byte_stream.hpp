#pragma once

#include <cstddef>

#include <boost/system/error_code.hpp>

namespace castlink {

// A connected duplex byte stream. The transport channel runs one reader and
// any number of writers against it, so implementations must allow a
// read_some to be in progress while write_all is called from another thread
// (writes themselves are already serialized by the caller). close() must
// unblock a pending read_some.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Reads at least one byte unless an error is reported; end of stream is
    // boost::asio::error::eof.
    virtual std::size_t read_some(char* data, std::size_t size, boost::system::error_code& ec) = 0;

    virtual void write_all(const char* data, std::size_t size, boost::system::error_code& ec) = 0;

    virtual void close() = 0;
};

} // namespace castlink
