#pragma once

#include <cstdint>
#include <string>

namespace castctl {

// What to send back for one request's Range header.
struct ByteRange {
    enum class Kind { Full, Partial, Unsatisfiable };

    Kind kind = Kind::Full;
    std::uint64_t start = 0;
    std::uint64_t end = 0;   // inclusive

    std::uint64_t length() const { return end - start + 1; }
};

// Interprets a single "bytes=first-last" range (either side may be omitted)
// against a file of file_size bytes. A header that isn't a byte range is
// treated as a request for the whole file; last is clamped to the file end.
ByteRange parse_byte_range(const std::string& header, std::uint64_t file_size);

// Percent-encodes a path segment; spaces become %20.
std::string url_encode(const std::string& segment);

// Content type for a media file, by extension.
std::string guess_content_type(const std::string& path);

// Binds port and serves file_path, with Range support, to anyone who asks
// until the process exits. Throws boost::system::system_error if the port
// can't be bound. Returns the URL path (leading '/') the file is served under.
std::string start_media_server(const std::string& file_path, unsigned short port,
                               const std::string& content_type);

} // namespace castctl
