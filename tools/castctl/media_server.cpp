#include "media_server.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "castlink/log.hpp"

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace castctl {

namespace log = castlink::log;

namespace {

constexpr const char* kServerName = "castctl";

bool parse_number(const std::string& text, std::uint64_t& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

template <class Body>
void set_common_headers(http::response<Body>& res, const std::string& content_type) {
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, content_type);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::accept_ranges, "bytes");
}

void send_error(tcp::socket& sock, http::status status, unsigned version, const std::string& text) {
    http::response<http::string_body> err{status, version};
    err.set(http::field::server, kServerName);
    err.set(http::field::content_type, "text/plain");
    err.body() = text;
    err.prepare_payload();
    http::write(sock, err);
}

void serve_range(tcp::socket& sock, beast::file& file, const ByteRange& range, std::uint64_t file_size,
                 unsigned version, const std::string& content_type) {
    beast::error_code ec;
    file.seek(range.start, ec);
    if (ec) {
        log::warn("HTTP") << "Seek error: " << ec.message();
        send_error(sock, http::status::internal_server_error, version, "Seek error");
        return;
    }

    http::response<http::empty_body> res{http::status::partial_content, version};
    set_common_headers(res, content_type);
    res.set(http::field::content_range, "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) +
                                            "/" + std::to_string(file_size));
    res.content_length(range.length());

    http::response_serializer<http::empty_body> header{res};
    http::write_header(sock, header);

    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(range.length(), 8192)));
    std::uint64_t remaining = range.length();
    while (remaining > 0) {
        const auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        const std::size_t bytes_read = file.read(buffer.data(), to_read, ec);
        if (ec || bytes_read == 0) break;
        net::write(sock, net::buffer(buffer.data(), bytes_read));
        remaining -= bytes_read;
    }
    log::debug("HTTP") << "Served range " << range.start << "-" << range.end << " (" << range.length() << " bytes)";
}

void serve_connection(tcp::socket sock, const std::string& file_path, const std::string& content_type) {
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    beast::error_code ec;
    http::read(sock, buffer, req, ec);
    if (ec) {
        log::debug("HTTP") << "Bad request: " << ec.message();
        return;
    }

    beast::file file;
    file.open(file_path.c_str(), beast::file_mode::scan, ec);
    if (ec) {
        send_error(sock, http::status::not_found, req.version(), "Not found");
        return;
    }
    const std::uint64_t file_size = file.size(ec);
    if (ec) {
        send_error(sock, http::status::internal_server_error, req.version(), "File size error");
        return;
    }

    ByteRange range;
    auto range_header = req.find(http::field::range);
    if (range_header != req.end()) range = parse_byte_range(std::string(range_header->value()), file_size);

    switch (range.kind) {
    case ByteRange::Kind::Partial:
        serve_range(sock, file, range, file_size, req.version(), content_type);
        break;
    case ByteRange::Kind::Unsatisfiable: {
        http::response<http::string_body> err{http::status::range_not_satisfiable, req.version()};
        err.set(http::field::server, kServerName);
        err.set(http::field::content_range, "bytes */" + std::to_string(file_size));
        err.prepare_payload();
        http::write(sock, err);
        break;
    }
    case ByteRange::Kind::Full: {
        file.close(ec);
        http::response<http::file_body> res{http::status::ok, req.version()};
        res.body().open(file_path.c_str(), beast::file_mode::scan, ec);
        if (ec) {
            log::warn("HTTP") << "File open error for full serve: " << ec.message();
            return;
        }
        set_common_headers(res, content_type);
        res.prepare_payload();
        http::write(sock, res);
        log::debug("HTTP") << "Served full file (" << file_size << " bytes)";
        break;
    }
    }

    sock.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace

ByteRange parse_byte_range(const std::string& header, std::uint64_t file_size) {
    ByteRange out;
    const std::string prefix = "bytes=";
    if (header.compare(0, prefix.size(), prefix) != 0) return out;

    const std::string ranges = header.substr(prefix.size());
    const std::size_t dash = ranges.find('-');
    // Multiple ranges aren't supported; the whole file is a valid answer.
    if (dash == std::string::npos || ranges.find(',') != std::string::npos) return out;

    const std::string first = ranges.substr(0, dash);
    const std::string last = ranges.substr(dash + 1);
    out.kind = ByteRange::Kind::Unsatisfiable;

    std::uint64_t a = 0;
    std::uint64_t b = 0;
    if (first.empty()) {
        // Suffix form: the last b bytes.
        if (!parse_number(last, b) || b == 0 || file_size == 0) return out;
        out.start = b >= file_size ? 0 : file_size - b;
        out.end = file_size - 1;
    } else {
        if (!parse_number(first, a) || a >= file_size) return out;
        if (last.empty()) {
            b = file_size - 1;
        } else if (!parse_number(last, b) || b < a) {
            return out;
        }
        out.start = a;
        out.end = std::min(b, file_size - 1);
    }
    out.kind = ByteRange::Kind::Partial;
    return out;
}

std::string url_encode(const std::string& segment) {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    for (char ch : segment) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == ' ') {
            encoded += "%20";
        } else if (std::isalnum(c) || c == '.' || c == '-' || c == '_' || c == '~') {
            encoded += ch;
        } else {
            encoded += '%';
            encoded += hex[(c >> 4) & 0xF];
            encoded += hex[c & 0xF];
        }
    }
    return encoded;
}

std::string guess_content_type(const std::string& path) {
    const std::size_t dot = path.find_last_of('.');
    if (dot == std::string::npos) return "application/octet-stream";
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "mp4" || ext == "m4v") return "video/mp4";
    if (ext == "webm") return "video/webm";
    if (ext == "mkv") return "video/x-matroska";
    if (ext == "mp3") return "audio/mpeg";
    if (ext == "m4a") return "audio/mp4";
    if (ext == "aac") return "audio/aac";
    if (ext == "flac") return "audio/flac";
    if (ext == "wav") return "audio/wav";
    if (ext == "ogg") return "audio/ogg";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "png") return "image/png";
    return "application/octet-stream";
}

std::string start_media_server(const std::string& file_path, unsigned short port,
                               const std::string& content_type) {
    auto ioc = std::make_shared<net::io_context>(1);
    auto acceptor = std::make_shared<tcp::acceptor>(*ioc, tcp::endpoint{tcp::v4(), port});

    const std::string filename = file_path.substr(file_path.find_last_of("/\\") + 1);
    log::info("HTTP") << "Serving " << filename << " (" << content_type << ") on port " << port;

    std::thread([ioc, acceptor, file_path, content_type] {
        for (;;) {
            tcp::socket socket{*ioc};
            beast::error_code ec;
            acceptor->accept(socket, ec);
            if (ec) {
                log::warn("HTTP") << "Accept failed: " << ec.message();
                if (!acceptor->is_open()) return;
                continue;
            }
            std::thread([sock = std::move(socket), file_path, content_type]() mutable {
                try {
                    serve_connection(std::move(sock), file_path, content_type);
                } catch (const std::exception& e) {
                    log::warn("HTTP") << "Connection error: " << e.what();
                }
            }).detach();
        }
    }).detach();

    return "/" + url_encode(filename);
}

} // namespace castctl
