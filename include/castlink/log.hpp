#pragma once

#include <sstream>
#include <string>

namespace castlink {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_level(Level level);
Level level();
bool enabled(Level level);

// "debug", "info", "warn", "error"; throws std::invalid_argument otherwise.
Level parse_level(const std::string& name);

// Writes one "[tag] message" line. Info and below go to std::cout, warnings
// and errors to std::cerr. Lines from different threads never interleave.
void write(Level level, const char* tag, const std::string& message);

// Streams into a single log line, emitted when the Line goes out of scope:
//
//   log::info("Cast") << "Connecting to " << host << ":" << port;
class Line {
public:
    Line(Level level, const char* tag);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& operator<<(const T& value) {
        if (enabled_) stream_ << value;
        return *this;
    }

private:
    Level level_;
    const char* tag_;
    bool enabled_;
    std::ostringstream stream_;
};

inline Line debug(const char* tag) { return Line(Level::Debug, tag); }
inline Line info(const char* tag) { return Line(Level::Info, tag); }
inline Line warn(const char* tag) { return Line(Level::Warn, tag); }
inline Line error(const char* tag) { return Line(Level::Error, tag); }

} // namespace log
} // namespace castlink
