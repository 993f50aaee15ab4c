#include "castlink/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace castlink {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write_lock;

} // namespace

void set_level(Level level) {
    g_level.store(static_cast<int>(level));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

bool enabled(Level level) {
    return static_cast<int>(level) >= g_level.load();
}

Level parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    throw std::invalid_argument("unknown log level: " + name);
}

void write(Level level, const char* tag, const std::string& message) {
    if (!enabled(level)) return;

    std::lock_guard<std::mutex> lk(g_write_lock);
    switch (level) {
        case Level::Debug:
        case Level::Info:
            std::cout << "[" << tag << "] " << message << "\n";
            break;
        case Level::Warn:
            std::cerr << "[" << tag << "] WARN " << message << std::endl;
            break;
        case Level::Error:
            std::cerr << "[" << tag << "] ERROR " << message << std::endl;
            break;
    }
}

Line::Line(Level level, const char* tag)
    : level_(level), tag_(tag), enabled_(enabled(level)) {}

Line::~Line() {
    if (enabled_) write(level_, tag_, stream_.str());
}

} // namespace log
} // namespace castlink
