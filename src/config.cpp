#include "castlink/config.hpp"

#include <fstream>
#include <stdexcept>

namespace castlink {

namespace {

const Json::Value* member(const Json::Value& root, const char* key) {
    return root.isMember(key) ? &root[key] : nullptr;
}

void read_string(const Json::Value& root, const char* key, std::string& out) {
    if (auto v = member(root, key)) {
        if (!v->isString()) throw std::invalid_argument(std::string("config: '") + key + "' must be a string");
        out = v->asString();
    }
}

void read_count(const Json::Value& root, const char* key, std::size_t& out) {
    if (auto v = member(root, key)) {
        if (!v->isUInt64() || v->asUInt64() == 0) {
            throw std::invalid_argument(std::string("config: '") + key + "' must be a positive integer");
        }
        out = static_cast<std::size_t>(v->asUInt64());
    }
}

void read_millis(const Json::Value& root, const char* key, std::chrono::milliseconds& out) {
    if (auto v = member(root, key)) {
        if (!v->isUInt64() || v->asUInt64() == 0) {
            throw std::invalid_argument(std::string("config: '") + key + "' must be a positive number of milliseconds");
        }
        out = std::chrono::milliseconds(v->asUInt64());
    }
}

} // namespace

Config Config::from_json(const Json::Value& root) {
    if (!root.isObject()) throw std::invalid_argument("config: top level must be an object");

    Config config;
    read_string(root, "sender_id", config.sender_id);
    read_string(root, "receiver_id", config.receiver_id);
    read_string(root, "user_agent", config.user_agent);
    read_count(root, "max_frame_size", config.max_frame_size);
    read_millis(root, "heartbeat_interval_ms", config.heartbeat_interval);
    read_millis(root, "status_timeout_ms", config.status_timeout);
    read_millis(root, "command_timeout_ms", config.command_timeout);
    read_millis(root, "launch_timeout_ms", config.launch_timeout);
    read_count(root, "event_queue_capacity", config.event_queue_capacity);

    std::size_t threshold = config.heartbeat_miss_threshold;
    read_count(root, "heartbeat_miss_threshold", threshold);
    config.heartbeat_miss_threshold = static_cast<unsigned>(threshold);

    std::string level;
    read_string(root, "log_level", level);
    if (!level.empty()) config.log_level = log::parse_level(level);

    return config;
}

Config Config::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("config: cannot open " + path);

    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(in, root)) {
        throw std::runtime_error("config: " + path + ": " + reader.getFormattedErrorMessages());
    }
    return from_json(root);
}

} // namespace castlink
