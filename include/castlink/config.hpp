#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <json/json.h>

#include "castlink/log.hpp"

namespace castlink {

// Tunables for one device connection. Defaults match what Cast receivers
// expect from a well-behaved sender.
struct Config {
    std::string sender_id = "sender-0";
    std::string receiver_id = "receiver-0";
    std::string user_agent = "castlink";

    // Devices drop anything larger; the same bound is enforced on inbound frames.
    std::size_t max_frame_size = 64 * 1024;

    std::chrono::milliseconds heartbeat_interval{5000};
    unsigned heartbeat_miss_threshold = 3;

    std::chrono::milliseconds status_timeout{5000};
    std::chrono::milliseconds command_timeout{10000};
    std::chrono::milliseconds launch_timeout{30000};

    std::size_t event_queue_capacity = 256;

    log::Level log_level = log::Level::Info;

    // Overrides defaults with the keys present in root. Unknown keys are
    // ignored; a key with the wrong type throws std::invalid_argument.
    static Config from_json(const Json::Value& root);

    // Reads a JSON file and applies from_json. Throws std::runtime_error when
    // the file can't be read or parsed.
    static Config load(const std::string& path);
};

} // namespace castlink
