#pragma once

#include <chrono>
#include <memory>

#include "castlink/cast_device.hpp"
#include "castlink/config.hpp"
#include "support/fake_stream.hpp"
#include "support/scripted_receiver.hpp"

namespace castlink {
namespace test {

inline Config quick_config() {
    Config config;
    config.status_timeout = std::chrono::milliseconds(500);
    config.command_timeout = std::chrono::milliseconds(500);
    config.launch_timeout = std::chrono::milliseconds(2000);
    return config;
}

// A CastDevice wired to a ScriptedReceiver over an in-memory stream.
struct DeviceHarness {
    std::shared_ptr<FakeStream> stream = std::make_shared<FakeStream>();
    ScriptedReceiver script{stream};
    std::unique_ptr<CastDevice> device;

    explicit DeviceHarness(const Config& config = quick_config())
        : device(std::make_unique<CastDevice>(stream, config)) {}

    ~DeviceHarness() { device->close(); }

    std::size_t sent_count(const std::string& ns) const { return stream->sent_on(ns).size(); }
};

} // namespace test
} // namespace castlink
