#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "castlink/byte_stream.hpp"
#include "castlink/config.hpp"
#include "castlink/connection_controller.hpp"
#include "castlink/device_auth.hpp"
#include "castlink/event_bus.hpp"
#include "castlink/heartbeat_monitor.hpp"
#include "castlink/media_controller.hpp"
#include "castlink/namespace_router.hpp"
#include "castlink/receiver_controller.hpp"
#include "castlink/request_correlator.hpp"
#include "castlink/transport_channel.hpp"

namespace castlink {

// One connection to one receiver. Owns the channel, the reader loop thread,
// the timer thread and every controller; this is what applications talk to.
//
//   auto device = CastDevice::connect("192.168.1.20", 8009);
//   device->open();
//   auto app = device->receiver().launch(app::kDefaultMediaReceiver);
//   device->media(app)->load(url, "video/mp4");
//
// close() is the only teardown path and is idempotent. Losing the
// connection (heartbeat, device close, stream fault) publishes a
// ConnectionLost event and fails every pending request with Closed.
class CastDevice {
public:
    // Opens a TLS connection. Throws boost::system::system_error when the
    // device can't be reached.
    static std::unique_ptr<CastDevice> connect(const std::string& host, std::uint16_t port = 8009,
                                               const Config& config = Config());

    explicit CastDevice(std::shared_ptr<ByteStream> stream, const Config& config = Config());
    ~CastDevice();

    CastDevice(const CastDevice&) = delete;
    CastDevice& operator=(const CastDevice&) = delete;

    // Connects the receiver virtual connection and starts the heartbeat.
    void open();

    ReceiverController& receiver() { return *receiver_; }
    ConnectionController& connection() { return *connection_; }
    DeviceAuthenticator& auth() { return *auth_; }
    HeartbeatMonitor& heartbeat() { return *heartbeat_; }
    TransportChannel& channel() { return channel_; }
    const Config& config() const { return config_; }

    // Media controller for a running application. The same controller is
    // returned while the application keeps its transport id. Throws
    // NotRunning when app has no transport id.
    std::shared_ptr<MediaController> media(const Application& app);

    EventBus::SubscriptionId subscribe(EventHandler handler);
    EventBus::SubscriptionId subscribe(Channel channel, EventHandler handler);
    EventBus::SubscriptionId on_connection_lost(std::function<void(const std::string& reason)> handler);
    void unsubscribe(EventBus::SubscriptionId id);

    void close();
    // True after close() or once the connection has been lost.
    bool closed() const { return closing_ || channel_.closed(); }

private:
    void read_loop();
    void on_media_event(const Event& event);
    void expire_media(const std::vector<std::string>& transport_ids);

    const Config config_;

    boost::asio::io_context timers_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> timers_work_;
    std::thread timers_thread_;

    TransportChannel channel_;
    EventBus bus_;
    std::shared_ptr<RequestCorrelator> correlator_;
    std::shared_ptr<HeartbeatMonitor> heartbeat_;
    NamespaceRouter router_;

    std::unique_ptr<ConnectionController> connection_;
    std::unique_ptr<DeviceAuthenticator> auth_;
    std::unique_ptr<ReceiverController> receiver_;

    std::mutex media_mutex_;
    std::map<std::string, std::shared_ptr<MediaController>> media_;

    std::thread reader_;
    std::atomic<bool> closing_{false};
};

} // namespace castlink
