#include "castlink/cast_device.hpp"

#include "castlink/error.hpp"
#include "castlink/log.hpp"
#include "castlink/tls_stream.hpp"

namespace castlink {

std::unique_ptr<CastDevice> CastDevice::connect(const std::string& host, std::uint16_t port, const Config& config) {
    log::info("Cast") << "Establishing TLS connection to " << host << ":" << port;
    std::shared_ptr<ByteStream> stream = TlsStream::connect(host, port);
    log::info("Cast") << "TLS connection established";
    return std::make_unique<CastDevice>(std::move(stream), config);
}

CastDevice::CastDevice(std::shared_ptr<ByteStream> stream, const Config& config)
    : config_(config),
      timers_work_(boost::asio::make_work_guard(timers_)),
      channel_(std::move(stream), config.max_frame_size),
      bus_(config.event_queue_capacity),
      correlator_(std::make_shared<RequestCorrelator>(channel_, timers_, config.sender_id)),
      heartbeat_(std::make_shared<HeartbeatMonitor>(channel_, bus_, timers_, config)),
      router_(*correlator_, *heartbeat_, bus_),
      connection_(std::make_unique<ConnectionController>(channel_, config)),
      auth_(std::make_unique<DeviceAuthenticator>(channel_, config)),
      receiver_(std::make_unique<ReceiverController>(correlator_, config)) {
    timers_thread_ = std::thread([this] { timers_.run(); });

    // Whoever closes the channel (close(), the heartbeat, a read error) ends
    // every pending request with Closed.
    std::weak_ptr<RequestCorrelator> correlator = correlator_;
    std::weak_ptr<HeartbeatMonitor> heartbeat = heartbeat_;
    channel_.on_close([correlator, heartbeat] {
        if (auto c = correlator.lock()) c->shutdown();
        if (auto h = heartbeat.lock()) h->stop();
    });

    bus_.subscribe(Channel::Receiver, [this](const Event& e) { receiver_->observe(e.envelope); });
    bus_.subscribe(Channel::Media, [this](const Event& e) { on_media_event(e); });
    bus_.subscribe(Channel::Connection, [this](const Event& e) { connection_->observe(e.envelope); });
    bus_.subscribe(Channel::DeviceAuth, [this](const Event& e) { auth_->observe(e.envelope); });

    receiver_->on_applications_changed(
        [this](const std::vector<std::string>& stopped) { expire_media(stopped); });

    reader_ = std::thread([this] { read_loop(); });
}

CastDevice::~CastDevice() {
    close();
}

void CastDevice::open() {
    connection_->connect(config_.receiver_id);
    heartbeat_->start();
    log::info("Cast") << "Connected to " << config_.receiver_id << " as " << config_.sender_id;
}

std::shared_ptr<MediaController> CastDevice::media(const Application& app) {
    if (app.transport_id.empty()) {
        throw CastError(ErrorKind::NotRunning, "application " + app.app_id + " has no transport id");
    }
    std::lock_guard<std::mutex> lk(media_mutex_);
    auto it = media_.find(app.transport_id);
    if (it != media_.end() && !it->second->expired()) return it->second;

    auto controller = std::make_shared<MediaController>(correlator_, *connection_, config_, app.transport_id,
                                                        app.session_id);
    media_[app.transport_id] = controller;
    return controller;
}

EventBus::SubscriptionId CastDevice::subscribe(EventHandler handler) {
    return bus_.subscribe_all(std::move(handler));
}

EventBus::SubscriptionId CastDevice::subscribe(Channel channel, EventHandler handler) {
    return bus_.subscribe(channel, std::move(handler));
}

EventBus::SubscriptionId CastDevice::on_connection_lost(std::function<void(const std::string&)> handler) {
    return bus_.subscribe_all([handler = std::move(handler)](const Event& e) {
        if (e.kind == Event::Kind::ConnectionLost) handler(e.reason);
    });
}

void CastDevice::unsubscribe(EventBus::SubscriptionId id) {
    bus_.unsubscribe(id);
}

void CastDevice::close() {
    if (closing_.exchange(true)) return;
    log::info("Cast") << "Shutting down";

    heartbeat_->stop();
    channel_.close();
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
    bus_.stop();

    timers_work_.reset();
    timers_.stop();
    if (timers_thread_.joinable()) {
        if (timers_thread_.get_id() == std::this_thread::get_id()) {
            timers_thread_.detach();
        } else {
            timers_thread_.join();
        }
    }
    log::info("Cast") << "Connection closed";
}

void CastDevice::read_loop() {
    for (;;) {
        Envelope envelope;
        try {
            envelope = channel_.receive();
        } catch (const CastError& e) {
            if (closing_) {
                log::debug("Cast") << "Reader stopped: " << e.what();
                return;
            }
            // A dead heartbeat has already reported the loss.
            if (heartbeat_->state() == HeartbeatMonitor::State::Dead) return;

            const std::string reason = e.kind() == ErrorKind::Closed ? "connection closed by device" : e.what();
            log::error("Cast") << "Connection lost: " << reason;
            channel_.close();
            bus_.publish(Event::connection_lost(reason));
            return;
        }
        router_.route(envelope);
    }
}

void CastDevice::on_media_event(const Event& event) {
    std::shared_ptr<MediaController> controller;
    {
        std::lock_guard<std::mutex> lk(media_mutex_);
        auto it = media_.find(event.envelope.source_id);
        if (it != media_.end()) controller = it->second;
    }
    if (controller) {
        controller->observe(event.envelope);
    } else {
        log::debug("Media") << "Media message from " << event.envelope.source_id << " with no controller";
    }
}

void CastDevice::expire_media(const std::vector<std::string>& transport_ids) {
    std::vector<std::shared_ptr<MediaController>> expired;
    {
        std::lock_guard<std::mutex> lk(media_mutex_);
        for (const auto& id : transport_ids) {
            auto it = media_.find(id);
            if (it == media_.end()) continue;
            expired.push_back(it->second);
            media_.erase(it);
        }
    }
    for (auto& controller : expired) controller->invalidate();
}

} // namespace castlink
