#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "castlink/config.hpp"
#include "castlink/envelope.hpp"

namespace castlink {

class RequestCorrelator;

struct Volume {
    std::optional<double> level;
    std::optional<bool> muted;
};

// One running receiver application, as reported by the latest status.
struct Application {
    std::string app_id;
    std::string session_id;
    std::string transport_id;
    std::string display_name;
    std::string status_text;
    std::vector<std::string> namespaces;
    bool is_idle = false;
};

struct ReceiverStatus {
    std::vector<Application> applications;
    Volume volume;
    bool is_active_input = false;
    bool is_stand_by = false;
};

// Parses the "status" object of a RECEIVER_STATUS message. Throws
// CastError(DecodingError) when it isn't shaped like one.
ReceiverStatus parse_receiver_status(const Json::Value& status);
Volume parse_volume(const Json::Value& volume);

// Application lifecycle and device volume on the receiver namespace.
//
// Every RECEIVER_STATUS, whether a reply or a push, replaces the cached
// application list wholesale. Transport ids that disappear between two
// statuses are reported to the applications-changed listener so media
// sessions bound to them can be expired.
class ReceiverController {
public:
    using AppsChangedListener = std::function<void(const std::vector<std::string>& stopped_transport_ids)>;

    ReceiverController(std::shared_ptr<RequestCorrelator> correlator, const Config& config);

    ReceiverStatus get_status();

    // Asks the device to launch app_id and waits until a status shows it
    // running and not idle. The LAUNCH reply on its own only means the
    // request was accepted. Throws CommandRejected on LAUNCH_ERROR and
    // LaunchFailed when the deadline passes first.
    Application launch(const std::string& app_id);
    Application launch(const std::string& app_id, std::chrono::milliseconds deadline);

    // Stops the application with this transport id (or session id). Fails
    // with NotRunning, without sending anything, if the last known status
    // has no such application.
    ReceiverStatus stop(const std::string& session_transport_id);

    // level must be within [0, 1].
    Volume set_volume(double level);
    Volume set_muted(bool muted);

    std::optional<ReceiverStatus> last_status() const;
    std::vector<Application> applications() const;

    // The cached application with this app id, if it's running and not idle.
    std::optional<Application> find_running(const std::string& app_id) const;

    // Unsolicited receiver-namespace message.
    void observe(const Envelope& envelope);

    void on_applications_changed(AppsChangedListener listener);

private:
    ReceiverStatus request(Json::Value payload, std::chrono::milliseconds timeout);
    // Sends one receiver command and returns the reply body. A RECEIVER_STATUS
    // reply is applied to the cache; rejections throw CommandRejected.
    Json::Value exchange(Json::Value payload, std::chrono::milliseconds timeout);
    void apply(const ReceiverStatus& status);
    std::optional<Application> find_running_locked(const std::string& app_id) const;

    std::shared_ptr<RequestCorrelator> correlator_;
    const std::string receiver_id_;
    const std::chrono::milliseconds status_timeout_;
    const std::chrono::milliseconds command_timeout_;
    const std::chrono::milliseconds launch_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable status_changed_;
    std::optional<ReceiverStatus> status_;
    std::uint64_t generation_ = 0;
    AppsChangedListener listener_;
};

} // namespace castlink
