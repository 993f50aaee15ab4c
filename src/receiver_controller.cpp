#include "castlink/receiver_controller.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "castlink/error.hpp"
#include "castlink/log.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/request_correlator.hpp"

namespace castlink {

namespace {

// How long launch() waits for a status push before asking for one.
constexpr std::chrono::milliseconds kLaunchPollInterval{1000};

std::string string_field(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : std::string();
}

bool bool_field(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isBool() && v.asBool();
}

Application parse_application(const Json::Value& entry) {
    Application app;
    app.app_id = string_field(entry, "appId");
    app.session_id = string_field(entry, "sessionId");
    app.transport_id = string_field(entry, "transportId");
    app.display_name = string_field(entry, "displayName");
    app.status_text = string_field(entry, "statusText");
    app.is_idle = bool_field(entry, "isIdleScreen");

    const Json::Value& namespaces = entry["namespaces"];
    if (namespaces.isArray()) {
        for (const auto& n : namespaces) {
            if (n.isObject() && n["name"].isString()) app.namespaces.push_back(n["name"].asString());
        }
    }
    return app;
}

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point until) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

} // namespace

Volume parse_volume(const Json::Value& volume) {
    Volume out;
    if (!volume.isObject()) return out;
    if (volume["level"].isNumeric()) out.level = volume["level"].asDouble();
    if (volume["muted"].isBool()) out.muted = volume["muted"].asBool();
    return out;
}

ReceiverStatus parse_receiver_status(const Json::Value& status) {
    if (!status.isObject()) {
        throw CastError(ErrorKind::DecodingError, "RECEIVER_STATUS without a status object");
    }

    ReceiverStatus out;
    const Json::Value& apps = status["applications"];
    if (apps.isArray()) {
        for (const auto& entry : apps) {
            if (!entry.isObject()) continue;
            out.applications.push_back(parse_application(entry));
        }
    } else if (!apps.isNull()) {
        throw CastError(ErrorKind::DecodingError, "RECEIVER_STATUS applications is not an array");
    }
    out.volume = parse_volume(status["volume"]);
    out.is_active_input = bool_field(status, "isActiveInput");
    out.is_stand_by = bool_field(status, "isStandBy");
    return out;
}

ReceiverController::ReceiverController(std::shared_ptr<RequestCorrelator> correlator, const Config& config)
    : correlator_(std::move(correlator)),
      receiver_id_(config.receiver_id),
      status_timeout_(config.status_timeout),
      command_timeout_(config.command_timeout),
      launch_timeout_(config.launch_timeout) {}

ReceiverStatus ReceiverController::get_status() {
    Json::Value payload;
    payload["type"] = "GET_STATUS";
    return request(std::move(payload), status_timeout_);
}

Application ReceiverController::launch(const std::string& app_id) {
    return launch(app_id, launch_timeout_);
}

Application ReceiverController::launch(const std::string& app_id, std::chrono::milliseconds deadline) {
    const auto until = std::chrono::steady_clock::now() + deadline;

    Json::Value payload;
    payload["type"] = "LAUNCH";
    payload["appId"] = app_id;
    log::info("Receiver") << "Launching app " << app_id;

    // Only statuses that arrive after this point can confirm the launch.
    std::uint64_t launched_at;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        launched_at = generation_;
    }

    try {
        // Any reply other than a rejection is the acknowledgment; devices
        // answer with RECEIVER_STATUS or a bare LAUNCH_STATUS.
        Json::Value ack = exchange(std::move(payload), std::min(command_timeout_, deadline));
        const std::string type = message_type(ack);
        if (type != "RECEIVER_STATUS") {
            log::debug("Receiver") << "LAUNCH of " << app_id << " acknowledged with "
                                   << (type.empty() ? "untyped reply" : type);
        }
    } catch (const CastError& e) {
        // A lost acknowledgment doesn't mean the launch failed; keep watching
        // the status until the deadline.
        if (e.kind() != ErrorKind::Timeout) throw;
        log::warn("Receiver") << "No reply to LAUNCH of " << app_id << ", waiting for status";
    }

    for (;;) {
        std::uint64_t seen;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            if (generation_ != launched_at) {
                if (auto app = find_running_locked(app_id)) {
                    log::info("Receiver") << "App " << app_id << " running, transport " << app->transport_id;
                    return *app;
                }
            }
            auto left = remaining_until(until);
            if (left.count() == 0) break;

            seen = generation_;
            status_changed_.wait_for(lk, std::min(kLaunchPollInterval, left),
                                     [this, seen] { return generation_ != seen; });
            if (generation_ != seen) continue;
        }

        auto left = remaining_until(until);
        if (left.count() == 0) continue;
        try {
            Json::Value poll;
            poll["type"] = "GET_STATUS";
            request(std::move(poll), std::min(status_timeout_, left));
        } catch (const CastError& e) {
            if (e.kind() != ErrorKind::Timeout) throw;
        }
    }

    throw CastError(ErrorKind::LaunchFailed,
                    "app " + app_id + " not running after " + std::to_string(deadline.count()) + "ms");
}

ReceiverStatus ReceiverController::stop(const std::string& session_transport_id) {
    std::optional<Application> target;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (status_) {
            for (const auto& app : status_->applications) {
                if (app.transport_id == session_transport_id || app.session_id == session_transport_id) {
                    target = app;
                    break;
                }
            }
        }
    }
    if (!target) {
        throw CastError(ErrorKind::NotRunning, "no running application with id " + session_transport_id);
    }

    Json::Value payload;
    payload["type"] = "STOP";
    payload["sessionId"] = target->session_id;
    log::info("Receiver") << "Stopping " << target->app_id << " (session " << target->session_id << ")";
    return request(std::move(payload), command_timeout_);
}

Volume ReceiverController::set_volume(double level) {
    if (std::isnan(level) || level < 0.0 || level > 1.0) {
        throw CastError(ErrorKind::CommandRejected, "volume level must be within [0, 1]");
    }
    Json::Value payload;
    payload["type"] = "SET_VOLUME";
    payload["volume"]["level"] = level;
    return request(std::move(payload), command_timeout_).volume;
}

Volume ReceiverController::set_muted(bool muted) {
    Json::Value payload;
    payload["type"] = "SET_VOLUME";
    payload["volume"]["muted"] = muted;
    return request(std::move(payload), command_timeout_).volume;
}

std::optional<ReceiverStatus> ReceiverController::last_status() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return status_;
}

std::vector<Application> ReceiverController::applications() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!status_) return {};
    return status_->applications;
}

std::optional<Application> ReceiverController::find_running(const std::string& app_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return find_running_locked(app_id);
}

std::optional<Application> ReceiverController::find_running_locked(const std::string& app_id) const {
    if (!status_) return std::nullopt;
    for (const auto& app : status_->applications) {
        if (app.app_id == app_id && !app.is_idle) return app;
    }
    return std::nullopt;
}

void ReceiverController::observe(const Envelope& envelope) {
    auto body = parse_json(envelope);
    if (!body) {
        log::warn("Receiver") << body.error().what();
        return;
    }
    const std::string type = message_type(body.value());
    if (type == "RECEIVER_STATUS") {
        try {
            apply(parse_receiver_status(body.value()["status"]));
        } catch (const CastError& e) {
            log::warn("Receiver") << e.what();
        }
    } else if (type == "LAUNCH_ERROR") {
        log::warn("Receiver") << "Launch error: " << string_field(body.value(), "reason");
    } else {
        log::debug("Receiver") << "Ignoring " << (type.empty() ? "untyped" : type) << " message";
    }
}

void ReceiverController::on_applications_changed(AppsChangedListener listener) {
    std::lock_guard<std::mutex> lk(mutex_);
    listener_ = std::move(listener);
}

ReceiverStatus ReceiverController::request(Json::Value payload, std::chrono::milliseconds timeout) {
    const std::string sent_type = payload["type"].asString();
    Json::Value body = exchange(std::move(payload), timeout);
    const std::string type = message_type(body);
    if (type == "RECEIVER_STATUS") return parse_receiver_status(body["status"]);
    throw CastError(ErrorKind::DecodingError, "unexpected " + (type.empty() ? "untyped" : type) +
                                                  " reply to " + sent_type);
}

Json::Value ReceiverController::exchange(Json::Value payload, std::chrono::milliseconds timeout) {
    const std::string sent_type = payload["type"].asString();
    PendingRequest pending = correlator_->send_request(ns::kReceiver, receiver_id_, std::move(payload), timeout);
    Envelope reply = pending.get();

    Json::Value body = parse_json(reply).take();
    const std::string type = message_type(body);
    if (type == "RECEIVER_STATUS") {
        apply(parse_receiver_status(body["status"]));
    } else if (type == "LAUNCH_ERROR" || type == "INVALID_REQUEST") {
        std::string reason = string_field(body, "reason");
        throw CastError(ErrorKind::CommandRejected,
                        sent_type + " rejected: " + type + (reason.empty() ? "" : " (" + reason + ")"));
    }
    return body;
}

void ReceiverController::apply(const ReceiverStatus& status) {
    std::vector<std::string> vanished;
    AppsChangedListener listener;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        std::set<std::string> current;
        for (const auto& app : status.applications) current.insert(app.transport_id);
        if (status_) {
            for (const auto& app : status_->applications) {
                if (!app.transport_id.empty() && !current.count(app.transport_id)) {
                    vanished.push_back(app.transport_id);
                }
            }
        }
        status_ = status;
        ++generation_;
        listener = listener_;
    }
    status_changed_.notify_all();

    for (const auto& id : vanished) log::info("Receiver") << "Transport " << id << " went away";
    if (listener && !vanished.empty()) listener(vanished);
}

} // namespace castlink
