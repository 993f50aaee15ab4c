#include "castlink/media_controller.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "castlink/connection_controller.hpp"
#include "castlink/error.hpp"
#include "castlink/log.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/request_correlator.hpp"

namespace castlink {

namespace {

std::string string_field(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : std::string();
}

MediaStatus parse_entry(const Json::Value& entry) {
    MediaStatus out;
    if (entry["mediaSessionId"].isIntegral()) out.media_session_id = entry["mediaSessionId"].asInt64();
    out.player_state = string_field(entry, "playerState");
    out.idle_reason = string_field(entry, "idleReason");
    if (entry["currentTime"].isNumeric()) out.current_time = entry["currentTime"].asDouble();
    if (entry["playbackRate"].isNumeric()) out.playback_rate = entry["playbackRate"].asDouble();
    out.volume = parse_volume(entry["volume"]);

    const Json::Value& media = entry["media"];
    if (media.isObject()) {
        MediaInfo info;
        info.content_id = string_field(media, "contentId");
        info.content_type = string_field(media, "contentType");
        try {
            info.stream_type = parse_stream_type(string_field(media, "streamType"));
        } catch (const std::invalid_argument&) {
            info.stream_type = StreamType::None;
        }
        if (media["duration"].isNumeric()) info.duration = media["duration"].asDouble();
        out.media = info;
    }
    return out;
}

bool session_ended(const MediaStatus& status) {
    return status.player_state == "IDLE" && !status.idle_reason.empty();
}

} // namespace

const char* to_string(StreamType type) {
    switch (type) {
    case StreamType::None: return "NONE";
    case StreamType::Buffered: return "BUFFERED";
    case StreamType::Live: return "LIVE";
    }
    return "NONE";
}

StreamType parse_stream_type(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "NONE") return StreamType::None;
    if (upper == "BUFFERED") return StreamType::Buffered;
    if (upper == "LIVE") return StreamType::Live;
    throw std::invalid_argument("unknown stream type: " + name);
}

std::vector<MediaStatus> parse_media_status(const Json::Value& status) {
    if (!status.isArray()) {
        throw CastError(ErrorKind::DecodingError, "MEDIA_STATUS status is not an array");
    }
    std::vector<MediaStatus> out;
    for (const auto& entry : status) {
        if (entry.isObject()) out.push_back(parse_entry(entry));
    }
    return out;
}

MediaController::MediaController(std::shared_ptr<RequestCorrelator> correlator, ConnectionController& connection,
                                 const Config& config, std::string transport_id, std::string session_id)
    : correlator_(std::move(correlator)),
      connection_(connection),
      transport_id_(std::move(transport_id)),
      session_id_(std::move(session_id)),
      status_timeout_(config.status_timeout),
      command_timeout_(config.command_timeout) {}

MediaStatus MediaController::load(const std::string& content_id, const std::string& content_type,
                                  StreamType stream_type, bool autoplay) {
    Json::Value payload;
    payload["type"] = "LOAD";
    payload["sessionId"] = session_id_;
    payload["media"]["contentId"] = content_id;
    payload["media"]["contentType"] = content_type;
    payload["media"]["streamType"] = to_string(stream_type);
    payload["autoplay"] = autoplay;
    payload["currentTime"] = 0;

    log::info("Media") << "Loading " << content_id << " (" << content_type << ") on " << transport_id_;
    auto adopted = adopt(request(std::move(payload), command_timeout_));
    if (!adopted) {
        throw CastError(ErrorKind::CommandRejected, "LOAD reported no media session");
    }
    log::info("Media") << "Media session " << adopted->media_session_id << " is " << adopted->player_state;
    return *adopted;
}

std::optional<MediaStatus> MediaController::get_status() {
    Json::Value payload;
    payload["type"] = "GET_STATUS";
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (session_) payload["mediaSessionId"] = Json::Int64(session_->media_session_id);
    }
    return adopt(request(std::move(payload), status_timeout_));
}

MediaStatus MediaController::play() {
    Json::Value payload;
    payload["type"] = "PLAY";
    return command(std::move(payload));
}

MediaStatus MediaController::pause() {
    Json::Value payload;
    payload["type"] = "PAUSE";
    return command(std::move(payload));
}

MediaStatus MediaController::stop() {
    Json::Value payload;
    payload["type"] = "STOP";
    return command(std::move(payload));
}

MediaStatus MediaController::seek(double position) {
    if (std::isnan(position) || position < 0.0) {
        throw CastError(ErrorKind::CommandRejected, "seek position must not be negative");
    }
    Json::Value payload;
    payload["type"] = "SEEK";
    payload["currentTime"] = position;
    return command(std::move(payload));
}

MediaStatus MediaController::set_volume(double level) {
    if (std::isnan(level) || level < 0.0 || level > 1.0) {
        throw CastError(ErrorKind::CommandRejected, "volume level must be within [0, 1]");
    }
    Json::Value payload;
    payload["type"] = "SET_VOLUME";
    payload["volume"]["level"] = level;
    return command(std::move(payload));
}

MediaStatus MediaController::set_muted(bool muted) {
    Json::Value payload;
    payload["type"] = "SET_VOLUME";
    payload["volume"]["muted"] = muted;
    return command(std::move(payload));
}

std::optional<MediaSession> MediaController::session() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return session_;
}

bool MediaController::expired() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return expired_;
}

void MediaController::invalidate() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (expired_) return;
        expired_ = true;
        session_.reset();
    }
    std::size_t failed = correlator_->fail_destination(transport_id_, ErrorKind::SessionExpired,
                                                       "application on " + transport_id_ + " is gone");
    log::info("Media") << "Session on " << transport_id_ << " expired, " << failed << " request(s) failed";
}

void MediaController::observe(const Envelope& envelope) {
    auto body = parse_json(envelope);
    if (!body) {
        log::warn("Media") << body.error().what();
        return;
    }
    const std::string type = message_type(body.value());
    if (type != "MEDIA_STATUS") {
        log::debug("Media") << "Ignoring " << (type.empty() ? "untyped" : type) << " from " << envelope.source_id;
        return;
    }
    if (expired()) return;
    try {
        adopt(parse_media_status(body.value()["status"]));
    } catch (const CastError& e) {
        log::warn("Media") << e.what();
    }
}

MediaStatus MediaController::command(Json::Value payload) {
    ensure_usable();
    const std::int64_t id = require_session();
    payload["mediaSessionId"] = Json::Int64(id);

    auto adopted = adopt(request(std::move(payload), command_timeout_));
    if (adopted) return *adopted;

    MediaStatus idle;
    idle.media_session_id = id;
    idle.player_state = "IDLE";
    return idle;
}

std::vector<MediaStatus> MediaController::request(Json::Value payload, std::chrono::milliseconds timeout) {
    ensure_usable();
    connection_.connect(transport_id_);

    const std::string sent_type = payload["type"].asString();
    PendingRequest pending = correlator_->send_request(ns::kMedia, transport_id_, std::move(payload), timeout);
    // invalidate() may have run between ensure_usable() and the slot being
    // recorded; settling twice is harmless.
    if (expired()) {
        correlator_->fail_destination(transport_id_, ErrorKind::SessionExpired,
                                      "application on " + transport_id_ + " is gone");
    }
    Envelope reply = pending.get();

    Json::Value body = parse_json(reply).take();
    const std::string type = message_type(body);
    if (type == "MEDIA_STATUS") return parse_media_status(body["status"]);
    if (type == "LOAD_FAILED" || type == "LOAD_CANCELLED" || type == "INVALID_REQUEST" ||
        type == "INVALID_PLAYER_STATE") {
        std::string reason = string_field(body, "reason");
        throw CastError(ErrorKind::CommandRejected,
                        sent_type + " rejected: " + type + (reason.empty() ? "" : " (" + reason + ")"));
    }
    throw CastError(ErrorKind::DecodingError, "unexpected " + (type.empty() ? "untyped" : type) +
                                                  " reply to " + sent_type);
}

std::int64_t MediaController::require_session() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (expired_) throw CastError(ErrorKind::SessionExpired, "application on " + transport_id_ + " is gone");
    if (!session_) throw CastError(ErrorKind::NoActiveSession, "no media session on " + transport_id_);
    return session_->media_session_id;
}

void MediaController::ensure_usable() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (expired_) throw CastError(ErrorKind::SessionExpired, "application on " + transport_id_ + " is gone");
}

std::optional<MediaStatus> MediaController::adopt(const std::vector<MediaStatus>& statuses) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (statuses.empty()) {
        if (session_) log::info("Media") << "Media session " << session_->media_session_id << " ended";
        session_.reset();
        return std::nullopt;
    }

    const MediaStatus* current = &statuses.front();
    if (session_) {
        for (const auto& s : statuses) {
            if (s.media_session_id == session_->media_session_id) {
                current = &s;
                break;
            }
        }
    }

    if (session_ended(*current)) {
        log::info("Media") << "Media session " << current->media_session_id << " idle: " << current->idle_reason;
        session_.reset();
        return *current;
    }

    MediaSession next;
    next.media_session_id = current->media_session_id;
    next.transport_id = transport_id_;
    next.player_state = current->player_state;
    next.current_time = current->current_time;
    next.volume = current->volume;
    session_ = next;
    return *current;
}

} // namespace castlink
