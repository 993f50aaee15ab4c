#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "castlink/config.hpp"
#include "castlink/envelope.hpp"
#include "castlink/receiver_controller.hpp"

namespace castlink {

class ConnectionController;
class RequestCorrelator;

enum class StreamType { None, Buffered, Live };

const char* to_string(StreamType type);
// "NONE", "BUFFERED", "LIVE", case-insensitive; throws std::invalid_argument.
StreamType parse_stream_type(const std::string& name);

struct MediaInfo {
    std::string content_id;
    std::string content_type;
    StreamType stream_type = StreamType::Buffered;
    std::optional<double> duration;
};

// One entry of a MEDIA_STATUS status array.
struct MediaStatus {
    std::int64_t media_session_id = 0;
    std::string player_state;   // IDLE, BUFFERING, PLAYING, PAUSED
    std::string idle_reason;    // set only when player_state is IDLE
    double current_time = 0.0;
    double playback_rate = 1.0;
    Volume volume;
    std::optional<MediaInfo> media;
};

std::vector<MediaStatus> parse_media_status(const Json::Value& status);

// The media session currently loaded in an application.
struct MediaSession {
    std::int64_t media_session_id = 0;
    std::string transport_id;
    std::string player_state;
    double current_time = 0.0;
    Volume volume;
};

// Media playback inside one running application, addressed by its transport
// id. Opens the virtual connection to the application on first use.
//
// Playback commands need a media session, learnt from a LOAD or GET_STATUS
// reply (or a MEDIA_STATUS push); without one they fail with
// NoActiveSession. Once the application goes away invalidate() is called
// and everything, including commands already in flight, fails with
// SessionExpired.
class MediaController {
public:
    MediaController(std::shared_ptr<RequestCorrelator> correlator, ConnectionController& connection,
                    const Config& config, std::string transport_id, std::string session_id);

    MediaStatus load(const std::string& content_id, const std::string& content_type,
                     StreamType stream_type = StreamType::Buffered, bool autoplay = true);

    // Adopts the first reported media session, if any.
    std::optional<MediaStatus> get_status();

    MediaStatus play();
    MediaStatus pause();
    MediaStatus stop();
    // position in seconds, >= 0.
    MediaStatus seek(double position);
    MediaStatus set_volume(double level);
    MediaStatus set_muted(bool muted);

    std::optional<MediaSession> session() const;
    const std::string& transport_id() const { return transport_id_; }
    const std::string& app_session_id() const { return session_id_; }
    bool expired() const;

    void invalidate();

    // MEDIA_STATUS pushed by the application.
    void observe(const Envelope& envelope);

private:
    MediaStatus command(Json::Value payload);
    std::vector<MediaStatus> request(Json::Value payload, std::chrono::milliseconds timeout);
    std::int64_t require_session() const;
    void ensure_usable() const;
    // Takes the entry for our session (or the first one) as current and
    // returns it; an empty array ends the session.
    std::optional<MediaStatus> adopt(const std::vector<MediaStatus>& statuses);

    std::shared_ptr<RequestCorrelator> correlator_;
    ConnectionController& connection_;
    const std::string transport_id_;
    const std::string session_id_;
    const std::chrono::milliseconds status_timeout_;
    const std::chrono::milliseconds command_timeout_;

    mutable std::mutex mutex_;
    std::optional<MediaSession> session_;
    bool expired_ = false;
};

} // namespace castlink
