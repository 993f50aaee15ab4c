// castctl: command a Cast receiver over the Cast V2 protocol. Launches and
// stops applications, loads media (optionally served from a local file) and
// controls playback and volume.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "castlink/cast_device.hpp"
#include "castlink/config.hpp"
#include "castlink/error.hpp"
#include "castlink/log.hpp"
#include "castlink/namespaces.hpp"
#include "castlink/tls_stream.hpp"

#include "media_server.hpp"

using namespace castlink;

namespace {

std::atomic<bool> shutdown_requested{false};

void on_signal(int) {
    shutdown_requested = true;
}

enum class Action {
    None,
    Info,
    Run,
    Stop,
    StopCurrent,
    Media,
    Serve,
    Volume,
    Mute,
    Unmute,
    MediaPlay,
    MediaPause,
    MediaStop,
    MediaSeek,
    MediaVolume
};

struct Options {
    std::string address;
    std::uint16_t port = 8009;
    std::string config_path;
    bool verbose = false;

    Action action = Action::None;
    std::string argument;   // app name, URL or file, depending on the action
    double number = 0.0;    // volume level or seek position

    std::string media_type;
    StreamType stream_type = StreamType::Buffered;
    std::string media_app = "default";
    unsigned short http_port = 8080;
};

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " -a <address> [-p <port>] [-c <config.json>] [-v] <action>\n"
              << "Actions:\n"
              << "  --info                     print receiver status\n"
              << "  --run <app>                launch an app (id, or default|backdrop|youtube)\n"
              << "  --stop <app>               stop a running app\n"
              << "  --stop-current             stop whatever app is running\n"
              << "  --media <url>              load a URL [--media-type T] [--media-stream-type buffered|live|none]\n"
              << "  --serve <file>             serve a local file and cast it [--http-port P]\n"
              << "  --volume <level>           set device volume, 0.0 - 1.0\n"
              << "  --mute | --unmute\n"
              << "  --media-play | --media-pause | --media-stop\n"
              << "  --media-seek <seconds>\n"
              << "  --media-volume <level>\n"
              << "  --media-app <app>          app for media actions (default: default)\n";
}

void set_action(Options& opts, Action action, const std::string& argument = std::string()) {
    if (opts.action != Action::None) throw std::invalid_argument("only one action may be given");
    opts.action = action;
    opts.argument = argument;
}

Options parse_args(int argc, char** argv) {
    Options opts;
    auto value = [&](int& i) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(std::string(argv[i]) + " needs a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-a") {
            opts.address = value(i);
        } else if (arg == "-p") {
            opts.port = static_cast<std::uint16_t>(std::stoi(value(i)));
        } else if (arg == "-c") {
            opts.config_path = value(i);
        } else if (arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--info") {
            set_action(opts, Action::Info);
        } else if (arg == "--run") {
            set_action(opts, Action::Run, value(i));
        } else if (arg == "--stop") {
            set_action(opts, Action::Stop, value(i));
        } else if (arg == "--stop-current") {
            set_action(opts, Action::StopCurrent);
        } else if (arg == "--media") {
            set_action(opts, Action::Media, value(i));
        } else if (arg == "--serve") {
            set_action(opts, Action::Serve, value(i));
        } else if (arg == "--volume") {
            set_action(opts, Action::Volume);
            opts.number = std::stod(value(i));
        } else if (arg == "--mute") {
            set_action(opts, Action::Mute);
        } else if (arg == "--unmute") {
            set_action(opts, Action::Unmute);
        } else if (arg == "--media-play") {
            set_action(opts, Action::MediaPlay);
        } else if (arg == "--media-pause") {
            set_action(opts, Action::MediaPause);
        } else if (arg == "--media-stop") {
            set_action(opts, Action::MediaStop);
        } else if (arg == "--media-seek") {
            set_action(opts, Action::MediaSeek);
            opts.number = std::stod(value(i));
        } else if (arg == "--media-volume") {
            set_action(opts, Action::MediaVolume);
            opts.number = std::stod(value(i));
        } else if (arg == "--media-type") {
            opts.media_type = value(i);
        } else if (arg == "--media-stream-type") {
            opts.stream_type = parse_stream_type(value(i));
        } else if (arg == "--media-app") {
            opts.media_app = value(i);
        } else if (arg == "--http-port") {
            opts.http_port = static_cast<unsigned short>(std::stoi(value(i)));
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }

    if (opts.address.empty()) throw std::invalid_argument("-a <address> is required");
    if (opts.action == Action::None) throw std::invalid_argument("no action given");
    return opts;
}

void print_status(const ReceiverStatus& status) {
    std::cout << "Volume: ";
    if (status.volume.level) std::cout << *status.volume.level;
    else std::cout << "?";
    if (status.volume.muted && *status.volume.muted) std::cout << " (muted)";
    std::cout << "\n";
    std::cout << "Active input: " << (status.is_active_input ? "yes" : "no")
              << ", standby: " << (status.is_stand_by ? "yes" : "no") << "\n";

    if (status.applications.empty()) {
        std::cout << "No applications running\n";
        return;
    }
    for (const auto& app : status.applications) {
        std::cout << " " << app.display_name << " [" << app.app_id << "]" << (app.is_idle ? " (idle)" : "") << "\n"
                  << "    session " << app.session_id << ", transport " << app.transport_id << "\n";
        if (!app.status_text.empty()) std::cout << "    " << app.status_text << "\n";
    }
}

void print_media(const MediaStatus& status) {
    std::cout << "Media session " << status.media_session_id << ": " << status.player_state;
    if (!status.idle_reason.empty()) std::cout << " (" << status.idle_reason << ")";
    std::cout << " at " << status.current_time << "s\n";
    if (status.media) std::cout << "    " << status.media->content_id << " [" << status.media->content_type << "]\n";
}

std::optional<Application> find_app(ReceiverController& receiver, const std::string& app_id) {
    receiver.get_status();
    for (const auto& app : receiver.applications()) {
        if (app.app_id == app_id) return app;
    }
    return std::nullopt;
}

// Media controller for the running media app, with its current media
// session adopted.
std::shared_ptr<MediaController> running_media(CastDevice& device, const Options& opts) {
    const std::string app_id = resolve_app_id(opts.media_app);
    auto app = find_app(device.receiver(), app_id);
    if (!app || app->is_idle) throw CastError(ErrorKind::NotRunning, "app " + app_id + " is not running");
    auto media = device.media(*app);
    if (!media->get_status()) throw CastError(ErrorKind::NoActiveSession, "nothing is loaded in " + app_id);
    return media;
}

MediaStatus load_media(CastDevice& device, const Options& opts, const std::string& url,
                       const std::string& content_type) {
    const std::string app_id = resolve_app_id(opts.media_app);
    Application app = device.receiver().launch(app_id);
    std::cout << "[Cast] Media URL = " << url << "\n";
    MediaStatus status = device.media(app)->load(url, content_type, opts.stream_type);
    print_media(status);
    return status;
}

void wait_for_shutdown(CastDevice& device) {
    std::cout << "[Cast] Press Ctrl+C to stop.\n";
    while (!shutdown_requested && !device.closed()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int run(const Options& opts) {
    Config config = opts.config_path.empty() ? Config() : Config::load(opts.config_path);
    if (opts.verbose) config.log_level = log::Level::Debug;
    log::set_level(config.log_level);

    log::info("Cast") << "Establishing TLS connection to " << opts.address << ":" << opts.port;
    std::shared_ptr<TlsStream> stream = TlsStream::connect(opts.address, opts.port);
    const std::string local_ip = stream->local_address();
    log::debug("Cast") << "Local IP: " << local_ip;

    CastDevice device(stream, config);
    device.on_connection_lost([](const std::string& reason) {
        log::error("Cast") << "Connection lost: " << reason;
    });

    AuthOutcome auth = device.auth().challenge(config.status_timeout);
    switch (auth.status) {
    case AuthOutcome::Status::Response:
        log::info("Cast") << "Device answered the auth challenge";
        break;
    case AuthOutcome::Status::Error:
        log::warn("Cast") << "Device auth error " << auth.error_type << ", continuing";
        break;
    case AuthOutcome::Status::Timeout:
        log::warn("Cast") << "No device auth reply, continuing";
        break;
    }

    device.open();
    ReceiverController& receiver = device.receiver();

    switch (opts.action) {
    case Action::Info:
        print_status(receiver.get_status());
        break;
    case Action::Run: {
        Application app = receiver.launch(resolve_app_id(opts.argument));
        std::cout << "Running " << app.display_name << ", session " << app.session_id << "\n";
        break;
    }
    case Action::Stop: {
        const std::string app_id = resolve_app_id(opts.argument);
        auto app = find_app(receiver, app_id);
        if (!app) throw CastError(ErrorKind::NotRunning, "app " + app_id + " is not running");
        print_status(receiver.stop(app->transport_id));
        break;
    }
    case Action::StopCurrent: {
        receiver.get_status();
        std::optional<Application> current;
        for (const auto& app : receiver.applications()) {
            if (!app.is_idle) {
                current = app;
                break;
            }
        }
        if (!current) {
            std::cout << "Nothing running\n";
            break;
        }
        print_status(receiver.stop(current->transport_id));
        break;
    }
    case Action::Media: {
        const std::string type = opts.media_type.empty() ? castctl::guess_content_type(opts.argument) : opts.media_type;
        load_media(device, opts, opts.argument, type);
        break;
    }
    case Action::Serve: {
        const std::string type = opts.media_type.empty() ? castctl::guess_content_type(opts.argument) : opts.media_type;
        const std::string path = castctl::start_media_server(opts.argument, opts.http_port, type);
        const std::string url = "http://" + local_ip + ":" + std::to_string(opts.http_port) + path;
        load_media(device, opts, url, type);
        wait_for_shutdown(device);
        break;
    }
    case Action::Volume: {
        Volume v = receiver.set_volume(opts.number);
        std::cout << "Volume: " << v.level.value_or(opts.number) << "\n";
        break;
    }
    case Action::Mute:
    case Action::Unmute: {
        Volume v = receiver.set_muted(opts.action == Action::Mute);
        std::cout << "Muted: " << (v.muted.value_or(opts.action == Action::Mute) ? "yes" : "no") << "\n";
        break;
    }
    case Action::MediaPlay:
        print_media(running_media(device, opts)->play());
        break;
    case Action::MediaPause:
        print_media(running_media(device, opts)->pause());
        break;
    case Action::MediaStop:
        print_media(running_media(device, opts)->stop());
        break;
    case Action::MediaSeek:
        print_media(running_media(device, opts)->seek(opts.number));
        break;
    case Action::MediaVolume:
        print_media(running_media(device, opts)->set_volume(opts.number));
        break;
    case Action::None:
        break;
    }

    device.close();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "castctl: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    try {
        return run(opts);
    } catch (const CastError& e) {
        log::error("Cast") << to_string(e.kind()) << ": " << e.what();
    } catch (const std::exception& e) {
        log::error("Cast") << e.what();
    }
    return 1;
}
