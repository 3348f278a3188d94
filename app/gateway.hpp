#pragma once

#ifndef __GATEWAY_HPP
#define __GATEWAY_HPP

#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <fstream>
#include <filesystem>
#include <functional>

// glib unix signals
#include <glib-unix.h>
// cxxopts
#include <cxxopts.hpp>
// json
#include <nlohmann/json.hpp>
// httplib
#include <httplib.h>

// logging
#include <log.hpp>
#include <gst.hpp>
#include <ice.hpp>
#include <ws.hpp>
#include <meta.hpp>
#include <opts.hpp>
#include <utils.hpp>
#include <sysmon.hpp>
#include <control.hpp>
#include <metrics.hpp>
#include <monitor.hpp>
#include <pipeline.hpp>
#include <supervisor.hpp>

namespace app {

constexpr const char* c_build_marker = "[beta]";
inline std::string c_config_filename = "";

inline void logging() {
    applog::log::cfg().id = "rtcgw";
    applog::log::cfg().file = "rtcgw.log";
    applog::log();
}

inline void print_conf(std::string const& path) {
    if (path.empty() || !std::filesystem::exists(path))
        return;
    std::ifstream stream(path);
    if (!stream.is_open())
        return;
    try {
        std::string args_string;
        nlohmann::json const json = nlohmann::json::parse(stream);
        for (auto const& [key, value] : json.items()) {
            std::string value_str = value.dump();
            std::erase_if(value_str, [](char quote) { return quote == '"'; });
            args_string.append("--" + key + "=" + value_str + " ");
        }
        LOG_INFO_FMT( "{}: {}", path, args_string );
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR_FMT( "failed to parse JSON config from {}: {}", path, e.what() );
    }
}

inline void print_info(int argc, const char* const argv[]) {
    std::string arguments;
    LOG_INFO_FMT( "build date: {} {} {}", __DATE__, __TIME__, app::c_build_marker );
    LOG_INFO_FMT( "{} --help to print help message", argv[0] );
    for (int i = 0; i < argc; ++i)
        arguments += std::string(argv[i]) + std::string(" ");
    LOG_INFO_FMT( "{}", arguments );
}

inline void print_pars(std::string const& info, opts::parser const& pars, bool just_result = true) {
    std::string arguments;
    auto const& map{ pars.to_map(just_result) };
    for (const auto& [key, value] : map)
        arguments += std::string("--") + key + std::string("=") + value + std::string(" ");
    LOG_INFO_FMT( "{}: {}", info, arguments );
}

// blocks until the application marks itself ready
inline void wait_for_app_ready(std::string const& ready_file, std::chrono::milliseconds poll = std::chrono::milliseconds(200)) {
    if (std::filesystem::exists(ready_file))
        return;
    LOG_INFO_FMT( "waiting for streaming app ready file: {}", ready_file );
    while (!std::filesystem::exists(ready_file))
        std::this_thread::sleep_for(poll);
    LOG_INFO_FMT( "streaming app is ready" );
}

struct gateway_t {

    struct config_t {
        std::string signaling_host{ utils::env_or("SIGNALING_HOST", std::string("127.0.0.1")) };
        int port{ utils::env_or("LISTEN_PORT", 8080) };
        bool enable_https{ utils::env_or("ENABLE_HTTPS_WEB", false) };
        std::string rtc_config_json{ utils::env_or("RTC_CONFIG_JSON", std::string("/tmp/rtc.json")) };
        std::string coturn_web_uri{ utils::env_or("COTURN_WEB_URI", std::string()) };
        std::string coturn_web_username{ utils::env_or("COTURN_WEB_USERNAME", "rtcgw-" + utils::hostname()) };
        std::string coturn_auth_header_name{ utils::env_or("COTURN_AUTH_HEADER_NAME", std::string("x-auth-user")) };
        std::string turn_host{ utils::env_or("TURN_HOST", std::string()) };
        int turn_port{ utils::env_or("TURN_PORT", 0) };
        std::string turn_protocol{ utils::env_or("TURN_PROTOCOL", std::string("udp")) };
        bool turn_tls{ utils::env_or("TURN_TLS", false) };
        std::string turn_shared_secret{ utils::env_or("TURN_SHARED_SECRET", std::string()) };
        std::string turn_username{ utils::env_or("TURN_USERNAME", std::string()) };
        std::string turn_password{ utils::env_or("TURN_PASSWORD", std::string()) };
        int rtc_period{ utils::env_or("RTC_PERIOD", 60) };
        int turn_ttl{ utils::env_or("TURN_TTL", 86400) };
        int rtc_http_port{ utils::env_or("RTC_HTTP_PORT", 0) };
        bool app_auto_init{ utils::env_or("APP_AUTO_INIT", true) };
        std::string app_ready_file{ utils::env_or("APP_READY_FILE", std::string("/var/run/appconfig/appready")) };
        std::string encoder{ utils::env_or("WEBRTC_ENCODER", std::string("x264enc")) };
        int framerate{ utils::env_or("WEBRTC_FRAMERATE", 30) };
        int video_bitrate{ utils::env_or("WEBRTC_VIDEO_BITRATE", 2000) };
        int audio_bitrate{ utils::env_or("WEBRTC_AUDIO_BITRATE", 64000) };
        int audio_channels{ utils::env_or("WEBRTC_AUDIO_CHANNELS", 2) };
        std::string video_source{ utils::env_or("WEBRTC_VIDEO_SOURCE", std::string("ximagesrc show-pointer=0 use-damage=0")) };
        std::string audio_source{ utils::env_or("WEBRTC_AUDIO_SOURCE", std::string("pulsesrc")) };
        bool enable_resize{ utils::env_or("WEBRTC_ENABLE_RESIZE", false) };
        int sysmon_period{ utils::env_or("SYSMON_PERIOD", 1) };
        bool debug{ false };

        std::string signaling_url() const {
            return fmt::format("{}://{}:{}/ws", enable_https ? "wss" : "ws", signaling_host, port);
        }

        ice::source_params_t source_params() const {
            ice::source_params_t params;
            params.rtc_config_json = rtc_config_json;
            params.turn_host = turn_host;
            params.turn_port = turn_port;
            params.turn_protocol = turn_protocol;
            params.turn_tls = turn_tls;
            params.turn_shared_secret = turn_shared_secret;
            params.turn_username = turn_username;
            params.turn_password = turn_password;
            params.coturn_web_uri = coturn_web_uri;
            params.coturn_web_username = coturn_web_username;
            params.coturn_auth_header_name = coturn_auth_header_name;
            params.period = std::chrono::seconds(rtc_period > 0 ? rtc_period : 60);
            params.ttl = std::chrono::seconds(turn_ttl > 0 ? turn_ttl : ice::default_lifetime);
            return params;
        }

        media::webrtc_config_t webrtc_config() const {
            media::webrtc_config_t cfg;
            cfg.video_source = video_source;
            cfg.audio_source = audio_source;
            cfg.encoder = encoder;
            cfg.framerate = framerate;
            cfg.video_bitrate = video_bitrate;
            cfg.audio_bitrate = audio_bitrate;
            cfg.audio_channels = audio_channels;
            cfg.enable_resize = enable_resize;
            return cfg;
        }

        inline static const std::vector<std::string> descriptions {
            "signaling server host",
            "signaling server port",
            "use wss:// for the signaling server",
            "rtc config JSON file, watched for changes when it exists",
            "coturn-web REST service URI returning rtc config JSON",
            "user name sent to the coturn-web service and used for HMAC credentials",
            "header carrying the user name for coturn-web",
            "TURN server host",
            "TURN server port",
            "TURN transport protocol ('udp' or 'tcp')",
            "TURN over TLS (turns:)",
            "TURN shared secret for HMAC credentials",
            "legacy TURN user name",
            "legacy TURN password",
            "credential refresh period (in seconds)",
            "lifetime of HMAC credentials (in seconds)",
            "port serving the current rtc config on /turn ('0' = disabled)",
            "start without waiting for the app ready file",
            "file created by the streaming app when it is ready",
            "video encoder element (f.e. 'x264enc', 'nvh264enc', 'vp8enc', ...)",
            "video framerate (in frames per second)",
            "video bitrate (in kbit/sec)",
            "audio bitrate (in bit/sec)",
            "audio channels",
            "video source with properties",
            "audio source with properties",
            "resize the display to the viewer resolution (needs a display resize hook)",
            "system stats period (in seconds)",
            "debug logging"
        };
    };

    explicit gateway_t(config_t config): config(std::move(config)) {
        metrics::declare_defaults(gauges);
    }

    ~gateway_t() {
        server_stop();
    }

    // runs until SIGINT/SIGTERM, returns the process exit code
    int run() {
        if (!config.app_auto_init)
            wait_for_app_ready(config.app_ready_file);
        if (!gst::initializer::get().is_loaded())
            return 1;

        ice::credential_supervisor credentials(config.source_params(), [this](std::function<void()> task) { loop.post(std::move(task)); });
        ice::rtc_config_t initial;
        try {
            initial = credentials.resolve();
        } catch (const ice::config_format_error& e) {
            LOG_CRITICAL_FMT( "invalid credential configuration: {}", e.what() );
            return 1;
        } catch (const std::exception& e) {
            LOG_CRITICAL_FMT( "failed to resolve credentials: {}", e.what() );
            return 1;
        }

        peers_t const peers{};
        std::string const url{ config.signaling_url() };
        bool const resize{ resize_enabled(display, config.enable_resize) };
        auto webrtc{ config.webrtc_config() };
        webrtc.enable_resize = resize;
        auto video = std::make_shared<media::webrtc_pipeline>("video", webrtc, loop);
        auto audio = std::make_shared<media::webrtc_pipeline>("audio", webrtc, loop);
        auto video_link = std::make_shared<sig::ws_transport>(url, peers.video_local, loop);
        auto audio_link = std::make_shared<sig::ws_transport>(url, peers.audio_local, loop);

        supervisor_t supervisor(loop, peers, video, audio, video_link, audio_link);
        supervisor.enable_resize = resize;
        supervisor.display = display;
        supervisor.on_rtc_config = [this](ice::rtc_config_t const& rtc) { publish(rtc); };
        supervisor.apply_credentials(initial);
        credentials.on_rtc_config = [&supervisor](ice::rtc_config_t const& rtc) { supervisor.apply_credentials(rtc); };

        input_control_t control(video, audio);
        wire_control(control);
        video->on_data_message = [&control](std::string const& text) { control.handle(text); };

        sysmon::system_monitor sysmon(std::chrono::seconds(config.sysmon_period > 0 ? config.sysmon_period : 1));
        sysmon.on_stats = [this, video](sysmon::stats_t const& stats) {
            gauges.set(metrics::cpu_percent, stats.cpu_percent);
            gauges.set(metrics::mem_used, static_cast<double>(stats.mem_used));
            loop.post([video, stats]() {
                if (!video->is_running())
                    return;
                video->send_system_stats(stats.cpu_percent, stats.mem_total, stats.mem_used);
                video->send_ping(now_seconds());
            });
        };

        guint const sigint{ g_unix_signal_add(SIGINT, &gateway_t::on_signal, &supervisor) };
        guint const sigterm{ g_unix_signal_add(SIGTERM, &gateway_t::on_signal, &supervisor) };

        if (config.rtc_http_port > 0 && !server_start(config.rtc_http_port))
            LOG_ERROR_FMT( "rtc config publication disabled" );

        credentials.start();
        sysmon.start();
        LOG_INFO_FMT( "signaling server: {}", url );

        int code{ 0 };
        try {
            supervisor.run();
        } catch (const std::exception& e) {
            LOG_CRITICAL_FMT( "gateway failed: {}", e.what() );
            code = 1;
        }

        supervisor.shutdown([&sysmon, &credentials]() {
            sysmon.stop();
            credentials.stop();
        });
        video->on_data_message = nullptr;
        g_source_remove(sigint);
        g_source_remove(sigterm);
        server_stop();
        LOG_INFO_FMT( "gateway finished" );
        return code;
    }

    // descriptor served on GET /turn
    void publish(ice::rtc_config_t const& rtc) {
        auto doc = nlohmann::json::parse(rtc.json, nullptr, false);
        if (doc.is_discarded()) {
            LOG_ERROR_FMT( "not publishing malformed rtc config" );
            return;
        }
        std::lock_guard<std::mutex> lock(published_mutex);
        published = std::move(doc);
    }

    // viewer setting changes reach the pipelines and the JSON arguments file,
    // viewer reports reach the gauges
    void wire_control(input_control_t& control) {
        control.now = &gateway_t::now_seconds;
        control.on_setting = [this](std::string const& key, int value) {
            if (settings_file.empty()) {
                LOG_DEBUG_FMT( "no config file, {}={} not saved", key, value );
                return;
            }
            if (!opts::set_json_value(settings_file, key, value))
                LOG_ERROR_FMT( "failed to save {}={} to {}", key, value, settings_file );
        };
        control.on_client_fps = [this](double fps) { gauges.set(metrics::client_fps, fps); };
        control.on_client_latency = [this](double ms) { gauges.set(metrics::client_latency, ms); };
    }

    nlohmann::json get_published() const {
        std::lock_guard<std::mutex> lock(published_mutex);
        return published;
    }

    bool server_start(int port) {
        server.Get("/turn", [this](const httplib::Request&, httplib::Response& res) {
            LOG_DEBUG_FMT( "received /turn request" );
            res.set_content(get_published().dump(), "application/json");
        });
        server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("OK", "text/plain");
        });
        server.Get("/config", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(on_help ? on_help().dump(4) : "[]", "application/json");
        });
        server.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(gauges.render(), "text/plain; version=0.0.4");
        });
        thread = std::thread(
            [this, port]() {
                LOG_INFO_FMT( "HTTP server started on port {}", port );
                server.listen("0.0.0.0", port);
            }
        );
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!server.is_running()) {
            LOG_ERROR_FMT( "failed to start HTTP server on port {}", port );
            server_stop();
            return false;
        }
        return true;
    }

    void server_stop() {
        if (server.is_running())
            server.stop();
        if (thread.joinable()) {
            thread.join();
            LOG_INFO_FMT( "HTTP server stopped" );
        }
    }

    config_t config;
    std::function<nlohmann::json()> on_help{ nullptr };
    // JSON arguments file receiving viewer setting changes ("" = not saved)
    std::string settings_file;
    // display mutation of the host, resize stays off without a resize hook
    display_hooks_t display;
    metrics::gauges_t gauges;

private:
    static gboolean on_signal(gpointer user_data) {
        LOG_INFO_FMT( "signal received, stopping" );
        static_cast<supervisor_t*>(user_data)->stop();
        return G_SOURCE_CONTINUE;
    }

    static double now_seconds() {
        using namespace std::chrono;
        return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
    }

    gst::loop_t loop;
    httplib::Server server;
    std::thread thread;
    mutable std::mutex published_mutex;
    nlohmann::json published = nlohmann::json::object();
};

} // end of namespace app

namespace meta {

template<> inline auto register_members<app::gateway_t::config_t>() {
    using config_t = app::gateway_t::config_t;
    return make_members(
        make_member("signaling_host", 0, &config_t::signaling_host),
        make_member("port", 1, &config_t::port),
        make_member("enable_https", 2, &config_t::enable_https),
        make_member("rtc_config_json", 3, &config_t::rtc_config_json),
        make_member("coturn_web_uri", 4, &config_t::coturn_web_uri),
        make_member("coturn_web_username", 5, &config_t::coturn_web_username),
        make_member("coturn_auth_header_name", 6, &config_t::coturn_auth_header_name),
        make_member("turn_host", 7, &config_t::turn_host),
        make_member("turn_port", 8, &config_t::turn_port),
        make_member("turn_protocol", 9, &config_t::turn_protocol),
        make_member("turn_tls", 10, &config_t::turn_tls),
        make_member("turn_shared_secret", 11, &config_t::turn_shared_secret),
        make_member("turn_username", 12, &config_t::turn_username),
        make_member("turn_password", 13, &config_t::turn_password),
        make_member("rtc_period", 14, &config_t::rtc_period),
        make_member("turn_ttl", 15, &config_t::turn_ttl),
        make_member("rtc_http_port", 16, &config_t::rtc_http_port),
        make_member("app_auto_init", 17, &config_t::app_auto_init),
        make_member("app_ready_file", 18, &config_t::app_ready_file),
        make_member("encoder", 19, &config_t::encoder),
        make_member("framerate", 20, &config_t::framerate),
        make_member("video_bitrate", 21, &config_t::video_bitrate),
        make_member("audio_bitrate", 22, &config_t::audio_bitrate),
        make_member("audio_channels", 23, &config_t::audio_channels),
        make_member("video_source", 24, &config_t::video_source),
        make_member("audio_source", 25, &config_t::audio_source),
        make_member("enable_resize", 26, &config_t::enable_resize),
        make_member("sysmon_period", 27, &config_t::sysmon_period),
        make_member("debug", 28, &config_t::debug)
    );
}

template <typename T, typename = std::enable_if_t<meta::is_registered<T>()>>
inline void add_options(T& obj, opts::parser& parser, std::vector<std::string> const& descr) {
    meta::do_for_all_members<T>(
        [&obj, &parser, &descr](auto& member) {
            auto& ref{ member.get_ref(obj) };
            auto const id{ member.get_id() };
            if (id >= 0 && id < static_cast<int>(descr.size()))
                parser.add_option(member.get_name(), descr[id], ref);
        }
    );
}

template <typename T, typename = std::enable_if_t<meta::is_registered<T>()>>
void do_parse(T& obj, cxxopts::ParseResult const& parsed, bool default_value = true) {
    meta::do_for_all_members<T>(
        [&obj, &parsed, &default_value](auto& member) {
            auto& ref{ member.get_ref(obj) };
            auto const& name{ member.get_name() };
            auto parse_option = meta::overload {
                [&name, &parsed](int& val) { val = parsed[name].template as<int>(); },
                [&name, &parsed](bool& val) { val = parsed[name].template as<bool>(); },
                [&name, &parsed](double& val) { val = parsed[name].template as<double>(); },
                [&name, &parsed](std::string& val) { val = parsed[name].template as<std::string>(); },
            };
            try {
                if (default_value || parsed.count(name))
                    parse_option(ref);
            } catch (const cxxopts::exceptions::exception& e) {
                LOG_ERROR_FMT( "error parsing option '{}': {}", name, e.what() );
            }
        }
    );
}

template <typename T, typename = std::enable_if_t<meta::is_registered<T>()>>
nlohmann::json make_help(T const& obj, cxxopts::Options const& opts) {
    nlohmann::json out = nlohmann::json::array();
    meta::do_for_all_members<T>(
        [&obj, &opts, &out](auto& member) {
            using MemberT = meta::get_member_type<decltype(member)>;
            auto const& ref = member.get(obj);
            auto const& name = member.get_name();
            auto const detail = opts::get_option_detail(opts, name);
            if (!detail)
                return;
            nlohmann::json j;
            j["key"] = !detail->l.empty() ? detail->l[0] : detail->s;
            j["type"] = detail->is_boolean ? "bool" : (std::is_arithmetic_v<MemberT> ? "number" : "string");
            j["description"] = detail->desc;
            // secrets stay out of the published table
            bool const secret{ std::string_view(name).find("secret") != std::string_view::npos || std::string_view(name).find("password") != std::string_view::npos };
            j["default"] = secret ? "***" : (detail->has_default ? detail->default_value : "");
            if (secret)
                j["value"] = "***";
            else
                j["value"] = ref;
            out.push_back(j);
        }
    );
    return out;
}

} // end of namespace meta

#endif // #ifndef __GATEWAY_HPP
