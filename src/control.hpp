#pragma once

#ifndef __CONTROL_HPP
#define __CONTROL_HPP

#include <memory>
#include <string>
#include <functional>

// json
#include <nlohmann/json.hpp>

#include <log.hpp>
#include <pipeline.hpp>

namespace app {

// viewer requests arriving on the "input" data channel as {"type": ..., "data": {...}}
class input_control_t {
public:
    using setting_handler_t = std::function<void(std::string const& key, int value)>;
    using value_handler_t = std::function<void(double)>;

    input_control_t(std::shared_ptr<media::pipeline> video, std::shared_ptr<media::pipeline> audio)
        : video(std::move(video)), audio(std::move(audio)) {}

    // returns false for messages that are not understood
    bool handle(std::string const& text) {
        auto const msg = nlohmann::json::parse(text, nullptr, false);
        if (msg.is_discarded() || !msg.is_object() || !msg.contains("type") || !msg["type"].is_string()) {
            LOG_WARNING_FMT( "[input] invalid message: {}", text );
            return false;
        }
        std::string const type{ msg["type"].get<std::string>() };
        nlohmann::json const data = msg.value("data", nlohmann::json::object());

        if (type == "pong")
            return on_pong(data);
        if (type == "video_bitrate")
            return apply(type, data, [this](int kbps) { video->set_video_bitrate(kbps); });
        if (type == "audio_bitrate")
            return apply(type, data, [this](int bps) { audio->set_audio_bitrate(bps); });
        if (type == "framerate")
            return apply(type, data, [this](int fps) { video->set_framerate(fps); });
        if (type == "client_fps")
            return report(type, data, on_client_fps);
        if (type == "client_latency")
            return report(type, data, on_client_latency);

        LOG_DEBUG_FMT( "[input] unhandled message type: {}", type );
        return false;
    }

    // accepted setting changes, keyed by option name
    setting_handler_t on_setting{ nullptr };
    value_handler_t on_client_fps{ nullptr };
    value_handler_t on_client_latency{ nullptr };

    // wall clock in seconds, matches the ping timestamps
    std::function<double()> now{ nullptr };

private:
    static bool number_of(nlohmann::json const& data, double& value) {
        if (!data.is_object() || !data.contains("value") || !data["value"].is_number())
            return false;
        value = data["value"].get<double>();
        return true;
    }

    bool apply(std::string const& key, nlohmann::json const& data, std::function<void(int)> const& setter) {
        double value{ 0 };
        if (!number_of(data, value) || value < 1) {
            LOG_WARNING_FMT( "[input] invalid {} request: {}", key, data.dump() );
            return false;
        }
        int const n{ static_cast<int>(value) };
        LOG_INFO_FMT( "[input] {} set to {}", key, n );
        setter(n);
        if (on_setting)
            on_setting(key, n);
        return true;
    }

    static bool report(std::string const& key, nlohmann::json const& data, value_handler_t const& handler) {
        double value{ 0 };
        if (!number_of(data, value)) {
            LOG_WARNING_FMT( "[input] invalid {} report: {}", key, data.dump() );
            return false;
        }
        if (handler)
            handler(value);
        return true;
    }

    bool on_pong(nlohmann::json const& data) {
        if (!data.is_object() || !data.contains("start_time") || !data["start_time"].is_number() || !now)
            return false;
        double const latency_ms{ (now() - data["start_time"].get<double>()) * 1000.0 };
        video->send_latency(latency_ms);
        return true;
    }

    std::shared_ptr<media::pipeline> video;
    std::shared_ptr<media::pipeline> audio;
};

} // namespace app

#endif // #ifndef __CONTROL_HPP
