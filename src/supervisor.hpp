#pragma once

#ifndef __SUPERVISOR_HPP
#define __SUPERVISOR_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <optional>
#include <functional>

#include <log.hpp>
#include <gst.hpp>
#include <ice.hpp>
#include <utils.hpp>
#include <pipeline.hpp>
#include <signaling.hpp>

namespace app {

// fixed peer ids of the two signaling sessions
struct peers_t {
    int video_local{ 0 };
    int video_remote{ 1 };
    int audio_local{ 2 };
    int audio_remote{ 3 };
};

// display mutation is left to the host, each hook reports success
struct display_hooks_t {
    std::function<bool(utils::size_r const&)> resize;
    std::function<bool(int)> set_dpi;
    std::function<bool(int)> set_cursor_size;
};

// resize is only honoured with a resize hook installed
inline bool resize_enabled(display_hooks_t const& hooks, bool requested) {
    if (requested && !hooks.resize) {
        LOG_WARNING_FMT( "display resize requested without a resize hook, disabled" );
        return false;
    }
    return requested;
}

inline constexpr double min_scale{ 0.75 };
inline constexpr double max_scale{ 2.5 };
inline constexpr int base_dpi{ 96 };
inline constexpr int base_cursor_size{ 16 };

// drives the negotiation cycle: connect both channels, run the loop until the
// video session ends, stop both pipelines, repeat

class supervisor_t {
public:
    enum class state_t { idle, negotiating, active, restarting };

    supervisor_t(gst::loop_t& loop, peers_t peers,
                 std::shared_ptr<media::pipeline> video, std::shared_ptr<media::pipeline> audio,
                 std::shared_ptr<sig::transport> video_link, std::shared_ptr<sig::transport> audio_link)
        : loop(loop), peers(peers), video(std::move(video)), audio(std::move(audio)),
          video_channel("video", peers.video_local, peers.video_remote, std::move(video_link), loop, this->video),
          audio_channel("audio", peers.audio_local, peers.audio_remote, std::move(audio_link), loop, this->audio) {
        video_channel.on_session = [this](int peer, sig::meta_opt const& meta) { on_session(peer, meta); };
        audio_channel.on_session = [this](int peer, sig::meta_opt const& meta) { on_session(peer, meta); };
        video_channel.stop_pipeline = [this]() { stop_video(); };
        audio_channel.stop_pipeline = [this]() { stop_audio(); };
        video_channel.on_closed = [this]() {
            if (!in_cycle())
                return;
            LOG_INFO_FMT( "[video] session closed, restarting" );
            loop.quit();
        };
        audio_channel.on_closed = [this]() {
            if (!in_cycle())
                return;
            LOG_INFO_FMT( "[audio] session closed" );
            stop_audio();
        };
        this->video->on_error = [this](std::string const& reason) {
            LOG_ERROR_FMT( "[video] pipeline failed: {}", reason );
            if (in_cycle())
                this->loop.quit();
        };
        this->audio->on_error = [this](std::string const& reason) {
            LOG_ERROR_FMT( "[audio] pipeline failed: {}", reason );
            stop_audio();
        };
    }

    supervisor_t(const supervisor_t&) = delete;
    supervisor_t& operator=(const supervisor_t&) = delete;

    // blocks until stop() or until max_iterations cycles have run,
    // an exception escaping a loop task is rethrown
    void run() {
        while (!stopping && (max_iterations == 0 || iterations < max_iterations)) {
            ++iterations;
            LOG_INFO_FMT( "negotiation cycle {}", iterations );
            set_state(state_t::negotiating);
            video_stopped = false;
            audio_stopped = false;
            video->attach_bus();
            audio->attach_bus();
            video_channel.connect();
            audio_channel.connect();

            loop.run();

            set_state(state_t::restarting);
            teardown();
            if (!stopping && restart_delay.count() > 0)
                wait(restart_delay);
        }
        set_state(state_t::idle);
    }

    // thread-safe, ends the current cycle and the run
    void stop() {
        LOG_INFO_FMT( "supervisor stop requested" );
        stopping = true;
        loop.quit();
    }

    // stops pipelines, then the workers given, then closes the transports
    void shutdown(std::function<void()> const& stop_workers) {
        stop_video();
        stop_audio();
        if (stop_workers)
            stop_workers();
        video_channel.close();
        audio_channel.close();
        set_state(state_t::idle);
    }

    // starts the pipeline owning the peer, throws routing_error for any other peer
    void route_session(int peer, sig::meta_opt const& meta) {
        if (peer == peers.video_remote) {
            if (meta && enable_resize)
                apply_meta(*meta);
            set_state(state_t::active);
            video_stopped = false;
            if (!video->start(false))
                LOG_ERROR_FMT( "[video] failed to start pipeline" );
            return;
        }
        if (peer == peers.audio_remote) {
            audio_stopped = false;
            if (!audio->start(true))
                LOG_ERROR_FMT( "[audio] failed to start pipeline" );
            return;
        }
        throw sig::routing_error(fmt::format("no pipeline for peer {}", peer));
    }

    // refreshed descriptor: folded into the next start, pushed to running pipelines
    void apply_credentials(ice::rtc_config_t const& config) {
        for (auto const& pipe : { video, audio }) {
            pipe->set_rtc_config(config);
            if (!pipe->is_running())
                continue;
            for (auto const& uri : config.turn_servers)
                pipe->add_turn_server(uri);
        }
        LOG_INFO_FMT( "rtc config applied: {} stun, {} turn", config.stun_servers.size(), config.turn_servers.size() );
        if (on_rtc_config)
            on_rtc_config(config);
    }

    state_t get_state() const { return state; }
    int get_iterations() const { return iterations; }
    bool is_stopping() const { return stopping; }
    sig::channel& get_video_channel() { return video_channel; }
    sig::channel& get_audio_channel() { return audio_channel; }

    int max_iterations{ 0 };    // 0 runs until stop()
    bool enable_resize{ false };
    std::chrono::milliseconds restart_delay{ 2000 };
    display_hooks_t display;

    std::function<void(ice::rtc_config_t const&)> on_rtc_config;

private:
    bool in_cycle() const { return state == state_t::negotiating || state == state_t::active; }

    void set_state(state_t s) {
        state = s;
    }

    void on_session(int peer, sig::meta_opt const& meta) {
        try {
            route_session(peer, meta);
        } catch (const sig::routing_error& e) {
            LOG_ERROR_FMT( "routing error: {}", e.what() );
        }
    }

    void apply_meta(sig::session_meta const& meta) {
        if (!meta.res.empty()) {
            auto const size{ utils::str_to_size(meta.res) };
            if (!size.valid()) {
                LOG_WARNING_FMT( "[video] invalid resolution: {}", meta.res );
            } else if (display.resize && display.resize(size)) {
                LOG_INFO_FMT( "[video] display resized to {}", utils::size_to_str(size) );
                video->send_remote_resolution(utils::size_to_str(size));
            } else {
                LOG_WARNING_FMT( "[video] resize to {} failed", meta.res );
            }
        }
        if (meta.scale) {
            double const scale{ *meta.scale };
            if (scale < min_scale || scale > max_scale) {
                LOG_WARNING_FMT( "[video] scale {} out of range [{}, {}]", scale, min_scale, max_scale );
                return;
            }
            int const dpi{ static_cast<int>(base_dpi * scale) };
            int const cursor{ static_cast<int>(base_cursor_size * scale) };
            if (display.set_dpi && !display.set_dpi(dpi))
                LOG_WARNING_FMT( "[video] failed to set dpi {}", dpi );
            if (display.set_cursor_size && !display.set_cursor_size(cursor))
                LOG_WARNING_FMT( "[video] failed to set cursor size {}", cursor );
        }
    }

    // a pipeline is stopped at most once per start
    void stop_video() {
        if (video_stopped)
            return;
        video_stopped = true;
        video->stop();
    }

    void stop_audio() {
        if (audio_stopped)
            return;
        audio_stopped = true;
        audio->stop();
    }

    void teardown() {
        stop_video();
        stop_audio();
        video_channel.close();
        audio_channel.close();
    }

    // backoff between cycles, still serving the loop so stop() ends it
    void wait(std::chrono::milliseconds delay) {
        guint const id{ loop.post_delayed(delay, [this]() { loop.quit(); }) };
        loop.run();
        loop.cancel(id);
    }

    gst::loop_t& loop;
    peers_t peers;
    std::shared_ptr<media::pipeline> video;
    std::shared_ptr<media::pipeline> audio;
    sig::channel video_channel;
    sig::channel audio_channel;

    state_t state{ state_t::idle };
    int iterations{ 0 };
    bool video_stopped{ false };
    bool audio_stopped{ false };
    std::atomic<bool> stopping{ false };
};

} // namespace app

#endif // #ifndef __SUPERVISOR_HPP
