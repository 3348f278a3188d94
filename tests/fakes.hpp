#pragma once

#ifndef __FAKES_HPP
#define __FAKES_HPP

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <optional>
#include <functional>

#include <gst.hpp>
#include <ice.hpp>
#include <pipeline.hpp>
#include <signaling.hpp>

namespace fakes {

// ordered record of calls shared by several fakes
using journal_t = std::vector<std::string>;

struct fake_pipeline : media::pipeline {
    fake_pipeline(std::string name, journal_t* journal = nullptr): pipeline_name(std::move(name)), journal(journal) {}

    std::string const& name() const override { return pipeline_name; }

    bool start(bool audio_only = false) override {
        ++starts;
        if (audio_only)
            ++audio_starts;
        running = true;
        note(audio_only ? "start_audio" : "start");
        return true;
    }

    void stop() override {
        ++stops;
        running = false;
        note("stop");
    }

    bool is_running() const override { return running; }

    void attach_bus() override {
        ++bus_attached;
    }

    void set_rtc_config(ice::rtc_config_t const& config) override { rtc = config; }
    void add_turn_server(std::string const& uri) override { turn_added.push_back(uri); }

    void set_video_bitrate(int kbps) override { video_bitrate = kbps; }
    void set_audio_bitrate(int bps) override { audio_bitrate = bps; }
    void set_framerate(int fps) override { framerate = fps; }

    void send_remote_resolution(std::string const& res) override {
        resolutions.push_back(res);
        note("resolution:" + res);
    }
    void send_cursor_data(nlohmann::json const&) override {}
    void send_gpu_stats(double, double, double) override {}
    void send_system_stats(double, std::uint64_t, std::uint64_t) override { ++system_stats; }
    void send_ping(double) override {}
    void send_latency(double ms) override { latencies.push_back(ms); }

    void set_sdp(std::string const& type, std::string const& sdp) override { remote_sdp.emplace_back(type, sdp); }
    void set_ice(int mline, std::string const& candidate) override { remote_ice.emplace_back(mline, candidate); }

    // local side of the negotiation
    void emit_sdp(std::string const& type, std::string const& sdp) {
        if (events.on_sdp)
            events.on_sdp(type, sdp);
    }
    void emit_ice(int mline, std::string const& candidate) {
        if (events.on_ice)
            events.on_ice(mline, candidate);
    }

    void note(std::string const& what) {
        if (journal)
            journal->push_back(pipeline_name + "." + what);
    }

    std::string pipeline_name;
    journal_t* journal;
    int starts{ 0 };
    int audio_starts{ 0 };
    int stops{ 0 };
    int bus_attached{ 0 };
    int system_stats{ 0 };
    bool running{ false };
    int video_bitrate{ 0 };
    int audio_bitrate{ 0 };
    int framerate{ 0 };
    std::optional<ice::rtc_config_t> rtc;
    std::vector<std::string> turn_added;
    std::vector<std::string> resolutions;
    std::vector<double> latencies;
    std::vector<std::pair<std::string, std::string>> remote_sdp;
    std::vector<std::pair<int, std::string>> remote_ice;
};

struct fake_transport : sig::transport {
    fake_transport(std::string name, journal_t* journal = nullptr): transport_name(std::move(name)), journal(journal) {}

    void connect() override {
        ++connects;
        note("connect");
        if (on_connect_hook)
            on_connect_hook();
    }

    void setup_call(int peer_id) override {
        calls.push_back(peer_id);
        if (on_call_hook)
            on_call_hook(peer_id);
    }

    void send_sdp(std::string const& type, std::string const& sdp) override { sent_sdp.emplace_back(type, sdp); }
    void send_ice(int mline, std::string const& candidate) override { sent_ice.emplace_back(mline, candidate); }

    void close() override {
        ++closes;
        note("close");
    }

    void emit_connect() { if (on_connect) on_connect(); }
    void emit_disconnect() { if (on_disconnect) on_disconnect(); }
    template <typename E>
    void emit_error(E const& e) { if (on_error) on_error(std::make_exception_ptr(e)); }
    void emit_session(int peer, sig::meta_opt const& meta = std::nullopt) { if (on_session) on_session(peer, meta); }
    void emit_sdp(std::string const& type, std::string const& sdp) { if (on_sdp) on_sdp(type, sdp); }
    void emit_ice(int mline, std::string const& candidate) { if (on_ice) on_ice(mline, candidate); }

    void note(std::string const& what) {
        if (journal)
            journal->push_back(transport_name + "." + what);
    }

    std::string transport_name;
    journal_t* journal;
    int connects{ 0 };
    int closes{ 0 };
    std::vector<int> calls;
    std::vector<std::pair<std::string, std::string>> sent_sdp;
    std::vector<std::pair<int, std::string>> sent_ice;

    std::function<void()> on_connect_hook;
    std::function<void(int)> on_call_hook;
};

// runs the loop for at most the given time
inline void run_for(gst::loop_t& loop, std::chrono::milliseconds duration) {
    guint const id{ loop.post_delayed(duration, [&loop]() { loop.quit(); }) };
    loop.run();
    loop.cancel(id);
}

} // namespace fakes

#endif // #ifndef __FAKES_HPP
