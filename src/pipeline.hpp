#pragma once

#ifndef __PIPELINE_HPP
#define __PIPELINE_HPP

#include <string>
#include <vector>
#include <atomic>
#include <memory>
#include <variant>
#include <utility>
#include <optional>
#include <algorithm>
#include <functional>

// gst
#define GST_USE_UNSTABLE_API
// webrtc
#include <gst/gst.h>
#include <gst/sdp/sdp.h>
#include <gst/webrtc/webrtc.h>
// json
#include <nlohmann/json.hpp>

#include <log.hpp>
#include <gst.hpp>
#include <ice.hpp>
#include <utils.hpp>

namespace media {

// signaling side of a pipeline, set by the channel it is bound to
struct events_t {
    std::function<void(std::string const& type, std::string const& sdp)> on_sdp;
    std::function<void(int mline, std::string const& candidate)> on_ice;
};

// media pipeline as seen by the signaling and supervision layers
struct pipeline {
    virtual ~pipeline() = default;

    virtual std::string const& name() const = 0;

    // builds and plays the pipeline, audio_only selects the audio graph
    virtual bool start(bool audio_only = false) = 0;
    // safe to call when not running
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    // bus messages get dispatched on the loop from the next start on
    virtual void attach_bus() = 0;

    virtual void set_rtc_config(ice::rtc_config_t const& config) = 0;
    virtual void add_turn_server(std::string const& uri) = 0;

    virtual void set_video_bitrate(int kbps) = 0;
    virtual void set_audio_bitrate(int bps) = 0;
    virtual void set_framerate(int fps) = 0;

    virtual void send_remote_resolution(std::string const& res) = 0;
    virtual void send_cursor_data(nlohmann::json const& data) = 0;
    virtual void send_gpu_stats(double load, double memory_total, double memory_used) = 0;
    virtual void send_system_stats(double cpu_percent, std::uint64_t mem_total, std::uint64_t mem_used) = 0;
    virtual void send_ping(double t) = 0;
    virtual void send_latency(double ms) = 0;

    // remote description and candidates coming from the peer
    virtual void set_sdp(std::string const& type, std::string const& sdp) = 0;
    virtual void set_ice(int mline, std::string const& candidate) = 0;

    void bind(events_t e) { events = std::move(e); }

    // fatal pipeline condition (bus error or end of stream)
    std::function<void(std::string const&)> on_error;

protected:
    events_t events;
};

// property list applied to an element with g_object_set
struct gparams_t {
    using value_t = std::variant<std::string, int>;
    using option_t = std::pair<std::string, value_t>;
    using options_t = std::vector<option_t>;

    gparams_t(std::initializer_list<option_t> init) : options(init) {}

    void set_option(std::string const& name, value_t const& value) {
        auto it = std::find_if( options.begin(), options.end(), [&name](const option_t& opt) { return opt.first == name; } );
        if (it != options.end()) {
            it->second = value;
        } else {
            options.emplace_back(name, value);
        }
    }

    void apply(GstElement* element) const {
        if (!element)
            return;
        for (const auto& [name, value] : options) {
            if (std::holds_alternative<std::string>(value)) {
                g_object_set(element, name.c_str(), std::get<std::string>(value).c_str(), NULL);
            } else if (std::holds_alternative<int>(value)) {
                g_object_set(element, name.c_str(), std::get<int>(value), NULL);
            }
        }
    }

    options_t options;
};

struct webrtc_config_t {
    std::string video_source{ "ximagesrc show-pointer=0 use-damage=0" };
    std::string audio_source{ "pulsesrc" };
    std::string encoder{ "x264enc" };
    int framerate{ 30 };
    int video_bitrate{ 2000 };      // kbit/sec
    int audio_bitrate{ 64000 };     // bit/sec
    int audio_channels{ 2 };
    bool enable_resize{ false };
};

// gst-launch descriptions, both end in a webrtcbin named "webrtcbin"
inline std::string video_description(webrtc_config_t const& config) {
    auto it = gst::map_encoder_info.find(config.encoder);
    if (it == gst::map_encoder_info.end())
        return {};
    auto const& info = it->second;
    return fmt::format(
        "{} ! videorate ! videoconvert ! capsfilter name=vcaps caps=\"video/x-raw,framerate={}/1\" ! "
        "queue leaky=downstream max-size-buffers=2 ! {} name=encoder {}={} {} ! "
        "{} name=pay pt=96 ! application/x-rtp,media=video,encoding-name={},payload=96 ! "
        "webrtcbin name=webrtcbin bundle-policy=max-bundle",
        config.video_source, config.framerate,
        config.encoder, info.bitrate_prop, config.video_bitrate * info.bitrate_scale, info.params,
        info.rtppay, info.encoding
    );
}

inline std::string audio_description(webrtc_config_t const& config) {
    return fmt::format(
        "{} ! audioconvert ! audioresample ! audio/x-raw,channels={} ! queue leaky=downstream ! "
        "opusenc name=audioenc bitrate={} ! rtpopuspay name=audiopay pt=111 ! "
        "application/x-rtp,media=audio,encoding-name=OPUS,payload=111 ! "
        "webrtcbin name=webrtcbin bundle-policy=max-bundle",
        config.audio_source, config.audio_channels, config.audio_bitrate
    );
}

// one webrtcbin pipeline, acting as the offerer. Every webrtcbin signal is
// re-posted to the loop so that the bound channel is only called from there.

class webrtc_pipeline : public pipeline {
public:
    webrtc_pipeline(std::string name, webrtc_config_t config, gst::loop_t& loop)
        : pipeline_name(std::move(name)), config(std::move(config)), loop(loop) {}

    ~webrtc_pipeline() override { stop(); }

    std::string const& name() const override { return pipeline_name; }

    bool start(bool audio_only = false) override {
        if (is_running()) {
            LOG_WARNING_FMT( "[{}] pipeline already running", pipeline_name );
            return true;
        }
        if (!gst::initializer::get().is_loaded())
            return false;

        std::string const desc{ audio_only ? audio_description(config) : video_description(config) };
        if (desc.empty()) {
            LOG_ERROR_FMT( "[{}] unsupported encoder: {}", pipeline_name, config.encoder );
            return false;
        }
        if (!audio_only && !gst::element_exists(config.encoder)) {
            LOG_ERROR_FMT( "[{}] encoder element not available: {}", pipeline_name, config.encoder );
            return false;
        }
        LOG_DEBUG_FMT( "[{}] launching: {}", pipeline_name, desc );

        gst::safe_ptr<GError> err;
        GstElement* launched{ gst_parse_launch(desc.c_str(), err.get_ref()) };
        if (!launched || err) {
            LOG_ERROR_FMT( "[{}] failed to build pipeline: {}", pipeline_name, err ? err->message : "<unknown reason>" );
            if (launched)
                gst_object_unref(launched);
            return false;
        }
        pipe.attach(launched);
        webrtcbin.attach(gst::element_by_name(pipe, "webrtcbin"));
        if (!webrtcbin) {
            LOG_ERROR_FMT( "[{}] failed to find webrtcbin in pipeline", pipeline_name );
            pipe.release();
            return false;
        }

        gparams_t webrtcbin_params{ { "stun-server", rtc.stun_server() } };
        if (!rtc.stun_servers.empty())
            webrtcbin_params.apply(webrtcbin);
        for (auto const& uri : rtc.turn_servers)
            add_turn_server(uri);

        g_signal_connect(webrtcbin, "on-negotiation-needed", G_CALLBACK(on_negotiation_needed_static), this);
        g_signal_connect(webrtcbin, "on-ice-candidate", G_CALLBACK(on_ice_candidate_static), this);

        if (bus_attached)
            watch_bus();

        if (gst_element_set_state(pipe, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            LOG_ERROR_FMT( "[{}] failed to set pipeline to PLAYING state", pipeline_name );
            stop();
            return false;
        }

        if (!audio_only)
            create_data_channel();

        LOG_INFO_FMT( "[{}] {} pipeline started", pipeline_name, audio_only ? "audio" : "video" );
        return true;
    }

    void stop() override {
        ++generation;
        if (bus_watch) {
            GSource* source{ g_main_context_find_source_by_id(loop.get_context(), bus_watch) };
            if (source)
                g_source_destroy(source);
            bus_watch = 0;
        }
        if (channel) {
            g_object_unref(channel);
            channel = nullptr;
        }
        channel_open = false;
        if (!pipe)
            return;
        if (gst_element_set_state(pipe, GST_STATE_NULL) == GST_STATE_CHANGE_FAILURE)
            LOG_WARNING_FMT( "[{}] failed to set pipeline to NULL state", pipeline_name );
        webrtcbin.release();
        pipe.release();
        LOG_INFO_FMT( "[{}] pipeline stopped", pipeline_name );
    }

    bool is_running() const override { return (bool)pipe; }

    void attach_bus() override {
        bus_attached = true;
        if (pipe && !bus_watch)
            watch_bus();
    }

    void set_rtc_config(ice::rtc_config_t const& config) override {
        rtc = config;
    }

    void add_turn_server(std::string const& uri) override {
        if (!webrtcbin)
            return;
        gboolean ret{ FALSE };
        g_signal_emit_by_name(webrtcbin, "add-turn-server", uri.c_str(), &ret);
        if (!ret)
            LOG_WARNING_FMT( "[{}] webrtcbin refused turn server", pipeline_name );
    }

    void set_video_bitrate(int kbps) override {
        config.video_bitrate = kbps;
        auto it = gst::map_encoder_info.find(config.encoder);
        gst::safe_ptr<GstElement> encoder{ gst::element_by_name(pipe, "encoder") };
        if (encoder && it != gst::map_encoder_info.end())
            g_object_set(encoder, it->second.bitrate_prop.c_str(), kbps * it->second.bitrate_scale, NULL);
        send_action(fmt::format("video_bitrate,{}", kbps));
    }

    void set_audio_bitrate(int bps) override {
        config.audio_bitrate = bps;
        gst::safe_ptr<GstElement> encoder{ gst::element_by_name(pipe, "audioenc") };
        if (encoder)
            g_object_set(encoder, "bitrate", bps, NULL);
        send_action(fmt::format("audio_bitrate,{}", bps));
    }

    void set_framerate(int fps) override {
        config.framerate = fps;
        gst::safe_ptr<GstElement> vcaps{ gst::element_by_name(pipe, "vcaps") };
        if (vcaps) {
            gst::safe_ptr<GstCaps> caps{ gst_caps_from_string(fmt::format("video/x-raw,framerate={}/1", fps).c_str()) };
            g_object_set(vcaps, "caps", caps.get(), NULL);
        }
        send_action(fmt::format("framerate,{}", fps));
    }

    void send_remote_resolution(std::string const& res) override {
        remote_resolution = res;
        send_action("resolution," + res);
    }

    void send_cursor_data(nlohmann::json const& data) override {
        send_data("cursor", data);
    }

    void send_gpu_stats(double load, double memory_total, double memory_used) override {
        nlohmann::json data;
        data["load"] = load;
        data["memory_total"] = memory_total;
        data["memory_used"] = memory_used;
        send_data("gpu_stats", data);
    }

    void send_system_stats(double cpu_percent, std::uint64_t mem_total, std::uint64_t mem_used) override {
        nlohmann::json data;
        data["cpu_percent"] = cpu_percent;
        data["mem_total"] = mem_total;
        data["mem_used"] = mem_used;
        send_data("system_stats", data);
    }

    void send_ping(double t) override {
        nlohmann::json data;
        data["start_time"] = t;
        send_data("ping", data);
    }

    void send_latency(double ms) override {
        nlohmann::json data;
        data["latency_ms"] = ms;
        send_data("latency_measurement", data);
    }

    void set_sdp(std::string const& type, std::string const& sdp) override {
        if (!webrtcbin) {
            LOG_WARNING_FMT( "[{}] sdp {} ignored, pipeline not running", pipeline_name, type );
            return;
        }
        if (type != "answer") {
            LOG_WARNING_FMT( "[{}] unexpected sdp type: {}", pipeline_name, type );
            return;
        }
        GstSDPMessage* sdp_msg{ nullptr };
        if (gst_sdp_message_new_from_text(sdp.c_str(), &sdp_msg) != GST_SDP_OK) {
            LOG_ERROR_FMT( "[{}] invalid SDP answer", pipeline_name );
            return;
        }
        GstWebRTCSessionDescription* answer{ gst_webrtc_session_description_new(GST_WEBRTC_SDP_TYPE_ANSWER, sdp_msg) };
        gst::safe_ptr<GstPromise> promise{ gst_promise_new() };
        g_signal_emit_by_name(webrtcbin, "set-remote-description", answer, promise.get());
        gst_promise_interrupt(promise);
        gst_webrtc_session_description_free(answer);
        LOG_INFO_FMT( "[{}] remote description set", pipeline_name );
    }

    void set_ice(int mline, std::string const& candidate) override {
        if (!webrtcbin) {
            LOG_WARNING_FMT( "[{}] ice candidate ignored, pipeline not running", pipeline_name );
            return;
        }
        g_signal_emit_by_name(webrtcbin, "add-ice-candidate", static_cast<guint>(mline), candidate.c_str());
    }

    // messages from the browser over the "input" data channel
    std::function<void(std::string const&)> on_data_message;

    webrtc_config_t const& get_config() const { return config; }

private:
    void watch_bus() {
        gst::safe_ptr<GstBus> bus{ gst_element_get_bus(pipe) };
        GSource* source{ gst_bus_create_watch(bus) };
        g_source_set_callback(source, G_SOURCE_FUNC(&webrtc_pipeline::on_bus_static), this, nullptr);
        bus_watch = g_source_attach(source, loop.get_context());
        g_source_unref(source);
    }

    static gboolean on_bus_static(GstBus*, GstMessage* msg, gpointer user_data) {
        static_cast<webrtc_pipeline*>(user_data)->on_bus(msg);
        return G_SOURCE_CONTINUE;
    }

    void on_bus(GstMessage* msg) {
        switch (GST_MESSAGE_TYPE(msg)) {
            case GST_MESSAGE_ERROR: {
                gst::safe_ptr<GError> err;
                gst::safe_ptr<char> debug;
                gst_message_parse_error(msg, err.get_ref(), debug.get_ref());
                std::string const reason{ err ? err->message : "<unknown reason>" };
                LOG_ERROR_FMT( "[{}] pipeline error from {}: {} ({})", pipeline_name, GST_OBJECT_NAME(msg->src), reason, debug ? debug.get() : "" );
                if (on_error)
                    on_error(reason);
                break;
            }
            case GST_MESSAGE_EOS:
                LOG_WARNING_FMT( "[{}] end of stream", pipeline_name );
                if (on_error)
                    on_error("end of stream");
                break;
            case GST_MESSAGE_STATE_CHANGED:
                if (GST_MESSAGE_SRC(msg) == GST_OBJECT(pipe.get())) {
                    GstState old_state, new_state;
                    gst_message_parse_state_changed(msg, &old_state, &new_state, nullptr);
                    LOG_DEBUG_FMT( "[{}] state {} -> {}", pipeline_name, gst_element_state_get_name(old_state), gst_element_state_get_name(new_state) );
                }
                break;
            case GST_MESSAGE_LATENCY:
                gst_bin_recalculate_latency(GST_BIN(pipe.get()));
                break;
            default:
                break;
        }
    }

    // posts fn to the loop, dropped when the pipeline has been stopped meanwhile
    void post_current(std::function<void()> fn) {
        unsigned const gen{ generation };
        loop.post([this, gen, fn = std::move(fn)]() {
            if (gen == generation)
                fn();
        });
    }

    static void on_negotiation_needed_static(GstElement*, gpointer user_data) {
        auto* self = static_cast<webrtc_pipeline*>(user_data);
        self->post_current([self]() { self->create_offer(); });
    }

    void create_offer() {
        if (!webrtcbin)
            return;
        LOG_INFO_FMT( "[{}] creating offer", pipeline_name );
        GstPromise* promise{ gst_promise_new_with_change_func(&webrtc_pipeline::on_offer_created_static, this, nullptr) };
        g_signal_emit_by_name(webrtcbin, "create-offer", nullptr, promise);
    }

    // webrtcbin thread
    static void on_offer_created_static(GstPromise* promise, gpointer user_data) {
        static_cast<webrtc_pipeline*>(user_data)->on_offer_created(promise);
    }

    void on_offer_created(GstPromise* p) {
        gst::safe_ptr<GstPromise> promise{ p };
        if (gst_promise_wait(promise) != GST_PROMISE_RESULT_REPLIED) {
            LOG_ERROR_FMT( "[{}] offer creation failed", pipeline_name );
            return;
        }
        GstStructure const* reply{ gst_promise_get_reply(promise) };
        GstWebRTCSessionDescription* offer{ nullptr };
        gst_structure_get(reply, "offer", GST_TYPE_WEBRTC_SESSION_DESCRIPTION, &offer, NULL);
        if (!offer) {
            LOG_ERROR_FMT( "[{}] offer missing in reply", pipeline_name );
            return;
        }
        gst::safe_ptr<GstPromise> local{ gst_promise_new() };
        g_signal_emit_by_name(webrtcbin, "set-local-description", offer, local.get());
        gst_promise_interrupt(local);

        gst::safe_ptr<char> text{ gst_sdp_message_as_text(offer->sdp) };
        gst_webrtc_session_description_free(offer);
        if (!text) {
            LOG_ERROR_FMT( "[{}] gst_sdp_message_as_text returned NULL", pipeline_name );
            return;
        }
        std::string sdp{ text.get() };
        post_current([this, sdp = std::move(sdp)]() {
            if (events.on_sdp)
                events.on_sdp("offer", sdp);
        });
    }

    static void on_ice_candidate_static(GstElement*, guint mlineindex, gchar* candidate, gpointer user_data) {
        auto* self = static_cast<webrtc_pipeline*>(user_data);
        std::string c{ candidate ? candidate : "" };
        int const mline{ static_cast<int>(mlineindex) };
        self->post_current([self, mline, c = std::move(c)]() {
            if (self->events.on_ice)
                self->events.on_ice(mline, c);
        });
    }

    void create_data_channel() {
        g_signal_emit_by_name(webrtcbin, "create-data-channel", "input", nullptr, &channel);
        if (!channel) {
            LOG_WARNING_FMT( "[{}] failed to create data channel", pipeline_name );
            return;
        }
        g_signal_connect(channel, "on-open", G_CALLBACK(on_channel_open_static), this);
        g_signal_connect(channel, "on-close", G_CALLBACK(on_channel_close_static), this);
        g_signal_connect(channel, "on-message-string", G_CALLBACK(on_channel_message_static), this);
    }

    static void on_channel_open_static(GstWebRTCDataChannel*, gpointer user_data) {
        auto* self = static_cast<webrtc_pipeline*>(user_data);
        self->post_current([self]() { self->on_channel_open(); });
    }

    static void on_channel_close_static(GstWebRTCDataChannel*, gpointer user_data) {
        auto* self = static_cast<webrtc_pipeline*>(user_data);
        self->post_current([self]() {
            LOG_INFO_FMT( "[{}] data channel closed", self->pipeline_name );
            self->channel_open = false;
        });
    }

    static void on_channel_message_static(GstWebRTCDataChannel*, gchar* str, gpointer user_data) {
        auto* self = static_cast<webrtc_pipeline*>(user_data);
        std::string text{ str ? str : "" };
        self->post_current([self, text = std::move(text)]() { self->on_channel_message(text); });
    }

    // announces the current stream settings to the browser
    void on_channel_open() {
        LOG_INFO_FMT( "[{}] data channel open", pipeline_name );
        channel_open = true;
        send_action(fmt::format("framerate,{}", config.framerate));
        send_action(fmt::format("video_bitrate,{}", config.video_bitrate));
        send_action(fmt::format("audio_bitrate,{}", config.audio_bitrate));
        send_action(fmt::format("resize,{}", config.enable_resize ? "true" : "false"));
        send_action(fmt::format("encoder,{}", config.encoder));
        if (!remote_resolution.empty())
            send_action("resolution," + remote_resolution);
    }

    void on_channel_message(std::string const& text) {
        LOG_TRACE_FMT( "[{}] data channel message: {}", pipeline_name, text );
        if (on_data_message)
            on_data_message(text);
    }

    void send_action(std::string const& action) {
        nlohmann::json data;
        data["action"] = action;
        send_data("system", data);
    }

    void send_data(std::string const& type, nlohmann::json const& data) {
        if (!channel || !channel_open) {
            LOG_TRACE_FMT( "[{}] data channel not open, dropping {}", pipeline_name, type );
            return;
        }
        nlohmann::json msg;
        msg["type"] = type;
        msg["data"] = data;
        std::string const text{ msg.dump() };
        gst_webrtc_data_channel_send_string(channel, text.c_str());
    }

    std::string pipeline_name;
    webrtc_config_t config;
    gst::loop_t& loop;
    ice::rtc_config_t rtc{ ice::decode(ice::default_rtc_config) };

    gst::safe_ptr<GstElement> pipe;
    gst::safe_ptr<GstElement> webrtcbin;
    GstWebRTCDataChannel* channel{ nullptr };
    bool channel_open{ false };
    bool bus_attached{ false };
    guint bus_watch{ 0 };
    std::atomic<unsigned> generation{ 0 };
    std::string remote_resolution;
};

} // namespace media

#endif // #ifndef __PIPELINE_HPP
