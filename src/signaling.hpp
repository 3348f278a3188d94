#pragma once

#ifndef __SIGNALING_HPP
#define __SIGNALING_HPP

#include <chrono>
#include <memory>
#include <string>
#include <optional>
#include <exception>
#include <stdexcept>
#include <functional>

#include <log.hpp>
#include <gst.hpp>
#include <pipeline.hpp>

namespace sig {

enum class session_state { disconnected, connecting, connected, negotiating, active, reconnecting };

inline const char* to_string(session_state state) {
    switch (state) {
        case session_state::disconnected: return "disconnected";
        case session_state::connecting:   return "connecting";
        case session_state::connected:    return "connected";
        case session_state::negotiating:  return "negotiating";
        case session_state::active:       return "active";
        case session_state::reconnecting: return "reconnecting";
    }
    return "unknown";
}

// the requested peer is not registered on the server yet, retryable
struct peer_absent_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// any other server or protocol error, terminal for the channel
struct signaling_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// a session addressed to a peer id the receiver does not own
struct routing_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// optional metadata sent by the browser with SESSION_OK
struct session_meta {
    std::string res;                // "WxH", empty if absent
    std::optional<double> scale;
};

using meta_opt = std::optional<session_meta>;

// connection to the signaling server. Implementations deliver every event
// on the loop thread of the channel owning them.
struct transport {
    virtual ~transport() = default;

    virtual void connect() = 0;
    virtual void setup_call(int peer_id) = 0;
    virtual void send_sdp(std::string const& type, std::string const& sdp) = 0;
    virtual void send_ice(int mline, std::string const& candidate) = 0;
    virtual void close() = 0;

    std::function<void()> on_connect;
    std::function<void()> on_disconnect;
    std::function<void(std::exception_ptr)> on_error;
    std::function<void(std::string const&, std::string const&)> on_sdp;
    std::function<void(int, std::string const&)> on_ice;
    std::function<void(int, meta_opt const&)> on_session;
};

// one signaling session: binds a transport to a pipeline and keeps calling
// the remote peer until it shows up

class channel {
public:
    channel(std::string name, int local_id, int remote_id, std::shared_ptr<transport> link, gst::loop_t& loop, std::shared_ptr<media::pipeline> pipeline)
        : channel_name(std::move(name)), local_id(local_id), remote_id(remote_id), link(std::move(link)), loop(loop), pipeline(std::move(pipeline)) {
        this->link->on_connect = [this]() { handle_connect(); };
        this->link->on_disconnect = [this]() { handle_disconnect(); };
        this->link->on_error = [this](std::exception_ptr e) { handle_error(e); };
        this->link->on_session = [this](int peer, meta_opt const& meta) { handle_session(peer, meta); };
        this->link->on_sdp = [this](std::string const& type, std::string const& sdp) {
            LOG_DEBUG_FMT( "[{}] remote sdp {}", channel_name, type );
            this->pipeline->set_sdp(type, sdp);
        };
        this->link->on_ice = [this](int mline, std::string const& candidate) {
            this->pipeline->set_ice(mline, candidate);
        };
        this->pipeline->bind({
            [this](std::string const& type, std::string const& sdp) { this->link->send_sdp(type, sdp); },
            [this](int mline, std::string const& candidate) { this->link->send_ice(mline, candidate); }
        });
    }

    ~channel() {
        cancel_retry();
        link->on_connect = nullptr;
        link->on_disconnect = nullptr;
        link->on_error = nullptr;
        link->on_session = nullptr;
        link->on_sdp = nullptr;
        link->on_ice = nullptr;
        pipeline->bind({});
    }

    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;

    void connect() {
        closed_reported = false;
        set_state(session_state::connecting);
        LOG_INFO_FMT( "[{}] connecting as peer {}", channel_name, local_id );
        link->connect();
    }

    // explicit close, does not report on_closed
    void close() {
        closed_reported = true;
        cancel_retry();
        set_state(session_state::disconnected);
        link->close();
    }

    session_state state() const { return current; }
    std::string const& name() const { return channel_name; }
    int get_local_id() const { return local_id; }
    int get_remote_id() const { return remote_id; }
    int retries() const { return retry_count; }
    bool retry_pending() const { return retry_id != 0; }

    std::chrono::milliseconds retry_delay{ 2000 };

    std::function<void(int, meta_opt const&)> on_session;
    // the session ended without close() being called
    std::function<void()> on_closed;
    // replaces pipeline->stop() on a fatal error when set
    std::function<void()> stop_pipeline;

private:
    void set_state(session_state state) {
        if (state == current)
            return;
        LOG_DEBUG_FMT( "[{}] {} -> {}", channel_name, to_string(current), to_string(state) );
        current = state;
    }

    void handle_connect() {
        set_state(session_state::connected);
        call();
    }

    void call() {
        set_state(session_state::negotiating);
        LOG_INFO_FMT( "[{}] calling peer {}", channel_name, remote_id );
        link->setup_call(remote_id);
    }

    void handle_error(std::exception_ptr e) {
        try {
            std::rethrow_exception(e);
        } catch (const peer_absent_error& ex) {
            LOG_INFO_FMT( "[{}] peer {} not connected yet: {}", channel_name, remote_id, ex.what() );
            schedule_retry();
        } catch (const std::exception& ex) {
            LOG_ERROR_FMT( "[{}] signaling error: {}", channel_name, ex.what() );
            cancel_retry();
            if (stop_pipeline)
                stop_pipeline();
            else
                pipeline->stop();
            set_state(session_state::disconnected);
            link->close();
            report_closed();
        }
    }

    // several peer absent errors before the timer fires still make one retry
    void schedule_retry() {
        set_state(session_state::reconnecting);
        if (retry_id)
            return;
        retry_id = loop.post_delayed(retry_delay, [this]() {
            retry_id = 0;
            if (current != session_state::reconnecting)
                return;
            ++retry_count;
            call();
        });
    }

    void cancel_retry() {
        if (!retry_id)
            return;
        loop.cancel(retry_id);
        retry_id = 0;
    }

    void handle_disconnect() {
        LOG_INFO_FMT( "[{}] disconnected", channel_name );
        cancel_retry();
        set_state(session_state::disconnected);
        report_closed();
    }

    void handle_session(int peer, meta_opt const& meta) {
        if (peer != remote_id) {
            routing_error const e{ fmt::format("session for peer {} on channel expecting {}", peer, remote_id) };
            LOG_ERROR_FMT( "[{}] {}", channel_name, e.what() );
            return;
        }
        cancel_retry();
        set_state(session_state::active);
        LOG_INFO_FMT( "[{}] session established with peer {}", channel_name, peer );
        if (on_session)
            on_session(peer, meta);
    }

    void report_closed() {
        if (closed_reported)
            return;
        closed_reported = true;
        if (on_closed)
            on_closed();
    }

    std::string channel_name;
    int local_id;
    int remote_id;
    std::shared_ptr<transport> link;
    gst::loop_t& loop;
    std::shared_ptr<media::pipeline> pipeline;

    session_state current{ session_state::disconnected };
    guint retry_id{ 0 };
    int retry_count{ 0 };
    bool closed_reported{ false };
};

} // namespace sig

#endif // #ifndef __SIGNALING_HPP
