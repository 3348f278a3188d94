#pragma once

#ifndef __WS_HPP
#define __WS_HPP

#include <atomic>
#include <memory>
#include <string>
#include <variant>
#include <optional>
#include <exception>
#include <functional>

// libdatachannel
#include <rtc/rtc.hpp>
// json
#include <nlohmann/json.hpp>
// glib base64
#include <glib.h>

#include <log.hpp>
#include <gst.hpp>
#include <utils.hpp>
#include <signaling.hpp>

namespace sig {

// decodes the optional "SESSION_OK <base64 json>" argument
inline meta_opt parse_session_meta(std::string const& encoded) {
    if (encoded.empty())
        return std::nullopt;
    gsize len{ 0 };
    gst::safe_ptr<char> raw{ reinterpret_cast<char*>(g_base64_decode(encoded.c_str(), &len)) };
    if (!raw || !len)
        return std::nullopt;
    auto const j = nlohmann::json::parse(std::string(raw.get(), len), nullptr, false);
    if (!j.is_object())
        return std::nullopt;
    session_meta meta;
    if (j.contains("res") && j["res"].is_string())
        meta.res = j["res"].get<std::string>();
    if (j.contains("scale") && j["scale"].is_number())
        meta.scale = j["scale"].get<double>();
    return meta;
}

// text protocol of the signaling relay over a websocket:
//   -> HELLO <local id>        <- HELLO
//   -> SESSION <peer id>       <- SESSION_OK [meta] | ERROR <reason>
//   <-> {"sdp": {...}} | {"ice": {...}}

class ws_transport : public transport, public std::enable_shared_from_this<ws_transport> {
public:
    ws_transport(std::string url, int local_id, gst::loop_t& loop)
        : url(std::move(url)), local_id(local_id), loop(loop) {}

    ~ws_transport() override {
        if (ws)
            ws->resetCallbacks();
    }

    void connect() override {
        close();
        rtc::WebSocket::Configuration config;
        config.disableTlsVerification = true;
        ws = std::make_shared<rtc::WebSocket>(config);

        std::weak_ptr<ws_transport> weak{ shared_from_this() };
        unsigned const gen{ ++generation };
        ws->onOpen([weak, gen]() {
            dispatch(weak, gen, [](ws_transport& self) { self.handle_open(); });
        });
        ws->onClosed([weak, gen]() {
            dispatch(weak, gen, [](ws_transport& self) { self.handle_closed(); });
        });
        ws->onError([weak, gen](std::string reason) {
            dispatch(weak, gen, [reason = std::move(reason)](ws_transport& self) {
                self.raise(signaling_error("websocket: " + reason));
            });
        });
        ws->onMessage([weak, gen](rtc::message_variant data) {
            if (!std::holds_alternative<std::string>(data))
                return;
            dispatch(weak, gen, [text = std::get<std::string>(std::move(data))](ws_transport& self) {
                self.handle_message(text);
            });
        });

        LOG_INFO_FMT( "connecting to signaling server {}", url );
        try {
            ws->open(url);
        } catch (const std::exception& e) {
            raise(signaling_error(fmt::format("failed to open {}: {}", url, e.what())));
        }
    }

    void setup_call(int peer_id) override {
        requested_peer = peer_id;
        send(fmt::format("SESSION {}", peer_id));
    }

    void send_sdp(std::string const& type, std::string const& sdp) override {
        nlohmann::json msg;
        msg["sdp"]["type"] = type;
        msg["sdp"]["sdp"] = sdp;
        send(msg.dump());
    }

    void send_ice(int mline, std::string const& candidate) override {
        nlohmann::json msg;
        msg["ice"]["candidate"] = candidate;
        msg["ice"]["sdpMLineIndex"] = mline;
        send(msg.dump());
    }

    // events of the closed socket still in flight are dropped
    void close() override {
        ++generation;
        if (!ws)
            return;
        ws->resetCallbacks();
        ws->close();
        ws.reset();
    }

    std::string const& get_url() const { return url; }

    // one protocol line from the server, public for tests
    void handle_message(std::string const& raw) {
        std::string const text{ utils::trim(raw) };
        LOG_TRACE_FMT( "signaling <- {}", text );
        if (text == "HELLO") {
            if (on_connect)
                on_connect();
            return;
        }
        if (utils::str_starts(text, "SESSION_OK")) {
            auto const parts{ utils::str_split(text, " ") };
            meta_opt const meta{ parts.size() > 1 ? parse_session_meta(parts[1]) : std::nullopt };
            if (on_session)
                on_session(requested_peer, meta);
            return;
        }
        if (utils::str_starts(text, "ERROR")) {
            if (utils::str_starts(text, "ERROR peer"))
                raise(peer_absent_error(text));
            else
                raise(signaling_error(text));
            return;
        }
        auto const msg = nlohmann::json::parse(text, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) {
            raise(signaling_error("unexpected message: " + text));
            return;
        }
        try {
            if (msg.contains("sdp")) {
                auto const& sdp = msg.at("sdp");
                if (on_sdp)
                    on_sdp(sdp.at("type").get<std::string>(), sdp.at("sdp").get<std::string>());
            } else if (msg.contains("ice")) {
                auto const& ice = msg.at("ice");
                if (on_ice)
                    on_ice(ice.at("sdpMLineIndex").get<int>(), ice.at("candidate").get<std::string>());
            } else {
                LOG_WARNING_FMT( "unhandled signaling message: {}", text );
            }
        } catch (const nlohmann::json::exception& e) {
            raise(signaling_error(fmt::format("malformed message: {}", e.what())));
        }
    }

private:
    static void dispatch(std::weak_ptr<ws_transport> const& weak, unsigned gen, std::function<void(ws_transport&)> fn) {
        auto self{ weak.lock() };
        if (!self)
            return;
        self->loop.post([weak, gen, fn = std::move(fn)]() {
            auto self{ weak.lock() };
            if (self && gen == self->generation)
                fn(*self);
        });
    }

    void handle_open() {
        LOG_INFO_FMT( "signaling connected, registering as {}", local_id );
        send(fmt::format("HELLO {}", local_id));
    }

    void handle_closed() {
        ws.reset();
        if (on_disconnect)
            on_disconnect();
    }

    template <typename E>
    void raise(E const& e) {
        if (on_error)
            on_error(std::make_exception_ptr(e));
    }

    void send(std::string const& text) {
        if (!ws || !ws->isOpen()) {
            LOG_WARNING_FMT( "signaling not connected, dropping: {}", text );
            return;
        }
        LOG_TRACE_FMT( "signaling -> {}", text );
        try {
            ws->send(text);
        } catch (const std::exception& e) {
            LOG_ERROR_FMT( "signaling send failed: {}", e.what() );
        }
    }

    std::string url;
    int local_id;
    gst::loop_t& loop;
    std::shared_ptr<rtc::WebSocket> ws;
    std::atomic<unsigned> generation{ 0 };
    int requested_peer{ -1 };
};

} // namespace sig

#endif // #ifndef __WS_HPP
