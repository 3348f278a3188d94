#pragma once

#ifndef __MONITOR_HPP
#define __MONITOR_HPP

#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <fstream>
#include <sstream>
#include <variant>
#include <cstdint>
#include <functional>
#include <filesystem>
#include <condition_variable>

// gio file monitor
#include <gio/gio.h>

#include <log.hpp>
#include <gst.hpp>
#include <ice.hpp>
#include <meta.hpp>
#include <utils.hpp>

namespace ice {

using credentials_handler_t = std::function<void(rtc_config_t const&)>;

// one source of fresh ICE server descriptors, on_credentials fires on the monitor's own thread
struct credential_monitor {
    credential_monitor(std::string name, bool enabled): name(std::move(name)), enabled(enabled) {}
    virtual ~credential_monitor() = default;

    virtual void start() = 0;
    virtual void stop() = 0;

    std::string const name;
    bool const enabled;
    credentials_handler_t on_credentials{ nullptr };
};

// polls on a short tick and refreshes when the unix time is a multiple of period
struct periodic_monitor : credential_monitor {
    using clock_func_t = std::function<std::int64_t()>;

    periodic_monitor(std::string name, std::chrono::seconds period, bool enabled)
        : credential_monitor(std::move(name), enabled), period(period) {}

    ~periodic_monitor() override {
        stop();
    }

    void start() override {
        if (!enabled || thread.joinable())
            return;
        running = true;
        thread = std::thread([this]() {
            LOG_INFO_FMT( "[{}] monitor started, period {}s", name, period.count() );
            std::unique_lock<std::mutex> lock(mutex);
            while (running) {
                lock.unlock();
                tick();
                lock.lock();
                cv.wait_for(lock, tick_interval, [this]() { return !running; });
            }
            LOG_INFO_FMT( "[{}] monitor stopped", name );
        });
    }

    void stop() override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            running = false;
        }
        cv.notify_all();
        if (thread.joinable())
            thread.join();
    }

    // one scheduling step, fires at most once per aligned second
    void tick() {
        if (!enabled || period.count() <= 0)
            return;
        auto const now{ now_seconds() };
        if (now % period.count() != 0 || now == last_fired)
            return;
        last_fired = now;
        rtc_config_t config;
        try {
            config = fetch();
        } catch (const std::exception& e) {
            LOG_WARNING_FMT( "[{}] failed to refresh rtc config: {}", name, e.what() );
            return;
        }
        LOG_INFO_FMT( "[{}] rtc config refreshed, {} turn server(s)", name, config.turn_servers.size() );
        if (on_credentials)
            on_credentials(config);
    }

    std::chrono::seconds const period;
    std::chrono::milliseconds tick_interval{ 500 };
    clock_func_t now_seconds{ utils::unix_now };

protected:
    virtual rtc_config_t fetch() = 0;

private:
    std::thread thread;
    std::mutex mutex;
    std::condition_variable cv;
    bool running{ false };
    std::int64_t last_fired{ -1 };
};

struct hmac_params_t {
    std::string host;
    int port{ 0 };
    std::string secret;
    std::string username;
    std::string protocol{ "udp" };
    bool tls{ false };
    std::chrono::seconds ttl{ default_lifetime };
};

// generates time limited credentials from the TURN shared secret
struct hmac_monitor : periodic_monitor {
    hmac_monitor(hmac_params_t params, std::chrono::seconds period, bool enabled)
        : periodic_monitor("hmac", period, enabled), params(std::move(params)) {}

    ~hmac_monitor() override {
        stop();
    }

    static rtc_config_t generate(hmac_params_t const& params, std::int64_t now) {
        auto const username{ make_ephemeral_username(params.username, now + params.ttl.count()) };
        return decode(encode_hmac(params.host, params.port, params.secret, username, params.protocol, params.tls, params.ttl.count()));
    }

    hmac_params_t const params;

protected:
    rtc_config_t fetch() override {
        return generate(params, now_seconds());
    }
};

struct rest_params_t {
    std::string uri;
    std::string username;
    std::string auth_header_name{ "x-auth-user" };
};

// fetches the descriptor from a credential REST service
struct coturn_monitor : periodic_monitor {
    coturn_monitor(rest_params_t params, std::chrono::seconds period, bool enabled)
        : periodic_monitor("coturn", period, enabled), params(std::move(params)) {}

    ~coturn_monitor() override {
        stop();
    }

    rest_params_t const params;

protected:
    rtc_config_t fetch() override {
        return fetch_rest(params.uri, params.username, params.auth_header_name);
    }
};

inline std::string read_file(std::string const& path) {
    std::ifstream stream(path);
    if (!stream.is_open())
        throw config_format_error(fmt::format("can't open {}", path));
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

// watches a descriptor file and re-reads it once a writer closes it
struct file_monitor : credential_monitor {
    file_monitor(std::string path, bool enabled)
        : credential_monitor("file", enabled), path(std::move(path)) {}

    ~file_monitor() override {
        stop();
    }

    void start() override {
        if (!enabled || thread.joinable())
            return;
        thread = std::thread([this]() {
            g_main_context_push_thread_default(worker.get_context());
            gst::safe_ptr<GFile> file;
            file.attach(g_file_new_for_path(path.c_str()));
            gst::safe_ptr<GError> err;
            gst::safe_ptr<GFileMonitor> monitor;
            monitor.attach(g_file_monitor_file(file, G_FILE_MONITOR_NONE, nullptr, err.get_ref()));
            if (!monitor) {
                LOG_ERROR_FMT( "[{}] can't watch {}: {}", name, path, err ? err->message : "<unknown reason>" );
            } else {
                g_signal_connect(monitor.get(), "changed", G_CALLBACK(&file_monitor::on_changed), this);
                LOG_INFO_FMT( "[{}] watching {}", name, path );
                worker.run();
                g_file_monitor_cancel(monitor);
            }
            g_main_context_pop_thread_default(worker.get_context());
        });
    }

    void stop() override {
        if (!thread.joinable())
            return;
        worker.quit();
        thread.join();
    }

    // read/parse failures are logged, the next write retries
    void reload() {
        rtc_config_t config;
        try {
            config = decode(read_file(path));
        } catch (const std::exception& e) {
            LOG_WARNING_FMT( "[{}] failed to load {}: {}", name, path, e.what() );
            return;
        }
        LOG_INFO_FMT( "[{}] rtc config reloaded from {}", name, path );
        if (on_credentials)
            on_credentials(config);
    }

    std::string const path;

private:
    static void on_changed(GFileMonitor*, GFile*, GFile*, GFileMonitorEvent event, gpointer user_data) {
        if (event == G_FILE_MONITOR_EVENT_CHANGES_DONE_HINT)
            static_cast<file_monitor*>(user_data)->reload();
    }

    gst::loop_t worker{ true };
    std::thread thread;
};

// credential source, chosen once at startup

struct file_source { std::string path; };
struct hmac_source { hmac_params_t params; };
struct static_source { std::string host; int port; std::string username; std::string password; std::string protocol; bool tls; };
struct rest_source { rest_params_t params; };
struct default_source { };

using credential_source = std::variant<file_source, hmac_source, static_source, rest_source, default_source>;

inline char const* source_name(credential_source const& source) {
    return std::visit(meta::overload {
        [](file_source const&) { return "file"; },
        [](hmac_source const&) { return "hmac"; },
        [](static_source const&) { return "static"; },
        [](rest_source const&) { return "rest"; },
        [](default_source const&) { return "default"; }
    }, source);
}

struct source_params_t {
    std::string rtc_config_json;
    std::string turn_host;
    int turn_port{ 0 };
    std::string turn_protocol{ "udp" };
    bool turn_tls{ false };
    std::string turn_shared_secret;
    std::string turn_username;
    std::string turn_password;
    std::string coturn_web_uri;
    std::string coturn_web_username;
    std::string coturn_auth_header_name{ "x-auth-user" };
    std::chrono::seconds period{ 60 };
    std::chrono::seconds ttl{ default_lifetime };
};

// file on disk > shared secret > long-term credentials > REST service > built-in default
inline credential_source select_source(source_params_t const& params,
                                       std::function<bool(std::string const&)> const& file_exists = [](std::string const& path) { return std::filesystem::exists(path); }) {
    bool const has_turn_host{ !params.turn_host.empty() && params.turn_port > 0 };
    std::string const protocol{ utils::str_lower(params.turn_protocol) == "tcp" ? "tcp" : "udp" };
    if (!params.rtc_config_json.empty() && file_exists(params.rtc_config_json))
        return file_source{ params.rtc_config_json };
    if (!params.turn_shared_secret.empty()) {
        if (!has_turn_host)
            throw config_format_error("TURN shared secret given without TURN host and port");
        return hmac_source{ { params.turn_host, params.turn_port, params.turn_shared_secret, params.coturn_web_username, protocol, params.turn_tls, params.ttl } };
    }
    if (!params.turn_username.empty() && !params.turn_password.empty()) {
        if (!has_turn_host)
            throw config_format_error("TURN credentials given without TURN host and port");
        return static_source{ params.turn_host, params.turn_port, params.turn_username, params.turn_password, protocol, params.turn_tls };
    }
    if (!params.coturn_web_uri.empty())
        return rest_source{ { params.coturn_web_uri, params.coturn_web_username, params.coturn_auth_header_name } };
    return default_source{};
}

// owns the three adapters, only the one matching the selected source is enabled,
// every refresh is re-posted to the event loop before reaching on_rtc_config
class credential_supervisor {
public:
    using post_t = std::function<void(std::function<void()>)>;

    credential_supervisor(source_params_t params, post_t post): params(std::move(params)), post(std::move(post)) {}

    ~credential_supervisor() {
        stop();
    }

    // picks the source and produces the initial descriptor, throws config_format_error on bad startup config
    rtc_config_t resolve() {
        source = select_source(params, file_exists);
        bool fallback{ false };
        rtc_config_t config = std::visit(meta::overload {
            [](file_source const& s) {
                LOG_WARNING_FMT( "using file for rtc config: {}", s.path );
                return decode(read_file(s.path));
            },
            [](hmac_source const& s) {
                LOG_INFO_FMT( "using TURN shared secret for rtc config, host {}:{}", s.params.host, s.params.port );
                return hmac_monitor::generate(s.params, utils::unix_now());
            },
            [](static_source const& s) {
                LOG_WARNING_FMT( "using legacy non-HMAC TURN credentials" );
                return decode(encode_static(s.host, s.port, s.username, s.password, s.protocol, s.tls));
            },
            [&fallback](rest_source const& s) {
                try {
                    return fetch_rest(s.params.uri, s.params.username, s.params.auth_header_name);
                } catch (const credential_fetch_error& e) {
                    LOG_WARNING_FMT( "error fetching rtc config from {}, using default: {}", s.params.uri, e.what() );
                } catch (const config_format_error& e) {
                    LOG_WARNING_FMT( "bad rtc config from {}, using default: {}", s.params.uri, e.what() );
                }
                fallback = true;
                return decode(default_rtc_config);
            },
            [](default_source const&) {
                LOG_INFO_FMT( "no credential source configured, using default rtc config" );
                return decode(default_rtc_config);
            }
        }, source);
        if (fallback)
            source = default_source{};
        build();
        current = config;
        LOG_INFO_FMT( "initial rtc config ({}): {} stun, {} turn server(s)", source_name(source), config.stun_servers.size(), config.turn_servers.size() );
        return config;
    }

    void start() {
        for (auto* monitor : monitors())
            monitor->start();
    }

    void stop() {
        for (auto* monitor : monitors())
            monitor->stop();
    }

    credential_source const& get_source() const { return source; }
    rtc_config_t const& get_current() const { return current; }

    std::vector<credential_monitor*> monitors() const {
        std::vector<credential_monitor*> result;
        if (hmac) result.push_back(hmac.get());
        if (coturn) result.push_back(coturn.get());
        if (file) result.push_back(file.get());
        return result;
    }

    // runs on the event loop
    credentials_handler_t on_rtc_config{ nullptr };
    std::function<bool(std::string const&)> file_exists{ [](std::string const& path) { return std::filesystem::exists(path); } };

    std::unique_ptr<hmac_monitor> hmac;
    std::unique_ptr<coturn_monitor> coturn;
    std::unique_ptr<file_monitor> file;

private:
    void build() {
        auto const* hmac_src{ std::get_if<hmac_source>(&source) };
        auto const* rest_src{ std::get_if<rest_source>(&source) };
        hmac = std::make_unique<hmac_monitor>(hmac_src ? hmac_src->params : hmac_params_t{}, params.period, hmac_src != nullptr);
        coturn = std::make_unique<coturn_monitor>(rest_src ? rest_src->params : rest_params_t{}, params.period, rest_src != nullptr);
        file = std::make_unique<file_monitor>(params.rtc_config_json, std::holds_alternative<file_source>(source));
        for (auto* monitor : monitors()) {
            monitor->on_credentials = [this](rtc_config_t const& config) {
                post([this, config]() {
                    current = config;
                    if (on_rtc_config)
                        on_rtc_config(config);
                });
            };
        }
    }

    source_params_t params;
    post_t post;
    credential_source source{ default_source{} };
    rtc_config_t current;
};

} // namespace ice

#endif // #ifndef __MONITOR_HPP
