#pragma once

#ifndef __ICE_HPP
#define __ICE_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <chrono>
#include <stdexcept>

// glib uri
#include <glib.h>
// openssl
#include <openssl/evp.h>
#include <openssl/hmac.h>
// json
#include <nlohmann/json.hpp>
// httplib
#include <httplib.h>

#include <log.hpp>
#include <gst.hpp>
#include <utils.hpp>

namespace ice {

// ICE server descriptor errors

struct config_format_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct credential_fetch_error : std::runtime_error {
    credential_fetch_error(int status, std::string reason, std::string body)
        : std::runtime_error(fmt::format("credential fetch failed: {} {} {}", status, reason, body))
        , status(status), reason(std::move(reason)), body(std::move(body)) {}

    int status;
    std::string reason;
    std::string body;
};

// decoded descriptor: webrtcbin ready uris plus the untouched document
struct rtc_config_t {
    std::vector<std::string> stun_servers;
    std::vector<std::string> turn_servers;
    std::string json;

    std::string stun_server() const { return stun_servers.empty() ? std::string() : stun_servers.front(); }
};

inline constexpr char const* default_stun_host{ "stun.l.google.com" };
inline constexpr int default_stun_port{ 19302 };
inline constexpr int default_turn_port{ 3478 };
inline constexpr int default_turns_port{ 5349 };
inline constexpr std::int64_t default_lifetime{ 86400 };

inline std::string const default_rtc_config{ R"({
  "lifetimeDuration": "86400s",
  "iceServers": [
    {
      "urls": [
        "stun:stun.l.google.com:19302"
      ]
    }
  ],
  "blockStatus": "NOT_BLOCKED",
  "iceTransportPolicy": "all"
})" };

// percent-encodes everything outside the unreserved set
inline std::string url_quote(std::string const& value) {
    gst::safe_ptr<char> escaped;
    escaped.attach(g_uri_escape_string(value.c_str(), nullptr, FALSE));
    return escaped ? std::string(escaped.get()) : std::string();
}

inline std::string host_literal(std::string const& host) {
    return utils::str_exists(host, ":") ? "[" + host + "]" : host;
}

struct ice_url_t {
    std::string scheme;
    std::string host;
    int port{ 0 };
};

// "turn:host:port?transport=udp" style ice url, the query is dropped
inline ice_url_t parse_ice_url(std::string const& url) {
    auto const colon{ url.find(':') };
    if (colon == std::string::npos || colon == 0)
        throw config_format_error(fmt::format("invalid ice url: '{}'", url));
    ice_url_t result;
    result.scheme = utils::str_lower(url.substr(0, colon));
    std::string rest{ url.substr(colon + 1) };
    if (!utils::str_starts(rest, "//"))
        rest = "//" + rest;
    gst::safe_ptr<char> scheme, host;
    gint port{ -1 };
    gst::safe_ptr<GError> err;
    std::string const network{ result.scheme + ":" + rest };
    if (!g_uri_split_network(network.c_str(), G_URI_FLAGS_NONE, scheme.get_ref(), host.get_ref(), &port, err.get_ref()) || !host)
        throw config_format_error(fmt::format("invalid ice url: '{}': {}", url, err ? err->message : "no host"));
    result.host = host.get();
    if (result.host.empty())
        throw config_format_error(fmt::format("invalid ice url: '{}': empty host", url));
    result.port = port > 0 ? port : (result.scheme == "turns" ? default_turns_port : default_turn_port);
    return result;
}

inline std::string make_stun_uri(ice_url_t const& url) {
    return fmt::format("stun://{}:{}", host_literal(url.host), url.port);
}

inline std::string make_turn_uri(ice_url_t const& url, std::string const& username, std::string const& credential) {
    return fmt::format("{}://{}:{}@{}:{}", url.scheme, url_quote(username), url_quote(credential), host_literal(url.host), url.port);
}

// parses an iceServers document into stun/turn uris for webrtcbin
inline rtc_config_t decode(std::string const& data) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(data);
    } catch (const nlohmann::json::parse_error& e) {
        throw config_format_error(fmt::format("rtc config is not json: {}", e.what()));
    }
    if (!doc.is_object() || !doc.contains("iceServers"))
        throw config_format_error("rtc config has no iceServers");
    auto const& servers{ doc["iceServers"] };
    if (!servers.is_array())
        throw config_format_error("rtc config iceServers is not an array");

    rtc_config_t result;
    result.json = data;
    for (auto const& server : servers) {
        if (!server.is_object() || !server.contains("urls"))
            throw config_format_error("ice server without urls");
        std::vector<std::string> urls;
        auto const& field{ server["urls"] };
        if (field.is_string()) {
            urls.push_back(field.get<std::string>());
        } else if (field.is_array()) {
            for (auto const& url : field) {
                if (!url.is_string())
                    throw config_format_error("ice server url is not a string");
                urls.push_back(url.get<std::string>());
            }
        } else {
            throw config_format_error("ice server urls is neither string nor array");
        }
        for (auto const& url : urls) {
            auto const parsed{ parse_ice_url(url) };
            if (parsed.scheme == "stun") {
                result.stun_servers.push_back(make_stun_uri(parsed));
            } else if (parsed.scheme == "turn" || parsed.scheme == "turns") {
                if (!server.contains("username") || !server.contains("credential") ||
                    !server["username"].is_string() || !server["credential"].is_string())
                    throw config_format_error(fmt::format("turn server '{}' without username/credential", url));
                result.turn_servers.push_back(make_turn_uri(parsed, server["username"].get<std::string>(), server["credential"].get<std::string>()));
            } else {
                LOG_WARNING_FMT( "skipping ice url with unsupported scheme: {}", url );
            }
        }
    }
    return result;
}

// base64(HMAC-SHA1(secret, username)), the coturn use-auth-secret credential
inline std::string make_turn_credential(std::string const& secret, std::string const& username) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len{ 0 };
    if (!HMAC(EVP_sha1(), secret.data(), static_cast<int>(secret.size()),
              reinterpret_cast<const unsigned char*>(username.data()), username.size(), digest, &digest_len))
        throw std::runtime_error("HMAC-SHA1 failed");
    std::string encoded(4 * ((digest_len + 2) / 3), '\0');
    int const len{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()), digest, static_cast<int>(digest_len)) };
    encoded.resize(static_cast<std::size_t>(len));
    return encoded;
}

// "<unix expiry>:<user>" username of the coturn REST convention
inline std::string make_ephemeral_username(std::string const& user, std::int64_t expiry) {
    return fmt::format("{}:{}", expiry, user);
}

inline nlohmann::json make_document(nlohmann::json servers, std::int64_t lifetime) {
    nlohmann::json doc;
    doc["lifetimeDuration"] = fmt::format("{}s", lifetime);
    doc["iceServers"] = std::move(servers);
    doc["blockStatus"] = "NOT_BLOCKED";
    doc["iceTransportPolicy"] = "all";
    return doc;
}

inline std::string turn_url(std::string const& host, int port, std::string const& protocol, bool tls) {
    return fmt::format("{}:{}:{}?transport={}", tls ? "turns" : "turn", host_literal(host), port, protocol);
}

// username is used verbatim: pass make_ephemeral_username() for time limited credentials
inline std::string encode_hmac(std::string const& host, int port, std::string const& secret, std::string const& username,
                               std::string const& protocol = "udp", bool tls = false, std::int64_t lifetime = default_lifetime) {
    nlohmann::json stun;
    stun["urls"] = nlohmann::json::array({ fmt::format("stun:{}:{}", host_literal(host), port) });
    nlohmann::json turn;
    turn["urls"] = nlohmann::json::array({ turn_url(host, port, protocol, tls) });
    turn["username"] = username;
    turn["credential"] = make_turn_credential(secret, username);
    nlohmann::json servers = nlohmann::json::array({ stun, turn });
    return make_document(std::move(servers), lifetime).dump(2);
}

// long-term (non HMAC) TURN credentials
inline std::string encode_static(std::string const& host, int port, std::string const& username, std::string const& password,
                                 std::string const& protocol = "udp", bool tls = false) {
    nlohmann::json stun;
    stun["urls"] = nlohmann::json::array({
        fmt::format("stun:{}:{}", default_stun_host, default_stun_port),
        fmt::format("stun:{}:{}", host_literal(host), port)
    });
    nlohmann::json turn;
    turn["urls"] = nlohmann::json::array({ turn_url(host, port, protocol, tls) });
    turn["username"] = username;
    turn["credential"] = password;
    nlohmann::json servers = nlohmann::json::array({ stun, turn });
    return make_document(std::move(servers), default_lifetime).dump(2);
}

// GET the descriptor from a credential REST service, the user goes in the auth header
inline rtc_config_t fetch_rest(std::string const& uri, std::string const& username, std::string const& auth_header_name,
                               std::chrono::seconds timeout = std::chrono::seconds(10)) {
    gst::safe_ptr<GError> err;
    gst::safe_ptr<GUri> parsed;
    parsed.attach(g_uri_parse(uri.c_str(), G_URI_FLAGS_NONE, err.get_ref()));
    if (!parsed || !g_uri_get_host(parsed))
        throw credential_fetch_error(0, fmt::format("invalid uri '{}': {}", uri, err ? err->message : "no host"), "");
    std::string const scheme{ g_uri_get_scheme(parsed) };
    std::string origin{ fmt::format("{}://{}", scheme, host_literal(g_uri_get_host(parsed))) };
    if (g_uri_get_port(parsed) > 0)
        origin += fmt::format(":{}", g_uri_get_port(parsed));
    std::string path{ g_uri_get_path(parsed) };
    if (path.empty())
        path = "/";
    if (g_uri_get_query(parsed))
        path += fmt::format("?{}", g_uri_get_query(parsed));

    httplib::Client client(origin);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    httplib::Headers headers{ { auth_header_name, username } };
    LOG_DEBUG_FMT( "fetching rtc config from {}{}", origin, path );
    auto res = client.Get(path, headers);
    if (!res)
        throw credential_fetch_error(0, httplib::to_string(res.error()), "");
    if (res->status >= 400)
        throw credential_fetch_error(res->status, res->reason, res->body);
    if (res->body.empty())
        throw credential_fetch_error(res->status, "empty response", "");
    return decode(res->body);
}

} // namespace ice

#endif // #ifndef __ICE_HPP
