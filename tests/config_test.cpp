#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <cstdlib>
#include <fstream>
#include <filesystem>

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <gateway.hpp>

#include <fakes.hpp>

namespace {

std::vector<const char*> const tracked_env{
    "SIGNALING_HOST", "LISTEN_PORT", "ENABLE_HTTPS_WEB", "TURN_HOST", "TURN_PORT",
    "TURN_PROTOCOL", "TURN_SHARED_SECRET", "RTC_PERIOD", "TURN_TTL", "WEBRTC_ENABLE_RESIZE"
};

struct config_fixture : ::testing::Test {
    void SetUp() override {
        for (auto* name : tracked_env)
            unsetenv(name);
    }
    void TearDown() override {
        for (auto* name : tracked_env)
            unsetenv(name);
    }
};

// parses argv into a config through the same path as main()
app::gateway_t::config_t parse_args(std::vector<const char*> argv) {
    app::gateway_t::config_t config;
    opts::parser options(static_cast<int>(argv.size()), argv.data(), "rtcgw-gateway");
    meta::add_options(config, options, config.descriptions);
    options.add_default("");
    EXPECT_TRUE(options.parse());
    meta::do_parse(config, options.get_parsed());
    return config;
}

} // namespace

TEST_F(config_fixture, defaults) {
    app::gateway_t::config_t const config;
    EXPECT_EQ(config.signaling_host, "127.0.0.1");
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(config.enable_https);
    EXPECT_EQ(config.turn_protocol, "udp");
    EXPECT_EQ(config.rtc_period, 60);
    EXPECT_EQ(config.turn_ttl, 86400);
    EXPECT_EQ(config.signaling_url(), "ws://127.0.0.1:8080/ws");
    EXPECT_EQ(config.descriptions.size(), 29u);
}

TEST_F(config_fixture, environment_overrides_defaults) {
    setenv("SIGNALING_HOST", "signal.example.com", 1);
    setenv("LISTEN_PORT", "9443", 1);
    setenv("ENABLE_HTTPS_WEB", "True", 1);
    setenv("TURN_PORT", "not-a-number", 1);
    app::gateway_t::config_t const config;
    EXPECT_EQ(config.signaling_url(), "wss://signal.example.com:9443/ws");
    EXPECT_EQ(config.turn_port, 0);
}

TEST_F(config_fixture, source_params_carry_turn_settings) {
    app::gateway_t::config_t config;
    config.turn_host = "turn.example.com";
    config.turn_port = 3478;
    config.turn_shared_secret = "secret";
    config.rtc_period = 0;
    config.turn_ttl = 3600;
    auto const params{ config.source_params() };
    EXPECT_EQ(params.turn_host, "turn.example.com");
    EXPECT_EQ(params.turn_port, 3478);
    EXPECT_EQ(params.turn_shared_secret, "secret");
    EXPECT_EQ(params.period, std::chrono::seconds(60));
    EXPECT_EQ(params.ttl, std::chrono::seconds(3600));
}

TEST_F(config_fixture, command_line_parsing) {
    auto const config{ parse_args({ "rtcgw-gateway", "--turn_host=turn.example.com", "--turn_port=5349", "--turn_tls=true", "--framerate=60" }) };
    EXPECT_EQ(config.turn_host, "turn.example.com");
    EXPECT_EQ(config.turn_port, 5349);
    EXPECT_TRUE(config.turn_tls);
    EXPECT_EQ(config.framerate, 60);
    EXPECT_EQ(config.encoder, "x264enc");
}

TEST_F(config_fixture, json_file_fills_missing_arguments) {
    auto const dir{ std::filesystem::temp_directory_path() / "rtcgw_tests" };
    std::filesystem::create_directories(dir);
    auto const path{ (dir / "gateway.json").string() };
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"turn_host": "json.example.com", "port": 9000, "enable_resize": true})";
    }
    std::string const config_arg{ "--config=" + path };
    auto const config{ parse_args({ "rtcgw-gateway", config_arg.c_str(), "--port=7000" }) };
    EXPECT_EQ(config.turn_host, "json.example.com");
    EXPECT_EQ(config.port, 7000);
    EXPECT_TRUE(config.enable_resize);
}

TEST_F(config_fixture, help_table_masks_secrets) {
    setenv("TURN_SHARED_SECRET", "hunter2", 1);
    app::gateway_t::config_t config;
    std::vector<const char*> argv{ "rtcgw-gateway" };
    opts::parser options(static_cast<int>(argv.size()), argv.data(), "rtcgw-gateway");
    meta::add_options(config, options, config.descriptions);
    options.add_default("");
    ASSERT_TRUE(options.parse());

    auto const help{ meta::make_help(config, options.get_options()) };
    ASSERT_TRUE(help.is_array());
    EXPECT_EQ(help.size(), 29u);
    bool seen_secret{ false };
    for (auto const& row : help) {
        if (row["key"] == "turn_shared_secret") {
            seen_secret = true;
            EXPECT_EQ(row["value"], "***");
            EXPECT_EQ(row["default"], "***");
        }
        if (row["key"] == "port") {
            EXPECT_EQ(row["type"], "number");
            EXPECT_EQ(row["value"], 8080);
        }
        EXPECT_EQ(row.dump().find("hunter2"), std::string::npos);
    }
    EXPECT_TRUE(seen_secret);
}

TEST_F(config_fixture, published_descriptor_is_served) {
    app::gateway_t gateway(app::gateway_t::config_t{});
    auto const rtc{ ice::decode(ice::encode_hmac("turn.example.com", 3478, "secret", "1700000000:alice")) };
    gateway.publish(rtc);
    auto const expected{ nlohmann::json::parse(rtc.json) };
    EXPECT_EQ(gateway.get_published(), expected);

    int const port{ 38471 };
    ASSERT_TRUE(gateway.server_start(port));
    httplib::Client client("127.0.0.1", port);
    auto const turn{ client.Get("/turn") };
    ASSERT_TRUE(turn);
    EXPECT_EQ(turn->status, 200);
    EXPECT_EQ(nlohmann::json::parse(turn->body), expected);
    auto const health{ client.Get("/health") };
    ASSERT_TRUE(health);
    EXPECT_EQ(health->body, "OK");
    gateway.server_stop();
}

TEST_F(config_fixture, saved_setting_is_read_back_on_next_start) {
    auto const dir{ std::filesystem::temp_directory_path() / "rtcgw_tests" };
    std::filesystem::create_directories(dir);
    auto const path{ (dir / "saved.json").string() };
    std::filesystem::remove(path);

    ASSERT_TRUE(opts::set_json_value(path, "framerate", 60));
    ASSERT_TRUE(opts::set_json_value(path, "video_bitrate", 4000));
    ASSERT_TRUE(opts::set_json_value(path, "framerate", 24));

    std::ifstream in(path);
    auto const saved{ nlohmann::json::parse(in) };
    EXPECT_EQ(saved["framerate"], 24);
    EXPECT_EQ(saved["video_bitrate"], 4000);

    std::string const config_arg{ "--config=" + path };
    auto const config{ parse_args({ "rtcgw-gateway", config_arg.c_str() }) };
    EXPECT_EQ(config.framerate, 24);
    EXPECT_EQ(config.video_bitrate, 4000);
}

TEST_F(config_fixture, saving_into_a_malformed_file_fails) {
    auto const dir{ std::filesystem::temp_directory_path() / "rtcgw_tests" };
    std::filesystem::create_directories(dir);
    auto const path{ (dir / "broken.json").string() };
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    EXPECT_FALSE(opts::set_json_value(path, "framerate", 60));
}

TEST_F(config_fixture, viewer_settings_are_saved_and_metrics_served) {
    auto const dir{ std::filesystem::temp_directory_path() / "rtcgw_tests" };
    std::filesystem::create_directories(dir);
    auto const path{ (dir / "viewer.json").string() };
    std::filesystem::remove(path);

    app::gateway_t gateway(app::gateway_t::config_t{});
    gateway.settings_file = path;
    auto video{ std::make_shared<fakes::fake_pipeline>("video") };
    auto audio{ std::make_shared<fakes::fake_pipeline>("audio") };
    app::input_control_t control(video, audio);
    gateway.wire_control(control);

    EXPECT_TRUE(control.handle(R"({"type": "audio_bitrate", "data": {"value": 96000}})"));
    EXPECT_TRUE(control.handle(R"({"type": "client_fps", "data": {"value": 57.5}})"));
    EXPECT_EQ(audio->audio_bitrate, 96000);
    std::ifstream in(path);
    auto const saved{ nlohmann::json::parse(in) };
    EXPECT_EQ(saved["audio_bitrate"], 96000);

    int const port{ 38472 };
    ASSERT_TRUE(gateway.server_start(port));
    httplib::Client client("127.0.0.1", port);
    auto const res{ client.Get("/metrics") };
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->body.find("rtcgw_client_fps 57.5\n"), std::string::npos);
    EXPECT_NE(res->body.find("# TYPE rtcgw_cpu_percent gauge"), std::string::npos);
    gateway.server_stop();
}

TEST(utils_size, parses_resolutions) {
    EXPECT_EQ(utils::str_to_size("1920x1080"), (utils::size_r{ 1920, 1080 }));
    EXPECT_EQ(utils::str_to_size("1280*720"), (utils::size_r{ 1280, 720 }));
    EXPECT_FALSE(utils::str_to_size("wide").valid());
    EXPECT_FALSE(utils::str_to_size("0x1080").valid());
    EXPECT_EQ(utils::size_to_str({ 800, 600 }), "800x600");
}
