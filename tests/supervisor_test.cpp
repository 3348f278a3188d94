#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <iterator>
#include <algorithm>

#include <gtest/gtest.h>

#include <gst.hpp>
#include <supervisor.hpp>

#include <fakes.hpp>

using namespace std::chrono_literals;

namespace {

struct supervisor_fixture : ::testing::Test {
    supervisor_fixture()
        : video(std::make_shared<fakes::fake_pipeline>("video", &journal)),
          audio(std::make_shared<fakes::fake_pipeline>("audio", &journal)),
          video_link(std::make_shared<fakes::fake_transport>("video_link", &journal)),
          audio_link(std::make_shared<fakes::fake_transport>("audio_link", &journal)),
          supervisor(loop, app::peers_t{}, video, audio, video_link, audio_link) {
        supervisor.restart_delay = 0ms;
    }

    // every connect ends the cycle right away, as a refused websocket does
    void end_cycles_on_connect() {
        video_link->on_connect_hook = [this]() {
            loop.post([this]() { video_link->emit_disconnect(); });
        };
    }

    fakes::journal_t journal;
    gst::loop_t loop{ true };
    std::shared_ptr<fakes::fake_pipeline> video;
    std::shared_ptr<fakes::fake_pipeline> audio;
    std::shared_ptr<fakes::fake_transport> video_link;
    std::shared_ptr<fakes::fake_transport> audio_link;
    app::supervisor_t supervisor;
};

long count_of(fakes::journal_t const& journal, std::string const& entry) {
    return std::count(journal.begin(), journal.end(), entry);
}

// journal slices from each video connect to the next one
std::vector<fakes::journal_t> cycles_of(fakes::journal_t const& journal) {
    std::vector<std::size_t> connects;
    for (std::size_t i = 0; i < journal.size(); ++i)
        if (journal[i] == "video_link.connect")
            connects.push_back(i);
    std::vector<fakes::journal_t> cycles;
    for (std::size_t c = 0; c + 1 < connects.size(); ++c)
        cycles.emplace_back(journal.begin() + connects[c], journal.begin() + connects[c + 1]);
    return cycles;
}

} // namespace

TEST_F(supervisor_fixture, restarts_until_iteration_cap) {
    end_cycles_on_connect();
    supervisor.max_iterations = 3;
    supervisor.run();
    EXPECT_EQ(supervisor.get_iterations(), 3);
    EXPECT_EQ(supervisor.get_state(), app::supervisor_t::state_t::idle);
    EXPECT_EQ(video_link->connects, 3);
    EXPECT_EQ(audio_link->connects, 3);
    EXPECT_EQ(video->bus_attached, 3);
    EXPECT_EQ(video->stops, 3);
    EXPECT_EQ(audio->stops, 3);
}

TEST_F(supervisor_fixture, both_pipelines_stop_between_cycles) {
    end_cycles_on_connect();
    supervisor.max_iterations = 3;
    supervisor.run();

    auto const cycles{ cycles_of(journal) };
    ASSERT_EQ(cycles.size(), 2u);
    for (auto const& between : cycles) {
        EXPECT_EQ(count_of(between, "video.stop"), 1);
        EXPECT_EQ(count_of(between, "audio.stop"), 1);
        EXPECT_EQ(count_of(between, "video_link.close"), 1);
        EXPECT_EQ(count_of(between, "audio_link.close"), 1);
    }
}

TEST_F(supervisor_fixture, fatal_signaling_error_stops_video_once) {
    video_link->on_connect_hook = [this]() {
        loop.post([this]() {
            video_link->emit_connect();
            video_link->emit_session(1);
            video_link->emit_error(sig::signaling_error("ERROR server going away"));
        });
    };
    supervisor.max_iterations = 3;
    supervisor.run();
    EXPECT_EQ(video->starts, 3);
    EXPECT_EQ(video->stops, 3);
    EXPECT_EQ(audio->stops, 3);
    auto const cycles{ cycles_of(journal) };
    ASSERT_EQ(cycles.size(), 2u);
    for (auto const& between : cycles) {
        EXPECT_EQ(count_of(between, "video.stop"), 1);
        EXPECT_EQ(count_of(between, "audio.stop"), 1);
    }
}

TEST_F(supervisor_fixture, audio_closure_stops_audio_once_per_cycle) {
    audio_link->on_connect_hook = [this]() {
        loop.post([this]() {
            audio_link->emit_connect();
            audio_link->emit_session(3);
            audio_link->emit_disconnect();
        });
    };
    video_link->on_connect_hook = [this]() {
        loop.post_delayed(30ms, [this]() { video_link->emit_disconnect(); });
    };
    supervisor.max_iterations = 3;
    supervisor.run();
    EXPECT_EQ(audio->audio_starts, 3);
    EXPECT_EQ(audio->stops, 3);
    auto const cycles{ cycles_of(journal) };
    ASSERT_EQ(cycles.size(), 2u);
    for (auto const& between : cycles) {
        EXPECT_EQ(count_of(between, "video.stop"), 1);
        EXPECT_EQ(count_of(between, "audio.stop"), 1);
    }
}

TEST_F(supervisor_fixture, restarted_pipeline_is_stopped_again) {
    supervisor.route_session(3, std::nullopt);
    supervisor.shutdown(nullptr);
    supervisor.route_session(3, std::nullopt);
    supervisor.shutdown(nullptr);
    EXPECT_EQ(audio->stops, 2);
    EXPECT_EQ(video->stops, 1);
}

TEST_F(supervisor_fixture, stop_ends_the_run) {
    video_link->on_connect_hook = [this]() {
        loop.post([this]() { supervisor.stop(); });
    };
    supervisor.restart_delay = 2000ms;
    supervisor.run();
    EXPECT_EQ(supervisor.get_iterations(), 1);
    EXPECT_TRUE(supervisor.is_stopping());
    EXPECT_EQ(supervisor.get_state(), app::supervisor_t::state_t::idle);
}

TEST_F(supervisor_fixture, stop_from_another_thread) {
    std::thread stopper([this]() {
        std::this_thread::sleep_for(100ms);
        supervisor.stop();
    });
    supervisor.run();
    stopper.join();
    EXPECT_EQ(supervisor.get_iterations(), 1);
    EXPECT_EQ(video->stops, 1);
}

TEST_F(supervisor_fixture, pipeline_failure_ends_the_cycle) {
    video_link->on_connect_hook = [this]() {
        loop.post([this]() { video->on_error("internal data stream error"); });
    };
    supervisor.max_iterations = 2;
    supervisor.run();
    EXPECT_EQ(supervisor.get_iterations(), 2);
    EXPECT_EQ(video->stops, 2);
}

TEST_F(supervisor_fixture, audio_closure_only_stops_audio) {
    audio_link->on_connect_hook = [this]() {
        loop.post([this]() { audio_link->emit_disconnect(); });
    };
    video_link->on_connect_hook = [this]() {
        loop.post_delayed(50ms, [this]() { video_link->emit_disconnect(); });
    };
    supervisor.max_iterations = 1;
    supervisor.run();
    EXPECT_EQ(audio->stops, 1);
    EXPECT_EQ(video->stops, 1);
    auto const audio_stop{ std::distance(journal.begin(), std::find(journal.begin(), journal.end(), "audio.stop")) };
    auto const video_stop{ std::distance(journal.begin(), std::find(journal.begin(), journal.end(), "video.stop")) };
    EXPECT_LT(audio_stop, video_stop);
}

TEST_F(supervisor_fixture, session_on_video_channel_starts_video) {
    video_link->on_connect_hook = [this]() {
        loop.post([this]() {
            video_link->emit_connect();
            video_link->emit_session(1);
        });
        loop.post([this]() {
            EXPECT_EQ(supervisor.get_state(), app::supervisor_t::state_t::active);
            supervisor.stop();
        });
    };
    supervisor.run();
    EXPECT_EQ(video->starts, 1);
    EXPECT_EQ(video->audio_starts, 0);
    EXPECT_EQ(audio->starts, 0);
}

TEST_F(supervisor_fixture, unknown_peer_is_a_routing_error) {
    EXPECT_THROW(supervisor.route_session(7, std::nullopt), sig::routing_error);
    EXPECT_EQ(video->starts, 0);
    EXPECT_EQ(audio->starts, 0);
}

TEST_F(supervisor_fixture, audio_peer_starts_audio_only) {
    supervisor.route_session(3, std::nullopt);
    EXPECT_EQ(audio->audio_starts, 1);
    EXPECT_EQ(video->starts, 0);
}

TEST_F(supervisor_fixture, display_is_configured_before_start) {
    supervisor.enable_resize = true;
    supervisor.display.resize = [this](utils::size_r const& size) {
        journal.push_back("display.resize:" + utils::size_to_str(size));
        return true;
    };
    supervisor.display.set_dpi = [this](int dpi) {
        journal.push_back("display.dpi:" + std::to_string(dpi));
        return true;
    };
    supervisor.display.set_cursor_size = [this](int size) {
        journal.push_back("display.cursor:" + std::to_string(size));
        return true;
    };
    supervisor.route_session(1, sig::session_meta{ "1920x1080", 1.5 });
    fakes::journal_t const expected{
        "display.resize:1920x1080",
        "video.resolution:1920x1080",
        "display.dpi:144",
        "display.cursor:24",
        "video.start"
    };
    EXPECT_EQ(journal, expected);
    EXPECT_EQ(supervisor.get_state(), app::supervisor_t::state_t::active);
}

TEST_F(supervisor_fixture, out_of_range_scale_is_ignored) {
    int dpi_calls{ 0 };
    supervisor.enable_resize = true;
    supervisor.display.set_dpi = [&dpi_calls](int) { ++dpi_calls; return true; };
    supervisor.route_session(1, sig::session_meta{ "", 3.0 });
    supervisor.route_session(1, sig::session_meta{ "", 0.5 });
    EXPECT_EQ(dpi_calls, 0);
    EXPECT_EQ(video->starts, 2);
}

TEST_F(supervisor_fixture, failed_resize_is_not_announced) {
    supervisor.enable_resize = true;
    supervisor.display.resize = [](utils::size_r const&) { return false; };
    supervisor.route_session(1, sig::session_meta{ "1280x720", std::nullopt });
    supervisor.route_session(1, sig::session_meta{ "bogus", std::nullopt });
    EXPECT_TRUE(video->resolutions.empty());
    EXPECT_EQ(video->starts, 2);
}

TEST_F(supervisor_fixture, resize_disabled_leaves_display_alone) {
    bool resized{ false };
    supervisor.display.resize = [&resized](utils::size_r const&) { resized = true; return true; };
    supervisor.route_session(1, sig::session_meta{ "1920x1080", 1.0 });
    EXPECT_FALSE(resized);
    EXPECT_EQ(video->starts, 1);
}

TEST_F(supervisor_fixture, credentials_reach_running_pipelines) {
    video->start(false);
    journal.clear();
    ice::rtc_config_t config;
    config.stun_servers = { "stun://turn.example.com:3478" };
    config.turn_servers = { "turn://u:p@turn.example.com:3478", "turns://u:p@turn.example.com:5349" };
    int notified{ 0 };
    supervisor.on_rtc_config = [&notified](ice::rtc_config_t const&) { ++notified; };

    supervisor.apply_credentials(config);

    ASSERT_TRUE(video->rtc);
    ASSERT_TRUE(audio->rtc);
    EXPECT_EQ(video->rtc->turn_servers, config.turn_servers);
    EXPECT_EQ(audio->rtc->turn_servers, config.turn_servers);
    EXPECT_EQ(video->turn_added, config.turn_servers);
    EXPECT_TRUE(audio->turn_added.empty());
    EXPECT_EQ(notified, 1);
}

TEST(display_hooks, resize_needs_a_resize_hook) {
    app::display_hooks_t hooks;
    EXPECT_FALSE(app::resize_enabled(hooks, true));
    EXPECT_FALSE(app::resize_enabled(hooks, false));
    hooks.resize = [](utils::size_r const&) { return true; };
    EXPECT_TRUE(app::resize_enabled(hooks, true));
    EXPECT_FALSE(app::resize_enabled(hooks, false));
}
