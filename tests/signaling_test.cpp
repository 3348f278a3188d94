#include <chrono>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include <gst.hpp>
#include <signaling.hpp>
#include <ws.hpp>

#include <fakes.hpp>

using namespace std::chrono_literals;

namespace {

struct channel_fixture : ::testing::Test {
    channel_fixture()
        : pipeline(std::make_shared<fakes::fake_pipeline>("video")),
          link(std::make_shared<fakes::fake_transport>("video")),
          channel("video", 0, 1, link, loop, pipeline) {
        channel.retry_delay = 20ms;
        channel.on_closed = [this]() { ++closed; };
        channel.on_session = [this](int peer, sig::meta_opt const& meta) {
            sessions.push_back(peer);
            last_meta = meta;
        };
    }

    gst::loop_t loop{ true };
    std::shared_ptr<fakes::fake_pipeline> pipeline;
    std::shared_ptr<fakes::fake_transport> link;
    sig::channel channel;
    int closed{ 0 };
    std::vector<int> sessions;
    sig::meta_opt last_meta;
};

// which error type the transport raised
std::string error_kind(std::exception_ptr e) {
    try {
        std::rethrow_exception(e);
    } catch (const sig::peer_absent_error&) {
        return "peer_absent";
    } catch (const sig::signaling_error&) {
        return "signaling";
    } catch (const std::exception&) {
        return "other";
    }
}

} // namespace

TEST_F(channel_fixture, hello_calls_the_remote_peer) {
    channel.connect();
    EXPECT_EQ(link->connects, 1);
    EXPECT_EQ(channel.state(), sig::session_state::connecting);
    link->emit_connect();
    ASSERT_EQ(link->calls.size(), 1u);
    EXPECT_EQ(link->calls[0], 1);
    EXPECT_EQ(channel.state(), sig::session_state::negotiating);
}

TEST_F(channel_fixture, absent_peer_errors_coalesce_into_one_retry) {
    channel.connect();
    link->emit_connect();
    link->emit_error(sig::peer_absent_error("ERROR peer '1' not found"));
    link->emit_error(sig::peer_absent_error("ERROR peer '1' not found"));
    EXPECT_EQ(channel.state(), sig::session_state::reconnecting);
    EXPECT_TRUE(channel.retry_pending());
    fakes::run_for(loop, 100ms);
    EXPECT_EQ(link->calls.size(), 2u);
    EXPECT_EQ(channel.retries(), 1);
    EXPECT_FALSE(channel.retry_pending());
    EXPECT_EQ(channel.state(), sig::session_state::negotiating);
    EXPECT_EQ(closed, 0);
}

TEST_F(channel_fixture, keeps_retrying_while_peer_is_absent) {
    link->on_call_hook = [this](int) {
        link->emit_error(sig::peer_absent_error("ERROR peer '1' not found"));
    };
    channel.connect();
    link->emit_connect();
    fakes::run_for(loop, 300ms);
    EXPECT_GE(channel.retries(), 3);
    EXPECT_EQ(link->calls.size(), static_cast<std::size_t>(channel.retries()) + 1);
    EXPECT_EQ(pipeline->stops, 0);
    EXPECT_EQ(closed, 0);
}

TEST_F(channel_fixture, fatal_error_tears_down_once) {
    channel.connect();
    link->emit_connect();
    link->emit_error(sig::signaling_error("ERROR invalid peer"));
    EXPECT_EQ(channel.state(), sig::session_state::disconnected);
    EXPECT_EQ(pipeline->stops, 1);
    EXPECT_EQ(link->closes, 1);
    EXPECT_EQ(closed, 1);
    link->emit_disconnect();
    EXPECT_EQ(closed, 1);
}

TEST_F(channel_fixture, fatal_error_cancels_pending_retry) {
    channel.connect();
    link->emit_connect();
    link->emit_error(sig::peer_absent_error("ERROR peer '1' not found"));
    link->emit_error(sig::signaling_error("ERROR server going away"));
    EXPECT_FALSE(channel.retry_pending());
    fakes::run_for(loop, 80ms);
    EXPECT_EQ(link->calls.size(), 1u);
}

TEST_F(channel_fixture, disconnect_cancels_retry_and_reports_closed) {
    channel.connect();
    link->emit_connect();
    link->emit_error(sig::peer_absent_error("ERROR peer '1' not found"));
    ASSERT_TRUE(channel.retry_pending());
    link->emit_disconnect();
    EXPECT_FALSE(channel.retry_pending());
    EXPECT_EQ(channel.state(), sig::session_state::disconnected);
    EXPECT_EQ(closed, 1);
    fakes::run_for(loop, 80ms);
    EXPECT_EQ(link->calls.size(), 1u);
}

TEST_F(channel_fixture, explicit_close_is_not_reported) {
    channel.connect();
    link->emit_connect();
    channel.close();
    EXPECT_EQ(link->closes, 1);
    link->emit_disconnect();
    EXPECT_EQ(closed, 0);

    // a new connect re-arms the report
    channel.connect();
    link->emit_disconnect();
    EXPECT_EQ(closed, 1);
}

TEST_F(channel_fixture, session_for_other_peer_is_ignored) {
    channel.connect();
    link->emit_connect();
    link->emit_session(3);
    EXPECT_TRUE(sessions.empty());
    EXPECT_EQ(channel.state(), sig::session_state::negotiating);

    link->emit_session(1, sig::session_meta{ "1920x1080", 1.5 });
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0], 1);
    EXPECT_EQ(channel.state(), sig::session_state::active);
    ASSERT_TRUE(last_meta);
    EXPECT_EQ(last_meta->res, "1920x1080");
    EXPECT_DOUBLE_EQ(last_meta->scale.value_or(0), 1.5);
}

TEST_F(channel_fixture, session_cancels_pending_retry) {
    channel.connect();
    link->emit_connect();
    link->emit_error(sig::peer_absent_error("ERROR peer '1' not found"));
    link->emit_session(1);
    EXPECT_FALSE(channel.retry_pending());
    EXPECT_EQ(channel.state(), sig::session_state::active);
    fakes::run_for(loop, 80ms);
    EXPECT_EQ(link->calls.size(), 1u);
}

TEST_F(channel_fixture, negotiation_messages_are_relayed) {
    pipeline->emit_sdp("offer", "v=0 local");
    pipeline->emit_ice(0, "candidate:1 1 UDP 1 10.0.0.1 5000 typ host");
    ASSERT_EQ(link->sent_sdp.size(), 1u);
    EXPECT_EQ(link->sent_sdp[0].first, "offer");
    ASSERT_EQ(link->sent_ice.size(), 1u);
    EXPECT_EQ(link->sent_ice[0].first, 0);

    link->emit_sdp("answer", "v=0 remote");
    link->emit_ice(1, "candidate:2 1 UDP 1 10.0.0.2 5002 typ host");
    ASSERT_EQ(pipeline->remote_sdp.size(), 1u);
    EXPECT_EQ(pipeline->remote_sdp[0].first, "answer");
    EXPECT_EQ(pipeline->remote_sdp[0].second, "v=0 remote");
    ASSERT_EQ(pipeline->remote_ice.size(), 1u);
    EXPECT_EQ(pipeline->remote_ice[0].first, 1);
}

TEST(session_meta, decodes_resolution_and_scale) {
    auto const meta{ sig::parse_session_meta("eyJyZXMiOiIxOTIweDEwODAiLCJzY2FsZSI6MS41fQ==") };
    ASSERT_TRUE(meta);
    EXPECT_EQ(meta->res, "1920x1080");
    ASSERT_TRUE(meta->scale);
    EXPECT_DOUBLE_EQ(*meta->scale, 1.5);
}

TEST(session_meta, empty_or_invalid) {
    EXPECT_FALSE(sig::parse_session_meta(""));
    // base64 of "[1,2]"
    EXPECT_FALSE(sig::parse_session_meta("WzEsMl0="));
}

struct ws_fixture : ::testing::Test {
    ws_fixture(): transport(std::make_shared<sig::ws_transport>("ws://127.0.0.1:1/ws", 0, loop)) {
        transport->on_connect = [this]() { ++connected; };
        transport->on_error = [this](std::exception_ptr e) { errors.push_back(error_kind(e)); };
        transport->on_session = [this](int peer, sig::meta_opt const& meta) {
            sessions.push_back(peer);
            last_meta = meta;
        };
        transport->on_sdp = [this](std::string const& type, std::string const& sdp) { sdps.emplace_back(type, sdp); };
        transport->on_ice = [this](int mline, std::string const& candidate) { ices.emplace_back(mline, candidate); };
    }

    gst::loop_t loop{ true };
    std::shared_ptr<sig::ws_transport> transport;
    int connected{ 0 };
    std::vector<std::string> errors;
    std::vector<int> sessions;
    sig::meta_opt last_meta;
    std::vector<std::pair<std::string, std::string>> sdps;
    std::vector<std::pair<int, std::string>> ices;
};

TEST_F(ws_fixture, hello_reply_means_registered) {
    transport->handle_message("HELLO");
    transport->handle_message("HELLO\r\n");
    EXPECT_EQ(connected, 2);
    EXPECT_TRUE(errors.empty());
}

TEST_F(ws_fixture, session_ok_reports_the_called_peer) {
    transport->setup_call(1);
    transport->handle_message("SESSION_OK");
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0], 1);
    EXPECT_FALSE(last_meta);

    transport->setup_call(3);
    transport->handle_message("SESSION_OK eyJyZXMiOiIxOTIweDEwODAiLCJzY2FsZSI6MS41fQ==");
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[1], 3);
    ASSERT_TRUE(last_meta);
    EXPECT_EQ(last_meta->res, "1920x1080");
}

TEST_F(ws_fixture, errors_are_classified) {
    transport->handle_message("ERROR peer '1' not found");
    transport->handle_message("ERROR invalid msg");
    transport->handle_message("garbage");
    transport->handle_message(R"({"sdp": {"type": 1}})");
    std::vector<std::string> const expected{ "peer_absent", "signaling", "signaling", "signaling" };
    EXPECT_EQ(errors, expected);
}

TEST_F(ws_fixture, negotiation_messages) {
    transport->handle_message(R"({"sdp": {"type": "answer", "sdp": "v=0"}})");
    transport->handle_message(R"({"ice": {"candidate": "candidate:1 1 UDP 1 10.0.0.1 5000 typ host", "sdpMLineIndex": 0}})");
    transport->handle_message(R"({"other": 1})");
    ASSERT_EQ(sdps.size(), 1u);
    EXPECT_EQ(sdps[0].first, "answer");
    EXPECT_EQ(sdps[0].second, "v=0");
    ASSERT_EQ(ices.size(), 1u);
    EXPECT_EQ(ices[0].first, 0);
    EXPECT_TRUE(errors.empty());
}

TEST_F(ws_fixture, sending_without_socket_is_dropped) {
    EXPECT_NO_THROW(transport->send_sdp("offer", "v=0"));
    EXPECT_NO_THROW(transport->send_ice(0, "candidate"));
    EXPECT_NO_THROW(transport->close());
    EXPECT_EQ(transport->get_url(), "ws://127.0.0.1:1/ws");
}
