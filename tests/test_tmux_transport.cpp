#include <gtest/gtest.h>
#include <tmux/pane_transport.hpp>
#include <core/errors.hpp>
#include "fake_tmux.hpp"
#include <memory>

class TmuxTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        fake = std::make_shared<FakeTmux>();
        transport = std::make_unique<TmuxTransport>(fake);
    }

    std::shared_ptr<FakeTmux> fake;
    std::unique_ptr<TmuxTransport> transport;
};

// ── session_exists ──────────────────────────────────────────

TEST_F(TmuxTransportTest, SessionExists) {
    EXPECT_TRUE(transport->session_exists("myserver"));
    EXPECT_EQ(fake->calls.back(),
              (std::vector<std::string>{"has-session", "-t", "myserver"}));
}

TEST_F(TmuxTransportTest, SessionMissing) {
    fake->has_session = false;
    EXPECT_FALSE(transport->session_exists("nonexistent"));
}

TEST_F(TmuxTransportTest, NoServerMeansMissing) {
    fake->has_session = false;
    fake->has_session_stderr = "no server running on /tmp/tmux-1000/default\n";
    EXPECT_FALSE(transport->session_exists("myserver"));

    fake->has_session_stderr =
        "error connecting to /tmp/tmux-1000/default (No such file or directory)\n";
    EXPECT_FALSE(transport->session_exists("myserver"));
}

TEST_F(TmuxTransportTest, UnreachableSocketIsTransportError) {
    fake->has_session = false;
    fake->has_session_stderr =
        "error connecting to /tmp/tmux-1000/default (Permission denied)\n";
    EXPECT_THROW(transport->session_exists("myserver"), TransportError);
}

TEST_F(TmuxTransportTest, TmuxNotRunnableIsTransportError) {
    fake->run_error = "failed to run tmux: No such file or directory";
    EXPECT_THROW(transport->session_exists("myserver"), TransportError);
    EXPECT_THROW(transport->list_sessions(), TransportError);
}

// ── list_sessions ───────────────────────────────────────────

TEST_F(TmuxTransportTest, ListSessionsSplitsLinesInOrder) {
    fake->list_output = "session1\nsession2\nsession3\n";
    EXPECT_EQ(transport->list_sessions(),
              (std::vector<std::string>{"session1", "session2", "session3"}));
    EXPECT_EQ(fake->calls.back(),
              (std::vector<std::string>{"list-sessions", "-F", "#{session_name}"}));
}

TEST_F(TmuxTransportTest, ListSessionsEmptyWhenNoServer) {
    fake->list_exit = 1;
    EXPECT_TRUE(transport->list_sessions().empty());
}

TEST_F(TmuxTransportTest, ListSessionsSkipsBlankLines) {
    fake->list_output = "a\n\nb\n";
    EXPECT_EQ(transport->list_sessions(), (std::vector<std::string>{"a", "b"}));
}

// ── send_keys ───────────────────────────────────────────────

TEST_F(TmuxTransportTest, SendKeysWithSubmit) {
    transport->send_keys("myserver:0.1", "ls -la", true);
    auto sends = fake->calls_for("send-keys");
    ASSERT_EQ(sends.size(), 2u);
    EXPECT_EQ(sends[0],
              (std::vector<std::string>{"send-keys", "-t", "myserver:0.1", "-l", "--", "ls -la"}));
    EXPECT_EQ(sends[1],
              (std::vector<std::string>{"send-keys", "-t", "myserver:0.1", "Enter"}));
}

TEST_F(TmuxTransportTest, SendKeysWithoutSubmit) {
    transport->send_keys("myserver", "partial text", false);
    auto sends = fake->calls_for("send-keys");
    ASSERT_EQ(sends.size(), 1u);
    EXPECT_FALSE(contains_arg(sends[0], "Enter"));
    EXPECT_TRUE(contains_arg(sends[0], "partial text"));
}

TEST_F(TmuxTransportTest, SendEmptyTextOnlyPressesEnter) {
    transport->send_keys("myserver", "", true);
    auto sends = fake->calls_for("send-keys");
    ASSERT_EQ(sends.size(), 1u);
    EXPECT_TRUE(contains_arg(sends[0], "Enter"));

    fake->calls.clear();
    transport->send_keys("myserver", "", false);
    EXPECT_TRUE(fake->calls_for("send-keys").empty());
}

TEST_F(TmuxTransportTest, SendKeysEscapesTrailingSemicolon) {
    transport->send_keys("myserver", "ls;", false);
    auto sends = fake->calls_for("send-keys");
    ASSERT_EQ(sends.size(), 1u);
    EXPECT_EQ(sends[0].back(), "ls\\;");

    EXPECT_EQ(TmuxTransport::escape_trailing_semicolon("a;b"), "a;b");
    EXPECT_EQ(TmuxTransport::escape_trailing_semicolon(";"), "\\;");
}

TEST_F(TmuxTransportTest, SendKeysFailureThrows) {
    fake->send_fails = true;
    EXPECT_THROW(transport->send_keys("gone:9", "ls", true), TransportError);
}

// ── capture ─────────────────────────────────────────────────

TEST_F(TmuxTransportTest, CaptureVisibleRegion) {
    fake->captures = {"\x1b[32mraw\x1b[0m\n"};
    EXPECT_EQ(transport->capture("myserver", CaptureScope::Visible), "\x1b[32mraw\x1b[0m\n");
    EXPECT_EQ(fake->calls.back(),
              (std::vector<std::string>{"capture-pane", "-p", "-J", "-t", "myserver"}));
}

TEST_F(TmuxTransportTest, CaptureFullHistory) {
    transport->capture("myserver", CaptureScope::History);
    EXPECT_EQ(fake->calls.back(),
              (std::vector<std::string>{"capture-pane", "-p", "-J", "-t", "myserver", "-S", "-"}));
}

TEST_F(TmuxTransportTest, CaptureFailureThrows) {
    fake->capture_fails = true;
    EXPECT_THROW(transport->capture("myserver", CaptureScope::Visible), TransportError);
}

// ── TmuxProcessRunner argv ──────────────────────────────────

TEST(TmuxProcessRunner, SocketOptionsPrecedeSubcommand) {
    TmuxSettings s;
    EXPECT_EQ(TmuxProcessRunner(s).build_args({"list-sessions"}),
              (std::vector<std::string>{"list-sessions"}));

    s.socket_name = "agents";
    EXPECT_EQ(TmuxProcessRunner(s).build_args({"has-session", "-t", "x"}),
              (std::vector<std::string>{"-L", "agents", "has-session", "-t", "x"}));

    s.socket_path = "/run/tmux.sock";
    EXPECT_EQ(TmuxProcessRunner(s).build_args({"list-sessions"}),
              (std::vector<std::string>{"-S", "/run/tmux.sock", "list-sessions"}));
}

TEST(TmuxProcessRunner, MissingBinaryIsAnError) {
    TmuxSettings s;
    s.binary = "/nonexistent/tmuxbridge-no-such-tmux";
    s.command_timeout_ms = 2000;
    TmuxTransport transport(std::make_shared<TmuxProcessRunner>(s));
    EXPECT_THROW(transport.list_sessions(), TransportError);
}
