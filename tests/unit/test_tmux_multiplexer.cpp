#include <gtest/gtest.h>

#include "mux/tmux_multiplexer.hpp"
#include "process/process_registry.hpp"
#include "terminal/pty_bridge.hpp"
#include "util/eventually.hpp"

#include <chrono>
#include <mutex>
#include <unistd.h>

using namespace termpanel;
using namespace termpanel::mux;

namespace
{

// Records argv and answers with canned results instead of running tmux.
class ScriptedRunner : public process::CommandRunner
{
   public:
    process::CommandResult run(const std::vector<std::string>& argv) const override
    {
        std::lock_guard lock(mu_);
        calls_.push_back(argv);
        if (!results_.empty())
        {
            auto r = results_.front();
            results_.erase(results_.begin());
            return r;
        }
        process::CommandResult ok;
        ok.exit_code = 0;
        return ok;
    }

    void push(int exit_code, std::string out = {}, std::string err = {})
    {
        process::CommandResult r;
        r.exit_code = exit_code;
        r.out       = std::move(out);
        r.err       = std::move(err);
        results_.push_back(r);
    }

    std::vector<std::vector<std::string>> calls() const
    {
        std::lock_guard lock(mu_);
        return calls_;
    }

   private:
    mutable std::mutex                            mu_;
    mutable std::vector<std::vector<std::string>> calls_;
    mutable std::vector<process::CommandResult>   results_;
};

SessionId sid(const char* name)
{
    return *SessionId::canonical("term-", name);
}

struct TmuxArgs : ::testing::Test
{
    std::shared_ptr<ScriptedRunner> runner = std::make_shared<ScriptedRunner>();
    TmuxMultiplexer                 tmux{"tmux", "tp-test", runner};
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Command construction
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TmuxArgs, CreateSessionUsesPrivateSocketAndOptions)
{
    NewSessionSpec spec;
    spec.id            = sid("build");
    spec.cwd           = "/srv";
    spec.cols          = 100;
    spec.rows          = 30;
    spec.history_limit = 1234;
    ASSERT_TRUE(tmux.create_session(spec).ok());

    auto calls = runner->calls();
    ASSERT_GE(calls.size(), 2u);
    EXPECT_EQ(calls[0], (std::vector<std::string>{"tmux", "-L", "tp-test", "new-session", "-d",
                                                  "-s", "term-build", "-x", "100", "-y", "30",
                                                  "-c", "/srv"}));

    bool saw_history = false;
    for (const auto& c : calls)
    {
        if (c.size() == 7 && c[3] == "set-option" && c[5] == "history-limit")
        {
            saw_history = true;
            EXPECT_EQ(c[4], "=term-build");
            EXPECT_EQ(c[6], "1234");
        }
    }
    EXPECT_TRUE(saw_history);
}

TEST_F(TmuxArgs, CreateErrorsAreClassified)
{
    NewSessionSpec spec;
    spec.id = sid("dup");
    runner->push(1, "", "duplicate session: term-dup\n");
    EXPECT_EQ(tmux.create_session(spec).error().kind, ErrorKind::ResourceBusy);

    runner->push(-1, "", "tmux: not found");
    EXPECT_EQ(tmux.create_session(spec).error().kind, ErrorKind::DependencyMissing);

    runner->push(1, "", "server exited unexpectedly");
    auto other = tmux.create_session(spec);
    EXPECT_EQ(other.error().kind, ErrorKind::Internal);
    EXPECT_EQ(other.error().detail, "server exited unexpectedly");
}

TEST_F(TmuxArgs, TargetsAreExactMatches)
{
    tmux.has_session(sid("a"));
    tmux.send_literal(sid("a"), "echo hi");
    tmux.send_key(sid("a"), "C-y", 4);
    tmux.resize(sid("a"), 80, 24);

    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[0], (std::vector<std::string>{"tmux", "-L", "tp-test", "has-session", "-t",
                                                  "=term-a"}));
    EXPECT_EQ(calls[1], (std::vector<std::string>{"tmux", "-L", "tp-test", "send-keys", "-t",
                                                  "=term-a:", "-l", "--", "echo hi"}));
    EXPECT_EQ(calls[2], (std::vector<std::string>{"tmux", "-L", "tp-test", "send-keys", "-t",
                                                  "=term-a:", "-N", "4", "C-y"}));
    EXPECT_EQ(calls[3], (std::vector<std::string>{"tmux", "-L", "tp-test", "resize-window", "-t",
                                                  "=term-a:", "-x", "80", "-y", "24"}));
}

TEST_F(TmuxArgs, EmptyLiteralIsNotSent)
{
    EXPECT_TRUE(tmux.send_literal(sid("a"), ""));
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(TmuxArgs, ListFiltersByPrefix)
{
    runner->push(0, "term-a\nother\nterm-b\n\n");
    EXPECT_EQ(tmux.list_sessions("term-"), (std::vector<std::string>{"term-a", "term-b"}));

    runner->push(1, "", "no server running on /tmp/tmux-0/tp-test");
    EXPECT_TRUE(tmux.list_sessions("term-").empty());
}

TEST_F(TmuxArgs, NumericQueries)
{
    runner->push(0, "4242\n");
    EXPECT_EQ(tmux.pane_pid(sid("a")), 4242);
    runner->push(0, "garbage\n");
    EXPECT_FALSE(tmux.pane_pid(sid("a")).has_value());
    runner->push(1);
    EXPECT_FALSE(tmux.pane_pid(sid("a")).has_value());
    runner->push(0, "310\n");
    EXPECT_EQ(tmux.history_size(sid("a")), 310);
}

TEST_F(TmuxArgs, CaptureRange)
{
    runner->push(0, "\033[31mred\033[0m\n");
    auto text = tmux.capture_scrollback(sid("a"), -100, -1);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "\033[31mred\033[0m\n");

    auto calls = runner->calls();
    EXPECT_EQ(calls.back(), (std::vector<std::string>{"tmux", "-L", "tp-test", "capture-pane",
                                                      "-t", "=term-a:", "-p", "-e", "-J", "-S",
                                                      "-100", "-E", "-1"}));
}

TEST_F(TmuxArgs, AttachCommand)
{
    EXPECT_EQ(tmux.attach_command(sid("a")),
              (std::vector<std::string>{"tmux", "-L", "tp-test", "attach-session", "-t",
                                        "=term-a"}));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Against a real tmux server
// ═══════════════════════════════════════════════════════════════════════════════

class TmuxLive : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        if (!process::ProcessRegistry::find_executable("tmux"))
            GTEST_SKIP() << "tmux not installed";
        socket_ = "termpanel-test-" + std::to_string(::getpid());
        tmux_   = std::make_shared<TmuxMultiplexer>(
            "tmux", socket_, std::make_shared<process::CommandRunner>());
    }

    void TearDown() override
    {
        if (!tmux_)
            return;
        process::CommandRunner runner;
        (void)runner.run({"tmux", "-L", socket_, "kill-server"});
    }

    std::string                      socket_;
    std::shared_ptr<TmuxMultiplexer> tmux_;
};

class CollectingSink : public terminal::OutputSink
{
   public:
    void on_output(terminal::SubscriberId, const SessionId&, std::string_view data) override
    {
        std::lock_guard lock(mu_);
        text_.append(data);
    }
    void on_stream_closed(terminal::SubscriberId, const SessionId&, const std::string&) override {}

    std::string text()
    {
        std::lock_guard lock(mu_);
        return text_;
    }

   private:
    std::mutex  mu_;
    std::string text_;
};

TEST_F(TmuxLive, SessionLifecycle)
{
    NewSessionSpec spec;
    spec.id = sid("live");
    ASSERT_TRUE(tmux_->create_session(spec).ok());
    EXPECT_TRUE(tmux_->has_session(spec.id));
    EXPECT_FALSE(tmux_->has_session(sid("li")));   // no prefix matching

    auto dup = tmux_->create_session(spec);
    ASSERT_FALSE(dup.ok());
    EXPECT_EQ(dup.error().kind, ErrorKind::ResourceBusy);

    EXPECT_EQ(tmux_->list_sessions("term-"), std::vector<std::string>{"term-live"});
    auto pid = tmux_->pane_pid(spec.id);
    ASSERT_TRUE(pid.has_value());
    EXPECT_TRUE(process::pid_exists(*pid));
    EXPECT_TRUE(tmux_->history_size(spec.id).has_value());
    EXPECT_TRUE(tmux_->set_environment(spec.id, "DISPLAY", ":100"));
    EXPECT_TRUE(tmux_->unset_environment(spec.id, "DISPLAY"));
    EXPECT_TRUE(tmux_->capture_scrollback(spec.id, -10, std::nullopt).has_value());

    ASSERT_TRUE(tmux_->kill_session(spec.id).ok());
    EXPECT_FALSE(tmux_->has_session(spec.id));
    EXPECT_EQ(tmux_->kill_session(spec.id).error().kind, ErrorKind::NotFound);
}

TEST_F(TmuxLive, AttachStreamsShellOutput)
{
    NewSessionSpec spec;
    spec.id      = sid("build");
    spec.cwd     = "/tmp";
    spec.command = "/bin/sh";
    ASSERT_TRUE(tmux_->create_session(spec).ok());

    process::ProcessRegistry registry;
    CollectingSink           sink;
    TerminalConfig           cfg;
    cfg.poll_interval = std::chrono::milliseconds(10);
    terminal::PtyBridge bridge(tmux_, registry, sink, cfg);

    auto conn = bridge.acquire(spec.id, 1, 80, 24);
    ASSERT_NE(conn, nullptr);
    const pid_t child = conn->child_pid();

    // The arithmetic only expands in the shell's output, never in the echo.
    ASSERT_TRUE(bridge.write(spec.id, "pwd; echo hi-$((40+2))\n").ok());
    EXPECT_TRUE(termpanel::testing::eventually(
        [&] { return sink.text().find("hi-42") != std::string::npos; }, std::chrono::milliseconds(5000)));
    EXPECT_NE(sink.text().find("/tmp"), std::string::npos);

    bridge.teardown(spec.id);
    EXPECT_FALSE(bridge.has_connection(spec.id));
    EXPECT_TRUE(termpanel::testing::eventually([&] { return !process::pid_exists(child); }));
    EXPECT_TRUE(tmux_->has_session(spec.id));
}
