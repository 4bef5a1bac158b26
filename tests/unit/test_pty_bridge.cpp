#include <gtest/gtest.h>

#include "terminal/pty_bridge.hpp"
#include "util/eventually.hpp"
#include "util/fake_multiplexer.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

using namespace termpanel;
using namespace termpanel::terminal;
using termpanel::testing::eventually;
using termpanel::testing::FakeMultiplexer;
using namespace std::chrono_literals;

namespace
{

class RecordingSink : public OutputSink
{
   public:
    void on_output(SubscriberId subscriber, const SessionId&, std::string_view data) override
    {
        std::lock_guard lock(mu_);
        output_[subscriber].append(data);
    }

    void on_stream_closed(SubscriberId subscriber, const SessionId& session,
                          const std::string&) override
    {
        std::lock_guard lock(mu_);
        closed_.emplace_back(subscriber, session.str());
    }

    std::string output(SubscriberId subscriber)
    {
        std::lock_guard lock(mu_);
        return output_[subscriber];
    }

    size_t closed_count()
    {
        std::lock_guard lock(mu_);
        return closed_.size();
    }

   private:
    std::mutex                                          mu_;
    std::map<SubscriberId, std::string>                 output_;
    std::vector<std::pair<SubscriberId, std::string>>   closed_;
};

TerminalConfig fast_config(std::chrono::milliseconds grace = 2000ms)
{
    TerminalConfig cfg;
    cfg.poll_interval      = 10ms;
    cfg.reclaim_grace      = grace;
    cfg.pre_attach_settle  = 0ms;
    cfg.post_attach_settle = 0ms;
    return cfg;
}

SessionId sid(const char* name)
{
    return *SessionId::canonical("term-", name);
}

struct BridgeFixture : ::testing::Test
{
    void make_bridge(std::chrono::milliseconds grace = 2000ms)
    {
        bridge = std::make_unique<PtyBridge>(mux, registry, sink, fast_config(grace));
    }

    void SetUp() override
    {
        mux->add_session("term-main");
        make_bridge();
    }

    void TearDown() override { bridge.reset(); }

    std::shared_ptr<FakeMultiplexer> mux = std::make_shared<FakeMultiplexer>();
    process::ProcessRegistry         registry;
    RecordingSink                    sink;
    std::unique_ptr<PtyBridge>       bridge;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Acquire / release
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BridgeFixture, UnknownSessionIsRefused)
{
    EXPECT_EQ(bridge->acquire(sid("ghost"), 1, 80, 24), nullptr);
    EXPECT_EQ(bridge->connection_count(), 0u);
}

TEST_F(BridgeFixture, AcquireSpawnsOneConnection)
{
    auto conn = bridge->acquire(sid("main"), 1, 100, 30);
    ASSERT_NE(conn, nullptr);
    EXPECT_TRUE(bridge->has_connection(sid("main")));
    EXPECT_EQ(bridge->subscriber_count(sid("main")), 1u);
    EXPECT_GT(conn->child_pid(), 0);
    EXPECT_TRUE(registry.entry(conn->child_pid()).has_value());

    auto resizes = mux->resizes();
    ASSERT_FALSE(resizes.empty());
    EXPECT_EQ(resizes.back(), (std::pair<uint16_t, uint16_t>(100, 30)));
}

TEST_F(BridgeFixture, ZeroSizeUsesConfiguredDefaults)
{
    ASSERT_NE(bridge->acquire(sid("main"), 1, 0, 0), nullptr);
    auto resizes = mux->resizes();
    ASSERT_FALSE(resizes.empty());
    EXPECT_EQ(resizes.front().first, 120);
    EXPECT_EQ(resizes.front().second, 40);
}

TEST_F(BridgeFixture, SecondSubscriberSharesConnection)
{
    auto a = bridge->acquire(sid("main"), 1, 80, 24);
    auto b = bridge->acquire(sid("main"), 2, 80, 24);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(bridge->connection_count(), 1u);
    EXPECT_EQ(bridge->subscriber_count(sid("main")), 2u);
}

TEST_F(BridgeFixture, ReleaseUnknownSubscriberReturnsFalse)
{
    EXPECT_FALSE(bridge->release(sid("main"), 1));
    ASSERT_NE(bridge->acquire(sid("main"), 1, 80, 24), nullptr);
    EXPECT_FALSE(bridge->release(sid("main"), 99));
    EXPECT_TRUE(bridge->release(sid("main"), 1));
    EXPECT_FALSE(bridge->release(sid("main"), 1));
}

TEST_F(BridgeFixture, ResubscribeWithinGraceKeepsChild)
{
    auto  first = bridge->acquire(sid("main"), 1, 80, 24);
    ASSERT_NE(first, nullptr);
    pid_t child = first->child_pid();

    ASSERT_TRUE(bridge->release(sid("main"), 1));
    EXPECT_TRUE(bridge->reclaim_pending(sid("main")));

    auto again = bridge->acquire(sid("main"), 2, 80, 24);
    ASSERT_NE(again, nullptr);
    EXPECT_EQ(again->child_pid(), child);
    EXPECT_FALSE(bridge->reclaim_pending(sid("main")));
}

TEST_F(BridgeFixture, EmptyConnectionReclaimedAfterGrace)
{
    make_bridge(50ms);
    auto conn = bridge->acquire(sid("main"), 1, 80, 24);
    ASSERT_NE(conn, nullptr);
    pid_t child = conn->child_pid();
    conn.reset();

    ASSERT_TRUE(bridge->release(sid("main"), 1));
    EXPECT_TRUE(eventually([&] { return bridge->connection_count() == 0; }));
    EXPECT_TRUE(eventually([&] { return !process::pid_exists(child); }));
}

TEST_F(BridgeFixture, ConcurrentAcquireCreatesSingleConnection)
{
    std::vector<std::thread> threads;
    std::atomic<int>         acquired{0};
    for (SubscriberId sub = 1; sub <= 8; ++sub)
    {
        threads.emplace_back(
            [&, sub]
            {
                if (bridge->acquire(sid("main"), sub, 80, 24))
                    ++acquired;
            });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(acquired.load(), 8);
    EXPECT_EQ(bridge->connection_count(), 1u);
    EXPECT_EQ(bridge->subscriber_count(sid("main")), 8u);
}

TEST_F(BridgeFixture, SlowSpawnDoesNotBlockOtherSessions)
{
    auto cfg              = fast_config();
    cfg.pre_attach_settle = 600ms;
    bridge                = std::make_unique<PtyBridge>(mux, registry, sink, cfg);
    mux->add_session("term-other");

    std::shared_ptr<PtyConnection> slow;
    std::thread spawner([&] { slow = bridge->acquire(sid("main"), 1, 80, 24); });
    ASSERT_TRUE(eventually([&] { return !mux->resizes().empty(); }));

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(bridge->write(sid("other"), "ls\r").ok());
    EXPECT_TRUE(bridge->resize(sid("other"), 90, 30).ok());
    EXPECT_FALSE(bridge->has_connection(sid("other")));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 300ms);

    spawner.join();
    ASSERT_NE(slow, nullptr);
    EXPECT_EQ(bridge->subscriber_count(sid("main")), 1u);
}

TEST_F(BridgeFixture, ReleaseEverywhereWaitsForPendingSpawn)
{
    auto cfg              = fast_config();
    cfg.pre_attach_settle = 300ms;
    bridge                = std::make_unique<PtyBridge>(mux, registry, sink, cfg);

    std::thread spawner([&] { bridge->acquire(sid("main"), 5, 80, 24); });
    ASSERT_TRUE(eventually([&] { return !mux->resizes().empty(); }));

    auto released = bridge->release_subscriber_everywhere(5);
    spawner.join();
    ASSERT_EQ(released.size(), 1u);
    EXPECT_EQ(released[0], sid("main"));
    EXPECT_EQ(bridge->subscriber_count(sid("main")), 0u);
    EXPECT_TRUE(bridge->reclaim_pending(sid("main")));
}

TEST_F(BridgeFixture, ReleaseEverywhereCoversAllSessions)
{
    mux->add_session("term-other");
    ASSERT_NE(bridge->acquire(sid("main"), 7, 80, 24), nullptr);
    ASSERT_NE(bridge->acquire(sid("other"), 7, 80, 24), nullptr);
    ASSERT_NE(bridge->acquire(sid("other"), 8, 80, 24), nullptr);

    auto released = bridge->release_subscriber_everywhere(7);
    EXPECT_EQ(released.size(), 2u);
    EXPECT_EQ(bridge->subscriber_count(sid("main")), 0u);
    EXPECT_EQ(bridge->subscriber_count(sid("other")), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Streaming
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BridgeFixture, InputIsEchoedToEverySubscriber)
{
    ASSERT_NE(bridge->acquire(sid("main"), 1, 80, 24), nullptr);
    ASSERT_NE(bridge->acquire(sid("main"), 2, 80, 24), nullptr);

    ASSERT_TRUE(bridge->write(sid("main"), "hello-pty\n").ok());

    EXPECT_TRUE(eventually([&] { return sink.output(1).find("hello-pty") != std::string::npos; }));
    EXPECT_TRUE(eventually([&] { return sink.output(2).find("hello-pty") != std::string::npos; }));
    EXPECT_TRUE(mux->literals().empty());
}

TEST_F(BridgeFixture, TerminalQueriesAreFiltered)
{
    mux->set_attach_argv({"/bin/sh", "-c", "printf 'a\\033]11;?\\007b'; sleep 5"});
    ASSERT_NE(bridge->acquire(sid("main"), 1, 80, 24), nullptr);

    EXPECT_TRUE(eventually([&] { return sink.output(1).find('b') != std::string::npos; }));
    EXPECT_EQ(sink.output(1).find("]11;"), std::string::npos);
}

TEST_F(BridgeFixture, EndOfStreamNotifiesAndNextAcquireRespawns)
{
    mux->set_attach_argv({"/bin/sh", "-c", "echo bye"});
    auto first = bridge->acquire(sid("main"), 1, 80, 24);
    ASSERT_NE(first, nullptr);

    EXPECT_TRUE(eventually([&] { return sink.closed_count() == 1; }));
    EXPECT_NE(sink.output(1).find("bye"), std::string::npos);
    EXPECT_TRUE(first->reader_stopped());

    mux->set_attach_argv({"/bin/cat"});
    auto second = bridge->acquire(sid("main"), 1, 80, 24);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second, first);
    EXPECT_FALSE(second->reader_stopped());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Write / resize / teardown
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BridgeFixture, WriteWithoutConnectionFallsBackToMultiplexer)
{
    ASSERT_TRUE(bridge->write(sid("main"), "ls\r").ok());
    auto literals = mux->literals();
    ASSERT_EQ(literals.size(), 1u);
    EXPECT_EQ(literals[0], "ls\r");
}

TEST_F(BridgeFixture, WriteToUnknownSessionIsNotFound)
{
    auto status = bridge->write(sid("ghost"), "x");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::NotFound);
}

TEST_F(BridgeFixture, ResizeValidatesAndForwards)
{
    auto zero = bridge->resize(sid("main"), 0, 24);
    ASSERT_FALSE(zero.ok());
    EXPECT_EQ(zero.error().kind, ErrorKind::InvalidArgument);

    ASSERT_NE(bridge->acquire(sid("main"), 1, 80, 24), nullptr);
    ASSERT_TRUE(bridge->resize(sid("main"), 132, 50).ok());
    EXPECT_EQ(mux->resizes().back(), (std::pair<uint16_t, uint16_t>(132, 50)));

    auto missing = bridge->resize(sid("ghost"), 80, 24);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(BridgeFixture, TeardownKillsChildImmediately)
{
    auto  conn  = bridge->acquire(sid("main"), 1, 80, 24);
    ASSERT_NE(conn, nullptr);
    pid_t child = conn->child_pid();

    bridge->teardown(sid("main"));
    EXPECT_FALSE(bridge->has_connection(sid("main")));
    EXPECT_FALSE(process::pid_exists(child));
    EXPECT_EQ(sink.closed_count(), 0u);
}

TEST_F(BridgeFixture, DestroyAllClearsEverything)
{
    mux->add_session("term-other");
    ASSERT_NE(bridge->acquire(sid("main"), 1, 80, 24), nullptr);
    ASSERT_NE(bridge->acquire(sid("other"), 1, 80, 24), nullptr);
    bridge->destroy_all();
    EXPECT_EQ(bridge->connection_count(), 0u);
}
