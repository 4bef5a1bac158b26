#include <gtest/gtest.h>

#include "process/process_registry.hpp"
#include "terminal/signal_router.hpp"
#include "util/eventually.hpp"
#include "util/fake_multiplexer.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace termpanel;
using namespace termpanel::terminal;
using termpanel::testing::eventually;
using termpanel::testing::FakeMultiplexer;

namespace fs = std::filesystem;

namespace
{

SessionId sid(const char* name)
{
    return *SessionId::canonical("term-", name);
}

class FakeProcRoot
{
   public:
    FakeProcRoot()
    {
        std::string tmpl = (fs::temp_directory_path() / "termpanel-proc-XXXXXX").string();
        root_            = ::mkdtemp(tmpl.data());
    }
    ~FakeProcRoot()
    {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void add(const std::string& entry, const std::string& stat)
    {
        fs::create_directories(root_ / entry);
        std::ofstream(root_ / entry / "stat") << stat << "\n";
    }

    std::string path() const { return root_.string(); }

   private:
    fs::path root_;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SignalNames, AcceptsCommonSpellings)
{
    EXPECT_EQ(parse_signal("SIGINT"), SIGINT);
    EXPECT_EQ(parse_signal("int"), SIGINT);
    EXPECT_EQ(parse_signal("TERM"), SIGTERM);
    EXPECT_EQ(parse_signal("sigkill"), SIGKILL);
    EXPECT_EQ(parse_signal("TSTP"), SIGTSTP);
    EXPECT_EQ(parse_signal("cont"), SIGCONT);
    EXPECT_EQ(parse_signal("HUP"), SIGHUP);
    EXPECT_EQ(parse_signal("QUIT"), SIGQUIT);
    EXPECT_EQ(parse_signal("STOP"), SIGSTOP);
}

TEST(SignalNames, UnknownFallsBackToInterrupt)
{
    EXPECT_EQ(parse_signal(""), SIGINT);
    EXPECT_EQ(parse_signal("SIGWHATEVER"), SIGINT);
    EXPECT_EQ(parse_signal("9"), SIGINT);
}

TEST(StatParsing, ReadsParentPid)
{
    EXPECT_EQ(parse_stat_ppid("1234 (bash) S 1000 1234 1234 0 -1"), 1000);
}

TEST(StatParsing, CommWithSpacesAndParens)
{
    EXPECT_EQ(parse_stat_ppid("77 (my (odd) prog) R 42 77 77"), 42);
}

TEST(StatParsing, RejectsGarbage)
{
    EXPECT_FALSE(parse_stat_ppid("").has_value());
    EXPECT_FALSE(parse_stat_ppid("1234 bash S 1000").has_value());
    EXPECT_FALSE(parse_stat_ppid("1234 (bash)").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Child discovery
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SignalRouter, ChildrenFromFakeProcTree)
{
    FakeProcRoot proc;
    proc.add("42", "42 (bash) S 1 42 42");
    proc.add("124", "124 (vim) S 42 124 42");
    proc.add("123", "123 (make -j) R 42 123 42");
    proc.add("125", "125 (other) S 1 125 125");
    proc.add("self", "999 (self) S 42 999 999");

    SignalRouter router(std::make_shared<FakeMultiplexer>(), proc.path());
    EXPECT_EQ(router.children_of(42), (std::vector<pid_t>{123, 124}));
    EXPECT_TRUE(router.children_of(124).empty());
}

TEST(SignalRouter, MissingProcRootYieldsNoChildren)
{
    SignalRouter router(std::make_shared<FakeMultiplexer>(), "/nonexistent/termpanel-proc");
    EXPECT_TRUE(router.children_of(1).empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Delivery
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SignalRouter, UnknownPaneIsNotDelivered)
{
    auto mux = std::make_shared<FakeMultiplexer>();
    mux->add_session("term-main");
    SignalRouter router(mux);
    EXPECT_FALSE(router.deliver(sid("main"), SIGINT));
}

TEST(SignalRouter, ChildlessPaneReceivesSignalItself)
{
    process::ProcessRegistry registry;
    process::ProcessSpec     spec;
    spec.argv = {"sleep", "30"};
    auto pid  = registry.spawn("test/pane", spec);
    ASSERT_TRUE(pid.ok());

    auto mux = std::make_shared<FakeMultiplexer>();
    mux->add_session("term-main");
    mux->set_pane_pid("term-main", *pid);

    SignalRouter router(mux);
    EXPECT_TRUE(router.deliver(sid("main"), SIGTERM));
    EXPECT_TRUE(eventually([&] { return !registry.is_alive(*pid); }));
    EXPECT_EQ(registry.describe_exit(*pid), "killed by signal " + std::to_string(SIGTERM));
}

TEST(SignalRouter, ForegroundChildIsTargetedInsteadOfShell)
{
    process::ProcessRegistry registry;
    process::ProcessSpec     spec;
    spec.argv = {"/bin/sh", "-c", "sleep 30; exit 7"};
    auto shell = registry.spawn("test/pane", spec);
    ASSERT_TRUE(shell.ok());

    auto mux = std::make_shared<FakeMultiplexer>();
    mux->add_session("term-main");
    mux->set_pane_pid("term-main", *shell);

    SignalRouter router(mux);
    ASSERT_TRUE(eventually([&] { return !router.children_of(*shell).empty(); }));

    EXPECT_TRUE(router.deliver(sid("main"), SIGTERM));
    ASSERT_TRUE(eventually([&] { return !registry.is_alive(*shell); }));
    // The shell survived its child's death and ran the rest of its script.
    EXPECT_EQ(registry.describe_exit(*shell), "exited with code 7");
}
