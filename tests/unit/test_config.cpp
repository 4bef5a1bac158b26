#include <gtest/gtest.h>

#include "core/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <vector>

using namespace termpanel;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace
{

class ConfigFile : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        std::string tmpl = (fs::temp_directory_path() / "termpanel-cfg-XXXXXX").string();
        dir_             = ::mkdtemp(tmpl.data());
    }
    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& text)
    {
        auto path = (dir_ / "config.json").string();
        std::ofstream(path) << text;
        return path;
    }

    fs::path dir_;
};

// argv builder; keeps the strings alive for the duration of a call.
struct Args
{
    explicit Args(std::vector<std::string> a) : storage(std::move(a))
    {
        for (auto& s : storage)
            ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int    argc() { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       ptrs;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Defaults
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConfigDefaults, MatchDocumentedValues)
{
    DaemonConfig c;
    EXPECT_EQ(c.terminal.session_prefix, "term-");
    EXPECT_EQ(c.terminal.default_cols, 120);
    EXPECT_EQ(c.terminal.default_rows, 40);
    EXPECT_EQ(c.terminal.scrollback_limit, 50000u);
    EXPECT_EQ(c.display.display_base, 100);
    EXPECT_EQ(c.display.panel_count, 3);
    EXPECT_EQ(c.display.vnc_port_base, 5900);
    EXPECT_EQ(c.display.ws_port_base, 6100);
    EXPECT_EQ(c.display.default_width, 1280u);
    EXPECT_EQ(c.display.default_height, 800u);
    EXPECT_EQ(c.display.default_depth, 24u);
    EXPECT_EQ(c.log_level, LogLevel::Info);
}

TEST(ConfigDefaults, ShellFromEnvironment)
{
    const char* saved = std::getenv("SHELL");
    std::string restore = saved ? saved : "";
    ::setenv("SHELL", "/usr/bin/zsh", 1);
    EXPECT_EQ(make_default_config().terminal.default_shell, "/usr/bin/zsh");
    if (saved)
        ::setenv("SHELL", restore.c_str(), 1);
    else
        ::unsetenv("SHELL");
}

// ═══════════════════════════════════════════════════════════════════════════════
// JSON file
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ConfigFile, MissingFileIsNotAnError)
{
    DaemonConfig c;
    EXPECT_TRUE(load_config_file((dir_ / "absent.json").string(), c));
    EXPECT_EQ(c.terminal.session_prefix, "term-");
}

TEST_F(ConfigFile, OverlaysKnownKeys)
{
    auto path = write(R"({
        "session_prefix": "ws-",
        "tmux_socket": "alt",
        "default_cols": 100,
        "require_login": true,
        "reclaim_grace_ms": 750,
        "log_level": "debug",
        "commands_file": "/var/lib/tp/commands.json",
        "unknown_key": 1,
        "display": { "display_base": 200, "ws_port_base": 7100, "vnc_settle_ms": 20 }
    })");

    DaemonConfig c;
    ASSERT_TRUE(load_config_file(path, c));
    EXPECT_EQ(c.terminal.session_prefix, "ws-");
    EXPECT_EQ(c.terminal.tmux_socket, "alt");
    EXPECT_EQ(c.terminal.default_cols, 100);
    EXPECT_EQ(c.terminal.default_rows, 40);
    EXPECT_TRUE(c.terminal.require_login);
    EXPECT_EQ(c.terminal.reclaim_grace, 750ms);
    EXPECT_EQ(c.log_level, LogLevel::Debug);
    EXPECT_EQ(c.commands_file, "/var/lib/tp/commands.json");
    EXPECT_EQ(c.display.display_base, 200);
    EXPECT_EQ(c.display.ws_port_base, 7100);
    EXPECT_EQ(c.display.vnc_settle, 20ms);
    EXPECT_EQ(c.display.vnc_port_base, 5900);
}

TEST_F(ConfigFile, LegacyDisplayBaseKey)
{
    DaemonConfig c;
    ASSERT_TRUE(load_config_file(write(R"({"xvfb_display_base": 150})"), c));
    EXPECT_EQ(c.display.display_base, 150);
}

TEST_F(ConfigFile, NegativeValuesAreIgnored)
{
    DaemonConfig c;
    ASSERT_TRUE(load_config_file(write(R"({"default_rows": -5, "reclaim_grace_ms": -1})"), c));
    EXPECT_EQ(c.terminal.default_rows, 40);
    EXPECT_EQ(c.terminal.reclaim_grace, 5000ms);
}

TEST_F(ConfigFile, MalformedFileFails)
{
    DaemonConfig c;
    EXPECT_FALSE(load_config_file(write("{ \"session_prefix\": "), c));
    EXPECT_FALSE(load_config_file(write("[1, 2]"), c));
}

TEST_F(ConfigFile, ZeroChunkSizeFails)
{
    DaemonConfig c;
    EXPECT_FALSE(load_config_file(write(R"({"read_chunk_size": 0})"), c));
}

TEST_F(ConfigFile, ValuesTooLargeForTheirFieldFail)
{
    DaemonConfig c;
    EXPECT_FALSE(load_config_file(
        write(R"({"default_cols": 70000, "display": {"ws_port_base": 131172}})"), c));
    EXPECT_EQ(c.terminal.default_cols, 120);
    EXPECT_EQ(c.display.ws_port_base, 6100);

    DaemonConfig d;
    EXPECT_FALSE(load_config_file(write(R"({"display": {"ws_port_base": 131172}})"), d));

    DaemonConfig e;
    EXPECT_FALSE(load_config_file(write(R"({"display": {"panel_count": 4294967297}})"), e));
}

TEST_F(ConfigFile, PortRangeMustFitEveryPanel)
{
    DaemonConfig c;
    EXPECT_FALSE(load_config_file(write(R"({"display": {"vnc_port_base": 65535}})"), c));

    DaemonConfig d;
    EXPECT_FALSE(load_config_file(
        write(R"({"display": {"ws_port_base": 65530, "panel_count": 7}})"), d));

    DaemonConfig e;
    ASSERT_TRUE(load_config_file(
        write(R"({"display": {"vnc_port_base": 65533, "ws_port_base": 7000}})"), e));
    EXPECT_EQ(e.display.vnc_port_base, 65533);

    DaemonConfig f;
    EXPECT_FALSE(load_config_file(write(R"({"display": {"vnc_port_base": 0}})"), f));
}

TEST_F(ConfigFile, RejectedFileLeavesConfigUntouched)
{
    DaemonConfig c;
    c.terminal.session_prefix = "keep-";
    EXPECT_FALSE(load_config_file(
        write(R"({"session_prefix": "ws-", "display": {"vnc_port_base": 65535}})"), c));
    EXPECT_EQ(c.terminal.session_prefix, "keep-");
    EXPECT_EQ(c.display.vnc_port_base, 5900);
}

TEST_F(ConfigFile, OverlappingPortRangesFail)
{
    DaemonConfig c;
    EXPECT_FALSE(load_config_file(
        write(R"({"display": {"vnc_port_base": 6000, "ws_port_base": 6002}})"), c));
}

TEST_F(ConfigFile, EmptyPanelTableFails)
{
    DaemonConfig c;
    EXPECT_FALSE(load_config_file(write(R"({"display": {"panel_count": 0}})"), c));
    DaemonConfig d;
    EXPECT_FALSE(load_config_file(write(R"({"display": {"panel_count": -2}})"), d));
}

TEST_F(ConfigFile, ZeroTerminalSizeFails)
{
    DaemonConfig c;
    EXPECT_FALSE(load_config_file(write(R"({"default_cols": 0})"), c));
    DaemonConfig d;
    EXPECT_FALSE(load_config_file(write(R"({"default_rows": 0})"), d));
}

TEST(ConfigValidate, DefaultsAreValid)
{
    EXPECT_FALSE(validate_config(DaemonConfig{}).has_value());

    DaemonConfig c;
    c.display.panel_count = 0;
    auto err              = validate_config(c);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("panel_count"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Command line
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConfigCommandLine, ParsesFlags)
{
    Args         args({"termpanel-daemon", "--socket", "/tmp/x.sock", "--prefix", "dev-",
                       "--log-level", "warn", "--login", "--config", "/etc/tp.json",
                       "--tmux-socket", "dev", "--commands", "c.json", "--log-file", "tp.log"});
    DaemonConfig c;
    bool         help = true;
    std::string  config_path;
    auto         err = apply_command_line(args.argc(), args.argv(), c, help, config_path);

    ASSERT_FALSE(err.has_value()) << *err;
    EXPECT_FALSE(help);
    EXPECT_EQ(c.socket_path, "/tmp/x.sock");
    EXPECT_EQ(c.terminal.session_prefix, "dev-");
    EXPECT_EQ(c.log_level, LogLevel::Warning);
    EXPECT_TRUE(c.terminal.require_login);
    EXPECT_EQ(config_path, "/etc/tp.json");
    EXPECT_EQ(c.terminal.tmux_socket, "dev");
    EXPECT_EQ(c.commands_file, "c.json");
    EXPECT_EQ(c.log_file, "tp.log");
}

TEST(ConfigCommandLine, HelpFlag)
{
    Args         args({"termpanel-daemon", "--help"});
    DaemonConfig c;
    bool         help = false;
    std::string  config_path;
    EXPECT_FALSE(apply_command_line(args.argc(), args.argv(), c, help, config_path).has_value());
    EXPECT_TRUE(help);
    EXPECT_NE(usage_text("termpanel-daemon").find("--socket"), std::string::npos);
}

TEST(ConfigCommandLine, Errors)
{
    DaemonConfig c;
    bool         help = false;
    std::string  config_path;

    Args missing({"termpanel-daemon", "--socket"});
    auto err = apply_command_line(missing.argc(), missing.argv(), c, help, config_path);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("--socket"), std::string::npos);

    Args unknown({"termpanel-daemon", "--frobnicate", "1"});
    err = apply_command_line(unknown.argc(), unknown.argv(), c, help, config_path);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("Unknown option"), std::string::npos);

    Args bad_level({"termpanel-daemon", "--log-level", "loud"});
    err = apply_command_line(bad_level.argc(), bad_level.argv(), c, help, config_path);
    ASSERT_TRUE(err.has_value());
}
