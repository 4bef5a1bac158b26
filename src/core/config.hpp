#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <termpanel/logger.hpp>

namespace termpanel
{

// Binaries and fixed resource table for the display pipeline.
struct DisplayConfig
{
    std::string xvfb_binary       = "Xvfb";
    std::string vnc_binary        = "x11vnc";
    std::string websockify_binary = "websockify";

    // Fixed panel table: panel i <-> display (display_base + i) <-> ports.
    int      display_base  = 100;
    int      panel_count   = 3;
    uint16_t vnc_port_base = 5900;
    uint16_t ws_port_base  = 6100;

    uint32_t default_width  = 1280;
    uint32_t default_height = 800;
    uint32_t default_depth  = 24;

    // Directory holding .X<n>-lock and .X11-unix/X<n>.
    std::string x11_tmp_dir = "/tmp";

    std::chrono::milliseconds framebuffer_settle{500};
    std::chrono::milliseconds vnc_settle{500};
    std::chrono::milliseconds bridge_settle{300};
    std::chrono::milliseconds terminate_grace{100};
};

struct TerminalConfig
{
    std::string session_prefix   = "term-";
    std::string tmux_binary      = "tmux";
    std::string tmux_socket      = "termpanel";
    std::string default_shell    = "/bin/bash";   // empty = tmux default-command
    uint16_t    default_cols     = 120;
    uint16_t    default_rows     = 40;
    uint32_t    scrollback_limit = 50000;
    bool        require_login    = false;

    std::chrono::milliseconds poll_interval{50};
    size_t                    read_chunk_size = 16 * 1024;
    std::chrono::milliseconds reclaim_grace{5000};
    std::chrono::milliseconds pre_attach_settle{50};
    std::chrono::milliseconds post_attach_settle{100};
    std::chrono::milliseconds initial_command_settle{200};
    std::chrono::milliseconds command_timeout{5000};
    bool                      filter_terminal_queries = true;
};

struct DaemonConfig
{
    std::string    socket_path;   // empty = default_socket_path()
    std::string    commands_file = "commands.json";
    LogLevel       log_level     = LogLevel::Info;
    std::string    log_file;
    TerminalConfig terminal;
    DisplayConfig  display;
};

// Defaults, with the shell taken from $SHELL when set.
DaemonConfig make_default_config();

// Overlay values from a JSON config file onto `config`. Unknown keys are
// ignored. Returns false, leaving `config` unchanged, when the file exists
// but cannot be parsed, holds a value too large for its field, or fails
// validate_config(); a missing file is not an error.
bool load_config_file(const std::string& path, DaemonConfig& config);

// Cross-field checks: positive terminal size and chunk size, a non-empty
// panel table whose ports all fit in 1..65535 without overlapping.
// Returns the first problem found.
std::optional<std::string> validate_config(const DaemonConfig& config);

// Parse command-line flags on top of `config`. Returns an error message for
// malformed arguments; `show_help` is set for --help.
std::optional<std::string> apply_command_line(int argc, char* argv[], DaemonConfig& config,
                                              bool& show_help, std::string& config_path);

std::string usage_text(const char* argv0);

}   // namespace termpanel
