#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

#include "json_lite.hpp"

namespace termpanel
{

DaemonConfig make_default_config()
{
    DaemonConfig config;
    const char*  shell = std::getenv("SHELL");
    if (shell && shell[0] != '\0')
        config.terminal.default_shell = shell;
    return config;
}

// ─── JSON file ───────────────────────────────────────────────────────────────

namespace
{

// Negative values are ignored; values that do not fit `T` fail the load.
template <typename T>
bool read_uint(const json::Value& obj, const char* key, T& out)
{
    auto v = obj.get_int(key);
    if (!v || *v < 0)
        return true;
    if (static_cast<uint64_t>(*v) > static_cast<uint64_t>(std::numeric_limits<T>::max()))
    {
        TERMPANEL_LOG_WARN("config", "{} = {} is out of range (max {})", key, *v,
                           static_cast<uint64_t>(std::numeric_limits<T>::max()));
        return false;
    }
    out = static_cast<T>(*v);
    return true;
}

bool read_int(const json::Value& obj, const char* key, int& out)
{
    auto v = obj.get_int(key);
    if (!v)
        return true;
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max())
    {
        TERMPANEL_LOG_WARN("config", "{} = {} is out of range", key, *v);
        return false;
    }
    out = static_cast<int>(*v);
    return true;
}

void read_ms(const json::Value& obj, const char* key, std::chrono::milliseconds& out)
{
    if (auto v = obj.get_int(key); v && *v >= 0)
        out = std::chrono::milliseconds(*v);
}

void read_str(const json::Value& obj, const char* key, std::string& out)
{
    if (auto v = obj.get_string(key))
        out = *v;
}

bool apply_display_section(const json::Value& obj, DisplayConfig& d)
{
    read_str(obj, "xvfb_binary", d.xvfb_binary);
    read_str(obj, "vnc_binary", d.vnc_binary);
    read_str(obj, "websockify_binary", d.websockify_binary);
    bool ok = read_int(obj, "display_base", d.display_base);
    ok &= read_int(obj, "panel_count", d.panel_count);
    ok &= read_uint(obj, "vnc_port_base", d.vnc_port_base);
    ok &= read_uint(obj, "ws_port_base", d.ws_port_base);
    ok &= read_uint(obj, "default_width", d.default_width);
    ok &= read_uint(obj, "default_height", d.default_height);
    ok &= read_uint(obj, "default_depth", d.default_depth);
    read_str(obj, "x11_tmp_dir", d.x11_tmp_dir);
    read_ms(obj, "framebuffer_settle_ms", d.framebuffer_settle);
    read_ms(obj, "vnc_settle_ms", d.vnc_settle);
    read_ms(obj, "bridge_settle_ms", d.bridge_settle);
    read_ms(obj, "terminate_grace_ms", d.terminate_grace);
    return ok;
}

}   // namespace

bool load_config_file(const std::string& path, DaemonConfig& out)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        TERMPANEL_LOG_DEBUG("config", "No config file at {}, using defaults", path);
        return true;
    }

    std::ifstream in(path);
    if (!in)
    {
        TERMPANEL_LOG_WARN("config", "Could not open config file {}", path);
        return false;
    }
    std::stringstream buf;
    buf << in.rdbuf();

    size_t err_at = 0;
    auto   doc    = json::parse(buf.str(), &err_at);
    if (!doc || !doc->is_object())
    {
        TERMPANEL_LOG_WARN("config", "Could not parse config file {} (offset {})", path, err_at);
        return false;
    }

    // Overlay a copy so a rejected file leaves `out` untouched.
    DaemonConfig       config = out;
    const json::Value& root   = *doc;
    auto&              t      = config.terminal;

    read_str(root, "session_prefix", t.session_prefix);
    read_str(root, "tmux_binary", t.tmux_binary);
    read_str(root, "tmux_socket", t.tmux_socket);
    read_str(root, "default_shell", t.default_shell);
    bool ok = read_uint(root, "default_cols", t.default_cols);
    ok &= read_uint(root, "default_rows", t.default_rows);
    ok &= read_uint(root, "scrollback_limit", t.scrollback_limit);
    if (auto v = root.get_bool("require_login"))
        t.require_login = *v;
    if (auto v = root.get_bool("filter_terminal_queries"))
        t.filter_terminal_queries = *v;
    read_ms(root, "poll_interval_ms", t.poll_interval);
    ok &= read_uint(root, "read_chunk_size", t.read_chunk_size);
    read_ms(root, "reclaim_grace_ms", t.reclaim_grace);
    read_ms(root, "command_timeout_ms", t.command_timeout);

    read_str(root, "socket_path", config.socket_path);
    read_str(root, "commands_file", config.commands_file);
    read_str(root, "log_file", config.log_file);
    if (auto v = root.get_string("log_level"))
    {
        if (auto lvl = Logger::level_from_string(*v))
            config.log_level = *lvl;
        else
            TERMPANEL_LOG_WARN("config", "Unknown log_level '{}'", *v);
    }

    // Older config files keep the display base at top level.
    ok &= read_int(root, "xvfb_display_base", config.display.display_base);
    if (const json::Value* display = root.find("display"); display && display->is_object())
        ok &= apply_display_section(*display, config.display);
    if (!ok)
        return false;

    if (auto err = validate_config(config))
    {
        TERMPANEL_LOG_WARN("config", "Rejecting {}: {}", path, *err);
        return false;
    }

    out = std::move(config);
    TERMPANEL_LOG_INFO("config", "Loaded {}", path);
    return true;
}

// ─── Validation ──────────────────────────────────────────────────────────────

std::optional<std::string> validate_config(const DaemonConfig& config)
{
    const auto& t = config.terminal;
    const auto& d = config.display;

    if (t.default_cols == 0 || t.default_rows == 0)
        return std::string("default_cols and default_rows must be positive");
    if (t.read_chunk_size == 0 || t.poll_interval.count() == 0)
        return std::string("read_chunk_size and poll_interval_ms must be positive");

    if (d.panel_count <= 0)
        return std::string("panel_count must be positive");
    if (d.display_base < 0 || d.display_base > std::numeric_limits<int>::max() - d.panel_count)
        return "display_base " + std::to_string(d.display_base) + " is out of range";

    // Every panel needs a real port; 0 would let the kernel pick one.
    const int last = d.panel_count - 1;
    for (auto [name, base] : {std::pair<const char*, uint16_t>{"vnc_port_base", d.vnc_port_base},
                              std::pair<const char*, uint16_t>{"ws_port_base", d.ws_port_base}})
    {
        if (base == 0 || static_cast<int>(base) + last > 65535)
            return std::string(name) + " " + std::to_string(base) + " leaves no room for "
                   + std::to_string(d.panel_count) + " panel(s)";
    }
    const int vnc_lo = d.vnc_port_base, ws_lo = d.ws_port_base;
    if (vnc_lo <= ws_lo + last && ws_lo <= vnc_lo + last)
        return std::string("vnc and websocket port ranges overlap");
    return std::nullopt;
}

// ─── Command line ────────────────────────────────────────────────────────────

std::string usage_text(const char* argv0)
{
    std::ostringstream os;
    os << "Usage: " << (argv0 ? argv0 : "termpanel-daemon") << " [options]\n"
       << "  --socket <path>        Unix socket to listen on\n"
       << "  --config <path>        JSON config file (default: config.json)\n"
       << "  --commands <path>      Quick-command store (default: commands.json)\n"
       << "  --tmux-socket <name>   tmux -L server name\n"
       << "  --prefix <prefix>      Session name prefix\n"
       << "  --log-level <level>    trace|debug|info|warn|error|critical\n"
       << "  --log-file <path>      Also log to this file\n"
       << "  --login                Sessions start with a login prompt\n"
       << "  --help                 Show this help\n";
    return os.str();
}

std::optional<std::string> apply_command_line(int argc, char* argv[], DaemonConfig& config,
                                              bool& show_help, std::string& config_path)
{
    show_help = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h")
        {
            show_help = true;
            continue;
        }
        if (arg == "--login")
        {
            config.terminal.require_login = true;
            continue;
        }

        if (i + 1 >= argc)
            return "Missing value for " + arg;
        std::string value(argv[++i]);

        if (arg == "--socket")
            config.socket_path = value;
        else if (arg == "--config")
            config_path = value;
        else if (arg == "--commands")
            config.commands_file = value;
        else if (arg == "--tmux-socket")
            config.terminal.tmux_socket = value;
        else if (arg == "--prefix")
            config.terminal.session_prefix = value;
        else if (arg == "--log-file")
            config.log_file = value;
        else if (arg == "--log-level")
        {
            auto lvl = Logger::level_from_string(value);
            if (!lvl)
                return "Unknown log level: " + value;
            config.log_level = *lvl;
        }
        else
            return "Unknown option: " + arg;
    }
    return std::nullopt;
}

}   // namespace termpanel
