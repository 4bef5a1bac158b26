#include "tmux_multiplexer.hpp"

#include <charconv>
#include <sstream>

#include <termpanel/logger.hpp>

namespace termpanel::mux
{

namespace
{

// "=" forces an exact session-name match instead of tmux's prefix matching.
std::string session_target(const SessionId& id)
{
    return "=" + id.str();
}

std::string pane_target(const SessionId& id)
{
    return "=" + id.str() + ":";
}

std::string trim(std::string s)
{
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
        s.pop_back();
    size_t i = 0;
    while (i < s.size() && s[i] == ' ')
        ++i;
    return s.substr(i);
}

template <typename T>
std::optional<T> parse_number(const std::string& s)
{
    T    value{};
    auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size())
        return std::nullopt;
    return value;
}

}   // namespace

TmuxMultiplexer::TmuxMultiplexer(std::string binary, std::string socket_name,
                                 std::shared_ptr<process::CommandRunner> runner)
    : binary_(std::move(binary)), socket_(std::move(socket_name)), runner_(std::move(runner))
{
}

process::CommandResult TmuxMultiplexer::run(std::vector<std::string> args) const
{
    std::vector<std::string> argv{binary_, "-L", socket_};
    argv.insert(argv.end(), std::make_move_iterator(args.begin()),
                std::make_move_iterator(args.end()));
    auto result = runner_->run(argv);
    if (!result.ok())
        TERMPANEL_LOG_DEBUG("session", "tmux {} failed ({}): {}", argv[3], result.exit_code,
                            trim(result.err));
    return result;
}

Status TmuxMultiplexer::create_session(const NewSessionSpec& spec)
{
    std::vector<std::string> args{"new-session",
                                  "-d",
                                  "-s",
                                  spec.id.str(),
                                  "-x",
                                  std::to_string(spec.cols),
                                  "-y",
                                  std::to_string(spec.rows)};
    if (!spec.cwd.empty())
    {
        args.push_back("-c");
        args.push_back(spec.cwd);
    }
    if (!spec.command.empty())
        args.push_back(spec.command);

    auto result = run(std::move(args));
    if (!result.ok())
    {
        std::string detail = trim(result.err);
        if (result.timed_out)
            detail = "tmux new-session timed out";
        if (detail.find("duplicate session") != std::string::npos)
            return make_error(ErrorKind::ResourceBusy, detail);
        if (result.exit_code < 0 && !result.timed_out)
            return make_error(ErrorKind::DependencyMissing, detail);
        return make_error(ErrorKind::Internal, detail.empty() ? "tmux new-session failed" : detail);
    }

    const std::string target = session_target(spec.id);
    run({"set-option", "-t", target, "mouse", "off"});
    run({"set-option", "-t", target, "history-limit", std::to_string(spec.history_limit)});
    run({"set-window-option", "-t", pane_target(spec.id), "aggressive-resize", "on"});
    run({"set-option", "-t", target, "default-terminal", "xterm-256color"});
    return Status::success();
}

Status TmuxMultiplexer::kill_session(const SessionId& id)
{
    auto result = run({"kill-session", "-t", session_target(id)});
    if (!result.ok())
        return make_error(ErrorKind::NotFound, "session " + id.str() + " not found");
    return Status::success();
}

bool TmuxMultiplexer::has_session(const SessionId& id)
{
    return run({"has-session", "-t", session_target(id)}).ok();
}

std::vector<std::string> TmuxMultiplexer::list_sessions(std::string_view prefix)
{
    std::vector<std::string> names;
    auto                     result = run({"list-sessions", "-F", "#{session_name}"});
    if (!result.ok())
        return names;   // no server running means no sessions

    std::istringstream lines(result.out);
    std::string        line;
    while (std::getline(lines, line))
    {
        line = trim(line);
        if (!line.empty() && line.compare(0, prefix.size(), prefix) == 0)
            names.push_back(line);
    }
    return names;
}

bool TmuxMultiplexer::resize(const SessionId& id, uint16_t cols, uint16_t rows)
{
    return run({"resize-window", "-t", pane_target(id), "-x", std::to_string(cols), "-y",
                std::to_string(rows)})
        .ok();
}

bool TmuxMultiplexer::set_environment(const SessionId& id, const std::string& name,
                                      const std::string& value)
{
    return run({"set-environment", "-t", session_target(id), name, value}).ok();
}

bool TmuxMultiplexer::unset_environment(const SessionId& id, const std::string& name)
{
    return run({"set-environment", "-t", session_target(id), "-u", name}).ok();
}

bool TmuxMultiplexer::send_literal(const SessionId& id, std::string_view text)
{
    if (text.empty())
        return true;
    return run({"send-keys", "-t", pane_target(id), "-l", "--", std::string(text)}).ok();
}

bool TmuxMultiplexer::send_key(const SessionId& id, const std::string& key, int repeat)
{
    std::vector<std::string> args{"send-keys", "-t", pane_target(id)};
    if (repeat > 1)
    {
        args.push_back("-N");
        args.push_back(std::to_string(repeat));
    }
    args.push_back(key);
    return run(std::move(args)).ok();
}

bool TmuxMultiplexer::enter_copy_mode(const SessionId& id)
{
    return run({"copy-mode", "-t", pane_target(id)}).ok();
}

std::optional<std::string> TmuxMultiplexer::capture_scrollback(const SessionId& id,
                                                               int start_line,
                                                               std::optional<int> end_line)
{
    std::vector<std::string> args{"capture-pane", "-t", pane_target(id), "-p", "-e", "-J",
                                  "-S", std::to_string(start_line)};
    if (end_line)
    {
        args.push_back("-E");
        args.push_back(std::to_string(*end_line));
    }
    auto result = run(std::move(args));
    if (!result.ok())
        return std::nullopt;
    return result.out;
}

std::optional<std::string> TmuxMultiplexer::display_format(const SessionId& id,
                                                           const std::string& fmt) const
{
    auto result = run({"display-message", "-t", pane_target(id), "-p", fmt});
    if (!result.ok())
        return std::nullopt;
    return trim(result.out);
}

std::optional<int> TmuxMultiplexer::history_size(const SessionId& id)
{
    auto text = display_format(id, "#{history_size}");
    if (!text)
        return std::nullopt;
    return parse_number<int>(*text);
}

std::optional<pid_t> TmuxMultiplexer::pane_pid(const SessionId& id)
{
    auto text = display_format(id, "#{pane_pid}");
    if (!text)
        return std::nullopt;
    auto pid = parse_number<pid_t>(*text);
    if (!pid || *pid <= 0)
        return std::nullopt;
    return pid;
}

std::vector<std::string> TmuxMultiplexer::attach_command(const SessionId& id) const
{
    return {binary_, "-L", socket_, "attach-session", "-t", session_target(id)};
}

}   // namespace termpanel::mux
