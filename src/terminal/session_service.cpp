#include "session_service.hpp"

#include <filesystem>
#include <random>
#include <thread>

#include <termpanel/logger.hpp>

namespace termpanel::terminal
{

namespace
{

std::string generate_session_name()
{
    static constexpr char hex[] = "0123456789abcdef";
    std::random_device    rd;
    std::mt19937          gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string name = "session-";
    for (int i = 0; i < 8; ++i)
        name.push_back(hex[dist(gen)]);
    return name;
}

Error session_not_found(const SessionId& id)
{
    return make_error(ErrorKind::NotFound, "Session " + id.str() + " not found");
}

}   // namespace

std::optional<ScrollCommand> parse_scroll_command(std::string_view name)
{
    if (name == "enter")
        return ScrollCommand::Enter;
    if (name == "exit")
        return ScrollCommand::Exit;
    if (name == "up")
        return ScrollCommand::Up;
    if (name == "down")
        return ScrollCommand::Down;
    if (name == "page_up")
        return ScrollCommand::PageUp;
    if (name == "page_down")
        return ScrollCommand::PageDown;
    if (name == "top")
        return ScrollCommand::Top;
    if (name == "bottom")
        return ScrollCommand::Bottom;
    return std::nullopt;
}

SessionService::SessionService(std::shared_ptr<mux::Multiplexer> mux, PtyBridge& bridge,
                               display::DisplayManager& displays, TerminalConfig config)
    : mux_(std::move(mux)), bridge_(bridge), displays_(displays), config_(std::move(config))
{
}

Result<SessionId> SessionService::resolve(std::string_view raw) const
{
    auto id = SessionId::canonical(config_.session_prefix, raw);
    if (!id)
        return make_error(ErrorKind::InvalidArgument,
                          "Invalid session name '" + std::string(raw) + "'");
    return *id;
}

std::string SessionService::login_command() const
{
    // Prompts for a user name and hands authentication to su.
    return "bash -c '\n"
           "while true; do\n"
           "    echo \"\"\n"
           "    echo \"================================\"\n"
           "    echo \"  Terminal Login Required\"\n"
           "    echo \"================================\"\n"
           "    echo \"\"\n"
           "    read -p \"Username: \" username\n"
           "    if [ -n \"$username\" ]; then\n"
           "        su -l \"$username\"\n"
           "        if [ $? -eq 0 ]; then\n"
           "            break\n"
           "        fi\n"
           "        echo \"\"\n"
           "        echo \"Login failed. Please try again.\"\n"
           "        sleep 1\n"
           "    fi\n"
           "done\n"
           "'";
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

Result<SessionInfo> SessionService::create(const CreateSessionRequest& request)
{
    std::string raw = request.name && !request.name->empty() ? *request.name
                                                             : generate_session_name();
    auto id = resolve(raw);
    if (!id)
        return id.error();

    if (mux_->has_session(*id))
        return make_error(ErrorKind::ResourceBusy, "Session already exists");

    mux::NewSessionSpec spec;
    spec.id            = *id;
    spec.cols          = 80;
    spec.rows          = 24;
    spec.history_limit = config_.scrollback_limit;
    if (request.cwd && !request.cwd->empty())
    {
        std::error_code ec;
        if (std::filesystem::is_directory(*request.cwd, ec))
            spec.cwd = *request.cwd;
        else
            TERMPANEL_LOG_WARN("session", "Ignoring cwd {}: not a directory", *request.cwd);
    }
    if (config_.require_login)
        spec.command = login_command();
    else
        spec.command = config_.default_shell;

    if (auto created = mux_->create_session(spec); !created)
    {
        TERMPANEL_LOG_ERROR("session", "Cannot create {}: {}", id->str(),
                            created.error().detail);
        return created.error();
    }
    TERMPANEL_LOG_INFO("session", "Created {}{}", id->str(),
                       config_.require_login ? " (login required)" : "");

    // Login mode needs authentication before anything can be typed.
    if (request.command && !request.command->empty() && !config_.require_login)
    {
        std::this_thread::sleep_for(config_.initial_command_settle);
        if (!mux_->send_literal(*id, *request.command) || !mux_->send_key(*id, "Enter"))
            TERMPANEL_LOG_WARN("session", "Initial command for {} was not delivered", id->str());
    }

    return describe(*id);
}

SessionInfo SessionService::describe(const SessionId& id)
{
    SessionInfo info;
    info.name        = id.str();
    info.bridged     = bridge_.has_connection(id);
    info.subscribers = bridge_.subscriber_count(id);
    info.pane_pid    = mux_->pane_pid(id);
    return info;
}

std::vector<SessionInfo> SessionService::list()
{
    std::vector<SessionInfo> sessions;
    for (const auto& name : mux_->list_sessions(config_.session_prefix))
    {
        auto id = SessionId::from_canonical(config_.session_prefix, name);
        if (!id)
            continue;   // created outside termpanel with a name we would reject
        sessions.push_back(describe(*id));
    }
    return sessions;
}

bool SessionService::exists(const SessionId& id)
{
    return mux_->has_session(id);
}

Status SessionService::destroy(const SessionId& id)
{
    if (!mux_->has_session(id))
        return session_not_found(id);

    bridge_.teardown(id);
    if (auto killed = mux_->kill_session(id); !killed)
        return killed;
    TERMPANEL_LOG_INFO("session", "Destroyed {}", id.str());
    return Status::success();
}

Status SessionService::run_command(const SessionId& id, const std::string& command)
{
    if (command.empty())
        return make_error(ErrorKind::InvalidArgument, "No command specified");
    return bridge_.write(id, command + "\n");
}

// ─── Scrollback ─────────────────────────────────────────────────────────────

Result<Scrollback> SessionService::scrollback(const SessionId& id, int start_line,
                                              std::optional<int> end_line)
{
    auto content = mux_->capture_scrollback(id, start_line, end_line);
    if (!content)
    {
        if (!mux_->has_session(id))
            return session_not_found(id);
        return make_error(ErrorKind::Internal, "capture-pane failed for " + id.str());
    }

    Scrollback result;
    result.content      = std::move(*content);
    result.history_size = mux_->history_size(id).value_or(0);
    result.start_line   = start_line;
    return result;
}

Status SessionService::scroll(const SessionId& id, ScrollCommand command, int lines)
{
    if (lines < 1)
        lines = 1;

    bool ok = false;
    switch (command)
    {
        case ScrollCommand::Enter:
            ok = mux_->enter_copy_mode(id);
            break;
        case ScrollCommand::Exit:
            ok = mux_->send_key(id, "q");
            break;
        case ScrollCommand::Up:
            ok = mux_->send_key(id, "C-y", lines);
            break;
        case ScrollCommand::Down:
            ok = mux_->send_key(id, "C-e", lines);
            break;
        case ScrollCommand::PageUp:
            ok = mux_->send_key(id, "C-b");
            break;
        case ScrollCommand::PageDown:
            ok = mux_->send_key(id, "C-f");
            break;
        case ScrollCommand::Top:
            ok = mux_->send_key(id, "g");
            break;
        case ScrollCommand::Bottom:
            ok = mux_->send_key(id, "G");
            break;
    }
    if (!ok)
        return session_not_found(id);
    return Status::success();
}

// ─── Display binding ────────────────────────────────────────────────────────

Status SessionService::bind_display(const SessionId& id, int display)
{
    if (!mux_->has_session(id))
        return session_not_found(id);

    std::optional<display::DisplayEnvironment> env;
    if (displays_.probe(display))
        env = displays_.binding_environment(display);
    if (!env)
        return make_error(ErrorKind::NotFound,
                          "Display :" + std::to_string(display) + " not found");

    // New panes and windows inherit the multiplexer environment; the running
    // shell only sees what we type into it.
    for (const auto& [key, value] : env->entries())
        mux_->set_environment(id, std::string(display::env_key_name(key)), value);
    for (std::string_view name : display::COMPETING_DISPLAY_VARS)
        mux_->unset_environment(id, std::string(name));

    if (auto typed = bridge_.write(id, env->export_command() + "\n"); !typed)
        return typed;
    TERMPANEL_LOG_INFO("session", "Bound {} to display :{}", id.str(), display);
    return Status::success();
}

Status SessionService::unbind_display(const SessionId& id)
{
    if (!mux_->has_session(id))
        return session_not_found(id);

    for (const auto& [key, _] : display::DisplayEnvironment::for_display(0).entries())
        mux_->unset_environment(id, std::string(display::env_key_name(key)));

    if (auto typed = bridge_.write(id, display::DisplayEnvironment::unset_command() + "\n");
        !typed)
        return typed;
    TERMPANEL_LOG_INFO("session", "Unbound display from {}", id.str());
    return Status::success();
}

}   // namespace termpanel::terminal
