#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>
#include <termpanel/error.hpp>

#include "../core/config.hpp"
#include "../display/display_manager.hpp"
#include "../mux/multiplexer.hpp"
#include "pty_bridge.hpp"
#include "session_id.hpp"

namespace termpanel::terminal
{

struct CreateSessionRequest
{
    std::optional<std::string> name;      // generated when absent
    std::optional<std::string> cwd;       // ignored unless it is a directory
    std::optional<std::string> command;   // typed into the shell after creation
};

struct SessionInfo
{
    std::string          name;
    bool                 bridged     = false;
    size_t               subscribers = 0;
    std::optional<pid_t> pane_pid;
};

struct Scrollback
{
    std::string content;
    int         history_size = 0;
    int         start_line   = 0;
};

// Copy-mode navigation.
enum class ScrollCommand : uint8_t
{
    Enter,
    Exit,
    Up,
    Down,
    PageUp,
    PageDown,
    Top,
    Bottom,
};

std::optional<ScrollCommand> parse_scroll_command(std::string_view name);

// Session management on top of the multiplexer and the PTY bridge.
class SessionService
{
   public:
    SessionService(std::shared_ptr<mux::Multiplexer> mux, PtyBridge& bridge,
                   display::DisplayManager& displays, TerminalConfig config);

    // The canonical id for a client-supplied name, or InvalidArgument.
    Result<SessionId> resolve(std::string_view raw) const;

    Result<SessionInfo>      create(const CreateSessionRequest& request);
    std::vector<SessionInfo> list();
    bool                     exists(const SessionId& id);

    // Tears the bridge down immediately, then kills the session.
    Status destroy(const SessionId& id);

    // Types `command` followed by a newline.
    Status run_command(const SessionId& id, const std::string& command);

    Result<Scrollback> scrollback(const SessionId& id, int start_line, std::optional<int> end_line);
    Status             scroll(const SessionId& id, ScrollCommand command, int lines);

    Status bind_display(const SessionId& id, int display);
    Status unbind_display(const SessionId& id);

    const TerminalConfig& config() const { return config_; }

   private:
    SessionInfo describe(const SessionId& id);
    std::string login_command() const;

    std::shared_ptr<mux::Multiplexer> mux_;
    PtyBridge&                        bridge_;
    display::DisplayManager&          displays_;
    TerminalConfig                    config_;
};

}   // namespace termpanel::terminal
