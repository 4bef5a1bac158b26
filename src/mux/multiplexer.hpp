#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>
#include <termpanel/error.hpp>

#include "../terminal/session_id.hpp"

namespace termpanel::mux
{

using terminal::SessionId;

struct NewSessionSpec
{
    SessionId   id;
    std::string cwd;       // empty = multiplexer default
    std::string command;   // empty = default shell
    uint16_t    cols = 80;
    uint16_t    rows = 24;
    uint32_t    history_limit = 50000;
};

// Command-line contract of the terminal multiplexer. The bridge and the
// session service only talk to the multiplexer through this interface.
class Multiplexer
{
   public:
    virtual ~Multiplexer() = default;

    virtual Status create_session(const NewSessionSpec& spec) = 0;
    virtual Status kill_session(const SessionId& id)          = 0;
    virtual bool   has_session(const SessionId& id)           = 0;

    // Session names carrying `prefix`.
    virtual std::vector<std::string> list_sessions(std::string_view prefix) = 0;

    // Logical window size of the session.
    virtual bool resize(const SessionId& id, uint16_t cols, uint16_t rows) = 0;

    virtual bool set_environment(const SessionId& id, const std::string& name,
                                 const std::string& value)                       = 0;
    virtual bool unset_environment(const SessionId& id, const std::string& name) = 0;

    // Literal text, no key-name interpretation.
    virtual bool send_literal(const SessionId& id, std::string_view text) = 0;
    // Named key ("Enter", "C-y", "q"), optionally repeated.
    virtual bool send_key(const SessionId& id, const std::string& key, int repeat = 1) = 0;

    virtual bool enter_copy_mode(const SessionId& id) = 0;

    // capture-pane with escapes and joined lines. start/end are line offsets
    // relative to the visible pane (negative = history).
    virtual std::optional<std::string> capture_scrollback(const SessionId& id, int start_line,
                                                          std::optional<int> end_line) = 0;
    virtual std::optional<int> history_size(const SessionId& id) = 0;

    // Pid of the process running in the session's active pane.
    virtual std::optional<pid_t> pane_pid(const SessionId& id) = 0;

    // argv that attaches interactively to the session from a PTY.
    virtual std::vector<std::string> attach_command(const SessionId& id) const = 0;
};

}   // namespace termpanel::mux
