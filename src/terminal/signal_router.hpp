#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "../mux/multiplexer.hpp"
#include "session_id.hpp"

namespace termpanel::terminal
{

// Delivers job-control signals to what the user is running inside a session
// rather than to the multiplexer's own shell.
class SignalRouter
{
   public:
    explicit SignalRouter(std::shared_ptr<mux::Multiplexer> mux, std::string proc_root = "/proc")
        : mux_(std::move(mux)), proc_root_(std::move(proc_root))
    {
    }

    // Signal every direct child of the session's pane process, or the pane
    // process itself when it has none. False when the session or its pane
    // cannot be resolved or nothing could be signalled.
    bool deliver(const SessionId& id, int signal);

    // Direct children of `pid`, from the parent-pid field of /proc/<n>/stat.
    std::vector<pid_t> children_of(pid_t pid) const;

   private:
    std::shared_ptr<mux::Multiplexer> mux_;
    std::string                       proc_root_;
};

// "SIGINT", "int", "TERM", ... Unknown names map to SIGINT.
int parse_signal(std::string_view name);

// Parent pid from the contents of a /proc/<pid>/stat file.
std::optional<pid_t> parse_stat_ppid(std::string_view stat);

}   // namespace termpanel::terminal
