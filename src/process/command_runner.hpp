#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace termpanel::process
{

struct CommandResult
{
    int         exit_code = -1;   // -1 when the command could not run or timed out
    bool        timed_out = false;
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
};

// Runs short-lived helper commands (tmux subcommands, etc.) to completion with
// captured stdout/stderr. The child is killed when `timeout` elapses.
class CommandRunner
{
   public:
    explicit CommandRunner(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
        : timeout_(timeout)
    {
    }

    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string>& argv) const;

    std::chrono::milliseconds timeout() const { return timeout_; }

   private:
    std::chrono::milliseconds timeout_;
};

}   // namespace termpanel::process
