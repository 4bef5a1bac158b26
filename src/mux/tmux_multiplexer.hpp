#pragma once

#include <memory>
#include <string>

#include "../process/command_runner.hpp"
#include "multiplexer.hpp"

namespace termpanel::mux
{

// tmux on a private server socket: every command is `tmux -L <socket> ...`.
class TmuxMultiplexer : public Multiplexer
{
   public:
    TmuxMultiplexer(std::string binary, std::string socket_name,
                    std::shared_ptr<process::CommandRunner> runner);

    Status create_session(const NewSessionSpec& spec) override;
    Status kill_session(const SessionId& id) override;
    bool   has_session(const SessionId& id) override;

    std::vector<std::string> list_sessions(std::string_view prefix) override;

    bool resize(const SessionId& id, uint16_t cols, uint16_t rows) override;

    bool set_environment(const SessionId& id, const std::string& name,
                         const std::string& value) override;
    bool unset_environment(const SessionId& id, const std::string& name) override;

    bool send_literal(const SessionId& id, std::string_view text) override;
    bool send_key(const SessionId& id, const std::string& key, int repeat = 1) override;

    bool enter_copy_mode(const SessionId& id) override;

    std::optional<std::string> capture_scrollback(const SessionId& id, int start_line,
                                                  std::optional<int> end_line) override;
    std::optional<int>         history_size(const SessionId& id) override;

    std::optional<pid_t> pane_pid(const SessionId& id) override;

    std::vector<std::string> attach_command(const SessionId& id) const override;

    const std::string& socket_name() const { return socket_; }

   private:
    process::CommandResult run(std::vector<std::string> args) const;
    std::optional<std::string> display_format(const SessionId& id, const std::string& fmt) const;

    std::string                             binary_;
    std::string                             socket_;
    std::shared_ptr<process::CommandRunner> runner_;
};

}   // namespace termpanel::mux
