#include "signal_router.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <termpanel/logger.hpp>

#include "../process/process_registry.hpp"

namespace termpanel::terminal
{

namespace
{

struct SignalName
{
    const char* name;
    int         number;
};

constexpr SignalName SIGNAL_NAMES[] = {
    {"INT", SIGINT},   {"TERM", SIGTERM}, {"KILL", SIGKILL}, {"STOP", SIGSTOP},
    {"CONT", SIGCONT}, {"TSTP", SIGTSTP}, {"HUP", SIGHUP},   {"QUIT", SIGQUIT},
};

}   // namespace

int parse_signal(std::string_view name)
{
    std::string upper;
    upper.reserve(name.size());
    for (char c : name)
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (upper.rfind("SIG", 0) == 0)
        upper.erase(0, 3);

    for (const auto& entry : SIGNAL_NAMES)
    {
        if (upper == entry.name)
            return entry.number;
    }
    return SIGINT;
}

std::optional<pid_t> parse_stat_ppid(std::string_view stat)
{
    // comm may contain spaces and parentheses; fields resume after the last ')'.
    size_t close = stat.rfind(')');
    if (close == std::string_view::npos)
        return std::nullopt;

    std::istringstream fields{std::string(stat.substr(close + 1))};
    std::string        state;
    long               ppid = 0;
    if (!(fields >> state >> ppid))
        return std::nullopt;
    return static_cast<pid_t>(ppid);
}

std::vector<pid_t> SignalRouter::children_of(pid_t pid) const
{
    std::vector<pid_t> children;
    std::error_code    ec;
    for (const auto& dir : std::filesystem::directory_iterator(proc_root_, ec))
    {
        const std::string name = dir.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; }))
            continue;

        std::ifstream stat(dir.path() / "stat");
        if (!stat)
            continue;   // exited while we were scanning
        std::string line;
        std::getline(stat, line);
        auto ppid = parse_stat_ppid(line);
        if (ppid && *ppid == pid)
            children.push_back(static_cast<pid_t>(std::atol(name.c_str())));
    }
    std::sort(children.begin(), children.end());
    return children;
}

bool SignalRouter::deliver(const SessionId& id, int signal)
{
    auto pane = mux_->pane_pid(id);
    if (!pane)
    {
        TERMPANEL_LOG_WARN("signal", "No pane process for {}", id.str());
        return false;
    }

    std::vector<pid_t> targets = children_of(*pane);
    if (targets.empty())
        targets.push_back(*pane);

    bool delivered = false;
    for (pid_t target : targets)
    {
        if (process::send_signal(target, signal))
        {
            delivered = true;
            TERMPANEL_LOG_INFO("signal", "Sent signal {} to pid={} in {}", signal, target,
                               id.str());
        }
        else
        {
            TERMPANEL_LOG_WARN("signal", "Signal {} to pid={} failed", signal, target);
        }
    }
    return delivered;
}

}   // namespace termpanel::terminal
