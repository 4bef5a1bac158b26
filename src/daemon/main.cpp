#include "client_hub.hpp"
#include "event_dispatcher.hpp"

#include "../commands/command_store.hpp"
#include "../core/config.hpp"
#include "../display/display_manager.hpp"
#include "../ipc/transport.hpp"
#include "../mux/tmux_multiplexer.hpp"
#include "../process/command_runner.hpp"
#include "../process/process_registry.hpp"
#include "../terminal/pty_bridge.hpp"
#include "../terminal/session_service.hpp"
#include "../terminal/signal_router.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <poll.h>
#include <string>
#include <vector>

#include <termpanel/logger.hpp>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

// How often to reap finished child processes
constexpr auto REAP_INTERVAL = std::chrono::milliseconds(2000);
constexpr int  POLL_TIMEOUT_MS = 100;

}   // namespace

int main(int argc, char* argv[])
{
    using namespace termpanel;

    // Pass 1 finds --config; pass 2 lets the command line win over the file.
    DaemonConfig config      = make_default_config();
    std::string  config_path = "config.json";
    bool         show_help   = false;
    {
        DaemonConfig scratch = config;
        if (auto err = apply_command_line(argc, argv, scratch, show_help, config_path))
        {
            std::cerr << *err << "\n" << usage_text(argv[0]);
            return 2;
        }
    }
    if (show_help)
    {
        std::cout << usage_text(argv[0]);
        return 0;
    }

    auto& logger = Logger::instance();
    logger.add_sink(sinks::console_sink());

    if (!load_config_file(config_path, config))
        TERMPANEL_LOG_WARN("config", "Ignoring unreadable config file {}", config_path);
    if (auto err = apply_command_line(argc, argv, config, show_help, config_path))
    {
        std::cerr << *err << "\n" << usage_text(argv[0]);
        return 2;
    }

    logger.set_level(config.log_level);
    if (!config.log_file.empty())
        logger.add_sink(sinks::file_sink(config.log_file));

    if (config.socket_path.empty())
        config.socket_path = ipc::default_socket_path();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    TERMPANEL_LOG_INFO("daemon", "Starting termpanel daemon, socket: {}", config.socket_path);

    // --- Start UDS listener ---
    ipc::Server server;
    if (!server.listen(config.socket_path))
    {
        TERMPANEL_LOG_CRITICAL("daemon", "Failed to listen on {}: {}", config.socket_path,
                               std::strerror(errno));
        return 1;
    }

    process::ProcessRegistry registry;
    auto runner = std::make_shared<process::CommandRunner>(config.terminal.command_timeout);
    auto mux    = std::make_shared<mux::TmuxMultiplexer>(config.terminal.tmux_binary,
                                                         config.terminal.tmux_socket, runner);

    daemon::ClientHub        hub;
    terminal::PtyBridge      bridge(mux, registry, hub, config.terminal);
    display::DisplayManager  displays(registry, config.display);
    terminal::SessionService sessions(mux, bridge, displays, config.terminal);
    terminal::SignalRouter   signals(mux);
    commands::CommandStore   commands(config.commands_file);
    commands.load();

    daemon::EventDispatcher dispatcher(hub, sessions, bridge, signals, displays, commands);

    if (auto missing = displays.missing_dependencies(); !missing.empty())
    {
        std::string names;
        for (const auto& m : missing)
            names += (names.empty() ? "" : ", ") + m;
        TERMPANEL_LOG_WARN("daemon", "Display pipeline unavailable, missing: {}", names);
    }

    auto last_reap_check = std::chrono::steady_clock::now();

    TERMPANEL_LOG_INFO("daemon", "Listening for connections...");

    // --- Poll-based multiplexed event loop ---
    // poll() watches the listen fd and all client fds so a slow client never
    // blocks accepting new ones.
    while (g_running.load(std::memory_order_relaxed))
    {
        // [0] = listen socket, [1..N] = client sockets
        auto                       targets = hub.poll_targets();
        std::vector<struct pollfd> pfds;
        pfds.reserve(1 + targets.size());
        pfds.push_back({server.listen_fd(), POLLIN, 0});
        for (const auto& [id, fd] : targets)
            pfds.push_back({fd, POLLIN, 0});

        int poll_ret = ::poll(pfds.data(), static_cast<nfds_t>(pfds.size()), POLL_TIMEOUT_MS);
        if (poll_ret < 0)
        {
            if (errno == EINTR)
                continue;
            TERMPANEL_LOG_CRITICAL("daemon", "poll() failed: {}", std::strerror(errno));
            break;
        }

        // Accept new connections
        if (pfds[0].revents & POLLIN)
        {
            while (auto conn = server.try_accept())
                hub.add(std::move(conn));
        }

        for (size_t i = 0; i < targets.size(); ++i)
        {
            const auto& pfd = pfds[i + 1];
            auto        id  = targets[i].first;
            if (!(pfd.revents & (POLLIN | POLLHUP | POLLERR)))
                continue;

            ipc::RecvError why = ipc::RecvError::None;
            auto           msg = hub.recv(id, &why);
            if (!msg)
            {
                if (why != ipc::RecvError::Closed)
                    TERMPANEL_LOG_WARN("daemon", "Dropping client {}: {}", id,
                                       ipc::recv_error_name(why));
                dispatcher.on_disconnect(id);
                hub.remove(id);
                continue;
            }
            dispatcher.dispatch(id, *msg);
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_reap_check >= REAP_INTERVAL)
        {
            last_reap_check = now;
            for (pid_t pid : registry.reap_finished())
                TERMPANEL_LOG_DEBUG("process", "Reaped pid {}", pid);
        }
    }

    TERMPANEL_LOG_INFO("daemon", "Shutting down");

    for (const auto& [id, fd] : hub.poll_targets())
    {
        dispatcher.on_disconnect(id);
        hub.remove(id);
    }
    bridge.destroy_all();
    displays.release_all();
    server.close();

    TERMPANEL_LOG_INFO("daemon", "Stopped");
    return 0;
}
