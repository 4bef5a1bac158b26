#include "pty_bridge.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <termpanel/logger.hpp>
#include <unistd.h>

#include "escape_filter.hpp"
#include "utf8.hpp"

extern char** environ;

namespace termpanel::terminal
{

namespace
{

constexpr int WRITE_STALL_TIMEOUT_MS = 1000;

bool set_window_size(int fd, uint16_t cols, uint16_t rows)
{
    struct winsize ws
    {
    };
    ws.ws_col = cols;
    ws.ws_row = rows;
    return ::ioctl(fd, TIOCSWINSZ, &ws) == 0;
}

std::vector<std::string> attach_environment()
{
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e)
    {
        std::string_view entry(*e);
        // TMUX would make the attach client refuse to nest.
        if (entry.substr(0, 5) == "TERM=" || entry.substr(0, 5) == "TMUX=")
            continue;
        env.emplace_back(entry);
    }
    env.emplace_back("TERM=xterm-256color");
    return env;
}

}   // namespace

// ─── PtyConnection ──────────────────────────────────────────────────────────

PtyConnection::~PtyConnection()
{
    cancel_.store(true);
    if (reader_.joinable())
    {
        if (reader_.get_id() == std::this_thread::get_id())
            reader_.detach();
        else
            reader_.join();
    }
    if (master_fd_ >= 0)
        ::close(master_fd_);
}

size_t PtyConnection::subscriber_count() const
{
    std::lock_guard lock(mu_);
    return subscribers_.size();
}

bool PtyConnection::has_subscriber(SubscriberId id) const
{
    std::lock_guard lock(mu_);
    return subscribers_.count(id) > 0;
}

std::vector<SubscriberId> PtyConnection::subscribers() const
{
    std::lock_guard lock(mu_);
    return {subscribers_.begin(), subscribers_.end()};
}

// ─── PtyBridge ──────────────────────────────────────────────────────────────

PtyBridge::PtyBridge(std::shared_ptr<mux::Multiplexer> mux, process::ProcessRegistry& registry,
                     OutputSink& sink, TerminalConfig config)
    : mux_(std::move(mux)),
      registry_(registry),
      sink_(sink),
      config_(std::move(config)),
      reclaim_([this](const SessionId& id, uint64_t version) { on_reclaim(id, version); })
{
}

PtyBridge::~PtyBridge()
{
    reclaim_.stop();
    destroy_all();
}

std::shared_ptr<PtyConnection> PtyBridge::acquire(const SessionId& id, SubscriberId subscriber,
                                                  uint16_t cols, uint16_t rows)
{
    if (cols == 0)
        cols = config_.default_cols;
    if (rows == 0)
        rows = config_.default_rows;

    std::shared_ptr<PtyConnection> stale;
    {
        std::unique_lock lock(mu_);
        // A second acquire of a session being spawned joins the result.
        spawn_cv_.wait(lock, [&] { return spawning_.count(id) == 0; });

        auto it = connections_.find(id);
        if (it != connections_.end())
        {
            if (!it->second->reader_stopped())
            {
                auto conn = it->second;
                add_subscriber(*conn, subscriber);
                reclaim_.cancel(id);
                TERMPANEL_LOG_DEBUG("pty", "Subscriber {} joined {} ({} total)", subscriber,
                                    id.str(), conn->subscriber_count());
                return conn;
            }
            TERMPANEL_LOG_INFO("pty", "Connection for {} is dead, respawning", id.str());
            stale = std::move(it->second);
            connections_.erase(it);
            reclaim_.cancel(id);
        }
        spawning_.emplace(id, subscriber);
    }

    // Spawning sleeps and runs the multiplexer; other sessions stay usable.
    std::shared_ptr<PtyConnection> conn;
    if (stale)
    {
        close_connection(stale);
        stale.reset();
    }
    if (mux_->has_session(id))
        conn = spawn(id, cols, rows);
    else
        TERMPANEL_LOG_WARN("pty", "Refusing to bridge unknown session {}", id.str());

    {
        std::lock_guard lock(mu_);
        if (conn)
        {
            add_subscriber(*conn, subscriber);
            connections_[id] = conn;
        }
        spawning_.erase(id);
    }
    spawn_cv_.notify_all();
    return conn;
}

std::shared_ptr<PtyConnection> PtyBridge::spawn(const SessionId& id, uint16_t cols, uint16_t rows)
{
    // Size the session before attaching so the first frame is drawn at the
    // client's geometry.
    mux_->resize(id, cols, rows);
    if (config_.pre_attach_settle.count() > 0)
        std::this_thread::sleep_for(config_.pre_attach_settle);

    std::vector<std::string> argv = mux_->attach_command(id);
    if (argv.empty())
        return nullptr;
    auto binary = process::ProcessRegistry::find_executable(argv[0]);
    if (!binary)
    {
        TERMPANEL_LOG_ERROR("pty", "Attach binary {} not found", argv[0]);
        return nullptr;
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> env = attach_environment();
    std::vector<char*>       argv_ptrs;
    std::vector<char*>       env_ptrs;
    for (auto& a : argv)
        argv_ptrs.push_back(a.data());
    argv_ptrs.push_back(nullptr);
    for (auto& e : env)
        env_ptrs.push_back(e.data());
    env_ptrs.push_back(nullptr);
    long max_fd = ::sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536)
        max_fd = 65536;

    struct winsize ws
    {
    };
    ws.ws_col = cols;
    ws.ws_row = rows;

    int   master = -1;
    pid_t child  = ::forkpty(&master, nullptr, nullptr, &ws);
    if (child < 0)
    {
        TERMPANEL_LOG_ERROR("pty", "forkpty for {} failed: {}", id.str(), std::strerror(errno));
        return nullptr;
    }
    if (child == 0)
    {
        for (int fd = 3; fd < max_fd; ++fd)
            ::close(fd);
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGCHLD, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::execve(binary->c_str(), argv_ptrs.data(), env_ptrs.data());
        ::_exit(127);
    }

    int flags = ::fcntl(master, F_GETFL, 0);
    ::fcntl(master, F_SETFL, flags | O_NONBLOCK);
    ::fcntl(master, F_SETFD, FD_CLOEXEC);
    if (!set_window_size(master, cols, rows))
        TERMPANEL_LOG_WARN("pty", "TIOCSWINSZ on {} failed: {}", id.str(), std::strerror(errno));

    registry_.adopt("session:" + id.str() + "/attach", child);

    // The client may have attached before the multiplexer noticed our size.
    if (config_.post_attach_settle.count() > 0)
        std::this_thread::sleep_for(config_.post_attach_settle);
    mux_->resize(id, cols, rows);

    auto conn     = std::make_shared<PtyConnection>(id, master, child);
    conn->reader_ = std::thread([this, raw = conn.get()] { reader_loop(raw); });

    TERMPANEL_LOG_INFO("pty", "Bridged {} via pid={} ({}x{})", id.str(), child, cols, rows);
    return conn;
}

void PtyBridge::add_subscriber(PtyConnection& conn, SubscriberId subscriber)
{
    std::lock_guard lock(conn.mu_);
    conn.subscribers_.insert(subscriber);
    ++conn.version_;
}

void PtyBridge::reader_loop(PtyConnection* conn)
{
    std::string  buffer(config_.read_chunk_size, '\0');
    std::string  text;
    std::string  filtered;
    Utf8Decoder  decoder;
    EscapeFilter filter;
    std::string  reason = "end of stream";

    const int timeout_ms = static_cast<int>(config_.poll_interval.count());
    while (!conn->cancel_.load())
    {
        struct pollfd pfd
        {
        };
        pfd.fd     = conn->master_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            reason = std::string("poll: ") + std::strerror(errno);
            break;
        }
        if (ready == 0)
            continue;
        if (pfd.revents & POLLNVAL)
        {
            reason = "descriptor closed";
            break;
        }

        ssize_t n = ::read(conn->master_fd_, buffer.data(), buffer.size());
        if (n < 0)
        {
            if (errno == EAGAIN || errno == EINTR)
                continue;
            // EIO once the slave side is gone.
            reason = std::string("read: ") + std::strerror(errno);
            break;
        }
        if (n == 0)
            break;

        text.clear();
        decoder.feed(std::string_view(buffer.data(), static_cast<size_t>(n)), text);
        if (config_.filter_terminal_queries)
        {
            filtered.clear();
            filter.feed(text, filtered);
            text.swap(filtered);
        }
        if (!text.empty())
            broadcast(*conn, text);
    }

    conn->reader_stopped_.store(true);
    if (conn->cancel_.load())
        return;

    // Whatever the decoder and filter were still holding is final now.
    text.clear();
    decoder.flush(text);
    if (config_.filter_terminal_queries)
    {
        filtered.clear();
        filter.feed(text, filtered);
        filter.flush(filtered);
        text.swap(filtered);
    }
    if (!text.empty())
        broadcast(*conn, text);

    TERMPANEL_LOG_INFO("pty", "Reader for {} stopped: {}", conn->session_.str(), reason);
    for (SubscriberId sub : conn->subscribers())
        sink_.on_stream_closed(sub, conn->session_, reason);
}

void PtyBridge::broadcast(PtyConnection& conn, std::string_view data)
{
    // Snapshot under the connection lock, send without it.
    std::vector<SubscriberId> targets = conn.subscribers();
    for (SubscriberId sub : targets)
        sink_.on_output(sub, conn.session_, data);
}

bool PtyBridge::release(const SessionId& id, SubscriberId subscriber)
{
    std::lock_guard lock(mu_);
    auto            it = connections_.find(id);
    if (it == connections_.end())
        return false;

    auto&    conn    = *it->second;
    bool     emptied = false;
    uint64_t version = 0;
    {
        std::lock_guard conn_lock(conn.mu_);
        if (conn.subscribers_.erase(subscriber) == 0)
            return false;
        ++conn.version_;
        emptied = conn.subscribers_.empty();
        version = conn.version_;
    }

    TERMPANEL_LOG_DEBUG("pty", "Subscriber {} left {}", subscriber, id.str());
    if (emptied)
        reclaim_.schedule(id, version, config_.reclaim_grace);
    return true;
}

std::vector<SessionId> PtyBridge::release_subscriber_everywhere(SubscriberId subscriber)
{
    std::vector<SessionId> sessions;
    {
        std::unique_lock lock(mu_);
        // Let an in-flight acquire for this subscriber land so it is released too.
        spawn_cv_.wait(lock, [&] {
            for (const auto& [_, pending] : spawning_)
            {
                if (pending == subscriber)
                    return false;
            }
            return true;
        });
        for (const auto& [id, conn] : connections_)
        {
            if (conn->has_subscriber(subscriber))
                sessions.push_back(id);
        }
    }
    for (const auto& id : sessions)
        release(id, subscriber);
    return sessions;
}

void PtyBridge::on_reclaim(const SessionId& id, uint64_t version)
{
    std::shared_ptr<PtyConnection> victim;
    {
        std::lock_guard lock(mu_);
        auto            it = connections_.find(id);
        if (it == connections_.end())
            return;
        {
            std::lock_guard conn_lock(it->second->mu_);
            if (!it->second->subscribers_.empty() || it->second->version_ != version)
                return;
        }
        victim = std::move(it->second);
        connections_.erase(it);
    }
    TERMPANEL_LOG_INFO("pty", "Reclaiming idle connection for {}", id.str());
    close_connection(victim);
}

Status PtyBridge::write(const SessionId& id, std::string_view bytes)
{
    std::shared_ptr<PtyConnection> conn;
    {
        std::lock_guard lock(mu_);
        auto            it = connections_.find(id);
        if (it != connections_.end() && !it->second->reader_stopped())
            conn = it->second;
    }

    if (!conn)
    {
        if (!mux_->has_session(id))
            return make_error(ErrorKind::NotFound, "session " + id.str() + " not found");
        if (!mux_->send_literal(id, bytes))
            return make_error(ErrorKind::StreamFault, "send-keys to " + id.str() + " failed");
        return Status::success();
    }

    std::lock_guard write_lock(conn->write_mu_);
    if (conn->master_fd_ < 0)
        return make_error(ErrorKind::StreamFault, "connection to " + id.str() + " closed");
    size_t offset = 0;
    while (offset < bytes.size())
    {
        ssize_t n = ::write(conn->master_fd_, bytes.data() + offset, bytes.size() - offset);
        if (n > 0)
        {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && errno == EAGAIN)
        {
            struct pollfd pfd
            {
            };
            pfd.fd     = conn->master_fd_;
            pfd.events = POLLOUT;
            if (::poll(&pfd, 1, WRITE_STALL_TIMEOUT_MS) <= 0)
                return make_error(ErrorKind::StreamFault,
                                  "write to " + id.str() + " stalled");
            continue;
        }
        return make_error(ErrorKind::StreamFault,
                          "write to " + id.str() + ": " + std::strerror(errno));
    }
    return Status::success();
}

Status PtyBridge::resize(const SessionId& id, uint16_t cols, uint16_t rows)
{
    if (cols == 0 || rows == 0)
        return make_error(ErrorKind::InvalidArgument, "terminal size must be non-zero");

    std::shared_ptr<PtyConnection> conn = connection(id);
    if (conn && !conn->reader_stopped())
    {
        std::lock_guard write_lock(conn->write_mu_);
        if (conn->master_fd_ >= 0 && !set_window_size(conn->master_fd_, cols, rows))
            TERMPANEL_LOG_WARN("pty", "TIOCSWINSZ on {} failed: {}", id.str(),
                               std::strerror(errno));
    }

    if (!mux_->resize(id, cols, rows) && !conn)
        return make_error(ErrorKind::NotFound, "session " + id.str() + " not found");
    return Status::success();
}

void PtyBridge::teardown(const SessionId& id)
{
    std::shared_ptr<PtyConnection> victim;
    {
        std::unique_lock lock(mu_);
        spawn_cv_.wait(lock, [&] { return spawning_.count(id) == 0; });
        reclaim_.cancel(id);
        auto it = connections_.find(id);
        if (it == connections_.end())
            return;
        victim = std::move(it->second);
        connections_.erase(it);
    }
    close_connection(victim);
}

void PtyBridge::destroy_all()
{
    std::vector<std::shared_ptr<PtyConnection>> victims;
    {
        std::unique_lock lock(mu_);
        spawn_cv_.wait(lock, [&] { return spawning_.empty(); });
        reclaim_.cancel_all();
        for (auto& [_, conn] : connections_)
            victims.push_back(std::move(conn));
        connections_.clear();
    }
    for (auto& conn : victims)
        close_connection(conn);
    if (!victims.empty())
        TERMPANEL_LOG_INFO("pty", "Destroyed {} connection(s)", victims.size());
}

void PtyBridge::close_connection(const std::shared_ptr<PtyConnection>& conn)
{
    conn->cancel_.store(true);
    if (conn->reader_.joinable())
    {
        if (conn->reader_.get_id() == std::this_thread::get_id())
            conn->reader_.detach();
        else
            conn->reader_.join();
    }
    {
        std::lock_guard write_lock(conn->write_mu_);
        if (conn->master_fd_ >= 0)
        {
            ::close(conn->master_fd_);
            conn->master_fd_ = -1;
        }
    }
    // Closing the master hangs up the attach client; terminate() covers the
    // case where it lingers.
    registry_.terminate(conn->child_, std::chrono::milliseconds(100));
}

bool PtyBridge::has_connection(const SessionId& id) const
{
    std::lock_guard lock(mu_);
    return connections_.count(id) > 0;
}

size_t PtyBridge::subscriber_count(const SessionId& id) const
{
    auto conn = connection(id);
    return conn ? conn->subscriber_count() : 0;
}

std::optional<pid_t> PtyBridge::child_pid(const SessionId& id) const
{
    auto conn = connection(id);
    if (!conn)
        return std::nullopt;
    return conn->child_pid();
}

std::shared_ptr<PtyConnection> PtyBridge::connection(const SessionId& id) const
{
    std::lock_guard lock(mu_);
    auto            it = connections_.find(id);
    if (it == connections_.end())
        return nullptr;
    return it->second;
}

size_t PtyBridge::connection_count() const
{
    std::lock_guard lock(mu_);
    return connections_.size();
}

bool PtyBridge::reclaim_pending(const SessionId& id) const
{
    return reclaim_.pending(id);
}

}   // namespace termpanel::terminal
