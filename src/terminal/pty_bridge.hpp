#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <sys/types.h>
#include <termpanel/error.hpp>

#include "../core/config.hpp"
#include "../mux/multiplexer.hpp"
#include "../process/process_registry.hpp"
#include "output_sink.hpp"
#include "reclaim_scheduler.hpp"
#include "session_id.hpp"

namespace termpanel::terminal
{

// One PTY attached to a multiplexer session, shared by every subscriber of
// that session.
class PtyConnection
{
   public:
    PtyConnection(SessionId session, int master_fd, pid_t child)
        : session_(std::move(session)), master_fd_(master_fd), child_(child)
    {
    }
    ~PtyConnection();

    PtyConnection(const PtyConnection&)            = delete;
    PtyConnection& operator=(const PtyConnection&) = delete;

    const SessionId& session() const { return session_; }
    pid_t            child_pid() const { return child_; }

    // Set by the reader thread when the stream ends. Authoritative liveness.
    bool reader_stopped() const { return reader_stopped_.load(); }

    size_t                    subscriber_count() const;
    bool                      has_subscriber(SubscriberId id) const;
    std::vector<SubscriberId> subscribers() const;

   private:
    friend class PtyBridge;

    SessionId session_;
    int       master_fd_ = -1;
    pid_t     child_     = -1;

    mutable std::mutex     mu_;   // guards subscribers_ and version_
    std::set<SubscriberId> subscribers_;
    uint64_t               version_ = 0;

    std::mutex        write_mu_;
    std::atomic<bool> cancel_{false};
    std::atomic<bool> reader_stopped_{false};
    std::thread       reader_;
};

// Owns the PTY connections of all sessions. Each connection streams its
// session's output to a set of subscribers through an OutputSink and is
// reclaimed after a grace period once nobody is subscribed.
class PtyBridge
{
   public:
    PtyBridge(std::shared_ptr<mux::Multiplexer> mux, process::ProcessRegistry& registry,
              OutputSink& sink, TerminalConfig config);
    ~PtyBridge();

    PtyBridge(const PtyBridge&)            = delete;
    PtyBridge& operator=(const PtyBridge&) = delete;

    // Join `subscriber` to the session's connection, creating it when there is
    // none or the old one's reader has stopped. nullptr when the multiplexer
    // does not know the session or the PTY cannot be spawned. The spawn runs
    // without the table lock; concurrent acquires of that session wait for it.
    std::shared_ptr<PtyConnection> acquire(const SessionId& id, SubscriberId subscriber,
                                           uint16_t cols, uint16_t rows);

    // Leave the session. An emptied connection is reclaimed after the grace
    // period unless somebody subscribes again first. False if not subscribed.
    bool release(const SessionId& id, SubscriberId subscriber);

    // Client went away: release it from every session. Returns those sessions.
    std::vector<SessionId> release_subscriber_everywhere(SubscriberId subscriber);

    // Input bytes. Falls back to the multiplexer's literal key injection when
    // the session has no live connection.
    Status write(const SessionId& id, std::string_view bytes);

    // Resize the PTY (if bridged) and the multiplexer window.
    Status resize(const SessionId& id, uint16_t cols, uint16_t rows);

    // Immediate teardown, no grace period.
    void teardown(const SessionId& id);
    void destroy_all();

    bool                           has_connection(const SessionId& id) const;
    size_t                         subscriber_count(const SessionId& id) const;
    std::optional<pid_t>           child_pid(const SessionId& id) const;
    std::shared_ptr<PtyConnection> connection(const SessionId& id) const;
    size_t                         connection_count() const;
    bool                           reclaim_pending(const SessionId& id) const;

   private:
    std::shared_ptr<PtyConnection> spawn(const SessionId& id, uint16_t cols, uint16_t rows);
    void                           add_subscriber(PtyConnection& conn, SubscriberId subscriber);
    void                           reader_loop(PtyConnection* conn);
    void                           broadcast(PtyConnection& conn, std::string_view data);
    void                           close_connection(const std::shared_ptr<PtyConnection>& conn);
    void                           on_reclaim(const SessionId& id, uint64_t version);

    std::shared_ptr<mux::Multiplexer> mux_;
    process::ProcessRegistry&         registry_;
    OutputSink&                       sink_;
    TerminalConfig                    config_;

    mutable std::mutex mu_;   // guards connections_ and spawning_
    std::unordered_map<SessionId, std::shared_ptr<PtyConnection>, SessionIdHash> connections_;
    // Sessions whose PTY is being spawned outside mu_, with the subscriber
    // that asked for it.
    std::unordered_map<SessionId, SubscriberId, SessionIdHash> spawning_;
    std::condition_variable                                    spawn_cv_;

    ReclaimScheduler reclaim_;
};

}   // namespace termpanel::terminal
