#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include "session_id.hpp"

namespace termpanel::terminal
{

// Delayed, cancellable per-session callbacks on a single worker thread.
// At most one entry exists per session: schedule() replaces, cancel() removes.
// The callback receives the version passed to schedule() so the owner can
// tell whether anything changed in between.
class ReclaimScheduler
{
   public:
    using Clock    = std::chrono::steady_clock;
    using Callback = std::function<void(const SessionId&, uint64_t version)>;

    explicit ReclaimScheduler(Callback callback);
    ~ReclaimScheduler();

    ReclaimScheduler(const ReclaimScheduler&)            = delete;
    ReclaimScheduler& operator=(const ReclaimScheduler&) = delete;

    void schedule(const SessionId& id, uint64_t version, std::chrono::milliseconds delay);
    bool cancel(const SessionId& id);
    void cancel_all();

    bool   pending(const SessionId& id) const;
    size_t pending_count() const;

    // Joins the worker. Pending callbacks are dropped.
    void stop();

   private:
    struct Entry
    {
        Clock::time_point deadline;
        uint64_t          version = 0;
    };

    void run();

    Callback                         callback_;
    mutable std::mutex               mu_;
    std::condition_variable          cv_;
    std::map<SessionId, Entry>       entries_;
    bool                             stopping_ = false;
    std::thread                      worker_;
};

}   // namespace termpanel::terminal
