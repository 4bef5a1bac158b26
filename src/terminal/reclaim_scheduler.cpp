#include "reclaim_scheduler.hpp"

#include <utility>
#include <vector>

#include <termpanel/logger.hpp>

namespace termpanel::terminal
{

ReclaimScheduler::ReclaimScheduler(Callback callback) : callback_(std::move(callback))
{
    worker_ = std::thread([this] { run(); });
}

ReclaimScheduler::~ReclaimScheduler()
{
    stop();
}

void ReclaimScheduler::schedule(const SessionId& id, uint64_t version,
                                std::chrono::milliseconds delay)
{
    {
        std::lock_guard lock(mu_);
        if (stopping_)
            return;
        entries_[id] = Entry{Clock::now() + delay, version};
    }
    cv_.notify_one();
    TERMPANEL_LOG_DEBUG("pty", "Reclaim of {} scheduled in {}ms (version {})", id.str(),
                        delay.count(), version);
}

bool ReclaimScheduler::cancel(const SessionId& id)
{
    std::lock_guard lock(mu_);
    return entries_.erase(id) > 0;
}

void ReclaimScheduler::cancel_all()
{
    std::lock_guard lock(mu_);
    entries_.clear();
}

bool ReclaimScheduler::pending(const SessionId& id) const
{
    std::lock_guard lock(mu_);
    return entries_.count(id) > 0;
}

size_t ReclaimScheduler::pending_count() const
{
    std::lock_guard lock(mu_);
    return entries_.size();
}

void ReclaimScheduler::stop()
{
    {
        std::lock_guard lock(mu_);
        stopping_ = true;
        entries_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

void ReclaimScheduler::run()
{
    std::unique_lock lock(mu_);
    while (!stopping_)
    {
        if (entries_.empty())
        {
            cv_.wait(lock);
            continue;
        }

        auto next = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it)
        {
            if (it->second.deadline < next->second.deadline)
                next = it;
        }

        const Clock::time_point deadline = next->second.deadline;
        if (Clock::now() < deadline)
        {
            // Woken early by schedule/cancel/stop; re-evaluate either way.
            cv_.wait_until(lock, deadline);
            continue;
        }

        std::vector<std::pair<SessionId, uint64_t>> due;
        auto                                        now = Clock::now();
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (it->second.deadline <= now)
            {
                due.emplace_back(it->first, it->second.version);
                it = entries_.erase(it);
            }
            else
            {
                ++it;
            }
        }

        lock.unlock();
        for (const auto& [id, version] : due)
            callback_(id, version);
        lock.lock();
    }
}

}   // namespace termpanel::terminal
