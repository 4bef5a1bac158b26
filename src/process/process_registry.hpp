#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <termpanel/error.hpp>

namespace termpanel::process
{

// How to launch a supervised child.
struct ProcessSpec
{
    std::vector<std::string>                         argv;   // argv[0] resolved via PATH
    std::vector<std::pair<std::string, std::string>> env_set;
    std::vector<std::string>                         env_unset;
    bool                                             capture_stderr = false;
};

// Tracks a spawned process.
struct ProcessEntry
{
    pid_t       pid = 0;
    std::string tag;   // resource id, e.g. "display:100/xvfb"
    std::string binary;
    int         stderr_fd   = -1;   // unlinked temp file the child writes stderr to
    bool        exited      = false;
    int         exit_code   = -1;
    int         term_signal = 0;
};

// Table of OS processes keyed by pid, tagged with the resource that owns them.
// Thread-safe; every public method takes the internal mutex.
class ProcessRegistry
{
   public:
    ProcessRegistry() = default;
    ~ProcessRegistry();

    ProcessRegistry(const ProcessRegistry&)            = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    // Spawn a child. Fails with DependencyMissing when argv[0] cannot be
    // resolved and Internal when posix_spawn itself fails.
    Result<pid_t> spawn(const std::string& tag, const ProcessSpec& spec);

    // Track a child forked elsewhere (e.g. by forkpty) so terminate() and
    // reap_finished() cover it.
    void adopt(const std::string& tag, pid_t pid);

    // Non-destructive liveness check. Reaps our own exited children.
    bool is_alive(pid_t pid);

    // SIGTERM, wait up to `grace`, SIGKILL, reap. Idempotent; never fails.
    // Also works for pids this registry did not spawn.
    void terminate(pid_t pid, std::chrono::milliseconds grace);

    // Up to `max_bytes` of what the child has written to stderr so far.
    std::string captured_stderr(pid_t pid, size_t max_bytes = 4096) const;

    // "exited with code N" / "killed by signal N" / "running".
    std::string describe_exit(pid_t pid) const;

    // Reap any finished children. Returns the pids reaped.
    std::vector<pid_t> reap_finished();

    size_t                     process_count() const;
    std::vector<ProcessEntry>  all_processes() const;
    std::optional<ProcessEntry> entry(pid_t pid) const;

    // PATH lookup. Names containing '/' are checked as given.
    static std::optional<std::string> find_executable(const std::string& name);

   private:
    // Requires mu_ held.
    bool reap_locked(ProcessEntry& entry);
    void forget_locked(pid_t pid);

    mutable std::mutex                      mu_;
    std::unordered_map<pid_t, ProcessEntry> processes_;
};

// Send `sig` to `pid`, treating "already gone" as success.
bool send_signal(pid_t pid, int sig);

// kill(pid, 0) probe; EPERM counts as alive.
bool pid_exists(pid_t pid);

}   // namespace termpanel::process
