#include "process_registry.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <set>
#include <thread>

#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <termpanel/logger.hpp>
#include <unistd.h>

extern char** environ;

namespace termpanel::process
{

namespace
{

// Unlinked temp file used as the child's stderr. Unlike a pipe it never
// blocks a chatty child once we stop reading.
int make_capture_file()
{
    char path[] = "/tmp/termpanel-stderr-XXXXXX";
    int  fd     = ::mkostemp(path, O_CLOEXEC);
    if (fd < 0)
        return -1;
    ::unlink(path);
    return fd;
}

std::vector<std::string> build_environment(const ProcessSpec& spec)
{
    std::set<std::string> drop(spec.env_unset.begin(), spec.env_unset.end());
    for (const auto& [key, _] : spec.env_set)
        drop.insert(key);

    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e)
    {
        std::string entry(*e);
        auto        eq = entry.find('=');
        if (eq != std::string::npos && drop.count(entry.substr(0, eq)))
            continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : spec.env_set)
        env.push_back(key + "=" + value);
    return env;
}

bool probe_foreign(pid_t pid)
{
    int status = 0;
    if (::waitpid(pid, &status, WNOHANG) == pid)
        return false;   // was our zombie after all
    return pid_exists(pid);
}

}   // namespace

bool send_signal(pid_t pid, int sig)
{
    if (pid <= 0)
        return false;
    if (::kill(pid, sig) == 0)
        return true;
    return errno == ESRCH;
}

bool pid_exists(pid_t pid)
{
    if (pid <= 0)
        return false;
    if (::kill(pid, 0) == 0)
        return true;
    return errno == EPERM;
}

ProcessRegistry::~ProcessRegistry()
{
    std::lock_guard lock(mu_);
    for (auto& [_, entry] : processes_)
    {
        if (entry.stderr_fd >= 0)
            ::close(entry.stderr_fd);
    }
}

std::optional<std::string> ProcessRegistry::find_executable(const std::string& name)
{
    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (::access(name.c_str(), X_OK) == 0)
            return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path     = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t      start    = 0;
    while (start <= path.size())
    {
        size_t      end = path.find(':', start);
        std::string dir = path.substr(start, end == std::string::npos ? std::string::npos
                                                                      : end - start);
        if (dir.empty())
            dir = ".";
        std::string candidate = dir + "/" + name;

        struct stat st
        {
        };
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode)
            && ::access(candidate.c_str(), X_OK) == 0)
            return candidate;

        if (end == std::string::npos)
            break;
        start = end + 1;
    }
    return std::nullopt;
}

Result<pid_t> ProcessRegistry::spawn(const std::string& tag, const ProcessSpec& spec)
{
    if (spec.argv.empty())
        return make_error(ErrorKind::InvalidArgument, "empty argv for " + tag);

    auto binary = find_executable(spec.argv[0]);
    if (!binary)
        return make_error(ErrorKind::DependencyMissing, spec.argv[0]);

    int capture_fd = -1;
    if (spec.capture_stderr)
    {
        capture_fd = make_capture_file();
        if (capture_fd < 0)
            TERMPANEL_LOG_WARN("process", "Cannot capture stderr for {}: {}", tag,
                               std::strerror(errno));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    if (capture_fd >= 0)
        posix_spawn_file_actions_adddup2(&actions, capture_fd, STDERR_FILENO);
    else
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    // Own process group so a ^C aimed at the daemon does not reach the children;
    // default dispositions because the daemon ignores SIGPIPE.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t default_sigs;
    sigemptyset(&default_sigs);
    sigaddset(&default_sigs, SIGPIPE);
    sigaddset(&default_sigs, SIGINT);
    sigaddset(&default_sigs, SIGTERM);
    sigaddset(&default_sigs, SIGCHLD);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigdefault(&attr, &default_sigs);
    posix_spawnattr_setsigmask(&attr, &empty_mask);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr,
                             POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF
                                 | POSIX_SPAWN_SETSIGMASK);

    std::vector<std::string> env = build_environment(spec);
    std::vector<char*>       argv_ptrs;
    std::vector<char*>       env_ptrs;
    for (const auto& a : spec.argv)
        argv_ptrs.push_back(const_cast<char*>(a.c_str()));
    argv_ptrs.push_back(nullptr);
    for (const auto& e : env)
        env_ptrs.push_back(const_cast<char*>(e.c_str()));
    env_ptrs.push_back(nullptr);

    pid_t pid = 0;
    int   ret = posix_spawn(&pid, binary->c_str(), &actions, &attr, argv_ptrs.data(),
                            env_ptrs.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    if (ret != 0)
    {
        if (capture_fd >= 0)
            ::close(capture_fd);
        TERMPANEL_LOG_ERROR("process", "posix_spawn {} failed: {}", *binary, std::strerror(ret));
        return make_error(ErrorKind::Internal,
                          "posix_spawn " + *binary + ": " + std::strerror(ret));
    }

    ProcessEntry entry;
    entry.pid       = pid;
    entry.tag       = tag;
    entry.binary    = *binary;
    entry.stderr_fd = capture_fd;

    {
        std::lock_guard lock(mu_);
        processes_[pid] = std::move(entry);
    }

    TERMPANEL_LOG_INFO("process", "Spawned {} pid={} ({})", tag, pid, *binary);
    return pid;
}

void ProcessRegistry::adopt(const std::string& tag, pid_t pid)
{
    if (pid <= 0)
        return;
    ProcessEntry entry;
    entry.pid = pid;
    entry.tag = tag;
    std::lock_guard lock(mu_);
    processes_[pid] = std::move(entry);
}

bool ProcessRegistry::reap_locked(ProcessEntry& entry)
{
    if (entry.exited)
        return true;

    int   status = 0;
    pid_t result = ::waitpid(entry.pid, &status, WNOHANG);
    if (result == 0)
        return false;

    if (result == entry.pid)
    {
        entry.exited = true;
        if (WIFEXITED(status))
            entry.exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            entry.term_signal = WTERMSIG(status);
        return true;
    }

    // ECHILD: somebody else reaped it, or it was never ours.
    if (!pid_exists(entry.pid))
    {
        entry.exited = true;
        return true;
    }
    return false;
}

bool ProcessRegistry::is_alive(pid_t pid)
{
    if (pid <= 0)
        return false;

    {
        std::lock_guard lock(mu_);
        auto            it = processes_.find(pid);
        if (it != processes_.end())
            return !reap_locked(it->second);
    }
    return probe_foreign(pid);
}

void ProcessRegistry::terminate(pid_t pid, std::chrono::milliseconds grace)
{
    if (pid <= 0)
        return;

    if (!is_alive(pid))
    {
        std::lock_guard lock(mu_);
        forget_locked(pid);
        return;
    }

    send_signal(pid, SIGTERM);

    constexpr auto step     = std::chrono::milliseconds(10);
    auto           deadline = std::chrono::steady_clock::now() + grace;
    bool           alive    = true;
    while (std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(step);
        if (!is_alive(pid))
        {
            alive = false;
            break;
        }
    }

    if (alive)
    {
        TERMPANEL_LOG_DEBUG("process", "pid={} ignored SIGTERM, sending SIGKILL", pid);
        send_signal(pid, SIGKILL);
        // SIGKILL cannot be caught; this only waits for the kernel to reap.
        auto kill_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        while (is_alive(pid) && std::chrono::steady_clock::now() < kill_deadline)
            std::this_thread::sleep_for(step);
    }

    std::lock_guard lock(mu_);
    auto            it = processes_.find(pid);
    if (it != processes_.end())
        TERMPANEL_LOG_INFO("process", "Terminated {} pid={}", it->second.tag, pid);
    forget_locked(pid);
}

std::string ProcessRegistry::captured_stderr(pid_t pid, size_t max_bytes) const
{
    std::lock_guard lock(mu_);
    auto            it = processes_.find(pid);
    if (it == processes_.end() || it->second.stderr_fd < 0)
        return {};

    std::string out(max_bytes, '\0');
    ssize_t     n = ::pread(it->second.stderr_fd, out.data(), max_bytes, 0);
    if (n <= 0)
        return {};
    out.resize(static_cast<size_t>(n));
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
        out.pop_back();
    return out;
}

std::string ProcessRegistry::describe_exit(pid_t pid) const
{
    std::lock_guard lock(mu_);
    auto            it = processes_.find(pid);
    if (it == processes_.end())
        return "unknown process";
    const auto& e = it->second;
    if (!e.exited)
        return "running";
    if (e.term_signal != 0)
        return "killed by signal " + std::to_string(e.term_signal);
    if (e.exit_code >= 0)
        return "exited with code " + std::to_string(e.exit_code);
    return "exited";
}

std::vector<pid_t> ProcessRegistry::reap_finished()
{
    std::lock_guard    lock(mu_);
    std::vector<pid_t> reaped;

    for (auto& [pid, entry] : processes_)
    {
        if (entry.exited)
            continue;
        if (reap_locked(entry))
        {
            TERMPANEL_LOG_INFO("process", "Reaped {} pid={} exit_code={} signal={}", entry.tag,
                               pid, entry.exit_code, entry.term_signal);
            reaped.push_back(pid);
        }
    }
    return reaped;
}

size_t ProcessRegistry::process_count() const
{
    std::lock_guard lock(mu_);
    return processes_.size();
}

std::vector<ProcessEntry> ProcessRegistry::all_processes() const
{
    std::lock_guard           lock(mu_);
    std::vector<ProcessEntry> result;
    result.reserve(processes_.size());
    for (auto& [_, entry] : processes_)
        result.push_back(entry);
    return result;
}

std::optional<ProcessEntry> ProcessRegistry::entry(pid_t pid) const
{
    std::lock_guard lock(mu_);
    auto            it = processes_.find(pid);
    if (it == processes_.end())
        return std::nullopt;
    return it->second;
}

void ProcessRegistry::forget_locked(pid_t pid)
{
    auto it = processes_.find(pid);
    if (it == processes_.end())
        return;
    if (it->second.stderr_fd >= 0)
        ::close(it->second.stderr_fd);
    processes_.erase(it);
}

}   // namespace termpanel::process
