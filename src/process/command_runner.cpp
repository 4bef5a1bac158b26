#include "command_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <termpanel/logger.hpp>
#include <unistd.h>

#include "process_registry.hpp"

extern char** environ;

namespace termpanel::process
{

namespace
{

struct Pipe
{
    int rd = -1;
    int wr = -1;

    bool open()
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0)
            return false;
        rd = fds[0];
        wr = fds[1];
        return true;
    }

    void close_read()
    {
        if (rd >= 0)
            ::close(rd);
        rd = -1;
    }
    void close_write()
    {
        if (wr >= 0)
            ::close(wr);
        wr = -1;
    }
    ~Pipe()
    {
        close_read();
        close_write();
    }
};

bool drain(int& fd, std::string& out)
{
    char    buf[4096];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0)
    {
        out.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN))
        return true;
    ::close(fd);
    fd = -1;
    return false;
}

}   // namespace

CommandResult CommandRunner::run(const std::vector<std::string>& argv) const
{
    CommandResult result;
    if (argv.empty())
        return result;

    auto binary = ProcessRegistry::find_executable(argv[0]);
    if (!binary)
    {
        result.err = argv[0] + ": command not found";
        return result;
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open())
    {
        result.err = std::string("pipe: ") + std::strerror(errno);
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, out_pipe.wr, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe.wr, STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t default_sigs;
    sigemptyset(&default_sigs);
    sigaddset(&default_sigs, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &default_sigs);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> argv_ptrs;
    for (const auto& a : argv)
        argv_ptrs.push_back(const_cast<char*>(a.c_str()));
    argv_ptrs.push_back(nullptr);

    pid_t pid = 0;
    int   ret = posix_spawn(&pid, binary->c_str(), &actions, &attr, argv_ptrs.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    out_pipe.close_write();
    err_pipe.close_write();

    if (ret != 0)
    {
        result.err = std::string("posix_spawn: ") + std::strerror(ret);
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (out_pipe.rd >= 0 || err_pipe.rd >= 0)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            result.timed_out = true;
            break;
        }

        struct pollfd pfds[2] = {{out_pipe.rd, POLLIN, 0}, {err_pipe.rd, POLLIN, 0}};
        int           n = ::poll(pfds, 2, static_cast<int>(remaining.count()));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }
        if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR))
            drain(out_pipe.rd, result.out);
        if (pfds[1].revents & (POLLIN | POLLHUP | POLLERR))
            drain(err_pipe.rd, result.err);
    }

    if (result.timed_out)
    {
        TERMPANEL_LOG_WARN("process", "{} timed out after {} ms, killing", argv[0],
                           static_cast<long long>(timeout_.count()));
        send_signal(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }

    if (!result.timed_out && WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    return result;
}

}   // namespace termpanel::process
