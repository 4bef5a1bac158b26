#include "transport.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include "codec.hpp"

namespace termpanel::ipc
{

namespace
{

std::optional<sockaddr_un> unix_address(const std::string& path)
{
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
        return std::nullopt;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
}

// -1 with errno set on failure.
int connect_fd(const sockaddr_un& addr)
{
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return -1;
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }
    return fd;
}

}   // namespace

const char* recv_error_name(RecvError e)
{
    switch (e)
    {
        case RecvError::None:
            return "none";
        case RecvError::Closed:
            return "closed by peer";
        case RecvError::Io:
            return "read error";
        case RecvError::BadHeader:
            return "bad frame header";
        case RecvError::Oversized:
            return "oversized frame";
    }
    return "unknown";
}

// ─── Connection ──────────────────────────────────────────────────────────────

Connection::Connection(int fd) : fd_(fd) {}

Connection::~Connection()
{
    close();
}

Connection::Connection(Connection&& other) noexcept
    : fd_(other.fd_), last_error_(other.last_error_)
{
    other.fd_ = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_         = other.fd_;
        last_error_ = other.last_error_;
        other.fd_   = -1;
    }
    return *this;
}

bool Connection::fill(uint8_t* buf, size_t len)
{
    for (size_t got = 0; got < len;)
    {
        ssize_t n = ::read(fd_, buf + got, len - got);
        if (n > 0)
        {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        last_error_ = n == 0 ? RecvError::Closed : RecvError::Io;
        return false;
    }
    return true;
}

bool Connection::drain(const uint8_t* buf, size_t len)
{
    for (size_t sent = 0; sent < len;)
    {
        // MSG_NOSIGNAL: a vanished client must not raise SIGPIPE.
        ssize_t n = ::send(fd_, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        return false;
    }
    return true;
}

bool Connection::send(const Message& msg)
{
    if (fd_ < 0)
        return false;
    auto wire = encode_message(msg);
    return drain(wire.data(), wire.size());
}

std::optional<Message> Connection::recv()
{
    last_error_ = RecvError::None;
    if (fd_ < 0)
    {
        last_error_ = RecvError::Closed;
        return std::nullopt;
    }

    uint8_t raw[HEADER_SIZE];
    if (!fill(raw, HEADER_SIZE))
        return std::nullopt;

    auto header = decode_header(std::span<const uint8_t>(raw, HEADER_SIZE));
    if (!header)
    {
        last_error_ = RecvError::BadHeader;
        return std::nullopt;
    }
    if (header->payload_len > MAX_PAYLOAD_SIZE)
    {
        last_error_ = RecvError::Oversized;
        return std::nullopt;
    }

    Message msg;
    msg.header = *header;
    msg.payload.resize(header->payload_len);
    if (header->payload_len > 0 && !fill(msg.payload.data(), msg.payload.size()))
        return std::nullopt;
    return msg;
}

std::optional<PeerCredentials> Connection::peer_credentials() const
{
    if (fd_ < 0)
        return std::nullopt;
    ucred     cred{};
    socklen_t len = sizeof(cred);
    if (::getsockopt(fd_, SOL_SOCKET, SO_PEERCRED, &cred, &len) < 0)
        return std::nullopt;
    return PeerCredentials{cred.pid, cred.uid, cred.gid};
}

void Connection::close()
{
    if (fd_ < 0)
        return;
    ::close(fd_);
    fd_ = -1;
}

// ─── Server ──────────────────────────────────────────────────────────────────

Server::~Server()
{
    close();
}

bool Server::listen(const std::string& path)
{
    auto addr = unix_address(path);
    if (!addr)
    {
        errno = ENAMETOOLONG;
        return false;
    }

    struct stat st{};
    if (::lstat(path.c_str(), &st) == 0)
    {
        if (!S_ISSOCK(st.st_mode))
        {
            errno = EEXIST;
            return false;
        }
        int probe = connect_fd(*addr);
        if (probe >= 0)
        {
            ::close(probe);
            errno = EADDRINUSE;
            return false;
        }
        ::unlink(path.c_str());   // stale, left behind by a crashed daemon
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return false;

    // Tighten the umask around bind() so the socket is never world-reachable.
    mode_t old_mask = ::umask(0077);
    int    rc       = ::bind(fd, reinterpret_cast<const sockaddr*>(&*addr), sizeof(*addr));
    ::umask(old_mask);
    if (rc < 0 || ::listen(fd, 16) < 0)
    {
        int saved = errno;
        ::close(fd);
        if (rc == 0)
            ::unlink(path.c_str());
        errno = saved;
        return false;
    }

    listen_fd_ = fd;
    path_      = path;
    return true;
}

std::unique_ptr<Connection> Server::try_accept()
{
    if (listen_fd_ < 0)
        return nullptr;

    // Accepted sockets stay blocking so recv() always reads whole frames.
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0)
        return nullptr;
    return std::make_unique<Connection>(fd);
}

void Server::close()
{
    if (listen_fd_ >= 0)
    {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!path_.empty())
    {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

// ─── Client ──────────────────────────────────────────────────────────────────

std::unique_ptr<Connection> Client::connect(const std::string& path)
{
    auto addr = unix_address(path);
    if (!addr)
        return nullptr;
    int fd = connect_fd(*addr);
    if (fd < 0)
        return nullptr;
    return std::make_unique<Connection>(fd);
}

std::string default_socket_path()
{
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg)
        return std::string(xdg) + "/termpanel.sock";
    return "/tmp/termpanel-" + std::to_string(::getuid()) + ".sock";
}

}   // namespace termpanel::ipc
