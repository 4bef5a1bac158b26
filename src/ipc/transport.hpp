#pragma once

#include "message.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace termpanel::ipc
{

// Why the last recv() returned nothing.
enum class RecvError : uint8_t
{
    None = 0,
    Closed,      // orderly EOF from the peer
    Io,          // read() failed
    BadHeader,   // wrong magic or truncated header
    Oversized,   // payload_len above MAX_PAYLOAD_SIZE
};

const char* recv_error_name(RecvError e);

struct PeerCredentials
{
    pid_t pid = 0;
    uid_t uid = 0;
    gid_t gid = 0;
};

// ─── Connection ──────────────────────────────────────────────────────────────
// One framed stream over a connected AF_UNIX socket. Not thread-safe: the
// owner serializes send() and keeps recv() on a single thread.

class Connection
{
   public:
    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    bool is_open() const { return fd_ >= 0; }
    int  fd() const { return fd_; }

    bool send(const Message& msg);

    // Blocks until a whole frame is in. On failure last_error() says why.
    std::optional<Message> recv();
    RecvError              last_error() const { return last_error_; }

    // SO_PEERCRED of the other end.
    std::optional<PeerCredentials> peer_credentials() const;

    void close();

   private:
    // Fills `len` bytes or records the failure in last_error_.
    bool fill(uint8_t* buf, size_t len);
    bool drain(const uint8_t* buf, size_t len);

    int       fd_         = -1;
    RecvError last_error_ = RecvError::None;
};

// ─── Server ──────────────────────────────────────────────────────────────────

class Server
{
   public:
    Server() = default;
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Binds an owner-only socket at `path`. A leftover socket file nobody
    // answers on is replaced; one that accepts connections belongs to a
    // running daemon and makes listen() fail with errno = EADDRINUSE.
    bool listen(const std::string& path);

    // Never blocks; nullptr when no client is waiting.
    std::unique_ptr<Connection> try_accept();

    // Also unlinks the socket file.
    void close();

    bool               is_listening() const { return listen_fd_ >= 0; }
    int                listen_fd() const { return listen_fd_; }
    const std::string& path() const { return path_; }

   private:
    int         listen_fd_ = -1;
    std::string path_;
};

// ─── Client ──────────────────────────────────────────────────────────────────

class Client
{
   public:
    static std::unique_ptr<Connection> connect(const std::string& path);
};

// $XDG_RUNTIME_DIR/termpanel.sock, or /tmp/termpanel-<uid>.sock when
// XDG_RUNTIME_DIR is not set.
std::string default_socket_path();

}   // namespace termpanel::ipc
