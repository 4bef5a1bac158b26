#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <termpanel/error.hpp>

#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"
#include "../terminal/output_sink.hpp"

namespace termpanel::daemon
{

// Connected clients keyed by subscriber id. Messages to one client are
// serialized by that client's own send mutex, so PTY reader threads and the
// event loop can both send.
class ClientHub : public terminal::OutputSink
{
   public:
    ClientHub() = default;

    ClientHub(const ClientHub&)            = delete;
    ClientHub& operator=(const ClientHub&) = delete;

    // Takes ownership of `conn` and assigns it a fresh subscriber id.
    ipc::SubscriberId add(std::unique_ptr<ipc::Connection> conn);

    // Closes and forgets the client. Safe against concurrent send().
    void remove(ipc::SubscriberId id);

    // Stamps the sequence number and subscriber id. False if the client is
    // gone or the write failed.
    bool send(ipc::SubscriberId id, ipc::Message msg);

    // Blocking read of the next frame; called from the event loop only.
    // On failure `why` (if given) receives the reason.
    std::optional<ipc::Message> recv(ipc::SubscriberId id, ipc::RecvError* why = nullptr);

    std::vector<std::pair<ipc::SubscriberId, int>> poll_targets() const;

    size_t client_count() const;
    bool   contains(ipc::SubscriberId id) const;

    // ─── OutputSink ──────────────────────────────────────────────────────────
    void on_output(terminal::SubscriberId subscriber, const terminal::SessionId& session,
                   std::string_view data) override;
    void on_stream_closed(terminal::SubscriberId subscriber, const terminal::SessionId& session,
                          const std::string& reason) override;

   private:
    struct Slot
    {
        std::unique_ptr<ipc::Connection> conn;
        std::mutex                       send_mu;
    };

    std::shared_ptr<Slot> slot(ipc::SubscriberId id) const;

    mutable std::mutex                                           mu_;
    std::unordered_map<ipc::SubscriberId, std::shared_ptr<Slot>> clients_;
    ipc::SubscriberId                                            next_id_ = 1;
    std::atomic<uint64_t>                                        seq_{1};
};

// Builders shared by the event loop and the hub.
ipc::Message make_message(ipc::MessageType type, ipc::RequestId request_id,
                          std::vector<uint8_t> payload);
ipc::Message make_ok(ipc::RequestId request_id);
ipc::Message make_err(ipc::RequestId request_id, const Error& error);

}   // namespace termpanel::daemon
