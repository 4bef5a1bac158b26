#include "client_hub.hpp"

#include <termpanel/logger.hpp>

#include "../ipc/codec.hpp"

namespace termpanel::daemon
{

ipc::Message make_message(ipc::MessageType type, ipc::RequestId request_id,
                          std::vector<uint8_t> payload)
{
    ipc::Message msg;
    msg.header.type        = type;
    msg.header.request_id  = request_id;
    msg.payload            = std::move(payload);
    msg.header.payload_len = static_cast<uint32_t>(msg.payload.size());
    return msg;
}

ipc::Message make_ok(ipc::RequestId request_id)
{
    return make_message(ipc::MessageType::RESP_OK, request_id,
                        ipc::encode_resp_ok({request_id}));
}

ipc::Message make_err(ipc::RequestId request_id, const Error& error)
{
    ipc::RespErrPayload p;
    p.request_id = request_id;
    p.code       = static_cast<uint32_t>(error.kind);
    p.kind       = std::string(error_kind_tag(error.kind));
    p.message    = error.detail;
    return make_message(ipc::MessageType::RESP_ERR, request_id, ipc::encode_resp_err(p));
}

// ─── Registry ───────────────────────────────────────────────────────────────

ipc::SubscriberId ClientHub::add(std::unique_ptr<ipc::Connection> conn)
{
    auto peer = conn->peer_credentials();
    auto s    = std::make_shared<Slot>();
    s->conn   = std::move(conn);

    ipc::SubscriberId id;
    {
        std::lock_guard lock(mu_);
        id = next_id_++;
        clients_.emplace(id, std::move(s));
    }
    if (peer)
        TERMPANEL_LOG_INFO("ipc", "Client {} connected (pid={}, uid={})", id, peer->pid,
                           peer->uid);
    else
        TERMPANEL_LOG_INFO("ipc", "Client {} connected", id);
    return id;
}

void ClientHub::remove(ipc::SubscriberId id)
{
    std::shared_ptr<Slot> s;
    {
        std::lock_guard lock(mu_);
        auto it = clients_.find(id);
        if (it == clients_.end())
            return;
        s = std::move(it->second);
        clients_.erase(it);
    }
    std::lock_guard send_lock(s->send_mu);
    s->conn->close();
}

std::shared_ptr<ClientHub::Slot> ClientHub::slot(ipc::SubscriberId id) const
{
    std::lock_guard lock(mu_);
    auto it = clients_.find(id);
    return it == clients_.end() ? nullptr : it->second;
}

bool ClientHub::send(ipc::SubscriberId id, ipc::Message msg)
{
    auto s = slot(id);
    if (!s)
        return false;

    msg.header.seq           = seq_.fetch_add(1, std::memory_order_relaxed);
    msg.header.subscriber_id = id;

    std::lock_guard send_lock(s->send_mu);
    if (!s->conn->is_open())
        return false;
    if (!s->conn->send(msg))
    {
        TERMPANEL_LOG_DEBUG("ipc", "Send of {} to client {} failed",
                            ipc::message_type_name(msg.header.type), id);
        return false;
    }
    return true;
}

std::optional<ipc::Message> ClientHub::recv(ipc::SubscriberId id, ipc::RecvError* why)
{
    auto s = slot(id);
    if (!s)
    {
        if (why)
            *why = ipc::RecvError::Closed;
        return std::nullopt;
    }
    auto msg = s->conn->recv();
    if (!msg && why)
        *why = s->conn->last_error();
    return msg;
}

std::vector<std::pair<ipc::SubscriberId, int>> ClientHub::poll_targets() const
{
    std::lock_guard                                lock(mu_);
    std::vector<std::pair<ipc::SubscriberId, int>> targets;
    targets.reserve(clients_.size());
    for (const auto& [id, s] : clients_)
        targets.emplace_back(id, s->conn->fd());
    return targets;
}

size_t ClientHub::client_count() const
{
    std::lock_guard lock(mu_);
    return clients_.size();
}

bool ClientHub::contains(ipc::SubscriberId id) const
{
    std::lock_guard lock(mu_);
    return clients_.count(id) > 0;
}

// ─── OutputSink ─────────────────────────────────────────────────────────────

void ClientHub::on_output(terminal::SubscriberId subscriber, const terminal::SessionId& session,
                          std::string_view data)
{
    ipc::TerminalDataPayload p;
    p.session = session.str();
    p.data    = std::string(data);
    send(subscriber, make_message(ipc::MessageType::EVT_OUTPUT, ipc::INVALID_REQUEST,
                                  ipc::encode_terminal_data(p)));
}

void ClientHub::on_stream_closed(terminal::SubscriberId     subscriber,
                                 const terminal::SessionId& session, const std::string& reason)
{
    ipc::ErrorEventPayload p;
    p.kind    = std::string(error_kind_tag(ErrorKind::StreamFault));
    p.message = reason;
    p.session = session.str();
    send(subscriber, make_message(ipc::MessageType::EVT_ERROR, ipc::INVALID_REQUEST,
                                  ipc::encode_error_event(p)));
}

}   // namespace termpanel::daemon
