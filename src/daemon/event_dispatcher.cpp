#include "event_dispatcher.hpp"

#include <exception>
#include <unistd.h>

#include <termpanel/logger.hpp>

#include "../ipc/codec.hpp"

namespace termpanel::daemon
{

namespace
{

using ipc::MessageType;
using Replies = std::vector<ipc::Message>;

Replies one(ipc::Message msg)
{
    Replies replies;
    replies.push_back(std::move(msg));
    return replies;
}

Replies error_reply(const ipc::Message& request, const Error& error)
{
    return one(make_err(request.header.request_id, error));
}

Replies malformed(const ipc::Message& request)
{
    return error_reply(request, make_error(ErrorKind::InvalidArgument,
                                           std::string("Malformed ")
                                               + ipc::message_type_name(request.header.type)
                                               + " payload"));
}

Replies status_reply(const ipc::Message& request, const Status& status)
{
    if (!status)
        return error_reply(request, status.error());
    return one(make_ok(request.header.request_id));
}

ipc::SessionEntry to_entry(const terminal::SessionInfo& info)
{
    ipc::SessionEntry e;
    e.name        = info.name;
    e.bridged     = info.bridged;
    e.subscribers = static_cast<uint32_t>(info.subscribers);
    e.pane_pid    = info.pane_pid ? static_cast<uint64_t>(*info.pane_pid) : 0;
    return e;
}

ipc::DisplayEntry to_entry(const display::SlotInfo& slot, bool created)
{
    ipc::DisplayEntry e;
    e.display     = slot.display;
    e.panel_index = slot.panel_index;
    e.vnc_port    = slot.vnc_port;
    e.ws_port     = slot.ws_port;
    e.width       = slot.width;
    e.height      = slot.height;
    e.depth       = slot.depth;
    e.created     = created;
    return e;
}

ipc::Message display_reply(ipc::RequestId request_id, const display::SlotInfo& slot,
                           bool created)
{
    ipc::DisplayListPayload p;
    p.displays.push_back(to_entry(slot, created));
    return make_message(MessageType::RESP_DISPLAY, request_id, ipc::encode_display_list(p));
}

Error display_not_found(int display)
{
    return make_error(ErrorKind::NotFound, "Display :" + std::to_string(display) + " not found");
}

}   // namespace

EventDispatcher::EventDispatcher(ClientHub& hub, terminal::SessionService& sessions,
                                 terminal::PtyBridge& bridge, terminal::SignalRouter& signals,
                                 display::DisplayManager& displays,
                                 commands::CommandStore&  commands)
    : hub_(hub),
      sessions_(sessions),
      bridge_(bridge),
      signals_(signals),
      displays_(displays),
      commands_(commands)
{
}

void EventDispatcher::dispatch(ipc::SubscriberId subscriber, const ipc::Message& msg)
{
    for (auto& reply : handle(subscriber, msg))
        hub_.send(subscriber, std::move(reply));
}

Replies EventDispatcher::handle(ipc::SubscriberId subscriber, const ipc::Message& msg)
{
    TERMPANEL_LOG_TRACE("daemon", "{} from client {}", ipc::message_type_name(msg.header.type),
                        subscriber);
    try
    {
        return handle_unchecked(subscriber, msg);
    }
    catch (const std::exception& e)
    {
        TERMPANEL_LOG_ERROR("daemon", "{} failed: {}", ipc::message_type_name(msg.header.type),
                            e.what());
        return error_reply(msg, make_error(ErrorKind::Internal, e.what()));
    }
}

void EventDispatcher::on_disconnect(ipc::SubscriberId subscriber)
{
    auto left = bridge_.release_subscriber_everywhere(subscriber);
    TERMPANEL_LOG_INFO("daemon", "Client {} disconnected, left {} session(s)", subscriber,
                       left.size());
}

Replies EventDispatcher::handle_unchecked(ipc::SubscriberId subscriber, const ipc::Message& msg)
{
    switch (msg.header.type)
    {
        case MessageType::HELLO: return on_hello(subscriber, msg);

        case MessageType::REQ_SUBSCRIBE: return on_subscribe(subscriber, msg);
        case MessageType::REQ_UNSUBSCRIBE: return on_unsubscribe(subscriber, msg);
        case MessageType::REQ_INPUT: return on_input(msg);
        case MessageType::REQ_RESIZE: return on_resize(msg);
        case MessageType::REQ_SIGNAL: return on_signal(msg);
        case MessageType::REQ_SCROLL: return on_scroll(msg);
        case MessageType::REQ_SCROLLBACK: return on_scrollback(msg);

        case MessageType::REQ_SESSION_CREATE: return on_session_create(msg);
        case MessageType::REQ_SESSION_LIST: return on_session_list(msg);
        case MessageType::REQ_SESSION_DESTROY: return on_session_destroy(msg);
        case MessageType::REQ_SESSION_COMMAND: return on_session_command(msg);
        case MessageType::REQ_BIND_DISPLAY: return on_bind_display(msg);
        case MessageType::REQ_UNBIND_DISPLAY: return on_unbind_display(msg);

        case MessageType::REQ_DISPLAY_ALLOCATE: return on_display_allocate(msg);
        case MessageType::REQ_DISPLAY_LIST: return on_display_list(msg);
        case MessageType::REQ_DISPLAY_RELEASE: return on_display_release(msg);
        case MessageType::REQ_DISPLAY_GET: return on_display_get(msg);
        case MessageType::REQ_DISPLAY_ENV: return on_display_env(msg);
        case MessageType::REQ_DISPLAY_RESIZE: return on_display_resize(msg);
        case MessageType::REQ_DISPLAY_PANELS: return on_display_panels(msg);

        case MessageType::REQ_COMMANDS_GET: return on_commands_get(msg);
        case MessageType::REQ_COMMANDS_ADD: return on_commands_add(msg);
        case MessageType::REQ_COMMANDS_REMOVE: return on_commands_remove(msg);

        default: break;
    }

    TERMPANEL_LOG_WARN("daemon", "Unexpected message type {} from client {}",
                       static_cast<uint16_t>(msg.header.type), subscriber);
    return error_reply(msg, make_error(ErrorKind::InvalidArgument,
                                       std::string("Unsupported message type ")
                                           + ipc::message_type_name(msg.header.type)));
}

// ─── Terminal events ────────────────────────────────────────────────────────

Replies EventDispatcher::on_hello(ipc::SubscriberId subscriber, const ipc::Message& msg)
{
    auto hello = ipc::decode_hello(msg.payload);
    if (!hello)
        return malformed(msg);
    if (hello->protocol_major != ipc::PROTOCOL_MAJOR)
    {
        return error_reply(msg, make_error(ErrorKind::InvalidArgument,
                                           "Unsupported protocol version "
                                               + std::to_string(hello->protocol_major)));
    }

    TERMPANEL_LOG_INFO("daemon", "HELLO from client {} (build={})", subscriber,
                       hello->client_build);

    ipc::WelcomePayload wp;
    wp.subscriber_id  = subscriber;
    wp.daemon_pid     = static_cast<uint64_t>(::getpid());
    wp.session_prefix = sessions_.config().session_prefix;
    return one(make_message(MessageType::WELCOME, msg.header.request_id, ipc::encode_welcome(wp)));
}

Replies EventDispatcher::on_subscribe(ipc::SubscriberId subscriber, const ipc::Message& msg)
{
    auto req = ipc::decode_terminal_size(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());

    const auto& config = sessions_.config();
    uint16_t    cols   = req->cols ? req->cols : config.default_cols;
    uint16_t    rows   = req->rows ? req->rows : config.default_rows;

    if (!bridge_.acquire(*id, subscriber, cols, rows))
    {
        if (!sessions_.exists(*id))
            return error_reply(msg, make_error(ErrorKind::NotFound, "Session not found"));
        return error_reply(msg, make_error(ErrorKind::StreamFault,
                                           "Cannot attach to session " + id->str()));
    }

    Replies replies = one(make_ok(msg.header.request_id));
    replies.push_back(make_message(MessageType::EVT_SUBSCRIBED, msg.header.request_id,
                                   ipc::encode_session_target({id->str()})));
    return replies;
}

Replies EventDispatcher::on_unsubscribe(ipc::SubscriberId subscriber, const ipc::Message& msg)
{
    auto req = ipc::decode_session_target(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());

    if (!bridge_.release(*id, subscriber))
        return error_reply(msg, make_error(ErrorKind::NotFound,
                                           "Not subscribed to " + id->str()));

    Replies replies = one(make_ok(msg.header.request_id));
    replies.push_back(make_message(MessageType::EVT_UNSUBSCRIBED, msg.header.request_id,
                                   ipc::encode_session_target({id->str()})));
    return replies;
}

Replies EventDispatcher::on_input(const ipc::Message& msg)
{
    auto req = ipc::decode_terminal_data(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    return status_reply(msg, bridge_.write(*id, req->data));
}

Replies EventDispatcher::on_resize(const ipc::Message& msg)
{
    auto req = ipc::decode_terminal_size(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    return status_reply(msg, bridge_.resize(*id, req->cols, req->rows));
}

Replies EventDispatcher::on_signal(const ipc::Message& msg)
{
    auto req = ipc::decode_signal(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());

    int sig = terminal::parse_signal(req->signal);
    if (!signals_.deliver(*id, sig))
    {
        if (!sessions_.exists(*id))
            return error_reply(msg, make_error(ErrorKind::NotFound, "Session not found"));
        return error_reply(msg, make_error(ErrorKind::Internal,
                                           "Could not deliver signal to " + id->str()));
    }
    return one(make_ok(msg.header.request_id));
}

Replies EventDispatcher::on_scroll(const ipc::Message& msg)
{
    auto req = ipc::decode_scroll(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    auto command = terminal::parse_scroll_command(req->command);
    if (!command)
        return error_reply(msg, make_error(ErrorKind::InvalidArgument,
                                           "Unknown scroll command '" + req->command + "'"));
    return status_reply(msg, sessions_.scroll(*id, *command, req->lines));
}

Replies EventDispatcher::on_scrollback(const ipc::Message& msg)
{
    auto req = ipc::decode_scrollback_request(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());

    std::optional<int> end_line;
    if (req->end_line)
        end_line = *req->end_line;
    auto result = sessions_.scrollback(*id, req->start_line, end_line);
    if (!result)
        return error_reply(msg, result.error());

    ipc::ScrollbackPayload p;
    p.session      = id->str();
    p.content      = std::move(result->content);
    p.history_size = result->history_size;
    p.start_line   = result->start_line;
    return one(make_message(MessageType::EVT_SCROLLBACK, msg.header.request_id,
                            ipc::encode_scrollback(p)));
}

// ─── Sessions ───────────────────────────────────────────────────────────────

Replies EventDispatcher::on_session_create(const ipc::Message& msg)
{
    auto req = ipc::decode_session_create(msg.payload);
    if (!req)
        return malformed(msg);

    terminal::CreateSessionRequest request;
    request.name    = req->name;
    request.cwd     = req->cwd;
    request.command = req->command;

    auto created = sessions_.create(request);
    if (!created)
        return error_reply(msg, created.error());

    ipc::SessionListPayload p;
    p.sessions.push_back(to_entry(*created));
    return one(make_message(MessageType::RESP_SESSION, msg.header.request_id,
                            ipc::encode_session_list(p)));
}

Replies EventDispatcher::on_session_list(const ipc::Message& msg)
{
    ipc::SessionListPayload p;
    for (const auto& info : sessions_.list())
        p.sessions.push_back(to_entry(info));
    return one(make_message(MessageType::RESP_SESSIONS, msg.header.request_id,
                            ipc::encode_session_list(p)));
}

Replies EventDispatcher::on_session_destroy(const ipc::Message& msg)
{
    auto req = ipc::decode_session_target(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());

    auto destroyed = sessions_.destroy(*id);
    if (destroyed)
        commands_.clear(id->str());
    return status_reply(msg, destroyed);
}

Replies EventDispatcher::on_session_command(const ipc::Message& msg)
{
    auto req = ipc::decode_session_command(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    return status_reply(msg, sessions_.run_command(*id, req->command));
}

Replies EventDispatcher::on_bind_display(const ipc::Message& msg)
{
    auto req = ipc::decode_bind_display(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    return status_reply(msg, sessions_.bind_display(*id, req->display));
}

Replies EventDispatcher::on_unbind_display(const ipc::Message& msg)
{
    auto req = ipc::decode_session_target(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    return status_reply(msg, sessions_.unbind_display(*id));
}

// ─── Displays ───────────────────────────────────────────────────────────────

Replies EventDispatcher::on_display_allocate(const ipc::Message& msg)
{
    auto req = ipc::decode_display_allocate(msg.payload);
    if (!req)
        return malformed(msg);

    display::AllocateRequest request;
    request.display = req->display;
    request.panel   = req->panel;
    request.width   = req->width;
    request.height  = req->height;
    request.depth   = req->depth;

    auto allocated = displays_.allocate(request);
    if (!allocated)
        return error_reply(msg, allocated.error());
    return one(display_reply(msg.header.request_id, allocated->slot, allocated->created));
}

Replies EventDispatcher::on_display_list(const ipc::Message& msg)
{
    ipc::DisplayListPayload p;
    for (const auto& slot : displays_.list())
        p.displays.push_back(to_entry(slot, false));
    return one(make_message(MessageType::RESP_DISPLAYS, msg.header.request_id,
                            ipc::encode_display_list(p)));
}

Replies EventDispatcher::on_display_release(const ipc::Message& msg)
{
    auto req = ipc::decode_display_target(msg.payload);
    if (!req)
        return malformed(msg);
    return status_reply(msg, displays_.release(req->display));
}

Replies EventDispatcher::on_display_get(const ipc::Message& msg)
{
    auto req = ipc::decode_display_target(msg.payload);
    if (!req)
        return malformed(msg);
    auto slot = displays_.probe(req->display);
    if (!slot)
        return error_reply(msg, display_not_found(req->display));
    return one(display_reply(msg.header.request_id, *slot, false));
}

Replies EventDispatcher::on_display_env(const ipc::Message& msg)
{
    auto req = ipc::decode_display_target(msg.payload);
    if (!req)
        return malformed(msg);

    std::optional<display::DisplayEnvironment> env;
    if (displays_.probe(req->display))
        env = displays_.binding_environment(req->display);
    if (!env)
        return error_reply(msg, display_not_found(req->display));

    ipc::EnvPayload p;
    p.display = req->display;
    for (const auto& [key, value] : env->entries())
        p.vars.emplace_back(std::string(display::env_key_name(key)), value);
    for (std::string_view name : display::COMPETING_DISPLAY_VARS)
        p.unset.emplace_back(name);
    p.export_command = env->export_command();
    return one(make_message(MessageType::RESP_ENV, msg.header.request_id, ipc::encode_env(p)));
}

Replies EventDispatcher::on_display_resize(const ipc::Message& msg)
{
    auto req = ipc::decode_display_resize(msg.payload);
    if (!req)
        return malformed(msg);
    if (req->width == 0 || req->height == 0)
        return error_reply(msg, make_error(ErrorKind::InvalidArgument,
                                           "Width and height must be positive"));

    auto resized = displays_.resize(req->display, req->width, req->height);
    if (!resized)
        return error_reply(msg, resized.error());
    return one(display_reply(msg.header.request_id, resized->slot, resized->created));
}

Replies EventDispatcher::on_display_panels(const ipc::Message& msg)
{
    ipc::PanelsPayload p;
    for (const auto& panel : displays_.fixed_table())
        p.panels.push_back({panel.panel_index, panel.display, panel.vnc_port, panel.ws_port});
    return one(make_message(MessageType::RESP_PANELS, msg.header.request_id,
                            ipc::encode_panels(p)));
}

// ─── Quick commands ─────────────────────────────────────────────────────────

Replies EventDispatcher::commands_reply(ipc::RequestId request_id, const terminal::SessionId& id)
{
    ipc::CommandsPayload p;
    p.session = id.str();
    for (const auto& c : commands_.get(id.str()))
        p.commands.push_back({c.label, c.command});
    return one(make_message(MessageType::RESP_COMMANDS, request_id, ipc::encode_commands(p)));
}

Replies EventDispatcher::on_commands_get(const ipc::Message& msg)
{
    auto req = ipc::decode_session_target(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    return commands_reply(msg.header.request_id, *id);
}

Replies EventDispatcher::on_commands_add(const ipc::Message& msg)
{
    auto req = ipc::decode_commands_add(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    if (auto added = commands_.add(id->str(), req->label, req->command); !added)
        return error_reply(msg, added.error());
    return commands_reply(msg.header.request_id, *id);
}

Replies EventDispatcher::on_commands_remove(const ipc::Message& msg)
{
    auto req = ipc::decode_commands_remove(msg.payload);
    if (!req)
        return malformed(msg);
    auto id = sessions_.resolve(req->session);
    if (!id)
        return error_reply(msg, id.error());
    if (auto removed = commands_.remove(id->str(), req->index); !removed)
        return error_reply(msg, removed.error());
    return commands_reply(msg.header.request_id, *id);
}

}   // namespace termpanel::daemon
