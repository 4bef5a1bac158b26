#pragma once

#include <string>
#include <vector>

#include <termpanel/error.hpp>

#include "../commands/command_store.hpp"
#include "../display/display_manager.hpp"
#include "../ipc/message.hpp"
#include "../terminal/pty_bridge.hpp"
#include "../terminal/session_service.hpp"
#include "../terminal/signal_router.hpp"
#include "client_hub.hpp"

namespace termpanel::daemon
{

// Translates inbound messages into calls on the services. Every request gets
// exactly one reply; subscribe and unsubscribe follow theirs with an event.
class EventDispatcher
{
   public:
    EventDispatcher(ClientHub& hub, terminal::SessionService& sessions,
                    terminal::PtyBridge& bridge, terminal::SignalRouter& signals,
                    display::DisplayManager& displays, commands::CommandStore& commands);

    // handle() and send everything it produced to `subscriber`.
    void dispatch(ipc::SubscriberId subscriber, const ipc::Message& msg);

    // Replies and events for one inbound message, in send order. Never throws.
    std::vector<ipc::Message> handle(ipc::SubscriberId subscriber, const ipc::Message& msg);

    // The client's connection is gone: leave every session it joined.
    void on_disconnect(ipc::SubscriberId subscriber);

   private:
    using Replies = std::vector<ipc::Message>;

    Replies handle_unchecked(ipc::SubscriberId subscriber, const ipc::Message& msg);

    // ─── Terminal events ─────────────────────────────────────────────────
    Replies on_hello(ipc::SubscriberId subscriber, const ipc::Message& msg);
    Replies on_subscribe(ipc::SubscriberId subscriber, const ipc::Message& msg);
    Replies on_unsubscribe(ipc::SubscriberId subscriber, const ipc::Message& msg);
    Replies on_input(const ipc::Message& msg);
    Replies on_resize(const ipc::Message& msg);
    Replies on_signal(const ipc::Message& msg);
    Replies on_scroll(const ipc::Message& msg);
    Replies on_scrollback(const ipc::Message& msg);

    // ─── Sessions ────────────────────────────────────────────────────────
    Replies on_session_create(const ipc::Message& msg);
    Replies on_session_list(const ipc::Message& msg);
    Replies on_session_destroy(const ipc::Message& msg);
    Replies on_session_command(const ipc::Message& msg);
    Replies on_bind_display(const ipc::Message& msg);
    Replies on_unbind_display(const ipc::Message& msg);

    // ─── Displays ────────────────────────────────────────────────────────
    Replies on_display_allocate(const ipc::Message& msg);
    Replies on_display_list(const ipc::Message& msg);
    Replies on_display_release(const ipc::Message& msg);
    Replies on_display_get(const ipc::Message& msg);
    Replies on_display_env(const ipc::Message& msg);
    Replies on_display_resize(const ipc::Message& msg);
    Replies on_display_panels(const ipc::Message& msg);

    // ─── Quick commands ──────────────────────────────────────────────────
    Replies on_commands_get(const ipc::Message& msg);
    Replies on_commands_add(const ipc::Message& msg);
    Replies on_commands_remove(const ipc::Message& msg);

    Replies commands_reply(ipc::RequestId request_id, const terminal::SessionId& id);

    ClientHub&                hub_;
    terminal::SessionService& sessions_;
    terminal::PtyBridge&      bridge_;
    terminal::SignalRouter&   signals_;
    display::DisplayManager&  displays_;
    commands::CommandStore&   commands_;
};

}   // namespace termpanel::daemon
