#pragma once

#include <cstdint>
#include <string_view>

#include "session_id.hpp"

namespace termpanel::terminal
{

// Identifies one client connection across every session it subscribes to.
using SubscriberId = uint64_t;

// Where a bridge's reader threads deliver session output. Called from reader
// threads with no bridge lock held; implementations serialize their own sends.
class OutputSink
{
   public:
    virtual ~OutputSink() = default;

    virtual void on_output(SubscriberId subscriber, const SessionId& session,
                           std::string_view data) = 0;

    // The PTY reached EOF or failed; the connection is dead until the next acquire.
    virtual void on_stream_closed(SubscriberId subscriber, const SessionId& session,
                                  const std::string& reason) = 0;
};

}   // namespace termpanel::terminal
