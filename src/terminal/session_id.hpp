#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace termpanel::terminal
{

static constexpr size_t MAX_SESSION_NAME_LEN = 64;

// Opaque, canonical session identity: "<prefix><name>". Produced once per
// inbound request by canonical(); everything downstream passes it around
// without re-checking prefixes.
class SessionId
{
   public:
    SessionId() = default;

    // Prefix `raw` unless it already carries `prefix`, then validate.
    // Valid names are [A-Za-z0-9_-], at most MAX_SESSION_NAME_LEN long
    // including the prefix. tmux rewrites '.' and ':' so they are rejected.
    static std::optional<SessionId> canonical(std::string_view prefix, std::string_view raw);

    // Accept a name that is already canonical (e.g. read back from tmux).
    static std::optional<SessionId> from_canonical(std::string_view prefix,
                                                   std::string_view full);

    const std::string& str() const { return full_; }
    bool               empty() const { return full_.empty(); }

    auto operator<=>(const SessionId&) const = default;

   private:
    explicit SessionId(std::string full) : full_(std::move(full)) {}

    std::string full_;
};

bool is_valid_session_name(std::string_view name);

struct SessionIdHash
{
    size_t operator()(const SessionId& id) const noexcept
    {
        return std::hash<std::string>{}(id.str());
    }
};

}   // namespace termpanel::terminal
