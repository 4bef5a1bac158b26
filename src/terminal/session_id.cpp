#include "session_id.hpp"

namespace termpanel::terminal
{

bool is_valid_session_name(std::string_view name)
{
    if (name.empty() || name.size() > MAX_SESSION_NAME_LEN)
        return false;
    for (char c : name)
    {
        if (c >= 'a' && c <= 'z')
            continue;
        if (c >= 'A' && c <= 'Z')
            continue;
        if (c >= '0' && c <= '9')
            continue;
        if (c == '-' || c == '_')
            continue;
        return false;
    }
    return true;
}

std::optional<SessionId> SessionId::canonical(std::string_view prefix, std::string_view raw)
{
    if (raw.empty())
        return std::nullopt;

    std::string full;
    if (!prefix.empty() && raw.substr(0, prefix.size()) == prefix)
        full = std::string(raw);
    else
        full = std::string(prefix) + std::string(raw);

    // A bare prefix names nothing.
    if (full.size() == prefix.size() || !is_valid_session_name(full))
        return std::nullopt;
    return SessionId(std::move(full));
}

std::optional<SessionId> SessionId::from_canonical(std::string_view prefix, std::string_view full)
{
    if (full.substr(0, prefix.size()) != prefix || full.size() == prefix.size())
        return std::nullopt;
    if (!is_valid_session_name(full))
        return std::nullopt;
    return SessionId(std::string(full));
}

}   // namespace termpanel::terminal
