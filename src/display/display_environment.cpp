#include "display_environment.hpp"

namespace termpanel::display
{

namespace
{

constexpr std::array<EnvKey, ENV_KEY_COUNT> ALL_KEYS = {
    EnvKey::Display, EnvKey::GdkBackend, EnvKey::QtPlatform, EnvKey::SdlVideoDriver,
    EnvKey::LibglSoftware,
};

}   // namespace

std::string_view env_key_name(EnvKey key)
{
    switch (key)
    {
        case EnvKey::Display:
            return "DISPLAY";
        case EnvKey::GdkBackend:
            return "GDK_BACKEND";
        case EnvKey::QtPlatform:
            return "QT_QPA_PLATFORM";
        case EnvKey::SdlVideoDriver:
            return "SDL_VIDEODRIVER";
        case EnvKey::LibglSoftware:
            return "LIBGL_ALWAYS_SOFTWARE";
    }
    return "";
}

DisplayEnvironment DisplayEnvironment::for_display(int display)
{
    DisplayEnvironment env;
    env.values_[static_cast<size_t>(EnvKey::Display)]        = ":" + std::to_string(display);
    env.values_[static_cast<size_t>(EnvKey::GdkBackend)]     = "x11";
    env.values_[static_cast<size_t>(EnvKey::QtPlatform)]     = "xcb";
    env.values_[static_cast<size_t>(EnvKey::SdlVideoDriver)] = "x11";
    env.values_[static_cast<size_t>(EnvKey::LibglSoftware)]  = "1";
    return env;
}

std::vector<std::pair<EnvKey, std::string>> DisplayEnvironment::entries() const
{
    std::vector<std::pair<EnvKey, std::string>> out;
    out.reserve(ENV_KEY_COUNT);
    for (EnvKey key : ALL_KEYS)
        out.emplace_back(key, get(key));
    return out;
}

std::map<std::string, std::string> DisplayEnvironment::to_map() const
{
    std::map<std::string, std::string> out;
    for (EnvKey key : ALL_KEYS)
        out.emplace(std::string(env_key_name(key)), get(key));
    return out;
}

std::string DisplayEnvironment::export_command() const
{
    std::string cmd = "export";
    for (EnvKey key : ALL_KEYS)
    {
        cmd += ' ';
        cmd += env_key_name(key);
        cmd += '=';
        cmd += get(key);
    }
    cmd += " && unset";
    for (std::string_view name : COMPETING_DISPLAY_VARS)
    {
        cmd += ' ';
        cmd += name;
    }
    return cmd;
}

std::string DisplayEnvironment::unset_command()
{
    std::string cmd = "unset";
    for (EnvKey key : ALL_KEYS)
    {
        cmd += ' ';
        cmd += env_key_name(key);
    }
    return cmd;
}

}   // namespace termpanel::display
