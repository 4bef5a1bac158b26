#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace termpanel::display
{

// Variables a session exports to route GUI output to a virtual display.
enum class EnvKey : uint8_t
{
    Display,
    GdkBackend,
    QtPlatform,
    SdlVideoDriver,
    LibglSoftware,
};

static constexpr size_t ENV_KEY_COUNT = 5;

std::string_view env_key_name(EnvKey key);

// Variables that would steer toolkits to a real Wayland session instead.
static constexpr std::array<std::string_view, 2> COMPETING_DISPLAY_VARS = {
    "WAYLAND_DISPLAY",
    "XDG_SESSION_TYPE",
};

class DisplayEnvironment
{
   public:
    static DisplayEnvironment for_display(int display);

    const std::string& get(EnvKey key) const { return values_[static_cast<size_t>(key)]; }

    std::vector<std::pair<EnvKey, std::string>> entries() const;
    std::map<std::string, std::string>          to_map() const;

    // "export DISPLAY=:100 GDK_BACKEND=x11 ... && unset WAYLAND_DISPLAY ..."
    std::string export_command() const;

    // "unset DISPLAY GDK_BACKEND ..." for every key this record sets.
    static std::string unset_command();

   private:
    std::array<std::string, ENV_KEY_COUNT> values_;
};

}   // namespace termpanel::display
