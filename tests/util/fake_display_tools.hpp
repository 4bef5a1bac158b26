#pragma once

// Shell-script stand-ins for Xvfb, x11vnc and websockify plus a private X11
// tmp dir, so the display pipeline can run without X installed.

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "core/config.hpp"

namespace termpanel::testing
{

static constexpr const char* LONG_RUNNING_SCRIPT = "#!/bin/sh\nexec sleep 60\n";
static constexpr const char* CRASHING_SCRIPT     = "#!/bin/sh\necho boom >&2\nexit 3\n";

class FakeDisplayTools
{
   public:
    FakeDisplayTools()
    {
        namespace fs     = std::filesystem;
        std::string tmpl = (fs::temp_directory_path() / "termpanel-x11-XXXXXX").string();
        dir_             = ::mkdtemp(tmpl.data());
        fs::create_directories(dir_ / ".X11-unix");
    }

    ~FakeDisplayTools()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    FakeDisplayTools(const FakeDisplayTools&)            = delete;
    FakeDisplayTools& operator=(const FakeDisplayTools&) = delete;

    // Writes an executable script named `name` and returns its path.
    std::string script(const std::string& name, const char* body) const
    {
        auto path = dir_ / name;
        std::ofstream(path) << body;
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path.string();
    }

    // Display config wired to the fake binaries, with short settle times and
    // a per-process port range.
    DisplayConfig config(int display_base = 900) const
    {
        using namespace std::chrono_literals;
        DisplayConfig c;
        c.xvfb_binary       = script("Xvfb", LONG_RUNNING_SCRIPT);
        c.vnc_binary        = script("x11vnc", LONG_RUNNING_SCRIPT);
        c.websockify_binary = script("websockify", LONG_RUNNING_SCRIPT);
        c.x11_tmp_dir       = dir_.string();
        c.display_base      = display_base;
        c.panel_count       = 3;
        const auto offset   = static_cast<uint16_t>((::getpid() % 1000) * 8);
        c.vnc_port_base     = static_cast<uint16_t>(41000 + offset);
        c.ws_port_base      = static_cast<uint16_t>(41004 + offset);
        c.framebuffer_settle = 20ms;
        c.vnc_settle         = 20ms;
        c.bridge_settle      = 20ms;
        c.terminate_grace    = 200ms;
        return c;
    }

    const std::filesystem::path& dir() const { return dir_; }

   private:
    std::filesystem::path dir_;
};

}   // namespace termpanel::testing
