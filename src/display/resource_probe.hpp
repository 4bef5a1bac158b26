#pragma once

#include <cstdint>
#include <string>

namespace termpanel::display
{

// OS-level checks run before a slot is started. Our own table is not enough:
// a crashed instance or a foreign X server can hold any of these.

// True when 127.0.0.1:<port> can be bound right now.
bool port_available(uint16_t port);

std::string display_lock_path(const std::string& x11_tmp_dir, int display);
std::string display_socket_path(const std::string& x11_tmp_dir, int display);

// Neither the lock file nor the listening socket of display :<n> exists.
bool display_available(const std::string& x11_tmp_dir, int display);

}   // namespace termpanel::display
