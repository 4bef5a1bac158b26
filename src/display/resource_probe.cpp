#include "resource_probe.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <termpanel/logger.hpp>
#include <unistd.h>

namespace termpanel::display
{

bool port_available(uint16_t port)
{
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        TERMPANEL_LOG_ERROR("display", "socket() for port probe failed: {}", std::strerror(errno));
        return false;
    }

    struct sockaddr_in addr
    {
    };
    addr.sin_family      = AF_INET;
    addr.sin_port        = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool ok = ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return ok;
}

std::string display_lock_path(const std::string& x11_tmp_dir, int display)
{
    return x11_tmp_dir + "/.X" + std::to_string(display) + "-lock";
}

std::string display_socket_path(const std::string& x11_tmp_dir, int display)
{
    return x11_tmp_dir + "/.X11-unix/X" + std::to_string(display);
}

bool display_available(const std::string& x11_tmp_dir, int display)
{
    struct stat st
    {
    };
    if (::lstat(display_lock_path(x11_tmp_dir, display).c_str(), &st) == 0)
        return false;
    if (::lstat(display_socket_path(x11_tmp_dir, display).c_str(), &st) == 0)
        return false;
    return true;
}

}   // namespace termpanel::display
