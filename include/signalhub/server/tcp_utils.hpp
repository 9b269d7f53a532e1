#pragma once

#include <signalhub/logger.h>

#include <boost/asio.hpp>

#include <cstdint>

#ifdef __linux__
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#endif

namespace signalhub::server
{

// ============================================================================
// TCP Utilities
// ============================================================================

// Detects peers that vanish without a FIN (mobile devices changing network)
inline void enable_keepalive(boost::asio::ip::tcp::socket& socket, uint16_t idle_seconds)
{
    boost::system::error_code ec;
    socket.set_option(boost::asio::socket_base::keep_alive(true), ec);

    if (ec)
    {
        log_warning("failed to enable SO_KEEPALIVE: {}", ec.message());
        return;
    }

#ifdef __linux__
    int idle = static_cast<int>(idle_seconds);
    int interval = 10;
    int count = 5;
    int fd = static_cast<int>(socket.native_handle());

    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) != 0)
        log_warning("TCP_KEEPIDLE setsockopt failed");

    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval)) != 0)
        log_warning("TCP_KEEPINTVL setsockopt failed");

    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count)) != 0)
        log_warning("TCP_KEEPCNT setsockopt failed");
#else
    (void)idle_seconds;
#endif
}

inline void enable_no_delay(boost::asio::ip::tcp::socket& socket)
{
    boost::system::error_code ec;
    socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);

    if (ec)
        log_warning("failed to enable TCP_NODELAY: {}", ec.message());
}

} // namespace signalhub::server
