#pragma once

#include <signalhub/server/http_session.hpp>

#include <boost/asio.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

namespace signalhub::server
{

// ============================================================================
// Listener
// ============================================================================
//
// Accepts TCP connections and starts an http_session on a fresh strand for
// each. The acceptor is bound in the constructor so that a port clash is
// reported before the io threads start.

class listener : public std::enable_shared_from_this<listener>
{
    boost::asio::io_context* io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    endpoint_context& context_;
    uint16_t keepalive_idle_;

public:
    listener(boost::asio::io_context* io_context,
             std::string_view ip_address,
             uint16_t port,
             endpoint_context& context,
             uint16_t keepalive_idle = 60);

    listener(const listener&) = delete;
    listener& operator=(const listener&) = delete;
    listener(listener&&) = delete;
    listener& operator=(listener&&) = delete;
    ~listener() = default;

    void start();
    void stop();

    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();
};

} // namespace signalhub::server
