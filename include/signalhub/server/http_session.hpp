#pragma once

#include <signalhub/server/event_gateway.hpp>
#include <signalhub/server/http_api.hpp>
#include <signalhub/server/ws_transport.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace signalhub::server
{

// Everything a connection needs from the running server.
struct endpoint_context
{
    http_api& api;
    event_gateway& gateway;
    ws_transport& transport;
    std::string websocket_path{"/ws"};
    size_t max_message_size{1024 * 1024};
    std::chrono::seconds request_timeout{30};
};

// ============================================================================
// HTTP Session
// ============================================================================
//
// Reads requests off one accepted socket. Plain requests go to the HTTP API;
// an upgrade on the WebSocket path hands the socket over to a ws_session.

class http_session : public std::enable_shared_from_this<http_session>
{
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    boost::beast::http::response<boost::beast::http::string_body> response_;
    endpoint_context& context_;

public:
    http_session(boost::asio::ip::tcp::socket&& socket, endpoint_context& context);

    http_session(const http_session&) = delete;
    http_session& operator=(const http_session&) = delete;

    void run();

private:
    void do_read();
    void on_read(boost::beast::error_code ec, size_t bytes);
    void on_write(bool close, boost::beast::error_code ec, size_t bytes);
    void do_close();
};

} // namespace signalhub::server
