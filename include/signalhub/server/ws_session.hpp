#pragma once

#include <signalhub/server/event_gateway.hpp>
#include <signalhub/server/ws_transport.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <string>

namespace signalhub::server
{

// ============================================================================
// WebSocket Session
// ============================================================================
//
// One upgraded connection. All stream operations run on the socket's strand;
// send() may be called from any thread and is serialised through a write
// queue.

class ws_session : public channel_sink, public std::enable_shared_from_this<ws_session>
{
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;
    ws_transport& transport_;
    event_gateway& gateway_;
    size_t max_message_size_;
    channel_id id_;
    std::atomic<bool> finished_{false};

public:
    ws_session(boost::asio::ip::tcp::socket&& socket,
               ws_transport& transport,
               event_gateway& gateway,
               size_t max_message_size);

    ws_session(const ws_session&) = delete;
    ws_session& operator=(const ws_session&) = delete;

    // Completes the handshake for an upgrade request read by http_session.
    void run(boost::beast::http::request<boost::beast::http::string_body> request);

    void send(std::string text) override;
    void close() override;

    const channel_id& id() const { return id_; }

private:
    void on_accept(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, size_t bytes);
    void do_write();
    void on_write(boost::beast::error_code ec, size_t bytes);
    void finish(boost::beast::error_code ec);
};

} // namespace signalhub::server
