#include <signalhub/server/ws_session.hpp>

#include <signalhub/logger.h>

namespace signalhub::server
{

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

ws_session::ws_session(boost::asio::ip::tcp::socket&& socket,
                       ws_transport& transport,
                       event_gateway& gateway,
                       size_t max_message_size)
    : ws_(std::move(socket))
    , transport_(transport)
    , gateway_(gateway)
    , max_message_size_(max_message_size)
{
}

void ws_session::run(http::request<http::string_body> request)
{
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "signalhub");
    }));
    ws_.read_message_max(max_message_size_);

    ws_.async_accept(request, beast::bind_front_handler(&ws_session::on_accept, shared_from_this()));
}

void ws_session::send(std::string text)
{
    boost::asio::post(ws_.get_executor(), [self = shared_from_this(), text = std::move(text)]() mutable {
        if (self->finished_)
            return;

        self->write_queue_.push_back(std::move(text));
        if (self->write_queue_.size() == 1)
            self->do_write();
    });
}

void ws_session::close()
{
    boost::asio::post(ws_.get_executor(), [self = shared_from_this()] {
        if (self->finished_)
            return;

        if (self->write_queue_.empty())
        {
            self->ws_.async_close(websocket::close_code::going_away,
                                  [self](beast::error_code ec) { self->finish(ec); });
            return;
        }

        // A write is in flight; drop the connection instead of racing it
        beast::error_code ec;
        beast::get_lowest_layer(self->ws_).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(self->ws_).close();
    });
}

void ws_session::on_accept(beast::error_code ec)
{
    if (ec)
    {
        log_debug("websocket handshake failed: {}", ec.message());
        return;
    }

    id_ = transport_.open(shared_from_this());
    log_info("channel {} opened", id_);

    gateway_.on_connect(id_);
    do_read();
}

void ws_session::do_read()
{
    ws_.async_read(buffer_, beast::bind_front_handler(&ws_session::on_read, shared_from_this()));
}

void ws_session::on_read(beast::error_code ec, size_t)
{
    if (ec)
        return finish(ec);

    auto text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    gateway_.handle(id_, text);
    do_read();
}

void ws_session::do_write()
{
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(write_queue_.front()),
                    beast::bind_front_handler(&ws_session::on_write, shared_from_this()));
}

void ws_session::on_write(beast::error_code ec, size_t)
{
    if (ec)
        return finish(ec);

    write_queue_.pop_front();
    if (!write_queue_.empty())
        do_write();
}

void ws_session::finish(beast::error_code ec)
{
    if (finished_.exchange(true))
        return;

    if (ec && ec != websocket::error::closed && ec != boost::asio::error::operation_aborted)
        log_debug("channel {} dropped: {}", id_, ec.message());

    write_queue_.clear();
    transport_.close(id_);
    gateway_.on_disconnect(id_);
    log_info("channel {} closed", id_);
}

} // namespace signalhub::server
