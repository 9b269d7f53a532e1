#include <signalhub/server/http_session.hpp>

#include <signalhub/logger.h>
#include <signalhub/server/ws_session.hpp>

#include <boost/beast/websocket.hpp>

namespace signalhub::server
{

namespace beast = boost::beast;
namespace http = beast::http;

namespace
{
std::string as_string(beast::string_view text)
{
    return std::string(text.data(), text.size());
}
} // namespace

http_session::http_session(boost::asio::ip::tcp::socket&& socket, endpoint_context& context)
    : stream_(std::move(socket))
    , context_(context)
{
}

void http_session::run()
{
    boost::asio::dispatch(stream_.get_executor(),
                          beast::bind_front_handler(&http_session::do_read, shared_from_this()));
}

void http_session::do_read()
{
    parser_.emplace();
    parser_->body_limit(context_.max_message_size);

    stream_.expires_after(context_.request_timeout);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&http_session::on_read, shared_from_this()));
}

void http_session::on_read(beast::error_code ec, size_t)
{
    if (ec == http::error::end_of_stream)
        return do_close();
    if (ec)
    {
        if (ec != boost::asio::error::operation_aborted && ec != beast::error::timeout)
            log_debug("http read failed: {}", ec.message());
        return;
    }

    auto request = parser_->release();
    const auto target = as_string(request.target());
    const auto method = as_string(request.method_string());
    const auto path = target.substr(0, target.find('?'));

    if (beast::websocket::is_upgrade(request))
    {
        if (path == context_.websocket_path)
        {
            stream_.expires_never();
            std::make_shared<ws_session>(stream_.release_socket(), context_.transport, context_.gateway,
                                         context_.max_message_size)
                ->run(std::move(request));
            return;
        }
        log_debug("websocket upgrade on unknown path {} refused", path);
    }

    auto reply = context_.api.handle(method, target, request.body());

    response_ = http::response<http::string_body>{};
    response_.version(request.version());
    response_.result(static_cast<http::status>(reply.status));
    response_.set(http::field::server, "signalhub");
    response_.set(http::field::content_type, reply.content_type);
    response_.set(http::field::access_control_allow_origin, "*");
    response_.keep_alive(request.keep_alive());
    response_.body() = std::move(reply.body);
    response_.prepare_payload();

    log_debug("{} {} -> {}", method, target, reply.status);

    http::async_write(stream_, response_,
                      beast::bind_front_handler(&http_session::on_write, shared_from_this(),
                                                response_.need_eof()));
}

void http_session::on_write(bool close, beast::error_code ec, size_t)
{
    if (ec)
    {
        log_debug("http write failed: {}", ec.message());
        return;
    }

    if (close)
        return do_close();

    do_read();
}

void http_session::do_close()
{
    beast::error_code ec;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}

} // namespace signalhub::server
