#include <signalhub/server/listener.hpp>

#include <signalhub/logger.h>
#include <signalhub/server/tcp_utils.hpp>

#include <stdexcept>
#include <string>

namespace signalhub::server
{

listener::listener(boost::asio::io_context* io_context,
                   std::string_view ip_address,
                   uint16_t port,
                   endpoint_context& context,
                   uint16_t keepalive_idle)
    : io_context_{io_context}
    , acceptor_(boost::asio::make_strand(*io_context))
    , context_(context)
    , keepalive_idle_(keepalive_idle)
{
    try
    {
        auto endpoint = boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address(ip_address), port};
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    }
    catch (const std::exception& ex)
    {
        throw std::runtime_error{"Failed to listen on " + std::string{ip_address} + ":" +
                                 std::to_string(port) + " error:" + std::string{ex.what()}};
    }
}

void listener::start()
{
    auto endpoint = acceptor_.local_endpoint();
    log_info("listening on {}:{}", endpoint.address().to_string(), endpoint.port());
    do_accept();
}

void listener::stop()
{
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        boost::system::error_code ec;
        self->acceptor_.close(ec);
    });
    context_.transport.close_all();
}

void listener::do_accept()
{
    acceptor_.async_accept(
        boost::asio::make_strand(*io_context_),
        [wptr = weak_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            auto self = wptr.lock();
            if (!self)
                return;

            if (ec)
            {
                if (ec == boost::asio::error::operation_aborted)
                    return;
                // Out of descriptors and the like; keep serving the others
                log_error("accept failed: {}", ec.message());
            }
            else
            {
                enable_keepalive(socket, self->keepalive_idle_);
                enable_no_delay(socket);
                std::make_shared<http_session>(std::move(socket), self->context_)->run();
            }

            self->do_accept();
        });
}

} // namespace signalhub::server
