#include <signalhub/signalhub.h>

#include <boost/asio.hpp>
#include <fmt/core.h>
#include <prometheus/exposer.h>

#include <csignal>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

using namespace signalhub;

namespace
{
constexpr std::chrono::seconds gauge_refresh_interval{5};
constexpr std::chrono::seconds shutdown_grace{2};

std::unique_ptr<mirror_store> make_mirror(const server::server_config& config)
{
    if (config.redis_url.empty())
        return std::make_unique<null_mirror>();

    auto redis = std::make_unique<redis_mirror>(parse_redis_url(config.redis_url));
    if (!redis->is_connected())
        log_warning("redis mirror not reachable yet; continuing in memory and retrying in the background");

    // Redis round-trips must never run on an event handler thread
    return std::make_unique<write_behind_mirror>(std::move(redis));
}
} // namespace

int main(int argc, char* argv[])
{
    server::server_config config;
    try
    {
        auto cli = server::parse_command_line(argc, argv);
        if (cli.help)
        {
            server::print_usage(argv[0]);
            return 0;
        }
        config = server::resolve_server_config(cli);
    }
    catch (const std::exception& e)
    {
        fmt::print(stderr, "{}: {}\n\n", argv[0], e.what());
        server::print_usage(argv[0]);
        return 2;
    }

    Logger::instance().set_level(parse_log_level(config.log_level).value_or(LogLevel::Info));
    log_info("{} starting", version_full());
    server::print_summary(config);

    try
    {
        auto mirror = make_mirror(config);

        boost::asio::io_context io_context{static_cast<int>(config.threads)};
        system_clock_source clock;
        server::ws_transport transport;
        hub relay_hub(&io_context, clock, *mirror, transport, config.registry);

        (void)monitoring::MetricsManager::Init();
        monitoring::RelayMetrics metrics(monitoring::MetricsManager::GetRegistry());

        std::unique_ptr<prometheus::Exposer> exposer;
        if (!config.metrics_address.empty())
        {
            exposer = std::make_unique<prometheus::Exposer>(config.metrics_address);
            monitoring::MetricsManager::RegisterWithExposer(*exposer);
            log_info("metrics exposed on http://{}/metrics", config.metrics_address);
        }

        relay_hub.sweeper().set_sweep_handler([&metrics](const sweep_report& report) { metrics.RecordSweep(report); });

        server::event_gateway gateway(relay_hub, transport, &metrics);
        server::http_api api(relay_hub, &metrics);
        server::endpoint_context context{api, gateway, transport, config.websocket_path, config.max_message_size};
        auto http_listener = std::make_shared<server::listener>(&io_context, config.bind_address, config.port, context);

        relay_hub.start();
        http_listener->start();

        boost::asio::steady_timer refresh(io_context);
        std::function<void()> schedule_refresh = [&] {
            refresh.expires_after(gauge_refresh_interval);
            refresh.async_wait([&](const boost::system::error_code& ec) {
                if (ec)
                    return;
                metrics.Update(relay_hub.health());
                schedule_refresh();
            });
        };
        metrics.Update(relay_hub.health());
        schedule_refresh();

        boost::asio::steady_timer shutdown_timer(io_context);
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;

            log_info("signal {} received, shutting down", signo);
            refresh.cancel();
            http_listener->stop();
            relay_hub.stop();

            // Let close handshakes drain, then stop regardless
            shutdown_timer.expires_after(shutdown_grace);
            shutdown_timer.async_wait([&](const boost::system::error_code&) { io_context.stop(); });
        });

        std::vector<std::thread> workers;
        workers.reserve(config.threads - 1);
        for (unsigned i = 1; i < config.threads; ++i)
            workers.emplace_back([&io_context] { io_context.run(); });

        io_context.run();
        for (auto& worker : workers)
            worker.join();

        if (auto* writer = dynamic_cast<write_behind_mirror*>(mirror.get()); writer && !writer->flush(shutdown_grace))
            log_warning("{} mirror writes still queued at exit", writer->pending());

        log_info("signalhub stopped");
        return 0;
    }
    catch (const std::exception& e)
    {
        log_error("fatal: {}", e.what());
        return 1;
    }
}
