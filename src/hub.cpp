#include <signalhub/hub.hpp>

#include <signalhub/logger.h>

#include <stdexcept>

namespace signalhub
{

namespace
{
registry_config checked(registry_config config)
{
    if (!config.is_valid())
        throw std::invalid_argument("invalid registry configuration: thresholds must be positive "
                                    "and freshness_window must not exceed device_expiry");
    return config;
}
} // namespace

hub::hub(boost::asio::io_context* io_context_ptr,
         const clock& clock,
         mirror_store& mirror,
         transport& transport,
         registry_config config,
         token_generator generator)
    : clock_(clock)
    , mirror_(mirror)
    , config_(checked(config))
    , devices_(store_, clock_, config_)
    , sessions_(store_, clock_, config_, std::move(generator))
    , relay_(store_, clock_, transport, devices_, sessions_)
    , reaper_(std::make_shared<reaper>(io_context_ptr, store_, clock_, config_))
{
    store_.set_mirror(&mirror_);
}

hub::~hub()
{
    reaper_->stop();
}

void hub::start()
{
    preload();
    reaper_->start();
}

void hub::stop()
{
    reaper_->stop();
}

size_t hub::preload() noexcept
{
    size_t loaded = 0;

    best_effort("preload devices", [&] {
        for (const auto& record : mirror_.load_all(record_kind::device))
        {
            try
            {
                auto d = record.body.get<device>();
                // No live channel survives a restart
                d.status = device_status::offline;
                store_.restore_device(std::move(d));
                ++loaded;
            }
            catch (const std::exception& e)
            {
                log_warning("skipping unreadable mirrored device {}: {}", record.id, e.what());
            }
        }
    });

    best_effort("preload sessions", [&] {
        for (const auto& record : mirror_.load_all(record_kind::session))
        {
            try
            {
                if (store_.insert_session(record.body.get<session>()))
                    ++loaded;
            }
            catch (const std::exception& e)
            {
                log_warning("skipping unreadable mirrored session {}: {}", record.id, e.what());
            }
        }
    });

    if (loaded)
        log_info("restored {} records from {} mirror", loaded, mirror_.name());
    return loaded;
}

health_snapshot hub::health()
{
    auto counts = store_.counts();

    health_snapshot snapshot;
    snapshot.at = clock_.now();
    snapshot.devices = counts.devices;
    snapshot.online_devices = counts.online_devices;
    snapshot.sessions = counts.sessions;
    snapshot.active_sessions = counts.active_sessions;
    snapshot.channels = counts.channels;
    snapshot.mirror = mirror_.name();
    best_effort("ping", [&] { snapshot.mirror_connected = mirror_.is_connected(); });
    return snapshot;
}

} // namespace signalhub
