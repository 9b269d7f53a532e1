#include <signalhub/registry/reaper.hpp>

#include <signalhub/logger.h>

namespace signalhub
{

void reaper::start()
{
    if (running_.exchange(true))
        return;

    log_info("reaper started: every {}s, device expiry {}s, session expiry {}s",
             config_.sweep_interval.count(), config_.device_expiry.count(), config_.session_expiry.count());

    boost::asio::post(timer_.get_executor(), [wptr = weak_from_this()] {
        if (auto self = wptr.lock())
            self->schedule_next();
    });
}

void reaper::stop()
{
    if (!running_.exchange(false))
        return;

    boost::asio::post(timer_.get_executor(), [wptr = weak_from_this()] {
        if (auto self = wptr.lock())
        {
            boost::system::error_code ec;
            self->timer_.cancel(ec);
        }
    });
}

sweep_report reaper::sweep_once() noexcept
{
    sweep_report report;
    try
    {
        report.at = clock_.now();
        auto removed = store_.sweep(report.at,
                                    std::chrono::duration_cast<clock::duration>(config_.device_expiry),
                                    std::chrono::duration_cast<clock::duration>(config_.session_expiry));
        report.devices = std::move(removed.devices);
        report.sessions = std::move(removed.sessions);

        for (const auto& id : report.devices)
            log_info("device expired: {}", id);

        for (const auto& id : report.sessions)
            log_info("session reaped: {}", id);

        if (sweep_handler_)
            sweep_handler_(report);
    }
    catch (const std::exception& e)
    {
        log_error("reaper sweep failed: {}", e.what());
    }
    return report;
}

void reaper::schedule_next()
{
    if (!running_)
        return;

    timer_.expires_after(config_.sweep_interval);
    timer_.async_wait([wptr = weak_from_this()](const boost::system::error_code& ec) {
        // Cancelled by stop() or by destruction
        if (ec == boost::asio::error::operation_aborted)
            return;

        auto self = wptr.lock();
        if (!self || !self->running_)
            return;

        if (ec)
        {
            log_error("reaper timer failed: {}", ec.message());
            self->running_ = false;
            return;
        }

        self->sweep_once();
        self->schedule_next();
    });
}

} // namespace signalhub
