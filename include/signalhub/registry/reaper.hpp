#pragma once

#include <signalhub/registry/clock.hpp>
#include <signalhub/registry/registry_config.hpp>
#include <signalhub/registry/registry_store.hpp>

#include <boost/asio.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace signalhub
{

struct sweep_report
{
    clock::time_point at{};
    std::vector<std::string> devices{};
    std::vector<std::string> sessions{};

    bool empty() const { return devices.empty() && sessions.empty(); }
};

// ============================================================================
// Reaper
// ============================================================================
//
// Periodic sweep driven by a steady_timer on the owner's io_context. It only
// ever removes records. start()/stop() are idempotent; sweep_once() runs one
// cycle synchronously on the calling thread.

class reaper : public std::enable_shared_from_this<reaper>
{
public:
    using sweep_handler = std::function<void(const sweep_report&)>;

private:
    boost::asio::steady_timer timer_;
    registry_store& store_;
    const clock& clock_;
    const registry_config config_;
    sweep_handler sweep_handler_;
    std::atomic<bool> running_{false};

public:
    reaper(boost::asio::io_context* io_context_ptr,
           registry_store& store,
           const clock& clock,
           registry_config config)
        : timer_(boost::asio::make_strand(*io_context_ptr))
        , store_(store)
        , clock_(clock)
        , config_(config) {}

    reaper(const reaper&) = delete;
    reaper& operator=(const reaper&) = delete;
    reaper(reaper&&) = delete;
    reaper& operator=(reaper&&) = delete;

    // Set before start(); called after every sweep that ran.
    void set_sweep_handler(sweep_handler handler) { sweep_handler_ = std::move(handler); }

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    sweep_report sweep_once() noexcept;

private:
    void schedule_next();
};

} // namespace signalhub
