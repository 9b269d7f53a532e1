#pragma once

#include <chrono>

namespace signalhub
{

// ============================================================================
// Registry Configuration
// ============================================================================

struct registry_config
{
    // Reaper period
    std::chrono::seconds sweep_interval{60};

    // Devices older than this are hidden from availability listings
    std::chrono::seconds freshness_window{300};

    // Hard removal thresholds applied by the reaper
    std::chrono::seconds device_expiry{600};
    std::chrono::seconds session_expiry{3600};

    bool is_valid() const
    {
        return sweep_interval.count() > 0 &&
               freshness_window.count() > 0 &&
               device_expiry.count() > 0 &&
               session_expiry.count() > 0 &&
               freshness_window <= device_expiry;
    }
};

} // namespace signalhub
