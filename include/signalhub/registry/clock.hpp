#pragma once

#include <chrono>
#include <mutex>

namespace signalhub
{

// ============================================================================
// Time Source
// ============================================================================

class clock
{
public:
    using time_point = std::chrono::system_clock::time_point;
    using duration = std::chrono::system_clock::duration;

    virtual ~clock() = default;
    virtual time_point now() const = 0;
};

class system_clock_source : public clock
{
public:
    time_point now() const override { return std::chrono::system_clock::now(); }
};

// Settable clock for tests and replay.
class manual_clock : public clock
{
    mutable std::mutex mutex_;
    time_point now_;

public:
    explicit manual_clock(time_point start = time_point{std::chrono::hours{24 * 365 * 50}})
        : now_(start) {}

    time_point now() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(time_point t)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

    void advance(duration d)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }
};

inline double to_epoch_seconds(clock::time_point t)
{
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

inline clock::time_point from_epoch_seconds(double seconds)
{
    return clock::time_point{std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(seconds))};
}

} // namespace signalhub
