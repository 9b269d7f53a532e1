#include <signalhub/registry/reaper.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace signalhub;
using namespace std::chrono_literals;

class ReaperTest : public ::testing::Test
{
protected:
    boost::asio::io_context io_context_;
    manual_clock clock_;
    registry_store store_;
    memory_mirror mirror_;

    ReaperTest() { store_.set_mirror(&mirror_); }

    registry_config config_with_interval(std::chrono::seconds interval)
    {
        registry_config config;
        config.sweep_interval = interval;
        return config;
    }

    void add_device(const std::string& id)
    {
        device d;
        d.id = id;
        d.capabilities = {"client"};
        d.last_seen = clock_.now();
        store_.upsert_device(d);
    }

    void add_session(const std::string& id)
    {
        session s;
        s.id = id;
        s.created_at = clock_.now();
        s.last_activity_at = clock_.now();
        store_.add_session(s);
    }
};

TEST_F(ReaperTest, SweepOnceRemovesExpiredRecordsAndMirrorEntries)
{
    auto sweeper = std::make_shared<reaper>(&io_context_, store_, clock_, registry_config{});
    add_device("old-device");
    add_session("old-session");
    add_session("ended-session");
    store_.transition("ended-session", session_status::ended, clock_.now());

    clock_.advance(601s);
    add_device("new-device");

    auto report = sweeper->sweep_once();
    EXPECT_EQ(report.at, clock_.now());
    EXPECT_EQ(report.devices, std::vector<std::string>{"old-device"});
    EXPECT_EQ(report.sessions, std::vector<std::string>{"ended-session"});

    EXPECT_FALSE(mirror_.load(record_kind::device, "old-device").has_value());
    EXPECT_FALSE(mirror_.load(record_kind::session, "ended-session").has_value());
    EXPECT_TRUE(mirror_.load(record_kind::device, "new-device").has_value());
    EXPECT_TRUE(store_.find_session("old-session").has_value());

    clock_.advance(3000s);
    report = sweeper->sweep_once();
    EXPECT_EQ(report.sessions, std::vector<std::string>{"old-session"});
}

TEST_F(ReaperTest, SweepOnceOnEmptyStoreReportsNothing)
{
    auto sweeper = std::make_shared<reaper>(&io_context_, store_, clock_, registry_config{});
    EXPECT_TRUE(sweeper->sweep_once().empty());
}

TEST_F(ReaperTest, HandlerSeesEverySweep)
{
    auto sweeper = std::make_shared<reaper>(&io_context_, store_, clock_, registry_config{});
    int calls = 0;
    size_t devices = 0;
    sweeper->set_sweep_handler([&](const sweep_report& report) {
        ++calls;
        devices += report.devices.size();
    });

    add_device("a");
    sweeper->sweep_once();
    clock_.advance(700s);
    sweeper->sweep_once();

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(devices, 1u);
}

TEST_F(ReaperTest, ThrowingHandlerDoesNotEscape)
{
    auto sweeper = std::make_shared<reaper>(&io_context_, store_, clock_, registry_config{});
    sweeper->set_sweep_handler([](const sweep_report&) { throw std::runtime_error("boom"); });

    add_device("a");
    clock_.advance(700s);
    auto report = sweeper->sweep_once();
    EXPECT_EQ(report.devices.size(), 1u);
}

TEST_F(ReaperTest, StartAndStopAreIdempotent)
{
    auto sweeper = std::make_shared<reaper>(&io_context_, store_, clock_, config_with_interval(1s));

    EXPECT_FALSE(sweeper->is_running());
    sweeper->start();
    sweeper->start();
    EXPECT_TRUE(sweeper->is_running());

    sweeper->stop();
    sweeper->stop();
    EXPECT_FALSE(sweeper->is_running());

    // Nothing left pending once the timer is cancelled
    io_context_.run_for(200ms);
    EXPECT_TRUE(io_context_.stopped());
}

TEST_F(ReaperTest, TimerDrivesPeriodicSweeps)
{
    auto sweeper = std::make_shared<reaper>(&io_context_, store_, clock_, config_with_interval(1s));
    std::atomic<int> sweeps{0};
    sweeper->set_sweep_handler([&](const sweep_report&) {
        if (++sweeps == 2)
            sweeper->stop();
    });

    add_device("stale");
    clock_.advance(700s);

    sweeper->start();
    io_context_.run_for(5s);

    EXPECT_EQ(sweeps.load(), 2);
    EXPECT_FALSE(sweeper->is_running());
    EXPECT_FALSE(store_.find_device("stale").has_value());
}
