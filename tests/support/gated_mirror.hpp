#pragma once

#include <signalhub/mirror/mirror_store.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace signalhub::test_support
{

// A mirror that stalls every write until open() is called, like a backend
// that accepted the connection and stopped answering.
class gated_mirror : public mirror_store
{
    std::mutex mutex_;
    std::condition_variable opened_;
    bool open_{false};

public:
    std::atomic<int> entered{0};
    memory_mirror records;

    void open()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        opened_.notify_all();
    }

    // Spins until `count` writes have reached the backend.
    bool wait_entered(int count, std::chrono::milliseconds timeout = std::chrono::seconds{5})
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (entered.load() < count)
        {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        return true;
    }

    void save(const mirror_record& record) override
    {
        wait();
        records.save(record);
    }

    void erase(record_kind kind, const std::string& id) override
    {
        wait();
        records.erase(kind, id);
    }

    std::optional<nlohmann::json> load(record_kind kind, const std::string& id) override { return records.load(kind, id); }
    std::vector<mirror_record> load_all(record_kind kind) override { return records.load_all(kind); }
    bool is_connected() override { return true; }
    std::string name() const override { return "gated"; }

private:
    void wait()
    {
        ++entered;
        std::unique_lock<std::mutex> lock(mutex_);
        opened_.wait(lock, [this] { return open_; });
    }
};

} // namespace signalhub::test_support
