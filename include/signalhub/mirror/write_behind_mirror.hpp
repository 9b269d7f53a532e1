#pragma once

#include <signalhub/mirror/mirror_store.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace signalhub
{

struct write_behind_options
{
    // First wait after a failed write; doubles up to max_backoff.
    std::chrono::milliseconds initial_backoff{250};
    std::chrono::milliseconds max_backoff{std::chrono::seconds{30}};
    // An idle worker pings the backend this often to refresh is_connected().
    std::chrono::milliseconds probe_interval{std::chrono::seconds{5}};
};

// ============================================================================
// Write-Behind Mirror
// ============================================================================
//
// Puts a blocking mirror behind a queue drained by one worker thread.
// save() and erase() only enqueue, so callers never wait on the backend.
//
// Pending writes are keyed by record: a newer write for a record that is
// still queued replaces the older one in place, so the backend always ends
// on the last state handed in. Writes for one record reach the backend in
// the order they were handed in.
//
// After a failure the write is kept and the worker backs off before trying
// again; is_connected() reports the outcome of the last write or ping.
// load() and load_all() go straight to the backend (startup preload).

class write_behind_mirror : public mirror_store
{
    using record_key = std::pair<record_kind, std::string>;

    struct pending_write
    {
        bool erase{false};
        nlohmann::json body{};
    };

    std::unique_ptr<mirror_store> backend_;
    const write_behind_options options_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<record_key> order_;
    std::map<record_key, pending_write> pending_;
    bool busy_{false};
    bool stopping_{false};
    std::chrono::steady_clock::time_point retry_at_{};
    std::chrono::milliseconds backoff_;

    std::atomic<bool> connected_{false};
    std::atomic<size_t> written_{0};
    std::atomic<size_t> failures_{0};

    std::thread worker_;

public:
    explicit write_behind_mirror(std::unique_ptr<mirror_store> backend, write_behind_options options = {});
    ~write_behind_mirror() override;

    write_behind_mirror(const write_behind_mirror&) = delete;
    write_behind_mirror& operator=(const write_behind_mirror&) = delete;

    void save(const mirror_record& record) override;
    void erase(record_kind kind, const std::string& id) override;

    std::optional<nlohmann::json> load(record_kind kind, const std::string& id) override;
    std::vector<mirror_record> load_all(record_kind kind) override;

    bool is_connected() override { return connected_.load(); }
    std::string name() const override { return backend_->name(); }

    // Waits until the queue is drained. False on timeout.
    bool flush(std::chrono::milliseconds timeout);

    size_t pending() const;
    size_t written() const { return written_.load(); }
    size_t failures() const { return failures_.load(); }

private:
    void enqueue(record_key key, pending_write write);
    void run();
    void probe();
};

} // namespace signalhub
