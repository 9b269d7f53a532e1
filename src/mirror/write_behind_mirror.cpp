#include <signalhub/mirror/write_behind_mirror.hpp>

#include <signalhub/logger.h>

#include <algorithm>
#include <stdexcept>

namespace signalhub
{

write_behind_mirror::write_behind_mirror(std::unique_ptr<mirror_store> backend, write_behind_options options)
    : backend_(std::move(backend))
    , options_(options)
    , backoff_(options.initial_backoff)
{
    if (!backend_)
        throw std::invalid_argument("write_behind_mirror needs a backend");

    worker_ = std::thread([this] { run(); });
}

write_behind_mirror::~write_behind_mirror()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();

    if (worker_.joinable())
        worker_.join();

    if (auto left = pending(); left > 0)
        log_warning("{} mirror writes dropped at shutdown", left);
}

void write_behind_mirror::save(const mirror_record& record)
{
    enqueue({record.kind, record.id}, {false, record.body});
}

void write_behind_mirror::erase(record_kind kind, const std::string& id)
{
    enqueue({kind, id}, {true, {}});
}

std::optional<nlohmann::json> write_behind_mirror::load(record_kind kind, const std::string& id)
{
    return backend_->load(kind, id);
}

std::vector<mirror_record> write_behind_mirror::load_all(record_kind kind)
{
    return backend_->load_all(kind);
}

bool write_behind_mirror::flush(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return order_.empty() && !busy_; });
}

size_t write_behind_mirror::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size() + (busy_ ? 1 : 0);
}

void write_behind_mirror::enqueue(record_key key, pending_write write)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = pending_.insert_or_assign(key, std::move(write));
        if (inserted)
            order_.push_back(std::move(key));
    }
    wake_.notify_one();
}

// ============================================================================
// Worker
// ============================================================================

void write_behind_mirror::run()
{
    probe();

    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        if (stopping_ && (order_.empty() || !connected_))
            break;

        if (order_.empty())
        {
            if (!wake_.wait_for(lock, options_.probe_interval, [this] { return stopping_ || !order_.empty(); }))
            {
                lock.unlock();
                probe();
                lock.lock();
            }
            continue;
        }

        if (!stopping_ && std::chrono::steady_clock::now() < retry_at_)
        {
            wake_.wait_until(lock, retry_at_, [this] { return stopping_; });
            continue;
        }

        auto key = std::move(order_.front());
        order_.pop_front();
        auto node = pending_.extract(key);
        auto write = std::move(node.mapped());
        busy_ = true;
        lock.unlock();

        bool ok = best_effort(write.erase ? "erase" : "save", [&] {
            if (write.erase)
                backend_->erase(key.first, key.second);
            else
                backend_->save({key.first, key.second, write.body});
        });

        lock.lock();
        busy_ = false;

        if (ok)
        {
            ++written_;
            backoff_ = options_.initial_backoff;
            if (!connected_.exchange(true))
                log_info("{} mirror reachable again", backend_->name());
        }
        else
        {
            ++failures_;
            connected_ = false;

            // Retry first unless a newer write for the record superseded it
            if (pending_.emplace(key, std::move(write)).second)
                order_.push_front(std::move(key));

            retry_at_ = std::chrono::steady_clock::now() + backoff_;
            log_debug("{} mirror write failed, retrying in {}ms", backend_->name(), backoff_.count());
            backoff_ = std::min(backoff_ * 2, options_.max_backoff);
        }

        if (order_.empty())
            idle_.notify_all();
    }

    idle_.notify_all();
}

void write_behind_mirror::probe()
{
    bool up = false;
    best_effort("ping", [&] { up = backend_->is_connected(); });

    if (connected_.exchange(up) != up)
        log_info("{} mirror {}", backend_->name(), up ? "connected" : "unreachable");
}

} // namespace signalhub
