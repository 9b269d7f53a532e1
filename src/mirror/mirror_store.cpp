#include <signalhub/mirror/mirror_store.hpp>

namespace signalhub
{

const char* collection_name(record_kind kind)
{
    return kind == record_kind::device ? "devices" : "sessions";
}

// ============================================================================
// memory_mirror
// ============================================================================

void memory_mirror::save(const mirror_record& record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_[{record.kind, record.id}] = record.body;
}

std::optional<nlohmann::json> memory_mirror::load(record_kind kind, const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find({kind, id});
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::vector<mirror_record> memory_mirror::load_all(record_kind kind)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<mirror_record> result;
    for (auto& [key, body] : records_)
    {
        if (key.first == kind)
            result.push_back({kind, key.second, body});
    }
    return result;
}

void memory_mirror::erase(record_kind kind, const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase({kind, id});
}

size_t memory_mirror::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// ============================================================================
// Helpers
// ============================================================================

void mirror_save(mirror_store& mirror, const device& record) noexcept
{
    best_effort("save device", [&] {
        mirror.save({record_kind::device, record.id, nlohmann::json(record)});
    });
}

void mirror_save(mirror_store& mirror, const session& record) noexcept
{
    best_effort("save session", [&] {
        mirror.save({record_kind::session, record.id, nlohmann::json(record)});
    });
}

void mirror_erase(mirror_store& mirror, record_kind kind, const std::string& id) noexcept
{
    best_effort("erase", [&] { mirror.erase(kind, id); });
}

} // namespace signalhub
