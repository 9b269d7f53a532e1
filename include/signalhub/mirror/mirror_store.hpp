#pragma once

#include <signalhub/logger.h>
#include <signalhub/registry/device.hpp>
#include <signalhub/registry/session.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace signalhub
{

// ============================================================================
// Durable Mirror Interface
// ============================================================================
//
// Non-authoritative shadow of the registry. Implementations throw
// mirror_error on failure; the core never lets that escape an operation.

enum class record_kind
{
    device,
    session,
};

// Collection (Redis hash) name for a record kind.
const char* collection_name(record_kind kind);

struct mirror_record
{
    record_kind kind{record_kind::device};
    std::string id{};
    nlohmann::json body{};
};

class mirror_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class mirror_store
{
public:
    virtual ~mirror_store() = default;

    virtual void save(const mirror_record& record) = 0;
    virtual std::optional<nlohmann::json> load(record_kind kind, const std::string& id) = 0;
    virtual std::vector<mirror_record> load_all(record_kind kind) = 0;
    virtual void erase(record_kind kind, const std::string& id) = 0;
    virtual bool is_connected() = 0;
    virtual std::string name() const = 0;
};

// ============================================================================
// Built-in Implementations
// ============================================================================

// No mirror configured: in-memory registry only.
class null_mirror : public mirror_store
{
public:
    void save(const mirror_record&) override {}
    std::optional<nlohmann::json> load(record_kind, const std::string&) override { return std::nullopt; }
    std::vector<mirror_record> load_all(record_kind) override { return {}; }
    void erase(record_kind, const std::string&) override {}
    bool is_connected() override { return false; }
    std::string name() const override { return "none"; }
};

// Process-local mirror used by tests and by hubs that share a mirror.
class memory_mirror : public mirror_store
{
    mutable std::mutex mutex_;
    std::map<std::pair<record_kind, std::string>, nlohmann::json> records_;

public:
    void save(const mirror_record& record) override;
    std::optional<nlohmann::json> load(record_kind kind, const std::string& id) override;
    std::vector<mirror_record> load_all(record_kind kind) override;
    void erase(record_kind kind, const std::string& id) override;
    bool is_connected() override { return true; }
    std::string name() const override { return "memory"; }

    size_t size() const;
};

// ============================================================================
// Best-effort helpers
// ============================================================================

template<typename Fn>
bool best_effort(std::string_view what, Fn&& fn) noexcept
{
    try
    {
        fn();
        return true;
    }
    catch (const std::exception& e)
    {
        log_warning("mirror {} failed, continuing in memory: {}", what, e.what());
        return false;
    }
}

void mirror_save(mirror_store& mirror, const device& record) noexcept;
void mirror_save(mirror_store& mirror, const session& record) noexcept;
void mirror_erase(mirror_store& mirror, record_kind kind, const std::string& id) noexcept;

} // namespace signalhub
