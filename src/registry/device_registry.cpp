#include <signalhub/registry/device_registry.hpp>

#include <signalhub/logger.h>
#include <signalhub/registry/errors.hpp>

#include <fmt/ranges.h>

#include <algorithm>

namespace signalhub
{

device device_registry::register_device(const std::string& device_id, device_info info)
{
    if (device_id.empty())
        throw registry_error(error_kind::validation_error, "device_id is required");

    if (!info.metadata.is_object())
        throw registry_error(error_kind::validation_error, "device metadata must be an object");

    device record;
    record.id = device_id;
    record.display_name = info.display_name.empty() ? default_display_name(device_id) : std::move(info.display_name);
    record.capabilities = info.capabilities.empty() ? std::set<std::string>{std::string{role_client}}
                                                    : std::move(info.capabilities);
    record.status = device_status::online;
    record.last_seen = clock_.now();
    record.metadata = std::move(info.metadata);

    auto stored = store_.upsert_device(std::move(record));

    log_info("device registered: {} ({}) capabilities=[{}]",
             stored.id, stored.display_name, fmt::join(stored.capabilities, ","));
    return stored;
}

bool device_registry::touch(const std::string& device_id, std::optional<device_status> status)
{
    auto updated = store_.touch_device(device_id, clock_.now(), status);
    if (!updated)
    {
        log_debug("touch for unknown device {} ignored", device_id);
        return false;
    }
    return true;
}

std::vector<device> device_registry::list_available(std::string_view role) const
{
    const auto now = clock_.now();
    const auto freshness = std::chrono::duration_cast<clock::duration>(config_.freshness_window);

    auto all = store_.devices();
    std::vector<device> available;
    for (auto& d : all)
    {
        if (d.has_capability(role) && signalhub::is_available(d, now, freshness))
            available.push_back(std::move(d));
    }

    std::sort(available.begin(), available.end(), [](const device& a, const device& b) {
        if (a.last_seen != b.last_seen)
            return a.last_seen > b.last_seen;
        return a.id < b.id;
    });
    return available;
}

std::vector<device> device_registry::list_all() const
{
    auto all = store_.devices();
    std::sort(all.begin(), all.end(), [](const device& a, const device& b) { return a.id < b.id; });
    return all;
}

std::optional<device> device_registry::find(const std::string& device_id) const
{
    return store_.find_device(device_id);
}

bool device_registry::is_available(const std::string& device_id) const
{
    auto d = store_.find_device(device_id);
    return d && signalhub::is_available(*d, clock_.now(),
                                        std::chrono::duration_cast<clock::duration>(config_.freshness_window));
}

bool device_registry::remove(const std::string& device_id)
{
    if (!store_.erase_device(device_id))
        return false;

    log_info("device removed: {}", device_id);
    return true;
}

} // namespace signalhub
