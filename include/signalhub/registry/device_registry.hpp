#pragma once

#include <signalhub/registry/clock.hpp>
#include <signalhub/registry/device.hpp>
#include <signalhub/registry/registry_config.hpp>
#include <signalhub/registry/registry_store.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signalhub
{

// ============================================================================
// Device Registry
// ============================================================================

class device_registry
{
    registry_store& store_;
    const clock& clock_;
    registry_config config_;

public:
    device_registry(registry_store& store, const clock& clock, registry_config config)
        : store_(store)
        , clock_(clock)
        , config_(config) {}

    device_registry(const device_registry&) = delete;
    device_registry& operator=(const device_registry&) = delete;

    // Create or overwrite. The device comes back online with lastSeen = now.
    device register_device(const std::string& device_id, device_info info);

    // Unknown ids are ignored; they lost a race with expiry.
    bool touch(const std::string& device_id, std::optional<device_status> status = std::nullopt);

    // Online, fresh, and capable of `role`; most recently seen first.
    std::vector<device> list_available(std::string_view role) const;

    std::vector<device> list_all() const;
    std::optional<device> find(const std::string& device_id) const;
    bool is_available(const std::string& device_id) const;

    bool remove(const std::string& device_id);
};

} // namespace signalhub
