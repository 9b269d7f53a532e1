#pragma once

#include <string_view>

namespace signalhub
{
    inline constexpr int version_major       = 1;
    inline constexpr int version_minor       = 0;
    inline constexpr int version_patch       = 0;
    inline constexpr const char* version_tag = "";

    inline constexpr std::string_view version()
    {
        return "1.0.0";
    }

    inline constexpr std::string_view version_full()
    {
        return "signalhub v1.0.0 - rendezvous and signaling relay";
    }
} // namespace signalhub
