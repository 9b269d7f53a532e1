#pragma once

#include <signalhub/registry/errors.hpp>

#include <optional>
#include <ostream>

namespace signalhub
{

// gtest printer so failed comparisons show the kind name.
inline void PrintTo(error_kind kind, std::ostream* os)
{
    *os << to_string(kind);
}

namespace test_support
{

// The kind a call failed with, or nullopt when it succeeded.
template<typename Fn>
std::optional<error_kind> error_kind_of(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const registry_error& e)
    {
        return e.kind();
    }
    return std::nullopt;
}

} // namespace test_support
} // namespace signalhub
