#pragma once

#include <stdexcept>
#include <string>

namespace signalhub
{

enum class error_kind
{
    validation_error,
    not_found,
    unknown_session,
    already_bound,
    peer_unavailable,
    peer_unreachable,
    not_a_member,
    invalid_state,
    internal_fault,
};

inline const char* to_string(error_kind kind)
{
    switch (kind)
    {
        case error_kind::validation_error: return "ValidationError";
        case error_kind::not_found: return "NotFound";
        case error_kind::unknown_session: return "UnknownSession";
        case error_kind::already_bound: return "AlreadyBound";
        case error_kind::peer_unavailable: return "PeerUnavailable";
        case error_kind::peer_unreachable: return "PeerUnreachable";
        case error_kind::not_a_member: return "NotAMember";
        case error_kind::invalid_state: return "InvalidState";
        case error_kind::internal_fault: return "InternalFault";
    }
    return "InternalFault";
}

// HTTP-style status used by the request/response surface.
inline int http_status(error_kind kind)
{
    switch (kind)
    {
        case error_kind::validation_error:
            return 400;
        case error_kind::not_found:
        case error_kind::unknown_session:
            return 404;
        case error_kind::already_bound:
        case error_kind::peer_unavailable:
        case error_kind::peer_unreachable:
        case error_kind::not_a_member:
        case error_kind::invalid_state:
            return 409;
        case error_kind::internal_fault:
            return 500;
    }
    return 500;
}

class registry_error : public std::runtime_error
{
    error_kind kind_;

public:
    registry_error(error_kind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    error_kind kind() const noexcept { return kind_; }
};

} // namespace signalhub
