#pragma once

#include <signalhub/registry/errors.hpp>
#include <signalhub/relay/transport.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace signalhub::server
{

// ============================================================================
// Wire Envelope
// ============================================================================
//
// Every pub/sub frame is a JSON text message {"event": name, "data": {...}}.
// Inbound names are canonicalised so that older clients using the
// underscore spellings keep working.

struct inbound_event
{
    std::string name{};
    nlohmann::json data = nlohmann::json::object();
};

// Throws registry_error(validation_error) on malformed frames.
inbound_event decode_envelope(std::string_view text);

std::string encode_envelope(const outbound_event& event);

// Maps legacy aliases (webrtc_offer, ice_candidate, ...) onto canonical names.
std::string canonical_event_name(std::string_view name);

nlohmann::json error_body(error_kind kind, std::string_view message);

} // namespace signalhub::server
