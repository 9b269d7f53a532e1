#include <signalhub/server/envelope.hpp>

#include <signalhub/relay/events.hpp>

#include <array>
#include <utility>

namespace signalhub::server
{

namespace
{
constexpr std::array<std::pair<std::string_view, std::string_view>, 6> legacy_aliases{{
    {"register_device", events::register_device},
    {"webrtc_offer", events::offer},
    {"webrtc_answer", events::answer},
    {"ice_candidate", events::candidate},
    {"session_started", events::session_started},
    {"session_ended", events::session_ended},
}};
} // namespace

std::string canonical_event_name(std::string_view name)
{
    for (const auto& [alias, canonical] : legacy_aliases)
    {
        if (alias == name)
            return std::string{canonical};
    }
    return std::string{name};
}

inbound_event decode_envelope(std::string_view text)
{
    nlohmann::json frame = nlohmann::json::parse(text, nullptr, false);
    if (frame.is_discarded())
        throw registry_error(error_kind::validation_error, "frame is not valid JSON");
    if (!frame.is_object())
        throw registry_error(error_kind::validation_error, "frame must be a JSON object");

    auto name = frame.find("event");
    if (name == frame.end() || !name->is_string() || name->get_ref<const std::string&>().empty())
        throw registry_error(error_kind::validation_error, "frame has no event name");

    inbound_event event;
    event.name = canonical_event_name(name->get_ref<const std::string&>());

    if (auto data = frame.find("data"); data != frame.end() && !data->is_null())
    {
        if (!data->is_object())
            throw registry_error(error_kind::validation_error, "event data must be a JSON object");
        event.data = *data;
    }
    return event;
}

std::string encode_envelope(const outbound_event& event)
{
    return nlohmann::json{{"event", event.name}, {"data", event.data}}.dump();
}

nlohmann::json error_body(error_kind kind, std::string_view message)
{
    return {{"error", to_string(kind)}, {"message", message}};
}

} // namespace signalhub::server
