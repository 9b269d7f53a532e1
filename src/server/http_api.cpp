#include <signalhub/server/http_api.hpp>

#include <signalhub/logger.h>
#include <signalhub/server/envelope.hpp>
#include <signalhub/server/request_fields.hpp>

#include <fmt/chrono.h>

#include <ctime>

namespace signalhub::server
{

namespace
{
constexpr std::string_view session_status_prefix = "/api/session_status/";

std::string iso_timestamp(clock::time_point at)
{
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}Z", fmt::gmtime(std::chrono::system_clock::to_time_t(at)));
}

nlohmann::json parse_body(std::string_view body)
{
    if (body.empty())
        return nlohmann::json::object();

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded())
        throw registry_error(error_kind::validation_error, "request body is not valid JSON");
    if (!parsed.is_object())
        throw registry_error(error_kind::validation_error, "request body must be a JSON object");
    return parsed;
}
} // namespace

http_reply json_reply(int status, const nlohmann::json& body)
{
    return {status, "application/json", body.dump()};
}

http_api::http_api(hub& hub, monitoring::RelayMetrics* metrics)
    : hub_(hub)
    , metrics_(metrics)
{
    routes_ = {
        {"POST", "/api/sessions", false, [](http_api& api, std::string_view, const nlohmann::json& b) { return api.create_session(b); }},
        {"GET", "/api/sessions", false, [](http_api& api, std::string_view, const nlohmann::json&) { return api.list_sessions(); }},
        {"POST", "/api/start_session", false, [](http_api& api, std::string_view, const nlohmann::json& b) { return api.start_session(b); }},
        {"POST", "/api/stop_session", false, [](http_api& api, std::string_view, const nlohmann::json& b) { return api.stop_session(b); }},
        {"POST", "/api/devices", false, [](http_api& api, std::string_view, const nlohmann::json& b) { return api.register_device(b); }},
        {"GET", "/api/devices", false, [](http_api& api, std::string_view, const nlohmann::json&) { return api.list_devices(); }},
        {"GET", "/api/servers", false, [](http_api& api, std::string_view, const nlohmann::json&) { return api.list_servers(); }},
        {"GET", std::string{session_status_prefix}, true,
         [](http_api& api, std::string_view path, const nlohmann::json&) {
             return api.session_status(path.substr(session_status_prefix.size()));
         }},
        {"GET", "/health", false, [](http_api& api, std::string_view, const nlohmann::json&) { return api.health(); }},
        {"GET", "/api/health", false, [](http_api& api, std::string_view, const nlohmann::json&) { return api.api_health(); }},
        {"GET", "/", false, [](http_api& api, std::string_view, const nlohmann::json&) { return api.index(); }},
    };
}

http_reply http_api::handle(std::string_view method, std::string_view target, std::string_view body) noexcept
{
    try
    {
        auto path = target.substr(0, target.find('?'));

        bool path_known = false;
        for (auto& r : routes_)
        {
            const bool matches = r.prefix ? path.rfind(r.path, 0) == 0 : path == r.path;
            if (!matches)
                continue;

            path_known = true;
            if (r.method != method)
                continue;

            auto json_body = method == "POST" ? parse_body(body) : nlohmann::json::object();
            return r.fn(*this, path, json_body);
        }

        if (path_known)
            return json_reply(405, {{"error", "MethodNotAllowed"}, {"message", std::string{method} + " not allowed on " + std::string{path}}});
        return json_reply(404, {{"error", "NotFound"}, {"message", "no route for " + std::string{path}}});
    }
    catch (const registry_error& e)
    {
        return failure(e.kind(), e.what());
    }
    catch (const nlohmann::json::exception& e)
    {
        return failure(error_kind::validation_error, e.what());
    }
    catch (const std::exception& e)
    {
        log_error("{} {} failed: {}", method, target, e.what());
        return failure(error_kind::internal_fault, "internal error");
    }
}

// ============================================================================
// Handlers
// ============================================================================

http_reply http_api::create_session(const nlohmann::json& body)
{
    auto server_id = optional_string(body, "server_id");
    auto id = hub_.sessions().create_session(server_id);
    auto record = hub_.sessions().get_session(id);

    if (server_id)
    {
        hub_.relay().notify_status(record);
        hub_.relay().announce_server(record);
    }
    return json_reply(200, {{"session_id", record.id}, {"status", record.status}});
}

http_reply http_api::start_session(const nlohmann::json& body)
{
    auto device_id = required_string(body, "device_id");
    auto info = parse_device_info(body);
    const bool is_server = info.metadata.value("device_type", "") == role_server;

    if (hub_.devices().find(device_id))
        hub_.devices().touch(device_id, device_status::online);
    else
        hub_.devices().register_device(device_id, std::move(info));

    nlohmann::json session_id = nullptr;
    if (is_server)
    {
        auto id = hub_.sessions().create_session(device_id);
        hub_.relay().announce_server(hub_.sessions().get_session(id));
        session_id = id;
    }

    return json_reply(200, {{"status", "success"}, {"device_id", device_id}, {"session_id", session_id}});
}

http_reply http_api::register_device(const nlohmann::json& body)
{
    auto device_id = required_string(body, "device_id");
    return json_reply(200, hub_.devices().register_device(device_id, parse_device_info(body)));
}

http_reply http_api::list_devices()
{
    auto all = hub_.devices().list_all();
    return json_reply(200, {{"devices", all}, {"total", all.size()}});
}

http_reply http_api::list_servers()
{
    auto servers = hub_.devices().list_available(role_server);
    return json_reply(200, {{"servers", servers}, {"total", servers.size()}});
}

http_reply http_api::list_sessions()
{
    auto sessions = hub_.sessions().list_available_sessions();
    return json_reply(200, {{"sessions", sessions}, {"total", sessions.size()}});
}

http_reply http_api::session_status(std::string_view session_id)
{
    if (session_id.empty())
        throw registry_error(error_kind::validation_error, "session id is required");
    return json_reply(200, hub_.sessions().get_session(std::string{session_id}));
}

http_reply http_api::stop_session(const nlohmann::json& body)
{
    auto session_id = required_string(body, "session_id");
    auto result = hub_.sessions().end_session(session_id);
    if (result.changed)
        hub_.relay().notify_status(result.record);

    return json_reply(200, {{"status", "success"}, {"session_id", session_id}, {"state", result.record.status}});
}

http_reply http_api::health()
{
    auto snapshot = hub_.health();
    if (metrics_)
        metrics_->Update(snapshot);

    return json_reply(200, {
        {"status", "healthy"},
        {"timestamp", to_epoch_seconds(snapshot.at)},
        {"devices_count", snapshot.devices},
        {"sessions_count", snapshot.sessions},
        {"active_sessions", snapshot.active_sessions},
        {"redis_connected", snapshot.mirror_connected},
    });
}

http_reply http_api::api_health()
{
    auto counts = hub_.store().counts();
    return json_reply(200, {
        {"status", "ok"},
        {"message", "signalhub relay is running"},
        {"timestamp", iso_timestamp(hub_.time_source().now())},
        {"active_sessions", counts.active_sessions},
        {"total_devices", counts.devices},
    });
}

http_reply http_api::index() const
{
    std::string text = "signalhub rendezvous and signaling relay\n\nHTTP routes:\n";
    for (const auto& r : routes_)
        text += fmt::format("  {:<5} {}{}\n", r.method, r.path, r.prefix ? "<session_id>" : "");

    text += "\nWebSocket events:\n"
            "  register-device, bind-server, bind-client, offer, answer, candidate, data,\n"
            "  session-started, session-ended, heartbeat\n";
    return {200, "text/plain; charset=utf-8", std::move(text)};
}

http_reply http_api::failure(error_kind kind, std::string_view message)
{
    if (metrics_)
        metrics_->RecordFailure(kind);
    return json_reply(http_status(kind), error_body(kind, message));
}

} // namespace signalhub::server
