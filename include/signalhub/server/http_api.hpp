#pragma once

#include <signalhub/hub.hpp>
#include <signalhub/monitoring/relay_metrics.hpp>
#include <signalhub/registry/errors.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace signalhub::server
{

struct http_reply
{
    int status{200};
    std::string content_type{"application/json"};
    std::string body{};
};

// ============================================================================
// HTTP API
// ============================================================================
//
// Request/response surface over the hub. Knows nothing about sockets:
// the listener hands it method, target and body and writes back the reply.

class http_api
{
public:
    using handler = std::function<http_reply(http_api&, std::string_view path, const nlohmann::json& body)>;

    struct route
    {
        std::string method{};
        std::string path{};
        bool prefix{false};
        handler fn{};
    };

private:
    hub& hub_;
    monitoring::RelayMetrics* metrics_;
    std::vector<route> routes_;

public:
    explicit http_api(hub& hub, monitoring::RelayMetrics* metrics = nullptr);

    http_api(const http_api&) = delete;
    http_api& operator=(const http_api&) = delete;

    // Never throws; failures are mapped to their HTTP status.
    http_reply handle(std::string_view method, std::string_view target, std::string_view body) noexcept;

    const std::vector<route>& routes() const { return routes_; }

private:
    http_reply create_session(const nlohmann::json& body);
    http_reply start_session(const nlohmann::json& body);
    http_reply register_device(const nlohmann::json& body);
    http_reply list_devices();
    http_reply list_servers();
    http_reply list_sessions();
    http_reply session_status(std::string_view session_id);
    http_reply stop_session(const nlohmann::json& body);
    http_reply health();
    http_reply api_health();
    http_reply index() const;

    http_reply failure(error_kind kind, std::string_view message);
};

http_reply json_reply(int status, const nlohmann::json& body);

} // namespace signalhub::server
