#include <signalhub/monitoring/relay_metrics.hpp>

#include <string>

namespace signalhub::monitoring
{

    RelayMetrics::RelayMetrics(std::shared_ptr<prometheus::Registry> registry)
      : registry_(std::move(registry))
      , relayed_(MetricsManager::CreateCounterFamily(
          registry_, "signalhub_relayed_messages_total",
          "Negotiation messages delivered to a peer"))
      , failures_(MetricsManager::CreateCounterFamily(
          registry_, "signalhub_relay_failures_total",
          "Requests rejected, by error kind"))
      , reaped_(MetricsManager::CreateCounterFamily(
          registry_, "signalhub_reaped_total",
          "Records removed by the reaper"))
      , devices_(MetricsManager::CreateGauge(
          registry_, "signalhub_devices", "Registered devices"))
      , sessions_(MetricsManager::CreateGauge(
          registry_, "signalhub_sessions", "Sessions held in the registry"))
      , active_sessions_(MetricsManager::CreateGauge(
          registry_, "signalhub_active_sessions", "Sessions in the active state"))
      , mirror_connected_(MetricsManager::CreateGauge(
          registry_, "signalhub_mirror_connected",
          "Durable mirror reachable (1) or not (0)"))
      , uptime_(MetricsManager::CreateGauge(
          registry_, "signalhub_uptime_seconds", "Service uptime in seconds"))
      , health_status_(MetricsManager::CreateGauge(
          registry_, "signalhub_health_status",
          "Service health status (1=healthy, 0=unhealthy)"))
    {
        health_status_.Set(1.0);
    }

    void RelayMetrics::RecordRelayed(payload_kind kind)
    {
        MetricsManager::AddCounter(relayed_, {{"kind", std::string{event_name(kind)}}}).Increment();
    }

    void RelayMetrics::RecordFailure(error_kind kind)
    {
        MetricsManager::AddCounter(failures_, {{"error", to_string(kind)}}).Increment();
    }

    void RelayMetrics::RecordSweep(const sweep_report& report)
    {
        if (!report.devices.empty())
        {
            MetricsManager::AddCounter(reaped_, {{"record", collection_name(record_kind::device)}})
              .Increment(static_cast<double>(report.devices.size()));
        }
        if (!report.sessions.empty())
        {
            MetricsManager::AddCounter(reaped_, {{"record", collection_name(record_kind::session)}})
              .Increment(static_cast<double>(report.sessions.size()));
        }
    }

    void RelayMetrics::Update(const health_snapshot& snapshot)
    {
        devices_.Set(static_cast<double>(snapshot.devices));
        sessions_.Set(static_cast<double>(snapshot.sessions));
        active_sessions_.Set(static_cast<double>(snapshot.active_sessions));
        mirror_connected_.Set(snapshot.mirror_connected ? 1.0 : 0.0);

        const bool mirror_configured = snapshot.mirror != "none";
        SetHealthy(!mirror_configured || snapshot.mirror_connected);
        UpdateUptime();
    }

    void RelayMetrics::UpdateUptime()
    {
        uptime_.Set(MetricsManager::GetUptimeSeconds());
    }

    void RelayMetrics::SetHealthy(bool healthy)
    {
        health_status_.Set(healthy ? 1.0 : 0.0);
    }

    double RelayMetrics::Relayed(payload_kind kind)
    {
        return MetricsManager::AddCounter(relayed_, {{"kind", std::string{event_name(kind)}}}).Value();
    }

    double RelayMetrics::Failures(error_kind kind)
    {
        return MetricsManager::AddCounter(failures_, {{"error", to_string(kind)}}).Value();
    }

    double RelayMetrics::Reaped(record_kind kind)
    {
        return MetricsManager::AddCounter(reaped_, {{"record", collection_name(kind)}}).Value();
    }

} // namespace signalhub::monitoring
