#pragma once

#include <signalhub/hub.hpp>
#include <signalhub/mirror/mirror_store.hpp>
#include <signalhub/monitoring/metrics_manager.hpp>
#include <signalhub/registry/errors.hpp>
#include <signalhub/registry/reaper.hpp>
#include <signalhub/relay/events.hpp>

#include <memory>

namespace signalhub::monitoring
{

    // Relay counters and registry gauges. Safe to call from any io thread;
    // prometheus metrics are internally synchronised.
    class RelayMetrics
    {
    public:
        explicit RelayMetrics(std::shared_ptr<prometheus::Registry> registry);

        RelayMetrics(const RelayMetrics&)            = delete;
        RelayMetrics& operator=(const RelayMetrics&) = delete;

        void RecordRelayed(payload_kind kind);
        void RecordFailure(error_kind kind);
        void RecordSweep(const sweep_report& report);

        /// Refresh gauges from a hub snapshot. A configured mirror that
        /// does not answer marks the service unhealthy.
        void Update(const health_snapshot& snapshot);
        void UpdateUptime();
        void SetHealthy(bool healthy);

        [[nodiscard]] double Relayed(payload_kind kind);
        [[nodiscard]] double Failures(error_kind kind);
        [[nodiscard]] double Reaped(record_kind kind);
        [[nodiscard]] double Devices() const { return devices_.Value(); }
        [[nodiscard]] double Sessions() const { return sessions_.Value(); }
        [[nodiscard]] double ActiveSessions() const { return active_sessions_.Value(); }
        [[nodiscard]] double MirrorConnected() const { return mirror_connected_.Value(); }
        [[nodiscard]] double HealthStatus() const { return health_status_.Value(); }

    private:
        std::shared_ptr<prometheus::Registry> registry_;

        prometheus::Family<prometheus::Counter>& relayed_;
        prometheus::Family<prometheus::Counter>& failures_;
        prometheus::Family<prometheus::Counter>& reaped_;

        prometheus::Gauge& devices_;
        prometheus::Gauge& sessions_;
        prometheus::Gauge& active_sessions_;
        prometheus::Gauge& mirror_connected_;
        prometheus::Gauge& uptime_;
        prometheus::Gauge& health_status_;
    };

} // namespace signalhub::monitoring
