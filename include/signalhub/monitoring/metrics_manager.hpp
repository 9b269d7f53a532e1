// ============================================================================
// Core metrics manager
// ============================================================================
#pragma once

#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace signalhub::monitoring
{

    class MetricsManager
    {
    public:
        /// Initialize the process-wide registry. Idempotent.
        /// @return true if this call created the registry
        [[nodiscard]] static bool Init();

        [[nodiscard]] static std::shared_ptr<prometheus::Registry> GetRegistry();

        /// Drop the registry (tests). Invalidates all metric references.
        static void Reset();

        static void RegisterWithExposer(prometheus::Exposer& exposer);

        /// Labels applied to every metric created afterwards.
        /// @throws std::invalid_argument if any label name is invalid
        static void SetDefaultLabels(const std::map<std::string, std::string>& labels);

        /// Defaults, then dynamic labels, then `labels` (which win on conflict).
        [[nodiscard]] static std::map<std::string, std::string>
          MergeLabels(const std::map<std::string, std::string>& labels);

        [[nodiscard]] static prometheus::Family<prometheus::Counter>& CreateCounterFamily(
          const std::shared_ptr<prometheus::Registry>& registry,
          const std::string& name,
          const std::string& help);

        [[nodiscard]] static prometheus::Counter& AddCounter(
          prometheus::Family<prometheus::Counter>& family,
          const std::map<std::string, std::string>& labels);

        /// @return Reference valid until the registry is destroyed
        [[nodiscard]] static prometheus::Gauge& CreateGauge(
          const std::shared_ptr<prometheus::Registry>& registry,
          const std::string& name,
          const std::string& help,
          const std::map<std::string, std::string>& labels = {});

        [[nodiscard]] static bool IsInitialized();
        [[nodiscard]] static double GetUptimeSeconds();

        /// Must match [a-zA-Z_:][a-zA-Z0-9_:]* and not start with __
        static void ValidateMetricName(const std::string& name);
        static void ValidateLabels(const std::map<std::string, std::string>& labels);

    private:
        [[nodiscard]] static bool ValidateLabelValue(const std::string& value);

        inline static std::mutex mutex_;
        inline static std::shared_ptr<prometheus::Registry> registry_;
        inline static std::map<std::string, std::string> default_labels_;
        inline static std::map<std::string, std::string> dynamic_labels_;
        inline static std::chrono::steady_clock::time_point start_time_{};
    };

} // namespace signalhub::monitoring
