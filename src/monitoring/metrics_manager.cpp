#include <signalhub/monitoring/metrics_manager.hpp>

#include <cstdlib>
#include <regex>

namespace signalhub::monitoring
{

    bool MetricsManager::Init()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (registry_)
            return false;

        registry_   = std::make_shared<prometheus::Registry>();
        start_time_ = std::chrono::steady_clock::now();

        const char* container = std::getenv("CONTAINER_ID");
        if (container && ValidateLabelValue(container))
        {
            dynamic_labels_["container_id"] = container;
        }
        return true;
    }

    std::shared_ptr<prometheus::Registry> MetricsManager::GetRegistry()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_)
        {
            throw std::runtime_error(
              "MetricsManager not initialized. Call MetricsManager::Init() first."
            );
        }
        return registry_;
    }

    void MetricsManager::Reset()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registry_.reset();
        default_labels_.clear();
        dynamic_labels_.clear();
        start_time_ = {};
    }

    void MetricsManager::RegisterWithExposer(prometheus::Exposer& exposer)
    {
        exposer.RegisterCollectable(GetRegistry());
    }

    void MetricsManager::SetDefaultLabels(const std::map<std::string, std::string>& labels)
    {
        ValidateLabels(labels);
        std::lock_guard<std::mutex> lock(mutex_);
        default_labels_ = labels;
    }

    std::map<std::string, std::string> MetricsManager::MergeLabels(
      const std::map<std::string, std::string>& labels
    )
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto merged = default_labels_;
        merged.insert(dynamic_labels_.begin(), dynamic_labels_.end());

        for (const auto& [key, value]: labels)
        {
            merged[key] = value;
        }
        return merged;
    }

    prometheus::Family<prometheus::Counter>& MetricsManager::CreateCounterFamily(
      const std::shared_ptr<prometheus::Registry>& registry,
      const std::string& name, const std::string& help
    )
    {
        if (!registry)
        {
            throw std::invalid_argument("Registry cannot be null");
        }
        ValidateMetricName(name);
        return prometheus::BuildCounter().Name(name).Help(help).Register(*registry);
    }

    prometheus::Counter& MetricsManager::AddCounter(
      prometheus::Family<prometheus::Counter>& family,
      const std::map<std::string, std::string>& labels
    )
    {
        ValidateLabels(labels);
        return family.Add(MergeLabels(labels));
    }

    prometheus::Gauge& MetricsManager::CreateGauge(
      const std::shared_ptr<prometheus::Registry>& registry,
      const std::string& name, const std::string& help,
      const std::map<std::string, std::string>& labels
    )
    {
        if (!registry)
        {
            throw std::invalid_argument("Registry cannot be null");
        }
        ValidateMetricName(name);
        ValidateLabels(labels);

        auto& family = prometheus::BuildGauge().Name(name).Help(help).Register(*registry);
        return family.Add(MergeLabels(labels));
    }

    bool MetricsManager::IsInitialized()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_ != nullptr;
    }

    double MetricsManager::GetUptimeSeconds()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (start_time_ == std::chrono::steady_clock::time_point {})
        {
            start_time_ = std::chrono::steady_clock::now();
        }
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    void MetricsManager::ValidateMetricName(const std::string& name)
    {
        if (name.empty())
        {
            throw std::invalid_argument("Metric name cannot be empty");
        }
        if (name.size() >= 2 && name[0] == '_' && name[1] == '_')
        {
            throw std::invalid_argument(
              "Metric name '" + name + "' cannot start with '__' (reserved prefix)"
            );
        }

        static const std::regex name_regex("^[a-zA-Z_:][a-zA-Z0-9_:]*$");
        if (!std::regex_match(name, name_regex))
        {
            throw std::invalid_argument(
              "Invalid metric name '" + name + "'. Must match [a-zA-Z_:][a-zA-Z0-9_:]*"
            );
        }
    }

    void MetricsManager::ValidateLabels(const std::map<std::string, std::string>& labels)
    {
        static const std::regex label_regex("^[a-zA-Z_][a-zA-Z0-9_]*$");

        for (const auto& [key, value]: labels)
        {
            if (key.empty())
            {
                throw std::invalid_argument("Label name cannot be empty");
            }
            if (key.size() >= 2 && key[0] == '_' && key[1] == '_')
            {
                throw std::invalid_argument(
                  "Label name '" + key + "' cannot start with '__' (reserved prefix)"
                );
            }
            if (!std::regex_match(key, label_regex))
            {
                throw std::invalid_argument(
                  "Invalid label name '" + key + "'. Must match [a-zA-Z_][a-zA-Z0-9_]*"
                );
            }
            if (!ValidateLabelValue(value))
            {
                throw std::invalid_argument(
                  "Label value for '" + key + "' contains invalid characters"
                );
            }
        }
    }

    bool MetricsManager::ValidateLabelValue(const std::string& value)
    {
        // Reject control chars except tab
        for (char c: value)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\t')
            {
                return false;
            }
        }
        return true;
    }

} // namespace signalhub::monitoring
