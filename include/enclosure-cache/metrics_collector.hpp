#pragma once

#include "../types/config.hpp"

#ifdef HAVE_PROMETHEUS

#include "prometheus_metrics_impl.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace EnclosureCache
{

class MetricsCollector
{
    public:
    explicit MetricsCollector(const MetricsConfig &config);
    ~MetricsCollector() = default;

    MetricsCollector(const MetricsCollector &) = delete;
    MetricsCollector &operator=(const MetricsCollector &) = delete;
    MetricsCollector(MetricsCollector &&) = delete;
    MetricsCollector &operator=(MetricsCollector &&) = delete;

    // Resolution metrics
    void recordResolveCacheHit();
    void recordResolveCacheMiss();
    void recordPolicyDenial(std::string_view reason);

    // Transfer metrics
    void recordTransferStarted();
    void recordTransferFailed(std::string_view reason = "unknown");

    // Queue preloading metrics
    void recordPreloadRun(std::string_view outcome);
    void recordFileRemoval(bool approved);

    // Reachability metrics
    void recordProbeArmed();

    // Worker pool metrics
    void updatePendingTasks(size_t count);
    void updateActiveTasks(size_t count);

    std::string getMetricsUrl() const;

    private:
    std::unique_ptr<PrometheusMetricsImpl> implementation;
};

class GlobalMetrics
{
    public:
    static void initialize(const MetricsConfig &config);
    static void shutdown();
    static MetricsCollector &instance();

    private:
    static std::unique_ptr<MetricsCollector> metrics_instance;
};

} // namespace EnclosureCache

#else // !HAVE_PROMETHEUS

#include <string>
#include <string_view>

// No-op collector when prometheus-cpp is not available
namespace EnclosureCache
{

class MetricsCollector
{
    public:
    explicit MetricsCollector(const MetricsConfig &)
    {
    }
    ~MetricsCollector() = default;

    void recordResolveCacheHit()
    {
    }
    void recordResolveCacheMiss()
    {
    }
    void recordPolicyDenial(std::string_view)
    {
    }

    void recordTransferStarted()
    {
    }
    void recordTransferFailed(std::string_view = "unknown")
    {
    }

    void recordPreloadRun(std::string_view)
    {
    }
    void recordFileRemoval(bool)
    {
    }

    void recordProbeArmed()
    {
    }

    void updatePendingTasks(size_t)
    {
    }
    void updateActiveTasks(size_t)
    {
    }

    std::string getMetricsUrl() const
    {
        return "metrics disabled";
    }
};

class GlobalMetrics
{
    public:
    static void initialize(const MetricsConfig &)
    {
    }
    static void shutdown()
    {
    }
    static MetricsCollector &instance()
    {
        static MetricsCollector stub_metrics({});
        return stub_metrics;
    }
};

} // namespace EnclosureCache

#endif // HAVE_PROMETHEUS
