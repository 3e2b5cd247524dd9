#include "../include/enclosure-cache/metrics_collector.hpp"

#ifdef HAVE_PROMETHEUS

#include "../include/enclosure-cache/logger.hpp"

namespace EnclosureCache
{

MetricsCollector::MetricsCollector(const MetricsConfig &config)
: implementation(config.enabled ? std::make_unique<PrometheusMetricsImpl>(config) : nullptr)
{
}

void MetricsCollector::recordResolveCacheHit()
{
    if (implementation)
    {
        implementation->recordResolve(true);
    }
}

void MetricsCollector::recordResolveCacheMiss()
{
    if (implementation)
    {
        implementation->recordResolve(false);
    }
}

void MetricsCollector::recordPolicyDenial(std::string_view reason)
{
    if (implementation)
    {
        implementation->recordPolicyDenial(reason);
    }
}

void MetricsCollector::recordTransferStarted()
{
    if (implementation)
    {
        implementation->recordTransferStarted();
    }
}

void MetricsCollector::recordTransferFailed(std::string_view reason)
{
    if (implementation)
    {
        implementation->recordTransferFailed(reason);
    }
}

void MetricsCollector::recordPreloadRun(std::string_view outcome)
{
    if (implementation)
    {
        implementation->recordPreloadRun(outcome);
    }
}

void MetricsCollector::recordFileRemoval(bool approved)
{
    if (implementation)
    {
        implementation->recordFileRemoval(approved);
    }
}

void MetricsCollector::recordProbeArmed()
{
    if (implementation)
    {
        implementation->recordProbeArmed();
    }
}

void MetricsCollector::updatePendingTasks(size_t count)
{
    if (implementation)
    {
        implementation->updatePendingTasks(count);
    }
}

void MetricsCollector::updateActiveTasks(size_t count)
{
    if (implementation)
    {
        implementation->updateActiveTasks(count);
    }
}

std::string MetricsCollector::getMetricsUrl() const
{
    if (implementation)
    {
        return implementation->getMetricsUrl();
    }
    return "metrics disabled";
}

std::unique_ptr<MetricsCollector> GlobalMetrics::metrics_instance = nullptr;

MetricsCollector &GlobalMetrics::instance()
{
    if (!metrics_instance)
    {
        // Nothing is exposed until initialize() is called with metrics enabled
        static MetricsCollector no_op_metrics(MetricsConfig{});
        return no_op_metrics;
    }

    return *metrics_instance;
}

void GlobalMetrics::initialize(const MetricsConfig &config)
{
    if (!config.enabled)
    {
        Logger::info(LogCategory::METRICS, "Metrics disabled in configuration");
        metrics_instance = nullptr;
        return;
    }

    try
    {
        metrics_instance = std::make_unique<MetricsCollector>(config);
        Logger::info(LogCategory::METRICS, "Global metrics initialized: {}", metrics_instance->getMetricsUrl());
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::METRICS, "Failed to initialize global metrics: {}", e.what());
        metrics_instance = nullptr;
    }
}

void GlobalMetrics::shutdown()
{
    if (metrics_instance)
    {
        Logger::info(LogCategory::METRICS, "Shutting down global metrics");
        metrics_instance.reset();
    }
}

} // namespace EnclosureCache

#endif // HAVE_PROMETHEUS
