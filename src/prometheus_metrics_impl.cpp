#include "../include/enclosure-cache/prometheus_metrics_impl.hpp"

#ifdef HAVE_PROMETHEUS

#include "../include/enclosure-cache/logger.hpp"
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

namespace EnclosureCache
{

PrometheusMetricsImpl::PrometheusMetricsImpl(const MetricsConfig &config) : config(config)
{
    try
    {
        std::string bindAddr = config.bind_address + ":" + std::to_string(config.port);
        exposer = std::make_unique<prometheus::Exposer>(bindAddr, 1);

        registry = std::make_shared<prometheus::Registry>();
        exposer->RegisterCollectable(registry, config.endpoint_path);

        resolveFamily = &prometheus::BuildCounter()
                         .Name("enclosure_resolves_total")
                         .Help("Enclosure resolutions by cache result")
                         .Register(*registry);

        policyDenialsFamily = &prometheus::BuildCounter()
                               .Name("policy_denials_total")
                               .Help("Transfers refused by the data policy, by reason")
                               .Register(*registry);

        transfersStartedTotal = &prometheus::BuildCounter()
                                 .Name("transfers_started_total")
                                 .Help("Transfers handed to the transfer engine")
                                 .Register(*registry)
                                 .Add({});

        transfersFailedFamily = &prometheus::BuildCounter()
                                 .Name("transfers_failed_total")
                                 .Help("Transfers the engine refused or failed")
                                 .Register(*registry);

        preloadRunsFamily = &prometheus::BuildCounter()
                             .Name("preload_queue_runs_total")
                             .Help("Queue preloading runs by outcome")
                             .Register(*registry);

        fileRemovalsFamily = &prometheus::BuildCounter()
                              .Name("file_removal_requests_total")
                              .Help("Cached file removal requests by decision")
                              .Register(*registry);

        probesArmedTotal = &prometheus::BuildCounter()
                            .Name("reachability_probes_armed_total")
                            .Help("Reachability probes kept waiting for the network")
                            .Register(*registry)
                            .Add({});

        pendingTasks = &prometheus::BuildGauge()
                        .Name("worker_pending_tasks")
                        .Help("Tasks waiting in the worker pool")
                        .Register(*registry)
                        .Add({});

        activeTasks = &prometheus::BuildGauge()
                       .Name("worker_active_tasks")
                       .Help("Tasks running in the worker pool")
                       .Register(*registry)
                       .Add({});

        Logger::info(LogCategory::METRICS, "Metrics server started on {}{}", bindAddr, config.endpoint_path);
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::METRICS, "Failed to initialize metrics: {}", e.what());
        throw;
    }
}

PrometheusMetricsImpl::~PrometheusMetricsImpl() = default;

void PrometheusMetricsImpl::recordResolve(bool cache_hit)
{
    if (resolveFamily)
    {
        resolveFamily->Add({ { "result", cache_hit ? "hit" : "miss" } }).Increment();
    }
}

void PrometheusMetricsImpl::recordPolicyDenial(std::string_view reason)
{
    if (policyDenialsFamily)
    {
        policyDenialsFamily->Add({ { "reason", std::string(reason) } }).Increment();
    }
}

void PrometheusMetricsImpl::recordTransferStarted()
{
    if (transfersStartedTotal)
    {
        transfersStartedTotal->Increment();
    }
}

void PrometheusMetricsImpl::recordTransferFailed(std::string_view reason)
{
    if (transfersFailedFamily)
    {
        transfersFailedFamily->Add({ { "reason", std::string(reason) } }).Increment();
    }
}

void PrometheusMetricsImpl::recordPreloadRun(std::string_view outcome)
{
    if (preloadRunsFamily)
    {
        preloadRunsFamily->Add({ { "outcome", std::string(outcome) } }).Increment();
    }
}

void PrometheusMetricsImpl::recordFileRemoval(bool approved)
{
    if (fileRemovalsFamily)
    {
        fileRemovalsFamily->Add({ { "decision", approved ? "approved" : "refused" } }).Increment();
    }
}

void PrometheusMetricsImpl::recordProbeArmed()
{
    if (probesArmedTotal)
    {
        probesArmedTotal->Increment();
    }
}

void PrometheusMetricsImpl::updatePendingTasks(size_t count)
{
    if (pendingTasks)
    {
        pendingTasks->Set(static_cast<double>(count));
    }
}

void PrometheusMetricsImpl::updateActiveTasks(size_t count)
{
    if (activeTasks)
    {
        activeTasks->Set(static_cast<double>(count));
    }
}

std::string PrometheusMetricsImpl::getMetricsUrl() const
{
    return "http://" + config.bind_address + ":" + std::to_string(config.port) + config.endpoint_path;
}

} // namespace EnclosureCache

#endif // HAVE_PROMETHEUS
