#pragma once

#ifdef HAVE_PROMETHEUS

#include "../types/config.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace prometheus
{
class Registry;
class Exposer;
template <typename T>
class Family;
class Counter;
class Gauge;
} // namespace prometheus

namespace EnclosureCache
{

class PrometheusMetricsImpl
{
    public:
    explicit PrometheusMetricsImpl(const MetricsConfig &config);
    ~PrometheusMetricsImpl();

    void recordResolve(bool cache_hit);
    void recordPolicyDenial(std::string_view reason);

    void recordTransferStarted();
    void recordTransferFailed(std::string_view reason);

    void recordPreloadRun(std::string_view outcome);
    void recordFileRemoval(bool approved);

    void recordProbeArmed();

    void updatePendingTasks(size_t count);
    void updateActiveTasks(size_t count);

    std::string getMetricsUrl() const;

    private:
    MetricsConfig config;
    std::unique_ptr<prometheus::Exposer> exposer;
    std::shared_ptr<prometheus::Registry> registry;

    prometheus::Family<prometheus::Counter> *resolveFamily;
    prometheus::Family<prometheus::Counter> *policyDenialsFamily;

    prometheus::Counter *transfersStartedTotal;
    prometheus::Family<prometheus::Counter> *transfersFailedFamily;

    prometheus::Family<prometheus::Counter> *preloadRunsFamily;
    prometheus::Family<prometheus::Counter> *fileRemovalsFamily;

    prometheus::Counter *probesArmedTotal;

    prometheus::Gauge *pendingTasks;
    prometheus::Gauge *activeTasks;
};

} // namespace EnclosureCache

#endif // HAVE_PROMETHEUS
