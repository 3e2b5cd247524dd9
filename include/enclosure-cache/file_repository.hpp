#pragma once

#include "../types/config.hpp"
#include "download_policy.hpp"
#include "media_url.hpp"
#include "queue_source.hpp"
#include "reachability_gate.hpp"
#include "repository_error.hpp"
#include "transfer_client.hpp"
#include "user_settings.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace EnclosureCache
{

using PreloadCompletion = std::function<void(const std::optional<RepositoryError> &)>;
using ResolveCallback = std::function<void(const std::optional<MediaUrl> &, const std::optional<RepositoryError> &)>;
using SystemClock = std::function<std::chrono::system_clock::time_point()>;

/**
 * Decides for each enclosure whether to fetch it now, defer it, stream it
 * or leave it alone, given reachability, the user's data settings and the
 * transfer engine's state.
 *
 * Blocking work is dispatched onto the worker pool. resolve() itself blocks
 * and must not be called from a thread that has to stay responsive; use
 * resolveAsync() there.
 *
 * Overlapping preloadQueue() runs are not deduplicated, callers guard
 * against issuing them.
 */
class FileRepository : public RemovalApprover
{
    public:
    FileRepository(TransferClient &transfer_client,
                   QueueSource &queue_source,
                   UserSettings &user_settings,
                   ReachabilityProbeFactory &probe_factory,
                   WorkerPool &worker_pool,
                   const RepositoryConfig &config,
                   SystemClock clock_source = nullptr);
    ~FileRepository() override;

    FileRepository(const FileRepository &) = delete;
    FileRepository &operator=(const FileRepository &) = delete;

    // Local file if cached; otherwise the URL to play from, which is url
    // itself whenever no local copy is going to be made. Throws
    // RepositoryError for policy denials and transfer failures.
    MediaUrl resolve(const MediaUrl &url, bool allow_streaming);

    void resolveAsync(const MediaUrl &url, bool allow_streaming, ResolveCallback callback);

    // Best effort background fetch, errors are logged
    void preload(const MediaUrl &url);

    void cancelTransfer(const MediaUrl &url);

    // Deletes the local copy and cancels any transfer racing the deletion
    void removeCachedFile(const MediaUrl &url);

    void preloadQueue(bool also_remove_stale_files, PreloadCompletion completion = {});

    // Drops the reachability probe. Call before the process is suspended.
    void flush();

    void handleBackgroundTransferEvents(const std::string &identifier, std::function<void()> completion);

    // RemovalApprover
    bool approveRemoval(const MediaUrl &url, std::chrono::system_clock::time_point last_modified) override;
    bool allowsCellularTransport() const override;

    uint32_t removalBudget() const;
    std::optional<RepositoryError> lastPreloadError() const;
    std::optional<std::chrono::system_clock::time_point> lastRemovalTime() const;
    bool isProbeArmed() const;

    private:
    struct SharedState
    {
        uint32_t removal_budget = 0;
        std::optional<std::chrono::system_clock::time_point> last_removal{};
        std::optional<RepositoryError> last_error{};
        size_t in_flight = 0;
    };

    std::optional<RepositoryError> runPreloadQueue(bool also_remove_stale_files);
    std::vector<MediaUrl> collectQueue(std::optional<RepositoryError> &enumeration_error);
    std::optional<RepositoryError> startTransfers(const std::vector<MediaUrl> &urls);
    void removeStaleFiles(const std::vector<MediaUrl> &keeping);

    ReachabilityStatus reachabilityFor(const MediaUrl &url);
    MediaUrl startTransfer(const MediaUrl &url);

    // Runs work on the pool, tracked so destruction waits for it
    void dispatch(std::string label, std::function<void()> work);

    void resetRemovalBudget();
    bool consumeRemovalBudget();
    void recordRun(const std::optional<RepositoryError> &error, bool removed);

    TransferClient &transfer_client;
    QueueSource &queue_source;
    UserSettings &user_settings;
    WorkerPool &worker_pool;
    const RepositoryConfig config;
    SystemClock clock;

    ReachabilityGate gate;

    mutable std::mutex state_mutex{};
    std::condition_variable drained_condition{};
    SharedState state{};
};

} // namespace EnclosureCache
