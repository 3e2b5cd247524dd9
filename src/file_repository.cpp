#include <enclosure-cache/file_repository.hpp>
#include <enclosure-cache/logger.hpp>
#include <enclosure-cache/metrics_collector.hpp>
#include <enclosure-cache/time_utils.hpp>
#include <unordered_set>

namespace EnclosureCache
{

FileRepository::FileRepository(TransferClient &transfer_client,
                               QueueSource &queue_source,
                               UserSettings &user_settings,
                               ReachabilityProbeFactory &probe_factory,
                               WorkerPool &worker_pool,
                               const RepositoryConfig &config,
                               SystemClock clock_source)
: transfer_client(transfer_client), queue_source(queue_source), user_settings(user_settings),
  worker_pool(worker_pool), config(config), clock(std::move(clock_source)), gate(probe_factory)
{
    if (!clock)
    {
        clock = []
        {
            return std::chrono::system_clock::now();
        };
    }

    state.removal_budget = config.removal_budget;

    gate.setReachableHandler(
    [this]
    {
        Logger::info(LogCategory::REACHABILITY, "network came back, preloading queue");
        preloadQueue(false);
    });

    transfer_client.setRemovalApprover(this);
}

FileRepository::~FileRepository()
{
    gate.setReachableHandler(nullptr);
    gate.release();

    {
        std::unique_lock<std::mutex> lock(state_mutex);
        drained_condition.wait(lock,
                               [this]
                               {
                                   return state.in_flight == 0;
                               });
    }

    transfer_client.setRemovalApprover(nullptr);
}

// Resolving

ReachabilityStatus FileRepository::reachabilityFor(const MediaUrl &url)
{
    // Local sources need no network
    if (url.isFileUrl())
    {
        return ReachabilityStatus::REACHABLE;
    }

    return gate.probe(url.host());
}

MediaUrl FileRepository::startTransfer(const MediaUrl &url)
{
    try
    {
        MediaUrl result = transfer_client.start(url);
        GlobalMetrics::instance().recordTransferStarted();
        return result;
    }
    catch (const RepositoryError &e)
    {
        GlobalMetrics::instance().recordTransferFailed(RepositoryError::kindToString(e.kind()));
        throw;
    }
    catch (const std::exception &e)
    {
        GlobalMetrics::instance().recordTransferFailed("engine");
        throw RepositoryError::transfer(e.what());
    }
}

MediaUrl FileRepository::resolve(const MediaUrl &url, bool allow_streaming)
{
    if (auto local = transfer_client.localFile(url))
    {
        GlobalMetrics::instance().recordResolveCacheHit();
        Logger::debug(LogCategory::TRANSFER, "cache hit: {}", url.str());
        return *local;
    }

    GlobalMetrics::instance().recordResolveCacheMiss();

    const ReachabilityStatus status = reachabilityFor(url);
    const UserDataPolicy settings = user_settings.snapshot();

    if (allow_streaming)
    {
        const PolicyDecision streaming = DownloadPolicy::decide(TransferIntent::STREAM_OR_DOWNLOAD, status, settings);
        if (!streaming.allowed)
        {
            const auto reason = DownloadPolicy::denialReasonToString(*streaming.reason);
            GlobalMetrics::instance().recordPolicyDenial(reason);
            Logger::info(LogCategory::POLICY, "not streaming {}: {}", url.str(), reason);
            throw RepositoryError::denied(*streaming.reason);
        }
    }

    if (!settings.automatic_downloads)
    {
        Logger::info(LogCategory::POLICY, "settings prevented file preloading");
        return url;
    }

    const PolicyDecision downloading = DownloadPolicy::decide(TransferIntent::DOWNLOAD, status, settings);
    if (!downloading.allowed)
    {
        const auto reason = DownloadPolicy::denialReasonToString(*downloading.reason);
        GlobalMetrics::instance().recordPolicyDenial(reason);

        if (allow_streaming)
        {
            Logger::info(LogCategory::POLICY, "not downloading {} ({}), playing directly", url.str(), reason);
            return url;
        }

        Logger::info(LogCategory::POLICY, "not downloading {}: {}", url.str(), reason);
        throw RepositoryError::denied(*downloading.reason);
    }

    return startTransfer(url);
}

void FileRepository::resolveAsync(const MediaUrl &url, bool allow_streaming, ResolveCallback callback)
{
    dispatch("resolve " + url.str(),
             [this, url, allow_streaming, callback = std::move(callback)]
             {
                 std::optional<MediaUrl> result;
                 std::optional<RepositoryError> error;

                 try
                 {
                     result = resolve(url, allow_streaming);
                 }
                 catch (const RepositoryError &e)
                 {
                     error = e;
                 }

                 if (callback)
                 {
                     callback(result, error);
                 }
             });
}

void FileRepository::preload(const MediaUrl &url)
{
    dispatch("preload " + url.str(),
             [this, url]
             {
                 Logger::debug(LogCategory::TRANSFER, "preloading: {}", url.str());

                 try
                 {
                     resolve(url, false);
                 }
                 catch (const RepositoryError &e)
                 {
                     Logger::error(LogCategory::TRANSFER, "caught preloading error: {}", e.what());
                 }
             });
}

void FileRepository::cancelTransfer(const MediaUrl &url)
{
    dispatch("cancel " + url.str(),
             [this, url]
             {
                 Logger::debug(LogCategory::TRANSFER, "cancelling download: {}", url.str());
                 transfer_client.cancel(url);
             });
}

void FileRepository::removeCachedFile(const MediaUrl &url)
{
    dispatch("remove " + url.str(),
             [this, url]
             {
                 if (auto removed = transfer_client.removeFile(url))
                 {
                     Logger::info(LogCategory::REMOVAL, "removed file: {}", removed->str());
                 }

                 Logger::debug(LogCategory::TRANSFER, "cancelling downloads: {}", url.str());
                 transfer_client.cancel(url);
             });
}

void FileRepository::flush()
{
    gate.release();
}

void FileRepository::handleBackgroundTransferEvents(const std::string &identifier, std::function<void()> completion)
{
    Logger::info(LogCategory::TRANSFER, "handling events for background session: {}", identifier);
    transfer_client.handleBackgroundEvents(identifier, std::move(completion));
}

// Preloading the queue

void FileRepository::preloadQueue(bool also_remove_stale_files, PreloadCompletion completion)
{
    dispatch("preload queue",
             [this, also_remove_stale_files, completion = std::move(completion)]
             {
                 std::optional<RepositoryError> error = runPreloadQueue(also_remove_stale_files);
                 if (completion)
                 {
                     completion(error);
                 }
             });
}

std::optional<RepositoryError> FileRepository::runPreloadQueue(bool also_remove_stale_files)
{
    Logger::debug(LogCategory::QUEUE, "preloading queue");

    // A fresh decision, nothing armed from earlier runs
    flush();
    resetRemovalBudget();

    const UserDataPolicy settings = user_settings.snapshot();
    if (!settings.automatic_downloads)
    {
        Logger::info(LogCategory::QUEUE, "automatic downloads disabled, not preloading queue");
        recordRun(std::nullopt, false);
        GlobalMetrics::instance().recordPreloadRun("disabled");
        return std::nullopt;
    }

    // One probe for a representative host stands in for the whole queue
    const auto representative = MediaUrl::parse(config.representative_url);
    const ReachabilityStatus status = representative ? reachabilityFor(*representative) : ReachabilityStatus::UNKNOWN;
    const PolicyDecision decision = DownloadPolicy::decide(TransferIntent::DOWNLOAD, status, settings);

    if (!decision.allowed)
    {
        const auto reason = DownloadPolicy::denialReasonToString(*decision.reason);
        Logger::info(LogCategory::QUEUE, "reachability or settings prevented queue preloading: {}", reason);
        GlobalMetrics::instance().recordPolicyDenial(reason);
        GlobalMetrics::instance().recordPreloadRun("denied");

        auto error = std::make_optional(RepositoryError::denied(*decision.reason));
        recordRun(error, false);
        return error;
    }

    std::optional<RepositoryError> enumeration_error;
    const std::vector<MediaUrl> urls = collectQueue(enumeration_error);

    std::optional<RepositoryError> transfer_error = startTransfers(urls);

    // Picking the first error
    std::optional<RepositoryError> error = enumeration_error ? enumeration_error : transfer_error;
    if (error)
    {
        Logger::error(LogCategory::QUEUE, "error while preloading queue: {}", error->what());
    }

    // Only removing files while we could download them again
    if (also_remove_stale_files)
    {
        removeStaleFiles(urls);
    }

    resetRemovalBudget();
    recordRun(error, also_remove_stale_files);
    GlobalMetrics::instance().recordPreloadRun(error ? "error" : "ok");

    return error;
}

std::vector<MediaUrl> FileRepository::collectQueue(std::optional<RepositoryError> &enumeration_error)
{
    std::vector<MediaUrl> urls;
    std::unordered_set<std::string> seen;

    enumeration_error = queue_source.enumerate(
    [&urls, &seen](const MediaUrl &url)
    {
        if (seen.insert(url.str()).second)
        {
            urls.push_back(url);
        }
    });

    if (enumeration_error && enumeration_error->kind() == ErrorKind::MISSING_ENTRIES)
    {
        Logger::warn(LogCategory::QUEUE, "missing entries: {}", enumeration_error->what());
        enumeration_error.reset();
    }

    Logger::debug(LogCategory::QUEUE, "queue holds {} enclosures", urls.size());
    return urls;
}

std::optional<RepositoryError> FileRepository::startTransfers(const std::vector<MediaUrl> &urls)
{
    std::optional<RepositoryError> first_error;
    size_t started = 0;

    for (const auto &url : urls)
    {
        if (transfer_client.localFile(url))
        {
            continue;
        }

        // After a big sync the queue can get long; cap how many background
        // transfers a single pass may queue up
        if (started >= config.max_preloads_per_run)
        {
            Logger::info(LogCategory::QUEUE, "aborting queue preloading: too many files");
            break;
        }

        try
        {
            if (!startTransfer(url).isFileUrl())
            {
                started++;
            }
        }
        catch (const RepositoryError &e)
        {
            Logger::warn(LogCategory::TRANSFER, "could not start {}: {}", url.str(), e.what());
            if (!first_error)
            {
                first_error = e;
            }
        }
    }

    Logger::info(LogCategory::QUEUE, "started {} of {} transfers", started, urls.size());
    return first_error;
}

void FileRepository::removeStaleFiles(const std::vector<MediaUrl> &keeping)
{
    std::unordered_set<std::string> keep;
    for (const auto &url : keeping)
    {
        keep.insert(url.str());
    }

    Logger::debug(LogCategory::REMOVAL, "removing files except {} queued", keep.size());

    try
    {
        transfer_client.removeAll(keep);
        Logger::info(LogCategory::REMOVAL, "removing files complete");
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::REMOVAL, "removing files caught: {}", e.what());
    }
}

// Removal approval

bool FileRepository::approveRemoval(const MediaUrl &url, std::chrono::system_clock::time_point last_modified)
{
    const auto age = clock() - last_modified;
    const bool stale = age > std::chrono::hours(config.stale_after_hours);

    if (!stale)
    {
        Logger::debug(LogCategory::REMOVAL, "not removing {}: modified {} ago", url.str(), TimeUtils::formatDuration(age));
        GlobalMetrics::instance().recordFileRemoval(false);
        return false;
    }

    if (!consumeRemovalBudget())
    {
        Logger::debug(LogCategory::REMOVAL, "not removing {}: budget exhausted", url.str());
        GlobalMetrics::instance().recordFileRemoval(false);
        return false;
    }

    Logger::debug(LogCategory::REMOVAL, "removing: {}", url.str());
    GlobalMetrics::instance().recordFileRemoval(true);
    return true;
}

bool FileRepository::allowsCellularTransport() const
{
    return user_settings.snapshot().allow_cellular_downloads;
}

// Shared state

void FileRepository::dispatch(std::string label, std::function<void()> work)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        state.in_flight++;
    }

    auto tracked = [this, work = std::move(work)]
    {
        try
        {
            work();
        }
        catch (const std::exception &e)
        {
            Logger::error(LogCategory::WORKER, "repository task failed: {}", e.what());
        }

        std::lock_guard<std::mutex> lock(state_mutex);
        state.in_flight--;
        drained_condition.notify_all();
    };

    if (!worker_pool.post(std::move(label), std::move(tracked)))
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        state.in_flight--;
        drained_condition.notify_all();
    }
}

void FileRepository::resetRemovalBudget()
{
    std::lock_guard<std::mutex> lock(state_mutex);
    state.removal_budget = config.removal_budget;
}

bool FileRepository::consumeRemovalBudget()
{
    std::lock_guard<std::mutex> lock(state_mutex);
    if (state.removal_budget == 0)
    {
        return false;
    }

    state.removal_budget--;
    return true;
}

void FileRepository::recordRun(const std::optional<RepositoryError> &error, bool removed)
{
    std::lock_guard<std::mutex> lock(state_mutex);
    state.last_error = error;
    if (removed)
    {
        state.last_removal = clock();
    }
}

uint32_t FileRepository::removalBudget() const
{
    std::lock_guard<std::mutex> lock(state_mutex);
    return state.removal_budget;
}

std::optional<RepositoryError> FileRepository::lastPreloadError() const
{
    std::lock_guard<std::mutex> lock(state_mutex);
    return state.last_error;
}

std::optional<std::chrono::system_clock::time_point> FileRepository::lastRemovalTime() const
{
    std::lock_guard<std::mutex> lock(state_mutex);
    return state.last_removal;
}

bool FileRepository::isProbeArmed() const
{
    return gate.isArmed();
}

} // namespace EnclosureCache
