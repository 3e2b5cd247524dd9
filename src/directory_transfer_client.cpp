#include "../include/enclosure-cache/directory_transfer_client.hpp"
#include "../include/enclosure-cache/logger.hpp"
#include "../include/enclosure-cache/repository_error.hpp"
#include "../include/enclosure-cache/string_utils.hpp"
#include "../include/enclosure-cache/time_utils.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace EnclosureCache
{

namespace
{
    const char *const INDEX_FILE_NAME = "index.json";
    const char *const PARTIAL_SUFFIX = ".part";
} // namespace

DirectoryTransferClient::DirectoryTransferClient(const std::filesystem::path &cache_directory, size_t thread_count)
: cache_directory(std::filesystem::absolute(cache_directory).lexically_normal()),
  index_path(std::filesystem::absolute(cache_directory).lexically_normal() / INDEX_FILE_NAME)
{
    std::filesystem::create_directories(this->cache_directory);
    loadIndex();

    if (thread_count == 0)
    {
        thread_count = 1;
    }

    for (size_t i = 0; i < thread_count; ++i)
    {
        worker_threads.emplace_back(&DirectoryTransferClient::workerThread, this);
    }

    Logger::info(LogCategory::TRANSFER, "caching enclosures in {} ({} known)", this->cache_directory.string(),
                 index.size());
}

DirectoryTransferClient::~DirectoryTransferClient()
{
    shutdown();
}

std::filesystem::path DirectoryTransferClient::cachePathFor(const MediaUrl &url) const
{
    return cache_directory / (StringUtils::hashHex(url.str()) + url.extension());
}

std::optional<MediaUrl> DirectoryTransferClient::localFile(const MediaUrl &url)
{
    if (url.isFileUrl() && url.localPath().parent_path() == cache_directory)
    {
        return url;
    }

    const auto path = cachePathFor(url);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        return std::nullopt;
    }

    return MediaUrl::fromLocalPath(path);
}

MediaUrl DirectoryTransferClient::start(const MediaUrl &url)
{
    if (auto local = localFile(url))
    {
        return *local;
    }

    if (!url.isFileUrl())
    {
        throw RepositoryError::transfer(fmt::format("unsupported scheme '{}': {}", url.scheme(), url.str()));
    }

    const auto source = url.localPath();
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec))
    {
        throw RepositoryError::transfer(fmt::format("source file not found: {}", source.string()));
    }

    std::lock_guard<std::mutex> lock(queue_mutex);

    if (shutdown_requested)
    {
        throw RepositoryError::transfer("transfer client is shutting down");
    }

    if (active_transfers.find(url.str()) != active_transfers.end())
    {
        Logger::debug(LogCategory::TRANSFER, "transfer already in progress: {}", url.str());
        return url;
    }

    RemovalApprover *approver = removal_approver.load();
    Logger::debug(LogCategory::TRANSFER, "queueing copy of {} (cellular {})", url.str(),
                  approver && approver->allowsCellularTransport() ? "allowed" : "not allowed");

    auto task = std::make_shared<TransferTask>(url, source, cachePathFor(url), ++next_task_id);
    transfer_queue.push(task);
    active_transfers[url.str()] = task;
    queue_condition.notify_one();

    return url;
}

void DirectoryTransferClient::cancel(const MediaUrl &url)
{
    std::lock_guard<std::mutex> lock(queue_mutex);

    auto it = active_transfers.find(url.str());
    if (it != active_transfers.end())
    {
        it->second->cancelled = true;
        active_transfers.erase(it);
        Logger::debug(LogCategory::TRANSFER, "cancelled transfer: {}", url.str());
    }
}

std::optional<MediaUrl> DirectoryTransferClient::removeFile(const MediaUrl &url)
{
    const auto path = cachePathFor(url);

    std::error_code ec;
    if (!std::filesystem::remove(path, ec))
    {
        if (ec)
        {
            Logger::error(LogCategory::REMOVAL, "could not remove {}: {}", path.string(), ec.message());
        }
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(index_mutex);
        index.erase(path.filename().string());
        saveIndex();
    }

    return MediaUrl::fromLocalPath(path);
}

void DirectoryTransferClient::removeAll(const std::unordered_set<std::string> &keeping)
{
    RemovalApprover *approver = removal_approver.load();
    if (!approver)
    {
        Logger::warn(LogCategory::REMOVAL, "no removal approver set, keeping all files");
        return;
    }

    std::unordered_set<std::string> kept_names;
    for (const auto &kept : keeping)
    {
        if (auto url = MediaUrl::parse(kept))
        {
            kept_names.insert(cachePathFor(*url).filename().string());
        }
    }

    std::vector<std::filesystem::path> candidates;
    try
    {
        for (const auto &entry : std::filesystem::directory_iterator(cache_directory))
        {
            const auto name = entry.path().filename().string();
            if (!entry.is_regular_file() || name == INDEX_FILE_NAME || entry.path().extension() == PARTIAL_SUFFIX)
            {
                continue;
            }

            if (kept_names.find(name) == kept_names.end())
            {
                candidates.push_back(entry.path());
            }
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw RepositoryError::transfer(fmt::format("could not list cache directory: {}", e.what()));
    }

    size_t removed = 0;
    for (const auto &path : candidates)
    {
        const auto name = path.filename().string();

        std::optional<MediaUrl> url;
        {
            std::lock_guard<std::mutex> lock(index_mutex);
            auto it = index.find(name);
            if (it != index.end())
            {
                url = MediaUrl::parse(it->second);
            }
        }

        std::error_code ec;
        const auto modified = std::filesystem::last_write_time(path, ec);
        if (ec)
        {
            Logger::warn(LogCategory::REMOVAL, "could not stat {}: {}", path.string(), ec.message());
            continue;
        }

        if (!approver->approveRemoval(url ? *url : MediaUrl::fromLocalPath(path), TimeUtils::fromFileTime(modified)))
        {
            continue;
        }

        if (!std::filesystem::remove(path, ec))
        {
            Logger::error(LogCategory::REMOVAL, "could not remove {}: {}", path.string(), ec.message());
            continue;
        }

        std::lock_guard<std::mutex> lock(index_mutex);
        index.erase(name);
        removed++;
    }

    std::lock_guard<std::mutex> lock(index_mutex);
    saveIndex();
    Logger::info(LogCategory::REMOVAL, "removed {} of {} unqueued files", removed, candidates.size());
}

void DirectoryTransferClient::setRemovalApprover(RemovalApprover *approver)
{
    removal_approver = approver;
}

void DirectoryTransferClient::handleBackgroundEvents(const std::string &identifier, std::function<void()> done)
{
    // Copies never outlive the process, there is no session to restore
    Logger::debug(LogCategory::TRANSFER, "no pending events for session '{}'", identifier);
    if (done)
    {
        done();
    }
}

bool DirectoryTransferClient::isTransferInProgress(const MediaUrl &url) const
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    return active_transfers.find(url.str()) != active_transfers.end();
}

void DirectoryTransferClient::waitIdle()
{
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock,
                        [this]
                        {
                            return transfer_queue.empty() && running_count == 0;
                        });
}

void DirectoryTransferClient::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        shutdown_requested = true;

        // Pending copies are abandoned, the running ones finish
        while (!transfer_queue.empty())
        {
            active_transfers.erase(transfer_queue.front()->url.str());
            transfer_queue.pop();
        }
    }

    queue_condition.notify_all();

    for (auto &thread : worker_threads)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }

    worker_threads.clear();
    idle_condition.notify_all();
}

void DirectoryTransferClient::workerThread()
{
    while (true)
    {
        std::shared_ptr<TransferTask> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_condition.wait(lock,
                                 [this]
                                 {
                                     return !transfer_queue.empty() || shutdown_requested;
                                 });

            if (shutdown_requested)
            {
                break;
            }

            task = transfer_queue.front();
            transfer_queue.pop();
            running_count++;
        }

        processTransfer(task);

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            running_count--;

            auto it = active_transfers.find(task->url.str());
            if (it != active_transfers.end() && it->second == task)
            {
                active_transfers.erase(it);
            }
        }

        idle_condition.notify_all();
    }
}

void DirectoryTransferClient::processTransfer(const std::shared_ptr<TransferTask> &task)
{
    const auto &partial = task->partial;

    std::error_code ec;
    std::filesystem::copy_file(task->source, partial, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec)
    {
        Logger::error(LogCategory::TRANSFER, "copy of {} failed: {}", task->url.str(), ec.message());
        std::filesystem::remove(partial, ec);
        return;
    }

    if (task->cancelled)
    {
        Logger::debug(LogCategory::TRANSFER, "discarding cancelled copy: {}", task->url.str());
        std::filesystem::remove(partial, ec);
        return;
    }

    std::filesystem::rename(partial, task->target, ec);
    if (ec)
    {
        Logger::error(LogCategory::TRANSFER, "could not finish {}: {}", task->target.string(), ec.message());
        std::filesystem::remove(partial, ec);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(index_mutex);
        index[task->target.filename().string()] = task->url.str();
        saveIndex();
    }

    Logger::info(LogCategory::TRANSFER, "cached {} as {}", task->url.str(), task->target.filename().string());
}

// Called without index_mutex, before the workers start
void DirectoryTransferClient::loadIndex()
{
    std::ifstream file(index_path);
    if (!file.is_open())
    {
        return;
    }

    try
    {
        const nlohmann::json j = nlohmann::json::parse(file);
        for (const auto &[name, url] : j.items())
        {
            if (url.is_string())
            {
                index[name] = url.get<std::string>();
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn(LogCategory::TRANSFER, "ignoring unreadable index {}: {}", index_path.string(), e.what());
        index.clear();
    }
}

// Expects index_mutex to be held
void DirectoryTransferClient::saveIndex()
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto &[name, url] : index)
    {
        j[name] = url;
    }

    std::ofstream file(index_path, std::ios::trunc);
    if (!file.is_open())
    {
        Logger::error(LogCategory::TRANSFER, "could not write index {}", index_path.string());
        return;
    }

    file << j.dump(2);
}

} // namespace EnclosureCache
