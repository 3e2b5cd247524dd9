#pragma once

#include "transfer_client.hpp"
#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace EnclosureCache
{

struct TransferTask
{
    MediaUrl url;
    std::filesystem::path source{};
    std::filesystem::path target{};
    std::filesystem::path partial{}; // unique per task, a restart never shares it
    std::atomic<bool> cancelled{ false };

    TransferTask(const MediaUrl &url, std::filesystem::path source, std::filesystem::path target, uint64_t id)
    : url(url), source(std::move(source)), target(std::move(target))
    {
        partial = this->target;
        partial += "." + std::to_string(id) + ".part";
    }
};

/**
 * Transfer engine keeping enclosures in a flat cache directory.
 *
 * Cached files are named after a hash of their URL plus the original
 * extension; an index.json beside them maps file names back to URLs.
 * Copies from file:// sources run on the client's own threads and land
 * under a .part name of their own until complete, so a file with its
 * final name is always whole, even when a cancelled copy of the same URL
 * is still running beside a restarted one.
 */
class DirectoryTransferClient : public TransferClient
{
    public:
    DirectoryTransferClient(const std::filesystem::path &cache_directory, size_t thread_count = 2);
    ~DirectoryTransferClient() override;

    DirectoryTransferClient(const DirectoryTransferClient &) = delete;
    DirectoryTransferClient &operator=(const DirectoryTransferClient &) = delete;

    std::optional<MediaUrl> localFile(const MediaUrl &url) override;
    MediaUrl start(const MediaUrl &url) override;
    void cancel(const MediaUrl &url) override;
    std::optional<MediaUrl> removeFile(const MediaUrl &url) override;
    void removeAll(const std::unordered_set<std::string> &keeping) override;
    void setRemovalApprover(RemovalApprover *approver) override;
    void handleBackgroundEvents(const std::string &identifier, std::function<void()> done) override;

    bool isTransferInProgress(const MediaUrl &url) const;

    // Blocks until no copy is queued or running
    void waitIdle();

    void shutdown();

    std::filesystem::path cachePathFor(const MediaUrl &url) const;

    private:
    void workerThread();
    void processTransfer(const std::shared_ptr<TransferTask> &task);

    void loadIndex();
    void saveIndex();

    const std::filesystem::path cache_directory;
    const std::filesystem::path index_path;

    std::vector<std::thread> worker_threads{};
    std::queue<std::shared_ptr<TransferTask>> transfer_queue;
    std::unordered_map<std::string, std::shared_ptr<TransferTask>> active_transfers;
    size_t running_count = 0;
    uint64_t next_task_id = 0;

    mutable std::mutex queue_mutex{};
    std::condition_variable queue_condition{};
    std::condition_variable idle_condition{};
    bool shutdown_requested{ false };

    // File name -> URL string
    std::map<std::string, std::string> index{};
    std::mutex index_mutex{};

    std::atomic<RemovalApprover *> removal_approver{ nullptr };
};

} // namespace EnclosureCache
