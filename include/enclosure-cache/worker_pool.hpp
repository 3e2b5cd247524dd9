#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace EnclosureCache
{

struct WorkerTask
{
    std::string label{};
    std::function<void()> work{};
};

// General purpose pool for blocking work: reachability probing, transfer
// calls and file removal. Tasks run in FIFO order of submission.
class WorkerPool
{
    public:
    explicit WorkerPool(size_t thread_count = 4);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Returns false once shutdown() has been requested
    bool post(std::string label, std::function<void()> work);

    // Blocks until the queue is empty and no task is running
    void waitIdle();

    void shutdown();

    size_t getPendingCount() const;
    size_t getActiveCount() const;

    private:
    void workerThread();
    void runTask(WorkerTask &task);

    std::vector<std::thread> worker_threads{};
    std::queue<WorkerTask> task_queue;

    mutable std::mutex queue_mutex{};
    std::condition_variable queue_condition{};
    std::condition_variable idle_condition{};
    bool shutdown_requested{ false };

    std::atomic<size_t> pending_count{};
    std::atomic<size_t> active_count{};
};

} // namespace EnclosureCache
