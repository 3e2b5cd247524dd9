#include "../include/enclosure-cache/worker_pool.hpp"
#include "../include/enclosure-cache/logger.hpp"
#include "../include/enclosure-cache/metrics_collector.hpp"
#include <exception>

namespace EnclosureCache
{

WorkerPool::WorkerPool(size_t thread_count) : pending_count(0), active_count(0)
{
    if (thread_count == 0)
    {
        Logger::warn(LogCategory::WORKER, "worker pool needs at least one thread, using 1");
        thread_count = 1;
    }

    for (size_t i = 0; i < thread_count; ++i)
    {
        worker_threads.emplace_back(&WorkerPool::workerThread, this);
    }
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

bool WorkerPool::post(std::string label, std::function<void()> work)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);

        if (shutdown_requested)
        {
            Logger::warn(LogCategory::WORKER, "dropping '{}': worker pool is shutting down", label);
            return false;
        }

        task_queue.push(WorkerTask{ std::move(label), std::move(work) });
        pending_count++;
    }

    GlobalMetrics::instance().updatePendingTasks(pending_count.load());
    queue_condition.notify_one();

    return true;
}

void WorkerPool::waitIdle()
{
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock,
                        [this]
                        {
                            return task_queue.empty() && active_count.load() == 0;
                        });
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (shutdown_requested && worker_threads.empty())
        {
            return;
        }
        shutdown_requested = true;
    }

    queue_condition.notify_all();

    // Queued tasks are drained before the workers exit
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

size_t WorkerPool::getPendingCount() const
{
    return pending_count.load();
}

size_t WorkerPool::getActiveCount() const
{
    return active_count.load();
}

void WorkerPool::workerThread()
{
    while (true)
    {
        WorkerTask task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_condition.wait(lock,
                                 [this]
                                 {
                                     return !task_queue.empty() || shutdown_requested;
                                 });

            if (task_queue.empty())
            {
                // Shutdown requested and nothing left to drain
                break;
            }

            task = std::move(task_queue.front());
            task_queue.pop();
            pending_count--;
            active_count++;
        }

        GlobalMetrics::instance().updatePendingTasks(pending_count.load());
        GlobalMetrics::instance().updateActiveTasks(active_count.load());

        runTask(task);

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active_count--;
        }

        GlobalMetrics::instance().updateActiveTasks(active_count.load());
        idle_condition.notify_all();
    }
}

void WorkerPool::runTask(WorkerTask &task)
{
    Logger::trace(LogCategory::WORKER, "running '{}'", task.label);

    try
    {
        task.work();
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::WORKER, "task '{}' failed: {}", task.label, e.what());
    }
}

} // namespace EnclosureCache
