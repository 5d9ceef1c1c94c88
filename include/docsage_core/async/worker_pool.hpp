#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace docsage_core::async {

/**
 * @class WorkerPool
 * @brief A fixed set of threads draining a FIFO job queue.
 *
 * The pool owns its threads for its whole lifetime: they are started by the
 * constructor and stopped and joined by the destructor (RAII). Jobs still
 * queued at destruction are dropped; a job that is already running is
 * allowed to finish.
 */
class WorkerPool {
public:
    /**
     * @brief Starts the worker threads.
     * @param num_threads Number of threads, i.e. the concurrency limit.
     * @throw std::invalid_argument if num_threads is 0.
     */
    explicit WorkerPool(size_t num_threads);

    /**
     * @brief Signals every worker to stop and joins them.
     */
    ~WorkerPool();

    /**
     * @brief Queues a job. Jobs start in submission order.
     */
    void submit(std::function<void()> job);

    size_t size() const { return m_workers.size(); }

    // --- Rule of Five: Make the class non-copyable and non-movable ---
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

private:
    void run_loop(size_t worker_id);

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopping = false;
};

} // namespace docsage_core::async
