#include "docsage_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace docsage_core::async {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool must have at least one thread.");
    }

    m_workers.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back(&WorkerPool::run_loop, this, i);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();
    // Blocks until every running job has returned
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            throw std::runtime_error("WorkerPool is shutting down; cannot accept new jobs.");
        }
        m_jobs.push(std::move(job));
    }
    m_cv.notify_one();
}

void WorkerPool::run_loop(size_t worker_id) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
            if (m_stopping) {
                return;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop();
        }

        try {
            job();
        } catch (const std::exception& e) {
            // Jobs report their own failures through promises; anything that escapes is a bug
            std::cerr << "Worker [" << worker_id << "] ERROR: unhandled exception in job: "
                      << e.what() << std::endl;
        }
    }
}

} // namespace docsage_core::async
