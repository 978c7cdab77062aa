// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_NODE_CANON_WORKER_POOL_H
#define PROVCHAIN_NODE_CANON_WORKER_POOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @brief Fixed-size thread pool for canonicalization work
 *
 * Canonicalization is CPU-bound and may be slow on symmetric graphs. It runs
 * here, off the chain-append lock, so a long RDFC-1.0 search does not
 * block appends or reads.
 *
 * Tasks are plain callables; their result or exception is delivered
 * through the returned future.
 */
class CCanonWorkerPool {
public:
    /**
     * @brief Statistics for monitoring pool load
     */
    struct Stats {
        size_t queue_depth{0};
        size_t total_submitted{0};
        size_t total_completed{0};
    };

    /**
     * @param num_workers Thread count; 0 is treated as 1
     */
    explicit CCanonWorkerPool(size_t num_workers);

    /**
     * @brief Destructor - stops worker threads
     */
    ~CCanonWorkerPool();

    /**
     * @brief Start the worker threads
     * @return true on success, false if already running
     */
    bool Start();

    /**
     * @brief Stop the workers after the queue drains
     */
    void Stop();

    bool IsRunning() const { return m_running.load(); }
    size_t GetWorkerCount() const { return m_num_workers; }
    Stats GetStats() const;

    /**
     * @brief Queue a task
     *
     * When the pool is not running the task runs on the calling thread
     * before Submit returns.
     */
    template <typename F>
    std::future<std::invoke_result_t<F>> Submit(F task) {
        typedef std::invoke_result_t<F> Result;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::move(task));
        std::future<Result> future = packaged->get_future();

        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_stats.total_submitted++;
            if (!m_running.load()) {
                lock.unlock();
                (*packaged)();
                std::lock_guard<std::mutex> relock(m_queue_mutex);
                m_stats.total_completed++;
                return future;
            }
            m_queue.push([packaged]() { (*packaged)(); });
        }
        m_queue_cv.notify_one();
        return future;
    }

private:
    /**
     * @brief Worker thread main loop
     */
    void Worker();

    const size_t m_num_workers;
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_queue;
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::atomic<bool> m_running{false};
    Stats m_stats{};
};

#endif // PROVCHAIN_NODE_CANON_WORKER_POOL_H
