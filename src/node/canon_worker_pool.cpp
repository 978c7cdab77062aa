// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <node/canon_worker_pool.h>
#include <util/logging.h>

CCanonWorkerPool::CCanonWorkerPool(size_t num_workers)
    : m_num_workers(num_workers == 0 ? 1 : num_workers) {
}

CCanonWorkerPool::~CCanonWorkerPool() {
    Stop();
}

bool CCanonWorkerPool::Start() {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    if (m_running.load()) {
        return false;  // Already running
    }

    m_running.store(true);
    for (size_t i = 0; i < m_num_workers; i++) {
        m_workers.emplace_back(&CCanonWorkerPool::Worker, this);
    }
    LogPrintCanon(DEBUG, "Started %zu canonicalization workers", m_num_workers);
    return true;
}

void CCanonWorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (!m_running.load()) {
            return;  // Already stopped
        }
        m_running.store(false);
    }
    m_queue_cv.notify_all();  // Wake workers to check m_running

    for (std::thread& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
    LogPrintCanon(DEBUG, "Stopped canonicalization workers");
}

CCanonWorkerPool::Stats CCanonWorkerPool::GetStats() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    Stats stats = m_stats;
    stats.queue_depth = m_queue.size();
    return stats;
}

void CCanonWorkerPool::Worker() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running.load();
            });

            if (m_queue.empty()) {
                break;  // Shutting down and drained
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // packaged_task stores any exception in its future
        task();

        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_stats.total_completed++;
    }
}
