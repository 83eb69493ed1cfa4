#include "worker_pool.hpp"

namespace scan_notifier {

WorkerPool::~WorkerPool() {
    wait();
}

void WorkerPool::spawn(std::size_t num_workers, const std::function<void()>& work) {
    std::lock_guard lock(m_workers_mutex);
    for (std::size_t i = 0; i < num_workers; ++i) {
        m_workers.emplace_back(work);
    }
}

void WorkerPool::wait() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(m_workers_mutex);
        workers.swap(m_workers);
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t WorkerPool::size() {
    std::lock_guard lock(m_workers_mutex);
    return m_workers.size();
}

}  // namespace scan_notifier
