#ifndef SCAN_NOTIFIER_WORKER_POOL_HPP
#define SCAN_NOTIFIER_WORKER_POOL_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace scan_notifier {

/// Runs the same consumer loop on several threads and waits for all of them to return.
/// The pool is reusable: spawn() after wait() starts a fresh set of workers.
class WorkerPool {
private:
    std::vector<std::thread> m_workers;
    std::mutex m_workers_mutex;

public:
    WorkerPool() = default;
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /// @brief Launch num_workers threads, each running work once until it returns
    void spawn(std::size_t num_workers, const std::function<void()>& work);

    /// @brief Block until every spawned worker has returned
    void wait();

    std::size_t size();
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_WORKER_POOL_HPP
