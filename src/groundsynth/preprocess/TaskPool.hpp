#pragma once
#include "core/Error.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace GS {

/**
 * Fixed-size worker pool.
 *
 * Jobs run in submission order on whichever worker frees up first. A job that
 * throws is logged and counted; it never takes a worker down. Callers that need
 * the error itself must catch inside the job.
 */
class TaskPool {
public:
    using Job = std::function<void()>;

    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool();

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(Job job) -> std::optional<Error>;
    // Blocks until the queue is empty and no job is running.
    auto waitIdle() -> void;
    auto shutdown() -> void;
    auto size() const -> size_t;
    auto failedJobs() const -> size_t { return failed.load(); }

private:
    auto workerFunction() -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           jobs;
    mutable std::mutex        mutex;
    std::condition_variable   jobCV;
    std::condition_variable   idleCV;
    std::atomic<bool>         shuttingDown{false};
    std::atomic<size_t>       activeWorkers{0};
    size_t                    runningJobs = 0;
    std::atomic<size_t>       failed{0};
};

} // namespace GS
