#include "preprocess/TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <system_error>

namespace GS {

TaskPool::TaskPool(size_t threadCount) {
    gs_log("TaskPool::TaskPool constructing", "TaskPool");
    if (threadCount == 0)
        threadCount = 1;
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const& error) {
            gs_log(std::string("TaskPool::TaskPool failed to spawn worker: ") + error.what(), "TaskPool", "Error");
            break;
        }
    }
    gs_log("TaskPool::TaskPool constructed with workers=" + std::to_string(activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    shutdown();
}

auto TaskPool::submit(Job job) -> std::optional<Error> {
    if (!job)
        return Error{Error::Code::InvalidArgument, "Empty job"};
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown)
            return Error{Error::Code::UnknownError, "TaskPool shutting down"};
        if (workers.empty())
            return Error{Error::Code::UnknownError, "TaskPool has no workers"};
        jobs.push(std::move(job));
    }
    jobCV.notify_one();
    return std::nullopt;
}

auto TaskPool::waitIdle() -> void {
    std::unique_lock<std::mutex> lock(mutex);
    idleCV.wait(lock, [this] { return this->jobs.empty() && this->runningJobs == 0; });
}

auto TaskPool::shutdown() -> void {
    gs_log("TaskPool::shutdown begin", "TaskPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            for (auto& th : this->workers) {
                if (th.joinable())
                    th.join();
            }
            return;
        }
        this->shuttingDown = true;
    }
    this->jobCV.notify_all();

    // Workers drain the queue before they exit.
    for (auto& th : this->workers) {
        if (th.joinable())
            th.join();
    }
    activeWorkers = 0;
    this->workers.clear();
    gs_log("TaskPool::shutdown ends", "TaskPool");
}

auto TaskPool::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex);
    return this->workers.size();
}

auto TaskPool::workerFunction() -> void {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });
            if (this->jobs.empty())
                break;
            job = std::move(jobs.front());
            jobs.pop();
            ++runningJobs;
        }

        try {
            job();
        } catch (std::exception const& error) {
            ++failed;
            gs_log(std::string("Exception in pool job: ") + error.what(), "TaskPool", "Error");
        } catch (...) {
            ++failed;
            gs_log("Non-standard exception in pool job", "TaskPool", "Error");
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            --runningJobs;
            if (jobs.empty() && runningJobs == 0)
                idleCV.notify_all();
        }
    }
    --activeWorkers;
}

} // namespace GS
