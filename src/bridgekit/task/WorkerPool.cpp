#include "bridgekit/task/WorkerPool.hpp"

#include "bridgekit/log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <utility>

namespace BK {

auto WorkerPool::Instance() -> WorkerPool& {
    // Leaked on exit: a timed-out job may still be running when statics are destroyed.
    static WorkerPool* instance = new WorkerPool();
    return *instance;
}

WorkerPool::WorkerPool(std::size_t initialWorkers) {
    std::lock_guard const lock{mutex_};
    for (std::size_t i = 0; i < initialWorkers; ++i) {
        this->spawnLocked();
    }
}

WorkerPool::~WorkerPool() {
    this->shutdown();
}

auto WorkerPool::submit(Job job) -> std::optional<Error> {
    {
        std::lock_guard const lock{mutex_};
        if (shuttingDown_) {
            return Error{Error::Code::Cancelled, "worker pool is shutting down"};
        }
        jobs_.push_back(std::move(job));
        if (jobs_.size() > idleWorkers_) {
            this->spawnLocked();
        }
    }
    jobCv_.notify_one();
    return std::nullopt;
}

auto WorkerPool::shutdown() -> void {
    std::vector<std::jthread> workers;
    {
        std::lock_guard const lock{mutex_};
        shuttingDown_ = true;
        workers.swap(workers_);
    }
    jobCv_.notify_all();

    // Queued jobs still run; workers leave once the queue is empty.
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

auto WorkerPool::size() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return workers_.size();
}

auto WorkerPool::idle() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return idleWorkers_;
}

auto WorkerPool::failedJobs() const -> std::uint64_t {
    std::lock_guard const lock{mutex_};
    return failedJobs_;
}

auto WorkerPool::spawnLocked() -> void {
    workers_.emplace_back([this](std::stop_token stopToken) { this->workerLoop(stopToken); });
    bk_log("Worker pool grew to " + std::to_string(workers_.size()) + " threads", "WorkerPool", "INFO");
}

auto WorkerPool::workerLoop(std::stop_token stopToken) -> void {
    std::unique_lock lock{mutex_};
    while (true) {
        idleWorkers_ += 1;
        jobCv_.wait(lock, stopToken, [this] { return !jobs_.empty() || shuttingDown_; });
        idleWorkers_ -= 1;
        if (jobs_.empty()) {
            return;
        }

        auto job = std::move(jobs_.front());
        jobs_.pop_front();
        lock.unlock();

        std::optional<std::string> failure;
        try {
            job();
        } catch (std::exception const& e) {
            failure = e.what();
        } catch (...) {
            failure = "non-standard exception";
        }

        lock.lock();
        if (failure) {
            failedJobs_ += 1;
            bk_log("Worker job failed: " + *failure, "WorkerPool", "ERROR");
        }
    }
}

} // namespace BK
