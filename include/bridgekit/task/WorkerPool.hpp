#pragma once
#include "bridgekit/core/Error.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace BK {

/**
 * WorkerPool: reusable threads for jobs that may block for a long time.
 *
 * Idle workers pick up new jobs. A submit that finds every worker busy
 * starts one more, so a job that never returns cannot hold back later
 * ones. Workers are kept until shutdown.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::size_t initialWorkers = 1);
    ~WorkerPool();

    // Process-wide pool used by circuit breakers for timed calls.
    static auto Instance() -> WorkerPool&;

    WorkerPool(WorkerPool const&)                    = delete;
    auto operator=(WorkerPool const&) -> WorkerPool& = delete;

    auto submit(Job job) -> std::optional<Error>;
    auto shutdown() -> void;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto idle() const -> std::size_t;
    [[nodiscard]] auto failedJobs() const -> std::uint64_t;

private:
    auto spawnLocked() -> void;
    auto workerLoop(std::stop_token stopToken) -> void;

    mutable std::mutex          mutex_;
    std::condition_variable_any jobCv_;
    std::deque<Job>             jobs_;
    std::vector<std::jthread>   workers_;
    std::size_t                 idleWorkers_{0};
    std::uint64_t               failedJobs_{0};
    bool                        shuttingDown_{false};
};

} // namespace BK
