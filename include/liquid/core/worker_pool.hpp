/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool for phase-by-phase data-parallel loops
 *
 * The pool owns its threads for its whole lifetime. Each call to parallelFor
 * hands one contiguous block of [0, count) to every worker and returns only
 * after all blocks are done, so consecutive calls act as barriers.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace Parallel {

class WorkerPool {
public:
    /**
     * @brief Work callback: half-open index range plus the worker's id.
     *
     * The worker id is in [0, size()) and is stable for the block, so it can
     * address per-worker scratch storage.
     */
    using Task = std::function<void(std::size_t begin, std::size_t end, int worker)>;

    /**
     * @param workerCount Number of workers; values below 1 are treated as 1.
     *
     * A single-worker pool starts no threads and runs blocks on the caller.
     */
    explicit WorkerPool(int workerCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** @brief Number of workers (and per-worker scratch slots callers need) */
    int size() const { return workerCount; }

    /**
     * @brief Runs task over [0, count) split into one block per worker.
     *
     * Blocks until every worker has finished. If any block throws, the first
     * exception is rethrown here after the barrier.
     */
    void parallelFor(std::size_t count, const Task& task);

    /**
     * @brief Worker count to use when none is configured.
     *
     * Leaves one hardware thread for the caller, at least one worker.
     */
    static int defaultWorkerCount();

private:
    void workerLoop(int workerIndex);

    int workerCount;
    std::vector<std::thread> threads;

    std::mutex mtx;
    std::condition_variable startCv;
    std::condition_variable doneCv;

    const Task* currentTask = nullptr;
    std::size_t currentCount = 0;
    std::uint64_t generation = 0;
    int pending = 0;
    bool shuttingDown = false;
    std::exception_ptr firstError;
};

} // namespace Parallel
