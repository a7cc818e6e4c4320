/**
 * @file worker_pool.cpp
 * @brief Implementation of the fixed-size worker pool
 */

#include "liquid/core/worker_pool.hpp"

#include <algorithm>

namespace Parallel {

WorkerPool::WorkerPool(int count)
    : workerCount(std::max(1, count))
{
    if (workerCount > 1) {
        threads.reserve(static_cast<std::size_t>(workerCount));
        for (int w = 0; w < workerCount; ++w) {
            threads.emplace_back([this, w] { workerLoop(w); });
        }
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        shuttingDown = true;
    }
    startCv.notify_all();
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

int WorkerPool::defaultWorkerCount() {
    unsigned hc = std::thread::hardware_concurrency();
    if (hc == 0) {
        hc = 2;
    }
    return static_cast<int>(std::max(1u, hc - 1));
}

void WorkerPool::parallelFor(std::size_t count, const Task& task) {
    if (count == 0) {
        return;
    }
    if (workerCount <= 1) {
        task(0, count, 0);
        return;
    }

    std::unique_lock<std::mutex> lock(mtx);
    currentTask = &task;
    currentCount = count;
    pending = workerCount;
    firstError = nullptr;
    ++generation;
    startCv.notify_all();

    doneCv.wait(lock, [this] { return pending == 0; });
    currentTask = nullptr;

    if (firstError) {
        std::exception_ptr const error = firstError;
        firstError = nullptr;
        lock.unlock();
        std::rethrow_exception(error);
    }
}

void WorkerPool::workerLoop(int workerIndex) {
    std::uint64_t seenGeneration = 0;

    for (;;) {
        const Task* task = nullptr;
        std::size_t count = 0;
        {
            std::unique_lock<std::mutex> lock(mtx);
            startCv.wait(lock, [&] { return shuttingDown || generation != seenGeneration; });
            if (shuttingDown) {
                return;
            }
            seenGeneration = generation;
            task = currentTask;
            count = currentCount;
        }

        std::size_t const workers = static_cast<std::size_t>(workerCount);
        std::size_t const block = (count + workers - 1) / workers;
        std::size_t const begin = std::min(count, static_cast<std::size_t>(workerIndex) * block);
        std::size_t const end = std::min(count, begin + block);

        std::exception_ptr error;
        if (begin < end) {
            try {
                (*task)(begin, end, workerIndex);
            } catch (...) {
                error = std::current_exception();
            }
        }

        {
            std::lock_guard<std::mutex> lock(mtx);
            if (error && !firstError) {
                firstError = error;
            }
            if (--pending == 0) {
                doneCv.notify_one();
            }
        }
    }
}

} // namespace Parallel
