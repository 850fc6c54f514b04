#pragma once
#include <vector>
#include <thread>
#include <future>
#include <chrono>
#include <algorithm>
#include <cstddef>

/**
 * parallel processor for the per-agent work of a step
 * splits an index range into contiguous chunks and runs them through std::async
 * each index must only write its own output slot, the caller commits serially afterwards
 */
class ParallelProcessor
{
public:
    // work distribution strategies
    enum class SchedulingPolicy
    {
        Static,  // one chunk per thread
        Dynamic, // many small chunks for load balancing
        Guided   // medium chunks
    };

    // performance monitoring
    struct PerformanceMetrics
    {
        double avgExecutionTime = 0.0;
        double maxExecutionTime = 0.0;
        double minExecutionTime = 0.0;
        size_t totalOperations = 0;
    };

private:
    size_t numThreads_;
    SchedulingPolicy policy_;
    mutable PerformanceMetrics metrics_;

    // below this many items per thread the work runs inline on the caller
    static constexpr size_t MIN_ITEMS_PER_THREAD = 2;

    static size_t getOptimalThreadCount();

    // chunk size calculation for different policies
    size_t calculateChunkSize(size_t totalWork, SchedulingPolicy policy) const;

    void recordExecution(double milliseconds);

public:
    ParallelProcessor(size_t numThreads = 0, SchedulingPolicy policy = SchedulingPolicy::Static);
    ~ParallelProcessor() = default;

    // func(begin, end) is called once per chunk, chunks cover [0, count) exactly once
    // exceptions thrown by a chunk are rethrown here after every chunk has finished
    template <typename Function>
    void parallelForChunks(size_t count, Function &&func)
    {
        if (count == 0)
            return;

        if (numThreads_ <= 1 || count < numThreads_ * MIN_ITEMS_PER_THREAD)
        {
            // too little work for parallelization overhead
            func(static_cast<size_t>(0), count);
            return;
        }

        auto start = std::chrono::high_resolution_clock::now();

        const size_t chunkSize = calculateChunkSize(count, policy_);
        std::vector<std::future<void>> futures;
        futures.reserve((count + chunkSize - 1) / chunkSize);

        for (size_t startIdx = 0; startIdx < count; startIdx += chunkSize)
        {
            size_t endIdx = std::min(startIdx + chunkSize, count);
            futures.emplace_back(std::async(std::launch::async, [&func, startIdx, endIdx]()
                                            { func(startIdx, endIdx); }));
        }

        // wait for every chunk before letting an exception out, they all reference func
        for (auto &future : futures)
        {
            future.wait();
        }
        for (auto &future : futures)
        {
            future.get();
        }

        auto end = std::chrono::high_resolution_clock::now();
        recordExecution(std::chrono::duration<double, std::milli>(end - start).count());
    }

    // performance and configs
    size_t getThreadCount() const { return numThreads_; }
    SchedulingPolicy getSchedulingPolicy() const { return policy_; }

    PerformanceMetrics getMetrics() const { return metrics_; }
    void resetMetrics() { metrics_ = PerformanceMetrics{}; }
};
