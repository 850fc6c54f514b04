#include "ParallelProcessor.h"
#include <iostream>

ParallelProcessor::ParallelProcessor(size_t numThreads, SchedulingPolicy policy)
    : policy_(policy)
{
    numThreads_ = (numThreads == 0) ? getOptimalThreadCount() : numThreads;
    std::cout << "ParallelProcessor initialized with " << numThreads_ << " threads" << std::endl;
}

size_t ParallelProcessor::getOptimalThreadCount()
{
    size_t hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0)
        hwThreads = 4; // fallback...

    // reserve one thread for main/rendering, use rest for compute
    return std::max(static_cast<size_t>(1), hwThreads - 1);
}

size_t ParallelProcessor::calculateChunkSize(size_t totalWork, SchedulingPolicy policy) const
{
    switch (policy)
    {
    case SchedulingPolicy::Static:
        return (totalWork + numThreads_ - 1) / numThreads_; // ceiling division

    case SchedulingPolicy::Dynamic:
        return std::max(static_cast<size_t>(1), totalWork / (numThreads_ * 4)); // smaller chunks

    case SchedulingPolicy::Guided:
        return std::max(static_cast<size_t>(1), totalWork / (numThreads_ * 2)); // medium chunks

    default:
        return (totalWork + numThreads_ - 1) / numThreads_;
    }
}

void ParallelProcessor::recordExecution(double milliseconds)
{
    metrics_.totalOperations++;
    metrics_.avgExecutionTime = (metrics_.avgExecutionTime * (metrics_.totalOperations - 1) + milliseconds) / metrics_.totalOperations;
    metrics_.maxExecutionTime = std::max(metrics_.maxExecutionTime, milliseconds);
    metrics_.minExecutionTime = (metrics_.minExecutionTime == 0.0) ? milliseconds : std::min(metrics_.minExecutionTime, milliseconds);
}
