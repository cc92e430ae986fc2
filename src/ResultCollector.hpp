#pragma once
#include <vector>
#include <chrono>
#include <pthread.h>
#include "CopyTask.hpp"

struct RunSummary
{
    enum class Outcome : uint8_t
    {
        Success,
        PartialFailure,
        Failure,
    };

    size_t totalFiles = 0;
    size_t succeeded = 0;
    std::vector<TaskResult> failed; // in completion order
    size_t bytesCopied = 0;
    std::chrono::steady_clock::duration elapsed = {};
    double averageThroughput = 0; // bytes per second
    Outcome outcome = Outcome::Success;

    size_t countFailed(ErrorKind kind) const;
};

const char* outcomeName(RunSummary::Outcome outcome);

// Thread safe sink for task results. Workers hand their results over here as soon as a task finishes.
class ResultCollector
{
public:
    ResultCollector() = default;
    ~ResultCollector();

    ResultCollector(const ResultCollector&) = delete;
    ResultCollector& operator=(const ResultCollector&) = delete;

    void add(TaskResult&& result);
    size_t size();

    // Moves all collected results into the summary, leaving the collector empty
    RunSummary buildSummary(std::chrono::steady_clock::duration elapsed);

private:
    std::vector<TaskResult> results;
    pthread_mutex_t resultsMutex = PTHREAD_ADAPTIVE_MUTEX_INITIALIZER_NP;
};
