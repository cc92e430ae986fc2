#pragma once
#include <cstddef>

struct TaskResult;
struct RunSummary;

// Push style progress events, for front ends that would rather be told than poll ProgressState.
class ProgressListener
{
public:
    virtual ~ProgressListener() = default;

    virtual void onStart(size_t filesTotal, size_t bytesTotal) = 0;

    // Called once per file task, on the worker thread that ran it, so implementations must be thread safe
    virtual void onTaskFinished(const TaskResult& result) = 0;

    virtual void onFinish(const RunSummary& summary) = 0;
};
