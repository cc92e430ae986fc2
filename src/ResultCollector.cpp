#include "ResultCollector.hpp"
#include "Assert.hpp"

size_t RunSummary::countFailed(ErrorKind kind) const
{
    size_t count = 0;
    for (const TaskResult& result : this->failed)
    {
        if (result.error && result.error->kind == kind)
            count++;
    }
    return count;
}

const char* outcomeName(RunSummary::Outcome outcome)
{
    switch (outcome)
    {
        case RunSummary::Outcome::Success:
            return "Success";
        case RunSummary::Outcome::PartialFailure:
            return "PartialFailure";
        case RunSummary::Outcome::Failure:
            return "Failure";
    }

    message_and_abort("unknown Outcome");
}

ResultCollector::~ResultCollector()
{
    [[maybe_unused]] int ret = pthread_mutex_destroy(&this->resultsMutex);
    debug_assert(ret == 0);
}

void ResultCollector::add(TaskResult&& result)
{
    pthread_mutex_lock(&this->resultsMutex);
    this->results.emplace_back(std::move(result));
    pthread_mutex_unlock(&this->resultsMutex);
}

size_t ResultCollector::size()
{
    pthread_mutex_lock(&this->resultsMutex);
    size_t count = this->results.size();
    pthread_mutex_unlock(&this->resultsMutex);
    return count;
}

RunSummary ResultCollector::buildSummary(std::chrono::steady_clock::duration elapsed)
{
    std::vector<TaskResult> localResults;
    pthread_mutex_lock(&this->resultsMutex);
    this->results.swap(localResults);
    pthread_mutex_unlock(&this->resultsMutex);

    RunSummary summary;
    summary.elapsed = elapsed;

    for (TaskResult& result : localResults)
    {
        summary.bytesCopied += result.bytesTransferred;

        bool isFile = result.task.kind == CopyTask::Kind::File;
        if (isFile)
            summary.totalFiles++;

        if (result.succeeded())
        {
            if (isFile)
                summary.succeeded++;
        }
        else
        {
            debug_assert(result.error.has_value());
            summary.failed.emplace_back(std::move(result));
        }
    }

    double seconds = std::chrono::duration<double>(elapsed).count();
    summary.averageThroughput = seconds > 0 ? double(summary.bytesCopied) / seconds : 0;

    if (summary.failed.empty())
        summary.outcome = RunSummary::Outcome::Success;
    else if (summary.succeeded > 0)
        summary.outcome = RunSummary::Outcome::PartialFailure;
    else
        summary.outcome = RunSummary::Outcome::Failure;

    return summary;
}
