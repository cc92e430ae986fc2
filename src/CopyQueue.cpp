#include "CopyQueue.hpp"
#include "Assert.hpp"
#include "CopyRunner.hpp"
#include "IoRing.hpp"
#include "ProgressListener.hpp"
#include "Util.hpp"

CopyQueue::CopyQueue(const CopyOptions& options)
    : workerCount(options.workerCount > 0 ? options.workerCount : getLogicalCoreCount())
    , bufferSize(options.bufferSize)
    , queueCapacity(this->workerCount * Config::TASK_QUEUE_SLOTS_PER_WORKER)
    , verify(options.verify)
    , showProgress(options.showProgress)
    , showErrors(options.showErrors)
    , display(this->progress)
{
    release_assert(this->workerCount >= 1);
    release_assert(this->bufferSize >= 1);
}

CopyQueue::~CopyQueue()
{
    release_assert(this->state == State::Idle || this->state == State::Finished);

    [[maybe_unused]] int ret = pthread_mutex_destroy(&this->pendingTasksMutex);
    debug_assert(ret == 0);
    ret = pthread_cond_destroy(&this->tasksAvailable);
    debug_assert(ret == 0);
    ret = pthread_cond_destroy(&this->spaceAvailable);
    debug_assert(ret == 0);
}

void CopyQueue::onError(const Error& error)
{
    if (!this->showErrors)
        return;

    std::string line = std::string(errorKindName(error.kind)) + ": " + error.message();

    if (this->display.isRunning())
        this->display.postMessage(std::move(line));
    else
        fprintf(stderr, "%s\n", line.c_str());
}

void CopyQueue::onTaskFinished(TaskResult&& result)
{
    if (result.error)
        this->onError(*result.error);

    if (this->listener && result.task.kind == CopyTask::Kind::File)
        this->listener->onTaskFinished(result);

    this->results.add(std::move(result));
}

void CopyQueue::workerLoop()
{
    pthread_setname_np(pthread_self(), "copy worker");

    // The heap holds exactly one block per worker
    uint8_t* buffer = this->copyBufferHeap.getBlock();
    release_assert(buffer != nullptr);

    {
        IoRing ioRing;
        CopyRunner runner(this->progress, ioRing, buffer, this->bufferSize, this->verify);
        runner.beforeSizeCheckHook = this->beforeSizeCheckHook;
        runner.beforeVerifyHook = this->beforeVerifyHook;

        while (std::optional<CopyTask> task = this->popTask())
            this->onTaskFinished(runner.run(std::move(*task)));
    }

    this->copyBufferHeap.returnBlock(buffer);
}

std::optional<CopyTask> CopyQueue::popTask()
{
    pthread_mutex_lock(&this->pendingTasksMutex);

    while (this->pendingTasks.empty() && this->state != State::AdditionComplete)
        pthread_cond_wait(&this->tasksAvailable, &this->pendingTasksMutex);

    std::optional<CopyTask> task;
    if (!this->pendingTasks.empty())
    {
        task = std::move(this->pendingTasks.front());
        this->pendingTasks.pop_front();
        pthread_cond_signal(&this->spaceAvailable);
    }

    pthread_mutex_unlock(&this->pendingTasksMutex);

    return task;
}

void CopyQueue::enqueue(CopyTask&& task)
{
    debug_assert(this->state == State::Running);

    if (task.kind == CopyTask::Kind::Directory)
    {
        this->onTaskFinished(CopyRunner::runDirectoryTask(std::move(task)));
        return;
    }

    pthread_mutex_lock(&this->pendingTasksMutex);
    {
        while (this->pendingTasks.size() >= this->queueCapacity)
            pthread_cond_wait(&this->spaceAvailable, &this->pendingTasksMutex);

        this->pendingTasks.emplace_back(std::move(task));
        pthread_cond_signal(&this->tasksAvailable);
    }
    pthread_mutex_unlock(&this->pendingTasksMutex);
}

void CopyQueue::addTask(CopyTask&& task)
{
    release_assert(this->state == State::Running);

    if (task.kind == CopyTask::Kind::File)
        this->progress.addToTotals(1, task.sizeBytes);

    this->enqueue(std::move(task));
}

void CopyQueue::addPlan(CopyPlan&& plan)
{
    release_assert(this->state == State::Running);

    this->progress.addToTotals(plan.fileCount, plan.byteCount);

    if (this->listener)
        this->listener->onStart(plan.fileCount, plan.byteCount);

    for (CopyTask& task : plan.tasks)
        this->enqueue(std::move(task));
}

Result CopyQueue::start()
{
    release_assert(this->state == State::Idle);

    {
        Result result = this->copyBufferHeap.allocate(this->workerCount, this->bufferSize, Config::BUFFER_ALIGNMENT);
        if (std::holds_alternative<Error>(result))
            return result;
    }
    debug_assert(this->copyBufferHeap.getBlockSize() >= this->bufferSize);

    this->state = State::Running;
    this->started = std::chrono::steady_clock::now();

    if (this->showProgress && ProgressDisplay::canShowOnStderr())
        this->display.start();

    this->workerThreads.resize(this->workerCount);
    for (pthread_t& thread : this->workerThreads)
        release_assert(pthread_create(&thread, nullptr, CopyQueue::staticCallWorkerLoop, this) == 0);

    return Success();
}

RunSummary CopyQueue::join()
{
    release_assert(this->state == State::Running);

    pthread_mutex_lock(&this->pendingTasksMutex);
    this->state = State::AdditionComplete;
    pthread_cond_broadcast(&this->tasksAvailable); // wakes idle workers so they can see there's nothing more coming
    pthread_mutex_unlock(&this->pendingTasksMutex);

    for (pthread_t thread : this->workerThreads)
        pthread_join(thread, nullptr);
    this->workerThreads.clear();

    debug_assert(this->pendingTasks.empty());
    debug_assert(this->copyBufferHeap.getFreeBlocksCount() == this->copyBufferHeap.getBlockCount());

    this->display.stop();
    this->state = State::Finished;

    RunSummary summary = this->results.buildSummary(std::chrono::steady_clock::now() - this->started);

    if (this->listener)
        this->listener->onFinish(summary);

    return summary;
}
