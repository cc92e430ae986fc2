#pragma once
#include <pthread.h>
#include <atomic>
#include <deque>
#include <functional>
#include <optional>
#include <vector>
#include "Config.hpp"
#include "CopyTask.hpp"
#include "Heap.hpp"
#include "PathPlanner.hpp"
#include "ProgressDisplay.hpp"
#include "ProgressState.hpp"
#include "ResultCollector.hpp"

class ProgressListener;

struct CopyOptions
{
    size_t workerCount = 0; // zero means one worker per logical core
    size_t bufferSize = Config::DEFAULT_BUFFER_SIZE;
    bool verify = false;
    bool showProgress = false; // only has an effect when stderr is a terminal
    bool showErrors = true;
};

// A fixed pool of worker threads draining one bounded task queue.
//
// Usage is start(), then addPlan() / addTask() from one thread, then join(). Directory tasks are run synchronously by
// the adding thread, so every directory exists before any file task added after it can be picked up by a worker.
class CopyQueue
{
public:
    explicit CopyQueue(const CopyOptions& options);
    ~CopyQueue();

    CopyQueue(const CopyQueue&) = delete;
    CopyQueue& operator=(const CopyQueue&) = delete;

    void setListener(ProgressListener* newListener) { this->listener = newListener; }

    // Allocates the copy buffers and starts the workers. Fails, leaving the queue idle, when the buffers can't be allocated.
    [[nodiscard]] Result start();

    // Adds the whole plan to the progress totals up front, then queues its tasks in order
    void addPlan(CopyPlan&& plan);
    void addTask(CopyTask&& task);

    // Blocks until every added task has finished, and all workers have exited
    RunSummary join();

    const ProgressState& getProgress() const { return this->progress; }
    size_t getWorkerCount() const { return this->workerCount; }

private:
    friend class TestContainer;

    void enqueue(CopyTask&& task);
    std::optional<CopyTask> popTask();
    void onTaskFinished(TaskResult&& result);
    void onError(const Error& error);

    void workerLoop();

    static void* staticCallWorkerLoop(void* instance) { reinterpret_cast<CopyQueue*>(instance)->workerLoop(); return nullptr; }

private:
    size_t workerCount;
    size_t bufferSize;
    size_t queueCapacity;
    bool verify;
    bool showProgress;
    bool showErrors;

    Heap copyBufferHeap;
    ProgressState progress;
    ResultCollector results;
    ProgressDisplay display;
    ProgressListener* listener = nullptr;

    std::deque<CopyTask> pendingTasks;
    pthread_mutex_t pendingTasksMutex = PTHREAD_MUTEX_INITIALIZER;
    pthread_cond_t tasksAvailable = PTHREAD_COND_INITIALIZER;
    pthread_cond_t spaceAvailable = PTHREAD_COND_INITIALIZER;

    enum class State
    {
        Idle,
        Running,
        AdditionComplete,
        Finished, // a queue runs once, progress and results belong to that run
    };
    std::atomic<State> state = State::Idle;

    std::vector<pthread_t> workerThreads;
    std::chrono::steady_clock::time_point started;

    // Test hooks, handed to every worker's CopyRunner
    std::function<void(const CopyTask&)> beforeSizeCheckHook;
    std::function<void(const CopyTask&)> beforeVerifyHook;
};
