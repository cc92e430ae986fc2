#pragma once
#include <pthread.h>
#include <atomic>
#include <string>
#include <vector>
#include <chrono>
#include "ProgressState.hpp"

// Redraws a three line progress block on stderr at a fixed interval, from a separate thread.
// Messages posted while it runs are printed above the block instead of being overdrawn.
class ProgressDisplay
{
public:
    explicit ProgressDisplay(const ProgressState& progress);
    ~ProgressDisplay();

    ProgressDisplay(const ProgressDisplay&) = delete;
    ProgressDisplay& operator=(const ProgressDisplay&) = delete;

    // Don't try to show a progress bar if we're not outputting to a terminal
    static bool canShowOnStderr();

    void start();
    void stop();

    void postMessage(std::string&& message);

    bool isRunning() const { return this->running; }

private:
    void showProgressLoop();
    void showProgress();

    static void* staticCallShowProgressLoop(void* instance) { reinterpret_cast<ProgressDisplay*>(instance)->showProgressLoop(); return nullptr; }

private:
    const ProgressState& progress;

    std::atomic<bool> running = false;
    bool firstShow = true;

    std::chrono::steady_clock::time_point started;

    struct RatePoint { std::chrono::steady_clock::time_point time; size_t bytes; };
    std::vector<RatePoint> ratePoints;

    std::vector<std::string> messages;
    pthread_mutex_t messagesMutex = PTHREAD_ADAPTIVE_MUTEX_INITIALIZER_NP;

    pthread_t showProgressThread = {};
    pthread_mutex_t progressEndMutex = PTHREAD_MUTEX_INITIALIZER;
};
