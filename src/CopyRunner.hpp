#pragma once
#include <cstdint>
#include <functional>
#include "CopyTask.hpp"
#include "Verifier.hpp"

class IoRing;
class ProgressState;

// Runs file copy tasks for one worker. The runner borrows the worker's io ring and copy buffer, and is reused for every
// task that worker picks up.
class CopyRunner
{
public:
    CopyRunner(ProgressState& progress, IoRing& ioRing, uint8_t* buffer, size_t bufferSize, bool verify);

    CopyRunner() = delete;
    CopyRunner(const CopyRunner&) = delete;
    CopyRunner& operator=(const CopyRunner&) = delete;

    // Never fails as a whole, errors end up in the returned TaskResult
    TaskResult run(CopyTask&& task);

    // Directory tasks don't need a buffer or a ring, so the scheduler runs them on the thread that adds them
    static TaskResult runDirectoryTask(CopyTask&& task);

private:
    [[nodiscard]] Result copyFile(const CopyTask& task, size_t& bytesTransferred);

private:
    friend class CopyQueue;

    ProgressState& progress;
    IoRing& ioRing;
    uint8_t* buffer;
    size_t bufferSize;
    bool verify;
    Verifier verifier;

    // Test hooks. The first runs after the last chunk is written but before the two sizes are compared, the second
    // between the copy and the verification pass.
    std::function<void(const CopyTask&)> beforeSizeCheckHook;
    std::function<void(const CopyTask&)> beforeVerifyHook;
};
