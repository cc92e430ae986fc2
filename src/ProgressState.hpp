#pragma once
#include <atomic>
#include <cstddef>

// Counters shared by every worker of one copy operation. All of them only ever grow, so any snapshot is a consistent
// lower bound of the real progress. filesDone counts finished file tasks, whether they succeeded or not.
class ProgressState
{
public:
    struct Snapshot
    {
        size_t filesTotal = 0;
        size_t filesDone = 0;
        size_t bytesTotal = 0;
        size_t bytesDone = 0;
    };

    ProgressState() = default;
    ProgressState(const ProgressState&) = delete;
    ProgressState& operator=(const ProgressState&) = delete;

    // Work must be added to the totals before it can be reported as done
    void addToTotals(size_t files, size_t bytes);

    void addBytesDone(size_t bytes) { this->bytesDone += bytes; }
    void addFileDone() { this->filesDone++; }

    Snapshot snapshot() const;

private:
    std::atomic<size_t> filesTotal = 0;
    std::atomic<size_t> filesDone = 0;
    std::atomic<size_t> bytesTotal = 0;
    std::atomic<size_t> bytesDone = 0;
};
