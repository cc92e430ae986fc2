#include "ProgressState.hpp"

void ProgressState::addToTotals(size_t files, size_t bytes)
{
    this->filesTotal += files;
    this->bytesTotal += bytes;
}

ProgressState::Snapshot ProgressState::snapshot() const
{
    Snapshot snapshot;

    // Done counters first. Totals only grow, and always ahead of the matching done counter, so totals read
    // afterwards can't be below them.
    snapshot.filesDone = this->filesDone.load();
    snapshot.bytesDone = this->bytesDone.load();
    snapshot.filesTotal = this->filesTotal.load();
    snapshot.bytesTotal = this->bytesTotal.load();

    return snapshot;
}
