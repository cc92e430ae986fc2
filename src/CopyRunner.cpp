#include "CopyRunner.hpp"
#include "Assert.hpp"
#include "Config.hpp"
#include "IoRing.hpp"
#include "ProgressState.hpp"
#include "ScopedFileDescriptor.hpp"
#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>

CopyRunner::CopyRunner(ProgressState& progress, IoRing& ioRing, uint8_t* buffer, size_t bufferSize, bool verify)
    : progress(progress)
    , ioRing(ioRing)
    , buffer(buffer)
    , bufferSize(bufferSize)
    , verify(verify)
    , verifier(ioRing, buffer, bufferSize)
{
    release_assert(this->buffer != nullptr && this->bufferSize > 0);
}

TaskResult CopyRunner::run(CopyTask&& task)
{
    debug_assert(task.kind == CopyTask::Kind::File);

    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    TaskResult taskResult;

    Result result = this->copyFile(task, taskResult.bytesTransferred);

    if (this->verify && !std::holds_alternative<Error>(result))
    {
        if (this->beforeVerifyHook)
            this->beforeVerifyHook(task);

        result = this->verifier.verify(task.sourcePath, task.destinationPath);
    }

    if (std::holds_alternative<Error>(result))
    {
        Error& error = std::get<Error>(result);
        taskResult.status = error.kind == ErrorKind::VerifyMismatch ? TaskResult::Status::VerifyMismatch : TaskResult::Status::Failed;
        taskResult.error = std::move(error);
    }

    this->progress.addFileDone();

    taskResult.duration = std::chrono::steady_clock::now() - started;
    taskResult.task = std::move(task);
    return taskResult;
}

TaskResult CopyRunner::runDirectoryTask(CopyTask&& task)
{
    debug_assert(task.kind == CopyTask::Kind::Directory);

    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    TaskResult taskResult;

    Result result = recursiveMkdir(task.destinationPath, task.mode);
    if (std::holds_alternative<Error>(result))
    {
        taskResult.status = TaskResult::Status::Failed;
        taskResult.error = std::move(std::get<Error>(result));
    }

    taskResult.duration = std::chrono::steady_clock::now() - started;
    taskResult.task = std::move(task);
    return taskResult;
}

Result CopyRunner::copyFile(const CopyTask& task, size_t& bytesTransferred)
{
    ScopedFileDescriptor sourceFd;
    ScopedFileDescriptor destFd;

    {
        Result result = sourceFd.open(task.sourcePath, O_RDONLY | O_CLOEXEC);
        if (std::holds_alternative<Error>(result))
            return result;

        result = destFd.open(task.destinationPath, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, task.mode);
        if (std::holds_alternative<Error>(result))
            return result;
    }

    if (Config::DEBUG_COPY_OPS)
        printf("START %d->%d %s\n", sourceFd.getFd(), destFd.getFd(), task.sourcePath.c_str());

    // Progress is reported against the planned size, so a file that grew since planning can't push the
    // total past 100%
    size_t bytesReported = 0;
    off_t offset = 0;

    while (true)
    {
        IoRing::IoResult result = this->ioRing.copyChunk(sourceFd, destFd, this->buffer, this->bufferSize, offset);
        if (std::holds_alternative<Error>(result))
            return Error(std::move(std::get<Error>(result)));

        size_t copied = std::get<size_t>(result);
        if (copied == 0)
            break;

        offset += off_t(copied);
        bytesTransferred = size_t(offset);

        size_t reportable = std::min(bytesTransferred, task.sizeBytes);
        if (reportable > bytesReported)
        {
            this->progress.addBytesDone(reportable - bytesReported);
            bytesReported = reportable;
        }
    }

    if (this->beforeSizeCheckHook)
        this->beforeSizeCheckHook(task);

    struct stat64 sourceStat = {};
    struct stat64 destStat = {};
    if (fstat64(sourceFd.getFd(), &sourceStat) != 0)
        return Error("Failed to stat \"" + task.sourcePath + "\": \"" + strerror(errno) + "\"");
    if (fstat64(destFd.getFd(), &destStat) != 0)
        return Error("Failed to stat \"" + task.destinationPath + "\": \"" + strerror(errno) + "\"");

    {
        Result result = destFd.close();
        if (std::holds_alternative<Error>(result))
            return result;

        result = sourceFd.close();
        if (std::holds_alternative<Error>(result))
            return result;
    }

    // Catches truncation that no read or write call reported, eg. the source growing after we saw end of file
    if (destStat.st_size != sourceStat.st_size)
    {
        return Error(ErrorKind::SizeMismatch,
                     "Size mismatch for \"" + task.destinationPath + "\": source is " + std::to_string(sourceStat.st_size) +
                     " bytes, destination is " + std::to_string(destStat.st_size) + " bytes");
    }

    return Success();
}
