#include "IoRing.hpp"
#include "Assert.hpp"
#include "ScopedFileDescriptor.hpp"
#include <atomic>
#include <algorithm>
#include <cstring>
#include <unistd.h>

IoRing::IoRing(uint32_t entries)
    : partialRandom(std::random_device{}())
{
    int ret = io_uring_queue_init(entries, &this->ring, 0);
    if (ret == 0)
    {
        this->ringInitialised = true;
    }
    else
    {
        static std::atomic_bool warned = false;
        if (!warned.exchange(true))
            fprintf(stderr, "io_uring unavailable (\"%s\"), falling back to pread / pwrite\n", strerror(-ret));
    }
}

IoRing::~IoRing()
{
    if (this->ringInitialised)
        io_uring_queue_exit(&this->ring);
}

struct io_uring_sqe* IoRing::getSqe()
{
    // We always submit and reap everything before returning, so the submission queue can't be full here
    io_uring_sqe* sqe = io_uring_get_sqe(&this->ring);
    release_assert(sqe != nullptr);
    return sqe;
}

Result IoRing::submitAndWait(uint32_t count, int32_t results[2])
{
    int ret = 0;
    do
    {
        ret = io_uring_submit_and_wait(&this->ring, count);
    }
    while (ret == -EAGAIN || ret == -EINTR);

    if (ret < 0)
        return Error(std::string("io_uring submission failed: \"") + strerror(-ret) + "\"");

    for (uint32_t i = 0; i < count; i++)
    {
        io_uring_cqe* cqe = nullptr;
        int err = 0;
        do
        {
            err = io_uring_wait_cqe(&this->ring, &cqe);
        }
        while (err == -EAGAIN || err == -EINTR);

        if (err < 0)
            return Error(std::string("io_uring wait failed: \"") + strerror(-err) + "\"");

        debug_assert(cqe->user_data < 2);
        results[cqe->user_data] = cqe->res;
        io_uring_cqe_seen(&this->ring, cqe);
    }

    return Success();
}

size_t IoRing::forcedPartialSize(size_t count)
{
    debug_assert(count > 0);
    // never force zero, as that would look like EOF on a read
    return (this->partialRandom() % count) + 1;
}

int32_t IoRing::runRead(int fd, uint8_t* buffer, size_t count, off_t offset)
{
    count = std::min(count, MAX_IO_SIZE);
    int32_t result = 0;

    if (this->ringInitialised)
    {
        io_uring_sqe* sqe = this->getSqe();
        io_uring_prep_read(sqe, fd, buffer, unsigned(count), uint64_t(offset));
        sqe->user_data = uint64_t(OpIndex::Read);

        int32_t results[2] = {};
        Result submitResult = this->submitAndWait(1, results);
        if (std::holds_alternative<Error>(submitResult))
            return -EIO;
        result = results[int(OpIndex::Read)];
    }
    else
    {
        ssize_t ret = 0;
        int err = retrySyscall([&]()
        {
            ret = pread64(fd, buffer, count, offset);
        });
        result = ret < 0 ? -err : int32_t(ret);
    }

    if (Config::DEBUG_FORCE_PARTIAL_READS && result > 0)
        result = int32_t(this->forcedPartialSize(size_t(result)));

    return result;
}

int32_t IoRing::runWrite(int fd, const uint8_t* buffer, size_t count, off_t offset)
{
    count = std::min(count, MAX_IO_SIZE);
    if (Config::DEBUG_FORCE_PARTIAL_WRITES && count > 0)
        count = this->forcedPartialSize(count);

    if (this->ringInitialised)
    {
        io_uring_sqe* sqe = this->getSqe();
        io_uring_prep_write(sqe, fd, buffer, unsigned(count), uint64_t(offset));
        sqe->user_data = uint64_t(OpIndex::Write);

        int32_t results[2] = {};
        Result submitResult = this->submitAndWait(1, results);
        if (std::holds_alternative<Error>(submitResult))
            return -EIO;
        return results[int(OpIndex::Write)];
    }

    ssize_t ret = 0;
    int err = retrySyscall([&]()
    {
        ret = pwrite64(fd, buffer, count, offset);
    });
    return ret < 0 ? -err : int32_t(ret);
}

IoRing::IoResult IoRing::read(const ScopedFileDescriptor& fd, uint8_t* buffer, size_t count, off_t offset)
{
    int32_t result = this->runRead(fd.getFd(), buffer, count, offset);
    if (result < 0)
        return Error("Error reading file \"" + fd.getPath() + "\": \"" + strerror(-result) + "\"");

    return size_t(result);
}

IoRing::IoResult IoRing::writeAll(const ScopedFileDescriptor& fd, const uint8_t* buffer, size_t count, off_t offset)
{
    size_t done = 0;
    while (done < count)
    {
        int32_t result = this->runWrite(fd.getFd(), buffer + done, count - done, offset + off_t(done));
        if (result < 0)
            return Error("Error writing file \"" + fd.getPath() + "\": \"" + strerror(-result) + "\"");
        if (result == 0)
            return Error("Error writing file \"" + fd.getPath() + "\": \"no progress on write\"");

        done += size_t(result);
    }

    return done;
}

IoRing::IoResult IoRing::copyChunk(const ScopedFileDescriptor& source,
                                   const ScopedFileDescriptor& dest,
                                   uint8_t* buffer,
                                   size_t count,
                                   off_t offset)
{
    count = std::min(count, MAX_IO_SIZE);

    int32_t readResult = 0;
    int32_t writeResult = 0;

    if (this->ringInitialised)
    {
        bool forceShortRead = Config::DEBUG_FORCE_PARTIAL_READS;
        size_t writeCount = Config::DEBUG_FORCE_PARTIAL_WRITES ? this->forcedPartialSize(count) : count;

        io_uring_sqe* readSqe = this->getSqe();
        io_uring_prep_read(readSqe, source.getFd(), buffer, unsigned(count), uint64_t(offset));
        readSqe->flags |= IOSQE_IO_LINK; // The following write command will fail with ECANCELED if this read doesn't fully complete
        readSqe->user_data = uint64_t(OpIndex::Read);

        io_uring_sqe* writeSqe = this->getSqe();
        if (forceShortRead)
        {
            // A short read would cancel the linked write. To emulate that, we send a nop and override its result below.
            io_uring_prep_nop(writeSqe);
        }
        else
        {
            io_uring_prep_write(writeSqe, dest.getFd(), buffer, unsigned(writeCount), uint64_t(offset));
        }
        writeSqe->user_data = uint64_t(OpIndex::Write);

        int32_t results[2] = {};
        Result submitResult = this->submitAndWait(2, results);
        if (std::holds_alternative<Error>(submitResult))
            return Error(std::move(std::get<Error>(submitResult)));

        readResult = results[int(OpIndex::Read)];
        writeResult = results[int(OpIndex::Write)];

        if (forceShortRead)
        {
            // only allow spoofing a shorter-than-real read, never a longer one, and never hide a real error
            if (readResult > 0)
                readResult = int32_t(this->forcedPartialSize(size_t(readResult)));
            writeResult = -ECANCELED;
        }
    }
    else
    {
        readResult = this->runRead(source.getFd(), buffer, count, offset);
        writeResult = -ECANCELED;
    }

    if (Config::DEBUG_COPY_OPS)
    {
        printf("CHUNK %d->%d %ld RD: %d WT: %d\n",
               source.getFd(), dest.getFd(), long(offset), readResult, writeResult);
    }

    if (readResult < 0)
        return Error("Error reading file \"" + source.getPath() + "\": \"" + strerror(-readResult) + "\"");

    if (readResult == 0)
        return size_t(0);

    // ECANCELED means the read came back short, so nothing was written yet
    if (writeResult < 0 && writeResult != -ECANCELED)
        return Error("Error writing file \"" + dest.getPath() + "\": \"" + strerror(-writeResult) + "\"");

    size_t written = writeResult > 0 ? size_t(writeResult) : 0;
    debug_assert(written <= size_t(readResult));

    if (written < size_t(readResult))
    {
        IoResult rest = this->writeAll(dest, buffer + written, size_t(readResult) - written, offset + off_t(written));
        if (std::holds_alternative<Error>(rest))
            return rest;
    }

    return size_t(readResult);
}
