#pragma once
#include <liburing.h>
#include <cstdint>
#include <random>
#include "Config.hpp"
#include "Util.hpp"

class ScopedFileDescriptor;

// A small io_uring owned by one worker thread. Every call submits and waits for its own completions, so from the
// caller's point of view the operations are blocking, but a chunk copy still goes to the kernel as one linked
// read + write submission.
//
// Some kernels / sandboxes refuse io_uring_setup (ENOSYS / EPERM). In that case the ring degrades to plain
// pread / pwrite with the same semantics.
class IoRing
{
public:
    explicit IoRing(uint32_t entries = Config::IO_RING_ENTRIES);
    ~IoRing();

    IoRing(const IoRing&) = delete;
    IoRing& operator=(const IoRing&) = delete;

    using IoResult = std::variant<Error, size_t>;

    // Reads up to count bytes at offset. Returns the number of bytes read, zero means end of file.
    [[nodiscard]] IoResult read(const ScopedFileDescriptor& fd, uint8_t* buffer, size_t count, off_t offset);

    // Writes exactly count bytes at offset, continuing after short writes.
    [[nodiscard]] IoResult writeAll(const ScopedFileDescriptor& fd, const uint8_t* buffer, size_t count, off_t offset);

    // Reads up to count bytes from source at offset and writes whatever was read to dest at the same offset.
    // Returns the number of bytes copied, zero means the source is at end of file.
    [[nodiscard]] IoResult copyChunk(const ScopedFileDescriptor& source,
                                     const ScopedFileDescriptor& dest,
                                     uint8_t* buffer,
                                     size_t count,
                                     off_t offset);

    bool isUsingUring() const { return this->ringInitialised; }

    // Largest count a single read or write will ask the kernel for
    static constexpr size_t MAX_IO_SIZE = 0x7ffff000;
    static_assert(Config::MAX_BUFFER_SIZE <= MAX_IO_SIZE);

private:
    enum class OpIndex : uint8_t
    {
        Read = 0,
        Write = 1,
    };

    struct io_uring_sqe* getSqe();
    [[nodiscard]] Result submitAndWait(uint32_t count, int32_t results[2]);

    int32_t runRead(int fd, uint8_t* buffer, size_t count, off_t offset);
    int32_t runWrite(int fd, const uint8_t* buffer, size_t count, off_t offset);

    size_t forcedPartialSize(size_t count);

private:
    io_uring ring = {};
    bool ringInitialised = false;

    std::minstd_rand partialRandom;
};
