#pragma once
#include <cstdlib>
#include <cstdint>
#include <atomic>
#include "Util.hpp"

// Thread safe slab allocator for copy buffers. Every block starts on an alignment boundary.
// Holds no memory until allocate() succeeds.
class Heap
{
public:
    Heap() = default;
    ~Heap();

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    // Fails without allocating anything if blocks * blockSize (rounded up to the alignment) doesn't fit in memory
    [[nodiscard]] Result allocate(size_t blocks, size_t blockSize, size_t alignment = 4096);

    // Returns nullptr when all blocks are in use
    uint8_t* getBlock();
    void returnBlock(uint8_t* block);

    size_t getBlockSize() const { return this->blockSize; }
    size_t getBlockCount() const { return this->blocks; }
    size_t getAlignment() const { return this->alignment; }
    size_t getFreeBlocksCount() const;

private:
    std::atomic_bool* usedList = nullptr;
    uint8_t* data = nullptr;
    size_t blocks = 0;
    size_t blockSize = 0;
    size_t alignment = 0;
};
