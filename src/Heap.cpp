#include "Heap.hpp"
#include "Assert.hpp"
#include <cerrno>
#include <cstring>

Result Heap::allocate(size_t newBlocks, size_t requestedBlockSize, size_t newAlignment)
{
    release_assert(this->data == nullptr);
    release_assert(newBlocks > 0 && requestedBlockSize > 0);
    debug_assert(newAlignment > 0 && !(newAlignment & (newAlignment-1))); // assert align is power of two

    auto tooLarge = [&]()
    {
        return Error("Can't allocate " + std::to_string(newBlocks) + " buffers of " + std::to_string(requestedBlockSize) +
                     " bytes: size overflows");
    };

    // Round the block size up so every block stays aligned, aligned_alloc also requires the total to be a multiple of the alignment
    if (requestedBlockSize > SIZE_MAX - (newAlignment - 1))
        return tooLarge();
    size_t roundedBlockSize = ((requestedBlockSize + newAlignment - 1) / newAlignment) * newAlignment;

    size_t totalSize = 0;
    if (__builtin_mul_overflow(newBlocks, roundedBlockSize, &totalSize))
        return tooLarge();

    uint8_t* newData = static_cast<uint8_t*>(aligned_alloc(newAlignment, totalSize));
    if (newData == nullptr)
    {
        return Error("Can't allocate " + std::to_string(newBlocks) + " buffers of " + humanFriendlyFileSize(roundedBlockSize) +
                     ": \"" + strerror(errno) + "\"");
    }

    this->data = newData;
    this->blocks = newBlocks;
    this->blockSize = roundedBlockSize;
    this->alignment = newAlignment;
    this->usedList = new std::atomic_bool[this->blocks]();

    debug_assert(this->getFreeBlocksCount() == this->blocks);
    return Success();
}

Heap::~Heap()
{
#ifndef NDEBUG
    for (size_t i = 0; i < this->blocks; i++)
        debug_assert(!this->usedList[i]);
#endif
    free(this->data);
    delete[] this->usedList;
}

uint8_t* Heap::getBlock()
{
    for (size_t i = 0; i < this->blocks; i++)
    {
        bool expected = false;
        if (usedList[i].compare_exchange_strong(expected, true))
            return this->data + this->blockSize * i;
    }

    return nullptr;
}

void Heap::returnBlock(uint8_t* block)
{
    debug_assert(block >= this->data && block < this->data + (this->blocks * this->blockSize));
    debug_assert((intptr_t(block) - intptr_t(this->data)) % this->blockSize == 0);

    size_t i = size_t(block - this->data) / this->blockSize;
    debug_assert(i < this->blocks && usedList[i]);
    usedList[i] = false;
}

size_t Heap::getFreeBlocksCount() const
{
    size_t sum = 0;
    for (size_t i = 0; i < this->blocks; i++)
    {
        if (!usedList[i])
            sum++;
    }

    return sum;
}
