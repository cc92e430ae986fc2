#pragma once
#include <cstddef>
#include <cstdint>

namespace Config
{
    static constexpr size_t DEFAULT_BUFFER_SIZE = 1024 * 1024; // 1M
    static constexpr size_t BUFFER_ALIGNMENT = 4096;

    // A single read or write never moves more than this (the kernel's MAX_RW_COUNT), larger buffers would sit unused
    static constexpr size_t MAX_BUFFER_SIZE = 0x7ffff000;

    // Producers block once the task queue holds this many tasks per worker
    static constexpr size_t TASK_QUEUE_SLOTS_PER_WORKER = 64;

    // One linked read + write pair in flight per worker, plus headroom
    static constexpr uint32_t IO_RING_ENTRIES = 8;

    static constexpr int64_t PROGRESS_UPDATE_INTERVAL_MS = 250;

    // Window over which the progress display averages the transfer rate
    static constexpr double RATE_WINDOW_SECONDS = 10.0;

    static constexpr bool DEBUG_COPY_OPS = false;
    static constexpr bool PROGRESS_DEBUG_SIMPLE = false;

    // Test hooks, they make the io layer return short reads / writes at random to exercise the continuation paths
    extern bool DEBUG_FORCE_PARTIAL_READS;
    extern bool DEBUG_FORCE_PARTIAL_WRITES;
}
