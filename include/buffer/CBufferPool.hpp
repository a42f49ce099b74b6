/*-------------------------------------------------------------------------
 *
 * CBufferPool.hpp
 *      Pooled allocator for network byte buffers.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "buffer/CByteBuffer.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace DocLink
{

struct CBufferPoolStats
{
    size_t totalAllocations;
    size_t pooledHits;
    size_t outstandingBuffers;
    size_t idleBuffers;

    CBufferPoolStats()
        : totalAllocations(0), pooledHits(0), outstandingBuffers(0),
          idleBuffers(0)
    {
    }
};

/**
 * Hands out buffers rounded up to power-of-two size classes and keeps a
 * bounded free list per class. Must be owned by a shared_ptr so released
 * storage can find its way back.
 */
class CBufferPool : public std::enable_shared_from_this<CBufferPool>
{
  public:
    static constexpr size_t MIN_BUFFER_SIZE = 64;
    static constexpr size_t MAX_POOLED_SIZE = 16 * 1024 * 1024;
    static constexpr size_t MAX_IDLE_PER_CLASS = 32;

    static std::shared_ptr<CBufferPool> create();
    ~CBufferPool() = default;

    CByteBuffer getBuffer(size_t size);
    CBufferPoolStats getStats() const;
    void clear();

  private:
    CBufferPool() = default;
    friend struct CBufferStorage;
    void recycle(std::vector<uint8_t>&& bytes);
    static size_t sizeClass(size_t size, size_t& roundedSize);

    static constexpr size_t CLASS_COUNT = 19; /* 64 bytes .. 16 MiB */

    mutable std::mutex poolMutex_;
    std::array<std::vector<std::vector<uint8_t>>, CLASS_COUNT> freeLists_;
    std::atomic<size_t> totalAllocations_{0};
    std::atomic<size_t> pooledHits_{0};
    std::atomic<size_t> outstanding_{0};
};

} /* namespace DocLink */
