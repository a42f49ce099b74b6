/*-------------------------------------------------------------------------
 *
 * CBufferPool.cpp
 *      Pooled allocator for network byte buffers.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "buffer/CBufferPool.hpp"

namespace DocLink
{

std::shared_ptr<CBufferPool> CBufferPool::create()
{
    return std::shared_ptr<CBufferPool>(new CBufferPool());
}

/*
 * sizeClass
 *		Index of the power-of-two class holding size, and the class size.
 *		Returns CLASS_COUNT for sizes beyond the largest pooled class.
 */
size_t CBufferPool::sizeClass(size_t size, size_t& roundedSize)
{
    size_t index = 0;
    size_t classSize = MIN_BUFFER_SIZE;

    while (classSize < size && index < CLASS_COUNT)
    {
        classSize <<= 1;
        index++;
    }
    roundedSize = index < CLASS_COUNT ? classSize : size;
    return index;
}

/*
 * getBuffer
 *		Obtain an empty buffer that can hold at least size bytes
 */
CByteBuffer CBufferPool::getBuffer(size_t size)
{
    size_t roundedSize = 0;
    size_t index = sizeClass(size, roundedSize);
    auto storage = std::make_shared<CBufferStorage>();

    if (index < CLASS_COUNT)
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        auto& freeList = freeLists_[index];
        if (!freeList.empty())
        {
            storage->bytes = std::move(freeList.back());
            freeList.pop_back();
            pooledHits_++;
        }
    }
    if (storage->bytes.size() != roundedSize)
        storage->bytes.resize(roundedSize);

    storage->pool = weak_from_this();
    totalAllocations_++;
    outstanding_++;
    return CByteBuffer(std::move(storage));
}

/*
 * recycle
 *		Return released storage to its free list, dropping it when the list
 *		for its class is full or the size is not pooled.
 */
void CBufferPool::recycle(std::vector<uint8_t>&& bytes)
{
    size_t roundedSize = 0;
    size_t index = sizeClass(bytes.size(), roundedSize);

    outstanding_--;
    if (index >= CLASS_COUNT || roundedSize != bytes.size())
        return;

    std::lock_guard<std::mutex> lock(poolMutex_);
    auto& freeList = freeLists_[index];
    if (freeList.size() < MAX_IDLE_PER_CLASS)
        freeList.push_back(std::move(bytes));
}

CBufferPoolStats CBufferPool::getStats() const
{
    CBufferPoolStats stats;

    stats.totalAllocations = totalAllocations_.load();
    stats.pooledHits = pooledHits_.load();
    stats.outstandingBuffers = outstanding_.load();

    std::lock_guard<std::mutex> lock(poolMutex_);
    for (const auto& freeList : freeLists_)
        stats.idleBuffers += freeList.size();
    return stats;
}

void CBufferPool::clear()
{
    std::lock_guard<std::mutex> lock(poolMutex_);
    for (auto& freeList : freeLists_)
        freeList.clear();
}

} /* namespace DocLink */
