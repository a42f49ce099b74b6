/*-------------------------------------------------------------------------
 *
 * CByteBuffer.hpp
 *      Owned byte regions with shared, pooled backing storage.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace DocLink
{

class CBufferPool;

/**
 * Backing storage shared by every CByteBuffer sliced from it. When the last
 * handle lets go, the bytes are handed back to the pool they came from.
 */
struct CBufferStorage
{
    std::vector<uint8_t> bytes;
    std::weak_ptr<CBufferPool> pool;

    CBufferStorage() = default;
    explicit CBufferStorage(std::vector<uint8_t> data) : bytes(std::move(data))
    {
    }
    ~CBufferStorage();

    CBufferStorage(const CBufferStorage&) = delete;
    CBufferStorage& operator=(const CBufferStorage&) = delete;
};

/**
 * A readable window [begin, end) over shared storage, with room to append
 * up to the storage size. Handles are move-only; an extra reference must be
 * taken explicitly with retain(), and dropped with release() or destruction.
 */
class CByteBuffer
{
  public:
    CByteBuffer() noexcept;
    explicit CByteBuffer(std::vector<uint8_t> bytes);
    explicit CByteBuffer(std::shared_ptr<CBufferStorage> storage);
    ~CByteBuffer() = default;

    CByteBuffer(CByteBuffer&& other) noexcept;
    CByteBuffer& operator=(CByteBuffer&& other) noexcept;
    CByteBuffer(const CByteBuffer&) = delete;
    CByteBuffer& operator=(const CByteBuffer&) = delete;

    /* Readable bytes */
    size_t size() const noexcept;
    bool empty() const noexcept;
    const uint8_t* data() const noexcept;
    uint8_t at(size_t index) const;

    /* Bytes that can still be appended after the readable window */
    size_t writableBytes() const noexcept;
    size_t capacity() const noexcept;
    uint8_t* writePointer() noexcept;
    void put(const void* bytes, size_t length);
    void commit(size_t length);

    /* Detach the first length readable bytes; this keeps the remainder */
    CByteBuffer split(size_t length);
    /* Drop the first length readable bytes */
    void consume(size_t length);

    CByteBuffer retain() const;
    void release() noexcept;
    bool isReleased() const noexcept;
    long referenceCount() const noexcept;

    std::vector<uint8_t> toVector() const;

  private:
    std::shared_ptr<CBufferStorage> storage_;
    size_t begin_;
    size_t end_;
};

/**
 * An ordered sequence of byte regions forming one logical read.
 */
class CCompositeBuffer
{
  public:
    CCompositeBuffer() = default;
    CCompositeBuffer(CCompositeBuffer&&) noexcept = default;
    CCompositeBuffer& operator=(CCompositeBuffer&&) noexcept = default;
    CCompositeBuffer(const CCompositeBuffer&) = delete;
    CCompositeBuffer& operator=(const CCompositeBuffer&) = delete;

    void addComponent(CByteBuffer&& component);
    size_t size() const noexcept;
    size_t componentCount() const noexcept;
    const CByteBuffer& component(size_t index) const;
    uint8_t at(size_t index) const;

    std::vector<uint8_t> toVector() const;
    /* Single contiguous region; no copy when there is only one component */
    CByteBuffer flatten();
    void release() noexcept;

  private:
    std::vector<CByteBuffer> components_;
    size_t size_ = 0;
};

} /* namespace DocLink */
