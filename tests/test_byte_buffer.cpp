/*-------------------------------------------------------------------------
 *
 * test_byte_buffer.cpp
 *      Unit tests for byte buffers and the buffer pool.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CErrors.hpp"
#include "buffer/CBufferPool.hpp"
#include "buffer/CByteBuffer.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

namespace DocLink
{
namespace Test
{

TEST(ByteBufferTest, SplitSharesStorage)
{
    CByteBuffer buffer(std::vector<uint8_t>{1, 2, 3, 4, 5});

    CByteBuffer head = buffer.split(2);

    EXPECT_EQ(head.toVector(), (std::vector<uint8_t>{1, 2}));
    EXPECT_EQ(buffer.toVector(), (std::vector<uint8_t>{3, 4, 5}));
    EXPECT_EQ(buffer.referenceCount(), 2);
    EXPECT_THROW(buffer.split(4), CDocumentException);
}

TEST(ByteBufferTest, RetainAndReleaseTrackReferences)
{
    CByteBuffer buffer(std::vector<uint8_t>{9, 8, 7});
    CByteBuffer other = buffer.retain();

    EXPECT_EQ(buffer.referenceCount(), 2);
    other.release();
    EXPECT_TRUE(other.isReleased());
    EXPECT_EQ(other.size(), 0u);
    EXPECT_EQ(buffer.referenceCount(), 1);
    EXPECT_EQ(buffer.at(2), 7);
    EXPECT_THROW(buffer.at(3), CDocumentException);
}

TEST(ByteBufferTest, PoolRecyclesReleasedStorage)
{
    auto pool = CBufferPool::create();

    {
        CByteBuffer buffer = pool->getBuffer(100);
        EXPECT_TRUE(buffer.empty());
        EXPECT_GE(buffer.writableBytes(), 100u);

        const uint8_t bytes[] = {1, 2, 3};
        buffer.put(bytes, sizeof(bytes));
        EXPECT_EQ(buffer.size(), 3u);
        EXPECT_EQ(pool->getStats().outstandingBuffers, 1u);
    }

    EXPECT_EQ(pool->getStats().outstandingBuffers, 0u);
    EXPECT_EQ(pool->getStats().idleBuffers, 1u);

    CByteBuffer reused = pool->getBuffer(120);
    EXPECT_EQ(pool->getStats().pooledHits, 1u);
    EXPECT_EQ(pool->getStats().totalAllocations, 2u);

    pool->clear();
    EXPECT_EQ(pool->getStats().idleBuffers, 0u);
}

TEST(ByteBufferTest, CommitExtendsReadableWindow)
{
    auto pool = CBufferPool::create();
    CByteBuffer buffer = pool->getBuffer(64);

    buffer.writePointer()[0] = 0x42;
    buffer.commit(1);

    EXPECT_EQ(buffer.size(), 1u);
    EXPECT_EQ(buffer.at(0), 0x42);
    EXPECT_THROW(buffer.commit(buffer.writableBytes() + 1),
                 CDocumentException);
}

TEST(CompositeBufferTest, IndexesAcrossComponents)
{
    CCompositeBuffer composite;

    composite.addComponent(CByteBuffer(std::vector<uint8_t>{1, 2}));
    composite.addComponent(CByteBuffer(std::vector<uint8_t>{3}));
    composite.addComponent(CByteBuffer(std::vector<uint8_t>{4, 5, 6}));

    EXPECT_EQ(composite.size(), 6u);
    EXPECT_EQ(composite.componentCount(), 3u);
    EXPECT_EQ(composite.at(2), 3);
    EXPECT_EQ(composite.at(5), 6);
    EXPECT_THROW(composite.at(6), CDocumentException);

    CByteBuffer flat = composite.flatten();
    EXPECT_EQ(flat.toVector(), (std::vector<uint8_t>{1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(composite.size(), 0u);
}

TEST(CompositeBufferTest, ReleaseDropsComponents)
{
    CByteBuffer source(std::vector<uint8_t>{1, 2, 3});
    CCompositeBuffer composite;

    composite.addComponent(source.retain());
    EXPECT_EQ(source.referenceCount(), 2);

    composite.release();
    EXPECT_EQ(source.referenceCount(), 1);
    EXPECT_EQ(composite.componentCount(), 0u);
}

} /* namespace Test */
} /* namespace DocLink */
