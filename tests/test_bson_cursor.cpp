/*-------------------------------------------------------------------------
 *
 * test_bson_cursor.cpp
 *      Unit tests for the binary cursor.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CErrors.hpp"
#include "document/CBsonCursor.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <limits>
#include <system_error>
#include <vector>

namespace DocLink
{
namespace Test
{

namespace
{
template <typename Operation> std::error_code errorOf(Operation&& operation)
{
    try
    {
        operation();
    }
    catch (const CDocumentException& e)
    {
        return e.code();
    }
    return std::error_code();
}

CBsonCursor cursorOver(std::vector<uint8_t> bytes)
{
    return CBsonCursor(CByteBuffer(std::move(bytes)));
}
} /* anonymous namespace */

TEST(BsonCursorTest, ReadsLittleEndianIntegers)
{
    CBsonCursor cursor = cursorOver({0x01, 0x02, 0x03, 0x04, 0xFF, 0xFF, 0xFF,
                                     0xFF, 0xFF, 0xFF, 0xFF, 0x7F});

    EXPECT_EQ(cursor.readInt32(), 0x04030201);
    EXPECT_EQ(cursor.readInt64(), std::numeric_limits<int64_t>::max());
    EXPECT_FALSE(cursor.hasRemaining());
}

TEST(BsonCursorTest, ReadsNegativeInt32)
{
    CBsonCursor cursor = cursorOver({0xFE, 0xFF, 0xFF, 0xFF});

    EXPECT_EQ(cursor.readInt32(), -2);
}

TEST(BsonCursorTest, ReadsDouble)
{
    /* 1.5 == 0x3FF8000000000000 */
    CBsonCursor cursor =
        cursorOver({0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF8, 0x3F});

    EXPECT_DOUBLE_EQ(cursor.readDouble(), 1.5);
    EXPECT_EQ(cursor.position(), 8u);
}

TEST(BsonCursorTest, ReadsLengthPrefixedString)
{
    CBsonCursor cursor = cursorOver({0x03, 0x00, 0x00, 0x00, 'h', 'i', 0x00});

    EXPECT_EQ(cursor.readString(), "hi");
    EXPECT_EQ(cursor.position(), 7u);
    EXPECT_EQ(cursor.remaining(), 0u);
}

TEST(BsonCursorTest, StringMissingTerminatorIsMalformed)
{
    CBsonCursor cursor = cursorOver({0x03, 0x00, 0x00, 0x00, 'h', 'i', 'x'});

    EXPECT_EQ(errorOf([&] { cursor.readString(); }),
              make_error_code(CDocLinkErrc::MalformedString));
    EXPECT_EQ(cursor.position(), 0u);
}

TEST(BsonCursorTest, StringWithNonPositiveLengthIsMalformed)
{
    CBsonCursor cursor = cursorOver({0x00, 0x00, 0x00, 0x00, 0x00});

    EXPECT_EQ(errorOf([&] { cursor.readString(); }),
              make_error_code(CDocLinkErrc::MalformedString));
}

TEST(BsonCursorTest, StringLongerThanBufferIsOutOfBounds)
{
    CBsonCursor cursor = cursorOver({0x10, 0x00, 0x00, 0x00, 'a', 0x00});

    EXPECT_EQ(errorOf([&] { cursor.readString(); }),
              make_error_code(CDocLinkErrc::OutOfBounds));
    EXPECT_EQ(cursor.position(), 0u);
}

TEST(BsonCursorTest, ReadsConsecutiveCStrings)
{
    CBsonCursor cursor = cursorOver({'a', 'b', 0x00, 0x00, 'c', 0x00});

    EXPECT_EQ(cursor.readCString(), "ab");
    EXPECT_EQ(cursor.readCString(), "");
    EXPECT_EQ(cursor.readCString(), "c");
    EXPECT_FALSE(cursor.hasRemaining());
}

TEST(BsonCursorTest, UnterminatedCStringIsMalformed)
{
    CBsonCursor cursor = cursorOver({'a', 'b', 'c'});

    EXPECT_EQ(errorOf([&] { cursor.readCString(); }),
              make_error_code(CDocLinkErrc::MalformedCString));
    EXPECT_EQ(errorOf([&] { cursor.skipCString(); }),
              make_error_code(CDocLinkErrc::MalformedCString));
    EXPECT_EQ(cursor.position(), 0u);
}

TEST(BsonCursorTest, ReadingPastEndIsOutOfBounds)
{
    CBsonCursor cursor = cursorOver({0x01, 0x02});

    EXPECT_EQ(errorOf([&] { cursor.readInt32(); }),
              make_error_code(CDocLinkErrc::OutOfBounds));
    EXPECT_EQ(cursor.readByte(), 0x01);
    EXPECT_EQ(errorOf([&] { cursor.skip(2); }),
              make_error_code(CDocLinkErrc::OutOfBounds));
    EXPECT_EQ(cursor.readByte(), 0x02);
    EXPECT_EQ(errorOf([&] { cursor.readByte(); }),
              make_error_code(CDocLinkErrc::OutOfBounds));
}

TEST(BsonCursorTest, ReadsObjectId)
{
    std::vector<uint8_t> bytes = {0x51, 0x06, 0xFC, 0x9A, 0xBC, 0x82,
                                  0x37, 0x55, 0x81, 0x36, 0xD2, 0x89};
    CBsonCursor cursor = cursorOver(bytes);

    CObjectId objectId = cursor.readObjectId();
    EXPECT_EQ(objectId.toHexString(), "5106fc9abc8237558136d289");
    EXPECT_EQ(cursor.remaining(), 0u);
}

TEST(BsonCursorTest, ResetReturnsToMark)
{
    CBsonCursor cursor = cursorOver({0x01, 0x02, 0x03, 0x04});

    cursor.readByte();
    cursor.mark();
    EXPECT_EQ(cursor.readByte(), 0x02);
    EXPECT_EQ(cursor.readByte(), 0x03);
    cursor.reset();
    EXPECT_EQ(cursor.position(), 1u);
    EXPECT_EQ(cursor.readByte(), 0x02);
}

TEST(BsonCursorTest, MarkOverwritesEarlierMark)
{
    CBsonCursor cursor = cursorOver({0x01, 0x02, 0x03, 0x04});

    cursor.mark();
    cursor.skip(2);
    cursor.mark();
    cursor.skip(1);
    cursor.reset();
    EXPECT_EQ(cursor.position(), 2u);
}

TEST(BsonCursorTest, ResetWithoutMarkFails)
{
    CBsonCursor cursor = cursorOver({0x01});

    EXPECT_EQ(errorOf([&] { cursor.reset(); }),
              make_error_code(CDocLinkErrc::NoMarkSet));
}

TEST(BsonCursorTest, CloseReleasesBufferAndRejectsUse)
{
    CByteBuffer buffer(std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04});
    CBsonCursor cursor(buffer.retain());

    EXPECT_EQ(buffer.referenceCount(), 2);
    cursor.close();
    EXPECT_TRUE(cursor.isClosed());
    EXPECT_EQ(buffer.referenceCount(), 1);

    EXPECT_EQ(errorOf([&] { cursor.readByte(); }),
              make_error_code(CDocLinkErrc::ClosedCursorUse));
    EXPECT_EQ(errorOf([&] { cursor.position(); }),
              make_error_code(CDocLinkErrc::ClosedCursorUse));
    EXPECT_EQ(errorOf([&] { cursor.mark(); }),
              make_error_code(CDocLinkErrc::ClosedCursorUse));
    EXPECT_EQ(errorOf([&] { cursor.readCString(); }),
              make_error_code(CDocLinkErrc::ClosedCursorUse));
}

} /* namespace Test */
} /* namespace DocLink */
