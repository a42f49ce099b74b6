/*-------------------------------------------------------------------------
 *
 * test_object_id.cpp
 *      Unit tests for CObjectId.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CErrors.hpp"
#include "document/CObjectId.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <gtest/gtest.h>
#include <limits>
#include <unordered_set>

namespace DocLink
{
namespace Test
{

TEST(ObjectIdTest, FieldsLandInByteLayout)
{
    CObjectId objectId(0x5106FC9A, 0x00BC8237, static_cast<int16_t>(0x5581),
                       0x0036D289);
    CObjectId::Bytes expected = {0x51, 0x06, 0xFC, 0x9A, 0xBC, 0x82,
                                 0x37, 0x55, 0x81, 0x36, 0xD2, 0x89};

    EXPECT_EQ(objectId.toByteArray(), expected);
    EXPECT_EQ(objectId.toHexString(), "5106fc9abc8237558136d289");
}

TEST(ObjectIdTest, FieldsReadBackFromBytes)
{
    CObjectId::Bytes bytes = {0x51, 0x06, 0xFC, 0x9A, 0xBC, 0x82,
                              0x37, 0x55, 0x81, 0x36, 0xD2, 0x89};
    CObjectId objectId(bytes);

    EXPECT_EQ(objectId.getTimestamp(), 0x5106FC9A);
    EXPECT_EQ(objectId.getMachineIdentifier(), 0x00BC8237);
    EXPECT_EQ(objectId.getProcessIdentifier(), static_cast<int16_t>(0x5581));
    EXPECT_EQ(objectId.getCounter(), 0x0036D289);
}

TEST(ObjectIdTest, HexStringRoundTrip)
{
    CObjectId objectId("41d91c58988b09375cc1fe9f");

    EXPECT_EQ(objectId.toHexString(), "41d91c58988b09375cc1fe9f");
    EXPECT_EQ(CObjectId("41D91C58988B09375CC1FE9F"), objectId);
}

TEST(ObjectIdTest, MaximumFieldValues)
{
    CObjectId objectId(std::numeric_limits<int32_t>::max(),
                       std::numeric_limits<int16_t>::max(),
                       std::numeric_limits<int16_t>::max(),
                       std::numeric_limits<int16_t>::max());

    EXPECT_EQ(objectId.toHexString(), "7fffffff007fff7fff007fff");
    EXPECT_EQ(CObjectId(0, 0, 0, 0).toHexString(), "000000000000000000000000");
}

TEST(ObjectIdTest, RejectsInvalidHex)
{
    EXPECT_FALSE(CObjectId::isValid(""));
    EXPECT_FALSE(CObjectId::isValid("41d91c58988b09375cc1fe9"));
    EXPECT_FALSE(CObjectId::isValid("41d91c58988b09375cc1fe9g"));
    EXPECT_TRUE(CObjectId::isValid("41d91c58988b09375cc1fe9f"));

    try
    {
        CObjectId objectId("not an object id");
        FAIL() << "expected InvalidObjectId, got " << objectId.toHexString();
    }
    catch (const CDocumentException& e)
    {
        EXPECT_EQ(e.code(), make_error_code(CDocLinkErrc::InvalidObjectId));
    }
}

TEST(ObjectIdTest, RejectsOversizedMachineAndCounter)
{
    EXPECT_THROW(CObjectId(0, 0x01000000, 0, 0), CDocumentException);
    EXPECT_THROW(CObjectId(0, 0, 0, 0x01000000), CDocumentException);
    EXPECT_EQ(CObjectId(0, 0x00ffffff, 0, 0).getMachineIdentifier(),
              0x00ffffff);
}

TEST(ObjectIdTest, OrderingFollowsFieldSignificance)
{
    CObjectId zero(0, 0, 0, 0);

    EXPECT_LT(zero, CObjectId(1, 0, 0, 0));
    EXPECT_LT(zero, CObjectId(0, 1, 0, 0));
    EXPECT_LT(zero, CObjectId(0, 0, 1, 0));
    EXPECT_LT(zero, CObjectId(0, 0, 0, 1));
    EXPECT_LT(CObjectId(0, 0x00ffffff, 0, 0), CObjectId(1, 0, 0, 0));
    EXPECT_EQ(zero, CObjectId(0, 0, 0, 0));
}

TEST(ObjectIdTest, GeneratedIdsAreDistinctAndCurrent)
{
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    CObjectId first = CObjectId::generate();
    CObjectId second = CObjectId::generate();

    EXPECT_NE(first, second);
    EXPECT_EQ(first.getMachineIdentifier(), second.getMachineIdentifier());
    EXPECT_EQ(first.getProcessIdentifier(), second.getProcessIdentifier());
    EXPECT_EQ(second.getCounter(), (first.getCounter() + 1) & 0x00ffffff);
    EXPECT_LE(std::abs(first.getTimestamp() - now), 3);
}

TEST(ObjectIdTest, HashMatchesEquality)
{
    std::unordered_set<size_t> hashes;
    CObjectId objectId("41d91c58988b09375cc1fe9f");

    EXPECT_EQ(objectId.hash(), CObjectId(objectId.toByteArray()).hash());
    for (int i = 0; i < 100; i++)
        hashes.insert(CObjectId::generate().hash());
    EXPECT_GT(hashes.size(), 90u);
}

} /* namespace Test */
} /* namespace DocLink */
