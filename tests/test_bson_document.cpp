/*-------------------------------------------------------------------------
 *
 * test_bson_document.cpp
 *      Unit tests for the mutable document and value model.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonDocument.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace DocLink
{
namespace Test
{

TEST(BsonDocumentTest, KeepsInsertionOrder)
{
    CBsonDocument document;

    document.append("z", CBsonValue(1)).append("a", CBsonValue(2));
    document.put("m", CBsonValue(3));

    EXPECT_EQ(document.keySet(), (std::vector<std::string>{"z", "a", "m"}));
    EXPECT_EQ(document.size(), 3u);
}

TEST(BsonDocumentTest, PutReplacesInPlaceAndReturnsPrevious)
{
    CBsonDocument document{{"a", CBsonValue(1)}, {"b", CBsonValue(2)}};

    std::optional<CBsonValue> previous = document.put("a", CBsonValue("one"));
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(previous->asInt32(), 1);
    EXPECT_EQ(document.keySet(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(document.at("a").asString(), "one");

    EXPECT_FALSE(document.put("c", CBsonValue(true)).has_value());
}

TEST(BsonDocumentTest, RemoveAndClear)
{
    CBsonDocument document{{"a", CBsonValue(1)}, {"b", CBsonValue(2)}};

    EXPECT_FALSE(document.remove("missing").has_value());
    std::optional<CBsonValue> removed = document.remove("a");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->asInt32(), 1);
    EXPECT_FALSE(document.containsKey("a"));
    EXPECT_TRUE(document.containsValue(CBsonValue(2)));

    document.clear();
    EXPECT_TRUE(document.isEmpty());
}

TEST(BsonDocumentTest, PutAllMergesEntries)
{
    CBsonDocument target{{"a", CBsonValue(1)}};
    CBsonDocument source{{"b", CBsonValue(2)}, {"a", CBsonValue(3)}};

    target.putAll(source);

    EXPECT_EQ(target.keySet(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(target.at("a").asInt32(), 3);
}

TEST(BsonDocumentTest, LookupOfMissingKey)
{
    CBsonDocument document{{"x", CBsonValue(1)}};

    EXPECT_FALSE(document.get("y").has_value());
    EXPECT_THROW(document.at("y"), std::out_of_range);
}

TEST(BsonDocumentTest, EqualityIsOrderSensitiveAndDeep)
{
    CBsonDocument first{{"a", CBsonValue(1)},
                        {"sub", CBsonValue(CBsonDocument{{"k", CBsonValue("v")}})}};
    CBsonDocument second{{"a", CBsonValue(1)},
                         {"sub", CBsonValue(CBsonDocument{{"k", CBsonValue("v")}})}};
    CBsonDocument reordered{{"sub", CBsonValue(CBsonDocument{{"k", CBsonValue("v")}})},
                            {"a", CBsonValue(1)}};

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.hash(), second.hash());
    EXPECT_NE(first, reordered);
}

TEST(BsonDocumentTest, NumericTypesAreDistinct)
{
    EXPECT_NE(CBsonValue(1), CBsonValue(int64_t{1}));
    EXPECT_NE(CBsonValue(1), CBsonValue(1.0));
    EXPECT_EQ(CBsonValue(int64_t{7}), CBsonValue(int64_t{7}));
}

TEST(BsonValueTest, NaNAndSignedZeroHashConsistently)
{
    CBsonValue nan1(std::nan(""));
    CBsonValue nan2(-std::nan(""));

    EXPECT_EQ(nan1, nan2);
    EXPECT_EQ(nan1.hash(), nan2.hash());
    EXPECT_EQ(CBsonValue(0.0), CBsonValue(-0.0));
    EXPECT_EQ(CBsonValue(0.0).hash(), CBsonValue(-0.0).hash());
}

TEST(BsonValueTest, TypedAccessorRejectsWrongType)
{
    CBsonValue value("text");

    EXPECT_EQ(value.getType(), CBsonType::String);
    EXPECT_TRUE(value.isString());
    EXPECT_THROW(value.asInt32(), std::bad_variant_access);
}

TEST(BsonValueTest, ArraysCompareByContent)
{
    CBsonArray left{CBsonValue(1), CBsonValue("two")};
    CBsonArray right;
    right.add(CBsonValue(1));
    right.add(CBsonValue("two"));

    EXPECT_EQ(CBsonValue(left), CBsonValue(right));
    EXPECT_EQ(CBsonValue(left).hash(), CBsonValue(right).hash());
    EXPECT_EQ(left.at(1).asString(), "two");
}

TEST(BsonValueTest, UsableInHashedContainers)
{
    std::unordered_set<CBsonValue> seen;

    seen.insert(CBsonValue(1));
    seen.insert(CBsonValue(1));
    seen.insert(CBsonValue("1"));
    seen.insert(CBsonValue(CObjectId("41d91c58988b09375cc1fe9f")));

    EXPECT_EQ(seen.size(), 3u);
}

TEST(BsonDocumentTest, RendersRelaxedJson)
{
    CBsonDocument document{
        {"name", CBsonValue("a\"b")},
        {"n", CBsonValue(5)},
        {"id", CBsonValue(CObjectId("41d91c58988b09375cc1fe9f"))},
        {"list", CBsonValue(CBsonArray{CBsonValue(true), CBsonValue()})}};

    EXPECT_EQ(document.toJson(),
              "{\"name\": \"a\\\"b\", \"n\": 5, "
              "\"id\": {\"$oid\": \"41d91c58988b09375cc1fe9f\"}, "
              "\"list\": [true, null]}");
}

} /* namespace Test */
} /* namespace DocLink */
