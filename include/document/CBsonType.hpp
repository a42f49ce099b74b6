/*-------------------------------------------------------------------------
 *
 * CBsonType.hpp
 *      Wire-type tags of the binary document format.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <string>

namespace DocLink
{

/**
 * Element type tags, matching the standard BSON type codes exactly
 */
enum class CBsonType : uint8_t
{
    EndOfDocument = 0x00,
    Double = 0x01,
    String = 0x02,
    Document = 0x03,
    Array = 0x04,
    Binary = 0x05,
    Undefined = 0x06, /* deprecated */
    ObjectId = 0x07,
    Boolean = 0x08,
    DateTime = 0x09, /* UTC milliseconds since the epoch */
    Null = 0x0A,
    RegularExpression = 0x0B,
    DbPointer = 0x0C, /* deprecated */
    JavaScript = 0x0D,
    Symbol = 0x0E, /* deprecated */
    JavaScriptWithScope = 0x0F,
    Int32 = 0x10,
    Timestamp = 0x11,
    Int64 = 0x12,
    Decimal128 = 0x13,
    MinKey = 0xFF,
    MaxKey = 0x7F
};

/* True for every tag a document element may carry */
bool isValidBsonType(uint8_t tag) noexcept;

std::string typeName(CBsonType type);

} /* namespace DocLink */
