/*-------------------------------------------------------------------------
 *
 * CBsonType.cpp
 *      Wire-type tags of the binary document format.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonType.hpp"

namespace DocLink
{

bool isValidBsonType(uint8_t tag) noexcept
{
    return (tag >= 0x01 && tag <= 0x13) || tag == 0x7F || tag == 0xFF;
}

std::string typeName(CBsonType type)
{
    switch (type)
    {
    case CBsonType::EndOfDocument:
        return "endOfDocument";
    case CBsonType::Double:
        return "double";
    case CBsonType::String:
        return "string";
    case CBsonType::Document:
        return "document";
    case CBsonType::Array:
        return "array";
    case CBsonType::Binary:
        return "binary";
    case CBsonType::Undefined:
        return "undefined";
    case CBsonType::ObjectId:
        return "objectId";
    case CBsonType::Boolean:
        return "boolean";
    case CBsonType::DateTime:
        return "dateTime";
    case CBsonType::Null:
        return "null";
    case CBsonType::RegularExpression:
        return "regex";
    case CBsonType::DbPointer:
        return "dbPointer";
    case CBsonType::JavaScript:
        return "javascript";
    case CBsonType::Symbol:
        return "symbol";
    case CBsonType::JavaScriptWithScope:
        return "javascriptWithScope";
    case CBsonType::Int32:
        return "int32";
    case CBsonType::Timestamp:
        return "timestamp";
    case CBsonType::Int64:
        return "int64";
    case CBsonType::Decimal128:
        return "decimal128";
    case CBsonType::MinKey:
        return "minKey";
    case CBsonType::MaxKey:
        return "maxKey";
    }
    return "unknown(" + std::to_string(static_cast<int>(type)) + ")";
}

} /* namespace DocLink */
