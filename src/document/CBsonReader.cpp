/*-------------------------------------------------------------------------
 *
 * CBsonReader.cpp
 *      Structural walker over an encoded document.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonReader.hpp"

#include "CErrors.hpp"

namespace DocLink
{

namespace
{
/* i32 length + i32 string length + empty string + empty document */
constexpr int32_t MIN_CODE_WITH_SCOPE_SIZE = 4 + 4 + 1 + 5;
constexpr int32_t MIN_DOCUMENT_SIZE = 5;
constexpr uint8_t BINARY_SUBTYPE_OLD = 0x02;
} /* anonymous namespace */

CBsonReader::CBsonReader(CBsonCursor& cursor)
    : cursor_(cursor), documentEnds_(), currentType_(CBsonType::EndOfDocument)
{
}

/*
 * readStartDocument
 *		Read the length prefix and check that the whole document is present
 */
int32_t CBsonReader::readStartDocument()
{
    size_t start = cursor_.position();
    int32_t length = cursor_.readInt32();

    if (length < MIN_DOCUMENT_SIZE)
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "document length " + std::to_string(length) +
                                     " is too small");
    if (static_cast<size_t>(length) - 4 > cursor_.remaining())
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "document length " + std::to_string(length) +
                                     " exceeds the available bytes");

    size_t end = start + static_cast<size_t>(length);
    if (!documentEnds_.empty() && end > documentEnds_.back())
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "embedded document overruns its parent");

    documentEnds_.push_back(end);
    return length;
}

CBsonType CBsonReader::readBsonType()
{
    ensureInsideDocument(1);

    uint8_t tag = cursor_.readByte();
    if (!isValidBsonType(tag))
        throw CDocumentException(CDocLinkErrc::UnknownBsonType,
                                 "unknown element type " + std::to_string(tag));

    currentType_ = static_cast<CBsonType>(tag);
    return currentType_;
}

std::string CBsonReader::readName()
{
    return cursor_.readCString();
}

void CBsonReader::skipName()
{
    cursor_.skipCString();
}

/*
 * skipValue
 *		Step over one payload without decoding it
 */
void CBsonReader::skipValue(CBsonType type)
{
    switch (type)
    {
    case CBsonType::Double:
    case CBsonType::DateTime:
    case CBsonType::Int64:
    case CBsonType::Timestamp:
        cursor_.skip(8);
        break;
    case CBsonType::String:
    case CBsonType::JavaScript:
    case CBsonType::Symbol:
        cursor_.skip(static_cast<size_t>(readLength("string")));
        break;
    case CBsonType::Document:
    case CBsonType::Array:
    case CBsonType::JavaScriptWithScope:
    {
        int32_t length = readLength("document");
        if (length < 4)
            throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                     "embedded length " +
                                         std::to_string(length) +
                                         " is too small");
        cursor_.skip(static_cast<size_t>(length) - 4);
        break;
    }
    case CBsonType::Binary:
        cursor_.skip(static_cast<size_t>(readLength("binary")) + 1);
        break;
    case CBsonType::Undefined:
    case CBsonType::Null:
    case CBsonType::MinKey:
    case CBsonType::MaxKey:
        break;
    case CBsonType::ObjectId:
        cursor_.skip(CObjectId::SIZE);
        break;
    case CBsonType::Boolean:
        cursor_.skip(1);
        break;
    case CBsonType::RegularExpression:
        cursor_.skipCString();
        cursor_.skipCString();
        break;
    case CBsonType::DbPointer:
        cursor_.skip(static_cast<size_t>(readLength("string")));
        cursor_.skip(CObjectId::SIZE);
        break;
    case CBsonType::Int32:
        cursor_.skip(4);
        break;
    case CBsonType::Decimal128:
        cursor_.skip(16);
        break;
    case CBsonType::EndOfDocument:
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "no value follows the end of a document");
    }
}

/*
 * readEndDocument
 *		Called after readBsonType() returned EndOfDocument; the terminator
 *		must be the last byte of the declared length.
 */
void CBsonReader::readEndDocument()
{
    if (documentEnds_.empty())
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "no document is open");

    size_t end = documentEnds_.back();
    if (cursor_.position() != end)
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "document ends at " +
                                     std::to_string(cursor_.position()) +
                                     " but its length says " +
                                     std::to_string(end));
    documentEnds_.pop_back();
}

CBsonType CBsonReader::currentType() const noexcept
{
    return currentType_;
}

size_t CBsonReader::depth() const noexcept
{
    return documentEnds_.size();
}

double CBsonReader::readDouble()
{
    return cursor_.readDouble();
}

std::string CBsonReader::readString()
{
    return cursor_.readString();
}

CBsonBinary CBsonReader::readBinary()
{
    int32_t length = readLength("binary");
    CBsonBinary binary;

    binary.subtype = cursor_.readByte();
    binary.data = cursor_.readBytes(static_cast<size_t>(length));

    /* the old binary subtype repeats the length inside the payload */
    if (binary.subtype == BINARY_SUBTYPE_OLD && binary.data.size() >= 4)
    {
        uint32_t inner = static_cast<uint32_t>(binary.data[0]) |
                         static_cast<uint32_t>(binary.data[1]) << 8 |
                         static_cast<uint32_t>(binary.data[2]) << 16 |
                         static_cast<uint32_t>(binary.data[3]) << 24;
        if (inner == binary.data.size() - 4)
            binary.data.erase(binary.data.begin(), binary.data.begin() + 4);
    }
    return binary;
}

CObjectId CBsonReader::readObjectId()
{
    return cursor_.readObjectId();
}

bool CBsonReader::readBoolean()
{
    uint8_t value = cursor_.readByte();
    if (value > 1)
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "boolean byte must be 0 or 1, got " +
                                     std::to_string(value));
    return value == 1;
}

CBsonDateTime CBsonReader::readDateTime()
{
    return CBsonDateTime{cursor_.readInt64()};
}

CBsonRegex CBsonReader::readRegularExpression()
{
    CBsonRegex regex;
    regex.pattern = cursor_.readCString();
    regex.options = cursor_.readCString();
    return regex;
}

CBsonDbPointer CBsonReader::readDbPointer()
{
    CBsonDbPointer pointer;
    pointer.ns = cursor_.readString();
    pointer.id = cursor_.readObjectId();
    return pointer;
}

std::string CBsonReader::readJavaScript()
{
    return cursor_.readString();
}

std::string CBsonReader::readSymbol()
{
    return cursor_.readString();
}

int32_t CBsonReader::readInt32()
{
    return cursor_.readInt32();
}

CBsonTimestamp CBsonReader::readTimestamp()
{
    uint64_t raw = static_cast<uint64_t>(cursor_.readInt64());
    CBsonTimestamp timestamp;

    timestamp.increment = static_cast<uint32_t>(raw & 0xFFFFFFFFu);
    timestamp.time = static_cast<uint32_t>(raw >> 32);
    return timestamp;
}

int64_t CBsonReader::readInt64()
{
    return cursor_.readInt64();
}

CBsonDecimal128 CBsonReader::readDecimal128()
{
    CBsonDecimal128 decimal;
    decimal.low = static_cast<uint64_t>(cursor_.readInt64());
    decimal.high = static_cast<uint64_t>(cursor_.readInt64());
    return decimal;
}

std::string CBsonReader::readJavaScriptWithScopeCode()
{
    int32_t length = readLength("code with scope");
    if (length < MIN_CODE_WITH_SCOPE_SIZE)
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "code with scope length " +
                                     std::to_string(length) + " is too small");
    return cursor_.readString();
}

CBsonCursor& CBsonReader::cursor() noexcept
{
    return cursor_;
}

int32_t CBsonReader::readLength(const char* what)
{
    int32_t length = cursor_.readInt32();
    if (length < 0)
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 std::string("negative ") + what +
                                     " length " + std::to_string(length));
    return length;
}

void CBsonReader::ensureInsideDocument(size_t length) const
{
    if (!documentEnds_.empty() &&
        cursor_.position() + length > documentEnds_.back())
        throw CDocumentException(CDocLinkErrc::MalformedDocument,
                                 "element runs past the end of its document");
}

} /* namespace DocLink */
