/*-------------------------------------------------------------------------
 *
 * CBsonReader.hpp
 *      Structural walker over an encoded document.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonCursor.hpp"
#include "document/CBsonType.hpp"
#include "document/CBsonValue.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace DocLink
{

/**
 * Walks documents element by element on top of a cursor it borrows.
 *
 *     reader.readStartDocument();
 *     while ((type = reader.readBsonType()) != CBsonType::EndOfDocument)
 *     {
 *         name = reader.readName();
 *         ... read or skip the value ...
 *     }
 *     reader.readEndDocument();
 *
 * Structural problems throw CDocumentException with MalformedDocument.
 */
class CBsonReader
{
  public:
    explicit CBsonReader(CBsonCursor& cursor);

    /* Returns the declared total length of the document */
    int32_t readStartDocument();
    CBsonType readBsonType();
    std::string readName();
    void skipName();
    void skipValue(CBsonType type);
    void readEndDocument();

    CBsonType currentType() const noexcept;
    size_t depth() const noexcept;

    /* Leaf values; each expects the cursor at the start of the payload */
    double readDouble();
    std::string readString();
    CBsonBinary readBinary();
    CObjectId readObjectId();
    bool readBoolean();
    CBsonDateTime readDateTime();
    CBsonRegex readRegularExpression();
    CBsonDbPointer readDbPointer();
    std::string readJavaScript();
    std::string readSymbol();
    int32_t readInt32();
    CBsonTimestamp readTimestamp();
    int64_t readInt64();
    CBsonDecimal128 readDecimal128();

    /* Reads the total length and code; the scope document follows */
    std::string readJavaScriptWithScopeCode();

    CBsonCursor& cursor() noexcept;

  private:
    int32_t readLength(const char* what);
    void ensureInsideDocument(size_t length) const;

    CBsonCursor& cursor_;
    std::vector<size_t> documentEnds_;
    CBsonType currentType_;
};

} /* namespace DocLink */
