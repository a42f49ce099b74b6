/*-------------------------------------------------------------------------
 *
 * CBsonBuilder.hpp
 *      Builds encoded documents with libbson.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonValue.hpp"
#include "document/CObjectId.hpp"

#include <bson/bson.h>
#include <cstdint>
#include <string>
#include <vector>

namespace DocLink
{

class CBsonBuilder
{
  public:
    CBsonBuilder();
    ~CBsonBuilder();

    CBsonBuilder(const CBsonBuilder&) = delete;
    CBsonBuilder& operator=(const CBsonBuilder&) = delete;

    /* Nested scopes; values added until the matching end go inside */
    bool beginDocument(const std::string& key);
    bool endDocument();
    bool beginArray(const std::string& key);
    bool endArray();

    /* Key for the next element of the innermost open array */
    std::string nextArrayKey();

    bool addString(const std::string& key, const std::string& value);
    bool addInt32(const std::string& key, int32_t value);
    bool addInt64(const std::string& key, int64_t value);
    bool addDouble(const std::string& key, double value);
    bool addBool(const std::string& key, bool value);
    bool addNull(const std::string& key);
    bool addUndefined(const std::string& key);
    bool addObjectId(const std::string& key, const CObjectId& objectId);
    bool addDateTime(const std::string& key, int64_t millis);
    bool addTimestamp(const std::string& key, uint32_t time, uint32_t increment);
    bool addRegex(const std::string& key, const std::string& pattern,
                  const std::string& options = "");
    bool addJavaScript(const std::string& key, const std::string& code);
    bool addJavaScriptWithScope(const std::string& key, const std::string& code,
                                const CBsonBuilder& scope);
    bool addSymbol(const std::string& key, const std::string& symbol);
    bool addDbPointer(const std::string& key, const std::string& collection,
                      const CObjectId& objectId);
    bool addDecimal128(const std::string& key, const std::string& decimal);
    bool addDecimal128(const std::string& key, const CBsonDecimal128& decimal);
    bool addMinKey(const std::string& key);
    bool addMaxKey(const std::string& key);
    bool addBinary(const std::string& key, uint8_t subtype, const uint8_t* data,
                   size_t size);
    bool addDocument(const std::string& key, const CBsonBuilder& subdoc);

    /* Encoded bytes of the root document; empty while a scope is open */
    std::vector<uint8_t> getDocument() const;

    bool isValidBson(const uint8_t* data, size_t size) const;
    std::string toJson() const;

    size_t getDocumentSize() const;
    void clear();
    bool isEmpty() const;

    std::string getLastError() const;
    void clearErrors();
    bool hasErrors() const;

  private:
    struct Frame
    {
        bson_t* doc;
        std::string key;
        bool isArray;
        size_t nextIndex;
    };

    bson_t* current() const;
    bool endFrame(bool isArray);
    void destroyFrames() noexcept;
    bool checkBsonHandle() const;
    void setError(const std::string& error) const;

    bson_t* bsonDoc_;
    std::vector<Frame> frames_;

    mutable std::string lastError_;
    mutable bool hasErrors_;
};

} /* namespace DocLink */
