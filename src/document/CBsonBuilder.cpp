/*-------------------------------------------------------------------------
 *
 * CBsonBuilder.cpp
 *      Builds encoded documents with libbson.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonBuilder.hpp"

namespace DocLink
{

namespace
{
bson_oid_t toOid(const CObjectId& objectId)
{
    bson_oid_t oid;
    bson_oid_init_from_data(&oid, objectId.toByteArray().data());
    return oid;
}
} /* anonymous namespace */

CBsonBuilder::CBsonBuilder()
    : bsonDoc_(nullptr), frames_(), lastError_(), hasErrors_(false)
{
    bsonDoc_ = bson_new();
    if (!bsonDoc_)
    {
        setError("Failed to create BSON document");
    }
}

CBsonBuilder::~CBsonBuilder()
{
    destroyFrames();
    if (bsonDoc_)
        bson_destroy(bsonDoc_);
}

bool CBsonBuilder::beginDocument(const std::string& key)
{
    if (!checkBsonHandle())
        return false;

    bson_t* child = bson_new();
    if (!child)
    {
        setError("Failed to create embedded document");
        return false;
    }
    frames_.push_back(Frame{child, key, false, 0});
    return true;
}

bool CBsonBuilder::endDocument()
{
    return endFrame(false);
}

bool CBsonBuilder::beginArray(const std::string& key)
{
    if (!checkBsonHandle())
        return false;

    bson_t* child = bson_new();
    if (!child)
    {
        setError("Failed to create BSON array");
        return false;
    }
    frames_.push_back(Frame{child, key, true, 0});
    return true;
}

bool CBsonBuilder::endArray()
{
    return endFrame(true);
}

std::string CBsonBuilder::nextArrayKey()
{
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it)
    {
        if (it->isArray)
            return std::to_string(it->nextIndex++);
    }
    setError("nextArrayKey called outside an array");
    return std::string();
}

bool CBsonBuilder::addString(const std::string& key, const std::string& value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_utf8(current(), key.c_str(), -1, value.c_str(),
                          static_cast<int>(value.size())))
    {
        setError("Failed to add string");
        return false;
    }
    return true;
}

bool CBsonBuilder::addInt32(const std::string& key, int32_t value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_int32(current(), key.c_str(), -1, value))
    {
        setError("Failed to add int32");
        return false;
    }
    return true;
}

bool CBsonBuilder::addInt64(const std::string& key, int64_t value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_int64(current(), key.c_str(), -1, value))
    {
        setError("Failed to add int64");
        return false;
    }
    return true;
}

bool CBsonBuilder::addDouble(const std::string& key, double value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_double(current(), key.c_str(), -1, value))
    {
        setError("Failed to add double");
        return false;
    }
    return true;
}

bool CBsonBuilder::addBool(const std::string& key, bool value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_bool(current(), key.c_str(), -1, value))
    {
        setError("Failed to add bool");
        return false;
    }
    return true;
}

bool CBsonBuilder::addNull(const std::string& key)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_null(current(), key.c_str(), -1))
    {
        setError("Failed to add null");
        return false;
    }
    return true;
}

bool CBsonBuilder::addUndefined(const std::string& key)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_undefined(current(), key.c_str(), -1))
    {
        setError("Failed to add undefined");
        return false;
    }
    return true;
}

bool CBsonBuilder::addObjectId(const std::string& key, const CObjectId& objectId)
{
    if (!checkBsonHandle())
        return false;

    bson_oid_t oid = toOid(objectId);
    if (!bson_append_oid(current(), key.c_str(), -1, &oid))
    {
        setError("Failed to add ObjectId");
        return false;
    }
    return true;
}

bool CBsonBuilder::addDateTime(const std::string& key, int64_t millis)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_date_time(current(), key.c_str(), -1, millis))
    {
        setError("Failed to add datetime");
        return false;
    }
    return true;
}

bool CBsonBuilder::addTimestamp(const std::string& key, uint32_t time,
                                uint32_t increment)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_timestamp(current(), key.c_str(), -1, time, increment))
    {
        setError("Failed to add timestamp");
        return false;
    }
    return true;
}

bool CBsonBuilder::addRegex(const std::string& key, const std::string& pattern,
                            const std::string& options)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_regex(current(), key.c_str(), -1, pattern.c_str(),
                           options.c_str()))
    {
        setError("Failed to add regex");
        return false;
    }
    return true;
}

bool CBsonBuilder::addJavaScript(const std::string& key,
                                 const std::string& code)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_code(current(), key.c_str(), -1, code.c_str()))
    {
        setError("Failed to add JavaScript code");
        return false;
    }
    return true;
}

bool CBsonBuilder::addJavaScriptWithScope(const std::string& key,
                                          const std::string& code,
                                          const CBsonBuilder& scope)
{
    if (!checkBsonHandle())
        return false;
    if (!scope.bsonDoc_ || !scope.frames_.empty())
    {
        setError("Invalid scope document");
        return false;
    }

    if (!bson_append_code_with_scope(current(), key.c_str(), -1, code.c_str(),
                                     scope.bsonDoc_))
    {
        setError("Failed to add JavaScript code with scope");
        return false;
    }
    return true;
}

bool CBsonBuilder::addSymbol(const std::string& key, const std::string& symbol)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_symbol(current(), key.c_str(), -1, symbol.c_str(),
                            static_cast<int>(symbol.size())))
    {
        setError("Failed to add symbol");
        return false;
    }
    return true;
}

bool CBsonBuilder::addDbPointer(const std::string& key,
                                const std::string& collection,
                                const CObjectId& objectId)
{
    if (!checkBsonHandle())
        return false;

    bson_oid_t oid = toOid(objectId);
    if (!bson_append_dbpointer(current(), key.c_str(), -1, collection.c_str(),
                               &oid))
    {
        setError("Failed to add DB pointer");
        return false;
    }
    return true;
}

bool CBsonBuilder::addDecimal128(const std::string& key,
                                 const std::string& decimal)
{
    if (!checkBsonHandle())
        return false;

    bson_decimal128_t value;
    if (!bson_decimal128_from_string(decimal.c_str(), &value))
    {
        setError("Invalid decimal128 string: " + decimal);
        return false;
    }
    if (!bson_append_decimal128(current(), key.c_str(), -1, &value))
    {
        setError("Failed to add decimal128");
        return false;
    }
    return true;
}

bool CBsonBuilder::addDecimal128(const std::string& key,
                                 const CBsonDecimal128& decimal)
{
    if (!checkBsonHandle())
        return false;

    bson_decimal128_t value;
    value.low = decimal.low;
    value.high = decimal.high;
    if (!bson_append_decimal128(current(), key.c_str(), -1, &value))
    {
        setError("Failed to add decimal128");
        return false;
    }
    return true;
}

bool CBsonBuilder::addMinKey(const std::string& key)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_minkey(current(), key.c_str(), -1))
    {
        setError("Failed to add MinKey");
        return false;
    }
    return true;
}

bool CBsonBuilder::addMaxKey(const std::string& key)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_maxkey(current(), key.c_str(), -1))
    {
        setError("Failed to add MaxKey");
        return false;
    }
    return true;
}

bool CBsonBuilder::addBinary(const std::string& key, uint8_t subtype,
                             const uint8_t* data, size_t size)
{
    if (!checkBsonHandle())
        return false;
    if (!data && size != 0)
    {
        setError("Binary data is null with nonzero size");
        return false;
    }

    if (!bson_append_binary(current(), key.c_str(), -1,
                            static_cast<bson_subtype_t>(subtype), data,
                            static_cast<uint32_t>(size)))
    {
        setError("Failed to add binary");
        return false;
    }
    return true;
}

bool CBsonBuilder::addDocument(const std::string& key,
                               const CBsonBuilder& subdoc)
{
    if (!checkBsonHandle())
        return false;
    if (!subdoc.bsonDoc_ || !subdoc.frames_.empty())
    {
        setError("Invalid subdocument");
        return false;
    }

    if (!bson_append_document(current(), key.c_str(), -1, subdoc.bsonDoc_))
    {
        setError("Failed to add subdocument");
        return false;
    }
    return true;
}

std::vector<uint8_t> CBsonBuilder::getDocument() const
{
    if (!checkBsonHandle())
        return std::vector<uint8_t>();
    if (!frames_.empty())
    {
        setError("getDocument called with an open document or array");
        return std::vector<uint8_t>();
    }

    const uint8_t* data = bson_get_data(bsonDoc_);
    return std::vector<uint8_t>(data, data + bsonDoc_->len);
}

bool CBsonBuilder::isValidBson(const uint8_t* data, size_t size) const
{
    if (!data || size == 0)
        return false;

    bson_t* temp = bson_new_from_data(data, size);
    if (!temp)
        return false;

    bool ok = bson_validate(temp, BSON_VALIDATE_NONE, nullptr);
    bson_destroy(temp);
    return ok;
}

std::string CBsonBuilder::toJson() const
{
    if (!checkBsonHandle())
        return std::string();

    size_t len = 0;
    char* json = bson_as_relaxed_extended_json(bsonDoc_, &len);
    if (!json)
    {
        setError("Failed to convert to relaxed JSON");
        return std::string();
    }
    std::string s(json, len);
    bson_free(json);
    return s;
}

size_t CBsonBuilder::getDocumentSize() const
{
    if (!checkBsonHandle())
        return 0;
    return bsonDoc_->len;
}

void CBsonBuilder::clear()
{
    destroyFrames();
    if (bsonDoc_)
        bson_destroy(bsonDoc_);

    bsonDoc_ = bson_new();
    clearErrors();
}

bool CBsonBuilder::isEmpty() const
{
    if (!checkBsonHandle())
        return true;

    /* Empty document is 5 bytes */
    return bsonDoc_->len == 5;
}

std::string CBsonBuilder::getLastError() const
{
    return lastError_;
}

void CBsonBuilder::clearErrors()
{
    lastError_.clear();
    hasErrors_ = false;
}

bool CBsonBuilder::hasErrors() const
{
    return hasErrors_;
}

bson_t* CBsonBuilder::current() const
{
    return frames_.empty() ? bsonDoc_ : frames_.back().doc;
}

/*
 * endFrame
 *		Close the innermost scope and append it to its parent
 */
bool CBsonBuilder::endFrame(bool isArray)
{
    if (!checkBsonHandle())
        return false;
    if (frames_.empty() || frames_.back().isArray != isArray)
    {
        setError(isArray ? "endArray called without beginArray"
                         : "endDocument called without beginDocument");
        return false;
    }

    Frame frame = frames_.back();
    frames_.pop_back();

    bool ok = isArray ? bson_append_array(current(), frame.key.c_str(), -1,
                                          frame.doc)
                      : bson_append_document(current(), frame.key.c_str(), -1,
                                             frame.doc);
    bson_destroy(frame.doc);
    if (!ok)
    {
        setError(isArray ? "Failed to append array to document"
                         : "Failed to append embedded document");
        return false;
    }
    return true;
}

void CBsonBuilder::destroyFrames() noexcept
{
    for (auto& frame : frames_)
        bson_destroy(frame.doc);
    frames_.clear();
}

void CBsonBuilder::setError(const std::string& error) const
{
    lastError_ = error;
    hasErrors_ = true;
}

bool CBsonBuilder::checkBsonHandle() const
{
    return bsonDoc_ != nullptr && !hasErrors_;
}

} /* namespace DocLink */
