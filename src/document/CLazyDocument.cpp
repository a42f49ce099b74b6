/*-------------------------------------------------------------------------
 *
 * CLazyDocument.cpp
 *      Immutable document backed by its encoded bytes.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CLazyDocument.hpp"

#include "document/CDocumentCodec.hpp"

namespace DocLink
{

CLazyDocument CLazyDocument::wrapBytes(
    std::vector<uint8_t> bytes,
    std::shared_ptr<const CDecoderRegistry> registry)
{
    return CLazyDocument(CByteBuffer(std::move(bytes)), std::move(registry));
}

CLazyDocument CLazyDocument::wrapBytes(
    CByteBuffer bytes, std::shared_ptr<const CDecoderRegistry> registry)
{
    return CLazyDocument(std::move(bytes), std::move(registry));
}

CLazyDocument::CLazyDocument(CByteBuffer bytes,
                             std::shared_ptr<const CDecoderRegistry> registry)
    : bytes_(std::move(bytes)), registry_(std::move(registry))
{
}

CLazyDocument::CLazyDocument(const CLazyDocument& other)
    : bytes_(other.bytes_.retain()), registry_(other.registry_)
{
}

CLazyDocument& CLazyDocument::operator=(const CLazyDocument& other)
{
    if (this != &other)
    {
        bytes_ = other.bytes_.retain();
        registry_ = other.registry_;
    }
    return *this;
}

size_t CLazyDocument::size() const
{
    CBsonCursor cursor(bytes_.retain());
    CBsonReader reader(cursor);
    CBsonType type;
    size_t count = 0;

    reader.readStartDocument();
    while ((type = reader.readBsonType()) != CBsonType::EndOfDocument)
    {
        reader.skipName();
        reader.skipValue(type);
        count++;
    }
    reader.readEndDocument();
    return count;
}

bool CLazyDocument::isEmpty() const
{
    CBsonCursor cursor(bytes_.retain());
    CBsonReader reader(cursor);

    reader.readStartDocument();
    return reader.readBsonType() == CBsonType::EndOfDocument;
}

bool CLazyDocument::containsKey(const std::string& key) const
{
    CBsonCursor cursor(bytes_.retain());
    CBsonReader reader(cursor);
    CBsonType type;

    reader.readStartDocument();
    while ((type = reader.readBsonType()) != CBsonType::EndOfDocument)
    {
        if (reader.readName() == key)
            return true;
        reader.skipValue(type);
    }
    reader.readEndDocument();
    return false;
}

bool CLazyDocument::containsValue(const CBsonValue& value) const
{
    CBsonCursor cursor(bytes_.retain());
    CBsonReader reader(cursor);
    CBsonType type;

    reader.readStartDocument();
    while ((type = reader.readBsonType()) != CBsonType::EndOfDocument)
    {
        reader.skipName();
        if (registry_->decode(type, reader) == value)
            return true;
    }
    reader.readEndDocument();
    return false;
}

/*
 * get
 *		Decode only the first element named key
 */
std::optional<CBsonValue> CLazyDocument::get(const std::string& key) const
{
    CBsonCursor cursor(bytes_.retain());
    CBsonReader reader(cursor);
    CBsonType type;

    reader.readStartDocument();
    while ((type = reader.readBsonType()) != CBsonType::EndOfDocument)
    {
        if (reader.readName() == key)
            return registry_->decode(type, reader);
        reader.skipValue(type);
    }
    reader.readEndDocument();
    return std::nullopt;
}

std::vector<CBsonDocument::Entry> CLazyDocument::entrySet() const
{
    return toDocument().entrySet();
}

std::vector<std::string> CLazyDocument::keySet() const
{
    return toDocument().keySet();
}

std::vector<CBsonValue> CLazyDocument::values() const
{
    return toDocument().values();
}

CBsonDocument CLazyDocument::toDocument() const
{
    return decodeAs(CDocumentDecoder(registry_));
}

std::vector<uint8_t> CLazyDocument::getBytes() const
{
    return bytes_.toVector();
}

CByteBuffer CLazyDocument::getByteBuffer() const
{
    return bytes_.retain();
}

std::optional<CBsonValue> CLazyDocument::put(const std::string&, CBsonValue)
{
    throw CDocumentException(CDocLinkErrc::UnsupportedMutation,
                             "lazy documents are immutable: put");
}

CLazyDocument& CLazyDocument::append(const std::string&, CBsonValue)
{
    throw CDocumentException(CDocLinkErrc::UnsupportedMutation,
                             "lazy documents are immutable: append");
}

void CLazyDocument::putAll(const CBsonDocument&)
{
    throw CDocumentException(CDocLinkErrc::UnsupportedMutation,
                             "lazy documents are immutable: putAll");
}

std::optional<CBsonValue> CLazyDocument::remove(const std::string&)
{
    throw CDocumentException(CDocLinkErrc::UnsupportedMutation,
                             "lazy documents are immutable: remove");
}

void CLazyDocument::clear()
{
    throw CDocumentException(CDocLinkErrc::UnsupportedMutation,
                             "lazy documents are immutable: clear");
}

bool CLazyDocument::operator==(const CLazyDocument& other) const
{
    return toDocument() == other.toDocument();
}

bool CLazyDocument::operator==(const CBsonDocument& other) const
{
    return toDocument() == other;
}

size_t CLazyDocument::hash() const
{
    return toDocument().hash();
}

std::string CLazyDocument::toJson() const
{
    return toDocument().toJson();
}

} /* namespace DocLink */
