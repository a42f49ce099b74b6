/*-------------------------------------------------------------------------
 *
 * CDocumentCodec.cpp
 *      Whole-document decoder and encoder.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CDocumentCodec.hpp"

#include "CErrors.hpp"

namespace DocLink
{

namespace
{
void check(bool ok, const CBsonBuilder& builder)
{
    if (!ok)
        throw CDocumentException(CDocLinkErrc::EncodeFailure,
                                 builder.getLastError());
}
} /* anonymous namespace */

/*-------------------------------------------------------------------------
 * CDocumentDecoder
 *-------------------------------------------------------------------------*/

CDocumentDecoder::CDocumentDecoder()
    : registry_(CDecoderRegistry::defaultRegistry())
{
}

CDocumentDecoder::CDocumentDecoder(
    std::shared_ptr<const CDecoderRegistry> registry)
    : registry_(std::move(registry))
{
}

CBsonDocument CDocumentDecoder::decode(CBsonReader& reader) const
{
    return registry_->decodeDocument(reader);
}

const CDecoderRegistry& CDocumentDecoder::registry() const noexcept
{
    return *registry_;
}

/*-------------------------------------------------------------------------
 * CDocumentEncoder
 *-------------------------------------------------------------------------*/

void CDocumentEncoder::encode(CBsonBuilder& builder,
                              const CBsonDocument& document) const
{
    for (const auto& entry : document)
        encodeValue(builder, entry.first, entry.second);
}

std::vector<uint8_t> CDocumentEncoder::encode(
    const CBsonDocument& document) const
{
    CBsonBuilder builder;

    encode(builder, document);
    std::vector<uint8_t> bytes = builder.getDocument();
    check(!builder.hasErrors(), builder);
    return bytes;
}

void CDocumentEncoder::encodeValue(CBsonBuilder& builder,
                                   const std::string& key,
                                   const CBsonValue& value) const
{
    switch (value.getType())
    {
    case CBsonType::Double:
        check(builder.addDouble(key, value.asDouble()), builder);
        break;
    case CBsonType::String:
        check(builder.addString(key, value.asString()), builder);
        break;
    case CBsonType::Document:
        check(builder.beginDocument(key), builder);
        encode(builder, value.asDocument());
        check(builder.endDocument(), builder);
        break;
    case CBsonType::Array:
        check(builder.beginArray(key), builder);
        for (const auto& element : value.asArray())
            encodeValue(builder, builder.nextArrayKey(), element);
        check(builder.endArray(), builder);
        break;
    case CBsonType::Binary:
    {
        const CBsonBinary& binary = value.asBinary();
        check(builder.addBinary(key, binary.subtype, binary.data.data(),
                                binary.data.size()),
              builder);
        break;
    }
    case CBsonType::Undefined:
        check(builder.addUndefined(key), builder);
        break;
    case CBsonType::ObjectId:
        check(builder.addObjectId(key, value.asObjectId()), builder);
        break;
    case CBsonType::Boolean:
        check(builder.addBool(key, value.asBoolean()), builder);
        break;
    case CBsonType::DateTime:
        check(builder.addDateTime(key, value.asDateTime().millis), builder);
        break;
    case CBsonType::Null:
        check(builder.addNull(key), builder);
        break;
    case CBsonType::RegularExpression:
        check(builder.addRegex(key, value.asRegex().pattern,
                               value.asRegex().options),
              builder);
        break;
    case CBsonType::DbPointer:
    {
        const auto& pointer = value.get<CBsonDbPointer>();
        check(builder.addDbPointer(key, pointer.ns, pointer.id), builder);
        break;
    }
    case CBsonType::JavaScript:
        check(builder.addJavaScript(key, value.get<CBsonJavaScript>().code),
              builder);
        break;
    case CBsonType::Symbol:
        check(builder.addSymbol(key, value.get<CBsonSymbol>().symbol),
              builder);
        break;
    case CBsonType::JavaScriptWithScope:
    {
        const auto& code = value.get<CBsonJavaScriptWithScope>();
        CBsonBuilder scope;
        if (code.scope)
            encode(scope, *code.scope);
        check(builder.addJavaScriptWithScope(key, code.code, scope), builder);
        break;
    }
    case CBsonType::Int32:
        check(builder.addInt32(key, value.asInt32()), builder);
        break;
    case CBsonType::Timestamp:
        check(builder.addTimestamp(key, value.asTimestamp().time,
                                   value.asTimestamp().increment),
              builder);
        break;
    case CBsonType::Int64:
        check(builder.addInt64(key, value.asInt64()), builder);
        break;
    case CBsonType::Decimal128:
        check(builder.addDecimal128(key, value.asDecimal128()), builder);
        break;
    case CBsonType::MinKey:
        check(builder.addMinKey(key), builder);
        break;
    case CBsonType::MaxKey:
        check(builder.addMaxKey(key), builder);
        break;
    case CBsonType::EndOfDocument:
        throw CDocumentException(CDocLinkErrc::EncodeFailure,
                                 "end of document is not a value");
    }
}

} /* namespace DocLink */
