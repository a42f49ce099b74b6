/*-------------------------------------------------------------------------
 *
 * CDecoderRegistry.cpp
 *      Element type to decode function table.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CDecoderRegistry.hpp"

#include "CErrors.hpp"

namespace DocLink
{

CDecoderRegistry CDecoderRegistry::withDefaults()
{
    CDecoderRegistry registry;

    registry.registerDecoder(CBsonType::Double,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readDouble()); });
    registry.registerDecoder(CBsonType::String,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readString()); });
    registry.registerDecoder(CBsonType::Document,
                             [](CBsonReader& r, const CDecoderRegistry& self)
                             { return CBsonValue(self.decodeDocument(r)); });
    registry.registerDecoder(CBsonType::Array,
                             [](CBsonReader& r, const CDecoderRegistry& self)
                             { return CBsonValue(self.decodeArray(r)); });
    registry.registerDecoder(CBsonType::Binary,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readBinary()); });
    registry.registerDecoder(CBsonType::Undefined,
                             [](CBsonReader&, const CDecoderRegistry&)
                             { return CBsonValue(CBsonUndefined{}); });
    registry.registerDecoder(CBsonType::ObjectId,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readObjectId()); });
    registry.registerDecoder(CBsonType::Boolean,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readBoolean()); });
    registry.registerDecoder(CBsonType::DateTime,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readDateTime()); });
    registry.registerDecoder(CBsonType::Null,
                             [](CBsonReader&, const CDecoderRegistry&)
                             { return CBsonValue(CBsonNull{}); });
    registry.registerDecoder(CBsonType::RegularExpression,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readRegularExpression()); });
    registry.registerDecoder(CBsonType::DbPointer,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readDbPointer()); });
    registry.registerDecoder(
        CBsonType::JavaScript, [](CBsonReader& r, const CDecoderRegistry&)
        { return CBsonValue(CBsonJavaScript{r.readJavaScript()}); });
    registry.registerDecoder(CBsonType::Symbol,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(CBsonSymbol{r.readSymbol()}); });
    registry.registerDecoder(
        CBsonType::JavaScriptWithScope,
        [](CBsonReader& r, const CDecoderRegistry& self)
        {
            CBsonJavaScriptWithScope value;
            value.code = r.readJavaScriptWithScopeCode();
            value.scope =
                std::make_shared<const CBsonDocument>(self.decodeDocument(r));
            return CBsonValue(std::move(value));
        });
    registry.registerDecoder(CBsonType::Int32,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readInt32()); });
    registry.registerDecoder(CBsonType::Timestamp,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readTimestamp()); });
    registry.registerDecoder(CBsonType::Int64,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readInt64()); });
    registry.registerDecoder(CBsonType::Decimal128,
                             [](CBsonReader& r, const CDecoderRegistry&)
                             { return CBsonValue(r.readDecimal128()); });
    registry.registerDecoder(CBsonType::MinKey,
                             [](CBsonReader&, const CDecoderRegistry&)
                             { return CBsonValue(CBsonMinKey{}); });
    registry.registerDecoder(CBsonType::MaxKey,
                             [](CBsonReader&, const CDecoderRegistry&)
                             { return CBsonValue(CBsonMaxKey{}); });

    return registry;
}

std::shared_ptr<const CDecoderRegistry> CDecoderRegistry::defaultRegistry()
{
    static const std::shared_ptr<const CDecoderRegistry> instance =
        std::make_shared<const CDecoderRegistry>(withDefaults());
    return instance;
}

void CDecoderRegistry::registerDecoder(CBsonType type, DecodeFunction decoder)
{
    decoders_[static_cast<uint8_t>(type)] = std::move(decoder);
}

bool CDecoderRegistry::hasDecoder(CBsonType type) const noexcept
{
    return static_cast<bool>(decoders_[static_cast<uint8_t>(type)]);
}

CBsonValue CDecoderRegistry::decode(CBsonType type, CBsonReader& reader) const
{
    const auto& decoder = decoders_[static_cast<uint8_t>(type)];
    if (!decoder)
        throw CDocumentException(CDocLinkErrc::UnknownBsonType,
                                 "no decoder registered for " +
                                     typeName(type));
    return decoder(reader, *this);
}

CBsonDocument CDecoderRegistry::decodeDocument(CBsonReader& reader) const
{
    CBsonDocument document;
    CBsonType type;

    reader.readStartDocument();
    while ((type = reader.readBsonType()) != CBsonType::EndOfDocument)
    {
        std::string name = reader.readName();
        document.put(name, decode(type, reader));
    }
    reader.readEndDocument();
    return document;
}

CBsonArray CDecoderRegistry::decodeArray(CBsonReader& reader) const
{
    CBsonArray array;
    CBsonType type;

    reader.readStartDocument();
    while ((type = reader.readBsonType()) != CBsonType::EndOfDocument)
    {
        reader.skipName();
        array.add(decode(type, reader));
    }
    reader.readEndDocument();
    return array;
}

} /* namespace DocLink */
