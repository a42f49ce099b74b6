/*-------------------------------------------------------------------------
 *
 * CDocumentCodec.hpp
 *      Whole-document decoder and encoder.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonBuilder.hpp"
#include "document/CBsonDocument.hpp"
#include "document/CBsonReader.hpp"
#include "document/CDecoderRegistry.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace DocLink
{

/**
 * Decodes a document into a CBsonDocument through a registry
 */
class CDocumentDecoder
{
  public:
    CDocumentDecoder();
    explicit CDocumentDecoder(std::shared_ptr<const CDecoderRegistry> registry);

    CBsonDocument decode(CBsonReader& reader) const;
    CBsonDocument operator()(CBsonReader& reader) const
    {
        return decode(reader);
    }

    const CDecoderRegistry& registry() const noexcept;

  private:
    std::shared_ptr<const CDecoderRegistry> registry_;
};

/**
 * Writes a CBsonDocument through a builder. Builder failures throw
 * CDocumentException with EncodeFailure.
 */
class CDocumentEncoder
{
  public:
    /* Appends the entries to the builder's current scope */
    void encode(CBsonBuilder& builder, const CBsonDocument& document) const;
    std::vector<uint8_t> encode(const CBsonDocument& document) const;

  private:
    void encodeValue(CBsonBuilder& builder, const std::string& key,
                     const CBsonValue& value) const;
};

} /* namespace DocLink */
