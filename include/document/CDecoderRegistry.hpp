/*-------------------------------------------------------------------------
 *
 * CDecoderRegistry.hpp
 *      Element type to decode function table.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonDocument.hpp"
#include "document/CBsonReader.hpp"
#include "document/CBsonType.hpp"
#include "document/CBsonValue.hpp"

#include <array>
#include <functional>
#include <memory>

namespace DocLink
{

/**
 * Maps each element type to the function producing its value. Decoders for
 * embedded documents and arrays recurse through the registry they are
 * called with, so an override applies at every nesting level.
 */
class CDecoderRegistry
{
  public:
    using DecodeFunction =
        std::function<CBsonValue(CBsonReader&, const CDecoderRegistry&)>;

    /* Empty registry; see withDefaults() */
    CDecoderRegistry() = default;

    static CDecoderRegistry withDefaults();
    static std::shared_ptr<const CDecoderRegistry> defaultRegistry();

    void registerDecoder(CBsonType type, DecodeFunction decoder);
    bool hasDecoder(CBsonType type) const noexcept;

    /* Value whose type byte and name have already been read */
    CBsonValue decode(CBsonType type, CBsonReader& reader) const;

    /* Whole document or array starting at the length prefix */
    CBsonDocument decodeDocument(CBsonReader& reader) const;
    CBsonArray decodeArray(CBsonReader& reader) const;

  private:
    std::array<DecodeFunction, 256> decoders_;
};

} /* namespace DocLink */
