/*-------------------------------------------------------------------------
 *
 * CLazyDocument.hpp
 *      Immutable document backed by its encoded bytes.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CErrors.hpp"
#include "buffer/CByteBuffer.hpp"
#include "document/CBsonBuilder.hpp"
#include "document/CBsonCursor.hpp"
#include "document/CBsonDocument.hpp"
#include "document/CBsonReader.hpp"
#include "document/CDecoderRegistry.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace DocLink
{

/**
 * Read-only view of one encoded document. Nothing is decoded up front and
 * nothing is cached: every query walks the bytes with a fresh cursor.
 *
 * The mutating operations exist only to fail with UnsupportedMutation; use
 * toDocument() for a modifiable copy.
 */
class CLazyDocument
{
  public:
    /* Takes ownership of the bytes without copying them */
    static CLazyDocument
    wrapBytes(std::vector<uint8_t> bytes,
              std::shared_ptr<const CDecoderRegistry> registry =
                  CDecoderRegistry::defaultRegistry());
    static CLazyDocument
    wrapBytes(CByteBuffer bytes,
              std::shared_ptr<const CDecoderRegistry> registry =
                  CDecoderRegistry::defaultRegistry());

    /**
     * Encode value with encoder.encode(CBsonBuilder&, const T&) and wrap the
     * result.
     */
    template <typename T, typename Encoder>
    CLazyDocument(const T& value, const Encoder& encoder)
        : bytes_(), registry_(CDecoderRegistry::defaultRegistry())
    {
        CBsonBuilder builder;

        encoder.encode(builder, value);
        std::vector<uint8_t> encoded = builder.getDocument();
        if (builder.hasErrors())
            throw CDocumentException(CDocLinkErrc::EncodeFailure,
                                     builder.getLastError());
        bytes_ = CByteBuffer(std::move(encoded));
    }

    CLazyDocument(const CLazyDocument& other);
    CLazyDocument& operator=(const CLazyDocument& other);
    CLazyDocument(CLazyDocument&&) noexcept = default;
    CLazyDocument& operator=(CLazyDocument&&) noexcept = default;
    ~CLazyDocument() = default;

    size_t size() const;
    bool isEmpty() const;
    bool containsKey(const std::string& key) const;
    bool containsValue(const CBsonValue& value) const;
    std::optional<CBsonValue> get(const std::string& key) const;

    std::vector<CBsonDocument::Entry> entrySet() const;
    std::vector<std::string> keySet() const;
    std::vector<CBsonValue> values() const;

    /* Run decoder(CBsonReader&) over a fresh cursor positioned at the start */
    template <typename Decoder> auto decodeAs(Decoder&& decoder) const
    {
        CBsonCursor cursor(bytes_.retain());
        CBsonReader reader(cursor);
        return std::invoke(std::forward<Decoder>(decoder), reader);
    }

    CBsonDocument toDocument() const;

    std::vector<uint8_t> getBytes() const;
    CByteBuffer getByteBuffer() const;

    /* Always throw CDocumentException(UnsupportedMutation) */
    std::optional<CBsonValue> put(const std::string& key, CBsonValue value);
    CLazyDocument& append(const std::string& key, CBsonValue value);
    void putAll(const CBsonDocument& other);
    std::optional<CBsonValue> remove(const std::string& key);
    void clear();

    bool operator==(const CLazyDocument& other) const;
    bool operator==(const CBsonDocument& other) const;
    size_t hash() const;

    std::string toJson() const;

  private:
    CLazyDocument(CByteBuffer bytes,
                  std::shared_ptr<const CDecoderRegistry> registry);

    CByteBuffer bytes_;
    std::shared_ptr<const CDecoderRegistry> registry_;
};

} /* namespace DocLink */

template <> struct std::hash<DocLink::CLazyDocument>
{
    size_t operator()(const DocLink::CLazyDocument& document) const
    {
        return document.hash();
    }
};
