/*-------------------------------------------------------------------------
 *
 * CBsonCursor.hpp
 *      Sequential little-endian reader over a byte region.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "buffer/CByteBuffer.hpp"
#include "document/CObjectId.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DocLink
{

/**
 * Decodes primitive wire values from the buffer it owns. Every failure
 * throws CDocumentException and leaves the position where it was.
 *
 * There is a single mark slot: mark() overwrites any earlier mark.
 */
class CBsonCursor
{
  public:
    explicit CBsonCursor(CByteBuffer buffer);
    ~CBsonCursor() = default;

    CBsonCursor(CBsonCursor&&) noexcept = default;
    CBsonCursor& operator=(CBsonCursor&&) noexcept = default;
    CBsonCursor(const CBsonCursor&) = delete;
    CBsonCursor& operator=(const CBsonCursor&) = delete;

    uint8_t readByte();
    int32_t readInt32();
    int64_t readInt64();
    double readDouble();
    void readBytes(uint8_t* destination, size_t length);
    std::vector<uint8_t> readBytes(size_t length);
    CObjectId readObjectId();

    /* int32 length (including the trailing null) + bytes + 0x00 */
    std::string readString();
    /* bytes up to and including a 0x00; the terminator is not returned */
    std::string readCString();
    void skipCString();

    void skip(size_t length);
    void mark();
    void reset();

    size_t position() const;
    size_t remaining() const;
    bool hasRemaining() const;

    void close() noexcept;
    bool isClosed() const noexcept;

  private:
    void ensureOpen() const;
    void ensureAvailable(size_t length) const;
    size_t findNullByte() const;
    uint64_t readLittleEndian(size_t width);

    CByteBuffer buffer_;
    size_t position_;
    std::optional<size_t> mark_;
    bool closed_;
};

} /* namespace DocLink */
