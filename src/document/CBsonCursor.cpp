/*-------------------------------------------------------------------------
 *
 * CBsonCursor.cpp
 *      Sequential little-endian reader over a byte region.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonCursor.hpp"

#include "CErrors.hpp"

#include <cstring>

namespace DocLink
{

CBsonCursor::CBsonCursor(CByteBuffer buffer)
    : buffer_(std::move(buffer)), position_(0), mark_(), closed_(false)
{
}

uint8_t CBsonCursor::readByte()
{
    ensureAvailable(1);
    return buffer_.data()[position_++];
}

int32_t CBsonCursor::readInt32()
{
    return static_cast<int32_t>(readLittleEndian(4));
}

int64_t CBsonCursor::readInt64()
{
    return static_cast<int64_t>(readLittleEndian(8));
}

double CBsonCursor::readDouble()
{
    uint64_t bits = readLittleEndian(8);
    double value;

    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

void CBsonCursor::readBytes(uint8_t* destination, size_t length)
{
    ensureAvailable(length);
    if (length > 0)
        std::memcpy(destination, buffer_.data() + position_, length);
    position_ += length;
}

std::vector<uint8_t> CBsonCursor::readBytes(size_t length)
{
    ensureAvailable(length);
    std::vector<uint8_t> bytes(buffer_.data() + position_,
                               buffer_.data() + position_ + length);
    position_ += length;
    return bytes;
}

CObjectId CBsonCursor::readObjectId()
{
    ensureAvailable(CObjectId::SIZE);
    CObjectId objectId(buffer_.data() + position_);
    position_ += CObjectId::SIZE;
    return objectId;
}

/*
 * readString
 *		Length-prefixed string. The prefix counts the trailing null, which is
 *		consumed but not returned.
 */
std::string CBsonCursor::readString()
{
    ensureAvailable(4);

    size_t start = position_;
    int32_t size = readInt32();
    if (size < 1)
    {
        position_ = start;
        throw CDocumentException(CDocLinkErrc::MalformedString,
                                 "string length must be positive, got " +
                                     std::to_string(size));
    }
    if (static_cast<size_t>(size) > remaining())
    {
        position_ = start;
        throw CDocumentException(CDocLinkErrc::OutOfBounds,
                                 "string length " + std::to_string(size) +
                                     " exceeds remaining bytes");
    }

    const char* bytes =
        reinterpret_cast<const char*>(buffer_.data() + position_);
    if (bytes[size - 1] != '\0')
    {
        position_ = start;
        throw CDocumentException(CDocLinkErrc::MalformedString,
                                 "string is not null terminated");
    }

    std::string value(bytes, static_cast<size_t>(size - 1));
    position_ += static_cast<size_t>(size);
    return value;
}

/*
 * readCString
 *		Scan for the terminator first, then copy exactly the scanned span and
 *		step over the terminator.
 */
std::string CBsonCursor::readCString()
{
    ensureOpen();

    size_t terminator = findNullByte();
    const char* bytes =
        reinterpret_cast<const char*>(buffer_.data() + position_);
    std::string value(bytes, terminator - position_);

    position_ = terminator + 1;
    return value;
}

void CBsonCursor::skipCString()
{
    ensureOpen();
    position_ = findNullByte() + 1;
}

void CBsonCursor::skip(size_t length)
{
    ensureAvailable(length);
    position_ += length;
}

void CBsonCursor::mark()
{
    ensureOpen();
    mark_ = position_;
}

void CBsonCursor::reset()
{
    ensureOpen();
    if (!mark_)
        throw CDocumentException(CDocLinkErrc::NoMarkSet);
    position_ = *mark_;
}

size_t CBsonCursor::position() const
{
    ensureOpen();
    return position_;
}

size_t CBsonCursor::remaining() const
{
    ensureOpen();
    return buffer_.size() - position_;
}

bool CBsonCursor::hasRemaining() const
{
    return remaining() > 0;
}

/*
 * close
 *		Release the underlying region; further use fails
 */
void CBsonCursor::close() noexcept
{
    buffer_.release();
    mark_.reset();
    position_ = 0;
    closed_ = true;
}

bool CBsonCursor::isClosed() const noexcept
{
    return closed_;
}

void CBsonCursor::ensureOpen() const
{
    if (closed_)
        throw CDocumentException(CDocLinkErrc::ClosedCursorUse);
}

void CBsonCursor::ensureAvailable(size_t length) const
{
    ensureOpen();
    if (length > buffer_.size() - position_)
        throw CDocumentException(
            CDocLinkErrc::OutOfBounds,
            "need " + std::to_string(length) + " bytes at position " +
                std::to_string(position_) + ", only " +
                std::to_string(buffer_.size() - position_) + " remain");
}

/*
 * findNullByte
 *		Offset of the next 0x00 at or after the current position
 */
size_t CBsonCursor::findNullByte() const
{
    const uint8_t* bytes = buffer_.data();
    size_t limit = buffer_.size();

    for (size_t offset = position_; offset < limit; offset++)
    {
        if (bytes[offset] == 0)
            return offset;
    }
    throw CDocumentException(CDocLinkErrc::MalformedCString,
                             "no null terminator found after position " +
                                 std::to_string(position_));
}

uint64_t CBsonCursor::readLittleEndian(size_t width)
{
    ensureAvailable(width);

    const uint8_t* bytes = buffer_.data() + position_;
    uint64_t value = 0;
    for (size_t i = 0; i < width; i++)
        value |= static_cast<uint64_t>(bytes[i]) << (8 * i);

    position_ += width;
    return value;
}

} /* namespace DocLink */
