/*-------------------------------------------------------------------------
 *
 * CObjectId.cpp
 *      12-byte object identifier used as document primary keys.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CObjectId.hpp"

#include "CErrors.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <random>
#include <string_view>
#include <unistd.h>

namespace DocLink
{

namespace
{

constexpr int32_t LOW_ORDER_THREE_BYTES = 0x00ffffff;

struct CObjectIdSeed
{
    int32_t machineIdentifier;
    int16_t processIdentifier;
    std::atomic<int32_t> counter;

    CObjectIdSeed()
    {
        std::random_device device;
        std::mt19937 generator(device());

        machineIdentifier = static_cast<int32_t>(generator()) &
                            LOW_ORDER_THREE_BYTES;
        processIdentifier = static_cast<int16_t>(getpid() & 0xffff);
        counter = static_cast<int32_t>(generator()) & LOW_ORDER_THREE_BYTES;
    }
};

CObjectIdSeed& seed()
{
    static CObjectIdSeed instance;
    return instance;
}

int hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} /* anonymous namespace */

CObjectId::CObjectId() noexcept : bytes_{}
{
}

CObjectId::CObjectId(const Bytes& bytes) noexcept : bytes_(bytes)
{
}

CObjectId::CObjectId(const uint8_t* bytes) noexcept : bytes_{}
{
    std::memcpy(bytes_.data(), bytes, SIZE);
}

CObjectId::CObjectId(const std::string& hexString) : bytes_{}
{
    if (!isValid(hexString))
        throw CDocumentException(CDocLinkErrc::InvalidObjectId,
                                 "invalid hexadecimal representation of an "
                                 "ObjectId: [" + hexString + "]");

    for (size_t i = 0; i < SIZE; i++)
        bytes_[i] = static_cast<uint8_t>((hexValue(hexString[2 * i]) << 4) |
                                         hexValue(hexString[2 * i + 1]));
}

CObjectId::CObjectId(int32_t timestamp, int32_t machineIdentifier,
                     int16_t processIdentifier, int32_t counter)
    : bytes_{}
{
    if ((machineIdentifier & 0xff000000) != 0)
        throw CDocumentException(CDocLinkErrc::InvalidObjectId,
                                 "machine identifier must be between 0 and "
                                 "16777215 (it must fit in three bytes)");
    if ((counter & 0xff000000) != 0)
        throw CDocumentException(CDocLinkErrc::InvalidObjectId,
                                 "counter must be between 0 and 16777215 (it "
                                 "must fit in three bytes)");

    bytes_[0] = static_cast<uint8_t>(timestamp >> 24);
    bytes_[1] = static_cast<uint8_t>(timestamp >> 16);
    bytes_[2] = static_cast<uint8_t>(timestamp >> 8);
    bytes_[3] = static_cast<uint8_t>(timestamp);
    bytes_[4] = static_cast<uint8_t>(machineIdentifier >> 16);
    bytes_[5] = static_cast<uint8_t>(machineIdentifier >> 8);
    bytes_[6] = static_cast<uint8_t>(machineIdentifier);
    bytes_[7] = static_cast<uint8_t>(processIdentifier >> 8);
    bytes_[8] = static_cast<uint8_t>(processIdentifier);
    bytes_[9] = static_cast<uint8_t>(counter >> 16);
    bytes_[10] = static_cast<uint8_t>(counter >> 8);
    bytes_[11] = static_cast<uint8_t>(counter);
}

CObjectId CObjectId::generate()
{
    auto& state = seed();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int32_t seconds = static_cast<int32_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now).count());
    int32_t counter = state.counter.fetch_add(1) & LOW_ORDER_THREE_BYTES;

    return CObjectId(seconds, state.machineIdentifier,
                     state.processIdentifier, counter);
}

bool CObjectId::isValid(const std::string& hexString) noexcept
{
    if (hexString.size() != 2 * SIZE)
        return false;
    for (char c : hexString)
    {
        if (hexValue(c) < 0)
            return false;
    }
    return true;
}

int32_t CObjectId::getTimestamp() const noexcept
{
    return static_cast<int32_t>((uint32_t(bytes_[0]) << 24) |
                                (uint32_t(bytes_[1]) << 16) |
                                (uint32_t(bytes_[2]) << 8) | bytes_[3]);
}

int32_t CObjectId::getMachineIdentifier() const noexcept
{
    return static_cast<int32_t>((uint32_t(bytes_[4]) << 16) |
                                (uint32_t(bytes_[5]) << 8) | bytes_[6]);
}

int16_t CObjectId::getProcessIdentifier() const noexcept
{
    return static_cast<int16_t>((uint16_t(bytes_[7]) << 8) | bytes_[8]);
}

int32_t CObjectId::getCounter() const noexcept
{
    return static_cast<int32_t>((uint32_t(bytes_[9]) << 16) |
                                (uint32_t(bytes_[10]) << 8) | bytes_[11]);
}

const CObjectId::Bytes& CObjectId::toByteArray() const noexcept
{
    return bytes_;
}

std::string CObjectId::toHexString() const
{
    static const char digits[] = "0123456789abcdef";
    std::string result;

    result.reserve(2 * SIZE);
    for (uint8_t b : bytes_)
    {
        result.push_back(digits[b >> 4]);
        result.push_back(digits[b & 0x0f]);
    }
    return result;
}

std::strong_ordering CObjectId::operator<=>(const CObjectId& other) const noexcept
{
    return bytes_ <=> other.bytes_;
}

size_t CObjectId::hash() const noexcept
{
    return std::hash<std::string_view>{}(std::string_view(
        reinterpret_cast<const char*>(bytes_.data()), bytes_.size()));
}

} /* namespace DocLink */
