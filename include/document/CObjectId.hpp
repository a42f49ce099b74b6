/*-------------------------------------------------------------------------
 *
 * CObjectId.hpp
 *      12-byte object identifier used as document primary keys.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>

namespace DocLink
{

/**
 * Layout: 4-byte big-endian timestamp (seconds), 3-byte machine identifier,
 * 2-byte process identifier, 3-byte counter.
 */
class CObjectId
{
  public:
    static constexpr size_t SIZE = 12;
    using Bytes = std::array<uint8_t, SIZE>;

    CObjectId() noexcept;
    explicit CObjectId(const Bytes& bytes) noexcept;
    explicit CObjectId(const uint8_t* bytes) noexcept;
    explicit CObjectId(const std::string& hexString);
    CObjectId(int32_t timestamp, int32_t machineIdentifier,
              int16_t processIdentifier, int32_t counter);

    /* Fresh identifier for the current time with the next counter value */
    static CObjectId generate();
    static bool isValid(const std::string& hexString) noexcept;

    int32_t getTimestamp() const noexcept;
    int32_t getMachineIdentifier() const noexcept;
    int16_t getProcessIdentifier() const noexcept;
    int32_t getCounter() const noexcept;

    const Bytes& toByteArray() const noexcept;
    std::string toHexString() const;

    bool operator==(const CObjectId& other) const noexcept = default;
    std::strong_ordering operator<=>(const CObjectId& other) const noexcept;

    size_t hash() const noexcept;

  private:
    Bytes bytes_;
};

} /* namespace DocLink */
