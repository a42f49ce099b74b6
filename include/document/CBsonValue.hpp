/*-------------------------------------------------------------------------
 *
 * CBsonValue.hpp
 *      Decoded element values of the binary document format.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonType.hpp"
#include "document/CObjectId.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace DocLink
{

class CBsonDocument;
class CBsonArray;

struct CBsonNull
{
    bool operator==(const CBsonNull&) const = default;
};

struct CBsonUndefined
{
    bool operator==(const CBsonUndefined&) const = default;
};

struct CBsonMinKey
{
    bool operator==(const CBsonMinKey&) const = default;
};

struct CBsonMaxKey
{
    bool operator==(const CBsonMaxKey&) const = default;
};

struct CBsonBinary
{
    uint8_t subtype = 0x00;
    std::vector<uint8_t> data;

    bool operator==(const CBsonBinary&) const = default;
};

struct CBsonDateTime
{
    int64_t millis = 0; /* since the Unix epoch, UTC */

    bool operator==(const CBsonDateTime&) const = default;
};

struct CBsonRegex
{
    std::string pattern;
    std::string options;

    bool operator==(const CBsonRegex&) const = default;
};

struct CBsonDbPointer
{
    std::string ns;
    CObjectId id;

    bool operator==(const CBsonDbPointer&) const = default;
};

struct CBsonJavaScript
{
    std::string code;

    bool operator==(const CBsonJavaScript&) const = default;
};

struct CBsonSymbol
{
    std::string symbol;

    bool operator==(const CBsonSymbol&) const = default;
};

struct CBsonJavaScriptWithScope
{
    std::string code;
    std::shared_ptr<const CBsonDocument> scope;
};

/* Low four bytes on the wire are the increment, high four the seconds */
struct CBsonTimestamp
{
    uint32_t time = 0;
    uint32_t increment = 0;

    bool operator==(const CBsonTimestamp&) const = default;
};

/* IEEE 754-2008 decimal128, kept as its two little-endian halves */
struct CBsonDecimal128
{
    uint64_t low = 0;
    uint64_t high = 0;

    bool operator==(const CBsonDecimal128&) const = default;
};

/**
 * One decoded value. Embedded documents and arrays are shared and never
 * modified once wrapped in a value.
 */
class CBsonValue
{
  public:
    using DocumentPtr = std::shared_ptr<const CBsonDocument>;
    using ArrayPtr = std::shared_ptr<const CBsonArray>;
    using Storage =
        std::variant<CBsonNull, double, std::string, DocumentPtr, ArrayPtr,
                     CBsonBinary, CBsonUndefined, CObjectId, bool,
                     CBsonDateTime, CBsonRegex, CBsonDbPointer,
                     CBsonJavaScript, CBsonSymbol, CBsonJavaScriptWithScope,
                     int32_t, CBsonTimestamp, int64_t, CBsonDecimal128,
                     CBsonMinKey, CBsonMaxKey>;

    CBsonValue();
    CBsonValue(CBsonNull value);
    CBsonValue(double value);
    CBsonValue(std::string value);
    CBsonValue(const char* value);
    CBsonValue(CBsonDocument value);
    CBsonValue(CBsonArray value);
    CBsonValue(CBsonBinary value);
    CBsonValue(CBsonUndefined value);
    CBsonValue(CObjectId value);
    CBsonValue(bool value);
    CBsonValue(CBsonDateTime value);
    CBsonValue(CBsonRegex value);
    CBsonValue(CBsonDbPointer value);
    CBsonValue(CBsonJavaScript value);
    CBsonValue(CBsonSymbol value);
    CBsonValue(CBsonJavaScriptWithScope value);
    CBsonValue(int32_t value);
    CBsonValue(CBsonTimestamp value);
    CBsonValue(int64_t value);
    CBsonValue(CBsonDecimal128 value);
    CBsonValue(CBsonMinKey value);
    CBsonValue(CBsonMaxKey value);

    CBsonType getType() const noexcept;
    bool isNull() const noexcept;
    bool isNumber() const noexcept;
    bool isDocument() const noexcept;
    bool isArray() const noexcept;
    bool isString() const noexcept;

    /* Typed accessors throw std::bad_variant_access on a type mismatch */
    double asDouble() const;
    int32_t asInt32() const;
    int64_t asInt64() const;
    bool asBoolean() const;
    const std::string& asString() const;
    const CBsonDocument& asDocument() const;
    const CBsonArray& asArray() const;
    const CObjectId& asObjectId() const;
    const CBsonBinary& asBinary() const;
    const CBsonRegex& asRegex() const;
    CBsonDateTime asDateTime() const;
    CBsonTimestamp asTimestamp() const;
    CBsonDecimal128 asDecimal128() const;

    template <typename T> const T& get() const
    {
        return std::get<T>(value_);
    }

    const Storage& storage() const noexcept
    {
        return value_;
    }

    bool operator==(const CBsonValue& other) const;
    size_t hash() const noexcept;

    /* Relaxed extended JSON, for diagnostics */
    std::string toJson() const;

  private:
    Storage value_;
};

/**
 * Ordered list of values; element names on the wire are "0", "1", ...
 */
class CBsonArray
{
  public:
    CBsonArray() = default;
    CBsonArray(std::initializer_list<CBsonValue> values);

    void add(CBsonValue value);
    size_t size() const noexcept;
    bool isEmpty() const noexcept;
    const CBsonValue& operator[](size_t index) const;
    const CBsonValue& at(size_t index) const;

    std::vector<CBsonValue>::const_iterator begin() const noexcept;
    std::vector<CBsonValue>::const_iterator end() const noexcept;

    bool operator==(const CBsonArray& other) const;
    size_t hash() const noexcept;

  private:
    std::vector<CBsonValue> values_;
};

namespace detail
{
inline void hashCombine(size_t& seed, size_t value) noexcept
{
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}
} /* namespace detail */

} /* namespace DocLink */

template <> struct std::hash<DocLink::CBsonValue>
{
    size_t operator()(const DocLink::CBsonValue& value) const noexcept
    {
        return value.hash();
    }
};
