/*-------------------------------------------------------------------------
 *
 * CBsonValue.cpp
 *      Decoded element values of the binary document format.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonValue.hpp"

#include "document/CBsonDocument.hpp"

#include <bson/bson.h>
#include <openssl/evp.h>

#include <cmath>
#include <cstdio>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace DocLink
{

namespace
{

template <typename T> inline constexpr bool always_false_v = false;

std::string quote(const std::string& value)
{
    std::string result = "\"";

    for (unsigned char c : value)
    {
        switch (c)
        {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (c < 0x20)
            {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
                result += escaped;
            }
            else
                result.push_back(static_cast<char>(c));
        }
    }
    result += "\"";
    return result;
}

std::string base64(const std::vector<uint8_t>& data)
{
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                 data.data(), static_cast<int>(data.size()));
    encoded.resize(length > 0 ? static_cast<size_t>(length) : 0);
    return encoded;
}

std::string formatDouble(double value)
{
    if (std::isnan(value))
        return "{\"$numberDouble\":\"NaN\"}";
    if (std::isinf(value))
        return value > 0 ? "{\"$numberDouble\":\"Infinity\"}"
                         : "{\"$numberDouble\":\"-Infinity\"}";

    std::ostringstream ss;
    ss << std::setprecision(17) << value;
    std::string text = ss.str();
    if (text.find_first_of(".e") == std::string::npos)
        text += ".0";
    return text;
}

size_t hashDouble(double value) noexcept
{
    /* keep hash consistent with equality: 0.0 == -0.0 and NaN == NaN */
    if (value == 0.0)
        value = 0.0;
    if (std::isnan(value))
        return 0x7ff8;
    return std::hash<double>{}(value);
}

} /* anonymous namespace */

/*-------------------------------------------------------------------------
 * CBsonValue construction
 *-------------------------------------------------------------------------*/

CBsonValue::CBsonValue() : value_(std::in_place_type<CBsonNull>)
{
}

CBsonValue::CBsonValue(CBsonNull value)
    : value_(std::in_place_type<CBsonNull>, value)
{
}

CBsonValue::CBsonValue(double value) : value_(std::in_place_type<double>, value)
{
}

CBsonValue::CBsonValue(std::string value)
    : value_(std::in_place_type<std::string>, std::move(value))
{
}

CBsonValue::CBsonValue(const char* value)
    : value_(std::in_place_type<std::string>, value)
{
}

CBsonValue::CBsonValue(CBsonDocument value)
    : value_(std::in_place_type<DocumentPtr>,
             std::make_shared<const CBsonDocument>(std::move(value)))
{
}

CBsonValue::CBsonValue(CBsonArray value)
    : value_(std::in_place_type<ArrayPtr>,
             std::make_shared<const CBsonArray>(std::move(value)))
{
}

CBsonValue::CBsonValue(CBsonBinary value)
    : value_(std::in_place_type<CBsonBinary>, std::move(value))
{
}

CBsonValue::CBsonValue(CBsonUndefined value)
    : value_(std::in_place_type<CBsonUndefined>, value)
{
}

CBsonValue::CBsonValue(CObjectId value)
    : value_(std::in_place_type<CObjectId>, value)
{
}

CBsonValue::CBsonValue(bool value) : value_(std::in_place_type<bool>, value)
{
}

CBsonValue::CBsonValue(CBsonDateTime value)
    : value_(std::in_place_type<CBsonDateTime>, value)
{
}

CBsonValue::CBsonValue(CBsonRegex value)
    : value_(std::in_place_type<CBsonRegex>, std::move(value))
{
}

CBsonValue::CBsonValue(CBsonDbPointer value)
    : value_(std::in_place_type<CBsonDbPointer>, std::move(value))
{
}

CBsonValue::CBsonValue(CBsonJavaScript value)
    : value_(std::in_place_type<CBsonJavaScript>, std::move(value))
{
}

CBsonValue::CBsonValue(CBsonSymbol value)
    : value_(std::in_place_type<CBsonSymbol>, std::move(value))
{
}

CBsonValue::CBsonValue(CBsonJavaScriptWithScope value)
    : value_(std::in_place_type<CBsonJavaScriptWithScope>, std::move(value))
{
}

CBsonValue::CBsonValue(int32_t value)
    : value_(std::in_place_type<int32_t>, value)
{
}

CBsonValue::CBsonValue(CBsonTimestamp value)
    : value_(std::in_place_type<CBsonTimestamp>, value)
{
}

CBsonValue::CBsonValue(int64_t value)
    : value_(std::in_place_type<int64_t>, value)
{
}

CBsonValue::CBsonValue(CBsonDecimal128 value)
    : value_(std::in_place_type<CBsonDecimal128>, value)
{
}

CBsonValue::CBsonValue(CBsonMinKey value)
    : value_(std::in_place_type<CBsonMinKey>, value)
{
}

CBsonValue::CBsonValue(CBsonMaxKey value)
    : value_(std::in_place_type<CBsonMaxKey>, value)
{
}

/*-------------------------------------------------------------------------
 * CBsonValue queries
 *-------------------------------------------------------------------------*/

CBsonType CBsonValue::getType() const noexcept
{
    return std::visit(
        [](const auto& v) -> CBsonType
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, CBsonNull>)
                return CBsonType::Null;
            else if constexpr (std::is_same_v<T, double>)
                return CBsonType::Double;
            else if constexpr (std::is_same_v<T, std::string>)
                return CBsonType::String;
            else if constexpr (std::is_same_v<T, DocumentPtr>)
                return CBsonType::Document;
            else if constexpr (std::is_same_v<T, ArrayPtr>)
                return CBsonType::Array;
            else if constexpr (std::is_same_v<T, CBsonBinary>)
                return CBsonType::Binary;
            else if constexpr (std::is_same_v<T, CBsonUndefined>)
                return CBsonType::Undefined;
            else if constexpr (std::is_same_v<T, CObjectId>)
                return CBsonType::ObjectId;
            else if constexpr (std::is_same_v<T, bool>)
                return CBsonType::Boolean;
            else if constexpr (std::is_same_v<T, CBsonDateTime>)
                return CBsonType::DateTime;
            else if constexpr (std::is_same_v<T, CBsonRegex>)
                return CBsonType::RegularExpression;
            else if constexpr (std::is_same_v<T, CBsonDbPointer>)
                return CBsonType::DbPointer;
            else if constexpr (std::is_same_v<T, CBsonJavaScript>)
                return CBsonType::JavaScript;
            else if constexpr (std::is_same_v<T, CBsonSymbol>)
                return CBsonType::Symbol;
            else if constexpr (std::is_same_v<T, CBsonJavaScriptWithScope>)
                return CBsonType::JavaScriptWithScope;
            else if constexpr (std::is_same_v<T, int32_t>)
                return CBsonType::Int32;
            else if constexpr (std::is_same_v<T, CBsonTimestamp>)
                return CBsonType::Timestamp;
            else if constexpr (std::is_same_v<T, int64_t>)
                return CBsonType::Int64;
            else if constexpr (std::is_same_v<T, CBsonDecimal128>)
                return CBsonType::Decimal128;
            else if constexpr (std::is_same_v<T, CBsonMinKey>)
                return CBsonType::MinKey;
            else if constexpr (std::is_same_v<T, CBsonMaxKey>)
                return CBsonType::MaxKey;
            else
                static_assert(always_false_v<T>, "unhandled value type");
        },
        value_);
}

bool CBsonValue::isNull() const noexcept
{
    return std::holds_alternative<CBsonNull>(value_);
}

bool CBsonValue::isNumber() const noexcept
{
    return std::holds_alternative<double>(value_) ||
           std::holds_alternative<int32_t>(value_) ||
           std::holds_alternative<int64_t>(value_) ||
           std::holds_alternative<CBsonDecimal128>(value_);
}

bool CBsonValue::isDocument() const noexcept
{
    return std::holds_alternative<DocumentPtr>(value_);
}

bool CBsonValue::isArray() const noexcept
{
    return std::holds_alternative<ArrayPtr>(value_);
}

bool CBsonValue::isString() const noexcept
{
    return std::holds_alternative<std::string>(value_);
}

double CBsonValue::asDouble() const
{
    return std::get<double>(value_);
}

int32_t CBsonValue::asInt32() const
{
    return std::get<int32_t>(value_);
}

int64_t CBsonValue::asInt64() const
{
    return std::get<int64_t>(value_);
}

bool CBsonValue::asBoolean() const
{
    return std::get<bool>(value_);
}

const std::string& CBsonValue::asString() const
{
    return std::get<std::string>(value_);
}

const CBsonDocument& CBsonValue::asDocument() const
{
    return *std::get<DocumentPtr>(value_);
}

const CBsonArray& CBsonValue::asArray() const
{
    return *std::get<ArrayPtr>(value_);
}

const CObjectId& CBsonValue::asObjectId() const
{
    return std::get<CObjectId>(value_);
}

const CBsonBinary& CBsonValue::asBinary() const
{
    return std::get<CBsonBinary>(value_);
}

const CBsonRegex& CBsonValue::asRegex() const
{
    return std::get<CBsonRegex>(value_);
}

CBsonDateTime CBsonValue::asDateTime() const
{
    return std::get<CBsonDateTime>(value_);
}

CBsonTimestamp CBsonValue::asTimestamp() const
{
    return std::get<CBsonTimestamp>(value_);
}

CBsonDecimal128 CBsonValue::asDecimal128() const
{
    return std::get<CBsonDecimal128>(value_);
}

/*
 * operator==
 *		Deep comparison; embedded documents and arrays compare by content
 */
bool CBsonValue::operator==(const CBsonValue& other) const
{
    if (value_.index() != other.value_.index())
        return false;

    return std::visit(
        [&other](const auto& lhs) -> bool
        {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<T>(other.value_);

            if constexpr (std::is_same_v<T, DocumentPtr> ||
                          std::is_same_v<T, ArrayPtr>)
            {
                if (lhs == rhs)
                    return true;
                if (!lhs || !rhs)
                    return false;
                return *lhs == *rhs;
            }
            else if constexpr (std::is_same_v<T, CBsonJavaScriptWithScope>)
            {
                if (lhs.code != rhs.code)
                    return false;
                if (lhs.scope == rhs.scope)
                    return true;
                if (!lhs.scope || !rhs.scope)
                    return false;
                return *lhs.scope == *rhs.scope;
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
            }
            else
            {
                return lhs == rhs;
            }
        },
        value_);
}

size_t CBsonValue::hash() const noexcept
{
    size_t seed = value_.index();

    std::visit(
        [&seed](const auto& v)
        {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, DocumentPtr> ||
                          std::is_same_v<T, ArrayPtr>)
            {
                detail::hashCombine(seed, v ? v->hash() : 0);
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                detail::hashCombine(seed, hashDouble(v));
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
                detail::hashCombine(seed, std::hash<std::string>{}(v));
            }
            else if constexpr (std::is_same_v<T, bool> ||
                               std::is_same_v<T, int32_t> ||
                               std::is_same_v<T, int64_t>)
            {
                detail::hashCombine(seed, std::hash<T>{}(v));
            }
            else if constexpr (std::is_same_v<T, CObjectId>)
            {
                detail::hashCombine(seed, v.hash());
            }
            else if constexpr (std::is_same_v<T, CBsonBinary>)
            {
                detail::hashCombine(seed, v.subtype);
                for (uint8_t b : v.data)
                    detail::hashCombine(seed, b);
            }
            else if constexpr (std::is_same_v<T, CBsonDateTime>)
            {
                detail::hashCombine(seed, std::hash<int64_t>{}(v.millis));
            }
            else if constexpr (std::is_same_v<T, CBsonRegex>)
            {
                detail::hashCombine(seed, std::hash<std::string>{}(v.pattern));
                detail::hashCombine(seed, std::hash<std::string>{}(v.options));
            }
            else if constexpr (std::is_same_v<T, CBsonDbPointer>)
            {
                detail::hashCombine(seed, std::hash<std::string>{}(v.ns));
                detail::hashCombine(seed, v.id.hash());
            }
            else if constexpr (std::is_same_v<T, CBsonJavaScript>)
            {
                detail::hashCombine(seed, std::hash<std::string>{}(v.code));
            }
            else if constexpr (std::is_same_v<T, CBsonSymbol>)
            {
                detail::hashCombine(seed, std::hash<std::string>{}(v.symbol));
            }
            else if constexpr (std::is_same_v<T, CBsonJavaScriptWithScope>)
            {
                detail::hashCombine(seed, std::hash<std::string>{}(v.code));
                detail::hashCombine(seed, v.scope ? v.scope->hash() : 0);
            }
            else if constexpr (std::is_same_v<T, CBsonTimestamp>)
            {
                detail::hashCombine(seed, v.time);
                detail::hashCombine(seed, v.increment);
            }
            else if constexpr (std::is_same_v<T, CBsonDecimal128>)
            {
                detail::hashCombine(seed, std::hash<uint64_t>{}(v.low));
                detail::hashCombine(seed, std::hash<uint64_t>{}(v.high));
            }
        },
        value_);
    return seed;
}

std::string CBsonValue::toJson() const
{
    return std::visit(
        [](const auto& v) -> std::string
        {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, CBsonNull>)
                return "null";
            else if constexpr (std::is_same_v<T, double>)
                return formatDouble(v);
            else if constexpr (std::is_same_v<T, std::string>)
                return quote(v);
            else if constexpr (std::is_same_v<T, DocumentPtr>)
                return v ? v->toJson() : "{}";
            else if constexpr (std::is_same_v<T, ArrayPtr>)
            {
                std::string result = "[";
                bool first = true;
                if (v)
                {
                    for (const auto& element : *v)
                    {
                        if (!first)
                            result += ", ";
                        result += element.toJson();
                        first = false;
                    }
                }
                return result + "]";
            }
            else if constexpr (std::is_same_v<T, CBsonBinary>)
            {
                char subtype[3];
                std::snprintf(subtype, sizeof(subtype), "%02x", v.subtype);
                return "{\"$binary\": {\"base64\": " + quote(base64(v.data)) +
                       ", \"subType\": \"" + subtype + "\"}}";
            }
            else if constexpr (std::is_same_v<T, CBsonUndefined>)
                return "{\"$undefined\": true}";
            else if constexpr (std::is_same_v<T, CObjectId>)
                return "{\"$oid\": \"" + v.toHexString() + "\"}";
            else if constexpr (std::is_same_v<T, bool>)
                return v ? "true" : "false";
            else if constexpr (std::is_same_v<T, CBsonDateTime>)
                return "{\"$date\": {\"$numberLong\": \"" +
                       std::to_string(v.millis) + "\"}}";
            else if constexpr (std::is_same_v<T, CBsonRegex>)
                return "{\"$regularExpression\": {\"pattern\": " +
                       quote(v.pattern) + ", \"options\": " +
                       quote(v.options) + "}}";
            else if constexpr (std::is_same_v<T, CBsonDbPointer>)
                return "{\"$dbPointer\": {\"$ref\": " + quote(v.ns) +
                       ", \"$id\": {\"$oid\": \"" + v.id.toHexString() +
                       "\"}}}";
            else if constexpr (std::is_same_v<T, CBsonJavaScript>)
                return "{\"$code\": " + quote(v.code) + "}";
            else if constexpr (std::is_same_v<T, CBsonSymbol>)
                return "{\"$symbol\": " + quote(v.symbol) + "}";
            else if constexpr (std::is_same_v<T, CBsonJavaScriptWithScope>)
                return "{\"$code\": " + quote(v.code) + ", \"$scope\": " +
                       (v.scope ? v.scope->toJson() : std::string("{}")) + "}";
            else if constexpr (std::is_same_v<T, int32_t> ||
                               std::is_same_v<T, int64_t>)
                return std::to_string(v);
            else if constexpr (std::is_same_v<T, CBsonTimestamp>)
                return "{\"$timestamp\": {\"t\": " + std::to_string(v.time) +
                       ", \"i\": " + std::to_string(v.increment) + "}}";
            else if constexpr (std::is_same_v<T, CBsonDecimal128>)
            {
                bson_decimal128_t decimal;
                char text[BSON_DECIMAL128_STRING];

                decimal.low = v.low;
                decimal.high = v.high;
                bson_decimal128_to_string(&decimal, text);
                return "{\"$numberDecimal\": \"" + std::string(text) + "\"}";
            }
            else if constexpr (std::is_same_v<T, CBsonMinKey>)
                return "{\"$minKey\": 1}";
            else if constexpr (std::is_same_v<T, CBsonMaxKey>)
                return "{\"$maxKey\": 1}";
            else
                static_assert(always_false_v<T>, "unhandled value type");
        },
        value_);
}

/*-------------------------------------------------------------------------
 * CBsonArray implementation
 *-------------------------------------------------------------------------*/

CBsonArray::CBsonArray(std::initializer_list<CBsonValue> values)
    : values_(values)
{
}

void CBsonArray::add(CBsonValue value)
{
    values_.push_back(std::move(value));
}

size_t CBsonArray::size() const noexcept
{
    return values_.size();
}

bool CBsonArray::isEmpty() const noexcept
{
    return values_.empty();
}

const CBsonValue& CBsonArray::operator[](size_t index) const
{
    return values_[index];
}

const CBsonValue& CBsonArray::at(size_t index) const
{
    return values_.at(index);
}

std::vector<CBsonValue>::const_iterator CBsonArray::begin() const noexcept
{
    return values_.begin();
}

std::vector<CBsonValue>::const_iterator CBsonArray::end() const noexcept
{
    return values_.end();
}

bool CBsonArray::operator==(const CBsonArray& other) const
{
    return values_ == other.values_;
}

size_t CBsonArray::hash() const noexcept
{
    size_t seed = values_.size();
    for (const auto& value : values_)
        detail::hashCombine(seed, value.hash());
    return seed;
}

} /* namespace DocLink */
