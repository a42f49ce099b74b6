/*-------------------------------------------------------------------------
 *
 * CBsonDocument.cpp
 *      Mutable, fully decoded document with ordered keys.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonDocument.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>

namespace DocLink
{

CBsonDocument::CBsonDocument(std::initializer_list<Entry> entries)
{
    for (const auto& entry : entries)
        put(entry.first, entry.second);
}

size_t CBsonDocument::size() const noexcept
{
    return entries_.size();
}

bool CBsonDocument::isEmpty() const noexcept
{
    return entries_.empty();
}

bool CBsonDocument::containsKey(const std::string& key) const
{
    return find(key) != entries_.end();
}

bool CBsonDocument::containsValue(const CBsonValue& value) const
{
    return std::any_of(entries_.begin(), entries_.end(),
                       [&value](const Entry& entry)
                       { return entry.second == value; });
}

std::optional<CBsonValue> CBsonDocument::get(const std::string& key) const
{
    auto it = find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

const CBsonValue& CBsonDocument::at(const std::string& key) const
{
    auto it = find(key);
    if (it == entries_.end())
        throw std::out_of_range("no such key: " + key);
    return it->second;
}

const std::vector<CBsonDocument::Entry>& CBsonDocument::entrySet() const noexcept
{
    return entries_;
}

std::vector<std::string> CBsonDocument::keySet() const
{
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& entry : entries_)
        keys.push_back(entry.first);
    return keys;
}

std::vector<CBsonValue> CBsonDocument::values() const
{
    std::vector<CBsonValue> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_)
        result.push_back(entry.second);
    return result;
}

CBsonDocument::const_iterator CBsonDocument::begin() const noexcept
{
    return entries_.begin();
}

CBsonDocument::const_iterator CBsonDocument::end() const noexcept
{
    return entries_.end();
}

/*
 * put
 *		Insert or replace; returns the previous value if the key existed
 */
std::optional<CBsonValue> CBsonDocument::put(const std::string& key,
                                             CBsonValue value)
{
    auto it = find(key);
    if (it == entries_.end())
    {
        entries_.emplace_back(key, std::move(value));
        return std::nullopt;
    }

    CBsonValue previous = std::move(it->second);
    it->second = std::move(value);
    return previous;
}

CBsonDocument& CBsonDocument::append(const std::string& key, CBsonValue value)
{
    put(key, std::move(value));
    return *this;
}

void CBsonDocument::putAll(const CBsonDocument& other)
{
    for (const auto& entry : other.entries_)
        put(entry.first, entry.second);
}

std::optional<CBsonValue> CBsonDocument::remove(const std::string& key)
{
    auto it = find(key);
    if (it == entries_.end())
        return std::nullopt;

    CBsonValue previous = std::move(it->second);
    entries_.erase(it);
    return previous;
}

void CBsonDocument::clear() noexcept
{
    entries_.clear();
}

bool CBsonDocument::operator==(const CBsonDocument& other) const
{
    return entries_ == other.entries_;
}

size_t CBsonDocument::hash() const noexcept
{
    size_t seed = entries_.size();
    for (const auto& entry : entries_)
    {
        detail::hashCombine(seed, std::hash<std::string>{}(entry.first));
        detail::hashCombine(seed, entry.second.hash());
    }
    return seed;
}

std::string CBsonDocument::toJson() const
{
    std::string result = "{";
    bool first = true;

    for (const auto& entry : entries_)
    {
        if (!first)
            result += ", ";
        /* keys go through the same escaping as string values */
        result += CBsonValue(entry.first).toJson();
        result += ": ";
        result += entry.second.toJson();
        first = false;
    }
    return result + "}";
}

std::vector<CBsonDocument::Entry>::iterator
CBsonDocument::find(const std::string& key)
{
    return std::find_if(entries_.begin(), entries_.end(),
                        [&key](const Entry& entry)
                        { return entry.first == key; });
}

CBsonDocument::const_iterator CBsonDocument::find(const std::string& key) const
{
    return std::find_if(entries_.begin(), entries_.end(),
                        [&key](const Entry& entry)
                        { return entry.first == key; });
}

} /* namespace DocLink */
