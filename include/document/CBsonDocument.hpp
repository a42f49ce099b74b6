/*-------------------------------------------------------------------------
 *
 * CBsonDocument.hpp
 *      Mutable, fully decoded document with ordered keys.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonValue.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace DocLink
{

/**
 * Keys keep the order in which they were first inserted; replacing the
 * value of an existing key keeps its position.
 */
class CBsonDocument
{
  public:
    using Entry = std::pair<std::string, CBsonValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    CBsonDocument() = default;
    CBsonDocument(std::initializer_list<Entry> entries);

    /* Query operations */
    size_t size() const noexcept;
    bool isEmpty() const noexcept;
    bool containsKey(const std::string& key) const;
    bool containsValue(const CBsonValue& value) const;
    std::optional<CBsonValue> get(const std::string& key) const;
    const CBsonValue& at(const std::string& key) const;

    const std::vector<Entry>& entrySet() const noexcept;
    std::vector<std::string> keySet() const;
    std::vector<CBsonValue> values() const;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    /* Mutators */
    std::optional<CBsonValue> put(const std::string& key, CBsonValue value);
    CBsonDocument& append(const std::string& key, CBsonValue value);
    void putAll(const CBsonDocument& other);
    std::optional<CBsonValue> remove(const std::string& key);
    void clear() noexcept;

    bool operator==(const CBsonDocument& other) const;
    size_t hash() const noexcept;

    std::string toJson() const;

  private:
    std::vector<Entry>::iterator find(const std::string& key);
    const_iterator find(const std::string& key) const;

    std::vector<Entry> entries_;
};

} /* namespace DocLink */

template <> struct std::hash<DocLink::CBsonDocument>
{
    size_t operator()(const DocLink::CBsonDocument& document) const noexcept
    {
        return document.hash();
    }
};
