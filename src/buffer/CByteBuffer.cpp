/*-------------------------------------------------------------------------
 *
 * CByteBuffer.cpp
 *      Owned byte regions with shared, pooled backing storage.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "buffer/CByteBuffer.hpp"

#include "CErrors.hpp"
#include "buffer/CBufferPool.hpp"

#include <cstring>

namespace DocLink
{

CBufferStorage::~CBufferStorage()
{
    if (auto owner = pool.lock())
        owner->recycle(std::move(bytes));
}

/*-------------------------------------------------------------------------
 * CByteBuffer implementation
 *-------------------------------------------------------------------------*/

CByteBuffer::CByteBuffer() noexcept : storage_(nullptr), begin_(0), end_(0)
{
}

CByteBuffer::CByteBuffer(std::vector<uint8_t> bytes)
    : storage_(std::make_shared<CBufferStorage>(std::move(bytes))), begin_(0),
      end_(0)
{
    end_ = storage_->bytes.size();
}

CByteBuffer::CByteBuffer(std::shared_ptr<CBufferStorage> storage)
    : storage_(std::move(storage)), begin_(0), end_(0)
{
}

CByteBuffer::CByteBuffer(CByteBuffer&& other) noexcept
    : storage_(std::move(other.storage_)), begin_(other.begin_),
      end_(other.end_)
{
    other.begin_ = 0;
    other.end_ = 0;
}

CByteBuffer& CByteBuffer::operator=(CByteBuffer&& other) noexcept
{
    if (this != &other)
    {
        storage_ = std::move(other.storage_);
        begin_ = other.begin_;
        end_ = other.end_;
        other.begin_ = 0;
        other.end_ = 0;
    }
    return *this;
}

size_t CByteBuffer::size() const noexcept
{
    return end_ - begin_;
}

bool CByteBuffer::empty() const noexcept
{
    return end_ == begin_;
}

const uint8_t* CByteBuffer::data() const noexcept
{
    if (!storage_)
        return nullptr;
    return storage_->bytes.data() + begin_;
}

uint8_t CByteBuffer::at(size_t index) const
{
    if (!storage_ || index >= size())
        throw CDocumentException(CDocLinkErrc::OutOfBounds);
    return storage_->bytes[begin_ + index];
}

size_t CByteBuffer::writableBytes() const noexcept
{
    if (!storage_)
        return 0;
    return storage_->bytes.size() - end_;
}

size_t CByteBuffer::capacity() const noexcept
{
    if (!storage_)
        return 0;
    return storage_->bytes.size() - begin_;
}

uint8_t* CByteBuffer::writePointer() noexcept
{
    if (!storage_)
        return nullptr;
    return storage_->bytes.data() + end_;
}

/*
 * put
 *		Append bytes after the readable window
 */
void CByteBuffer::put(const void* bytes, size_t length)
{
    if (length > writableBytes())
        throw CDocumentException(CDocLinkErrc::OutOfBounds,
                                 "buffer capacity exceeded");
    if (length == 0)
        return;
    std::memcpy(writePointer(), bytes, length);
    end_ += length;
}

/*
 * commit
 *		Extend the readable window over bytes written through writePointer
 */
void CByteBuffer::commit(size_t length)
{
    if (length > writableBytes())
        throw CDocumentException(CDocLinkErrc::OutOfBounds,
                                 "buffer capacity exceeded");
    end_ += length;
}

/*
 * split
 *		Return a handle on the first length readable bytes; both handles
 *		share the same storage afterwards.
 */
CByteBuffer CByteBuffer::split(size_t length)
{
    if (length > size())
        throw CDocumentException(CDocLinkErrc::OutOfBounds);

    CByteBuffer prefix(storage_);
    prefix.begin_ = begin_;
    prefix.end_ = begin_ + length;
    begin_ += length;
    return prefix;
}

void CByteBuffer::consume(size_t length)
{
    if (length > size())
        throw CDocumentException(CDocLinkErrc::OutOfBounds);
    begin_ += length;
}

CByteBuffer CByteBuffer::retain() const
{
    CByteBuffer copy(storage_);
    copy.begin_ = begin_;
    copy.end_ = end_;
    return copy;
}

void CByteBuffer::release() noexcept
{
    storage_.reset();
    begin_ = 0;
    end_ = 0;
}

bool CByteBuffer::isReleased() const noexcept
{
    return storage_ == nullptr;
}

long CByteBuffer::referenceCount() const noexcept
{
    return storage_ ? storage_.use_count() : 0;
}

std::vector<uint8_t> CByteBuffer::toVector() const
{
    if (empty())
        return {};
    return std::vector<uint8_t>(data(), data() + size());
}

/*-------------------------------------------------------------------------
 * CCompositeBuffer implementation
 *-------------------------------------------------------------------------*/

void CCompositeBuffer::addComponent(CByteBuffer&& component)
{
    size_ += component.size();
    components_.push_back(std::move(component));
}

size_t CCompositeBuffer::size() const noexcept
{
    return size_;
}

size_t CCompositeBuffer::componentCount() const noexcept
{
    return components_.size();
}

const CByteBuffer& CCompositeBuffer::component(size_t index) const
{
    if (index >= components_.size())
        throw CDocumentException(CDocLinkErrc::OutOfBounds);
    return components_[index];
}

uint8_t CCompositeBuffer::at(size_t index) const
{
    for (const auto& component : components_)
    {
        if (index < component.size())
            return component.at(index);
        index -= component.size();
    }
    throw CDocumentException(CDocLinkErrc::OutOfBounds);
}

std::vector<uint8_t> CCompositeBuffer::toVector() const
{
    std::vector<uint8_t> result;
    result.reserve(size_);
    for (const auto& component : components_)
        result.insert(result.end(), component.data(),
                      component.data() + component.size());
    return result;
}

CByteBuffer CCompositeBuffer::flatten()
{
    CByteBuffer result;

    if (components_.size() == 1)
        result = std::move(components_.front());
    else
        result = CByteBuffer(toVector());

    components_.clear();
    size_ = 0;
    return result;
}

void CCompositeBuffer::release() noexcept
{
    for (auto& component : components_)
        component.release();
    components_.clear();
    size_ = 0;
}

} /* namespace DocLink */
