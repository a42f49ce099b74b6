/*-------------------------------------------------------------------------
 *
 * IStream.hpp
 *      Byte stream to a server, with blocking and completion-based calls.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "buffer/CByteBuffer.hpp"
#include "network/CServerAddress.hpp"

#include <cstddef>
#include <functional>
#include <system_error>
#include <vector>

namespace DocLink
{

/**
 * Interface for a connection-oriented byte stream. read(n) always yields
 * exactly n bytes. Handlers may run on another thread.
 */
class IStream
{
  public:
    using OpenHandler = std::function<void(const std::error_code&)>;
    using WriteHandler = std::function<void(const std::error_code&)>;
    using ReadHandler =
        std::function<void(const std::error_code&, CCompositeBuffer)>;

    virtual ~IStream() = default;

    virtual CByteBuffer getBuffer(size_t size) = 0;

    virtual std::error_code open() = 0;
    virtual void openAsync(OpenHandler handler) = 0;

    virtual std::error_code write(std::vector<CByteBuffer> buffers) = 0;
    virtual void writeAsync(std::vector<CByteBuffer> buffers,
                            WriteHandler handler) = 0;

    virtual std::error_code read(size_t numBytes, CCompositeBuffer& result) = 0;
    virtual void readAsync(size_t numBytes, ReadHandler handler) = 0;

    virtual const CServerAddress& getAddress() const noexcept = 0;
    virtual void close() = 0;
    virtual bool isClosed() const = 0;
};

} /* namespace DocLink */
