/*-------------------------------------------------------------------------
 *
 * CErrors.cpp
 *      Error category for DocLink.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CErrors.hpp"

namespace DocLink
{

namespace
{

class CDocLinkCategory : public std::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "doclink";
    }

    std::string message(int value) const override
    {
        switch (static_cast<CDocLinkErrc>(value))
        {
        case CDocLinkErrc::ConnectFailure:
            return "failed to connect to server";
        case CDocLinkErrc::ReadTimeout:
            return "timeout while receiving message";
        case CDocLinkErrc::GenericIOFailure:
            return "I/O failure on stream";
        case CDocLinkErrc::InterruptedWait:
            return "interrupted while waiting for completion";
        case CDocLinkErrc::ClosedTransportUse:
            return "stream is closed";
        case CDocLinkErrc::ReadAlreadyPending:
            return "a read is already pending on this stream";
        case CDocLinkErrc::TlsFailure:
            return "TLS failure";
        case CDocLinkErrc::OpenAlreadyPending:
            return "an open is already in progress on this stream";
        case CDocLinkErrc::ClosedCursorUse:
            return "cursor is closed";
        case CDocLinkErrc::OutOfBounds:
            return "read past end of buffer";
        case CDocLinkErrc::MalformedCString:
            return "cstring is not null terminated";
        case CDocLinkErrc::MalformedString:
            return "string length prefix or terminator is invalid";
        case CDocLinkErrc::MalformedDocument:
            return "document is malformed";
        case CDocLinkErrc::NoMarkSet:
            return "mark not set";
        case CDocLinkErrc::UnsupportedMutation:
            return "lazy document instances are immutable";
        case CDocLinkErrc::UnknownBsonType:
            return "no decoder registered for wire type";
        case CDocLinkErrc::InvalidObjectId:
            return "invalid ObjectId";
        case CDocLinkErrc::EncodeFailure:
            return "failed to encode document";
        }
        return "unknown doclink error";
    }
};

} /* anonymous namespace */

const std::error_category& doclinkCategory() noexcept
{
    static CDocLinkCategory category;
    return category;
}

std::error_code make_error_code(CDocLinkErrc errc) noexcept
{
    return std::error_code(static_cast<int>(errc), doclinkCategory());
}

CDocumentException::CDocumentException(CDocLinkErrc errc)
    : std::system_error(make_error_code(errc))
{
}

CDocumentException::CDocumentException(CDocLinkErrc errc,
                                       const std::string& what)
    : std::system_error(make_error_code(errc), what)
{
}

} /* namespace DocLink */
