/*-------------------------------------------------------------------------
 *
 * CErrors.hpp
 *      Error codes and error category for DocLink.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace DocLink
{

/**
 * Failure kinds reported by the transport and document layers
 */
enum class CDocLinkErrc
{
    /* Transport */
    ConnectFailure = 1,
    ReadTimeout,
    GenericIOFailure,
    InterruptedWait,
    ClosedTransportUse,
    ReadAlreadyPending,
    TlsFailure,
    OpenAlreadyPending,

    /* Binary cursor and documents */
    ClosedCursorUse = 100,
    OutOfBounds,
    MalformedCString,
    MalformedString,
    MalformedDocument,
    NoMarkSet,
    UnsupportedMutation,
    UnknownBsonType,
    InvalidObjectId,
    EncodeFailure
};

const std::error_category& doclinkCategory() noexcept;

std::error_code make_error_code(CDocLinkErrc errc) noexcept;

/**
 * Thrown by decode and document operations; carries a CDocLinkErrc code
 */
class CDocumentException : public std::system_error
{
  public:
    explicit CDocumentException(CDocLinkErrc errc);
    CDocumentException(CDocLinkErrc errc, const std::string& what);
};

} /* namespace DocLink */

namespace std
{
template <> struct is_error_code_enum<DocLink::CDocLinkErrc> : true_type
{
};
} /* namespace std */
