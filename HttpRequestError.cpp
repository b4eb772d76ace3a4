// SPDX-License-Identifier: Apache-2.0
#include "HttpRequestError.h"

#include <string>

namespace // {{{ category
{

class HttpRequestCategory: public std::error_category
{
  public:
    char const* name() const noexcept override { return "http-request"; }

    std::string message(int ec) const override
    {
        return std::string(as_string(static_cast<HttpRequestError>(ec)));
    }
};

} // }}}

std::error_category const& httpRequestCategory() noexcept
{
    static HttpRequestCategory const category;
    return category;
}

std::string_view as_string(HttpRequestError ec) noexcept
{
    switch (ec)
    {
        case HttpRequestError::Success: return "Success";
        case HttpRequestError::RequestLineTooLong: return "Request line too long";
        case HttpRequestError::MalformedRequestLine: return "Malformed request line";
        case HttpRequestError::UnsupportedVersion: return "Unsupported HTTP version";
        case HttpRequestError::InvalidHeaderName: return "Invalid header name";
        case HttpRequestError::InvalidHeaderValue: return "Invalid header value";
        case HttpRequestError::HeaderFieldTooLarge: return "Header field too large";
        case HttpRequestError::HeaderSectionTooLarge: return "Header section too large";
        case HttpRequestError::TooManyHeaders: return "Too many headers";
        case HttpRequestError::ConflictingBodyFraming: return "Conflicting body framing";
        case HttpRequestError::UnsupportedTransferEncoding: return "Unsupported transfer encoding";
        case HttpRequestError::InvalidContentLength: return "Invalid Content-Length";
        case HttpRequestError::InvalidChunkSize: return "Invalid chunk size";
        case HttpRequestError::InvalidChunkFraming: return "Invalid chunk framing";
        case HttpRequestError::ChunkLineTooLong: return "Chunk size line too long";
        case HttpRequestError::BodyTooLarge: return "Body too large";
        case HttpRequestError::UnexpectedEndOfInput: return "Unexpected end of input";
    }

    return "Undefined";
}

int toHttpStatus(std::error_code ec) noexcept
{
    if (ec.category() != httpRequestCategory())
        return 0;

    switch (static_cast<HttpRequestError>(ec.value()))
    {
        case HttpRequestError::Success: return 200;
        case HttpRequestError::RequestLineTooLong: return 414; // URI Too Long
        case HttpRequestError::UnsupportedVersion: return 505; // HTTP Version Not Supported
        case HttpRequestError::HeaderFieldTooLarge:
        case HttpRequestError::HeaderSectionTooLarge:
        case HttpRequestError::TooManyHeaders: return 431; // Request Header Fields Too Large
        case HttpRequestError::UnsupportedTransferEncoding: return 501; // Not Implemented
        case HttpRequestError::BodyTooLarge: return 413; // Payload Too Large
        case HttpRequestError::MalformedRequestLine:
        case HttpRequestError::InvalidHeaderName:
        case HttpRequestError::InvalidHeaderValue:
        case HttpRequestError::ConflictingBodyFraming:
        case HttpRequestError::InvalidContentLength:
        case HttpRequestError::InvalidChunkSize:
        case HttpRequestError::InvalidChunkFraming:
        case HttpRequestError::ChunkLineTooLong:
        case HttpRequestError::UnexpectedEndOfInput: return 400;
    }

    return 400;
}
