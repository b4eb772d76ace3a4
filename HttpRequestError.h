// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>
#include <system_error>
#include <type_traits>

/// Terminal parse errors. Once reported, the parser consumes no further bytes.
enum class HttpRequestError
{
    Success = 0,

    // request-line
    RequestLineTooLong,
    MalformedRequestLine,
    UnsupportedVersion,

    // header section (and chunked trailer section)
    InvalidHeaderName,
    InvalidHeaderValue,
    HeaderFieldTooLarge,
    HeaderSectionTooLarge,
    TooManyHeaders,

    // body framing
    ConflictingBodyFraming,
    UnsupportedTransferEncoding,
    InvalidContentLength,

    // chunked body
    InvalidChunkSize,
    InvalidChunkFraming,
    ChunkLineTooLong,

    BodyTooLarge,
    UnexpectedEndOfInput,
};

std::error_category const& httpRequestCategory() noexcept;

inline std::error_code make_error_code(HttpRequestError ec) noexcept
{
    return { static_cast<int>(ec), httpRequestCategory() };
}

namespace std
{
template <>
struct is_error_code_enum<HttpRequestError>: public std::true_type
{
};
} // namespace std

std::string_view as_string(HttpRequestError ec) noexcept;

/// Maps a parse error to the status code a server would answer with.
///
/// This is advisory only; the parser itself never generates a response.
/// Returns 0 for errors outside of the http-request category.
int toHttpStatus(std::error_code ec) noexcept;
