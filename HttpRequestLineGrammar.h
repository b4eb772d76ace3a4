// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "HttpCursor.h"
#include "HttpRequest.h"

#include <cstddef>
#include <string_view>
#include <system_error>

enum class HttpGrammarStatus
{
    Incomplete,
    Complete,
    Failed,
};

struct HttpGrammarResult
{
    HttpGrammarStatus status;
    std::error_code error {};

    static HttpGrammarResult incomplete() noexcept { return { HttpGrammarStatus::Incomplete }; }
    static HttpGrammarResult complete() noexcept { return { HttpGrammarStatus::Complete }; }
    static HttpGrammarResult failed(std::error_code ec) noexcept { return { HttpGrammarStatus::Failed, ec }; }
};

/// Request-Line = method SP request-target SP HTTP-version CRLF
class HttpRequestLineGrammar
{
  public:
    explicit HttpRequestLineGrammar(std::size_t maxLength) noexcept: _maxLength(maxLength) {}

    /// Consumes bytes up to and including the request-line's CRLF.
    ///
    /// On completion, method, target and version of @p request are set.
    HttpGrammarResult parse(HttpCursor& cursor, HttpRequest& request);

    /// Validates a complete request line (CRLF already stripped).
    static std::error_code parseLine(std::string_view line, HttpRequest& request);

    /// @return the version denoted by @p text, or HttpVersion::UNKNOWN.
    static HttpVersion parseVersion(std::string_view text) noexcept;

  private:
    std::size_t _maxLength;
    HttpLineBuffer _line;
};
