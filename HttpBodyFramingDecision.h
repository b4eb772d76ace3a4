// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "HttpLimits.h"
#include "HttpRequest.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

struct HttpFramingResult
{
    HttpBodyFraming framing {};
    std::error_code error {};
};

/// Selects the body strategy of a request once its header section is closed.
///
/// Exactly one of Content-Length and chunked Transfer-Encoding may frame the
/// body; any request carrying both is rejected rather than resolved in favour
/// of either.
class HttpBodyFramingDecision
{
  public:
    static HttpFramingResult decide(HttpHeaderList const& headers, HttpLimits const& limits);

    /// Parses a Content-Length value: 1*DIGIT, no sign, no whitespace.
    ///
    /// @return the value, or std::nullopt if the syntax is invalid.
    ///         Values not representable as size_t saturate to SIZE_MAX.
    static std::optional<std::size_t> parseContentLength(std::string_view value) noexcept;
};
