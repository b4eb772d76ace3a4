// SPDX-License-Identifier: Apache-2.0
#include "HttpBodyFramingDecision.h"

#include "HttpCharacters.h"
#include "HttpRequestError.h"

#include <limits>
#include <vector>

using namespace httpchars;

namespace
{

constexpr std::string_view ContentLength = "Content-Length";
constexpr std::string_view TransferEncoding = "Transfer-Encoding";

/// Collects the transfer-codings of all Transfer-Encoding fields, in order,
/// without their parameters.
std::vector<std::string_view> listCodings(HttpHeaderList const& headers)
{
    std::vector<std::string_view> codings;

    for (HttpHeader const& field: headers)
    {
        if (!iequals(field.name, TransferEncoding))
            continue;

        std::string_view list = field.value;
        while (!list.empty())
        {
            auto const comma = list.find(',');
            auto element = list.substr(0, comma);
            list = comma == std::string_view::npos ? std::string_view {} : list.substr(comma + 1);

            if (auto const semicolon = element.find(';'); semicolon != std::string_view::npos)
                element = element.substr(0, semicolon);

            element = trimWhitespace(element);
            if (!element.empty())
                codings.push_back(element);
        }
    }

    return codings;
}

HttpFramingResult decideTransferEncoding(HttpHeaderList const& headers)
{
    auto const codings = listCodings(headers);
    if (codings.empty())
        return { {}, HttpRequestError::UnsupportedTransferEncoding };

    std::size_t chunkedCount = 0;
    for (std::string_view const coding: codings)
        if (iequals(coding, "chunked"))
            chunkedCount++;

    // chunked must be applied exactly once, and last
    if (chunkedCount != 1 || !iequals(codings.back(), "chunked"))
        return { {}, HttpRequestError::UnsupportedTransferEncoding };

    return { HttpBodyFraming::chunked() };
}

HttpFramingResult decideContentLength(HttpHeaderList const& headers, HttpLimits const& limits)
{
    std::optional<std::string_view> first;

    for (HttpHeader const& field: headers)
    {
        if (!iequals(field.name, ContentLength))
            continue;

        if (!first)
            first = field.value;
        else if (*first != field.value)
            return { {}, HttpRequestError::ConflictingBodyFraming };
    }

    auto const length = HttpBodyFramingDecision::parseContentLength(*first);
    if (!length)
        return { {}, HttpRequestError::InvalidContentLength };

    if (*length > limits.maxBodySize)
        return { {}, HttpRequestError::BodyTooLarge };

    return { HttpBodyFraming::fixedLength(*length) };
}

} // namespace

HttpFramingResult HttpBodyFramingDecision::decide(HttpHeaderList const& headers, HttpLimits const& limits)
{
    bool const hasContentLength = headers.contains(ContentLength);
    bool const hasTransferEncoding = headers.contains(TransferEncoding);

    if (hasTransferEncoding && hasContentLength)
        return { {}, HttpRequestError::ConflictingBodyFraming };

    if (hasTransferEncoding)
        return decideTransferEncoding(headers);

    if (hasContentLength)
        return decideContentLength(headers, limits);

    return { HttpBodyFraming::none() };
}

std::optional<std::size_t> HttpBodyFramingDecision::parseContentLength(std::string_view value) noexcept
{
    if (value.empty())
        return std::nullopt;

    constexpr std::size_t Max = std::numeric_limits<std::size_t>::max();
    std::size_t result = 0;

    for (char const c: value)
    {
        if (!isDigit(c))
            return std::nullopt;

        auto const digit = static_cast<std::size_t>(c - '0');
        if (result > (Max - digit) / 10)
            result = Max;
        else
            result = result * 10 + digit;
    }

    return result;
}
