// SPDX-License-Identifier: Apache-2.0
#include "HttpHeaderGrammar.h"

#include "HttpCharacters.h"
#include "HttpRequestError.h"

#include <algorithm>

using namespace httpchars;

HttpHeaderGrammar::HttpHeaderGrammar(HttpLimits const& limits) noexcept:
    _maxCount(limits.maxHeaderCount),
    _maxFieldBytes(limits.maxSingleHeaderBytes),
    _maxSectionBytes(limits.maxHeaderSectionBytes)
{
}

HttpHeaderResult HttpHeaderGrammar::parse(HttpCursor& cursor, HttpHeaderList& headers)
{
    // Reject the field that would exceed the count as soon as its first byte
    // shows it is not the section terminator.
    if (_fieldCount >= _maxCount && _line.size() == 0 && !cursor.empty() && cursor.peek() != CR
        && cursor.peek() != LF)
        return { HttpHeaderEvent::Failed, HttpRequestError::TooManyHeaders };

    std::size_t const sectionRemaining = _maxSectionBytes - _sectionBytes;
    std::size_t const maxContent = std::min(_maxFieldBytes, sectionRemaining);

    auto const scan = _line.scan(cursor, maxContent);

    switch (scan.status)
    {
        case HttpLineStatus::Incomplete: return { HttpHeaderEvent::Incomplete };
        case HttpLineStatus::TooLong:
            if (_maxFieldBytes <= sectionRemaining)
                return { HttpHeaderEvent::Failed, HttpRequestError::HeaderFieldTooLarge };
            else
                return { HttpHeaderEvent::Failed, HttpRequestError::HeaderSectionTooLarge };
        case HttpLineStatus::Complete: break;
    }

    if (scan.bareLF)
        return { HttpHeaderEvent::Failed, HttpRequestError::InvalidHeaderValue };

    if (scan.line.empty())
        return { HttpHeaderEvent::End };

    // obs-fold: a continuation line of the previous field
    if (isWhitespace(scan.line.front()))
        return { HttpHeaderEvent::Failed, HttpRequestError::InvalidHeaderValue };

    std::string_view name;
    std::string_view value;
    if (auto const ec = parseField(scan.line, name, value); ec)
        return { HttpHeaderEvent::Failed, ec };

    headers.push_back(name, value);
    _fieldCount++;
    _sectionBytes += scan.line.size();

    return { HttpHeaderEvent::Field };
}

std::error_code HttpHeaderGrammar::parseField(std::string_view line,
                                              std::string_view& name,
                                              std::string_view& value) noexcept
{
    auto const colon = line.find(':');
    if (colon == std::string_view::npos)
        return HttpRequestError::InvalidHeaderName;

    // no whitespace allowed between field-name and colon
    auto const fieldName = line.substr(0, colon);
    if (!isToken(fieldName))
        return HttpRequestError::InvalidHeaderName;

    auto const fieldValue = trimWhitespace(line.substr(colon + 1));
    for (char const c: fieldValue)
        if (!isFieldText(c))
            return HttpRequestError::InvalidHeaderValue;

    name = fieldName;
    value = fieldValue;

    return {};
}
