// SPDX-License-Identifier: Apache-2.0
#include "HttpRequestLineGrammar.h"

#include "HttpCharacters.h"
#include "HttpRequestError.h"

using namespace httpchars;

HttpGrammarResult HttpRequestLineGrammar::parse(HttpCursor& cursor, HttpRequest& request)
{
    auto const scan = _line.scan(cursor, _maxLength);

    switch (scan.status)
    {
        case HttpLineStatus::Incomplete: return HttpGrammarResult::incomplete();
        case HttpLineStatus::TooLong: return HttpGrammarResult::failed(HttpRequestError::RequestLineTooLong);
        case HttpLineStatus::Complete: break;
    }

    if (scan.bareLF)
        return HttpGrammarResult::failed(HttpRequestError::MalformedRequestLine);

    if (auto const ec = parseLine(scan.line, request); ec)
        return HttpGrammarResult::failed(ec);

    return HttpGrammarResult::complete();
}

std::error_code HttpRequestLineGrammar::parseLine(std::string_view line, HttpRequest& request)
{
    auto const firstSP = line.find(SP);
    if (firstSP == std::string_view::npos)
        return HttpRequestError::MalformedRequestLine;

    auto const secondSP = line.find(SP, firstSP + 1);
    if (secondSP == std::string_view::npos || line.find(SP, secondSP + 1) != std::string_view::npos)
        return HttpRequestError::MalformedRequestLine;

    auto const method = line.substr(0, firstSP);
    auto const target = line.substr(firstSP + 1, secondSP - firstSP - 1);
    auto const version = line.substr(secondSP + 1);

    if (!isToken(method))
        return HttpRequestError::MalformedRequestLine;

    if (target.empty())
        return HttpRequestError::MalformedRequestLine;

    for (char const c: target)
        if (isControl(c))
            return HttpRequestError::MalformedRequestLine;

    // stray CR, NUL or HT in the version field is a framing defect, not an
    // unknown version
    for (char const c: version)
        if (isControl(c))
            return HttpRequestError::MalformedRequestLine;

    if (version.empty())
        return HttpRequestError::MalformedRequestLine;

    auto const httpVersion = parseVersion(version);
    if (httpVersion == HttpVersion::UNKNOWN)
        return HttpRequestError::UnsupportedVersion;

    request.method = method;
    request.target = target;
    request.version = httpVersion;

    return {};
}

HttpVersion HttpRequestLineGrammar::parseVersion(std::string_view text) noexcept
{
    if (text == "HTTP/1.1")
        return HttpVersion::VERSION_1_1;

    if (text == "HTTP/1.0")
        return HttpVersion::VERSION_1_0;

    return HttpVersion::UNKNOWN;
}
