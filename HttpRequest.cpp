// SPDX-License-Identifier: Apache-2.0
#include "HttpRequest.h"

#include "HttpCharacters.h"

#include <algorithm>

std::string_view as_string(HttpVersion version) noexcept
{
    switch (version)
    {
        case HttpVersion::VERSION_1_0: return "HTTP/1.0";
        case HttpVersion::VERSION_1_1: return "HTTP/1.1";
        case HttpVersion::UNKNOWN: break;
    }

    return "UNKNOWN";
}

std::string_view as_string(HttpBodyFraming::Kind kind) noexcept
{
    switch (kind)
    {
        case HttpBodyFraming::None: return "none";
        case HttpBodyFraming::FixedLength: return "fixed-length";
        case HttpBodyFraming::Chunked: return "chunked";
    }

    return "UNKNOWN";
}

void HttpHeaderList::push_back(std::string_view name, std::string_view value)
{
    _fields.push_back(HttpHeader { std::string(name), std::string(value) });
}

std::optional<std::string_view> HttpHeaderList::find(std::string_view name) const noexcept
{
    for (HttpHeader const& field: _fields)
        if (httpchars::iequals(field.name, name))
            return std::string_view(field.value);

    return std::nullopt;
}

std::size_t HttpHeaderList::count(std::string_view name) const noexcept
{
    return static_cast<std::size_t>(std::count_if(_fields.begin(), _fields.end(), [&](HttpHeader const& field) {
        return httpchars::iequals(field.name, name);
    }));
}

bool operator==(HttpHeader const& a, HttpHeader const& b) noexcept
{
    return a.name == b.name && a.value == b.value;
}

bool operator==(HttpRequest const& a, HttpRequest const& b) noexcept
{
    return a.method == b.method && a.target == b.target && a.version == b.version
           && a.headers.size() == b.headers.size()
           && std::equal(a.headers.begin(), a.headers.end(), b.headers.begin()) && a.framing == b.framing
           && a.trailerBegin == b.trailerBegin && a.body == b.body;
}
