// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string_view>

/// Character classes of the HTTP/1.1 message grammar (RFC 7230, section 3.2.6).
namespace httpchars
{

char constexpr CR = 0x0D;
char constexpr LF = 0x0A;
char constexpr SP = 0x20;
char constexpr HT = 0x09;
char constexpr NUL = 0x00;

constexpr char toLower(char value) noexcept
{
    return value >= 'A' && value <= 'Z' ? static_cast<char>(value - 'A' + 'a') : value;
}

constexpr bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (toLower(a[i]) != toLower(b[i]))
            return false;
    }

    return true;
}

constexpr bool isChar(char value) noexcept
{
    return static_cast<unsigned char>(value) <= 127;
}

constexpr bool isControl(char value) noexcept
{
    return (value >= 0 && value <= 31) || value == 127;
}

constexpr bool isDigit(char value) noexcept
{
    return value >= '0' && value <= '9';
}

/// @return the value of a hexadecimal digit, or -1 if @p value is none.
constexpr int hexValue(char value) noexcept
{
    if (value >= '0' && value <= '9')
        return value - '0';
    if (value >= 'a' && value <= 'f')
        return value - 'a' + 10;
    if (value >= 'A' && value <= 'F')
        return value - 'A' + 10;
    return -1;
}

constexpr bool isSeparator(char value) noexcept
{
    switch (value)
    {
        case '(':
        case ')':
        case '<':
        case '>':
        case '@':
        case ',':
        case ';':
        case ':':
        case '\\':
        case '"':
        case '/':
        case '[':
        case ']':
        case '?':
        case '=':
        case '{':
        case '}':
        case SP:
        case HT: return true;
        default: return false;
    }
}

constexpr bool isToken(char value) noexcept
{
    return isChar(value) && !(isControl(value) || isSeparator(value));
}

constexpr bool isToken(std::string_view value) noexcept
{
    if (value.empty())
        return false;

    for (char const c: value)
        if (!isToken(c))
            return false;

    return true;
}

constexpr bool isWhitespace(char value) noexcept
{
    return value == SP || value == HT;
}

/// field-vchar, obs-text, SP and HT.
constexpr bool isFieldText(char value) noexcept
{
    return !isControl(value) || value == HT;
}

constexpr std::string_view trimWhitespace(std::string_view value) noexcept
{
    while (!value.empty() && isWhitespace(value.front()))
        value.remove_prefix(1);

    while (!value.empty() && isWhitespace(value.back()))
        value.remove_suffix(1);

    return value;
}

} // namespace httpchars
