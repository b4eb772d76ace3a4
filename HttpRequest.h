// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class HttpVersion
{
    /// request-line not parsed yet; never the result of parsing input
    UNKNOWN = 0,
    VERSION_1_0 = 10,
    VERSION_1_1 = 11,
};

std::string_view as_string(HttpVersion version) noexcept;

struct HttpHeader
{
    std::string name;
    std::string value;
};

/// Ordered header fields, duplicates and original casing preserved.
///
/// Lookups compare names case-insensitively.
class HttpHeaderList
{
  public:
    using const_iterator = std::vector<HttpHeader>::const_iterator;

    void push_back(std::string_view name, std::string_view value);

    /// @return value of the first field named @p name, if any.
    std::optional<std::string_view> find(std::string_view name) const noexcept;

    bool contains(std::string_view name) const noexcept { return find(name).has_value(); }
    std::size_t count(std::string_view name) const noexcept;

    std::size_t size() const noexcept { return _fields.size(); }
    bool empty() const noexcept { return _fields.empty(); }
    HttpHeader const& operator[](std::size_t i) const noexcept { return _fields[i]; }

    const_iterator begin() const noexcept { return _fields.begin(); }
    const_iterator end() const noexcept { return _fields.end(); }

  private:
    std::vector<HttpHeader> _fields;
};

/// The body strategy selected once the header section is closed.
struct HttpBodyFraming
{
    enum Kind
    {
        None,
        FixedLength,
        Chunked,
    };

    Kind kind = None;

    /// body length, only meaningful for FixedLength
    std::size_t length = 0;

    static constexpr HttpBodyFraming none() noexcept { return {}; }
    static constexpr HttpBodyFraming fixedLength(std::size_t n) noexcept { return { FixedLength, n }; }
    static constexpr HttpBodyFraming chunked() noexcept { return { Chunked, 0 }; }

    constexpr bool operator==(HttpBodyFraming const& other) const noexcept
    {
        return kind == other.kind && length == other.length;
    }
    constexpr bool operator!=(HttpBodyFraming const& other) const noexcept { return !(*this == other); }
};

std::string_view as_string(HttpBodyFraming::Kind kind) noexcept;

/// A parsed HTTP/1.x request message.
struct HttpRequest
{
    std::string method;

    /// request-target as received; neither decoded nor normalized
    std::string target;

    HttpVersion version = HttpVersion::UNKNOWN;
    HttpHeaderList headers;
    HttpBodyFraming framing;

    /// index into headers where chunked trailer fields begin
    std::size_t trailerBegin = 0;

    /// decoded body; stays empty in HttpBodyMode::Streaming
    std::string body;
};

bool operator==(HttpHeader const& a, HttpHeader const& b) noexcept;
bool operator==(HttpRequest const& a, HttpRequest const& b) noexcept;
