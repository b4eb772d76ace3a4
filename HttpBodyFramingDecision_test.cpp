// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch.hpp>

#include "HttpBodyFramingDecision.h"
#include "HttpRequestError.h"

#include <initializer_list>
#include <limits>
#include <utility>

namespace
{

HttpHeaderList makeHeaders(std::initializer_list<std::pair<std::string_view, std::string_view>> fields)
{
    HttpHeaderList headers;
    for (auto const& [name, value]: fields)
        headers.push_back(name, value);
    return headers;
}

HttpFramingResult decide(std::initializer_list<std::pair<std::string_view, std::string_view>> fields)
{
    return HttpBodyFramingDecision::decide(makeHeaders(fields), HttpLimits {});
}

} // namespace

TEST_CASE("http_request_BodyFraming.none")
{
    auto const result = decide({ { "Host", "example.com" } });

    REQUIRE_FALSE(result.error);
    REQUIRE(result.framing == HttpBodyFraming::none());
}

TEST_CASE("http_request_BodyFraming.contentLength")
{
    auto const result = decide({ { "content-LENGTH", "42" } });

    REQUIRE_FALSE(result.error);
    REQUIRE(result.framing == HttpBodyFraming::fixedLength(42));
}

TEST_CASE("http_request_BodyFraming.chunked")
{
    auto const result = decide({ { "Transfer-Encoding", "gzip;q=1, Chunked" } });

    REQUIRE_FALSE(result.error);
    REQUIRE(result.framing == HttpBodyFraming::chunked());
}

TEST_CASE("http_request_BodyFraming.conflicting")
{
    REQUIRE(decide({ { "Content-Length", "1" }, { "Transfer-Encoding", "chunked" } }).error
            == HttpRequestError::ConflictingBodyFraming);
    REQUIRE(decide({ { "Transfer-Encoding", "gzip" }, { "Content-Length", "1" } }).error
            == HttpRequestError::ConflictingBodyFraming);
    REQUIRE(decide({ { "Content-Length", "1" }, { "Content-Length", "2" } }).error
            == HttpRequestError::ConflictingBodyFraming);
    REQUIRE(decide({ { "Content-Length", "x" }, { "Content-Length", "y" } }).error
            == HttpRequestError::ConflictingBodyFraming);
    REQUIRE_FALSE(decide({ { "Content-Length", "7" }, { "Content-Length", "7" } }).error);
}

TEST_CASE("http_request_BodyFraming.unsupportedTransferEncoding")
{
    REQUIRE(decide({ { "Transfer-Encoding", "gzip" } }).error == HttpRequestError::UnsupportedTransferEncoding);
    REQUIRE(decide({ { "Transfer-Encoding", " , " } }).error == HttpRequestError::UnsupportedTransferEncoding);
    REQUIRE(decide({ { "Transfer-Encoding", "chunked" }, { "Transfer-Encoding", "chunked" } }).error
            == HttpRequestError::UnsupportedTransferEncoding);
}

TEST_CASE("http_request_BodyFraming.bodyTooLarge")
{
    HttpLimits limits;
    limits.maxBodySize = 10;

    REQUIRE_FALSE(HttpBodyFramingDecision::decide(makeHeaders({ { "Content-Length", "10" } }), limits).error);
    REQUIRE(HttpBodyFramingDecision::decide(makeHeaders({ { "Content-Length", "11" } }), limits).error
            == HttpRequestError::BodyTooLarge);
}

TEST_CASE("http_request_BodyFraming.parseContentLength")
{
    REQUIRE(HttpBodyFramingDecision::parseContentLength("0") == std::optional<std::size_t>(0));
    REQUIRE(HttpBodyFramingDecision::parseContentLength("007") == std::optional<std::size_t>(7));
    REQUIRE(HttpBodyFramingDecision::parseContentLength("123456") == std::optional<std::size_t>(123456));
    REQUIRE(HttpBodyFramingDecision::parseContentLength("184467440737095516160000")
            == std::optional<std::size_t>(std::numeric_limits<std::size_t>::max()));

    REQUIRE_FALSE(HttpBodyFramingDecision::parseContentLength(""));
    REQUIRE_FALSE(HttpBodyFramingDecision::parseContentLength("+1"));
    REQUIRE_FALSE(HttpBodyFramingDecision::parseContentLength("1 "));
    REQUIRE_FALSE(HttpBodyFramingDecision::parseContentLength("1,1"));
    REQUIRE_FALSE(HttpBodyFramingDecision::parseContentLength("1e3"));
}
