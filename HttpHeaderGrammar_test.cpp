// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch.hpp>

#include "HttpHeaderGrammar.h"
#include "HttpRequestError.h"

TEST_CASE("http_request_HeaderGrammar.parseField")
{
    std::string_view name;
    std::string_view value;

    REQUIRE_FALSE(HttpHeaderGrammar::parseField("Accept:   text/html ", name, value));
    REQUIRE("Accept" == name);
    REQUIRE("text/html" == value);

    REQUIRE_FALSE(HttpHeaderGrammar::parseField("X-Colons: a:b:c", name, value));
    REQUIRE("a:b:c" == value);

    REQUIRE_FALSE(HttpHeaderGrammar::parseField("X-Utf8: \xc3\xa4", name, value));
    REQUIRE("\xc3\xa4" == value);
}

TEST_CASE("http_request_HeaderGrammar.parseField_invalid")
{
    std::string_view name = "untouched";
    std::string_view value = "untouched";

    REQUIRE(HttpHeaderGrammar::parseField("NoColon", name, value) == HttpRequestError::InvalidHeaderName);
    REQUIRE(HttpHeaderGrammar::parseField("Bad Name: x", name, value) == HttpRequestError::InvalidHeaderName);
    REQUIRE(HttpHeaderGrammar::parseField("Bad\"Name: x", name, value) == HttpRequestError::InvalidHeaderName);
    REQUIRE(HttpHeaderGrammar::parseField("Name: a\x7f", name, value) == HttpRequestError::InvalidHeaderValue);
    REQUIRE("untouched" == name);
    REQUIRE("untouched" == value);
}

TEST_CASE("http_request_HeaderGrammar.section")
{
    HttpHeaderGrammar grammar(HttpLimits {});
    HttpHeaderList headers;
    HttpCursor cursor("A: 1\r\nb: 2\r\n\r\nbody");

    REQUIRE(HttpHeaderEvent::Field == grammar.parse(cursor, headers).event);
    REQUIRE(HttpHeaderEvent::Field == grammar.parse(cursor, headers).event);
    REQUIRE(HttpHeaderEvent::End == grammar.parse(cursor, headers).event);

    REQUIRE("body" == cursor.rest());
    REQUIRE(2 == headers.size());
    REQUIRE(2 == grammar.fieldCount());
    REQUIRE(8 == grammar.sectionBytes());
    REQUIRE(headers.find("B") == std::optional<std::string_view>("2"));
}

TEST_CASE("http_request_HeaderGrammar.tooManyDetectedAtFirstByte")
{
    HttpLimits limits;
    limits.maxHeaderCount = 1;

    HttpHeaderGrammar grammar(limits);
    HttpHeaderList headers;

    HttpCursor first("A: 1\r\n");
    REQUIRE(HttpHeaderEvent::Field == grammar.parse(first, headers).event);

    SECTION("section terminator is still accepted")
    {
        HttpCursor cursor("\r\n");
        REQUIRE(HttpHeaderEvent::End == grammar.parse(cursor, headers).event);
    }

    SECTION("another field is rejected before it is consumed")
    {
        HttpCursor cursor("B");
        auto const result = grammar.parse(cursor, headers);
        REQUIRE(HttpHeaderEvent::Failed == result.event);
        REQUIRE(result.error == HttpRequestError::TooManyHeaders);
        REQUIRE(0 == cursor.consumed());
    }
}

TEST_CASE("http_request_HeaderGrammar.obsFold")
{
    HttpHeaderGrammar grammar(HttpLimits {});
    HttpHeaderList headers;
    HttpCursor cursor("A: 1\r\n\t2\r\n\r\n");

    REQUIRE(HttpHeaderEvent::Field == grammar.parse(cursor, headers).event);

    auto const result = grammar.parse(cursor, headers);
    REQUIRE(HttpHeaderEvent::Failed == result.event);
    REQUIRE(result.error == HttpRequestError::InvalidHeaderValue);
}
