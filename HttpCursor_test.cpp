// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch.hpp>

#include "HttpCursor.h"

#include <initializer_list>
#include <limits>

TEST_CASE("http_request_Cursor.take")
{
    HttpCursor cursor("abcdef");

    REQUIRE("ab" == cursor.take(2));
    REQUIRE(2 == cursor.consumed());
    REQUIRE('c' == cursor.peek());

    cursor.advance(1);
    REQUIRE("def" == cursor.rest());

    REQUIRE("def" == cursor.take(10));
    REQUIRE(cursor.empty());
    REQUIRE(0 == cursor.remaining());
    REQUIRE("" == cursor.take(1));
}

TEST_CASE("http_request_LineBuffer.singleFragmentIsNotCopied")
{
    std::string_view const input = "GET / HTTP/1.1\r\nHost: x\r\n";
    HttpCursor cursor(input);
    HttpLineBuffer buffer;

    auto const scan = buffer.scan(cursor, 100);

    REQUIRE(HttpLineStatus::Complete == scan.status);
    REQUIRE("GET / HTTP/1.1" == scan.line);
    REQUIRE(input.data() == scan.line.data());
    REQUIRE_FALSE(scan.bareLF);
    REQUIRE(16 == cursor.consumed());

    auto const next = buffer.scan(cursor, 100);
    REQUIRE(HttpLineStatus::Complete == next.status);
    REQUIRE("Host: x" == next.line);
    REQUIRE(cursor.empty());
}

TEST_CASE("http_request_LineBuffer.spanningFragments")
{
    HttpLineBuffer buffer;

    HttpCursor first("GET /");
    REQUIRE(HttpLineStatus::Incomplete == buffer.scan(first, 100).status);
    REQUIRE(first.empty());
    REQUIRE(5 == buffer.size());

    HttpCursor second(" HTTP/1.1\r");
    REQUIRE(HttpLineStatus::Incomplete == buffer.scan(second, 100).status);

    HttpCursor third("\nrest");
    auto const scan = buffer.scan(third, 100);

    REQUIRE(HttpLineStatus::Complete == scan.status);
    REQUIRE("GET / HTTP/1.1" == scan.line);
    REQUIRE(1 == third.consumed());
    REQUIRE(0 == buffer.size());
}

TEST_CASE("http_request_LineBuffer.bareLF")
{
    HttpCursor cursor("abc\n");
    HttpLineBuffer buffer;

    auto const scan = buffer.scan(cursor, 100);

    REQUIRE(HttpLineStatus::Complete == scan.status);
    REQUIRE(scan.bareLF);
    REQUIRE("abc" == scan.line);
}

TEST_CASE("http_request_LineBuffer.tooLong")
{
    SECTION("single fragment")
    {
        HttpCursor cursor("abcde\r\n");
        HttpLineBuffer buffer;

        REQUIRE(HttpLineStatus::TooLong == buffer.scan(cursor, 4).status);
        REQUIRE(0 == cursor.consumed());
    }

    SECTION("content at the limit followed by garbage")
    {
        HttpCursor cursor("abcd\rX\n");
        HttpLineBuffer buffer;

        REQUIRE(HttpLineStatus::TooLong == buffer.scan(cursor, 4).status);
    }

    SECTION("at the limit, one byte per fragment")
    {
        HttpLineBuffer buffer;
        for (char const c: std::string_view("abcd\r"))
        {
            HttpCursor cursor(std::string_view(&c, 1));
            REQUIRE(HttpLineStatus::Incomplete == buffer.scan(cursor, 4).status);
            REQUIRE(cursor.empty());
        }

        HttpCursor last("\n");
        auto const scan = buffer.scan(last, 4);
        REQUIRE(HttpLineStatus::Complete == scan.status);
        REQUIRE("abcd" == scan.line);
    }

    SECTION("one byte beyond the limit is never retained")
    {
        HttpLineBuffer buffer;

        HttpCursor first("abcd");
        REQUIRE(HttpLineStatus::Incomplete == buffer.scan(first, 4).status);

        HttpCursor second("e");
        REQUIRE(HttpLineStatus::TooLong == buffer.scan(second, 4).status);
        REQUIRE(0 == second.consumed());
        REQUIRE(4 == buffer.size());
    }
}

TEST_CASE("http_request_LineBuffer.unboundedLimit")
{
    auto const max = std::numeric_limits<std::size_t>::max();

    for (std::size_t const limit: { max, max - 1, max - 2 })
    {
        INFO("limit " << limit);
        HttpLineBuffer buffer;

        HttpCursor first("Host: exa");
        REQUIRE(HttpLineStatus::Incomplete == buffer.scan(first, limit).status);
        REQUIRE(first.empty());

        HttpCursor second("mple.com\r\n");
        auto const scan = buffer.scan(second, limit);
        REQUIRE(HttpLineStatus::Complete == scan.status);
        REQUIRE("Host: example.com" == scan.line);
    }
}
