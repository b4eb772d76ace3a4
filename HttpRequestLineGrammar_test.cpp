// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch.hpp>

#include "HttpRequestError.h"
#include "HttpRequestLineGrammar.h"

TEST_CASE("http_request_RequestLineGrammar.parseLine")
{
    HttpRequest request;

    REQUIRE_FALSE(HttpRequestLineGrammar::parseLine("PATCH /a/b?c=d HTTP/1.0", request));
    REQUIRE("PATCH" == request.method);
    REQUIRE("/a/b?c=d" == request.target);
    REQUIRE(HttpVersion::VERSION_1_0 == request.version);
}

TEST_CASE("http_request_RequestLineGrammar.parseLine_invalid")
{
    HttpRequest request;

    REQUIRE(HttpRequestLineGrammar::parseLine("GET", request) == HttpRequestError::MalformedRequestLine);
    REQUIRE(HttpRequestLineGrammar::parseLine("GET  HTTP/1.1", request) == HttpRequestError::MalformedRequestLine);
    REQUIRE(HttpRequestLineGrammar::parseLine("GET / ", request) == HttpRequestError::MalformedRequestLine);
    REQUIRE(HttpRequestLineGrammar::parseLine("GET / HTTP/1.1\r", request)
            == HttpRequestError::MalformedRequestLine);
    REQUIRE(HttpRequestLineGrammar::parseLine("G(T / HTTP/1.1", request) == HttpRequestError::MalformedRequestLine);
    REQUIRE(HttpRequestLineGrammar::parseLine("GET / HTTP/1.3", request) == HttpRequestError::UnsupportedVersion);

    // nothing is assigned from a rejected line
    REQUIRE(request.method.empty());
    REQUIRE(request.target.empty());
    REQUIRE(HttpVersion::UNKNOWN == request.version);
}

TEST_CASE("http_request_RequestLineGrammar.parseVersion")
{
    REQUIRE(HttpVersion::VERSION_1_1 == HttpRequestLineGrammar::parseVersion("HTTP/1.1"));
    REQUIRE(HttpVersion::VERSION_1_0 == HttpRequestLineGrammar::parseVersion("HTTP/1.0"));
    REQUIRE(HttpVersion::UNKNOWN == HttpRequestLineGrammar::parseVersion("HTTP/1.01"));
    REQUIRE(HttpVersion::UNKNOWN == HttpRequestLineGrammar::parseVersion("HTTP/11"));
    REQUIRE(HttpVersion::UNKNOWN == HttpRequestLineGrammar::parseVersion(""));
    REQUIRE("HTTP/1.1" == as_string(HttpVersion::VERSION_1_1));
}

TEST_CASE("http_request_RequestLineGrammar.incremental")
{
    HttpRequestLineGrammar grammar(64);
    HttpRequest request;

    HttpCursor first("DELETE /item/");
    REQUIRE(HttpGrammarStatus::Incomplete == grammar.parse(first, request).status);

    HttpCursor second("42 HTTP/1.1\r\nHost: x\r\n");
    REQUIRE(HttpGrammarStatus::Complete == grammar.parse(second, request).status);
    REQUIRE("Host: x\r\n" == second.rest());
    REQUIRE("DELETE" == request.method);
    REQUIRE("/item/42" == request.target);
}

TEST_CASE("http_request_RequestLineGrammar.tooLong")
{
    HttpRequestLineGrammar grammar(8);
    HttpRequest request;
    HttpCursor cursor("GET /abcdef HTTP/1.1\r\n");

    auto const result = grammar.parse(cursor, request);

    REQUIRE(HttpGrammarStatus::Failed == result.status);
    REQUIRE(result.error == HttpRequestError::RequestLineTooLong);
}
