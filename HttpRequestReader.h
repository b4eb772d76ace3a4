// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "HttpRequestParser.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

// Phase-scoped handles over HttpRequestParser.
//
// Each handle exposes only what is legal in its phase. feed() consumes the
// handle and moves the parser, held by value, into the handle of whatever
// phase it reached, so reading the body before the header section closed, or
// taking the request before it completed, does not compile.
//
//   auto step = HttpRequestReader::start().feed(bytes);
//   if (auto* headers = std::get_if<HttpAwaitingHeaders>(&step.state))
//       ... headers->method() ...

class HttpAwaitingRequestLine;
class HttpAwaitingHeaders;
class HttpAwaitingBody;
class HttpCompletedRequest;

/// Terminal parse error, with the partially parsed request for diagnostics.
struct HttpFailure
{
    std::error_code error;
    HttpRequest partial;
};

template <typename... Stages>
struct HttpStep
{
    std::variant<Stages..., HttpFailure> state;

    /// number of bytes taken from the fed fragment
    std::size_t consumed = 0;

    template <typename T>
    bool is() const noexcept
    {
        return std::holds_alternative<T>(state);
    }

    template <typename T>
    T& get()
    {
        return std::get<T>(state);
    }
};

class HttpRequestStage
{
  public:
    HttpRequestStage(HttpRequestStage&&) noexcept = default;
    HttpRequestStage& operator=(HttpRequestStage&&) noexcept = default;

    HttpParserPhase phase() const { return parser().phase(); }
    std::size_t bytesReceived() const { return parser().bytesReceived(); }

  protected:
    explicit HttpRequestStage(HttpRequestParser&& parser) noexcept: _parser(std::move(parser)) {}
    ~HttpRequestStage() = default;

    /// @throw std::logic_error if this handle has already been fed
    HttpRequestParser const& parser() const;

    /// Moves the parser out of this handle, leaving the handle spent.
    ///
    /// @throw std::logic_error if this handle has already been fed
    HttpRequestParser release();

    std::optional<HttpRequestParser> _parser;

    friend struct HttpStageFactory;
};

class HttpAwaitingRequestLine: public HttpRequestStage
{
  public:
    HttpStep<HttpAwaitingRequestLine, HttpAwaitingHeaders> feed(std::string_view chunk) &&;

    /// Transport closed; yields the failure if a request was in progress.
    std::error_code finish() && { return release().finish(); }

  private:
    explicit HttpAwaitingRequestLine(HttpRequestParser&& parser) noexcept: HttpRequestStage(std::move(parser))
    {
    }

    friend struct HttpStageFactory;
    friend class HttpRequestReader;
};

class HttpAwaitingHeaders: public HttpRequestStage
{
  public:
    std::string_view method() const { return parser().partialRequest().method; }
    std::string_view target() const { return parser().partialRequest().target; }
    HttpVersion version() const { return parser().partialRequest().version; }

    HttpStep<HttpAwaitingHeaders, HttpAwaitingBody, HttpCompletedRequest> feed(std::string_view chunk) &&;

    std::error_code finish() && { return release().finish(); }

  private:
    explicit HttpAwaitingHeaders(HttpRequestParser&& parser) noexcept: HttpRequestStage(std::move(parser))
    {
    }

    friend struct HttpStageFactory;
};

class HttpAwaitingBody: public HttpRequestStage
{
  public:
    std::string_view method() const { return parser().partialRequest().method; }
    std::string_view target() const { return parser().partialRequest().target; }
    HttpVersion version() const { return parser().partialRequest().version; }
    HttpHeaderList const& headers() const { return parser().partialRequest().headers; }
    HttpBodyFraming framing() const { return parser().framing(); }

    /// Body bytes delivered by the feed() that produced this handle
    /// (HttpBodyMode::Streaming only). Points into that fragment.
    std::string_view lastChunk() const noexcept { return _lastChunk; }

    HttpStep<HttpAwaitingBody, HttpCompletedRequest> feed(std::string_view chunk) &&;

    std::error_code finish() && { return release().finish(); }

  private:
    HttpAwaitingBody(HttpRequestParser&& parser, std::string_view lastChunk) noexcept:
        HttpRequestStage(std::move(parser)), _lastChunk(lastChunk)
    {
    }

    std::string_view _lastChunk;

    friend struct HttpStageFactory;
};

class HttpCompletedRequest
{
  public:
    HttpRequest const& request() const& noexcept { return _request; }
    HttpRequest request() && { return std::move(_request); }

  private:
    explicit HttpCompletedRequest(HttpRequest request) noexcept: _request(std::move(request)) {}

    HttpRequest _request;

    friend struct HttpStageFactory;
};

class HttpRequestReader
{
  public:
    /// Creates a fresh parser for one request.
    ///
    /// @throw std::invalid_argument if any limit is zero
    static HttpAwaitingRequestLine start(HttpParserConfig config = {}, HttpRequestListener* listener = nullptr);
};
