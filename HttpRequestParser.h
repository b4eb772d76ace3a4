// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "HttpBodyFramingDecision.h"
#include "HttpChunkedBody.h"
#include "HttpCursor.h"
#include "HttpFixedLengthBody.h"
#include "HttpHeaderGrammar.h"
#include "HttpLimits.h"
#include "HttpRequest.h"
#include "HttpRequestError.h"
#include "HttpRequestLineGrammar.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <variant>

namespace spdlog
{
class logger;
}

class HttpRequestListener // {{{
{
  public:
    virtual ~HttpRequestListener() = default;

    /** HTTP/1.1 Request-Line, that has been fully parsed.
     *
     * @param method the request-method (e.g. GET or POST)
     * @param target the request-target (e.g. /index.html)
     * @param version HTTP version (1.0 or 1.1)
     */
    virtual void onRequestLine(std::string_view method, std::string_view target, HttpVersion version) {}

    /**
     * Single HTTP message header, or a trailer of a chunked body.
     *
     * @param name the header name
     * @param value the header value
     */
    virtual void onHeader(std::string_view name, std::string_view value) {}

    /**
     * Invoked once all request headers have been fully parsed and the body
     * framing has been decided.
     *
     * (no possible content parsed yet)
     */
    virtual void onHeadersComplete(HttpBodyFraming framing) {}

    /**
     * Invoked for every piece of decoded body content being processed.
     */
    virtual void onBodyChunk(std::string_view chunk) {}

    /**
     * Invoked once the request has been fully processed.
     */
    virtual void onRequestEnd() {}

    /**
     * HTTP request protocol error. The parser is unusable afterwards.
     */
    virtual void onProtocolError(std::error_code error) {}
}; // }}}

/// Phases are entered strictly in declaration order (Error aside).
enum class HttpParserPhase
{
    Start,
    ParsingRequestLine,
    ParsingHeaders,
    DeterminingBodyFraming,
    ParsingBody,
    Complete,
    Error,
};

std::string_view as_string(HttpParserPhase phase) noexcept;

enum class HttpMilestone
{
    /// the request-line has been parsed
    RequestLine,

    /// the header section is closed and a body follows
    HeadersComplete,

    /// a piece of the body is available (HttpBodyMode::Streaming only)
    BodyData,
};

std::string_view as_string(HttpMilestone milestone) noexcept;

/// All bytes of the fragment were consumed; feed more.
struct HttpNeedMoreInput
{
};

struct HttpProgress
{
    HttpMilestone milestone;

    /// body bytes for HttpMilestone::BodyData, a view into the fed fragment
    std::string_view body {};
};

struct HttpDone
{
    HttpRequest request;
};

struct HttpFailed
{
    std::error_code error;
};

using HttpOutcome = std::variant<HttpNeedMoreInput, HttpProgress, HttpDone, HttpFailed>;

struct HttpFeedResult
{
    /// number of bytes taken from the fragment
    std::size_t consumed;

    HttpOutcome outcome;
};

/**
 * Incremental HTTP/1.x request parser.
 *
 * Bytes are fed in fragments of arbitrary size. Each call to feed() consumes
 * bytes until it needs more input, reaches a milestone, completes the request
 * or detects an error. The caller passes the unconsumed remainder of a
 * fragment back in after a milestone.
 *
 * Bytes beyond the end of the request are never consumed; they belong to the
 * next (pipelined) request, which is parsed by a new parser instance.
 *
 * One instance parses exactly one request. Instances share no state.
 *
 * @see HttpRequestReader for an interface that rules out calls out of order.
 */
class HttpRequestParser
{
  public:
    ///
    /// Initializes the HTTP/1.1 request parser.
    ///
    /// @param config   limits, body mode and logger
    /// @param listener optional receiver of milestone events; must outlive
    ///                 the parser
    ///
    /// @throw std::invalid_argument if any limit is zero
    explicit HttpRequestParser(HttpParserConfig config = {}, HttpRequestListener* listener = nullptr);

    ///
    /// Processes a message fragment.
    ///
    /// In streaming mode, the BodyData progress that carries the last body
    /// bytes is followed by HttpDone on the next call, which may pass an
    /// empty fragment.
    ///
    /// Once failed, every further call returns the same HttpFailed without
    /// consuming anything.
    ///
    /// @param chunk the chunk of bytes to process
    /// @throw std::logic_error if the request has already been completed
    HttpFeedResult feed(std::string_view chunk);

    /// Signals that the transport was closed.
    ///
    /// @return UnexpectedEndOfInput if a request was in progress (and enters
    ///         the error phase), the stored error if already failed, or an
    ///         empty error code otherwise.
    std::error_code finish();

    HttpParserPhase phase() const noexcept { return _phase; }
    HttpBodyFraming framing() const noexcept { return _request.framing; }
    std::error_code error() const noexcept { return _error; }
    std::size_t bytesReceived() const noexcept { return _bytesReceived; }
    HttpParserConfig const& config() const noexcept { return _config; }

    /// The request as parsed so far, for inspection while parsing or after an
    /// error. Empty once the request was handed out by HttpDone.
    HttpRequest const& partialRequest() const noexcept { return _request; }

  private:
    HttpOutcome process(HttpCursor& cursor);
    HttpOutcome decideBodyFraming(HttpCursor const& cursor);
    HttpOutcome parseBody(HttpCursor& cursor);
    std::optional<HttpOutcome> deliverBody(std::string_view data);
    HttpOutcome complete();
    HttpOutcome fail(std::error_code ec, std::size_t consumed);
    void transition(HttpParserPhase next);
    bool bodyComplete() const noexcept;

  private:
    HttpParserConfig _config;
    std::shared_ptr<spdlog::logger> _logger;
    HttpRequestListener* _listener;

    HttpParserPhase _phase = HttpParserPhase::Start;
    std::error_code _error;
    std::size_t _bytesReceived = 0;

    HttpRequest _request;

    HttpRequestLineGrammar _requestLine;
    HttpHeaderGrammar _headers;
    std::optional<HttpFixedLengthBody> _fixedLengthBody;
    std::optional<HttpChunkedBody> _chunkedBody;
};

/// Parses one complete request held in @p input, always in buffered mode.
///
/// @return the request, or the parse error (UnexpectedEndOfInput if
///         @p input ends before the request does). Bytes following the
///         request are ignored.
std::variant<HttpRequest, std::error_code> parseRequest(std::string_view input, HttpParserConfig config = {});
