// SPDX-License-Identifier: Apache-2.0
#include "HttpRequestParser.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

#define TRACE(...) SPDLOG_LOGGER_TRACE(_logger, __VA_ARGS__)

std::string_view as_string(HttpParserPhase phase) noexcept
{
    switch (phase)
    {
        case HttpParserPhase::Start: return "start";
        case HttpParserPhase::ParsingRequestLine: return "parsing-request-line";
        case HttpParserPhase::ParsingHeaders: return "parsing-headers";
        case HttpParserPhase::DeterminingBodyFraming: return "determining-body-framing";
        case HttpParserPhase::ParsingBody: return "parsing-body";
        case HttpParserPhase::Complete: return "complete";
        case HttpParserPhase::Error: return "error";
    }

    return "UNKNOWN";
}

std::string_view as_string(HttpMilestone milestone) noexcept
{
    switch (milestone)
    {
        case HttpMilestone::RequestLine: return "request-line";
        case HttpMilestone::HeadersComplete: return "headers-complete";
        case HttpMilestone::BodyData: return "body-data";
    }

    return "UNKNOWN";
}

HttpRequestParser::HttpRequestParser(HttpParserConfig config, HttpRequestListener* listener):
    _config(std::move(config)),
    _logger(_config.logger ? _config.logger : spdlog::default_logger()),
    _listener(listener),
    _requestLine(_config.limits.maxRequestLineLength),
    _headers(_config.limits)
{
    if (auto const invalid = _config.limits.validate(); !invalid.empty())
        throw std::invalid_argument("HttpRequestParser: limit " + std::string(invalid) + " must be positive");
}

HttpFeedResult HttpRequestParser::feed(std::string_view chunk)
{
    if (_phase == HttpParserPhase::Complete)
        throw std::logic_error("HttpRequestParser: feed() called after the request was completed");

    if (_phase == HttpParserPhase::Error)
        return HttpFeedResult { 0, HttpFailed { _error } };

    TRACE("feed(phase:{}): size: {}", as_string(_phase), chunk.size());

    HttpCursor cursor(chunk);
    HttpOutcome outcome = process(cursor);
    _bytesReceived += cursor.consumed();

    return HttpFeedResult { cursor.consumed(), std::move(outcome) };
}

HttpOutcome HttpRequestParser::process(HttpCursor& cursor)
{
    for (;;)
    {
        switch (_phase)
        {
            case HttpParserPhase::Start:
                if (cursor.empty())
                    return HttpNeedMoreInput {};
                transition(HttpParserPhase::ParsingRequestLine);
                break;
            case HttpParserPhase::ParsingRequestLine: {
                auto const result = _requestLine.parse(cursor, _request);
                if (result.status == HttpGrammarStatus::Incomplete)
                    return HttpNeedMoreInput {};
                if (result.status == HttpGrammarStatus::Failed)
                    return fail(result.error, cursor.consumed());

                TRACE("request-line: method={}, target={}, version={}",
                      _request.method,
                      _request.target,
                      as_string(_request.version));

                if (_listener)
                    _listener->onRequestLine(_request.method, _request.target, _request.version);

                transition(HttpParserPhase::ParsingHeaders);
                return HttpProgress { HttpMilestone::RequestLine };
            }
            case HttpParserPhase::ParsingHeaders: {
                auto const result = _headers.parse(cursor, _request.headers);
                switch (result.event)
                {
                    case HttpHeaderEvent::Incomplete: return HttpNeedMoreInput {};
                    case HttpHeaderEvent::Failed: return fail(result.error, cursor.consumed());
                    case HttpHeaderEvent::Field: {
                        HttpHeader const& field = _request.headers[_request.headers.size() - 1];
                        TRACE("header: {}: {}", field.name, field.value);
                        if (_listener)
                            _listener->onHeader(field.name, field.value);
                        break;
                    }
                    case HttpHeaderEvent::End: transition(HttpParserPhase::DeterminingBodyFraming); break;
                }
                break;
            }
            case HttpParserPhase::DeterminingBodyFraming: return decideBodyFraming(cursor);
            case HttpParserPhase::ParsingBody: return parseBody(cursor);
            case HttpParserPhase::Complete:
            case HttpParserPhase::Error:
                // feed() never enters the loop in a terminal phase
                return HttpFailed { _error };
        }
    }
}

HttpOutcome HttpRequestParser::decideBodyFraming(HttpCursor const& cursor)
{
    auto const decision = HttpBodyFramingDecision::decide(_request.headers, _config.limits);
    if (decision.error)
        return fail(decision.error, cursor.consumed());

    _request.framing = decision.framing;
    _request.trailerBegin = _request.headers.size();

    TRACE("body framing: {} ({} bytes)", as_string(decision.framing.kind), decision.framing.length);

    if (_listener)
        _listener->onHeadersComplete(decision.framing);

    switch (decision.framing.kind)
    {
        case HttpBodyFraming::None: return complete();
        case HttpBodyFraming::FixedLength:
            if (decision.framing.length == 0)
                return complete();
            _fixedLengthBody.emplace(decision.framing.length);
            break;
        case HttpBodyFraming::Chunked: _chunkedBody.emplace(_config.limits); break;
    }

    transition(HttpParserPhase::ParsingBody);
    return HttpProgress { HttpMilestone::HeadersComplete };
}

HttpOutcome HttpRequestParser::parseBody(HttpCursor& cursor)
{
    if (_fixedLengthBody)
    {
        for (;;)
        {
            if (_fixedLengthBody->done())
                return complete();

            if (cursor.empty())
                return HttpNeedMoreInput {};

            if (auto progress = deliverBody(_fixedLengthBody->consume(cursor)); progress)
                return std::move(*progress);
        }
    }

    for (;;)
    {
        auto const result = _chunkedBody->parse(cursor, _headers, _request.headers);
        switch (result.event)
        {
            case HttpChunkedEvent::Incomplete: return HttpNeedMoreInput {};
            case HttpChunkedEvent::Failed: return fail(result.error, cursor.consumed());
            case HttpChunkedEvent::Complete: return complete();
            case HttpChunkedEvent::Data:
                if (auto progress = deliverBody(result.data); progress)
                    return std::move(*progress);
                break;
            case HttpChunkedEvent::TrailerField: {
                HttpHeader const& field = _request.headers[_request.headers.size() - 1];
                TRACE("trailer: {}: {}", field.name, field.value);
                if (_listener)
                    _listener->onHeader(field.name, field.value);
                break;
            }
        }
    }
}

/// Hands out a piece of the body.
///
/// @return the progress to report in streaming mode, nothing in buffered mode.
std::optional<HttpOutcome> HttpRequestParser::deliverBody(std::string_view data)
{
    if (_listener)
        _listener->onBodyChunk(data);

    if (_config.bodyMode == HttpBodyMode::Streaming)
        return HttpOutcome { HttpProgress { HttpMilestone::BodyData, data } };

    _request.body.append(data);
    return std::nullopt;
}

HttpOutcome HttpRequestParser::complete()
{
    transition(HttpParserPhase::Complete);

    if (_listener)
        _listener->onRequestEnd();

    return HttpDone { std::move(_request) };
}

HttpOutcome HttpRequestParser::fail(std::error_code ec, std::size_t consumed)
{
    _logger->debug("http request protocol error in phase {} at offset {}: {}",
                   as_string(_phase),
                   _bytesReceived + consumed,
                   ec.message());

    _error = ec;
    transition(HttpParserPhase::Error);

    if (_listener)
        _listener->onProtocolError(ec);

    return HttpFailed { ec };
}

void HttpRequestParser::transition(HttpParserPhase next)
{
    TRACE("phase: {} -> {}", as_string(_phase), as_string(next));
    _phase = next;
}

bool HttpRequestParser::bodyComplete() const noexcept
{
    if (_fixedLengthBody)
        return _fixedLengthBody->done();

    if (_chunkedBody)
        return _chunkedBody->state() == HttpChunkedState::Complete;

    return false;
}

std::error_code HttpRequestParser::finish()
{
    switch (_phase)
    {
        case HttpParserPhase::Start:
        case HttpParserPhase::Complete: return {};
        case HttpParserPhase::Error: return _error;
        case HttpParserPhase::ParsingBody:
            // all body bytes arrived; only HttpDone was not collected yet
            if (bodyComplete())
                return {};
            break;
        default: break;
    }

    fail(HttpRequestError::UnexpectedEndOfInput, 0);
    return _error;
}

std::variant<HttpRequest, std::error_code> parseRequest(std::string_view input, HttpParserConfig config)
{
    config.bodyMode = HttpBodyMode::Buffered;
    HttpRequestParser parser(std::move(config));

    for (;;)
    {
        auto result = parser.feed(input);
        input.remove_prefix(result.consumed);

        if (auto* done = std::get_if<HttpDone>(&result.outcome))
            return std::move(done->request);

        if (auto const* failed = std::get_if<HttpFailed>(&result.outcome))
            return failed->error;

        if (std::holds_alternative<HttpNeedMoreInput>(result.outcome))
        {
            auto const ec = parser.finish();
            return ec ? ec : make_error_code(HttpRequestError::UnexpectedEndOfInput);
        }
    }
}
