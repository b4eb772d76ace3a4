// SPDX-License-Identifier: Apache-2.0
#include "HttpRequestReader.h"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

struct HttpStageFactory
{
    /// Feeds @p chunk and wraps the parser into the handle of the phase it
    /// reached. Phases outside of @p Stages cannot be reached from the phase
    /// the caller was in.
    template <typename... Stages>
    static HttpStep<Stages...> advance(HttpRequestParser parser, std::string_view chunk)
    {
        auto result = parser.feed(chunk);

        if (auto const* failed = std::get_if<HttpFailed>(&result.outcome))
            return wrap<Stages...>(HttpFailure { failed->error, parser.partialRequest() }, result.consumed);

        if (auto* done = std::get_if<HttpDone>(&result.outcome))
            return wrap<Stages...>(HttpCompletedRequest(std::move(done->request)), result.consumed);

        switch (parser.phase())
        {
            case HttpParserPhase::Start:
            case HttpParserPhase::ParsingRequestLine:
                return wrap<Stages...>(HttpAwaitingRequestLine(std::move(parser)), result.consumed);
            case HttpParserPhase::ParsingHeaders:
                return wrap<Stages...>(HttpAwaitingHeaders(std::move(parser)), result.consumed);
            case HttpParserPhase::ParsingBody: {
                std::string_view body;
                if (auto const* progress = std::get_if<HttpProgress>(&result.outcome))
                    body = progress->body;
                return wrap<Stages...>(HttpAwaitingBody(std::move(parser), body), result.consumed);
            }
            case HttpParserPhase::DeterminingBodyFraming:
            case HttpParserPhase::Complete:
            case HttpParserPhase::Error: break;
        }

        throw std::logic_error("HttpRequestReader: parser stopped in phase "
                               + std::string(as_string(parser.phase())));
    }

    template <typename... Stages, typename T>
    static HttpStep<Stages...> wrap(T&& stage, std::size_t consumed)
    {
        using Stage = std::decay_t<T>;

        if constexpr ((std::is_same_v<Stage, Stages> || ...) || std::is_same_v<Stage, HttpFailure>)
            return HttpStep<Stages...> { std::forward<T>(stage), consumed };
        else
            // unreachable: feed() stops at every milestone, so each handle only
            // reaches the successors it declares
            throw std::logic_error("HttpRequestReader: phase skipped");
    }
};

HttpRequestParser const& HttpRequestStage::parser() const
{
    if (!_parser)
        throw std::logic_error("HttpRequestReader: handle used after it was fed");

    return *_parser;
}

HttpRequestParser HttpRequestStage::release()
{
    if (!_parser)
        throw std::logic_error("HttpRequestReader: handle used after it was fed");

    HttpRequestParser parser = std::move(*_parser);
    _parser.reset();
    return parser;
}

HttpStep<HttpAwaitingRequestLine, HttpAwaitingHeaders> HttpAwaitingRequestLine::feed(std::string_view chunk) &&
{
    return HttpStageFactory::advance<HttpAwaitingRequestLine, HttpAwaitingHeaders>(release(), chunk);
}

HttpStep<HttpAwaitingHeaders, HttpAwaitingBody, HttpCompletedRequest> HttpAwaitingHeaders::feed(
    std::string_view chunk) &&
{
    return HttpStageFactory::advance<HttpAwaitingHeaders, HttpAwaitingBody, HttpCompletedRequest>(release(), chunk);
}

HttpStep<HttpAwaitingBody, HttpCompletedRequest> HttpAwaitingBody::feed(std::string_view chunk) &&
{
    return HttpStageFactory::advance<HttpAwaitingBody, HttpCompletedRequest>(release(), chunk);
}

HttpAwaitingRequestLine HttpRequestReader::start(HttpParserConfig config, HttpRequestListener* listener)
{
    return HttpAwaitingRequestLine(HttpRequestParser(std::move(config), listener));
}
