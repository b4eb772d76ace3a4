// SPDX-License-Identifier: Apache-2.0
#include "HttpRequestReader.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <string_view>
#include <utility>
#include <variant>

namespace
{

using Stage =
    std::variant<HttpAwaitingRequestLine, HttpAwaitingHeaders, HttpAwaitingBody, HttpCompletedRequest, HttpFailure>;

template <typename Variant>
Stage adopt(Variant&& state)
{
    return std::visit([](auto&& s) -> Stage { return Stage(std::move(s)); }, std::move(state));
}

template <typename Handle>
Stage feedHandle(Handle& handle, std::string_view& fragment)
{
    auto step = std::move(handle).feed(fragment);
    fragment.remove_prefix(step.consumed);
    return adopt(std::move(step.state));
}

Stage feed(Stage& stage, std::string_view& fragment)
{
    if (auto* handle = std::get_if<HttpAwaitingRequestLine>(&stage))
        return feedHandle(*handle, fragment);

    if (auto* handle = std::get_if<HttpAwaitingHeaders>(&stage))
        return feedHandle(*handle, fragment);

    return feedHandle(std::get<HttpAwaitingBody>(stage), fragment);
}

std::error_code finish(Stage& stage)
{
    if (auto* handle = std::get_if<HttpAwaitingRequestLine>(&stage))
        return std::move(*handle).finish();

    if (auto* handle = std::get_if<HttpAwaitingHeaders>(&stage))
        return std::move(*handle).finish();

    return std::move(std::get<HttpAwaitingBody>(stage)).finish();
}

bool isTerminal(Stage const& stage) noexcept
{
    return std::holds_alternative<HttpCompletedRequest>(stage) || std::holds_alternative<HttpFailure>(stage);
}

void logTransition(Stage const& stage, std::size_t previousIndex)
{
    if (stage.index() == previousIndex)
        return;

    if (auto const* headers = std::get_if<HttpAwaitingHeaders>(&stage))
        spdlog::info("request-line: {} {} {}", headers->method(), headers->target(), as_string(headers->version()));
    else if (auto const* body = std::get_if<HttpAwaitingBody>(&stage))
        spdlog::info("headers: {} fields, body framing: {} ({} bytes)",
                     body->headers().size(),
                     as_string(body->framing().kind),
                     body->framing().length);
}

} // namespace

int main(int argc, char const* argv[])
{
    std::ifstream file;
    std::istream* in = &std::cin;

    if (argc > 1)
    {
        file.open(argv[1], std::ios::binary);
        if (!file)
        {
            spdlog::error("cannot open {}", argv[1]);
            return 1;
        }
        in = &file;
    }

    HttpParserConfig config;
    config.bodyMode = HttpBodyMode::Streaming;

    Stage stage = HttpRequestReader::start(config);
    std::size_t bodyBytes = 0;

    char buffer[4096];
    std::string_view fragment;
    bool needInput = true;

    while (!isTerminal(stage))
    {
        if (needInput && fragment.empty())
        {
            in->read(buffer, sizeof(buffer));
            auto const n = static_cast<std::size_t>(in->gcount());

            if (n == 0)
            {
                auto const ec = finish(stage);
                if (ec)
                    stage = HttpFailure { ec, {} };
                else
                    spdlog::error("end of input without a complete request");
                break;
            }

            fragment = std::string_view(buffer, n);
        }

        auto const previousIndex = stage.index();

        stage = feed(stage, fragment);
        logTransition(stage, previousIndex);

        std::string_view chunk;
        if (auto const* body = std::get_if<HttpAwaitingBody>(&stage))
            chunk = body->lastChunk();
        bodyBytes += chunk.size();

        // a milestone may stop short of the fragment's end, and the last body
        // chunk is followed by the completion on an empty feed
        needInput = stage.index() == previousIndex && chunk.empty();
    }

    if (auto const* failure = std::get_if<HttpFailure>(&stage))
    {
        std::cerr << "error: " << failure->error.message() << " (HTTP " << toHttpStatus(failure->error) << ")\n";
        return 1;
    }

    auto const* completed = std::get_if<HttpCompletedRequest>(&stage);
    if (!completed)
        return 1;

    HttpRequest const& request = completed->request();
    std::cout << request.method << ' ' << request.target << ' ' << as_string(request.version) << '\n';
    for (HttpHeader const& field: request.headers)
        std::cout << field.name << ": " << field.value << '\n';
    std::cout << "body: " << bodyBytes << " bytes\n";

    return 0;
}
