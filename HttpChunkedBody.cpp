// SPDX-License-Identifier: Apache-2.0
#include "HttpChunkedBody.h"

#include "HttpCharacters.h"
#include "HttpRequestError.h"

#include <limits>

using namespace httpchars;

std::string_view as_string(HttpChunkedState state) noexcept
{
    switch (state)
    {
        case HttpChunkedState::ChunkSize: return "chunk-size";
        case HttpChunkedState::ChunkData: return "chunk-data";
        case HttpChunkedState::ChunkDataCR: return "chunk-data-cr";
        case HttpChunkedState::ChunkDataLF: return "chunk-data-lf";
        case HttpChunkedState::TrailerHeaders: return "trailer-headers";
        case HttpChunkedState::Complete: return "complete";
    }

    return "UNKNOWN";
}

HttpChunkedBody::HttpChunkedBody(HttpLimits const& limits) noexcept:
    _maxLineLength(limits.maxChunkLineLength), _maxBodySize(limits.maxBodySize)
{
}

HttpChunkedResult HttpChunkedBody::parse(HttpCursor& cursor,
                                         HttpHeaderGrammar& trailerGrammar,
                                         HttpHeaderList& trailers)
{
    for (;;)
    {
        switch (_state)
        {
            case HttpChunkedState::ChunkSize: {
                auto const scan = _line.scan(cursor, _maxLineLength);
                if (scan.status == HttpLineStatus::Incomplete)
                    return { HttpChunkedEvent::Incomplete };
                if (scan.status == HttpLineStatus::TooLong)
                    return fail(HttpRequestError::ChunkLineTooLong);
                if (scan.bareLF)
                    return fail(HttpRequestError::InvalidChunkSize);

                auto const size = parseChunkSize(scan.line);
                if (!size)
                    return fail(HttpRequestError::InvalidChunkSize);

                // checked before any byte of this chunk is taken
                if (*size > _maxBodySize - _decodedSize)
                    return fail(HttpRequestError::BodyTooLarge);

                if (*size == 0)
                {
                    _state = HttpChunkedState::TrailerHeaders;
                }
                else
                {
                    _chunkRemaining = *size;
                    _state = HttpChunkedState::ChunkData;
                }
                break;
            }
            case HttpChunkedState::ChunkData: {
                if (cursor.empty())
                    return { HttpChunkedEvent::Incomplete };

                auto const data = cursor.take(_chunkRemaining);
                _chunkRemaining -= data.size();
                _decodedSize += data.size();

                if (_chunkRemaining == 0)
                    _state = HttpChunkedState::ChunkDataCR;

                return { HttpChunkedEvent::Data, data };
            }
            case HttpChunkedState::ChunkDataCR:
                if (cursor.empty())
                    return { HttpChunkedEvent::Incomplete };
                if (cursor.peek() != CR)
                    return fail(HttpRequestError::InvalidChunkFraming);
                cursor.advance(1);
                _state = HttpChunkedState::ChunkDataLF;
                break;
            case HttpChunkedState::ChunkDataLF:
                if (cursor.empty())
                    return { HttpChunkedEvent::Incomplete };
                if (cursor.peek() != LF)
                    return fail(HttpRequestError::InvalidChunkFraming);
                cursor.advance(1);
                _state = HttpChunkedState::ChunkSize;
                break;
            case HttpChunkedState::TrailerHeaders: {
                auto const result = trailerGrammar.parse(cursor, trailers);
                switch (result.event)
                {
                    case HttpHeaderEvent::Incomplete: return { HttpChunkedEvent::Incomplete };
                    case HttpHeaderEvent::Field: return { HttpChunkedEvent::TrailerField };
                    case HttpHeaderEvent::Failed: return fail(result.error);
                    case HttpHeaderEvent::End: _state = HttpChunkedState::Complete; break;
                }
                break;
            }
            case HttpChunkedState::Complete: return { HttpChunkedEvent::Complete };
        }
    }
}

std::optional<std::size_t> HttpChunkedBody::parseChunkSize(std::string_view line) noexcept
{
    constexpr std::size_t Max = std::numeric_limits<std::size_t>::max();

    std::size_t size = 0;
    std::size_t digits = 0;

    for (; digits < line.size(); ++digits)
    {
        int const value = hexValue(line[digits]);
        if (value < 0)
            break;

        if (size > (Max >> 4))
            return std::nullopt;

        size = (size << 4) | static_cast<std::size_t>(value);
    }

    if (digits == 0)
        return std::nullopt;

    auto extension = line.substr(digits);
    while (!extension.empty() && isWhitespace(extension.front()))
        extension.remove_prefix(1);

    if (extension.empty())
    {
        // whitespace is only allowed in front of a chunk-ext
        if (digits != line.size())
            return std::nullopt;

        return size;
    }

    if (extension.front() != ';')
        return std::nullopt;

    for (char const c: extension)
        if (c == CR || c == LF || c == NUL)
            return std::nullopt;

    return size;
}
