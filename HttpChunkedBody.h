// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "HttpCursor.h"
#include "HttpHeaderGrammar.h"
#include "HttpLimits.h"
#include "HttpRequest.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

enum class HttpChunkedState
{
    ChunkSize,
    ChunkData,
    ChunkDataCR,
    ChunkDataLF,
    TrailerHeaders,
    Complete,
};

std::string_view as_string(HttpChunkedState state) noexcept;

enum class HttpChunkedEvent
{
    Incomplete,
    Data,
    TrailerField,
    Complete,
    Failed,
};

struct HttpChunkedResult
{
    HttpChunkedEvent event;

    /// decoded body bytes (Data only), a view into the fed fragment
    std::string_view data {};

    std::error_code error {};
};

/**
 * Decoder for "Transfer-Encoding: chunked".
 *
 * <pre>
 *   chunked-body = *chunk last-chunk trailer-part CRLF
 *   chunk        = chunk-size [ chunk-ext ] CRLF chunk-data CRLF
 *   chunk-size   = 1*HEXDIG
 *   last-chunk   = 1*("0") [ chunk-ext ] CRLF
 *   chunk-ext    = *( BWS ";" ... )    ; skipped
 * </pre>
 *
 * Trailer fields are parsed by the HttpHeaderGrammar that parsed the header
 * section, so they share its count and size budget.
 */
class HttpChunkedBody
{
  public:
    explicit HttpChunkedBody(HttpLimits const& limits) noexcept;

    /// Advances the decoder until it has something to report.
    ///
    /// @param cursor         input to consume from
    /// @param trailerGrammar grammar that parsed the header section
    /// @param trailers       list receiving trailer fields
    HttpChunkedResult parse(HttpCursor& cursor, HttpHeaderGrammar& trailerGrammar, HttpHeaderList& trailers);

    HttpChunkedState state() const noexcept { return _state; }

    /// total decoded body bytes so far
    std::size_t decodedSize() const noexcept { return _decodedSize; }

    /// Parses a chunk-size line (CRLF already stripped), skipping extensions.
    ///
    /// @return the chunk size, or std::nullopt if the line is malformed or
    ///         the size does not fit into size_t.
    static std::optional<std::size_t> parseChunkSize(std::string_view line) noexcept;

  private:
    HttpChunkedResult fail(std::error_code ec) const noexcept { return { HttpChunkedEvent::Failed, {}, ec }; }

  private:
    std::size_t _maxLineLength;
    std::size_t _maxBodySize;

    HttpChunkedState _state = HttpChunkedState::ChunkSize;
    HttpLineBuffer _line;
    std::size_t _chunkRemaining = 0;
    std::size_t _decodedSize = 0;
};
